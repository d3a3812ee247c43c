/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "LogDirectoryWatcherTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTest>

// SessionTail
#include "../sessiontail/LogDirectoryWatcher.h"

using namespace SessionTail;

static const QByteArray Line = QByteArrayLiteral("{\"type\":\"user\",\"message\":{\"content\":\"hi\"}}\n");
static const QDateTime BaseTime = QDateTime::fromString(QStringLiteral("2025-06-01T10:00:00Z"), Qt::ISODate);

// True if any captured logFileChanged carried the given session id
static bool spyHasSession(const QSignalSpy &spy, const QString &sessionId)
{
    for (int i = 0; i < spy.count(); ++i) {
        if (spy.at(i).at(0).value<LogFileEvent>().sessionId == sessionId) {
            return true;
        }
    }
    return false;
}

void LogDirectoryWatcherTest::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
}

void LogDirectoryWatcherTest::cleanup()
{
    delete m_dir;
    m_dir = nullptr;
}

QString LogDirectoryWatcherTest::writeFile(const QString &relativePath, const QByteArray &content, const QDateTime &modified)
{
    const QString path = m_dir->filePath(relativePath);
    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if (file.open(QIODevice::Append)) {
        file.write(content);
        file.flush();
        if (modified.isValid()) {
            file.setFileTime(modified, QFileDevice::FileModificationTime);
        }
        file.close();
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

void LogDirectoryWatcherTest::testClassifyRootSession()
{
    LogDirectoryWatcher watcher(m_dir->path());
    const QString path = m_dir->filePath(QStringLiteral("abc-123.jsonl"));

    const LogFileEvent event = watcher.classify(path);

    QVERIFY(event.isValid());
    QCOMPARE(event.sessionId, QStringLiteral("abc-123"));
    QVERIFY(event.parentId.isEmpty());
    QVERIFY(!event.isSubagent);
    QCOMPARE(event.path, QDir::cleanPath(QFileInfo(path).absoluteFilePath()));
}

void LogDirectoryWatcherTest::testClassifySubagent()
{
    LogDirectoryWatcher watcher(m_dir->path());

    const LogFileEvent event = watcher.classify(m_dir->filePath(QStringLiteral("abc-123/subagents/agent-7f.jsonl")));

    QVERIFY(event.isValid());
    QCOMPARE(event.sessionId, QStringLiteral("abc-123/agent-7f"));
    QCOMPARE(event.parentId, QStringLiteral("abc-123"));
    QVERIFY(event.isSubagent);
}

void LogDirectoryWatcherTest::testClassifyIgnoresOtherFiles()
{
    LogDirectoryWatcher watcher(m_dir->path());

    QVERIFY(!watcher.classify(m_dir->filePath(QStringLiteral("notes.txt"))).isValid());
    QVERIFY(!watcher.classify(m_dir->filePath(QStringLiteral("abc-123/other.jsonl"))).isValid());
    QVERIFY(!watcher.classify(m_dir->filePath(QStringLiteral("abc-123/tools/agent-1.jsonl"))).isValid());
    QVERIFY(!watcher.classify(m_dir->filePath(QStringLiteral("../outside.jsonl"))).isValid());
}

void LogDirectoryWatcherTest::testClaudeProjectDirName()
{
    QCOMPARE(LogDirectoryWatcher::claudeProjectDirName(QStringLiteral("/Users/foo/github.com/project")),
             QStringLiteral("-Users-foo-github-com-project"));
    QCOMPARE(LogDirectoryWatcher::claudeProjectDirName(QStringLiteral("/home/me/src/app/")), QStringLiteral("-home-me-src-app"));
}

void LogDirectoryWatcherTest::testScanExistingOldestFirst()
{
    writeFile(QStringLiteral("newest.jsonl"), Line, BaseTime.addSecs(30));
    writeFile(QStringLiteral("oldest.jsonl"), Line, BaseTime.addSecs(10));
    writeFile(QStringLiteral("oldest/subagents/agent-a.jsonl"), Line, BaseTime.addSecs(20));
    writeFile(QStringLiteral("README.md"), "ignored", BaseTime);
    writeFile(QStringLiteral("oldest/stray.jsonl"), Line, BaseTime);

    LogDirectoryWatcher watcher(m_dir->path());
    const QList<LogFileEvent> events = watcher.scanExisting();

    QCOMPARE(events.size(), 3);
    QCOMPARE(events.at(0).sessionId, QStringLiteral("oldest"));
    QCOMPARE(events.at(1).sessionId, QStringLiteral("oldest/agent-a"));
    QCOMPARE(events.at(1).parentId, QStringLiteral("oldest"));
    QCOMPARE(events.at(2).sessionId, QStringLiteral("newest"));
}

void LogDirectoryWatcherTest::testScanExistingEmptyRoot()
{
    LogDirectoryWatcher watcher(m_dir->path());
    QVERIFY(watcher.scanExisting().isEmpty());
}

void LogDirectoryWatcherTest::testStartFailsForMissingRoot()
{
    LogDirectoryWatcher watcher(m_dir->filePath(QStringLiteral("does-not-exist")));

    QVERIFY(!watcher.start());
    QVERIFY(!watcher.isRunning());
    QVERIFY(watcher.scanExisting().isEmpty());
}

void LogDirectoryWatcherTest::testStartStop()
{
    LogDirectoryWatcher watcher(m_dir->path());

    QVERIFY(watcher.start());
    QVERIFY(watcher.isRunning());
    QVERIFY(watcher.start());

    watcher.stop();
    QVERIFY(!watcher.isRunning());
}

void LogDirectoryWatcherTest::testReportsAppend()
{
    const QString path = writeFile(QStringLiteral("live.jsonl"), Line);

    LogDirectoryWatcher watcher(m_dir->path());
    QSignalSpy spy(&watcher, &LogDirectoryWatcher::logFileChanged);
    QVERIFY(spy.isValid());
    QVERIFY(watcher.start());

    writeFile(QStringLiteral("live.jsonl"), Line);

    QTRY_VERIFY_WITH_TIMEOUT(spyHasSession(spy, QStringLiteral("live")), 5000);
    QCOMPARE(spy.last().at(0).value<LogFileEvent>().path, path);
}

void LogDirectoryWatcherTest::testReportsNewTranscript()
{
    LogDirectoryWatcher watcher(m_dir->path());
    QSignalSpy spy(&watcher, &LogDirectoryWatcher::logFileChanged);
    QVERIFY(spy.isValid());
    QVERIFY(watcher.start());

    writeFile(QStringLiteral("fresh.jsonl"), Line);

    QTRY_VERIFY_WITH_TIMEOUT(spyHasSession(spy, QStringLiteral("fresh")), 5000);
}

void LogDirectoryWatcherTest::testReportsNewSubagentDirectory()
{
    writeFile(QStringLiteral("parent.jsonl"), Line);

    LogDirectoryWatcher watcher(m_dir->path());
    QSignalSpy spy(&watcher, &LogDirectoryWatcher::logFileChanged);
    QVERIFY(spy.isValid());
    QVERIFY(watcher.start());

    writeFile(QStringLiteral("parent/subagents/agent-1.jsonl"), Line);

    QTRY_VERIFY_WITH_TIMEOUT(spyHasSession(spy, QStringLiteral("parent/agent-1")), 5000);

    // Later appends to the new transcript are reported too
    spy.clear();
    writeFile(QStringLiteral("parent/subagents/agent-1.jsonl"), Line);
    QTRY_VERIFY_WITH_TIMEOUT(spyHasSession(spy, QStringLiteral("parent/agent-1")), 5000);
}

void LogDirectoryWatcherTest::testIgnoresRemovedTranscript()
{
    const QString path = writeFile(QStringLiteral("doomed.jsonl"), Line);
    writeFile(QStringLiteral("alive.jsonl"), Line);

    LogDirectoryWatcher watcher(m_dir->path());
    QSignalSpy spy(&watcher, &LogDirectoryWatcher::logFileChanged);
    QVERIFY(spy.isValid());
    QVERIFY(watcher.start());

    QVERIFY(QFile::remove(path));
    // Something that is reported, so the removal has been processed by the time it arrives
    writeFile(QStringLiteral("alive.jsonl"), Line);

    QTRY_VERIFY_WITH_TIMEOUT(spyHasSession(spy, QStringLiteral("alive")), 5000);
    QTest::qWait(200);
    QVERIFY(!spyHasSession(spy, QStringLiteral("doomed")));
}

QTEST_GUILESS_MAIN(LogDirectoryWatcherTest)

#include "moc_LogDirectoryWatcherTest.cpp"
