/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LogDirectoryWatcher.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QFileSystemWatcher>

#include <algorithm>

namespace SessionTail
{

static const QLatin1String JsonlSuffix(".jsonl");
static const QLatin1String SubagentsDir("subagents");

static QString stripJsonlSuffix(const QString &fileName)
{
    return fileName.left(fileName.size() - JsonlSuffix.size());
}

LogDirectoryWatcher::LogDirectoryWatcher(const QString &rootPath, QObject *parent)
    : QObject(parent)
    , m_rootPath(QDir::cleanPath(QFileInfo(rootPath).absoluteFilePath()))
    , m_watcher(new QFileSystemWatcher(this))
{
    qRegisterMetaType<SessionTail::LogFileEvent>();

    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &LogDirectoryWatcher::onDirectoryChanged);
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &LogDirectoryWatcher::onFileChanged);
}

LogDirectoryWatcher::~LogDirectoryWatcher()
{
    stop();
}

bool LogDirectoryWatcher::start()
{
    if (m_running) {
        return true;
    }

    if (!QFileInfo(m_rootPath).isDir()) {
        qWarning() << "LogDirectoryWatcher::start() - not a directory:" << m_rootPath;
        return false;
    }

    addDirectoryRecursive(m_rootPath, false);
    m_running = true;

    qDebug() << "LogDirectoryWatcher::start() - watching" << m_watcher->directories().size() << "directories and"
             << m_watcher->files().size() << "transcripts below" << m_rootPath;
    return true;
}

void LogDirectoryWatcher::stop()
{
    if (!m_running) {
        return;
    }

    const QStringList directories = m_watcher->directories();
    if (!directories.isEmpty()) {
        m_watcher->removePaths(directories);
    }
    const QStringList files = m_watcher->files();
    if (!files.isEmpty()) {
        m_watcher->removePaths(files);
    }
    m_running = false;
}

QList<LogFileEvent> LogDirectoryWatcher::scanExisting() const
{
    struct Found {
        LogFileEvent event;
        QDateTime modified;
    };
    QList<Found> found;

    QDirIterator it(m_rootPath, QStringList{QStringLiteral("*.jsonl")}, QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const LogFileEvent event = classify(path);
        if (event.isValid()) {
            found.append({event, it.fileInfo().lastModified()});
        }
    }

    std::sort(found.begin(), found.end(), [](const Found &a, const Found &b) {
        if (a.modified != b.modified) {
            return a.modified < b.modified;
        }
        return a.event.path < b.event.path;
    });

    QList<LogFileEvent> events;
    events.reserve(found.size());
    for (const Found &entry : found) {
        events.append(entry.event);
    }

    qDebug() << "LogDirectoryWatcher::scanExisting() - found" << events.size() << "transcripts";
    return events;
}

LogFileEvent LogDirectoryWatcher::classify(const QString &path) const
{
    LogFileEvent event;

    const QString absolutePath = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    if (!absolutePath.endsWith(JsonlSuffix)) {
        return event;
    }

    const QString relative = QDir(m_rootPath).relativeFilePath(absolutePath);
    if (relative.startsWith(QLatin1String(".."))) {
        return event;
    }

    const QStringList parts = relative.split(QLatin1Char('/'), Qt::SkipEmptyParts);

    if (parts.size() == 1) {
        event.path = absolutePath;
        event.sessionId = stripJsonlSuffix(parts.first());
        return event;
    }

    if (parts.size() >= 3 && parts.at(1) == SubagentsDir) {
        event.path = absolutePath;
        event.parentId = parts.first();
        event.sessionId = parts.first() + QLatin1Char('/') + stripJsonlSuffix(parts.last());
        event.isSubagent = true;
    }

    return event;
}

QString LogDirectoryWatcher::claudeProjectDirName(const QString &absolutePath)
{
    QString name = QDir::cleanPath(absolutePath);
    name.replace(QLatin1Char('/'), QLatin1Char('-'));
    name.replace(QLatin1Char('.'), QLatin1Char('-'));
    return name;
}

void LogDirectoryWatcher::onDirectoryChanged(const QString &path)
{
    const QDir dir(path);
    if (!dir.exists()) {
        return;
    }

    // New subdirectories (a session starting its first sub-agent)
    const QStringList subdirs = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &name : subdirs) {
        const QString subdir = dir.filePath(name);
        if (!m_watcher->directories().contains(subdir)) {
            addDirectoryRecursive(subdir, true);
        }
    }

    // New transcripts: watch them and report their first lines
    const QStringList files = dir.entryList(QStringList{QStringLiteral("*.jsonl")}, QDir::Files);
    for (const QString &name : files) {
        const QString file = dir.filePath(name);
        if (m_watcher->files().contains(file)) {
            continue;
        }
        watchFile(file);

        const LogFileEvent event = classify(file);
        if (event.isValid()) {
            Q_EMIT logFileChanged(event);
        }
    }
}

void LogDirectoryWatcher::onFileChanged(const QString &path)
{
    // Removed transcripts have nothing left to read
    if (!QFileInfo::exists(path)) {
        return;
    }

    // Editors and atomic writers replace the file, which drops the watch
    if (!m_watcher->files().contains(path)) {
        watchFile(path);
    }

    const LogFileEvent event = classify(path);
    if (event.isValid()) {
        Q_EMIT logFileChanged(event);
    }
}

void LogDirectoryWatcher::addDirectoryRecursive(const QString &path, bool reportFiles)
{
    if (!m_watcher->directories().contains(path) && !m_watcher->addPath(path)) {
        qWarning() << "LogDirectoryWatcher::addDirectoryRecursive() - cannot watch" << path;
    }

    const QDir dir(path);
    const QStringList files = dir.entryList(QStringList{QStringLiteral("*.jsonl")}, QDir::Files);
    for (const QString &name : files) {
        const QString file = dir.filePath(name);
        watchFile(file);

        if (reportFiles) {
            const LogFileEvent event = classify(file);
            if (event.isValid()) {
                Q_EMIT logFileChanged(event);
            }
        }
    }

    const QStringList subdirs = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &name : subdirs) {
        addDirectoryRecursive(dir.filePath(name), reportFiles);
    }
}

void LogDirectoryWatcher::watchFile(const QString &path)
{
    if (m_watcher->files().contains(path)) {
        return;
    }
    if (!m_watcher->addPath(path)) {
        qWarning() << "LogDirectoryWatcher::watchFile() - cannot watch" << path;
    }
}

} // namespace SessionTail

#include "moc_LogDirectoryWatcher.cpp"
