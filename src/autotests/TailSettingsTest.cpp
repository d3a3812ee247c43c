/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "TailSettingsTest.h"

// Qt
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// SessionTail
#include "../sessiontail/TailSettings.h"

using namespace SessionTail;

void TailSettingsTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void TailSettingsTest::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
}

void TailSettingsTest::cleanup()
{
    delete m_dir;
    m_dir = nullptr;
}

QString TailSettingsTest::configPath() const
{
    return m_dir->filePath(QStringLiteral("sessiontailrc"));
}

void TailSettingsTest::testDefaults()
{
    TailSettings settings(configPath());

    QCOMPARE(settings.panelCount(), 4);
    QCOMPARE(settings.projectsRoot(), QDir::homePath() + QStringLiteral("/.claude/projects"));
    QCOMPARE(settings.excludePatterns(), QStringList({QStringLiteral("prompt_suggestion")}));
    QCOMPARE(TailSettings::defaultExcludePatterns(), settings.excludePatterns());
}

void TailSettingsTest::testPanelCountWraps()
{
    TailSettings settings(configPath());

    settings.setPanelCount(5);
    QCOMPARE(settings.panelCount(), 5);

    settings.setPanelCount(6);
    QCOMPARE(settings.panelCount(), 1);

    settings.setPanelCount(0);
    QCOMPARE(settings.panelCount(), 1);

    settings.setPanelCount(2);
    QCOMPARE(settings.panelCount(), 2);
}

void TailSettingsTest::testSettingsPersist()
{
    {
        TailSettings settings(configPath());
        settings.setPanelCount(3);
        settings.setProjectsRoot(QStringLiteral("/srv/claude/projects"));
        settings.setExcludePatterns({QStringLiteral("warmup"), QStringLiteral("prompt_suggestion")});
    }

    QVERIFY(QFile::exists(configPath()));

    TailSettings reloaded(configPath());
    QCOMPARE(reloaded.panelCount(), 3);
    QCOMPARE(reloaded.projectsRoot(), QStringLiteral("/srv/claude/projects"));
    QCOMPARE(reloaded.excludePatterns(), QStringList({QStringLiteral("warmup"), QStringLiteral("prompt_suggestion")}));
}

void TailSettingsTest::testSettingsChangedSignal()
{
    TailSettings settings(configPath());
    QSignalSpy spy(&settings, &TailSettings::settingsChanged);
    QVERIFY(spy.isValid());

    settings.setPanelCount(2);
    settings.setProjectsRoot(QStringLiteral("/tmp/projects"));
    settings.setExcludePatterns({QStringLiteral("warmup")});

    QCOMPARE(spy.count(), 3);
}

void TailSettingsTest::testOutOfRangeValueInFile()
{
    QFile file(configPath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("[General]\nPanelCount=9\n");
    file.close();

    TailSettings settings(configPath());
    QCOMPARE(settings.panelCount(), 1);
}

QTEST_GUILESS_MAIN(TailSettingsTest)

#include "moc_TailSettingsTest.cpp"
