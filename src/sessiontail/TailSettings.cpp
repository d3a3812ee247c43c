/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TailSettings.h"
#include "SlotTable.h"

#include <KConfigGroup>
#include <QDir>

namespace SessionTail
{

TailSettings::TailSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // Absolute paths are used as-is, bare names resolve under ~/.config
    m_config = KSharedConfig::openConfig(configName, KConfig::SimpleConfig);
}

TailSettings::~TailSettings()
{
    save();
}

QStringList TailSettings::defaultExcludePatterns()
{
    return {QStringLiteral("prompt_suggestion")};
}

int TailSettings::panelCount() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    return SlotTable::wrapCount(group.readEntry("PanelCount", int(SlotTable::DefaultSlots)));
}

void TailSettings::setPanelCount(int count)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("PanelCount", SlotTable::wrapCount(count));
    Q_EMIT settingsChanged();
}

QString TailSettings::projectsRoot() const
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    const QString defaultRoot = QDir::homePath() + QStringLiteral("/.claude/projects");
    return group.readEntry("ProjectsRoot", defaultRoot);
}

void TailSettings::setProjectsRoot(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("General"));
    group.writeEntry("ProjectsRoot", path);
    Q_EMIT settingsChanged();
}

QStringList TailSettings::excludePatterns() const
{
    KConfigGroup group(m_config, QStringLiteral("Filter"));
    return group.readEntry("ExcludePatterns", defaultExcludePatterns());
}

void TailSettings::setExcludePatterns(const QStringList &patterns)
{
    KConfigGroup group(m_config, QStringLiteral("Filter"));
    group.writeEntry("ExcludePatterns", patterns);
    Q_EMIT settingsChanged();
}

void TailSettings::save()
{
    m_config->sync();
}

} // namespace SessionTail

#include "moc_TailSettings.cpp"
