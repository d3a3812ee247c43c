/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TAILSETTINGS_H
#define TAILSETTINGS_H

#include "sessiontail_export.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace SessionTail
{

/**
 * TailSettings manages the persistent defaults of the session tailer.
 *
 * Settings include:
 * - Number of display panels
 * - Root of the Claude projects directory
 * - Session id patterns hidden from display
 *
 * Stored in ~/.config/sessiontailrc unless another file is given.
 */
class SESSIONTAIL_EXPORT TailSettings : public QObject
{
    Q_OBJECT

public:
    explicit TailSettings(const QString &configName = QStringLiteral("sessiontailrc"), QObject *parent = nullptr);
    ~TailSettings() override;

    /**
     * Patterns hidden when nothing is configured
     */
    static QStringList defaultExcludePatterns();

    /**
     * Number of display panels, 1-5 (default: 4)
     */
    int panelCount() const;
    void setPanelCount(int count);

    /**
     * Directory holding one transcript directory per project
     * (default: ~/.claude/projects)
     */
    QString projectsRoot() const;
    void setProjectsRoot(const QString &path);

    /**
     * Session id substrings to hide (default: "prompt_suggestion")
     */
    QStringList excludePatterns() const;
    void setExcludePatterns(const QStringList &patterns);

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;
};

} // namespace SessionTail

#endif // TAILSETTINGS_H
