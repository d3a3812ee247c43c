/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LOGDIRECTORYWATCHER_H
#define LOGDIRECTORYWATCHER_H

#include "sessiontail_export.h"

#include <QList>
#include <QMetaType>
#include <QObject>
#include <QString>

class QFileSystemWatcher;

namespace SessionTail
{

/**
 * A transcript file that was created or appended to
 */
struct SESSIONTAIL_EXPORT LogFileEvent {
    QString path;
    QString sessionId;
    QString parentId; // owning root session, sub-agents only
    bool isSubagent = false;

    bool isValid() const
    {
        return !sessionId.isEmpty();
    }

    bool operator==(const LogFileEvent &other) const
    {
        return path == other.path && sessionId == other.sessionId && parentId == other.parentId && isSubagent == other.isSubagent;
    }
};

/**
 * LogDirectoryWatcher reports transcript activity below one project directory.
 *
 * Layout of a Claude project directory:
 *   {root}/{session-id}.jsonl                              root session
 *   {root}/{session-id}/subagents/agent-{id}.jsonl         sub-agent of that session
 *
 * Sub-agents get the id "{session-id}/agent-{id}" and parentId "{session-id}".
 * Other files are ignored.
 */
class SESSIONTAIL_EXPORT LogDirectoryWatcher : public QObject
{
    Q_OBJECT

public:
    explicit LogDirectoryWatcher(const QString &rootPath, QObject *parent = nullptr);
    ~LogDirectoryWatcher() override;

    QString rootPath() const
    {
        return m_rootPath;
    }

    /**
     * Watch every directory and transcript below the root.
     *
     * @return false if the root directory does not exist
     */
    bool start();

    /**
     * Stop watching
     */
    void stop();

    bool isRunning() const
    {
        return m_running;
    }

    /**
     * One event per existing transcript, least recently modified first, so
     * that replaying them leaves the newest sessions in the display slots.
     */
    QList<LogFileEvent> scanExisting() const;

    /**
     * Map a transcript path to its session; invalid event if it is not one
     */
    LogFileEvent classify(const QString &path) const;

    /**
     * Directory name Claude uses under ~/.claude/projects for a project:
     * "/home/me/my.app" becomes "-home-me-my-app"
     */
    static QString claudeProjectDirName(const QString &absolutePath);

Q_SIGNALS:
    void logFileChanged(const SessionTail::LogFileEvent &event);

private Q_SLOTS:
    void onDirectoryChanged(const QString &path);
    void onFileChanged(const QString &path);

private:
    void addDirectoryRecursive(const QString &path, bool reportFiles);
    void watchFile(const QString &path);

    QString m_rootPath;
    QFileSystemWatcher *m_watcher = nullptr;
    bool m_running = false;
};

} // namespace SessionTail

Q_DECLARE_METATYPE(SessionTail::LogFileEvent)

#endif // LOGDIRECTORYWATCHER_H
