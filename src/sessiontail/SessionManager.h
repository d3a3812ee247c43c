/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include "sessiontail_export.h"

#include "ExclusionFilter.h"
#include "Session.h"
#include "SlotTable.h"

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QReadWriteLock>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>

namespace SessionTail
{

/**
 * SessionManager is the live model of every transcript being tailed.
 *
 * Features:
 * - Owns all Session state: messages, parse offsets, recency
 * - Assigns sessions to a fixed number of display slots, evicting the least
 *   recently updated occupant when they are all taken
 * - Rebuilds the root/sub-agent hierarchy, sorted or in the order last shown
 * - Hides sessions matching the exclusion patterns from every view
 *
 * One ingestion thread mutates the model while any number of render threads
 * query it. A single read/write lock covers the whole state; each call holds
 * it for its entire duration, and queries return value snapshots.
 *
 * Slot membership and the hierarchy ordering are only refreshed when asked
 * for; nothing is invalidated automatically.
 */
class SESSIONTAIL_EXPORT SessionManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Source of lastUpdate timestamps. Only called with the write lock held.
     */
    using Clock = std::function<QDateTime()>;

    explicit SessionManager(int slotCount, const QStringList &excludePatterns = QStringList(), QObject *parent = nullptr);
    SessionManager(int slotCount, const QStringList &excludePatterns, const Clock &clock, QObject *parent = nullptr);
    ~SessionManager() override;

    /**
     * Wall clock in UTC that never hands out the same millisecond twice, so
     * back-to-back updates keep their order.
     */
    static Clock strictlyIncreasingClock();

    // ========== Session store ==========

    /**
     * Return the session @p id, creating it if needed.
     *
     * An existing session only has its lastUpdate refreshed; path, parent and
     * messages are left alone. A new session starts empty at offset 0 and is
     * offered a display slot.
     *
     * An empty @p id creates nothing and returns an invalid Session.
     */
    Session getOrCreate(const QString &id, const QString &path, const QString &parentId = QString(), bool isSubagent = false);

    /**
     * Append decoded @p messages to session @p id and move its offset to
     * @p newOffset. Unknown ids are ignored.
     */
    void append(const QString &id, const QList<Message> &messages, qint64 newOffset);

    /**
     * Snapshot of session @p id, excluded or not. Invalid if unknown.
     */
    Session session(const QString &id) const;

    bool contains(const QString &id) const;

    int sessionCount() const;

    /**
     * Visible sessions, newest first
     */
    QList<Session> allSessions() const;

    /**
     * Visible sessions whose parent is @p parentId, newest first
     */
    QList<Session> childSessions(const QString &parentId) const;

    /**
     * Ids that received messages since the previous call
     */
    QStringList takeRecentlyUpdated();

    // ========== Display slots ==========

    /**
     * Offer session @p id a display slot. Unknown, excluded and already
     * placed sessions are left alone.
     */
    void assignSlot(const QString &id);

    /**
     * Change the number of slots; see SlotTable::resize()
     */
    void setSlotCount(int count);

    int slotCount() const;

    /**
     * Sessions currently holding a slot, newest first, padded with invalid
     * sessions up to slotCount()
     */
    QList<Session> slotOccupants() const;

    // ========== Hierarchy ==========

    /**
     * Root sessions with their sub-agents, each level newest first
     */
    SessionForest buildSorted() const;

    /**
     * Same forest, keeping the order of @p previous for nodes already shown
     */
    SessionForest buildPreservingOrder(const SessionForest &previous) const;

    // ========== Exclusion ==========

    bool isExcluded(const QString &id) const;
    QStringList excludePatterns() const;

Q_SIGNALS:
    /**
     * Emitted after a new session has been registered
     */
    void sessionCreated(const QString &id);

    /**
     * Emitted after messages were appended to a session
     */
    void sessionAppended(const QString &id, int messageCount);

    /**
     * Emitted when the slot count actually changed
     */
    void slotCountChanged(int count);

private:
    // Callers must hold m_lock
    void assignSlotLocked(const QString &id);
    QDateTime lastUpdateLocked(const QString &id) const;
    QList<Session> visibleSessionsLocked() const;
    QSet<QString> knownIdsLocked() const;

    mutable QReadWriteLock m_lock;

    QHash<QString, Session> m_sessions;
    QStringList m_creationOrder;
    QSet<QString> m_recentlyUpdated;

    SlotTable m_slots;
    const ExclusionFilter m_filter;
    const Clock m_clock;
};

} // namespace SessionTail

#endif // SESSIONMANAGER_H
