/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionManager.h"
#include "SessionTree.h"

#include <QDebug>
#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>
#include <memory>

namespace SessionTail
{

SessionManager::SessionManager(int slotCount, const QStringList &excludePatterns, QObject *parent)
    : SessionManager(slotCount, excludePatterns, strictlyIncreasingClock(), parent)
{
}

SessionManager::SessionManager(int slotCount, const QStringList &excludePatterns, const Clock &clock, QObject *parent)
    : QObject(parent)
    , m_slots(slotCount)
    , m_filter(excludePatterns)
    , m_clock(clock ? clock : strictlyIncreasingClock())
{
}

SessionManager::~SessionManager() = default;

SessionManager::Clock SessionManager::strictlyIncreasingClock()
{
    auto last = std::make_shared<QDateTime>();
    return [last]() {
        QDateTime now = QDateTime::currentDateTimeUtc();
        if (last->isValid() && now <= *last) {
            now = last->addMSecs(1);
        }
        *last = now;
        return now;
    };
}

Session SessionManager::getOrCreate(const QString &id, const QString &path, const QString &parentId, bool isSubagent)
{
    if (id.isEmpty()) {
        qWarning() << "SessionManager::getOrCreate() - ignoring empty session id for" << path;
        return Session();
    }

    Session snapshot;
    {
        QWriteLocker locker(&m_lock);

        auto it = m_sessions.find(id);
        if (it != m_sessions.end()) {
            it->lastUpdate = m_clock();
            return *it;
        }

        Session session;
        session.id = id;
        session.path = path;
        session.parentId = parentId;
        session.isSubagent = isSubagent;
        session.lastUpdate = m_clock();

        m_sessions.insert(id, session);
        m_creationOrder.append(id);
        assignSlotLocked(id);
        snapshot = session;
    }

    Q_EMIT sessionCreated(id);
    return snapshot;
}

void SessionManager::append(const QString &id, const QList<Message> &messages, qint64 newOffset)
{
    {
        QWriteLocker locker(&m_lock);

        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            return;
        }

        it->messages.append(messages);
        it->offset = newOffset;
        it->lastUpdate = m_clock();
        if (!messages.isEmpty()) {
            m_recentlyUpdated.insert(id);
        }
    }

    if (!messages.isEmpty()) {
        Q_EMIT sessionAppended(id, messages.size());
    }
}

Session SessionManager::session(const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_sessions.value(id);
}

bool SessionManager::contains(const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_sessions.contains(id);
}

int SessionManager::sessionCount() const
{
    QReadLocker locker(&m_lock);
    return m_sessions.size();
}

QList<Session> SessionManager::allSessions() const
{
    QReadLocker locker(&m_lock);

    QList<Session> result = visibleSessionsLocked();
    std::sort(result.begin(), result.end(), newerThan);
    return result;
}

QList<Session> SessionManager::childSessions(const QString &parentId) const
{
    QReadLocker locker(&m_lock);

    QList<Session> children;
    for (const QString &id : m_creationOrder) {
        const Session session = m_sessions.value(id);
        if (!session.parentId.isEmpty() && session.parentId == parentId && !m_filter.matches(id)) {
            children.append(session);
        }
    }
    std::sort(children.begin(), children.end(), newerThan);
    return children;
}

QStringList SessionManager::takeRecentlyUpdated()
{
    QWriteLocker locker(&m_lock);

    QStringList ids;
    for (const QString &id : m_creationOrder) {
        if (m_recentlyUpdated.contains(id)) {
            ids.append(id);
        }
    }
    m_recentlyUpdated.clear();
    return ids;
}

void SessionManager::assignSlot(const QString &id)
{
    QWriteLocker locker(&m_lock);
    assignSlotLocked(id);
}

void SessionManager::setSlotCount(int count)
{
    int newCount = 0;
    {
        QWriteLocker locker(&m_lock);

        const int oldCount = m_slots.count();

        QList<Session> candidates;
        for (const QString &id : m_creationOrder) {
            if (!m_slots.contains(id) && !m_filter.matches(id)) {
                candidates.append(m_sessions.value(id));
            }
        }
        std::sort(candidates.begin(), candidates.end(), newerThan);

        QStringList candidateIds;
        candidateIds.reserve(candidates.size());
        for (const Session &candidate : candidates) {
            candidateIds.append(candidate.id);
        }

        m_slots.resize(count, candidateIds, [this](const QString &id) {
            return lastUpdateLocked(id);
        });

        newCount = m_slots.count();
        if (newCount == oldCount) {
            return;
        }
    }

    Q_EMIT slotCountChanged(newCount);
}

int SessionManager::slotCount() const
{
    QReadLocker locker(&m_lock);
    return m_slots.count();
}

QList<Session> SessionManager::slotOccupants() const
{
    QReadLocker locker(&m_lock);

    QList<Session> occupants;
    const QStringList ids = m_slots.occupants();
    for (const QString &id : ids) {
        const auto it = m_sessions.constFind(id);
        if (it != m_sessions.constEnd()) {
            occupants.append(*it);
        }
    }
    std::sort(occupants.begin(), occupants.end(), newerThan);

    while (occupants.size() < m_slots.count()) {
        occupants.append(Session());
    }
    return occupants;
}

SessionForest SessionManager::buildSorted() const
{
    QReadLocker locker(&m_lock);
    return SessionTree::buildSorted(visibleSessionsLocked(), knownIdsLocked());
}

SessionForest SessionManager::buildPreservingOrder(const SessionForest &previous) const
{
    QReadLocker locker(&m_lock);
    return SessionTree::buildPreservingOrder(visibleSessionsLocked(), knownIdsLocked(), previous);
}

bool SessionManager::isExcluded(const QString &id) const
{
    // m_filter is immutable after construction
    return m_filter.matches(id);
}

QStringList SessionManager::excludePatterns() const
{
    return m_filter.patterns();
}

void SessionManager::assignSlotLocked(const QString &id)
{
    // Only tracked sessions may take a slot from a live occupant
    if (id.isEmpty() || !m_sessions.contains(id) || m_filter.matches(id)) {
        return;
    }

    m_slots.assign(id, [this](const QString &occupant) {
        return lastUpdateLocked(occupant);
    });
}

QDateTime SessionManager::lastUpdateLocked(const QString &id) const
{
    const auto it = m_sessions.constFind(id);
    if (it == m_sessions.constEnd()) {
        return QDateTime();
    }
    return it->lastUpdate;
}

QList<Session> SessionManager::visibleSessionsLocked() const
{
    QList<Session> visible;
    visible.reserve(m_creationOrder.size());
    for (const QString &id : m_creationOrder) {
        if (!m_filter.matches(id)) {
            visible.append(m_sessions.value(id));
        }
    }
    return visible;
}

QSet<QString> SessionManager::knownIdsLocked() const
{
    QSet<QString> ids;
    ids.reserve(m_sessions.size());
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        ids.insert(it.key());
    }
    return ids;
}

} // namespace SessionTail

#include "moc_SessionManager.cpp"
