/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSION_H
#define SESSION_H

#include "sessiontail_export.h"

#include "Message.h"

#include <QDateTime>
#include <QList>
#include <QString>

namespace SessionTail
{

/**
 * Session is the tracked state of one transcript file: a root agent run or
 * one of its sub-agents.
 *
 * SessionManager owns the authoritative copy. Every query hands out a value
 * snapshot; the message list is implicitly shared, so snapshots are cheap and
 * never observe a later append.
 */
class SESSIONTAIL_EXPORT Session
{
public:
    Session() = default;

    QString id; // "{root}" or "{root}/agent-{x}" for sub-agents
    QString path; // backing JSONL file
    QString parentId; // empty for root sessions
    bool isSubagent = false;

    QList<Message> messages; // oldest first, append-only
    qint64 offset = 0; // bytes consumed from path
    QDateTime lastUpdate;

    /**
     * Default-constructed sessions stand for "no session"
     */
    bool isValid() const
    {
        return !id.isEmpty();
    }

    bool isRoot() const
    {
        return parentId.isEmpty();
    }
};

/**
 * Recency order: newest first, equal timestamps by id ascending
 */
SESSIONTAIL_EXPORT bool newerThan(const Session &a, const Session &b);

/**
 * SessionNode is one entry of a hierarchy query.
 *
 * It refers to its session by id only; look the session up through
 * SessionManager::session() when rendering.
 */
struct SESSIONTAIL_EXPORT SessionNode {
    QString sessionId;
    QList<SessionNode> children;
    bool expanded = true;

    /**
     * Number of nodes in this subtree, this node included
     */
    int subtreeSize() const;
};

using SessionForest = QList<SessionNode>;

} // namespace SessionTail

#endif // SESSION_H
