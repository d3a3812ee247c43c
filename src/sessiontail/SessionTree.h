/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONTREE_H
#define SESSIONTREE_H

#include "sessiontail_export.h"

#include "Session.h"

#include <QList>
#include <QSet>
#include <QString>

namespace SessionTail
{

/**
 * SessionTree rebuilds the parent/child forest from flat parentId links.
 *
 * Input is the list of visible (non-excluded) sessions in creation order, plus
 * the ids of every tracked session, excluded ones included. A session whose
 * parent was never tracked is shown as a root until the parent shows up. A
 * session whose parent is tracked but hidden disappears with that parent.
 */
class SESSIONTAIL_EXPORT SessionTree
{
public:
    /**
     * Roots and every child list ordered newest first
     */
    static SessionForest buildSorted(const QList<Session> &visible, const QSet<QString> &knownIds);

    /**
     * Same grouping, but ordered after @p previous: nodes already shown keep
     * their relative order, new nodes follow in creation order.
     */
    static SessionForest buildPreservingOrder(const QList<Session> &visible, const QSet<QString> &knownIds, const SessionForest &previous);

    /**
     * Depth-first search for @p sessionId, nullptr if absent
     */
    static const SessionNode *find(const SessionForest &forest, const QString &sessionId);

    /**
     * Total number of nodes in @p forest
     */
    static int nodeCount(const SessionForest &forest);
};

} // namespace SessionTail

#endif // SESSIONTREE_H
