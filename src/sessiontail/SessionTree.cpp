/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionTree.h"

#include <QHash>
#include <QVector>

#include <algorithm>

namespace SessionTail
{

namespace
{

struct Grouping {
    QList<Session> roots;
    QHash<QString, QList<Session>> children; // parentId -> children, creation order
};

Grouping group(const QList<Session> &visible, const QSet<QString> &knownIds)
{
    Grouping result;
    for (const Session &session : visible) {
        if (session.isRoot() || !knownIds.contains(session.parentId)) {
            result.roots.append(session);
        } else {
            result.children[session.parentId].append(session);
        }
    }
    return result;
}

SessionNode buildSortedNode(const Session &session, const Grouping &grouping)
{
    SessionNode node;
    node.sessionId = session.id;

    QList<Session> children = grouping.children.value(session.id);
    std::sort(children.begin(), children.end(), newerThan);
    for (const Session &child : children) {
        node.children.append(buildSortedNode(child, grouping));
    }
    return node;
}

// Reorder by the previously shown list; previous may be null for nodes never shown
SessionNode buildPreservedNode(const Session &session, const Grouping &grouping, const SessionNode *previous);

SessionForest preserveOrder(const QList<Session> &current, const Grouping &grouping, const SessionForest &previous)
{
    QHash<QString, int> indexById;
    for (int i = 0; i < current.size(); ++i) {
        indexById.insert(current.at(i).id, i);
    }

    SessionForest result;
    QVector<bool> placed(current.size(), false);

    for (const SessionNode &old : previous) {
        const auto it = indexById.constFind(old.sessionId);
        if (it == indexById.constEnd() || placed.at(it.value())) {
            continue;
        }
        result.append(buildPreservedNode(current.at(it.value()), grouping, &old));
        placed[it.value()] = true;
    }

    for (int i = 0; i < current.size(); ++i) {
        if (!placed.at(i)) {
            result.append(buildPreservedNode(current.at(i), grouping, nullptr));
        }
    }
    return result;
}

SessionNode buildPreservedNode(const Session &session, const Grouping &grouping, const SessionNode *previous)
{
    const SessionForest noChildren;
    const SessionForest &previousChildren = previous ? previous->children : noChildren;

    SessionNode node;
    node.sessionId = session.id;
    node.children = preserveOrder(grouping.children.value(session.id), grouping, previousChildren);
    return node;
}

} // namespace

SessionForest SessionTree::buildSorted(const QList<Session> &visible, const QSet<QString> &knownIds)
{
    const Grouping grouping = group(visible, knownIds);

    QList<Session> roots = grouping.roots;
    std::sort(roots.begin(), roots.end(), newerThan);

    SessionForest forest;
    forest.reserve(roots.size());
    for (const Session &root : roots) {
        forest.append(buildSortedNode(root, grouping));
    }
    return forest;
}

SessionForest SessionTree::buildPreservingOrder(const QList<Session> &visible, const QSet<QString> &knownIds, const SessionForest &previous)
{
    const Grouping grouping = group(visible, knownIds);
    return preserveOrder(grouping.roots, grouping, previous);
}

const SessionNode *SessionTree::find(const SessionForest &forest, const QString &sessionId)
{
    for (const SessionNode &node : forest) {
        if (node.sessionId == sessionId) {
            return &node;
        }
        if (const SessionNode *found = find(node.children, sessionId)) {
            return found;
        }
    }
    return nullptr;
}

int SessionTree::nodeCount(const SessionForest &forest)
{
    int total = 0;
    for (const SessionNode &node : forest) {
        total += node.subtreeSize();
    }
    return total;
}

} // namespace SessionTail
