/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Session.h"

namespace SessionTail
{

bool newerThan(const Session &a, const Session &b)
{
    if (a.lastUpdate != b.lastUpdate) {
        return a.lastUpdate > b.lastUpdate;
    }
    return a.id < b.id;
}

int SessionNode::subtreeSize() const
{
    int total = 1;
    for (const SessionNode &child : children) {
        total += child.subtreeSize();
    }
    return total;
}

} // namespace SessionTail
