/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "ExclusionFilter.h"

namespace SessionTail
{

ExclusionFilter::ExclusionFilter(const QStringList &patterns)
{
    // An empty pattern would match every id
    for (const QString &pattern : patterns) {
        if (!pattern.isEmpty() && !m_patterns.contains(pattern)) {
            m_patterns.append(pattern);
        }
    }
}

bool ExclusionFilter::matches(const QString &sessionId) const
{
    for (const QString &pattern : m_patterns) {
        if (sessionId.contains(pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace SessionTail
