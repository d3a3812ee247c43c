/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef EXCLUSIONFILTER_H
#define EXCLUSIONFILTER_H

#include "sessiontail_export.h"

#include <QString>
#include <QStringList>

namespace SessionTail
{

/**
 * ExclusionFilter hides sessions whose id contains any configured pattern.
 *
 * Exclusion only affects visibility (slots, listings, hierarchy). Excluded
 * sessions are still tracked and keep accumulating messages.
 */
class SESSIONTAIL_EXPORT ExclusionFilter
{
public:
    ExclusionFilter() = default;
    explicit ExclusionFilter(const QStringList &patterns);

    QStringList patterns() const
    {
        return m_patterns;
    }

    bool isEmpty() const
    {
        return m_patterns.isEmpty();
    }

    /**
     * Substring match against every pattern, case-sensitive
     */
    bool matches(const QString &sessionId) const;

private:
    QStringList m_patterns;
};

} // namespace SessionTail

#endif // EXCLUSIONFILTER_H
