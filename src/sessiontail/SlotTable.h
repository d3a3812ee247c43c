/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SLOTTABLE_H
#define SLOTTABLE_H

#include "sessiontail_export.h"

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include <functional>

namespace SessionTail
{

/**
 * SlotTable maps display slots 0..count-1 to session ids.
 *
 * When every slot is taken, a new session replaces the occupant with the
 * oldest lastUpdate. The table holds ids only; recency is resolved through a
 * lookup supplied by the owner, which also serializes access.
 */
class SESSIONTAIL_EXPORT SlotTable
{
public:
    static constexpr int MinSlots = 1;
    static constexpr int MaxSlots = 5;
    static constexpr int DefaultSlots = 4;

    /**
     * Resolves a session id to its lastUpdate. An invalid QDateTime means the
     * id is unknown, which makes its slot the first to be reused.
     */
    using RecencyLookup = std::function<QDateTime(const QString &)>;

    explicit SlotTable(int count = DefaultSlots);

    /**
     * Counts outside [MinSlots, MaxSlots] wrap around to MinSlots, the way a
     * cycling "more panels" key behaves.
     */
    static int wrapCount(int count);

    int count() const
    {
        return m_slots.size();
    }

    /**
     * Id in slot @p index, empty if the slot is free or out of range
     */
    QString occupant(int index) const;

    /**
     * Slot holding @p sessionId, or -1
     */
    int indexOf(const QString &sessionId) const;

    bool contains(const QString &sessionId) const
    {
        return indexOf(sessionId) >= 0;
    }

    /**
     * Assigned ids in slot index order
     */
    QStringList occupants() const;

    int freeCount() const;

    /**
     * Give @p sessionId a slot: nothing if it already has one, else the lowest
     * free slot, else the slot of the oldest occupant (lowest index on ties).
     *
     * @return the slot index used, -1 for an empty id
     */
    int assign(const QString &sessionId, const RecencyLookup &lastUpdateOf);

    /**
     * Change the slot count to wrapCount(@p count).
     *
     * Growing keeps every occupant in place and fills the new free slots from
     * @p candidates, which must be ordered newest first. Shrinking keeps the
     * most recently updated occupants, packed into the lowest slots in their
     * previous slot order.
     */
    void resize(int count, const QStringList &candidates, const RecencyLookup &lastUpdateOf);

private:
    QVector<QString> m_slots;
};

} // namespace SessionTail

#endif // SLOTTABLE_H
