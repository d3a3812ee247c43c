/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SlotTable.h"

#include <QDebug>

#include <algorithm>

namespace SessionTail
{

SlotTable::SlotTable(int count)
    : m_slots(wrapCount(count))
{
}

int SlotTable::wrapCount(int count)
{
    if (count < MinSlots || count > MaxSlots) {
        return MinSlots;
    }
    return count;
}

QString SlotTable::occupant(int index) const
{
    if (index < 0 || index >= m_slots.size()) {
        return QString();
    }
    return m_slots.at(index);
}

int SlotTable::indexOf(const QString &sessionId) const
{
    if (sessionId.isEmpty()) {
        return -1;
    }
    return m_slots.indexOf(sessionId);
}

QStringList SlotTable::occupants() const
{
    QStringList result;
    for (const QString &id : m_slots) {
        if (!id.isEmpty()) {
            result.append(id);
        }
    }
    return result;
}

int SlotTable::freeCount() const
{
    return static_cast<int>(std::count_if(m_slots.cbegin(), m_slots.cend(), [](const QString &id) {
        return id.isEmpty();
    }));
}

int SlotTable::assign(const QString &sessionId, const RecencyLookup &lastUpdateOf)
{
    if (sessionId.isEmpty()) {
        return -1;
    }

    const int existing = indexOf(sessionId);
    if (existing >= 0) {
        return existing;
    }

    for (int i = 0; i < m_slots.size(); ++i) {
        if (m_slots.at(i).isEmpty()) {
            m_slots[i] = sessionId;
            return i;
        }
    }

    // All slots taken: reuse the one whose occupant was updated least recently
    int oldestSlot = -1;
    QDateTime oldestTime;
    for (int i = 0; i < m_slots.size(); ++i) {
        const QDateTime time = lastUpdateOf(m_slots.at(i));
        if (!time.isValid()) {
            oldestSlot = i;
            break;
        }
        if (oldestSlot < 0 || time < oldestTime) {
            oldestSlot = i;
            oldestTime = time;
        }
    }

    qDebug() << "SlotTable::assign() - evicting" << m_slots.at(oldestSlot) << "from slot" << oldestSlot << "for" << sessionId;
    m_slots[oldestSlot] = sessionId;
    return oldestSlot;
}

void SlotTable::resize(int count, const QStringList &candidates, const RecencyLookup &lastUpdateOf)
{
    const int newCount = wrapCount(count);
    const int oldCount = m_slots.size();
    if (newCount == oldCount) {
        return;
    }

    if (newCount > oldCount) {
        m_slots.resize(newCount);

        int next = 0;
        for (int i = 0; i < newCount; ++i) {
            while (next < candidates.size() && contains(candidates.at(next))) {
                ++next;
            }
            if (next >= candidates.size()) {
                break;
            }
            if (m_slots.at(i).isEmpty()) {
                m_slots[i] = candidates.at(next++);
            }
        }
        qDebug() << "SlotTable::resize() - grew from" << oldCount << "to" << newCount << "slots";
        return;
    }

    // Shrinking: rank current slots by recency, unknown ids last
    QVector<int> ranked;
    for (int i = 0; i < oldCount; ++i) {
        if (!m_slots.at(i).isEmpty()) {
            ranked.append(i);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(), [&](int a, int b) {
        const QDateTime ta = lastUpdateOf(m_slots.at(a));
        const QDateTime tb = lastUpdateOf(m_slots.at(b));
        if (ta.isValid() != tb.isValid()) {
            return ta.isValid();
        }
        return ta > tb;
    });
    if (ranked.size() > newCount) {
        ranked.resize(newCount);
    }
    std::sort(ranked.begin(), ranked.end());

    QVector<QString> kept(newCount);
    for (int i = 0; i < ranked.size(); ++i) {
        kept[i] = m_slots.at(ranked.at(i));
    }
    m_slots = kept;
    qDebug() << "SlotTable::resize() - shrank from" << oldCount << "to" << newCount << "slots";
}

} // namespace SessionTail
