/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SLOTTABLETEST_H
#define SLOTTABLETEST_H

#include <QObject>

namespace SessionTail
{

class SlotTableTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testWrapCount_data();
    void testWrapCount();
    void testConstructorWrapsCount();

    // Assignment
    void testAssignFillsLowestFreeSlot();
    void testAssignExistingIsNoop();
    void testAssignEmptyIdRejected();
    void testEvictsOldestOccupant();
    void testEvictsUnknownOccupantFirst();
    void testEvictionTieGoesToLowestSlot();

    // Resizing
    void testGrowKeepsOccupantsInPlace();
    void testGrowFillsNewestCandidatesFirst();
    void testGrowWithFewCandidates();
    void testShrinkKeepsMostRecent();
    void testResizeOutOfRangeWraps();
};

}

#endif // SLOTTABLETEST_H
