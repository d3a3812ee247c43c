/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONMANAGERTEST_H
#define SESSIONMANAGERTEST_H

#include <QObject>

namespace SessionTail
{

class SessionManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Session store
    void testCreateSession();
    void testGetOrCreateIsIdempotent();
    void testEmptyIdIgnored();
    void testAppendConcatenatesBatches();
    void testAppendEmptyBatchMovesOffset();
    void testAppendUnknownIdIgnored();
    void testAppendRefreshesLastUpdate();
    void testSnapshotsAreIsolated();
    void testAllSessionsNewestFirst();
    void testAllSessionsTieBrokenById();
    void testChildSessions();
    void testTakeRecentlyUpdated();
    void testSignals();
    void testDefaultClockStrictlyIncreases();

    // Slot assignment
    void testSlotScenario();
    void testSlotOccupantsPadded();
    void testEvictsLeastRecentlyUpdated();
    void testEvictionTieGoesToLowestSlot();
    void testAppendDoesNotAssignSlot();
    void testAssignSlotIgnoresEmptyAndUnknownIds();
    void testGrowBackfillsMostRecentFirst();
    void testGrowNeverEvicts();
    void testShrinkKeepsNewest();
    void testSlotCountWraps();
    void testSlotCountChangedSignal();

    // Exclusion
    void testExcludedSessionStillTracked();
    void testExcludedSessionNeverTakesSlot();
    void testGrowSkipsExcludedSessions();
};

}

#endif // SESSIONMANAGERTEST_H
