#include "core/config_ledger.h"
#include <cassert>
#include <iostream>

using namespace curator::core;

static void testDefaultsAreValid() {
    EngineParams p;
    assert(ConfigLedger::validate(p).ok);
    ConfigLedger ledger;
    assert(!ledger.hasPending());
    assert(ledger.current().votingPeriod == 86400);
    assert(ledger.effectiveDeadlock() == DeadlockStrategy::REVERT);
}

static void testValidationBounds() {
    EngineParams p;
    p.votingPeriod = MIN_VOTING_PERIOD - 1;
    assert(ConfigLedger::validate(p).error == "invalid_voting_period");
    p.votingPeriod = MAX_VOTING_PERIOD + 1;
    assert(ConfigLedger::validate(p).error == "invalid_voting_period");

    p = EngineParams();
    p.blessingsPerUnit = 0;
    assert(ConfigLedger::validate(p).error == "invalid_blessings_per_unit");
    p.blessingsPerUnit = MAX_ACTIONS_PER_UNIT + 1;
    assert(ConfigLedger::validate(p).error == "invalid_blessings_per_unit");

    p = EngineParams();
    p.commandmentsPerUnit = 0;
    assert(ConfigLedger::validate(p).error == "invalid_commandments_per_unit");

    p = EngineParams();
    p.blessingWeight = MAX_WEIGHT + 1;
    assert(ConfigLedger::validate(p).error == "invalid_weight");

    p = EngineParams();
    p.timeDecayMin = p.timeDecayBase + 1;
    OpResult r = ConfigLedger::validate(p);
    assert(!r.ok);
    assert(r.kind == ErrorKind::VALIDATION);
    assert(r.error == "invalid_time_decay");
    p.timeDecayBase = 0;
    p.timeDecayMin = 0;
    assert(ConfigLedger::validate(p).error == "invalid_time_decay");
}

static void testScheduleIsDeferred() {
    ConfigLedger ledger;
    PendingParams update;
    update.votingPeriod = 7200;
    update.tieBreak = TieBreakStrategy::HIGHEST_SEED_ID;
    assert(ledger.validateUpdate(update).ok);
    ledger.schedule(update);

    assert(ledger.hasPending());
    assert(ledger.current().votingPeriod == 86400);
    assert(ledger.current().tieBreak == TieBreakStrategy::LOWEST_SEED_ID);

    auto applied = ledger.applyPending();
    assert(applied.size() == 2);
    assert(applied[0] == "voting_period");
    assert(applied[1] == "tie_break");
    assert(ledger.current().votingPeriod == 7200);
    assert(ledger.current().tieBreak == TieBreakStrategy::HIGHEST_SEED_ID);
    assert(!ledger.hasPending());
    assert(ledger.applyPending().empty());
}

static void testLaterScheduleOverridesEarlier() {
    ConfigLedger ledger;
    PendingParams first;
    first.votingPeriod = 7200;
    first.blessingCost = 5;
    ledger.schedule(first);

    PendingParams second;
    second.votingPeriod = 10800;
    ledger.schedule(second);

    ledger.applyPending();
    assert(ledger.current().votingPeriod == 10800);
    assert(ledger.current().blessingCost == 5);
}

static void testUpdateValidatedAgainstMergedState() {
    ConfigLedger ledger;
    PendingParams lowerBase;
    lowerBase.timeDecayBase = 100;
    lowerBase.timeDecayMin = 50;
    assert(ledger.validateUpdate(lowerBase).ok);
    ledger.schedule(lowerBase);

    // 500 is below the live base but above the staged one.
    PendingParams raiseMin;
    raiseMin.timeDecayMin = 500;
    assert(ledger.validateUpdate(raiseMin).error == "invalid_time_decay");

    assert(ledger.validateUpdate(PendingParams()).error == "empty_update");
}

static void testStagedDeadlockIsEffective() {
    ConfigLedger ledger;
    PendingParams update;
    update.deadlock = DeadlockStrategy::SKIP_ROUND;
    ledger.schedule(update);
    assert(ledger.current().deadlock == DeadlockStrategy::REVERT);
    assert(ledger.effectiveDeadlock() == DeadlockStrategy::SKIP_ROUND);
}

static void testPendingNames() {
    PendingParams p;
    assert(p.empty());
    p.scoreResetOnRoundEnd = false;
    assert(!p.empty());
    assert(p.names().size() == 1);
    assert(p.names()[0] == "score_reset");

    EngineParams base;
    base.scoreResetOnRoundEnd = true;
    assert(!p.overlay(base).scoreResetOnRoundEnd);
}

static void testTreasury() {
    ConfigLedger ledger;
    assert(ledger.treasury().empty());
    ledger.setTreasury("vault");
    assert(ledger.treasury() == "vault");
}

int main() {
    testDefaultsAreValid();
    testValidationBounds();
    testScheduleIsDeferred();
    testLaterScheduleOverridesEarlier();
    testUpdateValidatedAgainstMergedState();
    testStagedDeadlockIsEffective();
    testPendingNames();
    testTreasury();
    std::cout << "Config ledger tests passed" << std::endl;
    return 0;
}
