#include "core/scoring.h"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

using namespace curator::core;

static EngineParams flatParams() {
    EngineParams p;
    p.votingPeriod = 86400;
    p.blessingsPerUnit = 2;
    p.blessingWeight = 1000;
    p.timeDecayBase = 1000;
    p.timeDecayMin = 1000;
    return p;
}

static Seed makeSeed(SeedId id) {
    Seed s;
    s.id = id;
    s.creator = "creator";
    s.createdAt = 0;
    s.submittedInRound = 1;
    return s;
}

static void testIntegerSqrt() {
    assert(isqrt(0) == 0);
    assert(isqrt(1) == 1);
    assert(isqrt(3) == 1);
    assert(isqrt(4) == 2);
    assert(isqrt(1000000) == 1000);
    assert(isqrt(2000000) == 1414);
    assert(isqrt(std::numeric_limits<uint64_t>::max()) == 4294967295ULL);
}

static void testDampenIsSubLinear() {
    assert(dampen(0) == 0);
    assert(dampen(1) == 1000);
    assert(dampen(2) == 1414);
    assert(dampen(4) == 2000);
    for (uint64_t n = 1; n < 10; n++) {
        assert(dampen(n + 1) > dampen(n));
        assert(dampen(n + 1) - dampen(n) <= dampen(n) - dampen(n - 1));
    }
}

static void testDecayMultiplier() {
    assert(decayMultiplier(0, 100, 1000, 10) == 1000);
    assert(decayMultiplier(50, 100, 1000, 10) == 505);
    assert(decayMultiplier(100, 100, 1000, 10) == 10);
    assert(decayMultiplier(500, 100, 1000, 10) == 10);
    assert(decayMultiplier(50, 100, 1000, 1000) == 1000);
    assert(decayMultiplier(0, 0, 1000, 10) == 10);
}

static void testWeightedContributionFloor() {
    assert(weightedContribution(1000, 1000, 1000, 1000) == 1000);
    assert(weightedContribution(414, 1000, 1000, 1000) == 414);
    assert(weightedContribution(1000, 500, 1000, 1000) == 500);
    assert(weightedContribution(1, 1, 1, 1000) == 1);
    assert(weightedContribution(0, 1000, 1000, 1000) == 0);
    assert(weightedContribution(1000, 0, 1000, 1000) == 0);
}

static void testRepeatedBlessingsDampen() {
    ScoringEngine scoring;
    EngineParams p = flatParams();
    PeriodClock clock{0, 86400, 1};
    Seed a = makeSeed(1);
    Seed b = makeSeed(2);

    assert(scoring.applyBlessing(a, "x", "x", p, clock, 100) == 1000);
    assert(scoring.applyBlessing(a, "x", "x", p, clock, 200) == 414);
    assert(scoring.applyBlessing(b, "x", "x", p, clock, 300) == 1000);

    assert(a.blessingScore == 1414);
    assert(b.blessingScore == 1000);
    assert(a.blessingScore < 2 * b.blessingScore);
    assert(a.blessingCount == 2);

    assert(scoring.blessingCount("x", 1) == 2);
    assert(scoring.hasBlessed("x", 2));
    assert(!scoring.hasBlessed("y", 1));
    assert(scoring.pair("x", 1).lastBlessingDampened == 1414);
    assert(scoring.totalBlessings() == 3);
    assert(scoring.seedBlessings(1).size() == 2);
    assert(scoring.electorBlessings("x").size() == 3);
    assert(scoring.seedScoreByRound(1, 1) == 1414);
    assert(scoring.electorSeedBlessingsByRound(1, "x", 1) == 2);
}

static void testDecayedBlessing() {
    ScoringEngine scoring;
    EngineParams p = flatParams();
    p.timeDecayMin = 10;
    PeriodClock clock{1000, 1000, 1};
    Seed a = makeSeed(1);

    // Halfway through the period the multiplier is 505 of 1000.
    assert(scoring.applyBlessing(a, "x", "x", p, clock, 1500) == 505);
}

static void testDailyQuota() {
    ScoringEngine scoring;
    EngineParams p = flatParams();
    PeriodClock clock{0, 86400, 1};
    Seed a = makeSeed(1);

    assert(scoring.remainingBlessings("x", 1, p, 10) == 2);
    scoring.applyBlessing(a, "x", "x", p, clock, 10);
    scoring.applyBlessing(a, "x", "x", p, clock, 20);
    assert(scoring.blessingsUsedToday("x", 30) == 2);
    assert(scoring.remainingBlessings("x", 1, p, 30) == 0);
    assert(scoring.remainingBlessings("x", 3, p, 30) == 4);

    // Counters roll over at the UTC day boundary.
    assert(scoring.blessingsUsedToday("x", SECONDS_PER_DAY) == 0);
    assert(scoring.remainingBlessings("x", 1, p, SECONDS_PER_DAY + 5) == 2);
}

static void testDelegatedRecord() {
    ScoringEngine scoring;
    EngineParams p = flatParams();
    PeriodClock clock{0, 86400, 4};
    Seed a = makeSeed(1);
    scoring.applyBlessing(a, "x", "relayer", p, clock, 10);
    auto recs = scoring.seedBlessings(1);
    assert(recs.size() == 1);
    assert(recs[0].delegated);
    assert(recs[0].actor == "relayer");
    assert(recs[0].round == 4);
}

static void testCommandmentScoring() {
    ScoringEngine scoring;
    EngineParams p = flatParams();
    p.commandmentWeight = 500;
    PeriodClock clock{0, 86400, 1};
    Seed a = makeSeed(1);

    Commandment silent = scoring.applyCommandment(a, "x", "x", "QmCommentHandle01", false, p, clock, 10);
    assert(silent.id == 1);
    assert(silent.scoreDelta == 0);
    assert(a.blessingScore == 0);
    assert(a.commandmentCount == 1);

    Commandment scored = scoring.applyCommandment(a, "x", "x", "QmCommentHandle02", true, p, clock, 20);
    assert(scored.id == 2);
    // The silent commandment still advanced the pair's dampening curve.
    assert(scored.scoreDelta == 207);
    assert(a.blessingScore == 207);

    assert(scoring.commandmentsUsedToday("x", 30) == 2);
    assert(scoring.commandmentsBySeed(1).size() == 2);
    assert(scoring.commandmentsByAuthor("x").size() == 2);
    assert(scoring.totalCommandments() == 2);
}

int main() {
    testIntegerSqrt();
    testDampenIsSubLinear();
    testDecayMultiplier();
    testWeightedContributionFloor();
    testRepeatedBlessingsDampen();
    testDecayedBlessing();
    testDailyQuota();
    testDelegatedRecord();
    testCommandmentScoring();
    std::cout << "Scoring tests passed" << std::endl;
    return 0;
}
