#include "core/resolution.h"
#include <cassert>
#include <iostream>
#include <set>
#include <vector>

using namespace curator::core;
using curator::crypto::Hash256;

static Candidate cand(SeedId id, uint64_t score, Timestamp createdAt) {
    Candidate c;
    c.id = id;
    c.score = score;
    c.createdAt = createdAt;
    return c;
}

static Hash256 entropyOf(uint8_t b) {
    Hash256 h{};
    h.fill(b);
    return h;
}

static void testHighestScoreWins() {
    ResolutionPolicy policy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::REVERT);
    std::vector<Candidate> c = {cand(3, 900, 30), cand(1, 1414, 10), cand(2, 1000, 20)};
    Resolution r = policy.resolve(c, {}, 1, entropyOf(0));
    assert(r.outcome == ResolutionOutcome::WINNER);
    assert(r.winner == 1);
    assert(r.score == 1414);
    assert(!r.viaDeadlock);
}

static void testTieBreakStrategies() {
    // Ids deliberately out of submission order.
    std::vector<Candidate> tied = {cand(4, 500, 100), cand(2, 500, 300), cand(7, 500, 200), cand(9, 100, 0)};

    assert(ResolutionPolicy(TieBreakStrategy::EARLIEST_SUBMISSION, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 4);
    assert(ResolutionPolicy(TieBreakStrategy::LATEST_SUBMISSION, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 2);
    assert(ResolutionPolicy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 2);
    assert(ResolutionPolicy(TieBreakStrategy::HIGHEST_SEED_ID, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 7);
}

static void testEqualTimestampsFallBackToId() {
    std::vector<Candidate> tied = {cand(5, 10, 100), cand(3, 10, 100)};
    assert(ResolutionPolicy(TieBreakStrategy::EARLIEST_SUBMISSION, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 3);
    assert(ResolutionPolicy(TieBreakStrategy::LATEST_SUBMISSION, DeadlockStrategy::REVERT)
               .resolve(tied, {}, 1, entropyOf(0)).winner == 5);
}

static void testPseudoRandomIsDeterministic() {
    ResolutionPolicy policy(TieBreakStrategy::PSEUDO_RANDOM, DeadlockStrategy::REVERT);
    std::vector<Candidate> tied = {cand(1, 7, 0), cand(2, 7, 0), cand(3, 7, 0), cand(4, 7, 0)};
    std::vector<Candidate> shuffled = {tied[2], tied[0], tied[3], tied[1]};

    SeedId first = policy.resolve(tied, {}, 5, entropyOf(9)).winner;
    assert(first == policy.resolve(shuffled, {}, 5, entropyOf(9)).winner);
    assert(first >= 1 && first <= 4);

    std::set<SeedId> seen;
    for (uint8_t b = 0; b < 64; b++) {
        seen.insert(policy.resolve(tied, {}, 5, entropyOf(b)).winner);
    }
    assert(seen.size() > 1);

    for (size_t n = 1; n < 20; n++) {
        assert(ResolutionPolicy::pseudoRandomIndex("tie_break", 3, entropyOf(1), n) < n);
    }
    assert(ResolutionPolicy::pseudoRandomIndex("tie_break", 3, entropyOf(1), 0) == 0);
}

static void testDeadlockRevert() {
    ResolutionPolicy policy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::REVERT);
    Resolution r = policy.resolve({cand(1, 0, 0), cand(2, 0, 0)}, {}, 1, entropyOf(0));
    assert(r.outcome == ResolutionOutcome::NO_VALID_WINNER);
    assert(r.viaDeadlock);

    Resolution empty = policy.resolve({}, {}, 1, entropyOf(0));
    assert(empty.outcome == ResolutionOutcome::NO_VALID_WINNER);
}

static void testDeadlockSkip() {
    ResolutionPolicy policy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::SKIP_ROUND);
    Resolution r = policy.resolve({cand(1, 0, 0)}, {}, 1, entropyOf(0));
    assert(r.outcome == ResolutionOutcome::SKIPPED);
    assert(r.winner == NO_SEED);
    assert(r.strategy == DeadlockStrategy::SKIP_ROUND);
}

static void testDeadlockRandomFromAll() {
    ResolutionPolicy policy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::RANDOM_FROM_ALL);
    std::vector<Candidate> c = {cand(8, 0, 0), cand(3, 0, 0), cand(5, 0, 0)};
    Resolution r = policy.resolve(c, {}, 2, entropyOf(4));
    assert(r.outcome == ResolutionOutcome::WINNER);
    assert(r.viaDeadlock);
    assert(r.winner == 3 || r.winner == 5 || r.winner == 8);
    assert(r.winner == policy.resolve({c[1], c[2], c[0]}, {}, 2, entropyOf(4)).winner);

    Resolution none = policy.resolve({}, {}, 2, entropyOf(4));
    assert(none.outcome == ResolutionOutcome::SKIPPED);
}

static void testDeadlockAllowRewins() {
    ResolutionPolicy policy(TieBreakStrategy::LOWEST_SEED_ID, DeadlockStrategy::ALLOW_REWINS);
    std::vector<Candidate> prev = {cand(6, 300, 0), cand(2, 300, 0), cand(4, 10, 0)};
    Resolution r = policy.resolve({cand(9, 0, 0)}, prev, 3, entropyOf(0));
    assert(r.outcome == ResolutionOutcome::WINNER);
    assert(r.winner == 2);
    assert(r.rewin);
    assert(r.viaDeadlock);

    // Fresh candidates with score still win normally.
    Resolution normal = policy.resolve({cand(9, 1, 0)}, prev, 3, entropyOf(0));
    assert(normal.winner == 9);
    assert(!normal.rewin);

    Resolution stuck = policy.resolve({cand(9, 0, 0)}, {cand(6, 0, 0)}, 3, entropyOf(0));
    assert(stuck.outcome == ResolutionOutcome::NO_VALID_WINNER);
}

static void testLeaderPreview() {
    ResolutionPolicy policy(TieBreakStrategy::PSEUDO_RANDOM, DeadlockStrategy::REVERT);
    Candidate leader = policy.leader({cand(5, 40, 0), cand(3, 40, 0), cand(1, 2, 0)});
    assert(leader.id == 3);
    assert(leader.score == 40);

    Candidate none = policy.leader({cand(1, 0, 0)});
    assert(none.id == NO_SEED);
}

int main() {
    testHighestScoreWins();
    testTieBreakStrategies();
    testEqualTimestampsFallBackToId();
    testPseudoRandomIsDeterministic();
    testDeadlockRevert();
    testDeadlockSkip();
    testDeadlockRandomFromAll();
    testDeadlockAllowRewins();
    testLeaderPreview();
    std::cout << "Resolution tests passed" << std::endl;
    return 0;
}
