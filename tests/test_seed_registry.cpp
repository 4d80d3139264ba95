#include "core/seed_registry.h"
#include <cassert>
#include <iostream>
#include <string>

using namespace curator::core;

static const std::string CID_A = "QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG";
static const std::string CID_B = "bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi";

static void testContentHandleShape() {
    assert(SeedRegistry::isValidContentHandle(CID_A));
    assert(SeedRegistry::isValidContentHandle(CID_B));
    assert(!SeedRegistry::isValidContentHandle("Qm123"));
    assert(!SeedRegistry::isValidContentHandle("zz" + CID_A.substr(2)));
    assert(!SeedRegistry::isValidContentHandle("QmAbc/def/ghi"));
    assert(!SeedRegistry::isValidContentHandle("Qm" + std::string(127, 'a')));

    assert(SeedRegistry::normalizeContentHandle("  " + CID_A + "\n") == CID_A);
    assert(SeedRegistry::normalizeContentHandle("   ").empty());
    assert(SeedRegistry::normalizeContentHandle("not-a-cid").empty());
}

static void testSubmitAssignsSequentialIds() {
    SeedRegistry reg;
    SeedId a = reg.submit("alice", CID_A, 100, 1);
    SeedId b = reg.submit("bob", CID_B, 110, 1);
    assert(a == 1);
    assert(b == 2);
    assert(reg.count() == 2);
    assert(reg.countInRound(1) == 2);
    assert(reg.countInRound(2) == 0);

    const Seed* s = reg.find(a);
    assert(s != nullptr);
    assert(s->creator == "alice");
    assert(s->createdAt == 100);
    assert(s->submittedInRound == 1);
    assert(!s->isDecided());
    assert(reg.isEligible(a) && reg.isEligible(b));

    assert(reg.find(NO_SEED) == nullptr);
    assert(reg.find(3) == nullptr);

    auto byRound = reg.seedsByRound(1);
    assert(byRound.size() == 2 && byRound[0] == a && byRound[1] == b);
}

static void testCheckSubmit() {
    SeedRegistry reg;
    assert(reg.checkSubmit(CID_A, 1).ok);
    OpResult bad = reg.checkSubmit("Qmshort", 1);
    assert(!bad.ok);
    assert(bad.kind == ErrorKind::VALIDATION);
    assert(bad.error == "invalid_content_handle");

    for (size_t i = 0; i < MAX_SEEDS_PER_ROUND; i++) reg.submit("alice", CID_A, i, 1);
    OpResult full = reg.checkSubmit(CID_A, 1);
    assert(!full.ok);
    assert(full.error == "max_seeds_per_round_reached");
    assert(reg.checkSubmit(CID_A, 2).ok);
}

static void testRetractRules() {
    SeedRegistry reg;
    SeedId a = reg.submit("alice", CID_A, 100, 1);
    SeedId b = reg.submit("alice", CID_B, 100, 1);

    OpResult missing = reg.checkRetract(9, "alice");
    assert(missing.error == "seed_not_found");
    OpResult wrongCaller = reg.checkRetract(a, "bob");
    assert(wrongCaller.kind == ErrorKind::AUTHORIZATION);
    assert(wrongCaller.error == "not_seed_creator");

    assert(reg.checkRetract(a, "alice").ok);
    reg.retract(a);
    assert(reg.find(a)->isRetracted);
    assert(!reg.isEligible(a));
    assert(reg.checkRetract(a, "alice").error == "already_retracted");

    reg.markWinner(b, 1);
    assert(reg.checkRetract(b, "alice").error == "cannot_retract_winning_seed");
}

static void testMarkWinnerAndRewin() {
    SeedRegistry reg;
    SeedId a = reg.submit("alice", CID_A, 100, 1);
    reg.markWinner(a, 1);
    const Seed* s = reg.find(a);
    assert(s->isDecided());
    assert(s->selectedInRound == 1);
    assert(s->winCount == 1);
    assert(!reg.isEligible(a));

    reg.markWinner(a, 3);
    assert(s->selectedInRound == 1);
    assert(s->winCount == 2);
    assert(s->lastWonInRound == 3);

    auto prev = reg.previousWinners();
    assert(prev.size() == 1 && prev[0] == a);
}

static void testRebuildEligibleByMode() {
    SeedRegistry reg;
    SeedId r1 = reg.submit("alice", CID_A, 100, 1);
    SeedId r2 = reg.submit("alice", CID_B, 200, 2);
    SeedId won = reg.submit("alice", CID_A, 300, 2);
    SeedId gone = reg.submit("alice", CID_B, 400, 2);
    reg.markWinner(won, 2);
    reg.retract(gone);

    reg.rebuildEligible(RoundMode::ROUND_BASED, 2);
    assert(!reg.isEligible(r1));
    assert(reg.isEligible(r2));
    assert(!reg.isEligible(won));
    assert(!reg.isEligible(gone));

    reg.rebuildEligible(RoundMode::PERSISTENT, 3);
    assert(reg.isEligible(r1));
    assert(reg.isEligible(r2));
    assert(reg.eligible().size() == 2);
}

static void testPaging() {
    SeedRegistry reg;
    for (int i = 0; i < 5; i++) reg.submit("alice", CID_A, i, 1);
    auto page = reg.page(3, 10);
    assert(page.size() == 2);
    assert(page[0].id == 4);
    assert(reg.page(5, 1).empty());
}

int main() {
    testContentHandleShape();
    testSubmitAssignsSequentialIds();
    testCheckSubmit();
    testRetractRules();
    testMarkWinnerAndRewin();
    testRebuildEligibleByMode();
    testPaging();
    std::cout << "Seed registry tests passed" << std::endl;
    return 0;
}
