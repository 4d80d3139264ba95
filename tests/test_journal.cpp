#include "core/curation_engine.h"
#include "core/journal.h"
#include "core/ownership.h"
#include "database/database.h"
#include "utils/logger.h"
#include <cassert>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>

using namespace curator;
using namespace curator::core;

static const Timestamp T0 = 2000000;
static const uint64_t PERIOD = 3600;
static const std::string CID_A = "QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG";
static const std::string CID_B = "QmT78zSuBmuS4z925WZfrqQ1qHaJ56DQaTfyMUF7F8ff5o";

static std::string tempDbPath(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() /
                ("curator_" + name + "_" + std::to_string(std::time(nullptr)) + ".db");
    std::filesystem::remove(path);
    return path.string();
}

static EngineOptions testOptions() {
    EngineOptions o;
    o.admin = "admin";
    o.genesisTime = T0;
    o.params.votingPeriod = PERIOD;
    o.params.blessingsPerUnit = 2;
    o.params.timeDecayBase = 1000;
    o.params.timeDecayMin = 1000;
    o.creators = {"creator"};
    o.relayers = {"relayer"};
    return o;
}

static OwnershipSnapshot testSnapshot() {
    OwnershipSnapshot s;
    s.addHolder("x", {1, 2});
    s.addHolder("y", {3});
    s.build();
    return s;
}

static BlessingRequest blessingFor(const OwnershipSnapshot& snap, SeedId id, const Address& elector) {
    BlessingRequest req;
    req.seedId = id;
    req.elector = elector;
    req.unitIds = snap.find(elector)->unitIds;
    req.proof = snap.proofFor(elector);
    return req;
}

static void testCodecs() {
    BlessingRequest req;
    req.seedId = 7;
    req.elector = "x";
    req.actor = "relayer";
    req.unitIds = {1, 2};
    req.proof = {crypto::sha256(std::string("p"))};
    req.payment = 42;
    BlessingRequest back;
    assert(decodeBlessing(encodeBlessing(req), back));
    assert(back.seedId == 7);
    assert(back.actor == "relayer");
    assert(back.unitIds == req.unitIds);
    assert(back.proof == req.proof);
    assert(back.payment == 42);

    std::vector<uint8_t> truncated = encodeBlessing(req);
    truncated.resize(truncated.size() / 2);
    assert(!decodeBlessing(truncated, back));

    PendingParams update;
    update.deadlock = DeadlockStrategy::ALLOW_REWINS;
    update.votingPeriod = 7200;
    PendingParams decoded;
    assert(decodePendingParams(encodePendingParams(update), decoded));
    assert(decoded.deadlock == DeadlockStrategy::ALLOW_REWINS);
    assert(decoded.votingPeriod == 7200u);
    assert(!decoded.blessingCost.has_value());

    EngineOptions opts = testOptions();
    EngineOptions optsBack;
    assert(decodeOptions(encodeOptions(opts), optsBack));
    assert(optsBack.admin == "admin");
    assert(optsBack.genesisTime == T0);
    assert(optsBack.params.blessingsPerUnit == 2);
    assert(optsBack.relayers.size() == 1);

    JournalEntry garbage;
    assert(!Journal::decodeEntry({0xff, 0x01}, garbage));
    assert(Journal::entryKey(3) < Journal::entryKey(20));
}

static void testReplayRebuildsState() {
    std::string path = tempDbPath("replay");
    OwnershipSnapshot snap = testSnapshot();
    SeedId a = 0;
    SeedId b = 0;
    {
        CurationEngine engine(testOptions());
        assert(engine.open(path));
        assert(engine.isPersistent());
        assert(engine.updateOwnershipRoot("admin", snap.root(), T0).ok);
        a = engine.submitSeed("creator", CID_A, T0 + 1).seedId;
        b = engine.submitSeed("creator", CID_B, T0 + 2).seedId;
        assert(engine.blessSeed(blessingFor(snap, a, "x"), T0 + 10).ok);
        assert(engine.blessSeed(blessingFor(snap, a, "x"), T0 + 20).ok);
        assert(engine.blessSeed(blessingFor(snap, b, "y"), T0 + 30).ok);
        assert(engine.approveDelegate("y", "helper", true, T0 + 40).ok);
        assert(engine.grantRole("admin", Role::CREATOR, "newbie", T0 + 50).ok);

        PendingParams update;
        update.tieBreak = TieBreakStrategy::HIGHEST_SEED_ID;
        assert(engine.scheduleParams("admin", update, T0 + 60).ok);
        crypto::Hash256 entropy{};
        AdvanceResult adv = engine.advance(T0 + PERIOD, entropy);
        assert(adv.ok);
        assert(adv.winnerSeedId == a);

        PendingParams later;
        later.blessingCost = 9;
        assert(engine.scheduleParams("admin", later, T0 + PERIOD + 1).ok);
        assert(engine.pause("admin", "audit", T0 + PERIOD + 2).ok);
    }

    // Different options: the stored genesis wins on reopen.
    EngineOptions other = testOptions();
    other.admin = "someone";
    other.params.votingPeriod = 7200;
    CurationEngine reopened(other);
    assert(reopened.open(path));

    assert(reopened.currentRound() == 2);
    assert(reopened.periodStart() == T0 + PERIOD);
    assert(reopened.seedCount() == 2);
    assert(reopened.getSeed(a)->blessingScore == 1414);
    assert(reopened.getSeed(a)->selectedInRound == 1);
    assert(reopened.getSeed(b)->blessingScore == 1000);
    assert(reopened.roundWinner(1) == a);
    assert(reopened.winners().size() == 1);
    assert(reopened.blessingCount("x", a) == 2);
    assert(reopened.isDelegate("y", "helper"));
    assert(reopened.hasRole(Role::CREATOR, "newbie"));
    assert(reopened.hasRole(Role::ADMIN, "admin"));
    assert(!reopened.hasRole(Role::ADMIN, "someone"));
    assert(reopened.currentParams().tieBreak == TieBreakStrategy::HIGHEST_SEED_ID);
    assert(reopened.currentParams().votingPeriod == PERIOD);
    assert(reopened.pendingParams().blessingCost == 9u);
    assert(reopened.ownershipRoots().current == snap.root());
    assert(reopened.isPaused());
    assert(reopened.pauseReason() == "audit");

    // New commands continue the sequence and survive another reopen.
    assert(reopened.unpause("admin", T0 + PERIOD + 3).ok);
    assert(reopened.blessSeed(blessingFor(snap, b, "x"), T0 + PERIOD + 4).ok);
    reopened.close();
    assert(!reopened.isPersistent());

    CurationEngine third(testOptions());
    assert(third.open(path));
    assert(!third.isPaused());
    assert(third.getSeed(b)->blessingScore == 2000);

    std::filesystem::remove(path);
}

static void testRoundRecordsArePersisted() {
    std::string path = tempDbPath("records");
    OwnershipSnapshot snap = testSnapshot();
    {
        CurationEngine engine(testOptions());
        assert(engine.open(path));
        engine.updateOwnershipRoot("admin", snap.root(), T0);
        SeedId a = engine.submitSeed("creator", CID_A, T0 + 1).seedId;
        engine.blessSeed(blessingFor(snap, a, "y"), T0 + 2);
        assert(engine.advance(T0 + PERIOD, crypto::Hash256{}).ok);
    }

    database::Database db;
    assert(db.open(path));
    RoundRecord record;
    assert(decodeRoundRecord(db.get(Journal::roundKey(1)), record));
    assert(record.number == 1);
    assert(record.winnerSeedId == 1);
    assert(record.winningScore == 1000);
    assert(record.resolvedAt == T0 + PERIOD);

    WinnerNotification winner;
    assert(decodeWinner(db.get(Journal::winnerKey(1)), winner));
    assert(winner.contentHandle == CID_A);
    assert(winner.creator == "creator");
    assert(db.get(Journal::roundKey(2)).empty());

    size_t entries = 0;
    db.forEach(Journal::ENTRY_PREFIX, [&entries](const std::string&, const std::vector<uint8_t>&) {
        entries++;
        return true;
    });
    assert(entries == 4);
    db.close();
    std::filesystem::remove(path);
}

static void testRejectedCommandsAreNotJournaled() {
    std::string path = tempDbPath("rejected");
    {
        CurationEngine engine(testOptions());
        assert(engine.open(path));
        assert(!engine.submitSeed("creator", "bogus", T0).ok);
        assert(!engine.pause("creator", "nope", T0).ok);
        assert(engine.submitSeed("creator", CID_A, T0).ok);
    }
    database::Database db;
    assert(db.open(path));
    Journal journal(db);
    assert(journal.load());
    assert(journal.nextSequence() == 2);
    db.close();
    std::filesystem::remove(path);
}

static void testOpenRequiresFreshEngine() {
    std::string path = tempDbPath("fresh");
    CurationEngine engine(testOptions());
    assert(engine.submitSeed("creator", CID_A, T0).ok);
    assert(!engine.open(path));
    assert(!engine.isPersistent());
    // The in-memory state is untouched.
    assert(engine.seedCount() == 1);
    std::filesystem::remove(path);
}

int main() {
    utils::Logger::enableConsole(false);
    testCodecs();
    testReplayRebuildsState();
    testRoundRecordsArePersisted();
    testRejectedCommandsAreNotJournaled();
    testOpenRequiresFreshEngine();
    std::cout << "Journal tests passed" << std::endl;
    return 0;
}
