#pragma once

#include "core/engine_state.h"
#include "core/events.h"
#include "core/journal.h"
#include "crypto/merkle.h"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace curator {
namespace core {

struct EngineStatus {
    RoundId round = 0;
    RoundPhase phase = RoundPhase::OPEN;
    Timestamp periodStart = 0;
    uint64_t periodDuration = 0;
    uint64_t timeUntilPeriodEnd = 0;
    uint64_t secondsUntilDailyReset = 0;
    bool paused = false;
    std::string pauseReason;
    size_t totalSeeds = 0;
    size_t eligibleSeeds = 0;
    SeedId leader = NO_SEED;
    uint64_t leaderScore = 0;
    bool hasPendingConfig = false;
    bool persistent = false;
};

// Single-writer facade over EngineState. Mutations are serialized and
// journaled before they are applied; queries run under a shared lock.
// Callbacks fire after the lock is released.
class CurationEngine {
public:
    explicit CurationEngine(const EngineOptions& options,
                            std::shared_ptr<crypto::EligibilityOracle> oracle = nullptr);
    ~CurationEngine();

    CurationEngine(const CurationEngine&) = delete;
    CurationEngine& operator=(const CurationEngine&) = delete;

    // Binds the engine to a database. An existing journal is replayed;
    // a fresh database records this engine's options as genesis.
    bool open(const std::string& dbPath);
    void close();
    bool isPersistent() const;

    SubmitResult submitSeed(const Address& creator, const std::string& contentHandle, Timestamp now);
    OpResult retractSeed(SeedId seedId, const Address& caller, Timestamp now);

    BlessResult blessSeed(const BlessingRequest& request, Timestamp now);
    std::vector<BlessResult> batchBless(const Address& relayer, const std::vector<BlessingRequest>& requests, Timestamp now);
    CommandmentResult addCommandment(const CommandmentRequest& request, Timestamp now);

    AdvanceResult advance(Timestamp now, const crypto::Hash256& entropy);

    OpResult updateOwnershipRoot(const Address& caller, const crypto::Hash256& root, Timestamp now);
    OpResult scheduleParams(const Address& caller, const PendingParams& update, Timestamp now);
    OpResult setTreasury(const Address& caller, const Address& treasury, Timestamp now);
    OpResult grantRole(const Address& caller, Role role, const Address& account, Timestamp now);
    OpResult revokeRole(const Address& caller, Role role, const Address& account, Timestamp now);
    OpResult approveDelegate(const Address& elector, const Address& delegate, bool approved, Timestamp now);
    OpResult pause(const Address& caller, const std::string& reason, Timestamp now);
    OpResult unpause(const Address& caller, Timestamp now);

    std::optional<Seed> getSeed(SeedId seedId) const;
    size_t seedCount() const;
    std::vector<Seed> getSeeds(size_t offset, size_t limit) const;
    std::vector<SeedId> seedsByRound(RoundId round) const;
    std::vector<SeedId> currentRoundSeeds() const;
    std::vector<SeedId> eligibleSeeds() const;
    std::vector<SeedId> eligibleSeedsPage(size_t offset, size_t limit) const;
    size_t eligibleCount() const;
    std::pair<SeedId, uint64_t> currentLeader() const;

    RoundId currentRound() const;
    Timestamp periodStart() const;
    RoundPhase phase(Timestamp now) const;
    bool isResolvable(Timestamp now) const;
    uint64_t timeUntilPeriodEnd(Timestamp now) const;
    static uint64_t secondsUntilDailyReset(Timestamp now);
    std::optional<RoundRecord> roundRecord(RoundId round) const;
    SeedId roundWinner(RoundId round) const;
    std::vector<RoundRecord> roundHistory() const;
    std::vector<WinnerNotification> winners() const;

    uint64_t blessingCount(const Address& elector, SeedId seedId) const;
    bool hasBlessed(const Address& elector, SeedId seedId) const;
    uint64_t blessingsUsedToday(const Address& elector, Timestamp now) const;
    uint64_t commandmentsUsedToday(const Address& elector, Timestamp now) const;
    uint64_t remainingBlessings(const Address& elector, uint64_t ownedUnits, Timestamp now) const;
    std::vector<BlessingRecord> seedBlessings(SeedId seedId) const;
    std::vector<BlessingRecord> electorBlessings(const Address& elector) const;
    size_t totalBlessings() const;
    std::vector<Commandment> commandmentsBySeed(SeedId seedId) const;
    std::vector<Commandment> commandmentsByAuthor(const Address& author) const;
    uint64_t seedScoreByRound(RoundId round, SeedId seedId) const;
    uint64_t electorSeedBlessingsByRound(RoundId round, const Address& elector, SeedId seedId) const;

    EngineParams currentParams() const;
    PendingParams pendingParams() const;
    Address treasury() const;
    uint64_t treasuryBalance(const Address& treasury) const;
    OwnershipRoots ownershipRoots() const;
    bool isPaused() const;
    std::string pauseReason() const;
    bool hasRole(Role role, const Address& account) const;
    bool isDelegate(const Address& elector, const Address& delegate) const;

    EngineStatus status(Timestamp now) const;
    static std::string version();

    void onEvent(EngineEventHandler handler);
    void onWinnerSelected(WinnerHandler handler);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
