#pragma once

#include "core/types.h"
#include <optional>
#include <string>
#include <vector>

namespace curator {
namespace core {

struct EngineParams {
    uint64_t votingPeriod = 86400;
    uint32_t blessingsPerUnit = 1;
    uint32_t commandmentsPerUnit = 1;
    uint64_t blessingWeight = 1000;
    uint64_t commandmentWeight = 0;
    uint64_t timeDecayBase = 1000;
    uint64_t timeDecayMin = 10;
    uint64_t blessingCost = 0;
    uint64_t commandmentCost = 0;
    RoundMode roundMode = RoundMode::PERSISTENT;
    TieBreakStrategy tieBreak = TieBreakStrategy::LOWEST_SEED_ID;
    DeadlockStrategy deadlock = DeadlockStrategy::REVERT;
    bool scoreResetOnRoundEnd = false;
};

struct PendingParams {
    std::optional<uint64_t> votingPeriod;
    std::optional<uint32_t> blessingsPerUnit;
    std::optional<uint32_t> commandmentsPerUnit;
    std::optional<uint64_t> blessingWeight;
    std::optional<uint64_t> commandmentWeight;
    std::optional<uint64_t> timeDecayBase;
    std::optional<uint64_t> timeDecayMin;
    std::optional<uint64_t> blessingCost;
    std::optional<uint64_t> commandmentCost;
    std::optional<RoundMode> roundMode;
    std::optional<TieBreakStrategy> tieBreak;
    std::optional<DeadlockStrategy> deadlock;
    std::optional<bool> scoreResetOnRoundEnd;

    bool empty() const;
    std::vector<std::string> names() const;
    // Values present in `other` overwrite ours.
    void merge(const PendingParams& other);
    EngineParams overlay(const EngineParams& base) const;
};

constexpr uint64_t MIN_VOTING_PERIOD = 3600;
constexpr uint64_t MAX_VOTING_PERIOD = 7 * 86400;
constexpr uint32_t MAX_ACTIONS_PER_UNIT = 100;
constexpr uint64_t MAX_WEIGHT = 1000000;
constexpr uint64_t MAX_DECAY_BASE = 1000000;

class ConfigLedger {
public:
    explicit ConfigLedger(const EngineParams& initial = EngineParams());

    static OpResult validate(const EngineParams& params);

    // Checks `update` merged over current and already-staged values.
    OpResult validateUpdate(const PendingParams& update) const;
    void schedule(const PendingParams& update);

    // Swaps staged values into current; returns the names that were applied.
    std::vector<std::string> applyPending();

    const EngineParams& current() const { return current_; }
    const PendingParams& pending() const { return pending_; }
    bool hasPending() const { return !pending_.empty(); }

    // A staged deadlock strategy takes effect for a stalled resolution.
    DeadlockStrategy effectiveDeadlock() const;

    const Address& treasury() const { return treasury_; }
    void setTreasury(const Address& treasury) { treasury_ = treasury; }

private:
    EngineParams current_;
    PendingParams pending_;
    Address treasury_;
};

}
}
