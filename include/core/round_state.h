#pragma once

#include "core/types.h"
#include <optional>
#include <vector>

namespace curator {
namespace core {

enum class RoundPhase {
    OPEN,
    RESOLVABLE
};

std::string roundPhaseToString(RoundPhase phase);

class RoundStateMachine {
public:
    RoundStateMachine(Timestamp genesis, uint64_t votingPeriod);

    RoundId currentRound() const { return round_; }
    Timestamp periodStart() const { return periodStart_; }
    uint64_t periodDuration() const { return periodDuration_; }
    Timestamp periodEnd() const { return periodStart_ + periodDuration_; }

    RoundPhase phase(Timestamp now) const;
    bool isResolvable(Timestamp now) const;
    bool isBlessingOpen(Timestamp now) const;
    uint64_t timeUntilPeriodEnd(Timestamp now) const;

    // Records the outcome of the live round and opens the next one at `now`.
    void close(const RoundRecord& record, Timestamp now, uint64_t nextPeriod);

    const std::vector<RoundRecord>& history() const { return history_; }
    std::optional<RoundRecord> record(RoundId round) const;
    SeedId winnerOf(RoundId round) const;

private:
    RoundId round_;
    Timestamp periodStart_;
    uint64_t periodDuration_;
    std::vector<RoundRecord> history_;
};

}
}
