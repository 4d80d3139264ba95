#include "core/round_state.h"

namespace curator {
namespace core {

std::string roundPhaseToString(RoundPhase phase) {
    switch (phase) {
        case RoundPhase::OPEN: return "open";
        case RoundPhase::RESOLVABLE: return "resolvable";
    }
    return "unknown";
}

RoundStateMachine::RoundStateMachine(Timestamp genesis, uint64_t votingPeriod)
    : round_(1), periodStart_(genesis), periodDuration_(votingPeriod) {}

RoundPhase RoundStateMachine::phase(Timestamp now) const {
    return isResolvable(now) ? RoundPhase::RESOLVABLE : RoundPhase::OPEN;
}

bool RoundStateMachine::isResolvable(Timestamp now) const {
    return now >= periodEnd();
}

bool RoundStateMachine::isBlessingOpen(Timestamp now) const {
    return now < periodEnd();
}

uint64_t RoundStateMachine::timeUntilPeriodEnd(Timestamp now) const {
    Timestamp end = periodEnd();
    return now >= end ? 0 : end - now;
}

void RoundStateMachine::close(const RoundRecord& record, Timestamp now, uint64_t nextPeriod) {
    history_.push_back(record);
    round_++;
    periodStart_ = now;
    periodDuration_ = nextPeriod;
}

std::optional<RoundRecord> RoundStateMachine::record(RoundId round) const {
    if (round == 0 || round > history_.size()) return std::nullopt;
    return history_[round - 1];
}

SeedId RoundStateMachine::winnerOf(RoundId round) const {
    auto rec = record(round);
    return rec ? rec->winnerSeedId : NO_SEED;
}

}
}
