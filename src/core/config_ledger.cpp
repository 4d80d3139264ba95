#include "core/config_ledger.h"

namespace curator {
namespace core {

bool PendingParams::empty() const {
    return names().empty();
}

std::vector<std::string> PendingParams::names() const {
    std::vector<std::string> out;
    if (votingPeriod) out.push_back("voting_period");
    if (blessingsPerUnit) out.push_back("blessings_per_unit");
    if (commandmentsPerUnit) out.push_back("commandments_per_unit");
    if (blessingWeight) out.push_back("blessing_weight");
    if (commandmentWeight) out.push_back("commandment_weight");
    if (timeDecayBase) out.push_back("time_decay_base");
    if (timeDecayMin) out.push_back("time_decay_min");
    if (blessingCost) out.push_back("blessing_cost");
    if (commandmentCost) out.push_back("commandment_cost");
    if (roundMode) out.push_back("round_mode");
    if (tieBreak) out.push_back("tie_break");
    if (deadlock) out.push_back("deadlock");
    if (scoreResetOnRoundEnd) out.push_back("score_reset");
    return out;
}

void PendingParams::merge(const PendingParams& other) {
    if (other.votingPeriod) votingPeriod = other.votingPeriod;
    if (other.blessingsPerUnit) blessingsPerUnit = other.blessingsPerUnit;
    if (other.commandmentsPerUnit) commandmentsPerUnit = other.commandmentsPerUnit;
    if (other.blessingWeight) blessingWeight = other.blessingWeight;
    if (other.commandmentWeight) commandmentWeight = other.commandmentWeight;
    if (other.timeDecayBase) timeDecayBase = other.timeDecayBase;
    if (other.timeDecayMin) timeDecayMin = other.timeDecayMin;
    if (other.blessingCost) blessingCost = other.blessingCost;
    if (other.commandmentCost) commandmentCost = other.commandmentCost;
    if (other.roundMode) roundMode = other.roundMode;
    if (other.tieBreak) tieBreak = other.tieBreak;
    if (other.deadlock) deadlock = other.deadlock;
    if (other.scoreResetOnRoundEnd) scoreResetOnRoundEnd = other.scoreResetOnRoundEnd;
}

EngineParams PendingParams::overlay(const EngineParams& base) const {
    EngineParams p = base;
    if (votingPeriod) p.votingPeriod = *votingPeriod;
    if (blessingsPerUnit) p.blessingsPerUnit = *blessingsPerUnit;
    if (commandmentsPerUnit) p.commandmentsPerUnit = *commandmentsPerUnit;
    if (blessingWeight) p.blessingWeight = *blessingWeight;
    if (commandmentWeight) p.commandmentWeight = *commandmentWeight;
    if (timeDecayBase) p.timeDecayBase = *timeDecayBase;
    if (timeDecayMin) p.timeDecayMin = *timeDecayMin;
    if (blessingCost) p.blessingCost = *blessingCost;
    if (commandmentCost) p.commandmentCost = *commandmentCost;
    if (roundMode) p.roundMode = *roundMode;
    if (tieBreak) p.tieBreak = *tieBreak;
    if (deadlock) p.deadlock = *deadlock;
    if (scoreResetOnRoundEnd) p.scoreResetOnRoundEnd = *scoreResetOnRoundEnd;
    return p;
}

ConfigLedger::ConfigLedger(const EngineParams& initial) : current_(initial) {}

OpResult ConfigLedger::validate(const EngineParams& p) {
    if (p.votingPeriod < MIN_VOTING_PERIOD || p.votingPeriod > MAX_VOTING_PERIOD) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_voting_period");
    }
    if (p.blessingsPerUnit < 1 || p.blessingsPerUnit > MAX_ACTIONS_PER_UNIT) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_blessings_per_unit");
    }
    if (p.commandmentsPerUnit < 1 || p.commandmentsPerUnit > MAX_ACTIONS_PER_UNIT) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_commandments_per_unit");
    }
    if (p.blessingWeight > MAX_WEIGHT || p.commandmentWeight > MAX_WEIGHT) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_weight");
    }
    if (p.timeDecayBase == 0 || p.timeDecayBase > MAX_DECAY_BASE || p.timeDecayMin > p.timeDecayBase) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_time_decay");
    }
    return success();
}

OpResult ConfigLedger::validateUpdate(const PendingParams& update) const {
    if (update.empty()) return failure<OpResult>(ErrorKind::VALIDATION, "empty_update");
    PendingParams merged = pending_;
    merged.merge(update);
    return validate(merged.overlay(current_));
}

void ConfigLedger::schedule(const PendingParams& update) {
    pending_.merge(update);
}

std::vector<std::string> ConfigLedger::applyPending() {
    std::vector<std::string> applied = pending_.names();
    if (applied.empty()) return applied;
    current_ = pending_.overlay(current_);
    pending_ = PendingParams();
    return applied;
}

DeadlockStrategy ConfigLedger::effectiveDeadlock() const {
    return pending_.deadlock ? *pending_.deadlock : current_.deadlock;
}

}
}
