#pragma once

#include "core/types.h"
#include <functional>
#include <map>
#include <string>

namespace curator {
namespace core {

enum class EngineEventType {
    SeedSubmitted,
    SeedRetracted,
    BlessingSubmitted,
    BlessingFailed,
    SeedScoreUpdated,
    CommandmentSubmitted,
    WinnerSelected,
    RoundSkipped,
    ScoresReset,
    BlessingPeriodStarted,
    ConfigScheduled,
    ConfigApplied,
    OwnershipRootUpdated,
    TreasuryUpdated,
    RoleGranted,
    RoleRevoked,
    DelegateApproval,
    Paused,
    Unpaused
};

struct EngineEvent {
    EngineEventType type;
    RoundId round = 0;
    SeedId seedId = NO_SEED;
    Address actor;
    Timestamp timestamp = 0;
    std::map<std::string, std::string> data;
};

using EngineEventHandler = std::function<void(const EngineEvent&)>;
using WinnerHandler = std::function<void(const WinnerNotification&)>;

std::string eventTypeToString(EngineEventType type);

}
}
