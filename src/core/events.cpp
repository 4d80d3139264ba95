#include "core/events.h"

namespace curator {
namespace core {

std::string eventTypeToString(EngineEventType type) {
    switch (type) {
        case EngineEventType::SeedSubmitted: return "SeedSubmitted";
        case EngineEventType::SeedRetracted: return "SeedRetracted";
        case EngineEventType::BlessingSubmitted: return "BlessingSubmitted";
        case EngineEventType::BlessingFailed: return "BlessingFailed";
        case EngineEventType::SeedScoreUpdated: return "SeedScoreUpdated";
        case EngineEventType::CommandmentSubmitted: return "CommandmentSubmitted";
        case EngineEventType::WinnerSelected: return "WinnerSelected";
        case EngineEventType::RoundSkipped: return "RoundSkipped";
        case EngineEventType::ScoresReset: return "ScoresReset";
        case EngineEventType::BlessingPeriodStarted: return "BlessingPeriodStarted";
        case EngineEventType::ConfigScheduled: return "ConfigScheduled";
        case EngineEventType::ConfigApplied: return "ConfigApplied";
        case EngineEventType::OwnershipRootUpdated: return "OwnershipRootUpdated";
        case EngineEventType::TreasuryUpdated: return "TreasuryUpdated";
        case EngineEventType::RoleGranted: return "RoleGranted";
        case EngineEventType::RoleRevoked: return "RoleRevoked";
        case EngineEventType::DelegateApproval: return "DelegateApproval";
        case EngineEventType::Paused: return "Paused";
        case EngineEventType::Unpaused: return "Unpaused";
    }
    return "Unknown";
}

}
}
