#pragma once

#include "core/types.h"
#include "core/seed_registry.h"
#include "core/scoring.h"
#include "core/config_ledger.h"
#include "core/round_state.h"
#include "core/access_control.h"
#include "core/treasury.h"
#include "core/ownership.h"
#include "crypto/crypto.h"
#include <vector>

namespace curator {
namespace core {

struct EngineOptions {
    Address admin;
    Address treasury;
    Timestamp genesisTime = 0;
    EngineParams params;
    std::vector<Address> creators;
    std::vector<Address> relayers;
};

struct BlessingRequest {
    SeedId seedId = NO_SEED;
    Address elector;
    Address actor;
    std::vector<uint64_t> unitIds;
    std::vector<crypto::Hash256> proof;
    uint64_t payment = 0;
};

struct CommandmentRequest {
    SeedId seedId = NO_SEED;
    Address elector;
    Address actor;
    std::string contentHandle;
    std::vector<uint64_t> unitIds;
    std::vector<crypto::Hash256> proof;
    uint64_t payment = 0;
};

// Everything the engine mutates, owned in one place.
struct EngineState {
    explicit EngineState(const EngineOptions& options);

    SeedRegistry registry;
    ScoringEngine scoring;
    ConfigLedger config;
    RoundStateMachine rounds;
    AccessControl access;
    Treasury treasury;
    OwnershipRoots roots;
    std::vector<WinnerNotification> winners;
};

}
}
