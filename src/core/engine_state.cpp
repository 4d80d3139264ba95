#include "core/engine_state.h"

namespace curator {
namespace core {

EngineState::EngineState(const EngineOptions& options)
    : config(options.params),
      rounds(options.genesisTime, options.params.votingPeriod) {
    access.grant(Role::ADMIN, options.admin);
    for (const auto& c : options.creators) access.grant(Role::CREATOR, c);
    for (const auto& r : options.relayers) access.grant(Role::RELAYER, r);
    config.setTreasury(options.treasury.empty() ? options.admin : options.treasury);
}

}
}
