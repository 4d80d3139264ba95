#pragma once

#include "core/types.h"
#include "crypto/crypto.h"
#include <vector>

namespace curator {
namespace core {

struct Candidate {
    SeedId id = NO_SEED;
    uint64_t score = 0;
    Timestamp createdAt = 0;
};

enum class ResolutionOutcome {
    WINNER,
    SKIPPED,
    NO_VALID_WINNER
};

struct Resolution {
    ResolutionOutcome outcome = ResolutionOutcome::NO_VALID_WINNER;
    SeedId winner = NO_SEED;
    uint64_t score = 0;
    bool viaDeadlock = false;
    bool rewin = false;
    DeadlockStrategy strategy = DeadlockStrategy::REVERT;
};

class ResolutionPolicy {
public:
    ResolutionPolicy(TieBreakStrategy tieBreak, DeadlockStrategy deadlock);

    // `candidates` is the eligible set; `previousWinners` is only consulted
    // for a deadlock under ALLOW_REWINS. Pure: reads nothing else.
    Resolution resolve(std::vector<Candidate> candidates,
                       std::vector<Candidate> previousWinners,
                       RoundId round,
                       const crypto::Hash256& entropy) const;

    // Preview of resolve() without entropy; PSEUDO_RANDOM previews as lowest id.
    Candidate leader(std::vector<Candidate> candidates) const;

    SeedId breakTie(std::vector<Candidate> tied, RoundId round, const crypto::Hash256& entropy) const;

    static size_t pseudoRandomIndex(const std::string& domain, RoundId round,
                                    const crypto::Hash256& entropy, size_t n);

private:
    std::vector<Candidate> topScorers(const std::vector<Candidate>& candidates) const;

    TieBreakStrategy tieBreak_;
    DeadlockStrategy deadlock_;
};

}
}
