#pragma once

#include "core/types.h"
#include "core/eligible_set.h"
#include <unordered_map>
#include <vector>

namespace curator {
namespace core {

class SeedRegistry {
public:
    // Trimmed handle, or empty when the shape is not a CIDv0/CIDv1 lookalike.
    static std::string normalizeContentHandle(const std::string& raw);
    static bool isValidContentHandle(const std::string& handle);

    OpResult checkSubmit(const std::string& contentHandle, RoundId round) const;
    SeedId submit(const Address& creator, const std::string& contentHandle, Timestamp now, RoundId round);

    OpResult checkRetract(SeedId id, const Address& caller) const;
    void retract(SeedId id);

    // First win sets selectedInRound; later wins (rewins) only bump counters.
    void markWinner(SeedId id, RoundId round);

    const Seed* find(SeedId id) const;
    Seed* findMutable(SeedId id);
    size_t count() const { return seeds_.size(); }
    size_t countInRound(RoundId round) const;

    std::vector<SeedId> seedsByRound(RoundId round) const;
    std::vector<Seed> page(size_t offset, size_t limit) const;
    std::vector<SeedId> previousWinners() const;

    const EligibleSet& eligible() const { return eligible_; }
    bool isEligible(SeedId id) const { return eligible_.contains(id); }
    void rebuildEligible(RoundMode mode, RoundId round);

private:
    std::vector<Seed> seeds_;
    std::unordered_map<RoundId, std::vector<SeedId>> byRound_;
    std::vector<SeedId> winners_;
    EligibleSet eligible_;
};

}
}
