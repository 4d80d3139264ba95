#pragma once

#include "core/types.h"
#include "core/config_ledger.h"
#include <map>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace curator {
namespace core {

uint64_t isqrt(uint64_t n);

// floor(sqrt(count * SCORE_SCALE)); dampen(1) == 1000.
uint64_t dampen(uint64_t count);

// Linear from `base` at period start to `min` at period end, in units of `base`.
uint64_t decayMultiplier(uint64_t elapsed, uint64_t period, uint64_t base, uint64_t min);

uint64_t weightedContribution(uint64_t dampenedDelta, uint64_t weight, uint64_t multiplier, uint64_t decayBase);

inline uint64_t dayKey(Timestamp t) { return t / SECONDS_PER_DAY; }

struct PairState {
    uint64_t blessingsGiven = 0;
    uint64_t lastBlessingDampened = 0;
    uint64_t commandmentsGiven = 0;
    uint64_t lastCommandmentDampened = 0;
};

struct PeriodClock {
    Timestamp periodStart = 0;
    uint64_t periodDuration = 0;
    RoundId round = 0;
};

class ScoringEngine {
public:
    uint64_t blessingsUsedToday(const Address& elector, Timestamp now) const;
    uint64_t commandmentsUsedToday(const Address& elector, Timestamp now) const;
    uint64_t remainingBlessings(const Address& elector, uint64_t ownedUnits, const EngineParams& params, Timestamp now) const;
    uint64_t remainingCommandments(const Address& elector, uint64_t ownedUnits, const EngineParams& params, Timestamp now) const;

    // Callers check quota and lifecycle first; these only mutate.
    uint64_t applyBlessing(Seed& seed, const Address& elector, const Address& actor,
                           const EngineParams& params, const PeriodClock& clock, Timestamp now);
    Commandment applyCommandment(Seed& seed, const Address& author, const Address& actor,
                                 const std::string& contentHandle, bool scoring,
                                 const EngineParams& params, const PeriodClock& clock, Timestamp now);

    PairState pair(const Address& elector, SeedId seedId) const;
    uint64_t blessingCount(const Address& elector, SeedId seedId) const;
    bool hasBlessed(const Address& elector, SeedId seedId) const;

    std::vector<BlessingRecord> seedBlessings(SeedId seedId) const;
    std::vector<BlessingRecord> electorBlessings(const Address& elector) const;
    size_t totalBlessings() const { return blessings_.size(); }

    std::vector<Commandment> commandmentsBySeed(SeedId seedId) const;
    std::vector<Commandment> commandmentsByAuthor(const Address& author) const;
    size_t totalCommandments() const { return commandments_.size(); }

    uint64_t seedScoreByRound(RoundId round, SeedId seedId) const;
    uint64_t electorSeedBlessingsByRound(RoundId round, const Address& elector, SeedId seedId) const;

private:
    struct DailyCounter {
        uint64_t day = 0;
        uint64_t used = 0;
    };

    static uint64_t usedOn(const std::unordered_map<Address, DailyCounter>& counters, const Address& elector, uint64_t day);
    static void consume(std::unordered_map<Address, DailyCounter>& counters, const Address& elector, uint64_t day);

    std::unordered_map<Address, DailyCounter> blessingDays_;
    std::unordered_map<Address, DailyCounter> commandmentDays_;
    std::map<std::pair<Address, SeedId>, PairState> pairs_;

    std::vector<BlessingRecord> blessings_;
    std::unordered_map<SeedId, std::vector<size_t>> blessingsBySeed_;
    std::unordered_map<Address, std::vector<size_t>> blessingsByElector_;

    std::vector<Commandment> commandments_;
    std::unordered_map<SeedId, std::vector<size_t>> commandmentsBySeed_;
    std::unordered_map<Address, std::vector<size_t>> commandmentsByAuthor_;

    std::map<std::pair<RoundId, SeedId>, uint64_t> roundScores_;
    std::map<std::tuple<RoundId, Address, SeedId>, uint64_t> roundElectorBlessings_;
};

}
}
