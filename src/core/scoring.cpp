#include "core/scoring.h"
#include <algorithm>

namespace curator {
namespace core {

uint64_t isqrt(uint64_t n) {
    if (n < 2) return n;
    uint64_t x = n;
    uint64_t y = x / 2 + (x & 1);
    while (y < x) {
        x = y;
        y = (x + n / x) / 2;
    }
    return x;
}

uint64_t dampen(uint64_t count) {
    return isqrt(count * SCORE_SCALE);
}

uint64_t decayMultiplier(uint64_t elapsed, uint64_t period, uint64_t base, uint64_t min) {
    if (min >= base) return base;
    if (period == 0 || elapsed >= period) return min;
    uint64_t span = base - min;
    uint64_t drop = span * elapsed / period;
    uint64_t m = base - drop;
    return m < min ? min : m;
}

uint64_t weightedContribution(uint64_t dampenedDelta, uint64_t weight, uint64_t multiplier, uint64_t decayBase) {
    if (dampenedDelta == 0 || weight == 0 || decayBase == 0) return 0;
    // Bounded by the validated ranges: delta <= 1000, weight and multiplier <= 1e6.
    uint64_t out = dampenedDelta * weight / WEIGHT_UNIT * multiplier / decayBase;
    return out == 0 ? 1 : out;
}

uint64_t ScoringEngine::usedOn(const std::unordered_map<Address, DailyCounter>& counters,
                               const Address& elector, uint64_t day) {
    auto it = counters.find(elector);
    if (it == counters.end() || it->second.day != day) return 0;
    return it->second.used;
}

void ScoringEngine::consume(std::unordered_map<Address, DailyCounter>& counters,
                            const Address& elector, uint64_t day) {
    auto& c = counters[elector];
    if (c.day != day) {
        c.day = day;
        c.used = 0;
    }
    c.used++;
}

uint64_t ScoringEngine::blessingsUsedToday(const Address& elector, Timestamp now) const {
    return usedOn(blessingDays_, elector, dayKey(now));
}

uint64_t ScoringEngine::commandmentsUsedToday(const Address& elector, Timestamp now) const {
    return usedOn(commandmentDays_, elector, dayKey(now));
}

uint64_t ScoringEngine::remainingBlessings(const Address& elector, uint64_t ownedUnits,
                                           const EngineParams& params, Timestamp now) const {
    uint64_t allowance = ownedUnits * params.blessingsPerUnit;
    uint64_t used = blessingsUsedToday(elector, now);
    return used >= allowance ? 0 : allowance - used;
}

uint64_t ScoringEngine::remainingCommandments(const Address& elector, uint64_t ownedUnits,
                                              const EngineParams& params, Timestamp now) const {
    uint64_t allowance = ownedUnits * params.commandmentsPerUnit;
    uint64_t used = commandmentsUsedToday(elector, now);
    return used >= allowance ? 0 : allowance - used;
}

uint64_t ScoringEngine::applyBlessing(Seed& seed, const Address& elector, const Address& actor,
                                      const EngineParams& params, const PeriodClock& clock, Timestamp now) {
    consume(blessingDays_, elector, dayKey(now));

    PairState& ps = pairs_[{elector, seed.id}];
    ps.blessingsGiven++;
    uint64_t damp = dampen(ps.blessingsGiven);
    uint64_t delta = damp > ps.lastBlessingDampened ? damp - ps.lastBlessingDampened : 0;
    ps.lastBlessingDampened = damp;

    uint64_t elapsed = now > clock.periodStart ? now - clock.periodStart : 0;
    uint64_t mult = decayMultiplier(elapsed, clock.periodDuration, params.timeDecayBase, params.timeDecayMin);
    uint64_t contribution = weightedContribution(delta, params.blessingWeight, mult, params.timeDecayBase);

    seed.blessingScore += contribution;
    seed.blessingCount++;

    BlessingRecord rec;
    rec.seedId = seed.id;
    rec.elector = elector;
    rec.actor = actor;
    rec.timestamp = now;
    rec.round = clock.round;
    rec.scoreDelta = contribution;
    rec.delegated = actor != elector;
    blessingsBySeed_[seed.id].push_back(blessings_.size());
    blessingsByElector_[elector].push_back(blessings_.size());
    blessings_.push_back(rec);

    roundScores_[{clock.round, seed.id}] += contribution;
    roundElectorBlessings_[std::make_tuple(clock.round, elector, seed.id)]++;
    return contribution;
}

Commandment ScoringEngine::applyCommandment(Seed& seed, const Address& author, const Address& actor,
                                            const std::string& contentHandle, bool scoring,
                                            const EngineParams& params, const PeriodClock& clock, Timestamp now) {
    consume(commandmentDays_, author, dayKey(now));

    PairState& ps = pairs_[{author, seed.id}];
    ps.commandmentsGiven++;

    uint64_t damp = dampen(ps.commandmentsGiven);
    uint64_t delta = damp > ps.lastCommandmentDampened ? damp - ps.lastCommandmentDampened : 0;
    ps.lastCommandmentDampened = damp;

    uint64_t contribution = 0;
    if (scoring) {
        uint64_t elapsed = now > clock.periodStart ? now - clock.periodStart : 0;
        uint64_t mult = decayMultiplier(elapsed, clock.periodDuration, params.timeDecayBase, params.timeDecayMin);
        contribution = weightedContribution(delta, params.commandmentWeight, mult, params.timeDecayBase);
        seed.blessingScore += contribution;
        roundScores_[{clock.round, seed.id}] += contribution;
    }
    seed.commandmentCount++;

    Commandment c;
    c.id = commandments_.size() + 1;
    c.seedId = seed.id;
    c.author = author;
    c.actor = actor;
    c.contentHandle = contentHandle;
    c.createdAt = now;
    c.round = clock.round;
    c.scoreDelta = contribution;
    commandmentsBySeed_[seed.id].push_back(commandments_.size());
    commandmentsByAuthor_[author].push_back(commandments_.size());
    commandments_.push_back(c);
    return c;
}

PairState ScoringEngine::pair(const Address& elector, SeedId seedId) const {
    auto it = pairs_.find({elector, seedId});
    return it == pairs_.end() ? PairState() : it->second;
}

uint64_t ScoringEngine::blessingCount(const Address& elector, SeedId seedId) const {
    return pair(elector, seedId).blessingsGiven;
}

bool ScoringEngine::hasBlessed(const Address& elector, SeedId seedId) const {
    return blessingCount(elector, seedId) > 0;
}

std::vector<BlessingRecord> ScoringEngine::seedBlessings(SeedId seedId) const {
    std::vector<BlessingRecord> out;
    auto it = blessingsBySeed_.find(seedId);
    if (it == blessingsBySeed_.end()) return out;
    for (size_t idx : it->second) out.push_back(blessings_[idx]);
    return out;
}

std::vector<BlessingRecord> ScoringEngine::electorBlessings(const Address& elector) const {
    std::vector<BlessingRecord> out;
    auto it = blessingsByElector_.find(elector);
    if (it == blessingsByElector_.end()) return out;
    for (size_t idx : it->second) out.push_back(blessings_[idx]);
    return out;
}

std::vector<Commandment> ScoringEngine::commandmentsBySeed(SeedId seedId) const {
    std::vector<Commandment> out;
    auto it = commandmentsBySeed_.find(seedId);
    if (it == commandmentsBySeed_.end()) return out;
    for (size_t idx : it->second) out.push_back(commandments_[idx]);
    return out;
}

std::vector<Commandment> ScoringEngine::commandmentsByAuthor(const Address& author) const {
    std::vector<Commandment> out;
    auto it = commandmentsByAuthor_.find(author);
    if (it == commandmentsByAuthor_.end()) return out;
    for (size_t idx : it->second) out.push_back(commandments_[idx]);
    return out;
}

uint64_t ScoringEngine::seedScoreByRound(RoundId round, SeedId seedId) const {
    auto it = roundScores_.find({round, seedId});
    return it == roundScores_.end() ? 0 : it->second;
}

uint64_t ScoringEngine::electorSeedBlessingsByRound(RoundId round, const Address& elector, SeedId seedId) const {
    auto it = roundElectorBlessings_.find(std::make_tuple(round, elector, seedId));
    return it == roundElectorBlessings_.end() ? 0 : it->second;
}

}
}
