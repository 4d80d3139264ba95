#include "core/seed_registry.h"
#include <algorithm>
#include <cctype>

namespace curator {
namespace core {

static constexpr size_t MIN_HANDLE_LENGTH = 10;
static constexpr size_t MAX_HANDLE_LENGTH = 128;

std::string SeedRegistry::normalizeContentHandle(const std::string& raw) {
    size_t b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = raw.find_last_not_of(" \t\r\n");
    std::string handle = raw.substr(b, e - b + 1);
    return isValidContentHandle(handle) ? handle : "";
}

bool SeedRegistry::isValidContentHandle(const std::string& handle) {
    if (handle.size() < MIN_HANDLE_LENGTH || handle.size() > MAX_HANDLE_LENGTH) return false;
    for (unsigned char c : handle) {
        if (!std::isalnum(c)) return false;
    }
    return handle.compare(0, 2, "Qm") == 0 || handle.compare(0, 3, "baf") == 0;
}

OpResult SeedRegistry::checkSubmit(const std::string& contentHandle, RoundId round) const {
    if (!isValidContentHandle(contentHandle)) {
        return failure<OpResult>(ErrorKind::VALIDATION, "invalid_content_handle");
    }
    if (seeds_.size() >= MAX_TOTAL_SEEDS) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "max_total_seeds_reached");
    }
    if (countInRound(round) >= MAX_SEEDS_PER_ROUND) {
        return failure<OpResult>(ErrorKind::LIFECYCLE, "max_seeds_per_round_reached");
    }
    return success();
}

SeedId SeedRegistry::submit(const Address& creator, const std::string& contentHandle, Timestamp now, RoundId round) {
    Seed seed;
    seed.id = static_cast<SeedId>(seeds_.size() + 1);
    seed.creator = creator;
    seed.contentHandle = contentHandle;
    seed.createdAt = now;
    seed.submittedInRound = round;
    seeds_.push_back(seed);

    byRound_[round].push_back(seed.id);
    eligible_.insert(seed.id);
    return seed.id;
}

OpResult SeedRegistry::checkRetract(SeedId id, const Address& caller) const {
    const Seed* seed = find(id);
    if (!seed) return failure<OpResult>(ErrorKind::VALIDATION, "seed_not_found");
    if (seed->creator != caller) return failure<OpResult>(ErrorKind::AUTHORIZATION, "not_seed_creator");
    if (seed->isRetracted) return failure<OpResult>(ErrorKind::LIFECYCLE, "already_retracted");
    if (seed->isDecided()) return failure<OpResult>(ErrorKind::LIFECYCLE, "cannot_retract_winning_seed");
    return success();
}

void SeedRegistry::retract(SeedId id) {
    Seed* seed = findMutable(id);
    if (!seed) return;
    seed->isRetracted = true;
    eligible_.remove(id);
}

void SeedRegistry::markWinner(SeedId id, RoundId round) {
    Seed* seed = findMutable(id);
    if (!seed) return;
    if (seed->winCount == 0) {
        seed->selectedInRound = round;
        winners_.push_back(id);
    }
    seed->winCount++;
    seed->lastWonInRound = round;
    eligible_.remove(id);
}

const Seed* SeedRegistry::find(SeedId id) const {
    if (id == NO_SEED || id > seeds_.size()) return nullptr;
    return &seeds_[id - 1];
}

Seed* SeedRegistry::findMutable(SeedId id) {
    if (id == NO_SEED || id > seeds_.size()) return nullptr;
    return &seeds_[id - 1];
}

size_t SeedRegistry::countInRound(RoundId round) const {
    auto it = byRound_.find(round);
    return it == byRound_.end() ? 0 : it->second.size();
}

std::vector<SeedId> SeedRegistry::seedsByRound(RoundId round) const {
    auto it = byRound_.find(round);
    if (it == byRound_.end()) return {};
    return it->second;
}

std::vector<Seed> SeedRegistry::page(size_t offset, size_t limit) const {
    if (offset >= seeds_.size() || limit == 0) return {};
    size_t end = offset + std::min(limit, seeds_.size() - offset);
    return std::vector<Seed>(seeds_.begin() + offset, seeds_.begin() + end);
}

std::vector<SeedId> SeedRegistry::previousWinners() const {
    std::vector<SeedId> out;
    for (SeedId id : winners_) {
        if (!seeds_[id - 1].isRetracted) out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void SeedRegistry::rebuildEligible(RoundMode mode, RoundId round) {
    eligible_.clear();
    for (const auto& seed : seeds_) {
        if (seed.isRetracted || seed.isDecided()) continue;
        if (mode == RoundMode::ROUND_BASED && seed.submittedInRound != round) continue;
        eligible_.insert(seed.id);
    }
}

}
}
