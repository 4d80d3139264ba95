#include "core/resolution.h"
#include "utils/serialize.h"
#include <algorithm>

namespace curator {
namespace core {

static void sortById(std::vector<Candidate>& v) {
    std::sort(v.begin(), v.end(), [](const Candidate& a, const Candidate& b) { return a.id < b.id; });
}

ResolutionPolicy::ResolutionPolicy(TieBreakStrategy tieBreak, DeadlockStrategy deadlock)
    : tieBreak_(tieBreak), deadlock_(deadlock) {}

size_t ResolutionPolicy::pseudoRandomIndex(const std::string& domain, RoundId round,
                                           const crypto::Hash256& entropy, size_t n) {
    if (n == 0) return 0;
    utils::ByteBuffer buf;
    buf.writeString(domain);
    buf.writeUint64(round);
    buf.writeArray(entropy);
    buf.writeUint64(n);
    crypto::Hash256 h = crypto::sha256(buf.data());
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) {
        v = (v << 8) | h[i];
    }
    return static_cast<size_t>(v % n);
}

std::vector<Candidate> ResolutionPolicy::topScorers(const std::vector<Candidate>& candidates) const {
    uint64_t maxScore = 0;
    for (const auto& c : candidates) maxScore = std::max(maxScore, c.score);
    std::vector<Candidate> top;
    if (maxScore == 0) return top;
    for (const auto& c : candidates) {
        if (c.score == maxScore) top.push_back(c);
    }
    return top;
}

SeedId ResolutionPolicy::breakTie(std::vector<Candidate> tied, RoundId round, const crypto::Hash256& entropy) const {
    if (tied.empty()) return NO_SEED;
    sortById(tied);
    if (tied.size() == 1) return tied[0].id;

    switch (tieBreak_) {
        case TieBreakStrategy::EARLIEST_SUBMISSION:
            return std::min_element(tied.begin(), tied.end(), [](const Candidate& a, const Candidate& b) {
                return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
            })->id;
        case TieBreakStrategy::LATEST_SUBMISSION:
            return std::max_element(tied.begin(), tied.end(), [](const Candidate& a, const Candidate& b) {
                return a.createdAt != b.createdAt ? a.createdAt < b.createdAt : a.id < b.id;
            })->id;
        case TieBreakStrategy::LOWEST_SEED_ID:
            return tied.front().id;
        case TieBreakStrategy::HIGHEST_SEED_ID:
            return tied.back().id;
        case TieBreakStrategy::PSEUDO_RANDOM:
            return tied[pseudoRandomIndex("tie_break", round, entropy, tied.size())].id;
    }
    return tied.front().id;
}

Resolution ResolutionPolicy::resolve(std::vector<Candidate> candidates,
                                     std::vector<Candidate> previousWinners,
                                     RoundId round,
                                     const crypto::Hash256& entropy) const {
    sortById(candidates);
    Resolution r;
    r.strategy = deadlock_;

    std::vector<Candidate> top = topScorers(candidates);
    if (!top.empty()) {
        r.outcome = ResolutionOutcome::WINNER;
        r.winner = breakTie(top, round, entropy);
        r.score = top.front().score;
        return r;
    }

    r.viaDeadlock = true;
    switch (deadlock_) {
        case DeadlockStrategy::REVERT:
            r.outcome = ResolutionOutcome::NO_VALID_WINNER;
            return r;
        case DeadlockStrategy::SKIP_ROUND:
            r.outcome = ResolutionOutcome::SKIPPED;
            return r;
        case DeadlockStrategy::RANDOM_FROM_ALL:
            if (candidates.empty()) {
                r.outcome = ResolutionOutcome::SKIPPED;
                return r;
            }
            r.outcome = ResolutionOutcome::WINNER;
            {
                const Candidate& pick = candidates[pseudoRandomIndex("deadlock", round, entropy, candidates.size())];
                r.winner = pick.id;
                r.score = pick.score;
            }
            return r;
        case DeadlockStrategy::ALLOW_REWINS: {
            sortById(previousWinners);
            std::vector<Candidate> prevTop = topScorers(previousWinners);
            if (prevTop.empty()) {
                r.outcome = ResolutionOutcome::NO_VALID_WINNER;
                return r;
            }
            r.outcome = ResolutionOutcome::WINNER;
            r.winner = breakTie(prevTop, round, entropy);
            r.score = prevTop.front().score;
            r.rewin = true;
            return r;
        }
    }
    r.outcome = ResolutionOutcome::NO_VALID_WINNER;
    return r;
}

Candidate ResolutionPolicy::leader(std::vector<Candidate> candidates) const {
    std::vector<Candidate> top = topScorers(candidates);
    if (top.empty()) return Candidate();
    ResolutionPolicy preview(tieBreak_ == TieBreakStrategy::PSEUDO_RANDOM ? TieBreakStrategy::LOWEST_SEED_ID : tieBreak_,
                             deadlock_);
    SeedId id = preview.breakTie(top, 0, crypto::Hash256{});
    for (const auto& c : top) {
        if (c.id == id) return c;
    }
    return Candidate();
}

}
}
