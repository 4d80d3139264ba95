#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace curator {
namespace core {

using Address = std::string;
using SeedId = uint64_t;
using RoundId = uint64_t;
using Timestamp = uint64_t;

constexpr SeedId NO_SEED = 0;

constexpr uint64_t SCORE_SCALE = 1000000;
constexpr uint64_t WEIGHT_UNIT = 1000;
constexpr uint64_t SECONDS_PER_DAY = 86400;

constexpr size_t MAX_TOTAL_SEEDS = 100000;
constexpr size_t MAX_SEEDS_PER_ROUND = 1000;
constexpr size_t MAX_UNITS_PER_PROOF = 10000;
constexpr size_t MAX_PROOF_DEPTH = 64;
constexpr size_t MAX_BATCH_SIZE = 100;
constexpr size_t MAX_PAUSE_REASON = 256;

constexpr const char* ENGINE_VERSION = "1.2.0";

enum class RoundMode : uint8_t {
    PERSISTENT = 0,
    ROUND_BASED = 1
};

enum class TieBreakStrategy : uint8_t {
    EARLIEST_SUBMISSION = 0,
    LATEST_SUBMISSION = 1,
    LOWEST_SEED_ID = 2,
    HIGHEST_SEED_ID = 3,
    PSEUDO_RANDOM = 4
};

enum class DeadlockStrategy : uint8_t {
    REVERT = 0,
    SKIP_ROUND = 1,
    RANDOM_FROM_ALL = 2,
    ALLOW_REWINS = 3
};

enum class Role : uint8_t {
    ADMIN = 0,
    CREATOR = 1,
    RELAYER = 2
};

enum class ErrorKind : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    AUTHORIZATION = 2,
    ELIGIBILITY = 3,
    LIFECYCLE = 4,
    PAYMENT = 5
};

std::string roundModeToString(RoundMode mode);
std::string tieBreakToString(TieBreakStrategy strategy);
std::string deadlockToString(DeadlockStrategy strategy);
std::string roleToString(Role role);
std::string errorKindToString(ErrorKind kind);

bool parseRoundMode(const std::string& name, RoundMode& out);
bool parseTieBreak(const std::string& name, TieBreakStrategy& out);
bool parseDeadlock(const std::string& name, DeadlockStrategy& out);
bool parseRole(const std::string& name, Role& out);

// Trimmed and lowercased; an empty result means the input was not an address.
Address normalizeAddress(const std::string& raw);
bool isValidAddress(const Address& address);

struct Seed {
    SeedId id = NO_SEED;
    Address creator;
    std::string contentHandle;
    uint64_t blessingScore = 0;
    uint64_t blessingCount = 0;
    uint64_t commandmentCount = 0;
    Timestamp createdAt = 0;
    RoundId submittedInRound = 0;
    RoundId selectedInRound = 0;
    uint64_t winCount = 0;
    RoundId lastWonInRound = 0;
    bool isRetracted = false;

    bool isDecided() const { return selectedInRound != 0; }
};

struct BlessingRecord {
    SeedId seedId = NO_SEED;
    Address elector;
    Address actor;
    Timestamp timestamp = 0;
    RoundId round = 0;
    uint64_t scoreDelta = 0;
    bool delegated = false;
};

struct Commandment {
    uint64_t id = 0;
    SeedId seedId = NO_SEED;
    Address author;
    Address actor;
    std::string contentHandle;
    Timestamp createdAt = 0;
    RoundId round = 0;
    uint64_t scoreDelta = 0;
};

struct RoundRecord {
    RoundId number = 0;
    Timestamp periodStart = 0;
    uint64_t periodDuration = 0;
    Timestamp resolvedAt = 0;
    SeedId winnerSeedId = NO_SEED;
    uint64_t winningScore = 0;
    bool skipped = false;
    bool viaDeadlock = false;
    DeadlockStrategy deadlockStrategy = DeadlockStrategy::REVERT;
    size_t candidateCount = 0;
};

struct WinnerNotification {
    RoundId round = 0;
    SeedId seedId = NO_SEED;
    std::string contentHandle;
    uint64_t finalScore = 0;
    Address creator;
    Timestamp resolvedAt = 0;
};

struct OpResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
};

struct SubmitResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    SeedId seedId = NO_SEED;
};

struct BlessResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    SeedId seedId = NO_SEED;
    uint64_t scoreDelta = 0;
    uint64_t newScore = 0;
    uint64_t remainingToday = 0;
    uint64_t charged = 0;
    uint64_t refunded = 0;
};

struct CommandmentResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    uint64_t commandmentId = 0;
    uint64_t scoreDelta = 0;
    uint64_t remainingToday = 0;
    uint64_t charged = 0;
    uint64_t refunded = 0;
};

struct AdvanceResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    RoundId resolvedRound = 0;
    RoundId newRound = 0;
    SeedId winnerSeedId = NO_SEED;
    uint64_t winningScore = 0;
    bool skipped = false;
    bool viaDeadlock = false;
    std::vector<std::string> appliedConfig;
};

inline OpResult success() {
    OpResult r;
    r.ok = true;
    return r;
}

template<typename R>
R failure(ErrorKind kind, const std::string& code) {
    R r;
    r.ok = false;
    r.kind = kind;
    r.error = code;
    return r;
}

}
}
