#include "core/types.h"
#include <algorithm>
#include <cctype>

namespace curator {
namespace core {

std::string roundModeToString(RoundMode mode) {
    switch (mode) {
        case RoundMode::PERSISTENT: return "persistent";
        case RoundMode::ROUND_BASED: return "round_based";
    }
    return "unknown";
}

std::string tieBreakToString(TieBreakStrategy strategy) {
    switch (strategy) {
        case TieBreakStrategy::EARLIEST_SUBMISSION: return "earliest_submission";
        case TieBreakStrategy::LATEST_SUBMISSION: return "latest_submission";
        case TieBreakStrategy::LOWEST_SEED_ID: return "lowest_seed_id";
        case TieBreakStrategy::HIGHEST_SEED_ID: return "highest_seed_id";
        case TieBreakStrategy::PSEUDO_RANDOM: return "pseudo_random";
    }
    return "unknown";
}

std::string deadlockToString(DeadlockStrategy strategy) {
    switch (strategy) {
        case DeadlockStrategy::REVERT: return "revert";
        case DeadlockStrategy::SKIP_ROUND: return "skip_round";
        case DeadlockStrategy::RANDOM_FROM_ALL: return "random_from_all";
        case DeadlockStrategy::ALLOW_REWINS: return "allow_rewins";
    }
    return "unknown";
}

std::string roleToString(Role role) {
    switch (role) {
        case Role::ADMIN: return "admin";
        case Role::CREATOR: return "creator";
        case Role::RELAYER: return "relayer";
    }
    return "unknown";
}

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::AUTHORIZATION: return "authorization";
        case ErrorKind::ELIGIBILITY: return "eligibility";
        case ErrorKind::LIFECYCLE: return "lifecycle";
        case ErrorKind::PAYMENT: return "payment";
    }
    return "unknown";
}

static std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool parseRoundMode(const std::string& name, RoundMode& out) {
    std::string v = lower(name);
    if (v == "persistent" || v == "non_round_based") { out = RoundMode::PERSISTENT; return true; }
    if (v == "round_based") { out = RoundMode::ROUND_BASED; return true; }
    return false;
}

bool parseTieBreak(const std::string& name, TieBreakStrategy& out) {
    std::string v = lower(name);
    for (uint8_t i = 0; i <= static_cast<uint8_t>(TieBreakStrategy::PSEUDO_RANDOM); i++) {
        auto s = static_cast<TieBreakStrategy>(i);
        if (tieBreakToString(s) == v) { out = s; return true; }
    }
    return false;
}

bool parseDeadlock(const std::string& name, DeadlockStrategy& out) {
    std::string v = lower(name);
    for (uint8_t i = 0; i <= static_cast<uint8_t>(DeadlockStrategy::ALLOW_REWINS); i++) {
        auto s = static_cast<DeadlockStrategy>(i);
        if (deadlockToString(s) == v) { out = s; return true; }
    }
    return false;
}

bool parseRole(const std::string& name, Role& out) {
    std::string v = lower(name);
    if (v == "admin") { out = Role::ADMIN; return true; }
    if (v == "creator") { out = Role::CREATOR; return true; }
    if (v == "relayer") { out = Role::RELAYER; return true; }
    return false;
}

Address normalizeAddress(const std::string& raw) {
    size_t b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = raw.find_last_not_of(" \t\r\n");
    Address out = lower(raw.substr(b, e - b + 1));
    return isValidAddress(out) ? out : Address();
}

bool isValidAddress(const Address& address) {
    if (address.empty() || address.size() > 128) return false;
    for (unsigned char c : address) {
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.' && c != ':') return false;
    }
    return true;
}

}
}
