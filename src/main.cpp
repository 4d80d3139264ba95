#include <iostream>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include <ctime>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <getopt.h>

#include "core/curation_engine.h"
#include "core/ownership.h"
#include "crypto/crypto.h"
#include "utils/logger.h"
#include "utils/config.h"
#include <nlohmann/json.hpp>

namespace curator {

using json = nlohmann::json;
using namespace core;

struct CliConfig {
    std::string dataDir;
    std::string configPath;
    std::string logLevel;
    std::optional<Timestamp> now;
    bool showHelp = false;
    bool showVersion = false;
    std::vector<std::string> commandArgs;
};

void printHelp(const char* progName) {
    std::cout << "SeedCurator v" << CurationEngine::version() << " - round-based seed curation\n\n";
    std::cout << "Usage: " << progName << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  status                                  Show round and engine status\n";
    std::cout << "  submit <creator> <cid>                  Submit a seed\n";
    std::cout << "  retract <seed> <caller>                 Retract an undecided seed\n";
    std::cout << "  bless <seed> <elector> <snapshot> [payment] [actor]\n";
    std::cout << "                                          Bless a seed with a snapshot proof\n";
    std::cout << "  comment <seed> <elector> <cid> <snapshot> [payment] [actor]\n";
    std::cout << "                                          Attach a commandment to a seed\n";
    std::cout << "  advance [entropy-hex]                   Resolve the round once its period ended\n";
    std::cout << "  merkle <snapshot>                       Print root and proofs for a snapshot\n";
    std::cout << "  publish-root <caller> <snapshot>        Publish the snapshot root\n";
    std::cout << "  schedule <caller> key=value...          Stage parameters for the next round\n";
    std::cout << "  treasury <caller> <address>             Set the treasury address\n";
    std::cout << "  grant|revoke <caller> <role> <account>  Manage admin/creator/relayer roles\n";
    std::cout << "  delegate <elector> <delegate> <on|off>  Approve or withdraw a delegate\n";
    std::cout << "  pause <caller> [reason]                 Halt mutations\n";
    std::cout << "  unpause <caller>                        Resume mutations\n";
    std::cout << "  seeds [offset] [limit]                  List seeds\n";
    std::cout << "  eligible                                List eligible seed ids\n";
    std::cout << "  winners                                 List round winners\n";
    std::cout << "  leader                                  Show the current leader\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n";
    std::cout << "  -c, --config FILE   Use custom config file\n";
    std::cout << "  -D, --datadir DIR   Data directory\n";
    std::cout << "  -l, --loglevel LVL  Log level (debug/info/warn/error)\n";
    std::cout << "  -n, --now TS        Use TS (unix seconds) as the current time\n";
}

void printVersion() {
    std::cout << "SeedCurator " << CurationEngine::version() << "\n";
}

bool parseArgs(int argc, char* argv[], CliConfig& config) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"config", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'D'},
        {"loglevel", required_argument, nullptr, 'l'},
        {"now", required_argument, nullptr, 'n'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;

    while ((opt = getopt_long(argc, argv, "+hvc:D:l:n:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 'c':
                config.configPath = optarg;
                break;
            case 'D':
                config.dataDir = optarg;
                break;
            case 'l':
                config.logLevel = optarg;
                break;
            case 'n':
                try {
                    config.now = std::stoull(optarg);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --now value: " << optarg << "\n";
                    return false;
                }
                break;
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i) {
        config.commandArgs.emplace_back(argv[i]);
    }
    return true;
}

static bool parseUint(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t pos = 0;
        out = std::stoull(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseOnOff(const std::string& s, bool& out) {
    if (s == "on" || s == "true" || s == "1" || s == "yes") { out = true; return true; }
    if (s == "off" || s == "false" || s == "0" || s == "no") { out = false; return true; }
    return false;
}

static EngineParams paramsFromConfig(const utils::CurationConfig& cfg) {
    EngineParams p;
    p.votingPeriod = cfg.votingPeriod;
    p.blessingsPerUnit = cfg.blessingsPerUnit;
    p.commandmentsPerUnit = cfg.commandmentsPerUnit;
    p.blessingWeight = cfg.blessingWeight;
    p.commandmentWeight = cfg.commandmentWeight;
    p.timeDecayBase = cfg.timeDecayBase;
    p.timeDecayMin = cfg.timeDecayMin;
    p.blessingCost = cfg.blessingCost;
    p.commandmentCost = cfg.commandmentCost;
    p.scoreResetOnRoundEnd = cfg.scoreResetOnRoundEnd;
    if (!parseRoundMode(cfg.roundMode, p.roundMode)) {
        utils::Logger::warn("Unknown curation.round_mode '" + cfg.roundMode + "', using persistent");
    }
    if (!parseTieBreak(cfg.tieBreak, p.tieBreak)) {
        utils::Logger::warn("Unknown curation.tie_break '" + cfg.tieBreak + "', using lowest_seed_id");
    }
    if (!parseDeadlock(cfg.deadlock, p.deadlock)) {
        utils::Logger::warn("Unknown curation.deadlock '" + cfg.deadlock + "', using revert");
    }
    return p;
}

static EngineOptions optionsFromConfig(const utils::Config& config, Timestamp now) {
    utils::EngineConfig ec = config.getEngineConfig();
    EngineOptions o;
    o.admin = ec.admin;
    o.treasury = ec.treasury;
    o.genesisTime = ec.genesisTime != 0 ? ec.genesisTime : now;
    o.creators = ec.creators;
    o.relayers = ec.relayers;
    o.params = paramsFromConfig(config.getCurationConfig());
    return o;
}

// Applies one key=value pair to a staged update; keys match the config file.
static bool applyScheduleArg(const std::string& arg, PendingParams& update, std::string& error) {
    auto pos = arg.find('=');
    if (pos == std::string::npos) {
        error = "expected key=value, got " + arg;
        return false;
    }
    std::string key = arg.substr(0, pos);
    std::string value = arg.substr(pos + 1);
    uint64_t n = 0;
    bool numeric = parseUint(value, n);

    if (key == "round_mode") {
        RoundMode m;
        if (!parseRoundMode(value, m)) { error = "unknown round mode " + value; return false; }
        update.roundMode = m;
        return true;
    }
    if (key == "tie_break") {
        TieBreakStrategy t;
        if (!parseTieBreak(value, t)) { error = "unknown tie-break " + value; return false; }
        update.tieBreak = t;
        return true;
    }
    if (key == "deadlock") {
        DeadlockStrategy d;
        if (!parseDeadlock(value, d)) { error = "unknown deadlock strategy " + value; return false; }
        update.deadlock = d;
        return true;
    }
    if (key == "score_reset") {
        bool b;
        if (!parseOnOff(value, b)) { error = "score_reset must be on or off"; return false; }
        update.scoreResetOnRoundEnd = b;
        return true;
    }
    if (!numeric) {
        error = key + " needs an unsigned integer";
        return false;
    }
    if (key == "voting_period") update.votingPeriod = n;
    else if (key == "blessings_per_unit") update.blessingsPerUnit = static_cast<uint32_t>(std::min<uint64_t>(n, UINT32_MAX));
    else if (key == "commandments_per_unit") update.commandmentsPerUnit = static_cast<uint32_t>(std::min<uint64_t>(n, UINT32_MAX));
    else if (key == "blessing_weight") update.blessingWeight = n;
    else if (key == "commandment_weight") update.commandmentWeight = n;
    else if (key == "time_decay_base") update.timeDecayBase = n;
    else if (key == "time_decay_min") update.timeDecayMin = n;
    else if (key == "blessing_cost") update.blessingCost = n;
    else if (key == "commandment_cost") update.commandmentCost = n;
    else {
        error = "unknown parameter " + key;
        return false;
    }
    return true;
}

template<typename R>
static json resultJson(const R& r) {
    json out;
    out["ok"] = r.ok;
    if (!r.ok) {
        out["kind"] = errorKindToString(r.kind);
        out["error"] = r.error;
    }
    return out;
}

static json seedJson(const Seed& s) {
    json j;
    j["id"] = s.id;
    j["creator"] = s.creator;
    j["contentHandle"] = s.contentHandle;
    j["score"] = s.blessingScore;
    j["blessings"] = s.blessingCount;
    j["commandments"] = s.commandmentCount;
    j["createdAt"] = s.createdAt;
    j["submittedInRound"] = s.submittedInRound;
    j["selectedInRound"] = s.selectedInRound;
    j["winCount"] = s.winCount;
    j["retracted"] = s.isRetracted;
    return j;
}

static bool loadSnapshot(const std::string& path, OwnershipSnapshot& snapshot) {
    std::string err;
    if (!snapshot.loadFile(path, &err)) {
        std::cerr << "Snapshot error: " << err << "\n";
        return false;
    }
    return true;
}

static int printResult(const json& out, bool ok) {
    std::cout << out.dump(2) << "\n";
    return ok ? 0 : 1;
}

static int usageError(const std::string& cmd) {
    std::cerr << "Missing arguments for '" << cmd << "'; see --help\n";
    return 1;
}

int runCommand(CurationEngine& engine, const std::vector<std::string>& args, Timestamp now) {
    const std::string& cmd = args[0];
    auto arg = [&args](size_t i) -> std::string { return i < args.size() ? args[i] : std::string(); };

    if (cmd == "status") {
        EngineStatus s = engine.status(now);
        json out;
        out["version"] = CurationEngine::version();
        out["round"] = s.round;
        out["phase"] = roundPhaseToString(s.phase);
        out["periodStart"] = s.periodStart;
        out["periodDuration"] = s.periodDuration;
        out["timeUntilPeriodEnd"] = s.timeUntilPeriodEnd;
        out["secondsUntilDailyReset"] = s.secondsUntilDailyReset;
        out["paused"] = s.paused;
        if (s.paused) out["pauseReason"] = s.pauseReason;
        out["totalSeeds"] = s.totalSeeds;
        out["eligibleSeeds"] = s.eligibleSeeds;
        out["leader"] = s.leader;
        out["leaderScore"] = s.leaderScore;
        out["pendingConfig"] = s.hasPendingConfig;
        out["treasury"] = engine.treasury();
        OwnershipRoots roots = engine.ownershipRoots();
        out["ownershipRoot"] = roots.hasCurrent() ? "0x" + crypto::toHex(roots.current) : "";
        return printResult(out, true);
    }

    if (cmd == "submit") {
        if (args.size() < 3) return usageError(cmd);
        SubmitResult r = engine.submitSeed(args[1], args[2], now);
        json out = resultJson(r);
        if (r.ok) out["seedId"] = r.seedId;
        return printResult(out, r.ok);
    }

    if (cmd == "retract") {
        uint64_t id = 0;
        if (args.size() < 3 || !parseUint(args[1], id)) return usageError(cmd);
        OpResult r = engine.retractSeed(id, args[2], now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "bless" || cmd == "comment") {
        bool comment = cmd == "comment";
        size_t snapshotArg = comment ? 4 : 3;
        uint64_t id = 0;
        if (args.size() <= snapshotArg || !parseUint(args[1], id)) return usageError(cmd);
        uint64_t payment = 0;
        if (!arg(snapshotArg + 1).empty() && !parseUint(arg(snapshotArg + 1), payment)) return usageError(cmd);

        OwnershipSnapshot snapshot;
        if (!loadSnapshot(args[snapshotArg], snapshot)) return 1;
        Address elector = normalizeAddress(args[2]);
        const Holder* holder = snapshot.find(elector);
        std::vector<uint64_t> units = holder ? holder->unitIds : std::vector<uint64_t>();
        std::vector<crypto::Hash256> proof = holder ? snapshot.proofFor(elector) : std::vector<crypto::Hash256>();

        if (!comment) {
            BlessingRequest req;
            req.seedId = id;
            req.elector = elector;
            req.actor = arg(snapshotArg + 2);
            req.unitIds = units;
            req.proof = proof;
            req.payment = payment;
            BlessResult r = engine.blessSeed(req, now);
            json out = resultJson(r);
            if (r.ok) {
                out["scoreDelta"] = r.scoreDelta;
                out["newScore"] = r.newScore;
                out["remainingToday"] = r.remainingToday;
                out["charged"] = r.charged;
                out["refunded"] = r.refunded;
            }
            return printResult(out, r.ok);
        }

        CommandmentRequest req;
        req.seedId = id;
        req.elector = elector;
        req.actor = arg(snapshotArg + 2);
        req.contentHandle = args[3];
        req.unitIds = units;
        req.proof = proof;
        req.payment = payment;
        CommandmentResult r = engine.addCommandment(req, now);
        json out = resultJson(r);
        if (r.ok) {
            out["commandmentId"] = r.commandmentId;
            out["scoreDelta"] = r.scoreDelta;
            out["remainingToday"] = r.remainingToday;
            out["charged"] = r.charged;
            out["refunded"] = r.refunded;
        }
        return printResult(out, r.ok);
    }

    if (cmd == "advance") {
        crypto::Hash256 entropy{};
        if (args.size() > 1) {
            if (!crypto::parseHash256(args[1], entropy)) {
                std::cerr << "Entropy must be 32 bytes of hex\n";
                return 1;
            }
        } else {
            std::vector<uint8_t> rnd = crypto::randomBytes(entropy.size());
            std::copy(rnd.begin(), rnd.end(), entropy.begin());
        }
        AdvanceResult r = engine.advance(now, entropy);
        json out = resultJson(r);
        if (r.ok) {
            out["resolvedRound"] = r.resolvedRound;
            out["newRound"] = r.newRound;
            out["skipped"] = r.skipped;
            out["viaDeadlock"] = r.viaDeadlock;
            if (!r.skipped) {
                out["winner"] = r.winnerSeedId;
                out["winningScore"] = r.winningScore;
            }
            out["appliedConfig"] = r.appliedConfig;
        }
        return printResult(out, r.ok);
    }

    if (cmd == "merkle") {
        if (args.size() < 2) return usageError(cmd);
        OwnershipSnapshot snapshot;
        if (!loadSnapshot(args[1], snapshot)) return 1;
        std::cout << snapshot.merkleJson() << "\n";
        return 0;
    }

    if (cmd == "publish-root") {
        if (args.size() < 3) return usageError(cmd);
        OwnershipSnapshot snapshot;
        if (!loadSnapshot(args[2], snapshot)) return 1;
        OpResult r = engine.updateOwnershipRoot(args[1], snapshot.root(), now);
        json out = resultJson(r);
        if (r.ok) {
            out["root"] = "0x" + crypto::toHex(snapshot.root());
            out["holders"] = snapshot.holders().size();
            out["totalUnits"] = snapshot.totalUnits();
        }
        return printResult(out, r.ok);
    }

    if (cmd == "schedule") {
        if (args.size() < 3) return usageError(cmd);
        PendingParams update;
        for (size_t i = 2; i < args.size(); i++) {
            std::string err;
            if (!applyScheduleArg(args[i], update, err)) {
                std::cerr << err << "\n";
                return 1;
            }
        }
        OpResult r = engine.scheduleParams(args[1], update, now);
        json out = resultJson(r);
        if (r.ok) out["staged"] = engine.pendingParams().names();
        return printResult(out, r.ok);
    }

    if (cmd == "treasury") {
        if (args.size() < 3) return usageError(cmd);
        OpResult r = engine.setTreasury(args[1], args[2], now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "grant" || cmd == "revoke") {
        Role role;
        if (args.size() < 4) return usageError(cmd);
        if (!parseRole(args[2], role)) {
            std::cerr << "Unknown role " << args[2] << "\n";
            return 1;
        }
        OpResult r = cmd == "grant" ? engine.grantRole(args[1], role, args[3], now)
                                    : engine.revokeRole(args[1], role, args[3], now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "delegate") {
        bool approved = false;
        if (args.size() < 4 || !parseOnOff(args[3], approved)) return usageError(cmd);
        OpResult r = engine.approveDelegate(args[1], args[2], approved, now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "pause") {
        if (args.size() < 2) return usageError(cmd);
        std::string reason;
        for (size_t i = 2; i < args.size(); i++) {
            if (!reason.empty()) reason += " ";
            reason += args[i];
        }
        OpResult r = engine.pause(args[1], reason, now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "unpause") {
        if (args.size() < 2) return usageError(cmd);
        OpResult r = engine.unpause(args[1], now);
        return printResult(resultJson(r), r.ok);
    }

    if (cmd == "seeds") {
        uint64_t offset = 0;
        uint64_t limit = 50;
        if (!arg(1).empty() && !parseUint(arg(1), offset)) return usageError(cmd);
        if (!arg(2).empty() && !parseUint(arg(2), limit)) return usageError(cmd);
        json out = json::array();
        for (const auto& s : engine.getSeeds(offset, limit)) out.push_back(seedJson(s));
        return printResult(out, true);
    }

    if (cmd == "eligible") {
        json out;
        out["count"] = engine.eligibleCount();
        out["seeds"] = engine.eligibleSeeds();
        return printResult(out, true);
    }

    if (cmd == "winners") {
        json out = json::array();
        for (const auto& w : engine.winners()) {
            json j;
            j["round"] = w.round;
            j["seedId"] = w.seedId;
            j["contentHandle"] = w.contentHandle;
            j["score"] = w.finalScore;
            j["creator"] = w.creator;
            j["resolvedAt"] = w.resolvedAt;
            out.push_back(j);
        }
        return printResult(out, true);
    }

    if (cmd == "leader") {
        auto leader = engine.currentLeader();
        json out;
        out["seedId"] = leader.first;
        out["score"] = leader.second;
        return printResult(out, true);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 1;
}

}

int main(int argc, char* argv[]) {
    curator::CliConfig cli;
    if (!curator::parseArgs(argc, argv, cli)) {
        return 1;
    }
    if (cli.showHelp) {
        curator::printHelp(argv[0]);
        return 0;
    }
    if (cli.showVersion) {
        curator::printVersion();
        return 0;
    }
    if (cli.commandArgs.empty()) {
        curator::printHelp(argv[0]);
        return 1;
    }

    auto& config = curator::utils::Config::instance();
    if (!cli.dataDir.empty()) config.setDataDir(cli.dataDir);
    std::string configPath = cli.configPath.empty() ? config.getDataDir() + "/curator.conf" : cli.configPath;
    if (!config.load(configPath) && !cli.configPath.empty()) {
        std::cerr << "Cannot read config file " << configPath << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.getDataDir(), ec);

    curator::utils::LogConfig logCfg = config.getLogConfig();
    std::string level = cli.logLevel.empty() ? logCfg.level : cli.logLevel;
    curator::utils::Logger::setLevel(curator::utils::Logger::parseLevel(level, curator::utils::LogLevel::INFO));
    // stdout carries the JSON result; console logging is only wanted when debugging.
    curator::utils::Logger::enableConsole(logCfg.console && level == "debug");
    curator::utils::Logger::setAllowSensitiveLogging(logCfg.sensitive);
    curator::utils::Logger::setMaxFileSize(logCfg.maxFileSize);
    curator::utils::Logger::setMaxFiles(logCfg.maxFiles);
    // SEEDCURATOR_ALLOW_SENSITIVE_LOGS can still enable full addresses here.
    if (!logCfg.file.empty()) curator::utils::Logger::init(logCfg.file);

    curator::core::Timestamp now = cli.now ? *cli.now : static_cast<curator::core::Timestamp>(std::time(nullptr));
    curator::core::EngineOptions options = curator::optionsFromConfig(config, now);

    std::string command = cli.commandArgs[0];
    if (command == "merkle") {
        curator::core::CurationEngine scratch(options);
        return curator::runCommand(scratch, cli.commandArgs, now);
    }

    curator::core::CurationEngine engine(options);
    std::string dbPath = config.getEngineConfig().dbPath;
    if (!engine.open(dbPath)) {
        std::cerr << "Failed to open curation database " << dbPath << "\n";
        return 1;
    }

    int result = curator::runCommand(engine, cli.commandArgs, now);
    engine.close();
    curator::utils::Logger::shutdown();
    return result;
}
