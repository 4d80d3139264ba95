#include "utils/config.h"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace curator {
namespace utils {

using json = nlohmann::json;

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;
};

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.seedcurator";
    } else {
        impl_->dataDir = ".seedcurator";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto& d = impl_->data;
    d["curation.voting_period"] = "86400";
    d["curation.blessings_per_unit"] = "1";
    d["curation.commandments_per_unit"] = "1";
    d["curation.blessing_weight"] = "1000";
    d["curation.commandment_weight"] = "0";
    d["curation.time_decay_base"] = "1000";
    d["curation.time_decay_min"] = "10";
    d["curation.blessing_cost"] = "0";
    d["curation.commandment_cost"] = "0";
    d["curation.round_mode"] = "persistent";
    d["curation.tie_break"] = "lowest_seed_id";
    d["curation.deadlock"] = "revert";
    d["curation.score_reset"] = "false";

    d["engine.genesis_time"] = "0";

    d["log.level"] = "info";
    d["log.console"] = "true";
    d["log.sensitive"] = "false";
    d["log.max_file_size"] = "10485760";
    d["log.max_files"] = "5";
}

void Config::notifyChange(const std::string& key) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
        impl_->configPath.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        if (key.empty()) continue;
        impl_->data[key] = trim(line.substr(pos + 1));
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# SeedCurator configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return file.good();
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

uint64_t Config::getUint64(const std::string& key, uint64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    if (it->second.empty() || it->second[0] == '-') return def;
    try { return std::stoull(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    std::string val = it->second;
    std::transform(val.begin(), val.end(), val.begin(), ::tolower);
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    return def;
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data[key] = value;
    }
    notifyChange(key);
}

void Config::set(const std::string& key, const char* value) {
    set(key, std::string(value ? value : ""));
}

void Config::set(const std::string& key, int64_t value) {
    set(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    set(key, std::string(value ? "true" : "false"));
}

void Config::setList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) joined += ",";
        joined += values[i];
    }
    set(key, joined);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
    }
    notifyChange(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

CurationConfig Config::getCurationConfig() const {
    CurationConfig cfg;
    cfg.votingPeriod = getUint64("curation.voting_period", cfg.votingPeriod);
    cfg.blessingsPerUnit = static_cast<uint32_t>(getUint64("curation.blessings_per_unit", cfg.blessingsPerUnit));
    cfg.commandmentsPerUnit = static_cast<uint32_t>(getUint64("curation.commandments_per_unit", cfg.commandmentsPerUnit));
    cfg.blessingWeight = getUint64("curation.blessing_weight", cfg.blessingWeight);
    cfg.commandmentWeight = getUint64("curation.commandment_weight", cfg.commandmentWeight);
    cfg.timeDecayBase = getUint64("curation.time_decay_base", cfg.timeDecayBase);
    cfg.timeDecayMin = getUint64("curation.time_decay_min", cfg.timeDecayMin);
    cfg.blessingCost = getUint64("curation.blessing_cost", cfg.blessingCost);
    cfg.commandmentCost = getUint64("curation.commandment_cost", cfg.commandmentCost);
    cfg.roundMode = getString("curation.round_mode", cfg.roundMode);
    cfg.tieBreak = getString("curation.tie_break", cfg.tieBreak);
    cfg.deadlock = getString("curation.deadlock", cfg.deadlock);
    cfg.scoreResetOnRoundEnd = getBool("curation.score_reset", cfg.scoreResetOnRoundEnd);
    return cfg;
}

EngineConfig Config::getEngineConfig() const {
    EngineConfig cfg;
    cfg.admin = getString("engine.admin");
    cfg.treasury = getString("engine.treasury", cfg.admin);
    cfg.genesisTime = getUint64("engine.genesis_time", 0);
    cfg.creators = getList("engine.creators");
    cfg.relayers = getList("engine.relayers");
    cfg.dbPath = getString("engine.db_path", getDataDir() + "/curator.db");
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", cfg.level);
    cfg.file = getString("log.file");
    cfg.console = getBool("log.console", cfg.console);
    cfg.sensitive = getBool("log.sensitive", cfg.sensitive);
    cfg.maxFileSize = getUint64("log.max_file_size", cfg.maxFileSize);
    cfg.maxFiles = static_cast<uint32_t>(getUint64("log.max_files", cfg.maxFiles));
    return cfg;
}

void Config::setCurationConfig(const CurationConfig& cfg) {
    set("curation.voting_period", static_cast<int64_t>(cfg.votingPeriod));
    set("curation.blessings_per_unit", static_cast<int64_t>(cfg.blessingsPerUnit));
    set("curation.commandments_per_unit", static_cast<int64_t>(cfg.commandmentsPerUnit));
    set("curation.blessing_weight", static_cast<int64_t>(cfg.blessingWeight));
    set("curation.commandment_weight", static_cast<int64_t>(cfg.commandmentWeight));
    set("curation.time_decay_base", static_cast<int64_t>(cfg.timeDecayBase));
    set("curation.time_decay_min", static_cast<int64_t>(cfg.timeDecayMin));
    set("curation.blessing_cost", static_cast<int64_t>(cfg.blessingCost));
    set("curation.commandment_cost", static_cast<int64_t>(cfg.commandmentCost));
    set("curation.round_mode", cfg.roundMode);
    set("curation.tie_break", cfg.tieBreak);
    set("curation.deadlock", cfg.deadlock);
    set("curation.score_reset", cfg.scoreResetOnRoundEnd);
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

std::string Config::toJson() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    json out = json::object();
    for (const auto& [k, v] : impl_->data) {
        out[k] = v;
    }
    return out.dump(2);
}

size_t Config::size() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.size();
}

}
}
