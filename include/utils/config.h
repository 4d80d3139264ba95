#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace curator {
namespace utils {

struct CurationConfig {
    uint64_t votingPeriod = 86400;
    uint32_t blessingsPerUnit = 1;
    uint32_t commandmentsPerUnit = 1;
    uint64_t blessingWeight = 1000;
    uint64_t commandmentWeight = 0;
    uint64_t timeDecayBase = 1000;
    uint64_t timeDecayMin = 10;
    uint64_t blessingCost = 0;
    uint64_t commandmentCost = 0;
    std::string roundMode = "persistent";
    std::string tieBreak = "lowest_seed_id";
    std::string deadlock = "revert";
    bool scoreResetOnRoundEnd = false;
};

struct EngineConfig {
    std::string admin;
    std::string treasury;
    uint64_t genesisTime = 0;
    std::vector<std::string> creators;
    std::vector<std::string> relayers;
    std::string dbPath;
};

struct LogConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
    bool sensitive = false;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    uint64_t getUint64(const std::string& key, uint64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);
    void setList(const std::string& key, const std::vector<std::string>& values);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    CurationConfig getCurationConfig() const;
    EngineConfig getEngineConfig() const;
    LogConfig getLogConfig() const;

    void setCurationConfig(const CurationConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

    std::string toJson() const;
    size_t size() const;

private:
    Config();
    void loadDefaults();
    void notifyChange(const std::string& key);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
