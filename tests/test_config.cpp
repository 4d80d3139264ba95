#include <gtest/gtest.h>
#include "utils/config.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace curator::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "seedcurator_test_config";
        std::filesystem::create_directories(testDir);
        configPath = testDir / "curator.conf";
        Config::instance().reset();
    }

    void TearDown() override {
        Config::instance().onChange(nullptr);
        Config::instance().reset();
        if (std::filesystem::exists(testDir)) {
            std::filesystem::remove_all(testDir);
        }
    }

    void writeConfig(const std::string& text) {
        std::ofstream file(configPath);
        file << text;
    }

    std::filesystem::path testDir;
    std::filesystem::path configPath;
};

TEST_F(ConfigTest, DefaultsMatchEngineDefaults) {
    CurationConfig cfg = Config::instance().getCurationConfig();
    EXPECT_EQ(cfg.votingPeriod, 86400u);
    EXPECT_EQ(cfg.blessingsPerUnit, 1u);
    EXPECT_EQ(cfg.timeDecayMin, 10u);
    EXPECT_EQ(cfg.roundMode, "persistent");
    EXPECT_EQ(cfg.tieBreak, "lowest_seed_id");
    EXPECT_EQ(cfg.deadlock, "revert");
    EXPECT_FALSE(cfg.scoreResetOnRoundEnd);

    LogConfig log = Config::instance().getLogConfig();
    EXPECT_EQ(log.level, "info");
    EXPECT_TRUE(log.console);
    EXPECT_FALSE(log.sensitive);
    EXPECT_EQ(log.maxFileSize, 10u * 1024 * 1024);
    EXPECT_EQ(log.maxFiles, 5u);
}

TEST_F(ConfigTest, LogSettingsAreRead) {
    writeConfig(
        "log.level = debug\n"
        "log.file = /tmp/curator.log\n"
        "log.sensitive = true\n"
        "log.max_file_size = 4096\n"
        "log.max_files = 2\n");
    ASSERT_TRUE(Config::instance().load(configPath.string()));

    LogConfig log = Config::instance().getLogConfig();
    EXPECT_EQ(log.level, "debug");
    EXPECT_EQ(log.file, "/tmp/curator.log");
    EXPECT_TRUE(log.sensitive);
    EXPECT_EQ(log.maxFileSize, 4096u);
    EXPECT_EQ(log.maxFiles, 2u);
}

TEST_F(ConfigTest, LoadParsesKeyValueFile) {
    writeConfig(
        "# comment line\n"
        "curation.voting_period = 7200\n"
        "curation.deadlock=skip_round\n"
        "curation.score_reset = yes\n"
        "engine.admin = admin\n"
        "engine.creators = alice, bob ,,carol\n"
        "not a setting\n");

    ASSERT_TRUE(Config::instance().load(configPath.string()));
    EXPECT_EQ(Config::instance().getConfigPath(), configPath.string());

    CurationConfig cfg = Config::instance().getCurationConfig();
    EXPECT_EQ(cfg.votingPeriod, 7200u);
    EXPECT_EQ(cfg.deadlock, "skip_round");
    EXPECT_TRUE(cfg.scoreResetOnRoundEnd);

    EngineConfig engine = Config::instance().getEngineConfig();
    EXPECT_EQ(engine.admin, "admin");
    EXPECT_EQ(engine.treasury, "admin");
    ASSERT_EQ(engine.creators.size(), 3u);
    EXPECT_EQ(engine.creators[1], "bob");
    EXPECT_TRUE(engine.relayers.empty());
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load((testDir / "absent.conf").string()));
}

TEST_F(ConfigTest, NumericAccessorsFallBack) {
    Config& cfg = Config::instance();
    cfg.set("engine.genesis_time", "-5");
    EXPECT_EQ(cfg.getUint64("engine.genesis_time", 42), 42u);
    EXPECT_EQ(cfg.getInt64("engine.genesis_time", 0), -5);
    cfg.set("curation.blessing_cost", "abc");
    EXPECT_EQ(cfg.getUint64("curation.blessing_cost", 7), 7u);
    cfg.set("log.console", "maybe");
    EXPECT_TRUE(cfg.getBool("log.console", true));
}

TEST_F(ConfigTest, SetOverloadsAndChangeNotification) {
    Config& cfg = Config::instance();
    std::vector<std::string> changed;
    cfg.onChange([&changed](const std::string& key) { changed.push_back(key); });

    cfg.set("curation.blessing_weight", static_cast<int64_t>(500));
    cfg.set("curation.score_reset", true);
    cfg.set("curation.tie_break", "pseudo_random");
    cfg.setList("engine.relayers", {"r1", "r2"});

    EXPECT_EQ(cfg.getCurationConfig().blessingWeight, 500u);
    EXPECT_TRUE(cfg.getCurationConfig().scoreResetOnRoundEnd);
    EXPECT_EQ(cfg.getString("curation.tie_break"), "pseudo_random");
    EXPECT_EQ(cfg.getList("engine.relayers").size(), 2u);
    EXPECT_EQ(changed.size(), 4u);
}

TEST_F(ConfigTest, SaveRoundTripsThroughLoad) {
    Config& cfg = Config::instance();
    CurationConfig curation;
    curation.votingPeriod = 3600;
    curation.deadlock = "allow_rewins";
    cfg.setCurationConfig(curation);
    ASSERT_TRUE(cfg.save(configPath.string()));

    cfg.reset();
    EXPECT_EQ(cfg.getCurationConfig().votingPeriod, 86400u);
    ASSERT_TRUE(cfg.load(configPath.string()));
    EXPECT_EQ(cfg.getCurationConfig().votingPeriod, 3600u);
    EXPECT_EQ(cfg.getCurationConfig().deadlock, "allow_rewins");
}

TEST_F(ConfigTest, KeysAndJsonDump) {
    Config& cfg = Config::instance();
    auto curationKeys = cfg.keys("curation.");
    EXPECT_EQ(curationKeys.size(), 13u);
    EXPECT_TRUE(std::is_sorted(curationKeys.begin(), curationKeys.end()));

    cfg.remove("log.console");
    EXPECT_FALSE(cfg.has("log.console"));

    auto doc = nlohmann::json::parse(cfg.toJson());
    EXPECT_EQ(doc["curation.deadlock"].get<std::string>(), "revert");
    EXPECT_EQ(doc.size(), cfg.size());
}
