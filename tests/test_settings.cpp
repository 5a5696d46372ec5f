/**
 * Unit tests for JSON settings and logger configuration
 */

#include "common/settings.h"
#include "common/logging.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace solcino::common;
using json = nlohmann::json;

class SettingsTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::instance().set_output(nullptr);
        Logger::instance().set_level(LogLevel::INFO);
        Logger::instance().set_json_format(false);
        if (!temp_path_.empty()) {
            std::remove(temp_path_.c_str());
        }
    }

    std::string write_temp(const std::string& contents) {
        temp_path_ = ::testing::TempDir() + "solcino_settings_test.json";
        std::ofstream out(temp_path_);
        out << contents;
        return temp_path_;
    }

    std::string temp_path_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(SettingsTest, DefaultsAreValid) {
    auto settings = SettingsManager::create_default();
    EXPECT_EQ(SettingsManager::validate(settings), "");
    EXPECT_EQ(settings.program_id, PublicKey(32, 0x5C));
    EXPECT_EQ(settings.randomness_program_id, PublicKey(32, 0x5B));
    EXPECT_EQ(settings.compute_budget, 200000u);
}

TEST_F(SettingsTest, LoadFromJson) {
    json j = {
        {"program_id", std::string(64, 'a')},
        {"randomness_program_id", "0x" + std::string(64, 'b')},
        {"log_level", "DEBUG"},
        {"json_logs", true},
        {"compute_budget", 400000}
    };
    auto loaded = SettingsManager::load_from_json(j);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    EXPECT_EQ(loaded.value().program_id, PublicKey(32, 0xAA));
    EXPECT_EQ(loaded.value().randomness_program_id, PublicKey(32, 0xBB));
    EXPECT_EQ(loaded.value().log_level, "DEBUG");
    EXPECT_TRUE(loaded.value().json_logs);
    EXPECT_EQ(loaded.value().compute_budget, 400000u);
}

TEST_F(SettingsTest, MissingKeysKeepDefaults) {
    auto loaded = SettingsManager::load_from_json(json{{"log_level", "WARN"}});
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().program_id, PublicKey(32, 0x5C));
    EXPECT_EQ(loaded.value().log_level, "WARN");
}

TEST_F(SettingsTest, RejectsBadHex) {
    auto loaded = SettingsManager::load_from_json(json{{"program_id", "xyz"}});
    EXPECT_FALSE(loaded.is_ok());
}

TEST_F(SettingsTest, RejectsShortKey) {
    auto loaded = SettingsManager::load_from_json(json{{"program_id", "abcd"}});
    ASSERT_FALSE(loaded.is_ok());
    EXPECT_NE(loaded.error().find("32 bytes"), std::string::npos);
}

TEST_F(SettingsTest, RejectsWrongType) {
    auto loaded = SettingsManager::load_from_json(json{{"compute_budget", "lots"}});
    EXPECT_FALSE(loaded.is_ok());
}

TEST_F(SettingsTest, RejectsSameProgramIds) {
    const std::string id(64, 'c');
    auto loaded = SettingsManager::load_from_json(
        json{{"program_id", id}, {"randomness_program_id", id}});
    EXPECT_FALSE(loaded.is_ok());
}

TEST_F(SettingsTest, RejectsUnknownLogLevel) {
    auto settings = SettingsManager::create_default();
    settings.log_level = "verbose";
    EXPECT_NE(SettingsManager::validate(settings), "");
}

TEST_F(SettingsTest, JsonRoundTrip) {
    auto settings = SettingsManager::create_default();
    settings.compute_budget = 123;
    auto loaded = SettingsManager::load_from_json(SettingsManager::to_json(settings));
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().program_id, settings.program_id);
    EXPECT_EQ(loaded.value().compute_budget, 123u);
}

TEST_F(SettingsTest, LoadFromFile) {
    auto path = write_temp(R"({"log_level": "ERROR", "compute_budget": 5000})");
    auto loaded = SettingsManager::load_from_file(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    EXPECT_EQ(loaded.value().log_level, "ERROR");
    EXPECT_EQ(loaded.value().compute_budget, 5000u);
}

TEST_F(SettingsTest, LoadFromFileParseError) {
    auto path = write_temp("{ not json");
    auto loaded = SettingsManager::load_from_file(path);
    EXPECT_FALSE(loaded.is_ok());
}

TEST_F(SettingsTest, LoadFromMissingFile) {
    auto loaded = SettingsManager::load_from_file("/nonexistent/solcino/settings.json");
    ASSERT_FALSE(loaded.is_ok());
    EXPECT_NE(loaded.error().find("Cannot open"), std::string::npos);
}

// ============================================================================
// Logging
// ============================================================================

TEST_F(SettingsTest, ApplyLoggingSetsLevel) {
    auto settings = SettingsManager::create_default();
    settings.log_level = "WARN";
    SettingsManager::apply_logging(settings);
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::WARN);

    std::ostringstream captured;
    Logger::instance().set_output(&captured);
    LOG_INFO("raffle", "suppressed");
    LOG_WARN("raffle", "emitted ", 42);
    EXPECT_EQ(captured.str().find("suppressed"), std::string::npos);
    EXPECT_NE(captured.str().find("emitted 42"), std::string::npos);
}

TEST_F(SettingsTest, JsonLogLines) {
    auto settings = SettingsManager::create_default();
    settings.json_logs = true;
    SettingsManager::apply_logging(settings);

    std::ostringstream captured;
    Logger::instance().set_output(&captured);
    LOG_RAFFLE_REJECT("Raffle has ended", "RaffleEnded", {{"program", "5c5c5c5c..."}});

    auto line = json::parse(captured.str());
    EXPECT_EQ(line.value("module", ""), "raffle");
    EXPECT_EQ(line.value("message", ""), "Raffle has ended");
}

TEST_F(SettingsTest, LevelNames) {
    EXPECT_EQ(Logger::level_from_string("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(Logger::level_from_string("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_FALSE(Logger::level_from_string("info").has_value());
    EXPECT_EQ(Logger::level_to_string(LogLevel::ERROR), "ERROR");
}
