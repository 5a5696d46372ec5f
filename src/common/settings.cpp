#include "common/settings.h"
#include "common/logging.h"
#include <fstream>

using json = nlohmann::json;

namespace solcino {
namespace common {

ProgramSettings SettingsManager::create_default() {
    ProgramSettings settings;

    // Development ids; deployments override both from their settings file
    settings.program_id = PublicKey(PUBKEY_BYTES, 0x5C);
    settings.randomness_program_id = PublicKey(PUBKEY_BYTES, 0x5B);

    settings.log_level = "INFO";
    settings.json_logs = false;
    settings.compute_budget = 200000;

    return settings;
}

std::string SettingsManager::validate(const ProgramSettings& settings) {
    if (settings.program_id.size() != PUBKEY_BYTES) {
        return "program_id must be 32 bytes";
    }

    if (settings.randomness_program_id.size() != PUBKEY_BYTES) {
        return "randomness_program_id must be 32 bytes";
    }

    if (settings.program_id == settings.randomness_program_id) {
        return "program_id and randomness_program_id must differ";
    }

    if (!Logger::level_from_string(settings.log_level)) {
        return "Invalid log level: " + settings.log_level;
    }

    if (settings.compute_budget == 0) {
        return "compute_budget must be greater than zero";
    }

    return ""; // Valid
}

Result<ProgramSettings> SettingsManager::load_from_json(const json& j) {
    ProgramSettings settings = create_default();

    try {
        if (j.contains("program_id")) {
            auto key = from_hex(j.at("program_id").get<std::string>());
            if (!key.is_ok()) {
                return Result<ProgramSettings>("program_id: " + key.error());
            }
            settings.program_id = key.value();
        }

        if (j.contains("randomness_program_id")) {
            auto key = from_hex(j.at("randomness_program_id").get<std::string>());
            if (!key.is_ok()) {
                return Result<ProgramSettings>("randomness_program_id: " + key.error());
            }
            settings.randomness_program_id = key.value();
        }

        settings.log_level = j.value("log_level", settings.log_level);
        settings.json_logs = j.value("json_logs", settings.json_logs);
        settings.compute_budget = j.value("compute_budget", settings.compute_budget);
    } catch (const json::exception& e) {
        return Result<ProgramSettings>(std::string("Invalid settings: ") + e.what());
    }

    std::string error = validate(settings);
    if (!error.empty()) {
        return Result<ProgramSettings>(error);
    }

    return Result<ProgramSettings>(settings);
}

Result<ProgramSettings> SettingsManager::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<ProgramSettings>("Cannot open settings file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        return Result<ProgramSettings>(std::string("Failed to parse ") + path + ": " + e.what());
    }

    return load_from_json(j);
}

json SettingsManager::to_json(const ProgramSettings& settings) {
    json j;
    j["program_id"] = to_hex(settings.program_id);
    j["randomness_program_id"] = to_hex(settings.randomness_program_id);
    j["log_level"] = settings.log_level;
    j["json_logs"] = settings.json_logs;
    j["compute_budget"] = settings.compute_budget;
    return j;
}

void SettingsManager::apply_logging(const ProgramSettings& settings) {
    auto level = Logger::level_from_string(settings.log_level);
    Logger::instance().set_level(level.value_or(LogLevel::INFO));
    Logger::instance().set_json_format(settings.json_logs);
}

} // namespace common
} // namespace solcino
