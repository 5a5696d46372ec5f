#pragma once

#include "common/types.h"
#include <string>
#include <nlohmann/json.hpp>

namespace solcino {
namespace common {

/**
 * @brief Deployment settings for the raffle program and its host runtime
 *
 * Identifies the program and the external randomness service it trusts, and
 * carries the logging and compute budget knobs of the runtime.
 */
struct ProgramSettings {
    PublicKey program_id;                 ///< Address the raffle program is deployed at
    PublicKey randomness_program_id;      ///< Owner expected on every VRF account
    std::string log_level = "INFO";       ///< TRACE/DEBUG/INFO/WARN/ERROR/CRITICAL
    bool json_logs = false;               ///< Emit structured JSON log lines
    uint64_t compute_budget = 200000;     ///< Max compute units per transaction
};

/**
 * @brief Settings loader and validator
 */
class SettingsManager {
public:
    /**
     * @brief Default settings with fixed development program ids
     */
    static ProgramSettings create_default();

    /**
     * @brief Load settings from a JSON file
     * @param path path to the settings file
     * @return loaded settings, or an error message
     */
    static Result<ProgramSettings> load_from_file(const std::string& path);

    /**
     * @brief Load settings from a JSON object; missing keys keep their defaults
     */
    static Result<ProgramSettings> load_from_json(const nlohmann::json& json);

    static nlohmann::json to_json(const ProgramSettings& settings);

    /**
     * @brief Validate settings
     * @return validation error message, or empty string if valid
     */
    static std::string validate(const ProgramSettings& settings);

    /**
     * @brief Push log level and format into the global Logger
     */
    static void apply_logging(const ProgramSettings& settings);
};

} // namespace common
} // namespace solcino
