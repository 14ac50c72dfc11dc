#pragma once

#include "core/types/ProbeSettings.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace netprobe::infra {

/**
 * @brief Application configuration settings.
 *
 * Holds the probe targets and timeouts, the loop cadence, the bandwidth
 * endpoint, and logging and I/O pool options.
 */
struct AppConfig {
    // Monitor loop
    double intervalSeconds{2.0};          ///< Pause between cycles in seconds.
    std::optional<int> durationSeconds;   ///< Total run time, unbounded when empty.
    bool singleShot{false};               ///< Run one cycle and exit.

    // Probes
    core::ProbeSettings probes;           ///< Targets and per-probe timeouts.
    core::BandwidthSettings bandwidth;    ///< Bulk transfer endpoint.

    // Logging
    std::string logLevel{"info"};         ///< spdlog level name.
    std::string logFile;                  ///< Rotating log file, empty for console only.

    // I/O
    int workerThreads{4};                 ///< Asio worker threads.

    /**
     * @brief Interval as a duration.
     */
    [[nodiscard]] std::chrono::milliseconds interval() const;

    /**
     * @brief Duration bound as a duration, if any.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> maxDuration() const;

    /**
     * @brief Checks the configuration for values the monitor cannot run with.
     * @return One message per problem; empty when the configuration is usable.
     */
    [[nodiscard]] std::vector<std::string> validate() const;
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration as a JSON file. Keys that
 * are missing from the file keep their default values.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Loads configuration from disk.
     *
     * Writes a file with default values when none exists yet.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk, creating parent directories.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    static nlohmann::json toJson(const AppConfig& config);
    static void fromJson(const nlohmann::json& j, AppConfig& config);

private:
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netprobe::infra
