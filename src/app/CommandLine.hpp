#pragma once

#include "infrastructure/config/ConfigManager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netprobe::app {

/**
 * @brief Options given on the command line.
 *
 * Options that were not given stay empty and leave the configuration as
 * loaded.
 */
struct CommandLineOptions {
    std::vector<std::string> targets;      ///< --targets h1 h2 ...
    std::optional<double> intervalSeconds; ///< --interval <seconds>
    std::optional<int> durationSeconds;    ///< --duration <seconds>
    std::optional<std::string> outputPath; ///< --output <file>
    std::optional<std::string> configPath; ///< --config <file>
    std::optional<std::string> logFile;    ///< --log-file <file>
    bool singleShot{false};                ///< --single
    bool verbose{false};                   ///< --verbose
    bool help{false};                      ///< --help

    /**
     * @brief Overrides configuration values with the options that were given.
     */
    void applyTo(infra::AppConfig& config) const;
};

/**
 * @brief Parses command line arguments.
 */
class CommandLine {
public:
    /**
     * @brief Parses arguments (without the program name).
     * @param args Arguments in order.
     * @param error Receives a description of the first problem found.
     * @return Parsed options, or std::nullopt on error.
     */
    static std::optional<CommandLineOptions> parse(const std::vector<std::string>& args,
                                                   std::string& error);

    /**
     * @brief Parses argc/argv as passed to main().
     */
    static std::optional<CommandLineOptions> parse(int argc, char** argv, std::string& error);

    /**
     * @brief Usage text for --help and parse errors.
     */
    static std::string usage(const std::string& program);
};

} // namespace netprobe::app
