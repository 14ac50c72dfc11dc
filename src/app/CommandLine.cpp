#include "app/CommandLine.hpp"

#include <cmath>
#include <sstream>

namespace netprobe::app {

namespace {

bool isOption(const std::string& arg) {
    return arg.size() > 2 && arg.compare(0, 2, "--") == 0;
}

std::optional<double> parseSeconds(const std::string& value) {
    try {
        std::size_t consumed = 0;
        double seconds = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(seconds)) {
            return std::nullopt;
        }
        return seconds;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int> parseInteger(const std::string& value) {
    try {
        std::size_t consumed = 0;
        int number = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return number;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

void CommandLineOptions::applyTo(infra::AppConfig& config) const {
    if (!targets.empty()) {
        config.probes.targets = targets;
    }
    if (intervalSeconds) {
        config.intervalSeconds = *intervalSeconds;
    }
    if (durationSeconds) {
        config.durationSeconds = *durationSeconds;
    }
    if (logFile) {
        config.logFile = *logFile;
    }
    if (verbose) {
        config.logLevel = "debug";
    }
    if (singleShot) {
        config.singleShot = true;
    }
}

std::optional<CommandLineOptions> CommandLine::parse(const std::vector<std::string>& args,
                                                     std::string& error) {
    CommandLineOptions options;

    auto requireValue = [&args, &error](std::size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size() || isOption(args[i + 1])) {
            error = "missing value for " + args[i];
            return std::nullopt;
        }
        return args[++i];
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "--targets") {
            while (i + 1 < args.size() && !isOption(args[i + 1])) {
                options.targets.push_back(args[++i]);
            }
            if (options.targets.empty()) {
                error = "--targets requires at least one host";
                return std::nullopt;
            }
        } else if (arg == "--interval") {
            auto value = requireValue(i);
            if (!value) {
                return std::nullopt;
            }
            options.intervalSeconds = parseSeconds(*value);
            if (!options.intervalSeconds || *options.intervalSeconds <= 0.0) {
                error = "invalid interval '" + *value + "'";
                return std::nullopt;
            }
        } else if (arg == "--duration") {
            auto value = requireValue(i);
            if (!value) {
                return std::nullopt;
            }
            options.durationSeconds = parseInteger(*value);
            if (!options.durationSeconds || *options.durationSeconds <= 0) {
                error = "invalid duration '" + *value + "'";
                return std::nullopt;
            }
        } else if (arg == "--output") {
            options.outputPath = requireValue(i);
            if (!options.outputPath) {
                return std::nullopt;
            }
        } else if (arg == "--config") {
            options.configPath = requireValue(i);
            if (!options.configPath) {
                return std::nullopt;
            }
        } else if (arg == "--log-file") {
            options.logFile = requireValue(i);
            if (!options.logFile) {
                return std::nullopt;
            }
        } else if (arg == "--single") {
            options.singleShot = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else {
            error = "unknown argument '" + arg + "'";
            return std::nullopt;
        }
    }

    return options;
}

std::optional<CommandLineOptions> CommandLine::parse(int argc, char** argv, std::string& error) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args, error);
}

std::string CommandLine::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Network performance monitor for remote desktop sessions.\n"
        << "\n"
        << "Options:\n"
        << "  --targets <host>...   Target hosts to ping\n"
        << "  --interval <seconds>  Test interval in seconds (default 2)\n"
        << "  --duration <seconds>  Total test duration in seconds\n"
        << "  --output <file>       Write results as JSON to file\n"
        << "  --single              Run a single test instead of continuous monitoring\n"
        << "  --config <file>       Load configuration from JSON file\n"
        << "  --log-file <file>     Also write debug logs to file\n"
        << "  -v, --verbose         Enable debug logging\n"
        << "  -h, --help            Show this help\n";
    return oss.str();
}

} // namespace netprobe::app
