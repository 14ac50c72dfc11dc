#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <fstream>

namespace netprobe::infra {

std::chrono::milliseconds AppConfig::interval() const {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(intervalSeconds * 1000.0)));
}

std::optional<std::chrono::milliseconds> AppConfig::maxDuration() const {
    if (!durationSeconds) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(*durationSeconds) * 1000);
}

std::vector<std::string> AppConfig::validate() const {
    std::vector<std::string> errors;

    if (!(intervalSeconds > 0.0)) {
        errors.emplace_back("interval must be greater than zero");
    }
    if (durationSeconds && *durationSeconds <= 0) {
        errors.emplace_back("duration must be greater than zero");
    }
    if (probes.targets.empty()) {
        errors.emplace_back("at least one target is required");
    }
    for (const auto& target : probes.targets) {
        if (target.empty()) {
            errors.emplace_back("targets must not be empty strings");
            break;
        }
    }
    for (const auto& target : probes.targets) {
        // Would reach the ping utility as an option.
        if (!target.empty() && target.front() == '-') {
            errors.emplace_back("invalid target '" + target + "'");
        }
    }
    for (const auto& target : probes.tcpTargets) {
        if (target.host.empty() || target.port == 0) {
            errors.emplace_back("invalid tcp target '" + target.label() + "'");
        }
    }
    if (probes.pingTimeout.count() <= 0 || probes.tcpTimeout.count() <= 0 ||
        probes.dnsTimeout.count() <= 0) {
        errors.emplace_back("probe timeouts must be greater than zero");
    }
    if (bandwidth.enabled && bandwidth.sizeKb <= 0) {
        errors.emplace_back("bandwidth size must be greater than zero");
    }
    static const std::vector<std::string> levels{"trace", "debug", "info", "warn",
                                                 "warning", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), logLevel) == levels.end()) {
        errors.emplace_back("unknown log level '" + logLevel + "'");
    }
    if (workerThreads <= 0) {
        errors.emplace_back("worker thread count must be greater than zero");
    }

    return errors;
}

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        // Applied only once every key has parsed.
        AppConfig parsed = config_;
        fromJson(j, parsed);
        config_ = std::move(parsed);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        if (configPath_.has_parent_path()) {
            std::filesystem::create_directories(configPath_.parent_path());
        }

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << toJson(config_).dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson(const AppConfig& config) {
    nlohmann::json j;

    // Monitor
    j["monitor"]["targets"] = config.probes.targets;
    j["monitor"]["interval_seconds"] = config.intervalSeconds;
    if (config.durationSeconds) {
        j["monitor"]["duration_seconds"] = *config.durationSeconds;
    }
    j["monitor"]["single_shot"] = config.singleShot;

    // Probes
    j["probes"]["ping_timeout_ms"] = config.probes.pingTimeout.count();
    j["probes"]["tcp_timeout_ms"] = config.probes.tcpTimeout.count();
    j["probes"]["dns_timeout_ms"] = config.probes.dnsTimeout.count();
    j["probes"]["dns_target_count"] = config.probes.dnsTargetCount;
    j["probes"]["tcp_targets"] = nlohmann::json::array();
    for (const auto& target : config.probes.tcpTargets) {
        j["probes"]["tcp_targets"].push_back({{"host", target.host}, {"port", target.port}});
    }

    // Bandwidth
    j["bandwidth"]["enabled"] = config.bandwidth.enabled;
    j["bandwidth"]["scheme"] = config.bandwidth.scheme;
    j["bandwidth"]["host"] = config.bandwidth.host;
    j["bandwidth"]["port"] = config.bandwidth.port;
    j["bandwidth"]["size_kb"] = config.bandwidth.sizeKb;
    j["bandwidth"]["timeout_ms"] = config.bandwidth.timeout.count();

    // Logging
    j["logging"]["level"] = config.logLevel;
    j["logging"]["file"] = config.logFile;

    // I/O
    j["io"]["worker_threads"] = config.workerThreads;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j, AppConfig& config) {
    const AppConfig defaults;

    // Monitor
    if (j.contains("monitor")) {
        const auto& m = j["monitor"];
        if (m.contains("targets")) {
            config.probes.targets = m["targets"].get<std::vector<std::string>>();
        }
        config.intervalSeconds = m.value("interval_seconds", defaults.intervalSeconds);
        if (m.contains("duration_seconds") && !m["duration_seconds"].is_null()) {
            config.durationSeconds = m["duration_seconds"].get<int>();
        }
        config.singleShot = m.value("single_shot", defaults.singleShot);
    }

    // Probes
    if (j.contains("probes")) {
        const auto& p = j["probes"];
        config.probes.pingTimeout = std::chrono::milliseconds(
            p.value("ping_timeout_ms", defaults.probes.pingTimeout.count()));
        config.probes.tcpTimeout = std::chrono::milliseconds(
            p.value("tcp_timeout_ms", defaults.probes.tcpTimeout.count()));
        config.probes.dnsTimeout = std::chrono::milliseconds(
            p.value("dns_timeout_ms", defaults.probes.dnsTimeout.count()));
        config.probes.dnsTargetCount = p.value("dns_target_count", defaults.probes.dnsTargetCount);

        if (p.contains("tcp_targets")) {
            config.probes.tcpTargets.clear();
            for (const auto& entry : p["tcp_targets"]) {
                core::TcpTarget target;
                target.host = entry.value("host", "");
                target.port = entry.value("port", static_cast<uint16_t>(0));
                config.probes.tcpTargets.push_back(std::move(target));
            }
        }
    }

    // Bandwidth
    if (j.contains("bandwidth")) {
        const auto& b = j["bandwidth"];
        config.bandwidth.enabled = b.value("enabled", defaults.bandwidth.enabled);
        config.bandwidth.scheme = b.value("scheme", defaults.bandwidth.scheme);
        config.bandwidth.host = b.value("host", defaults.bandwidth.host);
        config.bandwidth.port = b.value("port", defaults.bandwidth.port);
        config.bandwidth.sizeKb = b.value("size_kb", defaults.bandwidth.sizeKb);
        config.bandwidth.timeout = std::chrono::milliseconds(
            b.value("timeout_ms", defaults.bandwidth.timeout.count()));
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logLevel = l.value("level", defaults.logLevel);
        config.logFile = l.value("file", defaults.logFile);
    }

    // I/O
    if (j.contains("io")) {
        config.workerThreads = j["io"].value("worker_threads", defaults.workerThreads);
    }
}

} // namespace netprobe::infra
