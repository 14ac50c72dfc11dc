#pragma once

#include "app/CommandLine.hpp"
#include "app/ReportPrinter.hpp"
#include "core/types/CumulativeStats.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "monitoring/CycleOrchestrator.hpp"
#include "monitoring/MonitorLoop.hpp"
#include "monitoring/ReadinessAnalyzer.hpp"
#include "monitoring/ResultHistory.hpp"

#include <memory>

namespace netprobe::app {

class Application {
public:
    explicit Application(CommandLineOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int run();

    const infra::AppConfig& config() const { return config_; }
    const core::CumulativeStats& stats() const { return stats_; }
    const monitoring::ResultHistory& history() const { return history_; }

private:
    void loadConfiguration();
    void initializeLogging();
    void initializeComponents();

    int runSingle();
    int runContinuous();
    void exportResults();

    CommandLineOptions options_;
    infra::AppConfig config_;

    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<monitoring::CycleOrchestrator> orchestrator_;
    std::unique_ptr<monitoring::MonitorLoop> loop_;

    core::CumulativeStats stats_;
    monitoring::ResultHistory history_;
    monitoring::ReadinessAnalyzer analyzer_;
    ReportPrinter printer_;
};

} // namespace netprobe::app
