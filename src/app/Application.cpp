#include "app/Application.hpp"

#include "infrastructure/export/ResultExporter.hpp"
#include "infrastructure/network/HttpTransferProvider.hpp"
#include "infrastructure/network/NameResolutionProbe.hpp"
#include "infrastructure/network/SystemPingProbe.hpp"
#include "infrastructure/network/TcpConnectProbe.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <stdexcept>

namespace netprobe::app {

namespace {

std::string joinMessages(const std::vector<std::string>& messages) {
    std::string joined;
    for (const auto& message : messages) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += message;
    }
    return joined;
}

} // namespace

Application::Application(CommandLineOptions options)
    : options_(std::move(options)), printer_(std::cout) {
    loadConfiguration();
    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");

    if (loop_) {
        loop_->stop();
    }

    if (asioContext_) {
        asioContext_->stop();
    }
}

void Application::loadConfiguration() {
    if (options_.configPath) {
        infra::ConfigManager manager(*options_.configPath);
        if (!manager.load()) {
            spdlog::warn("Continuing with default configuration");
        }
        config_ = manager.config();
    }

    options_.applyTo(config_);

    auto errors = config_.validate();
    if (!errors.empty()) {
        throw std::invalid_argument("Invalid configuration: " + joinMessages(errors));
    }
}

void Application::initializeLogging() {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(config_.logLevel));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!config_.logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config_.logFile, 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("netprobe", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    if (!config_.logFile.empty()) {
        spdlog::info("Log file: {}", config_.logFile);
    }
}

void Application::initializeComponents() {
    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(static_cast<size_t>(config_.workerThreads));
    asioContext_->start();

    // Probes
    monitoring::ProbeSet probes;
    probes.reachability = std::make_shared<infra::SystemPingProbe>(*asioContext_);
    probes.tcpConnect = std::make_shared<infra::TcpConnectProbe>(*asioContext_);
    probes.transfer = infra::makeTransferProvider(*asioContext_, config_.bandwidth);
    probes.nameResolver = std::make_shared<infra::NameResolutionProbe>(*asioContext_);

    orchestrator_ = std::make_unique<monitoring::CycleOrchestrator>(
        config_.probes, config_.bandwidth, std::move(probes));
    loop_ = std::make_unique<monitoring::MonitorLoop>(*orchestrator_, stats_, history_);

    spdlog::debug("Application components initialized");
}

int Application::run() {
    int status = config_.singleShot ? runSingle() : runContinuous();
    exportResults();
    return status;
}

int Application::runSingle() {
    std::cout << "Running single network test..." << std::endl;

    const auto& report = loop_->runOnce();
    printer_.printCycle(report);
    printer_.printReadiness(analyzer_.assess(stats_));
    return 0;
}

int Application::runContinuous() {
    std::cout << "Starting Network Performance Monitor\n"
              << "Testing every " << config_.intervalSeconds << " seconds\n"
              << "Press Ctrl+C to stop\n"
              << std::endl;

    asioContext_->watchSignals({SIGINT, SIGTERM}, [this](int signalNumber) {
        spdlog::info("Monitoring stopped by signal {}", signalNumber);
        loop_->stop();
    });

    loop_->setCycleCallback([this](const core::CycleReport& report, const core::CumulativeStats&) {
        printer_.printCycle(report);
    });
    loop_->setFinishCallback([this](const core::CumulativeStats& stats) {
        printer_.printSummary(stats);
        printer_.printReadiness(analyzer_.assess(stats));
    });

    loop_->run(config_.interval(), config_.maxDuration());
    return 0;
}

void Application::exportResults() {
    if (!options_.outputPath) {
        return;
    }
    if (!infra::ResultExporter::writeToFile(*options_.outputPath, history_.records(), stats_)) {
        spdlog::error("Results could not be written to {}", *options_.outputPath);
    }
}

} // namespace netprobe::app
