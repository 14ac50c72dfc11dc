#include "app/Application.hpp"
#include "app/CommandLine.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    std::string error;
    auto options = netprobe::app::CommandLine::parse(argc, argv, error);
    if (!options) {
        std::cerr << "netprobe: " << error << "\n\n"
                  << netprobe::app::CommandLine::usage(argv[0]);
        return 2;
    }

    if (options->help) {
        std::cout << netprobe::app::CommandLine::usage(argv[0]);
        return 0;
    }

    try {
        netprobe::app::Application app(std::move(*options));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
