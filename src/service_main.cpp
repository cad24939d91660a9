// filename: service_main.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/config.hpp"
#include "flowbridge/log.hpp"
#include "flowbridge/service.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace {

struct ServiceOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> outputDirectory;
    std::optional<std::size_t> keep;
    std::optional<std::string> viewer;
    bool quiet{false};
};

void printUsage() {
    std::cout << "flowbridge_service options:\n"
              << "  --config <path>        JSON config; its \"service\" section is used\n"
              << "  --host <addr>          Listen address (default 127.0.0.1)\n"
              << "  --port <int>           Listen port (default 8080, 0 picks a free port)\n"
              << "  --output-dir <path>    Directory for default results and live frames\n"
              << "  --keep <int>           Default results kept after each run (0 keeps all)\n"
              << "  --viewer <command>     Opens default results, e.g. \"paraview\"\n"
              << "  --quiet                Only print warnings and errors\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, ServiceOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--config" && i + 1 < argc) {
                opts.configPath = argv[++i];
            } else if (arg == "--host" && i + 1 < argc) {
                opts.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                const unsigned long port = std::stoul(argv[++i]);
                if (port > 65535UL) {
                    throw std::out_of_range("port must be at most 65535");
                }
                opts.port = static_cast<std::uint16_t>(port);
            } else if (arg == "--output-dir" && i + 1 < argc) {
                opts.outputDirectory = argv[++i];
            } else if (arg == "--keep" && i + 1 < argc) {
                opts.keep = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--viewer" && i + 1 < argc) {
                opts.viewer = argv[++i];
            } else if (arg == "--quiet") {
                opts.quiet = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    ServiceOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        return 1;
    }
    flowbridge::setQuiet(opts.quiet);

    try {
        flowbridge::ServiceConfig config{};
        if (opts.configPath) {
            config = flowbridge::loadBridgeConfigFromJson(*opts.configPath).service;
        }
        if (opts.host) {
            config.host = *opts.host;
        }
        if (opts.port) {
            config.port = *opts.port;
        }
        if (opts.outputDirectory) {
            config.outputDirectory = *opts.outputDirectory;
        }
        if (opts.keep) {
            config.keepArtifacts = *opts.keep;
        }
        if (opts.viewer) {
            config.viewerCommand = *opts.viewer;
        }

        flowbridge::SimulationService service(config);
        flowbridge::ServiceContext context;
        service.run(context);
    } catch (const std::exception& ex) {
        std::cerr << "flowbridge_service: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
