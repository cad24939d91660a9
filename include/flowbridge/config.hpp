// filename: config.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "flowbridge/timer.hpp"

namespace flowbridge {

/**
 * @brief Every wait and poll period used by the controller and the service.
 */
struct PollIntervals {
    Millis shutdownPoll{100};
    Millis readinessPoll{200};
    Millis framePoll{250};
    Millis artifactPoll{250};
    Millis stopGrace{1000};
    Millis startupTimeout{30000};
    Millis ackTimeout{300000};
    Millis freshnessWindow{3000};
};

struct ServiceConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};
    std::string outputDirectory{"flowbridge_output"};
    // Default-location results kept after each run; 0 disables pruning.
    std::size_t keepArtifacts{10};
    // Launched with the result path when a request names no result_path. Empty disables.
    std::string viewerCommand;
    std::size_t maxRequestBytes{64U * 1024U * 1024U};
    Millis shutdownPoll{100};
    Millis requestReadTimeout{10000};
};

struct ControllerConfig {
    std::string executable;
    std::string script;
    std::vector<std::string> extraArgs;
    std::string host{"127.0.0.1"};
    std::uint16_t port{8080};
    PollIntervals intervals;
};

struct BridgeConfig {
    ServiceConfig service;
    ControllerConfig controller;
};

// Reads {"service": {...}, "controller": {..., "intervals": {...}}}. Missing
// keys keep their defaults; unknown keys throw std::runtime_error.
BridgeConfig loadBridgeConfigFromJson(const std::string& path);

BridgeConfig parseBridgeConfig(const std::string& text);

}  // namespace flowbridge
