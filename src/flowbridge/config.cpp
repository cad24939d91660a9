// filename: config.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/config.hpp"

#include "json_fields.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace flowbridge {
namespace {

using json = nlohmann::json;
using ConfigError = std::runtime_error;

Millis readMillis(const json& node, const char* key, const std::string& ctx, Millis fallback) {
    return Millis{static_cast<Millis::rep>(
        detail::readCount<ConfigError>(node, key, ctx, static_cast<std::size_t>(fallback.count()), 1))};
}

std::uint16_t readPort(const json& node, const std::string& ctx, std::uint16_t fallback) {
    const std::size_t port = detail::readCount<ConfigError>(node, "port", ctx, fallback, 0);
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        throw ConfigError(ctx + ".port is out of range");
    }
    return static_cast<std::uint16_t>(port);
}

ServiceConfig parseService(const json& node) {
    const std::string ctx = "service";
    detail::requireObject<ConfigError>(node, ctx);
    detail::rejectUnknownKeys<ConfigError>(node,
                                           {"host", "port", "output_directory", "keep_artifacts",
                                            "viewer_command", "max_request_bytes", "shutdown_poll_ms",
                                            "request_read_timeout_ms"},
                                           ctx);
    ServiceConfig cfg{};
    cfg.host = detail::readString<ConfigError>(node, "host", ctx, cfg.host);
    cfg.port = readPort(node, ctx, cfg.port);
    cfg.outputDirectory = detail::readString<ConfigError>(node, "output_directory", ctx, cfg.outputDirectory);
    if (cfg.outputDirectory.empty()) {
        throw ConfigError(ctx + ".output_directory must not be empty");
    }
    cfg.keepArtifacts = detail::readCount<ConfigError>(node, "keep_artifacts", ctx, cfg.keepArtifacts, 0);
    cfg.viewerCommand = detail::readString<ConfigError>(node, "viewer_command", ctx, cfg.viewerCommand);
    cfg.maxRequestBytes =
        detail::readCount<ConfigError>(node, "max_request_bytes", ctx, cfg.maxRequestBytes, 1024);
    cfg.shutdownPoll = readMillis(node, "shutdown_poll_ms", ctx, cfg.shutdownPoll);
    cfg.requestReadTimeout = readMillis(node, "request_read_timeout_ms", ctx, cfg.requestReadTimeout);
    return cfg;
}

PollIntervals parseIntervals(const json& node) {
    const std::string ctx = "controller.intervals";
    detail::requireObject<ConfigError>(node, ctx);
    detail::rejectUnknownKeys<ConfigError>(node,
                                           {"shutdown_poll_ms", "readiness_poll_ms", "frame_poll_ms",
                                            "artifact_poll_ms", "stop_grace_ms", "startup_timeout_ms",
                                            "ack_timeout_ms", "freshness_window_ms"},
                                           ctx);
    PollIntervals intervals{};
    intervals.shutdownPoll = readMillis(node, "shutdown_poll_ms", ctx, intervals.shutdownPoll);
    intervals.readinessPoll = readMillis(node, "readiness_poll_ms", ctx, intervals.readinessPoll);
    intervals.framePoll = readMillis(node, "frame_poll_ms", ctx, intervals.framePoll);
    intervals.artifactPoll = readMillis(node, "artifact_poll_ms", ctx, intervals.artifactPoll);
    intervals.stopGrace = readMillis(node, "stop_grace_ms", ctx, intervals.stopGrace);
    intervals.startupTimeout = readMillis(node, "startup_timeout_ms", ctx, intervals.startupTimeout);
    intervals.ackTimeout = readMillis(node, "ack_timeout_ms", ctx, intervals.ackTimeout);
    intervals.freshnessWindow = readMillis(node, "freshness_window_ms", ctx, intervals.freshnessWindow);
    return intervals;
}

ControllerConfig parseController(const json& node) {
    const std::string ctx = "controller";
    detail::requireObject<ConfigError>(node, ctx);
    detail::rejectUnknownKeys<ConfigError>(
        node, {"executable", "script", "extra_args", "host", "port", "intervals"}, ctx);
    ControllerConfig cfg{};
    cfg.executable = detail::readString<ConfigError>(node, "executable", ctx, cfg.executable);
    cfg.script = detail::readString<ConfigError>(node, "script", ctx, cfg.script);
    if (node.contains("extra_args")) {
        const auto& args = node.at("extra_args");
        if (!args.is_array()) {
            throw ConfigError(ctx + ".extra_args must be an array of strings");
        }
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                throw ConfigError(ctx + ".extra_args must be an array of strings");
            }
            cfg.extraArgs.push_back(arg.get<std::string>());
        }
    }
    cfg.host = detail::readString<ConfigError>(node, "host", ctx, cfg.host);
    cfg.port = readPort(node, ctx, cfg.port);
    if (node.contains("intervals")) {
        cfg.intervals = parseIntervals(node.at("intervals"));
    }
    return cfg;
}

}  // namespace

BridgeConfig parseBridgeConfig(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& ex) {
        throw ConfigError(std::string("Config is not valid JSON: ") + ex.what());
    }
    detail::requireObject<ConfigError>(document, "config");
    detail::rejectUnknownKeys<ConfigError>(document, {"service", "controller"}, "config");

    BridgeConfig config{};
    if (document.contains("service")) {
        config.service = parseService(document.at("service"));
    }
    if (document.contains("controller")) {
        config.controller = parseController(document.at("controller"));
    }
    return config;
}

BridgeConfig loadBridgeConfigFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("Failed to open config file: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parseBridgeConfig(buffer.str());
}

}  // namespace flowbridge
