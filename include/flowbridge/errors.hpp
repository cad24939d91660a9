// filename: errors.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace flowbridge {

// Malformed or unrecognised request payload. Maps to HTTP 400.
class RequestSchemaError : public std::runtime_error {
public:
    explicit RequestSchemaError(const std::string& message) : std::runtime_error(message) {}
};

// The solver process cannot be started or did not become ready.
class LifecycleError : public std::runtime_error {
public:
    explicit LifecycleError(const std::string& message) : std::runtime_error(message) {}
};

// A staged artifact could not be moved to its final path. The staging file is kept.
class HandoffError : public std::runtime_error {
public:
    HandoffError(const std::string& message, std::string stagingPath)
        : std::runtime_error(message), stagingPath_(std::move(stagingPath)) {}

    const std::string& stagingPath() const { return stagingPath_; }

private:
    std::string stagingPath_;
};

// Transport or protocol failure. `status` is the HTTP code a server should
// answer with, or 0 when the failure is on the client side.
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

}  // namespace flowbridge
