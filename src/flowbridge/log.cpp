// filename: log.cpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#include "flowbridge/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>

namespace flowbridge {
namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool>& quietFlag() {
    static std::atomic<bool> quiet{false};
    return quiet;
}

void emit(std::ostream& stream, const char* level, const std::string& component,
          const std::string& message) {
    std::ostringstream line;
    line << "[flowbridge:" << component << "] ";
    if (level != nullptr) {
        line << level << ": ";
    }
    line << message << '\n';

    std::lock_guard<std::mutex> lock(logMutex());
    stream << line.str();
    stream.flush();
}

}  // namespace

void logInfo(const std::string& component, const std::string& message) {
    if (quietFlag().load()) {
        return;
    }
    emit(std::cout, nullptr, component, message);
}

void logWarn(const std::string& component, const std::string& message) {
    emit(std::cerr, "Warning", component, message);
}

void logError(const std::string& component, const std::string& message) {
    emit(std::cerr, "Error", component, message);
}

void setQuiet(bool quiet) {
    quietFlag().store(quiet);
}

bool isQuiet() {
    return quietFlag().load();
}

}  // namespace flowbridge
