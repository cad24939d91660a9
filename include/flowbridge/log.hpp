// filename: log.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <string>

namespace flowbridge {

// Lines are written as "[flowbridge:<component>] message". Info goes to stdout,
// warnings and errors to stderr. Writes are serialised across threads.
void logInfo(const std::string& component, const std::string& message);
void logWarn(const std::string& component, const std::string& message);
void logError(const std::string& component, const std::string& message);

// Suppresses info lines; warnings and errors are always printed.
void setQuiet(bool quiet);
bool isQuiet();

}  // namespace flowbridge
