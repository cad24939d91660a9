// filename: json_fields.hpp
// part of FlowBridge 2D Obstacle Solver Bridge
// MIT License

#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>

#include <nlohmann/json.hpp>

namespace flowbridge::detail {

template <typename Error>
const nlohmann::json& requireObject(const nlohmann::json& value, const std::string& field) {
    if (!value.is_object()) {
        throw Error(field + " must be a JSON object");
    }
    return value;
}

template <typename Error>
void rejectUnknownKeys(const nlohmann::json& object,
                       std::initializer_list<const char*> allowed,
                       const std::string& context) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        const bool known = std::any_of(allowed.begin(), allowed.end(),
                                       [&](const char* key) { return it.key() == key; });
        if (!known) {
            throw Error("Unrecognised field '" + it.key() + "' in " + context);
        }
    }
}

template <typename Error>
double readNumber(const nlohmann::json& object, const char* key, const std::string& context,
                  double fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (!value.is_number()) {
        throw Error(context + "." + key + " must be a number");
    }
    return value.get<double>();
}

template <typename Error>
std::size_t readCount(const nlohmann::json& object, const char* key, const std::string& context,
                      std::size_t fallback, std::size_t minimum) {
    if (!object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (!value.is_number_integer()) {
        throw Error(context + "." + key + " must be an integer");
    }
    const long long raw = value.get<long long>();
    if (raw < static_cast<long long>(minimum)) {
        throw Error(context + "." + key + " must be at least " + std::to_string(minimum));
    }
    return static_cast<std::size_t>(raw);
}

template <typename Error>
bool readBool(const nlohmann::json& object, const char* key, const std::string& context, bool fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (!value.is_boolean()) {
        throw Error(context + "." + key + " must be a boolean");
    }
    return value.get<bool>();
}

template <typename Error>
std::string readString(const nlohmann::json& object, const char* key, const std::string& context,
                       const std::string& fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (!value.is_string()) {
        throw Error(context + "." + key + " must be a string");
    }
    return value.get<std::string>();
}

}  // namespace flowbridge::detail
