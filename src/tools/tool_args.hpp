#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace deploypilot::tools {

// Non-empty string argument, or nullopt.
inline std::optional<std::string> string_arg(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object()) {
        return std::nullopt;
    }
    const auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Numeric argument; numeric strings ("30") are accepted as well.
inline std::optional<double> number_arg(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object()) {
        return std::nullopt;
    }
    const auto it = args.find(key);
    if (it == args.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        try {
            std::size_t used = 0;
            const std::string text = it->get<std::string>();
            const double value = std::stod(text, &used);
            if (used == text.size()) {
                return value;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

template <typename Action, std::size_t N>
using ActionTable = std::array<std::pair<const char*, Action>, N>;

template <typename Action, std::size_t N>
std::optional<Action> parse_action(const std::string& text, const ActionTable<Action, N>& table) {
    for (const auto& [name, action] : table) {
        if (text == name) {
            return action;
        }
    }
    return std::nullopt;
}

template <typename Action, std::size_t N>
std::string unknown_action_message(const std::string& text, const ActionTable<Action, N>& table) {
    std::string names;
    for (const auto& entry : table) {
        if (!names.empty()) {
            names += ", ";
        }
        names += entry.first;
    }
    return "Error: Unknown action '" + text + "'. Available actions: " + names;
}

template <typename Action, std::size_t N>
nlohmann::json action_enum(const ActionTable<Action, N>& table) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto& entry : table) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace deploypilot::tools
