#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

namespace unitpulse {

// Reads KEY=VALUE lines into the process environment without overriding
// variables that are already set.
std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

// Unset and empty variables are both nullopt.
std::optional<std::string> get_env(const std::string& key);

std::optional<bool> parse_bool(const std::string& value);

} // namespace unitpulse
