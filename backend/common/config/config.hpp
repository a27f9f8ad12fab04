#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace config {

// Declared limits for the user service. Nothing enforces them yet.
struct Config {
  std::size_t max_users{100};
  std::uint64_t timeout_ms{5000};
};

// Keys missing from the object keep their defaults.
std::expected<Config, std::string> configFromJson(const nlohmann::json& j);

std::expected<Config, std::string> loadConfig(const std::filesystem::path& path);

// Falls back to Config{} and reports the reason on stderr.
Config loadConfigOrDefault(const std::filesystem::path& path);

} // namespace config
