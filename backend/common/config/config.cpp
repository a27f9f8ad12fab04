#include "config.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>

namespace config {

namespace {
// json built from a C++ int is number_integer even when it is >= 0
bool isNonNegativeInteger(const nlohmann::json& v) {
  if (!v.is_number_integer()) {
    return false;
  }
  return v.is_number_unsigned() || v.get<std::int64_t>() >= 0;
}
} // namespace

std::expected<Config, std::string> configFromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::unexpected("config root must be a json object");
  }

  Config cfg;
  if (j.contains("max_users")) {
    if (!isNonNegativeInteger(j["max_users"])) {
      return std::unexpected("max_users must be an unsigned integer");
    }
    cfg.max_users = j["max_users"].get<std::size_t>();
  }
  if (j.contains("timeout_ms")) {
    if (!isNonNegativeInteger(j["timeout_ms"])) {
      return std::unexpected("timeout_ms must be an unsigned integer");
    }
    cfg.timeout_ms = j["timeout_ms"].get<std::uint64_t>();
  }
  return cfg;
}

std::expected<Config, std::string> loadConfig(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    return std::unexpected("failed to open config file: " + path.string());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected("failed to parse config file " + path.string() + ": " + e.what());
  }
  return configFromJson(j);
}

Config loadConfigOrDefault(const std::filesystem::path& path) {
  auto res = loadConfig(path);
  if (!res) {
    std::cerr << "Warning: " << res.error() << ", using default config" << std::endl;
    return Config{};
  }
  return res.value();
}

} // namespace config
