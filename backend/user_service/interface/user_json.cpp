#include "user_json.hpp"
#include <cstdint>
#include <optional>

namespace user_service {

namespace {
bool isNonNegativeInteger(const nlohmann::json& v) {
  if (!v.is_number_integer()) {
    return false;
  }
  return v.is_number_unsigned() || v.get<std::int64_t>() >= 0;
}
}

nlohmann::json toJson(const User& user) {
  nlohmann::json j = {
    {"id", user.id()},
    {"name", user.name()},
    {"email", nullptr}
  };
  if (user.email()) {
    j["email"] = user.email().value();
  }
  return j;
}

std::expected<User, std::string> userFromJson(const nlohmann::json& body) {
  if (!body.is_object()) {
    return std::unexpected("user must be a json object");
  }
  if (!body.contains("id") || !isNonNegativeInteger(body["id"])) {
    return std::unexpected("Missing or invalid id field");
  }
  if (!body.contains("name") || !body["name"].is_string()) {
    return std::unexpected("Missing or invalid name field");
  }

  std::optional<std::string> email;
  if (body.contains("email") && !body["email"].is_null()) {
    if (!body["email"].is_string()) {
      return std::unexpected("email must be a string or null");
    }
    email = body["email"].get<std::string>();
  }

  return User(body["id"].get<std::uint64_t>(), body["name"].get<std::string>(), email);
}

}
