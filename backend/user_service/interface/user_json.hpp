#pragma once
#include <expected>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/user.hpp"

namespace user_service {

// {"id": 1, "name": "Alice", "email": null}
nlohmann::json toJson(const User& user);

std::expected<User, std::string> userFromJson(const nlohmann::json& body);

}
