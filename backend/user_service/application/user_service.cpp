#include "user_service.hpp"
#include <algorithm>

namespace user_service {

UserService::UserService()
  : ids_(std::make_shared<common::IdGenerator>()) {}

UserService::UserService(std::shared_ptr<common::IdGenerator> ids)
  : ids_(ids ? ids : std::make_shared<common::IdGenerator>()) {}

User UserService::create(const std::string& name) const {
  return User::make(*ids_, name);
}

std::optional<User> UserService::findByName(const std::string& name) const {
  auto it = std::find_if(users_.begin(), users_.end(),
                         [&name](const User& u) { return u.name() == name; });
  if (it == users_.end()) {
    return std::nullopt;
  }
  return *it;
}

// nothing is persisted
std::expected<void, std::string> UserService::save(const User&) {
  return {};
}

std::optional<User> UserService::findById(std::uint64_t id) const {
  auto it = std::find_if(users_.begin(), users_.end(),
                         [id](const Identifiable& u) { return u.id() == id; });
  if (it == users_.end()) {
    return std::nullopt;
  }
  return *it;
}

} // namespace user_service
