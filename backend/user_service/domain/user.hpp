#pragma once
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include "common/id_generator.hpp"
#include "domain/identifiable.hpp"

namespace user_service {
class User : public Identifiable {
public:
  User(std::uint64_t id, const std::string& name,
       const std::optional<std::string>& email = std::nullopt)
    : id_(id), name_(name), email_(email) {}

  // takes a fresh id from ids; name is stored as given
  static User make(common::IdGenerator& ids, const std::string& name) {
    return User(ids.nextId(), name);
  }

  // same id and name, email replaced
  User withEmail(const std::string& email) const {
    return User(id_, name_, email);
  }

  std::uint64_t id() const override { return id_; }
  const std::string& name() const { return name_; }
  const std::optional<std::string>& email() const { return email_; }

  std::string debug() const {
    std::ostringstream oss;
    oss << "User{id:" << id_ << ",name:" << name_ << ",email:" << email_.value_or("none") << "}";
    return oss.str();
  }

private:
  std::uint64_t id_;
  std::string name_;
  std::optional<std::string> email_;
};
}
