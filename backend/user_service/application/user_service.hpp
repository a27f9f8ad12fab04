#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/id_generator.hpp"
#include "domain/repository.hpp"
#include "domain/user.hpp"

namespace user_service {
class UserService : public UserRepository {
public:
  // owns a fresh generator, ids start at 1
  UserService();
  // a null ids behaves like the default constructor
  explicit UserService(std::shared_ptr<common::IdGenerator> ids);

  // Builds a user with a fresh id. The user is NOT added to users_, so
  // findByName/findById will not see it.
  User create(const std::string& name) const;

  std::optional<User> findByName(const std::string& name) const;

  std::expected<void, std::string> save(const User& item) override;
  std::optional<User> findById(std::uint64_t id) const override;

  std::size_t size() const { return users_.size(); }

private:
  std::shared_ptr<common::IdGenerator> ids_;
  std::vector<User> users_;
};
}
