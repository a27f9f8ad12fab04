#pragma once
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include "domain/user.hpp"

namespace user_service {

// save() reporting success does not promise the item is durable.
template <typename T>
class Repository {
public:
  virtual ~Repository() = default;
  virtual std::expected<void, std::string> save(const T& item) = 0;
  virtual std::optional<T> findById(std::uint64_t id) const = 0;
};

using UserRepository = Repository<User>;

} // namespace user_service
