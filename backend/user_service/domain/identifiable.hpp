#pragma once
#include <cstdint>

namespace user_service {
class Identifiable {
public:
  virtual ~Identifiable() = default;
  virtual std::uint64_t id() const = 0;
};
}
