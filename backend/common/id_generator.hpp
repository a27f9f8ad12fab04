#pragma once
#include <atomic>
#include <cstdint>

namespace common {

// Mints unique numeric ids. One instance is shared by everything that
// creates entities, so ids stay unique across services using it.
class IdGenerator {
public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // returns the pre-increment value: 1, 2, 3, ...
  std::uint64_t nextId() {
    return next_id_.fetch_add(1, std::memory_order_seq_cst);
  }

private:
  std::atomic<std::uint64_t> next_id_{1};
};

} // namespace common
