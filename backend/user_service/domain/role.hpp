#pragma once
#include <string_view>

namespace user_service {

// Not attached to User yet.
enum class Role {
  Admin,
  Member,
  Guest
};

inline std::string_view roleName(Role role) {
  switch (role) {
    case Role::Admin: return "Admin";
    case Role::Member: return "Member";
    case Role::Guest: return "Guest";
  }
  return "Guest";
}

} // namespace user_service
