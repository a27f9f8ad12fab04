#pragma once
#include <string>
#include <string_view>

namespace common {

// "  Bob  " -> "bob". ASCII only: non-ASCII bytes are left untouched.
std::string formatName(std::string_view name);

} // namespace common
