#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace common {

std::string formatName(std::string_view name) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto begin = std::find_if_not(name.begin(), name.end(), is_space);
  auto end = std::find_if_not(name.rbegin(), std::make_reverse_iterator(begin), is_space).base();

  std::string result(begin, end);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

} // namespace common
