#include "utils.hpp"

#include <string>
#include <string_view>

namespace Utils {

std::string to_lower_copy(std::string_view s) {
  std::string out{s};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

} // namespace Utils
