#include "core/sanitize.hpp"

#include <algorithm>
#include <iterator>

namespace mr::core {

auto clean_string(std::string_view input) -> std::string {
  std::string out;
  out.reserve(input.size());
  std::ranges::copy_if(input, std::back_inserter(out), [](char c) { return c != '\0'; });
  return out;
}

void clean_string_in_place(std::string& value) {
  std::erase(value, '\0');
}

}  // namespace mr::core
