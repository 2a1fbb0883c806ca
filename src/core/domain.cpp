#include "core/domain.hpp"

#include "common/logging/log.hpp"

namespace mr::core {

namespace {

// Offset just past the second-to-last '.', or npos when there is no such dot.
auto root_offset(std::string_view domain) -> std::size_t {
  const auto last = domain.rfind('.');
  if (last == std::string_view::npos || last == 0) {
    return std::string_view::npos;
  }
  const auto second = domain.rfind('.', last - 1);
  return second == std::string_view::npos ? second : second + 1;
}

}  // namespace

auto split_domain(std::string_view domain) -> DomainParts {
  const auto offset = root_offset(domain);
  DomainParts parts;
  if (offset == std::string_view::npos) {
    parts.root = std::string{domain};
  } else {
    parts.prefix = std::string{domain.substr(0, offset)};
    parts.root = std::string{domain.substr(offset)};
  }
  log::debug("split_domain: domain={} prefix={} root={}", domain, parts.prefix, parts.root);
  return parts;
}

}  // namespace mr::core
