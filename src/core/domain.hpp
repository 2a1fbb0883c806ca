#pragma once

#include <string>
#include <string_view>

namespace mr::core {

/// A domain split into a tenant prefix and a two-label root.
/// `prefix + root` always reproduces the input exactly.
struct DomainParts {
  std::string prefix;
  std::string root;

  auto full() const -> std::string { return prefix + root; }
  auto operator==(const DomainParts&) const -> bool = default;
};

/// Split at the second-to-last '.'; everything up to and including that dot
/// is the prefix. Purely positional: no public-suffix knowledge, empty labels
/// and trailing dots count like any other label, bytes are not interpreted.
/// Inputs with fewer than two dots come back whole in `root`.
auto split_domain(std::string_view domain) -> DomainParts;

inline auto has_subdomain(const DomainParts& parts) -> bool {
  return !parts.prefix.empty();
}

}  // namespace mr::core
