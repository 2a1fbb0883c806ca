#pragma once

#include <string>
#include <string_view>

namespace mr::core {

inline constexpr std::string_view kDefaultIpfsGateway = "https://ipfs.io/ipfs/";

/// Values consumed by the normalization helpers.
struct Variables {
  /// Base URL substituted for the `ipfs://` scheme. Used verbatim, so it
  /// normally ends with '/'.
  std::string ipfs_gateway{kDefaultIpfsGateway};
};

struct Config {
  Variables variables;
};

/// Snapshot the --ipfs_gateway flag into a Config. An empty flag value is
/// treated as unset and yields the default gateway.
auto load_config_from_flags() -> Config;

}  // namespace mr::core
