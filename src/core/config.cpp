#include "core/config.hpp"

#include <gflags/gflags.h>

#include "common/logging/log.hpp"

DECLARE_string(ipfs_gateway);

namespace mr::core {

auto load_config_from_flags() -> Config {
  Config config;
  if (!FLAGS_ipfs_gateway.empty()) {
    config.variables.ipfs_gateway = FLAGS_ipfs_gateway;
  }
  log::debug("config loaded: ipfs_gateway={}", config.variables.ipfs_gateway);
  return config;
}

}  // namespace mr::core
