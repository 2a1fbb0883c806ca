#include "core/image_url.hpp"

#include "common/logging/log.hpp"

namespace mr::core {

auto resolve_image_url(std::string_view gateway_base, std::string_view url) -> std::string {
  if (!url.starts_with(kIpfsScheme)) {
    return std::string{url};
  }
  url.remove_prefix(kIpfsScheme.size());
  std::string out;
  out.reserve(gateway_base.size() + url.size());
  out.append(gateway_base);
  out.append(url);
  log::debug("image url rewritten via gateway: {}", out);
  return out;
}

auto parse_image_url(const Config& config, std::string_view url) -> std::string {
  return resolve_image_url(config.variables.ipfs_gateway, url);
}

}  // namespace mr::core
