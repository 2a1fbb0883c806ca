#pragma once

#include <string>
#include <string_view>

#include "core/config.hpp"

namespace mr::core {

inline constexpr std::string_view kIpfsScheme = "ipfs://";

/// Rewrite an `ipfs://` URL as `gateway_base` + the rest of the URL. Any other
/// input, empty included, is returned verbatim. No separator is inserted
/// between the gateway and the content path.
auto resolve_image_url(std::string_view gateway_base, std::string_view url) -> std::string;

/// resolve_image_url() using the gateway held in `config`.
auto parse_image_url(const Config& config, std::string_view url) -> std::string;

}  // namespace mr::core
