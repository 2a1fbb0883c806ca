#include "test_support.hpp"

namespace {

auto expect_url(const char *tag, const mr::core::Config &config, std::string_view url,
                std::string_view expected) -> bool {
  const auto result = mr::core::parse_image_url(config, url);
  if (result != expected) {
    std::cerr << "[" << tag << "] '" << url << "' -> '" << result << "', expected '"
              << expected << "'\n";
    return false;
  }
  return true;
}

}  // namespace

auto test_image_url_default_gateway() -> bool {
  return expect_url("image_url_default_gateway", mr::core::Config{}, "ipfs://examplehash",
                    "https://ipfs.io/ipfs/examplehash");
}

auto test_image_url_custom_gateway() -> bool {
  mr::core::Config config;
  config.variables.ipfs_gateway = "https://custom-ipfs.gateway/";
  if (!expect_url("image_url_custom_gateway", config, "ipfs://examplehash",
                  "https://custom-ipfs.gateway/examplehash")) {
    return false;
  }
  return mr::core::resolve_image_url("https://custom/", "ipfs://hash") ==
         "https://custom/hash";
}

auto test_image_url_passthrough() -> bool {
  return expect_url("image_url_passthrough", mr::core::Config{},
                    "https://example.com/image.png", "https://example.com/image.png");
}

auto test_image_url_empty() -> bool {
  return expect_url("image_url_empty", mr::core::Config{}, "", "");
}

auto test_image_url_no_scheme() -> bool {
  return expect_url("image_url_no_scheme", mr::core::Config{}, "examplehash",
                    "examplehash") &&
         expect_url("image_url_no_scheme", mr::core::Config{}, "ipfs:/hash", "ipfs:/hash");
}

auto test_image_url_gateway_without_separator() -> bool {
  return mr::core::resolve_image_url("https://gw.example/ipfs", "ipfs://Qm123/a.png") ==
             "https://gw.example/ipfsQm123/a.png" &&
         mr::core::resolve_image_url("https://gw/", "ipfs://") == "https://gw/";
}

auto test_image_url_scheme_is_case_sensitive() -> bool {
  return expect_url("image_url_scheme_case", mr::core::Config{}, "IPFS://hash",
                    "IPFS://hash");
}
