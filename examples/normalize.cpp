#include <iostream>
#include <string>
#include <string_view>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "core/config.hpp"
#include "core/domain.hpp"
#include "core/image_url.hpp"
#include "core/sanitize.hpp"
#include "core/wide_integer.hpp"

DEFINE_string(domain, "", "Domain to split into prefix and root");
DEFINE_string(low_hex, "", "Low 128 bits of a token id (hex, optional 0x)");
DEFINE_string(high_hex, "", "High 128 bits of a token id (hex, optional 0x)");
DEFINE_string(text, "", "Text to strip of NUL characters (\\0 is decoded)");
DEFINE_string(image_url, "", "Image URL to rewrite through the IPFS gateway");

namespace {

// Flags cannot carry raw NULs, so accept the two-character escape instead.
auto decode_nul_escapes(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == '0') {
      out.push_back('\0');
      ++i;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("mr_normalize --domain=... --low_hex=... --high_hex=... "
                          "--text=... --image_url=...");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  mr::log::init();

  const auto config = mr::core::load_config_from_flags();
  int status = 0;

  if (!FLAGS_domain.empty()) {
    const auto parts = mr::core::split_domain(FLAGS_domain);
    std::cout << "prefix=\"" << parts.prefix << "\" root=\"" << parts.root << "\"\n";
  }

  if (!FLAGS_low_hex.empty() || !FLAGS_high_hex.empty()) {
    auto id = mr::core::compose_wide_integer(FLAGS_low_hex, FLAGS_high_hex);
    if (id) {
      std::cout << "token_id=" << id->to_decimal() << " hex=" << id->to_hex() << "\n";
    } else {
      std::cerr << mr::core::error_code_name(id.error().code) << ": "
                << id.error().message << "\n";
      status = 1;
    }
  }

  if (!FLAGS_text.empty()) {
    std::cout << "text=\"" << mr::core::clean_string(decode_nul_escapes(FLAGS_text))
              << "\"\n";
  }

  if (!FLAGS_image_url.empty()) {
    std::cout << "image_url=" << mr::core::parse_image_url(config, FLAGS_image_url) << "\n";
  }

  mr::log::event("normalize_done", {{"status", std::to_string(status)}});
  mr::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
