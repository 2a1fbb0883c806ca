#include "test_support.hpp"

#include <array>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "common/logging/log.hpp"

using namespace std::string_literals;

namespace {

struct Case {
  std::string domain;
  std::string low_hex;
  std::string high_hex;
  std::string text;
  std::string image_url;
};

struct Answer {
  mr::core::DomainParts parts;
  std::optional<mr::core::WideInteger> id;
  std::string cleaned;
  std::string resolved;

  auto operator==(const Answer &) const -> bool = default;
};

auto solve(const Case &c, const mr::core::Config &config) -> Answer {
  Answer answer;
  answer.parts = mr::core::split_domain(c.domain);
  if (auto id = mr::core::compose_wide_integer(c.low_hex, c.high_hex)) {
    answer.id = *id;
  }
  answer.cleaned = mr::core::clean_string(c.text);
  answer.resolved = mr::core::parse_image_url(config, c.image_url);
  return answer;
}

}  // namespace

auto test_concurrent_normalization() -> bool {
  constexpr int kThreads = 8;
  constexpr int kIterations = 2000;
  constexpr std::size_t kCases = 5;

  const std::array<Case, kCases> cases{{
      {"deep.nested.sub.example.com", "0x1", "0x0", "Hello\0, world\0!"s, "ipfs://hash"},
      {"service.example.co.uk", "0x0000000000000000", "0x0000000000000001", "\0\0\0"s,
       "https://example.com/x.png"},
      {"localhost", "not-hex", "0x0", "Hell\0o \xF0\x9F\x8C\x8D\0!"s, ""},
      {"sub.例子.com", "0x" + std::string(32, 'f'), "0X" + std::string(32, 'F'), "", "hash"},
      {"...", "0xabc", "0x1" + std::string(32, '0'), "plain", "ipfs://Qm/a.png"},
  }};

  mr::core::Config config;
  config.variables.ipfs_gateway = "https://custom/";

  std::array<Answer, kCases> expected;
  for (std::size_t i = 0; i < kCases; ++i) {
    expected[i] = solve(cases[i], config);
  }

  // Route debug lines from every call through one shared file sink while the
  // workers run, then restore the flag-driven logger.
  const auto log_path = std::filesystem::temp_directory_path() /
                        ("mr_core_concurrency_" + std::to_string(std::random_device{}()) + ".log");
  mr::log::LogOptions options;
  options.level = spdlog::level::debug;
  options.to_console = false;
  options.to_file = true;
  options.file_path = log_path.string();
  mr::log::init(options);

  std::array<std::uint64_t, kThreads> seeds{};
  for (int i = 0; i < kThreads; ++i) {
    seeds[i] = 0x9e3779b97f4a7c15ULL ^ static_cast<std::uint64_t>(i);
  }

  std::mutex error_mutex;
  std::string error_message;
  const bool ok = run_concurrent(kThreads, kIterations, [&](int thread_index, int) {
    auto pick = static_cast<std::size_t>((next_seed(seeds[thread_index]) >> 33) % kCases);
    if (solve(cases[pick], config) == expected[pick]) {
      return true;
    }
    std::lock_guard<std::mutex> lock(error_mutex);
    error_message = "result diverged for domain " + cases[pick].domain;
    return false;
  });

  mr::log::init();
  std::error_code ec;
  std::filesystem::remove(log_path, ec);

  if (!ok) {
    std::cerr << "[concurrent_normalization] " << error_message << "\n";
    return false;
  }
  return expected[0].id.has_value() && !expected[2].id.has_value() &&
         !expected[4].id.has_value();
}
