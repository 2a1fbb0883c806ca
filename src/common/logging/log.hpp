#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mr::log {

using spdlog::debug;
using spdlog::info;
using spdlog::warn;

/// Sink selection for the process-wide logger. Console output goes to
/// stderr so it never mixes with results printed on stdout.
struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::warn;
  bool to_console = true;
  bool to_file = false;
  std::string file_path = "mr_core.log";
  std::size_t max_file_size = 10485760;
  int max_files = 3;
};

/// Map a --log_level name to a spdlog level; unknown names give `warn`.
auto parse_level(std::string_view name) -> spdlog::level::level_enum;

/// Snapshot of the --log_* flags.
auto options_from_flags() -> LogOptions;

/// Replace spdlog's default logger. Repeated calls reconfigure.
void init(const LogOptions& options);
void init();

void shutdown();

/// Structured line: `event k=v ...` at info level.
void event(std::string_view name, const std::unordered_map<std::string, std::string>& fields);

}  // namespace mr::log
