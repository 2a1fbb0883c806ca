#include "common/logging/log.hpp"

#include <gflags/gflags.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <vector>

DECLARE_string(log_level);
DECLARE_bool(log_to_file);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);

namespace mr::log {

namespace {

constexpr std::size_t kMinFileSize = 1024;

std::shared_ptr<spdlog::logger> g_logger;

}  // namespace

auto parse_level(std::string_view name) -> spdlog::level::level_enum {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return spdlog::level::warn;
}

auto options_from_flags() -> LogOptions {
  LogOptions options;
  options.level = parse_level(FLAGS_log_level);
  options.to_file = FLAGS_log_to_file;
  options.file_path = FLAGS_log_file;
  options.max_file_size =
      std::max(kMinFileSize, static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)));
  options.max_files = std::max(FLAGS_log_max_files, 1);
  return options;
}

void init(const LogOptions& options) {
  std::vector<spdlog::sink_ptr> sinks;
  if (options.to_console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (options.to_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file_path, options.max_file_size, options.max_files));
  }

  g_logger = std::make_shared<spdlog::logger>("mr_core", sinks.begin(), sinks.end());
  g_logger->set_level(options.level);
  g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::set_default_logger(g_logger);

  spdlog::debug("logger ready: level={} file={}", spdlog::level::to_string_view(options.level),
                options.to_file ? options.file_path : std::string{"-"});
}

void init() {
  init(options_from_flags());
}

void shutdown() {
  if (g_logger) {
    g_logger->flush();
    g_logger.reset();
    spdlog::shutdown();
  }
}

void event(std::string_view name, const std::unordered_map<std::string, std::string>& fields) {
  std::string msg{name};
  for (const auto& [key, value] : fields) {
    msg += " " + key + "=" + value;
  }
  spdlog::info(msg);
}

}  // namespace mr::log
