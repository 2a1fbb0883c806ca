#include <gflags/gflags.h>

// Logging. Console output always goes to stderr; the rotating file is opt-in.
DEFINE_string(log_level, "warn", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_bool(log_to_file, false, "Also write log lines to --log_file");
DEFINE_string(log_file, "mr_core.log", "Rotating log file path, used with --log_to_file");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation (floor 1024)");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep (floor 1)");

// Normalization
DEFINE_string(ipfs_gateway, "https://ipfs.io/ipfs/",
              "Gateway base URL used to rewrite ipfs:// image links");
