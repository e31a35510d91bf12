#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum log level (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "rp_engine.log", "Process log file, used until a replica configures its own");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep");
DEFINE_int32(log_queue_size, 8192, "Capacity of the async logging queue");
DEFINE_int32(log_flush_interval_ms, 1000, "Periodic flush of the async logger; 0 disables it");
DEFINE_string(replica_logs_dir, "logs", "Directory for per-replica log files when the deployment sets none");
