#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum level written to the log file (trace, debug, info, warn, error, critical, off)");
DEFINE_string(log_file, "pg_engine.log", "Rotating log file path; empty disables the file sink");
DEFINE_int32(log_max_size, 10485760, "Max log file size in bytes before rotation");
DEFINE_int32(log_max_files, 3, "Number of rotated log files to keep");
DEFINE_string(log_stderr_level, "off", "Minimum level echoed to stderr; off disables the console sink");
