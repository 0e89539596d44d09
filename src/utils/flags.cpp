#include "utils/flags.hpp"

DEFINE_string(output_dir, "downloads", "Directory downloads are written to");
DEFINE_int32(max_concurrent, 3, "Maximum number of transfers running at once");
DEFINE_int32(max_retries, 3,
             "Whole-task retries after a failed attempt (attempts = N + 1)");
DEFINE_string(custom_tbb_parallel_control, "",
              "TBB arena concurrency control, e.g. download:4,verify:2");

DEFINE_uint64(chunk_size, 1024 * 1024, "Stream chunk size in bytes");
DEFINE_bool(enable_resume, true,
            "Resume partial files with byte-range requests when possible");
DEFINE_uint64(speed_limit, 0, "Per-transfer speed cap in bytes/s (0 = none)");
DEFINE_bool(verify_checksum, true,
            "Verify checksums supplied by extractors after download");
DEFINE_int32(chunk_timeout, 60,
             "Seconds without data before a chunk read times out (0 = off)");
DEFINE_int32(max_chunk_retries, 3,
             "In-place retries of a stalled or broken stream");

DEFINE_double(requests_per_second, 10.0,
              "Process-wide outbound request budget (<= 0 disables)");
DEFINE_int32(connect_timeout, 30, "Connect timeout in seconds");
DEFINE_int32(read_timeout, 300,
             "Seconds a socket may stay idle before the request fails");
DEFINE_int32(total_timeout, 0, "Total request timeout in seconds (0 = none)");
DEFINE_string(proxy, "",
              "Proxy URL; empty uses http_proxy/https_proxy from environment");

DEFINE_string(task_db, "",
              "Task database path (default: ~/.config/haul/tasks.db)");
DEFINE_string(password, "", "Password for protected links");
DEFINE_bool(skip_completed, true,
            "Skip URLs that already have a completed task in the task store");
DEFINE_int32(history_limit, 50, "Rows shown by `haul history`");
DEFINE_int32(cancel_poll_ms, 1000,
             "How often running tasks check the task store for cancellation");

DEFINE_string(log_dir, "logs", "Log directory (empty = console only)");
DEFINE_string(log_level, "info", "debug | info | warn | error");
DEFINE_uint64(log_max_file_size, 10 * 1024 * 1024,
              "Rotate the log file after this many bytes");
DEFINE_uint64(log_max_backups, 3, "Rotated log files to keep");
