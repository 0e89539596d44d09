#ifndef HAUL_UTILS_FLAGS_HPP_
#define HAUL_UTILS_FLAGS_HPP_

#include <gflags/gflags.h>

// Output / scheduling
DECLARE_string(output_dir);
DECLARE_int32(max_concurrent);
DECLARE_int32(max_retries);
DECLARE_string(custom_tbb_parallel_control);

// Transfer
DECLARE_uint64(chunk_size);
DECLARE_bool(enable_resume);
DECLARE_uint64(speed_limit);
DECLARE_bool(verify_checksum);
DECLARE_int32(chunk_timeout);
DECLARE_int32(max_chunk_retries);

// Transport
DECLARE_double(requests_per_second);
DECLARE_int32(connect_timeout);
DECLARE_int32(read_timeout);
DECLARE_int32(total_timeout);
DECLARE_string(proxy);

// Task store / service
DECLARE_string(task_db);
DECLARE_string(password);
DECLARE_bool(skip_completed);
DECLARE_int32(history_limit);
DECLARE_int32(cancel_poll_ms);

// Logging
DECLARE_string(log_dir);
DECLARE_string(log_level);
DECLARE_uint64(log_max_file_size);
DECLARE_uint64(log_max_backups);

#endif  // HAUL_UTILS_FLAGS_HPP_
