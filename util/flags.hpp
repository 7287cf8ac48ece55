#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Defaults applied to fields a client leaves unset.
DECLARE_double(default_execution_time);
DECLARE_int64(default_memory_mb);
DECLARE_int64(default_output_bytes);
DECLARE_int64(default_source_length);
DECLARE_int32(default_recursion_depth);

// Service-wide ceilings every requested configuration is clamped to.
DECLARE_double(max_execution_time);
DECLARE_int64(max_memory_mb);
DECLARE_double(max_cpu_percent);
DECLARE_int32(max_open_files);
DECLARE_int32(max_processes);
DECLARE_int32(max_threads);
DECLARE_int64(max_output_bytes);
DECLARE_int64(max_source_length);

// Resource monitor.
DECLARE_int32(monitor_interval_millis);
DECLARE_int32(kill_grace_millis);

// Instance lifecycle.
DECLARE_int32(cleanup_interval_seconds);
DECLARE_int32(max_sandbox_lifetime_seconds);
DECLARE_int32(sandbox_idle_ttl_seconds);
DECLARE_int32(history_size);

// Database capability.
DECLARE_int32(max_db_rows);

// Sandboxed worker.
DECLARE_string(worker_path);

// Server.
DECLARE_string(listen_address);
DECLARE_int32(port);

#endif
