#include "util/flags.hpp"

DEFINE_double(default_execution_time, 30.0,
              "Wall-clock limit in seconds for sandboxes that do not set one");
DEFINE_int64(default_memory_mb, 256,
             "Memory limit in MB for sandboxes that do not set one");
DEFINE_int64(default_output_bytes, 1024 * 1024,
             "Size cap of each captured output stream");
DEFINE_int64(default_source_length, 10000,
             "Maximum accepted source length in characters");
DEFINE_int32(default_recursion_depth, 100,
             "Maximum call depth of sandboxed code");

DEFINE_double(max_execution_time, 300.0,
              "Upper bound for any sandbox wall-clock limit, in seconds");
DEFINE_int64(max_memory_mb, 2048, "Upper bound for any sandbox memory limit");
DEFINE_double(max_cpu_percent, 50.0,
              "CPU usage above which a warning is logged");
DEFINE_int32(max_open_files, 100, "Upper bound for open descriptors");
DEFINE_int32(max_processes, 5, "Upper bound for processes per sandbox");
DEFINE_int32(max_threads, 10, "Upper bound for threads per sandbox");
DEFINE_int64(max_output_bytes, 16 * 1024 * 1024,
             "Upper bound for the captured output cap");
DEFINE_int64(max_source_length, 1024 * 1024,
             "Upper bound for the accepted source length");

DEFINE_int32(monitor_interval_millis, 1000,
             "Interval between two resource samples");
DEFINE_int32(kill_grace_millis, 5000,
             "Time between SIGTERM and SIGKILL for terminated executions");

DEFINE_int32(cleanup_interval_seconds, 300,
             "Interval between two expiry sweeps");
DEFINE_int32(max_sandbox_lifetime_seconds, 3600,
             "Sandboxes older than this are removed by the sweep");
DEFINE_int32(sandbox_idle_ttl_seconds, 1800,
             "Sandboxes idle for longer than this are removed by the sweep");
DEFINE_int32(history_size, 1000, "Number of execution results kept");

DEFINE_int32(max_db_rows, 1000,
             "Maximum number of rows returned by a database query");

DEFINE_string(worker_path, "",
              "Path of codebox-worker; by default it is searched next to the "
              "running binary and then in PATH");

DEFINE_string(listen_address, "0.0.0.0", "Address the server listens on");
DEFINE_int32(port, 7071, "Port the server listens on");
