#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Race
DECLARE_int32(swarm_size);
DECLARE_int64(race_timeout_ms);
DECLARE_int64(drain_timeout_ms);

// Agent loop
DECLARE_int32(max_iterations);
DECLARE_int32(max_sandbox_faults);
DECLARE_int32(max_generation_retries);
DECLARE_int32(max_structural_defects);

// Sandbox
DECLARE_string(temp_directory);
DECLARE_string(python);
DECLARE_int64(sandbox_timeout_ms);
DECLARE_int64(install_timeout_ms);
DECLARE_int64(max_log_bytes);

// Generation oracle
DECLARE_string(oracle_command);
DECLARE_int64(oracle_timeout_ms);
DECLARE_int32(oracle_concurrency);

#endif
