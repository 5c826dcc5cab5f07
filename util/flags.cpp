#include "util/flags.hpp"

DEFINE_int32(swarm_size, 3, "Number of agents racing on the task");
DEFINE_int64(race_timeout_ms, 30 * 60 * 1000,
             "Abort the race after this many milliseconds. 0 disables it");
DEFINE_int64(drain_timeout_ms, 10 * 1000,
             "How long cancelled agents may take to stop before their "
             "sandboxes are released from outside");

DEFINE_int32(max_iterations, 5,
             "Sandbox attempts per agent before it gives up");
DEFINE_int32(max_sandbox_faults, 3,
             "Sandbox faults (timeouts, dependency or environment errors) per "
             "agent before it gives up");
DEFINE_int32(max_generation_retries, 3,
             "Consecutive oracle failures before the attempt counts as a "
             "failed iteration");
DEFINE_int32(max_structural_defects, 5,
             "Bundles rejected before execution per agent before it gives up");

DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_string(python, "python3",
              "Interpreter used to install dependencies and run the tests");
DEFINE_int64(sandbox_timeout_ms, 120 * 1000,
             "Wall time limit of the test command");
DEFINE_int64(install_timeout_ms, 300 * 1000,
             "Wall time limit of the dependency installation");
DEFINE_int64(max_log_bytes, 64 * 1024,
             "Bytes of stdout/stderr kept for every execution");

DEFINE_string(oracle_command, "",
              "Program that generates code and tests. It reads a text "
              "GenerationRequest on stdin and writes a text Bundle on stdout");
DEFINE_int64(oracle_timeout_ms, 10 * 60 * 1000,
             "Wall time limit of one oracle call");
DEFINE_int32(oracle_concurrency, 1, "Concurrent oracle calls allowed");
