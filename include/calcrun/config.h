#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace calcrun {

// Executor configuration. Defaults come from constants.h; deployments override
// them through PYTHON_EXECUTOR_* environment variables.
struct ExecutorConfig {
    size_t max_code_chars;
    size_t max_output_chars;
    double default_timeout_seconds;
    double max_timeout_seconds;
    size_t memory_limit_bytes;
    int max_concurrent_executions;
    std::string interpreter;                         // Name resolved against PATH, or a path
    bool seccomp_enabled;                            // Best-effort syscall filter in the child

    ExecutorConfig();

    // Defaults overridden by the process environment
    static ExecutorConfig from_environment();

    // Clamp a caller-supplied timeout. Absent, zero or non-finite values
    // select the default.
    double clamp_timeout(std::optional<double> requested) const;
};

} // namespace calcrun
