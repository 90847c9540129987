#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "constants.h"

namespace calcrun {

// Raw outcome of one sandboxed process
struct RunOutcome {
    std::string stdout_bytes;
    std::string stderr_bytes;
    std::optional<int> exit_code;           // Negative signal number if killed
    bool timed_out = false;
    std::string spawn_error;                // Set when the process never started
    std::chrono::milliseconds wall_time{0};
};

// Process limits applied to each run
struct SandboxConfig {
    std::string interpreter_path;           // Absolute path, resolved by the caller
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    size_t max_capture_bytes = MAX_CAPTURE_BYTES;
    bool seccomp_enabled = true;
};

// Runs validated code; all failures are reported in the outcome
class Runner {
public:
    virtual ~Runner() = default;
    virtual RunOutcome run(const std::string& code, double timeout_seconds) = 0;
};

// One fresh interpreter process per call
class ProcessRunner : public Runner {
public:
    explicit ProcessRunner(const SandboxConfig& config);
    ~ProcessRunner() override;

    RunOutcome run(const std::string& code, double timeout_seconds) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

// Resource-limit preamble followed by a blank line and the user code
std::string build_script(const std::string& code, double timeout_seconds,
                         size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES);

// CPU ceiling derived from the wall-clock timeout
long cpu_limit_seconds(double timeout_seconds);

} // namespace calcrun
