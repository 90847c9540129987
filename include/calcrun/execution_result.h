#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace calcrun {

// Terminal outcome of one execution request. Created once, never mutated
// after it is returned.
struct ExecutionResult {
    bool success = false;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;       // Absent on success
    std::optional<int> exit_code;           // Absent on timeout or spawn failure
    int64_t duration_ms = 0;
    std::string executed_code;              // Exact snippet that ran
    std::string code_sha256;                // Hex digest of executed_code
};

// Compact JSON object; absent optionals are null
std::string to_json(const ExecutionResult& result);

} // namespace calcrun
