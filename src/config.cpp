#include "calcrun/config.h"
#include "constants.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>

namespace calcrun {

ExecutorConfig::ExecutorConfig() :
    max_code_chars(DEFAULT_MAX_CODE_CHARS),
    max_output_chars(DEFAULT_MAX_OUTPUT_CHARS),
    default_timeout_seconds(DEFAULT_TIMEOUT_SECONDS),
    max_timeout_seconds(DEFAULT_MAX_TIMEOUT_SECONDS),
    memory_limit_bytes(DEFAULT_MEMORY_LIMIT_BYTES),
    max_concurrent_executions(DEFAULT_MAX_CONCURRENT_EXECUTIONS),
    interpreter("python3"),
    seccomp_enabled(true) {}

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return nullptr;
    return value;
}

void warn_ignored(const char* name, const char* value) {
    std::cerr << "[Config] Ignoring invalid " << name << "=" << value << std::endl;
}

// Positive integer no larger than max
void read_size(const char* name, size_t& target,
               size_t max = std::numeric_limits<size_t>::max()) {
    const char* value = env_value(name);
    if (!value) return;
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (*end != '\0' || errno == ERANGE || std::strchr(value, '-') || parsed == 0 || parsed > max) {
        warn_ignored(name, value);
        return;
    }
    target = static_cast<size_t>(parsed);
}

void read_seconds(const char* name, double& target) {
    const char* value = env_value(name);
    if (!value) return;
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (*end != '\0' || !std::isfinite(parsed) || parsed <= 0) {
        warn_ignored(name, value);
        return;
    }
    target = parsed;
}

} // namespace

ExecutorConfig ExecutorConfig::from_environment() {
    ExecutorConfig config;

    read_size("PYTHON_EXECUTOR_MAX_CODE_CHARS", config.max_code_chars);
    read_size("PYTHON_EXECUTOR_MAX_OUTPUT_CHARS", config.max_output_chars);
    read_seconds("PYTHON_EXECUTOR_TIMEOUT_SECONDS", config.default_timeout_seconds);
    read_seconds("PYTHON_EXECUTOR_MAX_TIMEOUT_SECONDS", config.max_timeout_seconds);

    size_t memory_mb = config.memory_limit_bytes / (1024 * 1024);
    read_size("PYTHON_EXECUTOR_MEMORY_LIMIT_MB", memory_mb,
              std::numeric_limits<size_t>::max() / (1024 * 1024));
    config.memory_limit_bytes = memory_mb * 1024 * 1024;

    size_t concurrent = static_cast<size_t>(config.max_concurrent_executions);
    read_size("PYTHON_EXECUTOR_MAX_CONCURRENT", concurrent);
    config.max_concurrent_executions = static_cast<int>(std::min<size_t>(concurrent, 1024));

    if (const char* interpreter = env_value("PYTHON_EXECUTOR_INTERPRETER")) {
        config.interpreter = interpreter;
    }

    if (config.max_timeout_seconds < MIN_TIMEOUT_SECONDS) {
        warn_ignored("PYTHON_EXECUTOR_MAX_TIMEOUT_SECONDS", "(below minimum timeout)");
        config.max_timeout_seconds = DEFAULT_MAX_TIMEOUT_SECONDS;
    }

    return config;
}

double ExecutorConfig::clamp_timeout(std::optional<double> requested) const {
    double timeout = default_timeout_seconds;
    if (requested && std::isfinite(*requested) && *requested != 0.0) {
        timeout = *requested;
    }
    return std::max(MIN_TIMEOUT_SECONDS, std::min(timeout, max_timeout_seconds));
}

} // namespace calcrun
