#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include "calcrun/config.h"
#include "calcrun/execution_result.h"
#include "calcrun/validator.h"

namespace calcrun {

class Runner;

// Extract -> validate -> run -> normalize for one content blob.
// Thread-safe; each call spawns its own interpreter process.
class Executor {
public:
    explicit Executor(const ExecutorConfig& config = ExecutorConfig());

    // Substitute the process runner (tests, alternative back ends)
    Executor(const ExecutorConfig& config, std::shared_ptr<Runner> runner);

    ~Executor();

    // Throws ValidationError when the snippet is rejected. Everything past
    // the validation gate is reported in the result.
    ExecutionResult execute(const std::string& content,
                            std::optional<double> timeout_seconds = std::nullopt);

    // Validates synchronously, then runs on a background thread
    std::future<ExecutionResult> execute_async(const std::string& content,
                                               std::optional<double> timeout_seconds = std::nullopt);

    // Extract and validate without running
    ValidationVerdict check(const std::string& content) const;

    const ExecutorConfig& config() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl;
};

} // namespace calcrun
