#include "calcrun/executor.h"
#include "calcrun/code_extractor.h"
#include "execution_gate.h"
#include "file_utils.h"
#include "result_normalizer.h"
#include "sandbox.h"
#include <cstdlib>
#include <iostream>

namespace calcrun {

class Executor::Impl {
public:
    ExecutorConfig config_;
    CodeExtractor extractor_;
    Validator validator_;
    ResultNormalizer normalizer_;
    ExecutionGate gate_;
    std::shared_ptr<Runner> runner_;

    Impl(const ExecutorConfig& config, std::shared_ptr<Runner> runner) :
        config_(config),
        validator_(make_policy(config)),
        normalizer_(config.max_output_chars),
        gate_(config.max_concurrent_executions),
        runner_(std::move(runner)) {
        if (!runner_) {
            runner_ = std::make_shared<ProcessRunner>(make_sandbox_config(config));
        }
    }

    // Extracted, validated snippet; throws ValidationError
    std::string prepare(const std::string& content) const {
        std::string code = extractor_.extract(content);
        ValidationVerdict verdict = validator_.validate(code);
        if (!verdict.accepted) {
            std::cerr << "[Executor] Rejected snippet (" << code.size() << " bytes): "
                      << verdict.reason << std::endl;
            throw ValidationError(verdict.reason);
        }
        return code;
    }

    ExecutionResult run(const std::string& code, double timeout) {
        ExecutionGate::Slot slot(gate_);
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(slot.waited());
        if (waited.count() > 0) {
            std::cerr << "[Executor] Waited " << waited.count() << "ms for an execution slot"
                      << std::endl;
        }

        RunOutcome outcome = runner_->run(code, timeout);
        ExecutionResult result = normalizer_.normalize(outcome, code, timeout);

        std::cerr << "[Executor] Snippet " << result.code_sha256.substr(0, 12)
                  << (outcome.timed_out ? " timed out" : " finished")
                  << " in " << result.duration_ms << "ms";
        if (result.exit_code) {
            std::cerr << " (exit " << *result.exit_code << ")";
        }
        if (!outcome.spawn_error.empty()) {
            std::cerr << " (" << outcome.spawn_error << ")";
        }
        std::cerr << std::endl;
        return result;
    }

private:
    static ValidationPolicy make_policy(const ExecutorConfig& config) {
        ValidationPolicy policy;
        policy.max_code_chars = config.max_code_chars;
        return policy;
    }

    static SandboxConfig make_sandbox_config(const ExecutorConfig& config) {
        SandboxConfig sandbox;
        const char* path_env = std::getenv("PATH");
        sandbox.interpreter_path = FileUtils::find_executable(config.interpreter,
                                                              path_env ? path_env : "");
        if (sandbox.interpreter_path.empty()) {
            std::cerr << "[Executor] Warning: interpreter '" << config.interpreter
                      << "' not found on PATH" << std::endl;
        }
        sandbox.memory_limit_bytes = config.memory_limit_bytes;
        sandbox.seccomp_enabled = config.seccomp_enabled;
        return sandbox;
    }
};

Executor::Executor(const ExecutorConfig& config) : Executor(config, nullptr) {}

Executor::Executor(const ExecutorConfig& config, std::shared_ptr<Runner> runner)
    : impl(std::make_shared<Impl>(config, std::move(runner))) {}

Executor::~Executor() = default;

ExecutionResult Executor::execute(const std::string& content, std::optional<double> timeout_seconds) {
    std::string code = impl->prepare(content);
    return impl->run(code, impl->config_.clamp_timeout(timeout_seconds));
}

std::future<ExecutionResult> Executor::execute_async(const std::string& content,
                                                     std::optional<double> timeout_seconds) {
    std::string code = impl->prepare(content);
    double timeout = impl->config_.clamp_timeout(timeout_seconds);

    // The task keeps the implementation alive past this Executor
    std::shared_ptr<Impl> state = impl;
    return std::async(std::launch::async, [state, code, timeout]() {
        return state->run(code, timeout);
    });
}

ValidationVerdict Executor::check(const std::string& content) const {
    return impl->validator_.validate(impl->extractor_.extract(content));
}

const ExecutorConfig& Executor::config() const {
    return impl->config_;
}

} // namespace calcrun
