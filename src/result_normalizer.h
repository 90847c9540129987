#pragma once

#include <cstddef>
#include <string>
#include "calcrun/execution_result.h"
#include "sandbox.h"

namespace calcrun {

// Decode UTF-8, replacing each invalid sequence with U+FFFD
std::string decode_utf8_lossy(const std::string& bytes);

// First max_chars code points plus the truncation marker when text is longer
std::string truncate_output(const std::string& text, size_t max_chars);

// Turns a raw run outcome into the caller-facing result
class ResultNormalizer {
public:
    explicit ResultNormalizer(size_t max_output_chars) : max_output_chars_(max_output_chars) {}

    ExecutionResult normalize(const RunOutcome& outcome, const std::string& executed_code,
                              double timeout_seconds) const;

private:
    size_t max_output_chars_;
};

} // namespace calcrun
