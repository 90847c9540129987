#include "result_normalizer.h"
#include "constants.h"
#include "file_utils.h"
#include <cstdio>

namespace calcrun {

namespace {

const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at i, or 0 if malformed
size_t valid_sequence_length(const std::string& bytes, size_t i) {
    unsigned char lead = static_cast<unsigned char>(bytes[i]);
    size_t remaining = bytes.size() - i;
    auto at = [&](size_t k) { return static_cast<unsigned char>(bytes[i + k]); };

    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        return (remaining >= 2 && is_continuation(at(1))) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (remaining < 3 || !is_continuation(at(1)) || !is_continuation(at(2))) return 0;
        if (lead == 0xE0 && at(1) < 0xA0) return 0;     // overlong
        if (lead == 0xED && at(1) > 0x9F) return 0;     // surrogates
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (remaining < 4 || !is_continuation(at(1)) || !is_continuation(at(2)) ||
            !is_continuation(at(3))) {
            return 0;
        }
        if (lead == 0xF0 && at(1) < 0x90) return 0;     // overlong
        if (lead == 0xF4 && at(1) > 0x8F) return 0;     // above U+10FFFF
        return 4;
    }
    return 0;
}

// Bytes of the maximal prefix of a sequence, replaced as one unit
size_t invalid_prefix_length(const std::string& bytes, size_t i) {
    unsigned char lead = static_cast<unsigned char>(bytes[i]);
    size_t expected = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC2 ? 2 : 1;
    if (lead > 0xF4) expected = 1;

    size_t length = 1;
    while (length < expected && i + length < bytes.size()) {
        unsigned char next = static_cast<unsigned char>(bytes[i + length]);
        if (!is_continuation(next)) break;
        if (length == 1) {
            if (lead == 0xE0 && next < 0xA0) break;
            if (lead == 0xED && next > 0x9F) break;
            if (lead == 0xF0 && next < 0x90) break;
            if (lead == 0xF4 && next > 0x8F) break;
        }
        ++length;
    }
    return length;
}

} // namespace

std::string decode_utf8_lossy(const std::string& bytes) {
    std::string text;
    text.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        size_t length = valid_sequence_length(bytes, i);
        if (length > 0) {
            text.append(bytes, i, length);
            i += length;
        } else {
            text += REPLACEMENT_CHARACTER;
            i += invalid_prefix_length(bytes, i);
        }
    }
    return text;
}

std::string truncate_output(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(text[i]))) continue;
        if (chars == max_chars) {
            return text.substr(0, i) + TRUNCATION_MARKER;
        }
        ++chars;
    }
    return text;
}

ExecutionResult ResultNormalizer::normalize(const RunOutcome& outcome,
                                            const std::string& executed_code,
                                            double timeout_seconds) const {
    ExecutionResult result;
    result.stdout_text = truncate_output(decode_utf8_lossy(outcome.stdout_bytes), max_output_chars_);
    result.stderr_text = truncate_output(decode_utf8_lossy(outcome.stderr_bytes), max_output_chars_);
    result.duration_ms = outcome.wall_time.count();
    result.executed_code = executed_code;
    result.code_sha256 = FileUtils::sha256_string(executed_code);

    if (outcome.timed_out) {
        char message[64];
        std::snprintf(message, sizeof(message), "Execution timed out after %.1fs", timeout_seconds);
        result.success = false;
        result.error = std::string(message);
        return result;
    }

    if (!outcome.spawn_error.empty()) {
        result.success = false;
        result.error = outcome.spawn_error;
        return result;
    }

    result.exit_code = outcome.exit_code;
    result.success = outcome.exit_code && *outcome.exit_code == 0;
    if (!result.success) {
        if (!result.stderr_text.empty()) {
            result.error = result.stderr_text;
        } else {
            result.error = "Python exited with code " +
                           (outcome.exit_code ? std::to_string(*outcome.exit_code)
                                              : std::string("unknown"));
        }
    }
    return result;
}

} // namespace calcrun
