#pragma once

#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>

namespace calcrun {

// Raised for input errors and policy violations; nothing has been spawned
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& reason)
        : std::runtime_error(reason) {}

    std::string reason() const { return what(); }
};

// Outcome of static validation
struct ValidationVerdict {
    bool accepted = false;
    std::string reason;     // Empty when accepted

    static ValidationVerdict accept() { return ValidationVerdict{true, ""}; }
    static ValidationVerdict reject(std::string why) { return ValidationVerdict{false, std::move(why)}; }
};

// Import allowlist and call denylist applied to the syntax tree
struct ValidationPolicy {
    std::set<std::string> allowed_modules;
    std::set<std::string> blocked_calls;
    size_t max_code_chars;

    ValidationPolicy();
};

// Static gate in front of the runner. Parses the snippet and walks the tree;
// never executes anything.
class Validator {
public:
    explicit Validator(ValidationPolicy policy = ValidationPolicy());

    ValidationVerdict validate(const std::string& code) const;

    // Throws ValidationError with the rejection reason
    void require_valid(const std::string& code) const;

    const ValidationPolicy& policy() const { return policy_; }

private:
    ValidationPolicy policy_;
};

// Number of UTF-8 code points in text; stray continuation bytes count once each
size_t utf8_length(const std::string& text);

} // namespace calcrun
