#include "calcrun/validator.h"
#include "constants.h"
#include "python_parser.h"

namespace calcrun {

ValidationPolicy::ValidationPolicy() :
    allowed_modules({
        "math", "statistics", "fractions", "decimal",
        "itertools", "functools", "collections", "random"
    }),
    blocked_calls({
        "open", "exec", "eval", "compile", "__import__", "input", "breakpoint",
        "globals", "locals", "vars", "getattr", "setattr", "delattr",
        "help", "exit", "quit"
    }),
    max_code_chars(DEFAULT_MAX_CODE_CHARS) {}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

namespace {

std::string top_level(const std::string& dotted) {
    return dotted.substr(0, dotted.find('.'));
}

// Resolved callee name: f(...) -> f, obj.f(...) -> f
std::string call_name(const Node& call) {
    const Node& func = *call.children.front();
    if (func.kind == NodeKind::Name || func.kind == NodeKind::Attribute) return func.name;
    return "";
}

} // namespace

Validator::Validator(ValidationPolicy policy) : policy_(std::move(policy)) {}

ValidationVerdict Validator::validate(const std::string& code) const {
    bool blank = code.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
    if (blank) {
        return ValidationVerdict::reject("No Python code provided");
    }
    if (utf8_length(code) > policy_.max_code_chars) {
        return ValidationVerdict::reject(
            "Code is too long (max " + std::to_string(policy_.max_code_chars) + " chars)");
    }

    NodePtr tree;
    try {
        tree = PythonParser::parse(code);
    } catch (const SyntaxError& e) {
        std::string message = e.what();
        // Some messages already say where the problem was detected
        if (message.find("at line ") == std::string::npos &&
            message.find("on line ") == std::string::npos) {
            message += " (line " + std::to_string(e.line()) + ")";
        }
        return ValidationVerdict::reject("Syntax error: " + message);
    }

    std::string reason;
    walk(*tree, [this, &reason](const Node& node) {
        switch (node.kind) {
            case NodeKind::Import:
                for (const auto& alias : node.children) {
                    std::string module = top_level(alias->name);
                    if (!policy_.allowed_modules.count(module)) {
                        reason = "Import '" + module + "' is not allowed in computation nodes";
                        return false;
                    }
                }
                break;

            case NodeKind::ImportFrom: {
                std::string module = top_level(node.name);
                if (!policy_.allowed_modules.count(module)) {
                    reason = "Import from '" + (module.empty() ? std::string("unknown") : module) +
                             "' is not allowed in computation nodes";
                    return false;
                }
                for (const auto& alias : node.children) {
                    if (alias->name == "*") {
                        reason = "Wildcard imports are not allowed";
                        return false;
                    }
                }
                break;
            }

            case NodeKind::Attribute:
                if (node.name.compare(0, 2, "__") == 0) {
                    reason = "Dunder attribute access is not allowed";
                    return false;
                }
                break;

            case NodeKind::Call: {
                std::string name = call_name(node);
                if (!name.empty() && policy_.blocked_calls.count(name)) {
                    reason = "Call '" + name + "' is not allowed";
                    return false;
                }
                break;
            }

            default:
                break;
        }
        return true;
    });

    if (!reason.empty()) return ValidationVerdict::reject(reason);
    return ValidationVerdict::accept();
}

void Validator::require_valid(const std::string& code) const {
    ValidationVerdict verdict = validate(code);
    if (!verdict.accepted) {
        throw ValidationError(verdict.reason);
    }
}

} // namespace calcrun
