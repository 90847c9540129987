/*
 * calcrun - run a computation-node snippet in a throwaway Python process
 * and print the result as JSON
 */

#include "calcrun/executor.h"
#include "file_utils.h"
#include <json/json.h>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

using namespace calcrun;

namespace {

constexpr int EXIT_SNIPPET_FAILED = 1;
constexpr int EXIT_REJECTED = 2;
constexpr int EXIT_USAGE = 64;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--timeout SECONDS] [--validate-only] [FILE]" << std::endl;
    std::cerr << "  Reads the content blob from FILE, or stdin when FILE is omitted or '-'." << std::endl;
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<double> timeout;
    bool validate_only = false;
    std::string input_path;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--timeout" && i + 1 < argc) {
            char* end = nullptr;
            double value = std::strtod(argv[++i], &end);
            if (*end != '\0' || !std::isfinite(value) || value < 0) {
                std::cerr << "Invalid timeout: " << argv[i] << std::endl;
                return EXIT_USAGE;
            }
            timeout = value;
        } else if (arg == "--validate-only") {
            validate_only = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            print_usage(argv[0]);
            return EXIT_USAGE;
        } else if (input_path.empty()) {
            input_path = arg;
        } else {
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    std::string content;
    if (input_path.empty() || input_path == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        try {
            content = FileUtils::read_file(input_path);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return EXIT_USAGE;
        }
    }

    Executor executor(ExecutorConfig::from_environment());

    if (validate_only) {
        ValidationVerdict verdict = executor.check(content);
        Json::Value json;
        json["valid"] = verdict.accepted;
        if (!verdict.accepted) {
            json["reason"] = verdict.reason;
        }
        std::cout << write_json(json) << std::endl;
        return verdict.accepted ? 0 : EXIT_REJECTED;
    }

    try {
        ExecutionResult result = executor.execute(content, timeout);
        std::cout << to_json(result) << std::endl;
        return result.success ? 0 : EXIT_SNIPPET_FAILED;
    } catch (const ValidationError& e) {
        Json::Value json;
        json["success"] = false;
        json["rejected"] = true;
        json["error"] = e.what();
        std::cout << write_json(json) << std::endl;
        return EXIT_REJECTED;
    }
}
