#pragma once

#include <string>

namespace calcrun {

class FileUtils {
public:
    // Hash utilities (audit digest of executed code)
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Resolve a program name against PATH; names containing '/' are checked as-is.
    // Returns an empty string if nothing executable is found.
    static std::string find_executable(const std::string& name, const std::string& path_env);

    // Read a whole file, throws std::runtime_error if it cannot be opened
    static std::string read_file(const std::string& filepath);
};

} // namespace calcrun
