#include <gtest/gtest.h>
#include "file_utils.h"
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace calcrun {
namespace {

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "calcrun_file_utils_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string create_test_file(const std::string& filename, const std::string& content,
                                 bool executable = false) {
        std::string filepath = test_dir / filename;
        std::ofstream file(filepath, std::ios::binary);
        file << content;
        file.close();
        chmod(filepath.c_str(), executable ? 0755 : 0644);
        return filepath;
    }

    std::filesystem::path test_dir;
};

// ============================================================================
// Audit digest
// ============================================================================

TEST_F(FileUtilsTest, SHA256String_KnownInput) {
    EXPECT_EQ(FileUtils::sha256_string(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::sha256_string("hello world"),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(FileUtilsTest, SHA256String_WhitespaceChangesDigest) {
    // Snippets differing only in trailing newline are different audit records
    std::string a = FileUtils::sha256_string("print(1)");
    std::string b = FileUtils::sha256_string("print(1)\n");

    EXPECT_NE(a, b);
    EXPECT_EQ(a.length(), 64u);
}

TEST_F(FileUtilsTest, BytesToHex_LowercasePadded) {
    unsigned char data[] = {0x00, 0x01, 0x0F, 0x10, 0xFF};
    EXPECT_EQ(FileUtils::bytes_to_hex(data, 5), "00010f10ff");
    EXPECT_EQ(FileUtils::bytes_to_hex(data, 0), "");
}

// ============================================================================
// Interpreter lookup
// ============================================================================

TEST_F(FileUtilsTest, FindExecutable_SearchesPathInOrder) {
    std::filesystem::create_directories(test_dir / "first");
    std::filesystem::create_directories(test_dir / "second");
    std::ofstream((test_dir / "second" / "fakepython").string()) << "#!/bin/sh\n";
    chmod((test_dir / "second" / "fakepython").c_str(), 0755);

    std::string path_env = (test_dir / "first").string() + ":" + (test_dir / "second").string();
    EXPECT_EQ(FileUtils::find_executable("fakepython", path_env),
              (test_dir / "second" / "fakepython").string());
}

TEST_F(FileUtilsTest, FindExecutable_SkipsNonExecutableFiles) {
    create_test_file("notrunnable", "data", false);
    EXPECT_EQ(FileUtils::find_executable("notrunnable", test_dir.string()), "");
}

TEST_F(FileUtilsTest, FindExecutable_PathNamesCheckedAsIs) {
    std::string script = create_test_file("runme", "#!/bin/sh\n", true);

    EXPECT_EQ(FileUtils::find_executable(script, "/nonexistent"), script);
    EXPECT_EQ(FileUtils::find_executable((test_dir / "missing").string(), ""), "");
    EXPECT_EQ(FileUtils::find_executable("", "/usr/bin"), "");
}

TEST_F(FileUtilsTest, FindExecutable_DefaultSearchPath) {
    // /bin/sh exists on every supported host
    EXPECT_FALSE(FileUtils::find_executable("sh", "").empty());
}

// ============================================================================
// Input files
// ============================================================================

TEST_F(FileUtilsTest, ReadFile_ReturnsExactBytes) {
    std::string content("```python\nprint(1)\n```\n\0tail", 28);
    std::string path = create_test_file("node.md", content);

    EXPECT_EQ(FileUtils::read_file(path), content);
}

TEST_F(FileUtilsTest, ReadFile_MissingFileThrows) {
    EXPECT_THROW(FileUtils::read_file((test_dir / "absent.md").string()), std::runtime_error);
}

} // namespace
} // namespace calcrun
