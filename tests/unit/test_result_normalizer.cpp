#include <gtest/gtest.h>
#include "result_normalizer.h"
#include "file_utils.h"
#include <json/json.h>
#include <memory>
#include <sstream>

namespace calcrun {
namespace {

RunOutcome exited(int code, const std::string& out = "", const std::string& err = "") {
    RunOutcome outcome;
    outcome.exit_code = code;
    outcome.stdout_bytes = out;
    outcome.stderr_bytes = err;
    outcome.wall_time = std::chrono::milliseconds(42);
    return outcome;
}

Json::Value parse_json(const std::string& text) {
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::istringstream stream(text);
    std::string errors;
    EXPECT_TRUE(Json::parseFromStream(builder, stream, &json, &errors)) << errors;
    return json;
}

// ============================================================================
// Decoding and truncation
// ============================================================================

TEST(DecodeUtf8Test, ValidTextUnchanged) {
    std::string text = "plain ascii, caf\xC3\xA9, \xE2\x88\x91, \xF0\x9F\x98\x80";
    EXPECT_EQ(decode_utf8_lossy(text), text);
}

TEST(DecodeUtf8Test, InvalidBytesReplaced) {
    EXPECT_EQ(decode_utf8_lossy("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(decode_utf8_lossy("\x80"), "\xEF\xBF\xBD");
    // Overlong encoding of '/'
    EXPECT_EQ(decode_utf8_lossy("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // Encoded surrogate
    EXPECT_EQ(decode_utf8_lossy("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(DecodeUtf8Test, TruncatedSequenceReplacedOnce) {
    // First two bytes of a three-byte sequence, cut at end of stream
    EXPECT_EQ(decode_utf8_lossy("x\xE2\x88"), "x\xEF\xBF\xBD");
    EXPECT_EQ(decode_utf8_lossy("\xE2\x88y"), "\xEF\xBF\xBDy");
}

TEST(TruncateOutputTest, ShortTextUnchanged) {
    EXPECT_EQ(truncate_output("hello", 5), "hello");
    EXPECT_EQ(truncate_output("", 0), "");
}

TEST(TruncateOutputTest, LongTextCutAndMarked) {
    EXPECT_EQ(truncate_output("hello world", 5), "hello\n... [output truncated]");
}

TEST(TruncateOutputTest, CountsCodePointsNotBytes) {
    std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9";    // three characters, six bytes
    EXPECT_EQ(truncate_output(text, 3), text);
    EXPECT_EQ(truncate_output(text, 2), "\xC3\xA9\xC3\xA9\n... [output truncated]");
}

// ============================================================================
// Normalization
// ============================================================================

class ResultNormalizerTest : public ::testing::Test {
protected:
    ResultNormalizer normalizer{20};
};

TEST_F(ResultNormalizerTest, SuccessfulRun) {
    ExecutionResult result = normalizer.normalize(exited(0, "4\n"), "print(2 + 2)", 6.0);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "4\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_FALSE(result.error.has_value());
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_EQ(result.duration_ms, 42);
    EXPECT_EQ(result.executed_code, "print(2 + 2)");
    EXPECT_EQ(result.code_sha256, FileUtils::sha256_string("print(2 + 2)"));
}

TEST_F(ResultNormalizerTest, FailureTakesErrorFromStderr) {
    ExecutionResult result = normalizer.normalize(exited(1, "", "ZeroDivisionError"), "1/0", 6.0);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "ZeroDivisionError");
    EXPECT_EQ(result.exit_code.value_or(-1), 1);
}

TEST_F(ResultNormalizerTest, ErrorFromStderrIsTruncatedLikeTheStream) {
    ExecutionResult result = normalizer.normalize(
        exited(1, "", std::string(100, 'E')), "x", 6.0);
    EXPECT_EQ(result.error.value_or(""), std::string(20, 'E') + "\n... [output truncated]");
    EXPECT_EQ(result.error.value_or(""), result.stderr_text);
}

TEST_F(ResultNormalizerTest, FailureWithoutStderrNamesExitCode) {
    ExecutionResult result = normalizer.normalize(exited(3), "raise SystemExit(3)", 6.0);
    EXPECT_EQ(result.error.value_or(""), "Python exited with code 3");

    ExecutionResult killed = normalizer.normalize(exited(-9), "x", 6.0);
    EXPECT_EQ(killed.error.value_or(""), "Python exited with code -9");
    EXPECT_EQ(killed.exit_code.value_or(0), -9);
}

TEST_F(ResultNormalizerTest, TruncationDoesNotAffectSuccess) {
    ExecutionResult result = normalizer.normalize(exited(0, std::string(50, 'x')), "x", 6.0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, std::string(20, 'x') + "\n... [output truncated]");
    EXPECT_FALSE(result.error.has_value());
}

TEST_F(ResultNormalizerTest, TimeoutHasDedicatedErrorAndNoExitCode) {
    RunOutcome outcome;
    outcome.timed_out = true;
    outcome.stdout_bytes = "partial\n";
    outcome.wall_time = std::chrono::milliseconds(1003);

    ExecutionResult result = normalizer.normalize(outcome, "while True: pass", 1.0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Execution timed out after 1.0s");
    EXPECT_FALSE(result.exit_code.has_value());
    EXPECT_EQ(result.stdout_text, "partial\n");
    EXPECT_EQ(result.duration_ms, 1003);

    ExecutionResult half = normalizer.normalize(outcome, "x", 0.5);
    EXPECT_EQ(half.error.value_or(""), "Execution timed out after 0.5s");
}

TEST_F(ResultNormalizerTest, SpawnFailureBecomesErrorValue) {
    RunOutcome outcome;
    outcome.spawn_error = "Python interpreter not found";

    ExecutionResult result = normalizer.normalize(outcome, "print(1)", 6.0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Python interpreter not found");
    EXPECT_FALSE(result.exit_code.has_value());
}

TEST_F(ResultNormalizerTest, InvalidUtf8OutputDecodedPermissively) {
    ExecutionResult result = normalizer.normalize(exited(0, "ok\xFF"), "x", 6.0);
    EXPECT_EQ(result.stdout_text, "ok\xEF\xBF\xBD");
}

// ============================================================================
// JSON
// ============================================================================

TEST(ExecutionResultJsonTest, AllFieldsSerialized) {
    ExecutionResult result;
    result.success = true;
    result.stdout_text = "3\n";
    result.exit_code = 0;
    result.duration_ms = 17;
    result.executed_code = "print(1 + 2)";
    result.code_sha256 = "abc";

    Json::Value json = parse_json(to_json(result));
    EXPECT_TRUE(json["success"].asBool());
    EXPECT_EQ(json["stdout"].asString(), "3\n");
    EXPECT_EQ(json["stderr"].asString(), "");
    EXPECT_TRUE(json["error"].isNull());
    EXPECT_EQ(json["exit_code"].asInt(), 0);
    EXPECT_EQ(json["duration_ms"].asInt64(), 17);
    EXPECT_EQ(json["executed_code"].asString(), "print(1 + 2)");
    EXPECT_EQ(json["code_sha256"].asString(), "abc");
}

TEST(ExecutionResultJsonTest, AbsentExitCodeIsNull) {
    ExecutionResult result;
    result.error = std::string("Execution timed out after 1.0s");

    Json::Value json = parse_json(to_json(result));
    EXPECT_FALSE(json["success"].asBool());
    EXPECT_TRUE(json["exit_code"].isNull());
    EXPECT_EQ(json["error"].asString(), "Execution timed out after 1.0s");
}

} // namespace
} // namespace calcrun
