#include <gtest/gtest.h>
#include "python_lexer.h"
#include <string>
#include <vector>

namespace calcrun {
namespace {

std::vector<TokenType> types_of(const std::string& source) {
    std::vector<TokenType> types;
    for (const auto& token : PythonLexer(source).tokenize()) {
        types.push_back(token.type);
    }
    return types;
}

SyntaxError lex_error(const std::string& source) {
    try {
        PythonLexer(source).tokenize();
    } catch (const SyntaxError& e) {
        return e;
    }
    ADD_FAILURE() << "Expected a syntax error for: " << source;
    return SyntaxError("", 0, 0);
}

// ============================================================================
// Token stream
// ============================================================================

TEST(PythonLexerTest, SimpleAssignment) {
    auto tokens = PythonLexer("x = 1\n").tokenize();
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, TokenType::NAME);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_TRUE(tokens[1].is_op("="));
    EXPECT_EQ(tokens[2].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[2].text, "1");
    EXPECT_EQ(tokens[3].type, TokenType::NEWLINE);
    EXPECT_EQ(tokens[4].type, TokenType::ENDMARKER);
}

TEST(PythonLexerTest, MissingTrailingNewlineIsSynthesized) {
    std::vector<TokenType> expected = {TokenType::NAME, TokenType::NEWLINE, TokenType::ENDMARKER};
    EXPECT_EQ(types_of("x"), expected);
}

TEST(PythonLexerTest, IndentAndDedent) {
    std::vector<TokenType> expected = {
        TokenType::NAME, TokenType::NAME, TokenType::OP, TokenType::NEWLINE,
        TokenType::INDENT, TokenType::NAME, TokenType::NEWLINE,
        TokenType::DEDENT, TokenType::NAME, TokenType::NEWLINE,
        TokenType::ENDMARKER
    };
    EXPECT_EQ(types_of("if x:\n    y\nz\n"), expected);
}

TEST(PythonLexerTest, DedentsClosedAtEndOfInput) {
    auto types = types_of("def f():\n    if x:\n        return 1");
    ASSERT_GE(types.size(), 3u);
    EXPECT_EQ(types[types.size() - 1], TokenType::ENDMARKER);
    EXPECT_EQ(types[types.size() - 2], TokenType::DEDENT);
    EXPECT_EQ(types[types.size() - 3], TokenType::DEDENT);
}

TEST(PythonLexerTest, BlankAndCommentLinesProduceNoTokens) {
    std::vector<TokenType> expected = {
        TokenType::NAME, TokenType::NEWLINE, TokenType::NAME, TokenType::NEWLINE,
        TokenType::ENDMARKER
    };
    EXPECT_EQ(types_of("a\n\n   \n# only a comment\n      # indented comment\nb\n"), expected);
}

TEST(PythonLexerTest, BracketsJoinLines) {
    auto tokens = PythonLexer("total = sum([1,\n    2,\n    3])\nnext_line = 1\n").tokenize();
    int newlines = 0;
    for (const auto& token : tokens) {
        if (token.type == TokenType::NEWLINE) ++newlines;
        EXPECT_NE(token.type, TokenType::INDENT);
    }
    EXPECT_EQ(newlines, 2);
    EXPECT_EQ(tokens[tokens.size() - 5].text, "next_line");
    EXPECT_EQ(tokens[tokens.size() - 5].line, 4);
}

TEST(PythonLexerTest, BackslashContinuationAndComments) {
    auto tokens = PythonLexer("x = 1 + \\\n    2  # trailing\n").tokenize();
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[4].text, "2");
    EXPECT_EQ(tokens[4].line, 2);
    EXPECT_EQ(tokens[5].type, TokenType::NEWLINE);
}

TEST(PythonLexerTest, StringPrefixesAndTripleQuotes) {
    auto tokens = PythonLexer("a = rb'x' + Rb\"y\"\nb = f'{a}'\nc = \"\"\"one\ntwo\"\"\"\nd = 1\n").tokenize();
    std::vector<std::string> strings;
    for (const auto& token : tokens) {
        if (token.type == TokenType::STRING) strings.push_back(token.text);
    }
    ASSERT_EQ(strings.size(), 4u);
    EXPECT_EQ(strings[0], "rb'x'");
    EXPECT_EQ(strings[1], "Rb\"y\"");
    EXPECT_EQ(strings[2], "f'{a}'");
    EXPECT_EQ(strings[3], "\"\"\"one\ntwo\"\"\"");

    EXPECT_EQ(tokens[tokens.size() - 5].text, "d");
    EXPECT_EQ(tokens[tokens.size() - 5].line, 5);
}

TEST(PythonLexerTest, NameFollowedByQuoteIsNotAPrefix) {
    auto tokens = PythonLexer("print'x'\n").tokenize();
    EXPECT_EQ(tokens[0].type, TokenType::NAME);
    EXPECT_EQ(tokens[0].text, "print");
    EXPECT_EQ(tokens[1].type, TokenType::STRING);
}

TEST(PythonLexerTest, NumberForms) {
    auto tokens = PythonLexer("0x1F 0o17 0b101 1_000 3.14 .5 1e-3 2j 1if").tokenize();
    std::vector<std::string> numbers;
    for (const auto& token : tokens) {
        if (token.type == TokenType::NUMBER) numbers.push_back(token.text);
    }
    std::vector<std::string> expected = {
        "0x1F", "0o17", "0b101", "1_000", "3.14", ".5", "1e-3", "2j", "1"
    };
    EXPECT_EQ(numbers, expected);
}

TEST(PythonLexerTest, LongestOperatorWins) {
    auto tokens = PythonLexer("a **= b // c ... d := e -> f != g").tokenize();
    EXPECT_TRUE(tokens[1].is_op("**="));
    EXPECT_TRUE(tokens[3].is_op("//"));
    EXPECT_TRUE(tokens[5].is_op("..."));
    EXPECT_TRUE(tokens[7].is_op(":="));
    EXPECT_TRUE(tokens[9].is_op("->"));
    EXPECT_TRUE(tokens[11].is_op("!="));
}

TEST(PythonLexerTest, CarriageReturnsAreNewlines) {
    auto tokens = PythonLexer("a = 1\r\nb = 2\rc = 3").tokenize();
    EXPECT_EQ(tokens[4].text, "b");
    EXPECT_EQ(tokens[4].line, 2);
    EXPECT_EQ(tokens[8].text, "c");
    EXPECT_EQ(tokens[8].line, 3);
}

TEST(PythonLexerTest, FirstLineOffset) {
    auto tokens = PythonLexer("(x)", 7).tokenize();
    EXPECT_EQ(tokens[1].line, 7);
}

// ============================================================================
// Errors
// ============================================================================

TEST(PythonLexerTest, UnclosedBracketReportsOpeningPosition) {
    SyntaxError e = lex_error("print((1)\n");
    EXPECT_STREQ(e.what(), "'(' was never closed");
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.column(), 5);
}

TEST(PythonLexerTest, UnmatchedClosingBracket) {
    EXPECT_STREQ(lex_error("x = 1)\n").what(), "unmatched ')'");
}

TEST(PythonLexerTest, MismatchedBrackets) {
    EXPECT_STREQ(lex_error("x = (1]\n").what(),
                 "closing parenthesis ']' does not match opening parenthesis '('");
    EXPECT_STREQ(lex_error("x = [1,\n2)\n").what(),
                 "closing parenthesis ')' does not match opening parenthesis '[' on line 1");
}

TEST(PythonLexerTest, UnterminatedStrings) {
    SyntaxError single = lex_error("s = 'abc\nt = 1\n");
    EXPECT_STREQ(single.what(), "unterminated string literal (detected at line 1)");
    EXPECT_EQ(single.line(), 1);
    EXPECT_EQ(single.column(), 4);

    SyntaxError triple = lex_error("s = '''abc\n\n");
    EXPECT_EQ(std::string(triple.what()).rfind("unterminated triple-quoted string literal", 0), 0u);
}

TEST(PythonLexerTest, InvalidDecimalLiteral) {
    EXPECT_STREQ(lex_error("x = 1abc\n").what(), "invalid decimal literal");
}

TEST(PythonLexerTest, UnderscoresOnlyBetweenDigits) {
    EXPECT_STREQ(lex_error("x = 1__0\n").what(), "invalid decimal literal");
    EXPECT_STREQ(lex_error("x = 1_\n").what(), "invalid decimal literal");
    EXPECT_STREQ(lex_error("x = 1._5\n").what(), "invalid decimal literal");
    EXPECT_STREQ(lex_error("x = 1e5_\n").what(), "invalid decimal literal");
    EXPECT_STREQ(lex_error("x = 0x__f\n").what(), "invalid hexadecimal literal");
    EXPECT_STREQ(lex_error("x = 0x\n").what(), "invalid hexadecimal literal");
    EXPECT_EQ(types_of("x = 0x_ff + 1_0.0_1e1_0\n").size(), 7u);
}

TEST(PythonLexerTest, DigitsOutsideTheBase) {
    EXPECT_STREQ(lex_error("x = 0b102\n").what(), "invalid digit '2' in binary literal");
    EXPECT_STREQ(lex_error("x = 0o78\n").what(), "invalid digit '8' in octal literal");
}

TEST(PythonLexerTest, LeadingZerosOnlyForZeroOrNonIntegers) {
    SyntaxError e = lex_error("y = 2\nx = 0777\n");
    EXPECT_STREQ(e.what(), "leading zeros in decimal integer literals are not permitted; "
                           "use an 0o prefix for octal integers");
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(e.column(), 4);
    EXPECT_STREQ(lex_error("x = 0_7\n").what(),
                 "leading zeros in decimal integer literals are not permitted; "
                 "use an 0o prefix for octal integers");

    auto tokens = PythonLexer("00 0_0 09.5 07e1 07j\n").tokenize();
    std::vector<std::string> numbers;
    for (const auto& token : tokens) {
        if (token.type == TokenType::NUMBER) numbers.push_back(token.text);
    }
    std::vector<std::string> expected = {"00", "0_0", "09.5", "07e1", "07j"};
    EXPECT_EQ(numbers, expected);
}

TEST(PythonLexerTest, TabsAndSpacesMustAgree) {
    SyntaxError e = lex_error("def f():\n\tif x:\n\t\tpass\n        pass\n");
    EXPECT_STREQ(e.what(), "inconsistent use of tabs and spaces in indentation");
    EXPECT_EQ(e.line(), 4);

    EXPECT_STREQ(lex_error("if x:\n        a\n\tb\n").what(),
                 "inconsistent use of tabs and spaces in indentation");

    // Consistent tabs, and tabs in separate blocks from spaces, are fine
    EXPECT_NO_THROW(PythonLexer("if x:\n\tif y:\n\t\tpass\n\tz = 1\nif w:\n    pass\n").tokenize());
}

TEST(PythonLexerTest, ContinuationAtEndOfInput) {
    EXPECT_STREQ(lex_error("x = 1 \\\n").what(), "unexpected EOF while parsing");
    EXPECT_STREQ(lex_error("x = 1 \\\n   \n").what(), "unexpected EOF while parsing");
    EXPECT_STREQ(lex_error("x = 1 \\").what(), "unexpected EOF while parsing");
}

TEST(PythonLexerTest, InvisibleCharactersRejected) {
    SyntaxError bom = lex_error("\xef\xbb\xbfprint(1)\n");
    EXPECT_STREQ(bom.what(), "invalid non-printable character U+FEFF");
    EXPECT_EQ(bom.line(), 1);
    EXPECT_EQ(bom.column(), 0);

    EXPECT_STREQ(lex_error("ab\xe2\x80\x8b" "c = 1\n").what(),
                 "invalid non-printable character U+200B");
    EXPECT_STREQ(lex_error("x =\xc2\xa0" "1\n").what(),
                 "invalid non-printable character U+00A0");

    // Inside a string literal they are just text
    EXPECT_NO_THROW(PythonLexer("s = '\xef\xbb\xbf'\n").tokenize());
}

TEST(PythonLexerTest, InconsistentDedent) {
    SyntaxError e = lex_error("if x:\n    y\n  z\n");
    EXPECT_STREQ(e.what(), "unindent does not match any outer indentation level");
    EXPECT_EQ(e.line(), 3);
}

TEST(PythonLexerTest, StrayCharacters) {
    EXPECT_STREQ(lex_error("x = 1 $ 2\n").what(), "invalid syntax");
    EXPECT_STREQ(lex_error("x = 1 \\ 2\n").what(),
                 "unexpected character after line continuation character");
}

TEST(PythonLexerTest, NullBytesRejected) {
    std::string source("x = 1\0", 6);
    EXPECT_STREQ(lex_error(source).what(), "source code cannot contain null bytes");
}

TEST(PythonLexerTest, BracketNestingIsBounded) {
    std::string deep(PythonLexer::MAX_BRACKET_DEPTH + 1, '(');
    EXPECT_STREQ(lex_error(deep).what(), "too many nested parentheses");
}

} // namespace
} // namespace calcrun
