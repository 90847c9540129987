#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace calcrun {

// Raised by the lexer and parser. line is 1-based, column 0-based.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, int line, int column)
        : std::runtime_error(message), line_(line), column_(column) {}

    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

enum class TokenType {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    ENDMARKER
};

struct Token {
    TokenType type;
    std::string text;       // STRING tokens keep prefix and quotes
    int line;
    int column;

    bool is_op(const char* op) const { return type == TokenType::OP && text == op; }
    bool is_name(const char* name) const { return type == TokenType::NAME && text == name; }
};

// Python 3 tokenizer. Produces the logical-line token stream the parser
// consumes: comments and blank lines dropped, continuation lines joined,
// INDENT/DEDENT synthesized from leading whitespace.
class PythonLexer {
public:
    static constexpr int MAX_BRACKET_DEPTH = 200;
    static constexpr int MAX_INDENT_DEPTH = 100;

    explicit PythonLexer(const std::string& source, int first_line = 1);

    std::vector<Token> tokenize();

private:
    std::string src_;
    size_t pos_ = 0;
    int line_;
    size_t line_start_ = 0;

    std::vector<Token> tokens_;
    std::vector<int> indents_;
    std::vector<int> alt_indents_;
    struct Bracket {
        char open;
        int line;
        int column;
    };
    std::vector<Bracket> brackets_;

    int column() const { return static_cast<int>(pos_ - line_start_); }
    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }
    void newline_at(size_t newline_pos);
    void emit(TokenType type, std::string text, int line, int column);
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_at(const std::string& message, int line, int column) const;

    bool handle_indentation();
    void lex_name_or_string();
    void lex_string(size_t prefix_start, int start_line, int start_column);
    void lex_number();
    bool consume_digits(const std::function<bool(char)>& accept, const std::string& error);
    void check_number_end(const std::string& error);
    void lex_operator();
};

// Identifier character classes shared with the parser
bool is_identifier_start(char c);
bool is_identifier_char(char c);

} // namespace calcrun
