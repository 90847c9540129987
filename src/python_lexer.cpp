#include "python_lexer.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>

namespace calcrun {

bool is_identifier_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_identifier_char(char c) {
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

namespace {

const char* const THREE_CHAR_OPS[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const TWO_CHAR_OPS[] = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="
};
const std::string ONE_CHAR_OPS = "+-*/%@&|^~<>()[]{},:;.=";

// Keywords that may directly follow a numeric literal ("1if x else 2")
const std::set<std::string> NUMBER_SUFFIX_KEYWORDS = {
    "and", "else", "for", "if", "in", "is", "not", "or"
};

bool is_string_prefix(std::string word) {
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::set<std::string> prefixes = {
        "r", "u", "b", "f", "br", "rb", "fr", "rf"
    };
    return prefixes.count(word) > 0;
}

// Invisible space and format characters are never part of a name. Returns
// the code point starting at text[pos], or 0 for anything else.
unsigned invisible_code_point(const std::string& text, size_t pos) {
    auto byte = [&text](size_t i) {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0u;
    };
    unsigned lead = byte(pos);
    unsigned code = 0;
    if (lead == 0xC2 && byte(pos + 1) == 0xA0) {
        code = 0xA0;
    } else if (lead == 0xE2 || lead == 0xEF) {
        unsigned b1 = byte(pos + 1), b2 = byte(pos + 2);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) return 0;
        code = ((lead & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
    }
    bool invisible = code == 0xA0 || (code >= 0x200B && code <= 0x200F) ||
                     code == 0x2028 || code == 0x2029 || code == 0x2060 || code == 0xFEFF;
    return invisible ? code : 0;
}

char closing_for(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

} // namespace

PythonLexer::PythonLexer(const std::string& source, int first_line)
    : line_(first_line) {
    // Universal newlines
    src_.reserve(source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        if (source[i] == '\r') {
            src_ += '\n';
            if (i + 1 < source.size() && source[i + 1] == '\n') ++i;
        } else {
            src_ += source[i];
        }
    }
}

void PythonLexer::newline_at(size_t newline_pos) {
    ++line_;
    line_start_ = newline_pos + 1;
}

void PythonLexer::emit(TokenType type, std::string text, int line, int column) {
    tokens_.push_back(Token{type, std::move(text), line, column});
}

void PythonLexer::fail(const std::string& message) const {
    throw SyntaxError(message, line_, column());
}

void PythonLexer::fail_at(const std::string& message, int line, int column) const {
    throw SyntaxError(message, line, column);
}

std::vector<Token> PythonLexer::tokenize() {
    if (src_.find('\0') != std::string::npos) {
        fail_at("source code cannot contain null bytes", line_, 0);
    }

    tokens_.clear();
    indents_.assign(1, 0);
    alt_indents_.assign(1, 0);
    brackets_.clear();

    bool at_line_start = true;
    while (pos_ < src_.size()) {
        if (at_line_start && brackets_.empty()) {
            if (!handle_indentation()) continue;
            at_line_start = false;
        }

        char c = peek();
        if (c == ' ' || c == '\t' || c == '\f') {
            ++pos_;
        } else if (c == '#') {
            while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        } else if (c == '\\') {
            if (peek(1) == '\n') {
                pos_ += 2;
                newline_at(pos_ - 1);
                if (brackets_.empty() &&
                    src_.find_first_not_of(" \t\f\n", pos_) == std::string::npos) {
                    fail("unexpected EOF while parsing");
                }
            } else if (pos_ + 1 >= src_.size()) {
                fail("unexpected EOF while parsing");
            } else {
                fail("unexpected character after line continuation character");
            }
        } else if (c == '\n') {
            if (brackets_.empty()) {
                emit(TokenType::NEWLINE, "\n", line_, column());
                at_line_start = true;
            }
            ++pos_;
            newline_at(pos_ - 1);
        } else if (unsigned code = invisible_code_point(src_, pos_)) {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "%04X", code);
            fail(std::string("invalid non-printable character U+") + hex);
        } else if (is_identifier_start(c)) {
            lex_name_or_string();
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            lex_number();
        } else if (c == '\'' || c == '"') {
            int line = line_;
            int col = column();
            lex_string(pos_, line, col);
        } else {
            lex_operator();
        }
    }

    if (!brackets_.empty()) {
        const Bracket& open = brackets_.back();
        fail_at(std::string("'") + open.open + "' was never closed", open.line, open.column);
    }

    if (!tokens_.empty() && tokens_.back().type != TokenType::NEWLINE &&
        tokens_.back().type != TokenType::DEDENT) {
        emit(TokenType::NEWLINE, "", line_, column());
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        emit(TokenType::DEDENT, "", line_, 0);
    }
    emit(TokenType::ENDMARKER, "", line_, 0);
    return std::move(tokens_);
}

// Measures the indentation of a new logical line. Returns false when the line
// is blank or a comment (consumed entirely) or the input ended.
bool PythonLexer::handle_indentation() {
    // col uses 8-column tab stops, alt_col counts a tab as one column. The two
    // must order the indentation levels the same way.
    size_t p = pos_;
    int col = 0;
    int alt_col = 0;
    while (p < src_.size()) {
        char c = src_[p];
        if (c == ' ') {
            ++col;
            ++alt_col;
        } else if (c == '\t') {
            col = (col / 8 + 1) * 8;
            ++alt_col;
        } else if (c == '\f') {
            col = alt_col = 0;
        } else {
            break;
        }
        ++p;
    }

    if (p >= src_.size()) {
        pos_ = p;
        return false;
    }
    if (src_[p] == '#' || src_[p] == '\n') {
        while (p < src_.size() && src_[p] != '\n') ++p;
        if (p < src_.size()) {
            ++p;
            newline_at(p - 1);
        }
        pos_ = p;
        return false;
    }

    pos_ = p;
    if (col == indents_.back()) {
        if (alt_col != alt_indents_.back()) {
            fail("inconsistent use of tabs and spaces in indentation");
        }
    } else if (col > indents_.back()) {
        if (alt_col <= alt_indents_.back()) {
            fail("inconsistent use of tabs and spaces in indentation");
        }
        if (static_cast<int>(indents_.size()) > MAX_INDENT_DEPTH) {
            fail("too many levels of indentation");
        }
        indents_.push_back(col);
        alt_indents_.push_back(alt_col);
        emit(TokenType::INDENT, "", line_, 0);
    } else {
        while (col < indents_.back()) {
            indents_.pop_back();
            alt_indents_.pop_back();
            emit(TokenType::DEDENT, "", line_, 0);
        }
        if (col != indents_.back()) {
            fail("unindent does not match any outer indentation level");
        }
        if (alt_col != alt_indents_.back()) {
            fail("inconsistent use of tabs and spaces in indentation");
        }
    }
    return true;
}

void PythonLexer::lex_name_or_string() {
    size_t start = pos_;
    int line = line_;
    int col = column();
    while (pos_ < src_.size() && is_identifier_char(src_[pos_]) &&
           !invisible_code_point(src_, pos_)) {
        ++pos_;
    }

    std::string word = src_.substr(start, pos_ - start);
    if ((peek() == '\'' || peek() == '"') && is_string_prefix(word)) {
        lex_string(start, line, col);
        return;
    }
    emit(TokenType::NAME, word, line, col);
}

void PythonLexer::lex_string(size_t prefix_start, int start_line, int start_column) {
    char quote = peek();
    bool triple = peek(1) == quote && peek(2) == quote;
    pos_ += triple ? 3 : 1;

    while (true) {
        if (pos_ >= src_.size()) {
            std::string detected = " (detected at line " + std::to_string(line_) + ")";
            fail_at(triple ? "unterminated triple-quoted string literal" + detected
                           : "unterminated string literal" + detected,
                    start_line, start_column);
        }

        char c = src_[pos_];
        if (c == '\\') {
            if (peek(1) == '\n') {
                pos_ += 2;
                newline_at(pos_ - 1);
            } else {
                pos_ = std::min(pos_ + 2, src_.size());
            }
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                fail_at("unterminated string literal (detected at line " +
                        std::to_string(line_) + ")", start_line, start_column);
            }
            ++pos_;
            newline_at(pos_ - 1);
            continue;
        }
        if (c == quote) {
            if (!triple) {
                ++pos_;
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                pos_ += 3;
                break;
            }
        }
        ++pos_;
    }

    emit(TokenType::STRING, src_.substr(prefix_start, pos_ - prefix_start),
         start_line, start_column);
}

void PythonLexer::lex_number() {
    size_t start = pos_;
    int line = line_;
    int col = column();
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    if (peek() == '0' && peek(1) && std::string("xXoObB").find(peek(1)) != std::string::npos) {
        char base = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
        const char* kind = base == 'x' ? "hexadecimal" : base == 'o' ? "octal" : "binary";
        auto accept = [base](char c) {
            unsigned char u = static_cast<unsigned char>(c);
            if (base == 'x') return std::isxdigit(u) != 0;
            if (base == 'o') return c >= '0' && c <= '7';
            return c == '0' || c == '1';
        };
        std::string error = std::string("invalid ") + kind + " literal";
        pos_ += 2;
        // "0x_ff" is valid, "0x" and "0x__f" are not
        if (peek() == '_') ++pos_;
        if (!consume_digits(accept, error)) {
            fail(error);
        }
        if (base != 'x' && is_digit(peek())) {
            fail(std::string("invalid digit '") + peek() + "' in " + kind + " literal");
        }
        check_number_end(error);
        emit(TokenType::NUMBER, src_.substr(start, pos_ - start), line, col);
        return;
    }

    const std::string error = "invalid decimal literal";
    bool is_integer = true;
    if (peek() != '.') {
        consume_digits(is_digit, error);
    }
    size_t integer_end = pos_;
    if (peek() == '.') {
        is_integer = false;
        ++pos_;
        if (is_digit(peek())) consume_digits(is_digit, error);
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
        is_integer = false;
        pos_ += is_digit(peek(1)) ? 1 : 2;
        consume_digits(is_digit, error);
    }
    if (peek() == 'j' || peek() == 'J') {
        is_integer = false;
        ++pos_;
    }

    if (is_integer && src_[start] == '0') {
        for (size_t i = start; i < integer_end; ++i) {
            if (src_[i] != '0' && src_[i] != '_') {
                fail_at("leading zeros in decimal integer literals are not permitted; "
                        "use an 0o prefix for octal integers", line, col);
            }
        }
    }

    check_number_end(error);
    emit(TokenType::NUMBER, src_.substr(start, pos_ - start), line, col);
}

// Digit run in which '_' may only separate two digits. Returns false when
// no digit was consumed.
bool PythonLexer::consume_digits(const std::function<bool(char)>& accept,
                                 const std::string& error) {
    size_t begin = pos_;
    while (true) {
        while (accept(peek())) ++pos_;
        if (peek() != '_') break;
        if (pos_ == begin || !accept(peek(1))) {
            ++pos_;
            fail(error);
        }
        ++pos_;
    }
    return pos_ > begin;
}

// A literal directly followed by a name is malformed, except for the
// keywords that may legally abut it ("1if x else 2")
void PythonLexer::check_number_end(const std::string& error) {
    if (!is_identifier_char(peek()) || invisible_code_point(src_, pos_)) return;
    size_t word_end = pos_;
    while (word_end < src_.size() && is_identifier_char(src_[word_end])) ++word_end;
    if (!NUMBER_SUFFIX_KEYWORDS.count(src_.substr(pos_, word_end - pos_))) {
        fail(error);
    }
}

void PythonLexer::lex_operator() {
    int line = line_;
    int col = column();

    for (const char* op : THREE_CHAR_OPS) {
        if (src_.compare(pos_, 3, op) == 0) {
            pos_ += 3;
            emit(TokenType::OP, op, line, col);
            return;
        }
    }
    for (const char* op : TWO_CHAR_OPS) {
        if (src_.compare(pos_, 2, op) == 0) {
            pos_ += 2;
            emit(TokenType::OP, op, line, col);
            return;
        }
    }

    char c = peek();
    if (ONE_CHAR_OPS.find(c) == std::string::npos) {
        if (std::isprint(static_cast<unsigned char>(c))) {
            fail("invalid syntax");
        }
        fail("invalid non-printable character");
    }

    if (c == '(' || c == '[' || c == '{') {
        if (static_cast<int>(brackets_.size()) >= MAX_BRACKET_DEPTH) {
            fail("too many nested parentheses");
        }
        brackets_.push_back(Bracket{c, line, col});
    } else if (c == ')' || c == ']' || c == '}') {
        if (brackets_.empty()) {
            fail(std::string("unmatched '") + c + "'");
        }
        const Bracket& open = brackets_.back();
        if (closing_for(open.open) != c) {
            std::string message = std::string("closing parenthesis '") + c +
                "' does not match opening parenthesis '" + open.open + "'";
            if (open.line != line) {
                message += " on line " + std::to_string(open.line);
            }
            fail(message);
        }
        brackets_.pop_back();
    }

    ++pos_;
    emit(TokenType::OP, std::string(1, c), line, col);
}

} // namespace calcrun
