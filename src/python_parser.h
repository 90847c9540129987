#pragma once

#include "python_ast.h"
#include "python_lexer.h"
#include <string>
#include <vector>

namespace calcrun {

// Recursive-descent parser for Python 3 source. Builds the tree the static
// validator walks; it checks syntax only and evaluates nothing.
// Throws SyntaxError on malformed input.
class PythonParser {
public:
    static constexpr int MAX_NESTING = 200;

    explicit PythonParser(std::vector<Token> tokens, int initial_depth = 0);

    // file_input: statements up to ENDMARKER
    NodePtr parse_module();

    // A single expression followed by end of input (f-string fields)
    NodePtr parse_expression_input();

    // Tokenize and parse a whole module
    static NodePtr parse(const std::string& source);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    int depth_;

    class DepthGuard {
    public:
        explicit DepthGuard(PythonParser& parser);
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    private:
        PythonParser& parser_;
    };

    // Token helpers
    const Token& cur() const { return tokens_[pos_]; }
    const Token& lookahead(size_t n = 1) const;
    const Token& advance();
    bool at_op(const char* op) const { return cur().is_op(op); }
    bool at_kw(const char* kw) const { return cur().is_name(kw); }
    bool accept_op(const char* op);
    bool accept_kw(const char* kw);
    void expect_op(const char* op, const char* message = "invalid syntax");
    void expect_kw(const char* kw, const char* message = "invalid syntax");
    Token expect_name();
    bool at_identifier() const;
    bool at_expression_start() const;
    bool at_statement_end() const;
    bool at_comprehension() const;
    [[noreturn]] void error(const std::string& message) const;
    [[noreturn]] static void error_at(const Token& token, const std::string& message);
    [[noreturn]] static void error_at(const Node& node, const std::string& message);

    // Statements
    void parse_statement(Node& body);
    void parse_simple_statements(Node& body);
    NodePtr parse_simple_statement();
    NodePtr parse_expression_statement();
    NodePtr parse_import();
    NodePtr parse_from_import();
    std::string parse_dotted_name();
    void parse_block(Node& owner);
    NodePtr parse_if();
    NodePtr parse_while();
    NodePtr parse_for(bool is_async);
    NodePtr parse_try();
    NodePtr parse_with(bool is_async);
    NodePtr parse_with_item();
    NodePtr parse_decorated();
    NodePtr parse_async(std::vector<NodePtr> decorators);
    NodePtr parse_funcdef(std::vector<NodePtr> decorators, bool is_async);
    NodePtr parse_classdef(std::vector<NodePtr> decorators);
    NodePtr parse_parameters(const char* closer, bool annotations);
    NodePtr parse_parameter(bool annotations);

    // Expressions
    NodePtr parse_star_expressions();
    NodePtr parse_star_expression();
    NodePtr parse_star_named_expression();
    NodePtr parse_named_expression();
    NodePtr parse_expression();
    NodePtr parse_lambda();
    NodePtr parse_disjunction();
    NodePtr parse_conjunction();
    NodePtr parse_inversion();
    NodePtr parse_comparison();
    NodePtr parse_bitwise_or();
    NodePtr parse_bitwise_xor();
    NodePtr parse_bitwise_and();
    NodePtr parse_shift();
    NodePtr parse_sum();
    NodePtr parse_term();
    NodePtr parse_factor();
    NodePtr parse_power();
    NodePtr parse_await_primary();
    NodePtr parse_primary();
    NodePtr parse_atom();
    NodePtr parse_call(NodePtr func);
    void parse_arguments(std::vector<NodePtr>& args, std::vector<NodePtr>& keywords);
    NodePtr parse_slices();
    NodePtr parse_slice();
    NodePtr parse_paren();
    NodePtr parse_list();
    NodePtr parse_brace();
    NodePtr parse_comprehension(NodeKind kind, NodePtr element, NodePtr value = nullptr);
    NodePtr parse_yield_expression();
    NodePtr parse_target_list();
    NodePtr parse_strings();

    // f-strings
    void parse_fstring_body(const std::string& body, const Token& token, Node& joined);
    size_t parse_fstring_field(const std::string& body, size_t start, const Token& token,
                               Node& joined);
    NodePtr parse_fstring_expression(const std::string& text, const Token& token);

    // Target validation
    static void check_target(const Node& node);
    static void check_del_target(const Node& node);
    static std::string describe(const Node& node);
};

} // namespace calcrun
