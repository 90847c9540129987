#include "python_parser.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace calcrun {

namespace {

const std::set<std::string> KEYWORDS = {
    "False", "None", "True", "and", "as", "assert", "async", "await",
    "break", "class", "continue", "def", "del", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is",
    "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
    "while", "with", "yield"
};

const std::set<std::string> AUGMENTED_OPS = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="
};

const std::set<std::string> COMPARISON_OPS = {"<", ">", "==", ">=", "<=", "!="};

bool is_keyword(const Token& token) {
    return token.type == TokenType::NAME && KEYWORDS.count(token.text) > 0;
}

// Splits a STRING token into its lowercase prefix and the body between quotes
void split_string_token(const std::string& text, std::string& prefix, std::string& body) {
    size_t quote = text.find_first_of("'\"");
    prefix = text.substr(0, quote);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    char q = text[quote];
    size_t quote_len = (text.size() >= quote + 6 && text[quote + 1] == q && text[quote + 2] == q) ? 3 : 1;
    body = text.substr(quote + quote_len, text.size() - quote - 2 * quote_len);
}

} // namespace

PythonParser::DepthGuard::DepthGuard(PythonParser& parser) : parser_(parser) {
    if (++parser_.depth_ > MAX_NESTING) {
        --parser_.depth_;
        parser_.error("too many nested expressions");
    }
}

PythonParser::PythonParser(std::vector<Token> tokens, int initial_depth)
    : tokens_(std::move(tokens)), depth_(initial_depth) {
    if (tokens_.empty() || tokens_.back().type != TokenType::ENDMARKER) {
        int line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.push_back(Token{TokenType::ENDMARKER, "", line, 0});
    }
}

NodePtr PythonParser::parse(const std::string& source) {
    PythonLexer lexer(source);
    PythonParser parser(lexer.tokenize());
    return parser.parse_module();
}

// ---------------------------------------------------------------------------
// Token helpers
// ---------------------------------------------------------------------------

const Token& PythonParser::lookahead(size_t n) const {
    size_t index = std::min(pos_ + n, tokens_.size() - 1);
    return tokens_[index];
}

const Token& PythonParser::advance() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return token;
}

bool PythonParser::accept_op(const char* op) {
    if (!at_op(op)) return false;
    advance();
    return true;
}

bool PythonParser::accept_kw(const char* kw) {
    if (!at_kw(kw)) return false;
    advance();
    return true;
}

void PythonParser::expect_op(const char* op, const char* message) {
    if (!accept_op(op)) error(message);
}

void PythonParser::expect_kw(const char* kw, const char* message) {
    if (!accept_kw(kw)) error(message);
}

Token PythonParser::expect_name() {
    if (!at_identifier()) error("invalid syntax");
    return advance();
}

bool PythonParser::at_identifier() const {
    return cur().type == TokenType::NAME && !is_keyword(cur());
}

bool PythonParser::at_expression_start() const {
    const Token& t = cur();
    switch (t.type) {
        case TokenType::NAME:
            return !is_keyword(t) || t.text == "not" || t.text == "lambda" ||
                   t.text == "await" || t.text == "True" || t.text == "False" ||
                   t.text == "None";
        case TokenType::NUMBER:
        case TokenType::STRING:
            return true;
        case TokenType::OP:
            return t.text == "(" || t.text == "[" || t.text == "{" || t.text == "-" ||
                   t.text == "+" || t.text == "~" || t.text == "*" || t.text == "...";
        default:
            return false;
    }
}

bool PythonParser::at_statement_end() const {
    return cur().type == TokenType::NEWLINE || at_op(";") || cur().type == TokenType::ENDMARKER;
}

bool PythonParser::at_comprehension() const {
    return at_kw("for") || (at_kw("async") && lookahead().is_name("for"));
}

void PythonParser::error(const std::string& message) const {
    const Token& t = cur();
    if (t.type == TokenType::INDENT) {
        throw SyntaxError("unexpected indent", t.line, t.column);
    }
    throw SyntaxError(message, t.line, t.column);
}

void PythonParser::error_at(const Token& token, const std::string& message) {
    throw SyntaxError(message, token.line, token.column);
}

void PythonParser::error_at(const Node& node, const std::string& message) {
    throw SyntaxError(message, node.line, node.column);
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

NodePtr PythonParser::parse_module() {
    auto module = make_node(NodeKind::Module, 1, 0);
    while (cur().type != TokenType::ENDMARKER) {
        if (cur().type == TokenType::NEWLINE) {
            advance();
            continue;
        }
        parse_statement(*module);
    }
    return module;
}

NodePtr PythonParser::parse_expression_input() {
    NodePtr expr = parse_star_expressions();
    while (cur().type == TokenType::NEWLINE) advance();
    if (cur().type != TokenType::ENDMARKER) error("invalid syntax");
    return expr;
}

void PythonParser::parse_statement(Node& body) {
    DepthGuard guard(*this);
    const Token& t = cur();

    if (t.type == TokenType::INDENT) error_at(t, "unexpected indent");
    if (t.type == TokenType::DEDENT) {
        error_at(t, "unindent does not match any outer indentation level");
    }

    if (t.type == TokenType::NAME) {
        if (t.text == "if") { body.add(parse_if()); return; }
        if (t.text == "while") { body.add(parse_while()); return; }
        if (t.text == "for") { body.add(parse_for(false)); return; }
        if (t.text == "try") { body.add(parse_try()); return; }
        if (t.text == "with") { body.add(parse_with(false)); return; }
        if (t.text == "def") { body.add(parse_funcdef({}, false)); return; }
        if (t.text == "class") { body.add(parse_classdef({})); return; }
        if (t.text == "async") { body.add(parse_async({})); return; }
    } else if (t.is_op("@")) {
        body.add(parse_decorated());
        return;
    }
    parse_simple_statements(body);
}

void PythonParser::parse_simple_statements(Node& body) {
    body.add(parse_simple_statement());
    while (accept_op(";")) {
        if (cur().type == TokenType::NEWLINE) break;
        body.add(parse_simple_statement());
    }
    if (cur().type != TokenType::NEWLINE) error("invalid syntax");
    advance();
}

NodePtr PythonParser::parse_simple_statement() {
    const Token t = cur();
    if (t.type == TokenType::NAME) {
        if (t.text == "pass" || t.text == "break" || t.text == "continue") {
            advance();
            NodeKind kind = t.text == "pass" ? NodeKind::Pass
                          : t.text == "break" ? NodeKind::Break : NodeKind::Continue;
            return make_node(kind, t.line, t.column);
        }
        if (t.text == "return") {
            advance();
            auto node = make_node(NodeKind::Return, t.line, t.column);
            if (!at_statement_end()) node->add(parse_star_expressions());
            return node;
        }
        if (t.text == "raise") {
            advance();
            auto node = make_node(NodeKind::Raise, t.line, t.column);
            if (!at_statement_end()) {
                node->add(parse_expression());
                if (accept_kw("from")) node->add(parse_expression());
            }
            return node;
        }
        if (t.text == "global" || t.text == "nonlocal") {
            advance();
            auto node = make_node(t.text == "global" ? NodeKind::Global : NodeKind::Nonlocal,
                                  t.line, t.column);
            do {
                Token name = expect_name();
                if (!node->value.empty()) node->value += ",";
                node->value += name.text;
            } while (accept_op(","));
            return node;
        }
        if (t.text == "del") {
            advance();
            auto node = make_node(NodeKind::Delete, t.line, t.column);
            do {
                if (at_statement_end()) break;
                NodePtr target = parse_bitwise_or();
                check_del_target(*target);
                node->add(std::move(target));
            } while (accept_op(","));
            if (node->children.empty()) error("invalid syntax");
            return node;
        }
        if (t.text == "assert") {
            advance();
            auto node = make_node(NodeKind::Assert, t.line, t.column);
            node->add(parse_expression());
            if (accept_op(",")) node->add(parse_expression());
            return node;
        }
        if (t.text == "import") return parse_import();
        if (t.text == "from") return parse_from_import();
    }
    return parse_expression_statement();
}

NodePtr PythonParser::parse_expression_statement() {
    const Token start = cur();
    NodePtr first = at_kw("yield") ? parse_yield_expression() : parse_star_expressions();

    if (at_op("=")) {
        auto node = make_node(NodeKind::Assign, start.line, start.column);
        std::vector<NodePtr> parts;
        parts.push_back(std::move(first));
        while (accept_op("=")) {
            parts.push_back(at_kw("yield") ? parse_yield_expression() : parse_star_expressions());
        }
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            check_target(*parts[i]);
            node->add(std::move(parts[i]));
        }
        node->add(std::move(parts.back()));
        return node;
    }

    if (cur().type == TokenType::OP && AUGMENTED_OPS.count(cur().text)) {
        if (first->kind != NodeKind::Name && first->kind != NodeKind::Attribute &&
            first->kind != NodeKind::Subscript) {
            error_at(*first, "'" + describe(*first) +
                     "' is an illegal expression for augmented assignment");
        }
        auto node = make_node(NodeKind::AugAssign, start.line, start.column);
        node->name = advance().text;
        node->add(std::move(first));
        node->add(at_kw("yield") ? parse_yield_expression() : parse_star_expressions());
        return node;
    }

    if (at_op(":")) {
        if (first->kind == NodeKind::Tuple) {
            error_at(*first, "only single target (not tuple) can be annotated");
        }
        if (first->kind != NodeKind::Name && first->kind != NodeKind::Attribute &&
            first->kind != NodeKind::Subscript) {
            error_at(*first, "illegal target for annotation");
        }
        advance();
        auto node = make_node(NodeKind::AnnAssign, start.line, start.column);
        node->add(std::move(first));
        node->add(parse_expression());
        if (accept_op("=")) {
            node->add(at_kw("yield") ? parse_yield_expression() : parse_star_expressions());
        }
        return node;
    }

    auto node = make_node(NodeKind::Expr, start.line, start.column);
    node->add(std::move(first));
    return node;
}

std::string PythonParser::parse_dotted_name() {
    std::string name = expect_name().text;
    while (at_op(".")) {
        advance();
        name += "." + expect_name().text;
    }
    return name;
}

NodePtr PythonParser::parse_import() {
    const Token t = advance();
    auto node = make_node(NodeKind::Import, t.line, t.column);
    do {
        const Token& start = cur();
        auto alias = make_node(NodeKind::Alias, start.line, start.column);
        alias->name = parse_dotted_name();
        if (accept_kw("as")) alias->value = expect_name().text;
        node->add(std::move(alias));
    } while (accept_op(","));
    return node;
}

NodePtr PythonParser::parse_from_import() {
    const Token t = advance();
    auto node = make_node(NodeKind::ImportFrom, t.line, t.column);

    while (at_op(".") || at_op("...")) {
        node->level += static_cast<int>(advance().text.size());
    }
    if (!at_kw("import")) {
        node->name = parse_dotted_name();
    } else if (node->level == 0) {
        error("invalid syntax");
    }
    expect_kw("import");

    if (at_op("*")) {
        const Token& star = advance();
        auto alias = make_node(NodeKind::Alias, star.line, star.column);
        alias->name = "*";
        node->add(std::move(alias));
        return node;
    }

    bool parenthesized = accept_op("(");
    do {
        if (parenthesized && at_op(")")) break;
        const Token name = expect_name();
        auto alias = make_node(NodeKind::Alias, name.line, name.column);
        alias->name = name.text;
        if (accept_kw("as")) alias->value = expect_name().text;
        node->add(std::move(alias));
    } while (accept_op(","));

    if (node->children.empty()) error("invalid syntax");
    if (parenthesized) expect_op(")");
    else if (!at_statement_end()) error("trailing comma not allowed without surrounding parentheses");
    return node;
}

void PythonParser::parse_block(Node& owner) {
    expect_op(":", "expected ':'");
    if (cur().type != TokenType::NEWLINE) {
        parse_simple_statements(owner);
        return;
    }
    advance();
    if (cur().type != TokenType::INDENT) {
        error_at(cur(), "expected an indented block");
    }
    advance();
    while (cur().type != TokenType::DEDENT && cur().type != TokenType::ENDMARKER) {
        parse_statement(owner);
    }
    if (cur().type == TokenType::DEDENT) advance();
}

NodePtr PythonParser::parse_if() {
    const Token t = advance();
    auto node = make_node(NodeKind::If, t.line, t.column);
    node->add(parse_named_expression());
    parse_block(*node);

    // elif chains nest in orelse
    Node* tail = node.get();
    while (at_kw("elif")) {
        const Token e = advance();
        auto branch = make_node(NodeKind::If, e.line, e.column);
        branch->add(parse_named_expression());
        parse_block(*branch);
        tail = tail->add(std::move(branch));
    }
    if (accept_kw("else")) parse_block(*tail);
    return node;
}

NodePtr PythonParser::parse_while() {
    const Token t = advance();
    auto node = make_node(NodeKind::While, t.line, t.column);
    node->add(parse_named_expression());
    parse_block(*node);
    if (accept_kw("else")) parse_block(*node);
    return node;
}

NodePtr PythonParser::parse_for(bool is_async) {
    const Token t = advance();
    auto node = make_node(is_async ? NodeKind::AsyncFor : NodeKind::For, t.line, t.column);
    NodePtr target = parse_target_list();
    check_target(*target);
    node->add(std::move(target));
    expect_kw("in");
    node->add(parse_star_expressions());
    parse_block(*node);
    if (accept_kw("else")) parse_block(*node);
    return node;
}

NodePtr PythonParser::parse_try() {
    const Token t = advance();
    auto node = make_node(NodeKind::Try, t.line, t.column);
    parse_block(*node);

    bool has_handlers = false;
    bool has_finally = false;
    while (at_kw("except")) {
        const Token e = advance();
        auto handler = make_node(NodeKind::ExceptHandler, e.line, e.column);
        if (accept_op("*")) node->kind = NodeKind::TryStar;
        if (!at_op(":")) {
            handler->add(parse_expression());
            if (at_op(",")) error("multiple exception types must be parenthesized");
            if (accept_kw("as")) handler->name = expect_name().text;
        }
        parse_block(*handler);
        node->add(std::move(handler));
        has_handlers = true;
    }
    if (at_kw("else")) {
        if (!has_handlers) error("invalid syntax");
        advance();
        parse_block(*node);
    }
    if (accept_kw("finally")) {
        parse_block(*node);
        has_finally = true;
    }
    if (!has_handlers && !has_finally) error("expected 'except' or 'finally' block");
    return node;
}

NodePtr PythonParser::parse_with_item() {
    const Token& start = cur();
    auto item = make_node(NodeKind::WithItem, start.line, start.column);
    item->add(parse_expression());
    if (accept_kw("as")) {
        NodePtr target = parse_bitwise_or();
        check_target(*target);
        item->add(std::move(target));
    }
    return item;
}

NodePtr PythonParser::parse_with(bool is_async) {
    const Token t = advance();
    auto node = make_node(is_async ? NodeKind::AsyncWith : NodeKind::With, t.line, t.column);

    std::vector<NodePtr> items;
    if (at_op("(")) {
        // Parenthesized item list; fall back to a plain expression on failure
        size_t saved = pos_;
        try {
            advance();
            do {
                if (at_op(")")) break;
                items.push_back(parse_with_item());
            } while (accept_op(","));
            expect_op(")");
            if (!at_op(":")) error("expected ':'");
        } catch (const SyntaxError&) {
            pos_ = saved;
            items.clear();
        }
    }
    if (items.empty()) {
        do {
            items.push_back(parse_with_item());
        } while (accept_op(","));
    }

    for (auto& item : items) node->add(std::move(item));
    parse_block(*node);
    return node;
}

NodePtr PythonParser::parse_decorated() {
    std::vector<NodePtr> decorators;
    while (accept_op("@")) {
        decorators.push_back(parse_named_expression());
        if (cur().type != TokenType::NEWLINE) error("invalid syntax");
        advance();
    }
    if (at_kw("def")) return parse_funcdef(std::move(decorators), false);
    if (at_kw("class")) return parse_classdef(std::move(decorators));
    if (at_kw("async")) return parse_async(std::move(decorators));
    error("invalid syntax");
}

NodePtr PythonParser::parse_async(std::vector<NodePtr> decorators) {
    advance();
    if (at_kw("def")) return parse_funcdef(std::move(decorators), true);
    if (decorators.empty()) {
        if (at_kw("for")) return parse_for(true);
        if (at_kw("with")) return parse_with(true);
    }
    error("invalid syntax");
}

NodePtr PythonParser::parse_funcdef(std::vector<NodePtr> decorators, bool is_async) {
    const Token t = advance();
    auto node = make_node(is_async ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef,
                          t.line, t.column);
    node->name = expect_name().text;

    expect_op("(", "expected '('");
    node->add(parse_parameters(")", true));
    expect_op(")");

    NodePtr returns;
    if (accept_op("->")) returns = parse_expression();

    parse_block(*node);
    for (auto& decorator : decorators) node->add(std::move(decorator));
    node->add(std::move(returns));
    return node;
}

NodePtr PythonParser::parse_classdef(std::vector<NodePtr> decorators) {
    const Token t = advance();
    auto node = make_node(NodeKind::ClassDef, t.line, t.column);
    node->name = expect_name().text;

    if (accept_op("(")) {
        std::vector<NodePtr> bases;
        std::vector<NodePtr> keywords;
        parse_arguments(bases, keywords);
        expect_op(")");
        for (auto& base : bases) node->add(std::move(base));
        for (auto& keyword : keywords) node->add(std::move(keyword));
    }

    parse_block(*node);
    for (auto& decorator : decorators) node->add(std::move(decorator));
    return node;
}

NodePtr PythonParser::parse_parameter(bool annotations) {
    const Token name = expect_name();
    auto arg = make_node(NodeKind::Arg, name.line, name.column);
    arg->name = name.text;
    if (annotations && accept_op(":")) arg->add(parse_expression());
    return arg;
}

NodePtr PythonParser::parse_parameters(const char* closer, bool annotations) {
    const Token& start = cur();
    auto node = make_node(NodeKind::Arguments, start.line, start.column);

    std::vector<NodePtr> posonly, regular, kwonly, kw_defaults, defaults;
    NodePtr vararg, kwarg;
    bool seen_star = false;
    bool seen_slash = false;
    bool seen_default = false;

    while (!at_op(closer)) {
        if (accept_op("/")) {
            if (seen_slash || seen_star || regular.empty()) {
                error_at(tokens_[pos_ - 1], "invalid syntax");
            }
            for (auto& p : regular) posonly.push_back(std::move(p));
            regular.clear();
            seen_slash = true;
        } else if (accept_op("**")) {
            kwarg = parse_parameter(annotations);
            accept_op(",");
            if (!at_op(closer)) error("arguments cannot follow var-keyword argument");
            break;
        } else if (accept_op("*")) {
            if (seen_star) error("* argument may appear only once");
            seen_star = true;
            if (!at_op(",")) vararg = parse_parameter(annotations);
        } else {
            NodePtr param = parse_parameter(annotations);
            NodePtr value;
            if (accept_op("=")) value = parse_expression();
            if (seen_star) {
                kwonly.push_back(std::move(param));
                kw_defaults.push_back(std::move(value));
            } else {
                if (value) {
                    defaults.push_back(std::move(value));
                    seen_default = true;
                } else if (seen_default) {
                    error_at(*param, "non-default argument follows default argument");
                }
                regular.push_back(std::move(param));
            }
        }
        if (!accept_op(",")) break;
    }

    if (seen_star && !vararg && kwonly.empty()) {
        error("named arguments must follow bare *");
    }

    for (auto& p : posonly) node->add(std::move(p));
    for (auto& p : regular) node->add(std::move(p));
    node->add(std::move(vararg));
    for (auto& p : kwonly) node->add(std::move(p));
    for (auto& d : kw_defaults) node->add(std::move(d));
    node->add(std::move(kwarg));
    for (auto& d : defaults) node->add(std::move(d));
    return node;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

NodePtr PythonParser::parse_star_expressions() {
    const Token start = cur();
    NodePtr first = parse_star_expression();
    if (!at_op(",")) return first;

    auto tuple = make_node(NodeKind::Tuple, start.line, start.column);
    tuple->add(std::move(first));
    while (accept_op(",")) {
        if (!at_expression_start()) break;
        tuple->add(parse_star_expression());
    }
    return tuple;
}

NodePtr PythonParser::parse_star_expression() {
    if (at_op("*")) {
        const Token star = advance();
        auto node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_bitwise_or());
        return node;
    }
    return parse_expression();
}

NodePtr PythonParser::parse_star_named_expression() {
    if (at_op("*")) {
        const Token star = advance();
        auto node = make_node(NodeKind::Starred, star.line, star.column);
        node->add(parse_bitwise_or());
        return node;
    }
    return parse_named_expression();
}

NodePtr PythonParser::parse_named_expression() {
    if (at_identifier() && lookahead().is_op(":=")) {
        const Token name = advance();
        advance();
        auto node = make_node(NodeKind::NamedExpr, name.line, name.column);
        auto target = make_node(NodeKind::Name, name.line, name.column);
        target->name = name.text;
        node->add(std::move(target));
        node->add(parse_expression());
        return node;
    }
    NodePtr expr = parse_expression();
    if (at_op(":=")) {
        error_at(*expr, "cannot use assignment expressions with " + describe(*expr));
    }
    return expr;
}

NodePtr PythonParser::parse_expression() {
    DepthGuard guard(*this);
    if (at_kw("lambda")) return parse_lambda();

    NodePtr body = parse_disjunction();
    if (!at_kw("if")) return body;

    const Token t = advance();
    auto node = make_node(NodeKind::IfExp, body->line, body->column);
    node->add(parse_disjunction());
    if (!accept_kw("else")) error_at(t, "expected 'else' after 'if' expression");
    node->add(std::move(body));
    node->add(parse_expression());
    return node;
}

NodePtr PythonParser::parse_lambda() {
    const Token t = advance();
    auto node = make_node(NodeKind::Lambda, t.line, t.column);
    node->add(parse_parameters(":", false));
    expect_op(":");
    node->add(parse_expression());
    return node;
}

NodePtr PythonParser::parse_disjunction() {
    NodePtr first = parse_conjunction();
    if (!at_kw("or")) return first;
    auto node = make_node(NodeKind::BoolOp, first->line, first->column);
    node->name = "or";
    node->add(std::move(first));
    while (accept_kw("or")) node->add(parse_conjunction());
    return node;
}

NodePtr PythonParser::parse_conjunction() {
    NodePtr first = parse_inversion();
    if (!at_kw("and")) return first;
    auto node = make_node(NodeKind::BoolOp, first->line, first->column);
    node->name = "and";
    node->add(std::move(first));
    while (accept_kw("and")) node->add(parse_inversion());
    return node;
}

NodePtr PythonParser::parse_inversion() {
    if (at_kw("not")) {
        DepthGuard guard(*this);
        const Token t = advance();
        auto node = make_node(NodeKind::UnaryOp, t.line, t.column);
        node->name = "not";
        node->add(parse_inversion());
        return node;
    }
    return parse_comparison();
}

NodePtr PythonParser::parse_comparison() {
    NodePtr left = parse_bitwise_or();
    NodePtr node;
    while (true) {
        std::string op;
        if (cur().type == TokenType::OP && COMPARISON_OPS.count(cur().text)) {
            op = advance().text;
        } else if (at_kw("in")) {
            advance();
            op = "in";
        } else if (at_kw("not") && lookahead().is_name("in")) {
            advance();
            advance();
            op = "not in";
        } else if (at_kw("is")) {
            advance();
            op = accept_kw("not") ? "is not" : "is";
        } else {
            break;
        }
        if (!node) {
            node = make_node(NodeKind::Compare, left->line, left->column);
            node->add(std::move(left));
        }
        node->name += node->name.empty() ? op : " " + op;
        node->add(parse_bitwise_or());
    }
    return node ? std::move(node) : std::move(left);
}

namespace {

// Left-associative binary operator chain
NodePtr parse_left_assoc(const std::function<NodePtr()>& next,
                         const std::function<bool()>& at_operator,
                         const std::function<std::string()>& take_operator) {
    NodePtr left = next();
    while (at_operator()) {
        std::string op = take_operator();
        auto node = make_node(NodeKind::BinOp, left->line, left->column);
        node->name = op;
        node->add(std::move(left));
        node->add(next());
        left = std::move(node);
    }
    return left;
}

} // namespace

NodePtr PythonParser::parse_bitwise_or() {
    return parse_left_assoc([this] { return parse_bitwise_xor(); },
                            [this] { return at_op("|"); },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_bitwise_xor() {
    return parse_left_assoc([this] { return parse_bitwise_and(); },
                            [this] { return at_op("^"); },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_bitwise_and() {
    return parse_left_assoc([this] { return parse_shift(); },
                            [this] { return at_op("&"); },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_shift() {
    return parse_left_assoc([this] { return parse_sum(); },
                            [this] { return at_op("<<") || at_op(">>"); },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_sum() {
    return parse_left_assoc([this] { return parse_term(); },
                            [this] { return at_op("+") || at_op("-"); },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_term() {
    return parse_left_assoc([this] { return parse_factor(); },
                            [this] {
                                return at_op("*") || at_op("/") || at_op("//") ||
                                       at_op("%") || at_op("@");
                            },
                            [this] { return advance().text; });
}

NodePtr PythonParser::parse_factor() {
    if (at_op("+") || at_op("-") || at_op("~")) {
        DepthGuard guard(*this);
        const Token t = advance();
        auto node = make_node(NodeKind::UnaryOp, t.line, t.column);
        node->name = t.text;
        node->add(parse_factor());
        return node;
    }
    return parse_power();
}

NodePtr PythonParser::parse_power() {
    NodePtr base = parse_await_primary();
    if (!at_op("**")) return base;
    advance();
    auto node = make_node(NodeKind::BinOp, base->line, base->column);
    node->name = "**";
    node->add(std::move(base));
    node->add(parse_factor());
    return node;
}

NodePtr PythonParser::parse_await_primary() {
    if (at_kw("await")) {
        DepthGuard guard(*this);
        const Token t = advance();
        auto node = make_node(NodeKind::Await, t.line, t.column);
        node->add(parse_primary());
        return node;
    }
    return parse_primary();
}

NodePtr PythonParser::parse_primary() {
    NodePtr node = parse_atom();
    int trailers = 0;
    while (true) {
        if (++trailers > MAX_NESTING * 10) error("too many nested expressions");
        if (at_op(".")) {
            advance();
            const Token attr = expect_name();
            auto access = make_node(NodeKind::Attribute, node->line, node->column);
            access->name = attr.text;
            access->add(std::move(node));
            node = std::move(access);
        } else if (at_op("(")) {
            node = parse_call(std::move(node));
        } else if (at_op("[")) {
            advance();
            auto subscript = make_node(NodeKind::Subscript, node->line, node->column);
            subscript->add(std::move(node));
            subscript->add(parse_slices());
            expect_op("]");
            node = std::move(subscript);
        } else {
            break;
        }
    }
    return node;
}

NodePtr PythonParser::parse_call(NodePtr func) {
    advance();
    auto node = make_node(NodeKind::Call, func->line, func->column);
    node->add(std::move(func));

    std::vector<NodePtr> args;
    std::vector<NodePtr> keywords;
    parse_arguments(args, keywords);
    expect_op(")");

    for (auto& arg : args) node->add(std::move(arg));
    for (auto& keyword : keywords) node->add(std::move(keyword));
    return node;
}

void PythonParser::parse_arguments(std::vector<NodePtr>& args, std::vector<NodePtr>& keywords) {
    bool seen_keyword = false;
    bool seen_unpack = false;

    while (!at_op(")")) {
        if (at_op("**")) {
            const Token t = advance();
            auto keyword = make_node(NodeKind::Keyword, t.line, t.column);
            keyword->add(parse_expression());
            keywords.push_back(std::move(keyword));
            seen_unpack = true;
        } else if (at_op("*")) {
            const Token t = advance();
            if (seen_unpack) {
                error_at(t, "iterable argument unpacking follows keyword argument unpacking");
            }
            auto starred = make_node(NodeKind::Starred, t.line, t.column);
            starred->add(parse_expression());
            args.push_back(std::move(starred));
        } else if (at_identifier() && lookahead().is_op("=")) {
            const Token name = advance();
            advance();
            auto keyword = make_node(NodeKind::Keyword, name.line, name.column);
            keyword->name = name.text;
            keyword->add(parse_expression());
            keywords.push_back(std::move(keyword));
            seen_keyword = true;
        } else {
            NodePtr value = parse_named_expression();
            if (at_comprehension()) {
                NodePtr generator = parse_comprehension(NodeKind::GeneratorExp, std::move(value));
                if (!args.empty() || !keywords.empty() || !at_op(")")) {
                    error_at(*generator, "Generator expression must be parenthesized");
                }
                args.push_back(std::move(generator));
                break;
            }
            if (seen_unpack) {
                error_at(*value, "positional argument follows keyword argument unpacking");
            }
            if (seen_keyword) {
                error_at(*value, "positional argument follows keyword argument");
            }
            args.push_back(std::move(value));
        }
        if (!accept_op(",")) break;
    }
}

NodePtr PythonParser::parse_slices() {
    const Token start = cur();
    NodePtr first = parse_slice();
    if (!at_op(",")) return first;

    auto tuple = make_node(NodeKind::Tuple, start.line, start.column);
    tuple->add(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) break;
        tuple->add(parse_slice());
    }
    return tuple;
}

NodePtr PythonParser::parse_slice() {
    const Token start = cur();
    NodePtr lower;
    if (!at_op(":")) {
        lower = parse_star_named_expression();
        if (!at_op(":")) return lower;
    }

    auto node = make_node(NodeKind::Slice, start.line, start.column);
    advance();
    node->add(std::move(lower));
    if (!at_op(":") && !at_op("]") && !at_op(",")) node->add(parse_expression());
    if (accept_op(":")) {
        if (!at_op("]") && !at_op(",")) node->add(parse_expression());
    }
    return node;
}

NodePtr PythonParser::parse_atom() {
    DepthGuard guard(*this);
    const Token& t = cur();

    switch (t.type) {
        case TokenType::NAME: {
            if (t.text == "True" || t.text == "False" || t.text == "None") {
                auto node = make_node(NodeKind::Constant, t.line, t.column);
                node->value = t.text;
                advance();
                return node;
            }
            if (is_keyword(t)) error("invalid syntax");
            auto node = make_node(NodeKind::Name, t.line, t.column);
            node->name = t.text;
            advance();
            return node;
        }
        case TokenType::NUMBER: {
            auto node = make_node(NodeKind::Constant, t.line, t.column);
            node->value = t.text;
            advance();
            return node;
        }
        case TokenType::STRING:
            return parse_strings();
        case TokenType::OP:
            if (t.text == "(") return parse_paren();
            if (t.text == "[") return parse_list();
            if (t.text == "{") return parse_brace();
            if (t.text == "...") {
                auto node = make_node(NodeKind::Constant, t.line, t.column);
                node->value = "...";
                advance();
                return node;
            }
            break;
        default:
            break;
    }
    error("invalid syntax");
}

NodePtr PythonParser::parse_paren() {
    const Token open = advance();
    if (accept_op(")")) return make_node(NodeKind::Tuple, open.line, open.column);

    if (at_kw("yield")) {
        NodePtr node = parse_yield_expression();
        expect_op(")");
        return node;
    }

    NodePtr first = parse_star_named_expression();
    if (at_comprehension()) {
        NodePtr node = parse_comprehension(NodeKind::GeneratorExp, std::move(first));
        expect_op(")");
        return node;
    }
    if (accept_op(")")) {
        if (first->kind == NodeKind::Starred) {
            error_at(*first, "cannot use starred expression here");
        }
        return first;
    }

    auto tuple = make_node(NodeKind::Tuple, open.line, open.column);
    tuple->add(std::move(first));
    while (accept_op(",")) {
        if (at_op(")")) break;
        tuple->add(parse_star_named_expression());
    }
    expect_op(")");
    return tuple;
}

NodePtr PythonParser::parse_list() {
    const Token open = advance();
    auto list = make_node(NodeKind::List, open.line, open.column);
    if (accept_op("]")) return list;

    NodePtr first = parse_star_named_expression();
    if (at_comprehension()) {
        NodePtr node = parse_comprehension(NodeKind::ListComp, std::move(first));
        expect_op("]");
        return node;
    }

    list->add(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) break;
        list->add(parse_star_named_expression());
    }
    expect_op("]");
    return list;
}

NodePtr PythonParser::parse_brace() {
    const Token open = advance();
    if (accept_op("}")) return make_node(NodeKind::Dict, open.line, open.column);

    // Dict display or dict comprehension
    bool is_dict = at_op("**");
    NodePtr first_key;
    NodePtr first_value;
    NodePtr first_element;
    if (is_dict) {
        advance();
        first_value = parse_bitwise_or();
    } else {
        first_element = parse_star_named_expression();
        if (accept_op(":")) {
            if (first_element->kind == NodeKind::Starred) {
                error_at(*first_element, "cannot use a starred expression in a dictionary value");
            }
            is_dict = true;
            first_key = std::move(first_element);
            first_value = parse_expression();
        }
    }

    if (is_dict) {
        if (first_key && at_comprehension()) {
            NodePtr node = parse_comprehension(NodeKind::DictComp, std::move(first_key),
                                               std::move(first_value));
            expect_op("}");
            return node;
        }
        std::vector<NodePtr> keys;
        std::vector<NodePtr> values;
        keys.push_back(std::move(first_key));
        values.push_back(std::move(first_value));
        while (accept_op(",")) {
            if (at_op("}")) break;
            if (accept_op("**")) {
                keys.push_back(nullptr);
                values.push_back(parse_bitwise_or());
            } else {
                keys.push_back(parse_expression());
                expect_op(":", "':' expected after dictionary key");
                values.push_back(parse_expression());
            }
        }
        expect_op("}");
        auto dict = make_node(NodeKind::Dict, open.line, open.column);
        for (auto& key : keys) dict->add(std::move(key));
        for (auto& value : values) dict->add(std::move(value));
        return dict;
    }

    if (at_comprehension()) {
        NodePtr node = parse_comprehension(NodeKind::SetComp, std::move(first_element));
        expect_op("}");
        return node;
    }
    auto set = make_node(NodeKind::Set, open.line, open.column);
    set->add(std::move(first_element));
    while (accept_op(",")) {
        if (at_op("}")) break;
        set->add(parse_star_named_expression());
    }
    expect_op("}");
    return set;
}

NodePtr PythonParser::parse_comprehension(NodeKind kind, NodePtr element, NodePtr value) {
    if (element->kind == NodeKind::Starred) {
        error_at(*element, "iterable unpacking cannot be used in comprehension");
    }
    auto node = make_node(kind, element->line, element->column);
    node->add(std::move(element));
    node->add(std::move(value));

    while (at_comprehension()) {
        const Token& start = cur();
        auto generator = make_node(NodeKind::Comprehension, start.line, start.column);
        if (accept_kw("async")) generator->level = 1;
        expect_kw("for");
        NodePtr target = parse_target_list();
        check_target(*target);
        generator->add(std::move(target));
        expect_kw("in");
        generator->add(parse_disjunction());
        while (accept_kw("if")) generator->add(parse_disjunction());
        node->add(std::move(generator));
    }
    return node;
}

NodePtr PythonParser::parse_yield_expression() {
    const Token t = advance();
    if (accept_kw("from")) {
        auto node = make_node(NodeKind::YieldFrom, t.line, t.column);
        node->add(parse_expression());
        return node;
    }
    auto node = make_node(NodeKind::Yield, t.line, t.column);
    if (at_expression_start()) node->add(parse_star_expressions());
    return node;
}

NodePtr PythonParser::parse_target_list() {
    const Token start = cur();
    auto parse_one = [this]() -> NodePtr {
        if (at_op("*")) {
            const Token star = advance();
            auto node = make_node(NodeKind::Starred, star.line, star.column);
            node->add(parse_bitwise_or());
            return node;
        }
        return parse_bitwise_or();
    };

    NodePtr first = parse_one();
    if (!at_op(",")) return first;

    auto tuple = make_node(NodeKind::Tuple, start.line, start.column);
    tuple->add(std::move(first));
    while (accept_op(",")) {
        if (at_kw("in") || at_op("=")) break;
        tuple->add(parse_one());
    }
    return tuple;
}

NodePtr PythonParser::parse_strings() {
    const Token first = cur();
    std::vector<Token> parts;
    while (cur().type == TokenType::STRING) parts.push_back(advance());

    bool any_bytes = false;
    bool any_text = false;
    bool any_format = false;
    for (const auto& part : parts) {
        std::string prefix, body;
        split_string_token(part.text, prefix, body);
        bool is_bytes = prefix.find('b') != std::string::npos;
        any_bytes = any_bytes || is_bytes;
        any_text = any_text || !is_bytes;
        any_format = any_format || prefix.find('f') != std::string::npos;
    }
    if (any_bytes && any_text) error_at(first, "cannot mix bytes and nonbytes literals");

    if (!any_format) {
        auto node = make_node(NodeKind::Constant, first.line, first.column);
        for (const auto& part : parts) {
            if (!node->value.empty()) node->value += " ";
            node->value += part.text;
        }
        return node;
    }

    auto joined = make_node(NodeKind::JoinedStr, first.line, first.column);
    for (const auto& part : parts) {
        std::string prefix, body;
        split_string_token(part.text, prefix, body);
        if (prefix.find('f') != std::string::npos) {
            parse_fstring_body(body, part, *joined);
        } else {
            auto constant = make_node(NodeKind::Constant, part.line, part.column);
            constant->value = part.text;
            joined->add(std::move(constant));
        }
    }
    return joined;
}

// ---------------------------------------------------------------------------
// f-strings
// ---------------------------------------------------------------------------

void PythonParser::parse_fstring_body(const std::string& body, const Token& token, Node& joined) {
    std::string literal;
    auto flush = [&]() {
        if (literal.empty()) return;
        auto constant = make_node(NodeKind::Constant, token.line, token.column);
        constant->value = literal;
        joined.add(std::move(constant));
        literal.clear();
    };

    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '{') {
            if (i + 1 < body.size() && body[i + 1] == '{') {
                literal += '{';
                i += 2;
                continue;
            }
            flush();
            i = parse_fstring_field(body, i + 1, token, joined);
        } else if (c == '}') {
            if (i + 1 < body.size() && body[i + 1] == '}') {
                literal += '}';
                i += 2;
                continue;
            }
            error_at(token, "f-string: single '}' is not allowed");
        } else {
            literal += c;
            ++i;
        }
    }
    flush();
}

size_t PythonParser::parse_fstring_field(const std::string& body, size_t start,
                                         const Token& token, Node& joined) {
    DepthGuard guard(*this);

    int depth = 0;
    char quote = '\0';
    size_t expr_end = std::string::npos;
    size_t i = start;
    for (; i < body.size(); ++i) {
        char c = body[i];
        if (quote) {
            if (c == quote) quote = '\0';
            continue;
        }
        if (c == '\\') error_at(token, "f-string expression part cannot include a backslash");
        if (c == '#') error_at(token, "f-string expression part cannot include '#'");
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0) {
                if (c != '}') error_at(token, std::string("f-string: unmatched '") + c + "'");
                break;
            }
            --depth;
        } else if (depth == 0 && c == '!' && (i + 1 >= body.size() || body[i + 1] != '=')) {
            break;
        } else if (depth == 0 && c == ':') {
            break;
        } else if (depth == 0 && c == '=' && i + 1 < body.size() && body[i + 1] != '=' &&
                   i > start && std::string("=!<>").find(body[i - 1]) == std::string::npos) {
            // Self-documenting expression: f"{x=}"
            expr_end = i;
            ++i;
            break;
        }
    }
    if (quote) error_at(token, "f-string: unterminated string");
    if (i >= body.size()) error_at(token, "f-string: expecting '}'");
    if (expr_end == std::string::npos) expr_end = i;

    std::string expr_text = body.substr(start, expr_end - start);
    bool blank = std::all_of(expr_text.begin(), expr_text.end(),
                             [](unsigned char ch) { return std::isspace(ch) != 0; });
    if (blank) error_at(token, "f-string: empty expression not allowed");

    auto value = make_node(NodeKind::FormattedValue, token.line, token.column);
    value->add(parse_fstring_expression(expr_text, token));

    if (i < body.size() && body[i] == '!') {
        if (i + 1 >= body.size() || std::string("sra").find(body[i + 1]) == std::string::npos) {
            error_at(token, "f-string: invalid conversion character: expected 's', 'r', or 'a'");
        }
        value->name = body.substr(i + 1, 1);
        i += 2;
    }

    if (i < body.size() && body[i] == ':') {
        ++i;
        auto spec = make_node(NodeKind::JoinedStr, token.line, token.column);
        std::string literal;
        while (i < body.size() && body[i] != '}') {
            if (body[i] == '{') {
                if (!literal.empty()) {
                    auto constant = make_node(NodeKind::Constant, token.line, token.column);
                    constant->value = literal;
                    spec->add(std::move(constant));
                    literal.clear();
                }
                i = parse_fstring_field(body, i + 1, token, *spec);
            } else {
                literal += body[i++];
            }
        }
        if (!literal.empty()) {
            auto constant = make_node(NodeKind::Constant, token.line, token.column);
            constant->value = literal;
            spec->add(std::move(constant));
        }
        value->add(std::move(spec));
    }

    if (i >= body.size() || body[i] != '}') error_at(token, "f-string: expecting '}'");
    joined.add(std::move(value));
    return i + 1;
}

NodePtr PythonParser::parse_fstring_expression(const std::string& text, const Token& token) {
    try {
        PythonLexer lexer("(" + text + ")", token.line);
        PythonParser parser(lexer.tokenize(), depth_);
        return parser.parse_expression_input();
    } catch (const SyntaxError& e) {
        std::string message = e.what();
        if (message.rfind("f-string", 0) != 0) message = "f-string: " + message;
        throw SyntaxError(message, token.line, token.column);
    }
}

// ---------------------------------------------------------------------------
// Target validation
// ---------------------------------------------------------------------------

void PythonParser::check_target(const Node& node) {
    switch (node.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Starred:
            check_target(*node.children.front());
            return;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (const auto& child : node.children) check_target(*child);
            return;
        default:
            error_at(node, "cannot assign to " + describe(node));
    }
}

void PythonParser::check_del_target(const Node& node) {
    switch (node.kind) {
        case NodeKind::Name:
        case NodeKind::Attribute:
        case NodeKind::Subscript:
            return;
        case NodeKind::Tuple:
        case NodeKind::List:
            for (const auto& child : node.children) check_del_target(*child);
            return;
        default:
            error_at(node, "cannot delete " + describe(node));
    }
}

std::string PythonParser::describe(const Node& node) {
    switch (node.kind) {
        case NodeKind::Constant:
            if (node.value == "True" || node.value == "False" || node.value == "None") {
                return node.value;
            }
            return node.value == "..." ? "ellipsis" : "literal";
        case NodeKind::Call: return "function call";
        case NodeKind::Compare: return "comparison";
        case NodeKind::Lambda: return "lambda";
        case NodeKind::IfExp: return "conditional expression";
        case NodeKind::NamedExpr: return "named expression";
        case NodeKind::Yield:
        case NodeKind::YieldFrom: return "yield expression";
        case NodeKind::Await: return "await expression";
        case NodeKind::Dict: return "dict literal";
        case NodeKind::Set: return "set display";
        case NodeKind::ListComp: return "list comprehension";
        case NodeKind::SetComp: return "set comprehension";
        case NodeKind::DictComp: return "dict comprehension";
        case NodeKind::GeneratorExp: return "generator expression";
        case NodeKind::JoinedStr: return "f-string expression";
        case NodeKind::Starred: return "starred";
        case NodeKind::Tuple: return "tuple";
        case NodeKind::List: return "list";
        case NodeKind::Name: return "name";
        case NodeKind::Attribute: return "attribute";
        case NodeKind::Subscript: return "subscript";
        default: return "expression";
    }
}

} // namespace calcrun
