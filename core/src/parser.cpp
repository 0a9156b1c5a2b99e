#include "frameguard/parser.h"

#include <cerrno>
#include <cstdlib>
#include <unordered_set>

namespace frameguard {

namespace {

class Parser {
public:
    explicit Parser(const std::vector<Token>& toks) : toks_(toks) {}

    Program program() {
        Program p;
        while (!at(TokKind::END)) {
            if (at(TokKind::NEWLINE)) { pos_++; continue; }
            links_ = 0;
            statement(p.body);
        }
        return p;
    }

private:
    const Token& cur() const { return toks_[pos_]; }
    const Token& peek_tok(size_t off) const {
        size_t i = pos_ + off;
        return i < toks_.size() ? toks_[i] : toks_.back();
    }
    bool at(TokKind k) const { return cur().kind == k; }
    bool at_op(const char* op) const { return cur().kind == TokKind::OP && cur().text == op; }
    bool at_kw(const char* kw) const { return cur().kind == TokKind::NAME && cur().text == kw; }

    [[noreturn]] void fail(const std::string& msg) const {
        throw ScriptError(ErrorKind::SYNTAX, msg, cur().line, cur().col);
    }

    [[noreturn]] void unexpected() const {
        const Token& t = cur();
        switch (t.kind) {
            case TokKind::NEWLINE: fail("unexpected end of line");
            case TokKind::INDENT: fail("unexpected indent");
            case TokKind::DEDENT: fail("unexpected dedent");
            case TokKind::END: fail("unexpected end of input");
            default: fail("invalid syntax near '" + t.text + "'");
        }
    }

    void expect_op(const char* op) {
        if (!at_op(op)) fail(std::string("expected '") + op + "'");
        pos_++;
    }

    std::string expect_name() {
        if (!at(TokKind::NAME) || is_keyword(cur().text)) fail("expected a name");
        return toks_[pos_++].text;
    }

    template <typename T>
    std::unique_ptr<T> node(const Token& at_tok) {
        auto n = std::make_unique<T>();
        n->line = at_tok.line;
        n->col = at_tok.col;
        return n;
    }

    static bool is_reserved(const std::string& s) {
        static const std::unordered_set<std::string> r = {
            "def", "class", "lambda", "return", "with", "try", "except", "finally", "raise",
            "global", "nonlocal", "del", "assert", "yield", "async", "await", "as",
        };
        return r.count(s) > 0;
    }

    void reject_reserved() const {
        const std::string& t = cur().text;
        if (t == "import" || t == "from") fail("import statements are not supported");
        fail("'" + t + "' is not supported");
    }

    // Bounds recursion on hostile input such as "((((((...".
    struct Nest {
        explicit Nest(Parser& p) : p_(p) {
            if (++p_.nesting_ > kMaxNesting) p_.fail("expression nested too deeply");
        }
        ~Nest() { p_.nesting_--; }
        Parser& p_;
    };
    static constexpr int kMaxNesting = 200;

    // Left-leaning chains (a+b+c..., x.y.z...) deepen the tree without
    // recursing here, so they get their own budget per top-level statement.
    void link() {
        if (++links_ > kMaxLinks) fail("statement too complex");
    }
    static constexpr int kMaxLinks = 5000;

    // ---- statements ----

    void statement(Block& out) {
        Nest nest(*this);
        if (at_kw("if")) { out.push_back(if_stmt()); return; }
        if (at_kw("while")) { out.push_back(while_stmt()); return; }
        if (at_kw("for")) { out.push_back(for_stmt()); return; }
        simple_statements(out);
    }

    void simple_statements(Block& out) {
        out.push_back(small_stmt());
        while (at_op(";")) {
            pos_++;
            if (at(TokKind::NEWLINE)) break;
            out.push_back(small_stmt());
        }
        if (!at(TokKind::NEWLINE)) unexpected();
        pos_++;
    }

    StmtPtr small_stmt() {
        const Token& t = cur();
        if (t.kind == TokKind::NAME) {
            if (t.text == "import" || t.text == "from" || is_reserved(t.text)) reject_reserved();
            if (t.text == "pass") { pos_++; return node_simple(Stmt::Kind::PASS, t); }
            if (t.text == "break" || t.text == "continue") {
                if (loop_depth_ == 0) fail("'" + t.text + "' outside loop");
                pos_++;
                return node_simple(t.text == "break" ? Stmt::Kind::BREAK : Stmt::Kind::CONTINUE, t);
            }
        }

        ExprPtr lhs = test();
        if (at_op("=")) {
            check_target(*lhs);
            pos_++;
            auto s = node<AssignStmt>(t);
            s->target = std::move(lhs);
            s->value = test();
            if (at_op("=")) fail("chained assignment is not supported");
            return s;
        }
        static const char* aug[] = {"+=", "-=", "*=", "/=", "//=", "%=", "**=", nullptr};
        for (const char** a = aug; *a; a++) {
            if (at_op(*a)) {
                check_target(*lhs);
                pos_++;
                auto s = node<AugAssignStmt>(t);
                std::string op = *a;
                op.pop_back();
                s->op = op;
                s->target = std::move(lhs);
                s->value = test();
                return s;
            }
        }
        auto s = node<ExprStmt>(t);
        s->expr = std::move(lhs);
        return s;
    }

    StmtPtr node_simple(Stmt::Kind k, const Token& t) {
        auto s = std::make_unique<SimpleStmt>(k);
        s->line = t.line;
        s->col = t.col;
        return s;
    }

    void check_target(const Expr& e) const {
        if (e.kind == Expr::Kind::NAME || e.kind == Expr::Kind::SUBSCRIPT || e.kind == Expr::Kind::ATTRIBUTE) return;
        throw ScriptError(ErrorKind::SYNTAX, "cannot assign to expression", e.line, e.col);
    }

    Block block() {
        expect_op(":");
        Block body;
        if (!at(TokKind::NEWLINE)) {
            simple_statements(body);
            return body;
        }
        pos_++;
        if (!at(TokKind::INDENT)) fail("expected an indented block");
        pos_++;
        while (!at(TokKind::DEDENT) && !at(TokKind::END)) {
            if (at(TokKind::NEWLINE)) { pos_++; continue; }
            statement(body);
        }
        if (at(TokKind::DEDENT)) pos_++;
        return body;
    }

    StmtPtr if_stmt() {
        const Token& t = cur();
        pos_++; // 'if' or 'elif'
        auto s = node<IfStmt>(t);
        s->cond = test();
        s->body = block();
        if (at_kw("elif")) {
            link();
            s->orelse.push_back(if_stmt());
        } else if (at_kw("else")) {
            pos_++;
            s->orelse = block();
        }
        return s;
    }

    StmtPtr while_stmt() {
        const Token& t = cur();
        pos_++;
        auto s = node<WhileStmt>(t);
        s->cond = test();
        loop_depth_++;
        s->body = block();
        loop_depth_--;
        if (at_kw("else")) fail("while/else is not supported");
        return s;
    }

    StmtPtr for_stmt() {
        const Token& t = cur();
        pos_++;
        auto s = node<ForStmt>(t);
        s->var = expect_name();
        if (at_op(",")) fail("tuple unpacking in for loops is not supported");
        if (!at_kw("in")) fail("expected 'in'");
        pos_++;
        s->iter = test();
        loop_depth_++;
        s->body = block();
        loop_depth_--;
        if (at_kw("else")) fail("for/else is not supported");
        return s;
    }

    // ---- expressions ----

    ExprPtr test() {
        Nest nest(*this);
        const Token& t = cur();
        ExprPtr e = or_test();
        if (at_kw("if")) {
            pos_++;
            auto c = node<ConditionalExpr>(t);
            c->then_value = std::move(e);
            c->cond = or_test();
            if (!at_kw("else")) fail("expected 'else' in conditional expression");
            pos_++;
            c->else_value = test();
            return c;
        }
        return e;
    }

    ExprPtr or_test() {
        ExprPtr e = and_test();
        while (at_kw("or")) {
            const Token& t = cur();
            link();
            pos_++;
            auto b = node<BoolOpExpr>(t);
            b->is_and = false;
            b->left = std::move(e);
            b->right = and_test();
            e = std::move(b);
        }
        return e;
    }

    ExprPtr and_test() {
        ExprPtr e = not_test();
        while (at_kw("and")) {
            const Token& t = cur();
            link();
            pos_++;
            auto b = node<BoolOpExpr>(t);
            b->is_and = true;
            b->left = std::move(e);
            b->right = not_test();
            e = std::move(b);
        }
        return e;
    }

    ExprPtr not_test() {
        Nest nest(*this);
        if (at_kw("not")) {
            const Token& t = cur();
            pos_++;
            auto u = node<UnaryExpr>(t);
            u->op = "not";
            u->operand = not_test();
            return u;
        }
        return comparison();
    }

    bool comp_op(std::string* op) {
        const Token& t = cur();
        if (t.kind == TokKind::OP) {
            if (t.text == "==" || t.text == "!=" || t.text == "<" || t.text == "<=" || t.text == ">" ||
                t.text == ">=") {
                *op = t.text;
                pos_++;
                return true;
            }
            return false;
        }
        if (t.kind != TokKind::NAME) return false;
        if (t.text == "in") { *op = "in"; pos_++; return true; }
        if (t.text == "not" && peek_tok(1).kind == TokKind::NAME && peek_tok(1).text == "in") {
            *op = "not in";
            pos_ += 2;
            return true;
        }
        if (t.text == "is") {
            pos_++;
            if (at_kw("not")) { pos_++; *op = "is not"; }
            else *op = "is";
            return true;
        }
        return false;
    }

    ExprPtr comparison() {
        const Token& t = cur();
        ExprPtr first = bit_or();
        std::string op;
        if (!comp_op(&op)) return first;
        auto c = node<CompareExpr>(t);
        c->first = std::move(first);
        do {
            c->ops.push_back(op);
            c->rest.push_back(bit_or());
        } while (comp_op(&op));
        return c;
    }

    ExprPtr binary_chain(ExprPtr (Parser::*next)(), std::initializer_list<const char*> ops) {
        ExprPtr e = (this->*next)();
        while (true) {
            const char* hit = nullptr;
            for (const char* o : ops) {
                if (at_op(o)) { hit = o; break; }
            }
            if (!hit) return e;
            const Token& t = cur();
            link();
            pos_++;
            auto b = node<BinaryExpr>(t);
            b->op = hit;
            b->left = std::move(e);
            b->right = (this->*next)();
            e = std::move(b);
        }
    }

    ExprPtr bit_or() { return binary_chain(&Parser::bit_and, {"|"}); }
    ExprPtr bit_and() { return binary_chain(&Parser::arith, {"&"}); }
    ExprPtr arith() { return binary_chain(&Parser::term, {"+", "-"}); }
    ExprPtr term() { return binary_chain(&Parser::factor, {"*", "/", "//", "%"}); }

    ExprPtr factor() {
        Nest nest(*this);
        if (at_op("-") || at_op("+") || at_op("~")) {
            const Token& t = cur();
            pos_++;
            auto u = node<UnaryExpr>(t);
            u->op = t.text;
            u->operand = factor();
            return u;
        }
        return power();
    }

    ExprPtr power() {
        ExprPtr base = postfix();
        if (at_op("**")) {
            const Token& t = cur();
            pos_++;
            auto b = node<BinaryExpr>(t);
            b->op = "**";
            b->left = std::move(base);
            b->right = factor();
            return b;
        }
        return base;
    }

    ExprPtr postfix() {
        ExprPtr e = atom();
        while (true) {
            const Token& t = cur();
            if (at_op(".") || at_op("(") || at_op("[")) link();
            if (at_op(".")) {
                pos_++;
                if (!at(TokKind::NAME)) fail("expected attribute name");
                auto a = node<AttributeExpr>(t);
                a->object = std::move(e);
                a->attr = toks_[pos_++].text;
                e = std::move(a);
            } else if (at_op("(")) {
                pos_++;
                auto c = node<CallExpr>(t);
                c->func = std::move(e);
                call_args(*c);
                e = std::move(c);
            } else if (at_op("[")) {
                pos_++;
                auto s = node<SubscriptExpr>(t);
                s->object = std::move(e);
                s->index = subscript_index();
                expect_op("]");
                e = std::move(s);
            } else {
                return e;
            }
        }
    }

    ExprPtr subscript_index() {
        const Token& t = cur();
        if (at_op(":")) fail("slices are not supported");
        ExprPtr first = test();
        if (at_op(":")) fail("slices are not supported");
        if (!at_op(",")) return first;
        auto tup = std::make_unique<ListExpr>(Expr::Kind::TUPLE);
        tup->line = t.line;
        tup->col = t.col;
        tup->elems.push_back(std::move(first));
        while (at_op(",")) {
            pos_++;
            if (at_op("]")) break;
            tup->elems.push_back(test());
        }
        return tup;
    }

    void call_args(CallExpr& c) {
        while (!at_op(")")) {
            if (at(TokKind::NAME) && peek_tok(1).kind == TokKind::OP && peek_tok(1).text == "=") {
                Keyword kw;
                kw.name = expect_name();
                pos_++; // '='
                kw.value = test();
                for (const auto& k : c.kwargs) {
                    if (k.name == kw.name) fail("keyword argument repeated: " + kw.name);
                }
                c.kwargs.push_back(std::move(kw));
            } else {
                if (at_op("*") || at_op("**")) fail("argument unpacking is not supported");
                if (!c.kwargs.empty()) fail("positional argument follows keyword argument");
                c.args.push_back(test());
            }
            if (at_op(",")) { pos_++; continue; }
            if (!at_op(")")) fail("expected ',' or ')'");
        }
        pos_++;
    }

    ExprPtr atom() {
        const Token& t = cur();
        switch (t.kind) {
            case TokKind::NUMBER: {
                pos_++;
                auto lit = node<LiteralExpr>(t);
                lit->value = parse_number(t);
                return lit;
            }
            case TokKind::STRING: {
                std::string s;
                while (at(TokKind::STRING)) s += toks_[pos_++].text;  // adjacent literals concatenate
                auto lit = node<LiteralExpr>(t);
                lit->value = Cell{s};
                return lit;
            }
            case TokKind::NAME: {
                if (t.text == "True" || t.text == "False" || t.text == "None") {
                    pos_++;
                    auto lit = node<LiteralExpr>(t);
                    if (t.text == "None") lit->value = Cell{};
                    else lit->value = Cell{t.text == "True"};
                    return lit;
                }
                if (t.text == "import" || t.text == "from" || is_reserved(t.text)) reject_reserved();
                if (is_keyword(t.text)) unexpected();
                pos_++;
                auto n = node<NameExpr>(t);
                n->id = t.text;
                return n;
            }
            case TokKind::OP: {
                if (t.text == "(") {
                    pos_++;
                    if (at_op(")")) fail("empty tuples are not supported");
                    ExprPtr inner = test();
                    if (at_op(",")) {
                        auto tup = std::make_unique<ListExpr>(Expr::Kind::TUPLE);
                        tup->line = t.line;
                        tup->col = t.col;
                        tup->elems.push_back(std::move(inner));
                        while (at_op(",")) {
                            pos_++;
                            if (at_op(")")) break;
                            tup->elems.push_back(test());
                        }
                        expect_op(")");
                        return tup;
                    }
                    expect_op(")");
                    return inner;
                }
                if (t.text == "[") {
                    pos_++;
                    auto l = node<ListExpr>(t);
                    while (!at_op("]")) {
                        l->elems.push_back(test());
                        if (at_kw("for")) fail("comprehensions are not supported");
                        if (at_op(",")) { pos_++; continue; }
                        if (!at_op("]")) fail("expected ',' or ']'");
                    }
                    pos_++;
                    return l;
                }
                if (t.text == "{") {
                    pos_++;
                    auto d = node<DictExpr>(t);
                    while (!at_op("}")) {
                        d->keys.push_back(test());
                        if (!at_op(":")) fail("expected ':' in dict literal");
                        pos_++;
                        d->values.push_back(test());
                        if (at_kw("for")) fail("comprehensions are not supported");
                        if (at_op(",")) { pos_++; continue; }
                        if (!at_op("}")) fail("expected ',' or '}'");
                    }
                    pos_++;
                    return d;
                }
                unexpected();
            }
            default:
                unexpected();
        }
    }

    Cell parse_number(const Token& t) const {
        const std::string& s = t.text;
        const bool is_float = s.find_first_of(".eE") != std::string::npos;
        errno = 0;
        if (is_float) {
            double v = std::strtod(s.c_str(), nullptr);
            if (errno == ERANGE) throw ScriptError(ErrorKind::SYNTAX, "float literal out of range", t.line, t.col);
            return Cell{v};
        }
        long long v = std::strtoll(s.c_str(), nullptr, 10);
        if (errno == ERANGE) throw ScriptError(ErrorKind::SYNTAX, "integer literal too large", t.line, t.col);
        return Cell{(int64_t)v};
    }

    const std::vector<Token>& toks_;
    size_t pos_{0};
    int loop_depth_{0};
    int nesting_{0};
    int links_{0};
};

} // namespace

Program parse_tokens(const std::vector<Token>& tokens) {
    if (tokens.empty()) return Program{};
    Parser p(tokens);
    return p.program();
}

Program parse_program(const std::string& src) {
    std::vector<Token> toks = tokenize(src);
    return parse_tokens(toks);
}

} // namespace frameguard
