#include "test_common.h"

#include "frameguard/lexer.h"
#include "frameguard/parser.h"

#include <string>
#include <vector>

using namespace frameguard;

static void expect_syntax_error(const std::string& src, const std::string& what) {
    try {
        (void)parse_program(src);
    } catch (const ScriptError& e) {
        expect_true(e.kind() == ErrorKind::SYNTAX, "expected SyntaxError for: " + what);
        expect_true(e.line() > 0, "syntax error should carry a line: " + what);
        return;
    }
    die("parse should fail: " + what);
}

int main() {
    // Tokens: layout and literals
    {
        auto toks = tokenize("if x:\n    y = 'a\\n'  # note\nz = 1.5e3\n");
        std::vector<TokKind> kinds;
        for (const auto& t : toks) kinds.push_back(t.kind);
        expect_true(toks[0].kind == TokKind::NAME && toks[0].text == "if", "first token is 'if'");
        bool saw_indent = false, saw_dedent = false, saw_str = false, saw_num = false;
        for (const auto& t : toks) {
            if (t.kind == TokKind::INDENT) saw_indent = true;
            if (t.kind == TokKind::DEDENT) saw_dedent = true;
            if (t.kind == TokKind::STRING) {
                saw_str = true;
                expect_true(t.text == "a\n", "string escapes decoded");
                expect_eq_ll(t.line, 2, "string token line");
            }
            if (t.kind == TokKind::NUMBER) saw_num = saw_num || t.text == "1.5e3";
        }
        expect_true(saw_indent && saw_dedent, "INDENT/DEDENT emitted");
        expect_true(saw_str && saw_num, "literals tokenized");
        expect_true(kinds.back() == TokKind::END, "stream ends with END");
    }

    // Implicit line joining inside brackets
    {
        auto toks = tokenize("x = [1,\n     2,\n     3]\n");
        int newlines = 0;
        for (const auto& t : toks) newlines += (t.kind == TokKind::NEWLINE);
        expect_eq_ll(newlines, 1, "bracketed continuation is one logical line");
    }

    // Strict tokenizer throws, lenient one collects
    {
        bool threw = false;
        try { (void)tokenize("x = 'open"); } catch (const ScriptError&) { threw = true; }
        expect_true(threw, "unterminated string throws");

        std::vector<ScriptError> errs;
        auto toks = tokenize_lenient("x = 'open\ny = $\n", &errs);
        expect_true(!errs.empty(), "lenient tokenizer reports errors");
        expect_true(!toks.empty() && toks.back().kind == TokKind::END, "lenient tokenizer still ends with END");
    }

    expect_true(is_keyword("for") && is_keyword("None") && !is_keyword("dataframe"), "keyword table");

    // Statements
    {
        Program p = parse_program(
            "total = 0\n"
            "for c in dataframe.columns:\n"
            "    if c == 'a':\n"
            "        continue\n"
            "    elif c in ['b', 'c']:\n"
            "        total += 1\n"
            "    else:\n"
            "        pass\n"
            "while total > 10:\n"
            "    total -= 1\n"
            "    if total == 5:\n"
            "        break\n"
            "dataframe = dataframe.rename(columns={'a': 'b'})\n"
            "dataframe['x'] = dataframe['y'] * 2\n");
        expect_eq_ll((long long)p.body.size(), 5, "five top-level statements");
        expect_true(p.body[0]->kind == Stmt::Kind::ASSIGN, "assignment");
        expect_true(p.body[1]->kind == Stmt::Kind::FOR, "for loop");
        expect_true(p.body[2]->kind == Stmt::Kind::WHILE, "while loop");
        expect_eq_ll(p.body[2]->line, 9, "statement line recorded");
        const auto* loop = static_cast<const ForStmt*>(p.body[1].get());
        expect_true(loop->var == "c", "loop variable");
        const auto* branch = static_cast<const IfStmt*>(loop->body[0].get());
        expect_eq_ll((long long)branch->orelse.size(), 1, "elif nests as a single IfStmt");
        expect_true(branch->orelse[0]->kind == Stmt::Kind::IF, "elif is an IfStmt");
    }

    // Grammar has no production for these
    expect_syntax_error("break\n", "break outside loop");
    expect_syntax_error("if x:\n    continue\n", "continue outside loop");
    expect_syntax_error("x = (1, 2\n", "unclosed paren");
    expect_syntax_error("x +\n", "dangling operator");
    expect_syntax_error("1 = x\n", "assignment to literal");
    expect_syntax_error("if x:\ny = 1\n", "missing indent");
    expect_syntax_error("for 1 in x:\n    pass\n", "bad loop target");

    // Stack-exhaustion guards
    expect_syntax_error("x = " + std::string(1000, '(') + "1" + std::string(1000, ')') + "\n", "deep nesting");
    expect_syntax_error("x = " + std::string(1000, '[') + std::string(1000, ']') + "\n", "deep list nesting");
    expect_syntax_error("x = " + std::string(1000, '-') + "1\n", "deep unary chain");
    {
        std::string chain = "x = 1";
        for (int i = 0; i < 6000; i++) chain += " + 1";
        expect_syntax_error(chain + "\n", "long operator chain");
    }
    {
        // moderate nesting still parses
        Program p = parse_program("x = " + std::string(50, '(') + "1" + std::string(50, ')') + "\n");
        expect_eq_ll((long long)p.body.size(), 1, "moderate nesting parses");
    }

    std::cerr << "test_script: ALL PASSED" << std::endl;
    return 0;
}
