#include "frameguard/lexer.h"

#include <cctype>
#include <unordered_set>

namespace frameguard {

namespace {

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> kw = {
        "and", "or", "not", "in", "is", "if", "elif", "else", "while", "for",
        "break", "continue", "pass", "True", "False", "None",
        // reserved: tokenized as names, rejected by the parser
        "import", "from", "as", "def", "class", "lambda", "return", "with",
        "try", "except", "finally", "raise", "global", "nonlocal", "del",
        "assert", "yield", "async", "await",
    };
    return kw;
}

bool is_name_start(unsigned char c) { return std::isalpha(c) || c == '_' || c >= 0x80; }
bool is_name_char(unsigned char c) { return std::isalnum(c) || c == '_' || c >= 0x80; }

class Lexer {
public:
    Lexer(const std::string& src, std::vector<ScriptError>* lenient)
        : src_(src), lenient_(lenient) {}

    std::vector<Token> run() {
        indents_.push_back(0);
        at_line_start_ = true;
        while (pos_ < src_.size()) {
            if (at_line_start_ && depth_ == 0) {
                if (!handle_indentation()) continue;
            }
            if (pos_ >= src_.size()) break;
            char c = src_[pos_];
            if (c == '\n') {
                newline();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') { advance(); continue; }
            if (c == '#') { skip_comment(); continue; }
            if (c == '\\' && peek(1) == '\n') { advance(); advance(); line_++; col_ = 1; continue; }
            if (c == '"' || c == '\'') { lex_string(line_, col_); continue; }
            if (std::isdigit((unsigned char)c) || (c == '.' && std::isdigit((unsigned char)peek(1)))) {
                lex_number();
                continue;
            }
            if (is_name_start((unsigned char)c)) { lex_name(); continue; }
            lex_op();
        }
        if (!tokens_.empty() && tokens_.back().kind != TokKind::NEWLINE &&
            tokens_.back().kind != TokKind::DEDENT && tokens_.back().kind != TokKind::INDENT) {
            push(TokKind::NEWLINE, "", line_, col_);
        }
        if (depth_ > 0) fail("unexpected end of input inside brackets", line_, col_);
        while (indents_.size() > 1) {
            indents_.pop_back();
            push(TokKind::DEDENT, "", line_, col_);
        }
        push(TokKind::END, "", line_, col_);
        return std::move(tokens_);
    }

private:
    char peek(size_t off) const { return pos_ + off < src_.size() ? src_[pos_ + off] : '\0'; }

    void advance() { pos_++; col_++; }

    void push(TokKind k, std::string text, int line, int col) {
        tokens_.push_back(Token{k, std::move(text), line, col});
    }

    void fail(const std::string& msg, int line, int col) {
        ScriptError err(ErrorKind::SYNTAX, msg, line, col);
        if (!lenient_) throw err;
        lenient_->push_back(err);
    }

    void newline() {
        if (depth_ == 0 && !tokens_.empty() && tokens_.back().kind != TokKind::NEWLINE) {
            push(TokKind::NEWLINE, "", line_, col_);
        }
        pos_++;
        line_++;
        col_ = 1;
        at_line_start_ = (depth_ == 0);
    }

    void skip_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') advance();
    }

    // Returns false when the line was blank/comment-only and has been consumed.
    bool handle_indentation() {
        int width = 0;
        size_t p = pos_;
        while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t' || src_[p] == '\f' || src_[p] == '\r')) {
            if (src_[p] == '\t') width = (width / 8 + 1) * 8;
            else if (src_[p] == ' ') width++;
            p++;
        }
        if (p >= src_.size() || src_[p] == '\n' || src_[p] == '#') {
            while (p < src_.size() && src_[p] != '\n') p++;
            col_ += (int)(p - pos_);
            pos_ = p;
            if (pos_ < src_.size()) { pos_++; line_++; col_ = 1; }
            return false;
        }
        col_ += (int)(p - pos_);
        pos_ = p;
        at_line_start_ = false;

        if (width > indents_.back()) {
            indents_.push_back(width);
            push(TokKind::INDENT, "", line_, col_);
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                push(TokKind::DEDENT, "", line_, col_);
            }
            if (width != indents_.back()) {
                fail("unindent does not match any outer indentation level", line_, col_);
            }
        }
        return true;
    }

    void lex_string(int line, int col) {
        const char q = src_[pos_];
        const bool triple = (peek(1) == q && peek(2) == q);
        advance();
        if (triple) { advance(); advance(); }
        std::string out;
        while (true) {
            if (pos_ >= src_.size()) {
                fail("unterminated string literal", line, col);
                push(TokKind::STRING, out, line, col);
                return;
            }
            char c = src_[pos_];
            if (c == q) {
                if (!triple) { advance(); break; }
                if (peek(1) == q && peek(2) == q) { advance(); advance(); advance(); break; }
            }
            if (c == '\n') {
                if (!triple) {
                    fail("unterminated string literal", line, col);
                    push(TokKind::STRING, out, line, col);
                    return;
                }
                out.push_back('\n');
                pos_++; line_++; col_ = 1;
                continue;
            }
            if (c == '\\') {
                char e = peek(1);
                advance();
                if (pos_ >= src_.size()) continue;
                advance();
                switch (e) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case '0': out.push_back('\0'); break;
                    case '\\': out.push_back('\\'); break;
                    case '\'': out.push_back('\''); break;
                    case '"': out.push_back('"'); break;
                    case '\n': line_++; col_ = 1; break;
                    case 'x': {
                        int v = 0, n = 0;
                        while (n < 2 && std::isxdigit((unsigned char)peek(0))) {
                            char h = src_[pos_];
                            v = v * 16 + (std::isdigit((unsigned char)h) ? h - '0' : (std::tolower((unsigned char)h) - 'a' + 10));
                            advance();
                            n++;
                        }
                        if (n != 2) fail("truncated \\x escape", line_, col_);
                        out.push_back((char)v);
                        break;
                    }
                    default:
                        out.push_back('\\');
                        out.push_back(e);
                        break;
                }
                continue;
            }
            out.push_back(c);
            advance();
        }
        push(TokKind::STRING, out, line, col);
    }

    void lex_number() {
        const int line = line_, col = col_;
        size_t start = pos_;
        while (std::isdigit((unsigned char)peek(0))) advance();
        if (peek(0) == '.' && std::isdigit((unsigned char)peek(1))) {
            advance();
            while (std::isdigit((unsigned char)peek(0))) advance();
        } else if (peek(0) == '.' && !is_name_start((unsigned char)peek(1))) {
            advance(); // "1." is a float
        }
        if (peek(0) == 'e' || peek(0) == 'E') {
            size_t save = pos_;
            int save_col = col_;
            advance();
            if (peek(0) == '+' || peek(0) == '-') advance();
            if (!std::isdigit((unsigned char)peek(0))) {
                pos_ = save;
                col_ = save_col;
            } else {
                while (std::isdigit((unsigned char)peek(0))) advance();
            }
        }
        push(TokKind::NUMBER, src_.substr(start, pos_ - start), line, col);
    }

    void lex_name() {
        const int line = line_, col = col_;
        size_t start = pos_;
        while (pos_ < src_.size() && is_name_char((unsigned char)src_[pos_])) advance();
        std::string name = src_.substr(start, pos_ - start);
        char q = peek(0);
        if ((q == '"' || q == '\'') && name.size() <= 2) {
            std::string low;
            for (char ch : name) low.push_back((char)std::tolower((unsigned char)ch));
            if (low == "r" || low == "b" || low == "f" || low == "u" || low == "rb" || low == "br" ||
                low == "fr" || low == "rf") {
                fail("string prefix '" + name + "' is not supported", line, col);
                // lenient: keep the literal so its contents are still inspected
                lex_string(line, col);
                return;
            }
        }
        push(TokKind::NAME, name, line, col);
    }

    void lex_op() {
        const int line = line_, col = col_;
        static const char* three[] = {"**=", "//=", nullptr};
        static const char* two[] = {"**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=",
                                    "->", ":=", nullptr};
        for (const char** t = three; *t; t++) {
            if (src_.compare(pos_, 3, *t) == 0) {
                push(TokKind::OP, *t, line, col);
                advance(); advance(); advance();
                return;
            }
        }
        for (const char** t = two; *t; t++) {
            if (src_.compare(pos_, 2, *t) == 0) {
                push(TokKind::OP, *t, line, col);
                advance(); advance();
                return;
            }
        }
        char c = src_[pos_];
        static const std::string singles = "+-*/%<>=()[]{},:.;&|~^@";
        if (singles.find(c) == std::string::npos) {
            fail(std::string("invalid character '") + c + "'", line, col);
            push(TokKind::OP, std::string(1, c), line, col);
            advance();
            return;
        }
        if (c == '(' || c == '[' || c == '{') depth_++;
        if (c == ')' || c == ']' || c == '}') {
            if (depth_ == 0) fail(std::string("unmatched '") + c + "'", line, col);
            else depth_--;
        }
        push(TokKind::OP, std::string(1, c), line, col);
        advance();
    }

    const std::string& src_;
    std::vector<ScriptError>* lenient_;
    size_t pos_{0};
    int line_{1};
    int col_{1};
    int depth_{0};
    bool at_line_start_{true};
    std::vector<int> indents_;
    std::vector<Token> tokens_;
};

} // namespace

std::vector<Token> tokenize(const std::string& src) {
    Lexer lx(src, nullptr);
    return lx.run();
}

std::vector<Token> tokenize_lenient(const std::string& src, std::vector<ScriptError>* errors) {
    Lexer lx(src, errors);
    return lx.run();
}

bool is_keyword(const std::string& s) {
    return keywords().count(s) > 0;
}

} // namespace frameguard
