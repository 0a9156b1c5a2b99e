#include "frameguard/scanner.h"

#include "frameguard/lexer.h"
#include "frameguard/parser.h"

#include <cctype>
#include <new>
#include <unordered_set>

namespace frameguard {

namespace {

const std::unordered_set<std::string>& denied_names() {
    static const std::unordered_set<std::string> s = {
        // interpreter escape hatches
        "open", "eval", "exec", "execfile", "compile", "input", "globals", "locals", "vars",
        "getattr", "setattr", "delattr", "hasattr", "breakpoint", "help", "exit", "quit",
        "memoryview", "dir", "type", "object", "super", "classmethod", "staticmethod",
        // modules
        "os", "sys", "subprocess", "socket", "shutil", "pathlib", "importlib", "builtins",
        "ctypes", "pickle", "marshal", "io", "tempfile", "glob", "signal", "threading",
        "multiprocessing", "requests", "urllib", "http", "ftplib",
        // process spawning
        "system", "popen", "fork", "kill",
        // pandas/numpy I/O and string evaluation
        "read_csv", "read_json", "read_pickle", "read_sql", "read_excel", "read_parquet",
        "read_table", "read_fwf", "read_html", "read_hdf", "read_feather", "read_clipboard",
        "to_csv", "to_json", "to_pickle", "to_sql", "to_excel", "to_parquet", "to_hdf",
        "to_feather", "to_clipboard", "to_html", "query", "load", "loadtxt", "save", "savetxt",
        "fromfile", "tofile", "genfromtxt",
    };
    return s;
}

const std::unordered_set<std::string>& denied_words() {
    static const std::unordered_set<std::string> s = {
        "import", "eval", "exec", "execfile", "globals", "getattr", "setattr", "delattr",
        "hasattr", "breakpoint", "memoryview", "subprocess", "socket", "shutil",
        "pathlib", "importlib", "builtins", "ctypes", "pickle", "marshal", "popen", "fork",
        "read_csv", "read_json", "read_pickle", "read_sql", "read_excel", "read_parquet",
        "to_csv", "to_json", "to_pickle", "to_sql", "to_excel", "to_parquet",
    };
    return s;
}

bool has_denied_prefix(const std::string& name) {
    static const char* prefixes[] = {"execv", "execl", "spawn", nullptr};
    for (const char** p = prefixes; *p; p++) {
        if (name.rfind(*p, 0) == 0) return true;
    }
    return false;
}

bool is_reserved_keyword(const std::string& s) {
    static const std::unordered_set<std::string> r = {
        "lambda", "def", "class", "with", "try", "except", "finally", "global", "nonlocal",
        "async", "await", "yield", "raise", "del", "assert", "return", "as",
    };
    return r.count(s) > 0;
}

bool has_non_ascii(const std::string& s) {
    for (unsigned char c : s) {
        if (c >= 0x80) return true;
    }
    return false;
}

std::string clip(const std::string& s) {
    static const size_t kMax = 80;
    if (s.size() <= kMax) return s;
    return s.substr(0, kMax) + "...";
}

class Scan {
public:
    explicit Scan(PolicyDecision* out) : out_(out) {}

    void add(const char* rule, const std::string& text, int line, int col) {
        out_->violations.push_back(PolicyViolation{rule, clip(text), line, col});
    }

    void name(const Token& t) {
        const std::string& n = t.text;
        if (n == "import" || n == "from") { add("import_statement", n, t.line, t.col); return; }
        if (is_reserved_keyword(n)) { add("reserved_keyword", n, t.line, t.col); return; }
        if (has_non_ascii(n)) { add("non_ascii", n, t.line, t.col); return; }
        if (n.find("__") != std::string::npos) { add("dunder_name", n, t.line, t.col); return; }
        if (is_denied_identifier(n)) add("denied_identifier", n, t.line, t.col);
    }

    // A run is one literal or several joined by '+' or adjacency.
    void string_run(const std::string& folded, const Token& first) {
        if (folded.find("__") != std::string::npos) add("dunder_string", folded, first.line, first.col);
        std::string word;
        auto flush = [&]() {
            if (!word.empty() && is_denied_string_word(word)) {
                add("denied_string", word, first.line, first.col);
            }
            word.clear();
        };
        for (char c : folded) {
            if (std::isalnum((unsigned char)c) || c == '_') word.push_back(c);
            else flush();
        }
        flush();
    }

private:
    PolicyDecision* out_;
};

} // namespace

bool is_denied_identifier(const std::string& name) {
    return denied_names().count(name) > 0 || has_denied_prefix(name);
}

bool is_denied_string_word(const std::string& word) {
    return denied_words().count(word) > 0 || has_denied_prefix(word);
}

PolicyDecision scan(const std::string& source_code, const ScanOptions& opt) {
    PolicyDecision d;
    Scan sc(&d);

    if (source_code.size() > opt.max_source_bytes) {
        sc.add("source_too_large", std::to_string(source_code.size()) + " bytes", 1, 1);
        d.allowed = false;
        return d;
    }

    try {
        std::vector<ScriptError> lex_errors;
        std::vector<Token> toks = tokenize_lenient(source_code, &lex_errors);

        for (size_t i = 0; i < toks.size(); i++) {
            const Token& t = toks[i];
            if (t.kind == TokKind::NAME) {
                sc.name(t);
            } else if (t.kind == TokKind::STRING) {
                std::string folded = t.text;
                size_t j = i + 1;
                while (j < toks.size()) {
                    if (toks[j].kind == TokKind::STRING) {
                        folded += toks[j].text;
                        j++;
                    } else if (toks[j].kind == TokKind::OP && toks[j].text == "+" && j + 1 < toks.size() &&
                               toks[j + 1].kind == TokKind::STRING) {
                        folded += toks[j + 1].text;
                        j += 2;
                    } else {
                        break;
                    }
                }
                sc.string_run(folded, t);
                i = j - 1;
            }
        }

        for (const auto& e : lex_errors) sc.add("syntax_error", e.what(), e.line(), e.col());

        // Grammar check only on lexically clean input; a rejected keyword
        // would otherwise be reported twice.
        if (d.violations.empty()) {
            try {
                parse_tokens(toks);
            } catch (const ScriptError& e) {
                sc.add("syntax_error", e.what(), e.line(), e.col());
            }
        }
    } catch (const std::bad_alloc&) {
        sc.add("source_too_large", "out of memory while scanning", 1, 1);
    }

    d.allowed = d.violations.empty();
    return d;
}

} // namespace frameguard
