#pragma once

// FrameScript tokenizer. Python-style layout: NEWLINE/INDENT/DEDENT tokens,
// implicit line joining inside brackets, '#' comments.
//
// Shared by the policy scanner (lexical rules) and the parser.

#include "errors.h"

#include <string>
#include <vector>

namespace frameguard {

enum class TokKind {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END,
};

struct Token {
    TokKind kind{TokKind::END};
    std::string text;   // decoded contents for STRING, raw text otherwise
    int line{1};
    int col{1};
};

// Throws ScriptError(SYNTAX) on bad input.
std::vector<Token> tokenize(const std::string& src);

// Never throws: collects errors and keeps going (unknown characters become
// single-character OP tokens, prefixed strings are kept as STRING tokens).
std::vector<Token> tokenize_lenient(const std::string& src, std::vector<ScriptError>* errors);

bool is_keyword(const std::string& s);

} // namespace frameguard
