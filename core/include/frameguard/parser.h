#pragma once
#include "ast.h"
#include "errors.h"
#include "lexer.h"

#include <string>
#include <vector>

namespace frameguard {

// Parse FrameScript source. Throws ScriptError(SYNTAX) with location.
Program parse_program(const std::string& src);
Program parse_tokens(const std::vector<Token>& tokens);

} // namespace frameguard
