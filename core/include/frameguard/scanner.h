#pragma once

// Static policy scanner: lexical/syntactic checks run before any code is
// executed. Heuristic first layer only; the workbench and the isolation
// boundary must hold on their own when it is bypassed.

#include "types.h"

#include <string>

namespace frameguard {

struct ScanOptions {
    size_t max_source_bytes{64 * 1024};
};

// Collects every violation; never throws.
PolicyDecision scan(const std::string& source_code, const ScanOptions& opt = {});

// Identifier denylist (names and attribute names).
bool is_denied_identifier(const std::string& name);
// Narrower list applied to words inside string literals; leaves out plain
// English words ("open", "input", "exit") that show up in data values.
bool is_denied_string_word(const std::string& word);

} // namespace frameguard
