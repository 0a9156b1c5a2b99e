#pragma once

// Process-wide registry of the preloaded libraries (pd, np, scipy) and the
// safe builtin functions. Built once, immutable afterwards; nothing a request
// carries can add to or change it.

#include "value.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace frameguard {

class Workshop {
public:
    // First call builds the registry; later calls return the same instance.
    static const Workshop& initialize();

    // nullptr when `name` is not a preloaded library.
    const Library* get(const std::string& name) const;
    std::vector<std::string> names() const;

    const std::vector<std::pair<std::string, Value>>& libraries() const { return libs_; }
    const std::vector<std::pair<std::string, Value>>& builtins() const { return builtins_; }
    const Value* builtin(const std::string& name) const;

    Workshop(const Workshop&) = delete;
    Workshop& operator=(const Workshop&) = delete;

private:
    Workshop();

    std::vector<std::pair<std::string, Value>> libs_;
    std::vector<std::pair<std::string, Value>> builtins_;
};

} // namespace frameguard
