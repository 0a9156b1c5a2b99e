#pragma once
#include <stdexcept>
#include <string>

namespace frameguard {

enum class ErrorKind {
    SYNTAX,
    NAME,
    TYPE,
    VALUE,
    KEY,
    INDEX,
    ATTRIBUTE,
    ZERO_DIVISION,
    RESOURCE,      // element/console ceiling or allocation failure
    STEP_BUDGET,   // in-process instruction backstop
};

const char* error_kind_name(ErrorKind k);

// Error raised while tokenizing, parsing or evaluating a script.
class ScriptError : public std::runtime_error {
public:
    ScriptError(ErrorKind kind, const std::string& msg, int line = 0, int col = 0)
        : std::runtime_error(msg), kind_(kind), line_(line), col_(col) {}

    ErrorKind kind() const { return kind_; }
    int line() const { return line_; }
    int col() const { return col_; }

    void set_location(int line, int col) {
        if (line_ == 0) { line_ = line; col_ = col; }
    }

    // "line 3: NameError: name 'x' is not defined"
    std::string describe() const;

private:
    ErrorKind kind_;
    int line_;
    int col_;
};

} // namespace frameguard
