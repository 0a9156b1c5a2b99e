#include "frameguard/errors.h"

namespace frameguard {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::SYNTAX:        return "SyntaxError";
        case ErrorKind::NAME:          return "NameError";
        case ErrorKind::TYPE:          return "TypeError";
        case ErrorKind::VALUE:         return "ValueError";
        case ErrorKind::KEY:           return "KeyError";
        case ErrorKind::INDEX:         return "IndexError";
        case ErrorKind::ATTRIBUTE:     return "AttributeError";
        case ErrorKind::ZERO_DIVISION: return "ZeroDivisionError";
        case ErrorKind::RESOURCE:      return "ResourceExceeded";
        case ErrorKind::STEP_BUDGET:   return "StepBudgetExceeded";
    }
    return "Error";
}

std::string ScriptError::describe() const {
    std::string out;
    if (line_ > 0) out = "line " + std::to_string(line_) + ": ";
    out += error_kind_name(kind_);
    out += ": ";
    out += what();
    return out;
}

} // namespace frameguard
