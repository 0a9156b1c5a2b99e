#pragma once

// Tree-walking evaluator for FrameScript programs.
//
// The namespace holds exactly what the caller binds plus the Workshop
// builtins; a name that is neither raises NameError. There is no way to
// reach anything else: no loader, no reflection, no lookup by string.

#include "ast.h"
#include "value.h"
#include "workshop.h"

#include <string>
#include <unordered_map>

namespace frameguard {

class Interpreter {
public:
    Interpreter(const Workshop& workshop, ExecContext& ctx);

    // Binds every Workshop library under its registry name.
    void bind_libraries();
    void bind(const std::string& name, Value v);
    // nullptr when unbound (builtins are not considered).
    const Value* lookup(const std::string& name) const;

    // Throws ScriptError; location is filled from the failing node.
    // Returns the value of a trailing top-level expression statement
    // (`dataframe.fillna(0)` as the last line), None otherwise.
    Value run(const Program& program);

    Value eval(const Expr& e);

private:
    enum class Flow { NORMAL, BREAK, CONTINUE };

    Flow exec_block(const Block& block);
    Flow exec(const Stmt& s);
    void assign(const Expr& target, const Value& v);

    Value eval_name(const NameExpr& e);
    Value eval_call(const CallExpr& e);
    Value eval_compare(const CompareExpr& e);

    const Workshop& workshop_;
    ExecContext& ctx_;
    std::unordered_map<std::string, Value> globals_;
};

} // namespace frameguard
