#include "frameguard/interpreter.h"

#include "frameguard/frame_ops.h"
#include "frameguard/methods.h"

namespace frameguard {

Interpreter::Interpreter(const Workshop& workshop, ExecContext& ctx) : workshop_(workshop), ctx_(ctx) {}

void Interpreter::bind_libraries() {
    for (const auto& kv : workshop_.libraries()) globals_[kv.first] = kv.second;
}

void Interpreter::bind(const std::string& name, Value v) { globals_[name] = std::move(v); }

const Value* Interpreter::lookup(const std::string& name) const {
    auto it = globals_.find(name);
    return it == globals_.end() ? nullptr : &it->second;
}

Value Interpreter::run(const Program& program) {
    // break/continue outside a loop are rejected by the parser
    const Block& body = program.body;
    for (size_t i = 0; i + 1 < body.size(); i++) exec(*body[i]);
    if (body.empty()) return Value::none();

    const Stmt& last = *body.back();
    if (last.kind != Stmt::Kind::EXPR) {
        exec(last);
        return Value::none();
    }
    ctx_.tick();
    try {
        return eval(*static_cast<const ExprStmt&>(last).expr);
    } catch (ScriptError& e) {
        e.set_location(last.line, last.col);
        throw;
    }
}

Interpreter::Flow Interpreter::exec_block(const Block& block) {
    for (const auto& s : block) {
        Flow f = exec(*s);
        if (f != Flow::NORMAL) return f;
    }
    return Flow::NORMAL;
}

Interpreter::Flow Interpreter::exec(const Stmt& s) {
    ctx_.tick();
    try {
        switch (s.kind) {
            case Stmt::Kind::EXPR:
                eval(*static_cast<const ExprStmt&>(s).expr);
                return Flow::NORMAL;
            case Stmt::Kind::ASSIGN: {
                const auto& a = static_cast<const AssignStmt&>(s);
                Value v = eval(*a.value);
                assign(*a.target, v);
                return Flow::NORMAL;
            }
            case Stmt::Kind::AUG_ASSIGN: {
                const auto& a = static_cast<const AugAssignStmt&>(s);
                Value cur = eval(*a.target);
                Value rhs = eval(*a.value);
                assign(*a.target, binary_op(ctx_, a.op, cur, rhs));
                return Flow::NORMAL;
            }
            case Stmt::Kind::IF: {
                const auto& i = static_cast<const IfStmt&>(s);
                if (truthy(eval(*i.cond))) return exec_block(i.body);
                return exec_block(i.orelse);
            }
            case Stmt::Kind::WHILE: {
                const auto& w = static_cast<const WhileStmt&>(s);
                while (truthy(eval(*w.cond))) {
                    ctx_.tick();
                    if (exec_block(w.body) == Flow::BREAK) break;
                }
                return Flow::NORMAL;
            }
            case Stmt::Kind::FOR: {
                const auto& f = static_cast<const ForStmt&>(s);
                std::vector<Value> items = iterate(ctx_, eval(*f.iter));
                for (auto& item : items) {
                    ctx_.tick();
                    globals_[f.var] = std::move(item);
                    if (exec_block(f.body) == Flow::BREAK) break;
                }
                return Flow::NORMAL;
            }
            case Stmt::Kind::BREAK: return Flow::BREAK;
            case Stmt::Kind::CONTINUE: return Flow::CONTINUE;
            case Stmt::Kind::PASS: return Flow::NORMAL;
        }
    } catch (ScriptError& e) {
        e.set_location(s.line, s.col);
        throw;
    }
    return Flow::NORMAL;
}

void Interpreter::assign(const Expr& target, const Value& v) {
    switch (target.kind) {
        case Expr::Kind::NAME:
            globals_[static_cast<const NameExpr&>(target).id] = v;
            return;
        case Expr::Kind::SUBSCRIPT: {
            const auto& sub = static_cast<const SubscriptExpr&>(target);
            Value obj = eval(*sub.object);
            Value key = eval(*sub.index);
            set_item(ctx_, obj, key, v);
            return;
        }
        case Expr::Kind::ATTRIBUTE: {
            const auto& attr = static_cast<const AttributeExpr&>(target);
            Value obj = eval(*attr.object);
            set_attr(ctx_, obj, attr.attr, v);
            return;
        }
        default:
            throw ScriptError(ErrorKind::SYNTAX, "cannot assign to expression", target.line, target.col);
    }
}

Value Interpreter::eval_name(const NameExpr& e) {
    auto it = globals_.find(e.id);
    if (it != globals_.end()) return it->second;
    if (const Value* b = workshop_.builtin(e.id)) return *b;
    throw ScriptError(ErrorKind::NAME, "name '" + e.id + "' is not defined", e.line, e.col);
}

Value Interpreter::eval_call(const CallExpr& e) {
    ctx_.tick();
    Value callee = eval(*e.func);
    CallArgs args;
    args.pos.reserve(e.args.size());
    for (const auto& a : e.args) args.pos.push_back(eval(*a));
    for (const auto& kw : e.kwargs) args.kw.emplace_back(kw.name, eval(*kw.value));
    return call_value(ctx_, callee, args);
}

Value Interpreter::eval_compare(const CompareExpr& e) {
    Value left = eval(*e.first);
    Value result;
    for (size_t i = 0; i < e.ops.size(); i++) {
        Value right = eval(*e.rest[i]);
        Value r = compare_op(ctx_, e.ops[i], left, right);
        if (e.ops.size() == 1) return r;
        // chained comparisons on scalars: a < b < c
        if (!truthy(r)) return Value::boolean(false);
        result = r;
        left = std::move(right);
    }
    return result;
}

Value Interpreter::eval(const Expr& e) {
    try {
        switch (e.kind) {
            case Expr::Kind::LITERAL: return Value::from_cell(static_cast<const LiteralExpr&>(e).value);
            case Expr::Kind::NAME: return eval_name(static_cast<const NameExpr&>(e));
            case Expr::Kind::ATTRIBUTE: {
                const auto& a = static_cast<const AttributeExpr&>(e);
                return get_attr(ctx_, eval(*a.object), a.attr);
            }
            case Expr::Kind::SUBSCRIPT: {
                const auto& s = static_cast<const SubscriptExpr&>(e);
                Value obj = eval(*s.object);
                return get_item(ctx_, obj, eval(*s.index));
            }
            case Expr::Kind::CALL: return eval_call(static_cast<const CallExpr&>(e));
            case Expr::Kind::UNARY: {
                const auto& u = static_cast<const UnaryExpr&>(e);
                return unary_op(ctx_, u.op, eval(*u.operand));
            }
            case Expr::Kind::BINARY: {
                const auto& b = static_cast<const BinaryExpr&>(e);
                Value l = eval(*b.left);
                return binary_op(ctx_, b.op, l, eval(*b.right));
            }
            case Expr::Kind::COMPARE: return eval_compare(static_cast<const CompareExpr&>(e));
            case Expr::Kind::BOOL_OP: {
                const auto& b = static_cast<const BoolOpExpr&>(e);
                Value l = eval(*b.left);
                if (b.is_and ? !truthy(l) : truthy(l)) return l;
                return eval(*b.right);
            }
            case Expr::Kind::CONDITIONAL: {
                const auto& c = static_cast<const ConditionalExpr&>(e);
                return truthy(eval(*c.cond)) ? eval(*c.then_value) : eval(*c.else_value);
            }
            case Expr::Kind::LIST:
            case Expr::Kind::TUPLE: {
                const auto& l = static_cast<const ListExpr&>(e);
                ctx_.check_cells(l.elems.size());
                std::vector<Value> items;
                items.reserve(l.elems.size());
                for (const auto& el : l.elems) items.push_back(eval(*el));
                return e.kind == Expr::Kind::LIST ? Value::list(std::move(items)) : Value::tuple(std::move(items));
            }
            case Expr::Kind::DICT: {
                const auto& d = static_cast<const DictExpr&>(e);
                auto data = std::make_shared<DictData>();
                for (size_t i = 0; i < d.keys.size(); i++) {
                    Value k = eval(*d.keys[i]);
                    data->set(to_cell(k, "dict key"), eval(*d.values[i]));
                }
                return Value::dict(data);
            }
        }
    } catch (ScriptError& err) {
        err.set_location(e.line, e.col);
        throw;
    }
    throw ScriptError(ErrorKind::SYNTAX, "unknown expression", e.line, e.col);
}

} // namespace frameguard
