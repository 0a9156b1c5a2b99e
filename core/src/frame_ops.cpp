#include "frameguard/frame_ops.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace frameguard {

namespace {

bool is_bool(const Cell& c) { return std::holds_alternative<bool>(c); }
bool is_int(const Cell& c) { return std::holds_alternative<int64_t>(c); }
bool is_str(const Cell& c) { return std::holds_alternative<std::string>(c); }

// bool participates in arithmetic as 0/1
bool is_arith(const Cell& c) { return cell_is_numeric(c) || is_bool(c); }
bool is_intlike(const Cell& c) { return is_int(c) || is_bool(c); }

int64_t int_of(const Cell& c) {
    if (auto* b = std::get_if<bool>(&c)) return *b ? 1 : 0;
    return std::get<int64_t>(c);
}

double dbl_of(const Cell& c) {
    if (auto* b = std::get_if<bool>(&c)) return *b ? 1.0 : 0.0;
    return cell_as_double(c);
}

std::string cell_type(const Cell& c) {
    return cell_is_null(c) ? "NoneType" : cell_type_name(c);
}

[[noreturn]] void unsupported(const std::string& op, const Cell& a, const Cell& b) {
    throw ScriptError(ErrorKind::TYPE, "unsupported operand type(s) for " + op + ": '" + cell_type(a) + "' and '" +
                                           cell_type(b) + "'");
}

double py_fmod(double a, double b) {
    double r = std::fmod(a, b);
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

Cell int_arith(const std::string& op, int64_t x, int64_t y, bool elementwise) {
    int64_t r = 0;
    if (op == "+") {
        if (!__builtin_add_overflow(x, y, &r)) return Cell{r};
        return Cell{(double)x + (double)y};
    }
    if (op == "-") {
        if (!__builtin_sub_overflow(x, y, &r)) return Cell{r};
        return Cell{(double)x - (double)y};
    }
    if (op == "*") {
        if (!__builtin_mul_overflow(x, y, &r)) return Cell{r};
        return Cell{(double)x * (double)y};
    }
    if (op == "/") {
        if (y == 0) {
            if (!elementwise) throw ScriptError(ErrorKind::ZERO_DIVISION, "division by zero");
            return make_double_cell(x == 0 ? NAN : (x > 0 ? INFINITY : -INFINITY));
        }
        return Cell{(double)x / (double)y};
    }
    if (op == "//" || op == "%") {
        if (y == 0) {
            if (!elementwise) throw ScriptError(ErrorKind::ZERO_DIVISION, "integer division or modulo by zero");
            if (op == "%") return Cell{};
            return make_double_cell(x == 0 ? NAN : (x > 0 ? INFINITY : -INFINITY));
        }
        if (x == INT64_MIN && y == -1) return op == "//" ? Cell{-(double)x} : Cell{(int64_t)0};
        int64_t q = x / y, m = x % y;
        if (m != 0 && ((m < 0) != (y < 0))) {
            q -= 1;
            m += y;
        }
        return op == "//" ? Cell{q} : Cell{m};
    }
    if (op == "**") {
        if (y < 0) {
            if (x == 0 && !elementwise) {
                throw ScriptError(ErrorKind::ZERO_DIVISION, "0 cannot be raised to a negative power");
            }
            return Cell{std::pow((double)x, (double)y)};
        }
        int64_t acc = 1, base = x;
        int64_t e = y;
        bool overflow = false;
        while (e > 0 && !overflow) {
            if (e & 1) overflow = __builtin_mul_overflow(acc, base, &acc);
            e >>= 1;
            if (e > 0 && !overflow) overflow = __builtin_mul_overflow(base, base, &base);
        }
        if (overflow) return Cell{std::pow((double)x, (double)y)};
        return Cell{acc};
    }
    if (op == "&") return Cell{x & y};
    if (op == "|") return Cell{x | y};
    throw ScriptError(ErrorKind::TYPE, "unsupported operator " + op);
}

Cell float_arith(const std::string& op, double x, double y, bool elementwise) {
    if (op == "+") return Cell{x + y};
    if (op == "-") return Cell{x - y};
    if (op == "*") return Cell{x * y};
    if (op == "/") {
        if (y == 0 && !elementwise) throw ScriptError(ErrorKind::ZERO_DIVISION, "float division by zero");
        return Cell{x / y};
    }
    if (op == "//") {
        if (y == 0 && !elementwise) throw ScriptError(ErrorKind::ZERO_DIVISION, "float floor division by zero");
        return Cell{std::floor(x / y)};
    }
    if (op == "%") {
        if (y == 0 && !elementwise) throw ScriptError(ErrorKind::ZERO_DIVISION, "float modulo");
        return Cell{py_fmod(x, y)};
    }
    if (op == "**") {
        if (x == 0 && y < 0 && !elementwise) {
            throw ScriptError(ErrorKind::ZERO_DIVISION, "0.0 cannot be raised to a negative power");
        }
        return Cell{std::pow(x, y)};
    }
    throw ScriptError(ErrorKind::TYPE, "unsupported operand type(s) for " + op + ": 'float'");
}

Cell repeat_str(const std::string& s, int64_t n) {
    std::string out;
    for (int64_t i = 0; i < n; i++) out += s;
    return Cell{out};
}

// Elementwise & and | over masks or integer columns.
Cell logic_cells(const std::string& op, const Cell& a, const Cell& b) {
    if ((is_bool(a) || cell_is_null(a)) && (is_bool(b) || cell_is_null(b))) {
        bool x = is_bool(a) && std::get<bool>(a);
        bool y = is_bool(b) && std::get<bool>(b);
        return Cell{op == "&" ? (x && y) : (x || y)};
    }
    if (is_intlike(a) && is_intlike(b)) return int_arith(op, int_of(a), int_of(b), true);
    unsupported(op, a, b);
}

bool scalar_equal(const Cell& a, const Cell& b) {
    if (is_arith(a) && is_arith(b)) {
        if (is_intlike(a) && is_intlike(b)) return int_of(a) == int_of(b);
        return dbl_of(a) == dbl_of(b);
    }
    return cell_equal(a, b);
}

// Ordering for <, <=, >, >=. Sets *ok=false when the types do not order.
int scalar_order(const Cell& a, const Cell& b, bool* ok) {
    *ok = true;
    if (is_arith(a) && is_arith(b)) {
        if (is_intlike(a) && is_intlike(b)) {
            int64_t x = int_of(a), y = int_of(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = dbl_of(a), y = dbl_of(b);
        if (std::isnan(x) || std::isnan(y)) return 2;  // unordered: every comparison is false
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (is_str(a) && is_str(b)) {
        int c = std::get<std::string>(a).compare(std::get<std::string>(b));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    *ok = false;
    return 0;
}

bool order_holds(const std::string& op, int ord) {
    if (ord == 2) return false;
    if (op == "<") return ord < 0;
    if (op == "<=") return ord <= 0;
    if (op == ">") return ord > 0;
    return ord >= 0;
}

bool values_equal(const Value& a, const Value& b);

bool seq_equal(const std::vector<Value>& x, const std::vector<Value>& y) {
    if (x.size() != y.size()) return false;
    for (size_t i = 0; i < x.size(); i++)
        if (!values_equal(x[i], y[i])) return false;
    return true;
}

bool values_equal(const Value& a, const Value& b) {
    if (a.is_scalar() && b.is_scalar()) return scalar_equal(a.cell(), b.cell());
    if (a.is_sequence() && b.is_sequence()) {
        return a.type() == b.type() && seq_equal(a.list_data().items, b.list_data().items);
    }
    if (a.type() == Value::Type::DICT && b.type() == Value::Type::DICT) {
        const auto& x = a.dict_data().items;
        const auto& y = b.dict_data();
        if (x.size() != y.items.size()) return false;
        for (const auto& kv : x) {
            const Value* o = y.find(kv.first);
            if (!o || !values_equal(kv.second, *o)) return false;
        }
        return true;
    }
    if (a.type() == Value::Type::FRAME && b.type() == Value::Type::FRAME) return a.frame_ptr() == b.frame_ptr();
    if (a.type() == Value::Type::SERIES && b.type() == Value::Type::SERIES) return a.series_ptr() == b.series_ptr();
    return false;
}

bool identical(const Value& a, const Value& b) {
    if (a.type() != b.type()) return false;
    switch (a.type()) {
        case Value::Type::NONE: return true;
        case Value::Type::BOOL:
        case Value::Type::INT:
        case Value::Type::FLOAT:
        case Value::Type::STR: return cell_equal(a.cell(), b.cell());
        case Value::Type::LIST:
        case Value::Type::TUPLE: return &a.list_data() == &b.list_data();
        case Value::Type::DICT: return &a.dict_data() == &b.dict_data();
        case Value::Type::FRAME:
        case Value::Type::LOC: return a.frame_ptr() == b.frame_ptr();
        case Value::Type::SERIES:
        case Value::Type::STR_ACCESSOR: return a.series_ptr() == b.series_ptr();
        case Value::Type::LIBRARY: return a.library_ptr() == b.library_ptr();
        case Value::Type::FUNCTION: return &a.function_ref() == &b.function_ref();
        case Value::Type::METHOD: return &a.method_ref() == &b.method_ref();
    }
    return false;
}

bool contains(ExecContext& ctx, const Value& needle, const Value& hay) {
    switch (hay.type()) {
        case Value::Type::LIST:
        case Value::Type::TUPLE:
            for (const auto& item : hay.list_data().items) {
                ctx.tick();
                if (values_equal(needle, item)) return true;
            }
            return false;
        case Value::Type::DICT:
            return hay.dict_data().find(to_cell(needle, "dict key")) != nullptr;
        case Value::Type::STR:
            if (needle.type() != Value::Type::STR) {
                throw ScriptError(ErrorKind::TYPE, "'in <string>' requires string as left operand");
            }
            return hay.as_str().find(needle.as_str()) != std::string::npos;
        case Value::Type::FRAME:
            return needle.type() == Value::Type::STR && hay.frame().find(needle.as_str()) != nullptr;
        case Value::Type::SERIES: {
            // membership tests the index, as for a pandas Series
            const Series& s = hay.series();
            if (!s.labels.empty()) {
                if (needle.type() != Value::Type::STR) return false;
                return std::find(s.labels.begin(), s.labels.end(), needle.as_str()) != s.labels.end();
            }
            if (needle.type() != Value::Type::INT) return false;
            return needle.as_int() >= 0 && (size_t)needle.as_int() < s.cells.size();
        }
        default:
            throw ScriptError(ErrorKind::TYPE, std::string("argument of type '") + type_name(hay) +
                                                   "' is not iterable");
    }
}

const Series* series_operand(const Value& a, const Value& b) {
    if (a.type() == Value::Type::SERIES) return &a.series();
    if (b.type() == Value::Type::SERIES) return &b.series();
    return nullptr;
}

} // namespace

bool agg_from_name(const std::string& name, Agg* out) {
    static const std::pair<const char*, Agg> table[] = {
        {"sum", Agg::SUM},       {"mean", Agg::MEAN}, {"median", Agg::MEDIAN}, {"min", Agg::MIN},
        {"max", Agg::MAX},       {"std", Agg::STD},   {"var", Agg::VAR},       {"count", Agg::COUNT},
        {"nunique", Agg::NUNIQUE}, {"any", Agg::ANY}, {"all", Agg::ALL},
    };
    for (const auto& e : table) {
        if (name == e.first) {
            *out = e.second;
            return true;
        }
    }
    return false;
}

Cell arith_cells(const std::string& op, const Cell& a, const Cell& b, bool elementwise) {
    if (cell_is_null(a) || cell_is_null(b)) {
        if (elementwise) return Cell{};
        unsupported(op, a, b);
    }
    if (is_str(a) || is_str(b)) {
        if (op == "+" && is_str(a) && is_str(b)) return Cell{std::get<std::string>(a) + std::get<std::string>(b)};
        if (op == "*" && is_str(a) && is_intlike(b)) return repeat_str(std::get<std::string>(a), int_of(b));
        if (op == "*" && is_intlike(a) && is_str(b)) return repeat_str(std::get<std::string>(b), int_of(a));
        unsupported(op, a, b);
    }
    if (op == "&" || op == "|") {
        if (is_bool(a) && is_bool(b)) {
            bool x = std::get<bool>(a), y = std::get<bool>(b);
            return Cell{op == "&" ? (x && y) : (x || y)};
        }
        if (is_intlike(a) && is_intlike(b)) return int_arith(op, int_of(a), int_of(b), elementwise);
        unsupported(op, a, b);
    }
    if (is_intlike(a) && is_intlike(b)) return int_arith(op, int_of(a), int_of(b), elementwise);
    return float_arith(op, dbl_of(a), dbl_of(b), elementwise);
}

std::shared_ptr<Series> make_series(std::string name, std::vector<Cell> cells) {
    auto s = std::make_shared<Series>();
    s->name = std::move(name);
    s->cells = std::move(cells);
    return s;
}

std::vector<Cell> cells_of(ExecContext& ctx, const Value& v, const char* what) {
    if (v.type() == Value::Type::SERIES) return v.series().cells;
    if (v.is_sequence()) {
        const auto& items = v.list_data().items;
        ctx.check_cells(items.size());
        std::vector<Cell> out;
        out.reserve(items.size());
        for (const auto& item : items) out.push_back(to_cell(item, what));
        return out;
    }
    throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a Series or list, got " + type_name(v));
}

std::vector<Cell> cells_for_length(ExecContext& ctx, const Value& v, size_t n, const char* what) {
    ctx.check_cells(n);
    if (v.is_scalar()) return std::vector<Cell>(n, to_cell(v, what));
    std::vector<Cell> cells = cells_of(ctx, v, what);
    if (cells.size() != n) {
        throw ScriptError(ErrorKind::VALUE, "length of values (" + std::to_string(cells.size()) +
                                                ") does not match length of index (" + std::to_string(n) + ")");
    }
    return cells;
}

Value binary_op(ExecContext& ctx, const std::string& op, const Value& a, const Value& b) {
    if (const Series* base = series_operand(a, b)) {
        const size_t n = base->cells.size();
        std::vector<Cell> x = cells_for_length(ctx, a, n, "operand");
        std::vector<Cell> y = cells_for_length(ctx, b, n, "operand");
        auto out = make_series(base->name, {});
        out->labels = base->labels;
        out->cells.reserve(n);
        const bool logic = (op == "&" || op == "|");
        for (size_t i = 0; i < n; i++) {
            Cell r = logic ? logic_cells(op, x[i], y[i]) : arith_cells(op, x[i], y[i], true);
            if (auto* d = std::get_if<double>(&r)) r = make_double_cell(*d);
            out->cells.push_back(std::move(r));
        }
        return Value::series(out);
    }

    if (a.is_sequence() || b.is_sequence()) {
        if (op == "+" && a.type() == b.type()) {
            const auto& x = a.list_data().items;
            const auto& y = b.list_data().items;
            ctx.check_cells(x.size() + y.size());
            std::vector<Value> out(x);
            out.insert(out.end(), y.begin(), y.end());
            return a.type() == Value::Type::LIST ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
        if (op == "*" && (a.type() == Value::Type::INT || b.type() == Value::Type::INT)) {
            const Value& seq = a.is_sequence() ? a : b;
            const int64_t times = std::max<int64_t>(0, (a.is_sequence() ? b : a).as_int());
            const auto& items = seq.list_data().items;
            ctx.check_cells(items.size() * (size_t)times);
            std::vector<Value> out;
            for (int64_t i = 0; i < times; i++) out.insert(out.end(), items.begin(), items.end());
            return seq.type() == Value::Type::LIST ? Value::list(std::move(out)) : Value::tuple(std::move(out));
        }
    }

    if (a.is_scalar() && b.is_scalar()) {
        const Cell& x = a.cell();
        const Cell& y = b.cell();
        if (op == "*" && is_str(x) && is_intlike(y)) {
            ctx.check_string(std::get<std::string>(x).size() * (size_t)std::max<int64_t>(0, int_of(y)));
        } else if (op == "*" && is_intlike(x) && is_str(y)) {
            ctx.check_string(std::get<std::string>(y).size() * (size_t)std::max<int64_t>(0, int_of(x)));
        } else if (op == "+" && is_str(x) && is_str(y)) {
            ctx.check_string(std::get<std::string>(x).size() + std::get<std::string>(y).size());
        }
        return Value::from_cell(arith_cells(op, x, y, false));
    }

    throw ScriptError(ErrorKind::TYPE, "unsupported operand type(s) for " + op + ": '" + type_name(a) + "' and '" +
                                           type_name(b) + "'");
}

Value compare_op(ExecContext& ctx, const std::string& op, const Value& a, const Value& b) {
    if (op == "in") return Value::boolean(contains(ctx, a, b));
    if (op == "not in") return Value::boolean(!contains(ctx, a, b));
    if (op == "is") return Value::boolean(identical(a, b));
    if (op == "is not") return Value::boolean(!identical(a, b));

    if (const Series* base = series_operand(a, b)) {
        const size_t n = base->cells.size();
        std::vector<Cell> x = cells_for_length(ctx, a, n, "operand");
        std::vector<Cell> y = cells_for_length(ctx, b, n, "operand");
        auto out = make_series(base->name, {});
        out->labels = base->labels;
        out->cells.reserve(n);
        for (size_t i = 0; i < n; i++) {
            bool r;
            if (cell_is_null(x[i]) || cell_is_null(y[i])) {
                r = (op == "!=");
            } else if (op == "==") {
                r = scalar_equal(x[i], y[i]);
            } else if (op == "!=") {
                r = !scalar_equal(x[i], y[i]);
            } else {
                bool ok;
                int ord = scalar_order(x[i], y[i], &ok);
                if (!ok) {
                    throw ScriptError(ErrorKind::TYPE, "'" + op + "' not supported between instances of '" +
                                                           cell_type(x[i]) + "' and '" + cell_type(y[i]) + "'");
                }
                r = order_holds(op, ord);
            }
            out->cells.push_back(Cell{r});
        }
        return Value::series(out);
    }

    if (op == "==") return Value::boolean(values_equal(a, b));
    if (op == "!=") return Value::boolean(!values_equal(a, b));

    if (a.is_scalar() && b.is_scalar()) {
        bool ok;
        int ord = scalar_order(a.cell(), b.cell(), &ok);
        if (ok) return Value::boolean(order_holds(op, ord));
    } else if (a.is_sequence() && b.is_sequence()) {
        const auto& x = a.list_data().items;
        const auto& y = b.list_data().items;
        for (size_t i = 0; i < x.size() && i < y.size(); i++) {
            if (values_equal(x[i], y[i])) continue;
            return compare_op(ctx, op, x[i], y[i]);
        }
        int ord = x.size() < y.size() ? -1 : (x.size() > y.size() ? 1 : 0);
        return Value::boolean(order_holds(op, ord));
    }
    throw ScriptError(ErrorKind::TYPE, "'" + op + "' not supported between instances of '" + type_name(a) +
                                           "' and '" + type_name(b) + "'");
}

Value unary_op(ExecContext& ctx, const std::string& op, const Value& v) {
    (void)ctx;
    if (op == "not") return Value::boolean(!truthy(v));

    if (v.type() == Value::Type::SERIES) {
        const Series& s = v.series();
        auto out = make_series(s.name, {});
        out->labels = s.labels;
        out->cells.reserve(s.cells.size());
        for (const auto& c : s.cells) {
            if (cell_is_null(c)) {
                out->cells.push_back(Cell{});
            } else if (op == "~") {
                if (is_bool(c)) out->cells.push_back(Cell{!std::get<bool>(c)});
                else if (is_int(c)) out->cells.push_back(Cell{~std::get<int64_t>(c)});
                else throw ScriptError(ErrorKind::TYPE, "bad operand type for unary ~: '" + cell_type(c) + "'");
            } else if (is_arith(c)) {
                if (op == "+") out->cells.push_back(is_bool(c) ? Cell{int_of(c)} : c);
                else if (is_intlike(c) && int_of(c) != INT64_MIN) out->cells.push_back(Cell{-int_of(c)});
                else out->cells.push_back(Cell{-dbl_of(c)});
            } else {
                throw ScriptError(ErrorKind::TYPE, "bad operand type for unary " + op + ": '" + cell_type(c) + "'");
            }
        }
        return Value::series(out);
    }

    if (v.is_scalar() && is_arith(v.cell())) {
        const Cell& c = v.cell();
        if (op == "~") {
            if (!is_intlike(c)) throw ScriptError(ErrorKind::TYPE, "bad operand type for unary ~: 'float'");
            return Value::integer(~int_of(c));
        }
        if (op == "+") return is_bool(c) ? Value::integer(int_of(c)) : v;
        if (is_intlike(c) && int_of(c) != INT64_MIN) return Value::integer(-int_of(c));
        return Value::real(-dbl_of(c));
    }
    throw ScriptError(ErrorKind::TYPE, "bad operand type for unary " + op + ": '" + type_name(v) + "'");
}

double quantile(const std::vector<Cell>& cells, double q) {
    std::vector<double> xs;
    for (const auto& c : cells)
        if (is_arith(c)) xs.push_back(dbl_of(c));
    if (xs.empty()) return NAN;
    std::sort(xs.begin(), xs.end());
    const double pos = q * (double)(xs.size() - 1);
    const size_t lo = (size_t)std::floor(pos);
    const size_t hi = std::min(lo + 1, xs.size() - 1);
    const double frac = pos - (double)lo;
    return xs[lo] + (xs[hi] - xs[lo]) * frac;
}

Value aggregate(const std::vector<Cell>& cells, Agg agg, int ddof) {
    std::vector<const Cell*> present;
    present.reserve(cells.size());
    for (const auto& c : cells)
        if (!cell_is_null(c)) present.push_back(&c);

    switch (agg) {
        case Agg::COUNT: return Value::integer((int64_t)present.size());
        case Agg::NUNIQUE: {
            std::vector<Cell> sorted;
            sorted.reserve(present.size());
            for (const Cell* c : present) sorted.push_back(*c);
            std::sort(sorted.begin(), sorted.end(), cell_less);
            int64_t n = 0;
            for (size_t i = 0; i < sorted.size(); i++)
                if (i == 0 || !cell_equal(sorted[i - 1], sorted[i])) n++;
            return Value::integer(n);
        }
        case Agg::ANY:
        case Agg::ALL: {
            for (const Cell* c : present) {
                const bool t = truthy(Value::from_cell(*c));
                if (agg == Agg::ANY && t) return Value::boolean(true);
                if (agg == Agg::ALL && !t) return Value::boolean(false);
            }
            return Value::boolean(agg == Agg::ALL);
        }
        default: break;
    }

    bool all_str = !present.empty();
    bool any_str = false;
    for (const Cell* c : present) {
        if (is_str(*c)) any_str = true;
        else all_str = false;
    }

    if (agg == Agg::SUM || agg == Agg::MIN || agg == Agg::MAX) {
        if (all_str) {
            if (agg == Agg::SUM) {
                std::string out;
                for (const Cell* c : present) out += std::get<std::string>(*c);
                return Value::str(out);
            }
            const Cell* best = present.front();
            for (const Cell* c : present) {
                if (agg == Agg::MIN ? cell_less(*c, *best) : cell_less(*best, *c)) best = c;
            }
            return Value::from_cell(*best);
        }
        if (any_str) throw ScriptError(ErrorKind::TYPE, "cannot reduce a column mixing strings and numbers");
    } else if (any_str) {
        throw ScriptError(ErrorKind::TYPE, "could not convert string to float");
    }

    if (agg == Agg::SUM) {
        bool ints = true;
        for (const Cell* c : present) ints = ints && is_intlike(*c);
        if (ints) {
            int64_t acc = 0;
            bool overflow = false;
            for (const Cell* c : present) overflow = overflow || __builtin_add_overflow(acc, int_of(*c), &acc);
            if (!overflow) return Value::integer(acc);
        }
        double acc = 0;
        for (const Cell* c : present) acc += dbl_of(*c);
        return Value::real(acc);
    }

    if (present.empty()) return Value::real(NAN);

    if (agg == Agg::MIN || agg == Agg::MAX) {
        const Cell* best = present.front();
        for (const Cell* c : present) {
            const double x = dbl_of(*c), y = dbl_of(*best);
            if (agg == Agg::MIN ? x < y : x > y) best = c;
        }
        if (is_bool(*best)) return Value::integer(int_of(*best));
        return Value::from_cell(*best);
    }

    if (agg == Agg::MEDIAN) return Value::real(quantile(cells, 0.5));

    double sum = 0;
    for (const Cell* c : present) sum += dbl_of(*c);
    const double mean = sum / (double)present.size();
    if (agg == Agg::MEAN) return Value::real(mean);

    const double dof = (double)present.size() - (double)ddof;
    if (dof <= 0) return Value::real(NAN);
    double ss = 0;
    for (const Cell* c : present) {
        const double d = dbl_of(*c) - mean;
        ss += d * d;
    }
    const double var = ss / dof;
    return Value::real(agg == Agg::VAR ? var : std::sqrt(var));
}

std::shared_ptr<Series> aggregate_frame(const Dataset& t, Agg agg, int ddof) {
    const bool numeric_only = !(agg == Agg::COUNT || agg == Agg::NUNIQUE || agg == Agg::ANY || agg == Agg::ALL);
    auto out = make_series("", {});
    for (const auto& col : t.columns) {
        if (numeric_only) {
            bool has_str = false;
            for (const auto& c : col.cells) {
                if (is_str(c)) { has_str = true; break; }
            }
            if (has_str) continue;
        }
        Value v = aggregate(col.cells, agg, ddof);
        out->labels.push_back(col.name);
        out->cells.push_back(to_cell(v, "reduction"));
    }
    return out;
}

std::string dtype_of(const std::vector<Cell>& cells) {
    bool any_null = false, all_bool = true, all_int = true, all_num = true, any_value = false;
    for (const auto& c : cells) {
        if (cell_is_null(c)) { any_null = true; continue; }
        any_value = true;
        if (!is_bool(c)) all_bool = false;
        if (!is_int(c)) all_int = false;
        if (!cell_is_numeric(c)) all_num = false;
    }
    if (!any_value) return "object";
    if (all_bool) return any_null ? "object" : "bool";
    if (all_int && !any_null) return "int64";
    if (all_num) return "float64";
    return "object";
}

std::vector<bool> mask_of(const Value& v, size_t rows) {
    std::vector<bool> keep;
    auto take = [&](const Cell& c) {
        if (cell_is_null(c)) { keep.push_back(false); return; }
        if (!is_bool(c)) throw ScriptError(ErrorKind::TYPE, "row filter must contain booleans, got " + cell_type(c));
        keep.push_back(std::get<bool>(c));
    };
    if (v.type() == Value::Type::SERIES) {
        for (const auto& c : v.series().cells) take(c);
    } else if (v.type() == Value::Type::LIST) {
        for (const auto& item : v.list_data().items) take(to_cell(item, "row filter"));
    } else {
        throw ScriptError(ErrorKind::TYPE, std::string("row filter must be a boolean Series, got ") + type_name(v));
    }
    if (keep.size() != rows) {
        throw ScriptError(ErrorKind::VALUE, "boolean filter has " + std::to_string(keep.size()) +
                                                " rows, table has " + std::to_string(rows));
    }
    return keep;
}

Dataset filter_rows(const Dataset& t, const std::vector<bool>& keep) {
    Dataset out;
    out.columns.reserve(t.columns.size());
    for (const auto& col : t.columns) {
        Column c;
        c.name = col.name;
        for (size_t r = 0; r < col.cells.size(); r++)
            if (keep[r]) c.cells.push_back(col.cells[r]);
        out.columns.push_back(std::move(c));
    }
    return out;
}

Dataset select_columns(const Dataset& t, const std::vector<std::string>& names) {
    Dataset out;
    for (const auto& n : names) {
        const Column* c = t.find(n);
        if (!c) throw ScriptError(ErrorKind::KEY, "column not found: '" + n + "'");
        if (out.find(n)) throw ScriptError(ErrorKind::VALUE, "column selected twice: '" + n + "'");
        out.columns.push_back(*c);
    }
    return out;
}

double round_digits(double x, int64_t digits) {
    if (!std::isfinite(x)) return x;
    if (digits == 0) return std::nearbyint(x);
    const double scale = std::pow(10.0, (double)digits);
    const double scaled = x * scale;
    if (!std::isfinite(scaled)) return x;
    return std::nearbyint(scaled) / scale;
}

bool parse_number(const std::string& raw, Cell* out) {
    size_t b = 0, e = raw.size();
    while (b < e && std::isspace((unsigned char)raw[b])) b++;
    while (e > b && std::isspace((unsigned char)raw[e - 1])) e--;
    if (b == e) return false;
    const std::string s = raw.substr(b, e - b);
    if (s.find_first_of("xX") != std::string::npos) return false;

    char* end = nullptr;
    errno = 0;
    long long i = std::strtoll(s.c_str(), &end, 10);
    if (errno == 0 && end && *end == '\0') {
        *out = Cell{(int64_t)i};
        return true;
    }
    errno = 0;
    double d = std::strtod(s.c_str(), &end);
    if (!end || *end != '\0') return false;
    *out = make_double_cell(d);
    return true;
}

} // namespace frameguard
