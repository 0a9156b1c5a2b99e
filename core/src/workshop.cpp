#include "frameguard/workshop.h"

#include "frameguard/frame_ops.h"
#include "frameguard/methods.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace frameguard {

namespace {

Value fn(const std::string& name, NativeImpl impl) {
    auto f = std::make_shared<NativeFunction>();
    f->name = name;
    f->impl = std::move(impl);
    return Value::function(std::shared_ptr<const NativeFunction>(std::move(f)));
}

Value library(const std::string& name, std::vector<std::pair<std::string, Value>> members) {
    auto lib = std::make_shared<Library>();
    lib->name = name;
    lib->members = std::move(members);
    return Value::library(std::shared_ptr<const Library>(std::move(lib)));
}

bool is_arith_cell(const Cell& c) { return cell_is_numeric(c) || std::holds_alternative<bool>(c); }

double arith_value(const Cell& c) {
    if (auto* b = std::get_if<bool>(&c)) return *b ? 1.0 : 0.0;
    return cell_as_double(c);
}

// Applies `f` to a number, or to every cell of a column/list (null stays null).
Value elementwise(ExecContext& ctx, const char* name, const Value& x, const std::function<Cell(const Cell&)>& f) {
    auto apply = [&](const Cell& c) -> Cell {
        if (cell_is_null(c)) return c;
        if (!is_arith_cell(c)) {
            throw ScriptError(ErrorKind::TYPE, std::string(name) + "() does not support '" + cell_type_name(c) + "'");
        }
        Cell r = f(c);
        if (auto* d = std::get_if<double>(&r)) r = make_double_cell(*d);
        return r;
    };
    if (x.type() == Value::Type::SERIES) {
        const Series& s = x.series();
        auto out = make_series(s.name, {});
        out->labels = s.labels;
        out->cells.reserve(s.cells.size());
        for (const auto& c : s.cells) out->cells.push_back(apply(c));
        return Value::series(out);
    }
    if (x.is_sequence()) {
        return Value::series(make_series("", [&] {
            std::vector<Cell> cells;
            for (const auto& c : cells_of(ctx, x, name)) cells.push_back(apply(c));
            return cells;
        }()));
    }
    if (x.is_scalar()) {
        if (x.is_none()) throw ScriptError(ErrorKind::TYPE, std::string(name) + "() does not support None");
        const Cell& c = x.cell();
        if (!is_arith_cell(c)) {
            throw ScriptError(ErrorKind::TYPE, std::string(name) + "() does not support '" + cell_type_name(c) + "'");
        }
        Cell r = f(c);
        return Value::from_cell(r);
    }
    throw ScriptError(ErrorKind::TYPE, std::string(name) + "() does not support " + type_name(x));
}

Value unary_math(const char* name, double (*op)(double)) {
    return fn(name, [name, op](ExecContext& ctx, CallArgs& args) {
        args.check(name, 1, {"x"});
        return elementwise(ctx, name, args.require(0, "x", name),
                           [op](const Cell& c) { return Cell{op(arith_value(c))}; });
    });
}

Value reduction(const char* name, Agg agg, int default_ddof) {
    return fn(name, [name, agg, default_ddof](ExecContext& ctx, CallArgs& args) {
        args.check(name, 1, {"a", "ddof", "axis"});
        const Value& a = args.require(0, "a", name);
        const Value* ddof = args.kwarg("ddof");
        std::vector<Cell> cells = a.is_scalar() ? std::vector<Cell>{to_cell(a, "a")} : cells_of(ctx, a, "a");
        return aggregate(cells, agg, ddof ? (int)arg_int(*ddof, "ddof") : default_ddof);
    });
}

Value null_test(const char* name, bool want_null) {
    return fn(name, [name, want_null](ExecContext& ctx, CallArgs& args) {
        args.check(name, 1, {"obj"});
        const Value& x = args.require(0, "obj", name);
        if (x.type() == Value::Type::FRAME || x.type() == Value::Type::SERIES) {
            CallArgs none;
            if (x.type() == Value::Type::FRAME) return call_frame_method(ctx, x, want_null ? "isna" : "notna", none);
            return call_series_method(ctx, x, want_null ? "isna" : "notna", none);
        }
        if (x.is_sequence()) {
            auto out = make_series("", {});
            for (const auto& c : cells_of(ctx, x, "obj")) out->cells.push_back(Cell{cell_is_null(c) == want_null});
            return Value::series(out);
        }
        bool null = x.is_none() || (x.type() == Value::Type::FLOAT && std::isnan(x.as_double()));
        return Value::boolean(null == want_null);
    });
}

Cell to_numeric_cell(const Cell& c, const std::string& errors) {
    if (cell_is_null(c) || cell_is_numeric(c)) return c;
    if (auto* b = std::get_if<bool>(&c)) return Cell{(int64_t)(*b ? 1 : 0)};
    const std::string& s = std::get<std::string>(c);
    Cell out;
    if (parse_number(s, &out)) return out;
    if (errors == "coerce") return Cell{};
    if (errors == "ignore") return c;
    throw ScriptError(ErrorKind::VALUE, "unable to parse string \"" + s + "\"");
}

Value make_pd() {
    return library("pd", {
        {"NA", Value::none()},
        {"isna", null_test("isna", true)},
        {"isnull", null_test("isnull", true)},
        {"notna", null_test("notna", false)},
        {"notnull", null_test("notnull", false)},
        {"to_numeric", fn("to_numeric", [](ExecContext& ctx, CallArgs& args) {
             args.check("to_numeric", 1, {"arg", "errors", "downcast"});
             const Value& x = args.require(0, "arg", "to_numeric");
             const Value* e = args.kwarg("errors");
             const std::string errors = e ? arg_str(*e, "errors") : "raise";
             if (errors != "raise" && errors != "coerce" && errors != "ignore") {
                 throw ScriptError(ErrorKind::VALUE, "invalid error value specified: " + errors);
             }
             if (x.is_scalar()) return Value::from_cell(to_numeric_cell(x.cell(), errors));
             std::vector<Cell> cells = cells_of(ctx, x, "arg");
             auto out = make_series(x.type() == Value::Type::SERIES ? x.series().name : "", {});
             if (x.type() == Value::Type::SERIES) out->labels = x.series().labels;
             out->cells.reserve(cells.size());
             for (const auto& c : cells) out->cells.push_back(to_numeric_cell(c, errors));
             return Value::series(out);
         })},
    });
}

Value make_np() {
    return library("np", {
        {"nan", Value::real(NAN)},
        {"inf", Value::real(INFINITY)},
        {"pi", Value::real(M_PI)},
        {"mean", reduction("mean", Agg::MEAN, 0)},
        {"median", reduction("median", Agg::MEDIAN, 0)},
        {"std", reduction("std", Agg::STD, 0)},
        {"var", reduction("var", Agg::VAR, 0)},
        {"sum", reduction("sum", Agg::SUM, 0)},
        {"min", reduction("min", Agg::MIN, 0)},
        {"max", reduction("max", Agg::MAX, 0)},
        {"sqrt", unary_math("sqrt", [](double x) { return std::sqrt(x); })},
        {"log", unary_math("log", [](double x) { return std::log(x); })},
        {"log1p", unary_math("log1p", [](double x) { return std::log1p(x); })},
        {"exp", unary_math("exp", [](double x) { return std::exp(x); })},
        {"floor", unary_math("floor", [](double x) { return std::floor(x); })},
        {"ceil", unary_math("ceil", [](double x) { return std::ceil(x); })},
        {"abs", fn("abs", [](ExecContext& ctx, CallArgs& args) {
             args.check("abs", 1, {"x"});
             return elementwise(ctx, "abs", args.require(0, "x", "abs"), [](const Cell& c) {
                 if (auto* i = std::get_if<int64_t>(&c)) return *i < 0 && *i != INT64_MIN ? Cell{-*i} : Cell{*i};
                 return Cell{std::fabs(arith_value(c))};
             });
         })},
        {"round", fn("round", [](ExecContext& ctx, CallArgs& args) {
             args.check("round", 2, {"a", "decimals"});
             const Value* d = args.get(1, "decimals");
             const int64_t digits = d ? arg_int(*d, "decimals") : 0;
             return elementwise(ctx, "round", args.require(0, "a", "round"), [digits](const Cell& c) {
                 if (std::holds_alternative<double>(c)) return Cell{round_digits(std::get<double>(c), digits)};
                 return c;
             });
         })},
        {"isnan", fn("isnan", [](ExecContext& ctx, CallArgs& args) {
             args.check("isnan", 1, {"x"});
             const Value& x = args.require(0, "x", "isnan");
             if (x.is_none()) return Value::boolean(true);
             if (x.is_scalar()) {
                 if (!x.is_number()) throw ScriptError(ErrorKind::TYPE, "isnan() does not support 'str'");
                 return Value::boolean(std::isnan(x.as_double()));
             }
             auto out = make_series(x.type() == Value::Type::SERIES ? x.series().name : "", {});
             for (const auto& c : cells_of(ctx, x, "x")) {
                 if (std::holds_alternative<std::string>(c)) {
                     throw ScriptError(ErrorKind::TYPE, "isnan() does not support 'str'");
                 }
                 out->cells.push_back(Cell{cell_is_null(c)});
             }
             return Value::series(out);
         })},
        {"where", fn("where", [](ExecContext& ctx, CallArgs& args) {
             args.check("where", 3, {});
             const Value& cond = args.require(0, "condition", "where");
             const Value& a = args.require(1, "x", "where");
             const Value& b = args.require(2, "y", "where");
             if (cond.is_scalar()) return truthy(cond) ? a : b;
             std::vector<Cell> mask = cells_of(ctx, cond, "condition");
             std::vector<Cell> xs = cells_for_length(ctx, a, mask.size(), "x");
             std::vector<Cell> ys = cells_for_length(ctx, b, mask.size(), "y");
             auto out = make_series(cond.type() == Value::Type::SERIES ? cond.series().name : "", {});
             out->cells.reserve(mask.size());
             for (size_t i = 0; i < mask.size(); i++) {
                 out->cells.push_back(truthy(Value::from_cell(mask[i])) ? xs[i] : ys[i]);
             }
             return Value::series(out);
         })},
        {"clip", fn("clip", [](ExecContext& ctx, CallArgs& args) {
             args.check("clip", 3, {"a", "a_min", "a_max"});
             const Value& a = args.require(0, "a", "clip");
             const Value* lo = args.get(1, "a_min");
             const Value* hi = args.get(2, "a_max");
             Value series = a;
             if (a.is_sequence()) series = Value::series(make_series("", cells_of(ctx, a, "a")));
             if (series.type() == Value::Type::SERIES) {
                 CallArgs fwd;
                 fwd.pos.push_back(lo ? *lo : Value::none());
                 fwd.pos.push_back(hi ? *hi : Value::none());
                 return call_series_method(ctx, series, "clip", fwd);
             }
             double x = arg_double(a, "a");
             if (lo && !lo->is_none() && x < arg_double(*lo, "a_min")) return *lo;
             if (hi && !hi->is_none() && x > arg_double(*hi, "a_max")) return *hi;
             return a;
         })},
    });
}

Value make_scipy() {
    Value stats = library("scipy.stats", {
        {"zscore", fn("zscore", [](ExecContext& ctx, CallArgs& args) {
             args.check("zscore", 1, {"a", "ddof", "nan_policy"});
             const Value& a = args.require(0, "a", "zscore");
             const Value* ddof_v = args.kwarg("ddof");
             const int ddof = ddof_v ? (int)arg_int(*ddof_v, "ddof") : 0;
             std::vector<Cell> cells = cells_of(ctx, a, "a");
             const double mean = aggregate(cells, Agg::MEAN, 0).as_double();
             const double sd = aggregate(cells, Agg::STD, ddof).as_double();
             auto out = make_series(a.type() == Value::Type::SERIES ? a.series().name : "", {});
             out->cells.reserve(cells.size());
             for (const auto& c : cells) {
                 if (cell_is_null(c)) out->cells.push_back(c);
                 else out->cells.push_back(make_double_cell((arith_value(c) - mean) / sd));
             }
             return Value::series(out);
         })},
        {"iqr", fn("iqr", [](ExecContext& ctx, CallArgs& args) {
             args.check("iqr", 1, {"x", "nan_policy"});
             const Value& x = args.require(0, "x", "iqr");
             std::vector<Cell> cells = cells_of(ctx, x, "x");
             for (const auto& c : cells) {
                 if (std::holds_alternative<std::string>(c)) {
                     throw ScriptError(ErrorKind::TYPE, "iqr() requires numeric values");
                 }
             }
             return Value::real(quantile(cells, 0.75) - quantile(cells, 0.25));
         })},
    });
    return library("scipy", {{"stats", stats}});
}

// ---- builtins ----

Value b_print(ExecContext& ctx, CallArgs& args) {
    args.check("print", SIZE_MAX, {"sep", "end"});
    const Value* sep_v = args.kwarg("sep");
    const Value* end_v = args.kwarg("end");
    const std::string sep = sep_v && !sep_v->is_none() ? arg_str(*sep_v, "sep") : " ";
    const std::string end = end_v && !end_v->is_none() ? arg_str(*end_v, "end") : "\n";
    std::string line;
    for (size_t i = 0; i < args.pos.size(); i++) {
        if (i) line += sep;
        line += to_str(args.pos[i]);
    }
    ctx.write_console(line + end);
    return Value::none();
}

Value b_len(ExecContext& ctx, CallArgs& args) {
    (void)ctx;
    args.check("len", 1, {});
    const Value& x = args.require(0, "obj", "len");
    switch (x.type()) {
        case Value::Type::STR: return Value::integer((int64_t)x.as_str().size());
        case Value::Type::LIST:
        case Value::Type::TUPLE: return Value::integer((int64_t)x.list_data().items.size());
        case Value::Type::DICT: return Value::integer((int64_t)x.dict_data().items.size());
        case Value::Type::FRAME: return Value::integer((int64_t)x.frame().rows());
        case Value::Type::SERIES: return Value::integer((int64_t)x.series().cells.size());
        default: throw ScriptError(ErrorKind::TYPE, std::string("object of type '") + type_name(x) + "' has no len()");
    }
}

Value b_range(ExecContext& ctx, CallArgs& args) {
    args.check("range", 3, {});
    if (args.pos.empty()) throw ScriptError(ErrorKind::TYPE, "range expected at least 1 argument, got 0");
    int64_t start = 0, stop, step = 1;
    if (args.pos.size() == 1) {
        stop = arg_int(args.pos[0], "stop");
    } else {
        start = arg_int(args.pos[0], "start");
        stop = arg_int(args.pos[1], "stop");
        if (args.pos.size() == 3) step = arg_int(args.pos[2], "step");
    }
    if (step == 0) throw ScriptError(ErrorKind::VALUE, "range() arg 3 must not be zero");
    long double span = step > 0 ? (long double)stop - start : (long double)start - stop;
    long double count = span <= 0 ? 0 : std::ceil(span / std::fabs((long double)step));
    if (count > (long double)SIZE_MAX / 2) count = (long double)SIZE_MAX / 2;
    ctx.check_cells((size_t)count);
    std::vector<Value> out;
    out.reserve((size_t)count);
    for (int64_t i = start; step > 0 ? i < stop : i > stop; i += step) {
        out.push_back(Value::integer(i));
        if ((step > 0 && i > INT64_MAX - step) || (step < 0 && i < INT64_MIN - step)) break;
    }
    return Value::list(std::move(out));
}

Value b_str(ExecContext&, CallArgs& args) {
    args.check("str", 1, {"object"});
    const Value* x = args.get(0, "object");
    return Value::str(x ? to_str(*x) : std::string());
}

Value b_int(ExecContext&, CallArgs& args) {
    args.check("int", 1, {});
    const Value* x = args.get(0, nullptr);
    if (!x) return Value::integer(0);
    switch (x->type()) {
        case Value::Type::BOOL: return Value::integer(x->as_bool() ? 1 : 0);
        case Value::Type::INT: return *x;
        case Value::Type::FLOAT: {
            const double d = x->as_double();
            if (std::isnan(d)) throw ScriptError(ErrorKind::VALUE, "cannot convert float NaN to integer");
            if (std::isinf(d)) throw ScriptError(ErrorKind::VALUE, "cannot convert float infinity to integer");
            if (std::fabs(d) >= 9.2e18) throw ScriptError(ErrorKind::VALUE, "integer out of range");
            return Value::integer((int64_t)std::trunc(d));
        }
        case Value::Type::STR: {
            Cell c;
            if (parse_number(x->as_str(), &c) && std::holds_alternative<int64_t>(c)) return Value::from_cell(c);
            throw ScriptError(ErrorKind::VALUE, "invalid literal for int() with base 10: " + cell_repr(x->cell()));
        }
        default:
            throw ScriptError(ErrorKind::TYPE, std::string("int() argument must be a string or a number, not '") +
                                                   type_name(*x) + "'");
    }
}

Value b_float(ExecContext&, CallArgs& args) {
    args.check("float", 1, {});
    const Value* x = args.get(0, nullptr);
    if (!x) return Value::real(0.0);
    if (x->is_number()) return Value::real(x->as_double());
    if (x->type() == Value::Type::STR) {
        std::string s = x->as_str();
        std::string low;
        for (char ch : s)
            if (!std::isspace((unsigned char)ch)) low.push_back((char)std::tolower((unsigned char)ch));
        if (low == "nan" || low == "+nan" || low == "-nan") return Value::real(NAN);
        if (low == "inf" || low == "+inf" || low == "infinity") return Value::real(INFINITY);
        if (low == "-inf" || low == "-infinity") return Value::real(-INFINITY);
        Cell c;
        if (parse_number(s, &c) && !cell_is_null(c)) return Value::real(cell_as_double(c));
        throw ScriptError(ErrorKind::VALUE, "could not convert string to float: " + cell_repr(x->cell()));
    }
    throw ScriptError(ErrorKind::TYPE, std::string("float() argument must be a string or a number, not '") +
                                           type_name(*x) + "'");
}

Value b_bool(ExecContext&, CallArgs& args) {
    args.check("bool", 1, {});
    const Value* x = args.get(0, nullptr);
    return Value::boolean(x ? truthy(*x) : false);
}

Value b_list(ExecContext& ctx, CallArgs& args) {
    args.check("list", 1, {});
    const Value* x = args.get(0, nullptr);
    return Value::list(x ? iterate(ctx, *x) : std::vector<Value>{});
}

Value b_tuple(ExecContext& ctx, CallArgs& args) {
    args.check("tuple", 1, {});
    const Value* x = args.get(0, nullptr);
    return Value::tuple(x ? iterate(ctx, *x) : std::vector<Value>{});
}

// No set type: distinct scalars as a list, in first-seen order.
Value b_set(ExecContext& ctx, CallArgs& args) {
    args.check("set", 1, {});
    const Value* x = args.get(0, nullptr);
    std::vector<Value> out;
    std::vector<Cell> seen;
    if (x) {
        for (auto& item : iterate(ctx, *x)) {
            Cell c = to_cell(item, "set element");
            bool dup = false;
            for (const auto& s : seen) {
                if (cell_equal(s, c)) { dup = true; break; }
            }
            if (dup) continue;
            seen.push_back(c);
            out.push_back(std::move(item));
        }
    }
    return Value::list(std::move(out));
}

Value b_dict(ExecContext& ctx, CallArgs& args) {
    args.check("dict", 1, {});
    auto d = std::make_shared<DictData>();
    if (const Value* src = args.get(0, nullptr)) {
        if (src->type() != Value::Type::DICT) throw ScriptError(ErrorKind::TYPE, "dict() expects a dict");
        d->items = src->dict_data().items;
    }
    ctx.check_cells(d->items.size() + args.kw.size());
    for (const auto& kv : args.kw) d->set(Cell{kv.first}, kv.second);
    return Value::dict(d);
}

Value b_abs(ExecContext& ctx, CallArgs& args) {
    args.check("abs", 1, {});
    const Value& x = args.require(0, "x", "abs");
    if (x.type() == Value::Type::SERIES) {
        CallArgs none;
        return call_series_method(ctx, x, "abs", none);
    }
    if (x.type() == Value::Type::INT) {
        const int64_t i = x.as_int();
        return i == INT64_MIN ? Value::real(std::fabs((double)i)) : Value::integer(i < 0 ? -i : i);
    }
    if (x.type() == Value::Type::BOOL) return Value::integer(x.as_bool() ? 1 : 0);
    if (x.type() == Value::Type::FLOAT) return Value::real(std::fabs(x.as_double()));
    throw ScriptError(ErrorKind::TYPE, std::string("bad operand type for abs(): '") + type_name(x) + "'");
}

Value extreme(ExecContext& ctx, CallArgs& args, const char* name, bool want_max) {
    args.check(name, SIZE_MAX, {"default"});
    if (args.pos.empty()) throw ScriptError(ErrorKind::TYPE, std::string(name) + " expected at least 1 argument");
    if (args.pos.size() == 1 && args.pos[0].type() == Value::Type::SERIES) {
        return aggregate(args.pos[0].series().cells, want_max ? Agg::MAX : Agg::MIN, 1);
    }
    std::vector<Value> items = args.pos.size() == 1 ? iterate(ctx, args.pos[0]) : args.pos;
    if (items.empty()) {
        if (const Value* d = args.kwarg("default")) return *d;
        throw ScriptError(ErrorKind::VALUE, std::string(name) + "() arg is an empty sequence");
    }
    Value best = items[0];
    for (size_t i = 1; i < items.size(); i++) {
        ctx.tick();
        if (truthy(compare_op(ctx, want_max ? ">" : "<", items[i], best))) best = items[i];
    }
    return best;
}

Value b_sum(ExecContext& ctx, CallArgs& args) {
    args.check("sum", 2, {"start"});
    const Value& x = args.require(0, "iterable", "sum");
    const Value* start = args.get(1, "start");
    if (x.type() == Value::Type::SERIES && !start) return aggregate(x.series().cells, Agg::SUM, 1);
    Value acc = start ? *start : Value::integer(0);
    for (const auto& item : iterate(ctx, x)) {
        ctx.tick();
        acc = binary_op(ctx, "+", acc, item);
    }
    return acc;
}

Value b_round(ExecContext& ctx, CallArgs& args) {
    args.check("round", 2, {"number", "ndigits"});
    const Value& x = args.require(0, "number", "round");
    const Value* nd = args.get(1, "ndigits");
    if (x.type() == Value::Type::SERIES || x.type() == Value::Type::FRAME) {
        CallArgs fwd;
        if (nd) fwd.pos.push_back(*nd);
        return x.type() == Value::Type::SERIES ? call_series_method(ctx, x, "round", fwd)
                                               : call_frame_method(ctx, x, "round", fwd);
    }
    if (x.type() == Value::Type::INT || x.type() == Value::Type::BOOL) {
        return x.type() == Value::Type::BOOL ? Value::integer(x.as_bool() ? 1 : 0) : x;
    }
    const double d = arg_double(x, "number");
    if (!nd || nd->is_none()) {
        if (!std::isfinite(d)) throw ScriptError(ErrorKind::VALUE, "cannot convert float " + format_float(d) + " to integer");
        return Value::integer((int64_t)round_digits(d, 0));
    }
    return Value::real(round_digits(d, arg_int(*nd, "ndigits")));
}

Value b_sorted(ExecContext& ctx, CallArgs& args) {
    args.check("sorted", 1, {"reverse"});
    std::vector<Value> items = iterate(ctx, args.require(0, "iterable", "sorted"));
    const Value* rev = args.kwarg("reverse");
    const bool reverse = rev && arg_bool(*rev, "reverse");
    std::stable_sort(items.begin(), items.end(), [&](const Value& a, const Value& b) {
        return truthy(compare_op(ctx, "<", reverse ? b : a, reverse ? a : b));
    });
    return Value::list(std::move(items));
}

} // namespace

Workshop::Workshop() {
    libs_.emplace_back("pd", make_pd());
    libs_.emplace_back("np", make_np());
    libs_.emplace_back("scipy", make_scipy());

    builtins_ = {
        {"print", fn("print", b_print)},
        {"len", fn("len", b_len)},
        {"range", fn("range", b_range)},
        {"str", fn("str", b_str)},
        {"int", fn("int", b_int)},
        {"float", fn("float", b_float)},
        {"bool", fn("bool", b_bool)},
        {"list", fn("list", b_list)},
        {"dict", fn("dict", b_dict)},
        {"tuple", fn("tuple", b_tuple)},
        {"set", fn("set", b_set)},
        {"abs", fn("abs", b_abs)},
        {"max", fn("max", [](ExecContext& ctx, CallArgs& args) { return extreme(ctx, args, "max", true); })},
        {"min", fn("min", [](ExecContext& ctx, CallArgs& args) { return extreme(ctx, args, "min", false); })},
        {"sum", fn("sum", b_sum)},
        {"round", fn("round", b_round)},
        {"sorted", fn("sorted", b_sorted)},
    };
}

const Workshop& Workshop::initialize() {
    static const Workshop instance;
    return instance;
}

const Library* Workshop::get(const std::string& name) const {
    for (const auto& kv : libs_)
        if (kv.first == name) return &kv.second.library_ref();
    return nullptr;
}

std::vector<std::string> Workshop::names() const {
    std::vector<std::string> out;
    for (const auto& kv : libs_) out.push_back(kv.first);
    return out;
}

const Value* Workshop::builtin(const std::string& name) const {
    for (const auto& kv : builtins_)
        if (kv.first == name) return &kv.second;
    return nullptr;
}

} // namespace frameguard
