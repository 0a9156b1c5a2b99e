#include "frameguard/frame_ops.h"
#include "frameguard/methods.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace frameguard {

namespace {

const char* const kSeriesMethods[] = {
    "sum",     "mean",    "median", "min",     "max",   "std",         "var",     "count",    "nunique",
    "any",     "all",     "unique", "fillna",  "ffill", "bfill",       "isnull",  "isna",     "notnull",
    "notna",   "dropna",  "astype", "round",   "abs",   "clip",        "replace", "map",      "apply",
    "quantile", "between", "isin",  "tolist",  "to_list", "copy",      "value_counts", "idxmax", "idxmin",
    "cumsum",  "sort_values", "reset_index", "head", "tail", "duplicated", "where",
};

std::shared_ptr<Series> like(const Series& s) {
    auto out = make_series(s.name, {});
    out->labels = s.labels;
    out->cells.reserve(s.cells.size());
    return out;
}

Value finish(const Value& self, std::shared_ptr<Series> result, const CallArgs& args) {
    const Value* inplace = args.kwarg("inplace");
    if (inplace && arg_bool(*inplace, "inplace")) {
        *self.series_ptr() = std::move(*result);
        return Value::none();
    }
    return Value::series(std::move(result));
}

// Subset of a column by position, carrying labels along.
std::shared_ptr<Series> take(const Series& s, const std::vector<size_t>& order) {
    auto out = make_series(s.name, {});
    for (size_t i : order) {
        out->cells.push_back(s.cells[i]);
        if (!s.labels.empty()) out->labels.push_back(s.labels[i]);
    }
    return out;
}

bool numeric(const Cell& c) { return cell_is_numeric(c) || std::holds_alternative<bool>(c); }

double num(const Cell& c) {
    if (auto* b = std::get_if<bool>(&c)) return *b ? 1.0 : 0.0;
    return cell_as_double(c);
}

Value m_fillna(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("fillna", 1, {"value", "inplace", "method"});
    const Series& s = self.series();
    if (const Value* method = args.kwarg("method")) {
        const std::string m = arg_str(*method, "method");
        if (m == "ffill" || m == "pad" || m == "bfill" || m == "backfill") {
            CallArgs rest;
            if (const Value* inplace = args.kwarg("inplace")) rest.kw.emplace_back("inplace", *inplace);
            return call_series_method(ctx, self, (m == "ffill" || m == "pad") ? "ffill" : "bfill", rest);
        }
        throw ScriptError(ErrorKind::VALUE, "invalid fill method: " + m);
    }
    const Value& value = args.require(0, "value", "fillna");
    std::vector<Cell> fill = cells_for_length(ctx, value, s.cells.size(), "fill value");
    auto out = like(s);
    for (size_t i = 0; i < s.cells.size(); i++) out->cells.push_back(cell_is_null(s.cells[i]) ? fill[i] : s.cells[i]);
    return finish(self, out, args);
}

Value m_fill_direction(const Value& self, bool forward, CallArgs& args) {
    args.check(forward ? "ffill" : "bfill", 0, {"inplace", "limit"});
    const Series& s = self.series();
    auto out = like(s);
    out->cells = s.cells;
    const Value* limit_v = args.kwarg("limit");
    const int64_t limit = limit_v ? arg_int(*limit_v, "limit") : -1;
    const size_t n = out->cells.size();
    Cell last;
    int64_t run = 0;
    for (size_t k = 0; k < n; k++) {
        const size_t i = forward ? k : n - 1 - k;
        if (!cell_is_null(out->cells[i])) {
            last = out->cells[i];
            run = 0;
        } else if (!cell_is_null(last) && (limit < 0 || run < limit)) {
            out->cells[i] = last;
            run++;
        }
    }
    return finish(self, out, args);
}

Value m_null_mask(const Value& self, bool want_null, CallArgs& args) {
    args.check("isnull", 0, {});
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) out->cells.push_back(Cell{cell_is_null(c) == want_null});
    return Value::series(out);
}

Value m_dropna(const Value& self, CallArgs& args) {
    args.check("dropna", 0, {"inplace"});
    const Series& s = self.series();
    std::vector<size_t> order;
    for (size_t i = 0; i < s.cells.size(); i++)
        if (!cell_is_null(s.cells[i])) order.push_back(i);
    return finish(self, take(s, order), args);
}

Value m_astype(const Value& self, CallArgs& args) {
    args.check("astype", 1, {"dtype"});
    const std::string target = dtype_arg(args.require(0, "dtype", "astype"));
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) out->cells.push_back(convert_cell(c, target));
    return Value::series(out);
}

Value m_round(const Value& self, CallArgs& args) {
    args.check("round", 1, {"decimals"});
    const Value* d = args.get(0, "decimals");
    const int64_t digits = d ? arg_int(*d, "decimals") : 0;
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) {
        if (auto* x = std::get_if<double>(&c)) out->cells.push_back(make_double_cell(round_digits(*x, digits)));
        else out->cells.push_back(c);
    }
    return Value::series(out);
}

Value m_abs(const Value& self, CallArgs& args) {
    args.check("abs", 0, {});
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) {
        if (auto* i = std::get_if<int64_t>(&c)) out->cells.push_back(*i == INT64_MIN ? Cell{std::fabs((double)*i)} : Cell{*i < 0 ? -*i : *i});
        else if (auto* x = std::get_if<double>(&c)) out->cells.push_back(Cell{std::fabs(*x)});
        else if (cell_is_null(c)) out->cells.push_back(c);
        else throw ScriptError(ErrorKind::TYPE, "bad operand type for abs(): '" + cell_type_name(c) + "'");
    }
    return Value::series(out);
}

Value m_clip(const Value& self, CallArgs& args) {
    args.check("clip", 2, {"lower", "upper"});
    const Value* lo_v = args.get(0, "lower");
    const Value* hi_v = args.get(1, "upper");
    const bool has_lo = lo_v && !lo_v->is_none();
    const bool has_hi = hi_v && !hi_v->is_none();
    const double lo = has_lo ? arg_double(*lo_v, "lower") : 0;
    const double hi = has_hi ? arg_double(*hi_v, "upper") : 0;
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) {
        if (!numeric(c)) {
            if (!cell_is_null(c)) throw ScriptError(ErrorKind::TYPE, "clip() requires numeric values");
            out->cells.push_back(c);
            continue;
        }
        const double x = num(c);
        if (has_lo && x < lo) out->cells.push_back(lo_v->cell());
        else if (has_hi && x > hi) out->cells.push_back(hi_v->cell());
        else out->cells.push_back(c);
    }
    return Value::series(out);
}

Value m_replace(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("replace", 2, {"to_replace", "value", "inplace"});
    const Value& from = args.require(0, "to_replace", "replace");
    std::vector<std::pair<Cell, Cell>> pairs;
    if (from.type() == Value::Type::DICT) {
        for (const auto& kv : from.dict_data().items) pairs.emplace_back(kv.first, to_cell(kv.second, "value"));
    } else {
        const Value* to = args.get(1, "value");
        const Cell to_c = to ? to_cell(*to, "value") : Cell{};
        if (from.is_scalar()) pairs.emplace_back(to_cell(from, "to_replace"), to_c);
        else
            for (const auto& c : cells_of(ctx, from, "to_replace")) pairs.emplace_back(c, to_c);
    }
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) {
        Cell r = c;
        for (const auto& p : pairs) {
            if (cell_equal(c, p.first)) {
                r = p.second;
                break;
            }
        }
        out->cells.push_back(std::move(r));
    }
    return finish(self, out, args);
}

Value m_map(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    args.check(name.c_str(), 1, {"na_action"});
    const Value& f = args.require(0, "arg", name.c_str());
    const Value* na_action = args.kwarg("na_action");
    const bool skip_na = na_action && !na_action->is_none() && arg_str(*na_action, "na_action") == "ignore";
    const Series& s = self.series();
    auto out = like(s);
    if (f.type() == Value::Type::DICT) {
        if (name == "apply") throw ScriptError(ErrorKind::TYPE, "apply() expects a function");
        for (const auto& c : s.cells) {
            const Value* hit = f.dict_data().find(c);
            out->cells.push_back(hit ? to_cell(*hit, "mapped value") : Cell{});
        }
        return Value::series(out);
    }
    if (f.type() != Value::Type::FUNCTION && f.type() != Value::Type::METHOD) {
        throw ScriptError(ErrorKind::TYPE, name + "() expects a dict or a function, got " + type_name(f));
    }
    for (const auto& c : s.cells) {
        ctx.tick();
        if (skip_na && cell_is_null(c)) {
            out->cells.push_back(c);
            continue;
        }
        CallArgs one;
        one.pos.push_back(Value::from_cell(c));
        out->cells.push_back(to_cell(call_value(ctx, f, one), "mapped value"));
    }
    return Value::series(out);
}

Value m_quantile(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("quantile", 1, {"q"});
    const Value* q = args.get(0, "q");
    const Series& s = self.series();
    for (const auto& c : s.cells) {
        if (std::holds_alternative<std::string>(c)) throw ScriptError(ErrorKind::TYPE, "quantile() requires numeric values");
    }
    auto one = [&](const Value& qv) {
        const double p = arg_double(qv, "q");
        if (p < 0 || p > 1) throw ScriptError(ErrorKind::VALUE, "percentiles should all be in the interval [0, 1]");
        return quantile(s.cells, p);
    };
    if (!q) return Value::real(quantile(s.cells, 0.5));
    if (q->is_sequence()) {
        auto out = make_series(s.name, {});
        for (const auto& item : iterate(ctx, *q)) {
            out->labels.push_back(to_str(item));
            out->cells.push_back(make_double_cell(one(item)));
        }
        return Value::series(out);
    }
    return Value::real(one(*q));
}

Value m_between(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("between", 3, {"left", "right", "inclusive"});
    const Value& left = args.require(0, "left", "between");
    const Value& right = args.require(1, "right", "between");
    const Value* inc_v = args.get(2, "inclusive");
    const std::string inc = inc_v ? arg_str(*inc_v, "inclusive") : "both";
    if (inc != "both" && inc != "neither" && inc != "left" && inc != "right") {
        throw ScriptError(ErrorKind::VALUE, "inclusive must be 'both', 'neither', 'left' or 'right'");
    }
    Value lo = compare_op(ctx, (inc == "both" || inc == "left") ? ">=" : ">", self, left);
    Value hi = compare_op(ctx, (inc == "both" || inc == "right") ? "<=" : "<", self, right);
    return binary_op(ctx, "&", lo, hi);
}

Value m_isin(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("isin", 1, {"values"});
    std::vector<Cell> values = cells_of(ctx, args.require(0, "values", "isin"), "values");
    std::sort(values.begin(), values.end(), cell_less);
    const Series& s = self.series();
    auto out = like(s);
    for (const auto& c : s.cells) {
        auto it = std::lower_bound(values.begin(), values.end(), c, cell_less);
        const bool hit = it != values.end() && cell_equal(*it, c);
        out->cells.push_back(Cell{hit && !cell_is_null(c)});
    }
    return Value::series(out);
}

Value m_value_counts(const Value& self, CallArgs& args) {
    args.check("value_counts", 0, {"dropna", "normalize", "ascending"});
    const Value* dropna_v = args.kwarg("dropna");
    const Value* norm_v = args.kwarg("normalize");
    const Value* asc_v = args.kwarg("ascending");
    const bool dropna = !dropna_v || arg_bool(*dropna_v, "dropna");
    const bool normalize = norm_v && arg_bool(*norm_v, "normalize");
    const bool ascending = asc_v && arg_bool(*asc_v, "ascending");

    const Series& s = self.series();
    std::vector<Cell> keys;
    std::vector<int64_t> counts;
    std::vector<size_t> order(s.cells.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return cell_less(s.cells[a], s.cells[b]); });
    std::vector<size_t> first_seen;
    for (size_t i = 0; i < order.size();) {
        size_t j = i + 1;
        while (j < order.size() && cell_equal(s.cells[order[i]], s.cells[order[j]])) j++;
        const Cell& key = s.cells[order[i]];
        if (!(dropna && cell_is_null(key))) {
            keys.push_back(key);
            counts.push_back((int64_t)(j - i));
            first_seen.push_back(order[i]);
        }
        i = j;
    }
    std::vector<size_t> rank(keys.size());
    std::iota(rank.begin(), rank.end(), 0);
    std::stable_sort(rank.begin(), rank.end(), [&](size_t a, size_t b) {
        if (counts[a] != counts[b]) return ascending ? counts[a] < counts[b] : counts[a] > counts[b];
        return first_seen[a] < first_seen[b];
    });
    int64_t total = 0;
    for (auto c : counts) total += c;
    auto out = make_series(normalize ? "proportion" : "count", {});
    for (size_t r : rank) {
        out->labels.push_back(cell_to_str(keys[r]));
        if (normalize) out->cells.push_back(Cell{total ? (double)counts[r] / (double)total : 0.0});
        else out->cells.push_back(Cell{counts[r]});
    }
    return Value::series(out);
}

Value m_idx(const Value& self, bool want_max, CallArgs& args) {
    args.check(want_max ? "idxmax" : "idxmin", 0, {"skipna"});
    const Series& s = self.series();
    long best = -1;
    for (size_t i = 0; i < s.cells.size(); i++) {
        const Cell& c = s.cells[i];
        if (cell_is_null(c)) continue;
        if (!numeric(c)) throw ScriptError(ErrorKind::TYPE, "idxmax()/idxmin() require numeric values");
        if (best < 0 || (want_max ? num(c) > num(s.cells[(size_t)best]) : num(c) < num(s.cells[(size_t)best]))) {
            best = (long)i;
        }
    }
    if (best < 0) throw ScriptError(ErrorKind::VALUE, "attempt to get argmax of an empty sequence");
    if (!s.labels.empty()) return Value::str(s.labels[(size_t)best]);
    return Value::integer(best);
}

Value m_cumsum(const Value& self, CallArgs& args) {
    args.check("cumsum", 0, {"skipna"});
    const Series& s = self.series();
    auto out = like(s);
    Cell acc{(int64_t)0};
    for (const auto& c : s.cells) {
        if (cell_is_null(c)) {
            out->cells.push_back(c);
            continue;
        }
        acc = arith_cells("+", acc, c, true);
        out->cells.push_back(acc);
    }
    return Value::series(out);
}

Value m_sort_values(const Value& self, CallArgs& args) {
    args.check("sort_values", 0, {"ascending", "na_position", "inplace", "ignore_index"});
    const Value* asc_v = args.kwarg("ascending");
    const bool ascending = !asc_v || arg_bool(*asc_v, "ascending");
    const Value* na_v = args.kwarg("na_position");
    const bool na_first = na_v && arg_str(*na_v, "na_position") == "first";
    const Series& s = self.series();
    std::vector<size_t> order(s.cells.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const Cell& x = s.cells[a];
        const Cell& y = s.cells[b];
        const bool xn = cell_is_null(x), yn = cell_is_null(y);
        if (xn || yn) return xn && yn ? false : (na_first ? xn : yn);
        return ascending ? cell_less(x, y) : cell_less(y, x);
    });
    return finish(self, take(s, order), args);
}

Value m_head_tail(const Value& self, bool head, CallArgs& args) {
    args.check(head ? "head" : "tail", 1, {"n"});
    const Value* nv = args.get(0, "n");
    const Series& s = self.series();
    const int64_t rows = (int64_t)s.cells.size();
    int64_t n = nv ? arg_int(*nv, "n") : 5;
    if (n < 0) n = std::max<int64_t>(0, rows + n);
    n = std::min(n, rows);
    std::vector<size_t> order;
    const int64_t start = head ? 0 : rows - n;
    for (int64_t i = start; i < start + n; i++) order.push_back((size_t)i);
    return Value::series(take(s, order));
}

Value m_duplicated(const Value& self, CallArgs& args) {
    args.check("duplicated", 0, {"keep"});
    const Value* keep_v = args.kwarg("keep");
    std::string keep = "first";
    if (keep_v) keep = (keep_v->type() == Value::Type::BOOL && !keep_v->as_bool()) ? "none" : arg_str(*keep_v, "keep");
    const Series& s = self.series();
    std::vector<size_t> order(s.cells.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return cell_less(s.cells[a], s.cells[b]); });
    std::vector<bool> dup(s.cells.size(), true);
    for (size_t i = 0; i < order.size();) {
        size_t j = i + 1;
        while (j < order.size() && cell_equal(s.cells[order[i]], s.cells[order[j]])) j++;
        if (keep == "first") dup[order[i]] = false;
        else if (keep == "last") dup[order[j - 1]] = false;
        else if (j - i == 1) dup[order[i]] = false;
        i = j;
    }
    auto out = like(s);
    for (bool d : dup) out->cells.push_back(Cell{d});
    return Value::series(out);
}

Value m_where(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("where", 2, {"cond", "other", "inplace"});
    const Series& s = self.series();
    std::vector<bool> keep = mask_of(args.require(0, "cond", "where"), s.cells.size());
    const Value* other = args.get(1, "other");
    std::vector<Cell> repl = other ? cells_for_length(ctx, *other, s.cells.size(), "other")
                                   : std::vector<Cell>(s.cells.size());
    auto out = like(s);
    for (size_t i = 0; i < s.cells.size(); i++) out->cells.push_back(keep[i] ? s.cells[i] : repl[i]);
    return finish(self, out, args);
}

} // namespace

bool has_series_method(const std::string& name) {
    for (const char* m : kSeriesMethods)
        if (name == m) return true;
    return false;
}

Value call_series_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    const Series& s = self.series();
    Agg agg;
    if (agg_from_name(name, &agg)) {
        args.check(name.c_str(), 0, {"skipna", "ddof", "numeric_only"});
        const Value* ddof = args.kwarg("ddof");
        return aggregate(s.cells, agg, ddof ? (int)arg_int(*ddof, "ddof") : 1);
    }
    if (name == "unique" || name == "tolist" || name == "to_list") {
        args.check(name.c_str(), 0, {});
        ctx.check_cells(s.cells.size());
        std::vector<Value> out;
        if (name == "unique") {
            std::vector<size_t> order(s.cells.size());
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(),
                             [&](size_t a, size_t b) { return cell_less(s.cells[a], s.cells[b]); });
            std::vector<bool> first(s.cells.size(), false);
            for (size_t i = 0; i < order.size(); i++) {
                if (i == 0 || !cell_equal(s.cells[order[i - 1]], s.cells[order[i]])) first[order[i]] = true;
            }
            for (size_t i = 0; i < s.cells.size(); i++)
                if (first[i]) out.push_back(Value::from_cell(s.cells[i]));
        } else {
            for (const auto& c : s.cells) out.push_back(Value::from_cell(c));
        }
        return Value::list(std::move(out));
    }
    if (name == "fillna") return m_fillna(ctx, self, args);
    if (name == "ffill" || name == "bfill") return m_fill_direction(self, name == "ffill", args);
    if (name == "isnull" || name == "isna") return m_null_mask(self, true, args);
    if (name == "notnull" || name == "notna") return m_null_mask(self, false, args);
    if (name == "dropna") return m_dropna(self, args);
    if (name == "astype") return m_astype(self, args);
    if (name == "round") return m_round(self, args);
    if (name == "abs") return m_abs(self, args);
    if (name == "clip") return m_clip(self, args);
    if (name == "replace") return m_replace(ctx, self, args);
    if (name == "map" || name == "apply") return m_map(ctx, self, name, args);
    if (name == "quantile") return m_quantile(ctx, self, args);
    if (name == "between") return m_between(ctx, self, args);
    if (name == "isin") return m_isin(ctx, self, args);
    if (name == "copy") {
        args.check("copy", 0, {"deep"});
        return Value::series(std::make_shared<Series>(s));
    }
    if (name == "value_counts") return m_value_counts(self, args);
    if (name == "idxmax" || name == "idxmin") return m_idx(self, name == "idxmax", args);
    if (name == "cumsum") return m_cumsum(self, args);
    if (name == "sort_values") return m_sort_values(self, args);
    if (name == "reset_index") {
        args.check("reset_index", 0, {"drop"});
        auto out = std::make_shared<Series>(s);
        out->labels.clear();
        return Value::series(out);
    }
    if (name == "head" || name == "tail") return m_head_tail(self, name == "head", args);
    if (name == "duplicated") return m_duplicated(self, args);
    if (name == "where") return m_where(ctx, self, args);
    throw ScriptError(ErrorKind::ATTRIBUTE, "'Series' object has no attribute '" + name + "'");
}

} // namespace frameguard
