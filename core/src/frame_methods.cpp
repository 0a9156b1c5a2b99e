#include "frameguard/frame_ops.h"
#include "frameguard/methods.h"

#include <algorithm>
#include <numeric>

namespace frameguard {

namespace {

const char* const kFrameMethods[] = {
    "copy",  "head",    "tail",  "rename", "drop",   "dropna", "fillna", "drop_duplicates", "sort_values",
    "reset_index", "astype", "isnull", "isna", "notnull", "notna", "replace", "round", "assign", "to_dict",
    "sum",   "mean",    "median", "min",   "max",    "std",    "var",    "count", "nunique", "any", "all",
};

bool inplace_arg(const CallArgs& args) {
    const Value* v = args.kwarg("inplace");
    return v && arg_bool(*v, "inplace");
}

// Result of a transforming method: a new table, or None after mutating in place.
Value finish(const Value& self, Dataset result, bool inplace) {
    if (inplace) {
        *self.frame_ptr() = std::move(result);
        return Value::none();
    }
    return Value::frame(std::make_shared<Dataset>(std::move(result)));
}

Dataset take_rows(const Dataset& t, const std::vector<size_t>& order) {
    Dataset out;
    out.columns.reserve(t.columns.size());
    for (const auto& col : t.columns) {
        Column c;
        c.name = col.name;
        c.cells.reserve(order.size());
        for (size_t r : order) c.cells.push_back(col.cells[r]);
        out.columns.push_back(std::move(c));
    }
    return out;
}

std::vector<const Column*> key_columns(const Dataset& t, const Value* subset) {
    std::vector<const Column*> keys;
    if (!subset || subset->is_none()) {
        for (const auto& c : t.columns) keys.push_back(&c);
        return keys;
    }
    for (const auto& name : arg_names(*subset, "subset")) {
        const Column* c = t.find(name);
        if (!c) throw ScriptError(ErrorKind::KEY, "column not found: '" + name + "'");
        keys.push_back(c);
    }
    return keys;
}

int row_compare(const std::vector<const Column*>& keys, size_t a, size_t b) {
    for (const Column* c : keys) {
        const Cell& x = c->cells[a];
        const Cell& y = c->cells[b];
        if (cell_less(x, y)) return -1;
        if (cell_less(y, x)) return 1;
    }
    return 0;
}

Value m_head_tail(const Value& self, const std::string& name, CallArgs& args) {
    args.check(name.c_str(), 1, {"n"});
    const Dataset& t = self.frame();
    const Value* nv = args.get(0, "n");
    int64_t n = nv ? arg_int(*nv, "n") : 5;
    const int64_t rows = (int64_t)t.rows();
    if (n < 0) n = std::max<int64_t>(0, rows + n);
    n = std::min(n, rows);
    std::vector<size_t> order;
    const int64_t start = name == "head" ? 0 : rows - n;
    for (int64_t i = start; i < start + n; i++) order.push_back((size_t)i);
    return finish(self, take_rows(t, order), false);
}

Value m_rename(const Value& self, CallArgs& args) {
    args.check("rename", 0, {"columns", "inplace"});
    const Value* mapping = args.kwarg("columns");
    if (!mapping || mapping->type() != Value::Type::DICT) {
        throw ScriptError(ErrorKind::TYPE, "rename() expects columns={old: new}");
    }
    Dataset out = self.frame();
    for (auto& col : out.columns) {
        if (const Value* nv = mapping->dict_data().find(Cell{col.name})) col.name = arg_str(*nv, "new column name");
    }
    std::string err = out.check_shape();
    if (!err.empty()) throw ScriptError(ErrorKind::VALUE, err);
    return finish(self, std::move(out), inplace_arg(args));
}

Value m_drop(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("drop", 1, {"labels", "axis", "columns", "index", "errors", "inplace"});
    const Dataset& t = self.frame();
    const Value* labels = args.get(0, "labels");
    const Value* columns = args.kwarg("columns");
    const Value* index = args.kwarg("index");
    const Value* axis = args.kwarg("axis");
    const Value* errors = args.kwarg("errors");
    const bool ignore = errors && arg_str(*errors, "errors") == "ignore";

    bool by_columns = columns != nullptr;
    if (!columns && labels && axis) {
        if (axis->type() == Value::Type::STR) by_columns = axis->as_str() == "columns";
        else by_columns = arg_int(*axis, "axis") == 1;
        if (by_columns) columns = labels;
    }

    if (by_columns) {
        std::vector<std::string> names = arg_names(*columns, "columns");
        Dataset out;
        for (const auto& n : names) {
            if (!t.find(n) && !ignore) throw ScriptError(ErrorKind::KEY, "column not found: '" + n + "'");
        }
        for (const auto& c : t.columns) {
            if (std::find(names.begin(), names.end(), c.name) == names.end()) out.columns.push_back(c);
        }
        return finish(self, std::move(out), inplace_arg(args));
    }

    const Value* rows = index ? index : labels;
    if (!rows) throw ScriptError(ErrorKind::TYPE, "drop() needs labels, columns= or index=");
    std::vector<bool> keep(t.rows(), true);
    std::vector<Value> list = rows->is_scalar() ? std::vector<Value>{*rows} : iterate(ctx, *rows);
    for (const auto& r : list) {
        int64_t i = arg_int(r, "row label");
        if (i < 0 || (size_t)i >= keep.size()) {
            if (ignore) continue;
            throw ScriptError(ErrorKind::KEY, "row " + std::to_string(i) + " not found");
        }
        keep[(size_t)i] = false;
    }
    return finish(self, filter_rows(t, keep), inplace_arg(args));
}

Value m_dropna(const Value& self, CallArgs& args) {
    args.check("dropna", 0, {"axis", "how", "subset", "thresh", "inplace"});
    const Dataset& t = self.frame();
    const Value* how_v = args.kwarg("how");
    const std::string how = how_v ? arg_str(*how_v, "how") : "any";
    if (how != "any" && how != "all") throw ScriptError(ErrorKind::VALUE, "invalid how option: " + how);
    const Value* thresh_v = args.kwarg("thresh");
    const Value* axis = args.kwarg("axis");
    const bool by_columns = axis && (axis->type() == Value::Type::STR ? axis->as_str() == "columns"
                                                                       : arg_int(*axis, "axis") == 1);

    auto keep_group = [&](size_t present, size_t total) {
        if (thresh_v) return (int64_t)present >= arg_int(*thresh_v, "thresh");
        return how == "any" ? present == total : present > 0;
    };

    if (by_columns) {
        Dataset out;
        for (const auto& c : t.columns) {
            size_t present = 0;
            for (const auto& cell : c.cells) present += cell_is_null(cell) ? 0 : 1;
            if (keep_group(present, c.cells.size())) out.columns.push_back(c);
        }
        return finish(self, std::move(out), inplace_arg(args));
    }

    std::vector<const Column*> keys = key_columns(t, args.kwarg("subset"));
    std::vector<bool> keep(t.rows());
    for (size_t r = 0; r < keep.size(); r++) {
        size_t present = 0;
        for (const Column* c : keys) present += cell_is_null(c->cells[r]) ? 0 : 1;
        keep[r] = keys.empty() || keep_group(present, keys.size());
    }
    return finish(self, filter_rows(t, keep), inplace_arg(args));
}

Value m_fillna(const Value& self, CallArgs& args) {
    args.check("fillna", 1, {"value", "inplace", "method"});
    if (args.kwarg("method")) throw ScriptError(ErrorKind::VALUE, "fillna(method=) is not supported; use ffill()/bfill() on a column");
    const Value& value = args.require(0, "value", "fillna");
    Dataset out = self.frame();

    auto fill_column = [](Column& col, const Cell& fill) {
        if (cell_is_null(fill)) return;
        for (auto& cell : col.cells)
            if (cell_is_null(cell)) cell = fill;
    };

    if (value.is_scalar()) {
        Cell fill = to_cell(value, "fill value");
        for (auto& col : out.columns) fill_column(col, fill);
    } else if (value.type() == Value::Type::DICT) {
        for (auto& col : out.columns) {
            if (const Value* v = value.dict_data().find(Cell{col.name})) fill_column(col, to_cell(*v, "fill value"));
        }
    } else if (value.type() == Value::Type::SERIES && !value.series().labels.empty()) {
        const Series& s = value.series();
        for (auto& col : out.columns) {
            for (size_t i = 0; i < s.labels.size(); i++) {
                if (s.labels[i] == col.name) fill_column(col, s.cells[i]);
            }
        }
    } else {
        throw ScriptError(ErrorKind::TYPE, std::string("fillna() value must be a scalar, dict or per-column Series, got ") +
                                               type_name(value));
    }
    return finish(self, std::move(out), inplace_arg(args));
}

Value m_drop_duplicates(const Value& self, CallArgs& args) {
    args.check("drop_duplicates", 1, {"subset", "keep", "inplace", "ignore_index"});
    const Dataset& t = self.frame();
    std::vector<const Column*> keys = key_columns(t, args.get(0, "subset"));
    const Value* keep_v = args.kwarg("keep");
    std::string keep_mode = "first";
    if (keep_v) {
        if (keep_v->type() == Value::Type::BOOL && !keep_v->as_bool()) keep_mode = "none";
        else keep_mode = arg_str(*keep_v, "keep");
    }
    if (keep_mode != "first" && keep_mode != "last" && keep_mode != "none") {
        throw ScriptError(ErrorKind::VALUE, "keep must be 'first', 'last' or False");
    }

    std::vector<size_t> order(t.rows());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return row_compare(keys, a, b) < 0; });

    std::vector<bool> keep(t.rows(), false);
    for (size_t i = 0; i < order.size();) {
        size_t j = i + 1;
        while (j < order.size() && row_compare(keys, order[i], order[j]) == 0) j++;
        // stable sort keeps original order within a group
        if (keep_mode == "first") keep[order[i]] = true;
        else if (keep_mode == "last") keep[order[j - 1]] = true;
        else if (j - i == 1) keep[order[i]] = true;
        i = j;
    }
    return finish(self, filter_rows(t, keep), inplace_arg(args));
}

Value m_sort_values(const Value& self, CallArgs& args) {
    args.check("sort_values", 2, {"by", "ascending", "na_position", "inplace", "ignore_index", "kind"});
    const Dataset& t = self.frame();
    std::vector<const Column*> keys = key_columns(t, &args.require(0, "by", "sort_values"));
    std::vector<bool> ascending(keys.size(), true);
    if (const Value* asc = args.get(1, "ascending")) {
        if (asc->is_sequence()) {
            const auto& items = asc->list_data().items;
            if (items.size() != keys.size()) {
                throw ScriptError(ErrorKind::VALUE, "length of ascending must match length of by");
            }
            for (size_t i = 0; i < items.size(); i++) ascending[i] = arg_bool(items[i], "ascending");
        } else {
            std::fill(ascending.begin(), ascending.end(), arg_bool(*asc, "ascending"));
        }
    }
    const Value* na_v = args.kwarg("na_position");
    const bool na_first = na_v && arg_str(*na_v, "na_position") == "first";

    std::vector<size_t> order(t.rows());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        for (size_t k = 0; k < keys.size(); k++) {
            const Cell& x = keys[k]->cells[a];
            const Cell& y = keys[k]->cells[b];
            const bool xn = cell_is_null(x), yn = cell_is_null(y);
            if (xn || yn) {
                if (xn && yn) continue;
                return na_first ? xn : yn;
            }
            if (cell_less(x, y)) return (bool)ascending[k];
            if (cell_less(y, x)) return !ascending[k];
        }
        return false;
    });
    return finish(self, take_rows(t, order), inplace_arg(args));
}

Value m_reset_index(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("reset_index", 0, {"drop", "inplace"});
    const Value* drop = args.kwarg("drop");
    Dataset out = self.frame();
    if (!(drop && arg_bool(*drop, "drop"))) {
        if (out.find("index")) throw ScriptError(ErrorKind::VALUE, "cannot insert index, already exists");
        ctx.check_cells(out.rows() * (out.columns.size() + 1));
        Column idx{"index", {}};
        for (size_t r = 0; r < out.rows(); r++) idx.cells.push_back(Cell{(int64_t)r});
        out.columns.insert(out.columns.begin(), std::move(idx));
    }
    return finish(self, std::move(out), inplace_arg(args));
}

Value m_astype(const Value& self, CallArgs& args) {
    args.check("astype", 1, {"dtype"});
    const Value& dtype = args.require(0, "dtype", "astype");
    Dataset out = self.frame();
    for (auto& col : out.columns) {
        std::string target;
        if (dtype.type() == Value::Type::DICT) {
            const Value* v = dtype.dict_data().find(Cell{col.name});
            if (!v) continue;
            target = dtype_arg(*v);
        } else {
            target = dtype_arg(dtype);
        }
        for (auto& cell : col.cells) cell = convert_cell(cell, target);
    }
    if (dtype.type() == Value::Type::DICT) {
        for (const auto& kv : dtype.dict_data().items) {
            if (!self.frame().find(cell_to_str(kv.first))) {
                throw ScriptError(ErrorKind::KEY, "column not found: '" + cell_to_str(kv.first) + "'");
            }
        }
    }
    return finish(self, std::move(out), false);
}

Value m_null_mask(const Value& self, const std::string& name, CallArgs& args) {
    args.check(name.c_str(), 0, {});
    const bool want_null = (name == "isnull" || name == "isna");
    Dataset out = self.frame();
    for (auto& col : out.columns) {
        for (auto& cell : col.cells) cell = Cell{cell_is_null(cell) == want_null};
    }
    return finish(self, std::move(out), false);
}

Value m_replace(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("replace", 2, {"to_replace", "value", "inplace"});
    const Value& from = args.require(0, "to_replace", "replace");
    std::vector<std::pair<Cell, Cell>> pairs;
    if (from.type() == Value::Type::DICT) {
        for (const auto& kv : from.dict_data().items) pairs.emplace_back(kv.first, to_cell(kv.second, "value"));
    } else {
        const Value* to = args.get(1, "value");
        Cell to_c = to ? to_cell(*to, "value") : Cell{};
        if (from.is_scalar()) {
            pairs.emplace_back(to_cell(from, "to_replace"), to_c);
        } else {
            for (const auto& c : cells_of(ctx, from, "to_replace")) pairs.emplace_back(c, to_c);
        }
    }
    Dataset out = self.frame();
    for (auto& col : out.columns) {
        for (auto& cell : col.cells) {
            for (const auto& p : pairs) {
                if (cell_equal(cell, p.first)) {
                    cell = p.second;
                    break;
                }
            }
        }
    }
    return finish(self, std::move(out), inplace_arg(args));
}

Value m_round(const Value& self, CallArgs& args) {
    args.check("round", 1, {"decimals"});
    const Value* d = args.get(0, "decimals");
    const int64_t digits = d ? arg_int(*d, "decimals") : 0;
    Dataset out = self.frame();
    for (auto& col : out.columns) {
        for (auto& cell : col.cells) {
            if (auto* x = std::get_if<double>(&cell)) cell = make_double_cell(round_digits(*x, digits));
        }
    }
    return finish(self, std::move(out), false);
}

Value m_assign(ExecContext& ctx, const Value& self, CallArgs& args) {
    if (!args.pos.empty()) throw ScriptError(ErrorKind::TYPE, "assign() takes keyword arguments only");
    Value out = Value::frame(std::make_shared<Dataset>(self.frame()));
    for (const auto& kv : args.kw) set_item(ctx, out, Value::str(kv.first), kv.second);
    return out;
}

Value m_to_dict(ExecContext& ctx, const Value& self, CallArgs& args) {
    args.check("to_dict", 1, {"orient"});
    const Value* o = args.get(0, "orient");
    const std::string orient = o ? arg_str(*o, "orient") : "dict";
    const Dataset& t = self.frame();
    ctx.check_cells(t.cell_count());
    if (orient == "records") {
        std::vector<Value> rows;
        for (size_t r = 0; r < t.rows(); r++) {
            auto d = std::make_shared<DictData>();
            for (const auto& c : t.columns) d->items.emplace_back(Cell{c.name}, Value::from_cell(c.cells[r]));
            rows.push_back(Value::dict(d));
        }
        return Value::list(std::move(rows));
    }
    if (orient != "list" && orient != "dict") throw ScriptError(ErrorKind::VALUE, "unsupported orient: " + orient);
    auto d = std::make_shared<DictData>();
    for (const auto& c : t.columns) {
        std::vector<Value> vals;
        for (const auto& cell : c.cells) vals.push_back(Value::from_cell(cell));
        if (orient == "list") {
            d->items.emplace_back(Cell{c.name}, Value::list(std::move(vals)));
        } else {
            auto inner = std::make_shared<DictData>();
            for (size_t r = 0; r < vals.size(); r++) inner->items.emplace_back(Cell{(int64_t)r}, vals[r]);
            d->items.emplace_back(Cell{c.name}, Value::dict(inner));
        }
    }
    return Value::dict(d);
}

Value m_reduce(const Value& self, const std::string& name, Agg agg, CallArgs& args) {
    args.check(name.c_str(), 0, {"axis", "numeric_only", "skipna", "ddof"});
    if (const Value* axis = args.kwarg("axis")) {
        if (!(axis->type() == Value::Type::INT && axis->as_int() == 0) &&
            !(axis->type() == Value::Type::STR && axis->as_str() == "index")) {
            throw ScriptError(ErrorKind::VALUE, name + "() only reduces along axis=0");
        }
    }
    const Value* ddof = args.kwarg("ddof");
    return Value::series(aggregate_frame(self.frame(), agg, ddof ? (int)arg_int(*ddof, "ddof") : 1));
}

} // namespace

bool has_frame_method(const std::string& name) {
    for (const char* m : kFrameMethods)
        if (name == m) return true;
    return false;
}

Value call_frame_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    if (name == "copy") {
        args.check("copy", 0, {"deep"});
        return finish(self, self.frame(), false);
    }
    if (name == "head" || name == "tail") return m_head_tail(self, name, args);
    if (name == "rename") return m_rename(self, args);
    if (name == "drop") return m_drop(ctx, self, args);
    if (name == "dropna") return m_dropna(self, args);
    if (name == "fillna") return m_fillna(self, args);
    if (name == "drop_duplicates") return m_drop_duplicates(self, args);
    if (name == "sort_values") return m_sort_values(self, args);
    if (name == "reset_index") return m_reset_index(ctx, self, args);
    if (name == "astype") return m_astype(self, args);
    if (name == "isnull" || name == "isna" || name == "notnull" || name == "notna") {
        return m_null_mask(self, name, args);
    }
    if (name == "replace") return m_replace(ctx, self, args);
    if (name == "round") return m_round(self, args);
    if (name == "assign") return m_assign(ctx, self, args);
    if (name == "to_dict") return m_to_dict(ctx, self, args);
    Agg agg;
    if (agg_from_name(name, &agg)) return m_reduce(self, name, agg, args);
    throw ScriptError(ErrorKind::ATTRIBUTE, "'DataFrame' object has no attribute '" + name + "'");
}

} // namespace frameguard
