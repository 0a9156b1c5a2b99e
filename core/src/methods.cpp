#include "frameguard/methods.h"

#include "frameguard/frame_ops.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace frameguard {

namespace {

[[noreturn]] void no_attr(const Value& obj, const std::string& name) {
    throw ScriptError(ErrorKind::ATTRIBUTE, std::string("'") + type_name(obj) + "' object has no attribute '" +
                                                name + "'");
}

bool one_of(const std::string& name, std::initializer_list<const char*> names) {
    for (const char* n : names)
        if (name == n) return true;
    return false;
}

const std::initializer_list<const char*> kListMethods = {"append", "extend", "pop", "copy", "index", "count"};
const std::initializer_list<const char*> kDictMethods = {"get", "keys", "values", "items", "copy", "update", "pop"};
const std::initializer_list<const char*> kStrMethods = {"lower",  "upper",      "strip",    "lstrip",  "rstrip",
                                                        "title",  "replace",    "startswith", "endswith", "split",
                                                        "join",   "find",       "isdigit",  "isalpha", "capitalize"};
const std::initializer_list<const char*> kAccessorMethods = {"lower",   "upper",    "strip",      "lstrip",
                                                             "rstrip",  "title",    "replace",    "contains",
                                                             "startswith", "endswith", "len", "capitalize"};

std::string ascii_map(const std::string& s, int (*fn)(int)) {
    std::string out = s;
    for (auto& ch : out) ch = (char)fn((unsigned char)ch);
    return out;
}

bool in_set(char c, const std::string* chars) {
    if (!chars) return std::isspace((unsigned char)c) != 0;
    return chars->find(c) != std::string::npos;
}

std::string strip(const std::string& s, bool left, bool right, const std::string* chars) {
    size_t b = 0, e = s.size();
    if (left)
        while (b < e && in_set(s[b], chars)) b++;
    if (right)
        while (e > b && in_set(s[e - 1], chars)) e--;
    return s.substr(b, e - b);
}

std::string title(const std::string& s) {
    std::string out = s;
    bool start = true;
    for (auto& ch : out) {
        if (std::isalpha((unsigned char)ch)) {
            ch = (char)(start ? std::toupper((unsigned char)ch) : std::tolower((unsigned char)ch));
            start = false;
        } else {
            start = true;
        }
    }
    return out;
}

std::string capitalize(const std::string& s) {
    std::string out = ascii_map(s, ::tolower);
    if (!out.empty()) out[0] = (char)std::toupper((unsigned char)out[0]);
    return out;
}

std::string replace_all(ExecContext& ctx, const std::string& s, const std::string& from, const std::string& to,
                        int64_t count) {
    if (from.empty()) return s;
    std::string out;
    size_t pos = 0;
    int64_t done = 0;
    while (count < 0 || done < count) {
        size_t hit = s.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(s, pos, hit - pos);
        out += to;
        ctx.check_string(out.size());
        pos = hit + from.size();
        done++;
    }
    out.append(s, pos, std::string::npos);
    return out;
}

std::vector<Value> split(const std::string& s, const std::string* sep, int64_t maxsplit) {
    std::vector<Value> out;
    if (!sep) {
        size_t i = 0;
        int64_t n = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
            if (i >= s.size()) break;
            if (maxsplit >= 0 && n >= maxsplit) {
                out.push_back(Value::str(strip(s.substr(i), false, true, nullptr)));
                break;
            }
            size_t j = i;
            while (j < s.size() && !std::isspace((unsigned char)s[j])) j++;
            out.push_back(Value::str(s.substr(i, j - i)));
            n++;
            i = j;
        }
        return out;
    }
    if (sep->empty()) throw ScriptError(ErrorKind::VALUE, "empty separator");
    size_t pos = 0;
    int64_t n = 0;
    while (maxsplit < 0 || n < maxsplit) {
        size_t hit = s.find(*sep, pos);
        if (hit == std::string::npos) break;
        out.push_back(Value::str(s.substr(pos, hit - pos)));
        pos = hit + sep->size();
        n++;
    }
    out.push_back(Value::str(s.substr(pos)));
    return out;
}

bool starts_with(const std::string& s, const std::string& p) { return s.compare(0, p.size(), p) == 0; }
bool ends_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}

std::regex compile_regex(const std::string& pat, bool icase) {
    try {
        auto flags = std::regex::ECMAScript;
        if (icase) flags |= std::regex::icase;
        return std::regex(pat, flags);
    } catch (const std::regex_error& e) {
        throw ScriptError(ErrorKind::VALUE, "invalid regular expression '" + pat + "': " + e.what());
    }
}

int64_t norm_index(int64_t i, size_t n, const char* what) {
    if (i < 0) i += (int64_t)n;
    if (i < 0 || (size_t)i >= n) throw ScriptError(ErrorKind::INDEX, std::string(what) + " index out of range");
    return i;
}

Value call_list_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    auto& items = self.list_data().items;
    if (name == "append") {
        args.check("append", 1, {});
        ctx.check_cells(items.size() + 1);
        items.push_back(args.require(0, "object", "append"));
        return Value::none();
    }
    if (name == "extend") {
        args.check("extend", 1, {});
        std::vector<Value> more = iterate(ctx, args.require(0, "iterable", "extend"));
        ctx.check_cells(items.size() + more.size());
        items.insert(items.end(), more.begin(), more.end());
        return Value::none();
    }
    if (name == "pop") {
        args.check("pop", 1, {});
        if (items.empty()) throw ScriptError(ErrorKind::INDEX, "pop from empty list");
        const Value* idx = args.get(0, nullptr);
        int64_t i = norm_index(idx ? arg_int(*idx, "index") : -1, items.size(), "pop");
        Value out = items[(size_t)i];
        items.erase(items.begin() + i);
        return out;
    }
    if (name == "copy") {
        args.check("copy", 0, {});
        return Value::list(items);
    }
    args.check(name.c_str(), 1, {});
    const Value& needle = args.require(0, "value", name.c_str());
    int64_t count = 0;
    for (size_t i = 0; i < items.size(); i++) {
        if (!truthy(compare_op(ctx, "==", items[i], needle))) continue;
        if (name == "index") return Value::integer((int64_t)i);
        count++;
    }
    if (name == "index") throw ScriptError(ErrorKind::VALUE, repr(needle) + " is not in list");
    return Value::integer(count);
}

Value call_dict_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    DictData& d = self.dict_data();
    if (name == "get") {
        args.check("get", 2, {});
        const Value* found = d.find(to_cell(args.require(0, "key", "get"), "dict key"));
        if (found) return *found;
        const Value* dflt = args.get(1, nullptr);
        return dflt ? *dflt : Value::none();
    }
    if (name == "keys" || name == "values" || name == "items") {
        args.check(name.c_str(), 0, {});
        std::vector<Value> out;
        for (const auto& kv : d.items) {
            if (name == "keys") out.push_back(Value::from_cell(kv.first));
            else if (name == "values") out.push_back(kv.second);
            else out.push_back(Value::tuple({Value::from_cell(kv.first), kv.second}));
        }
        return Value::list(std::move(out));
    }
    if (name == "copy") {
        args.check("copy", 0, {});
        auto copy = std::make_shared<DictData>();
        copy->items = d.items;
        return Value::dict(copy);
    }
    if (name == "update") {
        args.check("update", 1, {});
        const Value& other = args.require(0, "other", "update");
        if (other.type() != Value::Type::DICT) throw ScriptError(ErrorKind::TYPE, "update() expects a dict");
        ctx.check_cells(d.items.size() + other.dict_data().items.size());
        for (const auto& kv : other.dict_data().items) d.set(kv.first, kv.second);
        return Value::none();
    }
    // pop
    args.check("pop", 2, {});
    if (d.frozen) throw ScriptError(ErrorKind::TYPE, "'params' is read-only");
    Cell key = to_cell(args.require(0, "key", "pop"), "dict key");
    for (auto it = d.items.begin(); it != d.items.end(); ++it) {
        if (cell_equal(it->first, key)) {
            Value out = it->second;
            d.items.erase(it);
            return out;
        }
    }
    if (const Value* dflt = args.get(1, nullptr)) return *dflt;
    throw ScriptError(ErrorKind::KEY, cell_repr(key));
}

Value call_str_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    const std::string& s = self.as_str();
    if (name == "lower") { args.check("lower", 0, {}); return Value::str(ascii_map(s, ::tolower)); }
    if (name == "upper") { args.check("upper", 0, {}); return Value::str(ascii_map(s, ::toupper)); }
    if (name == "title") { args.check("title", 0, {}); return Value::str(title(s)); }
    if (name == "capitalize") { args.check("capitalize", 0, {}); return Value::str(capitalize(s)); }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        args.check(name.c_str(), 1, {});
        const Value* chars = args.get(0, nullptr);
        std::string set;
        if (chars && !chars->is_none()) set = arg_str(*chars, "chars");
        return Value::str(strip(s, name != "rstrip", name != "lstrip", chars && !chars->is_none() ? &set : nullptr));
    }
    if (name == "replace") {
        args.check("replace", 3, {"count"});
        const std::string from = arg_str(args.require(0, "old", "replace"), "old");
        const std::string to = arg_str(args.require(1, "new", "replace"), "new");
        const Value* count = args.get(2, "count");
        return Value::str(replace_all(ctx, s, from, to, count ? arg_int(*count, "count") : -1));
    }
    if (name == "startswith" || name == "endswith") {
        args.check(name.c_str(), 1, {});
        const std::string p = arg_str(args.require(0, "prefix", name.c_str()), "prefix");
        return Value::boolean(name == "startswith" ? starts_with(s, p) : ends_with(s, p));
    }
    if (name == "split") {
        args.check("split", 2, {"sep", "maxsplit"});
        const Value* sep = args.get(0, "sep");
        const Value* maxsplit = args.get(1, "maxsplit");
        std::string sep_s;
        if (sep && !sep->is_none()) sep_s = arg_str(*sep, "sep");
        auto parts = split(s, sep && !sep->is_none() ? &sep_s : nullptr, maxsplit ? arg_int(*maxsplit, "maxsplit") : -1);
        ctx.check_cells(parts.size());
        return Value::list(std::move(parts));
    }
    if (name == "join") {
        args.check("join", 1, {});
        std::string out;
        bool first = true;
        for (const auto& item : iterate(ctx, args.require(0, "iterable", "join"))) {
            if (!first) out += s;
            first = false;
            out += arg_str(item, "join() item");
            ctx.check_string(out.size());
        }
        return Value::str(out);
    }
    if (name == "find") {
        args.check("find", 1, {});
        size_t hit = s.find(arg_str(args.require(0, "sub", "find"), "sub"));
        return Value::integer(hit == std::string::npos ? -1 : (int64_t)hit);
    }
    // isdigit / isalpha
    args.check(name.c_str(), 0, {});
    if (s.empty()) return Value::boolean(false);
    for (char ch : s) {
        const bool ok = name == "isdigit" ? std::isdigit((unsigned char)ch) : std::isalpha((unsigned char)ch);
        if (!ok) return Value::boolean(false);
    }
    return Value::boolean(true);
}

Value frame_column(const Dataset& t, const std::string& name) {
    const Column* c = t.find(name);
    if (!c) throw ScriptError(ErrorKind::KEY, "column not found: '" + name + "'");
    return Value::series(make_series(c->name, c->cells));
}

bool is_mask(const Value& v) {
    if (v.type() == Value::Type::SERIES) {
        for (const auto& c : v.series().cells)
            if (!cell_is_null(c) && !std::holds_alternative<bool>(c)) return false;
        return true;
    }
    if (v.type() == Value::Type::LIST) {
        const auto& items = v.list_data().items;
        if (items.empty()) return false;
        for (const auto& item : items)
            if (item.type() != Value::Type::BOOL) return false;
        return true;
    }
    return false;
}

// Row selection of a .loc key: a boolean mask or a single row number.
std::vector<bool> loc_rows(const Value& rows, size_t n, bool* single) {
    *single = false;
    if (rows.type() == Value::Type::INT) {
        int64_t r = rows.as_int();
        if (r < 0 || (size_t)r >= n) throw ScriptError(ErrorKind::KEY, "row " + std::to_string(r) + " not found");
        std::vector<bool> keep(n, false);
        keep[(size_t)r] = true;
        *single = true;
        return keep;
    }
    return mask_of(rows, n);
}

Value loc_get(ExecContext& ctx, const Value& loc, const Value& key) {
    const Dataset& t = loc.frame();
    const Value* rows = &key;
    const Value* cols = nullptr;
    if (key.type() == Value::Type::TUPLE) {
        const auto& parts = key.list_data().items;
        if (parts.size() != 2) throw ScriptError(ErrorKind::INDEX, ".loc expects [rows] or [rows, columns]");
        rows = &parts[0];
        cols = &parts[1];
    }
    bool single = false;
    std::vector<bool> keep = loc_rows(*rows, t.rows(), &single);
    Dataset picked = filter_rows(t, keep);
    ctx.check_cells(picked.cell_count());

    if (single) {
        const size_t r = 0;
        if (cols && cols->type() == Value::Type::STR) {
            const Column* c = picked.find(cols->as_str());
            if (!c) throw ScriptError(ErrorKind::KEY, "column not found: '" + cols->as_str() + "'");
            return Value::from_cell(c->cells[r]);
        }
        if (cols) picked = select_columns(picked, arg_names(*cols, ".loc columns"));
        auto row = make_series("", {});
        for (const auto& c : picked.columns) {
            row->labels.push_back(c.name);
            row->cells.push_back(c.cells[r]);
        }
        return Value::series(row);
    }
    if (!cols) return Value::frame(std::make_shared<Dataset>(std::move(picked)));
    if (cols->type() == Value::Type::STR) return frame_column(picked, cols->as_str());
    return Value::frame(std::make_shared<Dataset>(select_columns(picked, arg_names(*cols, ".loc columns"))));
}

// Writes `v` into the selected rows of one column, creating it (null-filled) if needed.
void assign_rows(ExecContext& ctx, Dataset& t, const std::string& col, const std::vector<bool>& keep, const Value& v) {
    const size_t n = t.rows();
    size_t selected = 0;
    for (bool k : keep) selected += k ? 1 : 0;

    std::vector<Cell> src;
    bool positional = false;
    if (v.is_scalar()) {
        src.assign(1, to_cell(v, "assigned value"));
    } else {
        src = cells_of(ctx, v, "assigned value");
        if (src.size() == n) positional = true;
        else if (src.size() != selected) {
            throw ScriptError(ErrorKind::VALUE, "cannot assign " + std::to_string(src.size()) + " values to " +
                                                    std::to_string(selected) + " selected rows");
        }
    }

    Column* target = t.find(col);
    if (!target) {
        ctx.check_cells(n * (t.columns.size() + 1));
        t.columns.push_back(Column{col, std::vector<Cell>(n)});
        target = &t.columns.back();
    }
    size_t k = 0;
    for (size_t r = 0; r < n; r++) {
        if (!keep[r]) continue;
        if (v.is_scalar()) target->cells[r] = src[0];
        else target->cells[r] = positional ? src[r] : src[k];
        k++;
    }
}

void loc_set(ExecContext& ctx, const Value& loc, const Value& key, const Value& v) {
    Dataset& t = loc.frame();
    const Value* rows = &key;
    const Value* cols = nullptr;
    if (key.type() == Value::Type::TUPLE) {
        const auto& parts = key.list_data().items;
        if (parts.size() != 2) throw ScriptError(ErrorKind::INDEX, ".loc expects [rows] or [rows, columns]");
        rows = &parts[0];
        cols = &parts[1];
    }
    bool single = false;
    std::vector<bool> keep = loc_rows(*rows, t.rows(), &single);
    std::vector<std::string> names = cols ? arg_names(*cols, ".loc columns") : t.column_names();
    if (names.size() > 1 && !v.is_scalar()) {
        throw ScriptError(ErrorKind::VALUE, "only scalars can be assigned to several columns at once");
    }
    for (const auto& name : names) assign_rows(ctx, t, name, keep, v);
}

void set_frame_column(ExecContext& ctx, Dataset& t, const std::string& name, const Value& v) {
    size_t n = t.rows();
    if (t.columns.empty() && !v.is_scalar()) n = cells_of(ctx, v, "column values").size();
    if (v.type() == Value::Type::FRAME) throw ScriptError(ErrorKind::TYPE, "cannot assign a DataFrame to a column");
    std::vector<Cell> cells = cells_for_length(ctx, v, n, "column values");
    if (Column* c = t.find(name)) {
        c->cells = std::move(cells);
        return;
    }
    ctx.check_cells(n * (t.columns.size() + 1));
    t.columns.push_back(Column{name, std::move(cells)});
}

size_t series_position(const Series& s, const Value& key) {
    if (!s.labels.empty()) {
        if (key.type() == Value::Type::STR) {
            auto it = std::find(s.labels.begin(), s.labels.end(), key.as_str());
            if (it != s.labels.end()) return (size_t)(it - s.labels.begin());
        }
        throw ScriptError(ErrorKind::KEY, repr(key));
    }
    if (key.type() != Value::Type::INT) throw ScriptError(ErrorKind::KEY, repr(key));
    int64_t i = key.as_int();
    if (i < 0 || (size_t)i >= s.cells.size()) throw ScriptError(ErrorKind::KEY, repr(key));
    return (size_t)i;
}

} // namespace

std::string arg_str(const Value& v, const char* what) {
    if (v.type() != Value::Type::STR) {
        throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a string, got " + type_name(v));
    }
    return v.as_str();
}

int64_t arg_int(const Value& v, const char* what) {
    if (v.type() == Value::Type::INT) return v.as_int();
    if (v.type() == Value::Type::BOOL) return v.as_bool() ? 1 : 0;
    throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be an integer, got " + type_name(v));
}

double arg_double(const Value& v, const char* what) {
    if (v.is_number()) return v.as_double();
    throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a number, got " + type_name(v));
}

bool arg_bool(const Value& v, const char* what) {
    if (v.type() == Value::Type::BOOL) return v.as_bool();
    if (v.type() == Value::Type::INT) return v.as_int() != 0;
    throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a bool, got " + type_name(v));
}

std::vector<std::string> arg_names(const Value& v, const char* what) {
    if (v.type() == Value::Type::STR) return {v.as_str()};
    if (v.is_sequence()) {
        std::vector<std::string> out;
        for (const auto& item : v.list_data().items) out.push_back(arg_str(item, what));
        return out;
    }
    throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a column name or list of names");
}

std::string dtype_arg(const Value& v) {
    std::string n;
    if (v.type() == Value::Type::STR) n = v.as_str();
    else if (v.type() == Value::Type::FUNCTION) n = v.function_ref().name;
    else throw ScriptError(ErrorKind::TYPE, std::string("data type must be a name or builtin, got ") + type_name(v));

    if (one_of(n, {"int", "int64", "int32", "Int64", "Int32"})) return "int";
    if (one_of(n, {"float", "float64", "float32", "Float64"})) return "float";
    if (one_of(n, {"str", "string"})) return "str";
    if (one_of(n, {"bool", "boolean"})) return "bool";
    if (one_of(n, {"object", "category"})) return "object";
    throw ScriptError(ErrorKind::TYPE, "data type '" + n + "' not understood");
}

Cell convert_cell(const Cell& c, const std::string& dtype) {
    if (dtype == "object") return c;
    if (cell_is_null(c)) {
        if (dtype == "int") throw ScriptError(ErrorKind::VALUE, "cannot convert missing values to integer");
        return c;
    }
    if (dtype == "str") return Cell{cell_to_str(c)};
    if (dtype == "bool") return Cell{truthy(Value::from_cell(c))};

    Cell num = c;
    if (auto* b = std::get_if<bool>(&c)) num = Cell{(int64_t)(*b ? 1 : 0)};
    if (auto* s = std::get_if<std::string>(&c)) {
        if (!parse_number(*s, &num) || cell_is_null(num)) {
            throw ScriptError(ErrorKind::VALUE, "could not convert string to " + dtype + ": '" + *s + "'");
        }
    }
    if (dtype == "float") return make_double_cell(cell_as_double(num));
    if (auto* d = std::get_if<double>(&num)) {
        if (!std::isfinite(*d)) throw ScriptError(ErrorKind::VALUE, "cannot convert non-finite values to integer");
        if (std::holds_alternative<std::string>(c) && std::trunc(*d) != *d) {
            throw ScriptError(ErrorKind::VALUE, "invalid literal for int(): '" + std::get<std::string>(c) + "'");
        }
        return Cell{(int64_t)std::trunc(*d)};
    }
    return num;
}

Value get_attr(ExecContext& ctx, const Value& obj, const std::string& name) {
    (void)ctx;
    if (!name.empty() && name[0] == '_') {
        throw ScriptError(ErrorKind::ATTRIBUTE, "access to private attribute '" + name + "' is not allowed");
    }
    switch (obj.type()) {
        case Value::Type::LIBRARY: {
            if (const Value* m = obj.library_ref().find(name)) return *m;
            throw ScriptError(ErrorKind::ATTRIBUTE, "module '" + obj.library_ref().name + "' has no attribute '" +
                                                        name + "'");
        }
        case Value::Type::FRAME: {
            const Dataset& t = obj.frame();
            if (name == "columns") {
                std::vector<Value> cols;
                for (const auto& c : t.columns) cols.push_back(Value::str(c.name));
                return Value::list(std::move(cols));
            }
            if (name == "shape") {
                return Value::tuple({Value::integer((int64_t)t.rows()), Value::integer((int64_t)t.columns.size())});
            }
            if (name == "empty") return Value::boolean(t.cell_count() == 0);
            if (name == "size") return Value::integer((int64_t)t.cell_count());
            if (name == "loc") return Value::loc(obj.frame_ptr());
            if (name == "dtypes") {
                auto d = std::make_shared<DictData>();
                for (const auto& c : t.columns) d->items.emplace_back(Cell{c.name}, Value::str(dtype_of(c.cells)));
                return Value::dict(d);
            }
            if (name == "index") {
                std::vector<Value> idx;
                ctx.check_cells(t.rows());
                for (size_t i = 0; i < t.rows(); i++) idx.push_back(Value::integer((int64_t)i));
                return Value::list(std::move(idx));
            }
            if (has_frame_method(name)) return Value::method(obj, name);
            if (t.find(name)) return frame_column(t, name);
            no_attr(obj, name);
        }
        case Value::Type::SERIES: {
            const Series& s = obj.series();
            if (name == "str") return Value::str_accessor(obj.series_ptr());
            if (name == "name") return s.name.empty() ? Value::none() : Value::str(s.name);
            if (name == "size") return Value::integer((int64_t)s.cells.size());
            if (name == "shape") return Value::tuple({Value::integer((int64_t)s.cells.size())});
            if (name == "empty") return Value::boolean(s.cells.empty());
            if (name == "dtype") return Value::str(dtype_of(s.cells));
            if (name == "values") {
                CallArgs none;
                return call_series_method(ctx, obj, "tolist", none);
            }
            if (name == "index") {
                std::vector<Value> idx;
                for (size_t i = 0; i < s.cells.size(); i++) {
                    idx.push_back(s.labels.empty() ? Value::integer((int64_t)i) : Value::str(s.labels[i]));
                }
                return Value::list(std::move(idx));
            }
            if (has_series_method(name)) return Value::method(obj, name);
            no_attr(obj, name);
        }
        case Value::Type::STR_ACCESSOR:
            if (one_of(name, kAccessorMethods)) return Value::method(obj, name);
            no_attr(obj, name);
        case Value::Type::LIST:
            if (one_of(name, kListMethods)) return Value::method(obj, name);
            no_attr(obj, name);
        case Value::Type::DICT:
            if (one_of(name, kDictMethods)) return Value::method(obj, name);
            no_attr(obj, name);
        case Value::Type::STR:
            if (one_of(name, kStrMethods)) return Value::method(obj, name);
            no_attr(obj, name);
        default:
            no_attr(obj, name);
    }
}

void set_attr(ExecContext& ctx, const Value& obj, const std::string& name, const Value& v) {
    if (!name.empty() && name[0] == '_') {
        throw ScriptError(ErrorKind::ATTRIBUTE, "access to private attribute '" + name + "' is not allowed");
    }
    if (obj.type() == Value::Type::FRAME && name == "columns") {
        Dataset& t = obj.frame();
        std::vector<std::string> names = arg_names(v, "columns");
        if (names.size() != t.columns.size()) {
            throw ScriptError(ErrorKind::VALUE, "length mismatch: table has " + std::to_string(t.columns.size()) +
                                                    " columns, got " + std::to_string(names.size()) + " names");
        }
        Dataset renamed = t;
        for (size_t i = 0; i < names.size(); i++) renamed.columns[i].name = names[i];
        std::string err = renamed.check_shape();
        if (!err.empty()) throw ScriptError(ErrorKind::VALUE, err);
        t = std::move(renamed);
        return;
    }
    if (obj.type() == Value::Type::SERIES && name == "name") {
        obj.series().name = v.is_none() ? std::string() : arg_str(v, "name");
        return;
    }
    (void)ctx;
    throw ScriptError(ErrorKind::ATTRIBUTE, std::string("cannot set attribute '") + name + "' on '" + type_name(obj) +
                                                "' object");
}

Value get_item(ExecContext& ctx, const Value& obj, const Value& key) {
    switch (obj.type()) {
        case Value::Type::LIST:
        case Value::Type::TUPLE: {
            const auto& items = obj.list_data().items;
            return items[(size_t)norm_index(arg_int(key, "index"), items.size(), type_name(obj))];
        }
        case Value::Type::STR: {
            const std::string& s = obj.as_str();
            return Value::str(std::string(1, s[(size_t)norm_index(arg_int(key, "index"), s.size(), "string")]));
        }
        case Value::Type::DICT: {
            Cell k = to_cell(key, "dict key");
            if (const Value* v = obj.dict_data().find(k)) return *v;
            throw ScriptError(ErrorKind::KEY, cell_repr(k));
        }
        case Value::Type::FRAME: {
            const Dataset& t = obj.frame();
            if (key.type() == Value::Type::STR) return frame_column(t, key.as_str());
            if (is_mask(key)) {
                return Value::frame(std::make_shared<Dataset>(filter_rows(t, mask_of(key, t.rows()))));
            }
            if (key.is_sequence()) {
                return Value::frame(std::make_shared<Dataset>(select_columns(t, arg_names(key, "column list"))));
            }
            throw ScriptError(ErrorKind::KEY, "cannot index a DataFrame with " + std::string(type_name(key)));
        }
        case Value::Type::SERIES: {
            const Series& s = obj.series();
            if (is_mask(key)) {
                std::vector<bool> keep = mask_of(key, s.cells.size());
                auto out = make_series(s.name, {});
                for (size_t i = 0; i < keep.size(); i++) {
                    if (!keep[i]) continue;
                    out->cells.push_back(s.cells[i]);
                    if (!s.labels.empty()) out->labels.push_back(s.labels[i]);
                }
                return Value::series(out);
            }
            return Value::from_cell(s.cells[series_position(s, key)]);
        }
        case Value::Type::LOC: return loc_get(ctx, obj, key);
        default:
            throw ScriptError(ErrorKind::TYPE, std::string("'") + type_name(obj) + "' object is not subscriptable");
    }
}

void set_item(ExecContext& ctx, const Value& obj, const Value& key, const Value& v) {
    switch (obj.type()) {
        case Value::Type::LIST: {
            auto& items = obj.list_data().items;
            items[(size_t)norm_index(arg_int(key, "index"), items.size(), "list assignment")] = v;
            return;
        }
        case Value::Type::DICT: {
            DictData& d = obj.dict_data();
            if (!d.find(to_cell(key, "dict key"))) ctx.check_cells(d.items.size() + 1);
            d.set(to_cell(key, "dict key"), v);
            return;
        }
        case Value::Type::FRAME:
            if (key.type() == Value::Type::STR) {
                set_frame_column(ctx, obj.frame(), key.as_str(), v);
                return;
            }
            if (key.is_sequence() && v.type() == Value::Type::FRAME) {
                std::vector<std::string> names = arg_names(key, "column list");
                const Dataset& src = v.frame();
                if (src.columns.size() != names.size()) {
                    throw ScriptError(ErrorKind::VALUE, "columns must be same length as key");
                }
                Dataset staged = src;  // src may alias the target
                for (size_t i = 0; i < names.size(); i++) {
                    set_frame_column(ctx, obj.frame(), names[i],
                                     Value::series(make_series(names[i], staged.columns[i].cells)));
                }
                return;
            }
            throw ScriptError(ErrorKind::TYPE, "use df.loc[mask, column] = value to assign to selected rows");
        case Value::Type::SERIES: {
            Series& s = obj.series();
            if (is_mask(key)) {
                std::vector<bool> keep = mask_of(key, s.cells.size());
                Cell c = to_cell(v, "assigned value");
                for (size_t i = 0; i < keep.size(); i++)
                    if (keep[i]) s.cells[i] = c;
                return;
            }
            s.cells[series_position(s, key)] = to_cell(v, "assigned value");
            return;
        }
        case Value::Type::LOC: loc_set(ctx, obj, key, v); return;
        case Value::Type::TUPLE:
        case Value::Type::STR:
            throw ScriptError(ErrorKind::TYPE, std::string("'") + type_name(obj) +
                                                   "' object does not support item assignment");
        default:
            throw ScriptError(ErrorKind::TYPE, std::string("'") + type_name(obj) + "' object is not subscriptable");
    }
}

Value call_str_accessor(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args) {
    const Series& s = self.series();
    auto out = make_series(s.name, {});
    out->labels = s.labels;
    out->cells.reserve(s.cells.size());

    if (name == "contains") {
        args.check("contains", 1, {"pat", "case", "na", "regex"});
        const std::string pat = arg_str(args.require(0, "pat", "contains"), "pat");
        const Value* case_v = args.kwarg("case");
        const Value* na = args.kwarg("na");
        const Value* regex_v = args.kwarg("regex");
        const bool icase = case_v && !arg_bool(*case_v, "case");
        const bool use_regex = !regex_v || arg_bool(*regex_v, "regex");
        std::regex re;
        if (use_regex) re = compile_regex(pat, icase);
        const std::string needle = icase ? ascii_map(pat, ::tolower) : pat;
        for (const auto& c : s.cells) {
            ctx.tick();
            auto* str = std::get_if<std::string>(&c);
            if (!str) {
                out->cells.push_back(na ? to_cell(*na, "na") : Cell{});
                continue;
            }
            bool hit;
            if (use_regex) hit = std::regex_search(*str, re);
            else hit = (icase ? ascii_map(*str, ::tolower) : *str).find(needle) != std::string::npos;
            out->cells.push_back(Cell{hit});
        }
        return Value::series(out);
    }

    if (name == "replace") {
        args.check("replace", 2, {"pat", "repl", "regex", "case"});
        const std::string pat = arg_str(args.require(0, "pat", "replace"), "pat");
        const std::string repl = arg_str(args.require(1, "repl", "replace"), "repl");
        const Value* regex_v = args.kwarg("regex");
        const bool use_regex = regex_v && arg_bool(*regex_v, "regex");
        std::regex re;
        if (use_regex) re = compile_regex(pat, false);
        for (const auto& c : s.cells) {
            ctx.tick();
            auto* str = std::get_if<std::string>(&c);
            if (!str) { out->cells.push_back(Cell{}); continue; }
            std::string r = use_regex ? std::regex_replace(*str, re, repl) : replace_all(ctx, *str, pat, repl, -1);
            ctx.check_string(r.size());
            out->cells.push_back(Cell{r});
        }
        return Value::series(out);
    }

    std::string arg;
    const bool takes_arg = one_of(name, {"startswith", "endswith"});
    const bool strip_chars = one_of(name, {"strip", "lstrip", "rstrip"});
    if (takes_arg) {
        args.check(name.c_str(), 1, {"pat"});
        arg = arg_str(args.require(0, "pat", name.c_str()), "pat");
    } else if (strip_chars) {
        args.check(name.c_str(), 1, {"to_strip"});
        const Value* chars = args.get(0, "to_strip");
        if (chars && !chars->is_none()) arg = arg_str(*chars, "to_strip");
    } else {
        args.check(name.c_str(), 0, {});
    }
    const bool have_chars = strip_chars && !arg.empty();

    for (const auto& c : s.cells) {
        auto* str = std::get_if<std::string>(&c);
        if (!str) { out->cells.push_back(Cell{}); continue; }
        if (name == "lower") out->cells.push_back(Cell{ascii_map(*str, ::tolower)});
        else if (name == "upper") out->cells.push_back(Cell{ascii_map(*str, ::toupper)});
        else if (name == "title") out->cells.push_back(Cell{title(*str)});
        else if (name == "capitalize") out->cells.push_back(Cell{capitalize(*str)});
        else if (name == "len") out->cells.push_back(Cell{(int64_t)str->size()});
        else if (name == "startswith") out->cells.push_back(Cell{starts_with(*str, arg)});
        else if (name == "endswith") out->cells.push_back(Cell{ends_with(*str, arg)});
        else {
            out->cells.push_back(
                Cell{strip(*str, name != "rstrip", name != "lstrip", have_chars ? &arg : nullptr)});
        }
    }
    return Value::series(out);
}

Value call_value(ExecContext& ctx, const Value& callee, CallArgs& args) {
    if (callee.type() == Value::Type::FUNCTION) return callee.function_ref().impl(ctx, args);
    if (callee.type() != Value::Type::METHOD) {
        throw ScriptError(ErrorKind::TYPE, std::string("'") + type_name(callee) + "' object is not callable");
    }
    const BoundMethod& m = callee.method_ref();
    switch (m.self.type()) {
        case Value::Type::FRAME: return call_frame_method(ctx, m.self, m.name, args);
        case Value::Type::SERIES: return call_series_method(ctx, m.self, m.name, args);
        case Value::Type::STR_ACCESSOR: return call_str_accessor(ctx, m.self, m.name, args);
        case Value::Type::LIST: return call_list_method(ctx, m.self, m.name, args);
        case Value::Type::DICT: return call_dict_method(ctx, m.self, m.name, args);
        case Value::Type::STR: return call_str_method(ctx, m.self, m.name, args);
        default: break;
    }
    throw ScriptError(ErrorKind::TYPE, "method '" + m.name + "' is not callable");
}

} // namespace frameguard
