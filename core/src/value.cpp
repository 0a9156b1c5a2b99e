#include "frameguard/value.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace frameguard {

Value Value::from_cell(const Cell& c) {
    switch (c.index()) {
        case 0: return Value();
        case 1: return Value(Type::BOOL, c);
        case 2: return Value(Type::INT, c);
        case 3: return Value(Type::FLOAT, c);
        default: return Value(Type::STR, c);
    }
}

Value Value::list(std::vector<Value> items) {
    auto d = std::make_shared<ListData>();
    d->items = std::move(items);
    return Value(Type::LIST, d);
}

Value Value::tuple(std::vector<Value> items) {
    auto d = std::make_shared<ListData>();
    d->items = std::move(items);
    return Value(Type::TUPLE, d);
}

Value Value::dict(std::shared_ptr<DictData> d) { return Value(Type::DICT, std::move(d)); }
Value Value::frame(std::shared_ptr<Dataset> t) { return Value(Type::FRAME, std::move(t)); }
Value Value::series(std::shared_ptr<Series> s) { return Value(Type::SERIES, std::move(s)); }
Value Value::loc(std::shared_ptr<Dataset> t) { return Value(Type::LOC, std::move(t)); }
Value Value::str_accessor(std::shared_ptr<Series> s) { return Value(Type::STR_ACCESSOR, std::move(s)); }
Value Value::library(std::shared_ptr<const Library> lib) { return Value(Type::LIBRARY, std::move(lib)); }
Value Value::function(std::shared_ptr<const NativeFunction> fn) { return Value(Type::FUNCTION, std::move(fn)); }

Value Value::method(Value self, std::string name) {
    auto m = std::make_shared<BoundMethod>();
    m->self = std::move(self);
    m->name = std::move(name);
    return Value(Type::METHOD, std::shared_ptr<const BoundMethod>(std::move(m)));
}

const Cell& Value::cell() const {
    if (!is_scalar()) throw ScriptError(ErrorKind::TYPE, std::string("expected a scalar, got ") + type_name(*this));
    return std::get<Cell>(payload_);
}

double Value::as_double() const {
    const Cell& c = cell();
    if (auto* b = std::get_if<bool>(&c)) return *b ? 1.0 : 0.0;
    return cell_as_double(c);
}

ListData& Value::list_data() const { return *std::get<std::shared_ptr<ListData>>(payload_); }
DictData& Value::dict_data() const { return *std::get<std::shared_ptr<DictData>>(payload_); }
const std::shared_ptr<Dataset>& Value::frame_ptr() const { return std::get<std::shared_ptr<Dataset>>(payload_); }
const std::shared_ptr<Series>& Value::series_ptr() const { return std::get<std::shared_ptr<Series>>(payload_); }
const Library& Value::library_ref() const { return *library_ptr(); }
const std::shared_ptr<const Library>& Value::library_ptr() const {
    return std::get<std::shared_ptr<const Library>>(payload_);
}
const NativeFunction& Value::function_ref() const {
    return *std::get<std::shared_ptr<const NativeFunction>>(payload_);
}
const BoundMethod& Value::method_ref() const { return *std::get<std::shared_ptr<const BoundMethod>>(payload_); }

const Value* DictData::find(const Cell& key) const {
    for (const auto& kv : items)
        if (cell_equal(kv.first, key)) return &kv.second;
    return nullptr;
}

void DictData::set(const Cell& key, Value v) {
    if (frozen) throw ScriptError(ErrorKind::TYPE, "'params' is read-only");
    for (auto& kv : items) {
        if (cell_equal(kv.first, key)) {
            kv.second = std::move(v);
            return;
        }
    }
    items.emplace_back(key, std::move(v));
}

const Value* Library::find(const std::string& member) const {
    for (const auto& kv : members)
        if (kv.first == member) return &kv.second;
    return nullptr;
}

const Value* CallArgs::kwarg(const char* name) const {
    for (const auto& kv : kw)
        if (kv.first == name) return &kv.second;
    return nullptr;
}

const Value* CallArgs::get(size_t i, const char* name) const {
    if (i < pos.size()) return &pos[i];
    return name ? kwarg(name) : nullptr;
}

void CallArgs::check(const char* fn, size_t max_pos, std::initializer_list<const char*> allowed_kw) const {
    if (pos.size() > max_pos) {
        throw ScriptError(ErrorKind::TYPE, std::string(fn) + "() takes at most " + std::to_string(max_pos) +
                                               " positional arguments (" + std::to_string(pos.size()) + " given)");
    }
    for (const auto& kv : kw) {
        bool ok = false;
        for (const char* a : allowed_kw) {
            if (kv.first == a) { ok = true; break; }
        }
        if (!ok) {
            throw ScriptError(ErrorKind::TYPE,
                              std::string(fn) + "() got an unexpected keyword argument '" + kv.first + "'");
        }
    }
}

const Value& CallArgs::require(size_t i, const char* name, const char* fn) const {
    const Value* v = get(i, name);
    if (!v) throw ScriptError(ErrorKind::TYPE, std::string(fn) + "() missing required argument '" + name + "'");
    return *v;
}

void ExecContext::check_cells(size_t n) const {
    if (max_cells_ && n > max_cells_) {
        throw ScriptError(ErrorKind::RESOURCE, "element ceiling exceeded (" + std::to_string(n) + " > " +
                                                   std::to_string(max_cells_) + ")");
    }
}

void ExecContext::check_string(size_t len) const {
    if (max_cells_ && len > max_cells_) {
        throw ScriptError(ErrorKind::RESOURCE, "string length ceiling exceeded (" + std::to_string(len) + ")");
    }
}

void ExecContext::tick() {
    steps_++;
    if (max_steps_ && steps_ > max_steps_) {
        throw ScriptError(ErrorKind::STEP_BUDGET, "instruction budget of " + std::to_string(max_steps_) +
                                                      " steps exhausted");
    }
}

void ExecContext::write_console(const std::string& s) {
    if (console_truncated_) return;
    if (console_.size() + s.size() > console_max_) {
        console_.append(s, 0, console_max_ - console_.size());
        console_truncated_ = true;
        return;
    }
    console_ += s;
}

const char* type_name(const Value& v) {
    switch (v.type()) {
        case Value::Type::NONE: return "NoneType";
        case Value::Type::BOOL: return "bool";
        case Value::Type::INT: return "int";
        case Value::Type::FLOAT: return "float";
        case Value::Type::STR: return "str";
        case Value::Type::LIST: return "list";
        case Value::Type::TUPLE: return "tuple";
        case Value::Type::DICT: return "dict";
        case Value::Type::FRAME: return "DataFrame";
        case Value::Type::SERIES: return "Series";
        case Value::Type::LOC: return "LocIndexer";
        case Value::Type::STR_ACCESSOR: return "StringMethods";
        case Value::Type::LIBRARY: return "module";
        case Value::Type::FUNCTION: return "builtin_function";
        case Value::Type::METHOD: return "method";
    }
    return "object";
}

bool truthy(const Value& v) {
    switch (v.type()) {
        case Value::Type::NONE: return false;
        case Value::Type::BOOL: return v.as_bool();
        case Value::Type::INT: return v.as_int() != 0;
        case Value::Type::FLOAT: return v.as_double() != 0.0;
        case Value::Type::STR: return !v.as_str().empty();
        case Value::Type::LIST:
        case Value::Type::TUPLE: return !v.list_data().items.empty();
        case Value::Type::DICT: return !v.dict_data().items.empty();
        case Value::Type::FRAME:
        case Value::Type::SERIES:
            throw ScriptError(ErrorKind::VALUE, std::string("the truth value of a ") + type_name(v) +
                                                    " is ambiguous; use .empty, .any() or .all()");
        default: return true;
    }
}

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    char buf[64];
    int prec = 1;
    for (; prec <= 17; prec++) {
        std::snprintf(buf, sizeof(buf), "%.*e", prec - 1, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    const char* e = std::strchr(buf, 'e');
    const int exp10 = e ? std::atoi(e + 1) : 0;

    std::string out;
    if (exp10 >= -4 && exp10 < 16) {
        const int decimals = std::max(0, prec - 1 - exp10);
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, d);
        out = buf;
        if (out.find('.') == std::string::npos) out += ".0";
    } else {
        out = buf;
    }
    return out;
}

std::string cell_to_str(const Cell& c) {
    switch (c.index()) {
        case 0: return "None";
        case 1: return std::get<bool>(c) ? "True" : "False";
        case 2: return std::to_string(std::get<int64_t>(c));
        case 3: return format_float(std::get<double>(c));
        default: return std::get<std::string>(c);
    }
}

std::string cell_repr(const Cell& c) {
    if (auto* s = std::get_if<std::string>(&c)) {
        std::string out = "'";
        for (char ch : *s) {
            if (ch == '\'' || ch == '\\') out.push_back('\\');
            if (ch == '\n') { out += "\\n"; continue; }
            out.push_back(ch);
        }
        out.push_back('\'');
        return out;
    }
    return cell_to_str(c);
}

namespace {

std::string join_repr(const std::vector<Value>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += ", ";
        out += repr(items[i]);
    }
    return out;
}

std::string pad_right(const std::string& s, size_t w) {
    return s.size() >= w ? s : s + std::string(w - s.size(), ' ');
}

const size_t kPrintRows = 10;

std::string series_text(const Series& s) {
    std::string out;
    const size_t n = s.cells.size();
    for (size_t i = 0; i < n && i < kPrintRows; i++) {
        std::string label = s.labels.empty() ? std::to_string(i) : s.labels[i];
        out += pad_right(label, 8) + cell_to_str(s.cells[i]) + "\n";
    }
    if (n > kPrintRows) out += "... (" + std::to_string(n) + " rows)\n";
    out += "Name: " + (s.name.empty() ? std::string("None") : s.name) + ", Length: " + std::to_string(n);
    return out;
}

std::string frame_text(const Dataset& t) {
    if (t.columns.empty()) return "Empty DataFrame";
    std::string out = pad_right("", 6);
    for (const auto& c : t.columns) out += pad_right(c.name, 12);
    out += "\n";
    const size_t n = t.rows();
    for (size_t r = 0; r < n && r < kPrintRows; r++) {
        out += pad_right(std::to_string(r), 6);
        for (const auto& c : t.columns) out += pad_right(cell_to_str(c.cells[r]), 12);
        out += "\n";
    }
    out += "[" + std::to_string(n) + " rows x " + std::to_string(t.columns.size()) + " columns]";
    return out;
}

} // namespace

std::string to_str(const Value& v) {
    if (v.is_scalar()) return cell_to_str(v.cell());
    return repr(v);
}

std::string repr(const Value& v) {
    switch (v.type()) {
        case Value::Type::LIST: return "[" + join_repr(v.list_data().items) + "]";
        case Value::Type::TUPLE: {
            const auto& items = v.list_data().items;
            return "(" + join_repr(items) + (items.size() == 1 ? ",)" : ")");
        }
        case Value::Type::DICT: {
            std::string out = "{";
            bool first = true;
            for (const auto& kv : v.dict_data().items) {
                if (!first) out += ", ";
                first = false;
                out += cell_repr(kv.first) + ": " + repr(kv.second);
            }
            return out + "}";
        }
        case Value::Type::FRAME: return frame_text(v.frame());
        case Value::Type::SERIES: return series_text(v.series());
        case Value::Type::LIBRARY: return "<module '" + v.library_ref().name + "'>";
        case Value::Type::FUNCTION: return "<built-in function " + v.function_ref().name + ">";
        case Value::Type::METHOD:
            return std::string("<method ") + type_name(v.method_ref().self) + "." + v.method_ref().name + ">";
        case Value::Type::LOC: return "<LocIndexer>";
        case Value::Type::STR_ACCESSOR: return "<StringMethods>";
        default: return cell_repr(v.cell());
    }
}

Cell to_cell(const Value& v, const char* what) {
    if (!v.is_scalar()) {
        throw ScriptError(ErrorKind::TYPE, std::string(what) + " must be a scalar, got " + type_name(v));
    }
    const Cell& c = v.cell();
    if (auto* d = std::get_if<double>(&c)) return make_double_cell(*d);
    return c;
}

std::vector<Value> iterate(ExecContext& ctx, const Value& v) {
    std::vector<Value> out;
    switch (v.type()) {
        case Value::Type::LIST:
        case Value::Type::TUPLE: return v.list_data().items;
        case Value::Type::DICT:
            for (const auto& kv : v.dict_data().items) out.push_back(Value::from_cell(kv.first));
            return out;
        case Value::Type::STR:
            for (char ch : v.as_str()) out.push_back(Value::str(std::string(1, ch)));
            return out;
        case Value::Type::SERIES:
            ctx.check_cells(v.series().cells.size());
            for (const auto& c : v.series().cells) out.push_back(Value::from_cell(c));
            return out;
        case Value::Type::FRAME:
            for (const auto& c : v.frame().columns) out.push_back(Value::str(c.name));
            return out;
        default:
            throw ScriptError(ErrorKind::TYPE, std::string("'") + type_name(v) + "' object is not iterable");
    }
}

} // namespace frameguard
