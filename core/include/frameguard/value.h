#pragma once

// Runtime values of the FrameScript interpreter.
//
// Scalars are stored as a Cell. Containers and tables are shared handles, so
// `b = a` aliases the same list/dict/table, as in Python.

#include "dataset.h"
#include "errors.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace frameguard {

class Value;
class ExecContext;
struct ListData;
struct DictData;
struct Series;
struct Library;
struct NativeFunction;
struct BoundMethod;

class Value {
public:
    enum class Type {
        NONE,
        BOOL,
        INT,
        FLOAT,
        STR,
        LIST,
        TUPLE,
        DICT,
        FRAME,
        SERIES,
        LOC,           // row/column indexer of a table (df.loc)
        STR_ACCESSOR,  // string methods of a column (s.str)
        LIBRARY,
        FUNCTION,
        METHOD,
    };

    Value() = default;

    static Value none() { return Value(); }
    static Value boolean(bool b) { return from_cell(Cell{b}); }
    static Value integer(int64_t i) { return from_cell(Cell{i}); }
    static Value real(double d) { return from_cell(Cell{d}); }
    static Value str(std::string s) { return from_cell(Cell{std::move(s)}); }
    static Value from_cell(const Cell& c);

    static Value list(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);
    static Value dict(std::shared_ptr<DictData> d);
    static Value frame(std::shared_ptr<Dataset> t);
    static Value series(std::shared_ptr<Series> s);
    static Value loc(std::shared_ptr<Dataset> t);
    static Value str_accessor(std::shared_ptr<Series> s);
    static Value library(std::shared_ptr<const Library> lib);
    static Value function(std::shared_ptr<const NativeFunction> fn);
    static Value method(Value self, std::string name);

    Type type() const { return type_; }
    bool is_none() const { return type_ == Type::NONE; }
    bool is_scalar() const { return type_ <= Type::STR; }
    bool is_number() const { return type_ == Type::INT || type_ == Type::FLOAT || type_ == Type::BOOL; }
    bool is_sequence() const { return type_ == Type::LIST || type_ == Type::TUPLE; }

    // Scalar payload; throws TypeError for non-scalars.
    const Cell& cell() const;
    bool as_bool() const { return std::get<bool>(cell()); }
    int64_t as_int() const { return std::get<int64_t>(cell()); }
    const std::string& as_str() const { return std::get<std::string>(cell()); }
    double as_double() const;  // bool/int/float

    ListData& list_data() const;
    DictData& dict_data() const;
    const std::shared_ptr<Dataset>& frame_ptr() const;
    Dataset& frame() const { return *frame_ptr(); }
    const std::shared_ptr<Series>& series_ptr() const;
    Series& series() const { return *series_ptr(); }
    const Library& library_ref() const;
    const std::shared_ptr<const Library>& library_ptr() const;
    const NativeFunction& function_ref() const;
    const BoundMethod& method_ref() const;

private:
    using Payload = std::variant<Cell,
                                 std::shared_ptr<ListData>,
                                 std::shared_ptr<DictData>,
                                 std::shared_ptr<Dataset>,
                                 std::shared_ptr<Series>,
                                 std::shared_ptr<const Library>,
                                 std::shared_ptr<const NativeFunction>,
                                 std::shared_ptr<const BoundMethod>>;

    Value(Type t, Payload p) : type_(t), payload_(std::move(p)) {}

    Type type_{Type::NONE};
    Payload payload_{Cell{}};
};

struct ListData {
    std::vector<Value> items;
};

// Insertion-ordered mapping with scalar keys.
struct DictData {
    std::vector<std::pair<Cell, Value>> items;
    bool frozen{false};  // request parameters are read-only

    const Value* find(const Cell& key) const;
    void set(const Cell& key, Value v);
};

// One column of values. `labels` is empty for positional columns and holds
// one label per cell for reductions over a table (df.mean() etc).
struct Series {
    std::string name;
    std::vector<Cell> cells;
    std::vector<std::string> labels;
};

struct Library {
    std::string name;
    std::vector<std::pair<std::string, Value>> members;

    const Value* find(const std::string& member) const;
};

struct CallArgs {
    std::vector<Value> pos;
    std::vector<std::pair<std::string, Value>> kw;

    // Positional argument `i` or keyword `name`; nullptr when absent.
    const Value* get(size_t i, const char* name) const;
    const Value* kwarg(const char* name) const;

    // TypeError on extra positionals or unknown keywords.
    void check(const char* fn, size_t max_pos, std::initializer_list<const char*> allowed_kw) const;
    const Value& require(size_t i, const char* name, const char* fn) const;
};

using NativeImpl = std::function<Value(ExecContext&, CallArgs&)>;

struct NativeFunction {
    std::string name;
    NativeImpl impl;
};

struct BoundMethod {
    Value self;
    std::string name;
};

// Per-execution budgets and captured console output.
class ExecContext {
public:
    ExecContext(size_t max_cells, size_t console_max_bytes, uint64_t max_steps)
        : max_cells_(max_cells), console_max_(console_max_bytes), max_steps_(max_steps) {}

    // ResourceExceeded when a container/table of `n` elements would exceed the ceiling.
    void check_cells(size_t n) const;
    void check_string(size_t len) const;
    // Counts one interpreter step; StepBudgetExceeded past the budget.
    void tick();
    void write_console(const std::string& s);

    const std::string& console() const { return console_; }
    bool console_truncated() const { return console_truncated_; }
    uint64_t steps() const { return steps_; }
    size_t max_cells() const { return max_cells_; }

private:
    size_t max_cells_;
    size_t console_max_;
    uint64_t max_steps_;
    uint64_t steps_{0};
    std::string console_;
    bool console_truncated_{false};
};

const char* type_name(const Value& v);
bool truthy(const Value& v);

std::string format_float(double d);
std::string cell_to_str(const Cell& c);   // str() of a scalar
std::string cell_repr(const Cell& c);     // repr() of a scalar
std::string to_str(const Value& v);
std::string repr(const Value& v);

// Scalar value as a table cell (NaN folded to null). TypeError otherwise.
Cell to_cell(const Value& v, const char* what);

// Elements visited by `for` / list(): list and tuple items, dict keys,
// characters, column values, table column names.
std::vector<Value> iterate(ExecContext& ctx, const Value& v);

} // namespace frameguard
