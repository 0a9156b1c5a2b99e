#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace frameguard {

// A single table cell. monostate is null; NaN is never stored (normalized to null).
using Cell = std::variant<std::monostate, bool, int64_t, double, std::string>;

inline bool cell_is_null(const Cell& c) { return std::holds_alternative<std::monostate>(c); }
bool cell_is_numeric(const Cell& c);   // int or double (bool excluded)
double cell_as_double(const Cell& c);  // numeric cells only; 0.0 otherwise
Cell make_double_cell(double v);        // NaN -> null
bool cell_equal(const Cell& a, const Cell& b);
// Strict weak ordering used by sort: null < bool < numbers < strings.
bool cell_less(const Cell& a, const Cell& b);
std::string cell_type_name(const Cell& c);

struct Column {
    std::string name;
    std::vector<Cell> cells;
};

struct Dataset {
    std::vector<Column> columns;

    size_t rows() const { return columns.empty() ? 0 : columns.front().cells.size(); }
    size_t cell_count() const { return rows() * columns.size(); }

    // nullptr when absent
    const Column* find(const std::string& name) const;
    Column* find(const std::string& name);

    std::vector<std::string> column_names() const;

    // Empty string when consistent; otherwise the reason.
    std::string check_shape() const;
};

} // namespace frameguard
