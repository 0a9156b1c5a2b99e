#include "frameguard/dataset.h"

#include <cmath>
#include <unordered_set>

namespace frameguard {

bool cell_is_numeric(const Cell& c) {
    return std::holds_alternative<int64_t>(c) || std::holds_alternative<double>(c);
}

double cell_as_double(const Cell& c) {
    if (auto* i = std::get_if<int64_t>(&c)) return (double)*i;
    if (auto* d = std::get_if<double>(&c)) return *d;
    return 0.0;
}

Cell make_double_cell(double v) {
    if (std::isnan(v)) return Cell{};
    return Cell{v};
}

bool cell_equal(const Cell& a, const Cell& b) {
    if (cell_is_numeric(a) && cell_is_numeric(b)) {
        if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b))
            return std::get<int64_t>(a) == std::get<int64_t>(b);
        return cell_as_double(a) == cell_as_double(b);
    }
    return a == b;
}

static int cell_rank(const Cell& c) {
    if (cell_is_null(c)) return 0;
    if (std::holds_alternative<bool>(c)) return 1;
    if (cell_is_numeric(c)) return 2;
    return 3;
}

bool cell_less(const Cell& a, const Cell& b) {
    int ra = cell_rank(a), rb = cell_rank(b);
    if (ra != rb) return ra < rb;
    switch (ra) {
        case 0: return false;
        case 1: return !std::get<bool>(a) && std::get<bool>(b);
        case 2:
            if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b))
                return std::get<int64_t>(a) < std::get<int64_t>(b);
            return cell_as_double(a) < cell_as_double(b);
        default: return std::get<std::string>(a) < std::get<std::string>(b);
    }
}

std::string cell_type_name(const Cell& c) {
    switch (c.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "float";
        default: return "str";
    }
}

const Column* Dataset::find(const std::string& name) const {
    for (const auto& c : columns)
        if (c.name == name) return &c;
    return nullptr;
}

Column* Dataset::find(const std::string& name) {
    for (auto& c : columns)
        if (c.name == name) return &c;
    return nullptr;
}

std::vector<std::string> Dataset::column_names() const {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

std::string Dataset::check_shape() const {
    std::unordered_set<std::string> seen;
    const size_t n = rows();
    for (const auto& c : columns) {
        if (!seen.insert(c.name).second) return "duplicate column name: " + c.name;
        if (c.cells.size() != n) return "column '" + c.name + "' has " + std::to_string(c.cells.size()) +
                                        " rows, expected " + std::to_string(n);
    }
    return "";
}

} // namespace frameguard
