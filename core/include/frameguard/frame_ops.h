#pragma once

// Operators and reductions over scalars, columns and tables.
//
// Column operations follow table semantics: null propagates through
// arithmetic, comparisons against null are false, and division by zero
// yields inf/nan instead of raising. Scalar-only expressions follow
// Python semantics (TypeError on None, ZeroDivisionError).

#include "value.h"

#include <memory>
#include <string>
#include <vector>

namespace frameguard {

enum class Agg {
    SUM,
    MEAN,
    MEDIAN,
    MIN,
    MAX,
    STD,
    VAR,
    COUNT,
    NUNIQUE,
    ANY,
    ALL,
};

// Name as used in method calls ("mean", "nunique", ...).
bool agg_from_name(const std::string& name, Agg* out);

Value binary_op(ExecContext& ctx, const std::string& op, const Value& a, const Value& b);
Value compare_op(ExecContext& ctx, const std::string& op, const Value& a, const Value& b);
Value unary_op(ExecContext& ctx, const std::string& op, const Value& v);

// Scalar arithmetic on cells. `elementwise` selects column semantics.
Cell arith_cells(const std::string& op, const Cell& a, const Cell& b, bool elementwise);

// Reduction over the non-null cells. `ddof` only applies to STD/VAR.
Value aggregate(const std::vector<Cell>& cells, Agg agg, int ddof);
// Per-column reduction; result is labelled by column name. Numeric
// reductions skip non-numeric columns.
std::shared_ptr<Series> aggregate_frame(const Dataset& t, Agg agg, int ddof);

// Linear-interpolated quantile of the non-null numeric cells; NaN when empty.
double quantile(const std::vector<Cell>& cells, double q);

// "int64", "float64", "bool" or "object".
std::string dtype_of(const std::vector<Cell>& cells);

std::shared_ptr<Series> make_series(std::string name, std::vector<Cell> cells);

// Cells of length `n` from a scalar (broadcast), a column or a list.
std::vector<Cell> cells_for_length(ExecContext& ctx, const Value& v, size_t n, const char* what);
// Cells of a column, list or tuple value.
std::vector<Cell> cells_of(ExecContext& ctx, const Value& v, const char* what);

// Boolean row mask of length `rows` (null counts as false).
std::vector<bool> mask_of(const Value& v, size_t rows);

Dataset filter_rows(const Dataset& t, const std::vector<bool>& keep);
Dataset select_columns(const Dataset& t, const std::vector<std::string>& names);

// Round half to even at `digits` decimal places.
double round_digits(double x, int64_t digits);

// Numeric coercion used by pd.to_numeric and astype(float).
bool parse_number(const std::string& s, Cell* out);

} // namespace frameguard
