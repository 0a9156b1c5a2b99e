#pragma once

// Attribute, subscript and method protocol of the runtime values.
//
// Attribute names starting with '_' never resolve, on any value.

#include "value.h"

#include <string>

namespace frameguard {

Value get_attr(ExecContext& ctx, const Value& obj, const std::string& name);
void set_attr(ExecContext& ctx, const Value& obj, const std::string& name, const Value& v);

Value get_item(ExecContext& ctx, const Value& obj, const Value& key);
void set_item(ExecContext& ctx, const Value& obj, const Value& key, const Value& v);

// Calls a native function or bound method; TypeError for anything else.
Value call_value(ExecContext& ctx, const Value& callee, CallArgs& args);

// Per-type method tables (frame_methods.cpp, series_methods.cpp, methods.cpp).
bool has_frame_method(const std::string& name);
bool has_series_method(const std::string& name);
Value call_frame_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args);
Value call_series_method(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args);
Value call_str_accessor(ExecContext& ctx, const Value& self, const std::string& name, CallArgs& args);

// Shared helpers.
std::string arg_str(const Value& v, const char* what);
int64_t arg_int(const Value& v, const char* what);
double arg_double(const Value& v, const char* what);
bool arg_bool(const Value& v, const char* what);
// A string or list of strings.
std::vector<std::string> arg_names(const Value& v, const char* what);
// astype()/to_numeric() conversion of one cell; `dtype` is int/float/str/bool.
Cell convert_cell(const Cell& c, const std::string& dtype);
// Dtype name from a string ("float64") or a builtin (float).
std::string dtype_arg(const Value& v);

} // namespace frameguard
