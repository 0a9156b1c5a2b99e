#pragma once

#include "types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace frameguard {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);

// --- Cells ---

// Non-finite floats become null.
json_object* cell_to_json(const Cell& c);
// False for arrays and objects.
bool cell_from_json(json_object* v, Cell* out);

// --- Dataset ---
// Records form: [{"age":1},{"age":null}]. Column order is first-seen key
// order; a key missing from a record is null.

json_object* dataset_to_records(const Dataset& ds);
std::string dataset_to_records_json(const Dataset& ds);
bool dataset_from_records(json_object* arr, Dataset* out, std::string* err);
bool dataset_from_records_json(const std::string& s, Dataset* out, std::string* err);

// Columnar form {"columns":[...],"data":[[row],...]}; keeps the column
// list of zero-row tables. Used between the service and the workhost.
json_object* dataset_to_columnar(const Dataset& ds);
bool dataset_from_columnar(json_object* o, Dataset* out, std::string* err);

// --- Requests / decisions / results ---

// Wire request: {"code_snippet", "dataframe_json" (string) | "dataset" (array),
// "parameters", "required_libraries", "request_id"}.
bool request_from_json(json_object* o, ExecutionRequest* out, std::string* err);
bool request_from_json_string(const std::string& s, ExecutionRequest* out, std::string* err);

json_object* violations_to_json(const std::vector<PolicyViolation>& v);
json_object* decision_to_json(const PolicyDecision& d);

// Wire result: {"success","status","cleaned_dataframe_json","error_message",
// "violations","console","duration_ms"}.
json_object* result_to_json(const ExecutionResult& r);
std::string result_to_json_string(const ExecutionResult& r);

// --- Workhost protocol ---

json_object* host_job_to_json(const HostJob& job);
bool host_job_from_json(json_object* o, HostJob* out, std::string* err);

json_object* host_reply_to_json(const ExecutionResult& r, bool console_truncated);
bool host_reply_from_json(json_object* o, ExecutionResult* out, std::string* err);

} // namespace frameguard
