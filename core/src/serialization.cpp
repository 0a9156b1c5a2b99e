#include "frameguard/serialization.h"
#include "frameguard/json_mini.h"

#include <cmath>
#include <unordered_map>

namespace frameguard {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_mini::dump(o);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_int)) return false;
    *out = json_object_get_int64(v);
    return true;
}

// --- Cells ---

json_object* cell_to_json(const Cell& c) {
    if (auto b = std::get_if<bool>(&c)) return json_object_new_boolean(*b ? 1 : 0);
    if (auto i = std::get_if<int64_t>(&c)) return json_object_new_int64(*i);
    if (auto d = std::get_if<double>(&c)) {
        if (!std::isfinite(*d)) return nullptr;
        return json_object_new_double(*d);
    }
    if (auto s = std::get_if<std::string>(&c)) return json_object_new_string_len(s->c_str(), (int)s->size());
    return nullptr;
}

bool cell_from_json(json_object* v, Cell* out) {
    if (!v) { *out = Cell{}; return true; }
    switch (json_object_get_type(v)) {
        case json_type_null: *out = Cell{}; return true;
        case json_type_boolean: *out = Cell{json_object_get_boolean(v) != 0}; return true;
        case json_type_int: *out = Cell{(int64_t)json_object_get_int64(v)}; return true;
        case json_type_double: *out = make_double_cell(json_object_get_double(v)); return true;
        case json_type_string:
            *out = Cell{std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v))};
            return true;
        default: return false;
    }
}

// --- Dataset ---

json_object* dataset_to_records(const Dataset& ds) {
    json_object* arr = json_object_new_array();
    const size_t rows = ds.rows();
    for (size_t r = 0; r < rows; r++) {
        json_object* rec = json_object_new_object();
        for (const auto& col : ds.columns) {
            json_object_object_add(rec, col.name.c_str(), cell_to_json(col.cells[r]));
        }
        json_object_array_add(arr, rec);
    }
    return arr;
}

std::string dataset_to_records_json(const Dataset& ds) {
    json_mini::Doc d(dataset_to_records(ds));
    return json_mini::dump(d.root);
}

bool dataset_from_records(json_object* arr, Dataset* out, std::string* err) {
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        if (err) *err = "dataset must be a JSON array of records";
        return false;
    }
    Dataset ds;
    std::unordered_map<std::string, size_t> index;
    const size_t n = json_object_array_length(arr);
    for (size_t r = 0; r < n; r++) {
        json_object* rec = json_object_array_get_idx(arr, r);
        if (!rec || !json_object_is_type(rec, json_type_object)) {
            if (err) *err = "record " + std::to_string(r) + " is not an object";
            return false;
        }
        json_object_object_foreach(rec, k, v) {
            Cell c;
            if (!cell_from_json(v, &c)) {
                if (err) *err = "record " + std::to_string(r) + " field '" + k + "' is not a scalar";
                return false;
            }
            auto it = index.find(k);
            if (it == index.end()) {
                it = index.emplace(k, ds.columns.size()).first;
                ds.columns.push_back(Column{k, std::vector<Cell>(r)});
            }
            auto& cells = ds.columns[it->second].cells;
            if (cells.size() == r) cells.push_back(std::move(c));
            else cells[r] = std::move(c);
        }
        for (auto& col : ds.columns) {
            if (col.cells.size() < r + 1) col.cells.resize(r + 1);
        }
    }
    *out = std::move(ds);
    return true;
}

bool dataset_from_records_json(const std::string& s, Dataset* out, std::string* err) {
    json_mini::Doc d = json_mini::parse(s);
    if (!d) {
        if (err) *err = "dataset is not valid JSON";
        return false;
    }
    return dataset_from_records(d.root, out, err);
}

json_object* dataset_to_columnar(const Dataset& ds) {
    json_object* o = json_object_new_object();
    json_object* cols = json_object_new_array();
    for (const auto& c : ds.columns) json_object_array_add(cols, json_object_new_string(c.name.c_str()));
    json_object_object_add(o, "columns", cols);
    json_object* data = json_object_new_array();
    const size_t rows = ds.rows();
    for (size_t r = 0; r < rows; r++) {
        json_object* row = json_object_new_array();
        for (const auto& c : ds.columns) json_object_array_add(row, cell_to_json(c.cells[r]));
        json_object_array_add(data, row);
    }
    json_object_object_add(o, "data", data);
    return o;
}

bool dataset_from_columnar(json_object* o, Dataset* out, std::string* err) {
    json_object* cols = nullptr;
    json_object* data = nullptr;
    if (!o || !json_object_object_get_ex(o, "columns", &cols) || !json_object_is_type(cols, json_type_array) ||
        !json_object_object_get_ex(o, "data", &data) || !json_object_is_type(data, json_type_array)) {
        if (err) *err = "dataset: expected {columns, data}";
        return false;
    }
    Dataset ds;
    const size_t ncols = json_object_array_length(cols);
    for (size_t i = 0; i < ncols; i++) {
        json_object* name = json_object_array_get_idx(cols, i);
        if (!name || !json_object_is_type(name, json_type_string)) {
            if (err) *err = "dataset: column names must be strings";
            return false;
        }
        ds.columns.push_back(Column{json_object_get_string(name), {}});
    }
    const size_t nrows = json_object_array_length(data);
    for (auto& c : ds.columns) c.cells.reserve(nrows);
    for (size_t r = 0; r < nrows; r++) {
        json_object* row = json_object_array_get_idx(data, r);
        if (!row || !json_object_is_type(row, json_type_array) || json_object_array_length(row) != ncols) {
            if (err) *err = "dataset: row " + std::to_string(r) + " has the wrong width";
            return false;
        }
        for (size_t i = 0; i < ncols; i++) {
            Cell c;
            if (!cell_from_json(json_object_array_get_idx(row, i), &c)) {
                if (err) *err = "dataset: row " + std::to_string(r) + " holds a non-scalar";
                return false;
            }
            ds.columns[i].cells.push_back(std::move(c));
        }
    }
    std::string shape = ds.check_shape();
    if (!shape.empty()) {
        if (err) *err = "dataset: " + shape;
        return false;
    }
    *out = std::move(ds);
    return true;
}

// --- Requests ---

static bool parameters_from_json(json_object* o, std::map<std::string, ParamValue>* out, std::string* err) {
    if (!json_object_is_type(o, json_type_object)) {
        if (err) *err = "parameters must be an object";
        return false;
    }
    json_object_object_foreach(o, k, v) {
        Cell c;
        if (!cell_from_json(v, &c)) {
            if (err) *err = std::string("parameter '") + k + "' is not a scalar";
            return false;
        }
        (*out)[k] = std::move(c);
    }
    return true;
}

bool request_from_json(json_object* o, ExecutionRequest* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "request must be a JSON object";
        return false;
    }
    ExecutionRequest req;
    if (!json_get_string(o, "code_snippet", &req.source_code) && !json_get_string(o, "source_code", &req.source_code)) {
        if (err) *err = "missing 'code_snippet'";
        return false;
    }
    (void)json_get_string(o, "request_id", &req.request_id);

    json_object* v = nullptr;
    if (json_object_object_get_ex(o, "dataframe_json", &v) && v) {
        if (!json_object_is_type(v, json_type_string)) {
            if (err) *err = "'dataframe_json' must be a string";
            return false;
        }
        if (!dataset_from_records_json(json_object_get_string(v), &req.dataset, err)) return false;
    } else if (json_object_object_get_ex(o, "dataset", &v) && v) {
        if (!dataset_from_records(v, &req.dataset, err)) return false;
    } else {
        if (err) *err = "missing 'dataframe_json'";
        return false;
    }

    if (json_object_object_get_ex(o, "parameters", &v) && v) {
        if (!parameters_from_json(v, &req.parameters, err)) return false;
    }
    if (json_object_object_get_ex(o, "required_libraries", &v) && v) {
        if (!json_object_is_type(v, json_type_array)) {
            if (err) *err = "'required_libraries' must be an array of names";
            return false;
        }
        const size_t n = json_object_array_length(v);
        for (size_t i = 0; i < n; i++) {
            json_object* it = json_object_array_get_idx(v, i);
            if (!it || !json_object_is_type(it, json_type_string)) {
                if (err) *err = "'required_libraries' must be an array of names";
                return false;
            }
            req.required_libraries.push_back(json_object_get_string(it));
        }
    }
    *out = std::move(req);
    return true;
}

bool request_from_json_string(const std::string& s, ExecutionRequest* out, std::string* err) {
    json_mini::Doc d = json_mini::parse(s);
    if (!d) {
        if (err) *err = "request body is not valid JSON";
        return false;
    }
    return request_from_json(d.root, out, err);
}

// --- Decisions / results ---

json_object* violations_to_json(const std::vector<PolicyViolation>& v) {
    json_object* arr = json_object_new_array();
    for (const auto& pv : v) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "rule_id", json_object_new_string(pv.rule_id.c_str()));
        json_object_object_add(o, "matched_text", json_object_new_string_len(pv.matched_text.c_str(), (int)pv.matched_text.size()));
        json_object_object_add(o, "line", json_object_new_int(pv.line));
        json_object_object_add(o, "column", json_object_new_int(pv.column));
        json_object_array_add(arr, o);
    }
    return arr;
}

json_object* decision_to_json(const PolicyDecision& d) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "allowed", json_object_new_boolean(d.allowed ? 1 : 0));
    json_object_object_add(o, "violations", violations_to_json(d.violations));
    return o;
}

static std::string error_message_for(const ExecutionResult& r) {
    if (r.status == ExecStatus::POLICY_REJECTED) {
        std::string msg = "Security Violation: code snippet rejected by policy";
        if (!r.violations.empty()) msg += " (" + r.violations.front().rule_id + ")";
        return msg;
    }
    return r.diagnostics;
}

json_object* result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "success", json_object_new_boolean(r.ok() ? 1 : 0));
    json_object_object_add(o, "status", json_object_new_string(exec_status_to_str(r.status)));
    if (r.ok() && r.output_dataset) {
        std::string records = dataset_to_records_json(*r.output_dataset);
        json_object_object_add(o, "cleaned_dataframe_json", json_object_new_string_len(records.c_str(), (int)records.size()));
        json_object_object_add(o, "error_message", nullptr);
    } else {
        json_object_object_add(o, "cleaned_dataframe_json", nullptr);
        std::string msg = error_message_for(r);
        json_object_object_add(o, "error_message", json_object_new_string_len(msg.c_str(), (int)msg.size()));
    }
    json_object_object_add(o, "violations", violations_to_json(r.violations));
    json_object_object_add(o, "console", json_object_new_string_len(r.console.c_str(), (int)r.console.size()));
    json_object_object_add(o, "duration_ms", json_object_new_int64(r.duration_ms));
    return o;
}

std::string result_to_json_string(const ExecutionResult& r) {
    json_mini::Doc d(result_to_json(r));
    return json_mini::dump(d.root);
}

// --- Workhost protocol ---

json_object* host_job_to_json(const HostJob& job) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "source_code", json_object_new_string_len(job.source_code.c_str(), (int)job.source_code.size()));
    json_object_object_add(o, "dataset", dataset_to_columnar(job.dataset));
    json_object* params = json_object_new_object();
    for (const auto& kv : job.parameters) json_object_object_add(params, kv.first.c_str(), cell_to_json(kv.second));
    json_object_object_add(o, "parameters", params);
    json_object_object_add(o, "frame_name", json_object_new_string(job.frame_name.c_str()));
    json_object_object_add(o, "max_cells", json_object_new_int64((int64_t)job.max_cells));
    json_object_object_add(o, "console_max_bytes", json_object_new_int64((int64_t)job.console_max_bytes));
    json_object_object_add(o, "max_steps", json_object_new_int64((int64_t)job.max_steps));
    json_object_object_add(o, "enable_seccomp", json_object_new_boolean(job.enable_seccomp ? 1 : 0));
    return o;
}

bool host_job_from_json(json_object* o, HostJob* out, std::string* err) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "job must be a JSON object";
        return false;
    }
    HostJob job;
    if (!json_get_string(o, "source_code", &job.source_code)) {
        if (err) *err = "job: missing source_code";
        return false;
    }
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, "dataset", &v) || !dataset_from_columnar(v, &job.dataset, err)) {
        if (err && err->empty()) *err = "job: missing dataset";
        return false;
    }
    if (json_object_object_get_ex(o, "parameters", &v) && v) {
        if (!parameters_from_json(v, &job.parameters, err)) return false;
    }
    (void)json_get_string(o, "frame_name", &job.frame_name);
    int64_t n = 0;
    if (json_get_int64(o, "max_cells", &n) && n > 0) job.max_cells = (size_t)n;
    if (json_get_int64(o, "console_max_bytes", &n) && n >= 0) job.console_max_bytes = (size_t)n;
    if (json_get_int64(o, "max_steps", &n) && n >= 0) job.max_steps = (uint64_t)n;
    (void)json_get_bool(o, "enable_seccomp", &job.enable_seccomp);
    *out = std::move(job);
    return true;
}

json_object* host_reply_to_json(const ExecutionResult& r, bool console_truncated) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "status", json_object_new_string(exec_status_to_str(r.status)));
    if (r.output_dataset) json_object_object_add(o, "dataset", dataset_to_columnar(*r.output_dataset));
    json_object_object_add(o, "diagnostics", json_object_new_string_len(r.diagnostics.c_str(), (int)r.diagnostics.size()));
    json_object_object_add(o, "console", json_object_new_string_len(r.console.c_str(), (int)r.console.size()));
    json_object_object_add(o, "console_truncated", json_object_new_boolean(console_truncated ? 1 : 0));
    return o;
}

bool host_reply_from_json(json_object* o, ExecutionResult* out, std::string* err) {
    std::string status;
    if (!o || !json_get_string(o, "status", &status)) {
        if (err) *err = "workhost reply has no status";
        return false;
    }
    ExecutionResult r;
    r.status = exec_status_from_str(status);
    (void)json_get_string(o, "diagnostics", &r.diagnostics);
    (void)json_get_string(o, "console", &r.console);
    json_object* v = nullptr;
    if (r.status == ExecStatus::SUCCESS) {
        Dataset ds;
        if (!json_object_object_get_ex(o, "dataset", &v) || !dataset_from_columnar(v, &ds, err)) {
            if (err && err->empty()) *err = "workhost reply has no dataset";
            return false;
        }
        r.output_dataset = std::move(ds);
    }
    *out = std::move(r);
    return true;
}

} // namespace frameguard
