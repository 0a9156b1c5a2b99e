#include "test_common.h"

#include "frameguard/json_mini.h"
#include "frameguard/serialization.h"

#include <json-c/json.h>

#include <cmath>
#include <string>

using namespace frameguard;

int main() {
    // Records: first-seen column order, missing keys become null
    {
        Dataset ds;
        std::string err;
        bool ok = dataset_from_records_json(R"([{"b":1,"a":"x"},{"a":"y","c":true},{}])", &ds, &err);
        expect_true(ok, "records parse: " + err);
        expect_true(ds.column_names() == std::vector<std::string>({"b", "a", "c"}), "first-seen column order");
        expect_eq_ll((long long)ds.rows(), 3, "three rows");
        expect_true(cell_is_null(ds.find("b")->cells[1]), "missing key is null");
        expect_true(cell_is_null(ds.find("a")->cells[2]), "empty record is all null");
        expect_true(std::get<bool>(ds.find("c")->cells[1]), "bool kept");
        expect_true(ds.check_shape().empty(), "shape consistent");
    }

    // Records: rejects what is not a table of scalars
    {
        Dataset ds;
        std::string err;
        expect_true(!dataset_from_records_json("{\"a\":1}", &ds, &err), "object is not a record list");
        expect_true(!dataset_from_records_json("[1,2]", &ds, &err), "scalars are not records");
        expect_true(!dataset_from_records_json(R"([{"a":[1]}])", &ds, &err), "nested array rejected");
        expect_true(err.find("'a'") != std::string::npos, "error names the field");
        expect_true(!dataset_from_records_json(R"([{"a":{"b":1}}])", &ds, &err), "nested object rejected");
        expect_true(!dataset_from_records_json("[{\"a\":1}", &ds, &err), "truncated JSON rejected");
        expect_true(dataset_from_records_json("[]", &ds, &err) && ds.columns.empty(), "empty list is an empty table");
    }

    // Non-finite floats leave as null
    {
        Dataset ds;
        ds.columns.push_back(Column{"v", {Cell{1.5}, Cell{NAN}, Cell{INFINITY}, Cell{}}});
        std::string out = dataset_to_records_json(ds);
        expect_true(out.find("NaN") == std::string::npos && out.find("Infinity") == std::string::npos,
                    "no non-standard JSON tokens: " + out);
        Dataset back;
        std::string err;
        expect_true(dataset_from_records_json(out, &back, &err), "output parses: " + err);
        expect_true(cell_as_double(back.find("v")->cells[0]) == 1.5, "finite value kept");
        expect_true(cell_is_null(back.find("v")->cells[1]), "NaN written as null");
        expect_true(cell_is_null(back.find("v")->cells[2]), "inf written as null");
    }

    // Requests: string dataframe_json, inline dataset, parameters, libraries
    {
        ExecutionRequest req;
        std::string err;
        bool ok = request_from_json_string(
            R"({"code_snippet":"dataframe = dataframe.dropna()",
                "dataframe_json":"[{\"a\":1},{\"a\":null}]",
                "parameters":{"k":3,"name":"x","flag":false,"none":null},
                "required_libraries":["pandas"],
                "request_id":"r-9"})",
            &req, &err);
        expect_true(ok, "request parses: " + err);
        expect_true(req.source_code == "dataframe = dataframe.dropna()", "code");
        expect_eq_ll((long long)req.dataset.rows(), 2, "dataset rows");
        expect_eq_ll((long long)req.parameters.size(), 4, "parameters");
        expect_true(std::get<int64_t>(req.parameters["k"]) == 3, "int parameter");
        expect_true(cell_is_null(req.parameters["none"]), "null parameter");
        expect_true(req.required_libraries.size() == 1 && req.required_libraries[0] == "pandas", "libraries");
        expect_true(req.request_id == "r-9", "request id");

        ok = request_from_json_string(R"({"source_code":"x = 1","dataset":[{"a":1}]})", &req, &err);
        expect_true(ok, "inline dataset accepted: " + err);

        expect_true(!request_from_json_string("not json", &req, &err), "bad JSON");
        expect_true(!request_from_json_string(R"({"dataframe_json":"[]"})", &req, &err), "missing code");
        expect_true(err.find("code_snippet") != std::string::npos, "error names the field");
        expect_true(!request_from_json_string(R"({"code_snippet":"x"})", &req, &err), "missing dataset");
        expect_true(!request_from_json_string(R"({"code_snippet":"x","dataframe_json":[]})", &req, &err),
                    "dataframe_json must be a string");
        expect_true(!request_from_json_string(R"({"code_snippet":"x","dataset":[],"parameters":{"p":[1]}})", &req, &err),
                    "non-scalar parameter rejected");
        expect_true(!request_from_json_string(R"({"code_snippet":"x","dataset":[],"required_libraries":"pandas"})",
                                              &req, &err),
                    "libraries must be a list");
    }

    // Results keep the service wire contract
    {
        ExecutionResult ok;
        ok.status = ExecStatus::SUCCESS;
        Dataset ds;
        ds.columns.push_back(Column{"a", {Cell{int64_t(1)}}});
        ok.output_dataset = ds;
        json_mini::Doc d = json_mini::parse(result_to_json_string(ok));
        expect_true((bool)d, "result is JSON");
        bool success = false;
        expect_true(json_get_bool(d.root, "success", &success) && success, "success flag");
        std::string cleaned;
        expect_true(json_get_string(d.root, "cleaned_dataframe_json", &cleaned), "cleaned_dataframe_json is a string");
        expect_true(cleaned == "[{\"a\":1}]", "records payload: " + cleaned);
        json_object* em = nullptr;
        expect_true(json_object_object_get_ex(d.root, "error_message", &em) && em == nullptr, "error_message null");

        ExecutionResult denied;
        denied.status = ExecStatus::POLICY_REJECTED;
        denied.violations.push_back(PolicyViolation{"import_statement", "import", 1, 1});
        d = json_mini::parse(result_to_json_string(denied));
        std::string msg, status;
        expect_true(json_get_string(d.root, "error_message", &msg), "error message present");
        expect_true(msg.find("Security Violation") == 0 && msg.find("import_statement") != std::string::npos,
                    "rejection message: " + msg);
        expect_true(json_get_string(d.root, "status", &status) && status == "PolicyRejected", "status string");
        json_object* cd = nullptr;
        expect_true(json_object_object_get_ex(d.root, "cleaned_dataframe_json", &cd) && cd == nullptr,
                    "no dataset on failure");
    }

    // Child protocol keeps the column list of an empty table
    {
        HostJob job;
        job.source_code = "x = 1";
        job.dataset.columns.push_back(Column{"a", {}});
        job.dataset.columns.push_back(Column{"b", {}});
        job.parameters["p"] = Cell{2.5};
        job.max_steps = 99;
        json_mini::Doc d(host_job_to_json(job));
        HostJob back;
        std::string err;
        expect_true(host_job_from_json(d.root, &back, &err), "job parses: " + err);
        expect_eq_ll((long long)back.dataset.columns.size(), 2, "columns survive zero rows");
        expect_eq_ll((long long)back.max_steps, 99, "budget carried");
        expect_true(std::get<double>(back.parameters["p"]) == 2.5, "parameter carried");
    }

    // Canonical JSON sorts keys
    {
        json_mini::Doc d = json_mini::parse(R"({"b":1,"a":{"d":2,"c":3}})");
        expect_true(json_mini::canonical(d.root) == R"({"a":{"c":3,"d":2},"b":1})", "canonical ordering");
        expect_true(!json_mini::parse("[[[[1]]]]", 2), "depth limit enforced");
    }

    std::cerr << "test_serialization: ALL PASSED" << std::endl;
    return 0;
}
