#include "test_common.h"

#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <cmath>
#include <map>
#include <string>

using namespace frameguard;

static Dataset records(const std::string& json) {
    Dataset ds;
    std::string err;
    if (!dataset_from_records_json(json, &ds, &err)) die("bad fixture: " + err);
    return ds;
}

static ExecutionResult run(const std::string& src,
                           const Dataset& ds,
                           const std::map<std::string, ParamValue>& params = {},
                           const ExecLimits& limits = ExecLimits{},
                           bool* console_truncated = nullptr) {
    static Workbench wb(Workshop::initialize(), WorkbenchOptions{});
    return wb.evaluate(src, ds, params, limits, console_truncated);
}

static bool same_table(const Dataset& a, const Dataset& b) {
    if (a.column_names() != b.column_names() || a.rows() != b.rows()) return false;
    for (size_t c = 0; c < a.columns.size(); c++) {
        for (size_t r = 0; r < a.rows(); r++) {
            if (!cell_equal(a.columns[c].cells[r], b.columns[c].cells[r])) return false;
        }
    }
    return true;
}

static void expect_status(const ExecutionResult& r, ExecStatus want, const std::string& what) {
    if (r.status != want) {
        die(what + ": got " + exec_status_to_str(r.status) + " (" + r.diagnostics + "), want " +
            exec_status_to_str(want));
    }
}

int main() {
    const Dataset people = records(R"([{"name":"ann","age":31,"city":"Oslo"},
                                       {"name":"bob","age":null,"city":"Rome"},
                                       {"name":"cy","age":17,"city":null}])");

    // Mean imputation across numeric columns
    {
        ExecutionResult r = run("dataframe = dataframe.fillna(dataframe.mean())\n",
                                records(R"([{"age":1},{"age":null},{"age":3}])"));
        expect_status(r, ExecStatus::SUCCESS, "fillna(mean)");
        const Column* age = r.output_dataset->find("age");
        expect_true(age != nullptr, "age column kept");
        expect_eq_ll((long long)age->cells.size(), 3, "three rows");
        expect_true(cell_as_double(age->cells[0]) == 1.0, "row 0 unchanged");
        expect_true(cell_as_double(age->cells[1]) == 2.0, "row 1 imputed with the mean");
        expect_true(cell_as_double(age->cells[2]) == 3.0, "row 2 unchanged");
    }

    // A trailing bare expression that yields a table becomes the result
    {
        ExecutionResult r = run("dataframe.fillna(dataframe.mean())\n",
                                records(R"([{"age":1},{"age":null},{"age":3}])"));
        expect_status(r, ExecStatus::SUCCESS, "bare fillna(mean)");
        const Column* age = r.output_dataset->find("age");
        expect_true(age != nullptr && age->cells.size() == 3, "age column kept");
        expect_true(cell_as_double(age->cells[0]) == 1.0, "bare: row 0");
        expect_true(!cell_is_null(age->cells[1]) && cell_as_double(age->cells[1]) == 2.0, "bare: row 1 imputed");
        expect_true(cell_as_double(age->cells[2]) == 3.0, "bare: row 2");

        // a trailing non-table expression leaves the binding alone
        r = run("dataframe = dataframe.dropna()\nlen(dataframe)\n", people);
        expect_status(r, ExecStatus::SUCCESS, "trailing scalar");
        expect_eq_ll((long long)r.output_dataset->rows(), 1, "dropna result kept");

        // only the last top-level statement counts
        r = run("dataframe.head(1)\nx = 1\n", people);
        expect_eq_ll((long long)r.output_dataset->rows(), 3, "earlier bare expression discarded");
    }

    // Rename round trip restores the input
    {
        ExecutionResult r = run("dataframe = dataframe.rename(columns={'age': 'years'})\n"
                                "dataframe = dataframe.rename(columns={'years': 'age'})\n",
                                people);
        expect_status(r, ExecStatus::SUCCESS, "rename round trip");
        expect_true(same_table(*r.output_dataset, people), "rename round trip is identity");
    }

    // A filter applied to its own output changes nothing
    {
        const std::string filter = "dataframe = dataframe[dataframe['age'] > 18]\n";
        ExecutionResult once = run(filter, people);
        expect_status(once, ExecStatus::SUCCESS, "filter once");
        expect_eq_ll((long long)once.output_dataset->rows(), 1, "one adult");
        ExecutionResult twice = run(filter, *once.output_dataset);
        expect_status(twice, ExecStatus::SUCCESS, "filter twice");
        expect_true(same_table(*once.output_dataset, *twice.output_dataset), "filter is idempotent");
    }

    // Parameters are readable
    {
        ExecutionResult r = run("dataframe['age'] = dataframe['age'].fillna(params['default_age'])\n"
                                "dataframe = dataframe[dataframe['city'] != params['drop_city']]\n",
                                people, {{"default_age", Cell{int64_t(40)}}, {"drop_city", Cell{std::string("Rome")}}});
        expect_status(r, ExecStatus::SUCCESS, "params read");
        expect_eq_ll((long long)r.output_dataset->rows(), 2, "Rome row dropped");
    }

    // ...and read-only
    {
        ExecutionResult r = run("params['k'] = 1\n", people, {{"k", Cell{int64_t(0)}}});
        expect_status(r, ExecStatus::RUNTIME_ERROR, "params write");
        expect_true(r.diagnostics.find("read-only") != std::string::npos, "diagnostic names read-only params");
    }

    // Names outside the namespace do not exist, even with the scanner bypassed
    {
        ExecutionResult r = run("f = open('/etc/passwd')\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "open");
        expect_true(r.diagnostics.find("NameError") != std::string::npos, "open is a NameError");
        expect_true(r.diagnostics.find("/etc/passwd") == std::string::npos, "absolute paths scrubbed");

        r = run("m = __import__('os')\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "__import__");

        r = run("c = dataframe.__class__\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "dunder attribute");
    }

    // Diagnostics carry the failing line
    {
        ExecutionResult r = run("x = 1\ny = missing_name + 1\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "undefined name");
        expect_true(r.diagnostics.rfind("line 2: NameError", 0) == 0, "diagnostic: " + r.diagnostics);
        expect_true(!r.output_dataset.has_value(), "no dataset on failure");
    }

    // The binding must still hold a table
    {
        ExecutionResult r = run("dataframe = 42\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "rebound to int");
        expect_true(r.diagnostics.find("no longer holds a table") != std::string::npos, "names the binding");
    }

    // Preloaded libraries are in scope without importing
    {
        ExecutionResult r = run("dataframe['adult'] = np.where(dataframe['age'] >= 18, 'yes', 'no')\n"
                                "dataframe['missing'] = pd.isna(dataframe['age'])\n",
                                people);
        expect_status(r, ExecStatus::SUCCESS, "np/pd calls");
        const Column* adult = r.output_dataset->find("adult");
        expect_true(adult && std::get<std::string>(adult->cells[0]) == "yes", "np.where applied");
        const Column* missing = r.output_dataset->find("missing");
        expect_true(missing && std::get<bool>(missing->cells[1]), "pd.isna applied");
    }

    // print() is captured and capped
    {
        ExecutionResult r = run("print('rows', len(dataframe))\n", people);
        expect_status(r, ExecStatus::SUCCESS, "print");
        expect_true(r.console == "rows 3\n", "console: " + r.console);

        ExecLimits lim;
        lim.console_max_bytes = 16;
        bool truncated = false;
        r = run("for i in range(100):\n    print('line', i)\n", people, {}, lim, &truncated);
        expect_status(r, ExecStatus::SUCCESS, "print flood still succeeds");
        expect_true(r.console.size() <= 16, "console capped");
        expect_true(truncated, "truncation reported");
    }

    // In-process budgets
    {
        ExecLimits lim;
        lim.max_steps = 10000;
        ExecutionResult r = run("while True:\n    pass\n", people, {}, lim);
        expect_status(r, ExecStatus::TIMEOUT, "step budget");

        lim = ExecLimits{};
        lim.max_cells = 1000;
        r = run("x = list(range(1000000))\n", people, {}, lim);
        expect_status(r, ExecStatus::RESOURCE_EXCEEDED, "element ceiling");

        r = run("x = 'ab' * 100000000\n", people, {}, lim);
        expect_status(r, ExecStatus::RESOURCE_EXCEEDED, "string ceiling");
    }

    // Fresh namespace per run
    {
        ExecutionResult r = run("leftover = 1\n", people);
        expect_status(r, ExecStatus::SUCCESS, "define");
        r = run("y = leftover\n", people);
        expect_status(r, ExecStatus::RUNTIME_ERROR, "previous run's names are gone");
    }

    std::cerr << "test_interpreter: ALL PASSED" << std::endl;
    return 0;
}
