#include "test_common.h"

#include "frameguard/serialization.h"
#include "frameguard/workbench.h"
#include "frameguard/workshop.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

using namespace frameguard;

static double scalar_of(const std::string& expr) {
    Dataset ds;
    std::string err;
    if (!dataset_from_records_json(R"([{"x":2},{"x":4},{"x":4},{"x":4},{"x":5},{"x":5},{"x":7},{"x":9}])", &ds, &err)) {
        die(err);
    }
    Workbench wb(Workshop::initialize(), WorkbenchOptions{});
    ExecutionResult r = wb.evaluate("dataframe['v'] = " + expr + "\n", ds, {}, ExecLimits{});
    if (!r.ok()) die(expr + ": " + r.diagnostics);
    return cell_as_double(r.output_dataset->find("v")->cells[0]);
}

int main() {
    // Built once, shared by every caller
    const Workshop* first = nullptr;
    std::vector<std::thread> ts;
    std::vector<const Workshop*> seen(8, nullptr);
    for (int i = 0; i < 8; i++) {
        ts.emplace_back([&seen, i] { seen[i] = &Workshop::initialize(); });
    }
    for (auto& t : ts) t.join();
    first = seen[0];
    for (auto* p : seen) expect_true(p == first, "initialize() returns one instance");

    const Workshop& ws = Workshop::initialize();
    expect_true(ws.get("pd") != nullptr, "pd preloaded");
    expect_true(ws.get("np") != nullptr, "np preloaded");
    expect_true(ws.get("scipy") != nullptr, "scipy preloaded");
    expect_true(ws.get("os") == nullptr, "os not preloaded");
    expect_true(ws.get("pandas") == nullptr, "registry names are the short bindings");

    std::vector<std::string> names = ws.names();
    expect_eq_ll((long long)names.size(), 3, "three libraries");

    for (const char* b : {"print", "len", "range", "str", "int", "float", "bool", "list", "dict",
                          "tuple", "set", "abs", "max", "min", "sum", "round", "sorted"}) {
        expect_true(ws.builtin(b) != nullptr, std::string("builtin present: ") + b);
    }
    for (const char* b : {"open", "eval", "exec", "getattr", "__import__", "compile", "input"}) {
        expect_true(ws.builtin(b) == nullptr, std::string("builtin absent: ") + b);
    }

    // Library semantics
    expect_true(scalar_of("np.mean(dataframe['x'])") == 5.0, "np.mean");
    expect_true(scalar_of("np.median(dataframe['x'])") == 4.5, "np.median");
    expect_true(scalar_of("np.std(dataframe['x'])") == 2.0, "np.std uses ddof=0");
    expect_true(std::fabs(scalar_of("dataframe['x'].std()") - std::sqrt(32.0 / 7.0)) < 1e-12,
                "Series.std uses ddof=1");
    expect_true(scalar_of("np.sqrt(16)") == 4.0, "np.sqrt");
    expect_true(scalar_of("np.clip(12, 0, 10)") == 10.0, "np.clip upper");
    expect_true(scalar_of("scipy.stats.zscore(dataframe['x'])") == -1.5, "zscore of first row");
    expect_true(scalar_of("scipy.stats.iqr(dataframe['x'])") == 1.5, "iqr");
    expect_true(scalar_of("pd.to_numeric('3.5')") == 3.5, "pd.to_numeric");
    expect_true(scalar_of("round(2.5)") == 2.0, "round half to even");
    expect_true(scalar_of("len(set(dataframe['x']))") == 5.0, "set keeps distinct values");
    expect_true(scalar_of("sorted(set([3, 1, 3, 2]))[0]") == 1.0, "set result is iterable");
    expect_true(scalar_of("len(tuple(range(4)))") == 4.0, "tuple");

    std::cerr << "test_workshop: ALL PASSED" << std::endl;
    return 0;
}
