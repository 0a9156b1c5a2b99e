#include "test_common.h"

#include "frameguard/scanner.h"

#include <string>

using namespace frameguard;

static bool has_rule(const PolicyDecision& d, const std::string& rule) {
    for (const auto& v : d.violations)
        if (v.rule_id == rule) return true;
    return false;
}

static void expect_denied(const std::string& src, const std::string& rule) {
    PolicyDecision d = scan(src);
    expect_true(!d.allowed, "should be denied: " + src);
    expect_true(has_rule(d, rule), "expected rule " + rule + " for: " + src + "\n" + d.summary());
}

static void expect_allowed(const std::string& src) {
    PolicyDecision d = scan(src);
    expect_true(d.allowed, "should be allowed: " + src + "\n" + d.summary());
    expect_true(d.violations.empty(), "allowed decision must carry no violations");
}

int main() {
    // Typical cleaning snippets pass
    expect_allowed("dataframe = dataframe.dropna()\n");
    expect_allowed("dataframe = dataframe.rename(columns={'a': 'b'})\n");
    expect_allowed("dataframe['age'] = dataframe['age'].fillna(dataframe['age'].median())\n");
    expect_allowed("for c in dataframe.columns:\n    if c.startswith('x'):\n        dataframe = dataframe.drop(columns=[c])\n");
    expect_allowed("# import os is just a comment\ndataframe = dataframe.head(5)\n");
    expect_allowed("dataframe = dataframe[dataframe['name'] != 'open']\n");           // English words in data
    expect_allowed("dataframe['note'] = dataframe['note'].str.replace('exit', 'leave')\n");
    expect_allowed("x = 'caf\xc3\xa9'\n");                                            // non-ASCII inside a literal
    expect_allowed("dataframe = dataframe[dataframe['os'] == 'linux']\n");           // column names
    expect_allowed("dataframe['sys'] = dataframe['sys'].fillna(0)\n");

    // Import forms
    expect_denied("import os\n", "import_statement");
    expect_denied("from os import system\n", "import_statement");
    expect_denied("import pandas as pd\n", "import_statement");
    expect_denied("x = 1; import sys\n", "import_statement");

    // Dunder access and obfuscation
    expect_denied("x = dataframe.__class__\n", "dunder_name");
    expect_denied("__import__('os')\n", "dunder_name");
    expect_denied("x = ().__class__.__bases__[0].__subclasses__()\n", "dunder_name");
    expect_denied("x = dataframe['__cla' 'ss__']\n", "dunder_string");
    expect_denied("x = '_' + '_class_' + '_'\n", "dunder_string");

    // Denylisted identifiers, including as attributes
    expect_denied("f = open('/etc/passwd')\n", "denied_identifier");
    expect_denied("eval('1+1')\n", "denied_identifier");
    expect_denied("x = pd.read_csv('/etc/passwd')\n", "denied_identifier");
    expect_denied("dataframe.to_csv('/tmp/out')\n", "denied_identifier");
    expect_denied("x = dataframe.query('a > 1')\n", "denied_identifier");
    expect_denied("g = globals\n", "denied_identifier");
    expect_denied("os.execvp('sh', ['sh'])\n", "denied_identifier");
    expect_denied("x = np.load('data.npy')\n", "denied_identifier");
    expect_denied("t = type(dataframe)\n", "denied_identifier");

    // Denylisted words hidden in strings
    expect_denied("name = 'sub' + 'process'\n", "denied_string");
    expect_denied("name = 'sock' 'et'\n", "denied_string");
    expect_denied("x = 'read_csv'\n", "denied_string");
    expect_denied("x = 'please eval this'\n", "denied_string");

    // Reserved keywords
    expect_denied("f = lambda x: x\n", "reserved_keyword");
    expect_denied("def f():\n    pass\n", "reserved_keyword");
    expect_denied("class A:\n    pass\n", "reserved_keyword");
    expect_denied("try:\n    x = 1\nexcept:\n    pass\n", "reserved_keyword");
    expect_denied("with x:\n    pass\n", "reserved_keyword");
    expect_denied("global x\n", "reserved_keyword");
    expect_denied("del x\n", "reserved_keyword");
    expect_denied("assert x\n", "reserved_keyword");

    // Non-ASCII identifiers (homoglyphs)
    expect_denied("\xd0\xbepen = 1\n", "non_ascii");

    // Syntax errors
    expect_denied("x = (1,\n", "syntax_error");
    expect_denied("x = = 1\n", "syntax_error");
    expect_denied("if x\n    y = 1\n", "syntax_error");
    expect_denied("x = 'unterminated\n", "syntax_error");

    // Size ceiling
    {
        ScanOptions so;
        so.max_source_bytes = 32;
        PolicyDecision d = scan(std::string(64, 'x'), so);
        expect_true(!d.allowed, "oversized source must be denied");
        expect_eq_ll((long long)d.violations.size(), 1, "oversized source reports a single violation");
        expect_true(d.violations[0].rule_id == "source_too_large", "rule should be source_too_large");
    }

    // Every violation is collected, with locations
    {
        PolicyDecision d = scan("import os\nx = open('f')\n");
        expect_true(has_rule(d, "import_statement") && has_rule(d, "denied_identifier"),
                    "all violations should be collected");
        for (const auto& v : d.violations) {
            if (v.rule_id == "denied_identifier") {
                expect_eq_ll(v.line, 2, "open() violation line");
                expect_eq_ll(v.column, 5, "open() violation column");
                expect_true(v.matched_text == "open", "matched text should be the identifier");
            }
        }
        expect_true(d.summary().find("import_statement") != std::string::npos, "summary names the rule");
    }

    // Matched text is clipped
    {
        PolicyDecision d = scan("x = '__" + std::string(300, 'a') + "'\n");
        expect_true(has_rule(d, "dunder_string"), "long dunder string denied");
        expect_true(d.violations[0].matched_text.size() <= 83, "matched text should be clipped");
    }

    // Never throws on hostile input
    {
        std::string deep(5000, '(');
        PolicyDecision d = scan(deep);
        expect_true(!d.allowed, "unbalanced brackets denied");
        std::string binary;
        for (int i = 0; i < 256; i++) binary.push_back((char)i);
        (void)scan(binary);
        (void)scan("");
        (void)scan("\t\t\n  \n\x00", {});
    }

    expect_true(is_denied_identifier("subprocess"), "subprocess is denied");
    expect_true(is_denied_identifier("spawnlp"), "spawn prefix is denied");
    expect_true(!is_denied_identifier("dataframe"), "dataframe is allowed");
    expect_true(!is_denied_string_word("open"), "open is allowed inside strings");
    expect_true(is_denied_string_word("import"), "import is denied inside strings");
    expect_true(!is_denied_string_word("os") && !is_denied_string_word("sys"), "os/sys are plain column names");
    expect_true(is_denied_identifier("os") && is_denied_identifier("sys"), "os/sys still denied as names");
    expect_denied("x = os\n", "denied_identifier");

    std::cerr << "test_scanner: ALL PASSED" << std::endl;
    return 0;
}
