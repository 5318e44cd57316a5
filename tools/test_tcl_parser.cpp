// test_tcl_parser.cpp - Unit test for the console script tokenizer and expr
//
// Tests:
// 1. Commands and words: quoting, braces, brackets, comments, positions
// 2. Syntax errors with their locations
// 3. Tcl lists
// 4. Expressions: precedence, integer/double arithmetic, integer limits,
//    number formatting

#include "elan/tcl_expr.hpp"
#include "elan/tcl_parser.hpp"
#include <iostream>
#include <map>
#include <string>

using namespace radex::elan;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

template <typename E, typename F>
static bool throws(F f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

static std::map<std::string, std::string> g_vars = {{"x", "10"}, {"half", "0.5"}};

static std::string expr(const std::string& e) {
    ExprCallbacks cb;
    cb.variable = [](const std::string& name) { return g_vars.at(name); };
    cb.command = [](const std::string& script) { return script == "answer" ? "41" : ""; };
    TclExpr ex(cb);
    return ex.evaluate(e).toString();
}

static void checkExpr(const std::string& e, const std::string& expected) {
    std::string got;
    try {
        got = expr(e);
    } catch (const std::exception& ex) {
        got = std::string("exception: ") + ex.what();
    }
    check(got == expected, "expr {" + e + "} == " + expected + (got == expected ? "" : ", got " + got));
}

int main() {
    std::cout << "=== Tcl Parser / Expr Unit Test ===\n\n";

    // ========================================================================
    // TEST 1: Words
    // ========================================================================
    std::cout << "TEST 1: Commands and words\n";
    {
        auto cmds = TclParser::parse("set a 1\nputs $a");
        check(cmds.size() == 2, "two commands");
        check(cmds[0].words.size() == 3 && cmds[0].words[2].text == "1", "set a 1");
        check(cmds[1].line == 2 && cmds[1].words[1].text == "$a", "second command on line 2");

        cmds = TclParser::parse("set a {b [c] $d}");
        check(cmds[0].words[2].env == WordEnv::Braced && cmds[0].words[2].text == "b [c] $d",
              "braced word is kept literally");
        check(cmds[0].words[2].toString() == "{b [c] $d}", "braced word toString()");

        cmds = TclParser::parse("set a \"x [list y z]\"");
        check(cmds[0].words[2].env == WordEnv::Quoted && cmds[0].words[2].text == "x [list y z]",
              "quoted word");

        cmds = TclParser::parse("set a [expr {1 + 2}]");
        check(cmds[0].words[2].env == WordEnv::Bracketed &&
                  cmds[0].words[2].text == "expr {1 + 2}",
              "bracketed word");

        cmds = TclParser::parse("set a x[y]z");
        check(cmds[0].words[2].env == WordEnv::Bare && cmds[0].words[2].text == "x[y]z",
              "bracket inside bare word");
        cmds = TclParser::parse("set a [b][c]");
        check(cmds[0].words[2].env == WordEnv::Bare, "two bracket groups make a bare word");

        cmds = TclParser::parse("puts ${a b}");
        check(cmds[0].words.size() == 2 && cmds[0].words[1].text == "${a b}",
              "braced variable name is one word");

        cmds = TclParser::parse("# comment\nset a 1; set b 2\n\n  # indented comment\n");
        check(cmds.size() == 2 && cmds[1].words[1].text == "b", "comments and ';'");

        cmds = TclParser::parse("set a \\\n    1");
        check(cmds.size() == 1 && cmds[0].words.size() == 3, "backslash-newline joins lines");

        cmds = TclParser::parse("set abc 1", "f.elan", 10);
        const TclCommand& c = cmds[0];
        check(c.filename == "f.elan" && c.line == 10, "file name and first line");
        check(c.words[1].start == 5 && c.words[1].end() == 8, "word columns");
        check(c.char1 == 1 && c.char2 == 10, "command columns");
        check(c.toString() == "set abc 1", "command toString()");

        cmds = TclParser::parse("proc p {} {\n  set a 1\n}\nset b 2");
        check(cmds.size() == 2 && cmds[1].line == 4, "braced body spans lines");
    }

    // ========================================================================
    // TEST 2: Errors
    // ========================================================================
    std::cout << "\nTEST 2: Syntax errors\n";
    {
        check(throws<TclError>([] { TclParser::parse("set a {b"); }), "missing close-brace");
        check(throws<TclError>([] { TclParser::parse("set a \"b"); }), "missing close-quote");
        check(throws<TclError>([] { TclParser::parse("set a [b"); }), "missing close-bracket");
        check(throws<TclError>([] { TclParser::parse("set a {b}c"); }),
              "characters after close-brace");

        bool located = false;
        try {
            TclParser::parse("set a 1\nputs {x} # comment", "s.elan");
        } catch (const TclError& e) {
            located = e.filename() == "s.elan" && e.line() == 2 && e.char1() == 10;
        }
        check(located, "comment after a command is an error at its position");

        TclError e("oops", "f.elan", 3, 5, 9);
        check(std::string(e.what()) == "f.elan, line 3, chars 5-9: oops", "error text with range");
        check(std::string(TclError("oops").what()) == "console: oops", "error text without position");
    }

    // ========================================================================
    // TEST 3: Lists
    // ========================================================================
    std::cout << "\nTEST 3: Lists\n";
    {
        auto l = TclParser::splitList("a {b c} d");
        check(l.size() == 3 && l[1] == "b c", "split a {b c} d");
        l = TclParser::splitList("  {} \"x y\"  {a {b}} ");
        check(l.size() == 3 && l[0].empty() && l[1] == "x y" && l[2] == "a {b}",
              "empty, quoted and nested elements");
        check(TclParser::splitList("").empty(), "empty list");
        check(throws<std::invalid_argument>([] { TclParser::splitList("a {b"); }),
              "unmatched brace");
        check(TclParser::formatList({"a", "b c", ""}) == "a {b c} {}", "format list");
        check(TclParser::formatList({"a}"}) == "a\\}", "unbalanced brace is escaped");
    }

    // ========================================================================
    // TEST 4: Expressions
    // ========================================================================
    std::cout << "\nTEST 4: Expressions\n";
    {
        checkExpr("1 + 2 * 3", "7");
        checkExpr("(1 + 2) * 3", "9");
        checkExpr("7 / 2", "3");
        checkExpr("-7 / 2", "-4");
        checkExpr("7 % -3", "-2");
        checkExpr("2**10", "1024");
        checkExpr("4**2.0", "16.0");
        checkExpr("1/3.0", "0.3333333333333333");
        checkExpr("0.1 + 0.2", "0.30000000000000004");
        checkExpr("1e16 * 1.0", "1e+16");
        checkExpr("010 + 1", "11");
        checkExpr("0x10", "16");
        checkExpr("$x * $half", "5.0");
        checkExpr("$x > 5 ? \"big\" : \"small\"", "big");
        checkExpr("[answer] + 1", "42");
        checkExpr("\"abc\" eq {abc}", "1");
        checkExpr("1 < 2 && 2 < 1", "0");
        checkExpr("true || 0", "1");
        checkExpr("abs(-3)", "3");
        checkExpr("max(1, 2.5)", "2.5");
        checkExpr("int(3.7)", "3");
        checkExpr("sqrt(16)", "4.0");
        checkExpr("1 << 4 | 1", "17");

        check(throws<std::invalid_argument>([] { expr("1 / 0"); }), "divide by zero");
        check(throws<std::invalid_argument>([] { expr("1 +"); }), "missing operand");
        check(throws<std::invalid_argument>([] { expr("foo + 1"); }), "bareword");
        check(throws<std::invalid_argument>([] { expr("\"a\" + 1"); }), "non-numeric operand");
        check(throws<std::invalid_argument>([] { expr("nosuch(1)"); }), "unknown function");

        // 64-bit integer limits
        checkExpr("9223372036854775806 + 1", "9223372036854775807");
        checkExpr("2 ** 62", "4611686018427387904");
        checkExpr("(-2) ** 63", "-9223372036854775808");
        checkExpr("1 << 62", "4611686018427387904");
        checkExpr("-8 >> 70", "-1");
        checkExpr("(-9223372036854775807 - 1) % -1", "0");
        check(throws<std::invalid_argument>([] { expr("9223372036854775807 + 1"); }),
              "overflow in +");
        check(throws<std::invalid_argument>([] { expr("-9223372036854775807 - 2"); }),
              "overflow in -");
        check(throws<std::invalid_argument>([] { expr("4294967296 * 4294967296"); }),
              "overflow in *");
        check(throws<std::invalid_argument>([] { expr("(-9223372036854775807 - 1) / -1"); }),
              "smallest integer divided by -1");
        check(throws<std::invalid_argument>([] { expr("-(-9223372036854775807 - 1)"); }),
              "negating the smallest integer");
        check(throws<std::invalid_argument>([] { expr("3 ** 50"); }), "overflow in **");
        check(throws<std::invalid_argument>([] { expr("1 << 64"); }), "shift by 64");
        check(throws<std::invalid_argument>([] { expr("1 << 63"); }), "shift into the sign bit");
        check(throws<std::invalid_argument>([] { expr("1 << -1"); }), "negative shift count");
        check(throws<std::invalid_argument>([] { expr("int(1e30)"); }), "int() of a huge double");

        check(formatDouble(-0.5) == "-0.5", "formatDouble(-0.5)");
        check(formatDouble(1e-5) == "1e-05", "formatDouble(1e-5)");
        check(formatDouble(123456.0) == "123456.0", "formatDouble(123456)");

        bool b = false;
        check(parseBoolean("Yes", b) && b, "parseBoolean(Yes)");
        check(!parseBoolean("maybe", b), "parseBoolean(maybe)");
        check(!parseBoolean("\xC3\xA9t\xC3\xA9", b), "parseBoolean() of non-ASCII text");
        check(throws<std::invalid_argument>([] { ExprValue::parse("abc").truthy(); }),
              "non-boolean string as condition");
        check(ExprValue::parse("2.5").type() == ExprValue::Type::Double, "2.5 is a double");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All Tcl parser tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
