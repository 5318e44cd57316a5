// test_tcl_interpreter.cpp - Unit test for the console script interpreter
//
// Tests:
// 1. Variables, substitution and puts
// 2. Control flow: if, for, break/continue, loop bound, return
// 3. Procedures: defaults, args, arity errors, recursion bound, scopes and call log
// 4. Lists and string commands
// 5. Errors and refused constructs
// 6. Domain commands

#include "elan/tcl_interpreter.hpp"
#include "radex/logging.hpp"
#include <iostream>
#include <sstream>
#include <string>

using namespace radex;
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

// Message of the TclError a script raises, or "" if it runs through
static std::string errorOf(TclInterpreter& tcl, const std::string& script) {
    try {
        tcl.eval(script);
    } catch (const TclError& e) {
        return e.message();
    }
    return "";
}

static bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

int main() {
    std::cout << "=== Tcl Interpreter Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    // ========================================================================
    // TEST 1: Variables and substitution
    // ========================================================================
    std::cout << "TEST 1: Variables and substitution\n";
    {
        TclInterpreter tcl;
        std::ostringstream out;
        tcl.setOutput(out);

        check(tcl.eval("set a 5; set b [expr {$a * 2}]") == "10", "command substitution");
        check(tcl.eval("set b") == "10", "set with one argument reads");
        check(tcl.getVar(TclInterpreter::kGlobalScope, "a").str() == "5", "getVar()");

        tcl.eval("puts \"hello $a\"");
        check(out.str() == "hello 5\n", "puts with variable substitution");

        out.str("");
        tcl.eval("puts -nonewline {no $subst}");
        check(out.str() == "no $subst", "braces suppress substitution");

        out.str("");
        tcl.eval("set price 100.00; puts \"$$price\"");
        check(out.str() == "$100.00\n", "lone $ stays literal");

        out.str("");
        tcl.eval("puts [expr 1/3.0]; puts [expr {4**2.0}]; puts [expr {7/2}]");
        check(out.str() == "0.3333333333333333\n16.0\n3\n", "number formatting");

        check(tcl.eval("set t \"a\\tb\"; string length $t") == "3", "backslash escapes");
        check(tcl.eval("set {odd name} 1; set x ${odd name}") == "1", "${name} references");
        check(tcl.eval("subst {a is $a}") == "a is 5", "subst");
        check(tcl.eval("eval set q 7; set q") == "7", "eval");
        check(tcl.eval("info exists a") == "1" && tcl.eval("info exists zz") == "0", "info exists");
        check(tcl.eval("incr counter") == "1" && tcl.eval("incr counter 5") == "6",
              "incr starts unknown variables at 0");
    }

    // ========================================================================
    // TEST 2: Control flow
    // ========================================================================
    std::cout << "\nTEST 2: Control flow\n";
    {
        TclInterpreter tcl;

        const char* classify =
            "if {$x > 5} {\n"
            "    set r big\n"
            "} elseif {$x > 2} then {\n"
            "    set r mid\n"
            "} else {\n"
            "    set r small\n"
            "}\n"
            "set r";
        check(tcl.eval(std::string("set x 9\n") + classify) == "big", "if branch");
        check(tcl.eval(std::string("set x 3\n") + classify) == "mid", "elseif branch");
        check(tcl.eval(std::string("set x 1\n") + classify) == "small", "else branch");
        check(tcl.eval("set r none; if {0} {set r yes}; set r") == "none", "if without else");

        const char* loop =
            "set sum 0\n"
            "for {set i 0} {$i < 10} {incr i} {\n"
            "    if {$i == 3} { continue }\n"
            "    if {$i == 6} { break }\n"
            "    set sum [expr {$sum + $i}]\n"
            "}\n"
            "set sum";
        check(tcl.eval(loop) == "12", "for with continue and break");
        check(tcl.eval("set i") == "6", "loop variable after break");

        tcl.setMaxLoopIterations(5);
        check(tcl.eval("set n 0; for {} {1} {} {incr n}; set n") == "5",
              "endless loop stops at the iteration bound");

        check(tcl.eval("set a 1; return; set a 2") == "" && tcl.eval("set a") == "1",
              "return stops a top-level script");
    }

    // ========================================================================
    // TEST 3: Procedures
    // ========================================================================
    std::cout << "\nTEST 3: Procedures\n";
    {
        TclInterpreter tcl;
        tcl.eval("proc greet {name {greeting Hello} args} { return \"$greeting $name $args\" }");
        check(tcl.hasCommand(TclInterpreter::kGlobalScope, "greet") &&
                  tcl.scope(TclInterpreter::kGlobalScope).procs.count("greet") == 1 &&
                  tcl.scope(TclInterpreter::kGlobalScope).procs.count("") == 0,
              "procedure is registered under its name");
        check(tcl.eval("greet World") == "Hello World ", "default value and empty args");
        check(tcl.eval("greet World Hi a b") == "Hi World a b", "extra arguments go to args");

        tcl.eval("proc two {a b} { return $a }");
        check(contains(errorOf(tcl, "two 1"), "wrong # args"), "missing argument");
        check(contains(errorOf(tcl, "two 1 2 3"), "wrong # args"), "too many arguments");

        tcl.eval("proc noreturn {} { set x 1 }");
        check(tcl.eval("noreturn") == "", "procedure without return gives empty");

        tcl.eval("proc early {} { for {set i 0} {$i < 5} {incr i} { if {$i == 2} { return $i } } }");
        check(tcl.eval("early") == "2", "return from inside a loop");

        tcl.eval("proc countdown {n} {\n"
                 "    if {$n > 0} { return [countdown [expr {$n - 1}]] }\n"
                 "    return done\n"
                 "}");
        check(tcl.eval("countdown 20") == "done", "bounded recursion");

        tcl.setMaxCallDepth(50);
        tcl.eval("proc forever {} { forever }");
        check(contains(errorOf(tcl, "forever"), "too many nested procedure calls"),
              "endless recursion fails at the call depth bound");
        check(tcl.eval("countdown 10") == "done", "calls work again after the depth error");
        check(contains(errorOf(tcl, "countdown 60"), "too many nested procedure calls"),
              "depth bound applies to deep recursion");

        TclInterpreter scoped;
        scoped.eval("set outer 2\nproc f {} {\n    set inner 1\n}\nf");
        auto child = scoped.lastChildScope(TclInterpreter::kGlobalScope);
        check(scoped.scopeCount() == 2 && child.has_value(), "procedure call creates a scope");
        check(child && scoped.hasVar(*child, "outer") && scoped.hasVar(*child, "inner"),
              "procedure sees a copy of the caller's variables");
        check(!scoped.hasVar(TclInterpreter::kGlobalScope, "inner"),
              "procedure variables stay local");
        check(child && scoped.scope(*child).parent == TclInterpreter::kGlobalScope,
              "child scope knows its parent");

        auto sets = scoped.callings(TclInterpreter::kGlobalScope, {"set"});
        check(sets.size() == 2 && sets[1] == std::vector<std::string>{"set", "inner", "1"},
              "call log includes calls inside procedures");
        check(scoped.callings(TclInterpreter::kGlobalScope, {"set"}, false).size() == 1,
              "non-recursive call log");
    }

    // ========================================================================
    // TEST 4: Lists and strings
    // ========================================================================
    std::cout << "\nTEST 4: Lists and strings\n";
    {
        TclInterpreter tcl;
        tcl.eval("set l [list a {b c} d]");
        check(tcl.eval("llength $l") == "3", "list keeps its elements");
        check(tcl.eval("lindex $l 1") == "b c", "lindex");
        check(tcl.eval("lindex $l end") == "d" && tcl.eval("lindex $l end-2") == "a",
              "lindex end-N");
        check(tcl.eval("lindex $l 5") == "", "lindex out of range is empty");
        tcl.eval("lappend l e");
        check(tcl.eval("llength $l") == "4", "lappend");
        check(tcl.eval("append fresh x; llength $fresh") == "1", "append creates the list");

        check(tcl.eval("llength [split \"a,b,,c\" ,]") == "4", "split keeps empty elements");
        check(tcl.eval("string toupper abc") == "ABC", "string toupper");
        check(tcl.eval("string equal -nocase A a") == "1", "string equal -nocase");
        check(tcl.eval("string equal A a") == "0", "string equal");
    }

    // ========================================================================
    // TEST 5: Errors
    // ========================================================================
    std::cout << "\nTEST 5: Errors\n";
    {
        TclInterpreter tcl;
        check(contains(errorOf(tcl, "nosuch 1"), "Command 'nosuch' is not known"),
              "unknown command");
        check(contains(errorOf(tcl, "puts $nope"), "Variable 'nope' is not known"),
              "unknown variable");
        check(contains(errorOf(tcl, "puts \"\\x41\""), "escape sequence"),
              "unsupported escape");
        check(contains(errorOf(tcl, "puts {x} # comment"), "comment"),
              "comment after a command");
        check(contains(errorOf(tcl, "expr {\"__import__\"}"), "forbidden"),
              "forbidden word in expression");
        check(contains(errorOf(tcl, "set v exec; expr {$v}"), "forbidden"),
              "forbidden word in a substituted value");
        check(contains(errorOf(tcl, "expr {1 / 0}"), "divide by zero"), "division by zero");

        bool located = false;
        try {
            tcl.eval("set a 1\n  nosuch", "script.elan");
        } catch (const TclError& e) {
            located = e.filename() == "script.elan" && e.line() == 2 && e.char1() == 3;
        }
        check(located, "error names file, line and column");

        check(errorOf(tcl, "exec date") == "" && tcl.eval("exec ls") == "",
              "exec is refused without running anything");
        check(tcl.eval("source /nonexistent/radex.elan") == "", "missing source file is skipped");
        check(tcl.eval("break") == "", "break outside a loop only warns");
        check(tcl.eval("global a b") == "", "global is accepted");
    }

    // ========================================================================
    // TEST 6: Domain commands
    // ========================================================================
    std::cout << "\nTEST 6: Domain commands\n";
    {
        TclInterpreter tcl;
        std::vector<std::string> seen;
        tcl.registerCommand("radar", [&](ScopeId, const std::vector<std::string>& args)
                                         -> std::optional<std::string> {
            seen = args;
            return args.empty() ? std::nullopt : std::optional<std::string>(args[0]);
        });
        tcl.registerCommand("broken", [](ScopeId, const std::vector<std::string>&)
                                          -> std::optional<std::string> {
            throw std::out_of_range("no such path");
        });

        check(tcl.hasCommand(TclInterpreter::kGlobalScope, "radar"), "hasCommand()");
        check(tcl.eval("set r uhf; radar $r 1") == "uhf", "domain command gets substituted words");
        check(seen == std::vector<std::string>{"uhf", "1"}, "argument words");
        check(tcl.eval("radar") == "", "no result gives empty");
        check(errorOf(tcl, "broken") == "broken: no such path", "handler errors become TclError");

        auto calls = tcl.callings(TclInterpreter::kGlobalScope, {"radar"});
        check(calls.size() == 2 && calls[0][1] == "uhf", "domain calls are logged");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All Tcl interpreter tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
