// test_tlan_interpreter.cpp - Unit test for the TARLAN parser and interpreter
//
// Tests:
// 1. Line parsing: AT/SETTCR statements, comma lists, comments, bad lines
// 2. Two subcycle program: subcycle boundaries, RF windows, phase polarity
// 3. Structural errors: open streams, missing REP, commands after REP
// 4. Warnings for unknown mnemonics and misplaced SETTCR 0
// 5. Channel frequencies from AD routing and NCO selection

#include "kstconfig/nco.hpp"
#include "tlan/tlan_error.hpp"
#include "tlan/tlan_interpreter.hpp"
#include "tlan/tlan_parser.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

using namespace radex;
using namespace radex::tlan;

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

static bool near(double a, double b, double tol = 1e-12) {
    return std::fabs(a - b) < tol;
}

static std::vector<Command> program(const std::string& text) {
    std::istringstream in(text);
    return TlanParser::parseProgram(in);
}

static const char* kTwoSubcycles =
    "% two identical subcycles\n"
    "SETTCR 0\n"
    "AT 10 PHA0\n"
    "AT 40 RFON\n"
    "AT 100 PHA180\n"
    "AT 220 RFOFF\n"
    "AT 300 CH1\n"
    "AT 1500 ALLOFF\n"
    "SETTCR 1505\n"
    "AT 40 RFON\n"
    "AT 220 RFOFF\n"
    "AT 300 CH1\n"
    "AT 1500 ALLOFF\n"
    "AT 3010 REP\n"
    "AT 3020 RFON\n";

int main() {
    std::cout << "=== TARLAN Interpreter Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    // ========================================================================
    // TEST 1: Parsing
    // ========================================================================
    std::cout << "TEST 1: Parsing\n";
    {
        auto cmds = TlanParser::parseLine("AT 0 RFON");
        check(cmds.size() == 1 && cmds[0].t == 0.0 && cmds[0].mnemonic == "RFON",
              "AT 0 RFON");

        cmds = TlanParser::parseLine("AT 10 RFON,CH1 PHA0   % comment", 4);
        check(cmds.size() == 3 && cmds[1].mnemonic == "CH1" && cmds[2].mnemonic == "PHA0",
              "comma separated and blank separated mnemonics");
        check(near(cmds[0].t, 10 * us) && cmds[2].line == 4, "time in us and line number");

        cmds = TlanParser::parseLine("SETTCR 1505");
        check(cmds.size() == 1 && cmds[0].mnemonic == "SETTCR" && near(cmds[0].t, 1505 * us),
              "SETTCR 1505");

        check(TlanParser::parseLine("% only a comment").empty(), "comment line");
        check(TlanParser::parseLine("   ").empty(), "blank line");

        check(throws<TlanError>([] { TlanParser::parseLine("1 AT RFON"); }),
              "'1 AT RFON' is rejected");
        check(throws<TlanError>([] { TlanParser::parseLine("RFON at 3"); }),
              "'RFON at 3' is rejected");
        check(throws<TlanError>([] { TlanParser::parseLine("AT 10"); }),
              "AT without a mnemonic is rejected");
        check(throws<TlanError>([] { TlanParser::parseLine("AT 1x RFON"); }),
              "bad time is rejected");
        check(throws<TlanError>([] { TlanParser::parseLine("SETTCR"); }),
              "SETTCR without a time is rejected");

        bool line_ok = false;
        try {
            TlanParser::parseLine("RFON", 12);
        } catch (const TlanError& e) {
            line_ok = e.line() == 12 &&
                      std::string(e.what()).find("line 12") != std::string::npos;
        }
        check(line_ok, "error carries the line number");

        auto prog = program(kTwoSubcycles);
        check(prog.size() == 13 && prog.back().mnemonic == "REP", "parsing stops after REP");
        check(prog[0].line == 2 && prog.back().line == 14, "program keeps file lines");
    }

    // ========================================================================
    // TEST 2: Two subcycles
    // ========================================================================
    std::cout << "\nTEST 2: Two subcycles\n";
    {
        TlanInterpreter tlan;
        tlan.run(program(kTwoSubcycles));

        check(tlan.warnings().empty(), "no warnings");
        check(tlan.cycle().isOff() && tlan.cycle().count() == 1, "cycle closed");
        auto cycle = tlan.cycle().intervals()[0];
        check(near(cycle.begin(), 0) && near(cycle.end(), 3010 * us), "cycle is 0 - 3010 us");

        const SubcycleCollector& sc = tlan.subcycles();
        check(sc.count() == 2, "two subcycles");
        check(near(sc.interval(0).begin(), 0) && near(sc.interval(0).end(), 1505 * us),
              "subcycle 1 is 0 - 1505 us");
        check(near(sc.interval(1).begin(), 1505 * us) && near(sc.interval(1).end(), 3010 * us),
              "subcycle 2 is 1505 - 3010 us");
        check(throws<std::out_of_range>([&] { sc.interval(2); }), "no third subcycle");

        const auto& rf1 = sc.snapshot(0).at("RF");
        const auto& rf2 = sc.snapshot(1).at("RF");
        check(rf1.size() == 1 && near(rf1[0].begin(), 40 * us) && near(rf1[0].length(), 180 * us),
              "subcycle 1 transmits 40 - 220 us");
        check(rf2.size() == 1 && near(rf2[0].begin(), (40 + 1505) * us) &&
                  near(rf2[0].length(), 180 * us),
              "subcycle 2 transmits 1545 - 1725 us");

        const auto& ch1 = sc.snapshot(1).at("CH1");
        check(ch1.size() == 1 && near(ch1[0].begin(), 1805 * us) && near(ch1[0].end(), 3005 * us),
              "ALLOFF closes CH1");
        check(sc.snapshot(0).at("CH2").empty(), "unused channel has no windows");

        // Polarity: + from 10 us, - from 100 us and carried into subcycle 2
        const auto& plus = sc.snapshot(0).at("+");
        const auto& minus0 = sc.snapshot(0).at("-");
        const auto& minus1 = sc.snapshot(1).at("-");
        check(plus.size() == 1 && near(plus[0].begin(), 10 * us) && near(plus[0].end(), 100 * us),
              "+ polarity 10 - 100 us");
        check(minus0.size() == 1 && near(minus0[0].end(), 1505 * us),
              "- polarity closed with subcycle 1");
        check(minus1.size() == 1 && near(minus1[0].begin(), 1505 * us) &&
                  near(minus1[0].end(), 3010 * us),
              "- polarity carried into subcycle 2");

        check(tlan.phaseShifter().phaseShifts().size() == 2, "two phase shifts recorded");
        check(!tlan.firStart(), "no STFIR");
    }

    // ========================================================================
    // TEST 3: Structural errors
    // ========================================================================
    std::cout << "\nTEST 3: Structural errors\n";
    {
        bool named = false;
        try {
            TlanInterpreter tlan;
            tlan.run(program("AT 0 CH1\nAT 100 REP\n"));
        } catch (const TlanError& e) {
            named = e.line() == 2 && e.message().find("CH1") != std::string::npos;
        }
        check(named, "open channel at REP names CH1 and the REP line");

        check(throws<TlanError>([] {
                  TlanInterpreter tlan;
                  tlan.run(program("AT 10 RFON\nAT 20 RFOFF\n"));
              }),
              "program without REP");

        check(throws<TlanError>([] {
                  TlanInterpreter tlan;
                  tlan.run({});
              }),
              "empty program");

        check(throws<TlanError>([] {
                  TlanInterpreter tlan;
                  tlan.run({Command{10 * us, "REP", 1}, Command{20 * us, "RFON", 2}});
              }),
              "command after REP");

        check(throws<TlanError>([] {
                  TlanInterpreter tlan;
                  tlan.run(program("AT 10 RFON\nAT 20 RFON\nAT 30 REP\n"));
              }),
              "RF turned on twice");

        check(throws<TlanError>([] {
                  TlanInterpreter tlan;
                  tlan.run(program("AT 10 RFOFF\nAT 30 REP\n"));
              }),
              "RF turned off while off");

        check(throws<std::invalid_argument>([] { TlanInterpreter tlan({}, {128 * MHz}); }),
              "LO lists must not be empty");
    }

    // ========================================================================
    // TEST 4: Warnings
    // ========================================================================
    std::cout << "\nTEST 4: Warnings\n";
    {
        TlanInterpreter tlan;
        tlan.run(program("AT 10 FOOBAR\nAT 20 STFIR\nAT 30 STFIR\nAT 40 REP\n"));
        check(tlan.warnings().size() == 2, "two warnings");
        check(tlan.warnings()[0].find("FOOBAR") != std::string::npos &&
                  tlan.warnings()[0].find("line 1") != std::string::npos,
              "unknown mnemonic is skipped with a warning");
        check(tlan.firStart() && near(*tlan.firStart(), 20 * us), "first STFIR is kept");

        TlanInterpreter reset;
        reset.run(program("SETTCR 0\nAT 10 RFON\nAT 20 RFOFF\nSETTCR 0\n"
                          "AT 30 RFON\nAT 40 RFOFF\nSETTCR 0\nAT 100 REP\n"));
        check(reset.warnings().size() == 1, "SETTCR 0 mid-subcycle warns, before REP does not");
        check(reset.subcycles().count() == 1, "SETTCR 0 does not start a subcycle");
        check(reset.subcycles().snapshot(0).at("RF").size() == 2, "both pulses recorded");
    }

    // ========================================================================
    // TEST 5: Channel frequencies
    // ========================================================================
    std::cout << "\nTEST 5: Channel frequencies\n";
    {
        TlanInterpreter tlan({812 * MHz}, {128 * MHz, 122 * MHz});
        kstconfig::Nco nco;
        nco.loadTable({10.4 * MHz, 10.1 * MHz});
        tlan.setChannelNco(1, nco);

        tlan.run(program("AT 0 AD1L\nAT 5 NCOSEL1\nAT 10 CH1\nAT 100 CH1OFF\n"
                         "AT 200 AD2L\nAT 300 REP\n"));

        const auto& entries = tlan.frequencySeries(1).entries();
        check(entries.size() == 2, "two frequency changes on CH1");
        auto first = entries.begin();
        check(first != entries.end() && near(first->first, 5 * us) &&
                  near(first->second, 929.9 * MHz, 1e-3),
              "NCOSEL1 on path 1: 812 + 128 - 10.1 MHz");
        auto second = std::next(first);
        check(second != entries.end() && near(second->first, 200 * us) &&
                  near(second->second, 923.9 * MHz, 1e-3),
              "AD2L switches CH1 to the second LO2");
        check(tlan.frequencySeries(2).empty(), "channel without NCO table has no frequencies");

        check(throws<TlanError>([&] {
                  TlanInterpreter bad;
                  bad.setChannelNco(1, nco);
                  bad.run(program("AT 0 NCOSEL5\nAT 10 REP\n"));
              }),
              "NCOSEL outside the table");

        check(throws<std::out_of_range>([&] { tlan.setChannelNco(7, nco); }),
              "no channel board 7");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All TARLAN interpreter tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
