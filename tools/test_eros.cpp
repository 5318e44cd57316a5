// test_eros.cpp - Unit test for the EROS command catalog
//
// Tests:
// 1. Radar queries and script variables
// 2. Local oscillator selection per radar
// 3. Loaded files, BLOCK/callblock/gotoblock
// 4. runexperiment with arguments and the controller program lookup
// 5. Helpers: timestamp, readfrequencyfile, editDistance
//
// Experiment files are written below the system temp directory.

#include "elan/eros.hpp"
#include "elan/tcl_interpreter.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace radex;
using namespace radex::elan;

namespace fs = std::filesystem;

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

static void writeFile(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << text;
}

static const char* kMandaScript =
    "# Test experiment\n"
    "BLOCK setup {} {\n"
    "    loadradar receiver -f /kst/exp/manda/manda-u.rbin -l 1 -s 55800\n"
    "    loadradar transmitter -f manda/manda-u.tbin\n"
    "    loadfrequency -l manda/manda-u.nco 1,2\n"
    "    selectlo p 130\n"
    "}\n"
    "BLOCK main {} {\n"
    "    callblock setup\n"
    "    startdata manda-u.fil manda 5\n"
    "}\n"
    "set mode [argv]\n"
    "set start [getstarttime e]\n"
    "callblock main\n";

int main() {
    std::cout << "=== EROS Unit Test ===\n\n";
    setLogLevel(LogLevel::ERROR);

    fs::path root = fs::temp_directory_path() / "radex_test_eros";
    fs::remove_all(root);
    writeFile(root / "manda" / "manda.elan", kMandaScript);
    writeFile(root / "manda" / "manda-u.rbin", "");
    writeFile(root / "manda" / "manda-u.tlan", "AT 10 REP\n");
    writeFile(root / "manda" / "manda-u.nco", "NCOPAR_VS 0.1\nNCO 0 10.4\nNCO 1 10.1\n");
    writeFile(root / "fuzzy" / "prog-u.tlan", "AT 10 REP\n");
    writeFile(root / "fuzzy" / "zzz.tlan", "AT 10 REP\n");

    // ========================================================================
    // TEST 1: Radar queries
    // ========================================================================
    std::cout << "TEST 1: Radar queries\n";
    {
        TclInterpreter bad;
        check(throws<std::invalid_argument>([&] { Eros eros(bad, Radar::Unknown); }),
              "unknown radar is rejected");

        TclInterpreter tcl;
        Eros eros(tcl, Radar::UHF);
        check(tcl.eval("isradar") == "UHF", "isradar without arguments names the radar");
        check(tcl.eval("isradar VHF UHF") == "1" && tcl.eval("isradar ESR") == "0",
              "isradar with names");
        check(tcl.eval("isuhf") == "1" && tcl.eval("isesr") == "0", "isuhf / isesr");
        check(tcl.eval("set _radar") == "UHF" && tcl.eval("set _ant") == "UHF",
              "radar and antenna variables");
        check(tcl.eval("getstarttime b") == "-1", "devices have no start time yet");
        check(eros.state(TclInterpreter::kGlobalScope).lo2 == std::vector<double>{128, 122},
              "UHF default LO2");
        check(eros.experimentDirs().size() == 2 && eros.experimentDirs()[0] == "/kst/exp",
              "default experiment directories");

        TclInterpreter esr_tcl;
        Eros esr(esr_tcl, Radar::ESR, "32p");
        check(esr_tcl.eval("set x $32p") == "1" && esr_tcl.eval("set x $42p") == "0",
              "antenna variables at ESR");
        check(esr_tcl.eval("isesr") == "1", "isesr at ESR");

        check(Eros::defaultLo1(Radar::KIR) == Eros::defaultLo1(Radar::UHF),
              "KIR uses the UHF local oscillators");
    }

    // ========================================================================
    // TEST 2: Local oscillators
    // ========================================================================
    std::cout << "\nTEST 2: Local oscillators\n";
    {
        TclInterpreter tcl;
        Eros eros(tcl, Radar::UHF);
        tcl.eval("selectlo p 130");
        tcl.eval("selectlo lo1 i 813");
        const DomainState& st = eros.state(TclInterpreter::kGlobalScope);
        check(st.lo2[1] == 130 && st.lo2[0] == 128, "UHF tunes LO2 of the plasma line path");
        check(st.lo1[0] == 813, "LO given explicitly");
        check(eros.session().lo2[1] == 130, "session follows the global scope");
        check(throws<TclError>([&] { tcl.eval("selectlo x 130"); }), "unknown path");
        check(throws<TclError>([&] { tcl.eval("selectlo lo3 p 130"); }), "unknown LO");
        check(throws<TclError>([&] { tcl.eval("selectlo p abc"); }), "bad frequency");

        TclInterpreter vhf_tcl;
        Eros vhf(vhf_tcl, Radar::VHF);
        check(throws<TclError>([&] { vhf_tcl.eval("selectlo I 300"); }),
              "VHF needs the LO to be named");
        vhf_tcl.eval("selectlo lo1 II 299");
        check(vhf.state(TclInterpreter::kGlobalScope).lo1[1] == 299, "VHF path II");

        TclInterpreter esr_tcl;
        Eros esr(esr_tcl, Radar::ESR);
        esr_tcl.eval("selectlo P4 420");
        check(esr.state(TclInterpreter::kGlobalScope).lo1[3] == 420, "ESR P4 tunes LO1 of path 4");
    }

    // ========================================================================
    // TEST 3: Files and blocks
    // ========================================================================
    std::cout << "\nTEST 3: Files and blocks\n";
    {
        TclInterpreter tcl;
        Eros eros(tcl, Radar::UHF);
        tcl.eval("loadfrequency -l manda.nco 1,3");
        const DomainState& st = eros.state(TclInterpreter::kGlobalScope);
        check(st.files.nco[0] == "manda.nco" && st.files.nco[2] == "manda.nco" &&
                  st.files.nco[1].empty(),
              "loadfrequency sets the listed channels");
        tcl.eval("loadfrequency -\xC3\xA9 other.nco 2");
        check(st.files.nco[1] == "other.nco", "non-ASCII option is ignored");
        check(throws<TclError>([&] { tcl.eval("loadfrequency manda.nco 7"); }),
              "channel 7 does not exist");
        check(throws<TclError>([&] { tcl.eval("loadradar q -f x.rbin"); }),
              "unknown controller");

        tcl.eval("BLOCK b {} {\n    loadradar rec -f x.rbin\n    selectlo p 125\n}\ncallblock b");
        check(st.files.rbin == "x.rbin", "callblock keeps the block's files");
        check(st.lo2[1] == 125, "callblock keeps the block's LOs");

        tcl.eval("block g {} {\n    loadfilter f1.fir 1\n    gotoblock next\n"
                 "    loadfilter f2.fir 1\n}\ncallblock g");
        check(st.files.filter == "f1.fir", "gotoblock leaves the block");

        check(tcl.eval("upar 3") == "0", "user parameters read as 0");
        check(tcl.eval("SYNC 100; disp -c hello; stopradar; transferlo") == "",
              "descriptive commands run without effect");
    }

    // ========================================================================
    // TEST 4: runexperiment
    // ========================================================================
    std::cout << "\nTEST 4: runexperiment\n";
    {
        TclInterpreter tcl;
        Eros eros(tcl, Radar::UHF, "", {root.string()});

        auto found = eros.findFile("/kst/exp/manda/manda", ".elan");
        check(found && fs::path(*found) == root / "manda" / "manda.elan",
              "findFile() strips /kst/exp/ and adds the extension");
        check(!eros.findFile("manda/nothing", ".elan"), "findFile() of a missing file");

        eros.runExperiment("manda/manda", "1700000000", {"UP", "3"});
        ScopeId g = TclInterpreter::kGlobalScope;
        check(tcl.getVar(g, "mode").str() == "UP 3", "argv");
        check(tcl.getVar(g, "start").str() == "1700000000", "experiment start time");

        const DomainState& session = eros.session();
        check(session.files.rbin == "/kst/exp/manda/manda-u.rbin", "receiver program");
        check(session.files.tbin == "manda/manda-u.tbin", "transmitter program");
        check(session.files.fil == "manda-u.fil", "correlator file");
        check(session.files.nco[0] == "manda/manda-u.nco" && session.files.nco[1] == "manda/manda-u.nco",
              "NCO files");
        check(session.lo2[1] == 130, "LO selected inside nested blocks");
        check(eros.state(g).files.rbin == session.files.rbin, "global scope sees nested loads");

        check(fs::path(eros.tlanPath()) == root / "manda" / "manda-u.tlan",
              "controller program next to the receiver program");

        check(throws<TclError>([&] { eros.runExperiment("manda/nothing", "now"); }),
              "missing experiment script");

        TclInterpreter fuzzy_tcl;
        Eros fuzzy(fuzzy_tcl, Radar::UHF);
        check(throws<std::runtime_error>([&] { fuzzy.tlanPath(); }), "no receiver program loaded");
        fuzzy_tcl.eval("loadradar rec -f " + (root / "fuzzy" / "prog-v.rbin").string());
        check(fs::path(fuzzy.tlanPath()) == root / "fuzzy" / "prog-u.tlan",
              "closest .tlan name is used");
    }

    // ========================================================================
    // TEST 5: Helpers
    // ========================================================================
    std::cout << "\nTEST 5: Helpers\n";
    {
        TclInterpreter tcl;
        Eros eros(tcl, Radar::UHF, "", {root.string()});
        check(tcl.eval("timestamp 0") == "01-01-1970 00:00:00.0", "timestamp");
        check(tcl.eval("timestamp -nodate -nofrac 3661") == "01:01:01", "timestamp -nodate -nofrac");
        check(tcl.eval("timestamp -noyear -3 86400") == "02-01 00:00:00.000", "timestamp -noyear -3");
        check(tcl.eval("timestamp -1") == "", "negative time gives empty");

        check(tcl.eval("readfrequencyfile manda/manda-u 1") == "10.1", "readfrequencyfile");
        check(tcl.eval("readfrequencyfile manda/nothing 1") == "", "missing frequency file");
        check(throws<TclError>([&] { tcl.eval("readfrequencyfile manda/manda-u 2"); }),
              "address outside the file");

        check(editDistance("kitten", "sitting") == 3, "editDistance(kitten, sitting)");
        check(editDistance("", "abc") == 3 && editDistance("abc", "abc") == 0,
              "editDistance edge cases");
    }

    fs::remove_all(root);

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All EROS tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
