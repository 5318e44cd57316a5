/**
 * radex CLI - radar experiment timing from EISCAT ELAN scripts and TARLAN programs
 *
 * Runs the console script (or the controller program directly) and prints
 * the transmit/receive timing of every subcycle.
 */

#include "config/settings.hpp"
#include "elan/eros.hpp"
#include "elan/tcl_expr.hpp"
#include "elan/tcl_parser.hpp"
#include "experiment/experiment.hpp"
#include "experiment/report.hpp"
#include "kstconfig/nco.hpp"
#include "tlan/tlan_commands.hpp"
#include "tlan/tlan_error.hpp"
#include "tlan/tlan_interpreter.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace radex;

void printUsage(const char* prog) {
    std::cerr << "radex - radar experiment timing for the EISCAT KST radars\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  elan <file> [args...]  Run an ELAN experiment script and replay the\n";
    std::cerr << "                         controller program it loads\n";
    std::cerr << "  tlan <file>            Replay a TARLAN controller program\n";
    std::cerr << "  nco <file>             Show the frequency table of an NCO file\n";
    std::cerr << "  mnemonics              List the known TARLAN mnemonics\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -r <radar>      Radar: UHF, VHF, ESR, KIR, SOD (default: from settings, UHF)\n";
    std::cerr << "  -a <antenna>    Antenna, e.g. 32p or 42p at ESR (default: same as radar)\n";
    std::cerr << "  -s <n>          Show only subcycle n (1-based)\n";
    std::cerr << "  -c <file>       Settings file (default: $RADEX_CONFIG or\n";
    std::cerr << "                  ~/.config/radex/settings.ini)\n";
    std::cerr << "  -v              More log output (repeat for more)\n";
    std::cerr << "  -q              Errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " elan /kst/exp/manda/manda 0\n";
    std::cerr << "  " << prog << " -r VHF -s 2 tlan kst/exp/bella/bella.tlan\n";
}

static int runElan(const std::string& path, const std::vector<std::string>& args,
                   const config::Settings& settings, std::optional<size_t> subcycle) {
    experiment::ElanOptions options;
    options.radar = settings.radar;
    options.antenna = settings.antenna;
    options.experiment_dirs = settings.experiment_dirs;
    options.max_loop_iterations = settings.max_loop_iterations;
    options.args = args;

    experiment::Experiment exp = experiment::Experiment::fromElan(path, options);
    experiment::writeReport(std::cout, exp, subcycle, settings.speed_of_light);
    return 0;
}

static int runTlan(const std::string& path, const config::Settings& settings,
                   std::optional<size_t> subcycle) {
    std::vector<double> lo1;
    std::vector<double> lo2;
    for (double f : elan::Eros::defaultLo1(settings.radar)) lo1.push_back(f * MHz);
    for (double f : elan::Eros::defaultLo2(settings.radar)) lo2.push_back(f * MHz);

    tlan::TlanInterpreter interpreter(lo1, lo2);
    interpreter.load(path);

    experiment::Experiment exp = experiment::Experiment::fromTlan(interpreter);
    experiment::writeReport(std::cout, exp, subcycle, settings.speed_of_light);
    return 0;
}

static int showNco(const std::string& path) {
    std::vector<double> table = kstconfig::Nco::parseFile(path);
    std::cout << path << ": " << table.size() << " frequencies\n";
    for (size_t i = 0; i < table.size(); i++) {
        std::printf("  NCO %4zu  %s MHz\n", i, elan::formatDouble(table[i]).c_str());
    }
    return 0;
}

static int listMnemonics() {
    for (const char* statement : {"SETTCR", "REP"}) {
        std::printf("%-10s %s\n", statement, tlan::controlStatementDoc(statement));
    }
    for (const auto& [name, info] : tlan::mnemonicTable()) {
        // NCOSEL0..1023 and F0..15 would drown the list
        if (name.rfind("NCOSEL", 0) == 0 && name != "NCOSEL0") continue;
        if (name[0] == 'F' && name != "F0" && name.size() <= 3) continue;
        std::printf("%-10s %s\n", name.c_str(), info.doc.c_str());
    }
    return 0;
}

int main(int argc, char* argv[]) {
    const char* command = nullptr;
    const char* input_file = nullptr;
    const char* config_file = nullptr;
    const char* radar = nullptr;
    const char* antenna = nullptr;
    std::optional<size_t> subcycle;
    std::vector<std::string> script_args;
    int verbosity = 0;
    bool quiet = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-r") == 0 && i + 1 < argc) {
            radar = argv[++i];
        } else if (strcmp(argv[i], "-a") == 0 && i + 1 < argc) {
            antenna = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            int n = std::atoi(argv[++i]);
            if (n < 1) {
                std::cerr << "Subcycles are counted from 1\n";
                return 1;
            }
            subcycle = static_cast<size_t>(n - 1);
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0) {
            verbosity++;
        } else if (strcmp(argv[i], "-q") == 0) {
            quiet = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            if (!command) {
                command = argv[i];
            } else if (!input_file) {
                input_file = argv[i];
            } else {
                script_args.push_back(argv[i]);
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    config::Settings settings;
    if (!settings.load(config_file ? config_file : "") && config_file) {
        std::cerr << "Cannot read settings file " << config_file << "\n";
        return 1;
    }
    if (radar) {
        settings.radar = stringToRadar(radar);
        if (settings.radar == Radar::Unknown) {
            std::cerr << "Unknown radar: " << radar << "\n";
            return 1;
        }
    }
    if (antenna) {
        settings.antenna = antenna;
    }

    LogLevel level = settings.log_level;
    for (int i = 0; i < verbosity && level < LogLevel::TRACE; i++) {
        level = static_cast<LogLevel>(static_cast<int>(level) + 1);
    }
    if (quiet) {
        level = LogLevel::ERROR;
    }
    setLogLevel(level);

    FILE* log_file = nullptr;
    if (!settings.log_file.empty()) {
        log_file = std::fopen(settings.log_file.c_str(), "a");
        if (!log_file) {
            std::cerr << "Cannot open log file " << settings.log_file << "\n";
            return 1;
        }
        setLogFile(log_file);
    }

    int rc = 1;
    try {
        if (strcmp(command, "mnemonics") == 0) {
            rc = listMnemonics();
        } else if (!input_file) {
            std::cerr << "Command " << command << " needs a file\n";
            printUsage(argv[0]);
        } else if (strcmp(command, "elan") == 0) {
            rc = runElan(input_file, script_args, settings, subcycle);
        } else if (strcmp(command, "tlan") == 0) {
            rc = runTlan(input_file, settings, subcycle);
        } else if (strcmp(command, "nco") == 0) {
            rc = showNco(input_file);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
        }
    } catch (const tlan::TlanError& e) {
        std::cerr << "TARLAN error: " << e.what() << "\n";
    } catch (const elan::TclError& e) {
        std::cerr << "ELAN error: " << e.what() << "\n";
    } catch (const kstconfig::NcoError& e) {
        std::cerr << "NCO error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }

    if (log_file) {
        setLogFile(nullptr);
        std::fclose(log_file);
    }
    return rc;
}
