// TARLAN program parsing implementation

#include "tlan_parser.hpp"
#include "tlan_error.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace radex {
namespace tlan {

// Helper: split on whitespace
static std::vector<std::string> splitWhitespace(const std::string& s) {
    std::vector<std::string> result;
    std::istringstream iss(s);
    std::string item;
    while (iss >> item) {
        result.push_back(item);
    }
    return result;
}

// Helper: split on delimiter, skipping empty items
static std::vector<std::string> splitList(const std::string& s, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// Helper: microsecond literal to seconds
static double parseTime(const std::string& s, int line_number) {
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        throw TlanError("Invalid time '" + s + "'", line_number);
    }
    return value * us;
}

std::string Command::toString() const {
    std::ostringstream oss;
    oss << line << ": " << (t / us) << " " << mnemonic;
    return oss.str();
}

std::vector<Command> TlanParser::parseLine(const std::string& line, int line_number) {
    std::vector<Command> commands;

    // Filter away comments
    std::string codeline = line.substr(0, line.find('%'));

    std::vector<std::string> args = splitWhitespace(codeline);
    if (args.empty()) {
        return commands;
    }

    if (args[0] == "AT") {
        if (args.size() < 3) {
            throw TlanError("Line starting with 'AT' must include time and command(s)!",
                            line_number);
        }
        double time = parseTime(args[1], line_number);

        for (size_t i = 2; i < args.size(); i++) {
            for (const auto& mnemonic : splitList(args[i], ',')) {
                commands.push_back(Command{time, mnemonic, line_number});
            }
        }
    } else if (args[0] == "SETTCR") {
        if (args.size() < 2) {
            throw TlanError("SETTCR must be followed by a time!", line_number);
        }
        commands.push_back(Command{parseTime(args[1], line_number), "SETTCR", line_number});
    } else {
        throw TlanError("Line must start with 'AT' or 'SETTCR'. Use '%' for comments.",
                        line_number);
    }

    return commands;
}

std::vector<Command> TlanParser::parseProgram(std::istream& in) {
    std::vector<Command> program;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        for (auto& cmd : parseLine(line, line_number)) {
            bool is_rep = cmd.mnemonic == "REP";
            program.push_back(std::move(cmd));
            if (is_rep) {
                // The hardware never gets past REP
                LOG_TLAN(DEBUG, "REP on line %d, %zu commands parsed", line_number,
                         program.size());
                return program;
            }
        }
    }
    return program;
}

std::vector<Command> TlanParser::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open TARLAN file " + path);
    }
    LOG_TLAN(INFO, "Parsing %s", path.c_str());
    return parseProgram(file);
}

} // namespace tlan
} // namespace radex
