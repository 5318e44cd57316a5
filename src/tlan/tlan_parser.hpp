// TARLAN program parsing
//
// A TARLAN program has one statement per line:
//   AT <time> <mnemonic>[,<mnemonic>...] [<mnemonic>...]   % comment
//   SETTCR <time>
// Times are given in microseconds.

#pragma once

#include <istream>
#include <string>
#include <vector>

namespace radex {
namespace tlan {

// One mnemonic executed at subcycle time t [s]
struct Command {
    double t = 0.0;
    std::string mnemonic;
    int line = 0;           // Line in .tlan file, used for error messages

    // Sorting only looks at the time
    bool operator<(const Command& other) const { return t < other.t; }

    std::string toString() const;
};

class TlanParser {
public:
    // Parse a single line. Blank and comment-only lines give no commands.
    // Throws TlanError for anything that is not an AT or SETTCR statement.
    static std::vector<Command> parseLine(const std::string& line, int line_number = 0);

    // Parse a whole program in file order, stopping after the first REP.
    static std::vector<Command> parseProgram(std::istream& in);

    // Throws std::runtime_error if the file cannot be opened
    static std::vector<Command> parseFile(const std::string& path);
};

} // namespace tlan
} // namespace radex
