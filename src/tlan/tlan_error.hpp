#pragma once

#include <stdexcept>
#include <string>

namespace radex {
namespace tlan {

// Structural error in a TARLAN program. line == 0 means "no file line",
// e.g. a single command executed directly.
class TlanError : public std::runtime_error {
public:
    TlanError(const std::string& msg, int line = 0)
        : std::runtime_error(format(msg, line)), msg_(msg), line_(line) {}

    int line() const { return line_; }
    const std::string& message() const { return msg_; }

private:
    std::string msg_;
    int line_;

    static std::string format(const std::string& msg, int line) {
        if (line > 0) {
            return "The .tlan file has errors in line " + std::to_string(line) + ": " + msg;
        }
        return "The TARLAN command has errors: " + msg;
    }
};

} // namespace tlan
} // namespace radex
