#include "nco.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace radex {
namespace kstconfig {

static std::string formatError(const std::string& msg, int line) {
    if (line > 0) {
        return "NCO file error in line " + std::to_string(line) + ": " + msg;
    }
    return "NCO file error: " + msg;
}

NcoError::NcoError(Kind kind, const std::string& msg, int line)
    : std::runtime_error(formatError(msg, line)), kind_(kind), line_(line) {}

const char* ncoErrorKindToString(NcoError::Kind kind) {
    switch (kind) {
        case NcoError::Kind::BadVersion:    return "BadVersion";
        case NcoError::Kind::MalformedLine: return "MalformedLine";
        case NcoError::Kind::BadIndex:      return "BadIndex";
        case NcoError::Kind::BadFrequency:  return "BadFrequency";
        default: return "Unknown";
    }
}

Nco::Nco(double lo1_hz, double lo2_hz)
    : lo1_(lo1_hz), lo2_(lo2_hz) {}

std::vector<double> Nco::parse(const std::string& text) {
    std::vector<double> freqs;
    bool have_version = false;

    std::istringstream in(text);
    std::string raw;
    int line_number = 0;
    while (std::getline(in, raw)) {
        line_number++;
        std::string code = raw.substr(0, raw.find('%'));

        std::istringstream tokens(code);
        std::vector<std::string> args;
        std::string tok;
        while (tokens >> tok) {
            args.push_back(tok);
        }
        if (args.empty()) {
            continue;
        }

        if (!have_version) {
            if (args.size() != 2 || args[0] + " " + args[1] != kVersionLine) {
                throw NcoError(NcoError::Kind::BadVersion,
                               std::string("First line must be '") + kVersionLine + "'",
                               line_number);
            }
            have_version = true;
            continue;
        }

        if (args.size() != 3 || args[0] != "NCO") {
            throw NcoError(NcoError::Kind::MalformedLine,
                           "Expected 'NCO <index> <frequency>', got '" + code + "'",
                           line_number);
        }

        char* end = nullptr;
        long index = std::strtol(args[1].c_str(), &end, 10);
        if (*end != '\0' || index != static_cast<long>(freqs.size())) {
            throw NcoError(NcoError::Kind::BadIndex,
                           "Expected index " + std::to_string(freqs.size()) + ", got " + args[1],
                           line_number);
        }

        errno = 0;
        double f = std::strtod(args[2].c_str(), &end);
        if (end == args[2].c_str() || *end != '\0' || errno == ERANGE) {
            throw NcoError(NcoError::Kind::BadFrequency,
                           "Invalid frequency '" + args[2] + "'", line_number);
        }
        freqs.push_back(f);
    }

    if (!have_version) {
        throw NcoError(NcoError::Kind::BadVersion,
                       std::string("Missing '") + kVersionLine + "' line");
    }
    return freqs;
}

std::vector<double> Nco::parseFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open NCO file " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

void Nco::loadTable(const std::vector<double>& table_hz) {
    table_ = table_hz;
    if (selected_ && *selected_ >= static_cast<int>(table_.size())) {
        selected_.reset();
    }
}

void Nco::loadFile(const std::string& path) {
    std::vector<double> mhz = parseFile(path);
    std::vector<double> hz;
    hz.reserve(mhz.size());
    for (double f : mhz) {
        hz.push_back(f * MHz);
    }
    loadTable(hz);
    source_ = path;
    LOG_TLAN(DEBUG, "Loaded %zu NCO frequencies from %s", hz.size(), path.c_str());
}

void Nco::select(int index) {
    if (index < 0 || index >= static_cast<int>(table_.size())) {
        throw std::out_of_range("NCO entry " + std::to_string(index) + " is not in the table (" +
                                std::to_string(table_.size()) + " entries)");
    }
    selected_ = index;
}

bool Nco::isReady() const {
    return lo1_.has_value() && lo2_.has_value() && selected_.has_value() &&
           *selected_ < static_cast<int>(table_.size());
}

double Nco::frequency() const {
    if (!isReady()) {
        throw std::logic_error("NCO frequency requested before LOs, table and selection are set");
    }
    return *lo1_ + *lo2_ - table_[static_cast<size_t>(*selected_)];
}

} // namespace kstconfig
} // namespace radex
