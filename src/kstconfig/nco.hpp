// Numerically controlled oscillator (NCO) configuration
//
// The NCO on each channel board shifts the incoming signal by a frequency
// taken from a table (.nco file). By the time the signal reaches the channel
// it has already been mixed down twice, by LO1 and LO2, so the sky frequency
// a channel listens to is lo1 + lo2 - f_nco.
//
// .nco file format:
//   NCOPAR_VS       0.1
//   % comment lines
//   NCO   0   10.4   % f12
//   NCO   1   10.1   % f13

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace radex {
namespace kstconfig {

class NcoError : public std::runtime_error {
public:
    enum class Kind {
        BadVersion,     // Missing or wrong NCOPAR_VS line
        MalformedLine,  // Not an "NCO <index> <frequency>" triple
        BadIndex,       // Indices must count 0, 1, 2, ...
        BadFrequency,   // Frequency is not a number
    };

    NcoError(Kind kind, const std::string& msg, int line = 0);

    Kind kind() const { return kind_; }
    int line() const { return line_; }

private:
    Kind kind_;
    int line_;
};

const char* ncoErrorKindToString(NcoError::Kind kind);

class Nco {
public:
    static constexpr const char* kVersionLine = "NCOPAR_VS 0.1";

    Nco() = default;
    Nco(double lo1_hz, double lo2_hz);

    // Parse .nco file contents. Returns the table in MHz, as written in the file.
    static std::vector<double> parse(const std::string& text);
    static std::vector<double> parseFile(const std::string& path);

    void setLo1(double hz) { lo1_ = hz; }
    void setLo2(double hz) { lo2_ = hz; }
    std::optional<double> lo1() const { return lo1_; }
    std::optional<double> lo2() const { return lo2_; }

    // Table in Hz
    void loadTable(const std::vector<double>& table_hz);
    void loadFile(const std::string& path);
    const std::vector<double>& table() const { return table_; }
    bool hasTable() const { return !table_.empty(); }
    const std::string& source() const { return source_; }

    // NCOSEL<index>. Throws std::out_of_range for an index outside the table.
    void select(int index);
    std::optional<int> selected() const { return selected_; }

    // Both LOs set, table loaded and an entry selected
    bool isReady() const;

    // Center frequency lo1 + lo2 - f_nco [Hz]. Throws std::logic_error unless ready.
    double frequency() const;

private:
    std::optional<double> lo1_;
    std::optional<double> lo2_;
    std::vector<double> table_;
    std::optional<int> selected_;
    std::string source_;
};

} // namespace kstconfig
} // namespace radex
