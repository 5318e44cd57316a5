// Experiment timing assembled from a controller program run
//
// An Experiment is the visualization-ready view of one radar cycle: per
// subcycle the transmit windows, the receive windows of every channel, the
// other hardware lines, phase shifts and channel frequencies.
//
// Usage:
//   Experiment exp = Experiment::fromElan("manda", options);
//   const Subcycle& sc = exp.subcycle(0);
//   double r = nearestRange(sc.transmits[0], sc.receive[0][0], sc.baud_lengths[0]);

#pragma once

#include "radex/types.hpp"
#include "timeline/frequency_series.hpp"
#include "timeline/phase_shifter.hpp"
#include "timeline/time_interval.hpp"
#include "elan/tcl_interpreter.hpp"

#include <array>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace radex {
namespace tlan {
class TlanInterpreter;
}

namespace experiment {

struct Subcycle {
    timeline::TimeInterval interval;
    timeline::TimeIntervalList transmits;                               // RF
    std::array<timeline::TimeIntervalList, kChannelCount> receive;      // CH1..CH6
    std::map<std::string, timeline::TimeIntervalList> settings;         // Every other line, incl. +/-
    timeline::PhaseEventList phase_shifts;
    std::vector<double> baud_lengths;                                   // One per transmit window
    std::array<std::optional<timeline::FrequencySeries>, kChannelCount> frequencies;

    // Last transmit window that ends before rx begins
    std::optional<size_t> transmitBefore(const timeline::TimeInterval& rx) const;
};

struct ElanOptions {
    Radar radar = Radar::UHF;
    std::string antenna;                        // Empty: same as the radar
    std::vector<std::string> experiment_dirs;   // Searched before /kst/exp and kst/exp
    std::string start = "now";                  // runexperiment start time
    std::vector<std::string> args;              // runexperiment arguments (argv)
    int max_loop_iterations = elan::TclInterpreter::kDefaultMaxLoopIterations;
    std::ostream* script_output = nullptr;      // puts output, nullptr = stdout
};

class Experiment {
public:
    // One Subcycle per closed subcycle of a finished run
    static Experiment fromTlan(const tlan::TlanInterpreter& tlan, const std::string& name = "");

    // Run the console script, find its controller program and NCO files and
    // replay the program with the local oscillators the script selected.
    static Experiment fromElan(const std::string& path, const ElanOptions& options = {});

    const std::string& name() const { return name_; }
    const std::string& tlanPath() const { return tlan_path_; }
    const std::string& elanPath() const { return elan_path_; }

    std::optional<timeline::TimeInterval> cycle() const { return cycle_; }
    std::optional<double> firStart() const { return fir_start_; }

    // LO settings the program was run with [Hz], index = receiver path
    const std::vector<double>& lo1() const { return lo1_; }
    const std::vector<double>& lo2() const { return lo2_; }

    // NCO file loaded per channel, empty when none
    const std::array<std::string, kChannelCount>& ncoFiles() const { return nco_files_; }

    const std::vector<Subcycle>& subcycles() const { return subcycles_; }
    // Throws std::out_of_range
    const Subcycle& subcycle(size_t index) const;

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::string name_;
    std::string tlan_path_;
    std::string elan_path_;
    std::optional<timeline::TimeInterval> cycle_;
    std::optional<double> fir_start_;
    std::vector<double> lo1_;
    std::vector<double> lo2_;
    std::array<std::string, kChannelCount> nco_files_;
    std::vector<Subcycle> subcycles_;
    std::vector<std::string> warnings_;
};

// Nearest range [m] a receive window sees echoes from: v*(rx.begin - tx.end + baud)/2.
// Throws timeline::OverlapError if tx and rx overlap.
double nearestRange(const timeline::TimeInterval& tx, const timeline::TimeInterval& rx,
                    double baud_length, double velocity = c);

// Furthest range [m] from which a whole pulse is received: v*(rx.end - tx.end)/2.
// Throws timeline::OverlapError if tx and rx overlap.
double furthestFullRange(const timeline::TimeInterval& tx, const timeline::TimeInterval& rx,
                         double baud_length, double velocity = c);

} // namespace experiment
} // namespace radex
