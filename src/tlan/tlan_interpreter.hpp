// TARLAN interpreter
//
// Replays a radar controller program and records when every hardware line is
// on, organised into a cycle made of SETTCR-delimited subcycles.
//
// Usage:
//   TlanInterpreter tlan({812e6}, {128e6, 122e6});
//   tlan.setChannelNco(1, nco);
//   tlan.load("manda.tlan");
//   for (size_t i = 0; i < tlan.subcycles().count(); i++) { ... }

#pragma once

#include "tlan_commands.hpp"
#include "tlan_parser.hpp"
#include "subcycle_collector.hpp"
#include "kstconfig/nco.hpp"
#include "timeline/frequency_series.hpp"
#include "timeline/interval_stream.hpp"
#include "timeline/phase_shifter.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace radex {
namespace tlan {

class TlanInterpreter {
public:
    // UHF local oscillators: one LO1 shared by both paths
    TlanInterpreter();

    // LO frequencies [Hz], index = receiver path. A single LO1 is shared by
    // both paths. Throws std::invalid_argument if either list is empty.
    TlanInterpreter(const std::vector<double>& lo1_hz, const std::vector<double>& lo2_hz);

    // Replace the NCO of channel 1..6. Its LOs are set by the next AD routing.
    void setChannelNco(int channel, const kstconfig::Nco& nco);
    void loadChannelNco(int channel, const std::string& path);
    const kstconfig::Nco& channelNco(int channel) const;

    // Parse and run a .tlan file
    void load(const std::string& path);

    // Run a parsed program. The last command must be REP.
    void run(const std::vector<Command>& program);

    // Handle one command: SETTCR, REP or a mnemonic
    void step(const Command& cmd);

    // Execute one mnemonic at TCR + cmd.t. Throws TlanError before the
    // cycle has started. Unknown mnemonics are logged and skipped.
    void execute(const Command& cmd);

    const timeline::IntervalStream& cycle() const { return cycle_; }
    const SubcycleCollector& subcycles() const { return subcycles_; }
    const timeline::IntervalStream& stream(Stream s) const;
    const timeline::PhaseShifter& phaseShifter() const { return phase_; }
    const timeline::FrequencySeries& frequencySeries(int channel) const;

    // Local oscillators [Hz], index = receiver path
    const std::vector<double>& lo1() const { return lo1_; }
    const std::vector<double>& lo2() const { return lo2_; }

    double tcr() const { return tcr_; }
    std::optional<double> firStart() const { return fir_start_; }
    const std::string& fileName() const { return filename_; }

    // Recoverable problems met while running, also logged as warnings
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::vector<double> lo1_;
    std::vector<double> lo2_;

    timeline::IntervalStream cycle_;
    SubcycleCollector subcycles_;
    std::vector<timeline::IntervalStream> streams_;
    timeline::PhaseShifter phase_;
    std::array<timeline::FrequencySeries, 6> freq_rec_;
    std::array<kstconfig::Nco, 6> ncos_;

    double tcr_ = 0.0;
    std::optional<double> fir_start_;
    std::string filename_;
    std::vector<std::string> warnings_;

    void resetStreams();
    timeline::IntervalStream& mutableStream(Stream s);

    void startCycle(int line);
    void closeSubcycle(double time, int line);
    void openSubcycle(double time, int line);
    void setPolarity(Stream on, Stream off, double time, int line);

    void allOff(double time, int line);
    void routeAd(double time, int path, int first_channel);
    void selectNco(double time, int line, int index);

    double lo1ForPath(int path) const;
    double lo2ForPath(int path) const;

    void warn(const std::string& msg, int line);
};

} // namespace tlan
} // namespace radex
