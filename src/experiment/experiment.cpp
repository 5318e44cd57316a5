#include "experiment.hpp"
#include "elan/eros.hpp"
#include "tlan/tlan_interpreter.hpp"
#include "radex/logging.hpp"

#include <filesystem>
#include <stdexcept>

namespace radex {
namespace experiment {

std::optional<size_t> Subcycle::transmitBefore(const timeline::TimeInterval& rx) const {
    std::optional<size_t> found;
    for (size_t i = 0; i < transmits.size(); i++) {
        if (transmits[i].end() <= rx.begin()) {
            found = i;
        }
    }
    return found;
}

// Channel index of "CH1".."CH6", or -1
static int channelIndex(const std::string& stream) {
    if (stream.size() != 3 || stream.compare(0, 2, "CH") != 0) {
        return -1;
    }
    int ch = stream[2] - '0';
    if (ch < kFirstChannel || ch > kLastChannel) {
        return -1;
    }
    return ch - kFirstChannel;
}

// Frequencies in effect during the interval, or nothing if none was set
static std::optional<timeline::FrequencySeries> frequenciesWithin(
    const timeline::FrequencySeries& series, const timeline::TimeInterval& interval) {
    if (series.empty()) {
        return std::nullopt;
    }
    if (series.entries().begin()->first <= interval.begin()) {
        return series.shiftsWithin(interval);
    }

    // First frequency is selected inside or after the interval
    timeline::FrequencySeries result;
    for (const auto& [t, f] : series.entries()) {
        if (t >= interval.end()) break;
        result.set(t, f);
    }
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

Experiment Experiment::fromTlan(const tlan::TlanInterpreter& tlan, const std::string& name) {
    Experiment exp;
    exp.tlan_path_ = tlan.fileName();
    exp.name_ = name.empty() ? std::filesystem::path(tlan.fileName()).stem().string() : name;
    exp.fir_start_ = tlan.firStart();
    exp.lo1_ = tlan.lo1();
    exp.lo2_ = tlan.lo2();
    exp.warnings_ = tlan.warnings();
    for (int ch = kFirstChannel; ch <= kLastChannel; ch++) {
        exp.nco_files_[ch - kFirstChannel] = tlan.channelNco(ch).source();
    }

    if (tlan.cycle().isOff() && !tlan.cycle().empty()) {
        exp.cycle_ = tlan.cycle().intervals().front();
    }

    const tlan::SubcycleCollector& collected = tlan.subcycles();
    const timeline::PhaseShifter& phase = tlan.phaseShifter();

    for (size_t i = 0; i < collected.count(); i++) {
        Subcycle sc;
        sc.interval = collected.interval(i);

        for (const auto& [stream, intervals] : collected.snapshot(i)) {
            int ch = channelIndex(stream);
            if (stream == "RF") {
                sc.transmits = intervals;
            } else if (ch >= 0) {
                sc.receive[static_cast<size_t>(ch)] = intervals;
            } else {
                sc.settings[stream] = intervals;
            }
        }

        sc.phase_shifts = phase.phaseShiftsWithin(sc.interval);
        for (const auto& tx : sc.transmits) {
            sc.baud_lengths.push_back(phase.estimateBaudLength(tx));
        }
        for (int ch = kFirstChannel; ch <= kLastChannel; ch++) {
            sc.frequencies[ch - kFirstChannel] =
                frequenciesWithin(tlan.frequencySeries(ch), sc.interval);
        }

        LOG_EXP(DEBUG, "Subcycle %zu: %zu transmit windows, %zu phase shifts", i + 1,
                sc.transmits.size(), sc.phase_shifts.size());
        exp.subcycles_.push_back(std::move(sc));
    }

    LOG_EXP(INFO, "Experiment %s: %zu subcycles", exp.name_.c_str(), exp.subcycles_.size());
    return exp;
}

Experiment Experiment::fromElan(const std::string& path, const ElanOptions& options) {
    elan::TclInterpreter tcl;
    tcl.setMaxLoopIterations(options.max_loop_iterations);
    if (options.script_output) {
        tcl.setOutput(*options.script_output);
    }

    elan::Eros eros(tcl, options.radar, options.antenna, options.experiment_dirs);
    eros.runExperiment(path, options.start, options.args);

    const elan::DomainState& session = eros.session();
    std::string tlan_path = eros.tlanPath();

    std::vector<double> lo1;
    std::vector<double> lo2;
    for (double f : session.lo1) lo1.push_back(f * MHz);
    for (double f : session.lo2) lo2.push_back(f * MHz);

    tlan::TlanInterpreter tlan(lo1, lo2);
    for (int ch = kFirstChannel; ch <= kLastChannel; ch++) {
        const std::string& file = session.files.nco[ch - kFirstChannel];
        if (file.empty()) {
            continue;
        }
        std::optional<std::string> nco_path = eros.findFile(file, ".nco");
        if (!nco_path) {
            LOG_EXP(WARN, "NCO file %s for channel %d not found, its frequency stays unknown",
                    file.c_str(), ch);
            continue;
        }
        tlan.loadChannelNco(ch, *nco_path);
    }

    LOG_EXP(INFO, "Replaying %s for %s", tlan_path.c_str(), path.c_str());
    tlan.load(tlan_path);

    Experiment exp = fromTlan(tlan, std::filesystem::path(path).stem().string());
    exp.elan_path_ = path;
    return exp;
}

const Subcycle& Experiment::subcycle(size_t index) const {
    if (index >= subcycles_.size()) {
        throw std::out_of_range("Experiment " + name_ + " has " +
                                std::to_string(subcycles_.size()) + " subcycles, no subcycle " +
                                std::to_string(index + 1));
    }
    return subcycles_[index];
}

double nearestRange(const timeline::TimeInterval& tx, const timeline::TimeInterval& rx,
                    double baud_length, double velocity) {
    tx.checkOverlap(rx);
    return velocity * (rx.begin() - tx.end() + baud_length) / 2;
}

double furthestFullRange(const timeline::TimeInterval& tx, const timeline::TimeInterval& rx,
                         double baud_length, double velocity) {
    (void)baud_length;
    tx.checkOverlap(rx);
    return velocity * (rx.end() - tx.end()) / 2;
}

} // namespace experiment
} // namespace radex
