#pragma once

#include "time_interval.hpp"
#include "radex/types.hpp"

#include <vector>

namespace radex {
namespace timeline {

struct PhaseEvent {
    double time = 0.0;
    Phase phase = Phase::Deg0;
};

using PhaseEventList = std::vector<PhaseEvent>;

// Simulates the transmitter phase shifter (PHA0 / PHA180).
//
// Events are kept sorted by time. Events at the same time keep the order in
// which they were recorded.
class PhaseShifter {
public:
    PhaseShifter() = default;

    void setPhase(double time, Phase phase);
    void pha0(double time) { setPhase(time, Phase::Deg0); }
    void pha180(double time) { setPhase(time, Phase::Deg180); }

    // Forget history but keep the last phase as the phase at time 0
    void restart();

    const PhaseEventList& phaseShifts() const { return shifts_; }

    // Distinct phases in order of first use
    const std::vector<Phase>& phases() const { return phases_; }

    // Events with begin <= t <= end. If an event precedes the interval, the
    // phase in effect at interval.begin() is inserted first as a synthetic
    // event at interval.begin().
    PhaseEventList phaseShiftsWithin(const TimeInterval& interval) const;

    // GCD of the gaps between recorded shifts inside the interval, with each
    // gap rounded to whole nanoseconds. Returns the interval length when the
    // interval holds fewer than two shifts.
    //
    // A code that keeps its phase for two or more consecutive bauds
    // everywhere yields a multiple of the true baud length.
    double estimateBaudLength(const TimeInterval& interval) const;

private:
    PhaseEventList shifts_;
    std::vector<Phase> phases_;
};

} // namespace timeline
} // namespace radex
