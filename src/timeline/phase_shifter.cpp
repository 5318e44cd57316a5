#include "phase_shifter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <numeric>

namespace radex {
namespace timeline {

void PhaseShifter::setPhase(double time, Phase phase) {
    auto pos = std::upper_bound(shifts_.begin(), shifts_.end(), time,
                                [](double t, const PhaseEvent& e) { return t < e.time; });
    shifts_.insert(pos, PhaseEvent{time, phase});

    if (std::find(phases_.begin(), phases_.end(), phase) == phases_.end()) {
        phases_.push_back(phase);
    }
}

void PhaseShifter::restart() {
    if (shifts_.empty()) {
        return;
    }
    Phase last = shifts_.back().phase;
    shifts_.clear();
    setPhase(0.0, last);
}

PhaseEventList PhaseShifter::phaseShiftsWithin(const TimeInterval& interval) const {
    PhaseEventList result;

    // Last event strictly before the interval gives the phase at its start
    auto first = std::lower_bound(shifts_.begin(), shifts_.end(), interval.begin(),
                                  [](const PhaseEvent& e, double t) { return e.time < t; });
    if (first != shifts_.begin()) {
        result.push_back(PhaseEvent{interval.begin(), std::prev(first)->phase});
    }

    for (auto it = first; it != shifts_.end() && it->time <= interval.end(); ++it) {
        result.push_back(*it);
    }
    return result;
}

double PhaseShifter::estimateBaudLength(const TimeInterval& interval) const {
    std::vector<double> times;
    for (const auto& e : shifts_) {
        if (e.time >= interval.begin() && e.time <= interval.end()) {
            times.push_back(e.time);
        }
    }
    if (times.size() < 2) {
        return interval.length();
    }

    int64_t g = 0;
    for (size_t i = 1; i < times.size(); i++) {
        int64_t gap = std::llround((times[i] - times[i - 1]) * 1e9);
        g = std::gcd(g, gap);
    }
    if (g == 0) {
        return interval.length();
    }
    return static_cast<double>(g) / 1e9;
}

} // namespace timeline
} // namespace radex
