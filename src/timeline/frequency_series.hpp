#pragma once

#include "time_interval.hpp"

#include <map>
#include <utility>
#include <vector>

namespace radex {
namespace timeline {

// Time -> frequency [Hz] record of a receiver channel's center frequency
class FrequencySeries {
public:
    using Map = std::map<double, double>;

    FrequencySeries() = default;

    // Record frequency f from time t on. Overwrites an entry at the same time.
    void set(double t, double f) { series_[t] = f; }

    bool empty() const { return series_.empty(); }
    size_t size() const { return series_.size(); }
    const Map& entries() const { return series_; }

    // Distinct frequencies in order of first appearance in time
    std::vector<double> frequencies() const;

    // Frequency in effect at interval.begin() (stored at interval.begin()),
    // followed by every change strictly inside the interval.
    // Throws std::out_of_range if the interval starts before the first entry.
    FrequencySeries shiftsWithin(const TimeInterval& interval) const;

    // Step-line points of the series over the interval, for plotting:
    // {1:100, 2:135} over [1, 5] gives ([1, 2, 2, 5], [100, 100, 135, 135])
    std::pair<std::vector<double>, std::vector<double>> asLine(const TimeInterval& interval) const;

private:
    Map series_;
};

} // namespace timeline
} // namespace radex
