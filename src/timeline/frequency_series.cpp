#include "frequency_series.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace radex {
namespace timeline {

std::vector<double> FrequencySeries::frequencies() const {
    std::vector<double> result;
    for (const auto& [t, f] : series_) {
        (void)t;
        if (std::find(result.begin(), result.end(), f) == result.end()) {
            result.push_back(f);
        }
    }
    return result;
}

FrequencySeries FrequencySeries::shiftsWithin(const TimeInterval& interval) const {
    // Last entry at or before the start of the interval
    auto start = series_.upper_bound(interval.begin());
    if (start == series_.begin()) {
        throw std::out_of_range("TimeInterval begins before first frequency is defined!");
    }

    FrequencySeries result;
    result.set(interval.begin(), std::prev(start)->second);

    for (auto it = start; it != series_.end() && it->first < interval.end(); ++it) {
        result.set(it->first, it->second);
    }
    return result;
}

std::pair<std::vector<double>, std::vector<double>>
FrequencySeries::asLine(const TimeInterval& interval) const {
    FrequencySeries within = shiftsWithin(interval);

    std::vector<double> times;
    std::vector<double> freqs;
    const auto& e = within.entries();
    for (auto it = e.begin(); it != e.end(); ++it) {
        auto next = std::next(it);
        double until = (next == e.end()) ? interval.end() : next->first;
        times.push_back(it->first);
        times.push_back(until);
        freqs.push_back(it->second);
        freqs.push_back(it->second);
    }
    return {times, freqs};
}

} // namespace timeline
} // namespace radex
