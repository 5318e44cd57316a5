#pragma once

#include "timeline/interval_stream.hpp"
#include "timeline/time_interval.hpp"

#include <map>
#include <string>
#include <vector>

namespace radex {
namespace tlan {

// Closed intervals of every stream, keyed by stream name
using StreamSnapshot = std::map<std::string, timeline::TimeIntervalList>;

// Subcycle boundaries plus a snapshot of every stream taken when each
// subcycle closes. Subcycle i owns snapshot i.
class SubcycleCollector {
public:
    SubcycleCollector() : subcycles_("SUBCYCLE") {}

    bool isOn() const { return subcycles_.isOn(); }
    bool isOff() const { return subcycles_.isOff(); }

    void turnOn(double time, int line);

    // Close the running subcycle. Every stream must be off, otherwise a
    // TlanError naming the stream is thrown and nothing is recorded.
    void turnOff(double time, int line, const std::vector<timeline::IntervalStream>& streams);

    // Number of closed subcycles
    size_t count() const { return snapshots_.size(); }

    // Throws std::out_of_range for a subcycle that is not closed
    timeline::TimeInterval interval(size_t index) const;
    const StreamSnapshot& snapshot(size_t index) const;

    // Throws std::logic_error while a subcycle is running
    timeline::TimeIntervalList intervals() const { return subcycles_.intervals(); }

private:
    timeline::IntervalStream subcycles_;
    std::vector<timeline::TimeInterval> closed_;
    std::vector<StreamSnapshot> snapshots_;
};

} // namespace tlan
} // namespace radex
