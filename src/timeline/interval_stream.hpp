#pragma once

#include "time_interval.hpp"

#include <optional>
#include <string>
#include <vector>

namespace radex {
namespace timeline {

// On/off history of one named hardware line.
//
// Entries are either open (turned on, not yet off) or closed. Only the last
// entry may be open. Toggling errors are reported as tlan::TlanError carrying
// the program line that caused them.
class IntervalStream {
public:
    explicit IntervalStream(const std::string& name = "");

    const std::string& name() const { return name_; }

    bool isOn() const;
    bool isOff() const { return !isOn(); }

    void turnOn(double time, int line);
    void turnOff(double time, int line);

    // Number of entries, open or closed
    size_t count() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Closed intervals. Throws std::logic_error while the stream is on.
    TimeIntervalList intervals() const;

    // Throw std::logic_error if the stream was never toggled that way
    double lastTurnOn() const;
    double lastTurnOff() const;

private:
    struct Entry {
        double on = 0.0;
        std::optional<double> off;
    };

    std::string name_;
    std::vector<Entry> entries_;
};

} // namespace timeline
} // namespace radex
