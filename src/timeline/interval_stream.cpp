#include "interval_stream.hpp"
#include "tlan/tlan_error.hpp"

#include <stdexcept>

namespace radex {
namespace timeline {

IntervalStream::IntervalStream(const std::string& name)
    : name_(name) {}

bool IntervalStream::isOn() const {
    return !entries_.empty() && !entries_.back().off.has_value();
}

void IntervalStream::turnOn(double time, int line) {
    if (isOn()) {
        throw tlan::TlanError("Data stream " + name_ + " is already on!", line);
    }
    Entry e;
    e.on = time;
    entries_.push_back(e);
}

void IntervalStream::turnOff(double time, int line) {
    if (isOff()) {
        throw tlan::TlanError("Data stream " + name_ + " is already off!", line);
    }
    if (time < entries_.back().on) {
        throw tlan::TlanError("Data stream " + name_ + " is turned off before it was turned on!",
                              line);
    }
    entries_.back().off = time;
}

TimeIntervalList IntervalStream::intervals() const {
    if (isOn()) {
        throw std::logic_error("Stream " + name_ + " is on. Cannot return open intervals.");
    }
    TimeIntervalList result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.emplace_back(e.on, *e.off);
    }
    return result;
}

double IntervalStream::lastTurnOn() const {
    if (entries_.empty()) {
        throw std::logic_error("Stream " + name_ + " has not been turned on yet!");
    }
    return entries_.back().on;
}

double IntervalStream::lastTurnOff() const {
    if (entries_.empty()) {
        throw std::logic_error("Stream " + name_ + " has not been turned on yet!");
    }
    if (isOff()) {
        return *entries_.back().off;
    }
    if (entries_.size() == 1) {
        throw std::logic_error("Stream " + name_ + " is on, but has not been turned off yet!");
    }
    return *entries_[entries_.size() - 2].off;
}

} // namespace timeline
} // namespace radex
