#include "subcycle_collector.hpp"
#include "tlan_error.hpp"
#include "radex/logging.hpp"

#include <stdexcept>

namespace radex {
namespace tlan {

void SubcycleCollector::turnOn(double time, int line) {
    subcycles_.turnOn(time, line);
}

void SubcycleCollector::turnOff(double time, int line,
                                const std::vector<timeline::IntervalStream>& streams) {
    for (const auto& stream : streams) {
        if (stream.isOn()) {
            throw TlanError("Data stream " + stream.name() +
                                " is still on at the end of the subcycle!",
                            line);
        }
    }

    subcycles_.turnOff(time, line);

    StreamSnapshot snapshot;
    for (const auto& stream : streams) {
        snapshot[stream.name()] = stream.intervals();
    }
    closed_.emplace_back(subcycles_.lastTurnOn(), time);
    snapshots_.push_back(std::move(snapshot));

    LOG_TLAN(DEBUG, "Subcycle %zu closed: %s", snapshots_.size() - 1,
             closed_.back().toString().c_str());
}

timeline::TimeInterval SubcycleCollector::interval(size_t index) const {
    if (index >= closed_.size()) {
        throw std::out_of_range("Subcycle " + std::to_string(index) + " has not been closed");
    }
    return closed_[index];
}

const StreamSnapshot& SubcycleCollector::snapshot(size_t index) const {
    if (index >= snapshots_.size()) {
        throw std::out_of_range("Subcycle " + std::to_string(index) + " has not been closed");
    }
    return snapshots_[index];
}

} // namespace tlan
} // namespace radex
