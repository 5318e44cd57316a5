#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace radex {
namespace timeline {

// Raised when a transmit and a receive interval overlap
class OverlapError : public std::runtime_error {
public:
    OverlapError() : std::runtime_error("The radar transmits while receiving!") {}
};

// One closed [begin, end] period in seconds during which a line is on.
class TimeInterval {
public:
    // Throws std::invalid_argument if end < begin
    TimeInterval(double begin = 0.0, double end = 0.0);

    double begin() const { return begin_; }
    double end() const { return end_; }
    double length() const { return end_ - begin_; }
    std::pair<double, double> asPair() const { return {begin_, end_}; }

    TimeInterval operator*(double num) const;
    TimeInterval operator/(double num) const;

    bool operator==(const TimeInterval& other) const {
        return begin_ == other.begin_ && end_ == other.end_;
    }
    bool operator!=(const TimeInterval& other) const { return !(*this == other); }

    // Intervals that only share a boundary do not overlap
    bool overlapsWith(const TimeInterval& other) const;
    bool overlapsAny(const std::vector<TimeInterval>& others) const;

    // Throws OverlapError if the intervals overlap
    void checkOverlap(const TimeInterval& other) const;

    // True if this interval lies inside other. Boundaries may be shared.
    bool within(const TimeInterval& other) const;
    bool withinAny(const std::vector<TimeInterval>& others) const;

    std::string toString() const;

private:
    double begin_;
    double end_;
};

using TimeIntervalList = std::vector<TimeInterval>;

} // namespace timeline
} // namespace radex
