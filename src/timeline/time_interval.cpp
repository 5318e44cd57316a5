#include "time_interval.hpp"

#include <algorithm>
#include <sstream>

namespace radex {
namespace timeline {

TimeInterval::TimeInterval(double begin, double end)
    : begin_(begin), end_(end) {
    if (end < begin) {
        throw std::invalid_argument("Start of interval must come before end");
    }
}

TimeInterval TimeInterval::operator*(double num) const {
    return TimeInterval(begin_ * num, end_ * num);
}

TimeInterval TimeInterval::operator/(double num) const {
    return TimeInterval(begin_ / num, end_ / num);
}

bool TimeInterval::overlapsWith(const TimeInterval& other) const {
    if (begin_ <= other.end_ && end_ <= other.begin_) {
        return false;
    }
    if (other.begin_ <= end_ && other.end_ <= begin_) {
        return false;
    }
    return true;
}

bool TimeInterval::overlapsAny(const std::vector<TimeInterval>& others) const {
    return std::any_of(others.begin(), others.end(),
                       [this](const TimeInterval& iv) { return overlapsWith(iv); });
}

void TimeInterval::checkOverlap(const TimeInterval& other) const {
    if (overlapsWith(other)) {
        throw OverlapError();
    }
}

bool TimeInterval::within(const TimeInterval& other) const {
    return other.begin_ <= begin_ && end_ <= other.end_;
}

bool TimeInterval::withinAny(const std::vector<TimeInterval>& others) const {
    return std::any_of(others.begin(), others.end(),
                       [this](const TimeInterval& iv) { return within(iv); });
}

std::string TimeInterval::toString() const {
    std::ostringstream oss;
    oss << "TimeInterval(" << begin_ << ", " << end_ << ")";
    return oss.str();
}

} // namespace timeline
} // namespace radex
