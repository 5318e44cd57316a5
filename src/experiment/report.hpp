#pragma once

#include "experiment.hpp"

#include <iosfwd>
#include <optional>

namespace radex {
namespace experiment {

// Text rendering of an experiment, times in microseconds:
//
//   Experiment manda (manda-v.tlan)
//   Cycle 0.0 - 5580.0 us, 2 subcycles
//
//   Subcycle 1: 0.0 - 1395.0 us
//     RF       40.0 - 220.0 us   baud 10.0 us
//     CH1      250.0 - 1300.0 us   range 35.5 - 162.9 km
//     ...
//
// With subcycle set only that subcycle (0-based) is written. Ranges use
// velocity [m/s]. Throws std::out_of_range for a subcycle that does not exist.
void writeReport(std::ostream& out, const Experiment& exp,
                 std::optional<size_t> subcycle = std::nullopt, double velocity = c);

// One subcycle, without the experiment header
void writeSubcycle(std::ostream& out, const Subcycle& sc, size_t index, double velocity = c);

} // namespace experiment
} // namespace radex
