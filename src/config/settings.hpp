#pragma once

#include "radex/logging.hpp"
#include "radex/types.hpp"

#include <string>
#include <vector>

namespace radex {
namespace config {

// Settings that persist across runs. Command line options override them.
struct Settings {
    // Save/load to file. An empty path means getDefaultPath().
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // $RADEX_CONFIG, else $HOME/.config/radex/settings.ini
    static std::string getDefaultPath();

    // Site
    Radar radar = Radar::UHF;
    std::string antenna;                        // Empty = same as radar

    // Where experiment scripts, programs and NCO files are looked up
    // (in addition to /kst/exp and kst/exp). Stored ';'-separated.
    std::vector<std::string> experiment_dirs;

    // Logging
    LogLevel log_level = LogLevel::WARN;
    std::string log_file;                       // Empty = stderr

    // Console interpreter
    int max_loop_iterations = 1000;             // Bound on every for loop

    // Range calculations [m/s]
    double speed_of_light = c;
};

// "a;b;;c" -> {"a", "b", "c"}
std::vector<std::string> splitDirs(const std::string& value);
std::string joinDirs(const std::vector<std::string>& dirs);

} // namespace config
} // namespace radex
