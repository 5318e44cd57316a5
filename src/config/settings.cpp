#include "settings.hpp"

#include <cstdlib>
#include <fstream>

#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)

namespace radex {
namespace config {

// Supports RADEX_CONFIG environment variable for per-site configurations
std::string Settings::getDefaultPath() {
    const char* config_override = std::getenv("RADEX_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/radex/settings.ini";
    }
    return "settings.ini";
}

// Helper to create directory if it doesn't exist
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos) {
        std::string dir = path.substr(0, pos);
        // Create parent directories recursively
        for (size_t i = 0; i < dir.size(); i++) {
            if (dir[i] == '/') {
                std::string subdir = dir.substr(0, i);
                if (!subdir.empty()) {
                    MKDIR(subdir.c_str());
                }
            }
        }
        MKDIR(dir.c_str());
    }
}

static std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitDirs(const std::string& value) {
    std::vector<std::string> dirs;
    size_t start = 0;
    while (start <= value.size()) {
        size_t sep = value.find(';', start);
        if (sep == std::string::npos) sep = value.size();
        std::string dir = trim(value.substr(start, sep - start));
        if (!dir.empty()) {
            dirs.push_back(dir);
        }
        start = sep + 1;
    }
    return dirs;
}

std::string joinDirs(const std::vector<std::string>& dirs) {
    std::string s;
    for (size_t i = 0; i < dirs.size(); i++) {
        if (i > 0) s += ';';
        s += dirs[i];
    }
    return s;
}

// Save settings to INI file
bool Settings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << "[Site]\n";
    file << "radar=" << radarToString(radar) << "\n";
    file << "antenna=" << antenna << "\n";

    file << "\n[Files]\n";
    file << "experiment_dirs=" << joinDirs(experiment_dirs) << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << logLevelToString(log_level) << "\n";
    file << "log_file=" << log_file << "\n";

    file << "\n[Interpreter]\n";
    file << "max_loop_iterations=" << max_loop_iterations << "\n";

    file << "\n[Ranges]\n";
    file.precision(10);
    file << "speed_of_light=" << speed_of_light << "\n";

    return static_cast<bool>(file);
}

// Load settings from INI file
bool Settings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "radar") {
            Radar r = stringToRadar(value);
            if (r != Radar::Unknown) {
                radar = r;
            }
        } else if (key == "antenna") {
            antenna = value;
        } else if (key == "experiment_dirs") {
            experiment_dirs = splitDirs(value);
        } else if (key == "log_level") {
            parseLogLevel(value.c_str(), log_level);
        } else if (key == "log_file") {
            log_file = value;
        } else if (key == "max_loop_iterations") {
            int n = std::atoi(value.c_str());
            if (n > 0) {
                max_loop_iterations = n;
            }
        } else if (key == "speed_of_light") {
            double v = std::strtod(value.c_str(), nullptr);
            if (v > 0) {
                speed_of_light = v;
            }
        }
    }

    return true;
}

} // namespace config
} // namespace radex
