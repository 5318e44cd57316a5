#pragma once

#include <cstdint>
#include <string>

namespace radex {

// Units. All times are stored in seconds, all frequencies in Hz.
constexpr double us = 1e-6;                    // Microsecond
constexpr double ns = 1e-9;                    // Nanosecond
constexpr double MHz = 1e6;                    // Megahertz
constexpr double km = 1e3;                     // Kilometer
constexpr double c = 299792458.0;              // Speed of light [m/s]

// Receiver channel boards on the KST receivers
constexpr int kFirstChannel = 1;
constexpr int kLastChannel = 6;
constexpr int kChannelCount = kLastChannel - kFirstChannel + 1;

// Phase shifter states (degrees)
enum class Phase : uint16_t {
    Deg0 = 0,
    Deg180 = 180,
};

inline int phaseDegrees(Phase p) {
    return static_cast<int>(p);
}

inline const char* phaseToString(Phase p) {
    switch (p) {
        case Phase::Deg0:   return "+";
        case Phase::Deg180: return "-";
        default: return "?";
    }
}

// Radar sites supported by the console layer
enum class Radar : uint8_t {
    UHF,
    VHF,
    ESR,
    KIR,
    SOD,
    Unknown = 0xFF,
};

inline const char* radarToString(Radar r) {
    switch (r) {
        case Radar::UHF: return "UHF";
        case Radar::VHF: return "VHF";
        case Radar::ESR: return "ESR";
        case Radar::KIR: return "KIR";
        case Radar::SOD: return "SOD";
        default: return "UNKNOWN";
    }
}

inline Radar stringToRadar(const std::string& s) {
    if (s == "UHF" || s == "uhf") return Radar::UHF;
    if (s == "VHF" || s == "vhf") return Radar::VHF;
    if (s == "ESR" || s == "esr") return Radar::ESR;
    if (s == "KIR" || s == "kir") return Radar::KIR;
    if (s == "SOD" || s == "sod") return Radar::SOD;
    return Radar::Unknown;
}

} // namespace radex
