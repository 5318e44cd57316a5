#include "report.hpp"

#include <cstdarg>
#include <cstdio>
#include <ostream>

namespace radex {
namespace experiment {

static std::string format(const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

static std::string format(const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n < 0) {
        return std::string();
    }
    return std::string(buf, static_cast<size_t>(n) < sizeof(buf) ? static_cast<size_t>(n)
                                                                   : sizeof(buf) - 1);
}

static std::string interval(const timeline::TimeInterval& t) {
    return format("%.1f - %.1f us", t.begin() / us, t.end() / us);
}

void writeSubcycle(std::ostream& out, const Subcycle& sc, size_t index, double velocity) {
    out << format("Subcycle %zu: ", index + 1) << interval(sc.interval) << "\n";

    for (size_t i = 0; i < sc.transmits.size(); i++) {
        out << format("  %-8s ", "RF") << interval(sc.transmits[i]);
        if (i < sc.baud_lengths.size()) {
            out << format("   baud %.1f us", sc.baud_lengths[i] / us);
        }
        out << "\n";
    }

    for (size_t ch = 0; ch < sc.receive.size(); ch++) {
        std::string name = format("CH%zu", ch + kFirstChannel);
        for (const auto& rx : sc.receive[ch]) {
            out << format("  %-8s ", name.c_str()) << interval(rx);
            std::optional<size_t> tx = sc.transmitBefore(rx);
            if (tx) {
                double baud = *tx < sc.baud_lengths.size() ? sc.baud_lengths[*tx] : 0.0;
                out << format("   range %.1f - %.1f km",
                              nearestRange(sc.transmits[*tx], rx, baud, velocity) / km,
                              furthestFullRange(sc.transmits[*tx], rx, baud, velocity) / km);
            }
            out << "\n";
        }
    }

    for (const auto& [name, intervals] : sc.settings) {
        for (const auto& t : intervals) {
            out << format("  %-8s ", name.c_str()) << interval(t) << "\n";
        }
    }

    if (!sc.phase_shifts.empty()) {
        out << "  phase   ";
        for (const auto& e : sc.phase_shifts) {
            out << format(" %.1f%s", e.time / us, phaseToString(e.phase));
        }
        out << "\n";
    }

    for (size_t ch = 0; ch < sc.frequencies.size(); ch++) {
        if (!sc.frequencies[ch]) {
            continue;
        }
        out << format("  CH%zu freq", ch + kFirstChannel);
        for (const auto& [t, f] : sc.frequencies[ch]->entries()) {
            out << format(" %.1f us: %.4f MHz", t / us, f / MHz);
        }
        out << "\n";
    }
}

void writeReport(std::ostream& out, const Experiment& exp, std::optional<size_t> subcycle,
                 double velocity) {
    out << "Experiment " << exp.name();
    if (!exp.tlanPath().empty()) {
        out << " (" << exp.tlanPath() << ")";
    }
    out << "\n";

    if (exp.cycle()) {
        out << "Cycle " << interval(*exp.cycle());
    } else {
        out << "Cycle not closed";
    }
    out << format(", %zu subcycles\n", exp.subcycles().size());

    if (!exp.lo1().empty()) {
        out << "LO1";
        for (double f : exp.lo1()) out << format(" %.2f", f / MHz);
        out << " MHz, LO2";
        for (double f : exp.lo2()) out << format(" %.2f", f / MHz);
        out << " MHz\n";
    }
    if (exp.firStart()) {
        out << format("FIR filters started at %.1f us\n", *exp.firStart() / us);
    }

    if (subcycle) {
        out << "\n";
        writeSubcycle(out, exp.subcycle(*subcycle), *subcycle, velocity);
    } else {
        for (size_t i = 0; i < exp.subcycles().size(); i++) {
            out << "\n";
            writeSubcycle(out, exp.subcycles()[i], i, velocity);
        }
    }

    for (const auto& w : exp.warnings()) {
        out << "warning: " << w << "\n";
    }
}

} // namespace experiment
} // namespace radex
