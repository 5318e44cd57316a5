#include "tlan_interpreter.hpp"
#include "tlan_error.hpp"
#include "radex/logging.hpp"
#include "radex/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace radex {
namespace tlan {

TlanInterpreter::TlanInterpreter()
    : TlanInterpreter({812 * MHz}, {128 * MHz, 122 * MHz}) {}

TlanInterpreter::TlanInterpreter(const std::vector<double>& lo1_hz,
                                 const std::vector<double>& lo2_hz)
    : lo1_(lo1_hz), lo2_(lo2_hz), cycle_("CYCLE") {
    if (lo1_.empty() || lo2_.empty()) {
        throw std::invalid_argument("At least one LO1 and one LO2 frequency are needed");
    }
    resetStreams();
    for (auto& nco : ncos_) {
        nco.setLo1(lo1ForPath(1));
        nco.setLo2(lo2ForPath(1));
    }
}

void TlanInterpreter::resetStreams() {
    streams_.clear();
    streams_.reserve(kStreamCount);
    for (int i = 0; i < kStreamCount; i++) {
        streams_.emplace_back(streamToString(static_cast<Stream>(i)));
    }
}

const timeline::IntervalStream& TlanInterpreter::stream(Stream s) const {
    return streams_.at(static_cast<size_t>(s));
}

timeline::IntervalStream& TlanInterpreter::mutableStream(Stream s) {
    return streams_.at(static_cast<size_t>(s));
}

static size_t channelIndex(int channel) {
    if (channel < kFirstChannel || channel > kLastChannel) {
        throw std::out_of_range("No channel board " + std::to_string(channel));
    }
    return static_cast<size_t>(channel - kFirstChannel);
}

void TlanInterpreter::setChannelNco(int channel, const kstconfig::Nco& nco) {
    kstconfig::Nco& slot = ncos_[channelIndex(channel)];
    slot = nco;
    if (!slot.lo1()) slot.setLo1(lo1ForPath(1));
    if (!slot.lo2()) slot.setLo2(lo2ForPath(1));
}

void TlanInterpreter::loadChannelNco(int channel, const std::string& path) {
    ncos_[channelIndex(channel)].loadFile(path);
}

const kstconfig::Nco& TlanInterpreter::channelNco(int channel) const {
    return ncos_[channelIndex(channel)];
}

const timeline::FrequencySeries& TlanInterpreter::frequencySeries(int channel) const {
    return freq_rec_[channelIndex(channel)];
}

double TlanInterpreter::lo1ForPath(int path) const {
    // UHF splits into two paths after LO1
    if (lo1_.size() == 1) {
        return lo1_[0];
    }
    return lo1_[std::min(static_cast<size_t>(path), lo1_.size() - 1)];
}

double TlanInterpreter::lo2ForPath(int path) const {
    return lo2_[std::min(static_cast<size_t>(path), lo2_.size() - 1)];
}

void TlanInterpreter::warn(const std::string& msg, int line) {
    LOG_TLAN(WARN, "Line %d: %s", line, msg.c_str());
    warnings_.push_back("line " + std::to_string(line) + ": " + msg);
}

void TlanInterpreter::load(const std::string& path) {
    std::vector<Command> program = TlanParser::parseFile(path);
    filename_ = path;
    run(program);
}

void TlanInterpreter::run(const std::vector<Command>& program) {
    if (program.empty()) {
        throw TlanError("The program has no commands, it must end with REP");
    }

    for (size_t i = 0; i < program.size(); i++) {
        const Command& cmd = program[i];

        // SETTCR 0 continues the subcycle. Only the first command and the one
        // right before REP are known to be used that way.
        if (cmd.mnemonic == "SETTCR" && cmd.t == 0.0 && i != 0) {
            bool before_rep = i + 1 < program.size() && program[i + 1].mnemonic == "REP";
            if (!before_rep) {
                warn("SETTCR 0 in the middle of a subcycle, the time control is reset "
                     "without starting a new subcycle",
                     cmd.line);
            }
        }
        step(cmd);
    }

    const Command& last = program.back();
    if (last.mnemonic != "REP") {
        throw TlanError("The program must end with REP, last command is " + last.mnemonic,
                        last.line);
    }

    LOG_TLAN(INFO, "%zu subcycles, cycle %s", subcycles_.count(),
             cycle_.intervals().back().toString().c_str());
}

void TlanInterpreter::startCycle(int line) {
    if (cycle_.count() > 0) {
        throw TlanError("Command after the end of the cycle (REP)", line);
    }
    cycle_.turnOn(0.0, line);
    subcycles_.turnOn(0.0, line);
}

void TlanInterpreter::step(const Command& cmd) {
    if (cycle_.isOff()) {
        startCycle(cmd.line);
    }

    if (cmd.mnemonic == "SETTCR") {
        if (cmd.t > 0) {
            closeSubcycle(cmd.t, cmd.line);
            openSubcycle(cmd.t, cmd.line);
        }
        tcr_ = cmd.t;
        LOG_TLAN(TRACE, "TCR = %g us", tcr_ / us);
    } else if (cmd.mnemonic == "REP") {
        closeSubcycle(cmd.t, cmd.line);
        cycle_.turnOff(cmd.t, cmd.line);
    } else {
        execute(cmd);
    }
}

void TlanInterpreter::closeSubcycle(double time, int line) {
    // The phase polarity carries over into the next subcycle
    for (int i = 0; i < kStreamCount; i++) {
        Stream s = static_cast<Stream>(i);
        if (isPhaseStream(s) && stream(s).isOn()) {
            mutableStream(s).turnOff(time, line);
        }
    }

    subcycles_.turnOff(time, line, streams_);
    resetStreams();
}

void TlanInterpreter::openSubcycle(double time, int line) {
    subcycles_.turnOn(time, line);

    const auto& shifts = phase_.phaseShifts();
    if (!shifts.empty()) {
        Stream polarity = shifts.back().phase == Phase::Deg0 ? Stream::Plus : Stream::Minus;
        mutableStream(polarity).turnOn(time, line);
    }
}

void TlanInterpreter::setPolarity(Stream on, Stream off, double time, int line) {
    auto& off_stream = mutableStream(off);
    if (off_stream.isOn()) {
        off_stream.turnOff(time, line);
    }
    auto& on_stream = mutableStream(on);
    if (on_stream.isOff()) {
        on_stream.turnOn(time, line);
    }
}

void TlanInterpreter::execute(const Command& cmd) {
    if (cycle_.isOff()) {
        throw TlanError("The cycle has not been started!", cmd.line);
    }
    if (subcycles_.isOff()) {
        throw TlanError("No subcycle has been started yet!", cmd.line);
    }

    const MnemonicInfo* info = findMnemonic(cmd.mnemonic);
    if (!info) {
        warn("Command " + cmd.mnemonic + " is not implemented, skipped", cmd.line);
        return;
    }

    double t = tcr_ + cmd.t;
    LOG_TLAN(TRACE, "%10.3f us  %s", t / us, cmd.mnemonic.c_str());

    switch (info->action) {
        case Action::Nothing:
            break;
        case Action::StreamOn:
            mutableStream(info->stream).turnOn(t, cmd.line);
            break;
        case Action::StreamOff:
            mutableStream(info->stream).turnOff(t, cmd.line);
            break;
        case Action::Pha0:
            phase_.pha0(t);
            setPolarity(Stream::Plus, Stream::Minus, t, cmd.line);
            break;
        case Action::Pha180:
            phase_.pha180(t);
            setPolarity(Stream::Minus, Stream::Plus, t, cmd.line);
            break;
        case Action::AllOff:
            allOff(t, cmd.line);
            break;
        case Action::StFir:
            if (fir_start_) {
                warn("STFIR called again, FIR filters were started at " +
                         std::to_string(*fir_start_ / us) + " us",
                     cmd.line);
            } else {
                fir_start_ = t;
            }
            break;
        case Action::AdRoute:
            routeAd(t, info->path, info->first_channel);
            break;
        case Action::NcoSel:
            selectNco(t, cmd.line, info->nco_index);
            break;
    }
}

void TlanInterpreter::allOff(double time, int line) {
    for (int ch = kFirstChannel; ch <= kLastChannel; ch++) {
        auto& st = mutableStream(channelStream(ch));
        if (st.isOn()) {
            st.turnOff(time, line);
        }
    }
}

void TlanInterpreter::routeAd(double time, int path, int first_channel) {
    for (int ch = first_channel; ch < first_channel + 3; ch++) {
        kstconfig::Nco& nco = ncos_[channelIndex(ch)];
        nco.setLo1(lo1ForPath(path));
        nco.setLo2(lo2ForPath(path));
        if (nco.isReady()) {
            freq_rec_[channelIndex(ch)].set(time, nco.frequency());
        }
    }
}

void TlanInterpreter::selectNco(double time, int line, int index) {
    for (int ch = kFirstChannel; ch <= kLastChannel; ch++) {
        kstconfig::Nco& nco = ncos_[channelIndex(ch)];
        if (!nco.hasTable()) {
            continue;
        }
        try {
            nco.select(index);
        } catch (const std::out_of_range& e) {
            throw TlanError("CH" + std::to_string(ch) + ": " + e.what(), line);
        }
        if (nco.isReady()) {
            freq_rec_[channelIndex(ch)].set(time, nco.frequency());
            LOG_TLAN(TRACE, "CH%d center frequency %.4f MHz", ch, nco.frequency() / MHz);
        }
    }
}

} // namespace tlan
} // namespace radex
