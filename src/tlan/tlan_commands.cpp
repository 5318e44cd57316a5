#include "tlan_commands.hpp"

#include <stdexcept>

namespace radex {
namespace tlan {

const char* streamToString(Stream s) {
    switch (s) {
        case Stream::RF:     return "RF";
        case Stream::RXPROT: return "RXPROT";
        case Stream::LOPROT: return "LOPROT";
        case Stream::CAL:    return "CAL";
        case Stream::BEAM:   return "BEAM";
        case Stream::CH1:    return "CH1";
        case Stream::CH2:    return "CH2";
        case Stream::CH3:    return "CH3";
        case Stream::CH4:    return "CH4";
        case Stream::CH5:    return "CH5";
        case Stream::CH6:    return "CH6";
        case Stream::Plus:   return "+";
        case Stream::Minus:  return "-";
        default: return "UNKNOWN";
    }
}

Stream channelStream(int channel) {
    if (channel < 1 || channel > 6) {
        throw std::out_of_range("No channel board " + std::to_string(channel));
    }
    return static_cast<Stream>(static_cast<int>(Stream::CH1) + channel - 1);
}

static MnemonicInfo nothing(const std::string& doc) {
    MnemonicInfo info;
    info.doc = doc;
    return info;
}

static MnemonicInfo toggle(Action action, Stream stream, const std::string& doc) {
    MnemonicInfo info;
    info.action = action;
    info.stream = stream;
    info.doc = doc;
    return info;
}

static MnemonicInfo simple(Action action, const std::string& doc) {
    MnemonicInfo info;
    info.action = action;
    info.doc = doc;
    return info;
}

static MnemonicInfo route(int path, int first_channel, const std::string& doc) {
    MnemonicInfo info;
    info.action = Action::AdRoute;
    info.path = path;
    info.first_channel = first_channel;
    info.doc = doc;
    return info;
}

static MnemonicTable buildTable() {
    MnemonicTable t;

    t["RFON"] = toggle(Action::StreamOn, Stream::RF, "Enable RF output, bit 11 high");
    t["RFOFF"] = toggle(Action::StreamOff, Stream::RF, "Disable RF output, bit 11 low");
    t["RXPROT"] = toggle(Action::StreamOn, Stream::RXPROT, "Enable receiver protector, bit 12 high");
    t["RXPOFF"] = toggle(Action::StreamOff, Stream::RXPROT, "Disable receiver protector, bit 12 low");
    t["LOPROT"] = toggle(Action::StreamOn, Stream::LOPROT,
                         "Enable local oscillator protector, bit 6 high");
    t["LOPOFF"] = toggle(Action::StreamOff, Stream::LOPROT,
                         "Disable local oscillator protector, bit 6 low");
    t["BEAMON"] = toggle(Action::StreamOn, Stream::BEAM, "Enable beam in klystron, bit 13 high");
    t["BEAMOFF"] = toggle(Action::StreamOff, Stream::BEAM, "Disable beam in klystron, bit 13 low");
    t["CALON"] = toggle(Action::StreamOn, Stream::CAL,
                        "Tromso and receivers: enable noise source for calibration, bit 15 high");
    t["CAL100"] = toggle(Action::StreamOn, Stream::CAL,
                         "Enable noise source for calibration, bit 15 high");
    t["CALOFF"] = toggle(Action::StreamOff, Stream::CAL,
                         "Tromso and receivers: disable noise source, bit 15 low");
    t["CAL0"] = toggle(Action::StreamOff, Stream::CAL,
                       "Disable noise source for calibration, bit 15 low");

    t["PHA0"] = simple(Action::Pha0, "Set proper phase, bit 4 low");
    t["PHA180"] = simple(Action::Pha180, "Set proper phase, bit 4 high");
    t["ALLOFF"] = simple(Action::AllOff, "Close sampling gate on all channel boards, bit 10-15 low");
    t["STFIR"] = simple(Action::StFir,
                        "Start the FIR filters on the channel boards, bit 16 strobed");

    t["AD1L"] = route(0, 1, "Route input from AD 1 to channel boards 1, 2, 3");
    t["AD1R"] = route(0, 4, "Route input from AD 1 to channel boards 4, 5, 6");
    t["AD2L"] = route(1, 1, "Route input from AD 2 to channel boards 1, 2, 3");
    t["AD2R"] = route(1, 4, "Route input from AD 2 to channel boards 4, 5, 6");

    t["CHQPULS"] = nothing("High output on bit 31 for 2 us, synchronizes external hardware");
    t["RXSYNC"] = nothing("2 us pulse on bit 31 on the front of the receiver controller");
    t["TXSYNC"] = nothing("2 us pulse on bit 31 on the front of the transmitter controller");
    t["STC"] = nothing("Interrupt to the crate computer that new data are available, bit 8 strobed");
    t["BUFLIP"] = nothing("Change side of buffer memory in channel boards, bit 17 strobed");
    t["TRANS"] = nothing("Not documented");
    t["RECEV"] = nothing("Not documented");

    for (int ch = 1; ch <= 6; ch++) {
        std::string name = "CH" + std::to_string(ch);
        std::string bit = std::to_string(ch + 9);
        t[name] = toggle(Action::StreamOn, channelStream(ch),
                         "Open sampling gate on channel board " + std::to_string(ch) +
                             ", bit " + bit + " high");
        t[name + "OFF"] = toggle(Action::StreamOff, channelStream(ch),
                                 "Close sampling gate on channel board " + std::to_string(ch) +
                                     ", bit " + bit + " low");
    }

    for (int f = 0; f < 16; f++) {
        t["F" + std::to_string(f)] = nothing("Set transmitter frequency, bit 0-3");
    }

    for (int n = 0; n < 1024; n++) {
        MnemonicInfo info;
        info.action = Action::NcoSel;
        info.nco_index = n;
        info.doc = "Load NCO frequency " + std::to_string(n) +
                   " from memory into the NCO, strobe bit 29";
        t["NCOSEL" + std::to_string(n)] = std::move(info);
    }

    // Sample gate bits to the ADC, no timing effect here
    for (int bit : {4, 5}) {
        std::string b = std::to_string(bit);
        t["BRX" + b] = nothing("Set bit " + b + " on receiver controller");
        t["BRX" + b + "OFF"] = nothing("Clear bit " + b + " on receiver controller");
        t["BTX" + b] = nothing("Set bit " + b + " on transmitter controller");
        t["BTX" + b + "OFF"] = nothing("Clear bit " + b + " on transmitter controller");
    }

    return t;
}

const MnemonicTable& mnemonicTable() {
    static const MnemonicTable table = buildTable();
    return table;
}

const MnemonicInfo* findMnemonic(const std::string& mnemonic) {
    const auto& table = mnemonicTable();
    auto it = table.find(mnemonic);
    return it == table.end() ? nullptr : &it->second;
}

const char* controlStatementDoc(const std::string& mnemonic) {
    if (mnemonic == "REP") return "End of TARLAN program, repeat cycle";
    if (mnemonic == "SETTCR") return "Set reference time in time control, starts a subcycle";
    return nullptr;
}

} // namespace tlan
} // namespace radex
