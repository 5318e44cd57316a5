// TARLAN mnemonic table
//
// Every mnemonic the radar controller understands, with the action the
// interpreter takes and a one-line hardware description.

#pragma once

#include <map>
#include <string>

namespace radex {
namespace tlan {

// Hardware lines tracked as interval streams. Plus/Minus are the phase
// polarity pseudo-streams used to render phase history as intervals.
enum class Stream : int {
    RF = 0,
    RXPROT,
    LOPROT,
    CAL,
    BEAM,
    CH1,
    CH2,
    CH3,
    CH4,
    CH5,
    CH6,
    Plus,
    Minus,
    Count
};

constexpr int kStreamCount = static_cast<int>(Stream::Count);

const char* streamToString(Stream s);

// CH1..CH6 for channel 1..6
Stream channelStream(int channel);

// Phase polarity pseudo-streams, carried over into the next subcycle
inline bool isPhaseStream(Stream s) {
    return s == Stream::Plus || s == Stream::Minus;
}

// What executing a mnemonic does
enum class Action {
    Nothing,        // Known, but no timing effect worth simulating
    StreamOn,       // RFON, CH1, RXPROT, ...
    StreamOff,      // RFOFF, CH1OFF, RXPOFF, ...
    Pha0,           // Phase shifter to 0 degrees
    Pha180,         // Phase shifter to 180 degrees
    AllOff,         // Close sampling gate on all channel boards
    StFir,          // Start FIR filters
    AdRoute,        // AD1L/AD1R/AD2L/AD2R
    NcoSel,         // NCOSEL<n>
};

struct MnemonicInfo {
    Action action = Action::Nothing;
    Stream stream = Stream::RF;     // StreamOn / StreamOff
    int path = 0;                   // AdRoute: receiver path, 0 (AD1) or 1 (AD2)
    int first_channel = 0;          // AdRoute: 1 (L) or 4 (R), routes 3 channels
    int nco_index = 0;              // NcoSel
    std::string doc;
};

using MnemonicTable = std::map<std::string, MnemonicInfo>;

// Built on first use
const MnemonicTable& mnemonicTable();

// nullptr for an unknown mnemonic
const MnemonicInfo* findMnemonic(const std::string& mnemonic);

// Description of REP and SETTCR, which are handled by the interpreter itself
const char* controlStatementDoc(const std::string& mnemonic);

} // namespace tlan
} // namespace radex
