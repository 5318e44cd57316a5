// EROS command catalog for the console interpreter
//
// EROS is the experiment control system that runs ELAN scripts at the
// EISCAT sites. Only what matters for reconstructing the timing is kept:
// which controller programs, NCO tables and filters get loaded, and how the
// local oscillators are set. Commands that drive hardware or the correlator
// just log what they would have done.
//
// Usage:
//   TclInterpreter tcl;
//   Eros eros(tcl, Radar::UHF);
//   eros.runExperiment("manda", "now", {});
//   std::string tlan = eros.tlanPath();

#pragma once

#include "tcl_interpreter.hpp"
#include "radex/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace radex {
namespace elan {

// Last file of each kind loaded by the script
struct LoadedFiles {
    std::string tbin;                               // Transmitter program
    std::string rbin;                               // Receiver program
    std::string filter;                             // loadfilter
    std::string fil;                                // Correlator file (startdata)
    std::array<std::string, kChannelCount> nco;     // loadfrequency, per channel

    // Take over every file that other has set
    void merge(const LoadedFiles& other);
};

struct DomainState {
    Radar radar = Radar::Unknown;
    std::string antenna;
    LoadedFiles files;
    std::vector<double> lo1;    // [MHz], index = receiver path
    std::vector<double> lo2;    // [MHz]
    std::vector<std::string> argv;
    std::map<char, double> starttimes;  // e, b, r, t, c
};

class Eros {
public:
    static constexpr const char* kDefaultExperimentDirs[] = {"/kst/exp", "kst/exp"};

    // Registers the EROS commands on tcl, which must outlive this object
    Eros(TclInterpreter& tcl, Radar radar, const std::string& antenna = "",
         const std::vector<std::string>& experiment_dirs = {});

    Eros(const Eros&) = delete;
    Eros& operator=(const Eros&) = delete;

    static std::vector<double> defaultLo1(Radar radar);
    static std::vector<double> defaultLo2(Radar radar);

    // runexperiment <file> <start> <args...> in the global scope
    void runExperiment(const std::string& file, const std::string& start,
                       const std::vector<std::string>& args = {});

    // Locate a script or data file. Tries the name as given, then below each
    // experiment directory. A leading /kst/exp/ is stripped and the extension
    // appended when missing.
    std::optional<std::string> findFile(const std::string& name, const std::string& ext) const;

    // State as seen by one scope
    const DomainState& state(ScopeId scope) const;

    // Union of everything the script did, in any scope
    const DomainState& session() const { return session_; }

    // Guess the TARLAN source of the last loaded receiver program.
    // Throws std::runtime_error if there is none.
    std::string tlanPath() const;

    const std::vector<std::string>& experimentDirs() const { return dirs_; }

private:
    TclInterpreter& tcl_;
    std::map<ScopeId, DomainState> states_;
    DomainState session_;
    std::vector<std::string> dirs_;

    using Args = std::vector<std::string>;
    using Handler = std::optional<std::string> (Eros::*)(ScopeId, const Args&);

    void registerCommands();
    void add(const char* name, Handler handler);

    DomainState& mutableState(ScopeId scope);
    bool isRadar(ScopeId scope, Radar radar) const;

    // Stateful commands
    std::optional<std::string> loadRadar(ScopeId scope, const Args& args);
    std::optional<std::string> loadFrequency(ScopeId scope, const Args& args);
    std::optional<std::string> selectLo(ScopeId scope, const Args& args);
    std::optional<std::string> readFrequencyFile(ScopeId scope, const Args& args);
    std::optional<std::string> loadFilter(ScopeId scope, const Args& args);
    std::optional<std::string> startData(ScopeId scope, const Args& args);
    std::optional<std::string> block(ScopeId scope, const Args& args);
    std::optional<std::string> callBlock(ScopeId scope, const Args& args);
    std::optional<std::string> runExperimentCmd(ScopeId scope, const Args& args);
    std::optional<std::string> argv(ScopeId scope, const Args& args);
    std::optional<std::string> isRadarCmd(ScopeId scope, const Args& args);
    std::optional<std::string> getStartTime(ScopeId scope, const Args& args);
    std::optional<std::string> upar(ScopeId scope, const Args& args);

    // Descriptive commands
    std::optional<std::string> armRadar(ScopeId scope, const Args& args);
    std::optional<std::string> disableRecording(ScopeId scope, const Args& args);
    std::optional<std::string> disp(ScopeId scope, const Args& args);
    std::optional<std::string> logbook(ScopeId scope, const Args& args);
    std::optional<std::string> mount(ScopeId scope, const Args& args);
    std::optional<std::string> setFrequency(ScopeId scope, const Args& args);
    std::optional<std::string> setPanelPath(ScopeId scope, const Args& args);
    std::optional<std::string> startRadar(ScopeId scope, const Args& args);
    std::optional<std::string> stopData(ScopeId scope, const Args& args);
    std::optional<std::string> stopRadar(ScopeId scope, const Args& args);
    std::optional<std::string> sync(ScopeId scope, const Args& args);
    std::optional<std::string> timestamp(ScopeId scope, const Args& args);
    std::optional<std::string> transferLo(ScopeId scope, const Args& args);
    std::optional<std::string> writeExperimentFile(ScopeId scope, const Args& args);
};

// Levenshtein distance, used to match program file names
size_t editDistance(const std::string& a, const std::string& b);

} // namespace elan
} // namespace radex
