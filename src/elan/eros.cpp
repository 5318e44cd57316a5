#include "eros.hpp"
#include "tcl_expr.hpp"
#include "kstconfig/nco.hpp"
#include "radex/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace radex {
namespace elan {

void LoadedFiles::merge(const LoadedFiles& other) {
    if (!other.tbin.empty()) tbin = other.tbin;
    if (!other.rbin.empty()) rbin = other.rbin;
    if (!other.filter.empty()) filter = other.filter;
    if (!other.fil.empty()) fil = other.fil;
    for (size_t i = 0; i < nco.size(); i++) {
        if (!other.nco[i].empty()) nco[i] = other.nco[i];
    }
}

size_t editDistance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
    for (size_t i = 1; i <= a.size(); i++) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Tcl style abbreviation: "pla" -> "plasmaline"
static bool isAbbreviationOf(const std::string& word, const std::string& full) {
    return !word.empty() && startsWith(full, word);
}

static std::string toLower(std::string s) {
    for (char& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

static std::string join(const std::vector<std::string>& words, const char* sep = " ") {
    std::string s;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) s += sep;
        s += words[i];
    }
    return s;
}

// Every run of digits in text: "1,2,3" or "1:3" style channel lists
static std::vector<int> channelList(const std::string& text) {
    std::vector<int> channels;
    size_t i = 0;
    while (i < text.size()) {
        if (std::isdigit(static_cast<unsigned char>(text[i]))) {
            size_t start = i;
            while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
            int ch = std::atoi(text.substr(start, i - start).c_str());
            if (ch < kFirstChannel || ch > kLastChannel) {
                throw std::invalid_argument("No channel " + std::to_string(ch) + " at the receiver");
            }
            channels.push_back(ch);
        } else {
            i++;
        }
    }
    return channels;
}

static std::string channelText(const std::vector<int>& channels) {
    std::vector<std::string> words;
    for (int ch : channels) words.push_back(std::to_string(ch));
    return join(words, ", ");
}

static bool parseNumber(const std::string& s, double& value) {
    const char* begin = s.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0';
}

static bool parseInteger(const std::string& s, long long& value) {
    const char* begin = s.c_str();
    char* end = nullptr;
    value = std::strtoll(begin, &end, 10);
    return end != begin && *end == '\0';
}

static void requireArgs(const std::vector<std::string>& args, size_t min, const char* usage) {
    if (args.size() < min) {
        throw std::invalid_argument(std::string("wrong # args: should be \"") + usage + "\"");
    }
}

// Radar controllers, as named in loadradar / stopradar
static const std::vector<std::string>& controllerNames() {
    static const std::vector<std::string> names = {
        "transmitter", "receiver", "ion line receiver", "plasma line receiver"};
    return names;
}

static std::string controllerName(const std::string& abbreviation) {
    std::vector<std::string> matches;
    for (const auto& name : controllerNames()) {
        if (isAbbreviationOf(abbreviation, name)) {
            matches.push_back(name);
        }
    }
    if (matches.size() != 1) {
        throw std::invalid_argument("\"" + abbreviation + "\" names " +
                                    (matches.empty() ? "no" : "more than one") +
                                    " radar controller");
    }
    return matches[0];
}

// ============================================================================
// Construction
// ============================================================================

Eros::Eros(TclInterpreter& tcl, Radar radar, const std::string& antenna,
           const std::vector<std::string>& experiment_dirs)
    : tcl_(tcl), dirs_(experiment_dirs) {
    if (radar == Radar::Unknown) {
        throw std::invalid_argument("EROS needs a radar (UHF, VHF, ESR, KIR or SOD)");
    }
    for (const char* dir : kDefaultExperimentDirs) {
        dirs_.push_back(dir);
    }

    DomainState initial;
    initial.radar = radar;
    initial.antenna = antenna.empty() ? radarToString(radar) : antenna;
    initial.lo1 = defaultLo1(radar);
    initial.lo2 = defaultLo2(radar);
    for (char device : {'e', 'b', 'r', 't', 'c'}) {
        initial.starttimes[device] = -1;
    }
    session_ = initial;
    for (ScopeId id = 0; id < tcl_.scopeCount(); id++) {
        states_[id] = initial;
    }

    tcl_.setScopeCreatedCallback([this](ScopeId parent, ScopeId child) {
        DomainState copy = state(parent);
        states_[child] = std::move(copy);
    });

    // Variables some scripts test, e.g. if {$32p} at ESR
    tcl_.setVar(TclInterpreter::kGlobalScope, "_radar", radarToString(radar));
    tcl_.setVar(TclInterpreter::kGlobalScope, "_ant", initial.antenna);
    tcl_.setVar(TclInterpreter::kGlobalScope, "32p", initial.antenna == "32p" ? "1" : "0");
    tcl_.setVar(TclInterpreter::kGlobalScope, "42p", initial.antenna == "42p" ? "1" : "0");

    registerCommands();
    LOG_ELAN(DEBUG, "EROS started for the %s radar, antenna %s", radarToString(radar),
             initial.antenna.c_str());
}

std::vector<double> Eros::defaultLo1(Radar radar) {
    switch (radar) {
        case Radar::VHF: return {298, 298};
        case Radar::ESR: return {419, 435, 419, 435};
        case Radar::UHF:
        case Radar::KIR:
        case Radar::SOD: return {812};
        default: throw std::invalid_argument("No local oscillators known for this radar");
    }
}

std::vector<double> Eros::defaultLo2(Radar radar) {
    switch (radar) {
        case Radar::VHF: return {84, 84};
        case Radar::ESR: return {81.25, 81.25, 81.25, 81.25};
        case Radar::UHF:
        case Radar::KIR:
        case Radar::SOD: return {128, 122};
        default: throw std::invalid_argument("No local oscillators known for this radar");
    }
}

void Eros::add(const char* name, Handler handler) {
    tcl_.registerCommand(name, [this, handler](ScopeId scope, const Args& args) {
        return (this->*handler)(scope, args);
    });
}

void Eros::registerCommands() {
    add("loadradar", &Eros::loadRadar);
    add("loadfrequency", &Eros::loadFrequency);
    add("selectlo", &Eros::selectLo);
    add("readfrequencyfile", &Eros::readFrequencyFile);
    add("loadfilter", &Eros::loadFilter);
    add("startdata", &Eros::startData);
    add("block", &Eros::block);
    add("BLOCK", &Eros::block);
    add("callblock", &Eros::callBlock);
    add("runexperiment", &Eros::runExperimentCmd);
    add("argv", &Eros::argv);
    add("isradar", &Eros::isRadarCmd);
    add("getstarttime", &Eros::getStartTime);
    add("upar", &Eros::upar);

    add("armradar", &Eros::armRadar);
    add("disablerecording", &Eros::disableRecording);
    add("disp", &Eros::disp);
    add("logbook", &Eros::logbook);
    add("mount", &Eros::mount);
    add("setfrequency", &Eros::setFrequency);
    add("setpanelpath", &Eros::setPanelPath);
    add("startradar", &Eros::startRadar);
    add("stopdata", &Eros::stopData);
    add("stopradar", &Eros::stopRadar);
    add("sync", &Eros::sync);
    add("SYNC", &Eros::sync);
    add("timestamp", &Eros::timestamp);
    add("transferlo", &Eros::transferLo);
    add("writeexperimentfile", &Eros::writeExperimentFile);

    struct RadarTest {
        const char* name;
        Radar radar;
    };
    static const RadarTest tests[] = {
        {"isuhf", Radar::UHF}, {"isvhf", Radar::VHF}, {"isesr", Radar::ESR},
        {"iskir", Radar::KIR}, {"issod", Radar::SOD},
    };
    for (const auto& test : tests) {
        Radar radar = test.radar;
        tcl_.registerCommand(test.name, [this, radar](ScopeId scope, const Args&) {
            return std::optional<std::string>(isRadar(scope, radar) ? "1" : "0");
        });
    }

    // gotoblock leaves the running block, so it needs to return a flow
    tcl_.registerBuiltin("gotoblock", [](ScopeId, const TclArgs& args) {
        std::string next;
        for (const auto& a : args) next += (next.empty() ? "" : " ") + a.str();
        LOG_ELAN(INFO, "gotoblock %s: terminating the running BLOCK", next.c_str());
        return Result{Flow::JumpBlock, next};
    });

    tcl_.registerBuiltin("loadfile", [this](ScopeId scope, const TclArgs& args) {
        TclArgs words{TclValue("source")};
        words.insert(words.end(), args.begin(), args.end());
        return tcl_.invoke(scope, words);
    });
}

// ============================================================================
// State
// ============================================================================

const DomainState& Eros::state(ScopeId scope) const {
    auto it = states_.find(scope);
    if (it == states_.end()) {
        throw std::out_of_range("No EROS state for scope " + std::to_string(scope));
    }
    return it->second;
}

DomainState& Eros::mutableState(ScopeId scope) {
    auto it = states_.find(scope);
    if (it == states_.end()) {
        throw std::out_of_range("No EROS state for scope " + std::to_string(scope));
    }
    return it->second;
}

bool Eros::isRadar(ScopeId scope, Radar radar) const {
    return state(scope).radar == radar;
}

std::optional<std::string> Eros::findFile(const std::string& name, const std::string& ext) const {
    std::string relative = startsWith(name, "/kst/exp/") ? name.substr(9) : name;
    if (!endsWith(relative, ext)) relative += ext;
    std::string as_given = endsWith(name, ext) ? name : name + ext;

    std::vector<fs::path> candidates = {as_given};
    for (const auto& dir : dirs_) {
        candidates.push_back(fs::path(dir) / relative);
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::string Eros::tlanPath() const {
    const std::string& rbin = session_.files.rbin;
    if (rbin.empty()) {
        throw std::runtime_error("No receiver program was loaded, cannot guess the .tlan file");
    }

    fs::path rbin_path = findFile(rbin, ".rbin").value_or(rbin);
    fs::path dir = rbin_path.parent_path();
    if (dir.empty()) dir = ".";

    fs::path same_name = dir / (rbin_path.stem().string() + ".tlan");
    std::error_code ec;
    if (fs::is_regular_file(same_name, ec)) {
        LOG_ELAN(INFO, "Controller program: %s", same_name.string().c_str());
        return same_name.string();
    }
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("Directory " + dir.string() + " of receiver program " + rbin +
                                 " does not exist");
    }

    // Closest name among the .tlan files next to the rbin
    std::string target = rbin_path.filename().string();
    std::optional<fs::path> best;
    size_t best_distance = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".tlan") {
            continue;
        }
        std::string name = entry.path().filename().string();
        size_t d = editDistance(target, name);
        if (!best || d < best_distance ||
            (d == best_distance && name < best->filename().string())) {
            best = entry.path();
            best_distance = d;
        }
    }
    if (!best) {
        throw std::runtime_error("No .tlan file in " + dir.string() + " for receiver program " +
                                 rbin);
    }
    LOG_ELAN(INFO, "Controller program guessed from %s: %s", target.c_str(),
             best->string().c_str());
    return best->string();
}

void Eros::runExperiment(const std::string& file, const std::string& start,
                         const std::vector<std::string>& args) {
    TclArgs words = {TclValue("runexperiment"), TclValue(file), TclValue(start)};
    for (const auto& a : args) {
        words.push_back(a);
    }
    tcl_.invoke(TclInterpreter::kGlobalScope, words);
}

// ============================================================================
// Stateful commands
// ============================================================================

std::optional<std::string> Eros::loadRadar(ScopeId scope, const Args& args) {
    requireArgs(args, 1, "loadradar controller ?-f file? ?-l loops? ?-s sync?");
    std::string controller = controllerName(args[0]);
    LOG_ELAN(INFO, "Load %s controller", controller.c_str());

    if ((args.size() - 1) % 2 != 0) {
        throw std::invalid_argument("loadradar: option " + args.back() + " needs a value");
    }

    DomainState& st = mutableState(scope);
    for (size_t i = 1; i + 1 < args.size(); i += 2) {
        const std::string& option = args[i];
        const std::string& value = args[i + 1];
        if (option.size() < 2 || option[0] != '-') {
            throw std::invalid_argument("loadradar: expected an option, got " + option);
        }
        switch (option[1]) {
            case 'f':
                if (controller == "transmitter") {
                    st.files.tbin = value;
                    session_.files.tbin = value;
                } else {
                    st.files.rbin = value;
                    session_.files.rbin = value;
                }
                LOG_ELAN(INFO, "  compiled TARLAN program %s", value.c_str());
                break;
            case 'l': {
                long long loops = 0;
                if (!parseInteger(value, loops)) {
                    throw std::invalid_argument("loadradar: loop count " + value +
                                                " is not an integer");
                }
                LOG_ELAN(INFO, "  loop counter %lld", loops);
                break;
            }
            case 's': {
                // Given in 100 ns units
                double sync = 0.0;
                if (!parseNumber(value, sync)) {
                    throw std::invalid_argument("loadradar: sync period " + value +
                                                " is not a number");
                }
                LOG_ELAN(INFO, "  synchronisation period %g us", sync / 10);
                break;
            }
            default:
                LOG_ELAN(WARN, "loadradar: option %s ignored", option.c_str());
                break;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Eros::loadFrequency(ScopeId scope, const Args& args) {
    requireArgs(args, 2, "loadfrequency ?options? ?receiver? file channels");
    size_t n = args.size();
    const std::string& file = args[n - 2];
    std::vector<int> channels = channelList(args[n - 1]);

    bool has_receiver = n > 2 && (isAbbreviationOf(args[n - 3], "plasmaline") ||
                                  isAbbreviationOf(args[n - 3], "ionline"));
    std::string options;
    for (size_t i = 0; i + 2 + (has_receiver ? 1 : 0) < n; i++) {
        if (args[i].size() > 1) {
            options += static_cast<char>(std::tolower(static_cast<unsigned char>(args[i][1])));
        }
    }

    DomainState& st = mutableState(scope);
    for (int ch : channels) {
        st.files.nco[ch - kFirstChannel] = file;
        session_.files.nco[ch - kFirstChannel] = file;
    }

    bool esr = st.radar == Radar::ESR;
    std::string what = options.find('t') != std::string::npos ? "Test" : "Load";
    if (options.find('v') != std::string::npos) what = "Verbose " + toLower(what);
    bool correct = options.find('e') != std::string::npos || esr;
    LOG_ELAN(INFO, "%s %sfrequencies from file %s %sinto channels %s", what.c_str(),
             correct ? "and correct " : "", file.c_str(),
             (options.find('u') != std::string::npos || !esr) ? "uncorrected " : "",
             channelText(channels).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::selectLo(ScopeId scope, const Args& args) {
    if (args.size() < 2 || args.size() > 3) {
        throw std::invalid_argument("wrong # args: should be \"selectlo ?lo? path MHz\"");
    }
    DomainState& st = mutableState(scope);
    const std::string& path = args[args.size() - 2];
    double f = 0.0;
    if (!parseNumber(args.back(), f)) {
        throw std::invalid_argument("selectlo: frequency " + args.back() + " is not a number");
    }

    static const std::map<std::string, int> uhf_paths = {
        {"i", 1}, {"ion", 1}, {"1", 1}, {"p", 2}, {"pla", 2}, {"2", 2}};
    static const std::map<std::string, int> vhf_paths = {
        {"I", 1}, {"A", 1}, {"II", 2}, {"B", 2}};
    static const std::map<std::string, int> esr_paths = {
        {"P1", 1}, {"U32", 1}, {"32U", 1}, {"U32m", 1}, {"U", 1},
        {"P2", 2}, {"D32", 2}, {"32D", 2}, {"D32m", 2}, {"D", 2},
        {"P3", 3}, {"U42", 3}, {"42U", 3}, {"U42m", 3},
        {"P4", 4}, {"D42", 4}, {"42D", 4}, {"D42m", 4}};

    const std::map<std::string, int>* paths = &uhf_paths;
    if (st.radar == Radar::VHF) paths = &vhf_paths;
    if (st.radar == Radar::ESR) paths = &esr_paths;

    auto it = paths->find(path);
    if (it == paths->end()) {
        throw std::invalid_argument("selectlo: unknown receiver path " + path + " at " +
                                    radarToString(st.radar));
    }
    size_t index = static_cast<size_t>(it->second - 1);

    int lo = 0;
    if (args.size() == 3) {
        char last = args[0].empty() ? '\0' : args[0].back();
        if (last != '1' && last != '2') {
            throw std::invalid_argument("selectlo: there is no local oscillator " + args[0]);
        }
        lo = last - '0';
    } else if (st.radar == Radar::ESR) {
        lo = 1;     // Only LO1 can be tuned at ESR
    } else if (st.radar == Radar::VHF) {
        throw std::invalid_argument("selectlo: the local oscillator must be given at VHF");
    } else {
        lo = 2;     // Only LO2 can be tuned at UHF
    }

    std::vector<double>& table = lo == 1 ? st.lo1 : st.lo2;
    if (index >= table.size()) {
        throw std::out_of_range("selectlo: LO" + std::to_string(lo) + " has no path " +
                                std::to_string(index + 1));
    }
    table[index] = f;
    (lo == 1 ? session_.lo1 : session_.lo2)[index] = f;

    LOG_ELAN(INFO, "Select local oscillator frequencies: LO%d, path %s, frequency %g MHz", lo,
             path.c_str(), f);
    return std::nullopt;
}

std::optional<std::string> Eros::readFrequencyFile(ScopeId, const Args& args) {
    requireArgs(args, 2, "readfrequencyfile file address");
    if (args.size() > 2) {
        LOG_ELAN(WARN, "readfrequencyfile: only the first address is read");
    }
    std::optional<std::string> path = findFile(args[0], ".nco");
    if (!path) {
        LOG_ELAN(WARN, "Frequency file %s does not exist, no frequency read", args[0].c_str());
        return std::string();
    }

    std::vector<double> table = kstconfig::Nco::parseFile(*path);
    long long address = 0;
    if (!parseInteger(args[1], address)) {
        throw std::invalid_argument("readfrequencyfile: address " + args[1] +
                                    " is not an integer");
    }
    if (address < 0 || address >= static_cast<long long>(table.size())) {
        throw std::out_of_range("readfrequencyfile: " + *path + " has no address " + args[1]);
    }
    LOG_ELAN(DEBUG, "Read %zu frequencies from %s", table.size(), path->c_str());
    return formatDouble(table[static_cast<size_t>(address)]);
}

std::optional<std::string> Eros::loadFilter(ScopeId scope, const Args& args) {
    requireArgs(args, 2, "loadfilter ?line? file channels ?options?");
    std::string line = "ionline";
    size_t first = 0;
    if (isAbbreviationOf(args[0], "plasmaline")) {
        line = "plasmaline";
        first = 1;
    } else if (isAbbreviationOf(args[0], "ionline")) {
        first = 1;
    }
    if (first + 1 >= args.size()) {
        throw std::invalid_argument("loadfilter: file and channels needed");
    }

    const std::string& file = args[first];
    std::vector<int> channels = channelList(args[first + 1]);
    bool check_only = std::find(args.begin() + first + 2, args.end(), "-T") != args.end();

    DomainState& st = mutableState(scope);
    st.files.filter = file;
    session_.files.filter = file;

    LOG_ELAN(INFO, "%s filter %s for %s into channels %s",
             check_only ? "EROS would check (not load)" : "Load", file.c_str(), line.c_str(),
             channelText(channels).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::startData(ScopeId scope, const Args& args) {
    Args rest = args;
    std::string receiver = "ion";
    if (!rest.empty() && (rest[0] == "ion" || rest[0] == "-ion" || rest[0] == "pla" ||
                          rest[0] == "-pla")) {
        receiver = rest[0][0] == '-' ? rest[0].substr(1) : rest[0];
        rest.erase(rest.begin());
    }
    requireArgs(rest, 3, "startdata ?receiver? corrfile expid iper ?antenna?");

    DomainState& st = mutableState(scope);
    bool esr = st.radar == Radar::ESR;
    if (!esr && receiver == "pla") {
        return std::nullopt;
    }

    std::string antenna = st.antenna;
    if (esr) {
        if (rest.size() < 4) {
            throw std::invalid_argument("startdata: the antenna (32m or 42m) must be given at ESR");
        }
        antenna = rest[3];
    }

    st.files.fil = rest[0];
    session_.files.fil = rest[0];
    LOG_ELAN(INFO, "Start correlator and recorder: file %s, expid %s, integration %s s, antenna %s",
             rest[0].c_str(), rest[1].c_str(), rest[2].c_str(), antenna.c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::block(ScopeId scope, const Args& args) {
    requireArgs(args, 2, "BLOCK name ?args? body");
    TclArgs words(args.begin(), args.end());
    tcl_.defineProc(scope, words, "BLOCK " + args[0]);
    LOG_ELAN(INFO, "BLOCK %s defined", args[0].c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::callBlock(ScopeId scope, const Args& args) {
    requireArgs(args, 1, "callblock name ?args?");
    LOG_ELAN(INFO, "Enters BLOCK %s", args[0].c_str());

    TclArgs words(args.begin(), args.end());
    Result r = tcl_.invoke(scope, words);

    // The block ran in its own scope; keep what it loaded
    std::optional<ScopeId> child = tcl_.lastChildScope(scope);
    if (child) {
        const DomainState& callee = state(*child);
        DomainState& st = mutableState(scope);
        st.files.merge(callee.files);
        st.lo1 = callee.lo1;
        st.lo2 = callee.lo2;
    }
    return r.value.str();
}

std::optional<std::string> Eros::runExperimentCmd(ScopeId scope, const Args& args) {
    requireArgs(args, 2, "runexperiment file start ?args ...?");
    std::optional<std::string> path = findFile(args[0], ".elan");
    if (!path) {
        throw std::runtime_error("Experiment script " + args[0] + " not found");
    }

    DomainState& st = mutableState(scope);
    st.argv.assign(args.begin() + 2, args.end());
    session_.argv = st.argv;

    long long start = 0;
    if (!parseInteger(args[1], start)) {
        start = static_cast<long long>(std::time(nullptr));
    }
    st.starttimes['e'] = static_cast<double>(start);
    session_.starttimes['e'] = static_cast<double>(start);

    // Files named by the script are looked up next to it as well
    std::string dir = fs::path(*path).parent_path().string();
    if (!dir.empty() && std::find(dirs_.begin(), dirs_.end(), dir) == dirs_.end()) {
        dirs_.push_back(dir);
    }

    std::ifstream file(*path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open experiment script " + *path);
    }
    std::stringstream ss;
    ss << file.rdbuf();

    LOG_ELAN(INFO, "Running experiment %s, start %s, arguments: %s", path->c_str(),
             args[1].c_str(), join(st.argv).c_str());
    Result r = tcl_.evalScript(scope, ss.str(), *path);
    return r.value.str();
}

std::optional<std::string> Eros::argv(ScopeId scope, const Args&) {
    return join(state(scope).argv);
}

std::optional<std::string> Eros::isRadarCmd(ScopeId scope, const Args& args) {
    Radar radar = state(scope).radar;
    if (args.empty()) {
        return std::string(radarToString(radar));
    }
    for (const auto& a : args) {
        if (stringToRadar(a) == radar) {
            return std::string("1");
        }
    }
    return std::string("0");
}

std::optional<std::string> Eros::getStartTime(ScopeId scope, const Args& args) {
    requireArgs(args, 1, "getstarttime device");
    char device = static_cast<char>(std::tolower(static_cast<unsigned char>(args[0][0])));
    const auto& starttimes = state(scope).starttimes;
    auto it = starttimes.find(device);
    if (it == starttimes.end()) {
        throw std::invalid_argument("getstarttime: unknown device " + args[0]);
    }
    return std::to_string(static_cast<long long>(it->second));
}

std::optional<std::string> Eros::upar(ScopeId, const Args& args) {
    requireArgs(args, 1, "upar ?option? name ?value?");
    if (args.size() > 3) {
        throw std::invalid_argument("upar takes at most 3 arguments");
    }
    if (args[0] == "alias" && args.size() == 3) {
        LOG_ELAN(INFO, "Alias %s of user parameter %s not created", args[2].c_str(),
                 args[1].c_str());
    } else if (args.size() == 1) {
        LOG_ELAN(INFO, "User parameter %s read as 0", args[0].c_str());
        return std::string("0");
    } else if (args.size() == 2) {
        LOG_ELAN(INFO, "User parameter %s not read", args[1].c_str());
    } else {
        LOG_ELAN(INFO, "User parameter %s not set to %s", args[1].c_str(), args[2].c_str());
    }
    return std::nullopt;
}

// ============================================================================
// Descriptive commands
// ============================================================================

std::optional<std::string> Eros::armRadar(ScopeId, const Args& args) {
    requireArgs(args, 1, "armradar controller");
    LOG_ELAN(INFO, "Arm %s controller: start address and registers set, waiting for start pulse",
             args[0].c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::disableRecording(ScopeId scope, const Args& args) {
    bool esr = isRadar(scope, Radar::ESR);
    std::string receiver = esr && !args.empty() ? args[0] : "ion";
    if (!esr) {
        LOG_ELAN(INFO, "Recording disabled");
    } else if (receiver == "pla") {
        LOG_ELAN(INFO, "Recording of plasma line disabled");
    } else if (receiver == "ion") {
        LOG_ELAN(INFO, "Recording of ion line disabled");
    } else if (receiver == "all") {
        LOG_ELAN(INFO, "Recording of plasma and ion line disabled");
    } else {
        throw std::invalid_argument("disablerecording: unknown receiver " + receiver);
    }
    return std::nullopt;
}

std::optional<std::string> Eros::disp(ScopeId, const Args& args) {
    Args text;
    for (const auto& a : args) {
        if (!startsWith(a, "-")) text.push_back(a);
    }
    LOG_ELAN(INFO, "disp: %s", join(text).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::logbook(ScopeId, const Args& args) {
    LOG_ELAN(INFO, "logbook: %s", join(args).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::mount(ScopeId, const Args& args) {
    LOG_ELAN(WARN, "mount %s: disks should not be mounted from an ELAN script", join(args).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::setFrequency(ScopeId, const Args& args) {
    requireArgs(args, 2, "setfrequency ?options? ?receiver? channels MHz");
    LOG_ELAN(INFO, "Set frequencies of channels %s to %s MHz",
             channelText(channelList(args[args.size() - 2])).c_str(), args.back().c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::setPanelPath(ScopeId scope, const Args& args) {
    if (!isRadar(scope, Radar::VHF)) {
        return std::nullopt;
    }
    if (args.empty()) {
        LOG_ELAN(INFO, "Query panel path");
        return std::nullopt;
    }
    std::string path = toLower(args[0]);
    if (path == "split") {
        LOG_ELAN(INFO, "Panels I and II to ADC 1, III and IV to ADC 2");
    } else if (path == "alla") {
        LOG_ELAN(INFO, "All panels to ADC 1");
    } else if (path == "allb") {
        LOG_ELAN(INFO, "All panels to ADC 2");
    } else {
        LOG_ELAN(WARN, "setpanelpath: unknown panel path %s", args[0].c_str());
    }
    return std::nullopt;
}

std::optional<std::string> Eros::startRadar(ScopeId, const Args& args) {
    requireArgs(args, 1, "startradar time ?period?");
    std::string when = std::toupper(static_cast<unsigned char>(args[0][0])) == 'E' ? "ETIME" : args[0];
    LOG_ELAN(INFO, "Radar controllers start at %s, integration period %s s", when.c_str(),
             args.size() > 1 ? args[1].c_str() : "?");
    return std::nullopt;
}

std::optional<std::string> Eros::stopData(ScopeId, const Args&) {
    LOG_ELAN(INFO, "Stop correlator and recorder");
    return std::nullopt;
}

std::optional<std::string> Eros::stopRadar(ScopeId, const Args& args) {
    std::string controller = args.empty() ? "all" : args[0];
    if (startsWith(controller, "-")) controller = controller.substr(1);
    if (isAbbreviationOf(controller, "all")) {
        LOG_ELAN(INFO, "Stop all radar controllers");
    } else {
        LOG_ELAN(INFO, "Stop %s controller", controllerName(controller).c_str());
    }
    return std::nullopt;
}

std::optional<std::string> Eros::sync(ScopeId, const Args& args) {
    LOG_ELAN(INFO, "SYNC %s", join(args).c_str());
    return std::nullopt;
}

std::optional<std::string> Eros::timestamp(ScopeId, const Args& args) {
    requireArgs(args, 1, "timestamp ?options? seconds");
    long long seconds = 0;
    if (!parseInteger(args.back(), seconds)) {
        throw std::invalid_argument("timestamp: " + args.back() + " is not an integer");
    }
    if (seconds < 0) {
        return std::string();
    }

    bool date = true;
    bool year = true;
    int decimals = 1;
    for (size_t i = 0; i + 1 < args.size(); i++) {
        const std::string& option = args[i];
        if (option == "-noyear") year = false;
        else if (option == "-nodate") date = false;
        else if (option == "-nofrac") decimals = 0;
        else if (option == "-3") decimals = 3;
        else throw std::invalid_argument("timestamp: unknown option " + option);
    }

    std::string format;
    if (date) format += year ? "%d-%m-%Y " : "%d-%m ";
    format += "%H:%M:%S";

    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), format.c_str(), &tm);
    std::string out(buf, len);
    if (decimals > 0) out += "." + std::string(static_cast<size_t>(decimals), '0');
    return out;
}

std::optional<std::string> Eros::transferLo(ScopeId, const Args&) {
    LOG_ELAN(INFO, "Control of the local oscillators transferred (not checked)");
    return std::nullopt;
}

std::optional<std::string> Eros::writeExperimentFile(ScopeId, const Args& args) {
    LOG_ELAN(INFO, "Experiment files to copy: %s", join(args).c_str());
    return std::nullopt;
}

} // namespace elan
} // namespace radex
