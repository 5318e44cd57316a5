#include "tcl_interpreter.hpp"
#include "tcl_expr.hpp"
#include "radex/logging.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace radex {
namespace elan {

const char* flowToString(Flow flow) {
    switch (flow) {
        case Flow::Normal:    return "normal";
        case Flow::Return:    return "return";
        case Flow::Break:     return "break";
        case Flow::Continue:  return "continue";
        case Flow::JumpBlock: return "gotoblock";
        default: return "unknown";
    }
}

// Commands registered under a different name than the script uses
static const std::map<std::string, std::string>& keywordNames() {
    static const std::map<std::string, std::string> names = {
        {"if", "iftest"},
        {"for", "forloop"},
        {"return", "returnval"},
        {"global", "globalvar"},
    };
    return names;
}

static std::string commandName(const std::string& word) {
    auto it = keywordNames().find(word);
    return it == keywordNames().end() ? word : it->second;
}

// Forbidden in expressions
static void checkBlacklist(const std::string& text) {
    static const char* forbidden[] = {"lambda", "__", "\n", ";", "exec"};
    for (const char* word : forbidden) {
        if (text.find(word) != std::string::npos) {
            std::string shown = std::string(word) == "\n" ? "newline" : word;
            throw std::invalid_argument("Tried to evaluate expression with forbidden word: " +
                                        shown);
        }
    }
}

static bool parseInt(const std::string& s, int64_t& value) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return false;
    }
    const char* begin = s.c_str() + start;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(begin, &end, 10);
    if (end == begin || errno == ERANGE) {
        return false;
    }
    while (*end == ' ' || *end == '\t') end++;
    if (*end != '\0') {
        return false;
    }
    value = v;
    return true;
}

static std::string join(const TclArgs& args, size_t from = 0) {
    std::string s;
    for (size_t i = from; i < args.size(); i++) {
        if (i > from) s += ' ';
        s += args[i].str();
    }
    return s;
}

static bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Length of a variable reference starting at text[pos] == '$', or 0 if the
// '$' is literal. name receives the variable name.
static size_t variableReference(const std::string& text, size_t pos, std::string& name) {
    size_t i = pos + 1;
    if (i < text.size() && text[i] == '{') {
        size_t close = text.find('}', i);
        if (close == std::string::npos) {
            return 0;
        }
        name = text.substr(i + 1, close - i - 1);
        return close + 1 - pos;
    }
    size_t start = i;
    while (i < text.size()) {
        if (isNameChar(text[i])) {
            i++;
        } else if (text[i] == ':' && i + 1 < text.size() && text[i + 1] == ':') {
            i += 2;
        } else {
            break;
        }
    }
    if (i == start) {
        return 0;
    }
    name = text.substr(start, i - start);
    return i - pos;
}

// Index of the ']' matching the '[' at text[pos], or npos
static size_t matchingBracket(const std::string& text, size_t pos) {
    int depth = 0;
    int braces = 0;
    for (size_t i = pos; i < text.size(); i++) {
        char c = text[i];
        if (c == '\\') {
            i++;
            continue;
        }
        if (c == '{') {
            braces++;
        } else if (c == '}' && braces > 0) {
            braces--;
        } else if (braces == 0 && c == '[') {
            depth++;
        } else if (braces == 0 && c == ']') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

TclInterpreter::TclInterpreter()
    : out_(&std::cout) {
    scopes_.emplace_back();
    registerBuiltins();
}

void TclInterpreter::registerBuiltins() {
    auto bind = [this](Result (TclInterpreter::*fn)(ScopeId, const TclArgs&)) {
        return [this, fn](ScopeId scope, const TclArgs& args) { return (this->*fn)(scope, args); };
    };

    builtins_["set"] = bind(&TclInterpreter::cmdSet);
    builtins_["expr"] = bind(&TclInterpreter::cmdExpr);
    builtins_["iftest"] = bind(&TclInterpreter::cmdIf);
    builtins_["forloop"] = bind(&TclInterpreter::cmdFor);
    builtins_["incr"] = bind(&TclInterpreter::cmdIncr);
    builtins_["append"] = bind(&TclInterpreter::cmdAppend);
    builtins_["lappend"] = bind(&TclInterpreter::cmdAppend);
    builtins_["list"] = bind(&TclInterpreter::cmdList);
    builtins_["llength"] = bind(&TclInterpreter::cmdLlength);
    builtins_["lindex"] = bind(&TclInterpreter::cmdLindex);
    builtins_["proc"] = bind(&TclInterpreter::cmdProc);
    builtins_["puts"] = bind(&TclInterpreter::cmdPuts);
    builtins_["returnval"] = bind(&TclInterpreter::cmdReturn);
    builtins_["globalvar"] = bind(&TclInterpreter::cmdGlobal);
    builtins_["source"] = bind(&TclInterpreter::cmdSource);
    builtins_["eval"] = bind(&TclInterpreter::cmdEval);
    builtins_["subst"] = bind(&TclInterpreter::cmdSubst);
    builtins_["split"] = bind(&TclInterpreter::cmdSplit);
    builtins_["string"] = bind(&TclInterpreter::cmdString);
    builtins_["info"] = bind(&TclInterpreter::cmdInfo);
    builtins_["exec"] = bind(&TclInterpreter::cmdExec);
    builtins_["break"] = [](ScopeId, const TclArgs&) { return Result{Flow::Break, {}}; };
    builtins_["continue"] = [](ScopeId, const TclArgs&) { return Result{Flow::Continue, {}}; };
}

void TclInterpreter::registerBuiltin(const std::string& name, Builtin handler) {
    builtins_[name] = std::move(handler);
}

void TclInterpreter::registerCommand(const std::string& name, DomainHandler handler) {
    domain_[name] = std::move(handler);
}

bool TclInterpreter::hasCommand(ScopeId scope, const std::string& name) const {
    std::string n = commandName(name);
    return builtins_.count(n) > 0 || domain_.count(n) > 0 || this->scope(scope).procs.count(n) > 0;
}

// ============================================================================
// Scopes and variables
// ============================================================================

const Scope& TclInterpreter::scope(ScopeId id) const {
    if (id >= scopes_.size()) {
        throw std::out_of_range("No Tcl scope " + std::to_string(id));
    }
    return scopes_[id];
}

ScopeId TclInterpreter::createScope(ScopeId parent) {
    Scope child;
    child.parent = parent;
    child.vars = scopes_[parent].vars;
    child.procs = scopes_[parent].procs;
    scopes_.push_back(std::move(child));

    ScopeId id = scopes_.size() - 1;
    if (on_scope_created_) {
        on_scope_created_(parent, id);
    }
    return id;
}

std::optional<ScopeId> TclInterpreter::lastChildScope(ScopeId id) const {
    const auto& log = scope(id).log;
    for (auto it = log.rbegin(); it != log.rend(); ++it) {
        if (it->child) {
            return it->child;
        }
    }
    return std::nullopt;
}

std::vector<std::vector<std::string>> TclInterpreter::callings(ScopeId id,
                                                               const std::set<std::string>& names,
                                                               bool recursive) const {
    std::vector<std::vector<std::string>> result;
    for (const auto& entry : scope(id).log) {
        if (!entry.words.empty() && names.count(entry.words[0]) > 0) {
            result.push_back(entry.words);
        }
        if (recursive && entry.child) {
            auto sub = callings(*entry.child, names, true);
            result.insert(result.end(), sub.begin(), sub.end());
        }
    }
    return result;
}

void TclInterpreter::setVar(ScopeId scope, const std::string& name, const TclValue& value) {
    scopes_.at(scope).vars[name] = value;
}

bool TclInterpreter::hasVar(ScopeId scope, const std::string& name) const {
    return this->scope(scope).vars.count(name) > 0;
}

const TclValue& TclInterpreter::getVar(ScopeId scope, const std::string& name) const {
    const auto& vars = this->scope(scope).vars;
    auto it = vars.find(name);
    if (it == vars.end()) {
        throw std::out_of_range("can't read \"" + name + "\": no such variable");
    }
    return it->second;
}

// ============================================================================
// Evaluation
// ============================================================================

std::string TclInterpreter::eval(const std::string& script, const std::string& filename) {
    Result r = evalScript(kGlobalScope, script, filename);
    if (r.flow == Flow::Break || r.flow == Flow::Continue) {
        LOG_ELAN(WARN, "%s outside of a loop in %s", flowToString(r.flow), filename.c_str());
    }
    return r.value.str();
}

std::string TclInterpreter::evalFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open script " + path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    LOG_ELAN(INFO, "Running %s", path.c_str());
    return eval(ss.str(), path);
}

Result TclInterpreter::evalScript(ScopeId scope, const std::string& script,
                                  const std::string& filename, int first_line) {
    Result last;
    for (const auto& cmd : TclParser::parse(script, filename, first_line)) {
        Result r = execute(scope, cmd);
        if (r.flow != Flow::Normal) {
            return r;
        }
        last = std::move(r);
    }
    return last;
}

TclValue TclInterpreter::substituteWord(ScopeId scope, const TclCommand& cmd, size_t word_index) {
    const Word& word = cmd.words[word_index];
    switch (word.env) {
        case WordEnv::Braced:
            return TclValue(word.text);
        case WordEnv::Bracketed:
            return evalScript(scope, word.text, cmd.filename, word.line).value;
        default:
            return substitute(scope, word.text, &cmd, word_index);
    }
}

TclValue TclInterpreter::substitute(ScopeId scope, const std::string& text,
                                    const TclCommand* origin, size_t word_index) {
    auto fail = [&](const std::string& msg) -> TclError {
        if (origin) {
            return TclError(msg, *origin, word_index);
        }
        return TclError(msg);
    };
    std::string filename = origin ? origin->filename : "console";
    int line = origin && word_index < origin->words.size() ? origin->words[word_index].line : 1;

    auto lookup = [&](const std::string& name) -> const TclValue& {
        if (!hasVar(scope, name)) {
            throw fail("Variable '" + name + "' is not known in Tcl scope!");
        }
        return getVar(scope, name);
    };

    // A word that is a single variable or a single command keeps its value
    if (!text.empty() && text[0] == '$') {
        std::string name;
        size_t len = variableReference(text, 0, name);
        if (len > 0 && len == text.size()) {
            return lookup(name);
        }
    }
    if (!text.empty() && text[0] == '[' && matchingBracket(text, 0) == text.size() - 1) {
        return evalScript(scope, text.substr(1, text.size() - 2), filename, line).value;
    }

    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (c == '\\') {
            if (i + 1 >= text.size()) {
                out += c;
                break;
            }
            char d = text[i + 1];
            i += 2;
            switch (d) {
                case '\n':
                    out += ' ';
                    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) i++;
                    break;
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                case 'a': out += '\a'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'v': out += '\v'; break;
                case 'x':
                case 'o':
                case 'u':
                case 'U':
                    throw fail(std::string("Could not handle escape sequence \\") + d);
                default:
                    out += d;
                    break;
            }
        } else if (c == '$') {
            std::string name;
            size_t len = variableReference(text, i, name);
            if (len == 0) {
                out += c;
                i++;
            } else {
                out += lookup(name).str();
                i += len;
            }
        } else if (c == '[') {
            size_t close = matchingBracket(text, i);
            if (close == std::string::npos) {
                throw fail("Missing close-bracket");
            }
            out += evalScript(scope, text.substr(i + 1, close - i - 1), filename, line).value.str();
            i = close + 1;
        } else {
            out += c;
            i++;
        }
    }
    return TclValue(out);
}

Result TclInterpreter::execute(ScopeId scope, const TclCommand& cmd) {
    if (cmd.words.empty()) {
        return {};
    }
    TclArgs words;
    words.reserve(cmd.words.size());
    for (size_t i = 0; i < cmd.words.size(); i++) {
        words.push_back(substituteWord(scope, cmd, i));
    }
    return invoke(scope, words, &cmd);
}

Result TclInterpreter::invoke(ScopeId scope, const TclArgs& words, const TclCommand* origin) {
    if (words.empty()) {
        return {};
    }
    auto fail = [&](const std::string& msg) -> TclError {
        if (origin) {
            return TclError(msg, *origin);
        }
        return TclError(msg);
    };

    std::string name = commandName(words[0].str());
    TclArgs args(words.begin() + 1, words.end());

    auto builtin = builtins_.find(name);
    auto domain = domain_.find(name);
    std::shared_ptr<const Proc> proc;
    if (builtin == builtins_.end() && domain == domain_.end()) {
        const auto& procs = scopes_[scope].procs;
        auto it = procs.find(name);
        if (it == procs.end()) {
            if (origin) {
                throw TclError("Command '" + words[0].str() + "' is not known", *origin, 0);
            }
            throw TclError("Command '" + words[0].str() + "' is not known");
        }
        proc = it->second;
    }

    LogEntry entry;
    for (const auto& w : words) {
        entry.words.push_back(w.str());
    }
    size_t log_index = scopes_[scope].log.size();
    scopes_[scope].log.push_back(std::move(entry));

    LOG_ELAN(TRACE, "[%zu] %s", scope, join(words).c_str());

    Result result;
    try {
        if (builtin != builtins_.end()) {
            result = builtin->second(scope, args);
        } else if (domain != domain_.end()) {
            std::vector<std::string> sargs;
            for (const auto& a : args) {
                sargs.push_back(a.str());
            }
            std::optional<std::string> r = domain->second(scope, sargs);
            if (r) {
                result.value = *r;
            }
        } else {
            result = callProc(scope, *proc, args, log_index);
        }
    } catch (const TclError&) {
        throw;
    } catch (const std::exception& e) {
        throw fail(words[0].str() + ": " + e.what());
    }

    scopes_[scope].log[log_index].result = result.value.str();
    return result;
}

Result TclInterpreter::callProc(ScopeId caller, const Proc& proc, const TclArgs& args,
                                size_t log_index) {
    size_t nparams = proc.params.size();
    if (args.size() > nparams && !proc.variadic) {
        throw std::invalid_argument("wrong # args: " + proc.name + " takes at most " +
                                    std::to_string(nparams) + " arguments, got " +
                                    std::to_string(args.size()));
    }

    if (call_depth_ >= max_call_depth_) {
        throw std::runtime_error("too many nested procedure calls (limit " +
                                 std::to_string(max_call_depth_) + ") in " + proc.name);
    }
    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { depth++; }
        ~DepthGuard() { depth--; }
    } guard(call_depth_);

    ScopeId child = createScope(caller);
    scopes_[caller].log[log_index].child = child;

    for (size_t i = 0; i < nparams; i++) {
        if (i < args.size()) {
            setVar(child, proc.params[i], args[i]);
        } else if (proc.defaults[i]) {
            setVar(child, proc.params[i], *proc.defaults[i]);
        } else {
            size_t required = 0;
            for (const auto& d : proc.defaults) {
                if (!d) required++;
            }
            throw std::invalid_argument("wrong # args: " + proc.name + " needs at least " +
                                        std::to_string(required) + " arguments, no value for '" +
                                        proc.params[i] + "'");
        }
    }
    if (proc.variadic) {
        setVar(child, "args", args.size() > nparams ? join(args, nparams) : "");
    }

    Result r = evalScript(child, proc.body, proc.filename, proc.line);

    Result out;
    if (r.flow == Flow::Return) {
        out.value = r.value;
    }
    return out;
}

std::string TclInterpreter::evalExpr(ScopeId scope, const std::string& expression) {
    checkBlacklist(expression);

    ExprCallbacks cb;
    cb.variable = [this, scope](const std::string& name) {
        std::string s = getVar(scope, name).str();
        checkBlacklist(s);
        return s;
    };
    cb.command = [this, scope](const std::string& script) {
        std::string s = evalScript(scope, script, "expr").value.str();
        checkBlacklist(s);
        return s;
    };
    cb.substitute = [this, scope](const std::string& text) {
        std::string s = substitute(scope, text).str();
        checkBlacklist(s);
        return s;
    };

    TclExpr expr(cb);
    return expr.evaluate(expression).toString();
}

bool TclInterpreter::evalCondition(ScopeId scope, const std::string& expression) {
    return ExprValue::parse(evalExpr(scope, expression)).truthy();
}

void TclInterpreter::defineProc(ScopeId scope, const TclArgs& args, const std::string& filename,
                                int line) {
    if (args.size() < 2 || args.size() > 3) {
        throw std::invalid_argument("wrong # args: should be \"proc name args body\"");
    }

    Proc p;
    p.name = args[0].str();
    p.body = args.back().str();
    p.filename = filename;
    p.line = line;

    if (args.size() == 3) {
        std::vector<std::string> params = TclParser::splitList(args[1].str());
        for (size_t k = 0; k < params.size(); k++) {
            std::vector<std::string> parts = TclParser::splitList(params[k]);
            if (parts.empty()) {
                throw std::invalid_argument("argument with no name in proc " + p.name);
            }
            if (parts.size() > 2) {
                throw std::invalid_argument("too many fields in argument specifier \"" +
                                            params[k] + "\"");
            }
            if (parts[0] == "args" && parts.size() == 1 && k == params.size() - 1) {
                p.variadic = true;
                continue;
            }
            p.params.push_back(parts[0]);
            if (parts.size() == 2) {
                p.defaults.push_back(parts[1]);
            } else {
                p.defaults.push_back(std::nullopt);
            }
        }
    }

    std::string name = p.name;
    scopes_.at(scope).procs[name] = std::make_shared<const Proc>(std::move(p));
    LOG_ELAN(DEBUG, "proc %s defined", name.c_str());
}

// ============================================================================
// Built-in commands
// ============================================================================

Result TclInterpreter::cmdSet(ScopeId scope, const TclArgs& args) {
    if (args.size() == 1) {
        return {Flow::Normal, getVar(scope, args[0].str())};
    }
    if (args.size() != 2) {
        throw std::invalid_argument("wrong # args: should be \"set varName ?newValue?\"");
    }
    setVar(scope, args[0].str(), args[1]);
    return {Flow::Normal, args[1]};
}

Result TclInterpreter::cmdExpr(ScopeId scope, const TclArgs& args) {
    if (args.empty()) {
        throw std::invalid_argument("wrong # args: should be \"expr arg ?arg ...?\"");
    }
    return {Flow::Normal, evalExpr(scope, join(args))};
}

Result TclInterpreter::cmdIf(ScopeId scope, const TclArgs& args) {
    size_t i = 0;
    while (true) {
        if (i >= args.size()) {
            throw std::invalid_argument("wrong # args: no expression after \"if\"");
        }
        std::string cond = args[i++].str();
        if (i < args.size() && args[i].str() == "then") {
            i++;
        }
        if (i >= args.size()) {
            throw std::invalid_argument("wrong # args: no script following \"" + cond +
                                        "\" argument");
        }
        const TclValue& body = args[i++];

        if (evalCondition(scope, cond)) {
            return evalScript(scope, body.str(), "if " + cond);
        }
        if (i >= args.size()) {
            return {};
        }

        std::string word = args[i].str();
        if (word == "elseif") {
            i++;
            continue;
        }
        if (word == "else") {
            i++;
            if (i >= args.size()) {
                throw std::invalid_argument("wrong # args: no script following \"else\" argument");
            }
        }
        return evalScript(scope, args[i].str(), "else");
    }
}

Result TclInterpreter::cmdFor(ScopeId scope, const TclArgs& args) {
    if (args.size() != 4) {
        throw std::invalid_argument("wrong # args: should be \"for start test next command\"");
    }
    const std::string start = args[0].str();
    const std::string test = args[1].str();
    const std::string next = args[2].str();
    const std::string body = args[3].str();

    Result r = evalScript(scope, start, "for");
    if (r.flow == Flow::Return || r.flow == Flow::JumpBlock) {
        return r;
    }

    int iterations = 0;
    while (evalCondition(scope, test)) {
        if (iterations >= max_loop_iterations_) {
            LOG_ELAN(WARN, "for loop {%s} stopped after %d iterations", test.c_str(), iterations);
            break;
        }
        iterations++;

        Result b = evalScript(scope, body, "for");
        if (b.flow == Flow::Break) {
            break;
        }
        if (b.flow == Flow::Return || b.flow == Flow::JumpBlock) {
            return b;
        }

        Result n = evalScript(scope, next, "for");
        if (n.flow == Flow::Return || n.flow == Flow::JumpBlock) {
            return n;
        }
    }
    return {};
}

Result TclInterpreter::cmdIncr(ScopeId scope, const TclArgs& args) {
    if (args.empty() || args.size() > 2) {
        throw std::invalid_argument("wrong # args: should be \"incr varName ?increment?\"");
    }
    std::string name = args[0].str();

    int64_t increment = 1;
    if (args.size() == 2 && !parseInt(args[1].str(), increment)) {
        throw std::invalid_argument("expected integer but got \"" + args[1].str() + "\"");
    }

    int64_t value = 0;
    if (hasVar(scope, name) && !parseInt(getVar(scope, name).str(), value)) {
        throw std::invalid_argument("expected integer but got \"" + getVar(scope, name).str() +
                                    "\"");
    }

    TclValue result(std::to_string(value + increment));
    setVar(scope, name, result);
    return {Flow::Normal, result};
}

Result TclInterpreter::cmdAppend(ScopeId scope, const TclArgs& args) {
    if (args.empty()) {
        throw std::invalid_argument("wrong # args: the name of the list is needed");
    }
    std::string name = args[0].str();

    std::vector<std::string> elements;
    if (hasVar(scope, name)) {
        elements = getVar(scope, name).asList();
    }
    for (size_t i = 1; i < args.size(); i++) {
        elements.push_back(args[i].str());
    }

    TclValue list = TclValue::fromList(elements);
    setVar(scope, name, list);
    return {Flow::Normal, list};
}

Result TclInterpreter::cmdList(ScopeId, const TclArgs& args) {
    std::vector<std::string> elements;
    for (const auto& a : args) {
        elements.push_back(a.str());
    }
    return {Flow::Normal, TclValue::fromList(elements)};
}

Result TclInterpreter::cmdLlength(ScopeId, const TclArgs& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("wrong # args: should be \"llength list\"");
    }
    return {Flow::Normal, std::to_string(args[0].asList().size())};
}

Result TclInterpreter::cmdLindex(ScopeId, const TclArgs& args) {
    if (args.empty() || args.size() > 2) {
        throw std::invalid_argument("wrong # args: should be \"lindex list ?index?\"");
    }
    if (args.size() == 1) {
        return {Flow::Normal, args[0]};
    }

    std::vector<std::string> elements = args[0].asList();
    std::string index = args[1].str();
    int64_t i = 0;
    if (index.rfind("end", 0) == 0) {
        int64_t offset = 0;
        if (index.size() > 3 && (index[3] != '-' || !parseInt(index.substr(4), offset))) {
            throw std::invalid_argument("bad index \"" + index + "\"");
        }
        i = static_cast<int64_t>(elements.size()) - 1 - offset;
    } else if (!parseInt(index, i)) {
        throw std::invalid_argument("bad index \"" + index + "\"");
    }

    if (i < 0 || i >= static_cast<int64_t>(elements.size())) {
        return {};
    }
    return {Flow::Normal, elements[static_cast<size_t>(i)]};
}

Result TclInterpreter::cmdProc(ScopeId scope, const TclArgs& args) {
    defineProc(scope, args);
    return {};
}

Result TclInterpreter::cmdPuts(ScopeId, const TclArgs& args) {
    bool newline = true;
    size_t i = 0;
    if (args.size() >= 2 && args[0].str() == "-nonewline") {
        newline = false;
        i = 1;
    }

    std::string channel = "stdout";
    const TclValue* text = nullptr;
    if (args.size() - i == 1) {
        text = &args[i];
    } else if (args.size() - i == 2) {
        channel = args[i].str();
        text = &args[i + 1];
    } else {
        throw std::invalid_argument("wrong # args: should be \"puts ?-nonewline? ?channelId? string\"");
    }

    std::ostream& out = channel == "stderr" ? std::cerr : *out_;
    out << text->str();
    if (newline) {
        out << '\n';
    }
    return {};
}

Result TclInterpreter::cmdReturn(ScopeId, const TclArgs& args) {
    Result r;
    r.flow = Flow::Return;
    if (!args.empty()) {
        r.value = args.back();
    }
    return r;
}

Result TclInterpreter::cmdGlobal(ScopeId, const TclArgs& args) {
    // Procedures see a copy of the caller's variables already
    LOG_ELAN(DEBUG, "global %s ignored", join(args).c_str());
    return {};
}

Result TclInterpreter::cmdSource(ScopeId scope, const TclArgs& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("wrong # args: should be \"source fileName\"");
    }
    std::string path = args[0].str();
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ELAN(WARN, "source: %s not found, not executed", path.c_str());
        return {};
    }
    std::stringstream ss;
    ss << file.rdbuf();
    LOG_ELAN(INFO, "Sourcing %s", path.c_str());

    Result r = evalScript(scope, ss.str(), path);
    if (r.flow == Flow::JumpBlock) {
        return r;
    }
    return {Flow::Normal, r.value};
}

Result TclInterpreter::cmdEval(ScopeId scope, const TclArgs& args) {
    return evalScript(scope, join(args), "eval");
}

Result TclInterpreter::cmdSubst(ScopeId scope, const TclArgs& args) {
    if (args.empty()) {
        throw std::invalid_argument("wrong # args: should be \"subst string\"");
    }
    return {Flow::Normal, substitute(scope, args.back().str())};
}

Result TclInterpreter::cmdSplit(ScopeId, const TclArgs& args) {
    if (args.empty() || args.size() > 2) {
        throw std::invalid_argument("wrong # args: should be \"split string ?splitChars?\"");
    }
    std::string s = args[0].str();
    std::string chars = args.size() == 2 ? args[1].str() : " \t\n\r";

    std::vector<std::string> elements;
    if (chars.empty()) {
        for (char c : s) {
            elements.push_back(std::string(1, c));
        }
        return {Flow::Normal, TclValue::fromList(elements)};
    }

    std::string current;
    for (char c : s) {
        if (chars.find(c) != std::string::npos) {
            elements.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    elements.push_back(current);
    return {Flow::Normal, TclValue::fromList(elements)};
}

Result TclInterpreter::cmdString(ScopeId, const TclArgs& args) {
    if (args.size() < 2) {
        throw std::invalid_argument("wrong # args: should be \"string subcommand string\"");
    }
    std::string sub = args[0].str();

    if (sub == "tolower" || sub == "toupper") {
        std::string s = args[1].str();
        for (char& c : s) {
            c = static_cast<char>(sub == "tolower" ? std::tolower(static_cast<unsigned char>(c))
                                                   : std::toupper(static_cast<unsigned char>(c)));
        }
        return {Flow::Normal, s};
    }
    if (sub == "length") {
        return {Flow::Normal, std::to_string(args[1].str().size())};
    }
    if (sub == "equal") {
        bool nocase = args.size() == 4 && args[1].str() == "-nocase";
        if (args.size() != 3 && !nocase) {
            throw std::invalid_argument("wrong # args: should be \"string equal ?-nocase? a b\"");
        }
        std::string a = args[args.size() - 2].str();
        std::string b = args[args.size() - 1].str();
        if (nocase) {
            for (char& c : a) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            for (char& c : b) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return {Flow::Normal, a == b ? "1" : "0"};
    }
    throw std::invalid_argument("unknown or unsupported subcommand \"string " + sub + "\"");
}

Result TclInterpreter::cmdInfo(ScopeId scope, const TclArgs& args) {
    if (args.size() == 2 && args[0].str() == "exists") {
        return {Flow::Normal, hasVar(scope, args[1].str()) ? "1" : "0"};
    }
    throw std::invalid_argument("unsupported info subcommand, only \"info exists varName\" is known");
}

Result TclInterpreter::cmdExec(ScopeId, const TclArgs& args) {
    LOG_ELAN(WARN, "exec %s refused, external programs are never run", join(args).c_str());
    return {};
}

} // namespace elan
} // namespace radex
