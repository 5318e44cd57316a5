// Tcl interpreter for ELAN/EROS console scripts
//
// Implements the subset of Tcl used to configure and start radar
// experiments. Domain commands (the EROS catalog) are plugged in through
// registerCommand() / registerBuiltin().
//
// Scopes live in an arena owned by the interpreter and are referred to by
// index. A procedure call creates a child scope holding a copy of the
// caller's variables and procedures.

#pragma once

#include "tcl_parser.hpp"
#include "tcl_value.hpp"

#include <deque>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace radex {
namespace elan {

using ScopeId = size_t;

// How a script stopped
enum class Flow {
    Normal,
    Return,     // return
    Break,      // break
    Continue,   // continue
    JumpBlock,  // gotoblock: leave the running block
};

const char* flowToString(Flow flow);

struct Result {
    Flow flow = Flow::Normal;
    TclValue value;
};

struct Proc {
    std::string name;
    std::vector<std::string> params;                    // Without the trailing "args"
    std::vector<std::optional<std::string>> defaults;   // Parallel to params
    bool variadic = false;                              // Last parameter is "args"
    std::string body;
    std::string filename;
    int line = 0;
};

struct LogEntry {
    std::vector<std::string> words;
    std::string result;
    std::optional<ScopeId> child;   // Scope of a procedure call
};

struct Scope {
    std::optional<ScopeId> parent;
    std::map<std::string, TclValue> vars;
    std::map<std::string, std::shared_ptr<const Proc>> procs;
    std::vector<LogEntry> log;
};

class TclInterpreter {
public:
    static constexpr ScopeId kGlobalScope = 0;
    static constexpr int kDefaultMaxLoopIterations = 1000;
    static constexpr int kDefaultMaxCallDepth = 200;

    // Full access: may return any Flow and evaluate scripts
    using Builtin = std::function<Result(ScopeId scope, const TclArgs& args)>;

    // Domain command contract: (scope, argument words) -> optional result
    using DomainHandler =
        std::function<std::optional<std::string>(ScopeId scope, const std::vector<std::string>& args)>;

    using ScopeCreatedCallback = std::function<void(ScopeId parent, ScopeId child)>;

    TclInterpreter();

    // Run a script in the global scope and return the last command's result.
    // Return and gotoblock stop the script.
    std::string eval(const std::string& script, const std::string& filename = "console");

    // Run a file in the global scope. Throws std::runtime_error if it cannot be read.
    std::string evalFile(const std::string& path);

    // Run a script in a scope. The flow of the stopping command is returned.
    Result evalScript(ScopeId scope, const std::string& script,
                      const std::string& filename = "console", int first_line = 1);

    // Substitute and run one parsed command
    Result execute(ScopeId scope, const TclCommand& cmd);

    // Run a command from already substituted words
    Result invoke(ScopeId scope, const TclArgs& words, const TclCommand* origin = nullptr);

    // Backslash, variable and command substitution of text
    TclValue substitute(ScopeId scope, const std::string& text,
                        const TclCommand* origin = nullptr, size_t word_index = 0);

    // expr on a text, in the given scope
    std::string evalExpr(ScopeId scope, const std::string& expression);
    bool evalCondition(ScopeId scope, const std::string& expression);

    void registerBuiltin(const std::string& name, Builtin handler);
    void registerCommand(const std::string& name, DomainHandler handler);
    bool hasCommand(ScopeId scope, const std::string& name) const;

    // proc name ?params? body
    void defineProc(ScopeId scope, const TclArgs& args, const std::string& filename = "console",
                    int line = 0);

    // Variables
    void setVar(ScopeId scope, const std::string& name, const TclValue& value);
    bool hasVar(ScopeId scope, const std::string& name) const;
    // Throws std::out_of_range for an unknown variable
    const TclValue& getVar(ScopeId scope, const std::string& name) const;

    // Scope arena
    const Scope& scope(ScopeId id) const;
    size_t scopeCount() const { return scopes_.size(); }
    // Child scope of the last procedure call made from this scope
    std::optional<ScopeId> lastChildScope(ScopeId id) const;

    // Words of every logged call to one of the named commands, in call
    // order. With recursive, calls inside procedures are included.
    std::vector<std::vector<std::string>> callings(ScopeId id, const std::set<std::string>& names,
                                                   bool recursive = true) const;

    void setScopeCreatedCallback(ScopeCreatedCallback cb) { on_scope_created_ = std::move(cb); }

    // puts writes here (default std::cout)
    void setOutput(std::ostream& out) { out_ = &out; }
    std::ostream& output() { return *out_; }

    void setMaxLoopIterations(int n) { max_loop_iterations_ = n; }
    int maxLoopIterations() const { return max_loop_iterations_; }

    // Nesting bound on procedure calls, deeper calls fail with TclError
    void setMaxCallDepth(int n) { max_call_depth_ = n; }
    int maxCallDepth() const { return max_call_depth_; }

private:
    std::deque<Scope> scopes_;
    std::map<std::string, Builtin> builtins_;
    std::map<std::string, DomainHandler> domain_;
    ScopeCreatedCallback on_scope_created_;
    std::ostream* out_;
    int max_loop_iterations_ = kDefaultMaxLoopIterations;
    int max_call_depth_ = kDefaultMaxCallDepth;
    int call_depth_ = 0;

    void registerBuiltins();

    ScopeId createScope(ScopeId parent);
    Result callProc(ScopeId caller, const Proc& proc, const TclArgs& args, size_t log_index);

    TclValue substituteWord(ScopeId scope, const TclCommand& cmd, size_t word_index);

    // Built-in commands
    Result cmdSet(ScopeId scope, const TclArgs& args);
    Result cmdExpr(ScopeId scope, const TclArgs& args);
    Result cmdIf(ScopeId scope, const TclArgs& args);
    Result cmdFor(ScopeId scope, const TclArgs& args);
    Result cmdIncr(ScopeId scope, const TclArgs& args);
    Result cmdAppend(ScopeId scope, const TclArgs& args);
    Result cmdList(ScopeId scope, const TclArgs& args);
    Result cmdLlength(ScopeId scope, const TclArgs& args);
    Result cmdLindex(ScopeId scope, const TclArgs& args);
    Result cmdProc(ScopeId scope, const TclArgs& args);
    Result cmdPuts(ScopeId scope, const TclArgs& args);
    Result cmdReturn(ScopeId scope, const TclArgs& args);
    Result cmdGlobal(ScopeId scope, const TclArgs& args);
    Result cmdSource(ScopeId scope, const TclArgs& args);
    Result cmdEval(ScopeId scope, const TclArgs& args);
    Result cmdSubst(ScopeId scope, const TclArgs& args);
    Result cmdSplit(ScopeId scope, const TclArgs& args);
    Result cmdString(ScopeId scope, const TclArgs& args);
    Result cmdInfo(ScopeId scope, const TclArgs& args);
    Result cmdExec(ScopeId scope, const TclArgs& args);
};

} // namespace elan
} // namespace radex
