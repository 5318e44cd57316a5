// Tcl script tokenizer for ELAN/EROS console scripts
//
// Splits a script into commands and words. A word is bare, "quoted",
// {braced} or [bracketed]. Substitution is left to the interpreter; the
// parser only records where each word came from.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace radex {
namespace elan {

enum class WordEnv {
    Bare,       // abc, $x, a[b]c
    Quoted,     // "..."  substitution applies
    Braced,     // {...}  literal
    Bracketed,  // [...]  nested command, result replaces the word
};

struct Word {
    std::string text;           // Without the enclosing quotes, braces or brackets
    WordEnv env = WordEnv::Bare;
    int line = 0;
    int start = 0;              // Column of the first character, 1-based

    // Column one past the end, including the enclosing characters
    int end() const;

    // Text with braces/brackets put back, e.g. "{a b}"
    std::string toString() const;

    bool operator==(const Word& other) const { return text == other.text; }
};

struct TclCommand {
    std::vector<Word> words;
    int line = 0;
    std::string filename = "console";
    int char1 = 0;
    int char2 = 0;

    std::string toString() const;
};

// Error in a console script. Carries the file, line and column range.
class TclError : public std::runtime_error {
public:
    TclError(const std::string& msg, const std::string& filename = "console", int line = 0,
             int char1 = 0, int char2 = 0);

    // Located at the whole command, or at one of its words
    TclError(const std::string& msg, const TclCommand& cmd);
    TclError(const std::string& msg, const TclCommand& cmd, size_t word_index);

    const std::string& message() const { return msg_; }
    const std::string& filename() const { return filename_; }
    int line() const { return line_; }
    int char1() const { return char1_; }
    int char2() const { return char2_; }

private:
    std::string msg_;
    std::string filename_;
    int line_;
    int char1_;
    int char2_;

    static std::string format(const std::string& msg, const std::string& filename, int line,
                              int char1, int char2);
};

class TclParser {
public:
    // Parse a script. Empty commands and comments are dropped.
    // Throws TclError on unbalanced quotes, braces or brackets.
    static std::vector<TclCommand> parse(const std::string& script,
                                         const std::string& filename = "console",
                                         int first_line = 1);

    // Tcl list handling: "a {b c} d" <-> {"a", "b c", "d"}
    static std::vector<std::string> splitList(const std::string& list);
    static std::string formatList(const std::vector<std::string>& elements);
    static std::string formatListElement(const std::string& element);
};

} // namespace elan
} // namespace radex
