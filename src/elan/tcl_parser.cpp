#include "tcl_parser.hpp"

#include <cctype>

namespace radex {
namespace elan {

int Word::end() const {
    int wrap = env == WordEnv::Bare ? 0 : 2;
    return start + static_cast<int>(text.size()) + wrap;
}

std::string Word::toString() const {
    switch (env) {
        case WordEnv::Quoted:    return "\"" + text + "\"";
        case WordEnv::Braced:    return "{" + text + "}";
        case WordEnv::Bracketed: return "[" + text + "]";
        default: return text;
    }
}

std::string TclCommand::toString() const {
    std::string s;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) s += ' ';
        s += words[i].toString();
    }
    return s;
}

// ============================================================================
// TclError
// ============================================================================

std::string TclError::format(const std::string& msg, const std::string& filename, int line,
                             int char1, int char2) {
    std::string s = filename;
    if (line > 0) {
        s += ", line " + std::to_string(line);
    }
    if (char1 > 0) {
        if (char2 > char1) {
            s += ", chars " + std::to_string(char1) + "-" + std::to_string(char2);
        } else {
            s += ", char " + std::to_string(char1);
        }
    }
    return s + ": " + msg;
}

TclError::TclError(const std::string& msg, const std::string& filename, int line, int char1,
                   int char2)
    : std::runtime_error(format(msg, filename, line, char1, char2)),
      msg_(msg), filename_(filename), line_(line), char1_(char1), char2_(char2) {}

TclError::TclError(const std::string& msg, const TclCommand& cmd)
    : TclError(msg, cmd.filename, cmd.line, cmd.char1, cmd.char2) {}

TclError::TclError(const std::string& msg, const TclCommand& cmd, size_t word_index)
    : TclError(msg, cmd.filename,
               word_index < cmd.words.size() ? cmd.words[word_index].line : cmd.line,
               word_index < cmd.words.size() ? cmd.words[word_index].start : cmd.char1,
               word_index < cmd.words.size() ? cmd.words[word_index].end() : cmd.char2) {}

// ============================================================================
// Script scanner
// ============================================================================

namespace {

bool isSeparator(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ';';
}

class Scanner {
public:
    Scanner(const std::string& script, const std::string& filename, int first_line)
        : s_(script), filename_(filename), line_(first_line) {}

    std::vector<TclCommand> run() {
        std::vector<TclCommand> commands;
        std::vector<Word> words;

        auto finish = [&]() {
            if (words.empty()) {
                return;
            }
            TclCommand cmd;
            cmd.words = std::move(words);
            cmd.line = cmd.words.front().line;
            cmd.filename = filename_;
            cmd.char1 = cmd.words.front().start;
            cmd.char2 = cmd.words.back().end();
            commands.push_back(std::move(cmd));
            words.clear();
        };

        while (!atEnd()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r') {
                advance();
            } else if (skipContinuation()) {
                // Joins lines, acts as a word separator
            } else if (c == '\n' || c == ';') {
                finish();
                advance();
            } else if (c == '#' && words.empty()) {
                skipComment();
            } else if (c == '#') {
                fail("Cannot start a comment here, end the command with ';' first");
            } else {
                words.push_back(readWord());
            }
        }
        finish();
        return commands;
    }

private:
    const std::string& s_;
    std::string filename_;
    size_t pos_ = 0;
    int line_;
    int col_ = 1;

    bool atEnd() const { return pos_ >= s_.size(); }
    char peek(size_t offset = 0) const {
        return pos_ + offset < s_.size() ? s_[pos_ + offset] : '\0';
    }

    void advance() {
        if (s_[pos_] == '\n') {
            line_++;
            col_ = 1;
        } else {
            col_++;
        }
        pos_++;
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw TclError(msg, filename_, line_, col_);
    }

    // Backslash-newline plus the blanks after it
    bool skipContinuation() {
        if (peek() != '\\' || peek(1) != '\n') {
            return false;
        }
        advance();
        advance();
        while (peek() == ' ' || peek() == '\t') {
            advance();
        }
        return true;
    }

    void skipComment() {
        while (!atEnd() && peek() != '\n') {
            if (peek() == '\\' && peek(1) == '\n') {
                advance();
            }
            advance();
        }
    }

    void copyEscape(std::string& text) {
        text += peek();
        advance();
        if (!atEnd()) {
            text += peek();
            advance();
        }
    }

    void checkWordEnd(const char* what) {
        if (atEnd() || isSeparator(peek()) || (peek() == '\\' && peek(1) == '\n')) {
            return;
        }
        fail(std::string("Extra characters after ") + what);
    }

    Word readWord() {
        Word word;
        word.line = line_;
        word.start = col_;

        char c = peek();
        if (c == '{') {
            word.env = WordEnv::Braced;
            word.text = readBraced();
        } else if (c == '"') {
            word.env = WordEnv::Quoted;
            word.text = readQuoted();
        } else {
            readBare(word);
        }
        return word;
    }

    std::string readBraced() {
        int line = line_;
        int start = col_;
        advance();

        std::string text;
        int depth = 1;
        while (true) {
            if (atEnd()) {
                throw TclError("Missing close-brace", filename_, line, start);
            }
            if (skipContinuation()) {
                text += ' ';
                continue;
            }
            char c = peek();
            if (c == '\\') {
                copyEscape(text);
                continue;
            }
            if (c == '{') {
                depth++;
            } else if (c == '}') {
                depth--;
                if (depth == 0) {
                    advance();
                    break;
                }
            }
            text += c;
            advance();
        }
        checkWordEnd("close-brace");
        return text;
    }

    std::string readQuoted() {
        int line = line_;
        int start = col_;
        advance();

        std::string text;
        int brackets = 0;
        while (true) {
            if (atEnd()) {
                throw TclError("Missing close-quote", filename_, line, start);
            }
            if (skipContinuation()) {
                text += ' ';
                continue;
            }
            char c = peek();
            if (c == '\\') {
                copyEscape(text);
                continue;
            }
            if (c == '[') {
                brackets++;
            } else if (c == ']' && brackets > 0) {
                brackets--;
            } else if (c == '"' && brackets == 0) {
                advance();
                break;
            }
            text += c;
            advance();
        }
        checkWordEnd("close-quote");
        return text;
    }

    // Copy a {...} group inside brackets so that brackets in it do not count
    void copyBraceGroup(std::string& text) {
        int depth = 0;
        do {
            if (atEnd()) {
                fail("Missing close-brace");
            }
            char c = peek();
            if (c == '\\') {
                copyEscape(text);
                continue;
            }
            if (c == '{') depth++;
            if (c == '}') depth--;
            text += c;
            advance();
        } while (depth > 0);
    }

    void readBare(Word& word) {
        std::string text;
        int depth = 0;
        size_t first_close = std::string::npos;

        while (!atEnd()) {
            char c = peek();
            if (depth == 0 && (isSeparator(c) || (c == '\\' && peek(1) == '\n'))) {
                break;
            }
            if (c == '\\') {
                copyEscape(text);
                continue;
            }
            if (depth == 0 && c == '$' && peek(1) == '{') {
                while (!atEnd() && peek() != '}') {
                    text += peek();
                    advance();
                }
                if (atEnd()) {
                    fail("Missing close-brace for variable name");
                }
                text += '}';
                advance();
                continue;
            } else if (depth > 0 && c == '{') {
                copyBraceGroup(text);
                continue;
            } else if (c == '[') {
                depth++;
            } else if (c == ']' && depth > 0) {
                depth--;
                if (depth == 0 && first_close == std::string::npos) {
                    first_close = text.size();
                }
            }
            text += c;
            advance();
        }
        if (depth > 0) {
            throw TclError("Missing close-bracket", filename_, word.line, word.start);
        }

        if (!text.empty() && text.front() == '[' && first_close == text.size() - 1) {
            word.env = WordEnv::Bracketed;
            word.text = text.substr(1, text.size() - 2);
        } else {
            word.env = WordEnv::Bare;
            word.text = text;
        }
    }
};

} // namespace

std::vector<TclCommand> TclParser::parse(const std::string& script, const std::string& filename,
                                         int first_line) {
    Scanner scanner(script, filename, first_line);
    return scanner.run();
}

// ============================================================================
// Lists
// ============================================================================

static char unescape(char c) {
    switch (c) {
        case 'n': return '\n';
        case 't': return '\t';
        case 'r': return '\r';
        default: return c;
    }
}

std::vector<std::string> TclParser::splitList(const std::string& list) {
    std::vector<std::string> result;
    size_t i = 0;
    const size_t n = list.size();

    auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };

    while (true) {
        while (i < n && isSpace(list[i])) i++;
        if (i >= n) break;

        std::string element;
        if (list[i] == '{') {
            int depth = 1;
            i++;
            while (i < n) {
                char c = list[i];
                if (c == '\\' && i + 1 < n) {
                    element += c;
                    element += list[i + 1];
                    i += 2;
                    continue;
                }
                if (c == '{') depth++;
                if (c == '}' && --depth == 0) break;
                element += c;
                i++;
            }
            if (i >= n) {
                throw std::invalid_argument("unmatched open brace in list");
            }
            i++;
            if (i < n && !isSpace(list[i])) {
                throw std::invalid_argument("list element in braces followed by \"" +
                                            list.substr(i, 1) + "\" instead of space");
            }
        } else if (list[i] == '"') {
            i++;
            while (i < n && list[i] != '"') {
                if (list[i] == '\\' && i + 1 < n) {
                    element += unescape(list[i + 1]);
                    i += 2;
                    continue;
                }
                element += list[i];
                i++;
            }
            if (i >= n) {
                throw std::invalid_argument("unmatched open quote in list");
            }
            i++;
        } else {
            while (i < n && !isSpace(list[i])) {
                if (list[i] == '\\' && i + 1 < n) {
                    element += unescape(list[i + 1]);
                    i += 2;
                    continue;
                }
                element += list[i];
                i++;
            }
        }
        result.push_back(element);
    }
    return result;
}

std::string TclParser::formatListElement(const std::string& element) {
    if (element.empty()) {
        return "{}";
    }

    bool needs_quoting = element.front() == '#';
    int depth = 0;
    bool balanced = true;
    for (char c : element) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '[' || c == ']' ||
            c == '$' || c == ';' || c == '\\' || c == '{' || c == '}') {
            needs_quoting = true;
        }
        if (c == '{') depth++;
        if (c == '}' && --depth < 0) balanced = false;
    }
    if (!needs_quoting) {
        return element;
    }
    if (balanced && depth == 0 && element.back() != '\\') {
        return "{" + element + "}";
    }

    std::string escaped;
    for (char c : element) {
        if (c == ' ' || c == '"' || c == '[' || c == ']' || c == '$' || c == ';' || c == '\\' ||
            c == '{' || c == '}') {
            escaped += '\\';
        }
        if (c == '\n') {
            escaped += "\\n";
        } else if (c == '\t') {
            escaped += "\\t";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::string TclParser::formatList(const std::vector<std::string>& elements) {
    std::string s;
    for (size_t i = 0; i < elements.size(); i++) {
        if (i > 0) s += ' ';
        s += formatListElement(elements[i]);
    }
    return s;
}

} // namespace elan
} // namespace radex
