#include "tcl_expr.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

namespace radex {
namespace elan {

// ============================================================================
// Values
// ============================================================================

ExprValue ExprValue::fromInt(int64_t v) {
    ExprValue e;
    e.type_ = Type::Int;
    e.i_ = v;
    e.text_ = std::to_string(v);
    return e;
}

ExprValue ExprValue::fromDouble(double v) {
    ExprValue e;
    e.type_ = Type::Double;
    e.d_ = v;
    e.text_ = formatDouble(v);
    return e;
}

ExprValue ExprValue::fromString(const std::string& s) {
    ExprValue e;
    e.type_ = Type::String;
    e.text_ = s;
    return e;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

ExprValue ExprValue::parse(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        return fromString(text);
    }

    const char* begin = t.c_str();
    char* end = nullptr;

    // Integer: decimal or 0x hex
    bool has_digits = std::any_of(t.begin(), t.end(),
                                  [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    if (has_digits) {
        // Decimal unless 0x prefixed, "010" is ten
        bool hex = t.find("0x") != std::string::npos || t.find("0X") != std::string::npos;
        errno = 0;
        long long v = std::strtoll(begin, &end, hex ? 16 : 10);
        if (*end == '\0' && errno != ERANGE) {
            ExprValue e = fromInt(v);
            e.text_ = text;
            return e;
        }

        errno = 0;
        double d = std::strtod(begin, &end);
        if (*end == '\0' && errno != ERANGE) {
            ExprValue e = fromDouble(d);
            e.text_ = text;
            return e;
        }
    }
    return fromString(text);
}

std::string ExprValue::toString() const {
    switch (type_) {
        case Type::Int:    return std::to_string(i_);
        case Type::Double: return formatDouble(d_);
        default: return text_;
    }
}

bool ExprValue::truthy() const {
    switch (type_) {
        case Type::Int:    return i_ != 0;
        case Type::Double: return d_ != 0.0;
        default: break;
    }
    bool b = false;
    if (!parseBoolean(trim(text_), b)) {
        throw std::invalid_argument("expected boolean value but got \"" + text_ + "\"");
    }
    return b;
}

bool parseBoolean(const std::string& s, bool& value) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        value = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        value = false;
        return true;
    }
    return false;
}

std::string formatDouble(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Inf" : "-Inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    bool negative = !sci.empty() && sci[0] == '-';
    if (negative) {
        sci.erase(0, 1);
    }

    size_t e = sci.find('e');
    std::string mantissa = sci.substr(0, e);
    int exp = std::atoi(sci.c_str() + e + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits += c;
    }

    std::string out;
    if (exp >= -4 && exp < 16) {
        if (exp < 0) {
            out = "0." + std::string(static_cast<size_t>(-exp - 1), '0') + digits;
        } else if (digits.size() <= static_cast<size_t>(exp) + 1) {
            out = digits + std::string(static_cast<size_t>(exp) + 1 - digits.size(), '0') + ".0";
        } else {
            out = digits.substr(0, static_cast<size_t>(exp) + 1) + "." +
                  digits.substr(static_cast<size_t>(exp) + 1);
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) {
            out += "." + digits.substr(1);
        }
        int ae = std::abs(exp);
        out += exp < 0 ? "e-" : "e+";
        if (ae < 10) out += '0';
        out += std::to_string(ae);
    }
    return negative ? "-" + out : out;
}

// ============================================================================
// Syntax tree
// ============================================================================

namespace {

struct Node {
    enum class Kind {
        Literal,    // Number or {braced} text
        Variable,   // $name
        Command,    // [script]
        Quoted,     // "text"
        Unary,
        Binary,
        And,
        Or,
        Ternary,
        Call,
    };

    Kind kind = Kind::Literal;
    std::string text;       // Literal text, variable name, script or operator
    std::vector<std::unique_ptr<Node>> children;
};

using NodePtr = std::unique_ptr<Node>;

NodePtr makeNode(Node::Kind kind, const std::string& text) {
    auto n = std::make_unique<Node>();
    n->kind = kind;
    n->text = text;
    return n;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class ExprParser {
public:
    explicit ExprParser(const std::string& s) : s_(s) {}

    NodePtr parse() {
        NodePtr n = ternary();
        skipSpace();
        if (pos_ < s_.size()) {
            fail("unexpected \"" + s_.substr(pos_) + "\"");
        }
        return n;
    }

private:
    const std::string& s_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& msg) const {
        throw std::invalid_argument("syntax error in expression \"" + s_ + "\": " + msg);
    }

    void skipSpace() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
            pos_++;
        }
    }

    char peek(size_t offset = 0) const {
        return pos_ + offset < s_.size() ? s_[pos_ + offset] : '\0';
    }

    // Match an operator, refusing a longer operator that starts with it
    bool accept(const char* op, const char* not_followed_by = "") {
        skipSpace();
        size_t len = std::char_traits<char>::length(op);
        if (s_.compare(pos_, len, op) != 0) {
            return false;
        }
        char next = peek(len);
        if (next != '\0' && std::char_traits<char>::find(not_followed_by,
                                                          std::char_traits<char>::length(not_followed_by),
                                                          next)) {
            return false;
        }
        pos_ += len;
        return true;
    }

    bool acceptWord(const char* word) {
        skipSpace();
        size_t len = std::char_traits<char>::length(word);
        if (s_.compare(pos_, len, word) != 0 || isIdentChar(peek(len))) {
            return false;
        }
        pos_ += len;
        return true;
    }

    NodePtr binary(const std::string& op, NodePtr lhs, NodePtr rhs,
                   Node::Kind kind = Node::Kind::Binary) {
        auto n = makeNode(kind, op);
        n->children.push_back(std::move(lhs));
        n->children.push_back(std::move(rhs));
        return n;
    }

    NodePtr ternary() {
        NodePtr cond = logicalOr();
        if (!accept("?")) {
            return cond;
        }
        NodePtr a = ternary();
        if (!accept(":")) {
            fail("missing ':' in ternary operator");
        }
        NodePtr b = ternary();
        auto n = makeNode(Node::Kind::Ternary, "?:");
        n->children.push_back(std::move(cond));
        n->children.push_back(std::move(a));
        n->children.push_back(std::move(b));
        return n;
    }

    NodePtr logicalOr() {
        NodePtr n = logicalAnd();
        while (accept("||")) {
            n = binary("||", std::move(n), logicalAnd(), Node::Kind::Or);
        }
        return n;
    }

    NodePtr logicalAnd() {
        NodePtr n = bitOr();
        while (accept("&&")) {
            n = binary("&&", std::move(n), bitOr(), Node::Kind::And);
        }
        return n;
    }

    NodePtr bitOr() {
        NodePtr n = bitXor();
        while (accept("|", "|")) {
            n = binary("|", std::move(n), bitXor());
        }
        return n;
    }

    NodePtr bitXor() {
        NodePtr n = bitAnd();
        while (accept("^")) {
            n = binary("^", std::move(n), bitAnd());
        }
        return n;
    }

    NodePtr bitAnd() {
        NodePtr n = equality();
        while (accept("&", "&")) {
            n = binary("&", std::move(n), equality());
        }
        return n;
    }

    NodePtr equality() {
        NodePtr n = relational();
        while (true) {
            if (accept("==")) {
                n = binary("==", std::move(n), relational());
            } else if (accept("!=")) {
                n = binary("!=", std::move(n), relational());
            } else if (acceptWord("eq")) {
                n = binary("eq", std::move(n), relational());
            } else if (acceptWord("ne")) {
                n = binary("ne", std::move(n), relational());
            } else {
                return n;
            }
        }
    }

    NodePtr relational() {
        NodePtr n = shift();
        while (true) {
            if (accept("<=")) {
                n = binary("<=", std::move(n), shift());
            } else if (accept(">=")) {
                n = binary(">=", std::move(n), shift());
            } else if (accept("<", "<")) {
                n = binary("<", std::move(n), shift());
            } else if (accept(">", ">")) {
                n = binary(">", std::move(n), shift());
            } else {
                return n;
            }
        }
    }

    NodePtr shift() {
        NodePtr n = additive();
        while (true) {
            if (accept("<<")) {
                n = binary("<<", std::move(n), additive());
            } else if (accept(">>")) {
                n = binary(">>", std::move(n), additive());
            } else {
                return n;
            }
        }
    }

    NodePtr additive() {
        NodePtr n = multiplicative();
        while (true) {
            if (accept("+")) {
                n = binary("+", std::move(n), multiplicative());
            } else if (accept("-")) {
                n = binary("-", std::move(n), multiplicative());
            } else {
                return n;
            }
        }
    }

    NodePtr multiplicative() {
        NodePtr n = power();
        while (true) {
            if (accept("*", "*")) {
                n = binary("*", std::move(n), power());
            } else if (accept("/")) {
                n = binary("/", std::move(n), power());
            } else if (accept("%")) {
                n = binary("%", std::move(n), power());
            } else {
                return n;
            }
        }
    }

    // Right associative
    NodePtr power() {
        NodePtr n = unary();
        if (accept("**")) {
            n = binary("**", std::move(n), power());
        }
        return n;
    }

    NodePtr unary() {
        skipSpace();
        char c = peek();
        if (c == '-' || c == '+' || c == '!' || c == '~') {
            pos_++;
            auto n = makeNode(Node::Kind::Unary, std::string(1, c));
            n->children.push_back(unary());
            return n;
        }
        return primary();
    }

    // Text up to the matching close character, nesting-aware
    std::string delimited(char open, char close) {
        size_t start = ++pos_;
        int depth = 1;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == '\\' && pos_ + 1 < s_.size()) {
                pos_ += 2;
                continue;
            }
            if (c == open && open != close) {
                depth++;
            } else if (c == close) {
                if (--depth == 0) {
                    std::string text = s_.substr(start, pos_ - start);
                    pos_++;
                    return text;
                }
            }
            pos_++;
        }
        fail(std::string("missing '") + close + "'");
    }

    NodePtr number() {
        size_t start = pos_;
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
            pos_ += 2;
            while (std::isxdigit(static_cast<unsigned char>(peek()))) pos_++;
        } else {
            while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
            if (peek() == '.') {
                pos_++;
                while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
            }
            if ((peek() == 'e' || peek() == 'E') &&
                (std::isdigit(static_cast<unsigned char>(peek(1))) ||
                 ((peek(1) == '+' || peek(1) == '-') &&
                  std::isdigit(static_cast<unsigned char>(peek(2)))))) {
                pos_ += 2;
                while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
            }
        }
        return makeNode(Node::Kind::Literal, s_.substr(start, pos_ - start));
    }

    NodePtr variable() {
        pos_++;
        if (peek() == '{') {
            return makeNode(Node::Kind::Variable, delimited('{', '}'));
        }
        size_t start = pos_;
        while (isIdentChar(peek()) || (peek() == ':' && peek(1) == ':')) {
            pos_ += peek() == ':' ? 2 : 1;
        }
        if (pos_ == start) {
            fail("missing variable name after '$'");
        }
        return makeNode(Node::Kind::Variable, s_.substr(start, pos_ - start));
    }

    NodePtr primary() {
        skipSpace();
        char c = peek();

        if (c == '(') {
            pos_++;
            NodePtr n = ternary();
            if (!accept(")")) {
                fail("missing ')'");
            }
            return n;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            return number();
        }
        if (c == '$') {
            return variable();
        }
        if (c == '[') {
            return makeNode(Node::Kind::Command, delimited('[', ']'));
        }
        if (c == '"') {
            return makeNode(Node::Kind::Quoted, delimited('"', '"'));
        }
        if (c == '{') {
            return makeNode(Node::Kind::Literal, delimited('{', '}'));
        }
        if (std::isalpha(static_cast<unsigned char>(c))) {
            size_t start = pos_;
            while (isIdentChar(peek())) pos_++;
            std::string name = s_.substr(start, pos_ - start);

            skipSpace();
            if (peek() == '(') {
                pos_++;
                auto call = makeNode(Node::Kind::Call, name);
                skipSpace();
                if (peek() == ')') {
                    pos_++;
                    return call;
                }
                do {
                    call->children.push_back(ternary());
                } while (accept(","));
                if (!accept(")")) {
                    fail("missing ')' after arguments to " + name);
                }
                return call;
            }

            bool b = false;
            if (parseBoolean(name, b)) {
                return makeNode(Node::Kind::Literal, name);
            }
            fail("invalid bareword \"" + name + "\"");
        }
        if (c == '\0') {
            fail("missing operand");
        }
        fail(std::string("unexpected character '") + c + "'");
    }
};

// ============================================================================
// Evaluation
// ============================================================================

[[noreturn]] void overflow(const std::string& op) {
    throw std::invalid_argument("integer overflow in \"" + op + "\"");
}

int64_t checkedAdd(int64_t a, int64_t b) {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        overflow("+");
    }
    return a + b;
}

int64_t checkedSub(int64_t a, int64_t b) {
    if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) ||
        (b > 0 && a < std::numeric_limits<int64_t>::min() + b)) {
        overflow("-");
    }
    return a - b;
}

int64_t checkedMul(int64_t a, int64_t b, const std::string& op = "*") {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    bool bad = false;
    if (a > 0) {
        bad = b > 0 ? a > max / b : b < min / a;
    } else if (a < 0) {
        bad = b > 0 ? a < min / b : (b != 0 && b < max / a);
    }
    if (bad) {
        overflow(op);
    }
    return a * b;
}

int64_t checkedNeg(int64_t a) {
    if (a == std::numeric_limits<int64_t>::min()) {
        overflow("-");
    }
    return -a;
}

int64_t floorDiv(int64_t a, int64_t b) {
    if (a == std::numeric_limits<int64_t>::min() && b == -1) {
        overflow("/");
    }
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

int64_t floorMod(int64_t a, int64_t b) {
    if (b == -1) {
        return 0;
    }
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        r += b;
    }
    return r;
}

int64_t intPow(int64_t base, int64_t exp) {
    if (exp < 0) {
        if (base == 0) throw std::invalid_argument("exponentiation of zero by negative power");
        if (base == 1) return 1;
        if (base == -1) return (exp % 2 == 0) ? 1 : -1;
        return 0;
    }
    int64_t result = 1;
    while (exp > 0) {
        if (exp & 1) result = checkedMul(result, base, "**");
        exp >>= 1;
        if (exp > 0) base = checkedMul(base, base, "**");
    }
    return result;
}

// Double to integer, throws if it does not fit
int64_t toInt(double d, const std::string& op) {
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        throw std::invalid_argument("integer value too large to represent in \"" + op + "\"");
    }
    return static_cast<int64_t>(d);
}

void requireNumeric(const ExprValue& v, const std::string& op) {
    if (!v.isNumeric()) {
        throw std::invalid_argument("can't use non-numeric string \"" + v.text() +
                                    "\" as operand of \"" + op + "\"");
    }
}

void requireInt(const ExprValue& v, const std::string& op) {
    if (v.type() != ExprValue::Type::Int) {
        throw std::invalid_argument("can't use \"" + v.text() + "\" as operand of \"" + op +
                                    "\", an integer is needed");
    }
}

ExprValue arithmetic(const std::string& op, const ExprValue& a, const ExprValue& b) {
    requireNumeric(a, op);
    requireNumeric(b, op);

    bool ints = a.type() == ExprValue::Type::Int && b.type() == ExprValue::Type::Int;

    if (op == "%") {
        requireInt(a, op);
        requireInt(b, op);
        if (b.asInt() == 0) throw std::invalid_argument("divide by zero");
        return ExprValue::fromInt(floorMod(a.asInt(), b.asInt()));
    }
    if (op == "**") {
        if (ints) return ExprValue::fromInt(intPow(a.asInt(), b.asInt()));
        return ExprValue::fromDouble(std::pow(a.asDouble(), b.asDouble()));
    }
    if (op == "/") {
        if (ints) {
            if (b.asInt() == 0) throw std::invalid_argument("divide by zero");
            return ExprValue::fromInt(floorDiv(a.asInt(), b.asInt()));
        }
        if (b.asDouble() == 0.0) throw std::invalid_argument("divide by zero");
        return ExprValue::fromDouble(a.asDouble() / b.asDouble());
    }

    if (ints) {
        if (op == "+") return ExprValue::fromInt(checkedAdd(a.asInt(), b.asInt()));
        if (op == "-") return ExprValue::fromInt(checkedSub(a.asInt(), b.asInt()));
        return ExprValue::fromInt(checkedMul(a.asInt(), b.asInt()));
    }
    if (op == "+") return ExprValue::fromDouble(a.asDouble() + b.asDouble());
    if (op == "-") return ExprValue::fromDouble(a.asDouble() - b.asDouble());
    return ExprValue::fromDouble(a.asDouble() * b.asDouble());
}

ExprValue compare(const std::string& op, const ExprValue& a, const ExprValue& b) {
    if (op == "eq") return ExprValue::fromBool(a.text() == b.text());
    if (op == "ne") return ExprValue::fromBool(a.text() != b.text());

    int cmp;
    if (a.isNumeric() && b.isNumeric()) {
        if (a.type() == ExprValue::Type::Int && b.type() == ExprValue::Type::Int) {
            cmp = a.asInt() < b.asInt() ? -1 : (a.asInt() > b.asInt() ? 1 : 0);
        } else {
            cmp = a.asDouble() < b.asDouble() ? -1 : (a.asDouble() > b.asDouble() ? 1 : 0);
        }
    } else {
        int c = a.toString().compare(b.toString());
        cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    if (op == "==") return ExprValue::fromBool(cmp == 0);
    if (op == "!=") return ExprValue::fromBool(cmp != 0);
    if (op == "<") return ExprValue::fromBool(cmp < 0);
    if (op == ">") return ExprValue::fromBool(cmp > 0);
    if (op == "<=") return ExprValue::fromBool(cmp <= 0);
    return ExprValue::fromBool(cmp >= 0);
}

ExprValue bitwise(const std::string& op, const ExprValue& a, const ExprValue& b) {
    requireInt(a, op);
    requireInt(b, op);
    int64_t x = a.asInt();
    int64_t y = b.asInt();
    if (op == "&") return ExprValue::fromInt(x & y);
    if (op == "|") return ExprValue::fromInt(x | y);
    if (op == "^") return ExprValue::fromInt(x ^ y);
    if (y < 0) {
        throw std::invalid_argument("negative shift count");
    }
    if (op == "<<") {
        if (x != 0 && (y > 62 || x > (std::numeric_limits<int64_t>::max() >> y) ||
                       x < (std::numeric_limits<int64_t>::min() >> y))) {
            overflow(op);
        }
        return ExprValue::fromInt(static_cast<int64_t>(static_cast<uint64_t>(x) << y));
    }
    if (y > 63) {
        return ExprValue::fromInt(x < 0 ? -1 : 0);
    }
    return ExprValue::fromInt(x >> y);
}

using MathFunc = double (*)(double);

const std::map<std::string, MathFunc>& unaryMath() {
    static const std::map<std::string, MathFunc> funcs = {
        {"acos", [](double x) { return std::acos(x); }},
        {"asin", [](double x) { return std::asin(x); }},
        {"atan", [](double x) { return std::atan(x); }},
        {"ceil", [](double x) { return std::ceil(x); }},
        {"cos", [](double x) { return std::cos(x); }},
        {"cosh", [](double x) { return std::cosh(x); }},
        {"exp", [](double x) { return std::exp(x); }},
        {"floor", [](double x) { return std::floor(x); }},
        {"log", [](double x) { return std::log(x); }},
        {"log10", [](double x) { return std::log10(x); }},
        {"sin", [](double x) { return std::sin(x); }},
        {"sinh", [](double x) { return std::sinh(x); }},
        {"sqrt", [](double x) { return std::sqrt(x); }},
        {"tan", [](double x) { return std::tan(x); }},
        {"tanh", [](double x) { return std::tanh(x); }},
    };
    return funcs;
}

ExprValue checked(const std::string& name, double result, const std::vector<ExprValue>& args) {
    bool nan_arg = std::any_of(args.begin(), args.end(),
                               [](const ExprValue& v) { return std::isnan(v.asDouble()); });
    if (std::isnan(result) && !nan_arg) {
        throw std::invalid_argument("domain error: argument not in valid range for " + name);
    }
    return ExprValue::fromDouble(result);
}

void requireArgs(const std::string& name, const std::vector<ExprValue>& args, size_t n) {
    if (args.size() != n) {
        throw std::invalid_argument("math function " + name + " takes " + std::to_string(n) +
                                    " argument(s), got " + std::to_string(args.size()));
    }
    for (const auto& a : args) {
        requireNumeric(a, name);
    }
}

ExprValue callFunction(const std::string& name, const std::vector<ExprValue>& args) {
    auto it = unaryMath().find(name);
    if (it != unaryMath().end()) {
        requireArgs(name, args, 1);
        return checked(name, it->second(args[0].asDouble()), args);
    }

    if (name == "abs") {
        requireArgs(name, args, 1);
        if (args[0].type() == ExprValue::Type::Int) {
            return ExprValue::fromInt(args[0].asInt() < 0 ? checkedNeg(args[0].asInt())
                                                           : args[0].asInt());
        }
        return ExprValue::fromDouble(std::fabs(args[0].asDouble()));
    }
    if (name == "double") {
        requireArgs(name, args, 1);
        return ExprValue::fromDouble(args[0].asDouble());
    }
    if (name == "int") {
        requireArgs(name, args, 1);
        if (args[0].type() == ExprValue::Type::Int) return args[0];
        return ExprValue::fromInt(toInt(std::trunc(args[0].asDouble()), name));
    }
    if (name == "round") {
        requireArgs(name, args, 1);
        if (args[0].type() == ExprValue::Type::Int) return args[0];
        return ExprValue::fromInt(toInt(std::round(args[0].asDouble()), name));
    }
    if (name == "atan2" || name == "fmod" || name == "hypot" || name == "pow") {
        requireArgs(name, args, 2);
        double a = args[0].asDouble();
        double b = args[1].asDouble();
        double r;
        if (name == "atan2") {
            r = std::atan2(a, b);
        } else if (name == "fmod") {
            if (b == 0.0) throw std::invalid_argument("divide by zero");
            r = std::fmod(a, b);
        } else if (name == "hypot") {
            r = std::hypot(a, b);
        } else {
            r = std::pow(a, b);
        }
        return checked(name, r, args);
    }
    if (name == "max" || name == "min") {
        if (args.empty()) {
            throw std::invalid_argument("math function " + name + " needs at least one argument");
        }
        bool all_int = true;
        for (const auto& a : args) {
            requireNumeric(a, name);
            all_int = all_int && a.type() == ExprValue::Type::Int;
        }
        size_t best = 0;
        for (size_t i = 1; i < args.size(); i++) {
            bool better = name == "max" ? args[i].asDouble() > args[best].asDouble()
                                        : args[i].asDouble() < args[best].asDouble();
            if (better) best = i;
        }
        if (all_int) return ExprValue::fromInt(args[best].asInt());
        return ExprValue::fromDouble(args[best].asDouble());
    }

    throw std::invalid_argument("unknown math function \"" + name + "\"");
}

class Evaluator {
public:
    explicit Evaluator(const ExprCallbacks& cb) : cb_(cb) {}

    ExprValue eval(const Node& n) const {
        switch (n.kind) {
            case Node::Kind::Literal:
                return ExprValue::parse(n.text);
            case Node::Kind::Variable:
                return ExprValue::parse(cb_.variable(n.text));
            case Node::Kind::Command:
                return ExprValue::parse(cb_.command(n.text));
            case Node::Kind::Quoted:
                return ExprValue::parse(cb_.substitute ? cb_.substitute(n.text) : n.text);
            case Node::Kind::Unary:
                return unary(n.text, eval(*n.children[0]));
            case Node::Kind::And:
                return ExprValue::fromBool(eval(*n.children[0]).truthy() &&
                                           eval(*n.children[1]).truthy());
            case Node::Kind::Or:
                return ExprValue::fromBool(eval(*n.children[0]).truthy() ||
                                           eval(*n.children[1]).truthy());
            case Node::Kind::Ternary:
                return eval(*n.children[0]).truthy() ? eval(*n.children[1])
                                                     : eval(*n.children[2]);
            case Node::Kind::Call: {
                std::vector<ExprValue> args;
                for (const auto& child : n.children) {
                    args.push_back(eval(*child));
                }
                return callFunction(n.text, args);
            }
            case Node::Kind::Binary:
                return binary(n.text, eval(*n.children[0]), eval(*n.children[1]));
        }
        throw std::logic_error("unhandled expression node");
    }

private:
    const ExprCallbacks& cb_;

    static ExprValue unary(const std::string& op, const ExprValue& v) {
        if (op == "!") {
            return ExprValue::fromBool(!v.truthy());
        }
        if (op == "~") {
            requireInt(v, op);
            return ExprValue::fromInt(~v.asInt());
        }
        requireNumeric(v, op);
        if (op == "+") {
            return v.type() == ExprValue::Type::Int ? ExprValue::fromInt(v.asInt())
                                                    : ExprValue::fromDouble(v.asDouble());
        }
        return v.type() == ExprValue::Type::Int ? ExprValue::fromInt(checkedNeg(v.asInt()))
                                                : ExprValue::fromDouble(-v.asDouble());
    }

    static ExprValue binary(const std::string& op, const ExprValue& a, const ExprValue& b) {
        if (op == "+" || op == "-" || op == "*" || op == "/" || op == "%" || op == "**") {
            return arithmetic(op, a, b);
        }
        if (op == "&" || op == "|" || op == "^" || op == "<<" || op == ">>") {
            return bitwise(op, a, b);
        }
        return compare(op, a, b);
    }
};

} // namespace

TclExpr::TclExpr(ExprCallbacks callbacks)
    : callbacks_(std::move(callbacks)) {}

ExprValue TclExpr::evaluate(const std::string& expression) const {
    ExprParser parser(expression);
    NodePtr tree = parser.parse();
    Evaluator evaluator(callbacks_);
    return evaluator.eval(*tree);
}

} // namespace elan
} // namespace radex
