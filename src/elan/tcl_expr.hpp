// Tcl expression evaluator (expr, if, for conditions)
//
// Recursive-descent parser producing a small syntax tree, evaluated with
// Tcl's operator precedence. Integer arithmetic stays integer (division
// floors), doubles print in shortest round-trip form.

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace radex {
namespace elan {

class ExprValue {
public:
    enum class Type { Int, Double, String };

    static ExprValue fromInt(int64_t v);
    static ExprValue fromDouble(double v);
    static ExprValue fromString(const std::string& s);
    static ExprValue fromBool(bool b) { return fromInt(b ? 1 : 0); }

    // Numeric text becomes Int or Double, anything else stays a String
    static ExprValue parse(const std::string& text);

    Type type() const { return type_; }
    bool isNumeric() const { return type_ != Type::String; }
    int64_t asInt() const { return i_; }
    double asDouble() const { return type_ == Type::Int ? static_cast<double>(i_) : d_; }

    // Text the value was parsed from (or its formatted form)
    const std::string& text() const { return text_; }

    // Canonical form: 5, 0.5, 16.0, abc
    std::string toString() const;

    // Non-zero number or true/yes/on. Throws std::invalid_argument for
    // strings that are not booleans.
    bool truthy() const;

private:
    Type type_ = Type::String;
    int64_t i_ = 0;
    double d_ = 0.0;
    std::string text_;
};

// Shortest round-trip form, with ".0" for integral values: 16.0, 0.1, 1e+16
std::string formatDouble(double d);

// true/false/yes/no/on/off, case-insensitive, plus 1/0
bool parseBoolean(const std::string& s, bool& value);

struct ExprCallbacks {
    std::function<std::string(const std::string& name)> variable;      // $name
    std::function<std::string(const std::string& script)> command;     // [script]
    std::function<std::string(const std::string& text)> substitute;    // "text"
};

class TclExpr {
public:
    explicit TclExpr(ExprCallbacks callbacks);

    // Throws std::invalid_argument on syntax errors, non-numeric operands
    // and division by zero
    ExprValue evaluate(const std::string& expression) const;

private:
    ExprCallbacks callbacks_;
};

} // namespace elan
} // namespace radex
