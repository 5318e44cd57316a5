#pragma once

#include <string>
#include <vector>

namespace radex {
namespace elan {

// Value of a variable, word or command result: a string or a list.
//
// Lists keep their elements while passed around whole (set y $x). Used as
// text they are joined with single spaces.
class TclValue {
public:
    TclValue() = default;
    TclValue(const std::string& s) : str_(s) {}
    TclValue(const char* s) : str_(s) {}

    static TclValue fromList(const std::vector<std::string>& elements);

    bool isList() const { return is_list_; }
    bool empty() const { return is_list_ ? list_.empty() : str_.empty(); }

    std::string str() const;

    // Elements of a list, or the string parsed as a Tcl list
    std::vector<std::string> asList() const;

    bool operator==(const TclValue& other) const { return str() == other.str(); }
    bool operator!=(const TclValue& other) const { return !(*this == other); }

private:
    std::string str_;
    std::vector<std::string> list_;
    bool is_list_ = false;
};

using TclArgs = std::vector<TclValue>;

} // namespace elan
} // namespace radex
