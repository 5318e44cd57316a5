#include "tcl_value.hpp"
#include "tcl_parser.hpp"

namespace radex {
namespace elan {

TclValue TclValue::fromList(const std::vector<std::string>& elements) {
    TclValue v;
    v.list_ = elements;
    v.is_list_ = true;
    return v;
}

std::string TclValue::str() const {
    if (!is_list_) {
        return str_;
    }
    std::string s;
    for (size_t i = 0; i < list_.size(); i++) {
        if (i > 0) s += ' ';
        s += list_[i];
    }
    return s;
}

std::vector<std::string> TclValue::asList() const {
    if (is_list_) {
        return list_;
    }
    return TclParser::splitList(str_);
}

} // namespace elan
} // namespace radex
