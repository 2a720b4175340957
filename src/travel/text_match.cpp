#include "ftr/travel/text_match.hpp"

#include <algorithm>
#include <cctype>

namespace ftr::travel {

namespace {

bool sameChar(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

} // namespace

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), sameChar);
}

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) {
    if (prefix.empty() || text.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), text.begin(), sameChar);
}

bool containsIgnoreCase(std::string_view text, std::string_view needle) {
    if (needle.empty()) {
        return false;
    }
    return std::search(text.begin(), text.end(), needle.begin(), needle.end(), sameChar) !=
           text.end();
}

}  // namespace ftr::travel
