#pragma once

/// @file text_match.hpp
/// @brief ASCII case-insensitive matching for engine object and item names.

#include <string_view>

namespace ftr::travel {

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b);

/// False for an empty prefix.
[[nodiscard]] bool startsWithIgnoreCase(std::string_view text, std::string_view prefix);

/// False for an empty needle.
[[nodiscard]] bool containsIgnoreCase(std::string_view text, std::string_view needle);

}  // namespace ftr::travel
