#pragma once

#include <fillin/result.hpp>
#include <string>
#include <string_view>

namespace fillin {

// Character that turns a following delimiter literal into plain text.
constexpr char kEscapeChar = '\\';

// The left/right literals marking a span. Matched verbatim, never as patterns.
struct Delimiters {
    std::string left = "[[";
    std::string right = "]]";

    // Both literals must be non-empty and distinct
    Status validate() const;

    bool operator==(const Delimiters& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const Delimiters& other) const { return !(*this == other); }
};

enum class ScanMode { First, Last };

// Find an occurrence of `delim` in `text` that is not immediately preceded by
// kEscapeChar. First mode returns the earliest one; Last mode returns the
// latest one lying entirely inside [0, limit). Returns std::string::npos when
// there is none.
std::size_t find_unescaped(std::string_view text, std::string_view delim,
                           ScanMode mode = ScanMode::First,
                           std::size_t limit = std::string_view::npos);

// Replace every escaped delimiter literal with the bare literal. Only valid for
// text that will not be scanned again.
std::string unescape(std::string_view text, const Delimiters& delims);

} // namespace fillin
