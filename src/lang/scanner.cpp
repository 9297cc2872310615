#include <fillin/lang/scanner.hpp>

namespace fillin {

Status Delimiters::validate() const {
    if (left.empty() || right.empty()) {
        return FillinError{FillinError::InvalidArg,
            "delimiters must not be empty",
            "set both a left and a right delimiter, e.g. '[[' and ']]'"};
    }
    if (left == right) {
        return FillinError{FillinError::InvalidArg,
            "left and right delimiters are identical: '" + left + "'",
            "nesting cannot be detected unless the two literals differ"};
    }
    return ok_status();
}

static bool is_structural(std::string_view text, std::size_t pos) {
    return pos == 0 || text[pos - 1] != kEscapeChar;
}

std::size_t find_unescaped(std::string_view text, std::string_view delim,
                           ScanMode mode, std::size_t limit) {
    if (delim.empty()) return std::string::npos;

    if (mode == ScanMode::First) {
        std::size_t pos = text.find(delim);
        while (pos != std::string_view::npos) {
            if (is_structural(text, pos)) return pos;
            pos = text.find(delim, pos + 1);
        }
        return std::string::npos;
    }

    std::string_view prefix = text.substr(0, limit);
    if (prefix.size() < delim.size()) return std::string::npos;

    std::size_t pos = prefix.rfind(delim);
    while (pos != std::string_view::npos) {
        if (is_structural(prefix, pos)) return pos;
        if (pos == 0) break;
        pos = prefix.rfind(delim, pos - 1);
    }
    return std::string::npos;
}

std::string unescape(std::string_view text, const Delimiters& delims) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == kEscapeChar) {
            std::string_view rest = text.substr(i + 1);
            // Right literal first, same precedence as the left-to-right rewrite
            if (!delims.right.empty() && rest.substr(0, delims.right.size()) == delims.right) {
                out += delims.right;
                i += 1 + delims.right.size();
                continue;
            }
            if (!delims.left.empty() && rest.substr(0, delims.left.size()) == delims.left) {
                out += delims.left;
                i += 1 + delims.left.size();
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

} // namespace fillin
