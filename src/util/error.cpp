#include <fillin/error.hpp>

namespace fillin {

const char* FillinError::code_name(Code c) {
    switch (c) {
        case IO:            return "IO";
        case Parse:         return "Parse";
        case Config:        return "Config";
        case NotFound:      return "NotFound";
        case InvalidArg:    return "InvalidArg";
        case MalformedSpan: return "MalformedSpan";
        case UnknownTag:    return "UnknownTag";
        case Hook:          return "Hook";
    }
    return "Unknown";
}

std::string FillinError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
    }

    return result;
}

} // namespace fillin
