#pragma once

#include <string>

namespace fillin {

struct FillinError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        MalformedSpan,
        UnknownTag,
        Hook
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;

    FillinError() = default;
    FillinError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FillinError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // Recoverable conditions degrade the output but do not abort interpretation
    bool is_recoverable() const { return code == MalformedSpan; }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace fillin
