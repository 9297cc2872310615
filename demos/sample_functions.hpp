#pragma once

// Functions the fillin_render demo makes available to [[&name(..)]] spans.

#include <fillin/hooks.hpp>
#include <fillin/result.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace fillin::demo {

inline std::string transform_all(const std::vector<std::string>& args, int (*fn)(int)) {
    std::string out;
    for (const auto& a : args) {
        for (char c : a) out += static_cast<char>(fn(static_cast<unsigned char>(c)));
    }
    return out;
}

// The whole argument must be a number; "1abc" is rejected rather than read as 1.
inline Result<double> parse_number(const std::string& text) {
    std::size_t pos = 0;
    double value = 0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        return FillinError{FillinError::Hook,
            "add: '" + text + "' is not a number"};
    }
    return Result<double>::ok(value);
}

inline void register_sample_functions(FunctionTable& functions) {
    functions.set("upper", [](const std::vector<std::string>& args) {
        return Result<std::string>::ok(transform_all(args, [](int c) { return std::toupper(c); }));
    });
    functions.set("lower", [](const std::vector<std::string>& args) {
        return Result<std::string>::ok(transform_all(args, [](int c) { return std::tolower(c); }));
    });
    functions.set("join", [](const std::vector<std::string>& args) -> Result<std::string> {
        if (args.empty()) return Result<std::string>::ok("");
        std::string out;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (i > 1) out += args[0];
            out += args[i];
        }
        return Result<std::string>::ok(out);
    });
    functions.set("add", [](const std::vector<std::string>& args) -> Result<std::string> {
        double sum = 0;
        for (const auto& a : args) {
            auto n = parse_number(a);
            FILLIN_TRY(n);
            sum += n.value();
        }
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.15g", sum);
        return Result<std::string>::ok(buf);
    });
}

} // namespace fillin::demo
