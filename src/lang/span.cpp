#include <fillin/lang/span.hpp>
#include <fillin/log.hpp>
#include <cctype>

namespace fillin {

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static FillinError malformed(const std::string& span, const char* why) {
    return FillinError{FillinError::MalformedSpan,
        "can't interpret template chunk '" + span + "': " + why};
}

Result<SpanParts> parse_span(const std::string& span, const Delimiters& delims) {
    const std::size_t lsize = delims.left.size();
    const std::size_t rsize = delims.right.size();

    if (span.size() < lsize + rsize ||
        span.compare(0, lsize, delims.left) != 0 ||
        span.compare(span.size() - rsize, rsize, delims.right) != 0) {
        return malformed(span, "not enclosed in delimiters");
    }

    std::size_t pos = lsize;
    std::size_t end = span.size() - rsize;
    while (pos < end && is_space(span[pos])) ++pos;

    if (pos == end) {
        return malformed(span, "missing tag character");
    }
    if (is_word_char(span[pos])) {
        return malformed(span, "tag must be a non-word character");
    }

    SpanParts parts;
    parts.tag = span[pos++];

    while (pos < end && is_space(span[pos])) ++pos;
    while (end > pos && is_space(span[end - 1])) --end;
    parts.payload = span.substr(pos, end - pos);

    return Result<SpanParts>::ok(std::move(parts));
}

Result<std::string> resolve_span(const std::string& span,
                                 const Delimiters& delims,
                                 const HookRegistry& hooks) {
    auto parts = parse_span(span, delims);
    FILLIN_TRY(parts);

    const SpanParts& p = parts.value();
    const Hook* hook = hooks.find(p.tag);
    if (!hook) {
        return FillinError{FillinError::UnknownTag,
            std::string("no interpret hook defined for type '") + p.tag + "'",
            "register one with HookRegistry::set()"};
    }

    log::trace("dispatching '%c' hook with payload '%s'", p.tag, p.payload.c_str());
    return (*hook)(p.payload);
}

} // namespace fillin
