#pragma once

#include <fillin/hooks.hpp>
#include <fillin/lang/scanner.hpp>
#include <fillin/result.hpp>
#include <string>

namespace fillin {

// A span split into the character selecting its hook and the text handed to it.
struct SpanParts {
    char tag = '\0';
    std::string payload;
};

// Split `span` (delimiters included) into tag and payload. Whitespace around
// the tag and before the right delimiter is dropped; escaped delimiters in the
// payload are left as they are. Fails with MalformedSpan when the text is not
// exactly one span.
Result<SpanParts> parse_span(const std::string& span, const Delimiters& delims);

// Parse `span` and dispatch its payload to the hook registered for its tag.
// MalformedSpan is recoverable; UnknownTag and any error returned by the hook
// itself are fatal to the interpretation.
Result<std::string> resolve_span(const std::string& span,
                                 const Delimiters& delims,
                                 const HookRegistry& hooks);

} // namespace fillin
