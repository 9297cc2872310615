#pragma once

#include <fillin/config.hpp>
#include <fillin/hooks.hpp>
#include <fillin/lang/scanner.hpp>
#include <fillin/result.hpp>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace fillin {

// Receives each piece of finished plain text, in output order.
using Sink = std::function<void(const std::string& chunk)>;

// Interpret `text`, handing final plain text to `sink` as soon as it is known.
//
// The buffer is rescanned from its start after every resolved span, so text a
// hook returns is itself scanned for delimiters. A span whose text does not
// parse is replaced by nothing and an unterminated span ends interpretation
// with the rest of the buffer passed through verbatim; both only log a
// warning. An unknown tag or a failing hook aborts with that error, after
// whatever was already handed to `sink`.
Status interpret(std::string text, const Delimiters& delims,
                 const HookRegistry& hooks, const Sink& sink);

// Everything an interpretation needs: delimiters, hooks, the stores behind the
// default hooks, and the template search path.
//
// Copies share the variable store and function table with the original but
// own their delimiters, hooks, and search path.
class Engine {
public:
    Engine();

    // Process-wide default engine used by templates that are not given one
    static std::shared_ptr<Engine> shared();

    const Delimiters& delimiters() const { return delimiters_; }
    Status set_delimiters(Delimiters delims);

    HookRegistry& hooks() { return hooks_; }
    const HookRegistry& hooks() const { return hooks_; }

    VariableStore& variables() { return *variables_; }
    const VariableStore& variables() const { return *variables_; }

    FunctionTable& functions() { return *functions_; }
    const FunctionTable& functions() const { return *functions_; }

    const std::vector<std::string>& template_path() const { return template_path_; }
    void set_template_path(std::vector<std::string> dirs) { template_path_ = std::move(dirs); }

    // Apply delimiters, search path, and variables from `cfg`. Leaves the
    // engine untouched when the delimiters are invalid.
    Status configure(const Config& cfg);

    Status run(std::string text, const Sink& sink) const;

    // Collecting mode: the whole output as one string
    Result<std::string> interpret(const std::string& text) const;

    // Streaming mode: output written to `out` chunk by chunk
    Status interpret_to(const std::string& text, std::ostream& out) const;

private:
    Delimiters delimiters_;
    std::shared_ptr<VariableStore> variables_;
    std::shared_ptr<FunctionTable> functions_;
    HookRegistry hooks_;
    std::vector<std::string> template_path_{"."};
};

} // namespace fillin
