#include <fillin/lang/engine.hpp>
#include <fillin/lang/span.hpp>
#include <fillin/log.hpp>
#include <ostream>

namespace fillin {

// ---------------------------------------------------------------------------
// Scan/resolve loop
// ---------------------------------------------------------------------------

static void warn_truncated(const std::string& buffer) {
    log::warn("problem interpreting text '%s': unterminated span, "
              "emitting the rest uninterpreted", buffer.c_str());
}

Status interpret(std::string text, const Delimiters& delims,
                 const HookRegistry& hooks, const Sink& sink) {
    FILLIN_TRY(delims.validate());

    while (true) {
        // Plain text before the first structural left delimiter is final
        std::size_t first_left = find_unescaped(text, delims.left);
        if (first_left == std::string::npos) {
            if (!text.empty()) sink(unescape(text, delims));
            break;
        }
        if (first_left > 0) {
            sink(unescape(std::string_view(text).substr(0, first_left), delims));
            text.erase(0, first_left);
            continue;
        }

        std::size_t first_right = find_unescaped(text, delims.right);
        if (first_right == std::string::npos) {
            warn_truncated(text);
            sink(text);
            break;
        }

        // Innermost span: nearest left delimiter before the first right one
        std::size_t last_left = find_unescaped(text, delims.left, ScanMode::Last, first_right);
        if (last_left == std::string::npos) {
            warn_truncated(text);
            sink(text);
            break;
        }

        std::size_t span_len = first_right + delims.right.size() - last_left;
        auto replacement = resolve_span(text.substr(last_left, span_len), delims, hooks);
        if (replacement.is_err()) {
            if (!replacement.error().is_recoverable()) {
                return std::move(replacement).error();
            }
            log::warn("%s", replacement.error().message.c_str());
            text.erase(last_left, span_len);
            continue;
        }
        text.replace(last_left, span_len, replacement.value());
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

Engine::Engine()
    : variables_(std::make_shared<VariableStore>()),
      functions_(std::make_shared<FunctionTable>()),
      hooks_(HookRegistry::with_defaults(variables_, functions_)) {}

std::shared_ptr<Engine> Engine::shared() {
    static std::shared_ptr<Engine> instance = std::make_shared<Engine>();
    return instance;
}

Status Engine::set_delimiters(Delimiters delims) {
    FILLIN_TRY(delims.validate());
    delimiters_ = std::move(delims);
    return ok_status();
}

Status Engine::configure(const Config& cfg) {
    Delimiters delims = delimiters_;
    if (cfg.left_delimiter) delims.left = *cfg.left_delimiter;
    if (cfg.right_delimiter) delims.right = *cfg.right_delimiter;
    FILLIN_TRY(set_delimiters(std::move(delims)));

    if (cfg.template_path) template_path_ = *cfg.template_path;
    for (const auto& [name, value] : cfg.variables) {
        variables_->set(name, value);
    }
    return ok_status();
}

Status Engine::run(std::string text, const Sink& sink) const {
    return fillin::interpret(std::move(text), delimiters_, hooks_, sink);
}

Result<std::string> Engine::interpret(const std::string& text) const {
    std::string out;
    FILLIN_TRY(run(text, [&out](const std::string& chunk) { out += chunk; }));
    return Result<std::string>::ok(std::move(out));
}

Status Engine::interpret_to(const std::string& text, std::ostream& out) const {
    auto st = run(text, [&out](const std::string& chunk) {
        out << chunk;
        out.flush();
    });
    if (st.is_ok() && !out) {
        return FillinError{FillinError::IO, "failed writing interpreted template"};
    }
    return st;
}

} // namespace fillin
