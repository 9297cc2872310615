#include <fillin/hooks.hpp>
#include <fillin/log.hpp>
#include <cctype>

namespace fillin {

// ---------------------------------------------------------------------------
// VariableStore
// ---------------------------------------------------------------------------

void VariableStore::set(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

const std::string* VariableStore::find(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() ? &it->second : nullptr;
}

bool VariableStore::contains(const std::string& name) const {
    return values_.count(name) > 0;
}

bool VariableStore::erase(const std::string& name) {
    return values_.erase(name) > 0;
}

void VariableStore::clear() {
    values_.clear();
}

// ---------------------------------------------------------------------------
// FunctionTable
// ---------------------------------------------------------------------------

void FunctionTable::set(const std::string& name, Function fn) {
    functions_[name] = std::move(fn);
}

const Function* FunctionTable::find(const std::string& name) const {
    auto it = functions_.find(name);
    return it != functions_.end() ? &it->second : nullptr;
}

bool FunctionTable::contains(const std::string& name) const {
    return functions_.count(name) > 0;
}

bool FunctionTable::erase(const std::string& name) {
    return functions_.erase(name) > 0;
}

// ---------------------------------------------------------------------------
// HookRegistry
// ---------------------------------------------------------------------------

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

Status HookRegistry::set(char tag, Hook hook) {
    if (is_word_char(tag)) {
        return FillinError{FillinError::InvalidArg,
            std::string("hook tag '") + tag + "' is a word character",
            "tags must not be letters, digits, or '_'"};
    }
    if (!hook) {
        return FillinError{FillinError::InvalidArg,
            std::string("empty hook for tag '") + tag + "'"};
    }
    hooks_[tag] = std::move(hook);
    return ok_status();
}

const Hook* HookRegistry::find(char tag) const {
    auto it = hooks_.find(tag);
    return it != hooks_.end() ? &it->second : nullptr;
}

bool HookRegistry::contains(char tag) const {
    return hooks_.count(tag) > 0;
}

bool HookRegistry::erase(char tag) {
    return hooks_.erase(tag) > 0;
}

HookRegistry HookRegistry::with_defaults(std::shared_ptr<const VariableStore> variables,
                                         std::shared_ptr<const FunctionTable> functions) {
    HookRegistry registry;
    registry.hooks_['$'] = variable_hook(std::move(variables));
    registry.hooks_['&'] = function_hook(std::move(functions));
    return registry;
}

// ---------------------------------------------------------------------------
// Default hooks
// ---------------------------------------------------------------------------

Hook variable_hook(std::shared_ptr<const VariableStore> variables) {
    return [variables](const std::string& name) -> Result<std::string> {
        if (const std::string* value = variables->find(name)) {
            return Result<std::string>::ok(*value);
        }
        log::debug("variable '%s' is not set, substituting empty text", name.c_str());
        return Result<std::string>::ok(std::string());
    };
}

Result<FunctionCall> parse_function_call(const std::string& text) {
    // Leftmost word run immediately followed by '(' with a ')' somewhere after it
    std::size_t close = text.rfind(')');
    std::size_t open = std::string::npos;
    for (std::size_t i = 1; close != std::string::npos && i < close; ++i) {
        if (text[i] == '(' && is_word_char(text[i - 1])) {
            open = i;
            break;
        }
    }
    if (open == std::string::npos) {
        return FillinError{FillinError::Parse,
            "can't understand function call '" + text + "'",
            "expected: name(arg1,arg2,...)"};
    }

    std::size_t start = open;
    while (start > 0 && is_word_char(text[start - 1])) --start;

    FunctionCall call;
    call.name = text.substr(start, open - start);

    std::string args = text.substr(open + 1, close - open - 1);
    std::size_t pos = 0;
    while (!args.empty()) {
        std::size_t comma = args.find(',', pos);
        if (comma == std::string::npos) {
            call.args.push_back(args.substr(pos));
            break;
        }
        call.args.push_back(args.substr(pos, comma - pos));
        pos = comma + 1;
    }
    while (!call.args.empty() && call.args.back().empty()) {
        call.args.pop_back();
    }

    return Result<FunctionCall>::ok(std::move(call));
}

Hook function_hook(std::shared_ptr<const FunctionTable> functions) {
    return [functions](const std::string& payload) -> Result<std::string> {
        auto call = parse_function_call(payload);
        FILLIN_TRY(call);

        const Function* fn = functions->find(call.value().name);
        if (!fn) {
            return FillinError{FillinError::NotFound,
                "undefined template function '" + call.value().name + "'",
                "register it in the engine's function table"};
        }
        return (*fn)(call.value().args);
    };
}

} // namespace fillin
