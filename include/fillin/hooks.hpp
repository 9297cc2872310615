#pragma once

#include <fillin/result.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fillin {

// Resolves the trimmed payload of one span into its replacement text.
using Hook = std::function<Result<std::string>(const std::string& payload)>;

// A function callable from templates through the default '&' hook.
using Function = std::function<Result<std::string>(const std::vector<std::string>& args)>;

// Name -> value store consulted by the default '$' hook.
class VariableStore {
public:
    void set(const std::string& name, std::string value);
    const std::string* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    bool erase(const std::string& name);
    void clear();
    std::size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, std::string> values_;
};

// Name -> function table consulted by the default '&' hook.
class FunctionTable {
public:
    void set(const std::string& name, Function fn);
    const Function* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    bool erase(const std::string& name);
    std::size_t size() const { return functions_.size(); }

private:
    std::unordered_map<std::string, Function> functions_;
};

// Tag character -> hook. Registration overwrites any previous entry.
class HookRegistry {
public:
    // Fails with InvalidArg when `tag` is a word character or the hook is empty
    Status set(char tag, Hook hook);
    const Hook* find(char tag) const;
    bool contains(char tag) const;
    bool erase(char tag);
    std::size_t size() const { return hooks_.size(); }

    // Registry with '$' bound to `variables` and '&' bound to `functions`
    static HookRegistry with_defaults(std::shared_ptr<const VariableStore> variables,
                                      std::shared_ptr<const FunctionTable> functions);

private:
    std::unordered_map<char, Hook> hooks_;
};

// Word characters are alphanumerics and '_'; tags must be anything else
bool is_word_char(char c);

// Default '$' hook: payload is a variable name, unknown names yield "".
Hook variable_hook(std::shared_ptr<const VariableStore> variables);

// Default '&' hook: payload is "name(arg1,arg2,...)".
Hook function_hook(std::shared_ptr<const FunctionTable> functions);

struct FunctionCall {
    std::string name;
    std::vector<std::string> args;
};

// Parse "name(args)" and split the arguments on commas. Empty argument text
// gives no arguments and trailing empty arguments are dropped.
Result<FunctionCall> parse_function_call(const std::string& text);

} // namespace fillin
