#pragma once

#include <fillin/lang/engine.hpp>
#include <fillin/result.hpp>
#include <any>
#include <iosfwd>
#include <memory>
#include <string>
#include <unordered_map>

namespace fillin {

// A piece of fill-in text bound to the engine that interprets it, plus a bag of
// caller-defined properties. Interpreting never modifies the stored text.
class Template {
public:
    Template();
    explicit Template(std::string text,
                      std::shared_ptr<Engine> engine = Engine::shared());

    const std::string& text() const { return text_; }
    void set_text(std::string text) { text_ = std::move(text); }

    Engine& engine() { return *engine_; }
    const Engine& engine() const { return *engine_; }

    // Replace the text with the named template from the engine's search path.
    // "null" empties the text. A missing file leaves the text as it was; an
    // unreadable one empties it.
    Status load_file(const std::string& name);

    Result<std::string> interpret() const;
    Status interpret_to(std::ostream& out) const;

    void set_property(const std::string& name, std::any value);
    const std::any* property(const std::string& name) const;
    bool has_property(const std::string& name) const;

    // Typed access; nullptr when unset or holding another type
    template<typename T>
    const T* property_as(const std::string& name) const {
        const std::any* v = property(name);
        return v ? std::any_cast<T>(v) : nullptr;
    }

private:
    std::string text_;
    std::shared_ptr<Engine> engine_;
    std::unordered_map<std::string, std::any> properties_;
};

} // namespace fillin
