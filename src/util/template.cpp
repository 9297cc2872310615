#include <fillin/template.hpp>
#include <fillin/template_source.hpp>

namespace fillin {

Template::Template() : engine_(Engine::shared()) {}

Template::Template(std::string text, std::shared_ptr<Engine> engine)
    : text_(std::move(text)),
      engine_(engine ? std::move(engine) : Engine::shared()) {}

Status Template::load_file(const std::string& name) {
    auto loaded = load_template(name, engine_->template_path());
    if (loaded.is_err()) {
        if (loaded.error().code == FillinError::IO) text_.clear();
        return std::move(loaded).error();
    }
    text_ = std::move(loaded).value();
    return ok_status();
}

Result<std::string> Template::interpret() const {
    return engine_->interpret(text_);
}

Status Template::interpret_to(std::ostream& out) const {
    return engine_->interpret_to(text_, out);
}

void Template::set_property(const std::string& name, std::any value) {
    properties_[name] = std::move(value);
}

const std::any* Template::property(const std::string& name) const {
    auto it = properties_.find(name);
    return it != properties_.end() ? &it->second : nullptr;
}

bool Template::has_property(const std::string& name) const {
    return properties_.count(name) > 0;
}

} // namespace fillin
