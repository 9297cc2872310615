#include <fillin/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdint>
#include <cstdio>

namespace fillin {

static FillinError type_error(const std::string& key, const char* expected) {
    return FillinError{FillinError::Config,
        "config key '" + key + "' must be " + expected};
}

// Fewest digits that read back as the same double
static std::string format_double(double d) {
    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    return buf;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FillinError{FillinError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [delimiters] section
    if (auto delims = doc["delimiters"].as_table()) {
        for (const char* side : {"left", "right"}) {
            auto node = (*delims)[side];
            if (!node) continue;
            auto s = node.value<std::string>();
            if (!s) return type_error(std::string("delimiters.") + side, "a string");
            if (s->empty()) {
                return FillinError{FillinError::Config,
                    std::string("config key 'delimiters.") + side + "' is empty",
                    "delimiters must be at least one character long"};
            }
            if (std::string(side) == "left") {
                cfg.left_delimiter = *s;
            } else {
                cfg.right_delimiter = *s;
            }
        }
    }

    // [template] section
    if (auto tmpl = doc["template"].as_table()) {
        if (auto node = (*tmpl)["path"]) {
            auto arr = node.as_array();
            if (!arr) return type_error("template.path", "an array of strings");
            std::vector<std::string> dirs;
            for (const auto& entry : *arr) {
                auto s = entry.value<std::string>();
                if (!s) return type_error("template.path", "an array of strings");
                dirs.push_back(*s);
            }
            cfg.template_path = std::move(dirs);
        }
    }

    // [variables] section: strings, plus numbers and booleans rendered as text
    if (auto vars = doc["variables"].as_table()) {
        for (const auto& [key, val] : *vars) {
            std::string k(key);
            if (auto s = val.value_exact<std::string>()) {
                cfg.variables[k] = *s;
            } else if (auto i = val.value_exact<std::int64_t>()) {
                cfg.variables[k] = std::to_string(*i);
            } else if (auto b = val.value_exact<bool>()) {
                cfg.variables[k] = *b ? "true" : "false";
            } else if (auto d = val.value_exact<double>()) {
                cfg.variables[k] = format_double(*d);
            } else {
                return type_error("variables." + k, "a string, number, or boolean");
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            if (!s) return type_error("log.level", "a string");
            auto lvl = log::parse_level(*s);
            if (!lvl) {
                return FillinError{FillinError::Config,
                    "unknown log level '" + *s + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FillinError{FillinError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        FillinError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.left_delimiter) left_delimiter = other.left_delimiter;
    if (other.right_delimiter) right_delimiter = other.right_delimiter;
    if (other.template_path) template_path = other.template_path;
    if (other.log_level) log_level = other.log_level;

    // Variables: other overrides this per-name
    for (const auto& [k, v] : other.variables) {
        variables[k] = v;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.fillin/config.toml";
}

} // namespace fillin
