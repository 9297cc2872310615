#pragma once

#include <fillin/log.hpp>
#include <fillin/result.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fillin {

// Settings read from fillin TOML files. Unset fields stay std::nullopt so that
// layers can be merged: global < project < command line.
struct Config {
    std::optional<std::string> left_delimiter;
    std::optional<std::string> right_delimiter;
    std::optional<std::vector<std::string>> template_path;
    std::optional<log::Level> log_level;
    std::unordered_map<std::string, std::string> variables;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Discover the global config file path: ~/.fillin/config.toml
std::string global_config_path();

} // namespace fillin
