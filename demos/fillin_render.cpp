// fillin_render.cpp
//
// Render a fill-in template to stdout.
//
//     ./fillin_render greeting.tmpl
//     ./fillin_render --config site.toml --set user=Sam greeting.tmpl
//     ./fillin_render --verbose '/abs/path/page.tmpl'
//
// Settings come from ~/.fillin/config.toml, then --config, then --set.
// Besides '$' variables, templates can call [[&upper(..)]], [[&lower(..)]],
// [[&join(sep,a,b,..)]] and [[&add(1,2.5,..)]].

#include <fillin/config.hpp>
#include <fillin/log.hpp>
#include <fillin/result.hpp>
#include <fillin/template.hpp>

#include "sample_functions.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace fillin;

struct Options {
    std::string template_name;
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> assignments;
    bool verbose = false;
};

static const char* kUsage =
    "usage: fillin_render [--config FILE] [--set NAME=VALUE]... [--verbose] TEMPLATE";

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--set") {
            if (i + 1 >= argc) {
                return FillinError{FillinError::InvalidArg,
                    "missing value after " + arg, kUsage};
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                opts.config_file = value;
                continue;
            }
            auto eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                return FillinError{FillinError::InvalidArg,
                    "malformed assignment '" + value + "'",
                    "expected NAME=VALUE"};
            }
            opts.assignments.emplace_back(value.substr(0, eq), value.substr(eq + 1));
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return FillinError{FillinError::InvalidArg,
                "unknown option " + arg, kUsage};
        } else if (opts.template_name.empty()) {
            opts.template_name = arg;
        } else {
            return FillinError{FillinError::InvalidArg,
                "more than one template given", kUsage};
        }
    }

    if (opts.template_name.empty()) {
        return FillinError{FillinError::InvalidArg, "no template specified", kUsage};
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        FILLIN_TRY(g);
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!opts.config_file.empty()) {
        auto l = Config::load(opts.config_file);
        FILLIN_TRY(l);
        local = std::move(l).value();
    }

    Config cfg = Config::effective(global, local);
    for (const auto& [name, value] : opts.assignments) {
        cfg.variables[name] = value;
    }
    return Result<Config>::ok(std::move(cfg));
}

Status render(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    FILLIN_TRY(opts);

    if (opts.value().verbose) log::set_level(log::Debug);

    auto cfg = load_config(opts.value());
    FILLIN_TRY(cfg);
    if (cfg.value().log_level && !opts.value().verbose) {
        log::set_level(*cfg.value().log_level);
    }

    auto engine = std::make_shared<Engine>();
    FILLIN_TRY(engine->configure(cfg.value()));
    demo::register_sample_functions(engine->functions());

    Template tmpl(std::string(), engine);
    FILLIN_TRY(tmpl.load_file(opts.value().template_name));
    log::debug("template '%s' is %zu bytes",
               opts.value().template_name.c_str(), tmpl.text().size());

    return tmpl.interpret_to(std::cout);
}

int main(int argc, char** argv) {
    auto result = render(argc, argv);
    if (result.is_err()) {
        std::cout.flush();
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
