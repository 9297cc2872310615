#include <fillin/template_source.hpp>
#include <fstream>
#include <sstream>

namespace fillin {

namespace fs = std::filesystem;

static std::string join_path(const std::vector<std::string>& dirs) {
    std::string out;
    for (const auto& d : dirs) {
        if (!out.empty()) out += ' ';
        out += d;
    }
    return out;
}

Result<fs::path> find_template(const std::string& name,
                               const std::vector<std::string>& search_path) {
    std::error_code ec;
    fs::path p(name);

    if (p.is_absolute()) {
        if (fs::is_regular_file(p, ec)) {
            return Result<fs::path>::ok(p);
        }
    } else {
        for (const auto& dir : search_path) {
            fs::path candidate = fs::path(dir) / p;
            if (fs::is_regular_file(candidate, ec)) {
                return Result<fs::path>::ok(candidate);
            }
        }
    }

    return FillinError{FillinError::NotFound,
        "can't find template '" + name + "' in " + join_path(search_path),
        p.is_absolute() ? "" : "add its directory to the template search path"};
}

Result<std::string> load_template(const std::string& name,
                                  const std::vector<std::string>& search_path) {
    if (name == kNullTemplate) {
        return Result<std::string>::ok(std::string());
    }

    auto path = find_template(name, search_path);
    FILLIN_TRY(path);

    std::ifstream file(path.value(), std::ios::binary);
    if (!file.is_open()) {
        return FillinError{FillinError::IO,
            "can't open " + path.value().string(),
            "check file permissions"};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return FillinError{FillinError::IO,
            "error reading " + path.value().string()};
    }
    return Result<std::string>::ok(ss.str());
}

} // namespace fillin
