#pragma once

#include <fillin/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace fillin {

// Reserved template name that stands for an empty template.
constexpr const char* kNullTemplate = "null";

// Locate `name`: absolute paths are used as given, relative ones are tried
// against each directory of `search_path` in order.
Result<std::filesystem::path> find_template(const std::string& name,
                                            const std::vector<std::string>& search_path);

// Locate and read `name`. kNullTemplate yields "" without touching the disk.
Result<std::string> load_template(const std::string& name,
                                  const std::vector<std::string>& search_path);

} // namespace fillin
