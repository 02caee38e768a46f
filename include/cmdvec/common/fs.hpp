#pragma once

#include "cmdvec/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cmdvec::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, std::string_view bytes);

[[nodiscard]] std::filesystem::path resolve_against(const std::filesystem::path &base,
                                                    const std::string &name);

} // namespace cmdvec::common
