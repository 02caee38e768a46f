#pragma once

#include "cmdvec/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cmdvec::common {

[[nodiscard]] std::string sha256_hex(std::string_view bytes);

[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

} // namespace cmdvec::common
