#pragma once

#include "cmdvec/catalog/command_record.hpp"
#include "cmdvec/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cmdvec::catalog {

enum class CatalogFormat { Yaml, Json };

[[nodiscard]] common::Result<std::vector<CommandRecord>> parse_yaml_catalog(const std::string &content);

[[nodiscard]] common::Result<std::vector<CommandRecord>> parse_json_catalog(const std::string &content);

[[nodiscard]] CatalogFormat detect_format(const std::filesystem::path &path,
                                          const std::string &content);

[[nodiscard]] common::Result<std::vector<CommandRecord>> load_catalog(const std::filesystem::path &path);

} // namespace cmdvec::catalog
