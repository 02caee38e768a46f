#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/config/schema.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmdvec::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] std::uint32_t max_embed_threads();

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::filesystem::path corpus_path(const Config &config);
[[nodiscard]] std::filesystem::path vectors_path(const Config &config);
[[nodiscard]] std::filesystem::path catalog_path(const Config &config);
[[nodiscard]] std::filesystem::path embeddings_path(const Config &config);
[[nodiscard]] std::filesystem::path manifest_path(const Config &config);

} // namespace cmdvec::config
