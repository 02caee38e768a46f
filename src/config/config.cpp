#include "cmdvec/config/config.hpp"

#include "cmdvec/common/fs.hpp"
#include "cmdvec/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <thread>

namespace cmdvec::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cmdvec";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CMDVEC_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

template <typename T> std::optional<T> parse_unsigned(const std::string &raw) {
  const std::string value = common::trim(raw);
  T parsed{};
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

bool is_known_level(const std::string &level) {
  return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool is_known_backend(const std::string &backend) {
  return backend == "log" || backend == "none" || backend == "noop";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("CMDVEC_ASSETS_DIR"); dir != nullptr && *dir) {
    config.assets.dir = expand_config_value(dir);
  }

  if (const char *top_k = std::getenv("CMDVEC_TOP_K"); top_k != nullptr && *top_k) {
    if (const auto parsed = parse_unsigned<std::uint64_t>(top_k); parsed.has_value()) {
      config.reduce.top_k = *parsed;
    }
  }

  if (const char *threads = std::getenv("CMDVEC_THREADS"); threads != nullptr && *threads) {
    if (const auto parsed = parse_unsigned<std::uint32_t>(threads); parsed.has_value()) {
      config.embed.threads = *parsed;
    }
  }

  if (const char *level = std::getenv("CMDVEC_LOG_LEVEL"); level != nullptr && *level) {
    config.observability.level = common::to_lower(common::trim(level));
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.assets.dir = expand_config_value(doc.get_string("assets.dir", config.assets.dir));
  config.assets.corpus = expand_config_value(doc.get_string("assets.corpus", config.assets.corpus));
  config.assets.vectors =
      expand_config_value(doc.get_string("assets.vectors", config.assets.vectors));
  config.assets.catalog =
      expand_config_value(doc.get_string("assets.catalog", config.assets.catalog));
  config.assets.embeddings =
      expand_config_value(doc.get_string("assets.embeddings", config.assets.embeddings));
  config.assets.manifest =
      expand_config_value(doc.get_string("assets.manifest", config.assets.manifest));

  config.reduce.top_k = doc.get_u64("reduce.top_k", config.reduce.top_k);
  config.reduce.dimension =
      static_cast<std::size_t>(doc.get_u64("reduce.dimension", config.reduce.dimension));
  config.reduce.progress_interval =
      doc.get_u64("reduce.progress_interval", config.reduce.progress_interval);

  const std::uint64_t threads = doc.get_u64("embed.threads", config.embed.threads);
  if (threads > std::numeric_limits<std::uint32_t>::max()) {
    return common::Result<Config>::failure("embed.threads is out of range");
  }
  config.embed.threads = static_cast<std::uint32_t>(threads);
  config.embed.progress_interval =
      doc.get_u64("embed.progress_interval", config.embed.progress_interval);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));
  config.observability.level =
      common::to_lower(doc.get_string("observability.level", config.observability.level));

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  file << "[assets]\n";
  file << "dir = " << common::quote_toml_string(config.assets.dir) << "\n";
  file << "corpus = " << common::quote_toml_string(config.assets.corpus) << "\n";
  file << "vectors = " << common::quote_toml_string(config.assets.vectors) << "\n";
  file << "catalog = " << common::quote_toml_string(config.assets.catalog) << "\n";
  file << "embeddings = " << common::quote_toml_string(config.assets.embeddings) << "\n";
  file << "manifest = " << common::quote_toml_string(config.assets.manifest) << "\n";

  file << "\n[reduce]\n";
  file << "top_k = " << config.reduce.top_k << "\n";
  file << "dimension = " << config.reduce.dimension << "\n";
  file << "progress_interval = " << config.reduce.progress_interval << "\n";

  file << "\n[embed]\n";
  file << "threads = " << config.embed.threads << "\n";
  file << "progress_interval = " << config.embed.progress_interval << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "level = " << common::quote_toml_string(config.observability.level) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }
  const auto status = common::write_file_atomic(cfg_path_result.value(), render_config(config));
  if (!status.ok()) {
    return common::Status::error("Failed to write config: " + status.error());
  }
  return common::Status::success();
}

std::uint32_t max_embed_threads() {
  return std::max<std::uint32_t>(64, std::thread::hardware_concurrency() * 4);
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.reduce.top_k == 0) {
    return common::Result<std::vector<std::string>>::failure("reduce.top_k must be at least 1");
  }
  if (config.reduce.top_k > std::numeric_limits<std::uint32_t>::max()) {
    return common::Result<std::vector<std::string>>::failure(
        "reduce.top_k exceeds the u32 vocabulary header");
  }
  if (config.reduce.dimension == 0) {
    return common::Result<std::vector<std::string>>::failure("reduce.dimension must be at least 1");
  }
  if (config.embed.threads == 0) {
    return common::Result<std::vector<std::string>>::failure("embed.threads must be at least 1");
  }
  if (config.embed.threads > max_embed_threads()) {
    return common::Result<std::vector<std::string>>::failure(
        "embed.threads " + std::to_string(config.embed.threads) + " exceeds the limit of " +
        std::to_string(max_embed_threads()));
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!is_known_backend(backend)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }
  const std::string level = common::to_lower(common::trim(config.observability.level));
  if (!is_known_level(level)) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                              config.observability.level);
  }

  if (config.reduce.dimension != 100) {
    warnings.push_back("reduce.dimension is " + std::to_string(config.reduce.dimension) +
                       "; the command lookup reader expects 100");
  }
  if (config.reduce.progress_interval == 0 || config.embed.progress_interval == 0) {
    warnings.push_back("a progress_interval of 0 disables progress reporting");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::filesystem::path corpus_path(const Config &config) {
  return common::resolve_against(common::expand_path(config.assets.dir), config.assets.corpus);
}

std::filesystem::path vectors_path(const Config &config) {
  return common::resolve_against(common::expand_path(config.assets.dir), config.assets.vectors);
}

std::filesystem::path catalog_path(const Config &config) {
  return common::resolve_against(common::expand_path(config.assets.dir), config.assets.catalog);
}

std::filesystem::path embeddings_path(const Config &config) {
  return common::resolve_against(common::expand_path(config.assets.dir),
                                 config.assets.embeddings);
}

std::filesystem::path manifest_path(const Config &config) {
  return common::resolve_against(common::expand_path(config.assets.dir), config.assets.manifest);
}

} // namespace cmdvec::config
