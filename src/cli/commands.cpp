#include "cmdvec/cli/commands.hpp"

#include "cmdvec/common/fs.hpp"
#include "cmdvec/config/config.hpp"
#include "cmdvec/doctor/diagnostics.hpp"
#include "cmdvec/embedding/generator.hpp"
#include "cmdvec/observability/factory.hpp"
#include "cmdvec/observability/global.hpp"
#include "cmdvec/pipeline/pipeline.hpp"
#include "cmdvec/text/tokenizer.hpp"
#include "cmdvec/vectors/store_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace cmdvec::cli {

namespace {

constexpr std::size_t DEFAULT_SAMPLES = 5;
constexpr std::size_t QUERY_LEADING = 5;

std::string version_string() {
#ifdef CMDVEC_VERSION
  std::string version = CMDVEC_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef CMDVEC_GIT_COMMIT
  const std::string commit = CMDVEC_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "cmdvec " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Removes `name VALUE` from args. Fails when the flag is present without a value.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::optional<std::string> &out_value,
                 std::string &error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::optional<std::uint64_t> parse_count(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

bool reject_extra(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument for " << command << ": " << args.front() << "\n";
  return true;
}

// Command-line paths are taken relative to the working directory, not assets.dir.
std::string absolute_arg(const std::string &value) {
  std::error_code ec;
  auto path = std::filesystem::absolute(common::expand_path(value), ec);
  if (ec) {
    return common::expand_path(value);
  }
  return path.lexically_normal().string();
}

// Load failures are reported on stderr.
std::optional<config::Config> load_ready_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return std::nullopt;
  }
  return cfg.take();
}

bool prepare_run(const config::Config &cfg) {
  const auto validation = config::validate_config(cfg);
  if (!validation.ok()) {
    std::cerr << "Invalid config: " << validation.error() << "\n";
    return false;
  }
  observability::set_global_observer(observability::create_observer(cfg));
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }
  return true;
}

void print_reduce_run(const pipeline::ReduceRun &run) {
  std::cout << "Reduced " << run.corpus.string() << "\n";
  std::cout << "  lines read: " << run.stats.lines_read << "\n";
  std::cout << "  accepted: " << run.stats.accepted << "\n";
  std::cout << "  malformed: " << run.stats.malformed << "\n";
  std::cout << "  duplicates: " << run.stats.duplicates << "\n";
  std::cout << "Wrote " << run.vocab_size << " words to " << run.output.string() << " ("
            << run.bytes_written << " bytes)\n";
}

void print_embed_run(const pipeline::EmbedRun &run) {
  std::cout << "Embedded " << run.report.count << " commands from " << run.catalog.string()
            << " using " << run.vocab_size << " words\n";
  std::cout << "  dimension: " << run.report.dimension << "\n";
  std::cout << "  zero vectors: " << run.report.zero_matches << "\n";
  std::cout << "Wrote " << run.output.string() << " (" << run.bytes_written << " bytes)\n";
}

int run_reduce(std::vector<std::string> args) {
  std::optional<std::string> corpus;
  std::optional<std::string> output;
  std::optional<std::string> top_k;
  std::string error;
  if (!take_option(args, "--corpus", "", corpus, error) ||
      !take_option(args, "--output", "-o", output, error) ||
      !take_option(args, "--top-k", "-k", top_k, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (reject_extra(args, "reduce")) {
    return 1;
  }

  auto cfg = load_ready_config();
  if (!cfg.has_value()) {
    return 1;
  }
  if (corpus.has_value()) {
    cfg->assets.corpus = absolute_arg(*corpus);
  }
  if (output.has_value()) {
    cfg->assets.vectors = absolute_arg(*output);
  }
  if (top_k.has_value()) {
    const auto parsed = parse_count(*top_k);
    if (!parsed.has_value()) {
      std::cerr << "invalid --top-k: " << *top_k << "\n";
      return 1;
    }
    cfg->reduce.top_k = *parsed;
  }
  if (!prepare_run(*cfg)) {
    return 1;
  }

  const auto run = pipeline::run_reduce(*cfg);
  if (!run.ok()) {
    std::cerr << run.error() << "\n";
    return 1;
  }
  print_reduce_run(run.value());
  return 0;
}

int run_embed(std::vector<std::string> args) {
  std::optional<std::string> vectors;
  std::optional<std::string> catalog;
  std::optional<std::string> output;
  std::optional<std::string> threads;
  std::string error;
  if (!take_option(args, "--vectors", "", vectors, error) ||
      !take_option(args, "--catalog", "", catalog, error) ||
      !take_option(args, "--output", "-o", output, error) ||
      !take_option(args, "--threads", "-j", threads, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (reject_extra(args, "embed")) {
    return 1;
  }

  auto cfg = load_ready_config();
  if (!cfg.has_value()) {
    return 1;
  }
  if (vectors.has_value()) {
    cfg->assets.vectors = absolute_arg(*vectors);
  }
  if (catalog.has_value()) {
    cfg->assets.catalog = absolute_arg(*catalog);
  }
  if (output.has_value()) {
    cfg->assets.embeddings = absolute_arg(*output);
  }
  if (threads.has_value()) {
    const auto parsed = parse_count(*threads);
    if (!parsed.has_value() || *parsed > std::numeric_limits<std::uint32_t>::max()) {
      std::cerr << "invalid --threads: " << *threads << "\n";
      return 1;
    }
    cfg->embed.threads = static_cast<std::uint32_t>(*parsed);
  }
  if (!prepare_run(*cfg)) {
    return 1;
  }

  const auto run = pipeline::run_embed(*cfg);
  if (!run.ok()) {
    std::cerr << run.error() << "\n";
    return 1;
  }
  print_embed_run(run.value());
  return 0;
}

int run_build(std::vector<std::string> args) {
  if (reject_extra(args, "build")) {
    return 1;
  }
  auto cfg = load_ready_config();
  if (!cfg.has_value() || !prepare_run(*cfg)) {
    return 1;
  }

  const auto run = pipeline::run_build(*cfg);
  if (!run.ok()) {
    std::cerr << run.error() << "\n";
    return 1;
  }
  print_reduce_run(run.value().reduce);
  print_embed_run(run.value().embed);
  std::cout << "Manifest: " << run.value().manifest.string() << "\n";
  return 0;
}

int run_inspect(std::vector<std::string> args) {
  std::optional<std::string> samples_arg;
  std::string error;
  if (!take_option(args, "--samples", "-n", samples_arg, error)) {
    std::cerr << error << "\n";
    return 1;
  }
  if (args.empty() || (args[0] != "vectors" && args[0] != "embeddings")) {
    std::cerr << "usage: cmdvec inspect vectors|embeddings [PATH] [--samples N]\n";
    return 1;
  }
  const std::string target = args[0];
  if (args.size() > 2) {
    std::cerr << "unexpected argument for inspect: " << args[2] << "\n";
    return 1;
  }

  std::size_t samples = DEFAULT_SAMPLES;
  if (samples_arg.has_value()) {
    const auto parsed = parse_count(*samples_arg);
    if (!parsed.has_value()) {
      std::cerr << "invalid --samples: " << *samples_arg << "\n";
      return 1;
    }
    samples = static_cast<std::size_t>(*parsed);
  }

  auto cfg = load_ready_config();
  if (!cfg.has_value()) {
    return 1;
  }

  if (target == "vectors") {
    const std::filesystem::path path =
        args.size() > 1 ? std::filesystem::path(absolute_arg(args[1])) : config::vectors_path(*cfg);
    std::cout << "Vector store: " << path.string() << "\n";
    const auto summary = doctor::inspect_vector_store(path, cfg->reduce.dimension, samples);
    if (!summary.ok()) {
      std::cerr << summary.error() << "\n";
      return 1;
    }
    doctor::print_vector_store_summary(summary.value());
    return 0;
  }

  const std::filesystem::path path =
      args.size() > 1 ? std::filesystem::path(absolute_arg(args[1])) : config::embeddings_path(*cfg);
  std::cout << "Embedding table: " << path.string() << "\n";
  const auto summary = doctor::inspect_embedding_table(path, samples);
  if (!summary.ok()) {
    std::cerr << summary.error() << "\n";
    return 1;
  }
  doctor::print_embedding_table_summary(summary.value());
  return 0;
}

int run_query(const std::vector<std::string> &args) {
  const std::string text = join_tokens(args);
  if (common::trim(text).empty()) {
    std::cerr << "usage: cmdvec query <text...>\n";
    return 1;
  }

  auto cfg = load_ready_config();
  if (!cfg.has_value()) {
    return 1;
  }
  const auto store = vectors::load_vector_store(config::vectors_path(*cfg), cfg->reduce.dimension);
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }

  const auto tokens = text::tokenize(text);
  std::cout << "Tokens:";
  if (tokens.empty()) {
    std::cout << " (none)";
  }
  std::cout << "\n";
  for (const auto &token : tokens) {
    std::cout << "  " << token << " " << (store.value().contains(token) ? "hit" : "miss") << "\n";
  }

  const auto embedding = embedding::embed_tokens(store.value(), tokens);
  double norm = 0.0;
  for (const float value : embedding.values) {
    norm += static_cast<double>(value) * static_cast<double>(value);
  }
  std::cout << "Matched: " << embedding.matched << " of " << tokens.size() << "\n";
  std::ostringstream numbers;
  numbers << std::fixed << std::setprecision(4) << "Norm: " << std::sqrt(norm) << "\n";
  numbers << "Leading:";
  for (std::size_t i = 0; i < std::min(QUERY_LEADING, embedding.values.size()); ++i) {
    numbers << " " << embedding.values[i];
  }
  std::cout << numbers.str() << "\n";
  return 0;
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto cp = config::config_path();
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string()
              << (config::config_exists() ? "" : " (not found, using defaults)") << "\n";
  }
  std::cout << "Assets: " << common::expand_path(cfg.value().assets.dir) << "\n";

  const auto show = [](const char *label, const std::filesystem::path &path) {
    std::error_code ec;
    const bool present = std::filesystem::is_regular_file(path, ec);
    std::cout << "  " << label << path.string() << (present ? "" : " (missing)") << "\n";
  };
  show("corpus:     ", config::corpus_path(cfg.value()));
  show("vectors:    ", config::vectors_path(cfg.value()));
  show("catalog:    ", config::catalog_path(cfg.value()));
  show("embeddings: ", config::embeddings_path(cfg.value()));
  show("manifest:   ", config::manifest_path(cfg.value()));

  std::cout << "Top K: " << cfg.value().reduce.top_k << "\n";
  std::cout << "Dimension: " << cfg.value().reduce.dimension << "\n";
  std::cout << "Threads: " << cfg.value().embed.threads << "\n";
  return 0;
}

int run_doctor() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }

  const auto report = doctor::run_diagnostics(cfg.value());
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "show") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "init") {
    args.erase(args.begin());
    const bool force = take_flag(args, "--force");
    if (reject_extra(args, "config init")) {
      return 1;
    }
    const auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    if (config::config_exists() && !force) {
      std::cerr << "config already exists: " << path.value().string()
                << " (use --force to overwrite)\n";
      return 1;
    }
    const auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    std::cout << "Wrote " << path.value().string() << "\n";
    return 0;
  }

  std::cerr << "unknown config command: " << args[0] << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  cmdvec [--config PATH] <command> [options]\n\n";

  std::cout << "ASSETS\n";
  std::cout << "  reduce [--corpus P] [--output P] [--top-k N]\n";
  std::cout << "                 Keep the first N corpus words as a binary vector store\n";
  std::cout << "  embed [--vectors P] [--catalog P] [--output P] [--threads N]\n";
  std::cout << "                 Average word vectors into one embedding per command\n";
  std::cout << "  build          reduce, embed, then write the manifest\n\n";

  std::cout << "INSPECTION\n";
  std::cout << "  inspect vectors|embeddings [PATH] [--samples N]\n";
  std::cout << "                 Print the header and the first N entries\n";
  std::cout << "  query <text>   Show which tokens of a phrase the vector store knows\n\n";

  std::cout << "DIAGNOSTICS\n";
  std::cout << "  status         Show configured asset paths\n";
  std::cout << "  doctor         Check assets for consistency\n";
  std::cout << "  config show    Display current configuration\n";
  std::cout << "  config init    Write a default config file\n";
  std::cout << "  config-path    Print the config file location\n";
  std::cout << "  version        Show version\n\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "reduce") {
    return run_reduce(std::move(args));
  }
  if (subcommand == "embed") {
    return run_embed(std::move(args));
  }
  if (subcommand == "build") {
    return run_build(std::move(args));
  }
  if (subcommand == "inspect") {
    return run_inspect(std::move(args));
  }
  if (subcommand == "query") {
    return run_query(args);
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cmdvec::cli
