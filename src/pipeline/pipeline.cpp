#include "cmdvec/pipeline/pipeline.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/assets/manifest.hpp"
#include "cmdvec/catalog/catalog.hpp"
#include "cmdvec/config/config.hpp"
#include "cmdvec/embedding/embedding_table.hpp"
#include "cmdvec/observability/global.hpp"
#include "cmdvec/vectors/store_codec.hpp"

#include <chrono>
#include <fstream>

namespace cmdvec::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

common::Status require_input(const std::filesystem::path &path, const std::string &what) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return assets::fail_status({.code = assets::AssetErrorCode::MissingInput,
                                .message = what + " not found: " + path.string()});
  }
  return common::Status::success();
}

common::Status require_valid(const config::Config &config) {
  const auto validation = config::validate_config(config);
  if (!validation.ok()) {
    return common::Status::error("Invalid configuration: " + validation.error());
  }
  return common::Status::success();
}

std::uint64_t size_of(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

} // namespace

common::Result<ReduceRun> run_reduce(const config::Config &config) {
  if (const auto status = require_valid(config); !status.ok()) {
    return common::Result<ReduceRun>::failure(status.error());
  }

  ReduceRun run;
  run.corpus = config::corpus_path(config);
  run.output = config::vectors_path(config);
  if (const auto status = require_input(run.corpus, "corpus"); !status.ok()) {
    return common::Result<ReduceRun>::failure(status.error());
  }

  std::ifstream input(run.corpus, std::ios::binary);
  if (!input) {
    return assets::fail<ReduceRun>({.code = assets::AssetErrorCode::Io,
                                    .message = "unable to open corpus: " + run.corpus.string()});
  }

  const auto start = Clock::now();
  observability::record_stage_start("reduce");
  auto reduced = vectors::reduce_corpus(input,
                                        vectors::ReduceOptions{
                                            .top_k = config.reduce.top_k,
                                            .dimension = config.reduce.dimension,
                                            .progress_interval = config.reduce.progress_interval,
                                        });
  if (!reduced.ok()) {
    observability::record_error("reduce", reduced.error());
    return common::Result<ReduceRun>::failure(reduced.error());
  }
  auto result = reduced.take();

  if (const auto saved = vectors::save_vector_store(run.output, result.store); !saved.ok()) {
    observability::record_error("reduce", saved.error());
    return common::Result<ReduceRun>::failure(saved.error());
  }

  run.stats = result.stats;
  run.vocab_size = result.store.size();
  run.bytes_written = size_of(run.output);
  observability::record_asset_written(run.output.string(), run.bytes_written);
  observability::record_stage_end("reduce", elapsed_since(start), run.vocab_size);
  return common::Result<ReduceRun>::success(std::move(run));
}

common::Result<EmbedRun> run_embed(const config::Config &config) {
  if (const auto status = require_valid(config); !status.ok()) {
    return common::Result<EmbedRun>::failure(status.error());
  }

  EmbedRun run;
  run.vectors = config::vectors_path(config);
  run.catalog = config::catalog_path(config);
  run.output = config::embeddings_path(config);
  for (const auto &status : {require_input(run.vectors, "vector store"),
                             require_input(run.catalog, "catalog")}) {
    if (!status.ok()) {
      return common::Result<EmbedRun>::failure(status.error());
    }
  }

  const auto start = Clock::now();
  observability::record_stage_start("embed");

  auto store = vectors::load_vector_store(run.vectors, config.reduce.dimension);
  if (!store.ok()) {
    observability::record_error("embed", store.error());
    return common::Result<EmbedRun>::failure(store.error());
  }
  auto records = catalog::load_catalog(run.catalog);
  if (!records.ok()) {
    observability::record_error("embed", records.error());
    return common::Result<EmbedRun>::failure(records.error());
  }

  auto generated = embedding::generate_table(
      store.value(), records.value(),
      embedding::GenerationOptions{.threads = config.embed.threads,
                                   .progress_interval = config.embed.progress_interval});
  if (!generated.ok()) {
    observability::record_error("embed", generated.error());
    return common::Result<EmbedRun>::failure(generated.error());
  }
  auto result = generated.take();

  if (const auto saved = embedding::save_embedding_table(run.output, result.table); !saved.ok()) {
    observability::record_error("embed", saved.error());
    return common::Result<EmbedRun>::failure(saved.error());
  }

  run.vocab_size = store.value().size();
  run.report = result.report;
  run.zero_match_indices = std::move(result.zero_match_indices);
  run.bytes_written = size_of(run.output);
  if (run.report.zero_matches > 0) {
    observability::record_warning("embed", std::to_string(run.report.zero_matches) +
                                               " commands had no matching words in the vocabulary");
  }
  observability::record_asset_written(run.output.string(), run.bytes_written);
  observability::record_stage_end("embed", elapsed_since(start), run.report.count);
  return common::Result<EmbedRun>::success(std::move(run));
}

common::Result<BuildRun> run_build(const config::Config &config) {
  if (const auto status = require_valid(config); !status.ok()) {
    return common::Result<BuildRun>::failure(status.error());
  }
  for (const auto &status : {require_input(config::corpus_path(config), "corpus"),
                             require_input(config::catalog_path(config), "catalog")}) {
    if (!status.ok()) {
      return common::Result<BuildRun>::failure(status.error());
    }
  }

  BuildRun run;
  auto reduced = run_reduce(config);
  if (!reduced.ok()) {
    return common::Result<BuildRun>::failure(reduced.error());
  }
  run.reduce = reduced.take();

  auto embedded = run_embed(config);
  if (!embedded.ok()) {
    return common::Result<BuildRun>::failure(embedded.error());
  }
  run.embed = embedded.take();

  run.manifest = config::manifest_path(config);
  const auto manifest = assets::build_manifest(
      run.manifest, assets::ManifestInputs{.vectors = run.embed.vectors,
                                           .vocab_size = run.reduce.vocab_size,
                                           .catalog = run.embed.catalog,
                                           .records = run.embed.report.count,
                                           .embeddings = run.embed.output,
                                           .count = run.embed.report.count,
                                           .zero_vectors = run.embed.report.zero_matches,
                                           .dimension = run.embed.report.dimension});
  if (!manifest.ok()) {
    return common::Result<BuildRun>::failure(manifest.error());
  }
  if (const auto saved = assets::save_manifest(run.manifest, manifest.value()); !saved.ok()) {
    return common::Result<BuildRun>::failure(saved.error());
  }
  observability::record_asset_written(run.manifest.string(), size_of(run.manifest));
  return common::Result<BuildRun>::success(std::move(run));
}

} // namespace cmdvec::pipeline
