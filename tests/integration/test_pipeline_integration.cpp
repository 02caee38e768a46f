#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/assets/manifest.hpp"
#include "cmdvec/config/config.hpp"
#include "cmdvec/embedding/embedding_table.hpp"
#include "cmdvec/pipeline/pipeline.hpp"
#include "cmdvec/vectors/store_codec.hpp"

#include <filesystem>

namespace {

namespace pipeline = cmdvec::pipeline;
using cmdvec::testing::corpus_line;
using cmdvec::testing::TempWorkspace;

constexpr std::size_t kDim = cmdvec::vectors::VECTOR_DIMENSION;

std::string sample_corpus() {
  return corpus_line("the", kDim, 0.1F) + corpus_line("list", kDim, 1.0F) +
         corpus_line("files", kDim, 3.0F) + "short 1 2 3\n" + corpus_line("list", kDim, 2.0F) +
         corpus_line("remove", kDim, -1.0F) + corpus_line("directory", kDim, 0.5F);
}

const char *sample_catalog() {
  return "commands:\n"
         "  - command: ls\n"
         "    description: List files\n"
         "    keywords: [directory]\n"
         "  - command: rm -rf\n"
         "    description: Remove a directory tree\n"
         "  - command: htop\n";
}

} // namespace

void register_pipeline_integration_tests(std::vector<cmdvec::tests::TestCase> &tests) {
  using cmdvec::tests::require;

  tests.push_back({"pipeline_build_end_to_end", [] {
                     TempWorkspace workspace;
                     workspace.create_file("glove.6B.100d.txt", sample_corpus());
                     workspace.create_file("commands.yml", sample_catalog());
                     const auto config = cmdvec::testing::temp_config(workspace);
                     const cmdvec::testing::ObserverGuard observer;

                     const auto built = pipeline::run_build(config);
                     require(built.ok(), built.error());
                     const auto &run = built.value();
                     require(run.reduce.stats.malformed == 1, "short line is malformed");
                     require(run.reduce.stats.duplicates == 1, "list appears twice");
                     require(run.reduce.vocab_size == 5, "five distinct words");
                     require(run.embed.report.count == 3, "three commands");
                     require(run.embed.report.zero_matches == 1, "htop matches nothing");
                     require(run.embed.zero_match_indices == std::vector<std::size_t>{2}, "htop index");

                     const auto store = cmdvec::vectors::load_vector_store(cmdvec::config::vectors_path(config));
                     require(store.ok(), store.error());
                     require(store.value().entries()[1].word == "list", "list keeps its first position");
                     require(store.value().entries()[1].values[0] == 2.0F, "list takes its last vector");

                     const auto table =
                         cmdvec::embedding::load_embedding_table(cmdvec::config::embeddings_path(config));
                     require(table.ok(), table.error());
                     // ls: ls(miss) list(2) files(3) directory(0.5)
                     require(table.value().rows[0][0] == static_cast<float>(5.5 / 3.0), "ls row");
                     // rm -rf: rm, rf miss; remove(-1) a(miss) directory(0.5) tree(miss)
                     require(table.value().rows[1][kDim - 1] == -0.25F, "rm row");
                     require(table.value().rows[2][0] == 0.0F, "htop row");

                     const auto manifest = cmdvec::assets::load_manifest(run.manifest);
                     require(manifest.ok(), manifest.error());
                     require(cmdvec::assets::verify_manifest(run.manifest, manifest.value()).empty(),
                             "fresh build verifies");
                     require(manifest.value().zero_vectors == 1, "zero vectors recorded");

                     const auto ends =
                         observer.observer().events_of<cmdvec::observability::StageEndEvent>();
                     require(ends.size() == 2, "reduce and embed stages end");
                     const auto written =
                         observer.observer().events_of<cmdvec::observability::AssetWrittenEvent>();
                     require(written.size() == 3, "store, table and manifest written");
                   }});

  tests.push_back({"pipeline_missing_corpus_writes_nothing", [] {
                     TempWorkspace workspace;
                     workspace.create_file("commands.yml", sample_catalog());
                     const auto config = cmdvec::testing::temp_config(workspace);
                     const auto built = pipeline::run_build(config);
                     require(!built.ok(), "build without corpus should fail");
                     require(cmdvec::assets::has_error_code(built.error(),
                                                            cmdvec::assets::AssetErrorCode::MissingInput),
                             built.error());
                     require(!std::filesystem::exists(cmdvec::config::vectors_path(config)), "no store");
                     require(!std::filesystem::exists(cmdvec::config::manifest_path(config)), "no manifest");
                   }});

  tests.push_back({"pipeline_missing_catalog_fails_before_reduce", [] {
                     TempWorkspace workspace;
                     workspace.create_file("glove.6B.100d.txt", sample_corpus());
                     const auto config = cmdvec::testing::temp_config(workspace);
                     const auto built = pipeline::run_build(config);
                     require(cmdvec::assets::has_error_code(built.error(),
                                                            cmdvec::assets::AssetErrorCode::MissingInput),
                             built.error());
                     require(!std::filesystem::exists(cmdvec::config::vectors_path(config)),
                             "reduce must not run");
                   }});

  tests.push_back({"pipeline_embed_respects_thread_count", [] {
                     TempWorkspace workspace;
                     workspace.create_file("glove.6B.100d.txt", sample_corpus());
                     std::string catalog;
                     for (int i = 0; i < 60; ++i) {
                       catalog += "- command: cmd" + std::to_string(i) + "\n";
                       catalog += i % 2 == 0 ? "  description: list files\n" : "  keywords: [remove]\n";
                     }
                     workspace.create_file("commands.yml", catalog);
                     auto config = cmdvec::testing::temp_config(workspace);
                     require(pipeline::run_reduce(config).ok(), "reduce failed");

                     const auto single = pipeline::run_embed(config);
                     require(single.ok(), single.error());
                     const auto first = cmdvec::embedding::load_embedding_table(single.value().output);

                     config.embed.threads = 7;
                     const auto parallel = pipeline::run_embed(config);
                     require(parallel.ok(), parallel.error());
                     const auto second = cmdvec::embedding::load_embedding_table(parallel.value().output);
                     require(first.ok() && second.ok(), "tables load");
                     require(first.value() == second.value(), "tables match across thread counts");
                   }});

  tests.push_back({"pipeline_rejects_invalid_config", [] {
                     TempWorkspace workspace;
                     auto config = cmdvec::testing::temp_config(workspace);
                     config.reduce.top_k = 0;
                     const auto reduced = pipeline::run_reduce(config);
                     require(!reduced.ok(), "top_k 0 should fail");
                     require(reduced.error().find("Invalid configuration") == 0, reduced.error());
                   }});

  tests.push_back({"pipeline_top_k_caps_vocabulary", [] {
                     TempWorkspace workspace;
                     workspace.create_file("glove.6B.100d.txt", sample_corpus());
                     auto config = cmdvec::testing::temp_config(workspace);
                     config.reduce.top_k = 2;
                     const auto reduced = pipeline::run_reduce(config);
                     require(reduced.ok(), reduced.error());
                     require(reduced.value().vocab_size == 2, "two words kept");
                     require(reduced.value().bytes_written == 4 + 2 * 2 + 3 + 4 + 2 * kDim * 4,
                             "bytes written");
                   }});
}
