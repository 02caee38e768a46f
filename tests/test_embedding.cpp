#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/byte_io.hpp"
#include "cmdvec/embedding/embedding_table.hpp"
#include "cmdvec/embedding/generator.hpp"

#include <algorithm>

namespace {

namespace assets = cmdvec::assets;
namespace catalog = cmdvec::catalog;
namespace embedding = cmdvec::embedding;
namespace vectors = cmdvec::vectors;
using cmdvec::testing::basis_store;

catalog::CommandRecord record(std::string command, std::string description = "",
                              std::vector<std::string> keywords = {}) {
  catalog::CommandRecord out;
  out.command = std::move(command);
  out.description = std::move(description);
  out.keywords = std::move(keywords);
  return out;
}

// Store with irregular values so that summation order shows up in the low bits.
vectors::VectorStore irregular_store() {
  vectors::VectorStore store;
  const std::vector<std::string> words{"list", "files", "directory", "show", "hidden", "remove"};
  for (std::size_t w = 0; w < words.size(); ++w) {
    std::vector<float> values(vectors::VECTOR_DIMENSION);
    for (std::size_t i = 0; i < values.size(); ++i) {
      values[i] = static_cast<float>((w + 1) * 0.1234567 + static_cast<double>(i) * 1e-3) *
                  (i % 2 == 0 ? 1.0F : -1.0F);
    }
    if (!store.upsert(words[w], values).ok()) {
      throw std::runtime_error("store setup failed");
    }
  }
  return store;
}

std::vector<catalog::CommandRecord> many_records(const std::size_t count) {
  const std::vector<std::string> vocab{"list", "files", "directory", "show", "hidden", "remove",
                                       "unknown"};
  std::vector<catalog::CommandRecord> records;
  for (std::size_t i = 0; i < count; ++i) {
    records.push_back(record("cmd" + std::to_string(i), vocab[i % vocab.size()] + " " +
                                                            vocab[(i * 3) % vocab.size()],
                             {vocab[(i + 2) % vocab.size()]}));
  }
  return records;
}

} // namespace

void register_embedding_tests(std::vector<cmdvec::tests::TestCase> &tests) {
  using cmdvec::tests::require;

  tests.push_back({"record_tokens_orders_command_description_keywords", [] {
                     const auto tokens = embedding::record_tokens(
                         record("ls -la", "List directory contents", {"show files", "dir"}));
                     require(tokens == std::vector<std::string>{"ls", "la", "list", "directory",
                                                                "contents", "show", "files", "dir"},
                             "unexpected token order");
                   }});

  tests.push_back({"embed_averages_matched_vectors", [] {
                     const auto store = basis_store(2, {"aa", "bb"});
                     const auto result = embedding::embed_record(store, record("aa", "bb"));
                     require(result.matched == 2, "two matches");
                     require(result.values == std::vector<float>{0.5F, 0.5F}, "mean of e0 and e1");
                   }});

  tests.push_back({"embed_repeated_tokens_weigh_more", [] {
                     const auto store = basis_store(2, {"aa", "bb"});
                     const auto result = embedding::embed_text(store, "aa aa aa bb");
                     require(result.matched == 4, "duplicates count");
                     require(result.values == std::vector<float>{0.75F, 0.25F}, "weighted mean");
                   }});

  tests.push_back({"embed_skips_unknown_tokens", [] {
                     const auto store = basis_store(3, {"git", "log"});
                     const auto result = embedding::embed_text(store, "git --oneline log");
                     require(result.matched == 2, "oneline is not in the store");
                     require(result.values == std::vector<float>{0.5F, 0.5F, 0.0F}, "mean of hits");
                   }});

  tests.push_back({"embed_without_matches_is_zero_vector", [] {
                     const auto store = irregular_store();
                     const auto result =
                         embedding::embed_record(store, record("xyz", "qqq zzz", {"nope"}));
                     require(result.matched == 0, "no matches");
                     require(result.values.size() == vectors::VECTOR_DIMENSION, "full dimension");
                     require(std::all_of(result.values.begin(), result.values.end(),
                                         [](float v) { return v == 0.0F; }),
                             "all components zero");
                   }});

  tests.push_back({"embed_is_bit_reproducible", [] {
                     const auto store = irregular_store();
                     const auto r = record("ls", "list hidden files in a directory", {"show", "list"});
                     const auto first = embedding::embed_record(store, r);
                     const auto second = embedding::embed_record(store, r);
                     require(vectors::same_bits(first.values, second.values), "embeddings differ");
                   }});

  tests.push_back({"embed_sums_in_double_then_narrows", [] {
                     vectors::VectorStore store(1);
                     require(store.upsert("big", {16777216.0F}).ok(), "setup");
                     require(store.upsert("one", {1.0F}).ok(), "setup");
                     // Float accumulation would lose the +1 terms: 2^24 + 1 rounds back to 2^24.
                     const auto result = embedding::embed_text(store, "big one one");
                     const double expected = (16777216.0 + 2.0) / 3.0;
                     require(result.values[0] == static_cast<float>(expected), "double accumulation");
                   }});

  tests.push_back({"generate_table_keeps_positions", [] {
                     const auto store = basis_store(3, {"aa", "bb", "cc"});
                     const std::vector<catalog::CommandRecord> records{
                         record("cc"), record("none"), record("aa", "bb"), record("bb")};
                     const auto generated = embedding::generate_table(store, records);
                     require(generated.ok(), generated.error());
                     const auto &table = generated.value().table;
                     require(table.size() == 4, "one row per record");
                     require(table.rows[0] == std::vector<float>{0.0F, 0.0F, 1.0F}, "row 0");
                     require(table.rows[1] == std::vector<float>{0.0F, 0.0F, 0.0F}, "row 1");
                     require(table.rows[2] == std::vector<float>{0.5F, 0.5F, 0.0F}, "row 2");
                     require(table.rows[3] == std::vector<float>{0.0F, 1.0F, 0.0F}, "row 3");
                     require(generated.value().report.zero_matches == 1, "one zero match");
                     require(generated.value().zero_match_indices == std::vector<std::size_t>{1},
                             "zero match index");
                   }});

  tests.push_back({"generate_table_threads_match_sequential", [] {
                     const auto store = irregular_store();
                     const auto records = many_records(257);
                     const auto sequential = embedding::generate_table(store, records, {.threads = 1});
                     const auto parallel = embedding::generate_table(store, records, {.threads = 8});
                     require(sequential.ok() && parallel.ok(), "generation failed");
                     require(sequential.value().table == parallel.value().table,
                             "thread count must not change the table");
                     require(sequential.value().zero_match_indices ==
                                 parallel.value().zero_match_indices,
                             "zero-match indices must agree");
                   }});

  tests.push_back({"generate_table_more_threads_than_records", [] {
                     const auto store = basis_store(2, {"aa"});
                     const auto generated =
                         embedding::generate_table(store, {record("aa")}, {.threads = 16});
                     require(generated.ok() && generated.value().table.size() == 1, "single row");
                     const auto empty = embedding::generate_table(store, {}, {.threads = 4});
                     require(empty.ok() && empty.value().table.size() == 0, "empty catalog");
                     require(empty.value().table.dimension == 2, "dimension carried");
                   }});

  tests.push_back({"generate_table_reports_zero_matches", [] {
                     const cmdvec::testing::ObserverGuard guard;
                     const auto store = basis_store(2, {"aa"});
                     const auto generated = embedding::generate_table(
                         store, {record("zz"), record("aa"), record("yy")}, {.progress_interval = 1});
                     require(generated.ok(), generated.error());
                     const auto metrics =
                         guard.observer().metrics_of<cmdvec::observability::ZeroMatchMetric>();
                     require(metrics.size() == 1 && metrics[0].count == 2, "zero-match metric");
                     const auto progress =
                         guard.observer().events_of<cmdvec::observability::ProgressEvent>();
                     require(progress.size() == 3, "progress per record");
                   }});

  tests.push_back({"table_layout_matches_documented_format", [] {
                     embedding::EmbeddingTable table{.dimension = 2, .rows = {{1.0F, 0.0F}}};
                     const auto bytes = embedding::encode_embedding_table(table);
                     require(bytes.ok(), bytes.error());
                     const std::string expected("\x01\x00\x00\x00"
                                                "\x02\x00\x00\x00"
                                                "\x00\x00\x80\x3f"
                                                "\x00\x00\x00\x00",
                                                16);
                     require(bytes.value() == expected, "unexpected table bytes");
                   }});

  tests.push_back({"table_round_trip", [] {
                     const auto store = irregular_store();
                     const auto generated = embedding::generate_table(store, many_records(40));
                     require(generated.ok(), generated.error());
                     const auto bytes = embedding::encode_embedding_table(generated.value().table);
                     require(bytes.ok(), bytes.error());
                     require(bytes.value().size() == 8 + 40 * vectors::VECTOR_DIMENSION * 4, "size");
                     const auto decoded = embedding::decode_embedding_table(bytes.value());
                     require(decoded.ok(), decoded.error());
                     require(decoded.value() == generated.value().table, "round trip");
                   }});

  tests.push_back({"table_encode_rejects_ragged_rows", [] {
                     embedding::EmbeddingTable table{.dimension = 3, .rows = {{1.0F, 2.0F, 3.0F}, {1.0F}}};
                     const auto bytes = embedding::encode_embedding_table(table);
                     require(assets::has_error_code(bytes.error(), assets::AssetErrorCode::Format),
                             bytes.error());
                   }});

  tests.push_back({"table_decode_truncation_and_trailing_bytes", [] {
                     embedding::EmbeddingTable table{.dimension = 2, .rows = {{1.0F, 2.0F}, {3.0F, 4.0F}}};
                     const std::string bytes = embedding::encode_embedding_table(table).value();

                     const auto header = embedding::decode_embedding_table(bytes.substr(0, 6), 2);
                     require(assets::has_error_code(header.error(), assets::AssetErrorCode::TruncatedStream),
                             header.error());

                     const auto row = embedding::decode_embedding_table(bytes.substr(0, bytes.size() - 1), 2);
                     require(assets::has_error_code(row.error(), assets::AssetErrorCode::TruncatedStream),
                             row.error());
                     require(row.error().find("offset=20") != std::string::npos, row.error());

                     const auto trailing = embedding::decode_embedding_table(bytes + "x", 2);
                     require(assets::has_error_code(trailing.error(), assets::AssetErrorCode::Format),
                             trailing.error());
                   }});

  tests.push_back({"table_decode_huge_dimension_does_not_allocate", [] {
                     const std::string header("\x01\0\0\0\xff\xff\xff\xff", 8);
                     const auto decoded = embedding::decode_embedding_table(header, std::nullopt);
                     require(assets::has_error_code(decoded.error(), assets::AssetErrorCode::TruncatedStream),
                             decoded.error());
                     require(decoded.error().find("offset=8") != std::string::npos, decoded.error());

                     std::string rows("\xff\xff\xff\x7f\x02\0\0\0", 8);
                     rows.append(12, '\0');
                     const auto many = embedding::decode_embedding_table(rows, std::nullopt);
                     require(assets::has_error_code(many.error(), assets::AssetErrorCode::TruncatedStream),
                             many.error());
                     require(many.error().find("offset=20") != std::string::npos, many.error());
                   }});

  tests.push_back({"table_decode_checks_expected_dimension", [] {
                     embedding::EmbeddingTable table{.dimension = 2, .rows = {{1.0F, 2.0F}}};
                     const std::string bytes = embedding::encode_embedding_table(table).value();
                     const auto strict = embedding::decode_embedding_table(bytes);
                     require(assets::has_error_code(strict.error(), assets::AssetErrorCode::Format),
                             "dimension 2 is not the expected 100");
                     const auto open = embedding::decode_embedding_table(bytes, std::nullopt);
                     require(open.ok() && open.value().dimension == 2, "header dimension accepted");
                   }});

  tests.push_back({"table_save_and_load", [] {
                     cmdvec::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "cmd_embeddings.bin";
                     embedding::EmbeddingTable table;
                     table.rows.assign(3, std::vector<float>(vectors::VECTOR_DIMENSION, 0.5F));
                     require(embedding::save_embedding_table(path, table).ok(), "save failed");
                     const auto loaded = embedding::load_embedding_table(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value() == table, "loaded table should match");

                     const auto missing = embedding::load_embedding_table(workspace.path() / "nope.bin");
                     require(assets::has_error_code(missing.error(), assets::AssetErrorCode::MissingInput),
                             missing.error());
                   }});
}
