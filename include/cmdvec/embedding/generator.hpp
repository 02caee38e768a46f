#pragma once

#include "cmdvec/catalog/command_record.hpp"
#include "cmdvec/common/result.hpp"
#include "cmdvec/embedding/embedding_table.hpp"
#include "cmdvec/vectors/vector_store.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cmdvec::embedding {

struct Embedding {
  std::vector<float> values;
  std::size_t matched = 0;
};

struct GenerationOptions {
  std::uint32_t threads = 1;
  std::uint64_t progress_interval = 500;
};

struct GenerationReport {
  std::size_t count = 0;
  std::size_t dimension = 0;
  std::size_t zero_matches = 0;
};

struct GenerationResult {
  EmbeddingTable table;
  GenerationReport report;
  std::vector<std::size_t> zero_match_indices;
};

[[nodiscard]] std::vector<std::string> record_tokens(const catalog::CommandRecord &record);

[[nodiscard]] Embedding embed_tokens(const vectors::VectorStore &store,
                                     const std::vector<std::string> &tokens);

[[nodiscard]] Embedding embed_record(const vectors::VectorStore &store,
                                     const catalog::CommandRecord &record);

[[nodiscard]] Embedding embed_text(const vectors::VectorStore &store, std::string_view text);

[[nodiscard]] common::Result<GenerationResult>
generate_table(const vectors::VectorStore &store, const std::vector<catalog::CommandRecord> &records,
               const GenerationOptions &options = {});

} // namespace cmdvec::embedding
