#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/vectors/vector_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cmdvec::embedding {

/// Row i is the embedding of catalog record i.
struct EmbeddingTable {
  std::size_t dimension = vectors::VECTOR_DIMENSION;
  std::vector<std::vector<float>> rows;

  [[nodiscard]] std::size_t size() const { return rows.size(); }
  [[nodiscard]] bool operator==(const EmbeddingTable &other) const;
};

/// Layout, little-endian: u32 count, u32 dimension, count x dimension x f32.
/// Fails with format when a row does not have `dimension` components.
[[nodiscard]] common::Result<std::string> encode_embedding_table(const EmbeddingTable &table);

/// With `expected_dimension` set, a header declaring another width is a format error.
/// Headers promising more rows than the bytes hold fail with truncated_stream up front.
[[nodiscard]] common::Result<EmbeddingTable>
decode_embedding_table(std::string_view bytes,
                       std::optional<std::size_t> expected_dimension = vectors::VECTOR_DIMENSION);

[[nodiscard]] common::Status save_embedding_table(const std::filesystem::path &path,
                                                  const EmbeddingTable &table);
[[nodiscard]] common::Result<EmbeddingTable>
load_embedding_table(const std::filesystem::path &path,
                     std::optional<std::size_t> expected_dimension = vectors::VECTOR_DIMENSION);

} // namespace cmdvec::embedding
