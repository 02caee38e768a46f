#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/vectors/vector_store.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string_view>

namespace cmdvec::vectors {

struct ReduceOptions {
  std::uint64_t top_k = 100'000;
  std::size_t dimension = VECTOR_DIMENSION;
  std::uint64_t progress_interval = 10'000;
};

struct ReduceStats {
  std::uint64_t lines_read = 0;
  std::uint64_t accepted = 0;
  std::uint64_t malformed = 0;
  std::uint64_t duplicates = 0;
};

struct ReduceResult {
  VectorStore store;
  ReduceStats stats;
};

[[nodiscard]] std::optional<WordVector> parse_corpus_line(std::string_view line,
                                                          std::size_t dimension);

[[nodiscard]] common::Result<ReduceResult> reduce_corpus(std::istream &input,
                                                         const ReduceOptions &options);

} // namespace cmdvec::vectors
