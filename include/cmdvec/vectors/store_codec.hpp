#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/vectors/vector_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cmdvec::vectors {

/// Binary vector store layout, all integers little-endian:
///   u32 vocab_size
///   vocab_size x { u16 word_len, word_len bytes UTF-8, dimension x f32 }
/// The dimension is not stored; readers must be told it.
[[nodiscard]] std::string encode_vector_store(const VectorStore &store);

/// Fails with truncated_stream when a record runs past the end, encoding when a word is not
/// UTF-8, and format on duplicate words or trailing bytes. Errors carry the byte offset.
[[nodiscard]] common::Result<VectorStore>
decode_vector_store(std::string_view bytes, std::size_t dimension = VECTOR_DIMENSION);

[[nodiscard]] common::Status save_vector_store(const std::filesystem::path &path,
                                               const VectorStore &store);
[[nodiscard]] common::Result<VectorStore>
load_vector_store(const std::filesystem::path &path, std::size_t dimension = VECTOR_DIMENSION);

} // namespace cmdvec::vectors
