#include "cmdvec/vectors/store_codec.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/byte_io.hpp"
#include "cmdvec/common/fs.hpp"
#include "cmdvec/common/utf8.hpp"

#include <algorithm>

namespace cmdvec::vectors {

namespace {

common::Result<VectorStore> truncated(const std::size_t offset, const std::string &what) {
  return assets::fail<VectorStore>({.code = assets::AssetErrorCode::TruncatedStream,
                                    .offset = offset,
                                    .message = "stream ends inside " + what});
}

} // namespace

std::string encode_vector_store(const VectorStore &store) {
  std::size_t total = 4;
  for (const auto &entry : store.entries()) {
    total += 2 + entry.word.size() + entry.values.size() * 4;
  }

  common::ByteWriter writer(total);
  writer.put_u32(static_cast<std::uint32_t>(store.size()));
  for (const auto &entry : store.entries()) {
    writer.put_u16(static_cast<std::uint16_t>(entry.word.size()));
    writer.put_bytes(entry.word);
    for (const float value : entry.values) {
      writer.put_f32(value);
    }
  }
  return writer.release();
}

common::Result<VectorStore> decode_vector_store(const std::string_view bytes,
                                                const std::size_t dimension) {
  common::ByteReader reader(bytes);
  std::uint32_t vocab_size = 0;
  if (!reader.get_u32(vocab_size)) {
    return truncated(reader.offset(), "the vocabulary header");
  }

  VectorStore store(dimension);
  // Never trust the header for the reservation: each record needs at least 2 + 4*dim bytes.
  const std::size_t min_record = 2 + dimension * 4;
  store.reserve(std::min<std::size_t>(vocab_size, reader.remaining() / min_record));

  for (std::uint32_t i = 0; i < vocab_size; ++i) {
    const std::size_t record_offset = reader.offset();
    std::uint16_t word_len = 0;
    if (!reader.get_u16(word_len)) {
      return truncated(reader.offset(), "the length of word " + std::to_string(i));
    }

    const std::size_t word_offset = reader.offset();
    std::string_view word;
    if (!reader.get_bytes(word_len, word)) {
      return truncated(reader.offset(), "word " + std::to_string(i) + " (declared " +
                                            std::to_string(word_len) + " bytes)");
    }
    if (const auto bad = common::first_invalid_utf8(word); bad.has_value()) {
      return assets::fail<VectorStore>({.code = assets::AssetErrorCode::Encoding,
                                        .offset = word_offset + *bad,
                                        .message = "word " + std::to_string(i) +
                                                   " is not valid UTF-8"});
    }

    std::vector<float> values(dimension);
    for (std::size_t d = 0; d < dimension; ++d) {
      if (!reader.get_f32(values[d])) {
        return truncated(reader.offset(), "the vector of word " + std::to_string(i));
      }
    }

    std::string key(word);
    if (store.contains(key)) {
      return assets::fail<VectorStore>({.code = assets::AssetErrorCode::Format,
                                        .offset = record_offset,
                                        .message = "duplicate word '" + key + "'"});
    }
    const auto inserted = store.upsert(std::move(key), std::move(values));
    if (!inserted.ok()) {
      return common::Result<VectorStore>::failure(inserted.error());
    }
  }

  if (!reader.at_end()) {
    return assets::fail<VectorStore>({.code = assets::AssetErrorCode::Format,
                                      .offset = reader.offset(),
                                      .message = std::to_string(reader.remaining()) +
                                                 " trailing bytes after " +
                                                 std::to_string(vocab_size) + " records"});
  }
  return common::Result<VectorStore>::success(std::move(store));
}

common::Status save_vector_store(const std::filesystem::path &path, const VectorStore &store) {
  const auto status = common::write_file_atomic(path, encode_vector_store(store));
  if (!status.ok()) {
    return assets::fail_status({.code = assets::AssetErrorCode::Io, .message = status.error()});
  }
  return common::Status::success();
}

common::Result<VectorStore> load_vector_store(const std::filesystem::path &path,
                                              const std::size_t dimension) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return assets::fail<VectorStore>({.code = assets::AssetErrorCode::MissingInput,
                                      .message = "vector store not found: " + path.string()});
  }
  const auto bytes = common::read_file(path);
  if (!bytes.ok()) {
    return assets::fail<VectorStore>({.code = assets::AssetErrorCode::Io, .message = bytes.error()});
  }
  auto decoded = decode_vector_store(bytes.value(), dimension);
  if (!decoded.ok()) {
    return common::Result<VectorStore>::failure(path.string() + ": " + decoded.error());
  }
  return decoded;
}

} // namespace cmdvec::vectors
