#include "cmdvec/embedding/embedding_table.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/byte_io.hpp"
#include "cmdvec/common/fs.hpp"

#include <cstdint>
#include <limits>

namespace cmdvec::embedding {

namespace {

common::Result<EmbeddingTable> truncated(const std::size_t offset, const std::string &what) {
  return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::TruncatedStream,
                                       .offset = offset,
                                       .message = "stream ends inside " + what});
}

} // namespace

bool EmbeddingTable::operator==(const EmbeddingTable &other) const {
  if (dimension != other.dimension || rows.size() != other.rows.size()) {
    return false;
  }
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (!vectors::same_bits(rows[i], other.rows[i])) {
      return false;
    }
  }
  return true;
}

common::Result<std::string> encode_embedding_table(const EmbeddingTable &table) {
  if (table.rows.size() > std::numeric_limits<std::uint32_t>::max() ||
      table.dimension > std::numeric_limits<std::uint32_t>::max()) {
    return assets::fail<std::string>({.code = assets::AssetErrorCode::Format,
                                      .message = "table does not fit u32 header fields"});
  }

  common::ByteWriter writer(8 + table.rows.size() * table.dimension * 4);
  writer.put_u32(static_cast<std::uint32_t>(table.rows.size()));
  writer.put_u32(static_cast<std::uint32_t>(table.dimension));
  for (std::size_t i = 0; i < table.rows.size(); ++i) {
    const auto &row = table.rows[i];
    if (row.size() != table.dimension) {
      return assets::fail<std::string>({.code = assets::AssetErrorCode::Format,
                                        .message = "row " + std::to_string(i) + " has " +
                                                   std::to_string(row.size()) +
                                                   " components, expected " +
                                                   std::to_string(table.dimension)});
    }
    for (const float value : row) {
      writer.put_f32(value);
    }
  }
  return common::Result<std::string>::success(writer.release());
}

common::Result<EmbeddingTable> decode_embedding_table(const std::string_view bytes,
                                                      std::optional<std::size_t> expected_dimension) {
  common::ByteReader reader(bytes);
  std::uint32_t count = 0;
  std::uint32_t dimension = 0;
  if (!reader.get_u32(count)) {
    return truncated(reader.offset(), "the count header");
  }
  if (!reader.get_u32(dimension)) {
    return truncated(reader.offset(), "the dimension header");
  }
  if (expected_dimension.has_value() && dimension != *expected_dimension) {
    return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::Format,
                                          .offset = 4,
                                          .message = "table dimension " + std::to_string(dimension) +
                                                     " does not match expected " +
                                                     std::to_string(*expected_dimension)});
  }
  if (dimension == 0 && count != 0) {
    return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::Format,
                                          .offset = 4,
                                          .message = "table declares rows of zero width"});
  }

  EmbeddingTable table;
  table.dimension = dimension;
  const std::uint64_t row_bytes = static_cast<std::uint64_t>(dimension) * 4;
  if (row_bytes != 0) {
    // Header sizes are untrusted; locate the first short row before allocating any.
    const std::uint64_t complete_rows = reader.remaining() / row_bytes;
    if (complete_rows < count) {
      const std::uint64_t partial = (reader.remaining() % row_bytes) / 4 * 4;
      return truncated(static_cast<std::size_t>(reader.offset() + complete_rows * row_bytes + partial),
                       "row " + std::to_string(complete_rows) + " of " + std::to_string(count));
    }
    table.rows.reserve(count);
  }

  for (std::uint32_t i = 0; i < count; ++i) {
    std::vector<float> row(dimension);
    for (std::uint32_t d = 0; d < dimension; ++d) {
      if (!reader.get_f32(row[d])) {
        return truncated(reader.offset(), "row " + std::to_string(i) + " of " +
                                              std::to_string(count));
      }
    }
    table.rows.push_back(std::move(row));
  }

  if (!reader.at_end()) {
    return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::Format,
                                          .offset = reader.offset(),
                                          .message = std::to_string(reader.remaining()) +
                                                     " trailing bytes after " +
                                                     std::to_string(count) + " rows"});
  }
  return common::Result<EmbeddingTable>::success(std::move(table));
}

common::Status save_embedding_table(const std::filesystem::path &path, const EmbeddingTable &table) {
  const auto encoded = encode_embedding_table(table);
  if (!encoded.ok()) {
    return encoded.status();
  }
  const auto status = common::write_file_atomic(path, encoded.value());
  if (!status.ok()) {
    return assets::fail_status({.code = assets::AssetErrorCode::Io, .message = status.error()});
  }
  return common::Status::success();
}

common::Result<EmbeddingTable> load_embedding_table(const std::filesystem::path &path,
                                                    std::optional<std::size_t> expected_dimension) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::MissingInput,
                                          .message = "embedding table not found: " + path.string()});
  }
  const auto bytes = common::read_file(path);
  if (!bytes.ok()) {
    return assets::fail<EmbeddingTable>({.code = assets::AssetErrorCode::Io,
                                          .message = bytes.error()});
  }
  auto decoded = decode_embedding_table(bytes.value(), expected_dimension);
  if (!decoded.ok()) {
    return common::Result<EmbeddingTable>::failure(path.string() + ": " + decoded.error());
  }
  return decoded;
}

} // namespace cmdvec::embedding
