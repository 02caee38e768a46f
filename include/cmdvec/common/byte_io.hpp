#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cmdvec::common {

class ByteWriter {
public:
  ByteWriter() = default;
  explicit ByteWriter(std::size_t reserve_bytes) { buffer_.reserve(reserve_bytes); }

  void put_u16(std::uint16_t value);
  void put_u32(std::uint32_t value);
  void put_f32(float value);
  void put_bytes(std::string_view bytes);

  [[nodiscard]] std::size_t size() const { return buffer_.size(); }
  [[nodiscard]] const std::string &bytes() const { return buffer_; }
  [[nodiscard]] std::string release() { return std::move(buffer_); }

private:
  std::string buffer_;
};

class ByteReader {
public:
  explicit ByteReader(std::string_view bytes) : bytes_(bytes) {}

  [[nodiscard]] bool get_u16(std::uint16_t &out);
  [[nodiscard]] bool get_u32(std::uint32_t &out);
  [[nodiscard]] bool get_f32(float &out);
  [[nodiscard]] bool get_bytes(std::size_t count, std::string_view &out);

  [[nodiscard]] std::size_t offset() const { return offset_; }
  [[nodiscard]] std::size_t remaining() const { return bytes_.size() - offset_; }
  [[nodiscard]] bool at_end() const { return offset_ == bytes_.size(); }

private:
  std::string_view bytes_;
  std::size_t offset_ = 0;
};

} // namespace cmdvec::common
