#include "cmdvec/common/byte_io.hpp"

#include <cstring>

namespace cmdvec::common {

namespace {

std::uint32_t float_bits(const float value) {
  static_assert(sizeof(float) == sizeof(std::uint32_t), "f32 must be 32 bits wide");
  std::uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return bits;
}

float bits_float(const std::uint32_t bits) {
  float value = 0.0F;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

} // namespace

void ByteWriter::put_u16(const std::uint16_t value) {
  buffer_.push_back(static_cast<char>(value & 0xFFU));
  buffer_.push_back(static_cast<char>((value >> 8U) & 0xFFU));
}

void ByteWriter::put_u32(const std::uint32_t value) {
  for (unsigned shift = 0; shift < 32U; shift += 8U) {
    buffer_.push_back(static_cast<char>((value >> shift) & 0xFFU));
  }
}

void ByteWriter::put_f32(const float value) { put_u32(float_bits(value)); }

void ByteWriter::put_bytes(const std::string_view bytes) { buffer_.append(bytes); }

bool ByteReader::get_u16(std::uint16_t &out) {
  if (remaining() < 2) {
    return false;
  }
  const auto *p = reinterpret_cast<const unsigned char *>(bytes_.data() + offset_);
  out = static_cast<std::uint16_t>(p[0] | (p[1] << 8U));
  offset_ += 2;
  return true;
}

bool ByteReader::get_u32(std::uint32_t &out) {
  if (remaining() < 4) {
    return false;
  }
  const auto *p = reinterpret_cast<const unsigned char *>(bytes_.data() + offset_);
  out = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8U) |
        (static_cast<std::uint32_t>(p[2]) << 16U) | (static_cast<std::uint32_t>(p[3]) << 24U);
  offset_ += 4;
  return true;
}

bool ByteReader::get_f32(float &out) {
  std::uint32_t bits = 0;
  if (!get_u32(bits)) {
    return false;
  }
  out = bits_float(bits);
  return true;
}

bool ByteReader::get_bytes(const std::size_t count, std::string_view &out) {
  if (remaining() < count) {
    return false;
  }
  out = bytes_.substr(offset_, count);
  offset_ += count;
  return true;
}

} // namespace cmdvec::common
