#include "cmdvec/common/utf8.hpp"

namespace cmdvec::common {

namespace {

bool in_range(const unsigned char c, const unsigned char lo, const unsigned char hi) {
  return c >= lo && c <= hi;
}

} // namespace

std::optional<std::size_t> first_invalid_utf8(const std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned char second_lo = 0x80;
    unsigned char second_hi = 0xBF;
    if (in_range(lead, 0xC2, 0xDF)) {
      length = 2;
    } else if (lead == 0xE0) {
      length = 3;
      second_lo = 0xA0;
    } else if (lead == 0xED) {
      length = 3;
      second_hi = 0x9F;
    } else if (in_range(lead, 0xE1, 0xEF)) {
      length = 3;
    } else if (lead == 0xF0) {
      length = 4;
      second_lo = 0x90;
    } else if (lead == 0xF4) {
      length = 4;
      second_hi = 0x8F;
    } else if (in_range(lead, 0xF1, 0xF3)) {
      length = 4;
    } else {
      return i;
    }

    if (i + length > bytes.size()) {
      return i;
    }
    if (!in_range(static_cast<unsigned char>(bytes[i + 1]), second_lo, second_hi)) {
      return i;
    }
    for (std::size_t k = 2; k < length; ++k) {
      if (!in_range(static_cast<unsigned char>(bytes[i + k]), 0x80, 0xBF)) {
        return i;
      }
    }
    i += length;
  }
  return std::nullopt;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  }
}

} // namespace cmdvec::common
