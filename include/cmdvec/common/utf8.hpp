#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cmdvec::common {

[[nodiscard]] std::optional<std::size_t> first_invalid_utf8(std::string_view bytes);

[[nodiscard]] inline bool is_valid_utf8(std::string_view bytes) {
  return !first_invalid_utf8(bytes).has_value();
}

void append_utf8(std::string &out, std::uint32_t cp);

} // namespace cmdvec::common
