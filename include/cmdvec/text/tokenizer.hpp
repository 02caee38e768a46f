#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cmdvec::text {

inline constexpr std::size_t MIN_TOKEN_LENGTH = 2;

[[nodiscard]] std::vector<std::string> tokenize(std::string_view text);

void tokenize_into(std::string_view text, std::vector<std::string> &out);

} // namespace cmdvec::text
