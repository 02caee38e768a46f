#pragma once

#include "cmdvec/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace cmdvec::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace cmdvec::common
