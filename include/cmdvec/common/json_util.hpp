#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cmdvec::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX and surrogate pairs.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Position of the first character of the value stored under a top-level key of the
/// object `json`, or npos. Keys of nested objects and string contents never match.
[[nodiscard]] std::size_t json_find_value(const std::string &json, const std::string &key);

/// Extract a string field value from a JSON object.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as text) from a JSON object.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a boolean field; nullopt when absent or not a boolean literal.
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON object.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON object.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Extract the string elements of an array field like ["a","b"].
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Split a JSON array into the text of its elements; nullopt when the array is malformed.
[[nodiscard]] std::optional<std::vector<std::string>>
json_split_array_values(const std::string &array_json);

} // namespace cmdvec::common
