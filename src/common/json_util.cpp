#include "cmdvec/common/json_util.hpp"

#include "cmdvec/common/utf8.hpp"

#include <cctype>
#include <cstdint>

namespace cmdvec::common {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::optional<std::uint32_t> read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(raw[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  return value;
}

// End (exclusive) of a scalar literal such as a number, true, false or null.
std::size_t scalar_end(const std::string &json, std::size_t pos) {
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  return pos;
}

std::size_t find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    escaped = !escaped && ch == '\\';
  }
  return std::string::npos;
}

std::size_t find_matching_token(const std::string &json, const std::size_t open_pos,
                                const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

// End (exclusive) of whatever value starts at pos, or npos when it is unterminated.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  if (json[pos] == '"') {
    const auto end = find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (json[pos] == '{' || json[pos] == '[') {
    const char close = json[pos] == '{' ? '}' : ']';
    const auto end = find_matching_token(json, pos, json[pos], close);
    return end == std::string::npos ? end : end + 1;
  }
  return scalar_end(json, pos);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char HEX[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(HEX[(static_cast<unsigned char>(ch) >> 4U) & 0xFU]);
        escaped.push_back(HEX[static_cast<unsigned char>(ch) & 0xFU]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = read_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back('u');
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const auto low = read_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10U) + (*low - 0xDC00);
          i += 6;
        }
      }
      if (code >= 0xD800 && code <= 0xDFFF) {
        code = 0xFFFD;
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_value(const std::string &json, const std::string &key) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::string::npos;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      return std::string::npos;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::string::npos;
    }

    const auto key_end = find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::string::npos;
    }
    const std::string name = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::string::npos;
    }
    pos = json_skip_ws(json, pos + 1);
    if (name == key) {
      return pos < json.size() ? pos : std::string::npos;
    }

    pos = value_end(json, pos);
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = json_find_value(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto pos = json_find_value(json, field);
  if (pos == std::string::npos || json[pos] == '"' || json[pos] == '{' || json[pos] == '[') {
    return "";
  }
  return json.substr(pos, scalar_end(json, pos) - pos);
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const auto pos = json_find_value(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  const std::string literal = json.substr(pos, scalar_end(json, pos) - pos);
  if (literal == "true") {
    return true;
  }
  if (literal == "false") {
    return false;
  }
  return std::nullopt;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto pos = json_find_value(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  const auto end = find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto pos = json_find_value(json, field);
  if (pos == std::string::npos || json[pos] != '[') {
    return "";
  }
  const auto end = find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] == '"') {
      const auto end = find_string_end(array_str, pos);
      if (end == std::string::npos) {
        break;
      }
      out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
      continue;
    }
    const auto end = value_end(array_str, pos);
    if (end == std::string::npos) {
      break;
    }
    pos = end == pos ? pos + 1 : end;
  }
  return out;
}

std::optional<std::vector<std::string>> json_split_array_values(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return std::nullopt;
  }
  const auto close = find_matching_token(array_json, pos, '[', ']');
  if (close == std::string::npos || json_skip_ws(array_json, close + 1) != array_json.size()) {
    return std::nullopt;
  }

  std::vector<std::string> out;
  pos = json_skip_ws(array_json, pos + 1);
  if (pos == close) {
    return out;
  }
  while (pos < close) {
    const auto end = value_end(array_json, pos);
    if (end == std::string::npos || end == pos || end > close) {
      return std::nullopt;
    }
    out.push_back(array_json.substr(pos, end - pos));

    pos = json_skip_ws(array_json, end);
    if (pos == close) {
      return out;
    }
    if (array_json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(array_json, pos + 1);
  }
  return std::nullopt;
}

} // namespace cmdvec::common
