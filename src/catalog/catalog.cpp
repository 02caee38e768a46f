#include "cmdvec/catalog/catalog.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/fs.hpp"
#include "cmdvec/common/json_util.hpp"
#include "cmdvec/common/utf8.hpp"

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>

namespace cmdvec::catalog {

namespace {

using Records = std::vector<CommandRecord>;

struct FieldValue {
  bool is_list = false;
  bool is_null = false;
  std::string scalar;
  std::vector<std::string> items;
};

struct RawRecord {
  std::size_t line = 0;
  std::map<std::string, FieldValue> fields;
};

struct KeyValue {
  std::string key;
  std::string value;
};

template <typename T> common::Result<T> format_error(const std::string &message) {
  return assets::fail<T>({.code = assets::AssetErrorCode::Format, .message = message});
}

std::string at_line(const std::size_t line) { return "line " + std::to_string(line) + ": "; }

std::size_t indent_of(const std::string &line) {
  std::size_t indent = 0;
  while (indent < line.size() && line[indent] == ' ') {
    ++indent;
  }
  return indent;
}

bool opens_quote(const std::string &text, const std::size_t i) {
  if (text[i] != '"' && text[i] != '\'') {
    return false;
  }
  if (i == 0) {
    return true;
  }
  const char prev = text[i - 1];
  return prev == ' ' || prev == '\t' || prev == '[' || prev == ',' || prev == '{';
}

// Index of the quote closing the scalar opened at `open`, or npos.
std::size_t quoted_end(const std::string &text, const std::size_t open) {
  const char quote = text[open];
  for (std::size_t i = open + 1; i < text.size(); ++i) {
    if (quote == '"' && text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == quote) {
      if (quote == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
        ++i;
        continue;
      }
      return i;
    }
  }
  return std::string::npos;
}

// `#` starts a comment at the start of a line or after whitespace, outside quotes.
std::string strip_comment(const std::string &text) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (opens_quote(text, i)) {
      const auto end = quoted_end(text, i);
      if (end == std::string::npos) {
        return text;
      }
      i = end;
      continue;
    }
    if (text[i] == '#' && (i == 0 || text[i - 1] == ' ' || text[i - 1] == '\t')) {
      return text.substr(0, i);
    }
  }
  return text;
}

std::string unquote_single(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    out.push_back(body[i]);
    if (body[i] == '\'' && i + 1 < body.size() && body[i + 1] == '\'') {
      ++i;
    }
  }
  return out;
}

std::optional<std::uint32_t> read_hex(const std::string &body, const std::size_t pos,
                                      const std::size_t digits) {
  if (pos + digits > body.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + digits; ++i) {
    const auto ch = static_cast<unsigned char>(body[i]);
    if (std::isxdigit(ch) == 0) {
      return std::nullopt;
    }
    const std::uint32_t digit = std::isdigit(ch) != 0 ? ch - '0' : (std::tolower(ch) - 'a' + 10);
    value = (value << 4U) | digit;
  }
  return value;
}

// Body of a YAML double-quoted scalar. Unknown escapes are kept verbatim.
std::string unquote_double(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '\n') {
      out.push_back(' ');
      continue;
    }
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char next = body[++i];
    switch (next) {
    case '0':
      out.push_back('\0');
      break;
    case 'a':
      out.push_back('\a');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 't':
    case '\t':
      out.push_back('\t');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'v':
      out.push_back('\v');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 'e':
      out.push_back('\x1b');
      break;
    case ' ':
    case '"':
    case '/':
    case '\\':
      out.push_back(next);
      break;
    case 'N':
      common::append_utf8(out, 0x85);
      break;
    case '_':
      common::append_utf8(out, 0xA0);
      break;
    case 'L':
      common::append_utf8(out, 0x2028);
      break;
    case 'P':
      common::append_utf8(out, 0x2029);
      break;
    case 'x':
    case 'u':
    case 'U': {
      const std::size_t digits = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
      const auto code = read_hex(body, i + 1, digits);
      if (!code.has_value() || *code > 0x10FFFF) {
        out.push_back('\\');
        out.push_back(next);
        break;
      }
      common::append_utf8(out, *code);
      i += digits;
      break;
    }
    case '\r':
    case '\n': {
      // Escaped line break: the break and the next line's indentation vanish.
      if (next == '\r' && i + 1 < body.size() && body[i + 1] == '\n') {
        ++i;
      }
      while (i + 1 < body.size() && (body[i + 1] == ' ' || body[i + 1] == '\t')) {
        ++i;
      }
      break;
    }
    default:
      out.push_back('\\');
      out.push_back(next);
      break;
    }
  }
  return out;
}

// Text of a complete scalar token; quoted forms lose their quotes and escapes.
std::string scalar_text(const std::string &token) {
  if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
    return unquote_double(token.substr(1, token.size() - 2));
  }
  if (token.size() >= 2 && token.front() == '\'' && token.back() == '\'') {
    return unquote_single(token.substr(1, token.size() - 2));
  }
  return token;
}

bool is_null_literal(const std::string &value) {
  return value == "~" || value == "null" || value == "Null" || value == "NULL";
}

std::optional<KeyValue> split_key_value(const std::string &content) {
  if (content.empty()) {
    return std::nullopt;
  }

  std::size_t colon = std::string::npos;
  if (content.front() == '"' || content.front() == '\'') {
    const auto end = quoted_end(content, 0);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    colon = end + 1;
    while (colon < content.size() && content[colon] == ' ') {
      ++colon;
    }
    if (colon >= content.size() || content[colon] != ':') {
      return std::nullopt;
    }
  } else {
    for (std::size_t i = 0; i < content.size(); ++i) {
      if (content[i] == ':' && (i + 1 == content.size() || content[i + 1] == ' ' ||
                                content[i + 1] == '\t')) {
        colon = i;
        break;
      }
    }
  }
  if (colon == std::string::npos || (colon + 1 < content.size() && content[colon + 1] != ' ' &&
                                     content[colon + 1] != '\t')) {
    return std::nullopt;
  }

  KeyValue kv{.key = scalar_text(common::trim(content.substr(0, colon))),
              .value = common::trim(content.substr(colon + 1))};
  if (kv.key.empty()) {
    return std::nullopt;
  }
  return kv;
}

// False while a flow sequence or quoted scalar still needs more lines.
bool is_complete(const std::string &value) {
  if (value.front() == '"' || value.front() == '\'') {
    return quoted_end(value, 0) != std::string::npos;
  }
  if (value.front() != '[') {
    return true;
  }
  int depth = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (opens_quote(value, i)) {
      const auto end = quoted_end(value, i);
      if (end == std::string::npos) {
        return false;
      }
      i = end;
      continue;
    }
    if (value[i] == '[') {
      ++depth;
    } else if (value[i] == ']' && --depth == 0) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> split_flow_elements(const std::string &body) {
  std::vector<std::string> out;
  std::string current;
  auto push_current = [&]() {
    const std::string element = common::trim(current);
    if (!element.empty()) {
      out.push_back(scalar_text(element));
    }
    current.clear();
  };

  for (std::size_t i = 0; i < body.size(); ++i) {
    if (opens_quote(body, i)) {
      const auto end = quoted_end(body, i);
      const std::size_t stop = end == std::string::npos ? body.size() - 1 : end;
      current += body.substr(i, stop - i + 1);
      i = stop;
      continue;
    }
    if (body[i] == ',') {
      push_current();
      continue;
    }
    current.push_back(body[i]);
  }
  push_current();
  return out;
}

common::Result<FieldValue> parse_inline_value(const std::string &value, const std::size_t line) {
  FieldValue field;
  if (value.front() == '[') {
    if (value.back() != ']') {
      return format_error<FieldValue>(at_line(line) + "unexpected text after flow sequence");
    }
    field.is_list = true;
    field.items = split_flow_elements(value.substr(1, value.size() - 2));
    return common::Result<FieldValue>::success(std::move(field));
  }
  if (value.front() == '"' || value.front() == '\'') {
    if (quoted_end(value, 0) != value.size() - 1) {
      return format_error<FieldValue>(at_line(line) + "unexpected text after quoted scalar");
    }
    field.scalar = scalar_text(value);
    return common::Result<FieldValue>::success(std::move(field));
  }
  if (is_null_literal(value)) {
    field.is_null = true;
  } else {
    field.scalar = value;
  }
  return common::Result<FieldValue>::success(std::move(field));
}

class YamlCatalogReader {
public:
  explicit YamlCatalogReader(const std::string &content) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      lines_.push_back(std::move(line));
    }
  }

  common::Result<std::vector<RawRecord>> read();

private:
  common::Status read_field(RawRecord &record, const std::string &content, std::size_t line);
  std::string read_block_scalar(const std::string &header, std::size_t parent_indent);

  std::vector<std::string> lines_;
  std::size_t next_ = 0;
  std::size_t item_indent_ = std::string::npos;
  std::string pending_key_;
  std::string plain_key_;
};

common::Result<std::vector<RawRecord>> YamlCatalogReader::read() {
  using Out = std::vector<RawRecord>;
  Out records;
  bool mapping_root = false;
  std::string top_key;
  std::size_t seq_indent = std::string::npos;
  bool seq_done = false;

  while (next_ < lines_.size()) {
    const std::size_t line_no = next_ + 1;
    const std::string &raw = lines_[next_++];
    const std::size_t indent = indent_of(raw);
    if (indent < raw.size() && raw[indent] == '\t') {
      return format_error<Out>(at_line(line_no) + "tabs are not allowed in indentation");
    }
    const std::string content = common::trim(strip_comment(raw.substr(indent)));
    if (content.empty() || (indent == 0 && (content == "---" || content == "..."))) {
      continue;
    }
    if (seq_done) {
      continue;
    }

    const bool dash = content == "-" || common::starts_with(content, "- ");
    if (seq_indent == std::string::npos) {
      if (dash && (!mapping_root || top_key == "commands")) {
        seq_indent = indent;
      } else {
        if (indent == 0 && !dash) {
          const auto kv = split_key_value(content);
          if (!kv.has_value()) {
            return format_error<Out>(at_line(line_no) +
                                     "expected a list of records or a `commands:` key");
          }
          mapping_root = true;
          top_key = kv->key;
          if (top_key == "commands" && !kv->value.empty()) {
            if (kv->value != "[]") {
              return format_error<Out>(at_line(line_no) + "`commands` must hold a block list");
            }
            seq_done = true;
          }
        }
        continue;
      }
    }

    if (indent < seq_indent || (indent == seq_indent && !dash)) {
      if (mapping_root && indent == 0) {
        seq_done = true;
        continue;
      }
      return format_error<Out>(at_line(line_no) + "unexpected content after the record list");
    }

    if (indent == seq_indent) {
      records.push_back(RawRecord{.line = line_no, .fields = {}});
      pending_key_.clear();
      plain_key_.clear();
      std::size_t skip = 1;
      while (skip < content.size() && content[skip] == ' ') {
        ++skip;
      }
      if (skip >= content.size()) {
        item_indent_ = std::string::npos;
        continue;
      }
      item_indent_ = indent + skip;
      if (const auto status = read_field(records.back(), content.substr(skip), line_no);
          !status.ok()) {
        return common::Result<Out>::failure(status.error());
      }
      continue;
    }

    auto &record = records.back();
    if (item_indent_ == std::string::npos) {
      item_indent_ = indent;
    }

    if (!pending_key_.empty() && dash && indent >= item_indent_) {
      std::size_t skip = 1;
      while (skip < content.size() && content[skip] == ' ') {
        ++skip;
      }
      auto &field = record.fields[pending_key_];
      field.is_list = true;
      field.is_null = false;
      const std::string item = skip < content.size() ? content.substr(skip) : "";
      if (!item.empty() && !is_null_literal(item)) {
        field.items.push_back(scalar_text(item));
      }
      continue;
    }

    if (indent == item_indent_) {
      if (const auto status = read_field(record, content, line_no); !status.ok()) {
        return common::Result<Out>::failure(status.error());
      }
      continue;
    }

    if (indent > item_indent_ && !plain_key_.empty()) {
      // Plain scalars fold onto following, more indented lines.
      record.fields[plain_key_].scalar += " " + content;
      continue;
    }
    if (indent > item_indent_ && !pending_key_.empty()) {
      continue; // nested mapping under a key the catalog does not use
    }
    return format_error<Out>(at_line(line_no) + "unexpected indentation");
  }

  return common::Result<Out>::success(std::move(records));
}

common::Status YamlCatalogReader::read_field(RawRecord &record, const std::string &content,
                                             const std::size_t line) {
  pending_key_.clear();
  plain_key_.clear();

  const auto kv = split_key_value(content);
  if (!kv.has_value()) {
    return assets::fail_status({.code = assets::AssetErrorCode::Format,
                                .message = at_line(line) + "expected `key: value`"});
  }

  auto &field = record.fields[kv->key];
  field = FieldValue{};
  std::string value = kv->value;
  if (value.empty()) {
    field.is_null = true;
    pending_key_ = kv->key;
    return common::Status::success();
  }
  if (value.front() == '|' || value.front() == '>') {
    field.scalar = read_block_scalar(value, item_indent_);
    return common::Status::success();
  }

  while (!is_complete(value)) {
    if (next_ >= lines_.size()) {
      return assets::fail_status({.code = assets::AssetErrorCode::Format,
                                  .message = at_line(line) + "unterminated value for `" +
                                             kv->key + "`"});
    }
    const std::string &more = lines_[next_++];
    // Double-quoted scalars keep the break so an escaped line break can join the lines.
    value += (value.front() == '"' ? "\n" : " ") +
             common::trim(value.front() == '[' ? strip_comment(more) : more);
  }

  auto parsed = parse_inline_value(value, line);
  if (!parsed.ok()) {
    return parsed.status();
  }
  field = parsed.take();
  if (!field.is_list && !field.is_null && value.front() != '"' && value.front() != '\'') {
    plain_key_ = kv->key;
  }
  return common::Status::success();
}

std::string YamlCatalogReader::read_block_scalar(const std::string &header,
                                                 const std::size_t parent_indent) {
  const bool folded = header.front() == '>';
  const bool strip = header.find('-') != std::string::npos;

  std::vector<std::string> body;
  std::size_t block_indent = std::string::npos;
  while (next_ < lines_.size()) {
    const std::string &raw = lines_[next_];
    if (common::trim(raw).empty()) {
      body.emplace_back();
      ++next_;
      continue;
    }
    const std::size_t indent = indent_of(raw);
    if (indent <= parent_indent) {
      break;
    }
    if (block_indent == std::string::npos) {
      block_indent = indent;
    }
    if (indent < block_indent) {
      break;
    }
    body.push_back(raw.substr(block_indent));
    ++next_;
  }
  while (!body.empty() && body.back().empty()) {
    body.pop_back();
  }

  std::string out;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (folded) {
      if (body[i].empty()) {
        out += '\n';
      } else {
        if (!out.empty() && out.back() != '\n') {
          out += ' ';
        }
        out += body[i];
      }
    } else {
      if (i > 0) {
        out += '\n';
      }
      out += body[i];
    }
  }
  if (!strip && !out.empty()) {
    out += '\n';
  }
  return out;
}

std::string record_label(const std::size_t index, const std::size_t line) {
  std::string label = "record " + std::to_string(index);
  if (line != 0) {
    label += " (line " + std::to_string(line) + ")";
  }
  return label;
}

std::vector<std::string> list_of(const FieldValue &field) {
  if (field.is_list) {
    return field.items;
  }
  if (field.is_null || field.scalar.empty()) {
    return {};
  }
  return {field.scalar};
}

common::Result<CommandRecord> to_record(const RawRecord &raw, const std::size_t index) {
  const std::string label = record_label(index, raw.line);
  const auto command = raw.fields.find("command");
  if (command == raw.fields.end() || command->second.is_null || command->second.is_list) {
    return format_error<CommandRecord>(label + " has no command");
  }

  CommandRecord record;
  record.command = command->second.scalar;

  for (const auto &[key, field] : raw.fields) {
    if (key == "description" || key == "niche") {
      if (field.is_list) {
        return format_error<CommandRecord>(label + ": `" + key + "` must be a scalar");
      }
      (key == "description" ? record.description : record.niche) = field.scalar;
    } else if (key == "keywords") {
      record.keywords = list_of(field);
    } else if (key == "tags") {
      record.tags = list_of(field);
    } else if (key == "platform") {
      record.platform = list_of(field);
    } else if (key == "pipeline" && !field.is_null) {
      const std::string flag = common::to_lower(field.scalar);
      if (field.is_list) {
        return format_error<CommandRecord>(label + ": `pipeline` must be a boolean");
      }
      if (flag == "true" || flag == "yes" || flag == "on") {
        record.pipeline = true;
      } else if (flag == "false" || flag == "no" || flag == "off") {
        record.pipeline = false;
      } else {
        return format_error<CommandRecord>(label + ": `pipeline` must be a boolean, got '" +
                                           field.scalar + "'");
      }
    }
  }
  return common::Result<CommandRecord>::success(std::move(record));
}

} // namespace

common::Result<Records> parse_yaml_catalog(const std::string &content) {
  YamlCatalogReader reader(content);
  auto raw = reader.read();
  if (!raw.ok()) {
    return common::Result<Records>::failure(raw.error());
  }

  Records records;
  records.reserve(raw.value().size());
  for (std::size_t i = 0; i < raw.value().size(); ++i) {
    auto record = to_record(raw.value()[i], i);
    if (!record.ok()) {
      return common::Result<Records>::failure(record.error());
    }
    records.push_back(record.take());
  }
  return common::Result<Records>::success(std::move(records));
}

common::Result<Records> parse_json_catalog(const std::string &content) {
  std::string array = content;
  const std::size_t start = common::json_skip_ws(content, 0);
  if (start < content.size() && content[start] == '{') {
    array = common::json_get_array(content, "commands");
    if (array.empty()) {
      return format_error<Records>("JSON catalog object has no `commands` array");
    }
  }

  const auto values = common::json_split_array_values(array);
  if (!values.has_value()) {
    return format_error<Records>("JSON catalog is not a well-formed array");
  }

  Records records;
  records.reserve(values->size());
  for (std::size_t i = 0; i < values->size(); ++i) {
    const std::string &object = (*values)[i];
    const std::string label = record_label(i, 0);
    if (object.front() != '{') {
      return format_error<Records>(label + " is not an object");
    }
    const auto command_pos = common::json_find_value(object, "command");
    if (command_pos == std::string::npos || object[command_pos] != '"') {
      return format_error<Records>(label + " has no command");
    }

    CommandRecord record;
    record.command = common::json_get_string(object, "command");
    record.description = common::json_get_string(object, "description");
    record.keywords = common::json_get_string_array(object, "keywords");
    record.tags = common::json_get_string_array(object, "tags");
    record.niche = common::json_get_string(object, "niche");
    record.platform = common::json_get_string_array(object, "platform");
    record.pipeline = common::json_get_bool(object, "pipeline").value_or(false);
    records.push_back(std::move(record));
  }
  return common::Result<Records>::success(std::move(records));
}

CatalogFormat detect_format(const std::filesystem::path &path, const std::string &content) {
  const std::string ext = common::to_lower(path.extension().string());
  if (ext == ".json") {
    return CatalogFormat::Json;
  }
  if (ext == ".yml" || ext == ".yaml") {
    return CatalogFormat::Yaml;
  }
  const std::size_t start = common::json_skip_ws(content, 0);
  if (start < content.size() && (content[start] == '[' || content[start] == '{')) {
    return CatalogFormat::Json;
  }
  return CatalogFormat::Yaml;
}

common::Result<Records> load_catalog(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return assets::fail<Records>({.code = assets::AssetErrorCode::MissingInput,
                                  .message = "catalog not found: " + path.string()});
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return assets::fail<Records>({.code = assets::AssetErrorCode::Io, .message = content.error()});
  }

  auto parsed = detect_format(path, content.value()) == CatalogFormat::Json
                    ? parse_json_catalog(content.value())
                    : parse_yaml_catalog(content.value());
  if (!parsed.ok()) {
    return common::Result<Records>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

} // namespace cmdvec::catalog
