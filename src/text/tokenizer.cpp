#include "cmdvec/text/tokenizer.hpp"

namespace cmdvec::text {

namespace {

void flush(std::string &current, std::vector<std::string> &out) {
  if (current.size() >= MIN_TOKEN_LENGTH) {
    out.push_back(current);
  }
  current.clear();
}

} // namespace

void tokenize_into(const std::string_view text, std::vector<std::string> &out) {
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if (byte >= 'A' && byte <= 'Z') {
      current.push_back(static_cast<char>(byte - 'A' + 'a'));
      continue;
    }
    if ((byte >= 'a' && byte <= 'z') || (byte >= '0' && byte <= '9')) {
      current.push_back(static_cast<char>(byte));
      continue;
    }

    // U+212A KELVIN SIGN (E2 84 AA)
    if (byte == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x84 &&
        static_cast<unsigned char>(text[i + 2]) == 0xAA) {
      current.push_back('k');
      i += 2;
      continue;
    }
    // U+0130 LATIN CAPITAL LETTER I WITH DOT ABOVE (C4 B0)
    if (byte == 0xC4 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xB0) {
      current.push_back('i');
      flush(current, out);
      i += 1;
      continue;
    }

    flush(current, out);
  }
  flush(current, out);
}

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  tokenize_into(text, tokens);
  return tokens;
}

} // namespace cmdvec::text
