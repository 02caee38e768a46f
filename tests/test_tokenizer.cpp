#include "test_framework.hpp"

#include "cmdvec/text/tokenizer.hpp"

namespace {

using Tokens = std::vector<std::string>;

std::string join(const Tokens &tokens) {
  std::string out;
  for (const auto &token : tokens) {
    out += "[" + token + "]";
  }
  return out;
}

} // namespace

void register_tokenizer_tests(std::vector<cmdvec::tests::TestCase> &tests) {
  using cmdvec::tests::require;
  using cmdvec::text::tokenize;

  tests.push_back({"tokenize_splits_on_punctuation", [] {
                     const auto tokens = tokenize("Git-Log v2!!");
                     require(tokens == Tokens{"git", "log", "v2"}, "got " + join(tokens));
                   }});

  tests.push_back({"tokenize_drops_single_characters", [] {
                     const auto tokens = tokenize("a b cd e fg 1 23");
                     require(tokens == Tokens{"cd", "fg", "23"}, "got " + join(tokens));
                   }});

  tests.push_back({"tokenize_keeps_order_and_duplicates", [] {
                     const auto tokens = tokenize("list files, list ALL files");
                     require(tokens == Tokens{"list", "files", "list", "all", "files"},
                             "got " + join(tokens));
                   }});

  tests.push_back({"tokenize_empty_and_separator_only_input", [] {
                     require(tokenize("").empty(), "empty input gives no tokens");
                     require(tokenize("  --- !! \t\n").empty(), "separators give no tokens");
                   }});

  tests.push_back({"tokenize_treats_non_ascii_as_separators", [] {
                     const auto tokens = tokenize("caf\xc3\xa9 na\xc3\xafve r\xc3\xa9sum\xc3\xa9");
                     require(tokens == Tokens{"caf", "na", "ve", "sum"}, "got " + join(tokens));
                   }});

  tests.push_back({"tokenize_folds_characters_with_ascii_lowercase", [] {
                     // KELVIN SIGN lowercases to 'k'.
                     const auto kelvin = tokenize("\xe2\x84\xaaill");
                     require(kelvin == Tokens{"kill"}, "got " + join(kelvin));
                     // I WITH DOT ABOVE lowercases to 'i' plus a combining dot.
                     const auto dotted = tokenize("\xc4\xb0nstall");
                     require(dotted == Tokens{"nstall"}, "got " + join(dotted));
                     const auto joined = tokenize("x\xc4\xb0");
                     require(joined == Tokens{"xi"}, "got " + join(joined));
                   }});

  tests.push_back({"tokenize_handles_shell_syntax", [] {
                     const auto tokens = tokenize("find . -name '*.log' | xargs rm -rf");
                     require(tokens == Tokens{"find", "name", "log", "xargs", "rm", "rf"},
                             "got " + join(tokens));
                   }});

  tests.push_back({"tokenize_into_appends", [] {
                     Tokens out{"existing"};
                     cmdvec::text::tokenize_into("tar xzf", out);
                     require(out == Tokens{"existing", "tar", "xzf"}, "got " + join(out));
                   }});

  tests.push_back({"tokenize_is_deterministic", [] {
                     const std::string text = "Docker compose UP --build -d";
                     require(tokenize(text) == tokenize(text), "same input, same tokens");
                   }});
}
