#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cmdvec/vectors/reducer.hpp"

#include <cmath>
#include <sstream>

namespace {

namespace vectors = cmdvec::vectors;
using cmdvec::testing::corpus_line;

vectors::ReduceResult reduce(const std::string &corpus, const vectors::ReduceOptions &options) {
  std::istringstream input(corpus);
  auto result = vectors::reduce_corpus(input, options);
  if (!result.ok()) {
    throw std::runtime_error(result.error());
  }
  return result.take();
}

} // namespace

void register_reducer_tests(std::vector<cmdvec::tests::TestCase> &tests) {
  using cmdvec::tests::require;

  tests.push_back({"parse_corpus_line_reads_word_and_components", [] {
                     const auto parsed = vectors::parse_corpus_line("the 0.5 -1.25 +3e2", 3);
                     require(parsed.has_value(), "line should parse");
                     require(parsed->word == "the", "word");
                     require(parsed->values == std::vector<float>{0.5F, -1.25F, 300.0F}, "values");
                   }});

  tests.push_back({"parse_corpus_line_accepts_tabs_and_crlf", [] {
                     const auto parsed = vectors::parse_corpus_line("of\t1\t2\r", 2);
                     require(parsed.has_value() && parsed->values.size() == 2, "tabs and CR are whitespace");
                   }});

  tests.push_back({"parse_corpus_line_rejects_malformed_lines", [] {
                     require(!vectors::parse_corpus_line("", 2).has_value(), "empty line");
                     require(!vectors::parse_corpus_line("word 1", 2).has_value(), "too few components");
                     require(!vectors::parse_corpus_line("word 1 2 3", 2).has_value(), "too many components");
                     require(!vectors::parse_corpus_line("word 1 x", 2).has_value(), "non-numeric component");
                     require(!vectors::parse_corpus_line("word 1 2.5.1", 2).has_value(), "partial number");
                   }});

  tests.push_back({"parse_corpus_line_flushes_float_underflow_to_zero", [] {
                     const auto parsed = vectors::parse_corpus_line("w 1e-50 -1e-60 1e-40 0.5", 4);
                     require(parsed.has_value(), "underflowing components are still numbers");
                     require(parsed->values[0] == 0.0F && !std::signbit(parsed->values[0]), "+0");
                     require(parsed->values[1] == 0.0F && std::signbit(parsed->values[1]), "-0");
                     require(parsed->values[2] > 0.0F, "subnormal kept");
                     require(parsed->values[3] == 0.5F, "normal value");
                     require(!vectors::parse_corpus_line("w 1e39 0.5", 2).has_value(),
                             "values past the float range stay malformed");
                   }});

  tests.push_back({"reduce_counts_underflow_lines_toward_cap", [] {
                     const auto result =
                         reduce("tiny 1e-50 2\n" + corpus_line("of", 2, 2.0F) +
                                    corpus_line("and", 2, 3.0F),
                                {.top_k = 2, .dimension = 2, .progress_interval = 0});
                     require(result.stats.malformed == 0, "no malformed lines");
                     require(result.store.size() == 2 && result.store.entries()[0].word == "tiny",
                             "underflow line is kept in order");
                     require(!result.store.contains("and"), "cap reached before the third line");
                   }});

  tests.push_back({"reduce_keeps_source_order", [] {
                     const auto result =
                         reduce(corpus_line("the", 2, 1.0F) + corpus_line("of", 2, 2.0F) +
                                    corpus_line("and", 2, 3.0F),
                                {.top_k = 10, .dimension = 2, .progress_interval = 0});
                     require(result.store.size() == 3, "three words expected");
                     require(result.store.entries()[0].word == "the", "first word");
                     require(result.store.entries()[2].word == "and", "last word");
                     require(result.stats.lines_read == 3 && result.stats.accepted == 3, "stats");
                   }});

  tests.push_back({"reduce_skips_malformed_lines_without_counting_them", [] {
                     const std::string corpus = corpus_line("one", 2, 1.0F) + "broken 1\n" + "\n" +
                                                "nan-ish 1 abc\n" + corpus_line("two", 2, 2.0F) +
                                                corpus_line("three", 2, 3.0F);
                     const auto result =
                         reduce(corpus, {.top_k = 2, .dimension = 2, .progress_interval = 0});
                     require(result.store.size() == 2, "cap counts only valid lines");
                     require(result.store.entries()[1].word == "two", "second valid line is kept");
                     require(result.stats.malformed == 3, "three malformed lines");
                     require(result.stats.lines_read == 5, "reading stops once the cap is reached");
                   }});

  tests.push_back({"reduce_duplicate_word_takes_last_vector", [] {
                     const auto result = reduce(corpus_line("go", 2, 1.0F) + corpus_line("run", 2, 2.0F) +
                                                    corpus_line("go", 2, 5.0F),
                                                {.top_k = 10, .dimension = 2, .progress_interval = 0});
                     require(result.store.size() == 2, "duplicate should not add an entry");
                     require(result.store.entries()[0].word == "go", "first position kept");
                     require(result.store.entries()[0].values[0] == 5.0F, "later vector wins");
                     require(result.stats.duplicates == 1, "one duplicate");
                     require(result.stats.accepted == 3, "duplicates count toward the cap");
                   }});

  tests.push_back({"reduce_rejects_invalid_utf8_words", [] {
                     const auto result = reduce(std::string("bad\xff 1 2\n") + corpus_line("ok", 2, 1.0F),
                                                {.top_k = 10, .dimension = 2, .progress_interval = 0});
                     require(result.store.size() == 1, "invalid word should be skipped");
                     require(result.stats.malformed == 1, "invalid word counts as malformed");
                   }});

  tests.push_back({"reduce_caps_large_corpus_at_first_valid_lines", [] {
                     std::string corpus;
                     corpus.reserve(150'000 * 24);
                     for (std::size_t i = 0; i < 150'000; ++i) {
                       corpus += "w" + std::to_string(i) + " " + std::to_string(i % 97) + " 0.5 -1\n";
                       if (i == 10) {
                         corpus += "junk line\n";
                       }
                     }
                     const auto result =
                         reduce(corpus, {.top_k = 100'000, .dimension = 3, .progress_interval = 10'000});
                     require(result.store.size() == 100'000, "exactly K entries expected");
                     require(result.store.entries().front().word == "w0", "first entry");
                     require(result.store.entries().back().word == "w99999", "last entry");
                     require(!result.store.contains("w100000"), "lines past the cap are ignored");
                     require(result.stats.malformed == 1, "junk line skipped");
                   }});

  tests.push_back({"reduce_full_dimension_lines", [] {
                     const auto result =
                         reduce(corpus_line("the", vectors::VECTOR_DIMENSION, 0.25F) +
                                    corpus_line("short", vectors::VECTOR_DIMENSION - 1, 0.25F),
                                {});
                     require(result.store.size() == 1, "99-component line is malformed");
                     require(result.store.entries()[0].values.size() == vectors::VECTOR_DIMENSION,
                             "100 components");
                   }});

  tests.push_back({"reduce_reports_progress_and_malformed_count", [] {
                     const cmdvec::testing::ObserverGuard guard;
                     std::string corpus = "oops\n";
                     for (int i = 0; i < 7; ++i) {
                       corpus += corpus_line("w" + std::to_string(i), 2, 1.0F);
                     }
                     (void)reduce(corpus, {.top_k = 100, .dimension = 2, .progress_interval = 3});

                     const auto progress =
                         guard.observer().events_of<cmdvec::observability::ProgressEvent>();
                     require(progress.size() == 2, "progress at 3 and 6");
                     require(progress[1].done == 6, "second progress at 6");
                     const auto malformed =
                         guard.observer().metrics_of<cmdvec::observability::MalformedLinesMetric>();
                     require(malformed.size() == 1 && malformed[0].count == 1, "one malformed line");
                   }});
}
