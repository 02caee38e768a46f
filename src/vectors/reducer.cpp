#include "cmdvec/vectors/reducer.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/observability/global.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>

namespace cmdvec::vectors {

namespace {

bool is_space(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::string_view next_field(std::string_view line, std::size_t &pos) {
  while (pos < line.size() && is_space(line[pos])) {
    ++pos;
  }
  const std::size_t start = pos;
  while (pos < line.size() && !is_space(line[pos])) {
    ++pos;
  }
  return line.substr(start, pos - start);
}

// f32 cannot hold the value; tiny magnitudes round to zero, anything past the float range fails.
std::optional<float> narrow_out_of_range(const char *first, const char *last) {
  long double wide = 0.0L;
  auto [ptr, ec] = std::from_chars(first, last, wide);
  const long double limit = std::numeric_limits<float>::max();
  if (ec != std::errc() || ptr != last || wide > limit || wide < -limit) {
    return std::nullopt;
  }
  return static_cast<float>(wide);
}

std::optional<float> parse_component(std::string_view field) {
  if (!field.empty() && field.front() == '+') {
    field.remove_prefix(1);
  }
  if (field.empty()) {
    return std::nullopt;
  }
  float value = 0.0F;
  const auto *first = field.data();
  const auto *last = first + field.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ptr != last) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range) {
    return narrow_out_of_range(first, last);
  }
  if (ec != std::errc()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<WordVector> parse_corpus_line(const std::string_view line,
                                            const std::size_t dimension) {
  std::size_t pos = 0;
  const std::string_view word = next_field(line, pos);
  if (word.empty()) {
    return std::nullopt;
  }

  WordVector parsed{.word = std::string(word), .values = {}};
  parsed.values.reserve(dimension);
  for (std::string_view field = next_field(line, pos); !field.empty();
       field = next_field(line, pos)) {
    if (parsed.values.size() == dimension) {
      return std::nullopt;
    }
    const auto value = parse_component(field);
    if (!value.has_value()) {
      return std::nullopt;
    }
    parsed.values.push_back(*value);
  }

  if (parsed.values.size() != dimension) {
    return std::nullopt;
  }
  return parsed;
}

common::Result<ReduceResult> reduce_corpus(std::istream &input, const ReduceOptions &options) {
  ReduceResult result{.store = VectorStore(options.dimension), .stats = {}};
  auto &stats = result.stats;

  std::string line;
  while (stats.accepted < options.top_k && std::getline(input, line)) {
    ++stats.lines_read;

    auto parsed = parse_corpus_line(line, options.dimension);
    if (!parsed.has_value()) {
      ++stats.malformed;
      continue;
    }

    const bool duplicate = result.store.contains(parsed->word);
    if (!result.store.upsert(std::move(parsed->word), std::move(parsed->values)).ok()) {
      ++stats.malformed;
      continue;
    }
    if (duplicate) {
      ++stats.duplicates;
    }

    ++stats.accepted;
    if (options.progress_interval != 0 && stats.accepted % options.progress_interval == 0) {
      observability::record_progress("reduce", stats.accepted, options.top_k);
    }
  }

  if (input.bad()) {
    return assets::fail<ReduceResult>({.code = assets::AssetErrorCode::Io,
                                       .message = "read failed after line " +
                                                  std::to_string(stats.lines_read)});
  }

  if (stats.malformed > 0) {
    observability::record_metric(observability::MalformedLinesMetric{.count = stats.malformed});
    observability::record_warning("reduce", "skipped " + std::to_string(stats.malformed) +
                                                " malformed corpus lines");
  }
  return common::Result<ReduceResult>::success(std::move(result));
}

} // namespace cmdvec::vectors
