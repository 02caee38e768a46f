#include "cmdvec/doctor/diagnostics.hpp"

#include "cmdvec/assets/manifest.hpp"
#include "cmdvec/catalog/catalog.hpp"
#include "cmdvec/config/config.hpp"
#include "cmdvec/embedding/embedding_table.hpp"
#include "cmdvec/vectors/store_codec.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cmdvec::doctor {

namespace {

constexpr std::size_t LEADING_COMPONENTS = 3;

using Clock = std::chrono::steady_clock;

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

std::chrono::milliseconds since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

double l2_norm(const std::vector<float> &values) {
  double sum = 0.0;
  for (const float value : values) {
    sum += static_cast<double>(value) * static_cast<double>(value);
  }
  return std::sqrt(sum);
}

std::vector<float> leading(const std::vector<float> &values) {
  const auto n = std::min(values.size(), LEADING_COMPONENTS);
  return {values.begin(), values.begin() + static_cast<std::ptrdiff_t>(n)};
}

bool is_zero_vector(const std::vector<float> &values) {
  return std::all_of(values.begin(), values.end(), [](const float v) { return v == 0.0F; });
}

std::uint64_t file_bytes(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

std::string format_values(const std::vector<float> &values) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4);
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << (i == 0 ? "" : ", ") << values[i];
  }
  return out.str();
}

std::string format_norm(const double norm) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << norm;
  return out.str();
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = "valid";
  return check;
}

DiagnosticCheck check_corpus(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Corpus";
  const auto path = config::corpus_path(config);
  std::error_code ec;
  if (std::filesystem::is_regular_file(path, ec)) {
    check.status = CheckStatus::Pass;
    check.message = path.string() + " (" + std::to_string(file_bytes(path)) + " bytes)";
  } else {
    check.status = CheckStatus::Warn;
    check.message = "not found at " + path.string() + " (only `reduce` needs it)";
  }
  return check;
}

} // namespace

DiagnosticsReport run_diagnostics(const config::Config &config) {
  DiagnosticsReport report;
  add_check(report, check_config(config));
  add_check(report, check_corpus(config));

  std::optional<std::size_t> records;
  std::optional<std::size_t> rows;

  {
    DiagnosticCheck check{.name = "Vector store", .status = CheckStatus::Pass, .message = "", .latency = {}};
    const auto start = Clock::now();
    const auto store = vectors::load_vector_store(config::vectors_path(config), config.reduce.dimension);
    check.latency = since(start);
    if (store.ok()) {
      check.message = std::to_string(store.value().size()) + " words x " +
                      std::to_string(store.value().dimension());
      if (store.value().empty()) {
        check.status = CheckStatus::Warn;
        check.message = "empty vocabulary";
      }
    } else {
      check.status = CheckStatus::Fail;
      check.message = store.error();
    }
    add_check(report, std::move(check));
  }

  {
    DiagnosticCheck check{.name = "Catalog", .status = CheckStatus::Pass, .message = "", .latency = {}};
    const auto loaded = catalog::load_catalog(config::catalog_path(config));
    if (loaded.ok()) {
      records = loaded.value().size();
      check.message = std::to_string(*records) + " records";
    } else {
      check.status = CheckStatus::Fail;
      check.message = loaded.error();
    }
    add_check(report, std::move(check));
  }

  std::size_t zero_vectors = 0;
  {
    DiagnosticCheck check{.name = "Embedding table", .status = CheckStatus::Pass, .message = "", .latency = {}};
    const auto start = Clock::now();
    const auto table =
        embedding::load_embedding_table(config::embeddings_path(config), config.reduce.dimension);
    check.latency = since(start);
    if (table.ok()) {
      rows = table.value().size();
      zero_vectors = static_cast<std::size_t>(std::count_if(
          table.value().rows.begin(), table.value().rows.end(), is_zero_vector));
      check.message = std::to_string(*rows) + " rows x " + std::to_string(table.value().dimension);
    } else {
      check.status = CheckStatus::Fail;
      check.message = table.error();
    }
    add_check(report, std::move(check));
  }

  if (records.has_value() && rows.has_value()) {
    DiagnosticCheck check{.name = "Alignment", .status = CheckStatus::Pass, .message = "", .latency = {}};
    if (*records == *rows) {
      check.message = "one embedding per catalog record";
    } else {
      check.status = CheckStatus::Fail;
      check.message = "table has " + std::to_string(*rows) + " rows but the catalog has " +
                      std::to_string(*records) + " records";
    }
    add_check(report, std::move(check));
  }

  if (rows.has_value()) {
    DiagnosticCheck check{.name = "Zero vectors", .status = CheckStatus::Pass, .message = "", .latency = {}};
    const double share = *rows == 0 ? 0.0 : static_cast<double>(zero_vectors) / static_cast<double>(*rows);
    std::ostringstream message;
    message << zero_vectors << " of " << *rows << " (" << std::fixed << std::setprecision(1)
            << share * 100.0 << "%)";
    check.message = message.str();
    if (share > ZERO_VECTOR_WARN_RATIO) {
      check.status = CheckStatus::Warn;
    }
    add_check(report, std::move(check));
  }

  {
    DiagnosticCheck check{.name = "Manifest", .status = CheckStatus::Pass, .message = "", .latency = {}};
    const auto path = config::manifest_path(config);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      check.status = CheckStatus::Warn;
      check.message = "not found (written by `cmdvec build`)";
    } else if (const auto manifest = assets::load_manifest(path); !manifest.ok()) {
      check.status = CheckStatus::Fail;
      check.message = manifest.error();
    } else if (const auto problems = assets::verify_manifest(path, manifest.value());
               !problems.empty()) {
      check.status = CheckStatus::Fail;
      check.message = problems.front();
    } else {
      check.message = "digests match";
    }
    add_check(report, std::move(check));
  }

  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    std::cout << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      std::cout << " (" << check.latency->count() << "ms)";
    }
    std::cout << "\n";
  }

  std::cout << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
            << report.warnings << " warnings\n";
}

common::Result<VectorStoreSummary> inspect_vector_store(const std::filesystem::path &path,
                                                        const std::size_t dimension,
                                                        const std::size_t samples) {
  const auto store = vectors::load_vector_store(path, dimension);
  if (!store.ok()) {
    return common::Result<VectorStoreSummary>::failure(store.error());
  }

  VectorStoreSummary summary;
  summary.vocab_size = store.value().size();
  summary.dimension = store.value().dimension();
  summary.bytes = file_bytes(path);
  const auto &entries = store.value().entries();
  for (std::size_t i = 0; i < std::min(samples, entries.size()); ++i) {
    summary.samples.push_back(VectorSample{.word = entries[i].word,
                                           .leading = leading(entries[i].values),
                                           .norm = l2_norm(entries[i].values)});
  }
  return common::Result<VectorStoreSummary>::success(std::move(summary));
}

common::Result<EmbeddingTableSummary> inspect_embedding_table(const std::filesystem::path &path,
                                                              const std::size_t samples) {
  const auto table = embedding::load_embedding_table(path, std::nullopt);
  if (!table.ok()) {
    return common::Result<EmbeddingTableSummary>::failure(table.error());
  }

  EmbeddingTableSummary summary;
  summary.count = table.value().size();
  summary.dimension = table.value().dimension;
  summary.bytes = file_bytes(path);
  const auto &rows = table.value().rows;
  summary.zero_vectors = static_cast<std::size_t>(std::count_if(rows.begin(), rows.end(), is_zero_vector));
  for (std::size_t i = 0; i < std::min(samples, rows.size()); ++i) {
    summary.samples.push_back(
        EmbeddingSample{.index = i, .leading = leading(rows[i]), .norm = l2_norm(rows[i])});
  }
  return common::Result<EmbeddingTableSummary>::success(std::move(summary));
}

void print_vector_store_summary(const VectorStoreSummary &summary) {
  std::cout << "Vocab size: " << summary.vocab_size << "\n";
  std::cout << "Dimension: " << summary.dimension << "\n";
  std::cout << "Bytes: " << summary.bytes << "\n";
  for (const auto &sample : summary.samples) {
    std::cout << "  '" << sample.word << "': values[0:" << sample.leading.size()
              << "] = " << format_values(sample.leading) << " norm=" << format_norm(sample.norm)
              << "\n";
  }
}

void print_embedding_table_summary(const EmbeddingTableSummary &summary) {
  std::cout << "Commands: " << summary.count << "\n";
  std::cout << "Dimension: " << summary.dimension << "\n";
  std::cout << "Zero vectors: " << summary.zero_vectors << "\n";
  std::cout << "Bytes: " << summary.bytes << "\n";
  for (const auto &sample : summary.samples) {
    std::cout << "  Embedding " << sample.index << ": norm=" << format_norm(sample.norm)
              << " values[0:" << sample.leading.size()
              << "] = " << format_values(sample.leading) << "\n";
  }
}

} // namespace cmdvec::doctor
