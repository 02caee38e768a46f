#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/config/schema.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cmdvec::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

inline constexpr double ZERO_VECTOR_WARN_RATIO = 0.10;

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config);
void print_diagnostics_report(const DiagnosticsReport &report);

struct VectorSample {
  std::string word;
  std::vector<float> leading;
  double norm = 0.0;
};

struct VectorStoreSummary {
  std::size_t vocab_size = 0;
  std::size_t dimension = 0;
  std::uint64_t bytes = 0;
  std::vector<VectorSample> samples;
};

struct EmbeddingSample {
  std::size_t index = 0;
  std::vector<float> leading;
  double norm = 0.0;
};

struct EmbeddingTableSummary {
  std::size_t count = 0;
  std::size_t dimension = 0;
  std::size_t zero_vectors = 0;
  std::uint64_t bytes = 0;
  std::vector<EmbeddingSample> samples;
};

[[nodiscard]] common::Result<VectorStoreSummary>
inspect_vector_store(const std::filesystem::path &path, std::size_t dimension, std::size_t samples);
[[nodiscard]] common::Result<EmbeddingTableSummary>
inspect_embedding_table(const std::filesystem::path &path, std::size_t samples);

void print_vector_store_summary(const VectorStoreSummary &summary);
void print_embedding_table_summary(const EmbeddingTableSummary &summary);

} // namespace cmdvec::doctor
