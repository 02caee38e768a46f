#pragma once

#include "cmdvec/common/result.hpp"
#include "cmdvec/config/schema.hpp"
#include "cmdvec/embedding/generator.hpp"
#include "cmdvec/vectors/reducer.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace cmdvec::pipeline {

struct ReduceRun {
  std::filesystem::path corpus;
  std::filesystem::path output;
  vectors::ReduceStats stats;
  std::size_t vocab_size = 0;
  std::uint64_t bytes_written = 0;
};

struct EmbedRun {
  std::filesystem::path vectors;
  std::filesystem::path catalog;
  std::filesystem::path output;
  std::size_t vocab_size = 0;
  embedding::GenerationReport report;
  std::vector<std::size_t> zero_match_indices;
  std::uint64_t bytes_written = 0;
};

struct BuildRun {
  ReduceRun reduce;
  EmbedRun embed;
  std::filesystem::path manifest;
};

[[nodiscard]] common::Result<ReduceRun> run_reduce(const config::Config &config);

[[nodiscard]] common::Result<EmbedRun> run_embed(const config::Config &config);

[[nodiscard]] common::Result<BuildRun> run_build(const config::Config &config);

} // namespace cmdvec::pipeline
