#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace cmdvec::config {

struct AssetsConfig {
  std::string dir = "assets";
  std::string corpus = "glove.6B.100d.txt";
  std::string vectors = "glove.bin";
  std::string catalog = "commands.yml";
  std::string embeddings = "cmd_embeddings.bin";
  std::string manifest = "manifest.json";
};

struct ReduceConfig {
  std::uint64_t top_k = 100'000;
  std::size_t dimension = 100;
  std::uint64_t progress_interval = 10'000;
};

struct EmbedConfig {
  std::uint32_t threads = 1;
  std::uint64_t progress_interval = 500;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  AssetsConfig assets;
  ReduceConfig reduce;
  EmbedConfig embed;
  ObservabilityConfig observability;
};

} // namespace cmdvec::config
