#pragma once

#include "cmdvec/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cmdvec::assets {

inline constexpr std::uint32_t MANIFEST_FORMAT_VERSION = 1;

struct ArtifactEntry {
  std::string file;
  std::string sha256;
};

struct Manifest {
  std::uint32_t format_version = MANIFEST_FORMAT_VERSION;
  std::uint64_t dimension = 0;
  ArtifactEntry vectors;
  std::uint64_t vocab_size = 0;
  ArtifactEntry catalog;
  std::uint64_t records = 0;
  ArtifactEntry embeddings;
  std::uint64_t count = 0;
  std::uint64_t zero_vectors = 0;
};

struct ManifestInputs {
  std::filesystem::path vectors;
  std::uint64_t vocab_size = 0;
  std::filesystem::path catalog;
  std::uint64_t records = 0;
  std::filesystem::path embeddings;
  std::uint64_t count = 0;
  std::uint64_t zero_vectors = 0;
  std::uint64_t dimension = 0;
};

[[nodiscard]] common::Result<Manifest> build_manifest(const std::filesystem::path &manifest_path,
                                                      const ManifestInputs &inputs);

[[nodiscard]] std::string render_manifest(const Manifest &manifest);
[[nodiscard]] common::Result<Manifest> parse_manifest(const std::string &json);

[[nodiscard]] common::Status save_manifest(const std::filesystem::path &path,
                                           const Manifest &manifest);
[[nodiscard]] common::Result<Manifest> load_manifest(const std::filesystem::path &path);

[[nodiscard]] std::vector<std::string> verify_manifest(const std::filesystem::path &manifest_path,
                                                       const Manifest &manifest);

} // namespace cmdvec::assets
