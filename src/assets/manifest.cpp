#include "cmdvec/assets/manifest.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/fs.hpp"
#include "cmdvec/common/json_util.hpp"
#include "cmdvec/common/sha256.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace cmdvec::assets {

namespace {

std::string relative_name(const std::filesystem::path &artifact,
                          const std::filesystem::path &manifest_dir) {
  std::error_code ec;
  const auto base = manifest_dir.empty() ? std::filesystem::current_path(ec)
                                         : std::filesystem::absolute(manifest_dir, ec);
  const auto target = std::filesystem::absolute(artifact, ec);
  if (ec) {
    return artifact.string();
  }
  const auto relative = target.lexically_normal().lexically_relative(base.lexically_normal());
  if (relative.empty() || common::starts_with(relative.generic_string(), "..")) {
    return target.lexically_normal().string();
  }
  return relative.generic_string();
}

common::Result<ArtifactEntry> hash_artifact(const std::filesystem::path &artifact,
                                            const std::filesystem::path &manifest_dir) {
  const auto digest = common::sha256_file_hex(artifact);
  if (!digest.ok()) {
    return fail<ArtifactEntry>({.code = AssetErrorCode::Io, .message = digest.error()});
  }
  return common::Result<ArtifactEntry>::success(
      ArtifactEntry{.file = relative_name(artifact, manifest_dir), .sha256 = digest.value()});
}

std::optional<std::uint64_t> parse_u64(const std::string &text) {
  std::uint64_t value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

void render_entry(std::ostringstream &out, const std::string &name, const ArtifactEntry &entry,
                  const std::vector<std::pair<std::string, std::uint64_t>> &counts) {
  out << "  \"" << name << "\": {\n";
  out << "    \"file\": \"" << common::json_escape(entry.file) << "\",\n";
  out << "    \"sha256\": \"" << entry.sha256 << "\"";
  for (const auto &[key, value] : counts) {
    out << ",\n    \"" << key << "\": " << value;
  }
  out << "\n  }";
}

common::Result<ArtifactEntry> read_entry(const std::string &json, const std::string &name) {
  const std::string object = common::json_get_object(json, name);
  if (object.empty()) {
    return fail<ArtifactEntry>({.code = AssetErrorCode::Format,
                                .message = "manifest has no `" + name + "` entry"});
  }
  ArtifactEntry entry{.file = common::json_get_string(object, "file"),
                      .sha256 = common::json_get_string(object, "sha256")};
  if (entry.file.empty() || entry.sha256.empty()) {
    return fail<ArtifactEntry>({.code = AssetErrorCode::Format,
                                .message = "manifest entry `" + name + "` needs file and sha256"});
  }
  return common::Result<ArtifactEntry>::success(std::move(entry));
}

common::Status read_count(const std::string &json, const std::string &key, std::uint64_t &out) {
  const auto value = parse_u64(common::json_get_number(json, key));
  if (!value.has_value()) {
    return fail_status({.code = AssetErrorCode::Format,
                        .message = "manifest field `" + key + "` is not a count"});
  }
  out = *value;
  return common::Status::success();
}

} // namespace

common::Result<Manifest> build_manifest(const std::filesystem::path &manifest_path,
                                        const ManifestInputs &inputs) {
  const auto dir = manifest_path.parent_path();
  auto vectors = hash_artifact(inputs.vectors, dir);
  if (!vectors.ok()) {
    return common::Result<Manifest>::failure(vectors.error());
  }
  auto catalog = hash_artifact(inputs.catalog, dir);
  if (!catalog.ok()) {
    return common::Result<Manifest>::failure(catalog.error());
  }
  auto embeddings = hash_artifact(inputs.embeddings, dir);
  if (!embeddings.ok()) {
    return common::Result<Manifest>::failure(embeddings.error());
  }

  Manifest manifest;
  manifest.dimension = inputs.dimension;
  manifest.vectors = vectors.take();
  manifest.vocab_size = inputs.vocab_size;
  manifest.catalog = catalog.take();
  manifest.records = inputs.records;
  manifest.embeddings = embeddings.take();
  manifest.count = inputs.count;
  manifest.zero_vectors = inputs.zero_vectors;
  return common::Result<Manifest>::success(std::move(manifest));
}

std::string render_manifest(const Manifest &manifest) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"format_version\": " << manifest.format_version << ",\n";
  out << "  \"dimension\": " << manifest.dimension << ",\n";
  render_entry(out, "vectors", manifest.vectors, {{"vocab_size", manifest.vocab_size}});
  out << ",\n";
  render_entry(out, "catalog", manifest.catalog, {{"records", manifest.records}});
  out << ",\n";
  render_entry(out, "embeddings", manifest.embeddings,
               {{"count", manifest.count}, {"zero_vectors", manifest.zero_vectors}});
  out << "\n}\n";
  return out.str();
}

common::Result<Manifest> parse_manifest(const std::string &json) {
  Manifest manifest;
  std::uint64_t version = 0;
  if (const auto status = read_count(json, "format_version", version); !status.ok()) {
    return common::Result<Manifest>::failure(status.error());
  }
  if (version != MANIFEST_FORMAT_VERSION) {
    return fail<Manifest>({.code = AssetErrorCode::Format,
                           .message = "unsupported manifest format_version " +
                                      std::to_string(version)});
  }
  if (const auto status = read_count(json, "dimension", manifest.dimension); !status.ok()) {
    return common::Result<Manifest>::failure(status.error());
  }

  auto vectors = read_entry(json, "vectors");
  auto catalog = read_entry(json, "catalog");
  auto embeddings = read_entry(json, "embeddings");
  for (const auto *entry : {&vectors, &catalog, &embeddings}) {
    if (!entry->ok()) {
      return common::Result<Manifest>::failure(entry->error());
    }
  }
  manifest.vectors = vectors.take();
  manifest.catalog = catalog.take();
  manifest.embeddings = embeddings.take();

  const std::string vectors_json = common::json_get_object(json, "vectors");
  const std::string catalog_json = common::json_get_object(json, "catalog");
  const std::string embeddings_json = common::json_get_object(json, "embeddings");
  for (const auto &status : {read_count(vectors_json, "vocab_size", manifest.vocab_size),
                             read_count(catalog_json, "records", manifest.records),
                             read_count(embeddings_json, "count", manifest.count),
                             read_count(embeddings_json, "zero_vectors", manifest.zero_vectors)}) {
    if (!status.ok()) {
      return common::Result<Manifest>::failure(status.error());
    }
  }
  return common::Result<Manifest>::success(std::move(manifest));
}

common::Status save_manifest(const std::filesystem::path &path, const Manifest &manifest) {
  const auto status = common::write_file_atomic(path, render_manifest(manifest));
  if (!status.ok()) {
    return fail_status({.code = AssetErrorCode::Io, .message = status.error()});
  }
  return common::Status::success();
}

common::Result<Manifest> load_manifest(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fail<Manifest>({.code = AssetErrorCode::MissingInput,
                           .message = "manifest not found: " + path.string()});
  }
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return fail<Manifest>({.code = AssetErrorCode::Io, .message = content.error()});
  }
  auto parsed = parse_manifest(content.value());
  if (!parsed.ok()) {
    return common::Result<Manifest>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

std::vector<std::string> verify_manifest(const std::filesystem::path &manifest_path,
                                         const Manifest &manifest) {
  std::vector<std::string> problems;
  const auto dir = manifest_path.parent_path();

  const std::vector<std::pair<std::string, const ArtifactEntry *>> entries = {
      {"vectors", &manifest.vectors},
      {"catalog", &manifest.catalog},
      {"embeddings", &manifest.embeddings}};
  for (const auto &[name, entry] : entries) {
    const auto path = common::resolve_against(dir, entry->file);
    const auto digest = common::sha256_file_hex(path);
    if (!digest.ok()) {
      problems.push_back(name + ": " + digest.error());
    } else if (digest.value() != entry->sha256) {
      problems.push_back(name + ": " + path.string() + " changed since the manifest was written");
    }
  }

  if (manifest.count != manifest.records) {
    problems.push_back("embeddings.count " + std::to_string(manifest.count) +
                       " does not match catalog.records " + std::to_string(manifest.records));
  }
  return problems;
}

} // namespace cmdvec::assets
