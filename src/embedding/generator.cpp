#include "cmdvec/embedding/generator.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/observability/global.hpp"
#include "cmdvec/text/tokenizer.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <limits>
#include <system_error>

namespace cmdvec::embedding {

std::vector<std::string> record_tokens(const catalog::CommandRecord &record) {
  std::vector<std::string> tokens;
  text::tokenize_into(record.command, tokens);
  text::tokenize_into(record.description, tokens);
  for (const auto &keyword : record.keywords) {
    text::tokenize_into(keyword, tokens);
  }
  return tokens;
}

Embedding embed_tokens(const vectors::VectorStore &store, const std::vector<std::string> &tokens) {
  const std::size_t dimension = store.dimension();
  std::vector<double> sum(dimension, 0.0);
  std::size_t matched = 0;

  for (const auto &token : tokens) {
    const auto *entry = store.find(token);
    if (entry == nullptr) {
      continue;
    }
    for (std::size_t i = 0; i < dimension; ++i) {
      sum[i] += static_cast<double>(entry->values[i]);
    }
    ++matched;
  }

  Embedding out{.values = std::vector<float>(dimension, 0.0F), .matched = matched};
  if (matched == 0) {
    return out;
  }
  const auto divisor = static_cast<double>(matched);
  for (std::size_t i = 0; i < dimension; ++i) {
    out.values[i] = static_cast<float>(sum[i] / divisor);
  }
  return out;
}

Embedding embed_record(const vectors::VectorStore &store, const catalog::CommandRecord &record) {
  return embed_tokens(store, record_tokens(record));
}

Embedding embed_text(const vectors::VectorStore &store, const std::string_view text) {
  return embed_tokens(store, text::tokenize(text));
}

common::Result<GenerationResult> generate_table(const vectors::VectorStore &store,
                                                const std::vector<catalog::CommandRecord> &records,
                                                const GenerationOptions &options) {
  if (records.size() > std::numeric_limits<std::uint32_t>::max()) {
    return assets::fail<GenerationResult>({.code = assets::AssetErrorCode::Format,
                                            .message = "catalog has more records than a u32 count"});
  }

  const std::size_t total = records.size();
  GenerationResult result;
  result.table.dimension = store.dimension();
  result.table.rows.resize(total);
  std::vector<std::size_t> matched(total, 0);
  std::atomic<std::uint64_t> done{0};

  auto embed_range = [&](const std::size_t begin, const std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
      auto embedding = embed_record(store, records[i]);
      result.table.rows[i] = std::move(embedding.values);
      matched[i] = embedding.matched;

      const auto finished = done.fetch_add(1) + 1;
      if (options.progress_interval != 0 && finished % options.progress_interval == 0) {
        observability::record_progress("embed", finished, total);
      }
    }
  };

  const std::size_t workers =
      std::clamp<std::size_t>(options.threads, 1, std::max<std::size_t>(total, 1));
  if (workers == 1) {
    embed_range(0, total);
  } else {
    // Contiguous chunks; each worker only writes its own slots.
    const std::size_t chunk = (total + workers - 1) / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    try {
      for (std::size_t begin = 0; begin < total; begin += chunk) {
        const std::size_t end = std::min(total, begin + chunk);
        futures.push_back(std::async(std::launch::async, embed_range, begin, end));
      }
    } catch (const std::system_error &e) {
      for (auto &future : futures) {
        future.wait();
      }
      return common::Result<GenerationResult>::failure(
          "unable to start " + std::to_string(workers) + " embedding workers: " + e.what());
    }
    for (auto &future : futures) {
      future.get();
    }
  }

  for (std::size_t i = 0; i < total; ++i) {
    if (matched[i] == 0) {
      result.zero_match_indices.push_back(i);
    }
  }
  result.report = GenerationReport{.count = total,
                                   .dimension = store.dimension(),
                                   .zero_matches = result.zero_match_indices.size()};
  observability::record_metric(
      observability::ZeroMatchMetric{.count = result.report.zero_matches});
  return common::Result<GenerationResult>::success(std::move(result));
}

} // namespace cmdvec::embedding
