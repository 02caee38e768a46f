#include "bench_common.hpp"

#include "cmdvec/vectors/reducer.hpp"
#include "cmdvec/vectors/store_codec.hpp"

#include <sstream>

namespace {

std::string synthetic_corpus(const std::size_t words) {
  std::ostringstream out;
  for (std::size_t w = 0; w < words; ++w) {
    out << "word" << w;
    for (std::size_t i = 0; i < cmdvec::vectors::VECTOR_DIMENSION; ++i) {
      out << ' ' << static_cast<float>((w * 31 + i) % 997) / 997.0F - 0.5F;
    }
    out << '\n';
  }
  return out.str();
}

} // namespace

void run_codec_benchmark() {
  std::cout << "\n=== Vector Store Benchmarks ===\n";

  const std::string corpus = synthetic_corpus(5000);
  cmdvec::vectors::VectorStore store;
  cmdvec::bench::run_bench("reduce_corpus_5k", 5, [&] {
    std::istringstream input(corpus);
    auto reduced = cmdvec::vectors::reduce_corpus(input, cmdvec::vectors::ReduceOptions{});
    if (reduced.ok()) {
      store = std::move(reduced.take().store);
    }
  });

  std::string encoded;
  cmdvec::bench::run_bench("encode_vector_store_5k", 20, [&] {
    encoded = cmdvec::vectors::encode_vector_store(store);
  });

  cmdvec::bench::run_bench("decode_vector_store_5k", 20, [&] {
    (void)cmdvec::vectors::decode_vector_store(encoded);
  });
}
