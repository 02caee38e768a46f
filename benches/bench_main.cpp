#include <iostream>

void run_tokenizer_benchmark();
void run_codec_benchmark();
void run_embedding_benchmark();

int main() {
  std::cout << "cmdvec Benchmarks\n";
  run_tokenizer_benchmark();
  run_codec_benchmark();
  run_embedding_benchmark();
  return 0;
}
