#pragma once

#include "cmdvec/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace cmdvec::vectors {

inline constexpr std::size_t VECTOR_DIMENSION = 100;
inline constexpr std::size_t MAX_WORD_BYTES = 65535;

struct WordVector {
  std::string word;
  std::vector<float> values;
};

class VectorStore {
public:
  explicit VectorStore(std::size_t dimension = VECTOR_DIMENSION) : dimension_(dimension) {}

  [[nodiscard]] common::Status upsert(std::string word, std::vector<float> values);

  [[nodiscard]] const WordVector *find(const std::string &word) const;
  [[nodiscard]] bool contains(const std::string &word) const { return index_.contains(word); }

  [[nodiscard]] std::size_t dimension() const { return dimension_; }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const std::vector<WordVector> &entries() const { return entries_; }

  void reserve(std::size_t count);

  [[nodiscard]] bool operator==(const VectorStore &other) const;

private:
  std::size_t dimension_;
  std::vector<WordVector> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

[[nodiscard]] bool same_bits(const std::vector<float> &lhs, const std::vector<float> &rhs);

} // namespace cmdvec::vectors
