#include "cmdvec/vectors/vector_store.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/common/utf8.hpp"

#include <cstring>

namespace cmdvec::vectors {

common::Status VectorStore::upsert(std::string word, std::vector<float> values) {
  if (values.size() != dimension_) {
    return assets::fail_status({.code = assets::AssetErrorCode::Format,
                                .message = "vector for '" + word + "' has " +
                                           std::to_string(values.size()) + " components, expected " +
                                           std::to_string(dimension_)});
  }
  if (word.size() > MAX_WORD_BYTES) {
    return assets::fail_status({.code = assets::AssetErrorCode::Format,
                                .message = "word of " + std::to_string(word.size()) +
                                           " bytes exceeds the u16 length prefix"});
  }
  if (const auto bad = common::first_invalid_utf8(word); bad.has_value()) {
    return assets::fail_status({.code = assets::AssetErrorCode::Encoding,
                                .message = "word is not valid UTF-8 at byte " +
                                           std::to_string(*bad)});
  }

  if (const auto it = index_.find(word); it != index_.end()) {
    entries_[it->second].values = std::move(values);
    return common::Status::success();
  }

  index_.emplace(word, entries_.size());
  entries_.push_back(WordVector{.word = std::move(word), .values = std::move(values)});
  return common::Status::success();
}

const WordVector *VectorStore::find(const std::string &word) const {
  const auto it = index_.find(word);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second];
}

void VectorStore::reserve(const std::size_t count) {
  entries_.reserve(count);
  index_.reserve(count);
}

bool VectorStore::operator==(const VectorStore &other) const {
  if (dimension_ != other.dimension_ || entries_.size() != other.entries_.size()) {
    return false;
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].word != other.entries_[i].word ||
        !same_bits(entries_[i].values, other.entries_[i].values)) {
      return false;
    }
  }
  return true;
}

bool same_bits(const std::vector<float> &lhs, const std::vector<float> &rhs) {
  return lhs.size() == rhs.size() &&
         (lhs.empty() || std::memcmp(lhs.data(), rhs.data(), lhs.size() * sizeof(float)) == 0);
}

} // namespace cmdvec::vectors
