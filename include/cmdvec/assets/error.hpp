#pragma once

#include "cmdvec/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace cmdvec::assets {

enum class AssetErrorCode {
  MissingInput,
  MalformedLine,
  TruncatedStream,
  Encoding,
  Format,
  Io,
};

struct AssetError {
  AssetErrorCode code = AssetErrorCode::Format;
  std::optional<std::size_t> offset;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] std::string_view error_code_label(AssetErrorCode code);

[[nodiscard]] bool has_error_code(const std::string &message, AssetErrorCode code);

template <typename T> [[nodiscard]] common::Result<T> fail(const AssetError &error) {
  return common::Result<T>::failure(error.to_string());
}

[[nodiscard]] inline common::Status fail_status(const AssetError &error) {
  return common::Status::error(error.to_string());
}

} // namespace cmdvec::assets
