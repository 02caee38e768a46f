#include "cmdvec/assets/error.hpp"

#include <sstream>

namespace cmdvec::assets {

std::string_view error_code_label(const AssetErrorCode code) {
  switch (code) {
  case AssetErrorCode::MissingInput:
    return "missing_input";
  case AssetErrorCode::MalformedLine:
    return "malformed_line";
  case AssetErrorCode::TruncatedStream:
    return "truncated_stream";
  case AssetErrorCode::Encoding:
    return "encoding";
  case AssetErrorCode::Format:
    return "format";
  case AssetErrorCode::Io:
    return "io";
  }
  return "unknown";
}

std::string AssetError::to_string() const {
  std::ostringstream stream;
  stream << "Asset error [" << error_code_label(code) << "]";
  if (offset.has_value()) {
    stream << " offset=" << *offset;
  }
  if (!message.empty()) {
    stream << ": " << message;
  }
  return stream.str();
}

bool has_error_code(const std::string &message, const AssetErrorCode code) {
  const std::string tag = "Asset error [" + std::string(error_code_label(code)) + "]";
  return message.find(tag) != std::string::npos;
}

} // namespace cmdvec::assets
