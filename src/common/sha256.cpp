#include "cmdvec/common/sha256.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace cmdvec::common {

namespace {

constexpr std::size_t READ_BLOCK = 1 << 16;

std::string to_hex(const unsigned char *digest, const std::size_t length) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < length; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return stream.str();
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string sha256_hex(const std::string_view bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

Result<std::string> sha256_file_hex(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("failed to open " + path.string());
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure("failed to initialise SHA-256 digest");
  }

  std::array<char, READ_BLOCK> block{};
  while (in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    const auto got = in.gcount();
    if (got > 0 && EVP_DigestUpdate(ctx.get(), block.data(), static_cast<std::size_t>(got)) != 1) {
      return Result<std::string>::failure("SHA-256 update failed for " + path.string());
    }
  }
  if (in.bad()) {
    return Result<std::string>::failure("I/O error while hashing " + path.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    return Result<std::string>::failure("SHA-256 finalisation failed for " + path.string());
  }
  return Result<std::string>::success(to_hex(digest, length));
}

} // namespace cmdvec::common
