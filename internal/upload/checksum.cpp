#include "checksum.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/arrow_utils.hpp"

namespace assetxfer::upload {

namespace {

constexpr int64_t kChunkBytes = 1 << 20;

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

const EVP_MD* DigestFor(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::kMd5:
      return EVP_md5();
    case ChecksumAlgorithm::kSha256:
      return EVP_sha256();
  }
  throw std::invalid_argument("unsupported checksum algorithm");
}

std::string HexEncode(const unsigned char* data, unsigned int len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string_view ToString(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::kMd5:
      return "MD5";
    case ChecksumAlgorithm::kSha256:
      return "SHA_256";
  }
  return "UNKNOWN";
}

Checksum ComputeChecksum(arrow::io::InputStream& in, ChecksumAlgorithm algorithm) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), DigestFor(algorithm), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  std::vector<uint8_t> chunk(kChunkBytes);
  while (true) {
    const auto n = storage::common::Unwrap(in.Read(kChunkBytes, chunk.data()));
    if (n == 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  return Checksum{algorithm, HexEncode(digest, digest_len)};
}

} // namespace assetxfer::upload
