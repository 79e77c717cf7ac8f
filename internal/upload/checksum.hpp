#pragma once

#include <arrow/io/interfaces.h>

#include <string>
#include <string_view>

namespace assetxfer::upload {

enum class ChecksumAlgorithm {
  kMd5,
  kSha256,
};

std::string_view ToString(ChecksumAlgorithm algorithm);

struct Checksum {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::kMd5;
  std::string       hash; // lowercase hex
};

/*
  Streams `in` to its end through the digest in fixed-size chunks.
*/
Checksum ComputeChecksum(arrow::io::InputStream& in, ChecksumAlgorithm algorithm);

} // namespace assetxfer::upload
