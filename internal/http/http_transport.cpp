#include "http_transport.hpp"

#include <cctype>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace assetxfer::http {

namespace {

constexpr std::size_t kCopyChunkBytes = 64 * 1024;

} // namespace

bool IsSuccessStatus(int status_code) {
  return status_code >= 200 && status_code < 300;
}

std::string ReadPrefix(HttpResponseStream& response, std::size_t limit) {
  std::string out;
  out.resize(limit);
  std::size_t filled = 0;
  while (filled < limit) {
    const auto n = response.Read(reinterpret_cast<uint8_t*>(out.data()) + filled, static_cast<int64_t>(limit - filled));
    if (n == 0) {
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  out.resize(filled);
  return out;
}

std::string ReadAll(HttpResponseStream& response) {
  std::string          out;
  std::vector<uint8_t> chunk(kCopyChunkBytes);
  while (true) {
    const auto n = response.Read(chunk.data(), static_cast<int64_t>(chunk.size()));
    if (n == 0) {
      return out;
    }
    out.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(n));
  }
}

int64_t CopyBody(HttpResponseStream& response, arrow::io::OutputStream& out) {
  std::vector<uint8_t> chunk(kCopyChunkBytes);
  int64_t              total = 0;
  while (true) {
    const auto n = response.Read(chunk.data(), static_cast<int64_t>(chunk.size()));
    if (n == 0) {
      return total;
    }
    storage::common::Unwrap(out.Write(chunk.data(), n));
    total += n;
  }
}

std::string CollapseWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string FailureMessage(HttpResponseStream& response, std::size_t limit) {
  std::string prefix;
  try {
    prefix = ReadPrefix(response, limit);
  } catch (const util::TransientNetworkError&) {
    // The status already classifies the failure; a truncated error body only
    // costs the diagnostic text.
    prefix.clear();
  }

  auto message = CollapseWhitespace(prefix);
  if (message.empty()) {
    message = CollapseWhitespace(response.status_line());
  }
  return message;
}

} // namespace assetxfer::http
