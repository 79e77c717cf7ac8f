#include "asset_url.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"

namespace assetxfer::transfer {

namespace {

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
    text.replace(pos, from.size(), to);
  }
}

struct CurlUrlDeleter {
  void operator()(CURLU* url) const {
    curl_url_cleanup(url);
  }
};

struct CurlFreeDeleter {
  void operator()(char* part) const {
    curl_free(part);
  }
};

// Scheme of `url` as the URL parser sees it, lowercased.
std::string ParseScheme(const std::string& url) {
  std::unique_ptr<CURLU, CurlUrlDeleter> handle(curl_url());
  if (!handle) {
    throw std::runtime_error("curl_url allocation failed");
  }
  if (auto rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), CURLU_NON_SUPPORT_SCHEME); rc != CURLUE_OK) {
    throw std::invalid_argument(std::string("parse resolved URL: ") + curl_url_strerror(rc));
  }

  char* raw = nullptr;
  if (auto rc = curl_url_get(handle.get(), CURLUPART_SCHEME, &raw, 0); rc != CURLUE_OK) {
    throw std::invalid_argument(std::string("parse resolved URL: ") + curl_url_strerror(rc));
  }
  std::unique_ptr<char, CurlFreeDeleter> scheme(raw);

  std::string out(scheme.get());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string ResolveImageAssetDownloadUrl(const std::string& template_url, int64_t width, int64_t height, const std::string& file_name) {
  const auto templ = storage::common::TrimSpace(template_url);
  if (templ.empty()) {
    throw std::invalid_argument("image asset template URL is missing");
  }
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("image asset dimensions are missing");
  }

  auto resolved = templ;
  ReplaceAll(resolved, "{w}", std::to_string(width));
  ReplaceAll(resolved, "{h}", std::to_string(height));
  if (resolved.find("{f}") != std::string::npos) {
    auto format = std::filesystem::path(storage::common::TrimSpace(file_name)).extension().string();
    if (!format.empty()) {
      format.erase(0, 1);
    }
    format = storage::common::TrimSpace(format);
    if (format.empty()) {
      format = "png";
    }
    ReplaceAll(resolved, "{f}", format);
  }

  if (resolved.find_first_of("{}") != std::string::npos) {
    throw std::invalid_argument("unresolved template URL: \"" + templ + "\"");
  }

  const auto scheme = ParseScheme(resolved);
  if (scheme != "http" && scheme != "https") {
    throw std::invalid_argument("unsupported URL scheme \"" + scheme + "\"");
  }
  return resolved;
}

} // namespace assetxfer::transfer
