#pragma once

#include <cstdint>
#include <string>

namespace assetxfer::transfer {

/*
  Concrete download URL for an image asset template such as
  "https://cdn.example.com/{w}x{h}bb.{f}".

  {w} and {h} take the dimensions; {f} takes the extension of `file_name`
  (without the dot), or "png" when it has none. Throws std::invalid_argument
  when the template is blank, a dimension is not positive, braces remain
  after substitution, or the scheme is not http/https.
*/
std::string ResolveImageAssetDownloadUrl(const std::string& template_url, int64_t width, int64_t height, const std::string& file_name);

} // namespace assetxfer::transfer
