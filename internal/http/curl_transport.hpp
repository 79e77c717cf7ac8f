#pragma once

#include <chrono>
#include <memory>

#include "internal/http/http_transport.hpp"

namespace assetxfer::http {

/*
  libcurl-backed transport.

  Each Send() drives its own multi handle from the calling thread, so the
  caller's CancellationToken is checked between short poll slices and the
  body is only pulled off the wire as Read() asks for it.
*/
class CurlTransport final : public HttpTransport {
 public:
  struct Options {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};

    // A transfer slower than low_speed_limit bytes/s for low_speed_time is
    // aborted as a transient failure.
    long                      low_speed_limit = 1;
    std::chrono::milliseconds low_speed_time{std::chrono::seconds(60)};

    long max_redirects = 10;
  };

  CurlTransport();
  explicit CurlTransport(Options options);

  std::unique_ptr<HttpResponseStream> Send(const HttpRequest& request, const util::CancellationToken& token) override;

 private:
  Options options_;
};

} // namespace assetxfer::http
