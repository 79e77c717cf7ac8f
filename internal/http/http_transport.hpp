#pragma once

#include <arrow/io/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/cancellation.hpp"

namespace assetxfer::http {

using Header  = std::pair<std::string, std::string>;
using Headers = std::vector<Header>;

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers     headers;

  // Optional request body, streamed; body_length bytes are sent.
  std::shared_ptr<arrow::io::InputStream> body;
  int64_t                                 body_length = 0;
};

/*
  Response whose status and headers are known, body still on the wire.

  Read() pulls the body incrementally so callers decide where the bytes go
  (or whether to keep only a diagnostic prefix) after seeing the status.
*/
class HttpResponseStream {
 public:
  virtual ~HttpResponseStream() = default;

  virtual int status_code() const = 0;

  // e.g. "404 Not Found"; may be empty.
  virtual std::string status_line() const = 0;

  // Case-insensitive lookup of the final response's header; empty if absent.
  virtual std::string Header(std::string_view name) const = 0;

  // Reads up to `max` body bytes into `out`. Returns 0 at end of body.
  // Throws TransientNetworkError on a broken transfer, CancellationError on cancel.
  virtual int64_t Read(uint8_t* out, int64_t max) = 0;
};

/*
  Network seam of the transfer core.

  Send() blocks until the response head has arrived and must observe `token`
  promptly while blocked. Transport failures are thrown as
  TransientNetworkError (worth retrying) or NonRetryableError (e.g. malformed URL).
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual std::unique_ptr<HttpResponseStream> Send(const HttpRequest& request, const util::CancellationToken& token) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

bool IsSuccessStatus(int status_code);

// Reads at most `limit` body bytes.
std::string ReadPrefix(HttpResponseStream& response, std::size_t limit);

// Reads the whole body into memory. For small JSON documents only.
std::string ReadAll(HttpResponseStream& response);

// Streams the remaining body into `out`, returning the byte count.
int64_t CopyBody(HttpResponseStream& response, arrow::io::OutputStream& out);

// Splits on whitespace and rejoins with single spaces.
std::string CollapseWhitespace(std::string_view text);

/*
  Diagnostic message for a failed response: a collapsed prefix of the body,
  falling back to the status line.
*/
std::string FailureMessage(HttpResponseStream& response, std::size_t limit);

} // namespace assetxfer::http
