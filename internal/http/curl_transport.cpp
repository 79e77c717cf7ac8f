#include "curl_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace assetxfer::http {

namespace {

constexpr int         kPollSliceMs     = 100;
constexpr std::size_t kBufferHighWater = 1 << 20;

std::once_flag g_curl_init_once;

void InitCurlOnce() {
  std::call_once(g_curl_init_once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string TrimLine(std::string_view line) {
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
  return std::string(line);
}

/*
  Curl codes that no retry can fix: the request itself is unusable.
*/
bool IsPermanentCurlError(CURLcode code) {
  switch (code) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_NOT_BUILT_IN:
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_OUT_OF_MEMORY:
    case CURLE_READ_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
      return true;
    default:
      return false;
  }
}

[[noreturn]] void ThrowCurlError(CURLcode code, const char* error_buffer, const std::string& url) {
  std::string detail = (error_buffer != nullptr && error_buffer[0] != '\0') ? error_buffer : curl_easy_strerror(code);
  std::string msg    = "request " + url + ": " + detail;
  if (IsPermanentCurlError(code)) {
    throw util::NonRetryableError(msg);
  }
  throw util::TransientNetworkError(msg);
}

class CurlResponseStream final : public HttpResponseStream {
 public:
  CurlResponseStream(const HttpRequest& request, const util::CancellationToken& token, const CurlTransport::Options& options)
      : token_(token), url_(request.url), request_body_(request.body), body_remaining_(request.body_length) {
    multi_ = curl_multi_init();
    easy_  = curl_easy_init();
    if (multi_ == nullptr || easy_ == nullptr) {
      Cleanup();
      throw std::runtime_error("curl handle allocation failed");
    }
    error_buffer_[0] = '\0';

    curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_buffer_);
    curl_easy_setopt(easy_, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(options.low_speed_time).count()));

    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlResponseStream::OnHeader);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlResponseStream::OnBody);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);

    for (const auto& [name, value] : request.headers) {
      const auto line = name + ": " + value;
      header_list_    = curl_slist_append(header_list_, line.c_str());
    }

    if (request_body_) {
      // Disable "Expect: 100-continue"; presigned upload targets do not honor it.
      header_list_ = curl_slist_append(header_list_, "Expect:");
      curl_easy_setopt(easy_, CURLOPT_UPLOAD, 1L);
      curl_easy_setopt(easy_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.body_length));
      curl_easy_setopt(easy_, CURLOPT_READFUNCTION, &CurlResponseStream::OnRequestBody);
      curl_easy_setopt(easy_, CURLOPT_READDATA, this);
      if (request.method != "PUT") {
        curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
      }
    } else if (request.method == "HEAD") {
      curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
      curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (header_list_ != nullptr) {
      curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, header_list_);
    }

    if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
      Cleanup();
      throw std::runtime_error("curl_multi_add_handle failed");
    }
    attached_ = true;
  }

  ~CurlResponseStream() override {
    Cleanup();
  }

  CurlResponseStream(const CurlResponseStream&)            = delete;
  CurlResponseStream& operator=(const CurlResponseStream&) = delete;

  // Drives the transfer until the final response head is known.
  void AwaitHead() {
    while (!body_started_ && !done_) {
      Pump();
    }
    if (done_ && result_ != CURLE_OK && !body_started_) {
      ThrowTransferFailure();
    }

    long code = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &code);
    status_code_ = static_cast<int>(code);
    if (status_code_ == 0) {
      throw util::TransientNetworkError("request " + url_ + ": no HTTP response received");
    }
  }

  int status_code() const override {
    return status_code_;
  }

  std::string status_line() const override {
    return status_line_;
  }

  std::string Header(std::string_view name) const override {
    const auto key = Lower(name);
    for (const auto& [k, v] : headers_) {
      if (k == key) {
        return v;
      }
    }
    return {};
  }

  int64_t Read(uint8_t* out, int64_t max) override {
    if (max <= 0) {
      return 0;
    }
    while (buffer_offset_ == buffer_.size()) {
      buffer_.clear();
      buffer_offset_ = 0;
      if (done_) {
        if (result_ != CURLE_OK) {
          ThrowTransferFailure();
        }
        return 0;
      }
      if (paused_) {
        paused_ = false;
        curl_easy_pause(easy_, CURLPAUSE_CONT);
        continue;
      }
      Pump();
    }

    const auto available = buffer_.size() - buffer_offset_;
    const auto n         = std::min<std::size_t>(available, static_cast<std::size_t>(max));
    std::memcpy(out, buffer_.data() + buffer_offset_, n);
    buffer_offset_ += n;
    return static_cast<int64_t>(n);
  }

 private:
  [[noreturn]] void ThrowTransferFailure() const {
    if (!request_body_error_.empty()) {
      throw util::NonRetryableError("request " + url_ + ": " + request_body_error_);
    }
    ThrowCurlError(result_, error_buffer_, url_);
  }

  void Pump() {
    token_.ThrowIfCancelled();

    int  running = 0;
    auto mc      = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
      throw util::TransientNetworkError("request " + url_ + ": " + curl_multi_strerror(mc));
    }

    int      queued = 0;
    CURLMsg* msg    = nullptr;
    while ((msg = curl_multi_info_read(multi_, &queued)) != nullptr) {
      if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
        done_   = true;
        result_ = msg->data.result;
      }
    }

    if (!done_ && running > 0 && buffer_.size() - buffer_offset_ == 0) {
      int ready = 0;
      curl_multi_poll(multi_, nullptr, 0, kPollSliceMs, &ready);
    }
  }

  static size_t OnHeader(char* data, size_t size, size_t nitems, void* userdata) {
    auto*            self  = static_cast<CurlResponseStream*>(userdata);
    const size_t     bytes = size * nitems;
    std::string_view line(data, bytes);

    // A new status line starts a new response (redirect hop or 1xx interim).
    if (line.rfind("HTTP/", 0) == 0) {
      self->headers_.clear();
      auto trimmed  = TrimLine(line);
      auto space    = trimmed.find(' ');
      self->status_line_ = space == std::string::npos ? std::string() : TrimLine(std::string_view(trimmed).substr(space + 1));
      return bytes;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      self->headers_.emplace_back(Lower(TrimLine(line.substr(0, colon))), TrimLine(line.substr(colon + 1)));
    }
    return bytes;
  }

  static size_t OnBody(char* data, size_t size, size_t nmemb, void* userdata) {
    auto*        self  = static_cast<CurlResponseStream*>(userdata);
    const size_t bytes = size * nmemb;
    if (self->buffer_.size() - self->buffer_offset_ >= kBufferHighWater) {
      self->paused_ = true;
      return CURL_WRITEFUNC_PAUSE;
    }
    self->body_started_ = true;
    self->buffer_.insert(self->buffer_.end(), data, data + bytes);
    return bytes;
  }

  static size_t OnRequestBody(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto*   self = static_cast<CurlResponseStream*>(userdata);
    int64_t want = std::min<int64_t>(static_cast<int64_t>(size * nitems), self->body_remaining_);
    if (want <= 0) {
      return 0;
    }
    auto got = self->request_body_->Read(want, buffer);
    if (!got.ok()) {
      self->request_body_error_ = "read request body: " + got.status().ToString();
      return CURL_READFUNC_ABORT;
    }
    self->body_remaining_ -= *got;
    return static_cast<size_t>(*got);
  }

  void Cleanup() {
    if (attached_) {
      curl_multi_remove_handle(multi_, easy_);
      attached_ = false;
    }
    if (easy_ != nullptr) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
    if (multi_ != nullptr) {
      curl_multi_cleanup(multi_);
      multi_ = nullptr;
    }
    if (header_list_ != nullptr) {
      curl_slist_free_all(header_list_);
      header_list_ = nullptr;
    }
  }

  util::CancellationToken                 token_;
  std::string                             url_;
  std::shared_ptr<arrow::io::InputStream> request_body_;
  int64_t                                 body_remaining_ = 0;
  std::string                             request_body_error_;

  CURLM*             multi_       = nullptr;
  CURL*              easy_        = nullptr;
  struct curl_slist* header_list_ = nullptr;
  bool               attached_    = false;
  char               error_buffer_[CURL_ERROR_SIZE];

  int                                              status_code_ = 0;
  std::string                                      status_line_;
  std::vector<std::pair<std::string, std::string>> headers_;

  std::vector<uint8_t> buffer_;
  std::size_t          buffer_offset_ = 0;
  bool                 body_started_  = false;
  bool                 paused_        = false;
  bool                 done_          = false;
  CURLcode             result_        = CURLE_OK;
};

} // namespace

CurlTransport::CurlTransport() : CurlTransport(Options{}) {
}

CurlTransport::CurlTransport(Options options) : options_(options) {
  InitCurlOnce();
}

std::unique_ptr<HttpResponseStream> CurlTransport::Send(const HttpRequest& request, const util::CancellationToken& token) {
  token.ThrowIfCancelled();
  auto stream = std::make_unique<CurlResponseStream>(request, token, options_);
  stream->AwaitHead();
  return stream;
}

} // namespace assetxfer::http
