#include "internal/http/curl_transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using assetxfer::http::CurlTransport;
using assetxfer::http::HttpRequest;
using assetxfer::storage::common::Unwrap;
using assetxfer::testing::Throws;
using assetxfer::util::CancellationError;
using assetxfer::util::CancellationToken;
using assetxfer::util::ElapsedMillis;
using assetxfer::util::Millis;
using assetxfer::util::Now;
namespace http = assetxfer::http;
namespace util = assetxfer::util;

void SendAll(int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return; // client went away
    }
    sent += static_cast<std::size_t>(n);
  }
}

std::string Response(const std::string& status, const std::string& body, const std::string& extra_headers = "") {
  return "HTTP/1.1 " + status + "\r\nContent-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n" +
         extra_headers + "\r\n" + body;
}

// Blocks until the client closes its end.
void WaitForClientClose(int fd) {
  char buf[256];
  while (::recv(fd, buf, sizeof(buf), 0) > 0) {
  }
}

/*
  HTTP/1.1 listener on 127.0.0.1 with an ephemeral port. Connections are
  served one at a time on a background thread; `handler` receives the socket
  and the request path and owns the reply.
*/
class LoopbackServer {
 public:
  using Handler = std::function<void(int fd, const std::string& path)>;

  explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
      throw std::runtime_error("socket failed");
    }
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port        = 0;
    socklen_t len        = sizeof(addr);
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, 8) != 0 ||
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(listen_fd_);
      throw std::runtime_error("cannot listen on loopback");
    }
    port_   = ntohs(addr.sin_port);
    thread_ = std::thread([this] { Serve(); });
  }

  ~LoopbackServer() {
    stopping_ = true;
    ::shutdown(listen_fd_, SHUT_RDWR);
    thread_.join();
    ::close(listen_fd_);
  }

  LoopbackServer(const LoopbackServer&)            = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  std::string Url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

 private:
  void Serve() {
    while (!stopping_) {
      const int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        return;
      }
      const auto path = ReadRequestPath(fd);
      if (!path.empty()) {
        handler_(fd, path);
      }
      ::close(fd);
    }
  }

  static std::string ReadRequestPath(int fd) {
    std::string head;
    char        buf[1024];
    while (head.find("\r\n\r\n") == std::string::npos) {
      const auto n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return {};
      }
      head.append(buf, static_cast<std::size_t>(n));
    }
    // "GET /path HTTP/1.1"
    const auto first = head.find(' ');
    const auto last  = head.find(' ', first + 1);
    return head.substr(first + 1, last - first - 1);
  }

  Handler           handler_;
  int               listen_fd_ = -1;
  uint16_t          port_      = 0;
  std::atomic<bool> stopping_{false};
  std::thread       thread_;
};

// A port nothing listens on: bound once, then released.
uint16_t ClosedPort() {
  const int   fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  sockaddr_in addr{};
  addr.sin_family      = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len        = sizeof(addr);
  const bool bound = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                     ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
  ::close(fd);
  if (!bound) {
    throw std::runtime_error("cannot bind loopback port");
  }
  return ntohs(addr.sin_port);
}

HttpRequest Get(const std::string& url) {
  HttpRequest request;
  request.url = url;
  return request;
}

std::string PatternBody(std::size_t size) {
  std::string body(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    body[i] = static_cast<char>((i * 131 + i / 7) % 256);
  }
  return body;
}

void TestLargeBodyArrivesIntact() {
  const auto     body = PatternBody(3 * 1024 * 1024 + 5);
  LoopbackServer server([&](int fd, const std::string&) { SendAll(fd, Response("200 OK", body)); });

  CurlTransport transport;
  auto          response = transport.Send(Get(server.Url("/asset.bin")), CancellationToken());
  assert(response->status_code() == 200);
  assert(response->Header("content-length") == std::to_string(body.size()));

  // Let the socket fill well past the reader's buffer limit before draining.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  auto       out    = Unwrap(arrow::io::BufferOutputStream::Create());
  const auto copied = http::CopyBody(*response, *out);
  auto       buffer = Unwrap(out->Finish());
  assert(copied == static_cast<int64_t>(body.size()));
  assert(buffer->ToString() == body);
}

void TestFailureMessageFromBodyAndStatusLine() {
  LoopbackServer server([](int fd, const std::string& path) {
    if (path == "/missing") {
      SendAll(fd, Response("404 Not Found", "no such   asset\n"));
    } else {
      SendAll(fd, Response("503 Service Unavailable", ""));
    }
  });

  CurlTransport transport;
  auto          missing = transport.Send(Get(server.Url("/missing")), CancellationToken());
  assert(missing->status_code() == 404);
  assert(http::FailureMessage(*missing, 4096) == "no such asset");

  auto unavailable = transport.Send(Get(server.Url("/busy")), CancellationToken());
  assert(unavailable->status_code() == 503);
  assert(unavailable->status_line() == "503 Service Unavailable");
  assert(http::FailureMessage(*unavailable, 4096) == "503 Service Unavailable");
}

void TestRedirectIsFollowed() {
  LoopbackServer server([](int fd, const std::string& path) {
    if (path == "/old") {
      SendAll(fd, Response("302 Found", "", "Location: /data\r\nX-Hop: first\r\n"));
    } else if (path == "/data") {
      SendAll(fd, Response("200 OK", "DATA", "Content-Type: text/plain\r\n"));
    } else {
      SendAll(fd, Response("404 Not Found", ""));
    }
  });

  CurlTransport transport;
  auto          response = transport.Send(Get(server.Url("/old")), CancellationToken());
  assert(response->status_code() == 200);
  assert(response->status_line() == "200 OK");
  assert(response->Header("CONTENT-TYPE") == "text/plain");
  // Headers of the redirect hop are not visible on the final response.
  assert(response->Header("location").empty());
  assert(response->Header("x-hop").empty());
  assert(http::ReadAll(*response) == "DATA");
}

void TestRefusedConnectionIsTransient() {
  CurlTransport transport;
  const auto    url = "http://127.0.0.1:" + std::to_string(ClosedPort()) + "/asset.bin";
  assert(Throws<util::TransientNetworkError>([&] { transport.Send(Get(url), CancellationToken()); }));
}

void TestMalformedUrlIsNotRetryable() {
  CurlTransport transport;
  assert(Throws<util::NonRetryableError>([&] { transport.Send(Get("ht!tp://bad"), CancellationToken()); }));
}

void TestCancelStopsStalledRequest() {
  LoopbackServer server([](int fd, const std::string&) { WaitForClientClose(fd); });

  CancellationToken token;
  std::thread       canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token.Cancel();
  });

  CurlTransport transport;
  const auto    start = Now();
  bool          threw = false;
  try {
    transport.Send(Get(server.Url("/stall")), token);
  } catch (const CancellationError& e) {
    threw = true;
    assert(!e.deadline_exceeded());
  }
  canceller.join();

  assert(threw);
  assert(ElapsedMillis(start) < 2000);
}

void TestDeadlineStopsStalledRequest() {
  LoopbackServer server([](int fd, const std::string&) { WaitForClientClose(fd); });

  CancellationToken root;
  const auto        token = root.WithTimeout(Millis(300));

  CurlTransport transport;
  const auto    start = Now();
  bool          threw = false;
  try {
    transport.Send(Get(server.Url("/stall")), token);
  } catch (const CancellationError& e) {
    threw = true;
    assert(e.deadline_exceeded());
  }

  assert(threw);
  assert(ElapsedMillis(start) >= 300);
  assert(ElapsedMillis(start) < 2300);
  assert(!root.IsCancelled());
}

void TestAlreadyCancelledTokenSendsNothing() {
  std::atomic<int> connections{0};
  LoopbackServer   server([&](int fd, const std::string&) {
    ++connections;
    SendAll(fd, Response("200 OK", "x"));
  });

  CancellationToken token;
  token.Cancel();
  CurlTransport transport;
  assert(Throws<CancellationError>([&] { transport.Send(Get(server.Url("/x")), token); }));
  assert(connections == 0);
}

} // namespace

int main() {
  TestLargeBodyArrivesIntact();
  TestFailureMessageFromBodyAndStatusLine();
  TestRedirectIsFollowed();
  TestRefusedConnectionIsTransient();
  TestMalformedUrlIsNotRetryable();
  TestCancelStopsStalledRequest();
  TestDeadlineStopsStalledRequest();
  TestAlreadyCancelledTokenSendsNothing();

  std::cout << "assetxfer_unit_curl_transport: pass\n";
  return 0;
}
