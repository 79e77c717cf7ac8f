#include "internal/transfer/downloader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using assetxfer::storage::AtomicFileWriter;
using assetxfer::testing::FakeResponse;
using assetxfer::testing::ReadFile;
using assetxfer::testing::ScriptedTransport;
using assetxfer::testing::TempDir;
using assetxfer::testing::Throws;
using assetxfer::testing::WriteFile;
using assetxfer::transfer::DownloadError;
using assetxfer::transfer::Downloader;
using assetxfer::util::CancellationToken;
using assetxfer::util::ElapsedMillis;
using assetxfer::util::ErrorKind;
using assetxfer::util::Millis;
using assetxfer::util::Now;
namespace util = assetxfer::util;

Downloader::Options FastOptions(int max_attempts = 4) {
  Downloader::Options options;
  options.policy.max_attempts  = max_attempts;
  options.policy.initial_delay = Millis(1);
  options.policy.max_delay     = Millis(4);
  return options;
}

DownloadError ExpectDownloadError(const Downloader& downloader, const std::string& url, const fs::path& dest, const CancellationToken& token = {}) {
  try {
    downloader.Download(url, dest.string(), false, token);
  } catch (const DownloadError& e) {
    return e;
  }
  assert(false && "expected DownloadError");
  throw std::logic_error("unreachable");
}

void TestRetriesThrottlingThenSucceeds() {
  TempDir dir("download_throttled");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(429, "slow down");
  transport->Respond(429, "slow down");
  transport->Respond(200, "DATA", {{"Content-Type", " application/octet-stream "}});

  Downloader::Options options;
  options.policy.initial_delay = Millis(200);
  options.policy.max_delay     = Millis(2000);
  Downloader downloader(transport, AtomicFileWriter(), options);

  const auto dest   = dir.path() / "asset.bin";
  const auto start  = Now();
  const auto result = downloader.Download("https://cdn.example.com/a.bin", dest.string(), false, CancellationToken());
  const auto took   = ElapsedMillis(start);

  assert(result.bytes_written() == 4);
  assert(result.attempts() == 3);
  assert(result.content_type() == "application/octet-stream");
  assert(result.output_path() == dest.string());
  assert(ReadFile(dest) == "DATA");
  assert(transport->calls() == 3);

  // 200ms then 400ms of backoff.
  assert(took >= 600);
  assert(took < 5000);
}

void TestNotFoundFailsAfterOneAttempt() {
  TempDir dir("download_404");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(404, "  no such\n\n   asset  ", {{"Content-Type", "text/plain"}});

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto dest  = dir.path() / "asset.bin";
  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/missing", dest);

  assert(error.kind() == ErrorKind::kHttpStatus);
  assert(error.status_code() == 404);
  assert(error.attempts() == 1);
  assert(error.content_type() == "text/plain");
  assert(std::string(error.what()) == "unexpected status 404 (no such asset)");
  assert(transport->calls() == 1);
  assert(!fs::exists(dest));
}

void TestEmptyErrorBodyFallsBackToStatusLine() {
  TempDir      dir("download_status_line");
  auto         transport = std::make_shared<ScriptedTransport>();
  FakeResponse response;
  response.status_code = 400;
  response.status_line = "400 Bad Request";
  transport->Respond(response);

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dir.path() / "x");
  assert(std::string(error.what()) == "unexpected status 400 (400 Bad Request)");
}

void TestErrorBodyPrefixIsBounded() {
  TempDir dir("download_long_body");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(500, std::string(10000, 'e'));

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dir.path() / "x");
  assert(error.status_code() == 500);
  assert(std::string(error.what()) == "unexpected status 500 (" + std::string(4096, 'e') + ")");
}

void TestExhaustsAttemptsWithClampedDelays() {
  TempDir dir("download_exhausted");
  auto    transport = std::make_shared<ScriptedTransport>();
  for (int i = 0; i < 6; ++i) {
    transport->Respond(503, "unavailable");
  }

  std::vector<std::pair<int, Millis>> retries;
  auto                                options = FastOptions(6);
  options.on_retry = [&](int attempt, Millis delay, const std::exception& error) {
    assert(std::string(error.what()).find("503") != std::string::npos);
    retries.emplace_back(attempt, delay);
  };
  Downloader downloader(transport, AtomicFileWriter(), options);

  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dir.path() / "x");
  assert(error.kind() == ErrorKind::kHttpStatus);
  assert(error.status_code() == 503);
  assert(error.attempts() == 6);
  assert(transport->calls() == 6);

  const std::vector<std::pair<int, Millis>> expected = {
      {1, Millis(1)}, {2, Millis(2)}, {3, Millis(4)}, {4, Millis(4)}, {5, Millis(4)}};
  assert(retries == expected);
}

void TestTransientNetworkErrorIsRetried() {
  TempDir dir("download_transient");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Fail(util::TransientNetworkError("connection reset by peer"));
  transport->Respond(200, "payload");

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto dest   = dir.path() / "asset.bin";
  const auto result = downloader.Download("https://cdn.example.com/x", dest.string(), false, CancellationToken());
  assert(result.attempts() == 2);
  assert(ReadFile(dest) == "payload");
}

void TestBrokenBodyRetriesWithoutLeavingPartialFile() {
  TempDir      dir("download_broken_body");
  auto         transport = std::make_shared<ScriptedTransport>();
  FakeResponse broken;
  broken.status_code      = 200;
  broken.body             = "PARTIAL-AND-MORE";
  broken.fail_after_bytes = 7;
  transport->Respond(broken);
  transport->Respond(200, "COMPLETE");

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto dest = dir.path() / "asset.bin";

  // No-overwrite mode: the first attempt must not leave a file that blocks the retry.
  const auto result = downloader.Download("https://cdn.example.com/x", dest.string(), false, CancellationToken());
  assert(result.attempts() == 2);
  assert(ReadFile(dest) == "COMPLETE");
  assert(assetxfer::testing::CountEntries(dir.path()) == 1);
}

void TestNonRetryableTransportErrorStopsImmediately() {
  TempDir dir("download_non_retryable");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Fail(util::NonRetryableError("URL using bad/illegal format"));

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto error = ExpectDownloadError(downloader, "ht!tp://bad", dir.path() / "x");
  assert(error.kind() == ErrorKind::kNonRetryable);
  assert(error.attempts() == 1);
  assert(transport->calls() == 1);
}

void TestExistingDestinationIsNotRetried() {
  TempDir dir("download_exists");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, "new");
  const auto dest = dir.path() / "asset.bin";
  WriteFile(dest, "old");

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dest);
  assert(error.kind() == ErrorKind::kFilesystemSafety);
  assert(error.attempts() == 1);
  assert(ReadFile(dest) == "old");
}

void TestOverwriteReplacesExistingDestination() {
  TempDir dir("download_overwrite");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, "new");
  const auto dest = dir.path() / "asset.bin";
  WriteFile(dest, "old");

  Downloader downloader(transport, AtomicFileWriter(), FastOptions());
  const auto result = downloader.Download("https://cdn.example.com/x", dest.string(), true, CancellationToken());
  assert(result.bytes_written() == 3);
  assert(ReadFile(dest) == "new");
}

void TestCancellationDuringBackoffWins() {
  TempDir dir("download_cancel_backoff");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(503, "unavailable");
  transport->Respond(503, "unavailable");

  Downloader::Options options;
  options.policy.initial_delay = Millis(10000);
  options.policy.max_delay     = Millis(10000);
  Downloader downloader(transport, AtomicFileWriter(), options);

  CancellationToken token;
  std::thread       canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.Cancel();
  });

  const auto start = Now();
  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dir.path() / "x", token);
  canceller.join();

  assert(error.kind() == ErrorKind::kCancelled);
  assert(error.attempts() == 1);
  assert(transport->calls() == 1);
  assert(ElapsedMillis(start) < 5000);
}

void TestCancelledTokenMakesNoRetry() {
  TempDir dir("download_cancelled");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, "unused");

  Downloader        downloader(transport, AtomicFileWriter(), FastOptions());
  CancellationToken token;
  token.Cancel();

  const auto error = ExpectDownloadError(downloader, "https://cdn.example.com/x", dir.path() / "x", token);
  assert(error.kind() == ErrorKind::kCancelled);
  assert(error.attempts() == 1);
}

void TestRequestCarriesIdentifyingHeaders() {
  TempDir dir("download_headers");
  auto    transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, "x");

  auto options       = FastOptions();
  options.user_agent = "asset-transfer-test/1.0";
  Downloader downloader(transport, AtomicFileWriter(), options);
  downloader.Download("  https://cdn.example.com/x  ", (dir.path() / "x").string(), false, CancellationToken());

  const auto requests = transport->requests();
  assert(requests.size() == 1);
  assert(requests[0].method == "GET");
  assert(requests[0].url == "https://cdn.example.com/x");
  assert(requests[0].Header("Accept") == "*/*");
  assert(requests[0].Header("User-Agent") == "asset-transfer-test/1.0");
}

void TestBlankInputsAreRejected() {
  auto       transport = std::make_shared<ScriptedTransport>();
  Downloader downloader(transport, AtomicFileWriter(), FastOptions());

  assert(Throws<std::invalid_argument>([&] { downloader.Download("   ", "/tmp/x", false, CancellationToken()); }));
  assert(Throws<std::invalid_argument>([&] { downloader.Download("https://x", " ", false, CancellationToken()); }));
  assert(transport->calls() == 0);
}

} // namespace

int main() {
  TestRetriesThrottlingThenSucceeds();
  TestNotFoundFailsAfterOneAttempt();
  TestEmptyErrorBodyFallsBackToStatusLine();
  TestErrorBodyPrefixIsBounded();
  TestExhaustsAttemptsWithClampedDelays();
  TestTransientNetworkErrorIsRetried();
  TestBrokenBodyRetriesWithoutLeavingPartialFile();
  TestNonRetryableTransportErrorStopsImmediately();
  TestExistingDestinationIsNotRetried();
  TestOverwriteReplacesExistingDestination();
  TestCancellationDuringBackoffWins();
  TestCancelledTokenMakesNoRetry();
  TestRequestCarriesIdentifyingHeaders();
  TestBlankInputsAreRejected();

  std::cout << "assetxfer_unit_downloader: pass\n";
  return 0;
}
