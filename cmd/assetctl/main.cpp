#include <google/protobuf/util/json_util.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "assetxfer/v1.hpp"
#include "internal/cli/exit_code.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transfer/delivery_state.hpp"
#include "internal/transfer/downloader.hpp"
#include "internal/upload/asset_files.hpp"

using assetxfer::cli::ToExitCode;
using assetxfer::observability::BoolField;
using assetxfer::observability::IntField;
using assetxfer::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  assetctl [--config <file.yaml>] download <url> <output-path> [--overwrite]\n"
            << "  assetctl [--config <file.yaml>] download-batch <manifest.yaml> [--overwrite]\n"
            << "  assetctl [--config <file.yaml>] upload <file-or-directory>\n";
}

struct Arguments {
  std::string              config_path;
  std::string              command;
  std::vector<std::string> positional;
  bool                     overwrite = false;
};

static bool ParseArguments(int argc, char** argv, Arguments* args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) return false;
      args->config_path = argv[++i];
    } else if (arg == "--overwrite") {
      args->overwrite = true;
    } else if (args->command.empty()) {
      args->command = arg;
    } else {
      args->positional.push_back(arg);
    }
  }
  return !args->command.empty();
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render result: " + std::string(status.message()));
  }
  std::cout << json;
}

/*
  Turns SIGINT/SIGTERM into token cancellation. The handler only flips a
  flag; Cancel() runs on this thread.
*/
class SignalWatcher {
 public:
  explicit SignalWatcher(assetxfer::util::CancellationToken token) : token_(std::move(token)) {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    thread_ = std::thread([this] {
      while (!stop_.load()) {
        if (!g_running) {
          ASSETXFER_LOG_WARN("Interrupted, cancelling transfer");
          token_.Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }

  ~SignalWatcher() {
    stop_.store(true);
    thread_.join();
  }

  SignalWatcher(const SignalWatcher&)            = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

 private:
  assetxfer::util::CancellationToken token_;
  std::atomic<bool>                  stop_{false};
  std::thread                        thread_;
};

static int RunDownload(const assetxfer::factory::Application& app, const Arguments& args, const assetxfer::util::CancellationToken& token) {
  if (args.positional.size() != 2) {
    Usage();
    return assetxfer::cli::kExitUsage;
  }

  auto result = app.downloader->Download(args.positional[0], args.positional[1], args.overwrite, token);
  ASSETXFER_LOG_INFO("Downloaded", {StringField("output_path", result.output_path()),
                                    IntField("bytes", result.bytes_written()),
                                    IntField("attempts", result.attempts()),
                                    BoolField("overwrite", args.overwrite)});
  PrintJson(result);
  return assetxfer::cli::kExitOk;
}

static int RunDownloadBatch(const assetxfer::factory::Application& app,
                            const Arguments& args,
                            const assetxfer::util::CancellationToken& token) {
  if (args.positional.size() != 1) {
    Usage();
    return assetxfer::cli::kExitUsage;
  }

  assetxfer::v1::DownloadManifest manifest;
  assetxfer::config::ConfigLoader::LoadMessageFromYaml(args.positional[0], &manifest);

  auto result = app.batch_downloader->DownloadAll(manifest, args.overwrite, token);
  for (const auto& failure : result.failures()) {
    ASSETXFER_LOG_ERROR("Download failed", {StringField("id", failure.id()),
                                            StringField("output_path", failure.output_path()),
                                            StringField("error", failure.error())});
  }
  ASSETXFER_LOG_INFO("Batch finished", {IntField("total", result.total()),
                                        IntField("downloaded", result.downloaded()),
                                        IntField("failed", result.failed())});
  PrintJson(result);
  return result.failed() == 0 ? assetxfer::cli::kExitOk : assetxfer::cli::kExitFailure;
}

static int RunUpload(const assetxfer::factory::Application& app, const Arguments& args, const assetxfer::util::CancellationToken& token) {
  if (args.positional.size() != 1) {
    Usage();
    return assetxfer::cli::kExitUsage;
  }
  if (!app.upload_pipeline) {
    ASSETXFER_LOG_ERROR("upload requires remote.base_url in the configuration");
    return assetxfer::cli::kExitUsage;
  }

  const auto files = assetxfer::upload::CollectAssetFiles(args.positional[0]);
  ASSETXFER_LOG_INFO("Uploading", {IntField("files", static_cast<int64_t>(files.size()))});

  auto result = app.upload_pipeline->UploadAll(files, token);
  PrintJson(result);
  return assetxfer::cli::kExitOk;
}

int main(int argc, char** argv) {
  Arguments args;
  if (!ParseArguments(argc, argv, &args)) {
    Usage();
    return assetxfer::cli::kExitUsage;
  }

  // Defaults until the config is read, so early errors also go to stderr.
  assetxfer::v1::RuntimeConfig config;
  assetxfer::observability::InitializeLogging(config);

  int exit_code = assetxfer::cli::kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!args.config_path.empty()) {
      config = assetxfer::config::ConfigLoader::LoadFromYaml(args.config_path);
      assetxfer::observability::InitializeLogging(config);
    }

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = assetxfer::factory::Build(config);

    assetxfer::util::CancellationToken token;
    SignalWatcher                      watcher(token);

    if (args.command == "download") {
      exit_code = RunDownload(app, args, token);
    } else if (args.command == "download-batch") {
      exit_code = RunDownloadBatch(app, args, token);
    } else if (args.command == "upload") {
      exit_code = RunUpload(app, args, token);
    } else {
      std::cerr << "unknown command: " << args.command << "\n";
      Usage();
      exit_code = assetxfer::cli::kExitUsage;
    }
  } catch (const assetxfer::transfer::DownloadError& e) {
    ASSETXFER_LOG_ERROR("Download failed", {StringField("error", e.what()),
                                            StringField("kind", assetxfer::util::ToString(e.kind())),
                                            IntField("attempts", e.attempts()),
                                            StringField("content_type", e.content_type())});
    exit_code = ToExitCode(e);
  } catch (const assetxfer::transfer::DeliveryError& e) {
    ASSETXFER_LOG_ERROR("Upload failed", {StringField("error", e.what()),
                                          StringField("kind", assetxfer::util::ToString(e.kind())),
                                          StringField("last_state", e.last_state()),
                                          IntField("status_code", e.status_code())});
    exit_code = ToExitCode(e);
  } catch (const std::exception& e) {
    ASSETXFER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    exit_code = ToExitCode(e);
  }

  assetxfer::observability::ShutdownLogging();
  return exit_code;
}
