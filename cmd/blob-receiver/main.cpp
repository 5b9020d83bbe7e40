#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/receiver/upload_handler.hpp"
#include "internal/runtime/server.hpp"
#include "internal/runtime/shutdown_coordinator.hpp"
#include "internal/storage/blob_store.hpp"

using blobstream::runtime::Server;
using blobstream::runtime::ShutdownCoordinator;
using blobstream::runtime::config::ReceiverConfig;

static void Usage() {
  std::cout << "Usage: blob-receiver [options]\n"
            << "  --config <file.yaml>              load settings from YAML (flags override it)\n"
            << "  -a, --address <ip>                IP address to listen on, use 0.0.0.0 for all (default 127.0.0.1)\n"
            << "  -p, --port <port>                 port to listen on (default 8000)\n"
            << "  -d, --uploads_dir <dir>           directory to store uploaded binary files (default /tmp)\n"
            << "  -f, --logfile <file>              optional file to log to\n"
            << "  --disable-stdout-logging          disable logging to stdout\n"
            << "  --disable-checksum-verification   keep files even when checksums do not match\n"
            << "  --io-threads <n>                  event loop threads (default 1)\n"
            << "  -h, --help                        show this help\n";
}

static std::optional<unsigned long> ParseUnsigned(const std::string& value) {
  if (value.empty() || value.front() == '-') return std::nullopt;
  char* end    = nullptr;
  auto  parsed = std::strtoul(value.c_str(), &end, 10);
  if (!end || *end != '\0') return std::nullopt;
  return parsed;
}

static bool ParseArgs(int argc, char** argv, ReceiverConfig& config, bool& help) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (i + 1 >= argc) return false;
      config_path = argv[i + 1];
    }
  }

  config = config_path.empty() ? blobstream::config::DefaultReceiverConfig()
                               : blobstream::config::ConfigLoader::LoadReceiverFromYaml(config_path);

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      help = true;
      return true;
    } else if (arg == "--config") {
      ++i;
    } else if (arg == "-a" || arg == "--address") {
      auto v = next();
      if (!v) return false;
      config.mutable_listen()->set_address(*v);
    } else if (arg == "-p" || arg == "--port") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.mutable_listen()->set_port(static_cast<uint32_t>(*n));
    } else if (arg == "-d" || arg == "--uploads_dir") {
      auto v = next();
      if (!v) return false;
      config.set_uploads_dir(*v);
    } else if (arg == "-f" || arg == "--logfile") {
      auto v = next();
      if (!v) return false;
      config.mutable_logging()->set_file(*v);
    } else if (arg == "--disable-stdout-logging") {
      config.mutable_logging()->set_disable_stdout(true);
    } else if (arg == "--disable-checksum-verification") {
      config.set_verify_checksums(false);
    } else if (arg == "--io-threads") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.set_io_threads(static_cast<uint32_t>(*n));
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  ReceiverConfig config;
  bool           help = false;

  try {
    if (!ParseArgs(argc, argv, config, help)) {
      Usage();
      return 1;
    }
    if (help) {
      Usage();
      return 0;
    }
    blobstream::config::ValidateReceiverConfig(config);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  try {
    blobstream::observability::InitializeLogging(config.logging(), "SERVER");

    auto store   = std::make_shared<const blobstream::storage::BlobStore>(config.uploads_dir(), "server");
    auto handler = std::make_shared<blobstream::receiver::UploadHandler>(store, config.listen().path(), config.verify_checksums());

    blobstream::runtime::ServerOptions options;
    options.io_threads     = config.io_threads();
    options.max_body_bytes = config.max_body_bytes();
    options.idle_timeout   = std::chrono::milliseconds(config.idle_timeout_ms());

    Server server(config.listen().address(), static_cast<uint16_t>(config.listen().port()),
                  [handler](const blobstream::runtime::HttpRequest& request) { return handler->Handle(request); }, options);

    // Register signal handlers before starting server to avoid race window.
    ShutdownCoordinator shutdown([&server](int) { server.Stop(); });
    shutdown.Start();

    server.Start();
    BLOBSTREAM_LOG_INFO("Receiver started", {blobstream::observability::StringField("uploads_dir", config.uploads_dir()),
                                             blobstream::observability::BoolField("verify_checksums", config.verify_checksums())});

    server.Wait();

    BLOBSTREAM_LOG_INFO("Receiver stopped");
    shutdown.Stop();
    blobstream::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BLOBSTREAM_LOG_ERROR("Fatal error", {blobstream::observability::StringField("error", e.what())});
    blobstream::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
