#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/runtime/shutdown_coordinator.hpp"
#include "internal/sender/sender_pipeline.hpp"

using blobstream::runtime::CancellationToken;
using blobstream::runtime::ShutdownCoordinator;
using blobstream::runtime::config::SenderConfig;

static void Usage() {
  std::cout << "Usage: blob-sender [options]\n"
            << "  --config <file.yaml>         load settings from YAML (flags override it)\n"
            << "  -a, --address <ip>           IP address to send to (default 127.0.0.1)\n"
            << "  -p, --port <port>            port to send to (default 8000)\n"
            << "  -n, --num_files <n>          number of random binary files to generate, 0 = until interrupted (default 100)\n"
            << "  -w, --num_workers <n>        number of concurrent send workers (default 10)\n"
            << "  -d, --binfile_dir <dir>      directory to store generated binary files (default /tmp)\n"
            << "  -f, --logfile <file>         optional file to log to\n"
            << "  --disable-stdout-logging     disable logging to stdout\n"
            << "  --inject-bad-checksums       purposefully corrupt blobs after hashing (10% by default)\n"
            << "  --corruption-rate <r>        corruption probability in [0, 1], implies --inject-bad-checksums\n"
            << "  --queue-capacity <n>         bound the work queue, 0 = unbounded (default 0)\n"
            << "  -h, --help                   show this help\n";
}

static std::optional<unsigned long long> ParseUnsigned(const std::string& value) {
  if (value.empty() || value.front() == '-') return std::nullopt;
  char* end    = nullptr;
  auto  parsed = std::strtoull(value.c_str(), &end, 10);
  if (!end || *end != '\0') return std::nullopt;
  return parsed;
}

static std::optional<double> ParseDouble(const std::string& value) {
  char* end    = nullptr;
  auto  parsed = std::strtod(value.c_str(), &end);
  if (value.empty() || !end || *end != '\0') return std::nullopt;
  return parsed;
}

// Returns false on a bad command line; `config` then holds partial results.
static bool ParseArgs(int argc, char** argv, SenderConfig& config, bool& help) {
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      if (i + 1 >= argc) return false;
      config_path = argv[i + 1];
    }
  }

  config = config_path.empty() ? blobstream::config::DefaultSenderConfig()
                               : blobstream::config::ConfigLoader::LoadSenderFromYaml(config_path);

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
      config.mutable_target()->set_address(*v);
    } else if (arg == "-p" || arg == "--port") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.mutable_target()->set_port(static_cast<uint32_t>(*n));
    } else if (arg == "-n" || arg == "--num_files") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.mutable_source()->set_num_blobs(*n);
    } else if (arg == "-w" || arg == "--num_workers") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.set_num_workers(static_cast<uint32_t>(*n));
    } else if (arg == "-d" || arg == "--binfile_dir") {
      auto v = next();
      if (!v) return false;
      config.set_binfile_dir(*v);
    } else if (arg == "-f" || arg == "--logfile") {
      auto v = next();
      if (!v) return false;
      config.mutable_logging()->set_file(*v);
    } else if (arg == "--disable-stdout-logging") {
      config.mutable_logging()->set_disable_stdout(true);
    } else if (arg == "--inject-bad-checksums") {
      config.mutable_corruption()->set_enabled(true);
    } else if (arg == "--corruption-rate") {
      auto v = next();
      auto r = v ? ParseDouble(*v) : std::nullopt;
      if (!r) return false;
      config.mutable_corruption()->set_enabled(true);
      config.mutable_corruption()->set_rate(*r);
    } else if (arg == "--queue-capacity") {
      auto v = next();
      auto n = v ? ParseUnsigned(*v) : std::nullopt;
      if (!n) return false;
      config.set_queue_capacity(*n);
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

int main(int argc, char** argv) {
  SenderConfig config;
  bool         help = false;

  try {
    if (!ParseArgs(argc, argv, config, help)) {
      Usage();
      return 1;
    }
    if (help) {
      Usage();
      return 0;
    }
    blobstream::config::ValidateSenderConfig(config);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  try {
    blobstream::observability::InitializeLogging(config.logging(), "SENDER");

    CancellationToken   token;
    ShutdownCoordinator shutdown([&token](int) { token.Cancel(); });
    shutdown.Start();

    blobstream::sender::SenderPipeline pipeline(config);
    pipeline.Run(token);

    shutdown.Stop();
    blobstream::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BLOBSTREAM_LOG_ERROR("Fatal error", {blobstream::observability::StringField("error", e.what())});
    blobstream::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
