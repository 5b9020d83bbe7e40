#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using blobstream::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "blobstream_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void TestSenderDefaults() {
  auto config = blobstream::config::DefaultSenderConfig();

  assert(config.target().address() == "127.0.0.1");
  assert(config.target().port() == 8000);
  assert(config.target().path() == "/uploads");
  assert(config.binfile_dir() == "/tmp");
  assert(config.num_workers() == 10);
  assert(config.source().num_blobs() == 100);
  assert(config.source().min_blob_bytes() == 1024);
  assert(config.source().max_blob_bytes() == 1048576);
  assert(config.source().min_delay_ms() == 1);
  assert(config.source().max_delay_ms() == 1000);
  assert(!config.corruption().enabled());
  assert(!config.logging().disable_stdout());
  assert(blobstream::config::ResolveCorruptionRate(config) == blobstream::config::kDefaultCorruptionRate);

  blobstream::config::ValidateSenderConfig(config);
}

void TestReceiverDefaults() {
  auto config = blobstream::config::DefaultReceiverConfig();

  assert(config.listen().port() == 8000);
  assert(config.uploads_dir() == "/tmp");
  assert(config.verify_checksums());
  assert(config.io_threads() == 1);

  blobstream::config::ValidateReceiverConfig(config);
}

void TestSenderYamlOverridesOnlyNamedSettings() {
  const auto yaml_path = WriteYaml("sender_partial",
                                   R"(target:
  port: 9000
binfile_dir: "/var/tmp/blobs"
source:
  num_blobs: 0
corruption:
  enabled: true
  rate: 0.5
)");

  auto config = ConfigLoader::LoadSenderFromYaml(yaml_path.string());
  assert(config.target().port() == 9000);
  assert(config.target().address() == "127.0.0.1");
  assert(config.binfile_dir() == "/var/tmp/blobs");
  assert(config.source().has_num_blobs() && config.source().num_blobs() == 0);
  assert(config.source().max_blob_bytes() == 1048576);
  assert(config.num_workers() == 10);
  assert(config.corruption().enabled());
  assert(blobstream::config::ResolveCorruptionRate(config) == 0.5);
}

void TestReceiverYamlCanDisableVerification() {
  const auto yaml_path = WriteYaml("receiver_no_verify",
                                   R"(listen:
  address: "0.0.0.0"
verify_checksums: false
logging:
  file: "/tmp/blobstream-receiver.log"
  disable_stdout: true
)");

  auto config = ConfigLoader::LoadReceiverFromYaml(yaml_path.string());
  assert(config.listen().address() == "0.0.0.0");
  assert(config.listen().port() == 8000);
  assert(!config.verify_checksums());
  assert(config.logging().disable_stdout());
  blobstream::config::ValidateReceiverConfig(config);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(target:
  port: 9000
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadSenderFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  assert(Throws([] { (void)ConfigLoader::LoadReceiverFromYaml("/nonexistent/blobstream.yaml"); }));
}

void TestValidationRejectsInconsistentSettings() {
  {
    auto config = blobstream::config::DefaultSenderConfig();
    config.set_num_workers(0);
    assert(Throws([&] { blobstream::config::ValidateSenderConfig(config); }));
  }
  {
    auto config = blobstream::config::DefaultSenderConfig();
    config.mutable_source()->set_min_blob_bytes(4096);
    config.mutable_source()->set_max_blob_bytes(1024);
    assert(Throws([&] { blobstream::config::ValidateSenderConfig(config); }));
  }
  {
    auto config = blobstream::config::DefaultSenderConfig();
    config.mutable_source()->set_min_delay_ms(10);
    config.mutable_source()->set_max_delay_ms(1);
    assert(Throws([&] { blobstream::config::ValidateSenderConfig(config); }));
  }
  {
    auto config = blobstream::config::DefaultSenderConfig();
    config.mutable_corruption()->set_enabled(true);
    config.mutable_corruption()->set_rate(1.5);
    assert(Throws([&] { blobstream::config::ValidateSenderConfig(config); }));
  }
  {
    auto config = blobstream::config::DefaultSenderConfig();
    config.mutable_logging()->set_disable_stdout(true);
    assert(Throws([&] { blobstream::config::ValidateSenderConfig(config); }));
    config.mutable_logging()->set_file("/tmp/sender.log");
    blobstream::config::ValidateSenderConfig(config);
  }
  {
    auto config = blobstream::config::DefaultReceiverConfig();
    config.set_io_threads(0);
    assert(Throws([&] { blobstream::config::ValidateReceiverConfig(config); }));
  }
}

} // namespace

int main() {
  TestSenderDefaults();
  TestReceiverDefaults();
  TestSenderYamlOverridesOnlyNamedSettings();
  TestReceiverYamlCanDisableVerification();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestValidationRejectsInconsistentSettings();

  std::cout << "blobstream_unit_config_loader: pass\n";
  return 0;
}
