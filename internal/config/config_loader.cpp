#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace blobstream::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("8000" is not a number).
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

template <typename Message>
static Message ParseYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  Message config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

SenderConfig DefaultSenderConfig() {
  SenderConfig config;

  auto* target = config.mutable_target();
  target->set_address("127.0.0.1");
  target->set_port(8000);
  target->set_path("/uploads");

  config.set_binfile_dir("/tmp");
  config.set_num_workers(10);
  config.set_queue_capacity(0);
  config.set_request_timeout_ms(30000);

  auto* source = config.mutable_source();
  source->set_num_blobs(100);
  source->set_min_blob_bytes(1024);
  source->set_max_blob_bytes(1024 * 1024);
  source->set_min_delay_ms(1);
  source->set_max_delay_ms(1000);

  config.mutable_corruption()->set_enabled(false);
  config.mutable_logging()->set_level("info");

  return config;
}

ReceiverConfig DefaultReceiverConfig() {
  ReceiverConfig config;

  auto* listen = config.mutable_listen();
  listen->set_address("127.0.0.1");
  listen->set_port(8000);
  listen->set_path("/uploads");

  config.set_uploads_dir("/tmp");
  config.set_verify_checksums(true);
  config.set_max_body_bytes(8 * 1024 * 1024);
  config.set_io_threads(1);
  config.set_idle_timeout_ms(30000);
  config.mutable_logging()->set_level("info");

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

SenderConfig ConfigLoader::LoadSenderFromYaml(const std::string& path) {
  auto config = DefaultSenderConfig();
  config.MergeFrom(ParseYaml<SenderConfig>(path));
  return config;
}

ReceiverConfig ConfigLoader::LoadReceiverFromYaml(const std::string& path) {
  auto config = DefaultReceiverConfig();
  config.MergeFrom(ParseYaml<ReceiverConfig>(path));
  return config;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

static void ValidateLogging(const blobstream::runtime::config::LoggingConfig& logging) {
  if (logging.disable_stdout() && logging.file().empty()) {
    throw std::invalid_argument("You must log either to stdout or provide a logfile");
  }
}

void ValidateSenderConfig(const SenderConfig& config) {
  if (config.target().address().empty()) throw std::invalid_argument("target address must not be empty");
  if (config.target().port() == 0 || config.target().port() > 65535) throw std::invalid_argument("target port must be in [1, 65535]");
  if (config.target().path().empty() || config.target().path().front() != '/') {
    throw std::invalid_argument("target path must start with '/'");
  }
  if (config.binfile_dir().empty()) throw std::invalid_argument("binfile_dir must not be empty");
  if (config.num_workers() == 0) throw std::invalid_argument("num_workers must be at least 1");

  const auto& source = config.source();
  if (source.min_blob_bytes() < 1) throw std::invalid_argument("min_blob_bytes must be at least 1");
  if (source.min_blob_bytes() > source.max_blob_bytes()) throw std::invalid_argument("min_blob_bytes exceeds max_blob_bytes");
  if (source.min_delay_ms() > source.max_delay_ms()) throw std::invalid_argument("min_delay_ms exceeds max_delay_ms");

  const double rate = ResolveCorruptionRate(config);
  if (rate < 0.0 || rate > 1.0) throw std::invalid_argument("corruption rate must be in [0, 1]");

  ValidateLogging(config.logging());
}

void ValidateReceiverConfig(const ReceiverConfig& config) {
  if (config.listen().port() > 65535) throw std::invalid_argument("listen port must be in [0, 65535]");
  if (config.listen().path().empty() || config.listen().path().front() != '/') {
    throw std::invalid_argument("listen path must start with '/'");
  }
  if (config.uploads_dir().empty()) throw std::invalid_argument("uploads_dir must not be empty");
  if (config.max_body_bytes() == 0) throw std::invalid_argument("max_body_bytes must be positive");
  if (config.io_threads() == 0) throw std::invalid_argument("io_threads must be at least 1");

  ValidateLogging(config.logging());
}

double ResolveCorruptionRate(const SenderConfig& config) {
  if (config.corruption().has_rate()) return config.corruption().rate();
  return kDefaultCorruptionRate;
}

std::string TargetUrl(const SenderConfig& config) {
  return "http://" + config.target().address() + ":" + std::to_string(config.target().port()) + config.target().path();
}

} // namespace blobstream::config
