#pragma once

#include <string>

#include "config/config.pb.h"

namespace blobstream::config {

using blobstream::runtime::config::ReceiverConfig;
using blobstream::runtime::config::SenderConfig;

/*
  Loads SenderConfig / ReceiverConfig from YAML files.

  YAML is converted to JSON then parsed into protobuf. The parsed
  message is merged over the built-in defaults, so a file only needs
  to name the settings it changes.
*/
class ConfigLoader {
 public:
  static SenderConfig   LoadSenderFromYaml(const std::string& path);
  static ReceiverConfig LoadReceiverFromYaml(const std::string& path);
};

SenderConfig   DefaultSenderConfig();
ReceiverConfig DefaultReceiverConfig();

// Throw std::invalid_argument describing the first inconsistent setting.
void ValidateSenderConfig(const SenderConfig& config);
void ValidateReceiverConfig(const ReceiverConfig& config);

// Rate applied when corruption is enabled without an explicit rate.
inline constexpr double kDefaultCorruptionRate = 0.1;

double ResolveCorruptionRate(const SenderConfig& config);

// "http://<address>:<port><path>" for log lines.
std::string TargetUrl(const SenderConfig& config);

} // namespace blobstream::config
