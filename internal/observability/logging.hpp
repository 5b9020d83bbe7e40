#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace blobstream::runtime::config {
class LoggingConfig;
}

namespace blobstream::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process-wide logger.

  `role` tags every line (SENDER / SERVER) so interleaved logs from
  both processes stay readable.
*/
void InitializeLogging(const blobstream::runtime::config::LoggingConfig& config, std::string_view role);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace blobstream::observability

#define BLOBSTREAM_LOG_INFO(message, ...) ::blobstream::observability::LogInfo((message), ##__VA_ARGS__)
#define BLOBSTREAM_LOG_WARN(message, ...) ::blobstream::observability::LogWarn((message), ##__VA_ARGS__)
#define BLOBSTREAM_LOG_ERROR(message, ...) ::blobstream::observability::LogError((message), ##__VA_ARGS__)
