#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace lotcost::runtime::config {
class RuntimeConfig;
}

namespace lotcost::util {
class Decimal;
}

namespace lotcost::observability {

/*
  Structured logging over spdlog.

  Messages render as "<message> key=value key=value".
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DecimalField(std::string_view key, const lotcost::util::Decimal& value);

void InitializeLogging(const lotcost::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace lotcost::observability

#define LOTCOST_LOG_DEBUG(message, ...) ::lotcost::observability::LogDebug((message), ##__VA_ARGS__)
#define LOTCOST_LOG_INFO(message, ...) ::lotcost::observability::LogInfo((message), ##__VA_ARGS__)
#define LOTCOST_LOG_WARN(message, ...) ::lotcost::observability::LogWarn((message), ##__VA_ARGS__)
#define LOTCOST_LOG_ERROR(message, ...) ::lotcost::observability::LogError((message), ##__VA_ARGS__)
