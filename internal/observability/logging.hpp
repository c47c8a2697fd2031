#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace cadence::runtime::config {
class RuntimeConfig;
}

namespace cadence::observability {

/*
  One key=value pair appended to a log line. Values are preformatted so a
  line reads the same whichever sink spdlog writes it to.
*/
struct LogField {
  std::string key;
  std::string value;
};

using LogFields = std::vector<LogField>;

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const cadence::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const LogFields& fields);

// Warning for a degraded analysis step: `stage` names the step that failed,
// `error` is the message that was recorded for it.
void LogStageFailure(std::string_view message, std::string_view stage, std::string_view error);

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogInfo(std::string_view message, const LogFields& fields) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace cadence::observability

#define CADENCE_LOG_DEBUG(message, ...) ::cadence::observability::LogDebug((message), ##__VA_ARGS__)
#define CADENCE_LOG_INFO(message, ...) ::cadence::observability::LogInfo((message), ##__VA_ARGS__)
#define CADENCE_LOG_WARN(message, ...) ::cadence::observability::LogWarn((message), ##__VA_ARGS__)
#define CADENCE_LOG_ERROR(message, ...) ::cadence::observability::LogError((message), ##__VA_ARGS__)
#define CADENCE_LOG_STAGE_FAILURE(message, stage, error) ::cadence::observability::LogStageFailure((message), (stage), (error))
