#pragma once

#include "uabridge/core/failures.hpp"

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace uabridge::proto::config {
class LoggingConfig;
}

namespace uabridge::observability {

struct LogField {
    std::string key;
    std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/**
 * @brief `failure=<type>` field for a BridgeFailure
 */
LogField FailureField(const BridgeFailure& failure);

/**
 * @brief Where log lines go
 *
 * The offline tools print their results on stdout, so they log to stderr.
 */
enum class LogTarget {
    Stdout,
    Stderr
};

/**
 * @brief Install the process-wide spdlog logger
 *
 * Level and pattern come from UABRIDGE_LOG_LEVEL / UABRIDGE_LOG_PATTERN,
 * then from `config`, then from built-in defaults.
 */
void InitializeLogging(const proto::config::LoggingConfig& config, LogTarget target = LogTarget::Stdout);
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

}

#define UABRIDGE_LOG_DEBUG(message, ...) ::uabridge::observability::LogDebug((message), ##__VA_ARGS__)
#define UABRIDGE_LOG_INFO(message, ...) ::uabridge::observability::LogInfo((message), ##__VA_ARGS__)
#define UABRIDGE_LOG_WARN(message, ...) ::uabridge::observability::LogWarn((message), ##__VA_ARGS__)
#define UABRIDGE_LOG_ERROR(message, ...) ::uabridge::observability::LogError((message), ##__VA_ARGS__)
