#include "uabridge/observability/logging.hpp"

#include "config/agent_config.pb.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace uabridge::observability {

namespace {

    constexpr std::string_view LOGGER_NAME = "uabridge";
    constexpr std::string_view DEFAULT_LEVEL = "info";
    constexpr std::string_view DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

    std::string ResolveLevel(const proto::config::LoggingConfig& config) {
        if (const char* level = std::getenv("UABRIDGE_LOG_LEVEL")) {
            return level;
        }
        if (!config.level().empty()) {
            return config.level();
        }
        return std::string(DEFAULT_LEVEL);
    }

    std::string ResolvePattern(const proto::config::LoggingConfig& config) {
        if (const char* pattern = std::getenv("UABRIDGE_LOG_PATTERN")) {
            return pattern;
        }
        if (!config.pattern().empty()) {
            return config.pattern();
        }
        return std::string(DEFAULT_PATTERN);
    }

    std::string SerializeFields(std::initializer_list<LogField> fields) {
        std::string out;
        for (const auto& field : fields) {
            if (!out.empty()) {
                out.push_back(' ');
            }
            out.append(field.key);
            out.push_back('=');
            if (field.value.find(' ') != std::string::npos) {
                out.push_back('"');
                out.append(field.value);
                out.push_back('"');
            } else {
                out.append(field.value);
            }
        }
        return out;
    }

}

LogField StringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

LogField FailureField(const BridgeFailure& failure) {
    return {"failure", std::string(ToString(failure.type))};
}

void InitializeLogging(const proto::config::LoggingConfig& config, const LogTarget target) {
    spdlog::drop(std::string(LOGGER_NAME));
    auto logger = target == LogTarget::Stderr
        ? spdlog::stderr_color_mt(std::string(LOGGER_NAME))
        : spdlog::stdout_color_mt(std::string(LOGGER_NAME));
    logger->set_pattern(ResolvePattern(config));
    logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
    spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
    const auto serialized = SerializeFields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

}
