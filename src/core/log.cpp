#include "gtin/core/log.hpp"

#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace gtin::core {
namespace {

struct LevelMapping final {
    LogLevel level;
    spdlog::level::level_enum spdlog_level;
};

constexpr LevelMapping kLevelMappings[] = {
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
};

[[nodiscard]] std::shared_ptr<spdlog::logger> make_library_logger_() {
    const std::string name{kLoggerName};
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return spdlog::stderr_color_mt(name);
}

} // namespace

spdlog::logger& library_logger() {
    // 函数内静态变量：首次使用时线程安全地初始化，之后只读。
    static const std::shared_ptr<spdlog::logger> logger = make_library_logger_();
    return *logger;
}

void set_log_level(LogLevel level) {
    for (const auto& mapping : kLevelMappings) {
        if (mapping.level == level) {
            library_logger().set_level(mapping.spdlog_level);
            return;
        }
    }
    library_logger().set_level(spdlog::level::off);
}

LogLevel log_level() {
    const auto current = library_logger().level();
    for (const auto& mapping : kLevelMappings) {
        if (mapping.spdlog_level == current) {
            return mapping.level;
        }
    }
    return LogLevel::off;
}

} // namespace gtin::core
