#include "untrustended/core/log.hpp"

#include "core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>

namespace untrustended::core {
namespace {

constexpr const char* kLoggerName = "untrustended";

// 下标即 LogLevel 的取值。
constexpr std::array<spdlog::level::level_enum, 7> kSpdlogLevels{
    spdlog::level::trace, spdlog::level::debug,    spdlog::level::info,
    spdlog::level::warn,  spdlog::level::err,      spdlog::level::critical,
    spdlog::level::off,
};

std::shared_ptr<spdlog::logger> make_logger() {
    // 业务侧可能已经用同名 logger 注册过自己的 sink，优先复用。
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    return spdlog::stderr_color_mt(kLoggerName);
}

} // namespace

namespace detail {

const std::shared_ptr<spdlog::logger>& logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    const auto mapped =
        index < kSpdlogLevels.size() ? kSpdlogLevels[index] : spdlog::level::off;
    detail::logger()->set_level(mapped);
}

LogLevel log_level() noexcept {
    const auto current = detail::logger()->level();
    for (std::size_t i = 0; i < kSpdlogLevels.size(); ++i) {
        if (kSpdlogLevels[i] == current) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::off;
}

} // namespace untrustended::core
