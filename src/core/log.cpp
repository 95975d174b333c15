#include "structbin/core/log.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <utility>

namespace structbin::core {
namespace {

using LevelPair = std::pair<LogLevel, spdlog::level::level_enum>;

// LogLevel 与 spdlog 级别一一对应；下标即 LogLevel 的取值。
constexpr std::array<LevelPair, 7> kLevels{{
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
}};

} // namespace

void set_log_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    // 越界的取值一律视为关闭
    spdlog::set_level(index < kLevels.size() ? kLevels[index].second : spdlog::level::off);
}

LogLevel log_level() noexcept {
    const auto current = spdlog::get_level();
    for (const auto& [ours, theirs] : kLevels) {
        if (theirs == current) {
            return ours;
        }
    }
    return LogLevel::off;
}

} // namespace structbin::core
