#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include "../error_handler/error.hpp"

namespace hashdup::infra {

inline constexpr std::string_view LOG_PATTERN = "[%Y-%m-%d %H:%M:%S] [%l] %v";

/// Логгер без вывода; используется, когда вызывающая сторона не передала свой.
[[nodiscard]] auto make_null_logger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

/// Настраивает глобальный логгер spdlog для CLI (паттерн и уровень).
void configure_default_logger(spdlog::level::level_enum level);

/// "trace", "debug", "info", "warn", "error", "critical", "off"
[[nodiscard]] auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum>;

} // namespace hashdup::infra
