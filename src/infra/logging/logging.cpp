#include "logging.hpp"
#include <fmt/core.h>
#include <spdlog/sinks/null_sink.h>

namespace hashdup::infra {

auto make_null_logger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    return std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

void configure_default_logger(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::set_pattern(std::string(LOG_PATTERN));
}

auto parse_log_level(std::string_view name) -> Result<spdlog::level::level_enum> {
    auto level = spdlog::level::from_str(std::string(name));
    // from_str возвращает off для неизвестных имён
    if (level == spdlog::level::off && name != "off") {
        return std::unexpected(make_error(ErrorCode::ConfigInvalid,
                                          fmt::format("Unknown log level: '{}'", name)));
    }
    return level;
}

} // namespace hashdup::infra
