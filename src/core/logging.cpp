#include "core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace core {

spdlog::level::level_enum parse_log_level(const std::string& level){
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") return spdlog::level::info;
    return lvl;
}

void init_logging(const std::string& level){
    auto logger = spdlog::get("volsig");
    if (!logger) logger = spdlog::stdout_color_mt("volsig");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(parse_log_level(level));
}

} // namespace core
