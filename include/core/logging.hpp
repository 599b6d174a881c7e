#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace core {

// Installs a colored stdout logger as the spdlog default.
// Unknown level names fall back to "info".
void init_logging(const std::string& level = "info");

spdlog::level::level_enum parse_log_level(const std::string& level);

} // namespace core
