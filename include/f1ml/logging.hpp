#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace f1ml {

// Library-wide logger ("f1ml"). Created on first use with the default setup.
std::shared_ptr<spdlog::logger> logger();

// Configure level and pattern. Level names follow spdlog ("debug", "info", ...).
// With no argument the level comes from F1ML_LOG_LEVEL, else "info".
void setup_logging(std::optional<std::string> level = std::nullopt);

} // namespace f1ml
