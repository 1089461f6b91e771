#include <f1ml/logging.hpp>
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace f1ml {

static constexpr const char* kLoggerName = "f1ml";
static constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%^%l%$] %v";

static std::shared_ptr<spdlog::logger> make_logger_() {
  if (auto existing = spdlog::get(kLoggerName)) return existing;
  auto lg = spdlog::stdout_color_mt(kLoggerName);
  lg->set_pattern(kPattern);
  lg->set_level(spdlog::level::info);
  return lg;
}

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> lg;
  std::call_once(once, [] { lg = make_logger_(); });
  return lg;
}

void setup_logging(std::optional<std::string> level) {
  if (!level) {
    const char* env = std::getenv("F1ML_LOG_LEVEL");
    level = (env && *env) ? std::string(env) : std::string("info");
  }
  auto lg = logger();
  // spdlog maps unknown names to "off"; keep info instead.
  auto lvl = spdlog::level::from_str(*level);
  if (lvl == spdlog::level::off && *level != "off") {
    lg->warn("Unknown log level '{}', using info", *level);
    lvl = spdlog::level::info;
  }
  lg->set_level(lvl);
  lg->set_pattern(kPattern);
}

} // namespace f1ml
