/**
 * @file logging.hpp
 * @brief Component loggers for cclink on top of spdlog.
 *
 * @details
 * Every component asks for its own named logger (`cclink.transport`,
 * `cclink.bridge`, ...). All of them share one sink set:
 *   - colored stderr, always;
 *   - a daily file `<log_dir>/connector.log` rotated at midnight, when enabled.
 *
 * Call `init()` once before starting a Client; loggers created earlier pick up the
 * new sinks and level, and may keep logging from other threads while it runs.
 * Loggers requested before any `init()` write to stderr at info.
 *
 * Line format: `10.19.2026 09:14:03 AM - info: [cclink.bridge] message`.
 */

#ifndef CCLINK_LOGGING_HPP
#define CCLINK_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cclink {

struct LoggerConfig {
  std::string level{"info"};            ///< debug | info | warning | error | critical
  bool rotating_log{false};             ///< add daily rotating file sink
  int rotating_log_backup_count{14};    ///< rotated files kept
  std::string log_dir;                  ///< empty: "<config dir>/logs"
};

namespace log {

static constexpr const char* PATTERN = "%m.%d.%Y %I:%M:%S %p - %l: [%n] %v";

/// Configure sinks and level for all cclink loggers. false if the file sink cannot be opened.
bool init(const LoggerConfig& cfg);

/// Named component logger, e.g. get("bridge") -> "cclink.bridge".
std::shared_ptr<spdlog::logger> get(const std::string& component);

/// "warning" -> warn, unknown -> info.
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace log
} // namespace cclink

#endif // CCLINK_LOGGING_HPP
