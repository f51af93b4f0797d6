// ============================================================================
// logging.cpp - spdlog sink management for cclink component loggers
// ============================================================================

#include "cclink/logging.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

namespace cclink {
namespace log {

namespace {

// Every component logger holds the one `fanout` sink for its whole life; init()
// swaps the children inside it (dist_sink locks), never a logger's own sink list.
struct Registry {
  Registry() : fanout(std::make_shared<spdlog::sinks::dist_sink_mt>()) {
    auto err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    err->set_pattern(PATTERN);
    fanout->add_sink(err);
  }

  std::mutex mu;
  std::shared_ptr<spdlog::sinks::dist_sink_mt> fanout;
  spdlog::level::level_enum level{spdlog::level::info};
  std::vector<std::shared_ptr<spdlog::logger>> loggers;
};

Registry& registry() {
  static Registry r;
  return r;
}

} // namespace

spdlog::level::level_enum parse_level(const std::string& name) {
  if (name == "debug")    return spdlog::level::debug;
  if (name == "info")     return spdlog::level::info;
  if (name == "warning" || name == "warn") return spdlog::level::warn;
  if (name == "error")    return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  return spdlog::level::info;
}

bool init(const LoggerConfig& cfg) {
  Registry& r = registry();
  std::lock_guard<std::mutex> lk(r.mu);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  bool ok = true;
  if (cfg.rotating_log) {
    try {
      fs::path dir = cfg.log_dir.empty() ? fs::path("logs") : fs::path(cfg.log_dir);
      fs::create_directories(dir);
      const auto keep = static_cast<uint16_t>(cfg.rotating_log_backup_count > 0 ? cfg.rotating_log_backup_count : 0);
      sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
          (dir / "connector.log").string(), 0, 0, false, keep));
    } catch (const spdlog::spdlog_ex& ex) {
      ok = false;
      spdlog::error("cclink: cannot open rotating log: {}", ex.what());
    } catch (const fs::filesystem_error& ex) {
      ok = false;
      spdlog::error("cclink: cannot create log directory: {}", ex.what());
    }
  }

  for (auto& s : sinks) s->set_pattern(PATTERN);
  r.fanout->set_sinks(std::move(sinks));
  r.level = parse_level(cfg.level);

  for (auto& lg : r.loggers) lg->set_level(r.level);  // atomic in spdlog::logger
  return ok;
}

std::shared_ptr<spdlog::logger> get(const std::string& component) {
  Registry& r = registry();
  std::lock_guard<std::mutex> lk(r.mu);

  const std::string name = "cclink." + component;
  for (auto& lg : r.loggers) {
    if (lg->name() == name) return lg;
  }

  auto lg = std::make_shared<spdlog::logger>(name, r.fanout);
  lg->set_level(r.level);
  r.loggers.push_back(lg);
  return lg;
}

} // namespace log
} // namespace cclink
