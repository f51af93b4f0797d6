// ============================================================================
// config.cpp - implementation for config.hpp
// ============================================================================

#include "cclink/config.hpp"
#include "cclink/digest.hpp"
#include "cclink/message.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <type_traits>

namespace fs = std::filesystem;
using nlohmann::json;

namespace cclink {

std::string ApiConfig::base_url() const {
  return protocol + "://" + host + ":" + std::to_string(port);
}

namespace config {

namespace {

// ---------------------------------------------------------------------------
// pick()
// ------
// Read j[key] as T if present and of a compatible JSON type, else keep @p def.
// ---------------------------------------------------------------------------
template <typename T>
T pick(const json& j, const char* key, const T& def) {
  if (!j.is_object() || !j.contains(key)) return def;
  const json& v = j[key];
  if constexpr (std::is_same<T, bool>::value) {
    return v.is_boolean() ? v.get<bool>() : def;
  } else if constexpr (std::is_arithmetic<T>::value) {
    return v.is_number() ? v.get<T>() : def;
  } else {
    return v.is_string() ? v.get<T>() : def;
  }
}

const json& section(const json& j, const char* key) {
  static const json empty = json::object();
  if (j.is_object() && j.contains(key) && j[key].is_object()) return j[key];
  return empty;
}

bool atomic_write_json(const fs::path& p, const json& j) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) return false;
  }
  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) return false;
    out << j.dump(2);
    out.flush();
    if (!out) return false;
  }
  fs::rename(tmp, p, ec);
  return !ec;
}

} // namespace

fs::path default_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "cclink";
  const char* home = std::getenv("HOME");
  fs::path base = (home && *home) ? fs::path(home) / ".config" : fs::temp_directory_path();
  return base / "cclink";
}

fs::path default_file() { return default_dir() / "connector.json"; }

json to_json(const Config& cfg) {
  json j;
  const auto& c = cfg.connector;
  j["connector"] = {
    {"protocol", c.protocol},
    {"host", c.host},
    {"port", c.port},
    {"keepalive_s", c.keepalive_s},
    {"reconnect_delay_min_ms", c.reconnect_delay_min_ms},
    {"reconnect_delay_max_ms", c.reconnect_delay_max_ms},
    {"reconnect_delay_factor", c.reconnect_delay_factor},
    {"handshake_timeout_ms", c.handshake_timeout_ms},
    {"default_timeout_ms", c.default_timeout_ms},
    {"sync_timeout_ms", c.sync_timeout_ms},
    {"callback_workers", c.callback_workers},
    {"tls_verify", c.tls_verify},
    {"ca_file", c.ca_file},
  };
  j["credentials"] = {
    {"user", cfg.credentials.user},
    {"password", cfg.credentials.password},
    {"group_id", cfg.credentials.group_id},
  };
  j["logger"] = {
    {"level", cfg.logger.level},
    {"rotating_log", cfg.logger.rotating_log},
    {"rotating_log_backup_count", cfg.logger.rotating_log_backup_count},
    {"log_dir", cfg.logger.log_dir},
  };
  const auto& a = cfg.api;
  j["api"] = {
    {"protocol", a.protocol},
    {"host", a.host},
    {"port", a.port},
    {"hub_endpoint", a.hub_endpoint},
    {"request_timeout_ms", a.request_timeout_ms},
    {"retries", a.retries},
    {"retry_delay_ms", a.retry_delay_ms},
  };
  j["hub"]    = {{"id", cfg.hub.id}, {"name", cfg.hub.name}};
  j["device"] = {{"id_prefix", cfg.device.id_prefix}};
  return j;
}

Config from_json(const json& j) {
  Config cfg;

  const json& c = section(j, "connector");
  auto& cc = cfg.connector;
  cc.protocol               = pick(c, "protocol", cc.protocol);
  cc.host                   = pick(c, "host", cc.host);
  cc.port                   = pick(c, "port", cc.port);
  cc.keepalive_s            = pick(c, "keepalive_s", cc.keepalive_s);
  cc.reconnect_delay_min_ms = pick(c, "reconnect_delay_min_ms", cc.reconnect_delay_min_ms);
  cc.reconnect_delay_max_ms = pick(c, "reconnect_delay_max_ms", cc.reconnect_delay_max_ms);
  cc.reconnect_delay_factor = pick(c, "reconnect_delay_factor", cc.reconnect_delay_factor);
  cc.handshake_timeout_ms   = pick(c, "handshake_timeout_ms", cc.handshake_timeout_ms);
  cc.default_timeout_ms     = pick(c, "default_timeout_ms", cc.default_timeout_ms);
  cc.sync_timeout_ms        = pick(c, "sync_timeout_ms", cc.sync_timeout_ms);
  cc.callback_workers       = pick(c, "callback_workers", cc.callback_workers);
  cc.tls_verify             = pick(c, "tls_verify", cc.tls_verify);
  cc.ca_file                = pick(c, "ca_file", cc.ca_file);

  const json& cr = section(j, "credentials");
  cfg.credentials.user     = pick(cr, "user", cfg.credentials.user);
  cfg.credentials.password = pick(cr, "password", cfg.credentials.password);
  cfg.credentials.group_id = pick(cr, "group_id", cfg.credentials.group_id);

  const json& l = section(j, "logger");
  cfg.logger.level                     = pick(l, "level", cfg.logger.level);
  cfg.logger.rotating_log              = pick(l, "rotating_log", cfg.logger.rotating_log);
  cfg.logger.rotating_log_backup_count = pick(l, "rotating_log_backup_count", cfg.logger.rotating_log_backup_count);
  cfg.logger.log_dir                   = pick(l, "log_dir", cfg.logger.log_dir);

  const json& a = section(j, "api");
  auto& ac = cfg.api;
  ac.protocol           = pick(a, "protocol", ac.protocol);
  ac.host               = pick(a, "host", ac.host);
  ac.port               = pick(a, "port", ac.port);
  ac.hub_endpoint       = pick(a, "hub_endpoint", ac.hub_endpoint);
  ac.request_timeout_ms = pick(a, "request_timeout_ms", ac.request_timeout_ms);
  ac.retries            = pick(a, "retries", ac.retries);
  ac.retry_delay_ms     = pick(a, "retry_delay_ms", ac.retry_delay_ms);

  const json& h = section(j, "hub");
  cfg.hub.id   = pick(h, "id", cfg.hub.id);
  cfg.hub.name = pick(h, "name", cfg.hub.name);

  cfg.device.id_prefix = pick(section(j, "device"), "id_prefix", cfg.device.id_prefix);
  return cfg;
}

bool validate(const Config& cfg, std::string& why) {
  const auto& c = cfg.connector;
  if (c.protocol != "tcp" && c.protocol != "tls") { why = "connector.protocol must be tcp or tls"; return false; }
  if (c.host.empty())                             { why = "connector.host is empty"; return false; }
  if (c.port == 0)                                { why = "connector.port is 0"; return false; }
  if (c.reconnect_delay_min_ms <= 0)              { why = "connector.reconnect_delay_min_ms must be > 0"; return false; }
  if (c.reconnect_delay_max_ms < c.reconnect_delay_min_ms) {
    why = "connector.reconnect_delay_max_ms must be >= reconnect_delay_min_ms";
    return false;
  }
  if (c.reconnect_delay_factor < 1.0)             { why = "connector.reconnect_delay_factor must be >= 1"; return false; }
  if (c.handshake_timeout_ms <= 0)                { why = "connector.handshake_timeout_ms must be > 0"; return false; }
  if (c.default_timeout_ms <= 0)                  { why = "connector.default_timeout_ms must be > 0"; return false; }
  if (c.sync_timeout_ms <= 0)                     { why = "connector.sync_timeout_ms must be > 0"; return false; }
  if (c.callback_workers < 1)                     { why = "connector.callback_workers must be >= 1"; return false; }
  if (cfg.api.enabled()) {
    if (cfg.api.protocol != "http" && cfg.api.protocol != "https") { why = "api.protocol must be http or https"; return false; }
    if (cfg.api.port == 0)                        { why = "api.port is 0"; return false; }
  }
  return true;
}

std::string generate_id_prefix(const std::string& user) {
  return digest::base64url_nopad(digest::md5(user + std::to_string(now_ms())));
}

bool save(const Config& cfg, const fs::path& file) {
  return atomic_write_json(file, to_json(cfg));
}

std::optional<Config> load(const fs::path& file) {
  auto lg = log::get("config");

  Config cfg;
  std::error_code ec;
  bool dirty = false;

  if (!fs::exists(file, ec)) {
    lg->info("no config at '{}', generating defaults", file.string());
    dirty = true;
  } else {
    std::ifstream in(file);
    if (!in) {
      lg->error("cannot open config '{}'", file.string());
      return std::nullopt;
    }
    try {
      json j;
      in >> j;
      if (!j.is_object()) {
        lg->error("config '{}' is not a JSON object", file.string());
        return std::nullopt;
      }
      cfg = from_json(j);
    } catch (const json::exception& ex) {
      lg->error("malformed config '{}': {}", file.string(), ex.what());
      return std::nullopt;
    }
  }

  if (cfg.device.id_prefix.empty()) {
    cfg.device.id_prefix = generate_id_prefix(cfg.credentials.user);
    dirty = true;
  }

  if (dirty && !save(cfg, file)) {
    lg->warn("could not write config '{}'", file.string());
  }

  cfg.file = file;
  if (cfg.logger.log_dir.empty()) {
    cfg.logger.log_dir = ((file.has_parent_path() ? file.parent_path() : fs::path(".")) / "logs").string();
  }

  std::string why;
  if (!validate(cfg, why)) {
    lg->error("invalid config '{}': {}", file.string(), why);
    return std::nullopt;
  }
  return cfg;
}

} // namespace config
} // namespace cclink
