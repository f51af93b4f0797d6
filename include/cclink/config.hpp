/**
 * @file config.hpp
 * @brief cclink configuration: typed sections, JSON file load/generate/save.
 *
 * @details
 * The configuration is one JSON document, by default
 * `$XDG_CONFIG_HOME/cclink/connector.json` (or `$HOME/.config/cclink/...`).
 * It is read once at startup. A missing file is generated with defaults; missing
 * keys inside an existing file fall back to defaults as well. Writes go through
 * `<file>.tmp` + rename so a crash never leaves a half-written config behind.
 *
 * ```json
 * {
 *   "connector":   { "protocol": "tcp", "host": "localhost", "port": 7700, ... },
 *   "credentials": { "user": "", "password": "", "group_id": "" },
 *   "logger":      { "level": "info", "rotating_log": false, ... },
 *   "api":         { "host": "", "hub_endpoint": "/hubs", ... },
 *   "hub":         { "id": "", "name": "" },
 *   "device":      { "id_prefix": "" }
 * }
 * ```
 */

#ifndef CCLINK_CONFIG_HPP
#define CCLINK_CONFIG_HPP

#include "cclink/logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace cclink {

struct ConnectorConfig {
  std::string protocol{"tcp"};          ///< "tcp" (plain) or "tls" (secure)
  std::string host{"localhost"};
  uint16_t    port{7700};
  int         keepalive_s{30};          ///< TCP keepalive idle time, 0 disables
  int64_t     reconnect_delay_min_ms{1000};
  int64_t     reconnect_delay_max_ms{60000};
  double      reconnect_delay_factor{2.0};
  int         handshake_timeout_ms{5000};
  int         default_timeout_ms{10000};
  int         sync_timeout_ms{10000};   ///< per device during synchronization
  int         callback_workers{2};
  bool        tls_verify{true};
  std::string ca_file;                  ///< empty: system trust store

  bool secure() const { return protocol == "tls"; }
};

struct Credentials {
  std::string user;
  std::string password;
  std::string group_id;
  std::string client_id;                ///< filled from the hub id at start, not persisted
};

struct ApiConfig {
  std::string protocol{"http"};
  std::string host;                     ///< empty disables hub handling
  uint16_t    port{80};
  std::string hub_endpoint{"/hubs"};
  int         request_timeout_ms{5000};
  int         retries{3};
  int         retry_delay_ms{500};

  bool enabled() const { return !host.empty(); }
  std::string base_url() const;
};

struct HubConfig {
  std::string id;
  std::string name;
};

struct DeviceConfig {
  std::string id_prefix;
};

struct Config {
  ConnectorConfig connector;
  Credentials     credentials;
  LoggerConfig    logger;
  ApiConfig       api;
  HubConfig       hub;
  DeviceConfig    device;

  std::filesystem::path file;           ///< where this config was loaded from, empty if in-memory
};

namespace config {

/// $XDG_CONFIG_HOME/cclink or $HOME/.config/cclink
std::filesystem::path default_dir();

/// default_dir() / "connector.json"
std::filesystem::path default_file();

nlohmann::json to_json(const Config& cfg);

/// Overlay @p j on top of defaults. Wrong-typed values keep the default.
Config from_json(const nlohmann::json& j);

/**
 * @brief Load @p file, generating it with defaults if it does not exist.
 * @details An empty `device.id_prefix` is generated and written back. An empty
 * `logger.log_dir` resolves to `<file dir>/logs` (in memory only).
 * @return std::nullopt if the file exists but is unreadable or not a JSON object,
 *         or if the resulting config fails validate().
 */
std::optional<Config> load(const std::filesystem::path& file);

/// Atomic write of to_json(cfg).
bool save(const Config& cfg, const std::filesystem::path& file);

/// false with a reason in @p why when a value is out of range.
bool validate(const Config& cfg, std::string& why);

/// base64url(md5(user + now)), no padding.
std::string generate_id_prefix(const std::string& user);

} // namespace config
} // namespace cclink

#endif // CCLINK_CONFIG_HPP
