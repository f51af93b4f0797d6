// ============================================================================
// hub.cpp - implementation for hub.hpp
// ============================================================================

#include "cclink/hub.hpp"
#include "cclink/digest.hpp"

#include <nlohmann/json.hpp>

#include <pwd.h>       // getpwuid_r
#include <unistd.h>    // geteuid

#include <algorithm>
#include <cstdlib>
#include <ctime>

namespace cclink {

const char* hub_status_name(HubStatus s) {
  switch (s) {
    case HubStatus::Ok:      return "ok";
    case HubStatus::Created: return "created";
    case HubStatus::Failed:  return "failed";
  }
  return "unknown";
}

const char* hub_sync_name(HubSync s) {
  switch (s) {
    case HubSync::Unchanged: return "unchanged";
    case HubSync::Updated:   return "updated";
    case HubSync::NotFound:  return "not found";
    case HubSync::Failed:    return "failed";
  }
  return "unknown";
}

std::string default_hub_name(const std::string& user, std::chrono::system_clock::time_point at) {
  const std::time_t t = std::chrono::system_clock::to_time_t(at);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);
  return user + "-" + stamp;
}

std::string devices_hash(const std::vector<Device>& devices) {
  std::vector<std::string> each;
  each.reserve(devices.size());
  for (const auto& d : devices) each.push_back(digest::to_hex(digest::sha1(d.id() + d.name())));
  std::sort(each.begin(), each.end());

  std::string joined;
  for (const auto& h : each) joined += h;
  return digest::to_hex(digest::sha1(joined));
}

// Login name of the process owner; the API user when the passwd entry is missing.
static std::string login_name(const std::string& fallback) {
  if (const char* u = std::getenv("USER")) {
    if (*u) return u;
  }
  passwd pw{};
  passwd* found = nullptr;
  char buf[1024];
  if (getpwuid_r(geteuid(), &pw, buf, sizeof(buf), &found) == 0 && found && found->pw_name) {
    return found->pw_name;
  }
  return fallback.empty() ? std::string("cclink") : fallback;
}

HubRegistrar::HubRegistrar(ApiConfig api, Credentials creds, std::string id_prefix)
  : api_(std::move(api)), creds_(std::move(creds)), id_prefix_(std::move(id_prefix)), log_(log::get("http")) {}

std::string HubRegistrar::wire_id(const std::string& local) const {
  if (id_prefix_.empty()) return local;
  return id_prefix_ + "-" + local;
}

std::string HubRegistrar::hub_url(const std::string& id) const {
  std::string url = api_.base_url() + api_.hub_endpoint;
  if (!id.empty()) url += "/" + id;
  return url;
}

http::RequestOptions HubRegistrar::options() const {
  http::RequestOptions o;
  o.timeout = std::chrono::milliseconds(api_.request_timeout_ms);
  o.retries = api_.retries;
  o.retry_delay = std::chrono::milliseconds(api_.retry_delay_ms);
  o.headers.emplace_back("Authorization", "Basic " + digest::base64(creds_.user + ":" + creds_.password));
  if (!creds_.group_id.empty()) o.headers.emplace_back("X-Group-Id", creds_.group_id);
  return o;
}

/*
 * ensure()
 * --------
 * PRE:    api enabled.
 * POLICY: a failed HEAD (transport or non-404 status) fails without creating a
 *         second hub; only a 404 leads to creation.
 * OUT:    Ok / Created with hub.id set, or Failed.
 */
HubStatus HubRegistrar::ensure(HubConfig& hub) {
  if (!hub.id.empty()) {
    const auto r = http::head(hub_url(hub.id), options());
    if (!r) {
      log_->error("hub '{}': platform API unreachable", hub.id);
      return HubStatus::Failed;
    }
    if (r->ok()) {
      log_->info("hub '{}' confirmed", hub.id);
      return HubStatus::Ok;
    }
    if (r->status != 404) {
      log_->error("hub '{}': unexpected status {}", hub.id, r->status);
      return HubStatus::Failed;
    }
    log_->warn("hub '{}' unknown to the platform, registering a new one", hub.id);
    hub.id.clear();
  }

  if (hub.name.empty()) {
    hub.name = default_hub_name(login_name(creds_.user), std::chrono::system_clock::now());
    log_->info("no hub name configured, using '{}'", hub.name);
  }

  const std::string body = nlohmann::json{{"name", hub.name}}.dump();
  const auto r = http::post(hub_url(), body, options());
  if (!r || !r->ok()) {
    log_->error("hub registration failed: {}", r ? "status " + std::to_string(r->status) : std::string("unreachable"));
    return HubStatus::Failed;
  }

  try {
    const auto j = nlohmann::json::parse(r->body);
    if (j.is_object() && j.contains("id")) {
      const auto& id = j["id"];
      hub.id = id.is_string() ? id.get<std::string>() : id.dump();
    }
  } catch (const nlohmann::json::exception& ex) {
    log_->error("hub registration: bad reply body: {}", ex.what());
    return HubStatus::Failed;
  }
  if (hub.id.empty()) {
    log_->error("hub registration: reply has no id");
    return HubStatus::Failed;
  }
  log_->info("hub registered with id '{}'", hub.id);
  return HubStatus::Created;
}

/*
 * sync()
 * ------
 * PRE:    hub.id known (ensure() succeeded).
 * POLICY: GET the hub; the platform's name wins over the local one; the device
 *         list is PUT only when the aggregate hash differs. A 404 on either
 *         request forgets the id.
 * OUT:    HubSync; hub.name / hub.id may have changed and need persisting.
 */
HubSync HubRegistrar::sync(HubConfig& hub, const std::vector<Device>& devices) {
  if (hub.id.empty()) {
    log_->error("hub sync: no hub id");
    return HubSync::Failed;
  }

  const std::string local_hash = devices_hash(devices);
  const auto r = http::get(hub_url(hub.id), options());
  if (!r) {
    log_->error("hub sync '{}': platform API unreachable", hub.id);
    return HubSync::Failed;
  }
  if (r->status == 404) {
    log_->error("hub sync: hub '{}' not found on platform, forgetting it", hub.id);
    hub.id.clear();
    return HubSync::NotFound;
  }
  if (!r->ok()) {
    log_->error("hub sync '{}': unexpected status {}", hub.id, r->status);
    return HubSync::Failed;
  }

  std::string remote_hash;
  try {
    const auto j = nlohmann::json::parse(r->body);
    if (!j.is_object()) {
      log_->error("hub sync '{}': reply is not an object", hub.id);
      return HubSync::Failed;
    }
    const auto name = j.value("name", std::string());
    if (!name.empty() && name != hub.name) {
      log_->warn("hub sync: local name '{}' differs from platform name '{}', adopting it", hub.name, name);
      hub.name = name;
    }
    // hash is null for a hub that never had devices
    if (j.contains("hash") && j["hash"].is_string()) remote_hash = j["hash"].get<std::string>();
  } catch (const nlohmann::json::exception& ex) {
    log_->error("hub sync '{}': bad reply body: {}", hub.id, ex.what());
    return HubSync::Failed;
  }

  if (remote_hash == local_hash) {
    log_->info("hub '{}' in sync ({} devices)", hub.id, devices.size());
    return HubSync::Unchanged;
  }

  nlohmann::json ids = nlohmann::json::array();
  for (const auto& d : devices) ids.push_back(wire_id(d.id()));
  const nlohmann::json body{
      {"id", hub.id},
      {"name", hub.name},
      {"hash", local_hash},
      {"device_local_ids", ids},
  };

  log_->debug("hub '{}': hash {} -> {}, updating device list", hub.id, remote_hash, local_hash);
  const auto u = http::put(hub_url(hub.id), body.dump(), options());
  if (!u) {
    log_->error("hub sync '{}': platform API unreachable", hub.id);
    return HubSync::Failed;
  }
  if (u->status == 404) {
    log_->error("hub sync: hub '{}' not found on platform, forgetting it", hub.id);
    hub.id.clear();
    return HubSync::NotFound;
  }
  if (!u->ok()) {
    log_->error("hub sync '{}': device update refused, status {}", hub.id, u->status);
    return HubSync::Failed;
  }
  log_->info("hub '{}' updated with {} devices", hub.id, devices.size());
  return HubSync::Updated;
}

} // namespace cclink
