#pragma once
/**
 * @file hub.hpp
 * @brief Out-of-band hub registration and hub synchronization through the platform HTTP API.
 *
 * @details
 * Before the first connect the platform must know the hub this client runs as.
 * - known id: `HEAD {api}{hub_endpoint}/{id}`; 2xx keeps it, 404 forgets it.
 * - no id:    `POST {api}{hub_endpoint}` with `{"name": ...}`, id read from the reply.
 *             An empty name is generated as `<login>-<UTC time>` first.
 *
 * After every device synchronization pass the hub's device list is reconciled:
 * ```
 *   GET  {hub}/{id}  -> {"name", "hash", ...}
 *        name differs  -> adopt the platform's name
 *        hash differs  -> PUT {hub}/{id} {"id","name","hash","device_local_ids"}
 *   404 on either    -> hub id forgotten (re-registered on the next start)
 * ```
 * `hash` is devices_hash() of the local device set, `device_local_ids` the wire ids.
 * Requests carry HTTP Basic credentials.
 */

#include "cclink/config.hpp"
#include "cclink/device.hpp"
#include "cclink/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace cclink {

enum class HubStatus : uint8_t {
  Ok = 0,    // existing id confirmed
  Created,   // new id written into HubConfig; caller persists it
  Failed,
};

enum class HubSync : uint8_t {
  Unchanged = 0,  // platform already had this device set
  Updated,        // device list PUT accepted
  NotFound,       // hub gone; HubConfig::id cleared, caller persists it
  Failed,
};

const char* hub_status_name(HubStatus s);
const char* hub_sync_name(HubSync s);

/// `<user>-<YYYY-MM-DDTHH:MM:SS>` in UTC.
std::string default_hub_name(const std::string& user, std::chrono::system_clock::time_point at);

/// SHA-1 hex over the sorted SHA-1 hexes of id+name per device. Order independent.
std::string devices_hash(const std::vector<Device>& devices);

class HubRegistrar {
public:
  HubRegistrar(ApiConfig api, Credentials creds, std::string id_prefix = {});

  HubStatus ensure(HubConfig& hub);

  /// Reconcile the hub's name and device list. PRE: hub.id set.
  HubSync sync(HubConfig& hub, const std::vector<Device>& devices);

  std::string hub_url(const std::string& id = {}) const;

private:
  http::RequestOptions options() const;
  std::string wire_id(const std::string& local) const;

  ApiConfig api_;
  Credentials creds_;
  std::string id_prefix_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace cclink
