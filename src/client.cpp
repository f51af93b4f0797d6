// ============================================================================
// client.cpp - implementation for client.hpp
// ============================================================================

#include "cclink/client.hpp"
#include "cclink/memory_device_manager.hpp"

#include <atomic>

namespace cclink {

namespace {
std::atomic<bool> g_client_alive{false};
}

std::unique_ptr<Client> Client::create(Config cfg, std::shared_ptr<DeviceManager> devices,
                                       TransportSession::LinkFactory link_factory) {
  auto lg = log::get("client");

  bool expected = false;
  if (!g_client_alive.compare_exchange_strong(expected, true)) {
    lg->error("a Client already exists in this process");
    return nullptr;
  }

  std::string why;
  if (!config::validate(cfg, why)) {
    lg->error("invalid configuration: {}", why);
    g_client_alive.store(false);
    return nullptr;
  }

  InstanceLock lock{std::filesystem::path()};
  if (!cfg.file.empty()) {
    const auto dir = cfg.file.has_parent_path() ? cfg.file.parent_path() : std::filesystem::path(".");
    lock = InstanceLock(dir / "cclink.lock");
    if (!lock.acquire()) {
      lg->error("another cclink process owns '{}'", lock.path().string());
      g_client_alive.store(false);
      return nullptr;
    }
  }

  if (!devices) devices = std::make_shared<MemoryDeviceManager>();
  return std::unique_ptr<Client>(new Client(std::move(cfg), std::move(devices), std::move(lock),
                                            std::move(link_factory)));
}

Client::Client(Config cfg, std::shared_ptr<DeviceManager> devices, InstanceLock lock,
               TransportSession::LinkFactory link_factory)
  : devices_(std::move(devices)),
    cfg_(std::move(cfg)),
    lock_(std::move(lock)),
    log_(log::get("client")),
    session_(cfg_.connector, std::move(link_factory)),
    sync_(*devices_),
    callbacks_("callbacks", cfg_.connector.callback_workers),
    notifier_("notify", 1),
    bridge_(session_, *devices_, sync_, callbacks_, cfg_),
    supervisor_(session_, bridge_, sync_, notifier_, cfg_) {
  session_.set_handlers(
      [this](Message&& msg) { bridge_.on_inbound(std::move(msg)); },
      [this](const std::string& reason) { supervisor_.notify_lost(reason); });
  if (cfg_.api.enabled()) supervisor_.after_sync([this] { sync_hub(); });
}

Config Client::config() const {
  std::lock_guard<std::mutex> lk(hub_mu_);
  return cfg_;
}

// caller holds hub_mu_
void Client::persist_hub(const char* what) {
  if (cfg_.file.empty()) return;
  if (!config::save(cfg_, cfg_.file)) log_->warn("could not persist {} to '{}'", what, cfg_.file.string());
}

/*
 * sync_hub()
 * ----------
 * Supervisor thread after each sync pass, or the application at any time.
 * NotFound leaves hub.id empty; the next start() registers a new hub.
 */
HubSync Client::sync_hub() {
  if (!cfg_.api.enabled()) return HubSync::Failed;

  std::lock_guard<std::mutex> lk(hub_mu_);
  if (cfg_.hub.id.empty()) {
    log_->warn("hub sync skipped: no hub id");
    return HubSync::Failed;
  }
  const HubConfig before = cfg_.hub;
  HubRegistrar hubs(cfg_.api, cfg_.credentials, cfg_.device.id_prefix);
  const HubSync hs = hubs.sync(cfg_.hub, devices_->devices());
  if (cfg_.hub.id != before.id || cfg_.hub.name != before.name) persist_hub("hub settings");
  return hs;
}

Client::~Client() {
  shutdown();
  g_client_alive.store(false);
}

/*
 * start()
 * -------
 * PRE:    created, not shut down.
 * POLICY: the hub prerequisite runs synchronously; the connection itself is
 *         made in the background by the supervisor.
 * OUT:    true once the supervisor runs.
 */
bool Client::start() {
  if (shut_down_) return false;
  if (started_) return true;

  if (!log::init(cfg_.logger)) log_->warn("file logging unavailable, using stderr only");

  if (cfg_.api.enabled()) {
    std::lock_guard<std::mutex> lk(hub_mu_);
    HubRegistrar hubs(cfg_.api, cfg_.credentials, cfg_.device.id_prefix);
    const HubStatus hs = hubs.ensure(cfg_.hub);
    if (hs == HubStatus::Failed) {
      log_->error("hub prerequisite failed, not connecting");
      return false;
    }
    if (hs == HubStatus::Created) persist_hub("hub id");
  }
  supervisor_.credentials().client_id = cfg_.hub.id;

  bridge_.start();
  if (!supervisor_.start()) return false;
  started_ = true;
  log_->info("client started for {}:{} ({})", cfg_.connector.host, cfg_.connector.port, cfg_.connector.protocol);
  return true;
}

void Client::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;

  // Bridge first: in-flight calls (sync included) fail fast instead of
  // holding the supervisor until their deadlines.
  bridge_.stop();
  supervisor_.shutdown();
  callbacks_.stop();
  notifier_.stop();
  lock_.release();
  if (started_) log_->info("client shut down");
}

} // namespace cclink
