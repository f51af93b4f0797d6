/**
 * @file main.cpp
 * @brief cclink-cli - operator tool around cclink::Client.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) and load/generate the JSON config.
 *  - Open the device store (file-backed with --store, else in memory) and add --device entries.
 *  - Start the client, print connect/disconnect transitions.
 *  - Serve platform tasks until SIGINT/SIGTERM; with --echo reply with the task payload.
 *
 * Notes:
 *  - Device syntax: id:type[:name]. Devices are added locally even while offline; they are
 *    registered by the synchronization pass once the connection is up.
 *  - Exit codes: 0 clean shutdown, 1 startup failure, 2 usage error.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>

#include "cclink/client.hpp"
#include "cclink/config.hpp"
#include "cclink/file_device_manager.hpp"
#include "cclink/logging.hpp"
#include "cclink/memory_device_manager.hpp"

namespace fs = std::filesystem;
using namespace cclink;

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop.store(true); }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

// "id:type[:name]" -> Device; name defaults to id.
static bool parse_device(const std::string& arg, Device& out) {
  const auto a = arg.find(':');
  if (a == std::string::npos || a == 0) return false;
  const auto b = arg.find(':', a + 1);
  const std::string id   = arg.substr(0, a);
  const std::string type = arg.substr(a + 1, b == std::string::npos ? std::string::npos : b - a - 1);
  const std::string name = b == std::string::npos ? id : arg.substr(b + 1);
  if (type.empty()) return false;
  out = Device(id, type, name);
  return true;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_store;
  std::vector<std::string> opt_devices;
  bool opt_echo{false};
  bool opt_verbose{false};
  bool opt_no_color{false};

  CLI::App app{"cclink client: connect, register devices, serve tasks"};

  app.add_option("-c,--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/cclink/connector.json)");
  app.add_option("--store", opt_store, "Persist devices in this JSON file (single owner)");
  app.add_option("-d,--device", opt_devices, "Device to add, id:type[:name] (repeatable)");
  app.add_flag("--echo", opt_echo, "Reply to every task with its own payload");
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout();

  std::vector<Device> to_add;
  for (const auto& arg : opt_devices) {
    Device d;
    if (!parse_device(arg, d)) {
      std::cerr << ansi.red("error: bad --device '" + arg + "', expected id:type[:name]") << "\n";
      return 2;
    }
    to_add.push_back(std::move(d));
  }

  const fs::path cfg_file = opt_config.empty() ? config::default_file() : fs::path(opt_config);
  auto cfg = config::load(cfg_file);
  if (!cfg) {
    std::cerr << ansi.red("error: cannot load config " + cfg_file.string()) << "\n";
    return 1;
  }
  if (opt_verbose) cfg->logger.level = "debug";
  log::init(cfg->logger);

  std::shared_ptr<DeviceManager> devices;
  if (!opt_store.empty()) {
    std::shared_ptr<FileDeviceManager> store = FileDeviceManager::open(opt_store);
    if (!store) {
      std::cerr << ansi.red("error: device store " + opt_store + " is locked or unreadable") << "\n";
      return 1;
    }
    devices = std::move(store);
  } else {
    devices = std::make_shared<MemoryDeviceManager>();
  }

  auto client = Client::create(*cfg, devices);
  if (!client) {
    std::cerr << ansi.red("error: another cclink client is running for this config") << "\n";
    return 1;
  }

  client->on_connect([&ansi] { std::cout << ansi.green("connected") << std::endl; });
  client->on_disconnect([&ansi] { std::cout << ansi.red("disconnected") << std::endl; });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (!client->start()) {
    std::cerr << ansi.red("error: client failed to start") << "\n";
    return 1;
  }

  // Non-blocking: local add is immediate, registration happens when the link is up.
  for (const auto& d : to_add) {
    CallOptions opts;
    opts.block = false;
    const std::string id = d.id();
    opts.callback = [id, &ansi](const CallResult& r) {
      std::cout << ansi.dim("register " + id + ": " + call_status_name(r.status)) << std::endl;
    };
    const auto res = client->add(d, opts);
    if (!res.local_ok()) {
      std::cout << ansi.dim("local add " + id + ": " + local_status_name(res.local)) << std::endl;
    }
  }

  std::cout << ansi.bold("serving ") << cfg->connector.host << ":" << cfg->connector.port
            << ansi.dim(" (Ctrl-C to stop)") << std::endl;

  while (!g_stop.load()) {
    auto task = client->receive(std::chrono::milliseconds(250));
    if (!task) continue;

    std::cout << ansi.bold("task ") << task->corr_id << " device=" << task->device_id
              << " service=" << task->service << " payload=" << task->payload << std::endl;

    if (opt_echo) {
      CallOptions opts;
      opts.block = false;
      client->response(*task, task->payload, opts);
    }
  }

  client->shutdown();
  std::cout << ansi.dim("bye") << std::endl;
  return 0;
}
