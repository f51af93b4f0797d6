#include <doctest/doctest.h>
#include "cclink/config.hpp"

#include "temp_dir.hpp"

#include <fstream>

using namespace cclink;
using cclink::test::TempDir;
using nlohmann::json;

static json read_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    json j;
    in >> j;
    return j;
}

TEST_CASE("Missing config file is generated with defaults and a device prefix") {
    TempDir dir;
    const auto file = dir / "connector.json";

    const auto cfg = config::load(file);
    REQUIRE(cfg.has_value());
    CHECK(cfg->connector.protocol == "tcp");
    CHECK(cfg->connector.port == 7700);
    CHECK(cfg->logger.level == "info");
    CHECK(cfg->file == file);
    CHECK(cfg->logger.log_dir == (dir / "logs").string());
    CHECK_FALSE(cfg->device.id_prefix.empty());
    CHECK(cfg->device.id_prefix.find('=') == std::string::npos);

    REQUIRE(std::filesystem::exists(file));
    const json j = read_json(file);
    CHECK(j["device"]["id_prefix"] == cfg->device.id_prefix);
    CHECK(j["connector"]["host"] == "localhost");

    // second load keeps the persisted prefix
    const auto again = config::load(file);
    REQUIRE(again.has_value());
    CHECK(again->device.id_prefix == cfg->device.id_prefix);
}

TEST_CASE("Existing config overlays defaults, wrong types keep the default") {
    TempDir dir;
    const auto file = dir / "connector.json";
    {
        std::ofstream out(file);
        out << R"({
          "connector": {"protocol": "tls", "host": "platform.example", "port": 8883, "keepalive_s": "often"},
          "credentials": {"user": "u", "password": "p", "group_id": "g"},
          "logger": {"level": "debug", "rotating_log": true},
          "device": {"id_prefix": "px"}
        })";
    }
    const auto cfg = config::load(file);
    REQUIRE(cfg.has_value());
    CHECK(cfg->connector.secure());
    CHECK(cfg->connector.host == "platform.example");
    CHECK(cfg->connector.port == 8883);
    CHECK(cfg->connector.keepalive_s == 30);
    CHECK(cfg->credentials.user == "u");
    CHECK(cfg->credentials.group_id == "g");
    CHECK(cfg->logger.rotating_log);
    CHECK(cfg->logger.rotating_log_backup_count == 14);
    CHECK(cfg->device.id_prefix == "px");
    CHECK_FALSE(cfg->api.enabled());
}

TEST_CASE("Malformed or invalid config fails to load") {
    TempDir dir;
    const auto file = dir / "connector.json";
    {
        std::ofstream out(file);
        out << "{ \"connector\": ";
    }
    CHECK_FALSE(config::load(file).has_value());

    {
        std::ofstream out(file, std::ios::trunc);
        out << R"({"connector": {"protocol": "udp"}})";
    }
    CHECK_FALSE(config::load(file).has_value());
}

TEST_CASE("Validation ranges") {
    Config cfg;
    std::string why;
    CHECK(config::validate(cfg, why));

    cfg.connector.reconnect_delay_max_ms = 10;
    CHECK_FALSE(config::validate(cfg, why));
    CHECK(why.find("reconnect_delay_max_ms") != std::string::npos);

    cfg = Config{};
    cfg.connector.reconnect_delay_factor = 0.5;
    CHECK_FALSE(config::validate(cfg, why));

    cfg = Config{};
    cfg.connector.callback_workers = 0;
    CHECK_FALSE(config::validate(cfg, why));

    cfg = Config{};
    cfg.api.host = "api.example";
    cfg.api.protocol = "ftp";
    CHECK_FALSE(config::validate(cfg, why));
}

TEST_CASE("Config JSON round trip keeps every section") {
    Config cfg;
    cfg.connector.host = "h";
    cfg.api.host = "api";
    cfg.api.port = 8080;
    cfg.hub.id = "hub-7";
    cfg.hub.name = "garage";
    cfg.credentials.client_id = "not persisted";

    const json j = config::to_json(cfg);
    CHECK_FALSE(j["credentials"].contains("client_id"));

    const Config back = config::from_json(j);
    CHECK(back.connector.host == "h");
    CHECK(back.api.base_url() == "http://api:8080");
    CHECK(back.hub.id == "hub-7");
    CHECK(back.hub.name == "garage");
}
