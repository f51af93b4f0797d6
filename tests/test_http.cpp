#include <doctest/doctest.h>
#include "cclink/client.hpp"
#include "cclink/hub.hpp"
#include "cclink/http_client.hpp"

#include "fake_platform.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <mutex>
#include <thread>

using namespace cclink;
using std::chrono::milliseconds;

namespace {

// Serves one scripted reply per connection, in order; the last one repeats.
class ScriptedHttpServer {
public:
    explicit ScriptedHttpServer(std::vector<std::string> replies) : replies_(std::move(replies)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&a), sizeof(a));
        ::listen(fd_, 8);
        socklen_t len = sizeof(a);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&a), &len);
        port_ = ntohs(a.sin_port);
        thread_ = std::thread([this] { run(); });
    }
    ~ScriptedHttpServer() {
        stop_.store(true);
        thread_.join();
        ::close(fd_);
    }

    std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(port_) + path; }
    int hits() const { return hits_.load(); }
    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lk(mu_);
        return requests_;
    }

private:
    void run() {
        while (!stop_.load()) {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 20) <= 0) continue;
            const int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) continue;

            std::string req;
            char buf[2048];
            while (true) {
                const auto hdr = req.find("\r\n\r\n");
                if (hdr != std::string::npos) {
                    const auto cl = req.find("Content-Length: ");
                    size_t need = 0;
                    if (cl != std::string::npos) need = std::stoul(req.substr(cl + 16));
                    if (req.size() >= hdr + 4 + need) break;
                }
                const ssize_t n = ::recv(c, buf, sizeof(buf), 0);
                if (n <= 0) break;
                req.append(buf, static_cast<size_t>(n));
            }
            {
                std::lock_guard<std::mutex> lk(mu_);
                requests_.push_back(req);
            }
            const int i = hits_.fetch_add(1);
            const std::string& rep = replies_[std::min<size_t>(static_cast<size_t>(i), replies_.size() - 1)];
            ::send(c, rep.data(), rep.size(), MSG_NOSIGNAL);
            ::shutdown(c, SHUT_WR);
            ::close(c);
        }
    }

    std::vector<std::string> replies_;
    int fd_{-1};
    uint16_t port_{0};
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<int> hits_{0};
    mutable std::mutex mu_;
    std::vector<std::string> requests_;
};

std::string json_reply(const std::string& status_line, const std::string& body) {
    return "HTTP/1.1 " + status_line + "\r\nContent-Type: application/json\r\nContent-Length: " +
           std::to_string(body.size()) + "\r\n\r\n" + body;
}

uint16_t port_of(const ScriptedHttpServer& srv) {
    return static_cast<uint16_t>(std::stoi(srv.url("").substr(17)));
}

const std::string R503 = "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n";
const std::string R200 = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\nContent-Type: text/plain\r\n\r\nhello";

} // namespace

TEST_CASE("URL parsing") {
    auto u = http::parse_url("https://api.example.com/hubs?x=1");
    REQUIRE(u.has_value());
    CHECK(u->secure());
    CHECK(u->host == "api.example.com");
    CHECK(u->port == 443);
    CHECK(u->target == "/hubs?x=1");

    u = http::parse_url("http://localhost:8080");
    REQUIRE(u.has_value());
    CHECK(u->port == 8080);
    CHECK(u->target == "/");

    CHECK_FALSE(http::parse_url("ftp://x/").has_value());
    CHECK_FALSE(http::parse_url("http://x:99999/").has_value());
    CHECK_FALSE(http::parse_url("http://:80/").has_value());
    CHECK_FALSE(http::parse_url("localhost/hubs").has_value());
}

TEST_CASE("Response parsing: content-length, chunked, to-EOF and HEAD") {
    http::Response r;
    CHECK(http::parse_response("HTTP/1.1 200 OK\r\nContent-Len", false, false, r) == http::Parse::Incomplete);
    CHECK(http::parse_response("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab", false, false, r) ==
          http::Parse::Incomplete);
    REQUIRE(http::parse_response("HTTP/1.1 201 Created\r\ncontent-length: 4\r\nX-A:  b \r\n\r\nabcd", false, false, r) ==
            http::Parse::Complete);
    CHECK(r.status == 201);
    CHECK(r.body == "abcd");
    CHECK(r.header.at("x-a") == "b");

    const std::string chunked =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n";
    REQUIRE(http::parse_response(chunked, false, false, r) == http::Parse::Complete);
    CHECK(r.body == "Wikipedia");
    CHECK(http::parse_response(chunked.substr(0, chunked.size() - 2), false, false, r) == http::Parse::Incomplete);

    CHECK(http::parse_response("HTTP/1.0 200 OK\r\n\r\nuntil close", false, false, r) == http::Parse::Incomplete);
    REQUIRE(http::parse_response("HTTP/1.0 200 OK\r\n\r\nuntil close", false, true, r) == http::Parse::Complete);
    CHECK(r.body == "until close");

    REQUIRE(http::parse_response("HTTP/1.1 404 Not Found\r\nContent-Length: 10\r\n\r\n", true, false, r) ==
            http::Parse::Complete);
    CHECK(r.status == 404);
    CHECK(r.body.empty());

    CHECK(http::parse_response("SSH-2.0\r\n\r\n", false, false, r) == http::Parse::Bad);
}

TEST_CASE("Header injection is rejected") {
    CHECK(http::is_valid_header("X-Id", "abc"));
    CHECK_FALSE(http::is_valid_header("", "abc"));
    CHECK_FALSE(http::is_valid_header("X-Id", "a\r\nEvil: 1"));
    CHECK_FALSE(http::is_valid_header("X:Id", "a"));
}

TEST_CASE("Server errors are retried up to the attempt budget") {
    ScriptedHttpServer srv({R503, R503, R200});
    http::RequestOptions o;
    o.retries = 3;
    o.retry_delay = milliseconds(20);
    o.timeout = milliseconds(1000);

    const auto t0 = std::chrono::steady_clock::now();
    const auto r = http::get(srv.url("/status"), o);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    REQUIRE(r.has_value());
    CHECK(r->status == 200);
    CHECK(r->body == "hello");
    CHECK(srv.hits() == 3);
    CHECK(elapsed >= milliseconds(40));
}

TEST_CASE("The last server error is surfaced when retries run out") {
    ScriptedHttpServer srv({R503});
    http::RequestOptions o;
    o.retries = 2;
    const auto r = http::post(srv.url("/x"), "{}", o);
    REQUIRE(r.has_value());
    CHECK(r->status == 503);
    CHECK(srv.hits() == 2);
}

TEST_CASE("Client errors are not retried; zero retries still makes one attempt") {
    ScriptedHttpServer srv({"HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n"});
    http::RequestOptions o;
    o.retries = 0;
    const auto r = http::head(srv.url("/hubs/7"), o);
    REQUIRE(r.has_value());
    CHECK(r->status == 404);
    CHECK(srv.hits() == 1);
}

TEST_CASE("Unreachable host yields no response") {
    http::RequestOptions o;
    o.retries = 2;
    o.timeout = milliseconds(300);
    CHECK_FALSE(http::get("http://127.0.0.1:1/", o).has_value());
}

TEST_CASE("Hub registrar creates a hub when none is known") {
    ScriptedHttpServer srv({"HTTP/1.1 201 Created\r\nContent-Length: 14\r\n\r\n{\"id\":\"hub-9\"}"});
    ApiConfig api;
    api.host = "127.0.0.1";
    api.port = static_cast<uint16_t>(std::stoi(srv.url("").substr(17)));
    Credentials creds;
    creds.user = "u";
    creds.password = "p";

    HubConfig hub;
    hub.name = "garage";
    HubRegistrar reg(api, creds);
    CHECK(reg.ensure(hub) == HubStatus::Created);
    CHECK(hub.id == "hub-9");

    const auto reqs = srv.requests();
    REQUIRE(reqs.size() == 1);
    CHECK(reqs[0].rfind("POST /hubs HTTP/1.1\r\n", 0) == 0);
    CHECK(reqs[0].find("Authorization: Basic dTpw\r\n") != std::string::npos);
    CHECK(reqs[0].find("{\"name\":\"garage\"}") != std::string::npos);
}

TEST_CASE("Hub registrar confirms a known hub and replaces a forgotten one") {
    ScriptedHttpServer ok({"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n"});
    ApiConfig api;
    api.host = "127.0.0.1";
    api.port = static_cast<uint16_t>(std::stoi(ok.url("").substr(17)));
    HubConfig hub;
    hub.id = "hub-1";
    CHECK(HubRegistrar(api, {}).ensure(hub) == HubStatus::Ok);
    CHECK(hub.id == "hub-1");
    CHECK(ok.requests().at(0).rfind("HEAD /hubs/hub-1 ", 0) == 0);

    ScriptedHttpServer gone({"HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n",
                             "HTTP/1.1 200 OK\r\nContent-Length: 14\r\n\r\n{\"id\":\"hub-2\"}"});
    api.port = static_cast<uint16_t>(std::stoi(gone.url("").substr(17)));
    CHECK(HubRegistrar(api, {}).ensure(hub) == HubStatus::Created);
    CHECK(hub.id == "hub-2");
    CHECK_FALSE(hub.name.empty());  // generated, so it can be persisted with the id
    CHECK(gone.requests().at(1).find("{\"name\":\"" + hub.name + "\"}") != std::string::npos);
}

TEST_CASE("Generated hub names and device set hashes") {
    const auto t = std::chrono::system_clock::from_time_t(1609459200);  // 2021-01-01T00:00:00Z
    CHECK(default_hub_name("alice", t) == "alice-2021-01-01T00:00:00");

    const Device a{"d1", "sensor", "kitchen"};
    const Device b{"d2", "lamp", "porch"};
    CHECK(devices_hash({a, b}) == devices_hash({b, a}));
    CHECK(devices_hash({a, b}) != devices_hash({a}));
    CHECK(devices_hash({}).size() == 40);

    Device renamed = b;
    renamed.set_name("back porch");
    CHECK(devices_hash({a, b}) != devices_hash({a, renamed}));
}

TEST_CASE("Hub sync leaves an up-to-date hub alone") {
    const std::vector<Device> devs{Device{"d1", "sensor", "kitchen"}};
    ScriptedHttpServer srv({json_reply("200 OK", "{\"id\":\"hub-1\",\"name\":\"garage\",\"hash\":\"" +
                                                     devices_hash(devs) + "\"}")});
    ApiConfig api;
    api.host = "127.0.0.1";
    api.port = port_of(srv);
    HubConfig hub{"hub-1", "garage"};

    CHECK(HubRegistrar(api, {}, "px").sync(hub, devs) == HubSync::Unchanged);
    CHECK(srv.hits() == 1);
    CHECK(srv.requests().at(0).rfind("GET /hubs/hub-1 ", 0) == 0);
    CHECK(hub.id == "hub-1");
}

TEST_CASE("Hub sync adopts the platform name and pushes a changed device list") {
    const std::vector<Device> devs{Device{"d1", "sensor", "kitchen"}, Device{"d2", "lamp", "porch"}};
    ScriptedHttpServer srv({json_reply("200 OK", "{\"id\":\"hub-1\",\"name\":\"shed\",\"hash\":null}"),
                            json_reply("200 OK", "{}")});
    ApiConfig api;
    api.host = "127.0.0.1";
    api.port = port_of(srv);
    HubConfig hub{"hub-1", "garage"};

    CHECK(HubRegistrar(api, {}, "px").sync(hub, devs) == HubSync::Updated);
    CHECK(hub.name == "shed");

    const auto reqs = srv.requests();
    REQUIRE(reqs.size() == 2);
    CHECK(reqs[1].rfind("PUT /hubs/hub-1 ", 0) == 0);
    const auto body = nlohmann::json::parse(reqs[1].substr(reqs[1].find("\r\n\r\n") + 4));
    CHECK(body["id"] == "hub-1");
    CHECK(body["name"] == "shed");
    CHECK(body["hash"] == devices_hash(devs));
    CHECK(body["device_local_ids"] == nlohmann::json::array({"px-d1", "px-d2"}));
}

TEST_CASE("Hub sync forgets a hub the platform no longer knows") {
    ScriptedHttpServer srv({"HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n"});
    ApiConfig api;
    api.host = "127.0.0.1";
    api.port = port_of(srv);
    HubConfig hub{"hub-1", "garage"};

    CHECK(HubRegistrar(api, {}).sync(hub, {}) == HubSync::NotFound);
    CHECK(hub.id.empty());
    CHECK(hub.name == "garage");
    CHECK(srv.hits() == 1);

    CHECK(HubRegistrar(api, {}).sync(hub, {}) == HubSync::Failed);  // no id, no request
    CHECK(srv.hits() == 1);
}

TEST_CASE("Client pushes its device list to the hub after synchronizing") {
    ScriptedHttpServer api_srv({"HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n",
                                json_reply("200 OK", "{\"id\":\"hub-1\",\"name\":\"garage\",\"hash\":null}"),
                                json_reply("200 OK", "{}")});
    cclink::test::FakePlatform platform;

    Config cfg;
    cfg.connector.host = "127.0.0.1";
    cfg.connector.port = platform.port();
    cfg.connector.keepalive_s = 0;
    cfg.connector.handshake_timeout_ms = 1000;
    cfg.api.host = "127.0.0.1";
    cfg.api.port = port_of(api_srv);
    cfg.hub.id = "hub-1";
    cfg.hub.name = "garage";
    cfg.device.id_prefix = "px";

    auto client = Client::create(cfg);
    REQUIRE(client != nullptr);
    client->devices().add(Device{"d1", "sensor", "kitchen"});
    REQUIRE(client->start());
    REQUIRE(client->wait_ready(milliseconds(5000)));

    // HEAD (prerequisite), GET and PUT (hub sync) all happen before traffic is accepted
    CHECK(api_srv.hits() == 3);
    const auto reqs = api_srv.requests();
    REQUIRE(reqs.size() == 3);
    CHECK(reqs[0].rfind("HEAD /hubs/hub-1 ", 0) == 0);
    CHECK(reqs[2].rfind("PUT /hubs/hub-1 ", 0) == 0);
    CHECK(reqs[2].find("px-d1") != std::string::npos);
    CHECK(platform.auths() == 1);
    CHECK(platform.received("register").at(0).device_id == "px-d1");
    client->shutdown();
}
