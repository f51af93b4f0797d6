#include <doctest/doctest.h>
#include "cclink/logging.hpp"
#include "temp_dir.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace cclink;
namespace fs = std::filesystem;

namespace {

// Concatenated contents of every file in dir whose name starts with prefix.
std::string read_logs(const fs::path& dir, const std::string& prefix) {
    std::string out;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().filename().string().rfind(prefix, 0) != 0) continue;
        std::ifstream in(e.path());
        std::stringstream ss;
        ss << in.rdbuf();
        out += ss.str();
    }
    return out;
}

} // namespace

TEST_CASE("Level names map onto spdlog levels") {
    CHECK(log::parse_level("debug") == spdlog::level::debug);
    CHECK(log::parse_level("warning") == spdlog::level::warn);
    CHECK(log::parse_level("warn") == spdlog::level::warn);
    CHECK(log::parse_level("critical") == spdlog::level::critical);
    CHECK(log::parse_level("chatty") == spdlog::level::info);
}

TEST_CASE("A component logger keeps its identity and logs while init reconfigures sinks") {
    test::TempDir tmp;
    auto lg = log::get("logtest");
    CHECK(lg->name() == "cclink.logtest");

    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 300; ++i) lg->error("reconfigure pass {}", i);
        done.store(true);
    });

    LoggerConfig with_file;
    with_file.level = "error";
    with_file.rotating_log = true;
    with_file.log_dir = tmp.path().string();
    LoggerConfig plain;
    plain.level = "error";

    int inits = 0;
    while (!done.load()) {
        CHECK(log::init((inits++ % 2) ? plain : with_file));
    }
    writer.join();

    CHECK(log::get("logtest") == lg);

    REQUIRE(log::init(with_file));
    CHECK(lg->level() == spdlog::level::err);
    lg->critical("after reconfigure");
    lg->flush();
    CHECK(read_logs(tmp.path(), "connector").find("[cclink.logtest] after reconfigure") != std::string::npos);

    log::init(LoggerConfig{});
    CHECK(lg->level() == spdlog::level::info);
}
