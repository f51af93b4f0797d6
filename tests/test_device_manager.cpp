#include <doctest/doctest.h>
#include "cclink/file_device_manager.hpp"
#include "cclink/instance_lock.hpp"
#include "cclink/memory_device_manager.hpp"

#include "temp_dir.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <thread>

using namespace cclink;
using cclink::test::TempDir;

TEST_CASE("Memory manager add/update/remove outcomes") {
    MemoryDeviceManager dm;
    Device d1{"d1", "sensor", "kitchen"};

    CHECK(dm.add(d1) == LocalStatus::Ok);
    CHECK(dm.add(d1) == LocalStatus::Exists);
    CHECK(dm.add(Device{"", "sensor", "x"}) == LocalStatus::Invalid);

    d1.set_name("hall");
    CHECK(dm.update(d1) == LocalStatus::Ok);
    REQUIRE(dm.get("d1").has_value());
    CHECK(dm.get("d1")->name() == "hall");
    CHECK(dm.get("d1")->hash() == d1.hash());

    CHECK(dm.update(Device{"nope", "sensor", "x"}) == LocalStatus::NotFound);
    CHECK(dm.remove("nope") == LocalStatus::NotFound);
    CHECK(dm.remove("d1") == LocalStatus::Ok);
    CHECK_FALSE(dm.get("d1").has_value());
    CHECK(dm.devices().empty());
}

TEST_CASE("Memory manager is safe under concurrent adds") {
    MemoryDeviceManager dm;
    std::vector<std::thread> ts;
    for (int t = 0; t < 4; ++t) {
        ts.emplace_back([&dm, t] {
            for (int i = 0; i < 50; ++i) dm.add(Device{"d" + std::to_string(t * 100 + i), "sensor", ""});
        });
    }
    for (auto& t : ts) t.join();
    CHECK(dm.size() == 200);
    CHECK(dm.clear() == LocalStatus::Ok);
    CHECK(dm.size() == 0);
}

TEST_CASE("DeviceRef resolves by id or carries the instance") {
    MemoryDeviceManager dm;
    dm.add(Device{"d1", "sensor", "kitchen"});

    DeviceRef by_id("d1");
    CHECK_FALSE(by_id.by_instance());
    REQUIRE(by_id.resolve(dm).has_value());
    CHECK(by_id.resolve(dm)->name() == "kitchen");

    DeviceRef missing(std::string("d9"));
    CHECK_FALSE(missing.resolve(dm).has_value());

    DeviceRef inst(Device{"d2", "lamp", "porch"});
    CHECK(inst.by_instance());
    CHECK(inst.id() == "d2");
    CHECK(inst.resolve(dm)->type() == "lamp");
}

TEST_CASE("File manager persists every mutation and reloads it") {
    TempDir dir;
    const auto file = dir / "devices.json";

    {
        auto dm = FileDeviceManager::open(file);
        REQUIRE(dm != nullptr);
        CHECK(dm->add(Device{"d1", "sensor", "kitchen", {{"unit", "C"}}}) == LocalStatus::Ok);
        CHECK(dm->add(Device{"d2", "lamp", "porch"}) == LocalStatus::Ok);
        CHECK(dm->remove("d2") == LocalStatus::Ok);
    }

    auto dm = FileDeviceManager::open(file);
    REQUIRE(dm != nullptr);
    CHECK(dm->size() == 1);
    REQUIRE(dm->get("d1").has_value());
    CHECK(dm->get("d1")->tags().at("unit") == "C");
}

TEST_CASE("File manager allows a single owner") {
    TempDir dir;
    const auto file = dir / "devices.json";

    auto first = FileDeviceManager::open(file);
    REQUIRE(first != nullptr);
    CHECK(FileDeviceManager::open(file) == nullptr);

    first.reset();
    CHECK(FileDeviceManager::open(file) != nullptr);
}

TEST_CASE("File manager refuses a store that is not a device array") {
    TempDir dir;
    const auto file = dir / "devices.json";
    {
        std::ofstream out(file);
        out << R"({"d1": {}})";
    }
    CHECK(FileDeviceManager::open(file) == nullptr);

    {
        std::ofstream out(file, std::ios::trunc);
        out << R"([{"id":"d1","type":"sensor","name":"k"}, {"name":"no id"}])";
    }
    auto dm = FileDeviceManager::open(file);
    REQUIRE(dm != nullptr);
    CHECK(dm->size() == 1);
}

TEST_CASE("InstanceLock is exclusive and released on destruction") {
    TempDir dir;
    InstanceLock a(dir / "x.lock");
    REQUIRE(a.acquire());
    CHECK(a.held());

    InstanceLock b(dir / "x.lock");
    CHECK_FALSE(b.acquire());

    InstanceLock moved(std::move(a));
    CHECK(moved.held());
    CHECK_FALSE(a.held());

    moved.release();
    CHECK(b.acquire());
}
