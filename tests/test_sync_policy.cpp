#include <doctest/doctest.h>
#include "cclink/device_sync.hpp"
#include "cclink/memory_device_manager.hpp"

#include <set>

using namespace cclink;
using std::chrono::milliseconds;

namespace {

// Records calls; answers 200 unless the device id is in `refuse` or `silent`.
class ScriptedChannel : public RegistrationChannel {
public:
    std::vector<std::string> registered;
    std::vector<std::string> updated;
    std::set<std::string> refuse;
    std::set<std::string> silent;
    std::function<void()> on_call;

    CallResult register_device(const Device& dev, milliseconds) override {
        registered.push_back(dev.id());
        return answer(dev);
    }
    CallResult update_device(const Device& dev, milliseconds) override {
        updated.push_back(dev.id());
        return answer(dev);
    }

private:
    CallResult answer(const Device& dev) {
        if (on_call) on_call();
        CallResult r;
        if (silent.count(dev.id())) {
            r.status = CallStatus::TimedOut;
            return r;
        }
        Message m;
        m.kind = MessageKind::Response;
        m.status = refuse.count(dev.id()) ? 500 : 200;
        r.status = CallStatus::Resolved;
        r.message = m;
        return r;
    }
};

const auto always = [] { return true; };

} // namespace

TEST_CASE("Decide: no record or not registered registers, same hash skips, new hash updates") {
    Device d{"d1", "sensor", "kitchen"};
    CHECK(DeviceSync::decide(std::nullopt, d) == DeviceSync::Action::Register);
    CHECK(DeviceSync::decide(SyncRecord{SyncState::NotRegistered, {}}, d) == DeviceSync::Action::Register);
    CHECK(DeviceSync::decide(SyncRecord{SyncState::DisconnectedPending, {}}, d) == DeviceSync::Action::Register);
    CHECK(DeviceSync::decide(SyncRecord{SyncState::Registered, d.hash()}, d) == DeviceSync::Action::Skip);
    CHECK(DeviceSync::decide(SyncRecord{SyncState::Registered, "stale"}, d) == DeviceSync::Action::Update);
}

TEST_CASE("Resync registers new devices, updates changed ones and skips the rest") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    ScriptedChannel ch;

    Device d1{"d1", "sensor", "kitchen"};
    Device d2{"d2", "lamp", "porch"};
    dm.add(d1);
    dm.add(d2);

    auto rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.registered == 2);
    CHECK(ch.updated.empty());
    REQUIRE(sync.record("d1").has_value());
    CHECK(sync.record("d1")->state == SyncState::Registered);
    CHECK(sync.record("d1")->hash == d1.hash());

    // second pass: nothing changed
    ch.registered.clear();
    rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.skipped == 2);
    CHECK(ch.registered.empty());
    CHECK(ch.updated.empty());

    // change d2, add d3
    d2.set_name("back porch");
    dm.update(d2);
    dm.add(Device{"d3", "sensor", "attic"});
    rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.registered == 1);
    CHECK(rep.updated == 1);
    CHECK(rep.skipped == 1);
    CHECK(ch.registered == std::vector<std::string>{"d3"});
    CHECK(ch.updated == std::vector<std::string>{"d2"});
    CHECK(sync.record("d2")->hash == d2.hash());
    CHECK(sync.passes() == 3);
}

TEST_CASE("Failed entries stay unregistered and are retried on the next pass only") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    ScriptedChannel ch;
    dm.add(Device{"d1", "sensor", "kitchen"});
    dm.add(Device{"d2", "sensor", "hall"});
    ch.refuse.insert("d1");
    ch.silent.insert("d2");

    auto rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.failed == 2);
    CHECK(ch.registered.size() == 2);  // one attempt each
    CHECK(sync.record("d1")->state == SyncState::NotRegistered);
    CHECK(sync.record("d2")->state == SyncState::NotRegistered);

    ch.refuse.clear();
    ch.silent.clear();
    rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.registered == 2);
}

TEST_CASE("A failure does not demote a device the platform already knows") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    Device d{"d1", "sensor", "kitchen"};
    dm.add(d);
    sync.mark_registered("d1", d.hash());

    sync.note_failure("d1");
    CHECK(sync.record("d1")->state == SyncState::Registered);
}

TEST_CASE("Devices absent locally are never deleted remotely") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    ScriptedChannel ch;
    sync.mark_registered("gone", "h");

    const auto rep = sync.run(ch, milliseconds(100), always);
    CHECK(rep.registered + rep.updated + rep.failed == 0);
    CHECK(sync.record("gone").has_value());
}

TEST_CASE("A lost connection aborts the pass") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    ScriptedChannel ch;
    dm.add(Device{"d1", "sensor", "a"});
    dm.add(Device{"d2", "sensor", "b"});
    dm.add(Device{"d3", "sensor", "c"});

    bool connected = true;
    ch.on_call = [&connected] { connected = false; };
    const auto rep = sync.run(ch, milliseconds(100), [&connected] { return connected; });
    CHECK(rep.aborted);
    CHECK(ch.registered.size() == 1);
}

TEST_CASE("Disconnect and delete outcomes drive the record") {
    MemoryDeviceManager dm;
    DeviceSync sync(dm);
    sync.mark_registered("d1", "h");
    sync.mark_disconnected("d1");
    CHECK(sync.record("d1")->state == SyncState::DisconnectedPending);
    sync.forget("d1");
    CHECK_FALSE(sync.record("d1").has_value());
    CHECK(std::string(sync_state_name(SyncState::Registered)) == "registered");
}
