#include <doctest/doctest.h>
#include "cclink/correlation_id.hpp"
#include "cclink/correlation_table.hpp"

#include <atomic>
#include <cstdint>
#include <set>
#include <thread>

using namespace cclink;
using Clock = PendingCall::Clock;
using std::chrono::milliseconds;

static std::shared_ptr<PendingCall> make_call(const std::string& id, Clock::time_point deadline) {
    return std::make_shared<PendingCall>(id, deadline);
}

TEST_CASE("Correlation ids: fixed token, monotonic hex sequence") {
    CorrelationIdGenerator gen(0x00ab12cdu);
    CHECK(gen.next() == "00ab12cd-1");
    CHECK(gen.next() == "00ab12cd-2");
    for (int i = 0; i < 13; ++i) gen.next();
    CHECK(gen.next() == "00ab12cd-10");
    CHECK(gen.issued() == 16);
    CHECK(std::string(CorrelationIdGenerator::format(0xffffffffu, UINT64_MAX).c_str()) ==
          "ffffffff-ffffffffffffffff");
}

TEST_CASE("Correlation ids are unique across threads") {
    CorrelationIdGenerator gen;
    std::mutex mu;
    std::set<std::string> seen;
    std::vector<std::thread> ts;
    for (int t = 0; t < 4; ++t) {
        ts.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                auto id = gen.next();
                std::lock_guard<std::mutex> lk(mu);
                seen.insert(std::move(id));
            }
        });
    }
    for (auto& t : ts) t.join();
    CHECK(seen.size() == 2000);
}

TEST_CASE("Register rejects an id already in flight") {
    CorrelationTable table;
    const auto dl = Clock::now() + milliseconds(1000);
    CHECK(table.register_call("a", make_call("a", dl), dl));
    CHECK_FALSE(table.register_call("a", make_call("a", dl), dl));
    CHECK(table.size() == 1);
}

TEST_CASE("Resolve matches at most once") {
    CorrelationTable table;
    const auto dl = Clock::now() + milliseconds(1000);
    auto call = make_call("a", dl);
    REQUIRE(table.register_call("a", call, dl));

    CorrelationTable::Waiter w;
    CHECK(table.resolve("a", w) == Match::Matched);
    CHECK(w == call);

    CorrelationTable::Waiter again;
    CHECK(table.resolve("a", again) == Match::Unmatched);
    CHECK(again == nullptr);
    CHECK(table.resolve("never", again) == Match::Unmatched);
    CHECK_FALSE(table.next_deadline().has_value());
}

TEST_CASE("Expire returns only due entries, earliest deadline first in the index") {
    CorrelationTable table;
    const auto now = Clock::now();
    table.register_call("late", make_call("late", now + milliseconds(500)), now + milliseconds(500));
    table.register_call("due1", make_call("due1", now - milliseconds(5)), now - milliseconds(5));
    table.register_call("due2", make_call("due2", now), now);

    REQUIRE(table.next_deadline().has_value());
    CHECK(*table.next_deadline() == now - milliseconds(5));

    const auto expired = table.expire(now);
    CHECK(expired.size() == 2);
    CHECK(table.contains("late"));
    CHECK_FALSE(table.contains("due1"));
    CHECK(*table.next_deadline() == now + milliseconds(500));

    CHECK(table.take("late") != nullptr);
    CHECK(table.take("late") == nullptr);
    CHECK(table.size() == 0);
}

TEST_CASE("Response and timeout racing on the same call complete it exactly once") {
    for (int round = 0; round < 200; ++round) {
        CorrelationTable table;
        const auto dl = Clock::now();
        std::atomic<int> hook_runs{0};
        auto call = std::make_shared<PendingCall>("r", dl, CallCallback{},
                                                  [&hook_runs](const CallResult&) { hook_runs.fetch_add(1); });
        REQUIRE(table.register_call("r", call, dl));

        std::atomic<int> completions{0};
        std::atomic<bool> go{false};

        std::thread responder([&] {
            while (!go.load()) {}
            CorrelationTable::Waiter w;
            if (table.resolve("r", w) == Match::Matched) {
                CallResult res;
                res.status = CallStatus::Resolved;
                if (w->complete(res)) completions.fetch_add(1);
            }
        });
        std::thread sweeper([&] {
            while (!go.load()) {}
            for (auto& w : table.expire(Clock::now())) {
                CallResult res;
                res.status = CallStatus::TimedOut;
                if (w->complete(res)) completions.fetch_add(1);
            }
        });
        go.store(true);
        responder.join();
        sweeper.join();

        CHECK(completions.load() == 1);
        CHECK(hook_runs.load() == 1);
        CHECK(call->done());
        const auto st = call->result().status;
        CHECK((st == CallStatus::Resolved || st == CallStatus::TimedOut));
    }
}

TEST_CASE("PendingCall completes once and wakes waiters") {
    auto call = std::make_shared<PendingCall>("x", Clock::now() + milliseconds(1000));
    Future f(call);
    CHECK_FALSE(f.done());
    CHECK_FALSE(f.wait_for(milliseconds(10)));

    std::thread t([call] {
        std::this_thread::sleep_for(milliseconds(20));
        CallResult r;
        r.status = CallStatus::Resolved;
        Message m;
        m.kind = MessageKind::Response;
        m.status = 200;
        r.message = m;
        call->complete(r);
    });
    const auto res = f.wait();
    t.join();
    CHECK(res.ok());

    CallResult second;
    second.status = CallStatus::TimedOut;
    CHECK_FALSE(call->complete(second));
    CHECK(f.status() == CallStatus::Resolved);
}

TEST_CASE("An empty Future reports failure") {
    Future f;
    CHECK_FALSE(f.valid());
    CHECK(f.done());
    CHECK(f.status() == CallStatus::Failed);
    CHECK(f.corr_id().empty());
}
