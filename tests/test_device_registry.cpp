#include "bulbs/core/DeviceRegistry.hpp"
#include "bulbs/core/Error.hpp"

#include "support/TestAssert.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace bulbs::core;
using bulbs::unexpected;

static DeviceState makeState(bool on, int brightness, const char* color) {
    DeviceState state;
    state.power = on;
    state.brightness = *Brightness::make(brightness);
    state.color = *Rgb::parse(color);
    return state;
}

static void testUpsertAndSnapshot() {
    DeviceRegistry registry;
    const DeviceAddress a("10.0.0.10");
    const DeviceAddress b("10.0.0.9");

    ASSERT_TRUE(registry.add(a, "desk"), "first add inserts");
    ASSERT_TRUE(!registry.add(a, "other"), "second add is refused");

    registry.upsert(a, makeState(true, 40, "#112233"));
    registry.upsert(b, makeState(false, 100, "#FFFFFF"));
    registry.upsert(a, makeState(false, 50, "#445566"));

    auto snap = registry.snapshot();
    ASSERT_EQ(snap.size(), static_cast<std::size_t>(2), "one entry per address");
    if (snap.size() == 2) {
        ASSERT_EQ(snap[0].address, b, "sorted numerically");
        ASSERT_EQ(snap[1].address, a, "10.0.0.10 last");
        ASSERT_EQ(snap[1].name, std::string("desk"), "name survives upsert");
        ASSERT_TRUE(snap[1].state.has_value(), "state recorded");
        if (snap[1].state) {
            ASSERT_EQ(snap[1].state->brightness.value(), 50, "latest state wins");
            ASSERT_TRUE(!snap[1].state->power, "latest power wins");
        }
        ASSERT_TRUE(snap[1].health == Health::Reachable, "state implies reachable");
    }

    // The snapshot is a copy.
    snap.clear();
    ASSERT_EQ(registry.size(), static_cast<std::size_t>(2), "registry unaffected by snapshot edits");
}

static void testHealthOnlyUpsert() {
    DeviceRegistry registry;
    const DeviceAddress a("10.0.0.1");
    registry.upsert(a, makeState(true, 80, "#FF0000"));
    registry.upsert(a, Health::Unreachable);

    auto device = registry.find(a);
    ASSERT_TRUE(device.has_value(), "device present");
    if (device) {
        ASSERT_TRUE(device->health == Health::Unreachable, "health updated");
        ASSERT_TRUE(device->state.has_value(), "last state kept");
    }

    registry.upsert(DeviceAddress("10.0.0.2"), Health::Unknown);
    ASSERT_EQ(registry.size(), static_cast<std::size_t>(2), "health upsert creates entry");
}

static void testApplyResults() {
    DeviceRegistry registry;
    const DeviceAddress ok("10.0.0.1");
    const DeviceAddress slow("10.0.0.2");
    const DeviceAddress garbled("10.0.0.3");
    const DeviceAddress skipped("10.0.0.4");

    ResultMap results;
    results.emplace(ok, makeState(true, 80, "#FF0000"));
    results.emplace(slow, CommandResult(unexpected(DeviceFailure{FailureKind::Timeout, {}, ""})));
    results.emplace(garbled, CommandResult(unexpected(DeviceFailure{FailureKind::ProtocolError, {}, "bad"})));
    results.emplace(skipped, CommandResult(unexpected(DeviceFailure{FailureKind::NotAttempted, {}, ""})));

    registry.apply(results);
    registry.apply(ResultMap{{slow, CommandResult(unexpected(DeviceFailure{FailureKind::ConnectionError, {}, ""}))}});

    auto okDevice = registry.find(ok);
    ASSERT_TRUE(okDevice && okDevice->health == Health::Reachable, "success -> reachable");
    if (okDevice && okDevice->state) {
        ASSERT_EQ(okDevice->state->color, *Rgb::parse("#FF0000"), "color recorded");
    }

    auto slowDevice = registry.find(slow);
    ASSERT_TRUE(slowDevice && slowDevice->health == Health::Unreachable, "timeout -> unreachable");
    if (slowDevice) {
        ASSERT_EQ(slowDevice->consecutiveFailures, 2u, "failures counted in a row");
        ASSERT_TRUE(!slowDevice->state, "no state invented for a failed device");
    }

    auto garbledDevice = registry.find(garbled);
    ASSERT_TRUE(garbledDevice && garbledDevice->health == Health::Unknown,
                "protocol error leaves health alone");

    registry.apply(ResultMap{{slow, makeState(false, 10, "#000000")}});
    slowDevice = registry.find(slow);
    ASSERT_TRUE(slowDevice && slowDevice->consecutiveFailures == 0, "success resets failure count");
}

static void testConcurrentUpserts() {
    DeviceRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kRounds = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < kRounds; ++i) {
                const DeviceAddress address("10.0.1." + std::to_string(i % 16));
                registry.upsert(address, makeState(i % 2 == 0, (t * 7 + i) % 101, "#010203"));
                (void)registry.snapshot();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto snap = registry.snapshot();
    ASSERT_EQ(snap.size(), static_cast<std::size_t>(16), "no duplicates under concurrency");
    for (const auto& device : snap) {
        ASSERT_TRUE(device.state.has_value(), "every entry has a state");
    }
}

static void testRemove() {
    DeviceRegistry registry;
    const DeviceAddress a("10.0.0.1");
    registry.add(a);
    ASSERT_TRUE(registry.remove(a), "remove existing");
    ASSERT_TRUE(!registry.remove(a), "remove missing");
    ASSERT_TRUE(!registry.find(a), "gone");
}

int main() {
    testUpsertAndSnapshot();
    testHealthOnlyUpsert();
    testApplyResults();
    testConcurrentUpserts();
    testRemove();
    return finishTests("DeviceRegistry");
}
