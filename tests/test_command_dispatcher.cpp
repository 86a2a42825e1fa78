#include "bulbs/core/CommandDispatcher.hpp"
#include "bulbs/core/DeviceRegistry.hpp"
#include "bulbs/core/Error.hpp"

#include "support/TestAssert.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace bulbs::core;
using namespace std::chrono_literals;
using bulbs::unexpected;

namespace {

/// Scriptable transport: records calls and tracks peak concurrency.
class FakeTransport : public DeviceTransport {
public:
    std::function<CommandResult(const DeviceAddress&)> behaviour;
    std::chrono::milliseconds delay{0};

    CommandResult execute(const DeviceAddress& address, const Operation&,
                          std::chrono::milliseconds timeout) override {
        const int now = inFlight.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        calls.fetch_add(1);
        lastTimeout.store(timeout.count());

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        CommandResult result = behaviour ? behaviour(address) : CommandResult(DeviceState{});
        inFlight.fetch_sub(1);
        return result;
    }

    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};
    std::atomic<long long> lastTimeout{0};
};

std::set<DeviceAddress> makeTargets(int count) {
    std::set<DeviceAddress> targets;
    for (int i = 1; i <= count; ++i) {
        targets.emplace("10.0.2." + std::to_string(i));
    }
    return targets;
}

} // namespace

static void testOneResultPerTarget() {
    auto transport = std::make_shared<FakeTransport>();
    CommandDispatcher dispatcher(transport);

    const auto command = *Command::make(SetPower{true}, makeTargets(20));
    auto results = dispatcher.dispatch(command);
    ASSERT_TRUE(results.has_value(), "dispatch succeeds");
    if (results) {
        ASSERT_EQ(results->size(), static_cast<std::size_t>(20), "one result per target");
        for (const auto& target : command.targets) {
            ASSERT_TRUE(results->count(target) == 1, "target present in results");
        }
    }
    ASSERT_EQ(transport->calls.load(), 20, "one call per target");
}

static void testFailureIsolation() {
    const DeviceAddress bad("10.0.2.3");
    auto transport = std::make_shared<FakeTransport>();
    transport->behaviour = [bad](const DeviceAddress& address) -> CommandResult {
        if (address == bad) {
            return unexpected(DeviceFailure{FailureKind::ConnectionError, {}, "refused"});
        }
        DeviceState state;
        state.power = true;
        return state;
    };
    CommandDispatcher dispatcher(transport);

    auto results = dispatcher.dispatch(*Command::make(SetPower{true}, makeTargets(5)));
    ASSERT_TRUE(results.has_value(), "dispatch succeeds");
    if (!results) return;

    int okCount = 0;
    for (const auto& [address, result] : *results) {
        if (result) {
            ++okCount;
            ASSERT_TRUE(address != bad, "only the bad address fails");
        } else {
            ASSERT_EQ(address, bad, "failure attributed to its own address");
        }
    }
    ASSERT_EQ(okCount, 4, "other devices unaffected");
}

static void testThrowingTransportStaysLocal() {
    const DeviceAddress bad("10.0.2.2");
    auto transport = std::make_shared<FakeTransport>();
    transport->behaviour = [bad](const DeviceAddress& address) -> CommandResult {
        if (address == bad) {
            throw std::runtime_error("boom");
        }
        return DeviceState{};
    };
    CommandDispatcher dispatcher(transport);

    auto results = dispatcher.dispatch(*Command::make(QueryStatus{}, makeTargets(3)));
    ASSERT_TRUE(results && results->size() == 3, "all targets reported");
    if (results) {
        const auto& failed = results->at(bad);
        ASSERT_TRUE(!failed && failed.error().kind == FailureKind::ProtocolError,
                    "exception becomes a protocol error");
    }
}

static void testConcurrencyBound() {
    auto transport = std::make_shared<FakeTransport>();
    transport->delay = 30ms;
    CommandDispatcher::Options options;
    options.maxInFlight = 3;
    CommandDispatcher dispatcher(transport, options);

    auto results = dispatcher.dispatch(*Command::make(Toggle{}, makeTargets(12)));
    ASSERT_TRUE(results && results->size() == 12, "all targets answered");
    ASSERT_TRUE(transport->peak.load() <= 3, "in-flight never exceeds the bound");
    ASSERT_TRUE(transport->peak.load() >= 2, "requests actually overlap");
}

static void testRequestsRunConcurrently() {
    auto transport = std::make_shared<FakeTransport>();
    transport->delay = 200ms;
    CommandDispatcher dispatcher(transport);

    const auto start = std::chrono::steady_clock::now();
    auto results = dispatcher.dispatch(*Command::make(QueryStatus{}, makeTargets(8)));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_TRUE(results.has_value(), "dispatch succeeds");
    ASSERT_TRUE(elapsed < 1000ms, "eight 200ms requests overlap instead of queueing");
}

static void testRequestTimeoutForwarded() {
    auto transport = std::make_shared<FakeTransport>();
    CommandDispatcher::Options options;
    options.requestTimeout = 250ms;
    CommandDispatcher dispatcher(transport, options);

    (void)dispatcher.dispatch(*Command::make(QueryStatus{}, makeTargets(1)));
    ASSERT_EQ(transport->lastTimeout.load(), 250LL, "per-request timeout reaches the transport");
}

static void testEmptyTargetsRejected() {
    auto transport = std::make_shared<FakeTransport>();
    CommandDispatcher dispatcher(transport);

    Command command{SetPower{true}, {}};
    auto results = dispatcher.dispatch(command);
    ASSERT_TRUE(!results, "empty command rejected");
    if (!results) {
        ASSERT_TRUE(results.error() == errc::invalid_command, "invalid_command");
    }
    ASSERT_EQ(transport->calls.load(), 0, "no device contacted");
}

static void testCancellation() {
    CancellationToken cancellation;
    auto transport = std::make_shared<FakeTransport>();
    transport->delay = 20ms;
    transport->behaviour = [&](const DeviceAddress&) -> CommandResult {
        cancellation.cancel();   // first answer cancels the rest
        DeviceState state;
        state.power = true;
        return state;
    };
    CommandDispatcher::Options options;
    options.maxInFlight = 1;
    CommandDispatcher dispatcher(transport, options);

    const auto command = *Command::make(SetPower{true}, makeTargets(10));
    auto results = dispatcher.dispatch(command, cancellation);
    ASSERT_TRUE(results.has_value(), "cancelled dispatch still returns results");
    if (!results) return;

    ASSERT_EQ(results->size(), static_cast<std::size_t>(10), "every target accounted for");
    ASSERT_EQ(transport->calls.load(), 1, "no new requests after cancel");

    std::size_t notAttempted = 0;
    for (const auto& [address, result] : *results) {
        if (!result) {
            ASSERT_TRUE(result.error().kind == FailureKind::NotAttempted, "unissued -> not attempted");
            ++notAttempted;
        }
    }
    ASSERT_EQ(notAttempted, static_cast<std::size_t>(9), "nine never issued");

    // Completed results are still applied; skipped devices keep their prior health.
    DeviceRegistry registry;
    for (const auto& target : command.targets) {
        registry.add(target);
    }
    registry.apply(*results);
    std::size_t reachable = 0;
    for (const auto& device : registry.snapshot()) {
        if (device.health == Health::Reachable) {
            ++reachable;
            ASSERT_TRUE(device.state && device.state->power, "applied state is the confirmed one");
        } else {
            ASSERT_TRUE(device.health == Health::Unknown, "skipped device untouched");
        }
    }
    ASSERT_EQ(reachable, static_cast<std::size_t>(1), "only the answered device updated");
}

int main() {
    testOneResultPerTarget();
    testFailureIsolation();
    testThrowingTransportStaysLocal();
    testConcurrencyBound();
    testRequestsRunConcurrently();
    testRequestTimeoutForwarded();
    testEmptyTargetsRejected();
    testCancellation();
    return finishTests("CommandDispatcher");
}
