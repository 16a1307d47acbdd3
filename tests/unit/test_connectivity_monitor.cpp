#include <catch2/catch_test_macros.hpp>
#include "network/connectivity_monitor.hpp"
#include "test_support.hpp"
#include <QSignalSpy>

using namespace tally;
using namespace tally::network;
using namespace std::chrono_literals;

namespace {

class UnavailableBackend : public ConnectivityBackend {
public:
    Result<void, Error> start() override {
        return Result<void, Error>::err(Error{"no reachability plugin"});
    }
    void stop() override {}
    [[nodiscard]] bool is_online() const override { return false; }
};

} // namespace

TEST_CASE("Connectivity: initial state comes from the backend", "[connectivity]") {
    auto backend = std::make_unique<ManualConnectivityBackend>(false);
    ConnectivityMonitor monitor(std::move(backend), 10ms);

    REQUIRE(monitor.start());
    REQUIRE(monitor.isBackendAvailable());
    REQUIRE_FALSE(monitor.isOnline());
}

TEST_CASE("Connectivity: transitions are debounced", "[connectivity]") {
    auto backend = std::make_unique<ManualConnectivityBackend>(true);
    auto* raw = backend.get();
    ConnectivityMonitor monitor(std::move(backend), 50ms);
    REQUIRE(monitor.start());

    QSignalSpy spy(&monitor, &ConnectivityMonitor::connectivityChanged);

    SECTION("a stable change surfaces once after the window") {
        raw->set_online(false);
        REQUIRE(monitor.isOnline());
        REQUIRE(spy.count() == 0);

        REQUIRE(spy.wait(1000));
        REQUIRE(spy.count() == 1);
        REQUIRE(spy.at(0).at(0).toBool() == false);
        REQUIRE_FALSE(monitor.isOnline());
    }

    SECTION("a flap inside the window emits nothing") {
        raw->set_online(false);
        raw->set_online(true);
        QTest::qWait(150);
        REQUIRE(spy.count() == 0);
        REQUIRE(monitor.isOnline());
    }

    SECTION("offline then online again emits both transitions") {
        raw->set_online(false);
        REQUIRE(testing::wait_until([&]() { return spy.count() == 1; }));
        raw->set_online(true);
        REQUIRE(testing::wait_until([&]() { return spy.count() == 2; }));
        REQUIRE(spy.at(1).at(0).toBool() == true);
        REQUIRE(monitor.isOnline());
    }
}

TEST_CASE("Connectivity: zero debounce settles immediately", "[connectivity]") {
    auto backend = std::make_unique<ManualConnectivityBackend>(true);
    auto* raw = backend.get();
    ConnectivityMonitor monitor(std::move(backend), 0ms);
    REQUIRE(monitor.start());

    QSignalSpy spy(&monitor, &ConnectivityMonitor::connectivityChanged);
    raw->set_online(false);
    REQUIRE(spy.count() == 1);
    REQUIRE_FALSE(monitor.isOnline());
}

TEST_CASE("Connectivity: no events after stop", "[connectivity]") {
    auto backend = std::make_unique<ManualConnectivityBackend>(true);
    auto* raw = backend.get();
    ConnectivityMonitor monitor(std::move(backend), 0ms);
    REQUIRE(monitor.start());
    monitor.stop();

    QSignalSpy spy(&monitor, &ConnectivityMonitor::connectivityChanged);
    raw->set_online(false);
    REQUIRE(spy.count() == 0);
    REQUIRE(monitor.isOnline());
}

TEST_CASE("Connectivity: unavailable backend assumes online", "[connectivity]") {
    ConnectivityMonitor monitor(std::make_unique<UnavailableBackend>(), 10ms);

    REQUIRE_FALSE(monitor.start());
    REQUIRE_FALSE(monitor.isBackendAvailable());
    REQUIRE(monitor.isOnline());

    ConnectivityMonitor without_backend(nullptr, 10ms);
    REQUIRE_FALSE(without_backend.start());
    REQUIRE(without_backend.isOnline());
}
