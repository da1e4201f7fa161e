#include <gtest/gtest.h>

#include "CountingClient.hpp"
#include "remotix/ConnectionRegistry.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace remotix;
using remotix_test::CountingClient;
using remotix_test::ClientStats;

namespace {

ConnectionConfig ftpConfig(const std::string& host = "ftp.example.com") {
    ConnectionConfig c;
    c.host = host;
    c.port = 21;
    c.username = "demo";
    c.password = "secret";
    return c;
}

// Deferred closes land on the connection's worker; give them a moment.
bool closedWithin(const ClientStats& stats, int expected) {
    for (int i = 0; i < 500; ++i) {
        if (stats.closed.load() >= expected) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

struct RegistryFixture : ::testing::Test {
    std::shared_ptr<ClientStats> stats = std::make_shared<ClientStats>();
    ConnectionRegistry reg{std::make_unique<CountingClient>(stats)};
};

} // namespace

TEST_F(RegistryFixture, connect_registers_live_session) {
    reg.connect("a", ftpConfig());
    EXPECT_TRUE(reg.isConnected("a"));
    EXPECT_EQ(reg.activeCount(), 1u);
    EXPECT_EQ(reg.config("a").host, "ftp.example.com");
    EXPECT_EQ(reg.config("a").password.value_or(""), "secret");
}

TEST_F(RegistryFixture, reconnect_replaces_previous_session) {
    reg.connect("a", ftpConfig("one.example.com"));
    reg.connect("a", ftpConfig("two.example.com"));
    EXPECT_EQ(reg.activeCount(), 1u);
    EXPECT_EQ(reg.config("a").host, "two.example.com");
    EXPECT_EQ(stats->opened.load(), 2);
    EXPECT_EQ(stats->closed.load(), 1);
}

TEST_F(RegistryFixture, failed_connect_leaves_registry_unchanged) {
    stats->failConnect = true;
    EXPECT_THROW(reg.connect("a", ftpConfig()), ConnectionError);
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_FALSE(reg.isConnected("a"));
}

TEST_F(RegistryFixture, invalid_config_raises_connection_error) {
    ConnectionConfig bad = ftpConfig();
    bad.username.clear();
    try {
        reg.connect("a", bad);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_STREQ(e.what(), "Host and username are required");
    }
    EXPECT_EQ(reg.activeCount(), 0u);
}

TEST_F(RegistryFixture, operations_on_unknown_id_fail_with_not_connected) {
    EXPECT_THROW(reg.config("ghost"), NotConnectedError);
    auto f = reg.list("ghost", "/");
    EXPECT_THROW(f.get(), NotConnectedError);
    EXPECT_FALSE(reg.isConnected("ghost"));
}

TEST_F(RegistryFixture, disconnect_is_idempotent) {
    reg.connect("a", ftpConfig());
    reg.disconnect("a");
    reg.disconnect("a");
    reg.disconnect("never-connected");
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_EQ(stats->closed.load(), 1);
    EXPECT_THROW(reg.readFile("a", "/readme.txt").get(), NotConnectedError);
}

TEST_F(RegistryFixture, typed_operations_round_trip_through_queue) {
    reg.connect("a", ftpConfig());
    reg.createDirectory("a", "/pub/reports/2026").get();
    reg.writeFile("a", "/pub/reports/2026/q3.csv", "a,b\n1,2\n").get();
    reg.rename("a", "/pub/reports/2026/q3.csv", "/pub/reports/2026/q3-final.csv").get();

    const auto entries = reg.list("a", "/pub/reports/2026").get();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "q3-final.csv");
    EXPECT_EQ(reg.readFile("a", "/pub/reports/2026/q3-final.csv").get(), "a,b\n1,2\n");

    reg.removeFile("a", "/pub/reports/2026/q3-final.csv").get();
    reg.removeDir("a", "/pub/reports").get();
    EXPECT_TRUE(reg.list("a", "/pub").get().empty());
}

TEST_F(RegistryFixture, transport_error_does_not_poison_queue) {
    reg.connect("a", ftpConfig());
    auto bad = reg.readFile("a", "/missing.txt");
    auto good = reg.readFile("a", "/readme.txt");
    try {
        bad.get();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("/missing.txt"), std::string::npos);
    }
    EXPECT_FALSE(good.get().empty());
}

TEST_F(RegistryFixture, per_connection_order_holds_under_concurrent_callers) {
    reg.connect("a", ftpConfig());
    std::mutex m;
    std::vector<int> seen;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 30; ++i) {
        futures.push_back(reg.submit("a", [i, &m, &seen](RemoteClient& c) {
            std::string err;
            // Odd operations fail at the transport.
            const bool ok = c.writeFile(i % 2 ? "/nope/x" : "/pub/x", std::to_string(i), err);
            std::lock_guard<std::mutex> lk(m);
            seen.push_back(i);
            if (!ok) throw TransportError(err);
        }));
    }
    for (int i = 0; i < 30; ++i) {
        if (i % 2) EXPECT_THROW(futures[i].get(), TransportError);
        else EXPECT_NO_THROW(futures[i].get());
    }
    for (int i = 0; i < 30; ++i) EXPECT_EQ(seen[i], i);
}

TEST_F(RegistryFixture, one_connection_never_sees_overlapping_calls) {
    reg.connect("a", ftpConfig());
    int maxInFlight = 0;
    std::vector<std::thread> callers;
    std::mutex fm;
    std::vector<std::future<void>> futures;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&, t]() {
            for (int i = 0; i < 8; ++i) {
                auto f = reg.writeFile("a", "/pub/f" + std::to_string(t), "x");
                std::lock_guard<std::mutex> lk(fm);
                futures.push_back(std::move(f));
            }
        });
    }
    for (auto& c : callers) c.join();
    for (auto& f : futures) f.get();
    reg.submit("a", [&maxInFlight](RemoteClient& c) {
        maxInFlight = static_cast<CountingClient&>(c).maxInFlight();
    }).get();
    EXPECT_EQ(maxInFlight, 1);
}

TEST_F(RegistryFixture, distinct_connections_run_independently) {
    reg.connect("a", ftpConfig());
    reg.connect("b", ftpConfig());
    std::promise<void> bStarted;
    auto bStartedFuture = bStarted.get_future().share();

    // "a" waits for "b" to start; this only completes if they can overlap.
    auto a = reg.submit("a", [bStartedFuture](RemoteClient&) {
        return bStartedFuture.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    });
    auto b = reg.submit("b", [&bStarted](RemoteClient&) { bStarted.set_value(); });
    b.get();
    EXPECT_TRUE(a.get());
}

TEST_F(RegistryFixture, disconnect_fails_queued_operations) {
    reg.connect("a", ftpConfig());
    std::promise<void> started;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    auto running = reg.submit("a", [&started, releaseFuture](RemoteClient& c) {
        started.set_value();
        releaseFuture.wait();
        return c.isConnected();
    });
    auto queued = reg.readFile("a", "/readme.txt");
    started.get_future().wait();

    std::thread closer([this]() { reg.disconnect("a"); });
    EXPECT_THROW(queued.get(), ConnectionClosedError);
    release.set_value();
    closer.join();
    // The in-flight operation ran to completion before the transport closed.
    EXPECT_TRUE(running.get());
    EXPECT_EQ(reg.activeCount(), 0u);
}

TEST_F(RegistryFixture, close_all_survives_failing_close) {
    reg.connect("a", ftpConfig());
    reg.connect("b", ftpConfig());
    reg.connect("c", ftpConfig());
    stats->throwOnDisconnect = true;
    EXPECT_NO_THROW(reg.closeAll());
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_EQ(stats->closed.load(), 3);
    stats->throwOnDisconnect = false;
}

TEST_F(RegistryFixture, reconnect_survives_failing_close_of_old_session) {
    reg.connect("a", ftpConfig("one.example.com"));
    stats->throwOnDisconnect = true;
    reg.connect("a", ftpConfig("two.example.com"));
    stats->throwOnDisconnect = false;
    EXPECT_EQ(reg.activeCount(), 1u);
    EXPECT_EQ(reg.config("a").host, "two.example.com");
}

TEST_F(RegistryFixture, failed_reconnect_drops_the_previous_session) {
    reg.connect("a", ftpConfig("one.example.com"));
    stats->failConnect = true;
    EXPECT_THROW(reg.connect("a", ftpConfig("two.example.com")), ConnectionError);
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_FALSE(reg.isConnected("a"));
    EXPECT_THROW(reg.config("a"), NotConnectedError);
    EXPECT_EQ(stats->opened.load(), 1);
    EXPECT_EQ(stats->closed.load(), 1);
}

TEST_F(RegistryFixture, close_paths_survive_non_standard_exception) {
    reg.connect("a", ftpConfig("one.example.com"));
    reg.connect("b", ftpConfig());
    stats->throwRawOnDisconnect = true;
    EXPECT_NO_THROW(reg.connect("a", ftpConfig("two.example.com")));
    EXPECT_EQ(reg.config("a").host, "two.example.com");
    EXPECT_NO_THROW(reg.closeAll());
    stats->throwRawOnDisconnect = false;
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_EQ(stats->closed.load(), 3);
}

TEST_F(RegistryFixture, operation_can_disconnect_its_own_connection) {
    reg.connect("a", ftpConfig());
    std::promise<void> gate;
    std::shared_future<void> go = gate.get_future().share();

    auto first = reg.submit("a", [this, go](RemoteClient& c) {
        go.wait();
        reg.disconnect("a");
        // The client is still open until this operation returns.
        std::string err;
        return c.isConnected() && c.mkdir("/after-disconnect", err);
    });
    auto second = reg.list("a", "/");
    gate.set_value();

    EXPECT_TRUE(first.get());
    EXPECT_THROW(second.get(), ConnectionClosedError);
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_FALSE(reg.isConnected("a"));
    EXPECT_TRUE(closedWithin(*stats, 1));

    // The id is free for a new session afterwards.
    reg.connect("a", ftpConfig());
    EXPECT_TRUE(reg.isConnected("a"));
}

TEST_F(RegistryFixture, operation_can_close_all_connections) {
    reg.connect("a", ftpConfig());
    reg.connect("b", ftpConfig());
    auto f = reg.submit("a", [this](RemoteClient&) {
        reg.closeAll();
        return 1;
    });
    EXPECT_EQ(f.get(), 1);
    EXPECT_EQ(reg.activeCount(), 0u);
    EXPECT_TRUE(closedWithin(*stats, 2));
}
