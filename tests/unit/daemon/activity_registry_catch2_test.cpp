// Activity leases that keep the daemon from idling out

#include <catch2/catch_test_macros.hpp>

#include <toolhub/daemon/components/ActivityRegistry.h>

#include <thread>
#include <vector>

using toolhub::daemon::ActivityRegistry;

TEST_CASE("Leases count per key and in total", "[daemon][activity][catch2]") {
    ActivityRegistry registry;
    auto a = registry.acquire("background-process");
    auto b = registry.acquire("background-process");
    auto c = registry.acquire("log-capture");

    CHECK(registry.total() == 3);
    CHECK(registry.count("background-process") == 2);
    CHECK(registry.count("log-capture") == 1);
    CHECK(registry.count("unknown") == 0);

    auto snap = registry.snapshot();
    CHECK(snap.activeLeaseCount == 3);
    CHECK(snap.byKey.at("background-process") == 2);

    b.release();
    CHECK(registry.count("background-process") == 1);
    CHECK(registry.total() == 2);
}

TEST_CASE("Releasing a lease twice is harmless", "[daemon][activity][catch2]") {
    ActivityRegistry registry;
    auto lease = registry.acquire("k");
    CHECK(lease.active());
    CHECK(lease.key() == "k");

    lease.release();
    lease.release();
    CHECK_FALSE(lease.active());
    CHECK(registry.total() == 0);
    CHECK(registry.snapshot().byKey.empty());
}

TEST_CASE("Leases release on destruction and follow moves", "[daemon][activity][catch2]") {
    ActivityRegistry registry;
    {
        auto lease = registry.acquire("scoped");
        CHECK(registry.total() == 1);
    }
    CHECK(registry.total() == 0);

    auto first = registry.acquire("moved");
    ActivityRegistry::Lease second = std::move(first);
    CHECK_FALSE(first.active());
    CHECK(second.active());
    CHECK(registry.total() == 1);

    ActivityRegistry::Lease third;
    third = std::move(second);
    CHECK(registry.total() == 1);

    auto other = registry.acquire("other");
    third = std::move(other);
    CHECK(registry.count("moved") == 0);
    CHECK(registry.count("other") == 1);
    CHECK(registry.total() == 1);
}

TEST_CASE("The listener fires on acquire and release", "[daemon][activity][catch2]") {
    ActivityRegistry registry;
    int notifications = 0;
    registry.setActivityListener([&] { ++notifications; });

    auto lease = registry.acquire("k");
    CHECK(notifications == 1);
    lease.release();
    CHECK(notifications == 2);
    lease.release();
    CHECK(notifications == 2);
}

TEST_CASE("Concurrent acquire and release keep counts consistent", "[daemon][activity][catch2]") {
    ActivityRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry] {
            for (int i = 0; i < 500; ++i) {
                auto lease = registry.acquire("work");
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    CHECK(registry.total() == 0);
    CHECK(registry.count("work") == 0);
}
