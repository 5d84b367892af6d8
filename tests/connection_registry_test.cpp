#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "ConnectionGuard.hpp"
#include "ConnectionRegistry.hpp"

using namespace std::chrono_literals;
using warden::core::Connection;
using warden::core::ConnectionGuard;
using warden::core::ConnectionId;
using warden::core::ConnectionRegistry;

namespace {

Connection MakeConnection(ConnectionId id) {
    return Connection{id, "127.0.0.1:50000", std::chrono::system_clock::now(), {}};
}

}  // namespace

TEST(ConnectionRegistry, AddAndRemove) {
    ConnectionRegistry registry;
    EXPECT_EQ(registry.Size(), 0U);

    registry.Add(MakeConnection(1));
    registry.Add(MakeConnection(2));
    EXPECT_EQ(registry.Size(), 2U);

    EXPECT_TRUE(registry.Remove(1));
    EXPECT_EQ(registry.Size(), 1U);
    EXPECT_TRUE(registry.Remove(2));
    EXPECT_EQ(registry.Size(), 0U);
}

TEST(ConnectionRegistry, RemoveIsIdempotent) {
    ConnectionRegistry registry;
    registry.Add(MakeConnection(7));

    EXPECT_TRUE(registry.Remove(7));
    EXPECT_FALSE(registry.Remove(7));
    EXPECT_FALSE(registry.Remove(42));
    EXPECT_EQ(registry.Size(), 0U);
}

TEST(ConnectionRegistry, NextIdIsUniqueAcrossThreads) {
    ConnectionRegistry registry;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    std::vector<std::vector<ConnectionId>> ids(kThreads);
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&registry, &ids, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    ids[t].push_back(registry.NextId());
                }
            });
        }
    }

    std::set<ConnectionId> unique;
    for (const auto& batch : ids) {
        unique.insert(batch.begin(), batch.end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(unique.count(0), 0U);
}

TEST(ConnectionRegistry, ConcurrentAddRemoveLeavesRegistryEmpty) {
    ConnectionRegistry registry;
    {
        std::vector<std::jthread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&registry] {
                for (int i = 0; i < 1000; ++i) {
                    auto id = registry.NextId();
                    registry.Add(MakeConnection(id));
                    registry.Remove(id);
                }
            });
        }
    }
    EXPECT_EQ(registry.Size(), 0U);
}

TEST(ConnectionRegistry, ForEachVisitsSnapshotAndAllowsRemoval) {
    ConnectionRegistry registry;
    for (ConnectionId id = 1; id <= 5; ++id) {
        registry.Add(MakeConnection(id));
    }

    std::set<ConnectionId> seen;
    registry.ForEach([&](const Connection& connection) {
        seen.insert(connection.id);
        registry.Remove(connection.id);
    });

    EXPECT_EQ(seen, (std::set<ConnectionId>{1, 2, 3, 4, 5}));
    EXPECT_EQ(registry.Size(), 0U);
}

TEST(ConnectionRegistry, WaitUntilEmptyReturnsImmediatelyWhenEmpty) {
    ConnectionRegistry registry;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(registry.WaitUntilEmpty(start + 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(ConnectionRegistry, WaitUntilEmptyTimesOut) {
    ConnectionRegistry registry;
    registry.Add(MakeConnection(1));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(registry.WaitUntilEmpty(start + 100ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(registry.Size(), 1U);
}

TEST(ConnectionRegistry, WaitUntilEmptyWakesOnLastRemove) {
    ConnectionRegistry registry;
    registry.Add(MakeConnection(1));
    registry.Add(MakeConnection(2));

    std::jthread closer([&registry] {
        std::this_thread::sleep_for(50ms);
        registry.Remove(1);
        std::this_thread::sleep_for(50ms);
        registry.Remove(2);
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(registry.WaitUntilEmpty(start + 5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(ConnectionGuard, RegistersForItsLifetime) {
    ConnectionRegistry registry;
    {
        ConnectionGuard guard(registry, MakeConnection(registry.NextId()));
        EXPECT_EQ(registry.Size(), 1U);
    }
    EXPECT_EQ(registry.Size(), 0U);
}

TEST(ConnectionGuard, ToleratesEarlierRemoval) {
    ConnectionRegistry registry;
    {
        ConnectionGuard guard(registry, MakeConnection(99));
        EXPECT_TRUE(registry.Remove(99));
    }
    EXPECT_EQ(registry.Size(), 0U);
}
