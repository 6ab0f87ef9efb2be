/**
 * @file tests/registry_test.cpp
 * @brief Tests of registry of clients with transfer in progress
*/
#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "server/registry.hpp"
#include "common/socket.hpp"

TEST(RegistryTest, InsertRejectsDuplicates) {
    RequestRegistry registry;
    sockaddr_in client = makeAddress("127.0.0.1", 5000);

    EXPECT_TRUE(registry.insert(client));
    EXPECT_FALSE(registry.insert(client));
    EXPECT_TRUE(registry.contains(client));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, KeyIsAddressAndPort) {
    RequestRegistry registry;
    EXPECT_TRUE(registry.insert(makeAddress("127.0.0.1", 5000)));
    EXPECT_TRUE(registry.insert(makeAddress("127.0.0.1", 5001)));
    EXPECT_TRUE(registry.insert(makeAddress("127.0.0.2", 5000)));
    EXPECT_EQ(registry.size(), 3u);
}

TEST(RegistryTest, RemoveAllowsNewRequest) {
    RequestRegistry registry;
    sockaddr_in client = makeAddress("10.0.0.1", 69);

    registry.insert(client);
    registry.remove(client);
    EXPECT_FALSE(registry.contains(client));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.insert(client));

    // removing unknown client is a no-op
    registry.remove(makeAddress("10.0.0.2", 69));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RegistryTest, ConcurrentInsertAcceptsOnce) {
    RequestRegistry registry;
    sockaddr_in client = makeAddress("127.0.0.1", 4242);
    std::vector<int> accepted(8, 0);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < accepted.size(); ++i) {
        threads.emplace_back([&registry, &client, &accepted, i]() {
            accepted[i] = registry.insert(client) ? 1 : 0;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    int total = 0;
    for (int value : accepted) {
        total += value;
    }
    EXPECT_EQ(total, 1);
}
