#include <gtest/gtest.h>
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include "transport_pool.hpp"
#include <cmath>
#include <random>
#include <thread>
#include <vector>

namespace httpload {

class TransportSelectorTest : public ::testing::Test {
protected:
    std::mt19937_64 rng_{1234};
};

TEST_F(TransportSelectorTest, RatioZeroNeverKeepsAlive) {
    TransportSelector selector(0.0);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(selector.select(rng_), TransportKind::NoKeepAlive);
    }
    EXPECT_EQ(selector.keepAliveSelections(), 0u);
    EXPECT_EQ(selector.noKeepAliveSelections(), 1000u);
}

TEST_F(TransportSelectorTest, RatioOneAlwaysKeepsAlive) {
    TransportSelector selector(1.0);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(selector.select(rng_), TransportKind::KeepAlive);
    }
    EXPECT_EQ(selector.keepAliveSelections(), 1000u);
    EXPECT_EQ(selector.noKeepAliveSelections(), 0u);
}

TEST_F(TransportSelectorTest, ShareConvergesToRatio) {
    TransportSelector selector(0.7);
    constexpr int draws = 20000;
    for (int i = 0; i < draws; ++i) {
        selector.select(rng_);
    }
    double share = static_cast<double>(selector.keepAliveSelections()) / draws;
    EXPECT_NEAR(share, 0.7, 0.02);
    EXPECT_EQ(selector.keepAliveSelections() + selector.noKeepAliveSelections(),
              static_cast<uint64_t>(draws));
}

TEST_F(TransportSelectorTest, CountersAreThreadSafe) {
    TransportSelector selector(0.5);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&selector, t]() {
            std::mt19937_64 rng(static_cast<uint64_t>(t));
            for (int i = 0; i < 2500; ++i) {
                selector.select(rng);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(selector.keepAliveSelections() + selector.noKeepAliveSelections(), 10000u);
}

TEST_F(TransportSelectorTest, InvalidRatioThrows) {
    EXPECT_THROW(TransportSelector(-0.1), ValidationException);
    EXPECT_THROW(TransportSelector(1.01), ValidationException);
    EXPECT_THROW(TransportSelector(std::nan("")), ValidationException);
}

TEST(TransportKindTest, Names) {
    EXPECT_STREQ(transportKindName(TransportKind::KeepAlive), "keep-alive");
    EXPECT_STREQ(transportKindName(TransportKind::NoKeepAlive), "no-keep-alive");
}

class TransportPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogConfig config;
        config.level = LogLevel::ERROR;
        config.consoleOutput = false;
        Logger::getInstance().configure(config);
    }
};

TEST_F(TransportPoolTest, ProfilesDifferOnlyInReuse) {
    TransportSettings settings;
    settings.maxIdleConnections = 16;
    settings.idleTimeout = std::chrono::seconds(5);
    settings.requestTimeout = std::chrono::milliseconds(750);
    settings.userAgent = "pool-test";

    TransportPool pool(settings);
    const auto& keepAlive = pool.profile(TransportKind::KeepAlive);
    const auto& noKeepAlive = pool.profile(TransportKind::NoKeepAlive);

    EXPECT_TRUE(keepAlive.reuseConnections);
    EXPECT_NE(keepAlive.share, nullptr);
    EXPECT_FALSE(noKeepAlive.reuseConnections);
    EXPECT_EQ(noKeepAlive.share, nullptr);

    for (const auto* profile : {&keepAlive, &noKeepAlive}) {
        EXPECT_EQ(profile->maxConnections, 16);
        EXPECT_EQ(profile->idleTimeout.count(), 5);
        EXPECT_EQ(profile->requestTimeout.count(), 750);
        EXPECT_EQ(profile->userAgent, "pool-test");
    }
}

TEST_F(TransportPoolTest, CreatesIndependentClients) {
    TransportPool pool(TransportSettings{});

    auto first = pool.create(TransportKind::KeepAlive);
    auto second = pool.create(TransportKind::KeepAlive);
    auto fresh = pool.create(TransportKind::NoKeepAlive);

    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first.get(), second.get());

    auto* curlFresh = dynamic_cast<CurlTransport*>(fresh.get());
    ASSERT_NE(curlFresh, nullptr);
    EXPECT_FALSE(curlFresh->options().reuseConnections);
}

} // namespace httpload
