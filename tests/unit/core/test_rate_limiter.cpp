/**
 * @file test_rate_limiter.cpp
 * @brief Unit tests for the polled upload rate limiter
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/core/rate_limiter.h>

#include "../../test_fixtures.h"

#include <chrono>
#include <limits>
#include <thread>

namespace kcenon::cloud_backup::test {

using namespace std::chrono_literals;

// =============================================================================
// Parse Tests
// =============================================================================

TEST(RateLimitParseTest, AcceptsPlainAndSuffixedValues) {
    EXPECT_EQ(parse_rate_limit("0"), 0u);
    EXPECT_EQ(parse_rate_limit("none"), 0u);
    EXPECT_EQ(parse_rate_limit(""), 0u);
    EXPECT_EQ(parse_rate_limit("750000"), 750000u);
    EXPECT_EQ(parse_rate_limit("512k"), 512u * 1024);
    EXPECT_EQ(parse_rate_limit(" 2M\n"), 2u * 1024 * 1024);
}

TEST(RateLimitParseTest, RejectsGarbage) {
    EXPECT_FALSE(parse_rate_limit("fast").has_value());
    EXPECT_FALSE(parse_rate_limit("12.5k").has_value());
    EXPECT_FALSE(parse_rate_limit("k").has_value());
    EXPECT_FALSE(parse_rate_limit("-5").has_value());
    EXPECT_FALSE(parse_rate_limit("+5").has_value());
}

TEST(RateLimitParseTest, RejectsValuesThatOverflow) {
    EXPECT_FALSE(parse_rate_limit("18446744073709551616").has_value());
    EXPECT_FALSE(parse_rate_limit("99999999999999999999999").has_value());
    EXPECT_FALSE(parse_rate_limit("18446744073709551615k").has_value());
    EXPECT_FALSE(parse_rate_limit("17179869184G").has_value());

    auto largest = std::numeric_limits<std::size_t>::max();
    EXPECT_EQ(parse_rate_limit(std::to_string(largest)), largest);
    EXPECT_EQ(parse_rate_limit("4G"), std::size_t{4} * 1024 * 1024 * 1024);
}

// =============================================================================
// Source Tests
// =============================================================================

class FileRateLimitSourceTest : public TempDirectoryFixture {};

TEST_F(FileRateLimitSourceTest, MissingFileMeansUnlimited) {
    file_rate_limit_source source(test_dir_ / "rate");
    auto limit = source.current_limit();
    ASSERT_TRUE(limit.has_value());
    EXPECT_EQ(limit.value(), 0u);
}

TEST_F(FileRateLimitSourceTest, ReadsFreshValueEveryCall) {
    auto path = write_file("rate", "100k\n");
    file_rate_limit_source source(path);
    EXPECT_EQ(source.current_limit().value(), 100u * 1024);

    write_file("rate", "0\n");
    EXPECT_EQ(source.current_limit().value(), 0u);
}

TEST_F(FileRateLimitSourceTest, UnparseableValueIsError) {
    auto path = write_file("rate", "soon");
    file_rate_limit_source source(path);
    auto limit = source.current_limit();
    ASSERT_FALSE(limit.has_value());
    EXPECT_EQ(limit.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Limiter Tests
// =============================================================================

class RateLimiterTest : public ::testing::Test {};

TEST_F(RateLimiterTest, UnlimitedNeverWaits) {
    rate_limiter limiter(std::make_shared<static_rate_limit_source>(0));
    for (int i = 0; i < 10; ++i) {
        auto waited = limiter.throttle(10 * 1024 * 1024);
        ASSERT_TRUE(waited.has_value());
        EXPECT_EQ(waited.value().count(), 0);
    }
    EXPECT_FALSE(limiter.is_enabled());
}

TEST_F(RateLimiterTest, PollsSourceBeforeEveryTransfer) {
    auto source = std::make_shared<sequence_rate_source>(std::vector<std::size_t>{0, 0, 0});
    rate_limiter limiter(source);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.throttle(1).has_value());
    }
    EXPECT_EQ(source->reads(), 5u);
}

TEST_F(RateLimiterTest, PicksUpLimitChangesBetweenChunks) {
    auto source = std::make_shared<sequence_rate_source>(
        std::vector<std::size_t>{0, 1024 * 1024, 0});
    rate_limiter limiter(source);

    ASSERT_TRUE(limiter.throttle(1).has_value());
    EXPECT_EQ(limiter.get_limit(), 0u);

    ASSERT_TRUE(limiter.throttle(1).has_value());
    EXPECT_EQ(limiter.get_limit(), 1024u * 1024);

    ASSERT_TRUE(limiter.throttle(1).has_value());
    EXPECT_EQ(limiter.get_limit(), 0u);
}

TEST_F(RateLimiterTest, AverageThroughputStaysNearLimit) {
    constexpr std::size_t limit = 2 * 1024 * 1024;
    constexpr std::size_t chunk = 100 * 1024;
    constexpr int chunks = 20;

    rate_limiter limiter(std::make_shared<static_rate_limit_source>(limit), 10ms);

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < chunks; ++i) {
        ASSERT_TRUE(limiter.throttle(chunk).has_value());
    }
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start);

    double expected = static_cast<double>(chunk * chunks) / static_cast<double>(limit);
    double rate = static_cast<double>(chunk * chunks) / elapsed.count();
    EXPECT_LE(rate, static_cast<double>(limit) * 1.10);
    EXPECT_GE(elapsed.count(), expected * 0.90);
    EXPECT_LE(elapsed.count(), expected * 1.50);
}

TEST_F(RateLimiterTest, ChunkLargerThanBucketStillPasses) {
    rate_limiter limiter(std::make_shared<static_rate_limit_source>(1024 * 1024), 10ms);
    auto start = std::chrono::steady_clock::now();
    auto waited = limiter.throttle(256 * 1024);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(waited.has_value());
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LE(elapsed, 600ms);
}

TEST_F(RateLimiterTest, AbortFlagEndsWait) {
    rate_limiter limiter(std::make_shared<static_rate_limit_source>(1024), 10ms);
    std::atomic<bool> abort_flag{false};

    std::thread trip([&] {
        std::this_thread::sleep_for(100ms);
        abort_flag = true;
    });

    auto start = std::chrono::steady_clock::now();
    auto waited = limiter.throttle(1024 * 1024, &abort_flag);
    auto elapsed = std::chrono::steady_clock::now() - start;
    trip.join();

    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::job_aborted);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(RateLimiterTest, InterruptWakesWaiter) {
    rate_limiter limiter(std::make_shared<static_rate_limit_source>(1024), 10ms);

    std::thread trip([&] {
        std::this_thread::sleep_for(100ms);
        limiter.interrupt();
    });

    auto waited = limiter.throttle(1024 * 1024);
    trip.join();
    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().code, error_code::job_aborted);
}

TEST_F(RateLimiterTest, SourceErrorKeepsPreviousLimit) {
    class flaky_source : public rate_limit_source {
    public:
        auto current_limit() -> result<std::size_t> override {
            if (calls_++ == 0) {
                return std::size_t{4096};
            }
            return unexpected{error{error_code::file_read_error, "unreadable"}};
        }

    private:
        int calls_ = 0;
    };

    rate_limiter limiter(std::make_shared<flaky_source>());
    ASSERT_TRUE(limiter.throttle(1).has_value());
    EXPECT_EQ(limiter.get_limit(), 4096u);
    ASSERT_TRUE(limiter.throttle(1).has_value());
    EXPECT_EQ(limiter.get_limit(), 4096u);
}

}  // namespace kcenon::cloud_backup::test
