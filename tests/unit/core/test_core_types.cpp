/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result types
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/core/types.h>

#include <string>

namespace kcenon::cloud_backup::test {

// =============================================================================
// Error Code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, CodesSitInTheirRanges) {
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -100);
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -120);
    EXPECT_EQ(static_cast<int>(error_code::cipher_unavailable), -140);
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::auth_failed), -180);
    EXPECT_EQ(static_cast<int>(error_code::checksum_mismatch), -200);
    EXPECT_EQ(static_cast<int>(error_code::backup_not_found), -220);
    EXPECT_EQ(static_cast<int>(error_code::job_aborted), -240);
}

TEST_F(ErrorCodeTest, ToStringIsHumanReadable) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::quota_exceeded), "quota exceeded");
    EXPECT_STREQ(to_string(error_code::backup_incomplete), "backup incomplete");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, TransientErrorsAreRetryable) {
    EXPECT_TRUE(is_transient(error_code::connection_failed));
    EXPECT_TRUE(is_transient(error_code::request_timeout));
    EXPECT_TRUE(is_transient(error_code::service_unavailable));
    EXPECT_TRUE(is_transient(error_code::rate_limited));
    EXPECT_TRUE(is_transient(error_code::server_error));

    EXPECT_FALSE(is_fatal(error_code::connection_failed));
    EXPECT_FALSE(is_fatal(error_code::server_error));
}

TEST_F(ErrorCodeTest, PermanentStoreErrorsAreFatal) {
    for (auto code : {error_code::auth_failed, error_code::access_denied,
                      error_code::quota_exceeded, error_code::bucket_not_found,
                      error_code::request_rejected}) {
        EXPECT_TRUE(is_permanent_store_error(code)) << to_string(code);
        EXPECT_FALSE(is_transient(code)) << to_string(code);
        EXPECT_TRUE(is_fatal(code)) << to_string(code);
    }
}

TEST_F(ErrorCodeTest, CipherAndIntegrityErrorsAreFatal) {
    EXPECT_TRUE(is_fatal(error_code::cipher_failed));
    EXPECT_TRUE(is_fatal(error_code::cipher_unavailable));
    EXPECT_TRUE(is_fatal(error_code::checksum_mismatch));
    EXPECT_FALSE(is_permanent_store_error(error_code::checksum_mismatch));
}

TEST_F(ErrorCodeTest, SuccessIsNeitherTransientNorFatal) {
    EXPECT_FALSE(is_transient(error_code::success));
    EXPECT_FALSE(is_fatal(error_code::success));
}

// =============================================================================
// Result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::file_not_found, "missing.tar"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing.tar");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::job_aborted}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "job aborted");
}

TEST_F(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    std::string moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

TEST_F(ResultTest, ErrorBoolConversion) {
    EXPECT_FALSE(static_cast<bool>(error{}));
    EXPECT_TRUE(static_cast<bool>(error{error_code::internal_error}));
}

}  // namespace kcenon::cloud_backup::test
