/**
 * @file test_secret.cpp
 * @brief Unit tests for scoped passphrase handling
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/core/secret.h>

#include "../../test_fixtures.h"

#include <type_traits>

namespace kcenon::cloud_backup::test {

class ScopedSecretTest : public TempDirectoryFixture {};

TEST_F(ScopedSecretTest, IsMoveOnly) {
    static_assert(!std::is_copy_constructible_v<scoped_secret>);
    static_assert(!std::is_copy_assignable_v<scoped_secret>);
    static_assert(std::is_nothrow_move_constructible_v<scoped_secret>);
}

TEST_F(ScopedSecretTest, HoldsValue) {
    scoped_secret secret("correct horse");
    EXPECT_EQ(secret.view(), "correct horse");
    EXPECT_EQ(secret.size(), 13u);
    EXPECT_FALSE(secret.empty());
}

TEST_F(ScopedSecretTest, MoveLeavesSourceEmpty) {
    scoped_secret a("battery staple");
    scoped_secret b(std::move(a));
    EXPECT_EQ(b.view(), "battery staple");
    EXPECT_TRUE(a.empty());

    scoped_secret c;
    c = std::move(b);
    EXPECT_EQ(c.view(), "battery staple");
    EXPECT_TRUE(b.empty());
}

TEST_F(ScopedSecretTest, ResetWipes) {
    scoped_secret secret("s3cret");
    secret.reset();
    EXPECT_TRUE(secret.empty());
    EXPECT_EQ(secret.view(), "");
}

TEST_F(ScopedSecretTest, LoadTrimsOneTrailingNewline) {
    auto path = write_file("pass", "hunter2\n");
    auto secret = load_secret_file(path);
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret.value().view(), "hunter2");
}

TEST_F(ScopedSecretTest, LoadTrimsCrLf) {
    auto path = write_file("pass", "hunter2\r\n");
    auto secret = load_secret_file(path);
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret.value().view(), "hunter2");
}

TEST_F(ScopedSecretTest, LoadKeepsInnerWhitespace) {
    auto path = write_file("pass", " two words \n\n");
    auto secret = load_secret_file(path);
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret.value().view(), " two words \n");
}

TEST_F(ScopedSecretTest, MissingFileIsMissingPassphrase) {
    auto secret = load_secret_file(test_dir_ / "absent");
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error().code, error_code::missing_passphrase);
}

TEST_F(ScopedSecretTest, EmptyFileIsRejected) {
    auto path = write_file("pass", "\n");
    auto secret = load_secret_file(path);
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error().code, error_code::missing_passphrase);
}

TEST_F(ScopedSecretTest, EmptyPathIsRejected) {
    auto secret = load_secret_file({});
    ASSERT_FALSE(secret.has_value());
    EXPECT_EQ(secret.error().code, error_code::missing_passphrase);
}

}  // namespace kcenon::cloud_backup::test
