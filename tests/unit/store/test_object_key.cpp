/**
 * @file test_object_key.cpp
 * @brief Unit tests for object key layout and metadata
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/store/object_key.h>

namespace kcenon::cloud_backup::test {

TEST(ObjectKeyTest, FormatsZeroPaddedSequence) {
    EXPECT_EQ(make_object_key("gandalf", 12, 3, chunk_kind::data), "gandalf/12/000003");
    EXPECT_EQ(make_object_key("gandalf", 12, 4, chunk_kind::parity), "gandalf/12/000004.par2");
    EXPECT_EQ(make_object_key("gandalf", 12, 1234567, chunk_kind::data), "gandalf/12/1234567");
}

TEST(ObjectKeyTest, KeyFromChunk) {
    chunk c;
    c.host = "frodo";
    c.backup_number = 7;
    c.sequence = 2;
    c.kind = chunk_kind::data;
    EXPECT_EQ(make_object_key(c), "frodo/7/000002");
}

TEST(ObjectKeyTest, Prefixes) {
    EXPECT_EQ(host_prefix("gandalf"), "gandalf/");
    EXPECT_EQ(backup_prefix("gandalf", 12), "gandalf/12/");
}

TEST(ObjectKeyTest, ParsesCurrentLayout) {
    auto data = parse_object_key("gandalf/12/000003");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data.value().host, "gandalf");
    EXPECT_EQ(data.value().backup_number, 12u);
    EXPECT_EQ(data.value().sequence, 3u);
    EXPECT_EQ(data.value().kind, chunk_kind::data);
    EXPECT_FALSE(data.value().legacy);

    auto parity = parse_object_key("gandalf/12/000004.par2");
    ASSERT_TRUE(parity.has_value());
    EXPECT_EQ(parity.value().kind, chunk_kind::parity);
    EXPECT_EQ(parity.value().sequence, 4u);
}

TEST(ObjectKeyTest, ParsesUnpaddedSequence) {
    auto data = parse_object_key("gandalf/12/3");
    ASSERT_TRUE(data.has_value()) << data.error().message;
    EXPECT_EQ(data.value().host, "gandalf");
    EXPECT_EQ(data.value().backup_number, 12u);
    EXPECT_EQ(data.value().sequence, 3u);
    EXPECT_EQ(data.value().kind, chunk_kind::data);

    auto parity = parse_object_key("gandalf/12/17.par2");
    ASSERT_TRUE(parity.has_value());
    EXPECT_EQ(parity.value().kind, chunk_kind::parity);
    EXPECT_EQ(parity.value().sequence, 17u);

    EXPECT_FALSE(parse_object_key("gandalf/12/0").has_value());
    EXPECT_FALSE(parse_object_key("gandalf/12/1234567890").has_value());
}

TEST(ObjectKeyTest, ParsesLegacyFlatNames) {
    auto whole = parse_object_key("gandalf.12.tar.gz.gpg");
    ASSERT_TRUE(whole.has_value());
    EXPECT_TRUE(whole.value().legacy);
    EXPECT_EQ(whole.value().host, "gandalf");
    EXPECT_EQ(whole.value().backup_number, 12u);
    EXPECT_EQ(whole.value().sequence, 1u);

    auto split = parse_object_key("my.host.5.tar.bz2.ac.gpg");
    ASSERT_TRUE(split.has_value());
    EXPECT_EQ(split.value().host, "my.host");
    EXPECT_EQ(split.value().backup_number, 5u);
    EXPECT_EQ(split.value().sequence, 3u);

    auto parity = parse_object_key("gandalf.12.tar.gz.vol0+1.par2.gpg");
    ASSERT_TRUE(parity.has_value());
    EXPECT_EQ(parity.value().kind, chunk_kind::parity);
    EXPECT_TRUE(parity.value().legacy);
}

TEST(ObjectKeyTest, RejectsForeignKeys) {
    for (const char* key : {"", "gandalf/12/", "gandalf/x/000001", "gandalf/12/000000",
                            "notes.txt", "a/b/c/000001"}) {
        auto parsed = parse_object_key(key);
        EXPECT_FALSE(parsed.has_value()) << key;
        if (!parsed) {
            EXPECT_EQ(parsed.error().code, error_code::invalid_object_key);
        }
    }
}

TEST(ObjectKeyTest, MetadataFromEncryptedChunk) {
    encrypted_chunk encrypted;
    encrypted.source.sha256 = "abc123";
    encrypted.source.total_count = 3;
    encrypted.source.parity_count = 1;
    encrypted.source.compression = "gzip";
    encrypted.algorithm = "gpg-aes256";

    auto metadata = make_object_metadata(encrypted);
    EXPECT_EQ(metadata[meta::sha256], "abc123");
    EXPECT_EQ(metadata[meta::chunk_total], "3");
    EXPECT_EQ(metadata[meta::parity_total], "1");
    EXPECT_EQ(metadata[meta::compression], "gzip");
    EXPECT_EQ(metadata[meta::cipher], "gpg-aes256");

    encrypted.source.compression.clear();
    EXPECT_EQ(make_object_metadata(encrypted)[meta::compression], "none");
}

}  // namespace kcenon::cloud_backup::test
