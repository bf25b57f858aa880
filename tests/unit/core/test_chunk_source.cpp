/**
 * @file test_chunk_source.cpp
 * @brief Unit tests for archive chunk enumeration
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/core/chunk_source.h>

#include "../../test_fixtures.h"

namespace kcenon::cloud_backup::test {

class ChunkSourceTest : public TempDirectoryFixture {
protected:
    auto base_spec() -> job_spec {
        job_spec spec;
        spec.host = "gandalf";
        spec.backup_number = 12;
        spec.compression = "gzip";
        spec.compression_extension = ".gz";
        spec.archive_destination = test_dir_;
        return spec;
    }
};

TEST_F(ChunkSourceTest, SplitSuffixSequence) {
    EXPECT_EQ(split_suffix_sequence("aa"), 1u);
    EXPECT_EQ(split_suffix_sequence("ab"), 2u);
    EXPECT_EQ(split_suffix_sequence("az"), 26u);
    EXPECT_EQ(split_suffix_sequence("ba"), 27u);
    EXPECT_EQ(split_suffix_sequence("zz"), 676u);
    EXPECT_FALSE(split_suffix_sequence("a").has_value());
    EXPECT_FALSE(split_suffix_sequence("aA").has_value());
    EXPECT_FALSE(split_suffix_sequence("abc").has_value());
}

TEST_F(ChunkSourceTest, ArchiveBaseName) {
    EXPECT_EQ(base_spec().archive_base_name(), "gandalf.12.tar.gz");
}

TEST_F(ChunkSourceTest, SplitArchiveInSuffixOrderThenParity) {
    write_file("gandalf.12.tar.gz.ab", "bbbb");
    write_file("gandalf.12.tar.gz.aa", "aaaaaa");
    write_file("gandalf.12.tar.gz.ac", "cc");
    write_file("gandalf.12.tar.gz.par2", "pp");
    write_file("gandalf.11.tar.gz.aa", "other backup");

    chunk_source source(base_spec());
    auto chunks = source.enumerate();
    ASSERT_TRUE(chunks.has_value()) << chunks.error().message;
    ASSERT_EQ(chunks.value().size(), 4u);

    const auto& c = chunks.value();
    EXPECT_EQ(c[0].path.filename(), "gandalf.12.tar.gz.aa");
    EXPECT_EQ(c[1].path.filename(), "gandalf.12.tar.gz.ab");
    EXPECT_EQ(c[2].path.filename(), "gandalf.12.tar.gz.ac");
    EXPECT_EQ(c[3].path.filename(), "gandalf.12.tar.gz.par2");

    for (uint32_t i = 0; i < 4; ++i) {
        EXPECT_EQ(c[i].sequence, i + 1);
        EXPECT_EQ(c[i].total_count, 3u);
        EXPECT_EQ(c[i].parity_count, 1u);
        EXPECT_EQ(c[i].host, "gandalf");
        EXPECT_EQ(c[i].backup_number, 12u);
        EXPECT_EQ(c[i].compression, "gzip");
    }
    EXPECT_EQ(c[0].kind, chunk_kind::data);
    EXPECT_EQ(c[3].kind, chunk_kind::parity);
    EXPECT_EQ(c[0].size, 6u);
}

TEST_F(ChunkSourceTest, UnsplitArchiveIsOneChunk) {
    write_file("gandalf.12.tar.gz", "whole archive");

    chunk_source source(base_spec());
    auto chunks = source.enumerate();
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].sequence, 1u);
    EXPECT_EQ(chunks.value()[0].total_count, 1u);
    EXPECT_EQ(chunks.value()[0].parity_count, 0u);
    EXPECT_EQ(chunks.value()[0].size, 13u);
    EXPECT_TRUE(chunks.value()[0].sha256.empty());
}

TEST_F(ChunkSourceTest, MissingArchiveIsFileNotFound) {
    chunk_source source(base_spec());
    auto chunks = source.enumerate();
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, error_code::file_not_found);
}

TEST_F(ChunkSourceTest, GapInSplitSuffixesIsRejected) {
    write_file("gandalf.12.tar.gz.aa", "a");
    write_file("gandalf.12.tar.gz.ac", "c");

    chunk_source source(base_spec());
    auto chunks = source.enumerate();
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, error_code::chunk_sequence_error);
}

TEST_F(ChunkSourceTest, ParityFilenameRestrictsMatches) {
    write_file("gandalf.12.tar.gz", "archive");
    write_file("gandalf.12.tar.gz.vol0.par2", "p0");
    write_file("gandalf.12.other.par2", "ignored");

    auto spec = base_spec();
    spec.parity_filename = "gandalf.12.tar.gz";
    chunk_source source(spec);
    auto chunks = source.enumerate();
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks.value().size(), 2u);
    EXPECT_EQ(chunks.value()[1].path.filename(), "gandalf.12.tar.gz.vol0.par2");
}

TEST_F(ChunkSourceTest, ExplicitPathsKeepGivenOrder) {
    auto second = write_file("second.bin", "2");
    auto first = write_file("first.bin", "1");
    auto parity = write_file("p.par2", "p");

    job_spec spec;
    spec.host = "gandalf";
    spec.backup_number = 3;
    spec.chunk_paths = {second, first};
    spec.parity_paths = {parity};

    chunk_source source(spec);
    auto chunks = source.enumerate();
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks.value().size(), 3u);
    EXPECT_EQ(chunks.value()[0].path, second);
    EXPECT_EQ(chunks.value()[1].path, first);
    EXPECT_EQ(chunks.value()[2].kind, chunk_kind::parity);
    EXPECT_EQ(chunks.value()[2].sequence, 3u);
}

TEST_F(ChunkSourceTest, ExplicitMissingChunkFails) {
    job_spec spec;
    spec.host = "gandalf";
    spec.chunk_paths = {test_dir_ / "gone"};

    auto chunks = chunk_source(spec).enumerate();
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, error_code::file_not_found);
}

TEST_F(ChunkSourceTest, HostIsValidated) {
    auto spec = base_spec();
    spec.host = "";
    EXPECT_EQ(chunk_source(spec).enumerate().error().code, error_code::invalid_argument);

    spec.host = "a/b";
    EXPECT_EQ(chunk_source(spec).enumerate().error().code, error_code::invalid_argument);
}

}  // namespace kcenon::cloud_backup::test
