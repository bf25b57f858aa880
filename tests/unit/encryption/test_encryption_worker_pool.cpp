/**
 * @file test_encryption_worker_pool.cpp
 * @brief Unit tests for the encryption stage
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/encryption/encryption_worker_pool.h>

#include "../../test_fixtures.h"

#include <set>

namespace kcenon::cloud_backup::test {

class EncryptionWorkerPoolTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        cipher_ = std::make_shared<scripted_cipher>();
    }

    auto make_chunks(int count, std::size_t size = 1024) -> std::vector<chunk> {
        std::vector<chunk> chunks;
        for (int i = 1; i <= count; ++i) {
            chunk c;
            c.host = "gandalf";
            c.backup_number = 12;
            c.sequence = static_cast<uint32_t>(i);
            c.total_count = static_cast<uint32_t>(count);
            c.path = create_test_file("part" + std::to_string(i), size);
            c.size = size;
            chunks.push_back(c);
        }
        return chunks;
    }

    std::shared_ptr<scripted_cipher> cipher_;
    scoped_secret passphrase_{"pool-passphrase"};
};

TEST_F(EncryptionWorkerPoolTest, EncryptFillsChecksums) {
    encryption_worker_pool pool(cipher_, passphrase_, staging_dir_);
    auto chunks = make_chunks(1);
    std::atomic<bool> abort_flag{false};

    auto encrypted = pool.encrypt(chunks[0], abort_flag);
    ASSERT_TRUE(encrypted.has_value()) << encrypted.error().message;

    const auto& e = encrypted.value();
    auto plain = read_file(chunks[0].path);
    auto cipher_text = read_file(e.ciphertext_path);

    auto plain_bytes = std::as_bytes(std::span(plain.data(), plain.size()));
    EXPECT_EQ(e.source.sha256, checksum::sha256(plain_bytes));
    EXPECT_EQ(e.ciphertext_md5, md5_hex(cipher_text));
    EXPECT_EQ(e.ciphertext_size, cipher_text.size());
    EXPECT_FALSE(e.content_md5.empty());
    EXPECT_EQ(e.algorithm, "test-cipher");
    EXPECT_EQ(e.ciphertext_path.parent_path(), staging_dir_);
    EXPECT_EQ(cipher_->last_passphrase(), "pool-passphrase");
}

TEST_F(EncryptionWorkerPoolTest, ExistingChecksumIsNotRecomputed) {
    encryption_worker_pool pool(cipher_, passphrase_, staging_dir_);
    auto chunks = make_chunks(1);
    chunks[0].sha256 = std::string(64, 'a');
    std::atomic<bool> abort_flag{false};

    auto encrypted = pool.encrypt(chunks[0], abort_flag);
    ASSERT_TRUE(encrypted.has_value()) << encrypted.error().message;
    EXPECT_EQ(encrypted.value().source.sha256, std::string(64, 'a'));
    EXPECT_FALSE(encrypted.value().ciphertext_md5.empty());
}

TEST_F(EncryptionWorkerPoolTest, StagingPathsAreUnique) {
    encryption_worker_pool pool(cipher_, passphrase_, staging_dir_);
    auto chunks = make_chunks(1);

    std::set<std::filesystem::path> seen;
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(seen.insert(pool.staging_path_for(chunks[0])).second);
    }
}

TEST_F(EncryptionWorkerPoolTest, CipherFailureRemovesPartialFile) {
    cipher_->fail_for = [](const std::filesystem::path&) -> std::optional<error> {
        return error{error_code::cipher_failed, "boom"};
    };
    encryption_worker_pool pool(cipher_, passphrase_, staging_dir_);
    auto chunks = make_chunks(1);
    std::atomic<bool> abort_flag{false};

    auto encrypted = pool.encrypt(chunks[0], abort_flag);
    ASSERT_FALSE(encrypted.has_value());
    EXPECT_EQ(encrypted.error().code, error_code::cipher_failed);
    EXPECT_EQ(staged_files(), 0u);
}

TEST_F(EncryptionWorkerPoolTest, WorkersDrainFeedInParallel) {
    cipher_->delay = std::chrono::milliseconds(30);
    auto chunks = make_chunks(8);

    encryption_worker_pool encryptor(cipher_, passphrase_, staging_dir_);
    chunk_feed feed(chunks);
    staging_queue<encrypted_chunk> queue(8);
    job_control control;
    auto workers = adapters::worker_pool_factory::create(4, "encrypt-test");

    auto futures = encryptor.start(*workers, 4, feed, queue, control);
    for (auto& f : futures) {
        f.get();
    }
    queue.close();

    std::set<uint32_t> sequences;
    while (auto item = queue.pop()) {
        sequences.insert(item->source.sequence);
    }
    EXPECT_EQ(sequences.size(), 8u);
    EXPECT_FALSE(control.aborted());
    EXPECT_EQ(encryptor.chunks_encrypted(), 8u);
    EXPECT_EQ(encryptor.bytes_encrypted(), 8u * 1024);
    EXPECT_GT(cipher_->max_active(), 1);
    EXPECT_LE(cipher_->max_active(), 4);
}

TEST_F(EncryptionWorkerPoolTest, FailureAbortsSiblings) {
    auto chunks = make_chunks(6);
    auto bad = chunks[1].path;
    cipher_->fail_for = [bad](const std::filesystem::path& input) -> std::optional<error> {
        if (input == bad) {
            return error{error_code::cipher_failed, "gpg exited with status 2"};
        }
        return std::nullopt;
    };

    encryption_worker_pool encryptor(cipher_, passphrase_, staging_dir_);
    chunk_feed feed(chunks);
    staging_queue<encrypted_chunk> queue(6);
    job_control control;

    // One worker keeps the order deterministic: chunk 1 succeeds, chunk 2 fails
    encryptor.run_worker(feed, queue, control);

    ASSERT_TRUE(control.aborted());
    ASSERT_TRUE(control.first_error().has_value());
    EXPECT_EQ(control.first_error()->code, error_code::cipher_failed);
    EXPECT_EQ(cipher_->inputs().size(), 2u);
    EXPECT_EQ(queue.drain().size(), 1u);
    EXPECT_EQ(queue.staged(), 1u);
}

TEST_F(EncryptionWorkerPoolTest, StopsWhenNoSlotCanBeReserved) {
    auto chunks = make_chunks(3);
    encryption_worker_pool encryptor(cipher_, passphrase_, staging_dir_);
    chunk_feed feed(chunks);
    staging_queue<encrypted_chunk> queue(1);
    job_control control;
    control.set_on_abort([&queue] { queue.abort(); });

    std::thread producer([&] { encryptor.run_worker(feed, queue, control); });

    // The single slot is taken by chunk 1; the worker now blocks in reserve()
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(queue.staged(), 1u);
    control.request_abort();
    producer.join();

    EXPECT_EQ(cipher_->calls(), 1);
}

}  // namespace kcenon::cloud_backup::test
