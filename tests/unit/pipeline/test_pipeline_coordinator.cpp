/**
 * @file test_pipeline_coordinator.cpp
 * @brief End-to-end job runs over the in-memory store and scripted cipher
 */

#include <gtest/gtest.h>

#include <kcenon/cloud_backup/pipeline/pipeline_coordinator.h>
#include <kcenon/cloud_backup/store/object_key.h>

#include "../../test_fixtures.h"

#include <atomic>

namespace kcenon::cloud_backup::test {

using namespace std::chrono_literals;

class PipelineCoordinatorTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        store_ = std::make_shared<memory_object_store>();
        cipher_ = std::make_shared<scripted_cipher>();

        options_.pipeline.max_encryption_workers = 2;
        options_.pipeline.upload_workers = 2;
        options_.pipeline.staging_multiplier = 2;
        options_.pipeline.staging_directory = staging_dir_;
        options_.retry.max_attempts = 3;
        options_.retry.initial_delay = 1ms;
        options_.retry.use_jitter = false;
    }

    auto make_chunks(uint32_t data, uint32_t parity, std::size_t size = 2048)
        -> std::vector<chunk> {
        std::vector<chunk> chunks;
        for (uint32_t seq = 1; seq <= data + parity; ++seq) {
            chunk c;
            c.host = "gandalf";
            c.backup_number = 12;
            c.sequence = seq;
            c.total_count = data;
            c.parity_count = parity;
            c.kind = seq > data ? chunk_kind::parity : chunk_kind::data;
            c.compression = "gzip";
            c.path = create_test_file("gandalf.12.part" + std::to_string(seq), size);
            c.size = size;
            chunks.push_back(c);
        }
        return chunks;
    }

    auto make_coordinator(std::shared_ptr<rate_limit_source> rate = nullptr)
        -> std::unique_ptr<pipeline_coordinator> {
        auto created = pipeline_coordinator::create(cipher_, store_, std::move(rate),
                                                    scoped_secret("job-passphrase"), options_);
        EXPECT_TRUE(created.has_value());
        if (!created) {
            return nullptr;
        }
        return std::move(created).value();
    }

    std::shared_ptr<memory_object_store> store_;
    std::shared_ptr<scripted_cipher> cipher_;
    coordinator_options options_;
};

// =============================================================================
// Creation
// =============================================================================

TEST_F(PipelineCoordinatorTest, CreateValidatesInputs) {
    auto no_cipher = pipeline_coordinator::create(nullptr, store_, nullptr,
                                                  scoped_secret("p"), options_);
    ASSERT_FALSE(no_cipher.has_value());
    EXPECT_EQ(no_cipher.error().code, error_code::invalid_configuration);

    auto no_pass = pipeline_coordinator::create(cipher_, store_, nullptr,
                                                scoped_secret(), options_);
    ASSERT_FALSE(no_pass.has_value());
    EXPECT_EQ(no_pass.error().code, error_code::missing_passphrase);

    auto zero_uploaders = options_;
    zero_uploaders.pipeline.upload_workers = 0;
    auto bad = pipeline_coordinator::create(cipher_, store_, nullptr,
                                            scoped_secret("p"), zero_uploaders);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, error_code::invalid_configuration);
}

TEST_F(PipelineCoordinatorTest, CreateRejectsUndersizedPool) {
    auto pool = std::make_shared<adapters::async_worker_pool>(1);
    auto created = pipeline_coordinator::create(cipher_, store_, nullptr,
                                                scoped_secret("p"), options_, pool);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, error_code::invalid_configuration);
}

TEST_F(PipelineCoordinatorTest, StagingCapacityFollowsWorkers) {
    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);
    EXPECT_EQ(coordinator->staging_capacity(), 2 * coordinator->encryption_workers());
    EXPECT_EQ(coordinator->upload_workers(), 2u);
}

// =============================================================================
// Successful Jobs
// =============================================================================

TEST_F(PipelineCoordinatorTest, UploadsEveryDataAndParityFile) {
    auto chunks = make_chunks(3, 1);
    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);

    auto report = coordinator->run(chunks);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(report.value().chunks_uploaded, 4u);
    ASSERT_EQ(report.value().objects.size(), 4u);
    EXPECT_EQ(report.value().objects[0].key, "gandalf/12/000001");
    EXPECT_EQ(report.value().objects[3].key, "gandalf/12/000004.par2");
    EXPECT_EQ(store_->size(), 4u);
    EXPECT_EQ(staged_files(), 0u);
    EXPECT_EQ(cipher_->last_passphrase(), "job-passphrase");

    for (const auto& c : chunks) {
        auto stored = store_->object(make_object_key(c));
        ASSERT_TRUE(stored.has_value()) << make_object_key(c);

        auto plain = read_file(c.path);
        auto plain_bytes = std::as_bytes(std::span(plain.data(), plain.size()));
        EXPECT_EQ(stored->object.metadata.at(meta::sha256), checksum::sha256(plain_bytes));
        EXPECT_EQ(stored->object.metadata.at(meta::chunk_total), "3");
        EXPECT_EQ(stored->object.metadata.at(meta::parity_total), "1");
        EXPECT_EQ(stored->object.metadata.at(meta::compression), "gzip");
        EXPECT_EQ(stored->body, std::string(scripted_cipher::header) + plain);
    }
}

TEST_F(PipelineCoordinatorTest, TransientErrorsAreAbsorbed) {
    store_->put_fault = [](const std::string& key, int attempt) -> std::optional<error> {
        if (key == "gandalf/12/000002" && attempt == 1) {
            return error{error_code::server_error, "HTTP 500"};
        }
        return std::nullopt;
    };

    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);
    auto report = coordinator->run(make_chunks(3, 0));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().retries, 1u);
    EXPECT_EQ(store_->put_attempts("gandalf/12/000002"), 2);
}

TEST_F(PipelineCoordinatorTest, StagingNeverExceedsCapacity) {
    options_.pipeline.upload_workers = 1;
    options_.pipeline.staging_multiplier = 1;
    store_->put_delay = 40ms;

    std::atomic<std::size_t> peak_files{0};
    auto staging = staging_dir_;
    store_->on_put = [&peak_files, staging](const std::string&) {
        auto files = static_cast<std::size_t>(std::distance(
            std::filesystem::directory_iterator(staging),
            std::filesystem::directory_iterator{}));
        auto current = peak_files.load();
        while (files > current && !peak_files.compare_exchange_weak(current, files)) {
        }
    };

    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);
    auto capacity = coordinator->staging_capacity();

    auto report = coordinator->run(make_chunks(8, 0, 512));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report.value().chunks_uploaded, 8u);
    EXPECT_LE(report.value().max_staged, capacity);
    EXPECT_GE(report.value().max_staged, 1u);
    EXPECT_LE(peak_files.load(), capacity);
}

TEST_F(PipelineCoordinatorTest, RateLimitIsPolledPerUpload) {
    auto source = std::make_shared<sequence_rate_source>(std::vector<std::size_t>{0});
    auto coordinator = make_coordinator(source);
    ASSERT_NE(coordinator, nullptr);

    auto report = coordinator->run(make_chunks(4, 1));
    ASSERT_TRUE(report.has_value());
    EXPECT_GE(source->reads(), 5u);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(PipelineCoordinatorTest, EncryptionFailureStopsLaterChunks) {
    options_.pipeline.max_encryption_workers = 1;
    options_.pipeline.upload_workers = 1;

    auto chunks = make_chunks(4, 0);
    auto second = chunks[1].path;
    auto store = store_;
    cipher_->fail_for = [second, store](const std::filesystem::path& input)
        -> std::optional<error> {
        if (input != second) {
            return std::nullopt;
        }
        // Fail only once chunk 1 is safely stored
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!store->contains("gandalf/12/000001") &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        return error{error_code::cipher_failed, "gpg exited with status 2"};
    };

    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);
    auto report = coordinator->run(chunks);

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::cipher_failed);
    EXPECT_TRUE(coordinator->is_aborted());
    EXPECT_TRUE(store_->contains("gandalf/12/000001"));
    EXPECT_FALSE(store_->contains("gandalf/12/000003"));
    EXPECT_FALSE(store_->contains("gandalf/12/000004"));
    EXPECT_EQ(cipher_->inputs().size(), 2u);
}

TEST_F(PipelineCoordinatorTest, PermanentUploadErrorFailsJob) {
    store_->put_fault = [](const std::string&, int) -> std::optional<error> {
        return error{error_code::access_denied, "HTTP 403 AccessDenied"};
    };

    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);
    auto report = coordinator->run(make_chunks(6, 0));

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::access_denied);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_LT(store_->put_calls(), 6);
}

TEST_F(PipelineCoordinatorTest, ExternalAbortEndsJob) {
    cipher_->delay = 200ms;
    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);

    std::thread trip([&coordinator] {
        std::this_thread::sleep_for(50ms);
        coordinator->abort();
    });

    auto started = std::chrono::steady_clock::now();
    auto report = coordinator->run(make_chunks(10, 0));
    trip.join();

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::job_aborted);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_LT(store_->size(), 10u);
}

TEST_F(PipelineCoordinatorTest, RunsAtMostOnce) {
    auto coordinator = make_coordinator();
    ASSERT_NE(coordinator, nullptr);

    auto empty = coordinator->run({});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::invalid_argument);

    auto again = coordinator->run(make_chunks(1, 0));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::not_initialized);
}

}  // namespace kcenon::cloud_backup::test
