/**
 * @file pipeline_coordinator.cpp
 * @brief Archive job coordination
 */

#include "kcenon/cloud_backup/pipeline/pipeline_coordinator.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/encryption/encryption_worker_pool.h"
#include "kcenon/cloud_backup/pipeline/staging_queue.h"
#include "kcenon/cloud_backup/pipeline/upload_manager.h"

#include <algorithm>
#include <filesystem>

namespace kcenon::cloud_backup {

struct pipeline_coordinator::impl {
    std::shared_ptr<symmetric_cipher> cipher;
    std::shared_ptr<object_store> store;
    std::shared_ptr<rate_limiter> limiter;
    std::shared_ptr<adapters::worker_pool_interface> pool;
    scoped_secret passphrase;
    coordinator_options options;

    std::size_t encryption_workers = 1;
    std::size_t upload_workers = 1;
    std::size_t capacity = 1;

    job_control control;
    bool used = false;
};

pipeline_coordinator::pipeline_coordinator() : pimpl_(std::make_unique<impl>()) {}

pipeline_coordinator::~pipeline_coordinator() = default;

auto pipeline_coordinator::create(std::shared_ptr<symmetric_cipher> cipher,
                                  std::shared_ptr<object_store> store,
                                  std::shared_ptr<rate_limit_source> rate_source,
                                  scoped_secret passphrase,
                                  coordinator_options options,
                                  std::shared_ptr<adapters::worker_pool_interface> pool)
    -> result<std::unique_ptr<pipeline_coordinator>> {
    if (!cipher) {
        return unexpected{error{error_code::invalid_configuration, "no cipher configured"}};
    }
    if (!store) {
        return unexpected{error{error_code::invalid_configuration, "no object store configured"}};
    }
    if (passphrase.empty()) {
        return unexpected{error{error_code::missing_passphrase, "passphrase is empty"}};
    }
    if (options.pipeline.upload_workers == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "at least one upload worker is required"}};
    }
    if (options.pipeline.staging_directory.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "staging directory is not set"}};
    }
    if (!rate_source) {
        rate_source = std::make_shared<static_rate_limit_source>(0);
    }

    std::unique_ptr<pipeline_coordinator> coordinator(new pipeline_coordinator());
    auto& p = *coordinator->pimpl_;
    p.cipher = std::move(cipher);
    p.store = std::move(store);
    p.limiter = std::make_shared<rate_limiter>(std::move(rate_source), options.rate_window);
    p.passphrase = std::move(passphrase);
    p.encryption_workers = options.pipeline.effective_encryption_workers();
    p.upload_workers = options.pipeline.upload_workers;
    p.capacity = options.pipeline.staging_capacity();
    p.options = std::move(options);

    if (!pool) {
        pool = adapters::worker_pool_factory::create(p.encryption_workers + p.upload_workers,
                                                     "cloud_backup_pipeline");
    }
    // Worker loops hold their thread for the whole job
    if (pool->thread_count() < p.encryption_workers + p.upload_workers) {
        return unexpected{error{error_code::invalid_configuration,
            "worker pool has " + std::to_string(pool->thread_count()) +
            " threads, job needs " +
            std::to_string(p.encryption_workers + p.upload_workers)}};
    }
    p.pool = std::move(pool);
    return coordinator;
}

auto pipeline_coordinator::run(std::vector<chunk> chunks) -> result<job_report> {
    auto& p = *pimpl_;
    if (p.used) {
        return unexpected{error{error_code::not_initialized,
                                "coordinator already ran a job"}};
    }
    p.used = true;

    if (chunks.empty()) {
        p.passphrase.reset();
        return unexpected{error{error_code::invalid_argument, "no chunks to upload"}};
    }

    std::error_code ec;
    std::filesystem::create_directories(p.options.pipeline.staging_directory, ec);
    if (ec) {
        p.passphrase.reset();
        return unexpected{error{error_code::file_write_error,
            "cannot create staging directory " +
            p.options.pipeline.staging_directory.string() + ": " + ec.message()}};
    }

    const auto expected = chunks.size();
    const auto& first = chunks.front();
    chunk_log_context job_ctx;
    job_ctx.host = first.host;
    job_ctx.backup_number = first.backup_number;
    job_ctx.total_chunks = first.total_count;

    CB_LOG_INFO_CTX(log_category::pipeline,
                    "Starting job: " + std::to_string(expected) + " files, " +
                    std::to_string(p.encryption_workers) + " encryption workers, " +
                    std::to_string(p.upload_workers) + " upload workers, staging capacity " +
                    std::to_string(p.capacity),
                    job_ctx);

    auto started = std::chrono::steady_clock::now();

    chunk_feed feed(std::move(chunks));
    staging_queue<encrypted_chunk> queue(p.capacity);
    encryption_worker_pool encryptor(p.cipher, p.passphrase,
                                     p.options.pipeline.staging_directory);
    upload_manager uploader(p.store, p.limiter, p.options.retry);

    p.control.set_on_abort([&queue, limiter = p.limiter] {
        queue.abort();
        limiter->interrupt();
    });

    auto encrypt_futures = encryptor.start(*p.pool, p.encryption_workers, feed, queue, p.control);
    auto upload_futures = uploader.start(*p.pool, p.upload_workers, queue, p.control);

    for (auto& f : encrypt_futures) {
        f.wait();
    }
    queue.close();
    for (auto& f : upload_futures) {
        f.wait();
    }
    p.control.set_on_abort(nullptr);
    p.passphrase.reset();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (p.control.aborted()) {
        auto leftover = queue.drain();
        for (const auto& item : leftover) {
            CB_LOG_WARN(log_category::pipeline,
                        "Leaving staged ciphertext " + item.ciphertext_path.string());
        }
        auto err = p.control.first_error().value_or(
            error{error_code::job_aborted, "job aborted"});
        job_ctx.error_message = err.message;
        CB_LOG_ERROR_CTX(log_category::pipeline,
                         "Job failed after " + std::to_string(uploader.chunks_uploaded()) +
                         " of " + std::to_string(expected) + " uploads",
                         job_ctx);
        return unexpected{std::move(err)};
    }

    if (uploader.chunks_uploaded() != expected) {
        return unexpected{error{error_code::internal_error,
            "uploaded " + std::to_string(uploader.chunks_uploaded()) + " of " +
            std::to_string(expected) + " files"}};
    }

    job_report report;
    report.chunks_uploaded = uploader.chunks_uploaded();
    report.bytes_uploaded = uploader.bytes_uploaded();
    report.retries = uploader.retries();
    report.checksum_reuploads = uploader.checksum_reuploads();
    report.elapsed = elapsed;
    report.max_staged = queue.max_staged();
    report.objects = uploader.uploaded_objects();
    std::sort(report.objects.begin(), report.objects.end(),
              [](const remote_object& a, const remote_object& b) { return a.key < b.key; });

    job_ctx.bytes = report.bytes_uploaded;
    job_ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
    CB_LOG_INFO_CTX(log_category::pipeline,
                    "Job complete: " + std::to_string(report.chunks_uploaded) + " objects, " +
                    std::to_string(report.retries) + " retries",
                    job_ctx);
    return report;
}

auto pipeline_coordinator::abort() -> void {
    pimpl_->control.request_abort();
}

auto pipeline_coordinator::is_aborted() const noexcept -> bool {
    return pimpl_->control.aborted();
}

auto pipeline_coordinator::encryption_workers() const noexcept -> std::size_t {
    return pimpl_->encryption_workers;
}

auto pipeline_coordinator::upload_workers() const noexcept -> std::size_t {
    return pimpl_->upload_workers;
}

auto pipeline_coordinator::staging_capacity() const noexcept -> std::size_t {
    return pimpl_->capacity;
}

}  // namespace kcenon::cloud_backup
