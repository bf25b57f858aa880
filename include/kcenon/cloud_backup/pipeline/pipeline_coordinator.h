/**
 * @file pipeline_coordinator.h
 * @brief Runs one archive job: encryption, staging and upload
 */

#ifndef KCENON_CLOUD_BACKUP_PIPELINE_PIPELINE_COORDINATOR_H
#define KCENON_CLOUD_BACKUP_PIPELINE_PIPELINE_COORDINATOR_H

#include <kcenon/cloud_backup/adapters/thread_pool_adapter.h>
#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/rate_limiter.h>
#include <kcenon/cloud_backup/core/secret.h>
#include <kcenon/cloud_backup/core/types.h>
#include <kcenon/cloud_backup/encryption/cipher_interface.h>
#include <kcenon/cloud_backup/pipeline/job_control.h>
#include <kcenon/cloud_backup/store/object_store.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Tuning for one coordinator
 */
struct coordinator_options {
    pipeline_options pipeline;
    retry_policy retry;

    /// Token bucket burst window of the rate limiter
    std::chrono::milliseconds rate_window{250};
};

/**
 * @brief Outcome of a successful archive job
 */
struct job_report {
    uint64_t chunks_uploaded = 0;
    uint64_t bytes_uploaded = 0;
    uint64_t retries = 0;
    uint64_t checksum_reuploads = 0;
    std::chrono::milliseconds elapsed{0};
    std::size_t max_staged = 0;               ///< Highest staged ciphertext count seen
    std::vector<remote_object> objects;       ///< Ordered by object key
};

/**
 * @brief Wires chunk enumeration, encryption and upload for one job
 *
 * @code
 * auto coordinator = pipeline_coordinator::create(
 *     cipher, store, rate_source, std::move(passphrase), options);
 * if (!coordinator) { ... }
 * auto report = coordinator.value()->run(chunks);
 * @endcode
 *
 * A job either uploads every chunk or fails with the first terminal error.
 * Objects already stored when a job fails are left in the store.
 */
class pipeline_coordinator {
public:
    /**
     * @brief Build a coordinator for one job
     * @param pool Worker pool to run on; a pool sized for the job is created when null
     */
    [[nodiscard]] static auto create(
        std::shared_ptr<symmetric_cipher> cipher,
        std::shared_ptr<object_store> store,
        std::shared_ptr<rate_limit_source> rate_source,
        scoped_secret passphrase,
        coordinator_options options,
        std::shared_ptr<adapters::worker_pool_interface> pool = nullptr)
        -> result<std::unique_ptr<pipeline_coordinator>>;

    ~pipeline_coordinator();

    pipeline_coordinator(const pipeline_coordinator&) = delete;
    auto operator=(const pipeline_coordinator&) -> pipeline_coordinator& = delete;

    /**
     * @brief Encrypt and upload @p chunks
     *
     * Blocks until every worker has stopped. The passphrase is wiped when
     * the run ends, so a coordinator runs at most one job.
     */
    [[nodiscard]] auto run(std::vector<chunk> chunks) -> result<job_report>;

    /**
     * @brief Request an abort from another thread
     */
    auto abort() -> void;

    [[nodiscard]] auto is_aborted() const noexcept -> bool;

    [[nodiscard]] auto encryption_workers() const noexcept -> std::size_t;
    [[nodiscard]] auto upload_workers() const noexcept -> std::size_t;
    [[nodiscard]] auto staging_capacity() const noexcept -> std::size_t;

private:
    pipeline_coordinator();

    struct impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_PIPELINE_PIPELINE_COORDINATOR_H
