/**
 * @file upload_manager.h
 * @brief Rate-limited, verified upload of encrypted chunks
 */

#ifndef KCENON_CLOUD_BACKUP_PIPELINE_UPLOAD_MANAGER_H
#define KCENON_CLOUD_BACKUP_PIPELINE_UPLOAD_MANAGER_H

#include <kcenon/cloud_backup/adapters/thread_pool_adapter.h>
#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/rate_limiter.h>
#include <kcenon/cloud_backup/pipeline/job_control.h>
#include <kcenon/cloud_backup/pipeline/staging_queue.h>
#include <kcenon/cloud_backup/store/object_store.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Result of one chunk upload
 */
struct upload_outcome {
    remote_object object;
    uint32_t attempts = 0;            ///< PUT requests sent
    uint32_t retries = 0;             ///< Attempts repeated after a transient error
    uint32_t checksum_reuploads = 0;  ///< 0 or 1
};

/**
 * @brief Upload stage of an archive job
 *
 * Per chunk: poll the rate limiter, PUT with Content-MD5, compare the
 * returned ETag with the ciphertext MD5. Transient errors are retried with
 * exponential backoff up to retry_policy::max_attempts; a checksum mismatch
 * gets exactly one re-upload. Anything else is terminal for the job.
 */
class upload_manager {
public:
    upload_manager(std::shared_ptr<object_store> store,
                   std::shared_ptr<rate_limiter> limiter,
                   retry_policy policy);

    upload_manager(const upload_manager&) = delete;
    auto operator=(const upload_manager&) -> upload_manager& = delete;

    /**
     * @brief Upload one chunk and verify the stored checksum
     */
    [[nodiscard]] auto upload(const encrypted_chunk& encrypted,
                              const std::atomic<bool>& abort_flag) -> result<upload_outcome>;

    /**
     * @brief One worker loop; returns when the queue is finished or aborted
     *
     * Confirmed ciphertext is deleted from staging before its slot is
     * released. Ciphertext of a failed chunk stays in place.
     */
    auto run_worker(staging_queue<encrypted_chunk>& queue, job_control& control) -> void;

    /**
     * @brief Start @p worker_count loops on @p pool under the "upload" stage
     */
    [[nodiscard]] auto start(adapters::worker_pool_interface& pool,
                             std::size_t worker_count,
                             staging_queue<encrypted_chunk>& queue,
                             job_control& control) -> std::vector<std::future<void>>;

    /**
     * @brief Objects confirmed so far, in completion order
     */
    [[nodiscard]] auto uploaded_objects() const -> std::vector<remote_object>;

    [[nodiscard]] auto chunks_uploaded() const noexcept -> uint64_t { return chunks_uploaded_.load(); }
    [[nodiscard]] auto bytes_uploaded() const noexcept -> uint64_t { return bytes_uploaded_.load(); }
    [[nodiscard]] auto retries() const noexcept -> uint64_t { return retries_.load(); }
    [[nodiscard]] auto checksum_reuploads() const noexcept -> uint64_t {
        return checksum_reuploads_.load();
    }

private:
    auto wait_backoff(std::size_t attempt, const std::atomic<bool>& abort_flag) -> bool;

    std::shared_ptr<object_store> store_;
    std::shared_ptr<rate_limiter> limiter_;
    retry_policy policy_;

    mutable std::mutex objects_mutex_;
    std::vector<remote_object> uploaded_;

    std::atomic<uint64_t> chunks_uploaded_{0};
    std::atomic<uint64_t> bytes_uploaded_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> checksum_reuploads_{0};
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_PIPELINE_UPLOAD_MANAGER_H
