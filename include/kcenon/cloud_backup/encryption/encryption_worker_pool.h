/**
 * @file encryption_worker_pool.h
 * @brief Parallel encryption of chunks into the staging directory
 */

#ifndef KCENON_CLOUD_BACKUP_ENCRYPTION_ENCRYPTION_WORKER_POOL_H
#define KCENON_CLOUD_BACKUP_ENCRYPTION_ENCRYPTION_WORKER_POOL_H

#include <kcenon/cloud_backup/adapters/thread_pool_adapter.h>
#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/secret.h>
#include <kcenon/cloud_backup/encryption/cipher_interface.h>
#include <kcenon/cloud_backup/pipeline/job_control.h>
#include <kcenon/cloud_backup/pipeline/staging_queue.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Encryption stage of an archive job
 *
 * Each worker takes the next chunk from the feed, reserves a staging slot,
 * hashes the plaintext, runs the cipher into a uniquely named staging file
 * and queues the resulting encrypted_chunk. A cipher failure fails the job;
 * siblings notice the abort flag and stop before their next chunk.
 *
 * The pool borrows the passphrase; the owner must keep it alive until
 * every worker future has completed.
 */
class encryption_worker_pool {
public:
    encryption_worker_pool(std::shared_ptr<symmetric_cipher> cipher,
                           const scoped_secret& passphrase,
                           std::filesystem::path staging_directory);

    encryption_worker_pool(const encryption_worker_pool&) = delete;
    auto operator=(const encryption_worker_pool&) -> encryption_worker_pool& = delete;

    /**
     * @brief Encrypt one chunk into staging
     *
     * Hashes the plaintext into chunk::sha256 unless the chunk already
     * carries one, then fills the ciphertext MD5 in both hex and base64 form. A partial staging file is removed on failure.
     */
    [[nodiscard]] auto encrypt(const chunk& plain, const std::atomic<bool>& abort_flag)
        -> result<encrypted_chunk>;

    /**
     * @brief One worker loop; returns when the feed is empty or the job aborts
     */
    auto run_worker(chunk_feed& feed,
                    staging_queue<encrypted_chunk>& queue,
                    job_control& control) -> void;

    /**
     * @brief Start @p worker_count loops on @p pool under the "encrypt" stage
     */
    [[nodiscard]] auto start(adapters::worker_pool_interface& pool,
                             std::size_t worker_count,
                             chunk_feed& feed,
                             staging_queue<encrypted_chunk>& queue,
                             job_control& control) -> std::vector<std::future<void>>;

    /**
     * @brief Unique staging path for a chunk
     */
    [[nodiscard]] auto staging_path_for(const chunk& plain) -> std::filesystem::path;

    [[nodiscard]] auto chunks_encrypted() const noexcept -> uint64_t {
        return chunks_encrypted_.load();
    }

    [[nodiscard]] auto bytes_encrypted() const noexcept -> uint64_t {
        return bytes_encrypted_.load();
    }

private:
    std::shared_ptr<symmetric_cipher> cipher_;
    const scoped_secret& passphrase_;
    std::filesystem::path staging_directory_;

    std::atomic<uint64_t> name_counter_{0};
    std::atomic<uint64_t> chunks_encrypted_{0};
    std::atomic<uint64_t> bytes_encrypted_{0};
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_ENCRYPTION_ENCRYPTION_WORKER_POOL_H
