/**
 * @file upload_manager.cpp
 * @brief Upload stage implementation
 */

#include "kcenon/cloud_backup/pipeline/upload_manager.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/store/object_key.h"
#include "kcenon/cloud_backup/store/store_utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace kcenon::cloud_backup {

namespace {

constexpr auto backoff_slice = std::chrono::milliseconds(50);

auto is_md5_hex(const std::string& etag) -> bool {
    return etag.size() == 32 &&
           std::all_of(etag.begin(), etag.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

auto equals_ignore_case(const std::string& a, const std::string& b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto upload_context(const encrypted_chunk& encrypted, const std::string& key)
    -> chunk_log_context {
    chunk_log_context ctx;
    ctx.host = encrypted.source.host;
    ctx.backup_number = encrypted.source.backup_number;
    ctx.sequence = encrypted.source.sequence;
    ctx.total_chunks = encrypted.source.total_count;
    ctx.object_key = key;
    ctx.bytes = encrypted.ciphertext_size;
    return ctx;
}

}  // namespace

upload_manager::upload_manager(std::shared_ptr<object_store> store,
                               std::shared_ptr<rate_limiter> limiter,
                               retry_policy policy)
    : store_(std::move(store)), limiter_(std::move(limiter)), policy_(policy) {}

auto upload_manager::wait_backoff(std::size_t attempt, const std::atomic<bool>& abort_flag)
    -> bool {
    auto delay = store_utils::calculate_retry_delay(policy_, attempt);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (std::chrono::steady_clock::now() < deadline) {
        if (abort_flag.load()) {
            return false;
        }
        auto remaining = deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(remaining, backoff_slice));
    }
    return !abort_flag.load();
}

auto upload_manager::upload(const encrypted_chunk& encrypted,
                            const std::atomic<bool>& abort_flag) -> result<upload_outcome> {
    const auto key = make_object_key(encrypted.source);
    const auto metadata = make_object_metadata(encrypted);

    upload_outcome outcome;
    std::size_t transient_attempt = 0;

    while (true) {
        if (abort_flag.load()) {
            return unexpected{error{error_code::job_aborted, "upload of " + key + " cancelled"}};
        }

        if (limiter_) {
            auto waited = limiter_->throttle(encrypted.ciphertext_size, &abort_flag);
            if (!waited) {
                return unexpected{waited.error()};
            }
        }

        ++transient_attempt;
        ++outcome.attempts;
        auto started = std::chrono::steady_clock::now();
        auto stored = store_->put_object(key, encrypted.ciphertext_path,
                                         encrypted.content_md5, metadata);
        auto elapsed = std::chrono::steady_clock::now() - started;

        auto ctx = upload_context(encrypted, key);
        ctx.attempt = outcome.attempts;

        bool mismatch = false;
        std::string mismatch_detail;

        if (!stored) {
            const auto& err = stored.error();
            if (err.code == error_code::checksum_mismatch) {
                mismatch = true;
                mismatch_detail = err.message;
            } else if (is_transient(err.code) && transient_attempt < policy_.max_attempts) {
                ctx.error_message = err.message;
                CB_LOG_WARN_CTX(log_category::upload, "Transient upload error, retrying", ctx);
                ++outcome.retries;
                retries_.fetch_add(1);
                if (!wait_backoff(transient_attempt, abort_flag)) {
                    return unexpected{error{error_code::job_aborted,
                                            "upload of " + key + " cancelled"}};
                }
                continue;
            } else {
                if (is_transient(err.code)) {
                    return unexpected{error{err.code,
                        err.message + " (gave up after " +
                        std::to_string(transient_attempt) + " attempts)"}};
                }
                return unexpected{err};
            }
        } else {
            const auto& etag = stored.value().etag;
            // Multipart and SSE-KMS ETags are not MD5s; Content-MD5 was checked by the store
            if (is_md5_hex(etag) && !equals_ignore_case(etag, encrypted.ciphertext_md5)) {
                mismatch = true;
                mismatch_detail = "ETag " + etag + " != MD5 " + encrypted.ciphertext_md5;
            }
        }

        if (mismatch) {
            ctx.error_message = mismatch_detail;
            if (outcome.checksum_reuploads == 0) {
                CB_LOG_WARN_CTX(log_category::upload, "Checksum mismatch, uploading again", ctx);
                ++outcome.checksum_reuploads;
                checksum_reuploads_.fetch_add(1);
                transient_attempt = 0;
                continue;
            }
            CB_LOG_ERROR_CTX(log_category::upload, "Checksum mismatch after re-upload", ctx);
            return unexpected{error{error_code::checksum_mismatch,
                                    key + ": " + mismatch_detail}};
        }

        outcome.object = std::move(stored.value());
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
        ctx.duration_ms = static_cast<uint64_t>(ms);
        if (ms > 0) {
            ctx.rate_mbps = static_cast<double>(encrypted.ciphertext_size) /
                            (1024.0 * 1024.0) / (static_cast<double>(ms) / 1000.0);
        }
        CB_LOG_INFO_CTX(log_category::upload, "Chunk uploaded", ctx);
        return outcome;
    }
}

auto upload_manager::run_worker(staging_queue<encrypted_chunk>& queue,
                                job_control& control) -> void {
    while (!control.aborted()) {
        auto item = queue.pop();
        if (!item) {
            return;
        }

        auto outcome = upload(*item, control.abort_flag());
        if (!outcome) {
            queue.release();
            const auto& err = outcome.error();
            if (err.code == error_code::job_aborted && control.aborted()) {
                return;
            }
            auto ctx = upload_context(*item, make_object_key(item->source));
            ctx.error_message = err.message;
            CB_LOG_ERROR_CTX(log_category::upload, "Upload failed", ctx);
            control.fail(err);
            return;
        }

        std::error_code ec;
        std::filesystem::remove(item->ciphertext_path, ec);
        if (ec) {
            CB_LOG_WARN(log_category::upload,
                        "Cannot remove staged " + item->ciphertext_path.string() + ": " +
                        ec.message());
        }
        queue.release();

        {
            std::lock_guard lock(objects_mutex_);
            uploaded_.push_back(outcome.value().object);
        }
        chunks_uploaded_.fetch_add(1);
        bytes_uploaded_.fetch_add(item->ciphertext_size);
    }
}

auto upload_manager::start(adapters::worker_pool_interface& pool,
                           std::size_t worker_count,
                           staging_queue<encrypted_chunk>& queue,
                           job_control& control) -> std::vector<std::future<void>> {
    std::vector<std::future<void>> futures;
    futures.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        futures.push_back(pool.start_worker(
            adapters::pipeline_stage::upload,
            [this, &queue, &control] { run_worker(queue, control); }));
    }
    return futures;
}

auto upload_manager::uploaded_objects() const -> std::vector<remote_object> {
    std::lock_guard lock(objects_mutex_);
    return uploaded_;
}

}  // namespace kcenon::cloud_backup
