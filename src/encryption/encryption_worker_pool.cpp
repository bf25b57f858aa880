/**
 * @file encryption_worker_pool.cpp
 * @brief Encryption stage implementation
 */

#include "kcenon/cloud_backup/encryption/encryption_worker_pool.h"
#include "kcenon/cloud_backup/core/checksum.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <chrono>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace kcenon::cloud_backup {

namespace {

auto chunk_context(const chunk& c) -> chunk_log_context {
    chunk_log_context ctx;
    ctx.host = c.host;
    ctx.backup_number = c.backup_number;
    ctx.sequence = c.sequence;
    ctx.total_chunks = c.total_count;
    ctx.bytes = c.size;
    return ctx;
}

}  // namespace

encryption_worker_pool::encryption_worker_pool(std::shared_ptr<symmetric_cipher> cipher,
                                               const scoped_secret& passphrase,
                                               std::filesystem::path staging_directory)
    : cipher_(std::move(cipher))
    , passphrase_(passphrase)
    , staging_directory_(std::move(staging_directory)) {}

auto encryption_worker_pool::staging_path_for(const chunk& plain) -> std::filesystem::path {
    std::ostringstream name;
    name << plain.host << "." << plain.backup_number << "."
         << std::setw(6) << std::setfill('0') << plain.sequence;
    if (plain.kind == chunk_kind::parity) {
        name << ".par2";
    }
    name << "." << ::getpid() << "-" << name_counter_.fetch_add(1) << ".gpg";
    return staging_directory_ / name.str();
}

auto encryption_worker_pool::encrypt(const chunk& plain, const std::atomic<bool>& abort_flag)
    -> result<encrypted_chunk> {
    encrypted_chunk out;
    out.source = plain;
    if (out.source.sha256.empty()) {
        auto plaintext_digest = checksum::sha256_file(plain.path);
        if (!plaintext_digest) {
            return unexpected{plaintext_digest.error()};
        }
        out.source.sha256 = plaintext_digest.value().hex;
    }
    out.algorithm = cipher_->algorithm();
    out.ciphertext_path = staging_path_for(plain);

    auto started = std::chrono::steady_clock::now();
    auto size = cipher_->encrypt(plain.path, out.ciphertext_path, passphrase_, abort_flag);
    if (!size) {
        std::error_code ec;
        std::filesystem::remove(out.ciphertext_path, ec);
        return unexpected{size.error()};
    }

    auto ciphertext_digest = checksum::md5_file(out.ciphertext_path);
    if (!ciphertext_digest) {
        std::error_code ec;
        std::filesystem::remove(out.ciphertext_path, ec);
        return unexpected{ciphertext_digest.error()};
    }

    out.ciphertext_size = ciphertext_digest.value().size;
    out.ciphertext_md5 = ciphertext_digest.value().hex;
    out.content_md5 = ciphertext_digest.value().base64;

    auto ctx = chunk_context(plain);
    ctx.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    CB_LOG_DEBUG_CTX(log_category::cipher, "Chunk encrypted", ctx);

    chunks_encrypted_.fetch_add(1);
    bytes_encrypted_.fetch_add(plain.size);
    return out;
}

auto encryption_worker_pool::run_worker(chunk_feed& feed,
                                        staging_queue<encrypted_chunk>& queue,
                                        job_control& control) -> void {
    while (!control.aborted()) {
        auto next = feed.next();
        if (!next) {
            return;
        }

        if (!queue.reserve()) {
            return;
        }
        if (control.aborted()) {
            queue.release();
            return;
        }

        auto encrypted = encrypt(*next, control.abort_flag());
        if (!encrypted) {
            queue.release();
            const auto& err = encrypted.error();
            if (err.code == error_code::job_aborted && control.aborted()) {
                return;
            }
            auto ctx = chunk_context(*next);
            ctx.error_message = err.message;
            CB_LOG_ERROR_CTX(log_category::cipher, "Encryption failed", ctx);
            control.fail(err);
            return;
        }

        queue.push(std::move(encrypted.value()));
    }
}

auto encryption_worker_pool::start(adapters::worker_pool_interface& pool,
                                   std::size_t worker_count,
                                   chunk_feed& feed,
                                   staging_queue<encrypted_chunk>& queue,
                                   job_control& control) -> std::vector<std::future<void>> {
    std::vector<std::future<void>> futures;
    futures.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        futures.push_back(pool.start_worker(
            adapters::pipeline_stage::encrypt,
            [this, &feed, &queue, &control] { run_worker(feed, queue, control); }));
    }
    return futures;
}

}  // namespace kcenon::cloud_backup
