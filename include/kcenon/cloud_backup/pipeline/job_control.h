/**
 * @file job_control.h
 * @brief Job-wide abort flag and chunk feed shared by pipeline workers
 */

#ifndef KCENON_CLOUD_BACKUP_PIPELINE_JOB_CONTROL_H
#define KCENON_CLOUD_BACKUP_PIPELINE_JOB_CONTROL_H

#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/types.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Abort flag plus the error that tripped it
 *
 * Workers poll aborted() every iteration. The first fail() wins; later
 * failures are counted but do not replace the reported cause.
 */
class job_control {
public:
    job_control() = default;

    job_control(const job_control&) = delete;
    auto operator=(const job_control&) -> job_control& = delete;

    /**
     * @brief Record a terminal failure and trip the abort flag
     */
    auto fail(error err) -> void {
        {
            std::lock_guard lock(mutex_);
            ++failures_;
            if (!first_error_) {
                first_error_ = std::move(err);
            }
        }
        aborted_.store(true);

        // Held across the call so set_on_abort() cannot return while a hook runs
        std::lock_guard hook_lock(hook_mutex_);
        auto hook = on_abort_;
        if (hook) {
            hook();
        }
    }

    /**
     * @brief Trip the abort flag without a worker failure (operator request)
     */
    auto request_abort() -> void {
        fail(error{error_code::job_aborted, "job aborted by request"});
    }

    [[nodiscard]] auto aborted() const noexcept -> bool { return aborted_.load(); }

    [[nodiscard]] auto abort_flag() const noexcept -> const std::atomic<bool>& {
        return aborted_;
    }

    [[nodiscard]] auto first_error() const -> std::optional<error> {
        std::lock_guard lock(mutex_);
        return first_error_;
    }

    [[nodiscard]] auto failure_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return failures_;
    }

    /**
     * @brief Callback run on every fail(), used to wake blocked queues
     *
     * Waits for a hook already running on another thread, so whatever the
     * old hook captured may be destroyed once this returns. A hook may call
     * fail() itself.
     */
    auto set_on_abort(std::function<void()> hook) -> void {
        std::lock_guard hook_lock(hook_mutex_);
        on_abort_ = std::move(hook);
    }

private:
    std::atomic<bool> aborted_{false};
    mutable std::mutex mutex_;
    std::optional<error> first_error_;
    std::size_t failures_ = 0;
    std::recursive_mutex hook_mutex_;
    std::function<void()> on_abort_;
};

/**
 * @brief Hands out chunks in enumeration order to encryption workers
 */
class chunk_feed {
public:
    explicit chunk_feed(std::vector<chunk> chunks) : chunks_(std::move(chunks)) {}

    /**
     * @brief Next pending chunk, or nullopt when exhausted
     */
    [[nodiscard]] auto next() -> std::optional<chunk> {
        auto index = next_.fetch_add(1);
        if (index >= chunks_.size()) {
            return std::nullopt;
        }
        return chunks_[index];
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return chunks_.size(); }

private:
    std::vector<chunk> chunks_;
    std::atomic<std::size_t> next_{0};
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_PIPELINE_JOB_CONTROL_H
