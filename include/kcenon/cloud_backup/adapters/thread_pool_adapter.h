// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Threads for the encryption and upload worker loops
 *
 * A backup job starts a fixed number of long-running worker loops per
 * stage. Each loop owns a thread until the staging queue drains or the job
 * aborts, so a pool must be at least as large as the sum of both stages.
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::cloud_backup::adapters {

/**
 * @brief Pipeline stage a worker loop belongs to
 */
enum class pipeline_stage : std::size_t {
    encrypt = 0,
    upload = 1,
};

inline constexpr std::size_t pipeline_stage_count = 2;

[[nodiscard]] constexpr auto to_string(pipeline_stage stage) noexcept -> std::string_view {
    switch (stage) {
        case pipeline_stage::encrypt: return "encrypt";
        case pipeline_stage::upload: return "upload";
    }
    return "unknown";
}

/**
 * @brief Live count of worker loops per stage
 *
 * Lock free. Loops register through stage_census::scoped_worker so a loop
 * that throws is still counted out.
 */
class stage_census {
public:
    class scoped_worker {
    public:
        scoped_worker(stage_census& census, pipeline_stage stage) noexcept
            : census_(census), stage_(stage) {}
        ~scoped_worker() { census_.discharge(stage_); }

        scoped_worker(const scoped_worker&) = delete;
        scoped_worker& operator=(const scoped_worker&) = delete;

    private:
        stage_census& census_;
        pipeline_stage stage_;
    };

    /// Counts a loop in before it is queued so callers see it immediately
    auto enlist(pipeline_stage stage) noexcept -> void {
        slot(stage).fetch_add(1, std::memory_order_acq_rel);
    }

    auto discharge(pipeline_stage stage) noexcept -> void {
        slot(stage).fetch_sub(1, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto running(pipeline_stage stage) const noexcept -> std::size_t {
        return counts_[static_cast<std::size_t>(stage)].load(std::memory_order_acquire);
    }

private:
    auto slot(pipeline_stage stage) noexcept -> std::atomic<std::size_t>& {
        return counts_[static_cast<std::size_t>(stage)];
    }

    std::array<std::atomic<std::size_t>, pipeline_stage_count> counts_{};
};

/**
 * @brief Runs pipeline worker loops
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Start one worker loop for @p stage
     * @return Future that completes when the loop returns, carrying any
     *         exception it threw
     */
    [[nodiscard]] virtual auto start_worker(pipeline_stage stage,
                                            std::function<void()> loop)
        -> std::future<void> = 0;

    /// Threads available to worker loops
    [[nodiscard]] virtual auto thread_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /// Loops of @p stage started and not yet returned
    [[nodiscard]] virtual auto running_workers(pipeline_stage stage) const -> std::size_t = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker loops on a kcenon::thread::thread_pool
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    thread_system_worker_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                              std::size_t threads);
    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Build and start a pool of @p threads workers
     * @param threads Thread count, 0 picks hardware concurrency
     */
    [[nodiscard]] static auto launch(std::size_t threads, const std::string& name)
        -> std::shared_ptr<thread_system_worker_pool>;

    [[nodiscard]] auto start_worker(pipeline_stage stage, std::function<void()> loop)
        -> std::future<void> override;
    [[nodiscard]] auto thread_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto running_workers(pipeline_stage stage) const -> std::size_t override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    std::size_t threads_;
    stage_census census_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker loops on dedicated std::async threads
 *
 * Used when thread_system is not available. Every loop gets its own thread,
 * so thread_count() is only the size the job asked for.
 */
class async_worker_pool : public worker_pool_interface {
public:
    explicit async_worker_pool(std::size_t threads = 0);

    [[nodiscard]] auto start_worker(pipeline_stage stage, std::function<void()> loop)
        -> std::future<void> override;
    [[nodiscard]] auto thread_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto running_workers(pipeline_stage stage) const -> std::size_t override;

private:
    std::size_t threads_;
    // Shared with running loops so a loop may outlive the pool object
    std::shared_ptr<stage_census> census_;
};

/**
 * @brief Picks thread_system when it was built in, std::async otherwise
 */
class worker_pool_factory {
public:
    [[nodiscard]] static auto create(std::size_t threads = 0,
                                     const std::string& name = "cloud_backup_pipeline")
        -> std::shared_ptr<worker_pool_interface>;

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
        return KCENON_WITH_THREAD_SYSTEM != 0;
    }
};

}  // namespace kcenon::cloud_backup::adapters
