// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker loop pools for the backup pipeline
 */

#include "kcenon/cloud_backup/adapters/thread_pool_adapter.h"

#include "kcenon/cloud_backup/core/logging.h"

#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::cloud_backup::adapters {

namespace {

auto pick_thread_count(std::size_t requested) -> std::size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/// One worker loop queued on thread_system; the packaged task stores the
/// loop's exception in the future handed back to the coordinator
class worker_loop_job : public kcenon::thread::job {
public:
    worker_loop_job(std::packaged_task<void()> loop, pipeline_stage stage)
        : job(std::string(to_string(stage)) + "_worker"), loop_(std::move(loop)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        loop_();
        return common::ok();
    }

private:
    std::packaged_task<void()> loop_;
};

}  // namespace

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::size_t threads)
    : pool_(std::move(pool)), threads_(threads) {}

thread_system_worker_pool::~thread_system_worker_pool() {
    if (pool_) {
        pool_->stop();
    }
}

auto thread_system_worker_pool::launch(std::size_t threads, const std::string& name)
    -> std::shared_ptr<thread_system_worker_pool> {
    threads = pick_thread_count(threads);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(name);
    for (std::size_t i = 0; i < threads; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    CB_LOG_DEBUG(log_category::pipeline,
                 name + " started with " + std::to_string(threads) + " threads");
    return std::make_shared<thread_system_worker_pool>(std::move(pool), threads);
}

auto thread_system_worker_pool::start_worker(pipeline_stage stage, std::function<void()> loop)
    -> std::future<void> {
    census_.enlist(stage);

    // The coordinator joins every future before the pool goes away
    std::packaged_task<void()> task([this, stage, loop = std::move(loop)] {
        stage_census::scoped_worker registered(census_, stage);
        loop();
    });
    auto done = task.get_future();

    auto queued = pool_->enqueue(std::make_unique<worker_loop_job>(std::move(task), stage));
    if (!queued.is_ok()) {
        census_.discharge(stage);
        auto message = "cannot queue " + std::string(to_string(stage)) + " worker";
        CB_LOG_ERROR(log_category::pipeline, message);

        std::promise<void> rejected;
        rejected.set_exception(std::make_exception_ptr(std::runtime_error(message)));
        return rejected.get_future();
    }
    return done;
}

auto thread_system_worker_pool::thread_count() const -> std::size_t {
    return threads_;
}

auto thread_system_worker_pool::is_running() const -> bool {
    return pool_ != nullptr;
}

auto thread_system_worker_pool::running_workers(pipeline_stage stage) const -> std::size_t {
    return census_.running(stage);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

async_worker_pool::async_worker_pool(std::size_t threads)
    : threads_(pick_thread_count(threads)), census_(std::make_shared<stage_census>()) {}

auto async_worker_pool::start_worker(pipeline_stage stage, std::function<void()> loop)
    -> std::future<void> {
    census_->enlist(stage);
    return std::async(std::launch::async, [census = census_, stage, loop = std::move(loop)] {
        stage_census::scoped_worker registered(*census, stage);
        loop();
    });
}

auto async_worker_pool::thread_count() const -> std::size_t {
    return threads_;
}

auto async_worker_pool::is_running() const -> bool {
    return true;
}

auto async_worker_pool::running_workers(pipeline_stage stage) const -> std::size_t {
    return census_->running(stage);
}

auto worker_pool_factory::create(std::size_t threads, const std::string& name)
    -> std::shared_ptr<worker_pool_interface> {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::launch(threads, name);
#else
    CB_LOG_DEBUG(log_category::pipeline,
                 name + " uses std::async worker threads");
    return std::make_shared<async_worker_pool>(threads);
#endif
}

}  // namespace kcenon::cloud_backup::adapters
