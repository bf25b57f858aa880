/**
 * @file staging_queue.h
 * @brief Bounded hand-off between encryption and upload
 *
 * Capacity counts staged ciphertext files, not queue entries: a producer
 * reserves a slot before it starts writing ciphertext and the consumer
 * releases it only after the file is gone. At most capacity() files exist
 * in staging at any time.
 */

#ifndef KCENON_CLOUD_BACKUP_PIPELINE_STAGING_QUEUE_H
#define KCENON_CLOUD_BACKUP_PIPELINE_STAGING_QUEUE_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::cloud_backup {

template <typename T>
class staging_queue {
public:
    explicit staging_queue(std::size_t capacity)
        : capacity_(std::max<std::size_t>(1, capacity)) {}

    staging_queue(const staging_queue&) = delete;
    auto operator=(const staging_queue&) -> staging_queue& = delete;

    /**
     * @brief Block until a staging slot is free
     * @return false if the queue was aborted while waiting
     */
    [[nodiscard]] auto reserve() -> bool {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return aborted_ || reserved_ < capacity_; });
        if (aborted_) {
            return false;
        }
        ++reserved_;
        max_reserved_ = std::max(max_reserved_, reserved_);
        return true;
    }

    /**
     * @brief Give back a slot whose file was removed or never written
     */
    auto release() -> void {
        {
            std::lock_guard lock(mutex_);
            if (reserved_ > 0) {
                --reserved_;
            }
        }
        not_full_.notify_one();
    }

    /**
     * @brief Queue an item for a slot obtained from reserve()
     */
    auto push(T item) -> void {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
    }

    /**
     * @brief Next item; nullopt once closed and empty, or aborted
     */
    [[nodiscard]] auto pop() -> std::optional<T> {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return aborted_ || closed_ || !items_.empty(); });
        if (aborted_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /**
     * @brief No more items will be pushed; consumers finish what is queued
     */
    auto close() -> void {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    /**
     * @brief Wake everyone; queued items are left unprocessed
     */
    auto abort() -> void {
        {
            std::lock_guard lock(mutex_);
            aborted_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    /**
     * @brief Items never handed to a consumer (after abort)
     */
    [[nodiscard]] auto drain() -> std::deque<T> {
        std::lock_guard lock(mutex_);
        std::deque<T> rest;
        rest.swap(items_);
        return rest;
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto staged() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return reserved_;
    }

    /**
     * @brief High-water mark of reserved slots
     */
    [[nodiscard]] auto max_staged() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return max_reserved_;
    }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    std::size_t reserved_ = 0;
    std::size_t max_reserved_ = 0;
    bool closed_ = false;
    bool aborted_ = false;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_PIPELINE_STAGING_QUEUE_H
