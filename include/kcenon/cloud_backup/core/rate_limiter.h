/**
 * @file rate_limiter.h
 * @brief Upload throttling driven by an externally adjustable limit
 *
 * The limit is polled from a rate_limit_source before every chunk transfer
 * and enforced with a token bucket that is allowed to run into debt, so a
 * chunk larger than the bucket still passes after the matching delay.
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_RATE_LIMITER_H
#define KCENON_CLOUD_BACKUP_CORE_RATE_LIMITER_H

#include <kcenon/cloud_backup/core/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace kcenon::cloud_backup {

/**
 * @brief Provider of the current upload limit in bytes per second
 *
 * A value of 0 means unrestricted. Implementations are read on every
 * chunk and must not cache across calls.
 */
class rate_limit_source {
public:
    virtual ~rate_limit_source() = default;

    [[nodiscard]] virtual auto current_limit() -> result<std::size_t> = 0;
};

/**
 * @brief Limit held in memory, adjustable at runtime
 */
class static_rate_limit_source : public rate_limit_source {
public:
    explicit static_rate_limit_source(std::size_t bytes_per_second = 0)
        : limit_(bytes_per_second) {}

    [[nodiscard]] auto current_limit() -> result<std::size_t> override {
        return limit_.load(std::memory_order_relaxed);
    }

    auto set_limit(std::size_t bytes_per_second) -> void {
        limit_.store(bytes_per_second, std::memory_order_relaxed);
    }

private:
    std::atomic<std::size_t> limit_;
};

/**
 * @brief Limit read from a file an operator may edit mid-job
 *
 * The file holds one value such as "0", "500000", "512k" or "2M"
 * (binary multiples). A missing or empty file means unrestricted.
 */
class file_rate_limit_source : public rate_limit_source {
public:
    explicit file_rate_limit_source(std::filesystem::path path);

    [[nodiscard]] auto current_limit() -> result<std::size_t> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Parse a limit value ("0", "none", "750000", "512k", "2m")
 */
[[nodiscard]] auto parse_rate_limit(std::string_view text) -> std::optional<std::size_t>;

/**
 * @brief Token bucket throttle fed by a rate_limit_source
 *
 * @code
 * auto source = std::make_shared<file_rate_limit_source>("/etc/backup/rate");
 * rate_limiter limiter(source);
 *
 * // Before each chunk upload
 * limiter.throttle(chunk_size, &abort_flag);
 * @endcode
 *
 * Thread-safe; upload workers share one limiter so the limit applies to
 * the aggregate throughput.
 */
class rate_limiter {
public:
    /**
     * @param source Limit provider polled before every transfer
     * @param burst_window Bucket capacity expressed as time at the current rate
     */
    explicit rate_limiter(std::shared_ptr<rate_limit_source> source,
                          std::chrono::milliseconds burst_window = std::chrono::milliseconds(250));

    ~rate_limiter();

    rate_limiter(const rate_limiter&) = delete;
    auto operator=(const rate_limiter&) -> rate_limiter& = delete;

    /**
     * @brief Re-read the limit and delay until @p bytes may be sent
     * @param bytes Size of the upcoming transfer
     * @param abort_flag Polled while waiting; the wait ends early when set
     * @return Delay actually applied, or job_aborted when interrupted
     */
    [[nodiscard]] auto throttle(std::size_t bytes,
                                const std::atomic<bool>* abort_flag = nullptr)
        -> result<std::chrono::microseconds>;

    /**
     * @brief Limit seen at the last poll (0 = unlimited)
     */
    [[nodiscard]] auto get_limit() const noexcept -> std::size_t;

    [[nodiscard]] auto is_enabled() const noexcept -> bool;

    /**
     * @brief Wake any waiting thread (used on job abort)
     */
    auto interrupt() -> void;

private:
    auto apply_limit(std::size_t bytes_per_second) -> void;
    auto refill_tokens() -> void;

    std::shared_ptr<rate_limit_source> source_;
    std::chrono::milliseconds burst_window_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<std::size_t> bytes_per_second_{0};
    std::atomic<bool> interrupted_{false};

    // Token bucket state, may go negative while a large chunk is owed
    double tokens_{0.0};
    double capacity_{0.0};
    std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_RATE_LIMITER_H
