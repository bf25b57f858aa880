/**
 * @file rate_limiter.cpp
 * @brief Upload throttling with a polled limit source
 */

#include "kcenon/cloud_backup/core/rate_limiter.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace kcenon::cloud_backup {

namespace {

constexpr auto wait_slice = std::chrono::milliseconds(50);

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

auto parse_rate_limit(std::string_view text) -> std::optional<std::size_t> {
    text = trim(text);
    if (text.empty() || text == "none" || text == "unlimited") {
        return 0;
    }

    std::size_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024; break;
        case 'm': case 'M': multiplier = 1024 * 1024; break;
        case 'g': case 'G': multiplier = 1024 * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    // Out-of-range values are rejected rather than wrapped; 0 would mean unlimited
    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    if (value > std::numeric_limits<std::size_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

// ============================================================================
// file_rate_limit_source
// ============================================================================

file_rate_limit_source::file_rate_limit_source(std::filesystem::path path)
    : path_(std::move(path)) {}

auto file_rate_limit_source::current_limit() -> result<std::size_t> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::size_t{0};
    }

    std::ifstream file(path_);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "cannot open rate limit file: " + path_.string()});
    }

    std::string line;
    std::getline(file, line);
    auto parsed = parse_rate_limit(line);
    if (!parsed) {
        return unexpected(error{error_code::invalid_configuration,
                                "unparseable rate limit '" + line + "' in " + path_.string()});
    }
    return *parsed;
}

// ============================================================================
// rate_limiter
// ============================================================================

rate_limiter::rate_limiter(std::shared_ptr<rate_limit_source> source,
                           std::chrono::milliseconds burst_window)
    : source_(std::move(source))
    , burst_window_(burst_window)
    , last_refill_(std::chrono::steady_clock::now()) {}

rate_limiter::~rate_limiter() {
    interrupt();
}

auto rate_limiter::throttle(std::size_t bytes, const std::atomic<bool>* abort_flag)
    -> result<std::chrono::microseconds> {
    if (source_) {
        auto polled = source_->current_limit();
        if (!polled) {
            CB_LOG_WARN(log_category::rate_limit,
                        "Keeping previous limit of " +
                        std::to_string(bytes_per_second_.load()) +
                        " B/s: " + polled.error().message);
        } else if (polled.value() != bytes_per_second_.load(std::memory_order_relaxed)) {
            CB_LOG_INFO(log_category::rate_limit,
                        "Upload limit changed to " +
                        (polled.value() == 0 ? std::string("unlimited")
                                             : std::to_string(polled.value()) + " B/s"));
            apply_limit(polled.value());
        }
    }

    if (bytes == 0 || !is_enabled()) {
        return std::chrono::microseconds::zero();
    }

    std::unique_lock lock(mutex_);
    refill_tokens();
    tokens_ -= static_cast<double>(bytes);
    if (tokens_ >= 0.0) {
        return std::chrono::microseconds::zero();
    }

    double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    if (rate <= 0.0) {
        return std::chrono::microseconds::zero();
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::microseconds(
        static_cast<int64_t>(-tokens_ / rate * 1'000'000.0));

    while (std::chrono::steady_clock::now() < deadline) {
        if (interrupted_.load() || (abort_flag && abort_flag->load())) {
            return unexpected(error{error_code::job_aborted, "throttle wait interrupted"});
        }
        auto slice_end = std::min(deadline, std::chrono::steady_clock::now() + wait_slice);
        cv_.wait_until(lock, slice_end);
    }

    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

auto rate_limiter::get_limit() const noexcept -> std::size_t {
    return bytes_per_second_.load(std::memory_order_relaxed);
}

auto rate_limiter::is_enabled() const noexcept -> bool {
    return bytes_per_second_.load(std::memory_order_relaxed) > 0;
}

auto rate_limiter::interrupt() -> void {
    interrupted_.store(true);
    cv_.notify_all();
}

auto rate_limiter::apply_limit(std::size_t bytes_per_second) -> void {
    std::lock_guard lock(mutex_);

    // Settle tokens earned at the old rate before switching
    refill_tokens();

    auto old_limit = bytes_per_second_.exchange(bytes_per_second);
    if (bytes_per_second == 0) {
        tokens_ = 0.0;
        capacity_ = 0.0;
    } else {
        double new_capacity = static_cast<double>(bytes_per_second) *
                              std::chrono::duration<double>(burst_window_).count();
        if (old_limit == 0) {
            // Start with full bucket when enabling
            tokens_ = new_capacity;
        } else {
            tokens_ = std::min(tokens_, new_capacity);
        }
        capacity_ = new_capacity;
    }
    last_refill_ = std::chrono::steady_clock::now();
    cv_.notify_all();
}

auto rate_limiter::refill_tokens() -> void {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double>(now - last_refill_);
    last_refill_ = now;

    double rate = static_cast<double>(bytes_per_second_.load(std::memory_order_relaxed));
    if (elapsed.count() > 0.0 && rate > 0.0) {
        tokens_ = std::min(tokens_ + elapsed.count() * rate, capacity_);
    }
}

}  // namespace kcenon::cloud_backup
