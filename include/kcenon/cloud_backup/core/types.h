/**
 * @file types.h
 * @brief Core result and error types for cloud_backup
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_TYPES_H
#define KCENON_CLOUD_BACKUP_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::cloud_backup {

/**
 * @brief Error codes for backup operations
 *
 * Error code ranges:
 * - -100 to -119: Configuration errors
 * - -120 to -139: Local chunk/file errors
 * - -140 to -159: Cipher errors
 * - -160 to -179: Transient store/network errors (retryable)
 * - -180 to -199: Permanent store errors
 * - -200 to -219: Integrity errors
 * - -220 to -239: Inventory/restore errors
 * - -240 to -259: Job control and internal errors
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_configuration = -100,
    missing_credentials = -101,
    missing_passphrase = -102,
    invalid_argument = -103,

    // Local chunk/file errors (-120 to -139)
    file_not_found = -120,
    file_read_error = -121,
    file_write_error = -122,
    chunk_sequence_error = -123,

    // Cipher errors (-140 to -159)
    cipher_unavailable = -140,
    cipher_failed = -141,
    cipher_output_truncated = -142,
    cipher_terminated = -143,

    // Transient store/network errors (-160 to -179)
    connection_failed = -160,
    request_timeout = -161,
    service_unavailable = -162,
    rate_limited = -163,
    server_error = -164,

    // Permanent store errors (-180 to -199)
    auth_failed = -180,
    access_denied = -181,
    quota_exceeded = -182,
    bucket_not_found = -183,
    request_rejected = -184,

    // Integrity errors (-200 to -219)
    checksum_mismatch = -200,

    // Inventory/restore errors (-220 to -239)
    backup_not_found = -220,
    backup_incomplete = -221,
    invalid_object_key = -222,
    object_not_found = -223,

    // Job control and internal errors (-240 to -259)
    job_aborted = -240,
    internal_error = -241,
    not_initialized = -242,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success: return "success";
        case error_code::invalid_configuration: return "invalid configuration";
        case error_code::missing_credentials: return "missing object store credentials";
        case error_code::missing_passphrase: return "missing passphrase";
        case error_code::invalid_argument: return "invalid argument";
        case error_code::file_not_found: return "file not found";
        case error_code::file_read_error: return "file read error";
        case error_code::file_write_error: return "file write error";
        case error_code::chunk_sequence_error: return "chunk sequence error";
        case error_code::cipher_unavailable: return "cipher unavailable";
        case error_code::cipher_failed: return "cipher failed";
        case error_code::cipher_output_truncated: return "cipher output truncated";
        case error_code::cipher_terminated: return "cipher terminated";
        case error_code::connection_failed: return "connection failed";
        case error_code::request_timeout: return "request timeout";
        case error_code::service_unavailable: return "service unavailable";
        case error_code::rate_limited: return "rate limited";
        case error_code::server_error: return "server error";
        case error_code::auth_failed: return "authentication failed";
        case error_code::access_denied: return "access denied";
        case error_code::quota_exceeded: return "quota exceeded";
        case error_code::bucket_not_found: return "bucket not found";
        case error_code::request_rejected: return "request rejected";
        case error_code::checksum_mismatch: return "checksum mismatch";
        case error_code::backup_not_found: return "backup not found";
        case error_code::backup_incomplete: return "backup incomplete";
        case error_code::invalid_object_key: return "invalid object key";
        case error_code::object_not_found: return "object not found";
        case error_code::job_aborted: return "job aborted";
        case error_code::internal_error: return "internal error";
        case error_code::not_initialized: return "not initialized";
        default: return "unknown error";
    }
}

/**
 * @brief Check if an error is transient and may succeed on retry
 */
[[nodiscard]] constexpr auto is_transient(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value >= -179;
}

/**
 * @brief Check if an error is permanent for the object store
 */
[[nodiscard]] constexpr auto is_permanent_store_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -180 && value >= -199;
}

/**
 * @brief Check if an error must abort a running archive job
 *
 * Everything except transient store errors is fatal for the job. Transient
 * errors become fatal only once the retry budget is spent, which the caller
 * reports with the original code.
 */
[[nodiscard]] constexpr auto is_fatal(error_code code) -> bool {
    return code != error_code::success && !is_transient(code);
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_TYPES_H
