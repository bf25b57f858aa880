/**
 * @file store_utils.h
 * @brief Encoding, hashing, time and XML helpers for the object store client
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_STORE_UTILS_H
#define KCENON_CLOUD_BACKUP_STORE_STORE_UTILS_H

#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cloud_backup::store_utils {

// encoding

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief RFC 3986 percent-encoding with uppercase hex, as SigV4 requires
 * @param encode_slash false keeps '/' literal for object paths
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

// cryptographic

auto sha256(const std::string& data) -> std::vector<uint8_t>;

auto sha256_hex(const std::string& data) -> std::string;

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t>;

// time

/**
 * @brief Format as YYYYMMDD'T'HHMMSS'Z' (UTC)
 */
auto format_amz_date(std::chrono::system_clock::time_point time) -> std::string;

/**
 * @brief Format as YYYYMMDD (UTC)
 */
auto format_date_stamp(std::chrono::system_clock::time_point time) -> std::string;

/**
 * @brief Format as YYYY-MM-DD HH:MM:SS UTC
 */
auto format_display_time(std::chrono::system_clock::time_point time) -> std::string;

/**
 * @brief Parse an ISO 8601 UTC timestamp such as 2024-05-01T12:00:00.000Z
 */
auto parse_iso8601(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

/**
 * @brief Parse an RFC 1123 date such as "Wed, 01 May 2024 12:00:00 GMT"
 */
auto parse_rfc1123(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point>;

// xml

/**
 * @brief Extract the first element value
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract every occurrence of an element, in document order
 */
auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string>;

/**
 * @brief Decode the five predefined XML entities
 */
auto xml_unescape(const std::string& text) -> std::string;

// response

/**
 * @brief Strip surrounding double quotes from an ETag
 */
auto normalize_etag(const std::string& etag) -> std::string;

/**
 * @brief Map a non-2xx status and error body to an error code
 */
auto classify_http_status(int status_code, const std::string& body) -> error_code;

// retry policy

/**
 * @brief Backoff before the next attempt, capped at max_delay
 * @param attempt Attempt that just failed, counting from 1
 *
 * With jitter the capped delay is scaled by a random factor in [0.5, 1.5].
 */
auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds;

}  // namespace kcenon::cloud_backup::store_utils

#endif  // KCENON_CLOUD_BACKUP_STORE_STORE_UTILS_H
