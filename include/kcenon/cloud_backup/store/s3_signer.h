/**
 * @file s3_signer.h
 * @brief AWS Signature Version 4 for S3 requests and pre-signed URLs
 *
 * All signing takes the request time as a parameter so output is
 * reproducible; callers pass std::chrono::system_clock::now() in production.
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_S3_SIGNER_H
#define KCENON_CLOUD_BACKUP_STORE_S3_SIGNER_H

#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace kcenon::cloud_backup {

/// Payload hash placeholder used by pre-signed URLs
inline constexpr const char* unsigned_payload = "UNSIGNED-PAYLOAD";

/// SHA256 of the empty string
inline constexpr const char* empty_payload_sha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

/// Longest validity S3 accepts for a pre-signed URL (7 days)
inline constexpr int64_t max_presign_expiry_seconds = 604800;

/**
 * @brief Request signer bound to one bucket, region and credential set
 */
class s3_signer {
public:
    s3_signer(store_credentials credentials, store_config config);

    /**
     * @brief Host header value (includes a non-default port)
     */
    [[nodiscard]] auto host() const -> const std::string& { return host_; }

    /**
     * @brief Scheme and host, e.g. "https://bucket.s3.us-east-1.amazonaws.com"
     */
    [[nodiscard]] auto base_url() const -> std::string;

    /**
     * @brief Request path for an object ("/key" or "/bucket/key")
     */
    [[nodiscard]] auto object_path(const std::string& key) const -> std::string;

    /**
     * @brief Request path addressing the bucket itself ("/" or "/bucket")
     */
    [[nodiscard]] auto bucket_path() const -> std::string;

    /**
     * @brief Sign a request with the Authorization header
     *
     * Every entry of @p headers is signed. The returned map holds @p headers
     * plus Host, x-amz-date, x-amz-content-sha256, an optional
     * x-amz-security-token and Authorization.
     *
     * @param method HTTP verb
     * @param path Unencoded request path starting with '/'
     * @param query Unencoded query parameters
     * @param headers Extra headers to sign
     * @param payload_hash Hex SHA256 of the body or UNSIGNED-PAYLOAD
     * @param now Signing time
     */
    [[nodiscard]] auto sign_request(
        const std::string& method,
        const std::string& path,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        const std::string& payload_hash,
        std::chrono::system_clock::time_point now) const
        -> std::map<std::string, std::string>;

    /**
     * @brief Build a pre-signed URL for @p key
     *
     * @param method HTTP verb the URL grants (normally "GET")
     * @param key Object key
     * @param expires Validity from @p now, 1..604800 seconds
     * @param now Signing time
     * @return URL, or invalid_argument for an out-of-range expiry
     */
    [[nodiscard]] auto presign(
        const std::string& method,
        const std::string& key,
        std::chrono::seconds expires,
        std::chrono::system_clock::time_point now) const -> result<std::string>;

    /**
     * @brief Canonical query string: encoded pairs sorted by key
     */
    [[nodiscard]] static auto canonical_query(
        const std::map<std::string, std::string>& query) -> std::string;

private:
    [[nodiscard]] auto credential_scope(const std::string& date_stamp) const -> std::string;
    [[nodiscard]] auto signature(const std::string& date_stamp,
                                 const std::string& string_to_sign) const -> std::string;

    store_credentials credentials_;
    store_config config_;
    std::string scheme_;
    std::string host_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_STORE_S3_SIGNER_H
