/**
 * @file backup_config.h
 * @brief Configuration types for the backup shipper
 *
 * Store, credential, pipeline and cipher settings, a fluent builder and
 * environment loading.
 */

#ifndef KCENON_CLOUD_BACKUP_CONFIG_BACKUP_CONFIG_H
#define KCENON_CLOUD_BACKUP_CONFIG_BACKUP_CONFIG_H

#include <kcenon/cloud_backup/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace kcenon::cloud_backup {

/**
 * @brief Retry policy for object store requests
 */
struct retry_policy {
    /// Maximum number of attempts, the first one included
    std::size_t max_attempts = 3;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{1000};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{30000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;
};

/**
 * @brief Object store access credentials
 */
struct store_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;

    [[nodiscard]] auto is_valid() const -> bool {
        return !access_key_id.empty() && !secret_access_key.empty();
    }
};

/**
 * @brief Object store location and transport settings
 */
struct store_config {
    /// Bucket name
    std::string bucket;

    /// Region
    std::string region = "us-east-1";

    /// Custom endpoint URL (for S3-compatible storage)
    std::optional<std::string> endpoint;

    /// Use path-style URLs (vs virtual-hosted style)
    bool use_path_style = false;

    /// Enable SSL/TLS
    bool use_ssl = true;

    /// Request timeout
    std::chrono::milliseconds request_timeout{300000};

    /// Retry policy
    retry_policy retry;
};

/**
 * @brief Worker counts and staging for the upload pipeline
 */
struct pipeline_options {
    /// Maximum encryption workers (0 = hardware concurrency)
    std::size_t max_encryption_workers = 0;

    /// Upload workers
    std::size_t upload_workers = 2;

    /// Staging capacity as a multiple of the encryption worker count
    std::size_t staging_multiplier = 2;

    /// Directory for ciphertext waiting to be uploaded
    std::filesystem::path staging_directory = std::filesystem::temp_directory_path();

    /**
     * @brief Encryption workers actually started
     */
    [[nodiscard]] auto effective_encryption_workers() const -> std::size_t;

    /**
     * @brief Staging queue capacity K
     */
    [[nodiscard]] auto staging_capacity() const -> std::size_t;
};

/**
 * @brief External cipher invocation settings
 */
struct cipher_options {
    /// gpg executable, looked up in PATH when not absolute
    std::string executable = "gpg";

    /// Symmetric algorithm passed to --cipher-algo
    std::string algorithm = "AES256";

    /// Optional --homedir for gpg
    std::optional<std::filesystem::path> homedir;
};

/**
 * @brief Complete configuration of one cloud_backup process
 */
struct backup_config {
    store_config store;
    store_credentials credentials;
    pipeline_options pipeline;
    cipher_options cipher;

    /// File holding the symmetric passphrase
    std::optional<std::filesystem::path> passphrase_file;

    /// File holding the current upload limit
    std::optional<std::filesystem::path> rate_limit_file;

    /// Suffix for legacy bucket naming
    std::string bucket_suffix = "backups";

    /**
     * @brief Validate the store part of the configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto is_valid() const -> bool { return validate().has_value(); }

    /**
     * @brief Check the settings an upload job needs on top of validate()
     */
    [[nodiscard]] auto validate_for_upload() const -> result<void>;
};

/**
 * @brief Bucket name used by the original tool when none is configured
 *
 * `<lowercase access key>-bkup-<suffix>`
 */
[[nodiscard]] auto legacy_bucket_name(const std::string& access_key_id,
                                      const std::string& suffix) -> std::string;

/**
 * @brief Environment lookup, replaceable in tests
 */
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by std::getenv
 */
[[nodiscard]] auto process_environment() -> env_lookup;

/**
 * @brief Build a configuration from environment variables
 *
 * Reads AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and the
 * CLOUD_BACKUP_* variables. Values not present keep their defaults; the
 * legacy bucket name is filled in when no bucket is set.
 */
[[nodiscard]] auto load_from_environment(const env_lookup& env = process_environment())
    -> backup_config;

/**
 * @brief Fluent builder for backup_config
 *
 * @code
 * auto config = backup_config_builder()
 *     .with_bucket("my-backups")
 *     .with_region("eu-west-1")
 *     .with_credentials({"AKIA...", "secret"})
 *     .with_upload_workers(4)
 *     .build();
 * @endcode
 */
class backup_config_builder {
public:
    backup_config_builder() = default;
    explicit backup_config_builder(backup_config base) : config_(std::move(base)) {}

    auto with_bucket(const std::string& bucket) -> backup_config_builder& {
        config_.store.bucket = bucket;
        return *this;
    }

    auto with_region(const std::string& region) -> backup_config_builder& {
        config_.store.region = region;
        return *this;
    }

    auto with_endpoint(const std::string& endpoint) -> backup_config_builder& {
        config_.store.endpoint = endpoint;
        return *this;
    }

    auto with_path_style(bool enable) -> backup_config_builder& {
        config_.store.use_path_style = enable;
        return *this;
    }

    auto with_ssl(bool enable) -> backup_config_builder& {
        config_.store.use_ssl = enable;
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> backup_config_builder& {
        config_.store.request_timeout = timeout;
        return *this;
    }

    auto with_retry_policy(const retry_policy& policy) -> backup_config_builder& {
        config_.store.retry = policy;
        return *this;
    }

    auto with_credentials(const store_credentials& credentials) -> backup_config_builder& {
        config_.credentials = credentials;
        return *this;
    }

    auto with_encryption_workers(std::size_t count) -> backup_config_builder& {
        config_.pipeline.max_encryption_workers = count;
        return *this;
    }

    auto with_upload_workers(std::size_t count) -> backup_config_builder& {
        config_.pipeline.upload_workers = count;
        return *this;
    }

    auto with_staging_multiplier(std::size_t multiplier) -> backup_config_builder& {
        config_.pipeline.staging_multiplier = multiplier;
        return *this;
    }

    auto with_staging_directory(const std::filesystem::path& dir) -> backup_config_builder& {
        config_.pipeline.staging_directory = dir;
        return *this;
    }

    auto with_cipher(const cipher_options& cipher) -> backup_config_builder& {
        config_.cipher = cipher;
        return *this;
    }

    auto with_passphrase_file(const std::filesystem::path& path) -> backup_config_builder& {
        config_.passphrase_file = path;
        return *this;
    }

    auto with_rate_limit_file(const std::filesystem::path& path) -> backup_config_builder& {
        config_.rate_limit_file = path;
        return *this;
    }

    [[nodiscard]] auto build() const -> backup_config { return config_; }

private:
    backup_config config_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CONFIG_BACKUP_CONFIG_H
