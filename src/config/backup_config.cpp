/**
 * @file backup_config.cpp
 * @brief Configuration validation and environment loading
 */

#include "kcenon/cloud_backup/config/backup_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <thread>

namespace kcenon::cloud_backup {

auto pipeline_options::effective_encryption_workers() const -> std::size_t {
    std::size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) {
        hw = 1;
    }
    if (max_encryption_workers == 0) {
        return hw;
    }
    return std::min(max_encryption_workers, hw);
}

auto pipeline_options::staging_capacity() const -> std::size_t {
    return std::max<std::size_t>(1, staging_multiplier * effective_encryption_workers());
}

auto backup_config::validate() const -> result<void> {
    if (!credentials.is_valid()) {
        return unexpected(error{error_code::missing_credentials,
                                "AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY are required"});
    }
    if (store.bucket.empty()) {
        return unexpected(error{error_code::invalid_configuration, "bucket is not set"});
    }
    if (store.region.empty()) {
        return unexpected(error{error_code::invalid_configuration, "region is not set"});
    }
    if (store.retry.max_attempts == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry max_attempts must be at least 1"});
    }
    return {};
}

auto backup_config::validate_for_upload() const -> result<void> {
    auto base = validate();
    if (!base) {
        return base;
    }
    if (!passphrase_file) {
        return unexpected(error{error_code::missing_passphrase,
                                "CLOUD_BACKUP_PASSPHRASE_FILE is not set"});
    }
    if (pipeline.upload_workers == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "upload_workers must be at least 1"});
    }
    if (pipeline.staging_multiplier == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "staging_multiplier must be at least 1"});
    }
    return {};
}

auto legacy_bucket_name(const std::string& access_key_id, const std::string& suffix)
    -> std::string {
    std::string lowered = access_key_id;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered + "-bkup-" + suffix;
}

auto process_environment() -> env_lookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto load_from_environment(const env_lookup& env) -> backup_config {
    backup_config config;

    if (auto v = env("AWS_ACCESS_KEY_ID")) config.credentials.access_key_id = *v;
    if (auto v = env("AWS_SECRET_ACCESS_KEY")) config.credentials.secret_access_key = *v;
    if (auto v = env("AWS_SESSION_TOKEN")) config.credentials.session_token = *v;

    if (auto v = env("CLOUD_BACKUP_BUCKET")) config.store.bucket = *v;
    if (auto v = env("CLOUD_BACKUP_REGION")) config.store.region = *v;
    if (auto v = env("CLOUD_BACKUP_ENDPOINT")) config.store.endpoint = *v;
    if (auto v = env("CLOUD_BACKUP_PASSPHRASE_FILE")) config.passphrase_file = *v;
    if (auto v = env("CLOUD_BACKUP_RATE_LIMIT_FILE")) config.rate_limit_file = *v;
    if (auto v = env("CLOUD_BACKUP_STAGING_DIR")) config.pipeline.staging_directory = *v;
    if (auto v = env("CLOUD_BACKUP_BUCKET_SUFFIX")) config.bucket_suffix = *v;

    if (config.store.bucket.empty() && !config.credentials.access_key_id.empty()) {
        config.store.bucket =
            legacy_bucket_name(config.credentials.access_key_id, config.bucket_suffix);
    }
    return config;
}

}  // namespace kcenon::cloud_backup
