/**
 * @file s3_object_store.h
 * @brief S3 implementation of object_store over an HTTP client
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_S3_OBJECT_STORE_H
#define KCENON_CLOUD_BACKUP_STORE_S3_OBJECT_STORE_H

#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/store/http_client.h>
#include <kcenon/cloud_backup/store/object_store.h>
#include <kcenon/cloud_backup/store/s3_signer.h>

#include <memory>

namespace kcenon::cloud_backup {

/**
 * @brief Amazon S3 (and S3-compatible) object store
 *
 * Requests are signed with SigV4. Each call is a single HTTP exchange;
 * retrying is left to the caller.
 *
 * @code
 * auto store = s3_object_store::create(config.store, config.credentials);
 * if (!store) {
 *     // missing_credentials or invalid_configuration
 * }
 * auto objects = store.value()->list_objects("gandalf/");
 * @endcode
 */
class s3_object_store : public object_store {
public:
    /**
     * @brief Create a store using the network_system HTTP client
     */
    [[nodiscard]] static auto create(const store_config& config,
                                     const store_credentials& credentials)
        -> result<std::unique_ptr<s3_object_store>>;

    /**
     * @brief Create a store over a caller-supplied HTTP client
     */
    [[nodiscard]] static auto create(const store_config& config,
                                     const store_credentials& credentials,
                                     std::shared_ptr<http_client_interface> client)
        -> result<std::unique_ptr<s3_object_store>>;

    ~s3_object_store() override;

    s3_object_store(const s3_object_store&) = delete;
    auto operator=(const s3_object_store&) -> s3_object_store& = delete;

    [[nodiscard]] auto put_object(
        const std::string& key,
        const std::filesystem::path& file,
        const std::string& content_md5,
        const std::map<std::string, std::string>& metadata) -> result<remote_object> override;

    [[nodiscard]] auto head_object(const std::string& key) -> result<remote_object> override;

    [[nodiscard]] auto list_objects(const std::string& prefix)
        -> result<std::vector<remote_object>> override;

    [[nodiscard]] auto delete_object(const std::string& key) -> result<void> override;

    [[nodiscard]] auto presign_get(
        const std::string& key,
        std::chrono::seconds expires,
        std::chrono::system_clock::time_point now) -> result<std::string> override;

    [[nodiscard]] auto bucket() const -> const std::string&;

private:
    s3_object_store(const store_config& config,
                    const store_credentials& credentials,
                    std::shared_ptr<http_client_interface> client);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_STORE_S3_OBJECT_STORE_H
