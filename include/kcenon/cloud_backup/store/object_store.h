/**
 * @file object_store.h
 * @brief Abstract object store used by upload, inventory and restore
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_OBJECT_STORE_H
#define KCENON_CLOUD_BACKUP_STORE_OBJECT_STORE_H

#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/types.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Bucket-scoped object operations
 *
 * Errors use the store ranges of error_code so callers can tell transient
 * failures (is_transient) from permanent ones.
 */
class object_store {
public:
    virtual ~object_store() = default;

    /**
     * @brief Upload a local file as one object
     * @param key Object key
     * @param file Local file with the object body
     * @param content_md5 Base64 MD5 of the body, checked by the store
     * @param metadata User metadata (names without the x-amz-meta- prefix)
     * @return The stored object with the store-reported ETag
     */
    [[nodiscard]] virtual auto put_object(
        const std::string& key,
        const std::filesystem::path& file,
        const std::string& content_md5,
        const std::map<std::string, std::string>& metadata) -> result<remote_object> = 0;

    /**
     * @brief Fetch size, timestamp, ETag and metadata of one object
     * @return object_not_found when absent
     */
    [[nodiscard]] virtual auto head_object(const std::string& key)
        -> result<remote_object> = 0;

    /**
     * @brief List every object under @p prefix, following pagination
     *
     * Listed objects carry no user metadata.
     */
    [[nodiscard]] virtual auto list_objects(const std::string& prefix)
        -> result<std::vector<remote_object>> = 0;

    /**
     * @brief Delete one object; deleting an absent object succeeds
     */
    [[nodiscard]] virtual auto delete_object(const std::string& key) -> result<void> = 0;

    /**
     * @brief Pre-signed GET URL valid for @p expires from @p now
     */
    [[nodiscard]] virtual auto presign_get(
        const std::string& key,
        std::chrono::seconds expires,
        std::chrono::system_clock::time_point now) -> result<std::string> = 0;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_STORE_OBJECT_STORE_H
