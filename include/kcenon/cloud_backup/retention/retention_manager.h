/**
 * @file retention_manager.h
 * @brief Age-based deletion of stored backups
 */

#ifndef KCENON_CLOUD_BACKUP_RETENTION_RETENTION_MANAGER_H
#define KCENON_CLOUD_BACKUP_RETENTION_RETENTION_MANAGER_H

#include <kcenon/cloud_backup/core/types.h>
#include <kcenon/cloud_backup/inventory/inventory_store.h>
#include <kcenon/cloud_backup/store/object_store.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Which backups to expire
 */
struct retention_policy {
    /// Backups strictly older than this are deleted
    std::chrono::hours max_age{24 * 30};

    std::optional<std::string> host;

    /// Report what would be deleted without deleting
    bool dry_run = false;

    /// Reference time; the system clock when unset
    std::optional<std::chrono::system_clock::time_point> now;
};

/**
 * @brief Outcome of one retention run
 */
struct retention_report {
    struct removed_backup {
        std::string host;
        uint64_t backup_number = 0;
        std::chrono::seconds age{0};
        std::size_t objects = 0;
        uint64_t bytes = 0;
    };

    std::size_t backups_removed = 0;
    std::size_t objects_deleted = 0;
    uint64_t bytes_freed = 0;
    bool dry_run = false;
    std::vector<removed_backup> removed;

    /**
     * @brief "<objects> objects, <bytes> bytes freed"
     */
    [[nodiscard]] auto summary() const -> std::string;
};

/**
 * @brief Deletes every object of backups older than a threshold
 *
 * Deletion is per object and not transactional. A run that stops half way
 * leaves a partial backup which the next run deletes; objects already gone
 * are simply not listed again.
 */
class retention_manager {
public:
    explicit retention_manager(std::shared_ptr<object_store> store);

    [[nodiscard]] auto apply(const retention_policy& policy) const -> result<retention_report>;

    /**
     * @brief Parse a day count given on the command line
     */
    [[nodiscard]] static auto parse_age_days(const std::string& text)
        -> result<std::chrono::hours>;

private:
    std::shared_ptr<object_store> store_;
    inventory_store inventory_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_RETENTION_RETENTION_MANAGER_H
