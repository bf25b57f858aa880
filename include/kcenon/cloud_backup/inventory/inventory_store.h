/**
 * @file inventory_store.h
 * @brief Groups stored objects into backups
 */

#ifndef KCENON_CLOUD_BACKUP_INVENTORY_INVENTORY_STORE_H
#define KCENON_CLOUD_BACKUP_INVENTORY_INVENTORY_STORE_H

#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/types.h>
#include <kcenon/cloud_backup/store/object_key.h>
#include <kcenon/cloud_backup/store/object_store.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief One stored object of a backup with its decoded key
 */
struct backup_part {
    object_key key;
    remote_object object;
};

/**
 * @brief All objects sharing a host and backup number
 */
struct backup_record {
    std::string host;
    uint64_t backup_number = 0;
    std::vector<backup_part> parts;      ///< Data parts by sequence, then parity
    uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point newest_upload{};
    bool legacy = false;                 ///< Written with the flat key layout

    std::optional<uint32_t> expected_chunks;  ///< From chunk-total metadata
    std::optional<uint32_t> expected_parity;  ///< From parity-total metadata

    /**
     * @brief Time since the most recent upload
     */
    [[nodiscard]] auto age(std::chrono::system_clock::time_point now) const
        -> std::chrono::seconds;

    [[nodiscard]] auto data_count() const -> std::size_t;
    [[nodiscard]] auto parity_count() const -> std::size_t;

    /**
     * @brief True when data parts run 1..N without gaps and match the
     *        recorded totals where known
     */
    [[nodiscard]] auto is_complete() const -> bool;

    /**
     * @brief Sequences missing from 1..N (N from metadata, else the highest seen)
     */
    [[nodiscard]] auto missing_sequences() const -> std::vector<uint32_t>;
};

enum class inventory_order {
    newest_first,
    oldest_first
};

/**
 * @brief Filter and ordering for a listing
 */
struct inventory_query {
    std::optional<std::string> host;
    inventory_order order = inventory_order::newest_first;

    /// HEAD one object per backup to read its chunk totals
    bool load_totals = true;
};

/**
 * @brief Read-only view of the backups held in an object store
 */
class inventory_store {
public:
    explicit inventory_store(std::shared_ptr<object_store> store);

    /**
     * @brief All backups matching @p query
     *
     * Keys in neither layout are skipped.
     */
    [[nodiscard]] auto list(const inventory_query& query = {}) const
        -> result<std::vector<backup_record>>;

    /**
     * @brief One backup, or backup_not_found
     */
    [[nodiscard]] auto find(const std::string& host, uint64_t backup_number) const
        -> result<backup_record>;

    /**
     * @brief Most recent backup of @p host, or backup_not_found
     */
    [[nodiscard]] auto latest(const std::string& host) const -> result<backup_record>;

private:
    auto collect(const std::vector<std::string>& prefixes,
                 const std::optional<std::string>& host) const
        -> result<std::vector<backup_record>>;

    auto load_totals(backup_record& record) const -> result<void>;

    std::shared_ptr<object_store> store_;
};

/**
 * @brief Group listed objects by host and backup number
 *
 * Returns records ordered by host, then backup number.
 */
[[nodiscard]] auto group_backups(const std::vector<remote_object>& objects)
    -> std::vector<backup_record>;

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_INVENTORY_INVENTORY_STORE_H
