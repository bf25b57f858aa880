/**
 * @file object_key.h
 * @brief Object key layout and per-object metadata
 *
 * Keys are `<host>/<backup>/<seq>` with the sequence zero-padded to six
 * digits when written and any width up to nine accepted when parsed;
 * parity files add a `.par2` suffix. Flat names written by the
 * older shell tool (`<host>.<num>.tar[.<ext>][.<aa>][.gpg]`) are still
 * recognised when listing.
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_OBJECT_KEY_H
#define KCENON_CLOUD_BACKUP_STORE_OBJECT_KEY_H

#include <kcenon/cloud_backup/core/chunk_types.h>
#include <kcenon/cloud_backup/core/types.h>

#include <cstdint>
#include <map>
#include <string>

namespace kcenon::cloud_backup {

/// Metadata names, sent as x-amz-meta-<name>
namespace meta {
inline constexpr const char* sha256 = "sha256";
inline constexpr const char* chunk_total = "chunk-total";
inline constexpr const char* parity_total = "parity-total";
inline constexpr const char* compression = "compression";
inline constexpr const char* cipher = "cipher";
}  // namespace meta

/**
 * @brief Decoded object key
 */
struct object_key {
    std::string host;
    uint64_t backup_number = 0;
    uint32_t sequence = 0;   ///< 0 for legacy parity names
    chunk_kind kind = chunk_kind::data;
    bool legacy = false;
};

/**
 * @brief Key for one chunk of a backup
 */
[[nodiscard]] auto make_object_key(const std::string& host, uint64_t backup_number,
                                   uint32_t sequence, chunk_kind kind) -> std::string;

[[nodiscard]] auto make_object_key(const chunk& c) -> std::string;

/**
 * @brief Listing prefix for all backups of a host ("<host>/")
 */
[[nodiscard]] auto host_prefix(const std::string& host) -> std::string;

/**
 * @brief Listing prefix for one backup ("<host>/<backup>/")
 */
[[nodiscard]] auto backup_prefix(const std::string& host, uint64_t backup_number)
    -> std::string;

/**
 * @brief Decode a key in either layout
 * @return Decoded key or invalid_object_key
 */
[[nodiscard]] auto parse_object_key(const std::string& key) -> result<object_key>;

/**
 * @brief Metadata stored with an uploaded chunk (names without prefix)
 */
[[nodiscard]] auto make_object_metadata(const encrypted_chunk& encrypted)
    -> std::map<std::string, std::string>;

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_STORE_OBJECT_KEY_H
