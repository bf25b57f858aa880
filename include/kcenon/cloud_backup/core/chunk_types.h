/**
 * @file chunk_types.h
 * @brief Data model for chunks, ciphertext and stored objects
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_CHUNK_TYPES_H
#define KCENON_CLOUD_BACKUP_CORE_CHUNK_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Kind of file in an archive job
 */
enum class chunk_kind {
    data,    ///< Piece of the split tar archive
    parity   ///< Redundancy file produced upstream
};

[[nodiscard]] constexpr auto to_string(chunk_kind kind) -> const char* {
    switch (kind) {
        case chunk_kind::data: return "data";
        case chunk_kind::parity: return "parity";
        default: return "unknown";
    }
}

/**
 * @brief One piece of a split archive or a parity file
 *
 * Data chunks carry sequence 1..total_count; parity files follow at
 * total_count + 1 .. total_count + parity_count.
 */
struct chunk {
    std::string host;
    uint64_t backup_number = 0;
    uint32_t sequence = 0;
    uint32_t total_count = 0;
    uint32_t parity_count = 0;
    chunk_kind kind = chunk_kind::data;
    std::filesystem::path path;
    uint64_t size = 0;
    std::string sha256;        ///< Pre-encryption checksum (hex)
    std::string compression;   ///< Upstream compression kind, e.g. "gzip"
};

/**
 * @brief A chunk after symmetric encryption, waiting in staging
 */
struct encrypted_chunk {
    chunk source;
    std::filesystem::path ciphertext_path;
    std::string algorithm;       ///< e.g. "gpg-aes256"
    uint64_t ciphertext_size = 0;
    std::string ciphertext_md5;  ///< Hex, compared against the store ETag
    std::string content_md5;     ///< Base64, sent as Content-MD5
};

/**
 * @brief An object as recorded by the store
 */
struct remote_object {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point uploaded_at{};
    std::string etag;
    std::map<std::string, std::string> metadata;  ///< x-amz-meta-* without prefix
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_CHUNK_TYPES_H
