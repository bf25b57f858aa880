/**
 * @file checksum.h
 * @brief Digest utilities for chunk and ciphertext integrity verification
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_CHECKSUM_H
#define KCENON_CLOUD_BACKUP_CORE_CHECKSUM_H

#include <kcenon/cloud_backup/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Digest of a file in the forms the object store protocol needs
 */
struct file_digest {
    std::string hex;                 ///< Lowercase hex (ETag form for MD5)
    std::string base64;              ///< Base64 of the raw digest (Content-MD5 form)
    uint64_t size = 0;               ///< Bytes hashed
};

/**
 * @brief Checksum utilities for SHA-256 and MD5 calculations
 *
 * Provides static methods for:
 * - SHA-256 of plaintext chunks (pre-encryption checksum)
 * - MD5 of ciphertext (compared with the store-reported ETag)
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 digest, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<file_digest>;

    /**
     * @brief Calculate MD5 digest of a file
     * @param path Path to the file
     * @return MD5 digest, or error
     */
    [[nodiscard]] static auto md5_file(const std::filesystem::path& path)
        -> result<file_digest>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate MD5 digest of data
     * @param data Input data span
     * @return MD5 digest as hex string
     */
    [[nodiscard]] static auto md5(std::span<const std::byte> data) -> std::string;

private:
    static constexpr std::size_t read_block_size = 64 * 1024;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_CHECKSUM_H
