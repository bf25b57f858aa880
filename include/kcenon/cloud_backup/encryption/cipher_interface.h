/**
 * @file cipher_interface.h
 * @brief Seam for the external symmetric cipher
 */

#ifndef KCENON_CLOUD_BACKUP_ENCRYPTION_CIPHER_INTERFACE_H
#define KCENON_CLOUD_BACKUP_ENCRYPTION_CIPHER_INTERFACE_H

#include <kcenon/cloud_backup/core/secret.h>
#include <kcenon/cloud_backup/core/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::cloud_backup {

/**
 * @brief File-to-file symmetric encryption
 *
 * Implementations read plaintext from @p input and write ciphertext to
 * @p output. They must return promptly with job_aborted once
 * @p abort_flag is set, terminating any child process they started.
 */
class symmetric_cipher {
public:
    virtual ~symmetric_cipher() = default;

    /**
     * @brief Identifier stored with each object, e.g. "gpg-aes256"
     */
    [[nodiscard]] virtual auto algorithm() const -> std::string = 0;

    /**
     * @brief Encrypt one file
     * @return Ciphertext size in bytes
     */
    [[nodiscard]] virtual auto encrypt(const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       const scoped_secret& passphrase,
                                       const std::atomic<bool>& abort_flag)
        -> result<uint64_t> = 0;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_ENCRYPTION_CIPHER_INTERFACE_H
