/**
 * @file gpg_cipher.h
 * @brief Symmetric encryption through a gpg child process
 */

#ifndef KCENON_CLOUD_BACKUP_ENCRYPTION_GPG_CIPHER_H
#define KCENON_CLOUD_BACKUP_ENCRYPTION_GPG_CIPHER_H

#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/encryption/cipher_interface.h>

#include <chrono>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Runs `gpg --symmetric` with plaintext on stdin and ciphertext on stdout
 *
 * The passphrase travels over an inherited pipe named by --passphrase-fd,
 * never through the argument list or the environment.
 *
 * Exit status mapping:
 * - 127 (exec failed) -> cipher_unavailable
 * - any other nonzero -> cipher_failed
 * - killed by a signal -> cipher_terminated
 * - empty or implausibly short output -> cipher_output_truncated
 */
class gpg_cipher : public symmetric_cipher {
public:
    explicit gpg_cipher(cipher_options options = {});

    [[nodiscard]] auto algorithm() const -> std::string override;

    [[nodiscard]] auto encrypt(const std::filesystem::path& input,
                               const std::filesystem::path& output,
                               const scoped_secret& passphrase,
                               const std::atomic<bool>& abort_flag)
        -> result<uint64_t> override;

    /**
     * @brief Argument vector for a given passphrase descriptor
     */
    [[nodiscard]] auto build_arguments(int passphrase_fd) const -> std::vector<std::string>;

private:
    cipher_options options_;
    std::chrono::milliseconds poll_interval_{20};
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_ENCRYPTION_GPG_CIPHER_H
