/**
 * @file secret.h
 * @brief Scoped holder for the job passphrase
 */

#ifndef KCENON_CLOUD_BACKUP_CORE_SECRET_H
#define KCENON_CLOUD_BACKUP_CORE_SECRET_H

#include <kcenon/cloud_backup/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace kcenon::cloud_backup {

/**
 * @brief Securely zero memory
 */
void secure_zero_memory(void* ptr, std::size_t size);

/**
 * @brief Move-only owner of secret bytes
 *
 * The bytes are wiped when the holder is destroyed or reset. The secret has
 * no stream operator and no string conversion; callers read it only through
 * view() at the point of use.
 *
 * @code
 * auto secret = load_secret_file("/etc/backup/passphrase");
 * if (secret) {
 *     cipher.encrypt(input, output, secret.value(), abort_flag);
 * }  // wiped here
 * @endcode
 */
class scoped_secret {
public:
    scoped_secret() = default;
    explicit scoped_secret(std::string_view value);
    ~scoped_secret();

    scoped_secret(const scoped_secret&) = delete;
    auto operator=(const scoped_secret&) -> scoped_secret& = delete;
    scoped_secret(scoped_secret&& other) noexcept;
    auto operator=(scoped_secret&& other) noexcept -> scoped_secret&;

    [[nodiscard]] auto view() const noexcept -> std::string_view {
        return {bytes_.data(), bytes_.size()};
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return bytes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return bytes_.empty(); }

    /**
     * @brief Wipe and release the secret
     */
    auto reset() noexcept -> void;

private:
    std::vector<char> bytes_;
};

/**
 * @brief Load a secret from a file, trimming one trailing newline
 * @param path File holding the passphrase
 * @return Secret, or missing_passphrase / file_read_error
 */
[[nodiscard]] auto load_secret_file(const std::filesystem::path& path)
    -> result<scoped_secret>;

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CORE_SECRET_H
