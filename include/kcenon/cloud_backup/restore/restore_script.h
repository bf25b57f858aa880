/**
 * @file restore_script.h
 * @brief Self-contained restore scripts built on pre-signed URLs
 *
 * The script downloads every part of one backup through time-limited
 * URLs, asks for the passphrase at restore time, decrypts the data parts
 * in sequence order and unpacks the joined archive. Nothing secret is
 * embedded: once the URLs expire the script is useless.
 */

#ifndef KCENON_CLOUD_BACKUP_RESTORE_RESTORE_SCRIPT_H
#define KCENON_CLOUD_BACKUP_RESTORE_RESTORE_SCRIPT_H

#include <kcenon/cloud_backup/core/chunk_types.h>
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

/// Bumped whenever the fixed shell text of the template changes
inline constexpr int RESTORE_TEMPLATE_VERSION = 2;

inline constexpr std::chrono::seconds default_restore_expiry{86400};

/**
 * @brief One downloadable part as it appears in the script
 */
struct script_part {
    std::string file_name;   ///< Name inside the scratch directory
    std::string url;         ///< Pre-signed GET URL
    chunk_kind kind = chunk_kind::data;
    uint32_t sequence = 0;
};

/**
 * @brief Everything the template needs
 */
struct restore_script_context {
    std::string host;
    uint64_t backup_number = 0;
    std::string compression = "none";
    std::chrono::system_clock::time_point created{};
    std::chrono::system_clock::time_point expires{};
    std::vector<script_part> parts;  ///< Data by sequence, then parity
};

/**
 * @brief Fill the restore template
 */
[[nodiscard]] auto render_restore_script(const restore_script_context& context) -> std::string;

/**
 * @brief Single-quote @p value for POSIX sh
 */
[[nodiscard]] auto shell_quote(const std::string& value) -> std::string;

/**
 * @brief Selection and validity of a script
 */
struct restore_request {
    std::string host;
    std::optional<uint64_t> backup_number;  ///< Latest backup when unset
    std::chrono::seconds expire = default_restore_expiry;

    /// Generation time; the system clock when unset
    std::optional<std::chrono::system_clock::time_point> now;
};

/**
 * @brief A generated script and what it covers
 */
struct restore_script {
    std::string text;
    std::string host;
    uint64_t backup_number = 0;
    std::size_t part_count = 0;
    std::chrono::system_clock::time_point expires_at{};
};

/**
 * @brief Builds restore scripts for backups in an object store
 *
 * @code
 * restore_script_generator generator(store);
 * restore_request request;
 * request.host = "gandalf";
 * request.expire = std::chrono::seconds(600);
 * auto script = generator.generate(request);
 * @endcode
 */
class restore_script_generator {
public:
    explicit restore_script_generator(std::shared_ptr<object_store> store);

    /**
     * @brief Generate a script for the requested backup
     * @return backup_not_found for an unknown host or backup number,
     *         backup_incomplete when parts are missing
     */
    [[nodiscard]] auto generate(const restore_request& request) const
        -> result<restore_script>;

private:
    std::shared_ptr<object_store> store_;
    inventory_store inventory_;
};

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_RESTORE_RESTORE_SCRIPT_H
