/**
 * @file backup_cli.h
 * @brief Command line front end: list, delete, script and upload
 */

#ifndef KCENON_CLOUD_BACKUP_CLI_BACKUP_CLI_H
#define KCENON_CLOUD_BACKUP_CLI_BACKUP_CLI_H

#include <kcenon/cloud_backup/config/backup_config.h>
#include <kcenon/cloud_backup/core/chunk_source.h>
#include <kcenon/cloud_backup/core/types.h>
#include <kcenon/cloud_backup/encryption/cipher_interface.h>
#include <kcenon/cloud_backup/store/object_store.h>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::cloud_backup {

/// Process exit codes
inline constexpr int exit_success = 0;
inline constexpr int exit_failure = 1;
inline constexpr int exit_usage = 2;
inline constexpr int exit_not_found = 3;

enum class cli_command {
    list,
    delete_backups,
    script,
    upload,
    help
};

/**
 * @brief Parsed command line
 */
struct cli_options {
    cli_command command = cli_command::list;

    // Global
    std::optional<std::string> bucket;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;
    bool path_style = false;
    std::optional<std::string> log_level;
    bool log_json = false;

    // list
    std::optional<std::string> host;
    bool oldest_first = false;

    // delete
    std::optional<std::string> age_days;
    bool dry_run = false;

    // script
    std::optional<uint64_t> backup_number;
    std::optional<int64_t> expire_seconds;
    std::optional<std::string> output;

    // upload
    job_spec job;
    std::optional<std::size_t> encryption_workers;
    std::optional<std::size_t> upload_workers;
    std::optional<std::string> staging_directory;
    std::optional<std::string> passphrase_file;
    std::optional<std::string> rate_limit_file;
};

/**
 * @brief Parse argv (argv[0] is skipped)
 * @return Options, or invalid_argument for usage errors
 */
[[nodiscard]] auto parse_arguments(const std::vector<std::string>& args) -> result<cli_options>;

/**
 * @brief Usage text
 */
[[nodiscard]] auto usage_text(const std::string& program) -> std::string;

/**
 * @brief Exit code for a failed command
 */
[[nodiscard]] auto exit_code_for(error_code code) -> int;

/**
 * @brief Apply command line overrides on top of an environment configuration
 */
auto apply_overrides(backup_config& config, const cli_options& options) -> void;

using store_factory =
    std::function<result<std::shared_ptr<object_store>>(const backup_config&)>;
using cipher_factory =
    std::function<std::shared_ptr<symmetric_cipher>(const cipher_options&)>;

/**
 * @brief Runs one parsed command against a configured store
 */
class backup_cli {
public:
    backup_cli(backup_config config, std::ostream& out, std::ostream& err);

    /**
     * @brief Replace the S3 store (tests use an in-memory store)
     */
    auto set_store_factory(store_factory factory) -> void;

    /**
     * @brief Replace the gpg cipher
     */
    auto set_cipher_factory(cipher_factory factory) -> void;

    /**
     * @brief Execute @p options and return the process exit code
     */
    [[nodiscard]] auto run(const cli_options& options) -> int;

private:
    auto run_list(const cli_options& options) -> int;
    auto run_delete(const cli_options& options) -> int;
    auto run_script(const cli_options& options) -> int;
    auto run_upload(const cli_options& options) -> int;

    auto open_store() -> result<std::shared_ptr<object_store>>;
    auto report(const error& err) -> int;

    backup_config config_;
    std::ostream& out_;
    std::ostream& err_;
    store_factory store_factory_;
    cipher_factory cipher_factory_;
};

/**
 * @brief Full entry point: parse, load configuration, run
 */
[[nodiscard]] auto run_cli(const std::vector<std::string>& args,
                           const env_lookup& env,
                           std::ostream& out,
                           std::ostream& err) -> int;

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_CLI_BACKUP_CLI_H
