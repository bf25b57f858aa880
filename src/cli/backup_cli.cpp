/**
 * @file backup_cli.cpp
 * @brief Command line front end
 */

#include "kcenon/cloud_backup/cli/backup_cli.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/core/rate_limiter.h"
#include "kcenon/cloud_backup/core/secret.h"
#include "kcenon/cloud_backup/encryption/gpg_cipher.h"
#include "kcenon/cloud_backup/inventory/inventory_store.h"
#include "kcenon/cloud_backup/pipeline/pipeline_coordinator.h"
#include "kcenon/cloud_backup/restore/restore_script.h"
#include "kcenon/cloud_backup/retention/retention_manager.h"
#include "kcenon/cloud_backup/store/s3_object_store.h"
#include "kcenon/cloud_backup/store/store_utils.h"

#include <charconv>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

#include <sys/stat.h>

namespace kcenon::cloud_backup {

namespace {

template <typename T>
auto parse_number(const std::string& flag, const std::string& text) -> result<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return unexpected{error{error_code::invalid_argument,
                                "--" + flag + " expects a number, got '" + text + "'"}};
    }
    return value;
}

auto usage_error(const std::string& message) -> unexpected {
    return unexpected{error{error_code::invalid_argument, message}};
}

auto format_age(std::chrono::seconds age) -> std::string {
    auto secs = age.count();
    if (secs < 0) {
        secs = 0;
    }
    auto days = secs / 86400;
    if (days > 0) {
        return std::to_string(days) + "d";
    }
    auto hours = secs / 3600;
    if (hours > 0) {
        return std::to_string(hours) + "h";
    }
    return std::to_string(secs / 60) + "m";
}

auto default_store_factory(const backup_config& config)
    -> result<std::shared_ptr<object_store>> {
    auto store = s3_object_store::create(config.store, config.credentials);
    if (!store) {
        return unexpected{store.error()};
    }
    return std::shared_ptr<object_store>(std::move(store.value()));
}

auto default_cipher_factory(const cipher_options& options) -> std::shared_ptr<symmetric_cipher> {
    return std::make_shared<gpg_cipher>(options);
}

}  // namespace

auto usage_text(const std::string& program) -> std::string {
    std::ostringstream oss;
    oss << "Usage: " << program << " [command] [options]\n"
        << "\n"
        << "Commands:\n"
        << "  list                         List stored backups (default)\n"
        << "      --host=<name>            Only backups of this host\n"
        << "      --oldest-first           Oldest backups first\n"
        << "  delete --age=<days>          Delete backups older than <days>\n"
        << "      --host=<name>            Only backups of this host\n"
        << "      --dry-run                Report without deleting\n"
        << "  script --host=<name>         Write a restore script for the latest backup\n"
        << "      --backup=<n>             Use backup <n> instead of the latest\n"
        << "      --expire=<seconds>       URL validity (default 86400, max 604800)\n"
        << "      --output=<file>          Write to <file> instead of stdout\n"
        << "  upload --host=<h> --backup=<n> --dest=<dir>\n"
        << "                               Encrypt and upload one archive job\n"
        << "      --compression=<kind>     Compression kind recorded with the objects\n"
        << "      --ext=<.gz>              Archive file extension\n"
        << "      --split-size=<bytes>     Split size used by the archiver\n"
        << "      --par-file=<name>        Parity file name filter\n"
        << "      --chunk=<path>           Explicit data chunk (repeatable)\n"
        << "      --parity=<path>          Explicit parity file (repeatable)\n"
        << "      --tar=<path> --split=<path> --par=<path> --file=<path>\n"
        << "                               Archiver details recorded in the log\n"
        << "      --encryption-workers=<n> --upload-workers=<n>\n"
        << "      --staging=<dir> --passphrase-file=<file> --rate-limit-file=<file>\n"
        << "\n"
        << "Global options:\n"
        << "  --bucket=<name> --region=<region> --endpoint=<url> --path-style\n"
        << "  --log-level=<trace|debug|info|warn|error|fatal> --log-json\n"
        << "  -h, --help\n"
        << "\n"
        << "Credentials come from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY.\n"
        << "Exit codes: 0 success, 1 failure, 2 usage error, 3 not found.\n";
    return oss.str();
}

auto parse_arguments(const std::vector<std::string>& args) -> result<cli_options> {
    cli_options options;
    bool command_seen = false;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.command = cli_command::help;
            return options;
        }

        if (arg.rfind("--", 0) != 0) {
            if (command_seen) {
                return usage_error("unexpected argument: " + arg);
            }
            command_seen = true;
            if (arg == "list") {
                options.command = cli_command::list;
            } else if (arg == "delete") {
                options.command = cli_command::delete_backups;
            } else if (arg == "script") {
                options.command = cli_command::script;
            } else if (arg == "upload") {
                options.command = cli_command::upload;
            } else if (arg == "help") {
                options.command = cli_command::help;
                return options;
            } else {
                return usage_error("unknown command: " + arg);
            }
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> inline_value;
        if (auto eq = name.find('='); eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        // Boolean switches
        if (name == "path-style" || name == "log-json" || name == "oldest-first" ||
            name == "dry-run") {
            if (inline_value) {
                return usage_error("--" + name + " takes no value");
            }
            if (name == "path-style") options.path_style = true;
            if (name == "log-json") options.log_json = true;
            if (name == "oldest-first") options.oldest_first = true;
            if (name == "dry-run") options.dry_run = true;
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return usage_error("--" + name + " requires a value");
        }

        if (name == "bucket") {
            options.bucket = value;
        } else if (name == "region") {
            options.region = value;
        } else if (name == "endpoint") {
            options.endpoint = value;
        } else if (name == "log-level") {
            options.log_level = value;
        } else if (name == "host") {
            options.host = value;
            options.job.host = value;
        } else if (name == "age") {
            options.age_days = value;
        } else if (name == "backup") {
            auto n = parse_number<uint64_t>(name, value);
            if (!n) {
                return unexpected{n.error()};
            }
            options.backup_number = n.value();
            options.job.backup_number = n.value();
        } else if (name == "expire") {
            auto n = parse_number<int64_t>(name, value);
            if (!n) {
                return unexpected{n.error()};
            }
            options.expire_seconds = n.value();
        } else if (name == "output") {
            options.output = value;
        } else if (name == "dest") {
            options.job.archive_destination = value;
        } else if (name == "compression") {
            options.job.compression = value;
        } else if (name == "ext") {
            options.job.compression_extension = value;
        } else if (name == "split-size") {
            auto n = parse_number<uint64_t>(name, value);
            if (!n) {
                return unexpected{n.error()};
            }
            options.job.split_size = n.value();
        } else if (name == "par-file") {
            options.job.parity_filename = value;
        } else if (name == "chunk") {
            options.job.chunk_paths.emplace_back(value);
        } else if (name == "parity") {
            options.job.parity_paths.emplace_back(value);
        } else if (name == "tar") {
            options.job.tar_path = value;
        } else if (name == "split") {
            options.job.split_path = value;
        } else if (name == "par") {
            options.job.parity_path = value;
        } else if (name == "file") {
            options.job.file_list.push_back(value);
        } else if (name == "encryption-workers") {
            auto n = parse_number<std::size_t>(name, value);
            if (!n) {
                return unexpected{n.error()};
            }
            options.encryption_workers = n.value();
        } else if (name == "upload-workers") {
            auto n = parse_number<std::size_t>(name, value);
            if (!n) {
                return unexpected{n.error()};
            }
            options.upload_workers = n.value();
        } else if (name == "staging") {
            options.staging_directory = value;
        } else if (name == "passphrase-file") {
            options.passphrase_file = value;
        } else if (name == "rate-limit-file") {
            options.rate_limit_file = value;
        } else {
            return usage_error("unknown option: --" + name);
        }
    }

    switch (options.command) {
        case cli_command::delete_backups:
            if (!options.age_days) {
                return usage_error("delete requires --age=<days>");
            }
            break;
        case cli_command::script:
            if (!options.host) {
                return usage_error("script requires --host=<name>");
            }
            break;
        case cli_command::upload:
            if (!options.host || !options.backup_number) {
                return usage_error("upload requires --host and --backup");
            }
            if (options.job.archive_destination.empty() && options.job.chunk_paths.empty()) {
                return usage_error("upload requires --dest or --chunk");
            }
            break;
        default:
            break;
    }

    if (options.log_level && !log_level_from_string(*options.log_level)) {
        return usage_error("unknown log level: " + *options.log_level);
    }
    return options;
}

auto exit_code_for(error_code code) -> int {
    switch (code) {
        case error_code::success:
            return exit_success;
        case error_code::invalid_argument:
            return exit_usage;
        case error_code::backup_not_found:
        case error_code::object_not_found:
        case error_code::file_not_found:
        case error_code::bucket_not_found:
            return exit_not_found;
        default:
            return exit_failure;
    }
}

auto apply_overrides(backup_config& config, const cli_options& options) -> void {
    if (options.bucket) config.store.bucket = *options.bucket;
    if (options.region) config.store.region = *options.region;
    if (options.endpoint) config.store.endpoint = *options.endpoint;
    if (options.path_style) config.store.use_path_style = true;
    if (options.encryption_workers) {
        config.pipeline.max_encryption_workers = *options.encryption_workers;
    }
    if (options.upload_workers) config.pipeline.upload_workers = *options.upload_workers;
    if (options.staging_directory) config.pipeline.staging_directory = *options.staging_directory;
    if (options.passphrase_file) config.passphrase_file = *options.passphrase_file;
    if (options.rate_limit_file) config.rate_limit_file = *options.rate_limit_file;
}

backup_cli::backup_cli(backup_config config, std::ostream& out, std::ostream& err)
    : config_(std::move(config))
    , out_(out)
    , err_(err)
    , store_factory_(default_store_factory)
    , cipher_factory_(default_cipher_factory) {}

auto backup_cli::set_store_factory(store_factory factory) -> void {
    store_factory_ = std::move(factory);
}

auto backup_cli::set_cipher_factory(cipher_factory factory) -> void {
    cipher_factory_ = std::move(factory);
}

auto backup_cli::report(const error& err) -> int {
    err_ << "error: " << err.message << " (" << to_string(err.code) << ")\n";
    CB_LOG_ERROR(log_category::cli, err.message);
    return exit_code_for(err.code);
}

auto backup_cli::open_store() -> result<std::shared_ptr<object_store>> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return store_factory_(config_);
}

auto backup_cli::run(const cli_options& options) -> int {
    switch (options.command) {
        case cli_command::help:
            out_ << usage_text("cloud_backup_cli");
            return exit_success;
        case cli_command::list:
            return run_list(options);
        case cli_command::delete_backups:
            return run_delete(options);
        case cli_command::script:
            return run_script(options);
        case cli_command::upload:
            return run_upload(options);
    }
    return exit_usage;
}

auto backup_cli::run_list(const cli_options& options) -> int {
    auto store = open_store();
    if (!store) {
        return report(store.error());
    }

    inventory_store inventory(store.value());
    inventory_query query;
    query.host = options.host;
    query.order = options.oldest_first ? inventory_order::oldest_first
                                       : inventory_order::newest_first;
    auto records = inventory.list(query);
    if (!records) {
        return report(records.error());
    }

    if (records.value().empty()) {
        out_ << "No backups found" << (options.host ? " for host " + *options.host : "")
             << ".\n";
        return exit_success;
    }

    const auto now = std::chrono::system_clock::now();
    out_ << std::left << std::setw(20) << "HOST" << std::setw(10) << "BACKUP"
         << std::setw(7) << "PARTS" << std::setw(16) << "BYTES" << std::setw(7) << "AGE"
         << std::setw(25) << "LAST UPLOAD" << "STATUS\n";
    for (const auto& backup : records.value()) {
        out_ << std::left << std::setw(20) << backup.host << std::setw(10)
             << backup.backup_number << std::setw(7) << backup.parts.size() << std::setw(16)
             << backup.total_bytes << std::setw(7) << format_age(backup.age(now))
             << std::setw(25) << store_utils::format_display_time(backup.newest_upload)
             << (backup.is_complete() ? "complete" : "INCOMPLETE")
             << (backup.legacy ? " (legacy)" : "") << "\n";
    }
    return exit_success;
}

auto backup_cli::run_delete(const cli_options& options) -> int {
    auto age = retention_manager::parse_age_days(*options.age_days);
    if (!age) {
        return report(age.error());
    }

    auto store = open_store();
    if (!store) {
        return report(store.error());
    }

    retention_policy policy;
    policy.max_age = age.value();
    policy.host = options.host;
    policy.dry_run = options.dry_run;

    retention_manager manager(store.value());
    auto result = manager.apply(policy);
    if (!result) {
        return report(result.error());
    }

    const auto& summary = result.value();
    for (const auto& removed : summary.removed) {
        out_ << (summary.dry_run ? "would delete " : "deleted ") << removed.host << " backup "
             << removed.backup_number << " (" << removed.objects << " objects, "
             << format_age(removed.age) << " old)\n";
    }
    out_ << summary.backups_removed << " backups, " << summary.summary()
         << (summary.dry_run ? " (dry run)" : "") << "\n";
    return exit_success;
}

auto backup_cli::run_script(const cli_options& options) -> int {
    auto store = open_store();
    if (!store) {
        return report(store.error());
    }

    restore_request request;
    request.host = *options.host;
    request.backup_number = options.backup_number;
    if (options.expire_seconds) {
        request.expire = std::chrono::seconds(*options.expire_seconds);
    }

    restore_script_generator generator(store.value());
    auto script = generator.generate(request);
    if (!script) {
        return report(script.error());
    }

    if (!options.output) {
        out_ << script.value().text;
        return exit_success;
    }

    std::ofstream file(*options.output, std::ios::binary | std::ios::trunc);
    if (!file) {
        return report(error{error_code::file_write_error, "cannot open " + *options.output});
    }
    file << script.value().text;
    file.close();
    if (!file) {
        return report(error{error_code::file_write_error, "cannot write " + *options.output});
    }
    if (::chmod(options.output->c_str(), 0700) != 0) {
        CB_LOG_WARN(log_category::cli, "cannot make " + *options.output + " executable");
    }

    out_ << "Wrote restore script for " << script.value().host << " backup "
         << script.value().backup_number << " (" << script.value().part_count
         << " parts) to " << *options.output << ", valid until "
         << store_utils::format_display_time(script.value().expires_at) << "\n";
    return exit_success;
}

auto backup_cli::run_upload(const cli_options& options) -> int {
    auto valid = config_.validate_for_upload();
    if (!valid) {
        return report(valid.error());
    }

    auto spec_valid = options.job.validate();
    if (!spec_valid) {
        return report(spec_valid.error());
    }

    chunk_source source(options.job);
    auto chunks = source.enumerate();
    if (!chunks) {
        return report(chunks.error());
    }

    auto passphrase = load_secret_file(*config_.passphrase_file);
    if (!passphrase) {
        return report(passphrase.error());
    }

    auto store = store_factory_(config_);
    if (!store) {
        return report(store.error());
    }

    std::shared_ptr<rate_limit_source> rate_source;
    if (config_.rate_limit_file) {
        rate_source = std::make_shared<file_rate_limit_source>(*config_.rate_limit_file);
    } else {
        rate_source = std::make_shared<static_rate_limit_source>(0);
    }

    coordinator_options coordinator_opts;
    coordinator_opts.pipeline = config_.pipeline;
    coordinator_opts.retry = config_.store.retry;

    auto coordinator = pipeline_coordinator::create(
        cipher_factory_(config_.cipher), store.value(), std::move(rate_source),
        std::move(passphrase.value()), coordinator_opts);
    if (!coordinator) {
        return report(coordinator.error());
    }

    auto job = coordinator.value()->run(std::move(chunks.value()));
    if (!job) {
        return report(job.error());
    }

    const auto& summary = job.value();
    out_ << "Uploaded " << summary.chunks_uploaded << " objects, " << summary.bytes_uploaded
         << " bytes in " << std::fixed << std::setprecision(1)
         << static_cast<double>(summary.elapsed.count()) / 1000.0 << "s ("
         << summary.retries << " retries, " << summary.checksum_reuploads
         << " checksum re-uploads)\n";
    return exit_success;
}

auto run_cli(const std::vector<std::string>& args,
             const env_lookup& env,
             std::ostream& out,
             std::ostream& err) -> int {
    auto parsed = parse_arguments(args);
    if (!parsed) {
        err << "error: " << parsed.error().message << "\n\n"
            << usage_text(args.empty() ? "cloud_backup_cli" : args.front());
        return exit_usage;
    }
    const auto& options = parsed.value();

    if (options.command == cli_command::help) {
        out << usage_text(args.empty() ? "cloud_backup_cli" : args.front());
        return exit_success;
    }

    auto& logger = get_logger();
    if (options.log_level) {
        logger.set_level(*log_level_from_string(*options.log_level));
    }
    if (options.log_json) {
        logger.set_output_format(log_output_format::json);
    }
    logger.initialize();

    auto config = load_from_environment(env);
    apply_overrides(config, options);

    backup_cli cli(std::move(config), out, err);
    auto code = cli.run(options);
    logger.flush();
    return code;
}

}  // namespace kcenon::cloud_backup
