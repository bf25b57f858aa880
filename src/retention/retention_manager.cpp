/**
 * @file retention_manager.cpp
 * @brief Retention implementation
 */

#include "kcenon/cloud_backup/retention/retention_manager.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <charconv>

namespace kcenon::cloud_backup {

auto retention_report::summary() const -> std::string {
    return std::to_string(objects_deleted) + " objects, " + std::to_string(bytes_freed) +
           " bytes freed";
}

retention_manager::retention_manager(std::shared_ptr<object_store> store)
    : store_(store), inventory_(std::move(store)) {}

auto retention_manager::parse_age_days(const std::string& text) -> result<std::chrono::hours> {
    uint32_t days = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), days);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return unexpected{error{error_code::invalid_argument,
                                "age must be a whole number of days: '" + text + "'"}};
    }
    if (days > 36500) {
        return unexpected{error{error_code::invalid_argument, "age is out of range: " + text}};
    }
    return std::chrono::hours(24 * static_cast<int64_t>(days));
}

auto retention_manager::apply(const retention_policy& policy) const -> result<retention_report> {
    inventory_query query;
    query.host = policy.host;
    query.order = inventory_order::oldest_first;
    query.load_totals = false;

    auto records = inventory_.list(query);
    if (!records) {
        return unexpected{records.error()};
    }

    const auto now = policy.now.value_or(std::chrono::system_clock::now());
    retention_report report;
    report.dry_run = policy.dry_run;

    for (const auto& backup : records.value()) {
        auto age = backup.age(now);
        if (age <= policy.max_age) {
            continue;
        }

        chunk_log_context ctx;
        ctx.host = backup.host;
        ctx.backup_number = backup.backup_number;
        ctx.bytes = backup.total_bytes;

        retention_report::removed_backup removed;
        removed.host = backup.host;
        removed.backup_number = backup.backup_number;
        removed.age = age;

        for (const auto& part : backup.parts) {
            if (!policy.dry_run) {
                auto deleted = store_->delete_object(part.object.key);
                if (!deleted) {
                    ctx.object_key = part.object.key;
                    ctx.error_message = deleted.error().message;
                    CB_LOG_ERROR_CTX(log_category::retention,
                                     "Delete failed after " + report.summary(), ctx);
                    return unexpected{deleted.error()};
                }
            }
            ++removed.objects;
            removed.bytes += part.object.size;
            ++report.objects_deleted;
            report.bytes_freed += part.object.size;
        }

        CB_LOG_INFO_CTX(log_category::retention,
                        std::string(policy.dry_run ? "Would delete" : "Deleted") +
                        " backup aged " +
                        std::to_string(std::chrono::duration_cast<std::chrono::hours>(age).count() / 24) +
                        " days",
                        ctx);
        ++report.backups_removed;
        report.removed.push_back(std::move(removed));
    }

    CB_LOG_INFO(log_category::retention,
                std::to_string(report.backups_removed) + " backups, " + report.summary());
    return report;
}

}  // namespace kcenon::cloud_backup
