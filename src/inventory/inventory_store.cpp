/**
 * @file inventory_store.cpp
 * @brief Backup grouping and listing
 */

#include "kcenon/cloud_backup/inventory/inventory_store.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <algorithm>
#include <charconv>
#include <map>
#include <set>
#include <utility>

namespace kcenon::cloud_backup {

namespace {

auto parse_count(const std::map<std::string, std::string>& metadata, const char* name)
    -> std::optional<uint32_t> {
    auto it = metadata.find(name);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    const auto& text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto part_less(const backup_part& a, const backup_part& b) -> bool {
    if (a.key.kind != b.key.kind) {
        return a.key.kind == chunk_kind::data;
    }
    if (a.key.sequence != b.key.sequence) {
        return a.key.sequence < b.key.sequence;
    }
    return a.object.key < b.object.key;
}

}  // namespace

auto backup_record::age(std::chrono::system_clock::time_point now) const
    -> std::chrono::seconds {
    return std::chrono::duration_cast<std::chrono::seconds>(now - newest_upload);
}

auto backup_record::data_count() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(
        parts.begin(), parts.end(),
        [](const backup_part& p) { return p.key.kind == chunk_kind::data; }));
}

auto backup_record::parity_count() const -> std::size_t {
    return parts.size() - data_count();
}

auto backup_record::missing_sequences() const -> std::vector<uint32_t> {
    std::set<uint32_t> present;
    for (const auto& p : parts) {
        if (p.key.kind == chunk_kind::data) {
            present.insert(p.key.sequence);
        }
    }
    uint32_t last = expected_chunks.value_or(present.empty() ? 0 : *present.rbegin());
    std::vector<uint32_t> missing;
    for (uint32_t seq = 1; seq <= last; ++seq) {
        if (present.count(seq) == 0) {
            missing.push_back(seq);
        }
    }
    return missing;
}

auto backup_record::is_complete() const -> bool {
    auto data = data_count();
    if (data == 0) {
        return false;
    }
    if (!missing_sequences().empty()) {
        return false;
    }
    // Duplicate sequences (both layouts present) do not count as complete
    if (expected_chunks && data != *expected_chunks) {
        return false;
    }
    if (expected_parity && parity_count() < *expected_parity) {
        return false;
    }
    return true;
}

auto group_backups(const std::vector<remote_object>& objects) -> std::vector<backup_record> {
    std::map<std::pair<std::string, uint64_t>, backup_record> grouped;

    for (const auto& object : objects) {
        auto parsed = parse_object_key(object.key);
        if (!parsed) {
            CB_LOG_DEBUG(log_category::inventory, "Skipping " + parsed.error().message);
            continue;
        }
        auto& key = parsed.value();
        auto& record = grouped[{key.host, key.backup_number}];
        record.host = key.host;
        record.backup_number = key.backup_number;
        record.legacy = record.legacy || key.legacy;
        record.total_bytes += object.size;
        record.newest_upload = std::max(record.newest_upload, object.uploaded_at);
        record.parts.push_back(backup_part{std::move(key), object});
    }

    std::vector<backup_record> records;
    records.reserve(grouped.size());
    for (auto& [id, record] : grouped) {
        std::sort(record.parts.begin(), record.parts.end(), part_less);
        records.push_back(std::move(record));
    }
    return records;
}

inventory_store::inventory_store(std::shared_ptr<object_store> store)
    : store_(std::move(store)) {}

auto inventory_store::load_totals(backup_record& record) const -> result<void> {
    auto first = std::find_if(record.parts.begin(), record.parts.end(),
                              [](const backup_part& p) {
                                  return p.key.kind == chunk_kind::data && !p.key.legacy;
                              });
    if (first == record.parts.end()) {
        return {};
    }

    auto head = store_->head_object(first->object.key);
    if (!head) {
        if (head.error().code == error_code::object_not_found) {
            return {};
        }
        return unexpected{head.error()};
    }

    const auto& metadata = head.value().metadata;
    record.expected_chunks = parse_count(metadata, meta::chunk_total);
    record.expected_parity = parse_count(metadata, meta::parity_total);
    first->object.metadata = metadata;
    return {};
}

auto inventory_store::collect(const std::vector<std::string>& prefixes,
                              const std::optional<std::string>& host) const
    -> result<std::vector<backup_record>> {
    std::vector<remote_object> objects;
    std::set<std::string> seen;
    for (const auto& prefix : prefixes) {
        auto listed = store_->list_objects(prefix);
        if (!listed) {
            return unexpected{listed.error()};
        }
        for (auto& object : listed.value()) {
            if (seen.insert(object.key).second) {
                objects.push_back(std::move(object));
            }
        }
    }

    auto records = group_backups(objects);
    if (host) {
        records.erase(std::remove_if(records.begin(), records.end(),
                                     [&](const backup_record& r) { return r.host != *host; }),
                      records.end());
    }
    return records;
}

auto inventory_store::list(const inventory_query& query) const
    -> result<std::vector<backup_record>> {
    std::vector<std::string> prefixes;
    if (query.host) {
        // Legacy flat keys share no "/" prefix with the current layout
        prefixes = {host_prefix(*query.host), *query.host + "."};
    } else {
        prefixes = {""};
    }

    auto records = collect(prefixes, query.host);
    if (!records) {
        return records;
    }

    if (query.load_totals) {
        for (auto& record : records.value()) {
            auto loaded = load_totals(record);
            if (!loaded) {
                return unexpected{loaded.error()};
            }
        }
    }

    auto& list = records.value();
    std::sort(list.begin(), list.end(), [&](const backup_record& a, const backup_record& b) {
        if (a.newest_upload != b.newest_upload) {
            return query.order == inventory_order::newest_first
                       ? a.newest_upload > b.newest_upload
                       : a.newest_upload < b.newest_upload;
        }
        if (a.host != b.host) {
            return a.host < b.host;
        }
        return query.order == inventory_order::newest_first
                   ? a.backup_number > b.backup_number
                   : a.backup_number < b.backup_number;
    });

    CB_LOG_DEBUG(log_category::inventory,
                 "Listed " + std::to_string(list.size()) + " backups");
    return records;
}

auto inventory_store::find(const std::string& host, uint64_t backup_number) const
    -> result<backup_record> {
    auto prefix = host + "." + std::to_string(backup_number) + ".";
    auto records = collect({backup_prefix(host, backup_number), prefix}, host);
    if (!records) {
        return unexpected{records.error()};
    }
    for (auto& record : records.value()) {
        if (record.backup_number == backup_number) {
            auto loaded = load_totals(record);
            if (!loaded) {
                return unexpected{loaded.error()};
            }
            return std::move(record);
        }
    }
    return unexpected{error{error_code::backup_not_found,
        "no backup " + std::to_string(backup_number) + " for host " + host}};
}

auto inventory_store::latest(const std::string& host) const -> result<backup_record> {
    inventory_query query;
    query.host = host;
    query.load_totals = false;
    auto records = list(query);
    if (!records) {
        return unexpected{records.error()};
    }
    if (records.value().empty()) {
        return unexpected{error{error_code::backup_not_found, "no backups for host " + host}};
    }
    auto newest = std::max_element(
        records.value().begin(), records.value().end(),
        [](const backup_record& a, const backup_record& b) {
            return a.backup_number < b.backup_number;
        });
    auto record = std::move(*newest);
    auto loaded = load_totals(record);
    if (!loaded) {
        return unexpected{loaded.error()};
    }
    return record;
}

}  // namespace kcenon::cloud_backup
