/**
 * @file chunk_source.cpp
 * @brief Chunk enumeration for archive jobs
 */

#include "kcenon/cloud_backup/core/chunk_source.h"
#include "kcenon/cloud_backup/core/logging.h"

#include <algorithm>
#include <system_error>

namespace kcenon::cloud_backup {

auto job_spec::archive_base_name() const -> std::string {
    std::string ext = compression_extension;
    if (!ext.empty() && ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return host + "." + std::to_string(backup_number) + ".tar" + ext;
}

auto job_spec::validate() const -> result<void> {
    if (host.empty()) {
        return unexpected(error{error_code::invalid_argument, "host is required"});
    }
    if (host.find('/') != std::string::npos) {
        return unexpected(error{error_code::invalid_argument,
                                "host must not contain '/': " + host});
    }
    if (chunk_paths.empty() && archive_destination.empty()) {
        return unexpected(error{error_code::invalid_argument,
                                "archive destination or explicit chunk paths required"});
    }
    return {};
}

auto split_suffix_sequence(std::string_view suffix) -> std::optional<uint32_t> {
    if (suffix.size() != 2) {
        return std::nullopt;
    }
    for (char c : suffix) {
        if (c < 'a' || c > 'z') {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>((suffix[0] - 'a') * 26 + (suffix[1] - 'a') + 1);
}

chunk_source::chunk_source(job_spec spec) : spec_(std::move(spec)) {}

auto chunk_source::find_data_files() const
    -> result<std::vector<std::filesystem::path>> {
    if (!spec_.chunk_paths.empty()) {
        for (const auto& path : spec_.chunk_paths) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                return unexpected(error{error_code::file_not_found,
                                        "chunk not found: " + path.string()});
            }
        }
        return spec_.chunk_paths;
    }

    const auto base = spec_.archive_base_name();
    const auto& dest = spec_.archive_destination;

    std::error_code ec;
    auto unsplit = dest / base;
    if (std::filesystem::is_regular_file(unsplit, ec)) {
        return std::vector<std::filesystem::path>{unsplit};
    }

    std::vector<std::pair<uint32_t, std::filesystem::path>> pieces;
    std::filesystem::directory_iterator it(dest, ec);
    if (ec) {
        return unexpected(error{error_code::file_not_found,
                                "cannot read archive destination: " + dest.string()});
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (name.size() != base.size() + 3 || !name.starts_with(base + ".")) {
            continue;
        }
        auto seq = split_suffix_sequence(std::string_view(name).substr(base.size() + 1));
        if (seq) {
            pieces.emplace_back(*seq, entry.path());
        }
    }

    if (pieces.empty()) {
        return unexpected(error{error_code::file_not_found,
                                "no archive chunks for " + base + " in " + dest.string()});
    }

    std::sort(pieces.begin(), pieces.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    // Split suffixes must be gap-free, otherwise a piece went missing upstream
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        if (pieces[i].first != i + 1) {
            return unexpected(error{error_code::chunk_sequence_error,
                                    "gap in split archive " + base + " before " +
                                    pieces[i].second.filename().string()});
        }
    }

    std::vector<std::filesystem::path> paths;
    paths.reserve(pieces.size());
    for (auto& [seq, path] : pieces) {
        paths.push_back(std::move(path));
    }
    return paths;
}

auto chunk_source::find_parity_files() const
    -> result<std::vector<std::filesystem::path>> {
    if (!spec_.parity_paths.empty()) {
        for (const auto& path : spec_.parity_paths) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                return unexpected(error{error_code::file_not_found,
                                        "parity file not found: " + path.string()});
            }
        }
        return spec_.parity_paths;
    }

    std::vector<std::filesystem::path> paths;
    if (spec_.archive_destination.empty()) {
        return paths;
    }

    const std::string prefix = spec_.parity_filename.empty()
        ? spec_.host + "." + std::to_string(spec_.backup_number) + "."
        : spec_.parity_filename;

    std::error_code ec;
    std::filesystem::directory_iterator it(spec_.archive_destination, ec);
    if (ec) {
        return paths;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (name.starts_with(prefix) && name.ends_with(".par2")) {
            paths.push_back(entry.path());
        }
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

auto chunk_source::enumerate() const -> result<std::vector<chunk>> {
    auto valid = spec_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    auto data_files = find_data_files();
    if (!data_files) {
        return unexpected(data_files.error());
    }
    auto parity_files = find_parity_files();
    if (!parity_files) {
        return unexpected(parity_files.error());
    }

    const auto total = static_cast<uint32_t>(data_files.value().size());
    const auto parity = static_cast<uint32_t>(parity_files.value().size());

    std::vector<chunk> chunks;
    chunks.reserve(total + parity);

    auto make_chunk = [&](const std::filesystem::path& path, uint32_t sequence,
                          chunk_kind kind) -> result<chunk> {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error{error_code::file_read_error,
                                    "cannot stat " + path.string() + ": " + ec.message()});
        }
        chunk c;
        c.host = spec_.host;
        c.backup_number = spec_.backup_number;
        c.sequence = sequence;
        c.total_count = total;
        c.parity_count = parity;
        c.kind = kind;
        c.path = path;
        c.size = size;
        c.compression = spec_.compression;
        return c;
    };

    uint32_t sequence = 1;
    for (const auto& path : data_files.value()) {
        auto c = make_chunk(path, sequence++, chunk_kind::data);
        if (!c) {
            return unexpected(c.error());
        }
        chunks.push_back(std::move(c.value()));
    }
    for (const auto& path : parity_files.value()) {
        auto c = make_chunk(path, sequence++, chunk_kind::parity);
        if (!c) {
            return unexpected(c.error());
        }
        chunks.push_back(std::move(c.value()));
    }

    CB_LOG_DEBUG(log_category::source,
                 "Archiver tar=" + spec_.tar_path.string() + " split=" +
                 spec_.split_path.string() + " par=" + spec_.parity_path.string() +
                 " split_size=" + std::to_string(spec_.split_size) + " files=" +
                 std::to_string(spec_.file_list.size()));
    CB_LOG_INFO(log_category::source,
                "Enumerated " + std::to_string(total) + " chunks and " +
                std::to_string(parity) + " parity files for " + spec_.archive_base_name());
    return chunks;
}

}  // namespace kcenon::cloud_backup
