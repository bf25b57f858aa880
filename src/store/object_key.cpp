/**
 * @file object_key.cpp
 * @brief Object key formatting and parsing
 */

#include "kcenon/cloud_backup/store/object_key.h"
#include "kcenon/cloud_backup/core/chunk_source.h"

#include <iomanip>
#include <regex>
#include <sstream>

namespace kcenon::cloud_backup {

namespace {

const std::regex& current_layout() {
    static const std::regex pattern(R"(^([^/]+)/([0-9]{1,18})/([0-9]{1,9})(\.par2)?$)");
    return pattern;
}

const std::regex& legacy_data_layout() {
    static const std::regex pattern(
        R"(^(.+)\.([0-9]{1,18})\.tar(\.(gz|bz2|xz|zst|lz4|lzo|Z))?(\.([a-z]{2}))?(\.gpg)?$)");
    return pattern;
}

const std::regex& legacy_parity_layout() {
    static const std::regex pattern(R"(^(.+?)\.([0-9]{1,18})\..*par2(\.gpg)?$)");
    return pattern;
}

auto parse_number(const std::string& text) -> uint64_t {
    return std::stoull(text);
}

}  // namespace

auto make_object_key(const std::string& host, uint64_t backup_number,
                     uint32_t sequence, chunk_kind kind) -> std::string {
    std::ostringstream oss;
    oss << host << "/" << backup_number << "/"
        << std::setw(6) << std::setfill('0') << sequence;
    if (kind == chunk_kind::parity) {
        oss << ".par2";
    }
    return oss.str();
}

auto make_object_key(const chunk& c) -> std::string {
    return make_object_key(c.host, c.backup_number, c.sequence, c.kind);
}

auto host_prefix(const std::string& host) -> std::string {
    return host + "/";
}

auto backup_prefix(const std::string& host, uint64_t backup_number) -> std::string {
    return host + "/" + std::to_string(backup_number) + "/";
}

auto parse_object_key(const std::string& key) -> result<object_key> {
    std::smatch m;

    if (std::regex_match(key, m, current_layout())) {
        object_key parsed;
        parsed.host = m[1].str();
        parsed.backup_number = parse_number(m[2].str());
        parsed.sequence = static_cast<uint32_t>(parse_number(m[3].str()));
        parsed.kind = m[4].matched ? chunk_kind::parity : chunk_kind::data;
        if (parsed.sequence == 0) {
            return unexpected{error{error_code::invalid_object_key,
                                    "sequence 0 in object key: " + key}};
        }
        return parsed;
    }

    if (key.find('/') == std::string::npos) {
        if (std::regex_match(key, m, legacy_data_layout())) {
            object_key parsed;
            parsed.host = m[1].str();
            parsed.backup_number = parse_number(m[2].str());
            parsed.sequence = 1;
            if (m[6].matched) {
                auto seq = split_suffix_sequence(m[6].str());
                parsed.sequence = seq.value_or(1);
            }
            parsed.legacy = true;
            return parsed;
        }
        if (std::regex_match(key, m, legacy_parity_layout())) {
            object_key parsed;
            parsed.host = m[1].str();
            parsed.backup_number = parse_number(m[2].str());
            parsed.kind = chunk_kind::parity;
            parsed.legacy = true;
            return parsed;
        }
    }

    return unexpected{error{error_code::invalid_object_key,
                            "unrecognised object key: " + key}};
}

auto make_object_metadata(const encrypted_chunk& encrypted)
    -> std::map<std::string, std::string> {
    const auto& c = encrypted.source;
    std::map<std::string, std::string> metadata{
        {meta::sha256, c.sha256},
        {meta::chunk_total, std::to_string(c.total_count)},
        {meta::parity_total, std::to_string(c.parity_count)},
        {meta::compression, c.compression.empty() ? "none" : c.compression},
        {meta::cipher, encrypted.algorithm},
    };
    return metadata;
}

}  // namespace kcenon::cloud_backup
