/**
 * @file restore_script.cpp
 * @brief Restore template and generator
 */

#include "kcenon/cloud_backup/restore/restore_script.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/store/object_key.h"
#include "kcenon/cloud_backup/store/s3_signer.h"
#include "kcenon/cloud_backup/store/store_utils.h"

#include <algorithm>
#include <sstream>

namespace kcenon::cloud_backup {

namespace {

constexpr const char* restore_template = R"TEMPLATE(#!/bin/sh
# Restoration script for {{HOST}} backup {{BACKUP}},
# a backup created on {{CREATED}}.
# Template version {{VERSION}}, {{PART_COUNT}} parts, compression {{COMPRESSION}}.
# To use: sh scriptname /path/to/put/the/files

# WARNING: THIS FILE EXPIRES AFTER {{EXPIRES}}
if [ "`date +%s`" -gt "{{EXPIRES_EPOCH}}" ]; then
    echo "Sorry, but this restore script is too old."
    exit 1
fi

if [ -z "$1" ]; then
    echo "Usage: $0 /path/to/restore/to"
    exit 1
fi

# Check the destination
if [ ! -d "$1" ]; then
    echo "Target $1 does not exist!"
    exit 1
fi

if [ -n "`ls -A "$1"`" ]; then
    echo "Target $1 is not empty!"
    exit 1
fi

cd "$1" || exit 1
SCRATCH=.restorescript-scratch
mkdir "$SCRATCH" || exit 1

fetch() {
    if command -v wget >/dev/null 2>&1; then
        wget -q -O "$SCRATCH/$1" "$2"
    else
        curl -f -s -S -o "$SCRATCH/$1" "$2"
    fi || { echo "Download of $1 failed"; exit 1; }
}

# retrieve files
{{DOWNLOADS}}

# passphrase is read here and never stored on disk
printf "Passphrase: "
stty -echo 2>/dev/null
read -r PASSPHRASE
stty echo 2>/dev/null
echo

# decrypt data parts in sequence order and join them
: > "$SCRATCH/archive"
for part in {{DATA_PARTS}}; do
    printf '%s\n' "$PASSPHRASE" | gpg --batch --quiet --passphrase-fd 0 \
        --pinentry-mode loopback --decrypt "$SCRATCH/$part" >> "$SCRATCH/archive" \
        || { echo "Decryption of $part failed"; exit 1; }
done
PASSPHRASE=

# untar, compression is detected from the archive
tar -xf "$SCRATCH/archive" || exit 1

rm -rf "$SCRATCH"
echo "DONE!  Have a nice day."
)TEMPLATE";

auto replace_all(std::string& text, const std::string& token, const std::string& value) -> void {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

// Header comments must stay on one line
auto comment_safe(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        out.push_back(c < 0x20 || c == 0x7f ? '?' : static_cast<char>(c));
    }
    return out;
}

auto scratch_name(const backup_part& part) -> std::string {
    if (part.key.legacy) {
        return part.object.key;
    }
    std::string name = part.object.key.substr(part.object.key.rfind('/') + 1);
    return name + ".gpg";
}

}  // namespace

auto shell_quote(const std::string& value) -> std::string {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out.push_back(c);
        }
    }
    out += "'";
    return out;
}

auto render_restore_script(const restore_script_context& context) -> std::string {
    std::ostringstream downloads;
    std::ostringstream data_parts;
    bool first_data = true;
    for (const auto& part : context.parts) {
        downloads << "fetch " << shell_quote(part.file_name) << " "
                  << shell_quote(part.url) << "\n";
        if (part.kind == chunk_kind::data) {
            if (!first_data) {
                data_parts << " ";
            }
            data_parts << shell_quote(part.file_name);
            first_data = false;
        }
    }

    auto expires_epoch = std::chrono::duration_cast<std::chrono::seconds>(
        context.expires.time_since_epoch()).count();

    std::string text = restore_template;
    replace_all(text, "{{HOST}}", comment_safe(context.host));
    replace_all(text, "{{BACKUP}}", std::to_string(context.backup_number));
    replace_all(text, "{{CREATED}}", store_utils::format_display_time(context.created));
    replace_all(text, "{{VERSION}}", std::to_string(RESTORE_TEMPLATE_VERSION));
    replace_all(text, "{{PART_COUNT}}", std::to_string(context.parts.size()));
    replace_all(text, "{{COMPRESSION}}", comment_safe(context.compression));
    replace_all(text, "{{EXPIRES}}", store_utils::format_display_time(context.expires));
    replace_all(text, "{{EXPIRES_EPOCH}}", std::to_string(expires_epoch));
    auto download_lines = downloads.str();
    if (!download_lines.empty() && download_lines.back() == '\n') {
        download_lines.pop_back();
    }
    replace_all(text, "{{DOWNLOADS}}", download_lines);
    replace_all(text, "{{DATA_PARTS}}", data_parts.str());
    return text;
}

restore_script_generator::restore_script_generator(std::shared_ptr<object_store> store)
    : store_(store), inventory_(std::move(store)) {}

auto restore_script_generator::generate(const restore_request& request) const
    -> result<restore_script> {
    if (request.host.empty()) {
        return unexpected{error{error_code::invalid_argument, "host is required"}};
    }
    if (request.expire.count() < 1 ||
        request.expire.count() > max_presign_expiry_seconds) {
        return unexpected{error{error_code::invalid_argument,
            "expiry must be between 1 and " +
            std::to_string(max_presign_expiry_seconds) + " seconds"}};
    }

    auto record = request.backup_number
                      ? inventory_.find(request.host, *request.backup_number)
                      : inventory_.latest(request.host);
    if (!record) {
        return unexpected{record.error()};
    }
    const auto& backup = record.value();

    if (!backup.is_complete()) {
        std::string missing;
        for (auto seq : backup.missing_sequences()) {
            missing += (missing.empty() ? "" : ",") + std::to_string(seq);
        }
        return unexpected{error{error_code::backup_incomplete,
            request.host + " backup " + std::to_string(backup.backup_number) +
            " is incomplete" + (missing.empty() ? "" : " (missing " + missing + ")")}};
    }

    const auto now = request.now.value_or(std::chrono::system_clock::now());

    restore_script_context context;
    context.host = backup.host;
    context.backup_number = backup.backup_number;
    context.created = backup.newest_upload;
    context.expires = now + request.expire;

    for (const auto& part : backup.parts) {
        auto url = store_->presign_get(part.object.key, request.expire, now);
        if (!url) {
            return unexpected{url.error()};
        }
        context.parts.push_back(
            script_part{scratch_name(part), url.value(), part.key.kind, part.key.sequence});

        auto compression = part.object.metadata.find(meta::compression);
        if (compression != part.object.metadata.end()) {
            context.compression = compression->second;
        }
    }

    restore_script script;
    script.text = render_restore_script(context);
    script.host = backup.host;
    script.backup_number = backup.backup_number;
    script.part_count = context.parts.size();
    script.expires_at = context.expires;

    chunk_log_context ctx;
    ctx.host = backup.host;
    ctx.backup_number = backup.backup_number;
    ctx.total_chunks = static_cast<uint32_t>(backup.data_count());
    CB_LOG_INFO_CTX(log_category::restore,
                    "Generated restore script valid until " +
                    store_utils::format_display_time(script.expires_at),
                    ctx);
    return script;
}

}  // namespace kcenon::cloud_backup
