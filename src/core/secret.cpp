/**
 * @file secret.cpp
 * @brief Scoped passphrase holder
 */

#include "kcenon/cloud_backup/core/secret.h"

#include <fstream>
#include <iterator>

#include <openssl/crypto.h>

namespace kcenon::cloud_backup {

void secure_zero_memory(void* ptr, std::size_t size) {
    if (ptr != nullptr && size > 0) {
        OPENSSL_cleanse(ptr, size);
    }
}

scoped_secret::scoped_secret(std::string_view value)
    : bytes_(value.begin(), value.end()) {}

scoped_secret::~scoped_secret() {
    reset();
}

scoped_secret::scoped_secret(scoped_secret&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.bytes_.clear();
}

auto scoped_secret::operator=(scoped_secret&& other) noexcept -> scoped_secret& {
    if (this != &other) {
        reset();
        bytes_ = std::move(other.bytes_);
        other.bytes_.clear();
    }
    return *this;
}

auto scoped_secret::reset() noexcept -> void {
    secure_zero_memory(bytes_.data(), bytes_.capacity());
    bytes_.clear();
    bytes_.shrink_to_fit();
}

auto load_secret_file(const std::filesystem::path& path) -> result<scoped_secret> {
    if (path.empty()) {
        return unexpected(error{error_code::missing_passphrase, "no passphrase file configured"});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::missing_passphrase,
                                "cannot open passphrase file: " + path.string()});
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
    if (file.bad()) {
        secure_zero_memory(raw.data(), raw.size());
        return unexpected(error{error_code::file_read_error,
                                "cannot read passphrase file: " + path.string()});
    }

    std::size_t len = raw.size();
    if (len > 0 && raw[len - 1] == '\n') {
        --len;
        if (len > 0 && raw[len - 1] == '\r') {
            --len;
        }
    }

    if (len == 0) {
        secure_zero_memory(raw.data(), raw.size());
        return unexpected(error{error_code::missing_passphrase,
                                "passphrase file is empty: " + path.string()});
    }

    scoped_secret secret(std::string_view(raw.data(), len));
    secure_zero_memory(raw.data(), raw.size());
    return secret;
}

}  // namespace kcenon::cloud_backup
