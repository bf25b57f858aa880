/**
 * @file checksum.cpp
 * @brief Digest utilities backed by OpenSSL EVP
 */

#include "kcenon/cloud_backup/core/checksum.h"

#include <array>
#include <fstream>
#include <memory>

#include <openssl/evp.h>

namespace kcenon::cloud_backup {

namespace {

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

auto to_hex(const unsigned char* data, std::size_t len) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

auto to_base64(const unsigned char* data, std::size_t len) -> std::string {
    std::string out(4 * ((len + 2) / 3), '\0');
    auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                   data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

auto digest_file(const std::filesystem::path& path, const EVP_MD* md,
                 std::size_t block_size) -> result<file_digest> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    md_ctx_ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return unexpected(error{error_code::internal_error, "digest init failed"});
    }

    std::vector<char> buffer(block_size);
    file_digest digest;
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = file.gcount();
        if (bytes_read <= 0) {
            break;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(),
                             static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "digest update failed"});
        }
        digest.size += static_cast<uint64_t>(bytes_read);
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> raw{};
    unsigned int raw_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), raw.data(), &raw_len) != 1) {
        return unexpected(error{error_code::internal_error, "digest final failed"});
    }

    digest.hex = to_hex(raw.data(), raw_len);
    digest.base64 = to_base64(raw.data(), raw_len);
    return digest;
}

auto digest_bytes(std::span<const std::byte> data, const EVP_MD* md) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> raw{};
    unsigned int raw_len = 0;
    if (EVP_Digest(data.data(), data.size(), raw.data(), &raw_len, md, nullptr) != 1) {
        return {};
    }
    return to_hex(raw.data(), raw_len);
}

}  // namespace

auto checksum::sha256_file(const std::filesystem::path& path) -> result<file_digest> {
    return digest_file(path, EVP_sha256(), read_block_size);
}

auto checksum::md5_file(const std::filesystem::path& path) -> result<file_digest> {
    return digest_file(path, EVP_md5(), read_block_size);
}

auto checksum::verify_sha256(const std::filesystem::path& path,
                             const std::string& expected) -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    return result.value().hex == expected;
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    return digest_bytes(data, EVP_sha256());
}

auto checksum::md5(std::span<const std::byte> data) -> std::string {
    return digest_bytes(data, EVP_md5());
}

}  // namespace kcenon::cloud_backup
