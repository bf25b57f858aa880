/**
 * @file store_utils.cpp
 * @brief Object store helper implementation
 */

#include "kcenon/cloud_backup/store/store_utils.h"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <locale>
#include <random>
#include <sstream>
#include <string_view>
#include <utility>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace kcenon::cloud_backup::store_utils {

namespace {

constexpr char lower_hex[] = "0123456789abcdef";
constexpr char upper_hex[] = "0123456789ABCDEF";

auto is_unreserved(unsigned char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

auto utc_text(std::chrono::system_clock::time_point time, const char* format) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm parts{};
    gmtime_r(&seconds, &parts);
    char buf[64];
    auto written = std::strftime(buf, sizeof(buf), format, &parts);
    return std::string(buf, written);
}

auto parse_utc(const std::string& text, const char* format)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::tm parts{};
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    in >> std::get_time(&parts, format);
    if (in.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&parts));
}

/// Finds the next <tag>...</tag> at or after @p from; returns the content
/// span and the position just past the closing tag
struct element_span {
    std::size_t begin;
    std::size_t end;
    std::size_t next;
};

auto find_element(const std::string& xml, const std::string& tag, std::size_t from)
    -> std::optional<element_span> {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";

    auto start = xml.find(open, from);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += open.size();
    auto stop = xml.find(close, start);
    if (stop == std::string::npos) {
        return std::nullopt;
    }
    return element_span{start, stop, stop + close.size()};
}

}  // namespace

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        hex += lower_hex[b >> 4];
        hex += lower_hex[b & 0x0f];
    }
    return hex;
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (is_unreserved(c) || (c == '/' && !encode_slash)) {
            out += static_cast<char>(c);
            continue;
        }
        out += '%';
        out += upper_hex[c >> 4];
        out += upper_hex[c & 0x0f];
    }
    return out;
}

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr);
    digest.resize(length);
    return digest;
}

auto sha256_hex(const std::string& data) -> std::string {
    return bytes_to_hex(sha256(data));
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         mac.data(), &length);
    mac.resize(length);
    return mac;
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

auto format_amz_date(std::chrono::system_clock::time_point time) -> std::string {
    return utc_text(time, "%Y%m%dT%H%M%SZ");
}

auto format_date_stamp(std::chrono::system_clock::time_point time) -> std::string {
    return utc_text(time, "%Y%m%d");
}

auto format_display_time(std::chrono::system_clock::time_point time) -> std::string {
    return utc_text(time, "%Y-%m-%d %H:%M:%S UTC");
}

auto parse_iso8601(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    // Fractional seconds and the trailing Z are ignored
    return parse_utc(text, "%Y-%m-%dT%H:%M:%S");
}

auto parse_rfc1123(const std::string& text)
    -> std::optional<std::chrono::system_clock::time_point> {
    return parse_utc(text, "%a, %d %b %Y %H:%M:%S");
}

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    auto span = find_element(xml, tag, 0);
    if (!span) {
        return std::nullopt;
    }
    return xml.substr(span->begin, span->end - span->begin);
}

auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string> {
    std::vector<std::string> values;
    std::size_t from = 0;
    while (auto span = find_element(xml, tag, from)) {
        values.push_back(xml.substr(span->begin, span->end - span->begin));
        from = span->next;
    }
    return values;
}

auto xml_unescape(const std::string& text) -> std::string {
    static const std::pair<std::string_view, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            auto hit = std::find_if(std::begin(entities), std::end(entities),
                                    [&](const auto& entity) {
                                        return text.compare(i, entity.first.size(),
                                                            entity.first) == 0;
                                    });
            if (hit != std::end(entities)) {
                out += hit->second;
                i += hit->first.size();
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

auto normalize_etag(const std::string& etag) -> std::string {
    auto out = xml_unescape(etag);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        return out.substr(1, out.size() - 2);
    }
    return out;
}

auto classify_http_status(int status_code, const std::string& body) -> error_code {
    const auto code = extract_xml_element(body, "Code").value_or("");
    const bool quota = code == "QuotaExceeded" || code == "StorageQuotaExceeded";

    switch (status_code) {
        case 401:
            return error_code::auth_failed;
        case 403:
            if (code == "SignatureDoesNotMatch" || code == "InvalidAccessKeyId" ||
                code == "ExpiredToken") {
                return error_code::auth_failed;
            }
            return quota ? error_code::quota_exceeded : error_code::access_denied;
        case 404:
            return code == "NoSuchBucket" ? error_code::bucket_not_found
                                          : error_code::object_not_found;
        case 400:
            if (code == "BadDigest" || code == "InvalidDigest") {
                return error_code::checksum_mismatch;
            }
            break;
        default:
            break;
    }

    if (status_code == 507 || quota) {
        return error_code::quota_exceeded;
    }
    if (status_code == 408 || code == "RequestTimeout") {
        return error_code::request_timeout;
    }
    if (status_code == 429 || code == "SlowDown") {
        return error_code::rate_limited;
    }
    if (status_code == 503) {
        return error_code::service_unavailable;
    }
    return status_code >= 500 ? error_code::server_error : error_code::request_rejected;
}

auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds {
    const auto exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
    auto delay = static_cast<double>(policy.initial_delay.count()) *
                 std::pow(policy.backoff_multiplier, exponent);
    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 engine{std::random_device{}()};
        delay *= std::uniform_real_distribution<>(0.5, 1.5)(engine);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::cloud_backup::store_utils
