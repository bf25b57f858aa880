/**
 * @file s3_signer.cpp
 * @brief AWS Signature Version 4 implementation
 */

#include "kcenon/cloud_backup/store/s3_signer.h"
#include "kcenon/cloud_backup/store/store_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace kcenon::cloud_backup {

using namespace store_utils;

namespace {

constexpr const char* signing_algorithm = "AWS4-HMAC-SHA256";

struct endpoint_parts {
    std::string scheme;
    std::string host;
};

auto parse_endpoint(const std::string& endpoint, bool use_ssl) -> endpoint_parts {
    endpoint_parts parts;
    std::string rest = endpoint;

    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parts.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    } else {
        parts.scheme = use_ssl ? "https" : "http";
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    // Default ports are not part of the signed host
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        auto port = rest.substr(colon + 1);
        if ((parts.scheme == "https" && port == "443") ||
            (parts.scheme == "http" && port == "80")) {
            rest = rest.substr(0, colon);
        }
    }

    parts.host = rest;
    return parts;
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto trim_header_value(const std::string& value) -> std::string {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

}  // namespace

s3_signer::s3_signer(store_credentials credentials, store_config config)
    : credentials_(std::move(credentials)), config_(std::move(config)) {
    if (config_.endpoint.has_value()) {
        auto parts = parse_endpoint(config_.endpoint.value(), config_.use_ssl);
        scheme_ = parts.scheme;
        host_ = config_.use_path_style ? parts.host : config_.bucket + "." + parts.host;
    } else {
        scheme_ = config_.use_ssl ? "https" : "http";
        host_ = config_.use_path_style
            ? "s3." + config_.region + ".amazonaws.com"
            : config_.bucket + ".s3." + config_.region + ".amazonaws.com";
    }
}

auto s3_signer::base_url() const -> std::string {
    return scheme_ + "://" + host_;
}

auto s3_signer::object_path(const std::string& key) const -> std::string {
    if (config_.use_path_style) {
        return "/" + config_.bucket + "/" + key;
    }
    return "/" + key;
}

auto s3_signer::bucket_path() const -> std::string {
    if (config_.use_path_style) {
        return "/" + config_.bucket;
    }
    return "/";
}

auto s3_signer::canonical_query(const std::map<std::string, std::string>& query)
    -> std::string {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(query.size());
    for (const auto& [k, v] : query) {
        encoded.emplace_back(url_encode(k), url_encode(v));
    }
    std::sort(encoded.begin(), encoded.end());

    std::ostringstream oss;
    bool first = true;
    for (const auto& [k, v] : encoded) {
        if (!first) oss << "&";
        oss << k << "=" << v;
        first = false;
    }
    return oss.str();
}

auto s3_signer::credential_scope(const std::string& date_stamp) const -> std::string {
    return date_stamp + "/" + config_.region + "/s3/aws4_request";
}

auto s3_signer::signature(const std::string& date_stamp,
                          const std::string& string_to_sign) const -> std::string {
    auto k_date = hmac_sha256("AWS4" + credentials_.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, config_.region);
    auto k_service = hmac_sha256(k_region, "s3");
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    return bytes_to_hex(hmac_sha256(k_signing, string_to_sign));
}

auto s3_signer::sign_request(
    const std::string& method,
    const std::string& path,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers,
    const std::string& payload_hash,
    std::chrono::system_clock::time_point now) const
    -> std::map<std::string, std::string> {
    std::string amz_date = format_amz_date(now);
    std::string date_stamp = format_date_stamp(now);

    auto signed_request_headers = headers;
    signed_request_headers["Host"] = host_;
    signed_request_headers["x-amz-date"] = amz_date;
    signed_request_headers["x-amz-content-sha256"] = payload_hash;
    if (credentials_.session_token.has_value()) {
        signed_request_headers["x-amz-security-token"] = credentials_.session_token.value();
    }

    // Canonical headers sorted by lowercase name
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [k, v] : signed_request_headers) {
        sorted_headers[to_lower(k)] = trim_header_value(v);
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [k, v] : sorted_headers) {
        canonical_headers << k << ":" << v << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << k;
        first = false;
    }
    std::string signed_headers = signed_headers_builder.str();

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << url_encode(path, false) << "\n";
    canonical_request << canonical_query(query) << "\n";
    canonical_request << canonical_headers.str() << "\n";
    canonical_request << signed_headers << "\n";
    canonical_request << payload_hash;

    std::string scope = credential_scope(date_stamp);
    std::ostringstream string_to_sign;
    string_to_sign << signing_algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << scope << "\n";
    string_to_sign << sha256_hex(canonical_request.str());

    std::ostringstream auth_header;
    auth_header << signing_algorithm << " ";
    auth_header << "Credential=" << credentials_.access_key_id << "/" << scope << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << signature(date_stamp, string_to_sign.str());

    signed_request_headers["Authorization"] = auth_header.str();
    return signed_request_headers;
}

auto s3_signer::presign(
    const std::string& method,
    const std::string& key,
    std::chrono::seconds expires,
    std::chrono::system_clock::time_point now) const -> result<std::string> {
    if (expires.count() < 1 || expires.count() > max_presign_expiry_seconds) {
        return unexpected{error{error_code::invalid_argument,
            "pre-signed URL expiry must be between 1 and 604800 seconds, got " +
            std::to_string(expires.count())}};
    }
    if (key.empty()) {
        return unexpected{error{error_code::invalid_object_key, "empty object key"}};
    }

    std::string amz_date = format_amz_date(now);
    std::string date_stamp = format_date_stamp(now);
    std::string path = object_path(key);
    std::string scope = credential_scope(date_stamp);

    std::map<std::string, std::string> query{
        {"X-Amz-Algorithm", signing_algorithm},
        {"X-Amz-Credential", credentials_.access_key_id + "/" + scope},
        {"X-Amz-Date", amz_date},
        {"X-Amz-Expires", std::to_string(expires.count())},
        {"X-Amz-SignedHeaders", "host"},
    };
    if (credentials_.session_token.has_value()) {
        query["X-Amz-Security-Token"] = credentials_.session_token.value();
    }
    std::string query_string = canonical_query(query);

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << url_encode(path, false) << "\n";
    canonical_request << query_string << "\n";
    canonical_request << "host:" << host_ << "\n";
    canonical_request << "\n";
    canonical_request << "host\n";
    canonical_request << unsigned_payload;

    std::ostringstream string_to_sign;
    string_to_sign << signing_algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << scope << "\n";
    string_to_sign << sha256_hex(canonical_request.str());

    std::ostringstream url_builder;
    url_builder << base_url() << url_encode(path, false);
    url_builder << "?" << query_string;
    url_builder << "&X-Amz-Signature=" << signature(date_stamp, string_to_sign.str());

    return url_builder.str();
}

}  // namespace kcenon::cloud_backup
