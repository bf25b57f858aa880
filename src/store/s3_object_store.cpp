/**
 * @file s3_object_store.cpp
 * @brief S3 object store implementation
 */

#include "kcenon/cloud_backup/store/s3_object_store.h"
#include "kcenon/cloud_backup/core/logging.h"
#include "kcenon/cloud_backup/store/store_utils.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace kcenon::cloud_backup {

using namespace store_utils;

namespace {

constexpr const char* metadata_header_prefix = "x-amz-meta-";

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "cannot open " + path.string()}};
    }
    std::string body((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
                                "read failed for " + path.string()}};
    }
    return body;
}

auto status_error(const http_response& response, const std::string& what) -> unexpected {
    auto body = response.get_body_string();
    auto code = classify_http_status(response.status_code, body);
    auto message = extract_xml_element(body, "Message").value_or(to_string(code));
    return unexpected{error{code, what + ": HTTP " + std::to_string(response.status_code) +
                                  " " + message}};
}

auto parse_uint(const std::string& text) -> uint64_t {
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            break;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

}  // namespace

struct s3_object_store::impl {
    store_config config;
    s3_signer signer;
    std::shared_ptr<http_client_interface> client;

    impl(const store_config& cfg, const store_credentials& creds,
         std::shared_ptr<http_client_interface> http)
        : config(cfg), signer(creds, cfg), client(std::move(http)) {}

    auto url_for(const std::string& path, const std::string& query = {}) const
        -> std::string {
        auto url = signer.base_url() + url_encode(path, false);
        if (!query.empty()) {
            url += "?" + query;
        }
        return url;
    }

    /// Signs and sends one request; the URL carries the canonical query so
    /// the wire matches what was signed
    auto exchange(http_method method, const std::string& path,
                  const std::map<std::string, std::string>& query,
                  const std::map<std::string, std::string>& headers,
                  std::string body = {}) const -> result<http_response> {
        const std::string payload_hash =
            body.empty() ? std::string(empty_payload_sha256) : sha256_hex(body);

        http_request request;
        request.method = method;
        request.url = url_for(path, s3_signer::canonical_query(query));
        request.headers = signer.sign_request(std::string(to_string(method)), path, query,
                                              headers, payload_hash,
                                              std::chrono::system_clock::now());
        request.body = std::move(body);
        return client->send(request);
    }

    static auto object_from_headers(const std::string& key, const http_response& response)
        -> remote_object {
        remote_object object;
        object.key = key;
        object.size = parse_uint(response.get_header("Content-Length").value_or("0"));
        object.etag = normalize_etag(response.get_header("ETag").value_or(""));
        if (auto modified = response.get_header("Last-Modified")) {
            if (auto parsed = parse_rfc1123(*modified)) {
                object.uploaded_at = *parsed;
            }
        }
        const std::string prefix = metadata_header_prefix;
        for (const auto& [name, value] : response.headers) {
            auto lower = to_lower(name);
            if (lower.rfind(prefix, 0) == 0) {
                object.metadata[lower.substr(prefix.size())] = value;
            }
        }
        return object;
    }

    static auto parse_contents(const std::string& xml) -> std::vector<remote_object> {
        std::vector<remote_object> objects;
        for (const auto& entry : extract_xml_elements(xml, "Contents")) {
            remote_object object;
            object.key = xml_unescape(extract_xml_element(entry, "Key").value_or(""));
            object.size = parse_uint(extract_xml_element(entry, "Size").value_or("0"));
            object.etag = normalize_etag(extract_xml_element(entry, "ETag").value_or(""));
            if (auto modified = extract_xml_element(entry, "LastModified")) {
                if (auto parsed = parse_iso8601(*modified)) {
                    object.uploaded_at = *parsed;
                }
            }
            if (!object.key.empty()) {
                objects.push_back(std::move(object));
            }
        }
        return objects;
    }
};

auto s3_object_store::create(const store_config& config,
                             const store_credentials& credentials)
    -> result<std::unique_ptr<s3_object_store>> {
    auto client = make_cloud_http_client(config.request_timeout);
    if (!client->is_available()) {
        return unexpected{error{error_code::invalid_configuration,
                                "built without network_system; S3 is unreachable"}};
    }
    return create(config, credentials, std::move(client));
}

auto s3_object_store::create(const store_config& config,
                             const store_credentials& credentials,
                             std::shared_ptr<http_client_interface> client)
    -> result<std::unique_ptr<s3_object_store>> {
    if (!credentials.is_valid()) {
        return unexpected{error{error_code::missing_credentials,
                                "access key id and secret access key are required"}};
    }
    if (config.bucket.empty() || config.region.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "bucket and region are required"}};
    }
    if (!client) {
        return unexpected{error{error_code::invalid_configuration, "no HTTP client"}};
    }
    return std::unique_ptr<s3_object_store>(
        new s3_object_store(config, credentials, std::move(client)));
}

s3_object_store::s3_object_store(const store_config& config,
                                 const store_credentials& credentials,
                                 std::shared_ptr<http_client_interface> client)
    : impl_(std::make_unique<impl>(config, credentials, std::move(client))) {}

s3_object_store::~s3_object_store() = default;

auto s3_object_store::bucket() const -> const std::string& {
    return impl_->config.bucket;
}

auto s3_object_store::put_object(
    const std::string& key,
    const std::filesystem::path& file,
    const std::string& content_md5,
    const std::map<std::string, std::string>& metadata) -> result<remote_object> {
    auto body = read_file(file);
    if (!body) {
        return unexpected{body.error()};
    }

    std::map<std::string, std::string> headers{
        {"Content-Type", "application/octet-stream"},
    };
    if (!content_md5.empty()) {
        headers["Content-MD5"] = content_md5;
    }
    for (const auto& [name, value] : metadata) {
        headers[metadata_header_prefix + name] = value;
    }

    const auto size = body.value().size();
    CB_LOG_DEBUG(log_category::store,
                 "PUT " + key + " (" + std::to_string(size) + " bytes)");

    auto response = impl_->exchange(http_method::put, impl_->signer.object_path(key), {},
                                    headers, std::move(body.value()));
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return status_error(response.value(), "PUT " + key);
    }

    remote_object object;
    object.key = key;
    object.size = size;
    object.uploaded_at = std::chrono::system_clock::now();
    object.etag = normalize_etag(response.value().get_header("ETag").value_or(""));
    object.metadata = metadata;
    return object;
}

auto s3_object_store::head_object(const std::string& key) -> result<remote_object> {
    auto response = impl_->exchange(http_method::head, impl_->signer.object_path(key), {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.status_code == 404) {
        // HEAD responses carry no error body
        return unexpected{error{error_code::object_not_found, "no such object: " + key}};
    }
    if (!resp.is_success()) {
        return status_error(resp, "HEAD " + key);
    }
    return impl::object_from_headers(key, resp);
}

auto s3_object_store::list_objects(const std::string& prefix)
    -> result<std::vector<remote_object>> {
    std::vector<remote_object> objects;
    std::optional<std::string> continuation;
    std::size_t pages = 0;

    do {
        std::map<std::string, std::string> query{{"list-type", "2"}};
        if (!prefix.empty()) {
            query["prefix"] = prefix;
        }
        if (continuation) {
            query["continuation-token"] = *continuation;
        }

        auto response = impl_->exchange(http_method::get, impl_->signer.bucket_path(), query, {});
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return status_error(response.value(), "LIST " + prefix);
        }

        auto xml = response.value().get_body_string();
        auto page = impl::parse_contents(xml);
        objects.insert(objects.end(), std::make_move_iterator(page.begin()),
                       std::make_move_iterator(page.end()));
        ++pages;

        continuation.reset();
        if (extract_xml_element(xml, "IsTruncated").value_or("false") == "true") {
            auto token = extract_xml_element(xml, "NextContinuationToken");
            if (!token || token->empty()) {
                return unexpected{error{error_code::server_error,
                                        "truncated listing without continuation token"}};
            }
            continuation = xml_unescape(*token);
        }
    } while (continuation);

    CB_LOG_DEBUG(log_category::store,
                 "Listed " + std::to_string(objects.size()) + " objects under '" + prefix +
                 "' in " + std::to_string(pages) + " page(s)");
    return objects;
}

auto s3_object_store::delete_object(const std::string& key) -> result<void> {
    auto response = impl_->exchange(http_method::del, impl_->signer.object_path(key), {}, {});
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.is_success()) {
        return {};
    }
    if (resp.status_code == 404 &&
        classify_http_status(404, resp.get_body_string()) != error_code::bucket_not_found) {
        return {};
    }
    return status_error(resp, "DELETE " + key);
}

auto s3_object_store::presign_get(
    const std::string& key,
    std::chrono::seconds expires,
    std::chrono::system_clock::time_point now) -> result<std::string> {
    return impl_->signer.presign("GET", key, expires, now);
}

}  // namespace kcenon::cloud_backup
