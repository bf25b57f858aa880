/**
 * @file http_client.h
 * @brief HTTP seam under the S3 client
 *
 * cloud_http_client sends through network_system; tests plug in their own
 * http_client_interface and script the responses.
 */

#ifndef KCENON_CLOUD_BACKUP_STORE_HTTP_CLIENT_H
#define KCENON_CLOUD_BACKUP_STORE_HTTP_CLIENT_H

#include <kcenon/cloud_backup/core/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::cloud_backup {

/// The verbs S3 object and bucket operations use
enum class http_method { get, put, head, del };

[[nodiscard]] constexpr auto to_string(http_method method) noexcept -> std::string_view {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::put: return "PUT";
        case http_method::head: return "HEAD";
        case http_method::del: return "DELETE";
    }
    return "GET";
}

/**
 * @brief One signed request; the query string is already part of @c url
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] auto get_body_string() const -> const std::string& { return body; }

    /// Header lookup ignoring case; servers differ on "ETag" versus "etag"
    [[nodiscard]] auto get_header(std::string_view name) const -> std::optional<std::string>;

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Sends one request and returns whatever status came back
 *
 * An error means no HTTP exchange completed (connection, DNS, TLS or
 * timeout). Every status code, 4xx and 5xx included, is a value.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto send(const http_request& request) -> result<http_response> = 0;
};

/**
 * @brief HTTP over network_system's http_client
 *
 * Built without network_system, every request fails with connection_failed.
 */
class cloud_http_client : public http_client_interface {
public:
    explicit cloud_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~cloud_http_client() override;

    cloud_http_client(const cloud_http_client&) = delete;
    auto operator=(const cloud_http_client&) -> cloud_http_client& = delete;

    [[nodiscard]] auto send(const http_request& request) -> result<http_response> override;

    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_cloud_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<cloud_http_client>;

}  // namespace kcenon::cloud_backup

#endif  // KCENON_CLOUD_BACKUP_STORE_HTTP_CLIENT_H
