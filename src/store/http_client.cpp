/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include "kcenon/cloud_backup/store/http_client.h"

#include "kcenon/cloud_backup/config/feature_flags.h"

#include <strings.h>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::cloud_backup {

auto http_response::get_header(std::string_view name) const -> std::optional<std::string> {
    const std::string wanted(name);
    for (const auto& [key, value] : headers) {
        if (key.size() == wanted.size() && ::strcasecmp(key.c_str(), wanted.c_str()) == 0) {
            return value;
        }
    }
    return std::nullopt;
}

struct cloud_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    explicit impl(std::chrono::milliseconds timeout)
        : client(std::make_shared<kcenon::network::core::http_client>(timeout)) {}

    std::shared_ptr<kcenon::network::core::http_client> client;
#else
    explicit impl(std::chrono::milliseconds) {}
#endif
};

cloud_http_client::cloud_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

cloud_http_client::~cloud_http_client() = default;

auto cloud_http_client::send(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto& client = *impl_->client;
    auto exchanged = [&] {
        switch (request.method) {
            case http_method::put: return client.put(request.url, request.body, request.headers);
            case http_method::head: return client.head(request.url, request.headers);
            case http_method::del: return client.del(request.url, request.headers);
            case http_method::get: break;
        }
        return client.get(request.url, {}, request.headers);
    }();

    if (exchanged.is_err()) {
        return unexpected{error{error_code::connection_failed,
            std::string(to_string(request.method)) + " " + request.url + " failed"}};
    }

    const auto& raw = exchanged.value();
    http_response response;
    response.status_code = raw.status_code;
    response.headers = raw.headers;
    response.body.assign(raw.body.begin(), raw.body.end());
    return response;
#else
    return unexpected{error{error_code::connection_failed,
        std::string(to_string(request.method)) + " " + request.url +
        ": built without network_system"}};
#endif
}

auto cloud_http_client::is_available() const noexcept -> bool {
    return KCENON_WITH_NETWORK_SYSTEM != 0;
}

auto make_cloud_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<cloud_http_client> {
    return std::make_shared<cloud_http_client>(timeout);
}

}  // namespace kcenon::cloud_backup
