#include <plm_cfg/asconnector/as_session.hpp>

#include <plm_cfg/core/log.hpp>

#include <httplib.h>

namespace plm_cfg {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

void LogResponse(int status, const std::string& body) {
    LogInfo(log_component::kHttp, "  < " + std::to_string(status));
    if (body.empty()) {
        return;
    }
    constexpr size_t kMaxBodyLog = 2000;
    if (body.size() <= kMaxBodyLog) {
        LogDebug(log_component::kHttp, "  < body: " + body);
    } else {
        LogDebug(log_component::kHttp, "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct AsSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_url;

    Impl(const std::string& host, uint16_t port, const AsSessionOptions& opts)
        : base_url("http://" + host + ":" + std::to_string(port)) {
        client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.read_timeout);
    }
};

AsSession::AsSession(const std::string& host,
                     uint16_t port,
                     const AsSessionOptions& options)
    : impl_(std::make_unique<Impl>(host, port, options)) {}

AsSession::~AsSession() = default;

Result<HttpResponse, Error> AsSession::Post(std::string_view path,
                                            std::string_view body,
                                            std::string_view content_type,
                                            const HttpHeaders& headers) {
    httplib::Headers hdrs;
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }
    LogInfo(log_component::kHttp, "POST " + impl_->base_url + std::string(path));
    LogDebug(log_component::kHttp, "  > body: " + std::string(body));

    auto res = impl_->client->Post(std::string(path), hdrs,
                                   std::string(body), std::string(content_type));
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Post", std::string(path), std::nullopt,
            "HTTP request to " + impl_->base_url + " failed: " +
                httplib::to_string(http_error),
            std::nullopt, CategoryFromHttpTransportError(http_error)});
    }
    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

std::string AsSession::BaseUrl() const {
    return impl_->base_url;
}

} // namespace plm_cfg
