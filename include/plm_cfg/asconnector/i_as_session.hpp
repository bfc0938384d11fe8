#pragma once

#include <plm_cfg/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace plm_cfg {

using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IAsSession: abstract HTTP session to the AsConnector REST service.
//
// AuthoringClient depends on this interface rather than a concrete HTTP
// client, which allows offline testing via MockAsSession. Paths are relative
// to the service root, e.g. "/v2///getversioninfo".
//
// Methods return Result<T, Error> and never throw on expected failures.
// Transport failures (refused, timed out) are errors; any HTTP status is a
// response.
// ---------------------------------------------------------------------------
class IAsSession {
public:
    virtual ~IAsSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IAsSession(const IAsSession&) = delete;
    IAsSession& operator=(const IAsSession&) = delete;
    IAsSession(IAsSession&&) = delete;
    IAsSession& operator=(IAsSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    // "http://host:port", used in diagnostics.
    [[nodiscard]] virtual std::string BaseUrl() const = 0;

protected:
    IAsSession() = default;
};

} // namespace plm_cfg
