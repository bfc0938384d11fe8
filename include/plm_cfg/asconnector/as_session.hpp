#pragma once

#include <plm_cfg/asconnector/i_as_session.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace plm_cfg {

// ---------------------------------------------------------------------------
// AsSessionOptions: timeouts for the AsConnector HTTP session. A request
// that exceeds them fails with ErrorCategory::Timeout.
// ---------------------------------------------------------------------------
struct AsSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{10};
};

// ---------------------------------------------------------------------------
// AsSession: concrete IAsSession implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header.
// ---------------------------------------------------------------------------
class AsSession : public IAsSession {
public:
    AsSession(const std::string& host,
              uint16_t port,
              const AsSessionOptions& options = {});

    ~AsSession() override;

    AsSession(const AsSession&) = delete;
    AsSession& operator=(const AsSession&) = delete;
    AsSession(AsSession&&) = delete;
    AsSession& operator=(AsSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] std::string BaseUrl() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace plm_cfg
