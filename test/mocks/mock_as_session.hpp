#pragma once

#include <plm_cfg/asconnector/i_as_session.hpp>

#include <deque>
#include <string>
#include <vector>

namespace plm_cfg {
namespace testing {

// ---------------------------------------------------------------------------
// MockAsSession: hand-written mock for offline unit testing.
//
// Usage:
//   MockAsSession mock;
//   mock.EnqueuePost(Result<HttpResponse, Error>::Ok({200, {}, "<r/>"}));
//   auto result = mock.Post("/v2///getversioninfo", "<req/>", "application/xml");
//   CHECK(mock.PostCallCount() == 1);
//
// Responses are consumed FIFO. If the queue is empty when Post is called,
// the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------

struct PostCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

class MockAsSession : public IAsSession {
public:
    MockAsSession() = default;

    void EnqueuePost(Result<HttpResponse, Error> response) {
        post_responses_.push_back(std::move(response));
    }

    // Shorthand for a 200 response with an XML body.
    void EnqueueXml(std::string body) {
        post_responses_.push_back(
            Result<HttpResponse, Error>::Ok(HttpResponse{200, {}, std::move(body)}));
    }

    void EnqueueTransportError(ErrorCategory category, std::string message = "connection refused") {
        post_responses_.push_back(Result<HttpResponse, Error>::Err(Error{
            "Post", "", std::nullopt, std::move(message), std::nullopt, category}));
    }

    [[nodiscard]] const std::vector<PostCall>& PostCalls() const noexcept {
        return post_calls_;
    }
    [[nodiscard]] size_t PostCallCount() const noexcept {
        return post_calls_.size();
    }
    [[nodiscard]] size_t PendingResponses() const noexcept {
        return post_responses_.size();
    }

    void Reset() {
        post_responses_.clear();
        post_calls_.clear();
    }

    // -- IAsSession implementation -------------------------------------------

    Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers) override {
        post_calls_.push_back({
            std::string(path),
            std::string(body),
            std::string(content_type),
            headers,
        });
        if (post_responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                "Post", std::string(path), std::nullopt,
                "MockAsSession: no responses enqueued", std::nullopt});
        }
        auto response = std::move(post_responses_.front());
        post_responses_.pop_front();
        return response;
    }

    [[nodiscard]] std::string BaseUrl() const override {
        return "http://mock:1234";
    }

private:
    std::deque<Result<HttpResponse, Error>> post_responses_;
    std::vector<PostCall> post_calls_;
};

// Response body with one <returnVal> per entry.
inline std::string ReturnValBody(const std::vector<std::string>& values) {
    std::string body = "<?xml version=\"1.0\"?><Response xmlns=\"urn:authoringsystem_v2\">";
    for (const auto& value : values) {
        body += "<returnVal>" + value + "</returnVal>";
    }
    body += "</Response>";
    return body;
}

} // namespace testing
} // namespace plm_cfg
