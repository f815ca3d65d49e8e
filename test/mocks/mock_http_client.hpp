#pragma once

#include <openapi_mcp/http/i_http_client.hpp>

#include <deque>
#include <string>
#include <vector>

namespace openapi_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpClient: hand-written mock for offline unit testing.
//
// Usage:
//   MockHttpClient mock;
//   mock.Enqueue(Result<HttpResponse, Error>::Ok({200, {}, R"({"id":1})"}));
//   auto result = mock.Send(request);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].path == "/pets/1");
//
// Responses are consumed FIFO. If the queue is empty when Send is called,
// the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------
class MockHttpClient : public IHttpClient {
public:
    MockHttpClient() = default;

    void Enqueue(Result<HttpResponse, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueOk(int status, std::string body) {
        responses_.push_back(
            Result<HttpResponse, Error>::Ok(HttpResponse{status, {}, std::move(body)}));
    }

    [[nodiscard]] const std::vector<OutgoingRequest>& Calls() const noexcept {
        return calls_;
    }
    [[nodiscard]] size_t CallCount() const noexcept {
        return calls_.size();
    }

    void Reset() {
        responses_.clear();
        calls_.clear();
    }

    Result<HttpResponse, Error> Send(const OutgoingRequest& request) override {
        calls_.push_back(request);
        if (responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                "MockHttpClient", request.path, std::nullopt,
                "No canned response queued", std::nullopt,
                ErrorCategory::Internal});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

private:
    std::deque<Result<HttpResponse, Error>> responses_;
    std::vector<OutgoingRequest> calls_;
};

} // namespace testing
} // namespace openapi_mcp
