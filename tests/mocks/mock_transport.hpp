#pragma once

#include "geist/transport/itransport.hpp"
#include <deque>
#include <mutex>
#include <vector>

namespace geist {
namespace testing {

/**
 * @brief Mock transport for unit testing
 *
 * Replays queued outcomes in order and records every request it receives.
 * Supports:
 * - Canned responses of any status
 * - Transport-level failure injection (no response at all)
 * - A default response once the queue is drained
 */
class MockTransport : public transport::ITransport {
public:
    // Response control
    std::deque<Expected<transport::HttpResponse>> outcomes;
    transport::HttpResponse default_response{200, "{}", {}};

    // State tracking
    std::vector<transport::HttpRequest> requests;

    void push_response(long status, std::string body) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes.push_back(transport::HttpResponse{status, std::move(body), {}});
    }

    void push_failure(ErrorCode code = ErrorCode::TransportFailed,
                      std::string message = "Could not resolve host") {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes.push_back(tl::unexpected(Error{code, std::move(message)}));
    }

    Expected<transport::HttpResponse> send(const transport::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (outcomes.empty()) {
            return default_response;
        }
        auto outcome = std::move(outcomes.front());
        outcomes.pop_front();
        return outcome;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests.size();
    }

private:
    mutable std::mutex mutex_;
};

} // namespace testing
} // namespace geist
