#pragma once

#include "geist/gateway/completion_gateway.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace geist {
namespace testing {

/**
 * @brief Mock completion gateway for unit testing
 *
 * Each complete() consumes one queued outcome. When the queue is drained
 * the gateway answers with default_response, or fails if it is empty.
 * Every request is recorded for verification.
 */
class MockGateway : public gateway::ICompletionGateway {
public:
    // Response control
    std::string default_response;
    std::deque<Expected<CompletionResult>> outcomes;

    // State tracking
    std::vector<CompletionRequest> requests;
    int release_calls = 0;

    /** @brief Queue a single-choice answer. */
    void push_text(std::string content) {
        push_choices({std::move(content)});
    }

    /** @brief Queue one answer carrying several choices. */
    void push_choices(std::vector<std::string> contents) {
        CompletionResult result;
        result.provider = "mock";
        result.model = "mock-model";
        for (auto& content : contents) {
            result.choices.push_back(Message::assistant(std::move(content)));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes.push_back(std::move(result));
    }

    void push_error(Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes.push_back(tl::unexpected(std::move(error)));
    }

    Expected<CompletionResult> complete(const CompletionRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (!outcomes.empty()) {
            auto outcome = std::move(outcomes.front());
            outcomes.pop_front();
            return outcome;
        }
        if (default_response.empty()) {
            return tl::unexpected(Error{ErrorCode::TransportFailed, "MockGateway has no queued response"});
        }
        CompletionResult result;
        result.provider = "mock";
        result.model = "mock-model";
        result.choices.push_back(Message::assistant(default_response));
        return result;
    }

    void release() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++release_calls;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests.size();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outcomes.size();
    }

private:
    mutable std::mutex mutex_;
};

} // namespace testing
} // namespace geist
