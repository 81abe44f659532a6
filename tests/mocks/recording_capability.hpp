#pragma once

#include "geist/capability/capability.hpp"
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geist {
namespace testing {

/**
 * @brief Capability that records every invocation
 *
 * Actions:
 * - write(text): records and returns "wrote: <text>"
 * - add(a, b): integer sum
 * - fail(): throws, surfacing as ActionFailed
 */
class RecordingCapability : public capability::Capability {
public:
    explicit RecordingCapability(std::string name = "Recorder")
        : Capability(std::move(name))
    {
        actions_table().register_action("write", "Record a line of text", {"text"},
            [this](std::string text) {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.emplace_back("write", nlohmann::json{{"text", text}});
                return "wrote: " + text;
            });

        actions_table().register_action("add", "Add two integers", {"a", "b"},
            [this](int a, int b) {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.emplace_back("add", nlohmann::json{{"a", a}, {"b", b}});
                return a + b;
            });

        actions_table().register_action("fail", "Always throws", {},
            [this]() -> std::string {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    calls_.emplace_back("fail", nlohmann::json::object());
                }
                throw std::runtime_error("recorder failure");
            });
    }

    std::vector<std::pair<std::string, nlohmann::json>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, nlohmann::json>> calls_;
};

} // namespace testing
} // namespace geist
