#pragma once

#include "../types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace geist {

/**
 * @brief Point-in-time copy of the three context buffers
 *
 * Exchanged with the persistence sink on phase-out / phase-in.
 */
struct ContextSnapshot {
    std::vector<std::string> world_context;
    std::vector<std::string> task_context;
    std::vector<std::string> execution_context;

    bool operator==(const ContextSnapshot& other) const {
        return world_context == other.world_context &&
               task_context == other.task_context &&
               execution_context == other.execution_context;
    }

    bool operator!=(const ContextSnapshot& other) const {
        return !(*this == other);
    }
};

namespace engine {

inline constexpr const char* kWorldContextLabel = "WORLD_CONTEXT:";
inline constexpr const char* kTaskContextLabel = "TASK_CONTEXT:";
inline constexpr const char* kExecutionContextLabel = "EXECUTION_CONTEXT:";

/**
 * @brief The unit of mutable agent state: world, task and execution buffers
 *
 * Buffers are only ever replaced wholesale; there is no partial update.
 * The task buffer is additionally consumed from the front by pop_next_task().
 *
 * Thread Safety: Internally synchronized via mutex so that a supervisor can
 * snapshot the context while the owning agent ticks.
 */
class AgentContext {
public:
    explicit AgentContext(AgentSettings settings, std::string session_handle = {})
        : settings_(std::move(settings))
        , session_handle_(std::move(session_handle))
    {}

    AgentContext(const AgentContext&) = delete;
    AgentContext& operator=(const AgentContext&) = delete;

    /**
     * @brief Concatenate the requested buffers under their labels
     *
     * Labels always appear in world, task, execution order no matter which
     * subset is requested. Items inside a buffer are joined by newline and
     * consecutive sections are separated by a newline. Buffers whose flag is
     * false contribute nothing, not even their label.
     */
    std::string aggregate(bool include_world, bool include_task, bool include_execution) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string out;
        auto append_section = [&out](const char* label, const std::vector<std::string>& items) {
            if (!out.empty()) {
                out += '\n';
            }
            out += label;
            out += join(items, "\n");
        };

        if (include_world) {
            append_section(kWorldContextLabel, world_context_);
        }
        if (include_task) {
            append_section(kTaskContextLabel, task_context_);
        }
        if (include_execution) {
            append_section(kExecutionContextLabel, execution_context_);
        }
        return out;
    }

    void replace_world(std::vector<std::string> items) {
        std::lock_guard<std::mutex> lock(mutex_);
        world_context_ = std::move(items);
    }

    void replace_task(std::vector<std::string> items) {
        std::lock_guard<std::mutex> lock(mutex_);
        task_context_ = std::move(items);
    }

    void replace_execution(std::vector<std::string> items) {
        std::lock_guard<std::mutex> lock(mutex_);
        execution_context_ = std::move(items);
    }

    /** @brief Queue a task behind the existing ones. */
    void append_task(std::string task) {
        std::lock_guard<std::mutex> lock(mutex_);
        task_context_.push_back(std::move(task));
    }

    /**
     * @brief Remove and return the first task
     *
     * @return The task, or a TaskQueueEmpty state error when nothing is queued
     */
    Expected<std::string> pop_next_task() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (task_context_.empty()) {
            return tl::unexpected(Error{
                ErrorCode::TaskQueueEmpty,
                "No task queued for execution"
            });
        }
        std::string task = std::move(task_context_.front());
        task_context_.erase(task_context_.begin());
        return task;
    }

    std::vector<std::string> world_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return world_context_;
    }

    std::vector<std::string> task_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return task_context_;
    }

    std::vector<std::string> execution_context() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return execution_context_;
    }

    ContextSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ContextSnapshot{world_context_, task_context_, execution_context_};
    }

    /** @brief Replace all three buffers from a persisted snapshot. */
    void restore(ContextSnapshot snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        world_context_ = std::move(snapshot.world_context);
        task_context_ = std::move(snapshot.task_context);
        execution_context_ = std::move(snapshot.execution_context);
    }

    AgentSettings settings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    void set_settings(AgentSettings settings) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(settings);
    }

    bool world_processing_enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.include_world_processing;
    }

    const std::string& session_handle() const { return session_handle_; }

private:
    static std::string join(const std::vector<std::string>& items, const char* separator) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                out += separator;
            }
            out += items[i];
        }
        return out;
    }

    AgentSettings settings_;
    std::string session_handle_;
    std::vector<std::string> world_context_;
    std::vector<std::string> task_context_;
    std::vector<std::string> execution_context_;
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace geist
