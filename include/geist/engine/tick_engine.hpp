#pragma once

#include "../types.hpp"
#include "../capability/capability_registry.hpp"
#include "../gateway/completion_gateway.hpp"
#include "agent_context.hpp"
#include "function_call_protocol.hpp"
#include "prompts.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geist {
namespace engine {

/**
 * @brief Phase the engine is currently in
 */
enum class TickState {
    Idle,               ///< Between ticks
    WorldTick,          ///< Rewriting world_context
    TaskTick,           ///< Popping a task and rewriting execution_context
    ExecutionPop,       ///< Generating a function call for one execution item
    ExecutionDispatch   ///< Running a validated call against the registry
};

[[nodiscard]] inline const char* tick_state_to_string(TickState state) {
    switch (state) {
        case TickState::Idle: return "idle";
        case TickState::WorldTick: return "world";
        case TickState::TaskTick: return "task";
        case TickState::ExecutionPop: return "execution-pop";
        case TickState::ExecutionDispatch: return "execution-dispatch";
    }
    return "unknown";
}

/**
 * @brief One full world -> task -> execution cycle over an AgentContext
 *
 * The engine is backend-agnostic: it only sees ICompletionGateway, so local
 * and remote models drive the same control flow.
 *
 * A tick:
 * - World (only when enabled): each completion choice becomes one world item
 * - Task: pops the next queued task and asks for a '|'-delimited action list,
 *   which replaces execution_context
 * - Execution: for each item, asks for a function call, regenerating on
 *   invalid output up to max_function_call_attempts total, then dispatches
 * - Clears execution_context and returns the dispatch results
 *
 * Any failure ends the tick; phases that already ran are not rolled back.
 *
 * Thread Safety: tick() is not reentrant. The owning Agent serializes it.
 */
class TickEngine {
public:
    static constexpr int kDefaultFunctionCallAttempts = 3;

    TickEngine(
        std::shared_ptr<AgentContext> context,
        std::shared_ptr<gateway::ICompletionGateway> gateway,
        std::shared_ptr<capability::CapabilityRegistry> registry
    )
        : context_(std::move(context))
        , gateway_(std::move(gateway))
        , registry_(std::move(registry))
    {}

    /**
     * @brief Override the system prompt (default: agent preamble plus the
     *        registry description). An empty string sends no system message.
     */
    void set_system_prompt(std::string prompt) {
        system_prompt_ = std::move(prompt);
    }

    /**
     * @brief Set total completion attempts per execution item (default: 3)
     */
    void set_max_function_call_attempts(int attempts) {
        max_function_call_attempts_ = attempts > 0 ? attempts : 1;
    }

    int max_function_call_attempts() const { return max_function_call_attempts_; }

    TickState state() const { return state_.load(std::memory_order_acquire); }

    /**
     * @brief Run one cycle
     *
     * @return Results of every dispatched call in execution order, or the
     *         error that ended the tick (TaskQueueEmpty when nothing is queued)
     */
    Expected<std::vector<nlohmann::json>> tick() {
        struct IdleOnExit {
            std::atomic<TickState>& state;
            ~IdleOnExit() { state.store(TickState::Idle, std::memory_order_release); }
        } idle_on_exit{state_};

        if (context_->world_processing_enabled()) {
            if (auto world = tick_world(); !world) {
                return tl::unexpected(world.error());
            }
        }

        if (auto tasks = tick_tasks(); !tasks) {
            return tl::unexpected(tasks.error());
        }

        return tick_execution();
    }

    /**
     * @brief Split a task-tick answer into execution items
     *
     * Items are separated by '|', trimmed, and empty items dropped.
     */
    static std::vector<std::string> split_items(const std::string& text) {
        std::vector<std::string> items;
        size_t start = 0;
        while (start <= text.size()) {
            size_t end = text.find('|', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            std::string item = trim(text.substr(start, end - start));
            if (!item.empty()) {
                items.push_back(std::move(item));
            }
            start = end + 1;
        }
        return items;
    }

private:
    Expected<void> tick_world() {
        enter(TickState::WorldTick);

        const std::string aggregate = context_->aggregate(true, true, false);
        auto result = complete(std::string(prompts::kWorldTick) + aggregate);
        if (!result) {
            return tl::unexpected(result.error());
        }

        auto items = result->contents();
        spdlog::info("world phase produced {} item(s)", items.size());
        context_->replace_world(std::move(items));
        return {};
    }

    Expected<void> tick_tasks() {
        enter(TickState::TaskTick);

        const std::string aggregate = context_->aggregate(true, true, true);
        auto task = context_->pop_next_task();
        if (!task) {
            return tl::unexpected(task.error());
        }

        auto result = complete(std::string(prompts::kTaskTick) + aggregate);
        if (!result) {
            return tl::unexpected(result.error());
        }

        auto items = split_items(result->first_content().value_or(""));
        if (items.empty()) {
            items.push_back(*task);
        }
        spdlog::info("task phase: '{}' -> {} execution item(s)", *task, items.size());
        context_->replace_execution(std::move(items));
        return {};
    }

    Expected<std::vector<nlohmann::json>> tick_execution() {
        std::vector<nlohmann::json> results;
        const auto items = context_->execution_context();
        results.reserve(items.size());

        for (const auto& item : items) {
            enter(TickState::ExecutionPop);
            auto call = generate_function_call(item);
            if (!call) {
                return tl::unexpected(call.error());
            }

            enter(TickState::ExecutionDispatch);
            auto dispatched = registry_->dispatch(*call);
            if (!dispatched) {
                spdlog::error("dispatch {}.{} failed: {}",
                              call->capability_name, call->action_name, dispatched.error().to_string());
                return tl::unexpected(dispatched.error());
            }
            results.push_back(std::move(*dispatched));
        }

        context_->replace_execution({});
        return results;
    }

    Expected<FunctionCall> generate_function_call(const std::string& item) {
        const std::string prompt =
            prompts::execution_tick() + "task: " + item + context_->aggregate(true, true, true);

        std::string last_payload;
        for (int attempt = 1; attempt <= max_function_call_attempts_; ++attempt) {
            auto result = complete(prompt);
            if (!result) {
                return tl::unexpected(result.error());
            }

            last_payload = result->first_content().value_or("");
            auto call = FunctionCallProtocol::parse(last_payload);
            if (call) {
                return call;
            }
            spdlog::warn("invalid function call for '{}' (attempt {}/{}): {}",
                         item, attempt, max_function_call_attempts_, call.error().message);
        }

        return tl::unexpected(Error{
            ErrorCode::FunctionCallRetriesExhausted,
            "No valid function call after " + std::to_string(max_function_call_attempts_) +
                " attempts for task: " + item,
            last_payload
        });
    }

    Expected<CompletionResult> complete(std::string user_prompt) {
        CompletionRequest request;
        request.system_prompt = system_prompt_.has_value()
            ? *system_prompt_
            : prompts::system_prompt(*registry_);
        request.user_prompt = std::move(user_prompt);
        request.settings = context_->settings().generation;

        auto result = gateway_->complete(request);
        if (!result) {
            spdlog::error("{} phase completion failed: {}",
                          tick_state_to_string(state()), result.error().to_string());
        }
        return result;
    }

    void enter(TickState state) {
        state_.store(state, std::memory_order_release);
        spdlog::debug("tick state -> {}", tick_state_to_string(state));
    }

    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        const size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) {
            return {};
        }
        const size_t last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    std::shared_ptr<AgentContext> context_;
    std::shared_ptr<gateway::ICompletionGateway> gateway_;
    std::shared_ptr<capability::CapabilityRegistry> registry_;
    std::optional<std::string> system_prompt_;
    int max_function_call_attempts_ = kDefaultFunctionCallAttempts;
    std::atomic<TickState> state_{TickState::Idle};
};

} // namespace engine
} // namespace geist
