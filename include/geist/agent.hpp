#pragma once

#include "types.hpp"
#include "config.hpp"
#include "capability/capability_registry.hpp"
#include "engine/agent_context.hpp"
#include "engine/tick_engine.hpp"
#include "gateway/completion_gateway.hpp"
#include "persistence/snapshot_store.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace geist {

/**
 * @brief One agent: context, tick engine and lifecycle around them
 *
 * The agent owns its AgentContext and TickEngine; the gateway, registry and
 * snapshot sink are shared so several agents can use the same provider
 * plumbing while keeping their state separate.
 *
 * Thread Model:
 * - tick() may be called from any thread; calls are serialized
 * - start() spawns a ticker thread that calls tick() every interval
 * - A State error (empty task queue) leaves the ticker idling; any other
 *   error stops it and is kept in last_error()
 *
 * Example Usage:
 * @code
 * auto agent = Agent::create(config, gateway, registry, store);
 * if (!agent) {
 *     std::cerr << agent.error().to_string() << std::endl;
 *     return 1;
 * }
 * (*agent)->initialize("write a haiku about autumn");
 * auto results = (*agent)->tick();
 * @endcode
 */
class Agent {
public:
    using Clock = std::chrono::system_clock;
    using ResultCallback = std::function<void(const std::vector<nlohmann::json>&)>;

    /**
     * @param sink Optional; without it phase_out() and phase_in() skip persistence
     */
    static Expected<std::unique_ptr<Agent>> create(
        const RuntimeConfig& config,
        std::shared_ptr<gateway::ICompletionGateway> gateway,
        std::shared_ptr<capability::CapabilityRegistry> registry,
        std::shared_ptr<persistence::ISnapshotSink> sink = nullptr
    ) {
        if (auto result = config.agent.validate(); !result) {
            return tl::unexpected(result.error());
        }
        if (!gateway) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent requires a completion gateway"});
        }
        if (!registry) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent requires a capability registry"});
        }
        if (config.session.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Agent session cannot be empty"});
        }

        return std::unique_ptr<Agent>(new Agent(config, std::move(gateway), std::move(registry), std::move(sink)));
    }

    ~Agent() {
        shutdown();
    }

    // Non-copyable and non-movable (ticker thread captures `this`)
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;
    Agent(Agent&&) = delete;
    Agent& operator=(Agent&&) = delete;

    /**
     * @brief Queue the agent's task, if one is given
     */
    void initialize(std::optional<std::string> task = std::nullopt) {
        if (task.has_value() && !task->empty()) {
            spdlog::info("[{}] queued task: {}", context_->settings().name, *task);
            context_->append_task(std::move(*task));
        }
    }

    /**
     * @brief Run one world -> task -> execution cycle
     *
     * @return Dispatch results, or the error that ended the tick
     */
    Expected<std::vector<nlohmann::json>> tick() {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        auto result = engine_.tick();
        if (result) {
            ticks_completed_.fetch_add(1, std::memory_order_relaxed);
            beat();
        }
        return result;
    }

    /**
     * @brief Stop ticking, persist the context and release the gateway
     */
    Expected<void> phase_out() {
        shutdown();

        if (sink_) {
            std::lock_guard<std::mutex> lock(tick_mutex_);
            if (auto saved = sink_->save(session_, context_->snapshot()); !saved) {
                return tl::unexpected(saved.error());
            }
        } else {
            spdlog::debug("No snapshot sink; phase-out keeps nothing for session '{}'", session_);
        }

        gateway_->release();
        spdlog::info("[{}] phased out", session_);
        return {};
    }

    /**
     * @brief Restore the latest snapshot of this session
     *
     * @return true if a snapshot was restored, false if none exists
     */
    Expected<bool> phase_in() {
        if (!sink_) {
            return false;
        }

        auto latest = sink_->load_latest(session_);
        if (!latest) {
            return tl::unexpected(latest.error());
        }
        if (!latest->has_value()) {
            spdlog::info("[{}] no snapshot to restore", session_);
            return false;
        }

        std::lock_guard<std::mutex> lock(tick_mutex_);
        context_->restore(std::move(**latest));
        spdlog::info("[{}] restored snapshot ({} task(s) queued)", session_, context_->task_context().size());
        return true;
    }

    /**
     * @brief Tick in the background every interval until stop()
     *
     * @param on_results Invoked on the ticker thread after each successful tick
     * @return AgentAlreadyRunning if the ticker is active
     */
    Expected<void> start(std::chrono::milliseconds interval, ResultCallback on_results = nullptr) {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_.load(std::memory_order_acquire)) {
            return tl::unexpected(Error{ErrorCode::AgentAlreadyRunning, "Agent is already ticking", session_});
        }
        if (interval.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Tick interval cannot be negative"});
        }

        // A ticker that stopped itself on error still needs joining
        if (ticker_.joinable()) {
            ticker_.join();
        }

        {
            std::lock_guard<std::mutex> state_lock(state_mutex_);
            last_error_.reset();
        }
        running_.store(true, std::memory_order_release);
        ticker_ = std::thread([this, interval, on_results = std::move(on_results)]() {
            ticker_loop(interval, on_results);
        });
        spdlog::info("[{}] ticking every {} ms", session_, interval.count());
        return {};
    }

    /**
     * @brief Stop background ticking and wait for the ticker to exit
     *
     * @return AgentNotRunning if the ticker was not active
     */
    Expected<void> stop() {
        if (!running_.load(std::memory_order_acquire)) {
            shutdown();
            return tl::unexpected(Error{ErrorCode::AgentNotRunning, "Agent is not ticking", session_});
        }
        shutdown();
        return {};
    }

    bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    /** @brief Time of the last successful or idle tick. */
    std::optional<Clock::time_point> last_heartbeat() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return last_heartbeat_;
    }

    uint64_t ticks_completed() const {
        return ticks_completed_.load(std::memory_order_relaxed);
    }

    /** @brief Error that stopped the ticker, if any. */
    std::optional<Error> last_error() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return last_error_;
    }

    const std::string& session() const { return session_; }

    std::shared_ptr<engine::AgentContext> context() const { return context_; }

    engine::TickEngine& engine() { return engine_; }

private:
    Agent(const RuntimeConfig& config,
          std::shared_ptr<gateway::ICompletionGateway> gateway,
          std::shared_ptr<capability::CapabilityRegistry> registry,
          std::shared_ptr<persistence::ISnapshotSink> sink)
        : session_(config.session)
        , context_(std::make_shared<engine::AgentContext>(config.agent, config.session))
        , gateway_(std::move(gateway))
        , registry_(std::move(registry))
        , sink_(std::move(sink))
        , engine_(context_, gateway_, registry_)
    {
        if (config.system_prompt) {
            engine_.set_system_prompt(*config.system_prompt);
        }
    }

    void ticker_loop(std::chrono::milliseconds interval, const ResultCallback& on_results) {
        while (running_.load(std::memory_order_acquire)) {
            // Nothing may escape the thread body; a throwing tick or callback stops the ticker
            try {
                auto result = tick();
                if (result) {
                    if (on_results) {
                        on_results(*result);
                    }
                } else if (result.error().category() == ErrorCategory::State) {
                    spdlog::debug("[{}] idle: {}", session_, result.error().message);
                    beat();
                } else {
                    stop_ticker(result.error());
                    break;
                }
            } catch (const std::exception& e) {
                stop_ticker(Error{ErrorCode::Unknown, std::string("Ticker raised: ") + e.what()});
                break;
            }

            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, interval, [this]() {
                return !running_.load(std::memory_order_acquire);
            });
        }
    }

    void stop_ticker(const Error& error) {
        spdlog::error("[{}] ticker stopped: {}", session_, error.to_string());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            last_error_ = error;
        }
        running_.store(false, std::memory_order_release);
    }

    /** @brief Signal the ticker and join it; safe to call repeatedly. */
    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        {
            std::lock_guard<std::mutex> wake_lock(wake_mutex_);
            running_.store(false, std::memory_order_release);
        }
        wake_.notify_all();
        if (ticker_.joinable()) {
            ticker_.join();
        }
    }

    void beat() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_heartbeat_ = Clock::now();
    }

    std::string session_;
    std::shared_ptr<engine::AgentContext> context_;
    std::shared_ptr<gateway::ICompletionGateway> gateway_;
    std::shared_ptr<capability::CapabilityRegistry> registry_;
    std::shared_ptr<persistence::ISnapshotSink> sink_;
    engine::TickEngine engine_;

    // Serializes tick(), phase_out() and phase_in()
    std::mutex tick_mutex_;

    // Ticker thread
    std::mutex lifecycle_mutex_;
    std::thread ticker_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;

    // Supervision state
    mutable std::mutex state_mutex_;
    std::optional<Clock::time_point> last_heartbeat_;
    std::optional<Error> last_error_;
    std::atomic<uint64_t> ticks_completed_{0};
};

} // namespace geist
