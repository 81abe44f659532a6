#pragma once

#include "../types.hpp"

namespace geist {
namespace gateway {

/**
 * @brief Abstract interface for obtaining completions
 *
 * The tick engine depends only on this interface, so the same control flow
 * drives a remote OpenAI-compatible provider, a local llama.cpp model, or a
 * test double.
 *
 * Design principles:
 * - Synchronous: complete() blocks until a result or a terminal error
 * - Stateless toward the agent: never touches AgentContext
 * - Resilience (retry, failover) lives behind the interface
 */
class ICompletionGateway {
public:
    virtual ~ICompletionGateway() = default;

    /**
     * @brief Obtain one completion
     *
     * @param request System prompt, user prompt and generation settings
     * @return Normalized result with at least one assistant choice, or error
     */
    virtual Expected<CompletionResult> complete(const CompletionRequest& request) = 0;

    /**
     * @brief Release provider resources on phase-out
     *
     * A later complete() reacquires whatever it needs.
     */
    virtual void release() {}
};

} // namespace gateway
} // namespace geist
