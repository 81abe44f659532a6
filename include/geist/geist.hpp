#pragma once

/**
 * @file geist.hpp
 * @brief Main convenience header for the Geist tick runtime
 *
 * Include this single header to get access to all public Geist APIs.
 *
 * Quick Start:
 * @code
 * #include <geist/geist.hpp>
 *
 * int main() {
 *     auto config = geist::load_runtime_config("geist.json");
 *     if (!config) {
 *         std::cerr << "Error: " << config.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto transport = geist::transport::create_transport();
 *     auto gateway = geist::gateway::HttpCompletionGateway::create(*config->gateway, transport);
 *     auto registry = geist::capability::CapabilityRegistry::from_table(
 *         geist::capability::builtin_capabilities(transport), config->capabilities);
 *
 *     auto agent = geist::Agent::create(*config, *gateway, *registry);
 *     (*agent)->initialize("write a haiku about autumn");
 *
 *     auto results = (*agent)->tick();
 *     if (!results) {
 *         std::cerr << "Error: " << results.error().to_string() << std::endl;
 *     }
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - geist::Agent: lifecycle around one context (tick, phase-out/in, ticker)
 * - geist::engine::TickEngine: the world -> task -> execution cycle
 * - geist::gateway::ICompletionGateway: remote or local completion provider
 * - geist::capability::CapabilityRegistry: what the model may call
 * - geist::Error: Structured error handling
 */

// Core types
#include "types.hpp"
#include "config.hpp"

// Public API
#include "agent.hpp"

// Gateways and transport
#include "gateway/completion_gateway.hpp"
#include "gateway/http_gateway.hpp"
#include "transport/itransport.hpp"
#include "transport/curl_transport.hpp"

// Capabilities
#include "capability/capability.hpp"
#include "capability/capability_registry.hpp"
#include "capability/builtin.hpp"

// Engine components (optional, for advanced usage)
#include "engine/agent_context.hpp"
#include "engine/function_call_protocol.hpp"
#include "engine/tick_engine.hpp"

// Persistence
#include "persistence/snapshot_store.hpp"
