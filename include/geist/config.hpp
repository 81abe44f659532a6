#pragma once

#include "types.hpp"
#include "gateway/http_gateway.hpp"
#include "gateway/llama_gateway.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace geist {

/**
 * @brief Everything needed to assemble one agent runtime
 *
 * Either a remote gateway or a local model must be configured. When both
 * are present the caller decides which one to build.
 *
 * File layout (unknown keys are ignored):
 * @code
 * {
 *   "agent":   {"name": "geist", "include_world_processing": false,
 *               "generation": {"max_tokens": 16, "n": 1, "temperature": 1.0, ...}},
 *   "gateway": {"primary": {"base_url": "https://api.openai.com/v1", "model": "gpt-4o"},
 *               "backups": [{"base_url": "...", "model": "..."}],
 *               "max_retries": 3, "request_timeout_ms": 30000,
 *               "retry_backoff_ms": 500, "max_failover_depth": 1},
 *   "local_model":   {"model_path": "model.gguf", "context_size": 4096},
 *   "capabilities":  {"LogAdapter": {}, "MarkdownFileAdapter": {"file_root": "notes"}},
 *   "database_path": "geist.db",
 *   "session":       "default",
 *   "log_level":     "info",
 *   "system_prompt": "..."
 * }
 * @endcode
 */
struct RuntimeConfig {
    AgentSettings agent;
    std::optional<gateway::GatewayConfig> gateway;
    std::optional<gateway::LocalModelConfig> local_model;
    nlohmann::json capabilities = default_capabilities();  ///< Capability name -> settings object
    std::string database_path;                              ///< Empty disables persistence
    std::string session = "default";
    std::string log_level = "info";
    std::optional<std::string> system_prompt;

    /** @brief Capabilities enabled when the config names none. */
    static nlohmann::json default_capabilities() {
        return nlohmann::json{
            {"LogAdapter", nlohmann::json::object()},
            {"MarkdownFileAdapter", nlohmann::json::object()},
            {"SearchAdapter", nlohmann::json::object()}
        };
    }

    Expected<void> validate() const;
};

/**
 * @brief Build a RuntimeConfig from a parsed document
 *
 * @return InvalidConfig naming the offending key on a missing required key
 *         or a value of the wrong type
 */
Expected<RuntimeConfig> parse_runtime_config(const nlohmann::json& doc);

/**
 * @brief Read and parse a JSON config file
 *
 * @return ConfigFileUnreadable if the file cannot be opened or is not JSON
 */
Expected<RuntimeConfig> load_runtime_config(const std::string& path);

/** @brief Recognized log level names: trace, debug, info, warn, error, critical, off. */
bool is_known_log_level(const std::string& level);

} // namespace geist
