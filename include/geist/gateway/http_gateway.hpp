#pragma once

#include "../types.hpp"
#include "../transport/itransport.hpp"
#include "completion_gateway.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace geist {
namespace gateway {

/**
 * @brief Environment variable holding the API key for a provider URL
 *
 * openai.com -> OPENAI_API_KEY, anthropic -> ANTHROPIC_API_KEY,
 * groq.com -> GROQ_API_KEY, x.ai -> GROK_API_KEY, otherwise API_KEY.
 */
std::string default_api_key_env(const std::string& base_url);

/**
 * @brief One OpenAI-compatible endpoint
 */
struct ProviderConfig {
    std::string base_url;     ///< e.g. https://api.openai.com/v1 (no trailing /chat/completions)
    std::string model;        ///< Model name sent in the payload
    std::string api_key;      ///< Explicit key; wins over the environment
    std::string api_key_env;  ///< Variable to read when api_key is empty

    Expected<void> validate() const {
        if (base_url.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidProvider, "Provider base_url cannot be empty"});
        }
        if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidProvider,
                "Provider base_url must start with http:// or https://",
                base_url
            });
        }
        if (model.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidProvider, "Provider model cannot be empty", base_url});
        }
        return {};
    }

    /** @brief api_key, else $api_key_env, else the host-derived variable; may be empty. */
    std::string resolve_api_key() const;

    /** @brief base_url + "/chat/completions". */
    std::string completions_url() const;
};

/**
 * @brief Retry and failover policy of the HTTP gateway
 */
struct GatewayConfig {
    ProviderConfig primary;
    std::vector<ProviderConfig> backups;  ///< Tried in order on qualifying failures

    int max_retries = 3;                               ///< Total attempts per provider, not retries after the first
    std::chrono::milliseconds request_timeout{30000};  ///< Deadline handed to the transport per call
    std::chrono::milliseconds retry_backoff{500};      ///< Pause between attempts on one provider
    int max_failover_depth = 1;                        ///< Backups tried automatically; 0 disables failover

    Expected<void> validate() const {
        if (auto result = primary.validate(); !result) {
            return result;
        }
        for (const auto& backup : backups) {
            if (auto result = backup.validate(); !result) {
                return result;
            }
        }
        if (max_retries <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_retries must be at least 1"});
        }
        if (request_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "request_timeout must be positive"});
        }
        if (retry_backoff.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "retry_backoff cannot be negative"});
        }
        if (max_failover_depth < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_failover_depth cannot be negative"});
        }
        return {};
    }
};

/**
 * @brief Completion gateway for OpenAI-compatible /chat/completions endpoints
 *
 * Per provider, up to max_retries attempts are made. A status >= 500 or a
 * transport failure on a provider that has a next hop in the failover chain
 * escalates at once to that hop; without one, it is retried like any other
 * non-2xx status. Any non-2xx below 500 is retried on the same provider and
 * never triggers failover.
 *
 * Thread Safety: complete() may be called concurrently only if the
 * transport allows it; the gateway itself keeps no mutable state.
 */
class HttpCompletionGateway : public ICompletionGateway {
public:
    HttpCompletionGateway(GatewayConfig config, std::shared_ptr<transport::ITransport> transport);

    /** @brief Validate config and construct. */
    static Expected<std::shared_ptr<HttpCompletionGateway>> create(
        GatewayConfig config, std::shared_ptr<transport::ITransport> transport);

    Expected<CompletionResult> complete(const CompletionRequest& request) override;

    /**
     * @brief Send the request straight to one backup, skipping the primary
     *
     * @return BackupNotConfigured if index is out of range
     */
    Expected<CompletionResult> complete_with_backup(const CompletionRequest& request, size_t index);

    const GatewayConfig& config() const { return config_; }

    /** @brief Wire payload for one provider. */
    static nlohmann::json build_payload(const ProviderConfig& provider, const CompletionRequest& request);

    /** @brief Normalize a 2xx body into a CompletionResult. */
    static Expected<CompletionResult> parse_response(const std::string& body, const ProviderConfig& provider);

private:
    /**
     * @param escalate When true, a 5xx or transport failure returns
     *        immediately so the caller can move to the next provider
     */
    Expected<CompletionResult> attempt_provider(const ProviderConfig& provider,
                                                const CompletionRequest& request,
                                                bool escalate);

    static bool qualifies_for_failover(const Error& error);

    GatewayConfig config_;
    std::shared_ptr<transport::ITransport> transport_;
};

} // namespace gateway
} // namespace geist
