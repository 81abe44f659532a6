#include "geist/gateway/http_gateway.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace geist {
namespace gateway {

namespace {

constexpr const char* kCompletionsPath = "/chat/completions";

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string truncate_body(const std::string& body) {
    constexpr size_t kMaxBody = 512;
    if (body.size() <= kMaxBody) {
        return body;
    }
    return body.substr(0, kMaxBody) + "...";
}

int int_field(const nlohmann::json& obj, const char* key, int fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_number_integer()) ? it->get<int>() : fallback;
}

} // namespace

std::string default_api_key_env(const std::string& base_url) {
    if (base_url.find("openai.com") != std::string::npos) return "OPENAI_API_KEY";
    if (base_url.find("anthropic") != std::string::npos) return "ANTHROPIC_API_KEY";
    if (base_url.find("groq.com") != std::string::npos) return "GROQ_API_KEY";
    if (base_url.find("x.ai") != std::string::npos) return "GROK_API_KEY";
    return "API_KEY";
}

std::string ProviderConfig::resolve_api_key() const {
    if (!api_key.empty()) {
        return api_key;
    }
    const std::string env_name = api_key_env.empty() ? default_api_key_env(base_url) : api_key_env;
    if (const char* value = std::getenv(env_name.c_str())) {
        return value;
    }
    return {};
}

std::string ProviderConfig::completions_url() const {
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (!ends_with(url, kCompletionsPath)) {
        url += kCompletionsPath;
    }
    return url;
}

HttpCompletionGateway::HttpCompletionGateway(GatewayConfig config, std::shared_ptr<transport::ITransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
{}

Expected<std::shared_ptr<HttpCompletionGateway>> HttpCompletionGateway::create(
    GatewayConfig config, std::shared_ptr<transport::ITransport> transport) {
    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    if (!transport) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "HTTP gateway requires a transport"});
    }
    return std::make_shared<HttpCompletionGateway>(std::move(config), std::move(transport));
}

nlohmann::json HttpCompletionGateway::build_payload(const ProviderConfig& provider,
                                                    const CompletionRequest& request) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& message : request.messages()) {
        messages.push_back({
            {"role", role_to_string(message.role)},
            {"content", message.content}
        });
    }

    const auto& s = request.settings;
    nlohmann::json payload{
        {"messages", std::move(messages)},
        {"model", provider.model},
        {"max_tokens", s.max_tokens},
        {"n", s.n},
        {"temperature", s.temperature},
        {"top_p", s.top_p},
        {"frequency_penalty", s.frequency_penalty},
        {"presence_penalty", s.presence_penalty}
    };
    if (s.stop.has_value()) {
        payload["stop"] = *s.stop;
    }
    return payload;
}

Expected<CompletionResult> HttpCompletionGateway::parse_response(const std::string& body,
                                                                 const ProviderConfig& provider) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::MalformedProviderResponse,
            "Provider response is not a JSON object",
            truncate_body(body)
        });
    }

    auto choices_it = doc.find("choices");
    if (choices_it == doc.end() || !choices_it->is_array() || choices_it->empty()) {
        return tl::unexpected(Error{
            ErrorCode::MalformedProviderResponse,
            "Provider response has no choices",
            truncate_body(body)
        });
    }

    CompletionResult result;
    result.provider = provider.base_url;
    result.model = provider.model;

    for (const auto& choice : *choices_it) {
        if (!choice.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::MalformedProviderResponse,
                "Choice is not an object",
                truncate_body(body)
            });
        }
        std::string content;
        if (auto msg = choice.find("message"); msg != choice.end() && msg->is_object()) {
            if (auto c = msg->find("content"); c != msg->end() && c->is_string()) {
                content = c->get<std::string>();
            }
        } else if (auto text = choice.find("text"); text != choice.end() && text->is_string()) {
            content = text->get<std::string>();
        } else {
            return tl::unexpected(Error{
                ErrorCode::MalformedProviderResponse,
                "Choice carries neither message nor text",
                truncate_body(body)
            });
        }
        result.choices.push_back(Message::assistant(std::move(content)));
    }

    if (auto model = doc.find("model"); model != doc.end() && model->is_string()) {
        result.model = model->get<std::string>();
    }
    if (auto id = doc.find("id"); id != doc.end() && id->is_string()) {
        result.id = id->get<std::string>();
    }
    if (auto usage = doc.find("usage"); usage != doc.end() && usage->is_object()) {
        result.usage.prompt_tokens = int_field(*usage, "prompt_tokens", 0);
        result.usage.completion_tokens = int_field(*usage, "completion_tokens", 0);
        result.usage.total_tokens = int_field(*usage, "total_tokens",
            result.usage.prompt_tokens + result.usage.completion_tokens);
    }
    return result;
}

bool HttpCompletionGateway::qualifies_for_failover(const Error& error) {
    return error.code == ErrorCode::ProviderServerError ||
           error.code == ErrorCode::TransportFailed ||
           error.code == ErrorCode::RequestTimeout;
}

Expected<CompletionResult> HttpCompletionGateway::attempt_provider(const ProviderConfig& provider,
                                                                   const CompletionRequest& request,
                                                                   bool escalate) {
    transport::HttpRequest http;
    http.method = "POST";
    http.url = provider.completions_url();
    http.headers["Content-Type"] = "application/json";
    // A backup with no key of its own reuses the primary's
    std::string key = provider.resolve_api_key();
    if (key.empty() && &provider != &config_.primary) {
        key = config_.primary.resolve_api_key();
    }
    if (!key.empty()) {
        http.headers["Authorization"] = "Bearer " + key;
    }
    http.body = build_payload(provider, request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    http.timeout = config_.request_timeout;

    std::string last_failure;
    for (int attempt = 1; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 1 && config_.retry_backoff.count() > 0) {
            std::this_thread::sleep_for(config_.retry_backoff);
        }

        spdlog::debug("POST {} (attempt {}/{})", http.url, attempt, config_.max_retries);
        const auto start = std::chrono::steady_clock::now();
        auto response = transport_->send(http);

        if (!response) {
            spdlog::warn("Request to {} failed on attempt {}: {}",
                         http.url, attempt, response.error().message);
            if (escalate) {
                Error error = response.error();
                error.context = http.url;
                return tl::unexpected(std::move(error));
            }
            last_failure = response.error().to_string();
            continue;
        }

        if (response->ok()) {
            auto result = parse_response(response->body, provider);
            if (result) {
                result->latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
            }
            return result;
        }

        spdlog::warn("Request to {} returned status {} on attempt {}: {}",
                     http.url, response->status_code, attempt, truncate_body(response->body));

        if (response->status_code >= 500 && escalate) {
            return tl::unexpected(Error{
                ErrorCode::ProviderServerError,
                "Provider returned status " + std::to_string(response->status_code),
                truncate_body(response->body)
            });
        }
        last_failure = "Status: " + std::to_string(response->status_code) +
                       ", Response: " + truncate_body(response->body);
    }

    return tl::unexpected(Error{
        ErrorCode::ProviderRequestFailed,
        "API request to " + http.url + " failed after " + std::to_string(config_.max_retries) + " attempts",
        last_failure
    });
}

Expected<CompletionResult> HttpCompletionGateway::complete(const CompletionRequest& request) {
    const size_t chain = std::min(config_.backups.size(),
                                  static_cast<size_t>(config_.max_failover_depth));

    auto result = attempt_provider(config_.primary, request, chain > 0);
    if (result || chain == 0 || !qualifies_for_failover(result.error())) {
        return result;
    }

    Error last = result.error();
    for (size_t index = 0; index < chain; ++index) {
        const bool has_next = index + 1 < chain;
        spdlog::warn("Failing over to backup {} ({}) after: {}",
                     index, config_.backups[index].base_url, last.message);

        auto backup = attempt_provider(config_.backups[index], request, has_next);
        if (backup) {
            return backup;
        }
        last = backup.error();
        if (has_next && !qualifies_for_failover(last)) {
            return backup;
        }
    }

    return tl::unexpected(Error{
        ErrorCode::FailoverExhausted,
        "All providers failed (primary and " + std::to_string(chain) + " backup(s))",
        last.to_string()
    });
}

Expected<CompletionResult> HttpCompletionGateway::complete_with_backup(const CompletionRequest& request,
                                                                       size_t index) {
    if (index >= config_.backups.size()) {
        return tl::unexpected(Error{
            ErrorCode::BackupNotConfigured,
            "No backup provider at index " + std::to_string(index),
            std::to_string(config_.backups.size()) + " backup(s) configured"
        });
    }
    return attempt_provider(config_.backups[index], request, false);
}

} // namespace gateway
} // namespace geist
