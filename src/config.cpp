#include "geist/config.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>

namespace geist {

namespace {

using nlohmann::json;

Error invalid_key(const std::string& key, const std::string& what) {
    return Error{ErrorCode::InvalidConfig, "Config key '" + key + "' " + what, key};
}

Error missing_key(const std::string& key) {
    return invalid_key(key, "is required");
}

/**
 * Typed optional lookups; a present key of the wrong type is an error,
 * an absent key leaves the target untouched.
 */
Expected<void> read_string(const json& obj, const std::string& prefix, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        return tl::unexpected(invalid_key(prefix + key, "must be a string"));
    }
    out = it->get<std::string>();
    return {};
}

Expected<void> read_int(const json& obj, const std::string& prefix, const char* key, int& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_number_integer()) {
        return tl::unexpected(invalid_key(prefix + key, "must be an integer"));
    }
    out = it->get<int>();
    return {};
}

Expected<void> read_float(const json& obj, const std::string& prefix, const char* key, float& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_number()) {
        return tl::unexpected(invalid_key(prefix + key, "must be a number"));
    }
    out = it->get<float>();
    return {};
}

Expected<void> read_bool(const json& obj, const std::string& prefix, const char* key, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_boolean()) {
        return tl::unexpected(invalid_key(prefix + key, "must be a boolean"));
    }
    out = it->get<bool>();
    return {};
}

Expected<void> read_millis(const json& obj, const std::string& prefix, const char* key,
                           std::chrono::milliseconds& out) {
    int value = static_cast<int>(out.count());
    if (auto r = read_int(obj, prefix, key, value); !r) {
        return r;
    }
    out = std::chrono::milliseconds(value);
    return {};
}

Expected<void> require_object(const json& value, const std::string& key) {
    if (!value.is_object()) {
        return tl::unexpected(invalid_key(key, "must be an object"));
    }
    return {};
}

Expected<GenerationSettings> parse_generation(const json& j) {
    const std::string prefix = "agent.generation.";
    GenerationSettings g;
    Expected<void> steps[] = {
        read_int(j, prefix, "max_tokens", g.max_tokens),
        read_int(j, prefix, "n", g.n),
        read_float(j, prefix, "temperature", g.temperature),
        read_float(j, prefix, "top_p", g.top_p),
        read_float(j, prefix, "frequency_penalty", g.frequency_penalty),
        read_float(j, prefix, "presence_penalty", g.presence_penalty),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }

    if (auto it = j.find("stop"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            return tl::unexpected(invalid_key(prefix + "stop", "must be a string"));
        }
        g.stop = it->get<std::string>();
    }
    return g;
}

Expected<AgentSettings> parse_agent(const json& j) {
    const std::string prefix = "agent.";
    AgentSettings agent;
    if (auto r = require_object(j, "agent"); !r) {
        return tl::unexpected(r.error());
    }

    Expected<void> steps[] = {
        read_string(j, prefix, "name", agent.name),
        read_string(j, prefix, "version", agent.version),
        read_string(j, prefix, "description", agent.description),
        read_bool(j, prefix, "include_world_processing", agent.include_world_processing),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }

    if (auto it = j.find("generation"); it != j.end()) {
        if (auto r = require_object(*it, prefix + "generation"); !r) {
            return tl::unexpected(r.error());
        }
        auto generation = parse_generation(*it);
        if (!generation) {
            return tl::unexpected(generation.error());
        }
        agent.generation = std::move(*generation);
    }
    return agent;
}

Expected<gateway::ProviderConfig> parse_provider(const json& j, const std::string& key,
                                                 const gateway::ProviderConfig* inherit) {
    if (auto r = require_object(j, key); !r) {
        return tl::unexpected(r.error());
    }

    gateway::ProviderConfig provider;
    if (inherit != nullptr) {
        provider.base_url = inherit->base_url;
        provider.model = inherit->model;
    }

    const std::string prefix = key + ".";
    Expected<void> steps[] = {
        read_string(j, prefix, "base_url", provider.base_url),
        read_string(j, prefix, "model", provider.model),
        read_string(j, prefix, "api_key", provider.api_key),
        read_string(j, prefix, "api_key_env", provider.api_key_env),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }

    // A backup without credentials of its own keeps the primary's
    if (inherit != nullptr && provider.api_key.empty() && provider.api_key_env.empty()) {
        provider.api_key = inherit->api_key;
        provider.api_key_env = inherit->api_key_env.empty()
            ? gateway::default_api_key_env(inherit->base_url)
            : inherit->api_key_env;
    }

    if (provider.base_url.empty()) {
        return tl::unexpected(missing_key(prefix + "base_url"));
    }
    if (provider.model.empty()) {
        return tl::unexpected(missing_key(prefix + "model"));
    }
    return provider;
}

Expected<gateway::GatewayConfig> parse_gateway(const json& j) {
    if (auto r = require_object(j, "gateway"); !r) {
        return tl::unexpected(r.error());
    }

    gateway::GatewayConfig config;
    auto primary_it = j.find("primary");
    if (primary_it == j.end()) {
        return tl::unexpected(missing_key("gateway.primary"));
    }
    auto primary = parse_provider(*primary_it, "gateway.primary", nullptr);
    if (!primary) {
        return tl::unexpected(primary.error());
    }
    config.primary = std::move(*primary);

    if (auto it = j.find("backups"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return tl::unexpected(invalid_key("gateway.backups", "must be an array"));
        }
        for (size_t i = 0; i < it->size(); ++i) {
            auto backup = parse_provider((*it)[i], "gateway.backups[" + std::to_string(i) + "]", &config.primary);
            if (!backup) {
                return tl::unexpected(backup.error());
            }
            config.backups.push_back(std::move(*backup));
        }
    }

    const std::string prefix = "gateway.";
    Expected<void> steps[] = {
        read_int(j, prefix, "max_retries", config.max_retries),
        read_millis(j, prefix, "request_timeout_ms", config.request_timeout),
        read_millis(j, prefix, "retry_backoff_ms", config.retry_backoff),
        read_int(j, prefix, "max_failover_depth", config.max_failover_depth),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }
    return config;
}

Expected<gateway::LocalModelConfig> parse_local_model(const json& j) {
    if (auto r = require_object(j, "local_model"); !r) {
        return tl::unexpected(r.error());
    }

    gateway::LocalModelConfig config;
    const std::string prefix = "local_model.";
    Expected<void> steps[] = {
        read_string(j, prefix, "model_path", config.model_path),
        read_int(j, prefix, "context_size", config.context_size),
        read_int(j, prefix, "n_gpu_layers", config.n_gpu_layers),
        read_bool(j, prefix, "use_mmap", config.use_mmap),
        read_bool(j, prefix, "use_mlock", config.use_mlock),
        read_int(j, prefix, "seed", config.seed),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }
    if (config.model_path.empty()) {
        return tl::unexpected(missing_key("local_model.model_path"));
    }
    return config;
}

} // namespace

bool is_known_log_level(const std::string& level) {
    static const std::array<const char*, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    for (const char* known : kLevels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

Expected<void> RuntimeConfig::validate() const {
    if (auto result = agent.validate(); !result) {
        return result;
    }
    if (!gateway.has_value() && !local_model.has_value()) {
        return tl::unexpected(missing_key("gateway"));
    }
    if (gateway.has_value()) {
        if (auto result = gateway->validate(); !result) {
            return result;
        }
    }
    if (local_model.has_value()) {
        if (auto result = local_model->validate(); !result) {
            return result;
        }
    }
    if (!capabilities.is_object()) {
        return tl::unexpected(invalid_key("capabilities", "must be an object"));
    }
    if (session.empty()) {
        return tl::unexpected(invalid_key("session", "cannot be empty"));
    }
    if (!is_known_log_level(log_level)) {
        return tl::unexpected(invalid_key("log_level", "must be one of trace, debug, info, warn, error, critical, off"));
    }
    return {};
}

Expected<RuntimeConfig> parse_runtime_config(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "Config document must be a JSON object"});
    }

    RuntimeConfig config;

    if (auto it = doc.find("agent"); it != doc.end()) {
        auto agent = parse_agent(*it);
        if (!agent) {
            return tl::unexpected(agent.error());
        }
        config.agent = std::move(*agent);
    }

    if (auto it = doc.find("gateway"); it != doc.end() && !it->is_null()) {
        auto gw = parse_gateway(*it);
        if (!gw) {
            return tl::unexpected(gw.error());
        }
        config.gateway = std::move(*gw);
    }

    if (auto it = doc.find("local_model"); it != doc.end() && !it->is_null()) {
        auto local = parse_local_model(*it);
        if (!local) {
            return tl::unexpected(local.error());
        }
        config.local_model = std::move(*local);
    }

    if (auto it = doc.find("capabilities"); it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            return tl::unexpected(invalid_key("capabilities", "must be an object"));
        }
        config.capabilities = *it;
    }

    Expected<void> steps[] = {
        read_string(doc, "", "database_path", config.database_path),
        read_string(doc, "", "session", config.session),
        read_string(doc, "", "log_level", config.log_level),
    };
    for (auto& step : steps) {
        if (!step) {
            return tl::unexpected(step.error());
        }
    }

    if (auto it = doc.find("system_prompt"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) {
            return tl::unexpected(invalid_key("system_prompt", "must be a string"));
        }
        config.system_prompt = it->get<std::string>();
    }

    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return config;
}

Expected<RuntimeConfig> load_runtime_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Cannot open config file", path});
    }

    auto doc = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (doc.is_discarded()) {
        return tl::unexpected(Error{ErrorCode::ConfigFileUnreadable, "Config file is not valid JSON", path});
    }

    spdlog::debug("Loaded config {}", path);
    return parse_runtime_config(doc);
}

} // namespace geist
