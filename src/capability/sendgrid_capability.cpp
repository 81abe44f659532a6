#include "geist/capability/builtin.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace geist {
namespace capability {

namespace {

const nlohmann::json& param_or_null(const nlohmann::json& params, const char* key) {
    static const nlohmann::json kNull;
    auto it = params.find(key);
    return it == params.end() ? kNull : *it;
}

} // namespace

Expected<void> SendGridSettings::validate() const {
    if (api_key.empty()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            "SendGridAdapter has no API key",
            "Set api_key or the " + api_key_env + " environment variable"
        });
    }
    if (from_email.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SendGridAdapter.from_email is required"});
    }
    if (endpoint.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SendGridAdapter.endpoint cannot be empty"});
    }
    return {};
}

Expected<SendGridSettings> SendGridSettings::from_json(const nlohmann::json& j) {
    SendGridSettings settings;
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SendGridAdapter settings must be an object"});
    }

    const std::pair<const char*, std::string*> string_fields[] = {
        {"api_key", &settings.api_key},
        {"api_key_env", &settings.api_key_env},
        {"from_email", &settings.from_email},
        {"from_name", &settings.from_name},
        {"endpoint", &settings.endpoint}
    };
    for (const auto& [key, field] : string_fields) {
        auto it = j.find(key);
        if (it == j.end()) {
            continue;
        }
        if (!it->is_string()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                std::string("SendGridAdapter.") + key + " must be a string"
            });
        }
        *field = it->get<std::string>();
    }

    if (auto it = j.find("timeout_ms"); it != j.end()) {
        if (!it->is_number_integer() || it->get<long long>() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "SendGridAdapter.timeout_ms must be a positive integer"});
        }
        settings.timeout = std::chrono::milliseconds(it->get<long long>());
    }

    if (settings.api_key.empty() && !settings.api_key_env.empty()) {
        if (const char* env = std::getenv(settings.api_key_env.c_str())) {
            settings.api_key = env;
        }
    }

    if (auto valid = settings.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return settings;
}

SendGridCapability::SendGridCapability(SendGridSettings settings, std::shared_ptr<transport::ITransport> transport)
    : Capability(kName)
    , settings_(std::move(settings))
    , transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("SendGridAdapter requires a transport");
    }

    auto& table = actions_table();

    table.register_action_with_schema(
        "send_email",
        "Send a plain text or HTML email",
        nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"to_email", {{"type", "string"}}},
                {"subject", {{"type", "string"}}},
                {"content", {{"type", "string"}}},
                {"to_name", {{"type", "string"}}}
            }},
            {"required", {"to_email", "subject", "content"}}
        },
        [this](const nlohmann::json& params) -> Expected<nlohmann::json> {
            std::optional<std::string> to_name;
            if (const auto& n = param_or_null(params, "to_name"); n.is_string()) {
                to_name = n.get<std::string>();
            }
            return send_email(params.at("to_email").get<std::string>(),
                              params.at("subject").get<std::string>(),
                              params.at("content").get<std::string>(),
                              to_name);
        });

    table.register_action_with_schema(
        "send_template_email",
        "Send an email rendered from a markdown or HTML template with {{token}} replacement",
        nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"to_email", {{"type", "string"}}},
                {"subject", {{"type", "string"}}},
                {"template", {{"type", "string"}}},
                {"tokens", {{"type", "object"}}},
                {"to_name", {{"type", "string"}}},
                {"is_markdown", {{"type", "boolean"}}}
            }},
            {"required", {"to_email", "subject", "template"}}
        },
        [this](const nlohmann::json& params) -> Expected<nlohmann::json> {
            std::optional<std::string> to_name;
            if (const auto& n = param_or_null(params, "to_name"); n.is_string()) {
                to_name = n.get<std::string>();
            }
            const auto& tokens = param_or_null(params, "tokens");
            const auto& markdown = param_or_null(params, "is_markdown");
            return send_template_email(params.at("to_email").get<std::string>(),
                                       params.at("subject").get<std::string>(),
                                       params.at("template").get<std::string>(),
                                       tokens.is_object() ? tokens : nlohmann::json::object(),
                                       to_name,
                                       markdown.is_boolean() ? markdown.get<bool>() : true);
        });
}

std::string SendGridCapability::replace_tokens(const std::string& content, const nlohmann::json& tokens) {
    if (!tokens.is_object() || tokens.empty()) {
        return content;
    }

    static const std::regex kToken(R"(\{\{\s*([^}]+?)\s*\}\})");

    std::string out;
    auto begin = std::sregex_iterator(content.begin(), content.end(), kToken);
    auto last = content.cbegin();
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        out.append(last, match[0].first);

        auto value = tokens.find(match[1].str());
        if (value == tokens.end()) {
            out += match[0].str();
        } else if (value->is_string()) {
            out += value->get<std::string>();
        } else {
            out += value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        last = match[0].second;
    }
    out.append(last, content.cend());
    return out;
}

std::string SendGridCapability::markdown_to_html(const std::string& markdown) {
    static const std::regex kBold(R"(\*\*(.+?)\*\*)");
    static const std::regex kItalic(R"(\*(.+?)\*)");
    static const std::regex kLink(R"(\[([^\]]+)\]\(([^)]+)\))");

    // Headers are line-anchored
    std::string html;
    html.reserve(markdown.size());
    size_t pos = 0;
    while (pos <= markdown.size()) {
        size_t eol = markdown.find('\n', pos);
        if (eol == std::string::npos) {
            eol = markdown.size();
        }
        const std::string line = markdown.substr(pos, eol - pos);
        int level = 0;
        for (const char* prefix : {"# ", "## ", "### "}) {
            ++level;
            const size_t len = std::char_traits<char>::length(prefix);
            if (line.size() > len && line.compare(0, len, prefix) == 0) {
                html += "<h" + std::to_string(level) + ">" + line.substr(len) +
                        "</h" + std::to_string(level) + ">";
                level = -1;
                break;
            }
        }
        if (level != -1) {
            html += line;
        }
        if (eol < markdown.size()) {
            html += '\n';
        }
        pos = eol + 1;
    }

    html = std::regex_replace(html, kBold, "<strong>$1</strong>");
    html = std::regex_replace(html, kItalic, "<em>$1</em>");
    html = std::regex_replace(html, kLink, "<a href=\"$2\">$1</a>");

    std::string out;
    out.reserve(html.size());
    for (char c : html) {
        if (c == '\n') {
            out += "<br>";
        } else {
            out += c;
        }
    }
    return out;
}

bool SendGridCapability::looks_like_html(const std::string& content) {
    return content.find('<') != std::string::npos && content.find('>') != std::string::npos;
}

std::string SendGridCapability::send_email(const std::string& to_email, const std::string& subject,
                                           const std::string& content,
                                           const std::optional<std::string>& to_name) const {
    const nlohmann::json payload{
        {"personalizations", nlohmann::json::array({
            {
                {"to", nlohmann::json::array({
                    {{"email", to_email}, {"name", to_name.value_or(to_email)}}
                })},
                {"subject", subject}
            }
        })},
        {"from", {{"email", settings_.from_email}, {"name", settings_.from_name}}},
        {"content", nlohmann::json::array({
            {
                {"type", looks_like_html(content) ? "text/html" : "text/plain"},
                {"value", content}
            }
        })}
    };

    transport::HttpRequest request;
    request.method = "POST";
    request.url = settings_.endpoint;
    request.headers["Authorization"] = "Bearer " + settings_.api_key;
    request.headers["Content-Type"] = "application/json";
    request.body = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    request.timeout = settings_.timeout;

    auto response = transport_->send(request);
    if (!response) {
        spdlog::warn("SendGridAdapter request failed: {}", response.error().to_string());
        return "Error sending email: " + response.error().message;
    }
    if (response->status_code == 202) {
        spdlog::info("SendGridAdapter sent email to {}", to_email);
        return kSent;
    }
    return "Error sending email: " + std::to_string(response->status_code) + " - " + response->body;
}

std::string SendGridCapability::send_template_email(const std::string& to_email, const std::string& subject,
                                                    const std::string& template_text,
                                                    const nlohmann::json& tokens,
                                                    const std::optional<std::string>& to_name,
                                                    bool is_markdown) const {
    const std::string processed_subject = replace_tokens(subject, tokens);
    std::string processed_content = replace_tokens(template_text, tokens);
    if (is_markdown) {
        processed_content = markdown_to_html(processed_content);
    }
    return send_email(to_email, processed_subject, processed_content, to_name);
}

} // namespace capability
} // namespace geist
