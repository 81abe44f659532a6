#include "geist/capability/builtin.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace geist {
namespace capability {

namespace {

void resolve_from_env(std::string& value, const std::string& env_name) {
    if (!value.empty() || env_name.empty()) {
        return;
    }
    if (const char* env = std::getenv(env_name.c_str())) {
        value = env;
    }
}

} // namespace

Expected<void> SmsSettings::validate() const {
    if (account_sid.empty()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            "SMSAdapter has no account SID",
            "Set account_sid or the " + account_sid_env + " environment variable"
        });
    }
    if (auth_token.empty()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            "SMSAdapter has no auth token",
            "Set auth_token or the " + auth_token_env + " environment variable"
        });
    }
    if (from_number.empty()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            "SMSAdapter has no source number",
            "Set from_number or the " + from_number_env + " environment variable"
        });
    }
    if (endpoint.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SMSAdapter.endpoint cannot be empty"});
    }
    return {};
}

Expected<SmsSettings> SmsSettings::from_json(const nlohmann::json& j) {
    SmsSettings settings;
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SMSAdapter settings must be an object"});
    }

    const std::pair<const char*, std::string*> string_fields[] = {
        {"account_sid", &settings.account_sid},
        {"account_sid_env", &settings.account_sid_env},
        {"auth_token", &settings.auth_token},
        {"auth_token_env", &settings.auth_token_env},
        {"from_number", &settings.from_number},
        {"from_number_env", &settings.from_number_env},
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
                std::string("SMSAdapter.") + key + " must be a string"
            });
        }
        *field = it->get<std::string>();
    }
    while (!settings.endpoint.empty() && settings.endpoint.back() == '/') {
        settings.endpoint.pop_back();
    }

    if (auto it = j.find("timeout_ms"); it != j.end()) {
        if (!it->is_number_integer() || it->get<long long>() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "SMSAdapter.timeout_ms must be a positive integer"});
        }
        settings.timeout = std::chrono::milliseconds(it->get<long long>());
    }

    resolve_from_env(settings.account_sid, settings.account_sid_env);
    resolve_from_env(settings.auth_token, settings.auth_token_env);
    resolve_from_env(settings.from_number, settings.from_number_env);

    if (auto valid = settings.validate(); !valid) {
        return tl::unexpected(valid.error());
    }
    return settings;
}

SmsCapability::SmsCapability(SmsSettings settings, std::shared_ptr<transport::ITransport> transport)
    : Capability(kName)
    , settings_(std::move(settings))
    , transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("SMSAdapter requires a transport");
    }

    auto& table = actions_table();
    table.register_action("send_text", "Send a text message to a phone number",
                          {"message", "number"},
                          [this](const std::string& message, const std::string& number) {
                              return send(message, number, std::nullopt);
                          });
    table.register_action("send_media", "Send a picture message with a public media URL",
                          {"message", "number", "media_url"},
                          [this](const std::string& message, const std::string& number,
                                 const std::string& media_url) {
                              return send(message, number, media_url);
                          });
}

std::string SmsCapability::messages_url() const {
    return settings_.endpoint + "/Accounts/" + transport::url_encode(settings_.account_sid) + "/Messages.json";
}

std::string SmsCapability::send(const std::string& message, const std::string& number,
                                const std::optional<std::string>& media_url) const {
    transport::HttpRequest request;
    request.method = "POST";
    request.url = messages_url();
    request.headers["Authorization"] =
        "Basic " + transport::base64_encode(settings_.account_sid + ":" + settings_.auth_token);
    request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    request.body = "To=" + transport::url_encode(number) +
                   "&From=" + transport::url_encode(settings_.from_number) +
                   "&Body=" + transport::url_encode(message);
    if (media_url) {
        request.body += "&MediaUrl=" + transport::url_encode(*media_url);
    }
    request.timeout = settings_.timeout;

    auto response = transport_->send(request);
    if (!response) {
        spdlog::warn("SMSAdapter request failed: {}", response.error().to_string());
        return "Error sending text: " + response.error().message;
    }
    if (response->status_code != 201) {
        return "Error sending text: " + std::to_string(response->status_code) + " - " + response->body;
    }

    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("sid") || !body["sid"].is_string()) {
        return "Error sending text: response carried no message SID";
    }
    spdlog::info("SMSAdapter sent message {} to {}", body["sid"].get<std::string>(), number);
    return body["sid"].get<std::string>();
}

} // namespace capability
} // namespace geist
