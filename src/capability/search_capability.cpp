#include "geist/capability/builtin.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace geist {
namespace capability {

Expected<SearchSettings> SearchSettings::from_json(const nlohmann::json& j) {
    SearchSettings settings;
    if (!j.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SearchAdapter settings must be an object"});
    }
    if (auto it = j.find("base_url"); it != j.end()) {
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "SearchAdapter.base_url must be a non-empty string"});
        }
        settings.base_url = it->get<std::string>();
        while (!settings.base_url.empty() && settings.base_url.back() == '/') {
            settings.base_url.pop_back();
        }
    }
    if (auto it = j.find("timeout_ms"); it != j.end()) {
        if (!it->is_number_integer() || it->get<long long>() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "SearchAdapter.timeout_ms must be a positive integer"});
        }
        settings.timeout = std::chrono::milliseconds(it->get<long long>());
    }
    return settings;
}

SearchCapability::SearchCapability(SearchSettings settings, std::shared_ptr<transport::ITransport> transport)
    : Capability(kName)
    , settings_(std::move(settings))
    , transport_(std::move(transport))
{
    if (!transport_) {
        throw std::invalid_argument("SearchAdapter requires a transport");
    }

    auto& table = actions_table();
    table.register_action("search", "Run a web search and return the raw result page",
                          {"search_term"},
                          [this](const std::string& search_term) { return search(search_term); });
    table.register_action("get", "Fetch the content at a URL",
                          {"url"},
                          [this](const std::string& url) { return get(url); });
}

std::string SearchCapability::search(const std::string& search_term) const {
    transport::HttpRequest request;
    request.method = "GET";
    request.url = settings_.base_url + "/search?q=" + transport::url_encode(search_term);
    request.timeout = settings_.timeout;

    auto response = transport_->send(request);
    if (!response) {
        spdlog::warn("SearchAdapter search failed: {}", response.error().to_string());
        return kSearchFailed;
    }
    if (response->status_code != 200) {
        spdlog::warn("SearchAdapter search returned HTTP {}", response->status_code);
        return kSearchFailed;
    }
    return std::move(response->body);
}

std::string SearchCapability::get(const std::string& url) const {
    transport::HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.timeout = settings_.timeout;

    auto response = transport_->send(request);
    if (!response) {
        spdlog::warn("SearchAdapter get failed: {}", response.error().to_string());
        return kGetFailed;
    }
    if (response->status_code != 200) {
        spdlog::warn("SearchAdapter get {} returned HTTP {}", url, response->status_code);
        return kGetFailed;
    }
    return std::move(response->body);
}

} // namespace capability
} // namespace geist
