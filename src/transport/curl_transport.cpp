#include "geist/transport/curl_transport.hpp"
#include <spdlog/spdlog.h>

namespace geist {
namespace transport {

static std::once_flag g_curl_init_flag;

void CurlTransport::initialize_global() {
    std::call_once(g_curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlTransport::CurlTransport() {
    initialize_global();
    curl_ = curl_easy_init();
}

CurlTransport::~CurlTransport() {
    if (curl_ != nullptr) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

size_t CurlTransport::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

size_t CurlTransport::header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    const size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        const size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string{} : value.substr(start);
        (*headers)[std::move(key)] = std::move(value);
    }
    return total;
}

Expected<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (curl_ == nullptr) {
        return tl::unexpected(Error{ErrorCode::TransportFailed, "CURL not initialized"});
    }

    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());

    const long timeout_ms = static_cast<long>(request.timeout.count());
    if (timeout_ms > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms / 2);
    }
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (request.method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list != nullptr) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
    }

    HttpResponse response;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    const CURLcode res = curl_easy_perform(curl_);

    if (header_list != nullptr) {
        curl_slist_free_all(header_list);
    }

    if (res != CURLE_OK) {
        spdlog::debug("{} {} failed: {}", request.method, request.url, curl_easy_strerror(res));
        return tl::unexpected(Error{
            res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::RequestTimeout : ErrorCode::TransportFailed,
            curl_easy_strerror(res),
            request.url
        });
    }

    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

std::shared_ptr<ITransport> create_transport() {
    return std::make_shared<CurlTransport>();
}

} // namespace transport
} // namespace geist
