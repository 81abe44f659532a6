#pragma once

#include "itransport.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <curl/curl.h>

namespace geist {
namespace transport {

/**
 * @brief Production transport implemented with a reusable libcurl easy handle
 *
 * The handle is reset before every request, so per-request options never
 * leak between calls. Requests on one instance are serialized.
 */
class CurlTransport : public ITransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;
    CurlTransport(CurlTransport&&) = delete;
    CurlTransport& operator=(CurlTransport&&) = delete;

    Expected<HttpResponse> send(const HttpRequest& request) override;

    /** @brief Initialize libcurl's global state once per process. */
    static void initialize_global();

private:
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata);

    CURL* curl_ = nullptr;
    std::mutex mutex_;
};

/** @brief Factory returning the production transport. */
std::shared_ptr<ITransport> create_transport();

} // namespace transport
} // namespace geist
