#pragma once

#include "../types.hpp"
#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace geist {
namespace transport {

/** @brief One outbound HTTP request. */
struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};  ///< Whole-request deadline
};

/** @brief Status and body of a completed HTTP exchange (any status). */
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/** @brief Percent-encode a query component (RFC 3986 unreserved set kept). */
inline std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

/** @brief Standard base64 with '=' padding, as used by HTTP basic auth. */
inline std::string base64_encode(std::string_view value) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((value.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < value.size(); i += 3) {
        const unsigned n = (static_cast<unsigned char>(value[i]) << 16) |
                           (static_cast<unsigned char>(value[i + 1]) << 8) |
                           static_cast<unsigned char>(value[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }
    const size_t rest = value.size() - i;
    if (rest > 0) {
        unsigned n = static_cast<unsigned char>(value[i]) << 16;
        if (rest == 2) {
            n |= static_cast<unsigned char>(value[i + 1]) << 8;
        }
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += rest == 2 ? kAlphabet[(n >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

/**
 * @brief Abstract interface for the HTTP round trip.
 *
 * A transport only reports failures where no HTTP response exists at all
 * (DNS, connect, TLS, timeout) as errors. Any response that came back,
 * whatever its status, is returned as a value so callers can apply their
 * own retry policy.
 *
 * Threading model: send() blocks the calling thread for the duration of
 * the request. Implementations must be safe to call from one thread at a
 * time per instance.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Expected<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace transport
} // namespace geist
