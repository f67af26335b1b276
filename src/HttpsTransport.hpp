// HttpsTransport.hpp
// HTTP(S) transport seam. CurlTransport talks to devices with self-issued
// certificates; tests substitute their own Transport.
#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace SmartCast {

enum class HttpMethod {
    Get,
    Put,
    Post
};

const char* toString(HttpMethod method);

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    std::string body;
    long timeoutMs{3000};
    const std::atomic<bool>* cancelFlag{nullptr}; // Aborts the transfer when set
};

struct HttpResponse {
    bool transportOk{false}; // false => no HTTP exchange completed
    bool cancelled{false};
    long statusCode{0};
    std::string body;
    std::string error;       // Transport failure text
};

class Transport {
public:
    virtual ~Transport() = default;

    // Must be safe to call from several threads at once.
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlTransport : public Transport {
public:
    // verifyPeer=false accepts the self-signed certificates SmartCast devices ship with
    explicit CurlTransport(bool verifyPeer = false);

    HttpResponse perform(const HttpRequest& request) override;

    // One curl_global_init per process
    static void ensureGlobalInit();

private:
    bool m_verifyPeer;
};

// Plain GET used for fetching SSDP device-description documents.
std::optional<std::string> httpGet(const std::string& url, long timeoutMs = 3000);

} // namespace SmartCast
