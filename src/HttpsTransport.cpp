// HttpsTransport.cpp
#include "HttpsTransport.hpp"
#include "SmartCastProtocol.hpp"

#include <iostream>

#include <curl/curl.h>

namespace SmartCast {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t totalSize = size * nmemb;
    auto* response = static_cast<std::string*>(userp);
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

// Non-zero return makes libcurl abort with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancelFlag = static_cast<const std::atomic<bool>*>(clientp);
    return (cancelFlag && cancelFlag->load()) ? 1 : 0;
}

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // anonymous namespace

const char* toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Put:  return "PUT";
        case HttpMethod::Post: return "POST";
    }
    return "GET";
}

void CurlTransport::ensureGlobalInit() {
    static CurlGlobal global;
    (void)global;
}

CurlTransport::CurlTransport(bool verifyPeer)
    : m_verifyPeer(verifyPeer) {
    ensureGlobalInit();
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    if (request.cancelFlag && request.cancelFlag->load()) {
        response.cancelled = true;
        response.error = "Request cancelled before sending";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize CURL";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "smartcast/0.1");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Devices present self-issued certificates: keep TLS, skip chain/host checks
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_verifyPeer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_verifyPeer ? 2L : 0L);

    if (request.cancelFlag) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(request.cancelFlag));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    switch (request.method) {
        case HttpMethod::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::Put:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
        case HttpMethod::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);

    if (headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
        response.error = "Request cancelled";
        return response;
    }

    if (res != CURLE_OK) {
        response.error = std::string("CURL error: ") + curl_easy_strerror(res);
        if (verboseLogging()) {
            std::cerr << "[HttpsTransport] " << toString(request.method) << " " << request.url
                      << " failed: " << response.error << std::endl;
        }
        return response;
    }

    response.transportOk = true;
    return response;
}

std::optional<std::string> httpGet(const std::string& url, long timeoutMs) {
    CurlTransport::ensureGlobalInit();

    CURL* curl = curl_easy_init();
    if (!curl) return std::nullopt;
    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    CURLcode rc = curl_easy_perform(curl);
    long code = 0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);
    if (rc != CURLE_OK || code < 200 || code >= 300) return std::nullopt;
    return body;
}

} // namespace SmartCast
