// CommandDispatcher.hpp
// Turns a logical SmartCast command into an HTTPS request and interprets the
// STATUS/ITEM/ITEMS envelope the device answers with.
#pragma once

#include "HttpsTransport.hpp"
#include "SmartCastProtocol.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace SmartCast {

struct RequestOptions {
    long timeoutMs{Defaults::RequestTimeoutMs};
    const std::atomic<bool>* cancelFlag{nullptr};
};

struct CommandRequest {
    HttpMethod method{HttpMethod::Get};
    std::string path;
    std::optional<nlohmann::json> body;
    std::optional<std::string> authToken;
};

struct CommandResponse {
    Status status;
    long httpStatus{0};
    nlohmann::json body; // Parsed envelope, null on transport/protocol failure

    bool ok() const { return status.ok(); }
};

class CommandDispatcher {
public:
    CommandDispatcher(std::shared_ptr<Transport> transport, std::string host, std::uint16_t port);

    // Never retries. The token is attached as an AUTH header only when present.
    CommandResponse send(const CommandRequest& request, const RequestOptions& options = RequestOptions()) const;
    CommandResponse send(HttpMethod method,
                         const std::string& path,
                         const std::optional<nlohmann::json>& body,
                         const std::optional<std::string>& token,
                         const RequestOptions& options = RequestOptions()) const;

    const std::string& host() const { return m_host; }
    std::uint16_t port() const { return m_port; }
    std::string urlFor(const std::string& path) const;

    // Number of requests handed to the transport so far
    std::size_t requestCount() const { return m_requestCount.load(); }

    // Maps a raw transport result onto the error taxonomy.
    static CommandResponse interpret(const HttpResponse& raw);

    // Envelope accessors; each returns ProtocolError when the shape is wrong.
    static Status itemField(const nlohmann::json& body, const char* field, nlohmann::json& out);
    static Status items(const nlohmann::json& body, nlohmann::json& out);
    static Status firstItem(const nlohmann::json& body, nlohmann::json& out);
    static Status firstItemValue(const nlohmann::json& body, nlohmann::json& out);

private:
    std::shared_ptr<Transport> m_transport;
    std::string m_host;
    std::uint16_t m_port;
    mutable std::atomic<std::size_t> m_requestCount{0};
};

} // namespace SmartCast
