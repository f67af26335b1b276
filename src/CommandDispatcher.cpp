// CommandDispatcher.cpp
#include "CommandDispatcher.hpp"

#include <iostream>

namespace SmartCast {

namespace {

std::string snippet(const std::string& body, size_t limit = 120) {
    if (body.size() <= limit) return body;
    return body.substr(0, limit) + "...";
}

// STATUS.RESULT of an envelope, upper-cased; empty if absent
std::string resultCode(const nlohmann::json& envelope) {
    if (!envelope.is_object()) return "";
    auto status = envelope.find("STATUS");
    if (status == envelope.end() || !status->is_object()) return "";
    auto result = status->find("RESULT");
    if (result == status->end() || !result->is_string()) return "";
    return toUpper(result->get<std::string>());
}

std::string resultDetail(const nlohmann::json& envelope) {
    auto status = envelope.find("STATUS");
    if (status == envelope.end() || !status->is_object()) return "";
    auto detail = status->find("DETAIL");
    if (detail == status->end() || !detail->is_string()) return "";
    return detail->get<std::string>();
}

} // anonymous namespace

CommandDispatcher::CommandDispatcher(std::shared_ptr<Transport> transport, std::string host, std::uint16_t port)
    : m_transport(std::move(transport)), m_host(std::move(host)), m_port(port) {
}

std::string CommandDispatcher::urlFor(const std::string& path) const {
    std::string url = "https://" + m_host + ":" + std::to_string(m_port);
    if (path.empty() || path.front() != '/') url += '/';
    return url + path;
}

CommandResponse CommandDispatcher::send(HttpMethod method,
                                        const std::string& path,
                                        const std::optional<nlohmann::json>& body,
                                        const std::optional<std::string>& token,
                                        const RequestOptions& options) const {
    CommandRequest request;
    request.method = method;
    request.path = path;
    request.body = body;
    request.authToken = token;
    return send(request, options);
}

CommandResponse CommandDispatcher::send(const CommandRequest& request, const RequestOptions& options) const {
    HttpRequest http;
    http.method = request.method;
    http.url = urlFor(request.path);
    http.timeoutMs = options.timeoutMs;
    http.cancelFlag = options.cancelFlag;

    if (request.body) {
        http.body = request.body->dump();
        http.headers.emplace_back("Content-Type: application/json");
    }
    if (request.authToken && !request.authToken->empty()) {
        http.headers.emplace_back("AUTH: " + *request.authToken);
    }

    if (verboseLogging()) {
        std::cout << "[CommandDispatcher] " << toString(request.method) << " " << http.url
                  << (request.authToken ? " (auth " + redactToken(*request.authToken) + ")" : std::string())
                  << (http.body.empty() ? std::string() : " body=" + http.body) << std::endl;
    }

    ++m_requestCount;
    HttpResponse raw = m_transport->perform(http);
    CommandResponse response = interpret(raw);

    if (verboseLogging()) {
        std::cout << "[CommandDispatcher]   -> " << response.status.describe()
                  << " http=" << response.httpStatus << std::endl;
    }
    return response;
}

CommandResponse CommandDispatcher::interpret(const HttpResponse& raw) {
    CommandResponse response;
    response.httpStatus = raw.statusCode;

    if (raw.cancelled) {
        response.status = Status::error(ErrorKind::Transport, raw.error.empty() ? "Request cancelled" : raw.error, "cancelled");
        response.status.cancelled = true;
        return response;
    }
    if (!raw.transportOk) {
        response.status = Status::error(ErrorKind::Transport, raw.error.empty() ? "Transport failure" : raw.error);
        return response;
    }

    nlohmann::json envelope = nlohmann::json::parse(raw.body, nullptr, false);
    bool parsed = !envelope.is_discarded();

    if (raw.statusCode < 200 || raw.statusCode >= 300) {
        // Prefer the device's own result code when it sent an envelope
        std::string code = parsed ? resultCode(envelope) : "";
        if (code.empty() || code == ResultCodes::Success) code = "http-" + std::to_string(raw.statusCode);
        response.status = Status::error(ErrorKind::Device,
                                        "HTTP " + std::to_string(raw.statusCode) + ": " + snippet(raw.body),
                                        code);
        return response;
    }

    if (!parsed || !envelope.is_object()) {
        response.status = Status::error(ErrorKind::Protocol, "Response is not a JSON object: " + snippet(raw.body));
        return response;
    }

    std::string code = resultCode(envelope);
    if (code.empty()) {
        response.status = Status::error(ErrorKind::Protocol, "Response has no STATUS.RESULT");
        return response;
    }
    if (code != ResultCodes::Success) {
        std::string detail = resultDetail(envelope);
        response.status = Status::error(ErrorKind::Device,
                                        detail.empty() ? describeResultCode(code) : detail,
                                        code);
        return response;
    }

    response.body = std::move(envelope);
    return response;
}

Status CommandDispatcher::itemField(const nlohmann::json& body, const char* field, nlohmann::json& out) {
    auto item = body.find("ITEM");
    if (item == body.end() || !item->is_object()) {
        return Status::error(ErrorKind::Protocol, "Response has no ITEM object");
    }
    auto value = item->find(field);
    if (value == item->end() || value->is_null()) {
        return Status::error(ErrorKind::Protocol, std::string("ITEM has no ") + field);
    }
    out = *value;
    return Status::success();
}

Status CommandDispatcher::items(const nlohmann::json& body, nlohmann::json& out) {
    auto list = body.find("ITEMS");
    if (list == body.end() || !list->is_array()) {
        return Status::error(ErrorKind::Protocol, "Response has no ITEMS array");
    }
    out = *list;
    return Status::success();
}

Status CommandDispatcher::firstItem(const nlohmann::json& body, nlohmann::json& out) {
    nlohmann::json list;
    Status status = items(body, list);
    if (!status) return status;
    if (list.empty() || !list[0].is_object()) {
        return Status::error(ErrorKind::Protocol, "ITEMS is empty");
    }
    out = list[0];
    return Status::success();
}

Status CommandDispatcher::firstItemValue(const nlohmann::json& body, nlohmann::json& out) {
    nlohmann::json item;
    Status status = firstItem(body, item);
    if (!status) return status;
    auto value = item.find("VALUE");
    if (value == item.end()) {
        return Status::error(ErrorKind::Protocol, "ITEMS[0] has no VALUE");
    }
    out = *value;
    return Status::success();
}

} // namespace SmartCast
