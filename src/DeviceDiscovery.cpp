// DeviceDiscovery.cpp
#include "DeviceDiscovery.hpp"
#include "HttpsTransport.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <unordered_map>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace SmartCast {

namespace {

// Closes the socket on every return path
struct SocketGuard {
    int fd{-1};
    explicit SocketGuard(int f) : fd(f) {}
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

// "http://192.168.0.14:8008/ssdp/device-desc.xml" -> "192.168.0.14"
std::string hostFromUrl(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t end = url.find_first_of(":/", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string decodeEntities(std::string text) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}, {"&amp;", "&"},
    };
    for (const auto& entity : entities) {
        size_t pos = 0;
        const size_t len = std::strlen(entity.first);
        while ((pos = text.find(entity.first, pos)) != std::string::npos) {
            text.replace(pos, len, entity.second);
            pos += 1;
        }
    }
    return text;
}

// Text of the first <tag>...</tag>, attributes on the opening tag allowed
std::optional<std::string> findTagText(const std::string& xml, const std::string& tag) {
    const std::string open = "<" + tag;
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t after = pos + open.size();
        if (after < xml.size() && (xml[after] == '>' || xml[after] == ' ' || xml[after] == '\t')) {
            size_t gt = xml.find('>', after);
            if (gt == std::string::npos) return std::nullopt;
            size_t close = xml.find("</" + tag + ">", gt + 1);
            if (close == std::string::npos) return std::nullopt;
            return decodeEntities(trim(xml.substr(gt + 1, close - gt - 1)));
        }
        pos = after;
    }
    return std::nullopt;
}

} // anonymous namespace

std::string stripUuidPrefix(const std::string& value) {
    std::string id = trim(value);
    if (id.size() >= 5 && toLower(id.substr(0, 5)) == "uuid:") id = id.substr(5);
    size_t sep = id.find("::");
    if (sep != std::string::npos) id = id.substr(0, sep);
    return trim(id);
}

std::string buildSearchRequest(const ScanOptions& options) {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: " + options.targetHost + ":" + std::to_string(options.targetPort) + "\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "ST: " + options.searchTarget + "\r\n"
           "MX: " + std::to_string(options.maxWaitSeconds) + "\r\n"
           "\r\n";
}

bool parseSsdpReply(const std::string& text, const std::string& from, SsdpReply& out) {
    auto lines = splitLines(text);
    if (lines.empty()) return false;

    // Status line: HTTP/1.x 200 ...
    const std::string& status = lines[0];
    if (status.compare(0, 7, "HTTP/1.") != 0) return false;
    size_t sp = status.find(' ');
    if (sp == std::string::npos || status.compare(sp + 1, 3, "200") != 0) return false;

    SsdpReply reply;
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = toUpper(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if (name == "LOCATION") reply.location = value;
        else if (name == "USN") reply.usn = value;
        else if (name == "SERVER") reply.server = value;
        else if (name == "ST") reply.searchTarget = value;
    }

    if (reply.location.empty() || reply.usn.empty()) return false;
    reply.identifier = stripUuidPrefix(reply.usn);
    if (reply.identifier.empty()) return false;

    reply.host = hostFromUrl(reply.location);
    if (reply.host.empty()) reply.host = from;
    if (reply.host.empty()) return false;

    out = std::move(reply);
    return true;
}

bool parseDeviceDescription(const std::string& xml, DeviceDescription& out) {
    DeviceDescription description;
    if (auto v = findTagText(xml, "friendlyName")) description.friendlyName = *v;
    if (auto v = findTagText(xml, "manufacturer")) description.manufacturer = *v;
    if (auto v = findTagText(xml, "modelName")) description.modelName = *v;
    if (auto v = findTagText(xml, "UDN")) description.udn = *v;
    if (description.friendlyName.empty() && description.udn.empty()) return false;
    out = std::move(description);
    return true;
}

DeviceDiscovery::DeviceDiscovery(ScanOptions options)
    : m_options(std::move(options)) {
}

bool DeviceDiscovery::describe(const SsdpReply& reply, long timeoutMs, DeviceDescriptor& out) const {
    std::optional<std::string> body;
    if (m_options.fetchDescription) {
        body = m_options.fetchDescription(reply.location, timeoutMs);
    } else {
        body = httpGet(reply.location, timeoutMs);
    }
    if (!body) {
        std::cerr << "[DeviceDiscovery] Could not fetch " << reply.location << std::endl;
        return false;
    }

    DeviceDescription description;
    if (!parseDeviceDescription(*body, description)) {
        std::cerr << "[DeviceDiscovery] Malformed description at " << reply.location << std::endl;
        return false;
    }
    if (!m_options.requiredManufacturer.empty()
        && toLower(description.manufacturer) != toLower(m_options.requiredManufacturer)) {
        if (verboseLogging()) {
            std::cout << "[DeviceDiscovery] Skipping " << description.friendlyName
                      << " (manufacturer " << description.manufacturer << ")" << std::endl;
        }
        return false;
    }

    out.identifier = reply.identifier;
    out.host = reply.host;
    out.port = m_options.controlPort;
    out.friendlyName = description.friendlyName;
    out.manufacturer = description.manufacturer;
    out.model = description.modelName;
    out.descriptionUrl = reply.location;
    return true;
}

Status DeviceDiscovery::scan(std::chrono::milliseconds timeout, std::vector<DeviceDescriptor>& out) const {
    out.clear();

    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (sock.fd < 0) {
        return Status::error(ErrorKind::Discovery, std::string("socket() failed: ") + std::strerror(errno));
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(sock.fd, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        return Status::error(ErrorKind::Discovery, std::string("bind() failed: ") + std::strerror(errno));
    }

    unsigned char ttl = 2;
    if (::setsockopt(sock.fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0 && verboseLogging()) {
        std::cerr << "[DeviceDiscovery] IP_MULTICAST_TTL: " << std::strerror(errno) << std::endl;
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(m_options.targetPort);
    if (::inet_pton(AF_INET, m_options.targetHost.c_str(), &target.sin_addr) != 1) {
        return Status::error(ErrorKind::Discovery, "Invalid SSDP target address " + m_options.targetHost);
    }

    const std::string request = buildSearchRequest(m_options);
    ssize_t sent = ::sendto(sock.fd, request.data(), request.size(), 0,
                            reinterpret_cast<sockaddr*>(&target), sizeof(target));
    if (sent < 0) {
        return Status::error(ErrorKind::Discovery, std::string("sendto() failed: ") + std::strerror(errno));
    }
    if (verboseLogging()) {
        std::cout << "[DeviceDiscovery] M-SEARCH sent to " << m_options.targetHost << ":"
                  << m_options.targetPort << " (" << m_options.searchTarget << ")" << std::endl;
    }

    // Descriptors in arrival order, unique by identifier
    std::unordered_map<std::string, size_t> indexById;
    size_t dropped = 0;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remainingMs = [&deadline]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
    };

    char buffer[4096];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(sock.fd, &readfds);
        timeval tv;
        tv.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);

        int sel = ::select(sock.fd + 1, &readfds, nullptr, nullptr, &tv);
        if (sel < 0) {
            if (errno == EINTR) continue;
            return Status::error(ErrorKind::Discovery, std::string("select() failed: ") + std::strerror(errno));
        }
        if (sel == 0) break;

        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t n = ::recvfrom(sock.fd, buffer, sizeof(buffer), 0,
                               reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (n < 0) {
            if (verboseLogging()) {
                std::cerr << "[DeviceDiscovery] recvfrom() failed: " << std::strerror(errno) << std::endl;
            }
            continue;
        }

        char fromText[INET_ADDRSTRLEN] = {0};
        ::inet_ntop(AF_INET, &from.sin_addr, fromText, sizeof(fromText));

        SsdpReply reply;
        if (!parseSsdpReply(std::string(buffer, static_cast<size_t>(n)), fromText, reply)) {
            ++dropped;
            if (verboseLogging()) {
                std::cerr << "[DeviceDiscovery] Dropping malformed reply from " << fromText << std::endl;
            }
            continue;
        }

        auto known = indexById.find(reply.identifier);
        if (known != indexById.end() && out[known->second].descriptionUrl == reply.location) {
            continue;  // Repeat of a reply already described
        }

        long budget = static_cast<long>(remainingMs());
        if (budget <= 0) {
            ++dropped;
            break;
        }
        DeviceDescriptor descriptor;
        if (!describe(reply, std::min(budget, m_options.fetchTimeoutMs), descriptor)) {
            // A newer reply that cannot be described leaves the earlier descriptor in place
            ++dropped;
            continue;
        }
        if (known != indexById.end()) {
            out[known->second] = std::move(descriptor);
        } else {
            indexById.emplace(reply.identifier, out.size());
            out.push_back(std::move(descriptor));
        }
    }

    std::cout << "[DeviceDiscovery] Found " << out.size() << " device(s)";
    if (dropped > 0) std::cout << ", dropped " << dropped << " reply(s)";
    std::cout << std::endl;
    return Status::success();
}

Status DeviceDiscovery::findByUuid(const std::string& uuid,
                                   std::chrono::milliseconds timeout,
                                   std::optional<DeviceDescriptor>& out) const {
    out.reset();
    std::vector<DeviceDescriptor> devices;
    Status status = scan(timeout, devices);
    if (!status) return status;

    const std::string wanted = toLower(stripUuidPrefix(uuid));
    for (const auto& device : devices) {
        if (toLower(device.identifier) == wanted) {
            out = device;
            break;
        }
    }
    return Status::success();
}

} // namespace SmartCast
