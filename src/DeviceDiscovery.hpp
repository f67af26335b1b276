// DeviceDiscovery.hpp
// SSDP (DIAL) discovery of SmartCast devices on the local network.
#pragma once

#include "SmartCastProtocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace SmartCast {

struct DeviceDescriptor {
    std::string identifier;     // Device UUID, stable per physical device
    std::string host;           // IPv4 address
    std::uint16_t port{Defaults::ControlPort};
    std::string friendlyName;
    std::string manufacturer;
    std::string model;
    std::string descriptionUrl;

    std::string address() const { return host + ":" + std::to_string(port); }
};

// Headers of one M-SEARCH reply
struct SsdpReply {
    std::string location;
    std::string usn;
    std::string server;
    std::string searchTarget;
    std::string identifier;     // From USN, "uuid:<id>::..." -> "<id>"
    std::string host;           // From LOCATION, falls back to the sender
};

// Fields read from the LOCATION device-description XML
struct DeviceDescription {
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    std::string udn;
};

// Returns the body at url, or nullopt on any failure. Must give up after timeoutMs.
using DescriptionFetcher = std::function<std::optional<std::string>(const std::string& url, long timeoutMs)>;

struct ScanOptions {
    std::string targetHost{Defaults::SsdpAddress};
    std::uint16_t targetPort{Defaults::SsdpPort};
    std::string searchTarget{Defaults::SsdpSearchTarget};
    int maxWaitSeconds{Defaults::SsdpMaxWaitSeconds};
    std::uint16_t controlPort{Defaults::ControlPort};
    std::string requiredManufacturer;      // Empty = accept any manufacturer
    long fetchTimeoutMs{Defaults::RequestTimeoutMs};
    DescriptionFetcher fetchDescription;   // Empty = libcurl GET
};

class DeviceDiscovery {
public:
    explicit DeviceDiscovery(ScanOptions options = ScanOptions());

    // Sends one M-SEARCH and collects replies until timeout elapses. Descriptions
    // are fetched within the same window, so the call returns after about timeout.
    // Descriptors are returned in arrival order, unique by identifier.
    Status scan(std::chrono::milliseconds timeout, std::vector<DeviceDescriptor>& out) const;

    // Scan and pick the device with this UUID (case-insensitive, "uuid:" prefix optional).
    Status findByUuid(const std::string& uuid,
                      std::chrono::milliseconds timeout,
                      std::optional<DeviceDescriptor>& out) const;

    const ScanOptions& options() const { return m_options; }

private:
    bool describe(const SsdpReply& reply, long timeoutMs, DeviceDescriptor& out) const;

    ScanOptions m_options;
};

std::string buildSearchRequest(const ScanOptions& options);

// Exposed for tests
bool parseSsdpReply(const std::string& text, const std::string& from, SsdpReply& out);
bool parseDeviceDescription(const std::string& xml, DeviceDescription& out);

// "uuid:ABC::urn:..." / "uuid:ABC" / "ABC" -> "ABC"
std::string stripUuidPrefix(const std::string& value);

} // namespace SmartCast
