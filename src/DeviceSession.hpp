// DeviceSession.hpp
// Pairing state machine and authenticated operations against one SmartCast device.
#pragma once

#include "CommandDispatcher.hpp"
#include "DeviceDiscovery.hpp"
#include "SettingsTree.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SmartCast {

struct SessionOptions {
    std::string clientId;                          // Empty = random per session
    long timeoutMs{Defaults::RequestTimeoutMs};
    std::string settingsRoot{Defaults::SettingsRoot};
};

struct DeviceState {
    bool powerOn{false};
    std::int64_t powerMode{0};                     // Raw power_mode VALUE
};

struct DeviceInfo {
    std::string castName;
    std::string modelName;
    std::string settingsRoot;
    std::string serialNumber;
    std::string firmwareVersion;
    std::int64_t chipset{0};
    std::vector<std::string> inputs;
};

struct InputSource {
    std::string name;                              // "HDMI-1"
    std::string friendlyName;                      // User label, falls back to name
    std::optional<std::uint32_t> hashval;
};

// Authentication states
struct Unpaired {};
struct Pairing {
    std::uint32_t processId{0};                    // PAIRING_REQ_TOKEN
    std::int64_t challengeType{0};                 // CHALLENGE_TYPE
};
struct Paired {
    std::string token;
};
using PairingState = std::variant<Unpaired, Pairing, Paired>;

const char* toString(const PairingState& state);

class DeviceSession {
public:
    DeviceSession(DeviceDescriptor device,
                  std::shared_ptr<Transport> transport,
                  SessionOptions options = SessionOptions());

    // Direct connect: tries the given port, or 7345 then 9000.
    static Status probe(const std::string& host,
                        std::shared_ptr<Transport> transport,
                        DeviceDescriptor& out,
                        const SessionOptions& options = SessionOptions(),
                        std::optional<std::uint16_t> port = std::nullopt);

    // Pairing
    Status beginPair(const std::string& clientName, const std::atomic<bool>* cancel = nullptr);
    Status submitPin(const std::string& pin, const std::atomic<bool>* cancel = nullptr);
    void cancelPair(const std::atomic<bool>* cancel = nullptr);
    Status restoreToken(const std::string& token);
    void forget();

    PairingState state() const;
    bool isPaired() const;
    std::optional<std::string> token() const;
    const std::string& clientId() const { return m_clientId; }
    const DeviceDescriptor& device() const { return m_device; }
    std::string settingsRoot() const;
    std::size_t requestCount() const { return m_dispatcher.requestCount(); }

    // Device state does not require pairing; the token is sent when held.
    Status getState(DeviceState& out, const std::atomic<bool>* cancel = nullptr);
    Status getDeviceInfo(DeviceInfo& out, const std::atomic<bool>* cancel = nullptr);

    // Authenticated operations
    Status readSettings(const std::string& path, std::vector<SettingsNode>& out,
                        const std::atomic<bool>* cancel = nullptr);
    Status readSettingConstraints(SettingsNode& node, const std::atomic<bool>* cancel = nullptr);
    Status writeSetting(const SettingsNode& node, const SettingValue& value,
                        const std::atomic<bool>* cancel = nullptr);
    Status sendKey(RemoteKey key, KeyAction action = KeyAction::Press,
                   const std::atomic<bool>* cancel = nullptr);
    Status sendKeys(const std::vector<KeyEvent>& keys, const std::atomic<bool>* cancel = nullptr);
    Status currentInput(InputSource& out, const std::atomic<bool>* cancel = nullptr);
    Status listInputs(std::vector<InputSource>& out, const std::atomic<bool>* cancel = nullptr);
    Status changeInput(const std::string& name, const std::atomic<bool>* cancel = nullptr);

private:
    RequestOptions requestOptions(const std::atomic<bool>* cancel) const;
    Status requireToken(std::string& token) const;

    // Sends with the token and drops to Unpaired when the device rejects it
    CommandResponse sendAuthenticated(HttpMethod method,
                                      const std::string& path,
                                      const std::optional<nlohmann::json>& body,
                                      const std::string& token,
                                      const std::atomic<bool>* cancel);
    void handleAuthRejection(const Status& status, const std::string& usedToken);

    nlohmann::json pairingBody(const Pairing& pairing, const std::string& responseValue) const;

    DeviceDescriptor m_device;
    SessionOptions m_options;
    std::string m_clientId;
    CommandDispatcher m_dispatcher;

    std::mutex m_pairingMutex;          // Serialises begin/submit/cancel, held across the request
    mutable std::mutex m_stateMutex;    // Guards m_state and m_settingsRoot, never held across I/O
    PairingState m_state{Unpaired{}};
    std::string m_settingsRoot;
};

// Random hex client id from OpenSSL
std::string generateClientId();

} // namespace SmartCast
