// DeviceSession.cpp
#include "DeviceSession.hpp"

#include <iomanip>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace SmartCast {

namespace {

std::string stringOf(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return "";
    auto it = object.find(key);
    if (it == object.end()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return "";
}

std::optional<std::uint32_t> hashvalOf(const nlohmann::json& item) {
    auto it = item.find("HASHVAL");
    if (it == item.end()) return std::nullopt;
    auto v = asInteger(*it);
    if (!v || *v < 0 || *v > static_cast<std::int64_t>(UINT32_MAX)) return std::nullopt;
    return static_cast<std::uint32_t>(*v);
}

// Input VALUE is either the label itself or {"NAME": label, ...}
bool decodeInput(const nlohmann::json& item, InputSource& out) {
    if (!item.is_object()) return false;
    InputSource input;
    input.name = stringOf(item, "NAME");
    if (input.name.empty()) input.name = stringOf(item, "CNAME");
    if (input.name.empty()) return false;
    auto value = item.find("VALUE");
    if (value != item.end()) {
        if (value->is_string()) input.friendlyName = value->get<std::string>();
        else if (value->is_object()) input.friendlyName = stringOf(*value, "NAME");
    }
    if (input.friendlyName.empty()) input.friendlyName = input.name;
    input.hashval = hashvalOf(item);
    out = std::move(input);
    return true;
}

Status decodeDeviceInfo(const nlohmann::json& value, DeviceInfo& out) {
    if (!value.is_object()) {
        return Status::error(ErrorKind::Protocol, "deviceinfo VALUE is not an object");
    }
    DeviceInfo info;
    info.castName = stringOf(value, "CAST_NAME");
    info.modelName = stringOf(value, "MODEL_NAME");
    info.settingsRoot = stringOf(value, "SETTINGS_ROOT");
    auto inputs = value.find("INPUTS");
    if (inputs != value.end() && inputs->is_array()) {
        for (const auto& input : *inputs) {
            if (input.is_string()) info.inputs.push_back(input.get<std::string>());
        }
    }
    auto system = value.find("SYSTEM_INFO");
    if (system != value.end() && system->is_object()) {
        info.serialNumber = stringOf(*system, "SERIAL_NUMBER");
        info.firmwareVersion = stringOf(*system, "VERSION");
        auto chipset = system->find("CHIPSET");
        if (chipset != system->end()) {
            if (auto v = asInteger(*chipset)) info.chipset = *v;
        }
    }
    out = std::move(info);
    return Status::success();
}

} // anonymous namespace

const char* toString(const PairingState& state) {
    if (std::holds_alternative<Pairing>(state)) return "Pairing";
    if (std::holds_alternative<Paired>(state)) return "Paired";
    return "Unpaired";
}

std::string generateClientId() {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::cerr << "[DeviceSession] Failed to generate random client id: " << ERR_get_error()
                  << ", falling back to std::random_device" << std::endl;
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    std::ostringstream oss;
    oss << "smartcast-";
    for (unsigned char b : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

DeviceSession::DeviceSession(DeviceDescriptor device,
                             std::shared_ptr<Transport> transport,
                             SessionOptions options)
    : m_device(std::move(device))
    , m_options(std::move(options))
    , m_clientId(m_options.clientId.empty() ? generateClientId() : m_options.clientId)
    , m_dispatcher(std::move(transport), m_device.host, m_device.port)
    , m_settingsRoot(m_options.settingsRoot.empty() ? Defaults::SettingsRoot : m_options.settingsRoot) {
}

Status DeviceSession::probe(const std::string& host,
                            std::shared_ptr<Transport> transport,
                            DeviceDescriptor& out,
                            const SessionOptions& options,
                            std::optional<std::uint16_t> port) {
    std::vector<std::uint16_t> ports;
    if (port) ports.push_back(*port);
    else ports.assign(std::begin(Defaults::ControlPorts), std::end(Defaults::ControlPorts));

    RequestOptions request;
    request.timeoutMs = options.timeoutMs;

    Status last = Status::error(ErrorKind::Transport, "No control port answered on " + host);
    for (std::uint16_t candidate : ports) {
        CommandDispatcher dispatcher(transport, host, candidate);
        CommandResponse response = dispatcher.send(HttpMethod::Get, Endpoints::DeviceInfo,
                                                   std::nullopt, std::nullopt, request);
        if (response.status.kind == ErrorKind::Transport) {
            if (verboseLogging()) {
                std::cout << "[DeviceSession] " << host << ":" << candidate << " did not answer: "
                          << response.status.message << std::endl;
            }
            last = response.status;
            continue;
        }

        DeviceDescriptor descriptor;
        descriptor.identifier = host;
        descriptor.host = host;
        descriptor.port = candidate;

        nlohmann::json value;
        DeviceInfo info;
        if (response.ok() && CommandDispatcher::firstItemValue(response.body, value).ok()
            && decodeDeviceInfo(value, info).ok()) {
            descriptor.friendlyName = info.castName;
            descriptor.model = info.modelName;
            // The serial number survives DHCP changes, the address does not
            if (!info.serialNumber.empty()) descriptor.identifier = info.serialNumber;
        }
        std::cout << "[DeviceSession] Control API found at " << descriptor.address() << std::endl;
        out = std::move(descriptor);
        return Status::success();
    }

    std::cerr << "[DeviceSession] Probe of " << host << " failed: " << last.describe() << std::endl;
    return last;
}

PairingState DeviceSession::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

bool DeviceSession::isPaired() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return std::holds_alternative<Paired>(m_state);
}

std::optional<std::string> DeviceSession::token() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (const auto* paired = std::get_if<Paired>(&m_state)) return paired->token;
    return std::nullopt;
}

std::string DeviceSession::settingsRoot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_settingsRoot;
}

RequestOptions DeviceSession::requestOptions(const std::atomic<bool>* cancel) const {
    RequestOptions options;
    options.timeoutMs = m_options.timeoutMs;
    options.cancelFlag = cancel;
    return options;
}

nlohmann::json DeviceSession::pairingBody(const Pairing& pairing, const std::string& responseValue) const {
    return nlohmann::json{
        {"DEVICE_ID", m_clientId},
        {"CHALLENGE_TYPE", pairing.challengeType},
        {"RESPONSE_VALUE", responseValue},
        {"PAIRING_REQ_TOKEN", pairing.processId},
    };
}

Status DeviceSession::beginPair(const std::string& clientName, const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> pairingLock(m_pairingMutex);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (std::holds_alternative<Pairing>(m_state)) {
            return Status::error(ErrorKind::PairAlreadyInProgress,
                                 "Pairing with " + m_device.address() + " is already in progress");
        }
    }

    nlohmann::json body{
        {"DEVICE_NAME", clientName},
        {"DEVICE_ID", m_clientId},
    };
    CommandResponse response = m_dispatcher.send(HttpMethod::Put, Endpoints::PairStart, body,
                                                 std::nullopt, requestOptions(cancel));
    if (!response.ok()) {
        std::cerr << "[DeviceSession] Pairing start failed: " << response.status.describe() << std::endl;
        return response.status;
    }

    nlohmann::json processId;
    nlohmann::json challenge;
    Status status = CommandDispatcher::itemField(response.body, "PAIRING_REQ_TOKEN", processId);
    if (status) status = CommandDispatcher::itemField(response.body, "CHALLENGE_TYPE", challenge);
    if (!status) {
        std::cerr << "[DeviceSession] Pairing start failed: " << status.describe() << std::endl;
        return status;
    }

    auto pid = asInteger(processId);
    auto challengeType = asInteger(challenge);
    if (!pid || *pid < 0 || *pid > static_cast<std::int64_t>(UINT32_MAX) || !challengeType) {
        return Status::error(ErrorKind::Protocol, "Pairing start returned a malformed process id or challenge");
    }

    Pairing pairing;
    pairing.processId = static_cast<std::uint32_t>(*pid);
    pairing.challengeType = *challengeType;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = pairing;
    }
    std::cout << "[DeviceSession] Pairing started with " << m_device.address()
              << " (challenge type " << pairing.challengeType << "), enter the PIN shown on screen" << std::endl;
    return Status::success();
}

Status DeviceSession::submitPin(const std::string& pin, const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> pairingLock(m_pairingMutex);
    Pairing pairing;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        const auto* current = std::get_if<Pairing>(&m_state);
        if (!current) {
            return Status::error(ErrorKind::NotAuthenticated, "No pairing in progress; call beginPair first");
        }
        pairing = *current;
    }

    CommandResponse response = m_dispatcher.send(HttpMethod::Put, Endpoints::PairFinish,
                                                 pairingBody(pairing, trim(pin)),
                                                 std::nullopt, requestOptions(cancel));

    // Nothing commits until a complete response was received
    if (response.status.kind == ErrorKind::Transport) {
        std::cerr << "[DeviceSession] PIN not delivered: " << response.status.describe() << std::endl;
        return response.status;
    }

    if (response.status.kind == ErrorKind::Device) {
        // BUSY, FAILURE or an HTTP 5xx say nothing about the PIN; the challenge stays open
        if (!isPairingRejectionCode(response.status.code)) {
            std::cerr << "[DeviceSession] PIN not accepted yet: " << response.status.describe() << std::endl;
            return response.status;
        }
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_state = Unpaired{};
        }
        std::cerr << "[DeviceSession] Pairing rejected: " << response.status.describe() << std::endl;
        return Status::error(ErrorKind::PairRejected, response.status.message, response.status.code);
    }

    nlohmann::json authToken;
    Status status = response.status;
    if (status) status = CommandDispatcher::itemField(response.body, "AUTH_TOKEN", authToken);
    if (status && (!authToken.is_string() || authToken.get<std::string>().empty())) {
        status = Status::error(ErrorKind::Protocol, "AUTH_TOKEN is not a non-empty string");
    }
    if (!status) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = Unpaired{};
        std::cerr << "[DeviceSession] Pairing failed: " << status.describe() << std::endl;
        return status;
    }

    const std::string token = authToken.get<std::string>();
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = Paired{token};
    }
    std::cout << "[DeviceSession] Paired with " << m_device.address()
              << ", token " << redactToken(token) << std::endl;
    return Status::success();
}

void DeviceSession::cancelPair(const std::atomic<bool>* cancel) {
    std::lock_guard<std::mutex> pairingLock(m_pairingMutex);
    Pairing pairing;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        const auto* current = std::get_if<Pairing>(&m_state);
        if (!current) return;
        pairing = *current;
        m_state = Unpaired{};
    }

    CommandResponse response = m_dispatcher.send(HttpMethod::Put, Endpoints::PairCancel,
                                                 pairingBody(pairing, Defaults::CancelPairingResponse),
                                                 std::nullopt, requestOptions(cancel));
    if (!response.ok()) {
        std::cerr << "[DeviceSession] Pairing cancel not acknowledged: " << response.status.describe() << std::endl;
    } else {
        std::cout << "[DeviceSession] Pairing cancelled" << std::endl;
    }
}

Status DeviceSession::restoreToken(const std::string& token) {
    const std::string value = trim(token);
    if (value.empty()) {
        return Status::error(ErrorKind::InvalidValue, "Auth token is empty");
    }
    std::lock_guard<std::mutex> pairingLock(m_pairingMutex);
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_state = Paired{value};
    if (verboseLogging()) {
        std::cout << "[DeviceSession] Using stored token " << redactToken(value) << std::endl;
    }
    return Status::success();
}

void DeviceSession::forget() {
    std::lock_guard<std::mutex> pairingLock(m_pairingMutex);
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_state = Unpaired{};
}

Status DeviceSession::requireToken(std::string& token) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    const auto* paired = std::get_if<Paired>(&m_state);
    if (!paired) {
        return Status::error(ErrorKind::NotAuthenticated,
                             std::string("Session is ") + toString(m_state) + "; pair with the device first");
    }
    token = paired->token;
    return Status::success();
}

void DeviceSession::handleAuthRejection(const Status& status, const std::string& usedToken) {
    if (!status.isAuthRejection()) return;
    std::lock_guard<std::mutex> lock(m_stateMutex);
    // A newer token from a concurrent re-pair must survive a stale rejection
    const auto* paired = std::get_if<Paired>(&m_state);
    if (paired && paired->token == usedToken) {
        m_state = Unpaired{};
        std::cerr << "[DeviceSession] Token " << redactToken(usedToken) << " rejected ("
                  << status.code << "), session is now Unpaired" << std::endl;
    }
}

CommandResponse DeviceSession::sendAuthenticated(HttpMethod method,
                                                 const std::string& path,
                                                 const std::optional<nlohmann::json>& body,
                                                 const std::string& token,
                                                 const std::atomic<bool>* cancel) {
    CommandResponse response = m_dispatcher.send(method, path, body, token, requestOptions(cancel));
    handleAuthRejection(response.status, token);
    return response;
}

Status DeviceSession::getState(DeviceState& out, const std::atomic<bool>* cancel) {
    std::optional<std::string> held = token();
    CommandResponse response = m_dispatcher.send(HttpMethod::Get, Endpoints::PowerMode,
                                                 std::nullopt, held, requestOptions(cancel));
    if (held) handleAuthRejection(response.status, *held);
    if (!response.ok()) return response.status;

    nlohmann::json value;
    Status status = CommandDispatcher::firstItemValue(response.body, value);
    if (!status) return status;
    auto mode = asInteger(value);
    if (!mode) {
        return Status::error(ErrorKind::Protocol, "power_mode VALUE is not an integer: " + value.dump());
    }
    out.powerMode = *mode;
    out.powerOn = (*mode == 1);
    return Status::success();
}

Status DeviceSession::getDeviceInfo(DeviceInfo& out, const std::atomic<bool>* cancel) {
    std::optional<std::string> held = token();
    CommandResponse response = m_dispatcher.send(HttpMethod::Get, Endpoints::DeviceInfo,
                                                 std::nullopt, held, requestOptions(cancel));
    if (held) handleAuthRejection(response.status, *held);
    if (!response.ok()) return response.status;

    nlohmann::json value;
    Status status = CommandDispatcher::firstItemValue(response.body, value);
    if (!status) return status;
    status = decodeDeviceInfo(value, out);
    if (!status) return status;

    if (!out.settingsRoot.empty()) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_settingsRoot = out.settingsRoot;
    }
    return Status::success();
}

Status DeviceSession::readSettings(const std::string& path, std::vector<SettingsNode>& out,
                                   const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;

    CommandResponse response = sendAuthenticated(HttpMethod::Get, dynamicSettingsPath(settingsRoot(), path),
                                                 std::nullopt, token, cancel);
    if (!response.ok()) return response.status;

    nlohmann::json items;
    status = CommandDispatcher::items(response.body, items);
    if (!status) return status;
    return decodeSettingsItems(items, path, out);
}

Status DeviceSession::readSettingConstraints(SettingsNode& node, const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;

    if (node.type != SettingType::Slider && node.type != SettingType::List && node.type != SettingType::XList) {
        return Status::success();
    }

    CommandResponse response = sendAuthenticated(HttpMethod::Get, staticSettingsPath(settingsRoot(), node.path),
                                                 std::nullopt, token, cancel);
    if (!response.ok()) return response.status;

    nlohmann::json items;
    status = CommandDispatcher::items(response.body, items);
    if (!status) return status;
    return applyStaticConstraints(items, node);
}

Status DeviceSession::writeSetting(const SettingsNode& node, const SettingValue& value,
                                   const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;

    // Dynamic reads carry no range or elements; fetch them before validating
    SettingsNode target = node;
    if (needsConstraints(target)) {
        status = readSettingConstraints(target, cancel);
        if (!status) {
            std::cerr << "[DeviceSession] Not writing " << target.path << ": constraints unavailable, "
                      << status.describe() << std::endl;
            return status;
        }
    }

    status = validateSettingValue(target, value);
    if (!status) {
        std::cerr << "[DeviceSession] Not writing " << target.path << ": " << status.message << std::endl;
        return status;
    }

    nlohmann::json body{
        {"REQUEST", "MODIFY"},
        {"VALUE", toJson(value)},
        {"HASHVAL", *target.hashval},
    };
    CommandResponse response = sendAuthenticated(HttpMethod::Put, dynamicSettingsPath(settingsRoot(), target.path),
                                                 body, token, cancel);
    if (!response.ok()) return response.status;

    if (verboseLogging()) {
        std::cout << "[DeviceSession] " << node.path << " = " << toString(value) << std::endl;
    }
    return Status::success();
}

Status DeviceSession::sendKey(RemoteKey key, KeyAction action, const std::atomic<bool>* cancel) {
    return sendKeys({KeyEvent{key, action}}, cancel);
}

Status DeviceSession::sendKeys(const std::vector<KeyEvent>& keys, const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;
    if (keys.empty()) {
        return Status::error(ErrorKind::InvalidValue, "No keys to send");
    }

    nlohmann::json keylist = nlohmann::json::array();
    for (const auto& event : keys) {
        KeyCode code = keyCodeFor(event.key);
        keylist.push_back({
            {"CODESET", code.codeset},
            {"CODE", code.code},
            {"ACTION", toString(event.action)},
        });
    }
    nlohmann::json body{{"KEYLIST", keylist}};

    CommandResponse response = sendAuthenticated(HttpMethod::Put, Endpoints::KeyCommand, body, token, cancel);
    return response.status;
}

Status DeviceSession::currentInput(InputSource& out, const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;

    CommandResponse response = sendAuthenticated(HttpMethod::Get,
                                                 dynamicSettingsPath(settingsRoot(), Endpoints::CurrentInput),
                                                 std::nullopt, token, cancel);
    if (!response.ok()) return response.status;

    nlohmann::json item;
    status = CommandDispatcher::firstItem(response.body, item);
    if (!status) return status;

    // current_input carries the selected input's name in VALUE
    InputSource input;
    input.name = stringOf(item, "VALUE");
    if (input.name.empty()) {
        return Status::error(ErrorKind::Protocol, "current_input has no VALUE");
    }
    input.friendlyName = input.name;
    input.hashval = hashvalOf(item);
    out = std::move(input);
    return Status::success();
}

Status DeviceSession::listInputs(std::vector<InputSource>& out, const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;

    CommandResponse response = sendAuthenticated(HttpMethod::Get,
                                                 dynamicSettingsPath(settingsRoot(), Endpoints::InputList),
                                                 std::nullopt, token, cancel);
    if (!response.ok()) return response.status;

    nlohmann::json items;
    status = CommandDispatcher::items(response.body, items);
    if (!status) return status;

    out.clear();
    for (const auto& item : items) {
        InputSource input;
        if (!decodeInput(item, input)) {
            return Status::error(ErrorKind::Protocol, "name_input item without NAME");
        }
        out.push_back(std::move(input));
    }
    return Status::success();
}

Status DeviceSession::changeInput(const std::string& name, const std::atomic<bool>* cancel) {
    std::string token;
    Status status = requireToken(token);
    if (!status) return status;
    if (trim(name).empty()) {
        return Status::error(ErrorKind::InvalidValue, "Input name is empty");
    }

    // The device wants the HASHVAL of current_input with the write
    InputSource current;
    status = currentInput(current, cancel);
    if (!status) return status;
    if (!current.hashval) {
        return Status::error(ErrorKind::Protocol, "current_input has no HASHVAL");
    }

    nlohmann::json body{
        {"REQUEST", "MODIFY"},
        {"VALUE", trim(name)},
        {"HASHVAL", *current.hashval},
    };
    CommandResponse response = sendAuthenticated(HttpMethod::Put,
                                                 dynamicSettingsPath(settingsRoot(), Endpoints::CurrentInput),
                                                 body, token, cancel);
    if (!response.ok()) return response.status;
    std::cout << "[DeviceSession] Input changed to " << trim(name) << std::endl;
    return Status::success();
}

} // namespace SmartCast
