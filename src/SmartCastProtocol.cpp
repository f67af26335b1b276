// SmartCastProtocol.cpp
#include "SmartCastProtocol.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <unordered_map>

namespace SmartCast {

namespace {

struct KeyEntry {
    RemoteKey key;
    const char* name;
    KeyCode code;
};

// CODESET/CODE pairs accepted by current SmartCast firmware
const KeyEntry kKeyTable[] = {
    {RemoteKey::SeekFwd,     "seek_fwd",     {2, 0}},
    {RemoteKey::SeekBack,    "seek_back",    {2, 1}},
    {RemoteKey::Pause,       "pause",        {2, 2}},
    {RemoteKey::Play,        "play",         {2, 3}},
    {RemoteKey::Down,        "down",         {3, 0}},
    {RemoteKey::Left,        "left",         {3, 1}},
    {RemoteKey::Up,          "up",           {3, 8}},
    {RemoteKey::Right,       "right",        {3, 7}},
    {RemoteKey::Ok,          "ok",           {3, 2}},
    {RemoteKey::Back,        "back",         {4, 0}},
    {RemoteKey::SmartCast,   "smartcast",    {4, 3}},
    {RemoteKey::CCToggle,    "cc_toggle",    {4, 4}},
    {RemoteKey::Info,        "info",         {4, 6}},
    {RemoteKey::Menu,        "menu",         {4, 8}},
    {RemoteKey::Home,        "home",         {4, 15}},
    {RemoteKey::VolumeDown,  "volume_down",  {5, 0}},
    {RemoteKey::VolumeUp,    "volume_up",    {5, 1}},
    {RemoteKey::MuteOff,     "mute_off",     {5, 2}},
    {RemoteKey::MuteOn,      "mute_on",      {5, 3}},
    {RemoteKey::MuteToggle,  "mute_toggle",  {5, 4}},
    {RemoteKey::PicMode,     "pic_mode",     {6, 0}},
    {RemoteKey::PicSize,     "pic_size",     {6, 2}},
    {RemoteKey::InputNext,   "input_next",   {7, 1}},
    {RemoteKey::ChannelDown, "channel_down", {8, 0}},
    {RemoteKey::ChannelUp,   "channel_up",   {8, 1}},
    {RemoteKey::ChannelPrev, "channel_prev", {8, 2}},
    {RemoteKey::Exit,        "exit",         {9, 0}},
    {RemoteKey::PowerOff,    "power_off",    {11, 0}},
    {RemoteKey::PowerOn,     "power_on",     {11, 1}},
    {RemoteKey::PowerToggle, "power_toggle", {11, 2}},
};

const KeyEntry* findKey(RemoteKey key) {
    for (const auto& entry : kKeyTable) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

// -1 = follow SMARTCAST_VERBOSE, 0/1 = forced by setVerboseLogging()
std::atomic<int> g_verboseOverride{-1};

} // anonymous namespace

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return "None";
        case ErrorKind::Discovery:             return "DiscoveryError";
        case ErrorKind::Transport:             return "TransportError";
        case ErrorKind::Protocol:              return "ProtocolError";
        case ErrorKind::Device:                return "DeviceError";
        case ErrorKind::NotAuthenticated:      return "NotAuthenticated";
        case ErrorKind::InvalidValue:          return "InvalidValue";
        case ErrorKind::PairAlreadyInProgress: return "PairAlreadyInProgress";
        case ErrorKind::PairRejected:          return "PairRejected";
    }
    return "Unknown";
}

bool Status::isAuthRejection() const {
    return kind == ErrorKind::Device && isAuthRejectionCode(code);
}

std::string Status::describe() const {
    if (ok()) return "OK";
    std::string out = toString(kind);
    if (!code.empty()) out += "(" + code + ")";
    if (cancelled) out += "[cancelled]";
    if (!message.empty()) out += ": " + message;
    return out;
}

Status Status::error(ErrorKind kind, std::string message, std::string code) {
    Status status;
    status.kind = kind;
    status.message = std::move(message);
    status.code = std::move(code);
    return status;
}

bool isAuthRejectionCode(const std::string& code) {
    return code == ResultCodes::RequiresPairing
        || code == ResultCodes::RequiresSystemPin
        || code == ResultCodes::RequiresNewSystemPin
        || code == "http-401"
        || code == "http-403";
}

bool isPairingRejectionCode(const std::string& code) {
    return code == ResultCodes::ChallengeIncorrect
        || code == ResultCodes::PairingDenied
        || code == ResultCodes::ValueOutOfRange
        || code == ResultCodes::MaxChallengesExceeded
        || code == ResultCodes::InvalidParameter
        || code == ResultCodes::Blocked;
}

std::string describeResultCode(const std::string& code) {
    static const std::unordered_map<std::string, std::string> descriptions = {
        {ResultCodes::InvalidParameter,      "Invalid parameter"},
        {ResultCodes::UriNotFound,           "URI not found"},
        {ResultCodes::MaxChallengesExceeded, "Too many failed pair attempts"},
        {ResultCodes::PairingDenied,         "Incorrect pin"},
        {ResultCodes::ValueOutOfRange,       "Pin out of range"},
        {ResultCodes::ChallengeIncorrect,    "Incorrect challenge"},
        {ResultCodes::Blocked,               "Pairing is already in progress"},
        {ResultCodes::Failure,               "Unknown command failure"},
        {ResultCodes::Aborted,               "Unknown abort"},
        {ResultCodes::Busy,                  "Device is busy"},
        {ResultCodes::RequiresPairing,       "Device requires pairing"},
        {ResultCodes::RequiresSystemPin,     "Device requires system pin"},
        {ResultCodes::RequiresNewSystemPin,  "Device requires new system pin"},
        {"NET_WIFI_NEEDS_VALID_SSID",        "Wifi needs SSID"},
        {"NET_WIFI_ALREADY_CONNECTED",       "Wifi already connected"},
        {"NET_WIFI_MISSING_PASSWORD",        "Wifi needs password"},
        {"NET_WIFI_NOT_EXISTED",             "Wifi network does not exist"},
        {"NET_WIFI_AUTH_REJECTED",           "Wifi authentication rejected"},
        {"NET_WIFI_CONNECT_TIMEOUT",         "Wifi connection timeout"},
        {"NET_WIFI_CONNECT_ABORTED",         "Wifi connection aborted"},
        {"NET_WIFI_CONNECTION_ERROR",        "Wifi connection error"},
        {"NET_IP_MANUAL_CONFIG_ERROR",       "IP config error"},
        {"NET_IP_DHCP_FAILED",               "DHCP failure"},
        {"NET_UNKNOWN_ERROR",                "Unknown network error"},
    };
    auto it = descriptions.find(code);
    return it != descriptions.end() ? it->second : code;
}

const char* toString(KeyAction action) {
    switch (action) {
        case KeyAction::Down:  return "KEYDOWN";
        case KeyAction::Up:    return "KEYUP";
        case KeyAction::Press: return "KEYPRESS";
    }
    return "KEYPRESS";
}

const char* keyName(RemoteKey key) {
    const KeyEntry* entry = findKey(key);
    return entry ? entry->name : "unknown";
}

KeyCode keyCodeFor(RemoteKey key) {
    const KeyEntry* entry = findKey(key);
    return entry ? entry->code : KeyCode{};
}

const std::vector<RemoteKey>& allRemoteKeys() {
    static const std::vector<RemoteKey> keys = [] {
        std::vector<RemoteKey> out;
        for (const auto& entry : kKeyTable) out.push_back(entry.key);
        return out;
    }();
    return keys;
}

bool parseRemoteKey(const std::string& name, RemoteKey& out) {
    std::string wanted = toLower(trim(name));
    std::replace(wanted.begin(), wanted.end(), '-', '_');
    for (const auto& entry : kKeyTable) {
        if (wanted == entry.name) {
            out = entry.key;
            return true;
        }
    }
    return false;
}

bool parseKeyAction(const std::string& name, KeyAction& out) {
    std::string wanted = toUpper(trim(name));
    if (wanted == "DOWN" || wanted == "KEYDOWN") { out = KeyAction::Down; return true; }
    if (wanted == "UP" || wanted == "KEYUP") { out = KeyAction::Up; return true; }
    if (wanted == "PRESS" || wanted == "KEYPRESS") { out = KeyAction::Press; return true; }
    return false;
}

bool verboseLogging() {
    int forced = g_verboseOverride.load();
    if (forced >= 0) return forced == 1;
    const char* env = std::getenv("SMARTCAST_VERBOSE");
    return env && (std::strcmp(env, "1") == 0 || std::strcmp(env, "true") == 0);
}

void setVerboseLogging(bool enabled) {
    g_verboseOverride.store(enabled ? 1 : 0);
}

std::string redactToken(const std::string& token) {
    if (token.size() <= 4) return "****";
    return token.substr(0, 4) + "...";
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace SmartCast
