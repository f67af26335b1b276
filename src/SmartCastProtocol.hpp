// SmartCastProtocol.hpp
// SmartCast control API: endpoints, result codes, error taxonomy and the
// virtual remote key table.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace SmartCast {

// Error taxonomy shared by discovery, dispatcher and session
enum class ErrorKind {
    None,
    Discovery,             // Local network transport unavailable
    Transport,             // Connect/timeout/TLS/cancel - caller may retry
    Protocol,              // Response had an unexpected shape - never retried
    Device,                // Device rejected the request (code in Status::code)
    NotAuthenticated,      // Local precondition, no request made
    InvalidValue,          // Local precondition, no request made
    PairAlreadyInProgress,
    PairRejected
};

const char* toString(ErrorKind kind);

struct Status {
    ErrorKind kind{ErrorKind::None};
    std::string code;      // Device result code ("CHALLENGE_INCORRECT") or "http-<status>"
    std::string message;
    bool cancelled{false}; // Transport only: aborted through the caller's cancel flag

    bool ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    bool isTransient() const { return kind == ErrorKind::Transport; }
    bool isAuthRejection() const;

    // "Device(REQUIRES_PAIRING): ..." style one-liner for logs
    std::string describe() const;

    static Status success() { return Status{}; }
    static Status error(ErrorKind kind, std::string message, std::string code = std::string());
};

namespace Endpoints {
    constexpr const char* PairStart   = "/pairing/start";
    constexpr const char* PairFinish  = "/pairing/pair";
    constexpr const char* PairCancel  = "/pairing/cancel";
    constexpr const char* PowerMode   = "/state/device/power_mode";
    constexpr const char* DeviceInfo  = "/state/device/deviceinfo";
    constexpr const char* KeyCommand  = "/key_command/";
    constexpr const char* DynamicMenu = "/menu_native/dynamic/";
    constexpr const char* StaticMenu  = "/menu_native/static/";
    constexpr const char* CurrentInput = "devices/current_input";
    constexpr const char* InputList    = "devices/name_input";
}

namespace Defaults {
    // Newer firmware listens on 7345, older on 9000
    constexpr std::uint16_t ControlPorts[] = {7345, 9000};
    constexpr std::uint16_t ControlPort = 7345;
    constexpr long RequestTimeoutMs = 3000;
    constexpr const char* SettingsRoot = "tv_settings";
    constexpr const char* SsdpAddress = "239.255.255.250";
    constexpr std::uint16_t SsdpPort = 1900;
    constexpr const char* SsdpSearchTarget = "urn:dial-multiscreen-org:device:dial:1";
    constexpr int SsdpMaxWaitSeconds = 3;
    // Value the device expects in RESPONSE_VALUE when abandoning a pairing
    constexpr const char* CancelPairingResponse = "1111";
}

namespace ResultCodes {
    constexpr const char* Success               = "SUCCESS";
    constexpr const char* InvalidParameter      = "INVALID_PARAMETER";
    constexpr const char* UriNotFound           = "URI_NOT_FOUND";
    constexpr const char* MaxChallengesExceeded = "MAX_CHALLENGES_EXCEEDED";
    constexpr const char* PairingDenied         = "PAIRING_DENIED";
    constexpr const char* ValueOutOfRange       = "VALUE_OUT_OF_RANGE";
    constexpr const char* ChallengeIncorrect    = "CHALLENGE_INCORRECT";
    constexpr const char* Blocked               = "BLOCKED";
    constexpr const char* Failure               = "FAILURE";
    constexpr const char* Aborted               = "ABORTED";
    constexpr const char* Busy                  = "BUSY";
    constexpr const char* RequiresPairing       = "REQUIRES_PAIRING";
    constexpr const char* RequiresSystemPin     = "REQUIRES_SYSTEM_PIN";
    constexpr const char* RequiresNewSystemPin  = "REQUIRES_NEW_SYSTEM_PIN";
}

// Codes that mean the token is missing, stale or revoked
bool isAuthRejectionCode(const std::string& code);

// Codes returned by /pairing/pair when the PIN or process id is not accepted
bool isPairingRejectionCode(const std::string& code);

// Human readable text for a device result code (falls back to the code itself)
std::string describeResultCode(const std::string& code);

// Virtual remote
enum class KeyAction {
    Down,
    Up,
    Press
};

enum class RemoteKey {
    SeekFwd, SeekBack, Pause, Play,
    Down, Left, Up, Right, Ok,
    Back, SmartCast, CCToggle, Info, Menu, Home,
    VolumeDown, VolumeUp, MuteOff, MuteOn, MuteToggle,
    PicMode, PicSize,
    InputNext,
    ChannelDown, ChannelUp, ChannelPrev,
    Exit,
    PowerOff, PowerOn, PowerToggle
};

struct KeyCode {
    std::uint8_t codeset{0};
    std::uint8_t code{0};
};

struct KeyEvent {
    RemoteKey key{RemoteKey::Ok};
    KeyAction action{KeyAction::Press};
};

const char* toString(KeyAction action);   // KEYDOWN / KEYUP / KEYPRESS
const char* keyName(RemoteKey key);       // "volume_up" style, used by the CLI
KeyCode keyCodeFor(RemoteKey key);
const std::vector<RemoteKey>& allRemoteKeys();

bool parseRemoteKey(const std::string& name, RemoteKey& out);
bool parseKeyAction(const std::string& name, KeyAction& out);

// Logging helpers
bool verboseLogging();
void setVerboseLogging(bool enabled);
std::string redactToken(const std::string& token);

std::string toUpper(std::string value);
std::string toLower(std::string value);
std::string trim(const std::string& value);

} // namespace SmartCast
