// main.cpp
#include "DeviceDiscovery.hpp"
#include "DeviceSession.hpp"
#include "HttpsTransport.hpp"
#include "SettingsTree.hpp"
#include "SmartCastProtocol.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

struct CliConfig {
    std::string host;
    std::string uuid;
    std::optional<std::uint16_t> port;
    std::string token;
    std::string clientName{"smartcast-cli"};
    long timeoutMs{SmartCast::Defaults::RequestTimeoutMs};
    int scanSeconds{SmartCast::Defaults::SsdpMaxWaitSeconds};
    bool verbose{false};
    std::vector<std::string> args;  // Command and its operands
};

void printUsage() {
    std::cout << "Usage: smartcast [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  discover                 List SmartCast devices on the local network\n"
              << "  pair                     Pair with the device and print the auth token\n"
              << "  state                    Show power state\n"
              << "  info                     Show model, firmware and inputs\n"
              << "  inputs                   List inputs and the current one\n"
              << "  input <name>             Switch input\n"
              << "  settings [path]          Read a settings menu or value\n"
              << "  write <path> <value>     Change a setting\n"
              << "  key <name> [action]      Press a remote key (action: press, down, up)\n"
              << "  keys                     List remote key names\n"
              << "\n"
              << "Options (environment variable in brackets):\n"
              << "  --host=ADDR              Device address [SMARTCAST_HOST]\n"
              << "  --uuid=UUID              Find the device by UUID [SMARTCAST_UUID]\n"
              << "  --port=N                 Control port, default probes 7345 then 9000 [SMARTCAST_PORT]\n"
              << "  --token=TOKEN            Auth token from a previous pairing [SMARTCAST_TOKEN]\n"
              << "  --client-name=NAME       Name shown on the device while pairing [SMARTCAST_CLIENT_NAME]\n"
              << "  --timeout-ms=N           Per-request timeout [SMARTCAST_TIMEOUT_MS]\n"
              << "  --scan-seconds=N         Discovery window [SMARTCAST_SCAN_SECONDS]\n"
              << "  --verbose                Trace requests and replies [SMARTCAST_VERBOSE]\n";
}

bool parseNumber(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    out = v;
    return true;
}

bool applyPort(const std::string& text, CliConfig& config) {
    long v = 0;
    if (!parseNumber(text, v) || v <= 0 || v > 65535) {
        std::cerr << "[main] Invalid port: " << text << std::endl;
        return false;
    }
    config.port = static_cast<std::uint16_t>(v);
    return true;
}

// Environment first, flags override
bool loadConfig(int argc, char** argv, CliConfig& config) {
    if (const char* env = std::getenv("SMARTCAST_HOST")) config.host = env;
    if (const char* env = std::getenv("SMARTCAST_UUID")) config.uuid = env;
    if (const char* env = std::getenv("SMARTCAST_PORT")) {
        if (!applyPort(env, config)) return false;
    }
    if (const char* env = std::getenv("SMARTCAST_TOKEN")) config.token = env;
    if (const char* env = std::getenv("SMARTCAST_CLIENT_NAME")) config.clientName = env;
    if (const char* env = std::getenv("SMARTCAST_TIMEOUT_MS")) {
        long v = 0;
        if (parseNumber(env, v) && v > 0) config.timeoutMs = v;
    }
    if (const char* env = std::getenv("SMARTCAST_SCAN_SECONDS")) {
        long v = 0;
        if (parseNumber(env, v) && v > 0) config.scanSeconds = static_cast<int>(v);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const std::string hostFlag = "--host=";
        const std::string uuidFlag = "--uuid=";
        const std::string portFlag = "--port=";
        const std::string tokenFlag = "--token=";
        const std::string nameFlag = "--client-name=";
        const std::string timeoutFlag = "--timeout-ms=";
        const std::string scanFlag = "--scan-seconds=";

        if (arg.rfind(hostFlag, 0) == 0) config.host = arg.substr(hostFlag.size());
        else if (arg.rfind(uuidFlag, 0) == 0) config.uuid = arg.substr(uuidFlag.size());
        else if (arg.rfind(portFlag, 0) == 0) {
            if (!applyPort(arg.substr(portFlag.size()), config)) return false;
        }
        else if (arg.rfind(tokenFlag, 0) == 0) config.token = arg.substr(tokenFlag.size());
        else if (arg.rfind(nameFlag, 0) == 0) config.clientName = arg.substr(nameFlag.size());
        else if (arg.rfind(timeoutFlag, 0) == 0) {
            long v = 0;
            if (!parseNumber(arg.substr(timeoutFlag.size()), v) || v <= 0) {
                std::cerr << "[main] Invalid timeout: " << arg << std::endl;
                return false;
            }
            config.timeoutMs = v;
        }
        else if (arg.rfind(scanFlag, 0) == 0) {
            long v = 0;
            if (!parseNumber(arg.substr(scanFlag.size()), v) || v <= 0) {
                std::cerr << "[main] Invalid scan window: " << arg << std::endl;
                return false;
            }
            config.scanSeconds = static_cast<int>(v);
        }
        else if (arg == "--verbose" || arg == "-v") config.verbose = true;
        else if (arg.rfind("--", 0) == 0 && arg != "--help") {
            std::cerr << "[main] Unknown option: " << arg << std::endl;
            return false;
        }
        else config.args.push_back(arg);
    }
    return true;
}

int reportFailure(const char* what, const SmartCast::Status& status) {
    std::cerr << "[main] " << what << " failed: " << status.describe() << std::endl;
    if (status.kind == SmartCast::ErrorKind::NotAuthenticated || status.isAuthRejection()) {
        std::cerr << "[main] Run 'smartcast pair' and pass the token with --token or SMARTCAST_TOKEN" << std::endl;
    }
    return 1;
}

SmartCast::ScanOptions scanOptions(const CliConfig& config) {
    SmartCast::ScanOptions options;
    options.maxWaitSeconds = config.scanSeconds;
    options.fetchTimeoutMs = config.timeoutMs;
    if (config.port) options.controlPort = *config.port;
    return options;
}

int runDiscover(const CliConfig& config) {
    SmartCast::DeviceDiscovery discovery(scanOptions(config));
    std::vector<SmartCast::DeviceDescriptor> devices;
    SmartCast::Status status = discovery.scan(std::chrono::seconds(config.scanSeconds), devices);
    if (!status) return reportFailure("Discovery", status);

    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        std::cout << "  [" << i << "] " << (d.friendlyName.empty() ? d.host : d.friendlyName)
                  << " (" << d.manufacturer << " " << d.model << ")"
                  << " -> " << d.address() << " uuid:" << d.identifier << std::endl;
    }
    return 0;
}

// Builds a session from --host (probe) or --uuid (discovery), then installs --token.
std::unique_ptr<SmartCast::DeviceSession> openSession(const CliConfig& config,
                                                      const std::shared_ptr<SmartCast::Transport>& transport) {
    SmartCast::SessionOptions options;
    options.timeoutMs = config.timeoutMs;

    SmartCast::DeviceDescriptor descriptor;
    if (!config.host.empty()) {
        SmartCast::Status status = SmartCast::DeviceSession::probe(config.host, transport, descriptor,
                                                                   options, config.port);
        if (!status) {
            reportFailure("Connect", status);
            return nullptr;
        }
    } else if (!config.uuid.empty()) {
        SmartCast::DeviceDiscovery discovery(scanOptions(config));
        std::optional<SmartCast::DeviceDescriptor> found;
        SmartCast::Status status = discovery.findByUuid(config.uuid, std::chrono::seconds(config.scanSeconds), found);
        if (!status) {
            reportFailure("Discovery", status);
            return nullptr;
        }
        if (!found) {
            std::cerr << "[main] No device with uuid " << config.uuid << " answered" << std::endl;
            return nullptr;
        }
        descriptor = *found;
        if (!config.port) {
            // SSDP does not advertise the control port
            SmartCast::DeviceDescriptor probed;
            SmartCast::Status probeStatus = SmartCast::DeviceSession::probe(descriptor.host, transport, probed, options);
            if (!probeStatus) {
                reportFailure("Connect", probeStatus);
                return nullptr;
            }
            descriptor.port = probed.port;
        }
    } else {
        std::cerr << "[main] No device given; use --host=ADDR or --uuid=UUID" << std::endl;
        return nullptr;
    }

    auto session = std::make_unique<SmartCast::DeviceSession>(descriptor, transport, options);
    if (!config.token.empty()) {
        SmartCast::Status status = session->restoreToken(config.token);
        if (!status) {
            reportFailure("Token", status);
            return nullptr;
        }
    }
    return session;
}

int runPair(const CliConfig& config, SmartCast::DeviceSession& session) {
    SmartCast::Status status = session.beginPair(config.clientName, &g_interrupted);
    if (!status) return reportFailure("Pairing", status);

    std::cout << "PIN (empty to cancel): " << std::flush;
    std::string pin;
    if (!std::getline(std::cin, pin) || SmartCast::trim(pin).empty() || g_interrupted.load()) {
        session.cancelPair();
        std::cerr << "[main] Pairing cancelled" << std::endl;
        return 1;
    }

    status = session.submitPin(pin, &g_interrupted);
    if (!status) {
        if (std::holds_alternative<SmartCast::Pairing>(session.state())) session.cancelPair();
        return reportFailure("Pairing", status);
    }

    auto token = session.token();
    std::cout << "AUTH_TOKEN=" << (token ? *token : std::string()) << std::endl;
    return 0;
}

int runState(SmartCast::DeviceSession& session) {
    SmartCast::DeviceState state;
    SmartCast::Status status = session.getState(state, &g_interrupted);
    if (!status) return reportFailure("State query", status);
    std::cout << "power: " << (state.powerOn ? "on" : "off") << " (power_mode " << state.powerMode << ")" << std::endl;
    return 0;
}

int runInfo(SmartCast::DeviceSession& session) {
    SmartCast::DeviceInfo info;
    SmartCast::Status status = session.getDeviceInfo(info, &g_interrupted);
    if (!status) return reportFailure("Device info", status);
    std::cout << "name:     " << info.castName << "\n"
              << "model:    " << info.modelName << "\n"
              << "serial:   " << info.serialNumber << "\n"
              << "firmware: " << info.firmwareVersion << "\n"
              << "chipset:  " << info.chipset << "\n"
              << "settings: " << info.settingsRoot << "\n"
              << "inputs:  ";
    for (const auto& input : info.inputs) std::cout << " " << input;
    std::cout << std::endl;
    return 0;
}

int runInputs(SmartCast::DeviceSession& session) {
    std::vector<SmartCast::InputSource> inputs;
    SmartCast::Status status = session.listInputs(inputs, &g_interrupted);
    if (!status) return reportFailure("Input list", status);
    SmartCast::InputSource current;
    status = session.currentInput(current, &g_interrupted);
    if (!status) return reportFailure("Current input", status);

    for (const auto& input : inputs) {
        std::cout << (input.name == current.name ? " * " : "   ") << input.name;
        if (input.friendlyName != input.name) std::cout << " (" << input.friendlyName << ")";
        std::cout << std::endl;
    }
    return 0;
}

void printNode(const SmartCast::SettingsNode& node) {
    std::cout << "  " << node.path << " [" << SmartCast::toString(node.type) << "]";
    if (node.name != node.cname) std::cout << " \"" << node.name << "\"";
    if (node.value) std::cout << " = " << SmartCast::toString(*node.value);
    if (node.readOnly) std::cout << " (read-only)";
    if (node.hidden) std::cout << " (hidden)";
    if (node.range) {
        std::cout << " range " << node.range->minimum << ".." << node.range->maximum
                  << " step " << node.range->increment;
    }
    if (!node.elements.empty()) {
        std::cout << " {";
        for (size_t i = 0; i < node.elements.size(); ++i) std::cout << (i ? ", " : "") << node.elements[i];
        std::cout << "}";
    }
    std::cout << std::endl;
}

// Settings paths are relative to the device's settings root
void refreshSettingsRoot(SmartCast::DeviceSession& session) {
    SmartCast::DeviceInfo info;
    SmartCast::Status status = session.getDeviceInfo(info, &g_interrupted);
    if (!status && SmartCast::verboseLogging()) {
        std::cerr << "[main] Using settings root " << session.settingsRoot() << ": " << status.describe() << std::endl;
    }
}

int runSettings(const CliConfig& config, SmartCast::DeviceSession& session) {
    std::string path = config.args.size() > 1 ? config.args[1] : std::string();
    refreshSettingsRoot(session);
    std::vector<SmartCast::SettingsNode> nodes;
    SmartCast::Status status = session.readSettings(path, nodes, &g_interrupted);
    if (!status) return reportFailure("Settings read", status);
    for (auto& node : nodes) {
        if (nodes.size() == 1) {
            SmartCast::Status constraints = session.readSettingConstraints(node, &g_interrupted);
            if (!constraints && SmartCast::verboseLogging()) {
                std::cerr << "[main] No constraints for " << node.path << ": " << constraints.describe() << std::endl;
            }
        }
        printNode(node);
    }
    return 0;
}

int runWrite(const CliConfig& config, SmartCast::DeviceSession& session) {
    if (config.args.size() < 3) {
        printUsage();
        return 2;
    }
    const std::string& path = config.args[1];
    const std::string& text = config.args[2];

    refreshSettingsRoot(session);
    std::vector<SmartCast::SettingsNode> nodes;
    SmartCast::Status status = session.readSettings(path, nodes, &g_interrupted);
    if (!status) return reportFailure("Settings read", status);

    const std::string wanted = SmartCast::joinSettingsPath(path, "");
    SmartCast::SettingsNode* node = nullptr;
    for (auto& candidate : nodes) {
        if (candidate.path == wanted) node = &candidate;
    }
    if (!node) {
        std::cerr << "[main] " << path << " is not a single setting" << std::endl;
        return 1;
    }

    status = session.readSettingConstraints(*node, &g_interrupted);
    if (!status) return reportFailure("Constraint read", status);

    SmartCast::SettingValue value;
    if (!SmartCast::parseSettingValue(*node, text, value)) {
        std::cerr << "[main] '" << text << "' is not a valid " << SmartCast::toString(node->type)
                  << " value for " << node->path << std::endl;
        return 1;
    }
    status = session.writeSetting(*node, value, &g_interrupted);
    if (!status) return reportFailure("Settings write", status);
    std::cout << node->path << " = " << SmartCast::toString(value) << std::endl;
    return 0;
}

int runKey(const CliConfig& config, SmartCast::DeviceSession& session) {
    if (config.args.size() < 2) {
        printUsage();
        return 2;
    }
    SmartCast::RemoteKey key;
    if (!SmartCast::parseRemoteKey(config.args[1], key)) {
        std::cerr << "[main] Unknown key '" << config.args[1] << "'; see 'smartcast keys'" << std::endl;
        return 2;
    }
    SmartCast::KeyAction action = SmartCast::KeyAction::Press;
    if (config.args.size() > 2 && !SmartCast::parseKeyAction(config.args[2], action)) {
        std::cerr << "[main] Unknown key action '" << config.args[2] << "'" << std::endl;
        return 2;
    }
    SmartCast::Status status = session.sendKey(key, action, &g_interrupted);
    if (!status) return reportFailure("Key", status);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CliConfig config;
    if (!loadConfig(argc, argv, config)) {
        printUsage();
        return 2;
    }
    if (config.verbose) SmartCast::setVerboseLogging(true);
    if (config.args.empty() || config.args[0] == "help" || config.args[0] == "--help") {
        printUsage();
        return config.args.empty() ? 2 : 0;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string& command = config.args[0];
    if (command == "discover") return runDiscover(config);
    if (command == "keys") {
        for (auto key : SmartCast::allRemoteKeys()) std::cout << "  " << SmartCast::keyName(key) << std::endl;
        return 0;
    }

    static const char* const sessionCommands[] = {
        "pair", "state", "info", "inputs", "input", "settings", "write", "key",
    };
    bool known = false;
    for (const char* name : sessionCommands) known = known || command == name;
    if (!known) {
        std::cerr << "[main] Unknown command: " << command << std::endl;
        printUsage();
        return 2;
    }

    auto transport = std::make_shared<SmartCast::CurlTransport>();
    auto session = openSession(config, transport);
    if (!session) return 1;

    if (command == "pair") return runPair(config, *session);
    if (command == "state") return runState(*session);
    if (command == "info") return runInfo(*session);
    if (command == "inputs") return runInputs(*session);
    if (command == "input") {
        if (config.args.size() < 2) {
            printUsage();
            return 2;
        }
        SmartCast::Status status = session->changeInput(config.args[1], &g_interrupted);
        return status ? 0 : reportFailure("Input change", status);
    }
    if (command == "settings") return runSettings(config, *session);
    if (command == "write") return runWrite(config, *session);
    return runKey(config, *session);
}
