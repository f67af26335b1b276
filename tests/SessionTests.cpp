#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../src/DeviceSession.hpp"
#include "MockTransport.hpp"

using namespace SmartCast;

static DeviceDescriptor testDevice() {
    DeviceDescriptor d;
    d.identifier = "8a2b6c1e-0000-4000-8000-00259e5f1f0a";
    d.host = "10.0.0.5";
    d.port = 7345;
    d.friendlyName = "Living Room";
    return d;
}

static SessionOptions testOptions() {
    SessionOptions options;
    options.clientId = "test-client-01";
    options.timeoutMs = 500;
    return options;
}

// Pairs a fresh session against the simulated device
static bool pair(DeviceSession& session, const SimulatedDevice& device) {
    return session.beginPair("unit-test").ok() && session.submitPin(device.pin).ok();
}

static SettingsNode nodeNamed(const std::vector<SettingsNode>& nodes, const std::string& cname) {
    for (const auto& node : nodes) {
        if (node.cname == cname) return node;
    }
    return SettingsNode();
}

int main(){
    int failures = 0;

    // Test 1: nothing authenticated leaves the process while Unpaired
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());

        SettingsNode node;
        node.path = "picture/brightness";
        node.type = SettingType::Slider;
        node.hashval = 1;
        std::vector<SettingsNode> nodes;
        std::vector<InputSource> inputs;
        InputSource input;

        std::vector<std::pair<const char*, Status>> results = {
            {"readSettings", session.readSettings("picture", nodes)},
            {"readSettingConstraints", session.readSettingConstraints(node)},
            {"writeSetting", session.writeSetting(node, SettingValue(std::int64_t(10)))},
            {"sendKey", session.sendKey(RemoteKey::VolumeUp)},
            {"sendKeys", session.sendKeys({{RemoteKey::Up, KeyAction::Down}, {RemoteKey::Up, KeyAction::Up}})},
            {"currentInput", session.currentInput(input)},
            {"listInputs", session.listInputs(inputs)},
            {"changeInput", session.changeInput("HDMI-2")},
            {"submitPin", session.submitPin("1234")},
        };
        for (const auto& r : results) {
            if (r.second.kind != ErrorKind::NotAuthenticated) {
                std::cerr << "[FAIL] " << r.first << " while Unpaired: " << r.second.describe() << "\n";
                ++failures;
            }
        }
        if (transport->callCount() != 0) {
            std::cerr << "[FAIL] " << transport->callCount() << " request(s) sent while Unpaired\n";
            ++failures;
        }
    }

    // Test 2: pairing happy path
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());

        Status begin = session.beginPair("Kitchen Tablet");
        PairingState afterBegin = session.state();
        const auto* pairing = std::get_if<Pairing>(&afterBegin);
        if (!begin || !pairing || pairing->processId != device.processId || pairing->challengeType != device.challengeType) {
            std::cerr << "[FAIL] beginPair: " << begin.describe() << " state=" << toString(afterBegin) << "\n";
            ++failures;
        }
        HttpRequest start = transport->lastRequest();
        nlohmann::json startBody = nlohmann::json::parse(start.body, nullptr, false);
        if (requestPath(start.url) != "/pairing/start" || start.method != HttpMethod::Put
            || startBody.value("DEVICE_NAME", "") != "Kitchen Tablet"
            || startBody.value("DEVICE_ID", "") != "test-client-01" || !authHeader(start).empty()) {
            std::cerr << "[FAIL] pairing start request: " << start.body << "\n";
            ++failures;
        }

        Status again = session.beginPair("Kitchen Tablet");
        if (again.kind != ErrorKind::PairAlreadyInProgress || transport->callCount() != 1) {
            std::cerr << "[FAIL] second beginPair: " << again.describe() << "\n";
            ++failures;
        }

        Status submit = session.submitPin(" 1234 ");
        PairingState afterSubmit = session.state();
        const auto* paired = std::get_if<Paired>(&afterSubmit);
        if (!submit || !paired || paired->token != device.issuedToken || session.token() != device.issuedToken) {
            std::cerr << "[FAIL] submitPin: " << submit.describe() << " state=" << toString(afterSubmit) << "\n";
            ++failures;
        }
        nlohmann::json pairBody = nlohmann::json::parse(transport->lastRequest().body, nullptr, false);
        if (pairBody.value("RESPONSE_VALUE", "") != "1234"
            || pairBody.value("PAIRING_REQ_TOKEN", 0u) != device.processId
            || pairBody.value("CHALLENGE_TYPE", 0) != device.challengeType) {
            std::cerr << "[FAIL] pairing finish body: " << pairBody.dump() << "\n";
            ++failures;
        }
    }

    // Test 3: wrong PIN rejects and forgets the process id
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        session.beginPair("unit-test");

        Status rejected = session.submitPin("0000");
        if (rejected.kind != ErrorKind::PairRejected || rejected.code != "PAIRING_DENIED"
            || !std::holds_alternative<Unpaired>(session.state())) {
            std::cerr << "[FAIL] wrong PIN: " << rejected.describe() << "\n";
            ++failures;
        }
        size_t before = transport->callCount();
        Status stale = session.submitPin(device.pin);
        if (stale.kind != ErrorKind::NotAuthenticated || transport->callCount() != before) {
            std::cerr << "[FAIL] submitPin after rejection: " << stale.describe() << "\n";
            ++failures;
        }
    }

    // Test 4: transport failure and cancellation keep the pairing open
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        session.beginPair("unit-test");

        transport->setHandler([](const HttpRequest&) { return MockTransport::failure("CURL error: Timeout was reached"); });
        Status lost = session.submitPin(device.pin);
        if (lost.kind != ErrorKind::Transport || !std::holds_alternative<Pairing>(session.state())) {
            std::cerr << "[FAIL] transport failure during submitPin: " << lost.describe() << "\n";
            ++failures;
        }

        transport->setHandler(device.handler());
        std::atomic<bool> cancel{true};
        Status cancelled = session.submitPin(device.pin, &cancel);
        if (cancelled.kind != ErrorKind::Transport || !cancelled.cancelled
            || !std::holds_alternative<Pairing>(session.state())) {
            std::cerr << "[FAIL] cancelled submitPin: " << cancelled.describe() << "\n";
            ++failures;
        }

        Status retry = session.submitPin(device.pin);
        if (!retry || !session.isPaired()) {
            std::cerr << "[FAIL] retry after transport failure: " << retry.describe() << "\n";
            ++failures;
        }
    }

    // Test 5: cancelPair notifies the device and always ends Unpaired
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        session.beginPair("unit-test");
        session.cancelPair();
        HttpRequest cancel = transport->lastRequest();
        nlohmann::json body = nlohmann::json::parse(cancel.body, nullptr, false);
        if (requestPath(cancel.url) != "/pairing/cancel" || body.value("RESPONSE_VALUE", "") != "1111"
            || body.value("PAIRING_REQ_TOKEN", 0u) != device.processId
            || !std::holds_alternative<Unpaired>(session.state())) {
            std::cerr << "[FAIL] cancelPair request/state\n";
            ++failures;
        }

        session.beginPair("unit-test");
        transport->setHandler([](const HttpRequest&) { return MockTransport::failure("unreachable"); });
        session.cancelPair();
        if (!std::holds_alternative<Unpaired>(session.state())) {
            std::cerr << "[FAIL] cancelPair with a dead network left state " << toString(session.state()) << "\n";
            ++failures;
        }

        size_t before = transport->callCount();
        session.cancelPair();
        if (transport->callCount() != before) {
            std::cerr << "[FAIL] cancelPair outside Pairing sent a request\n";
            ++failures;
        }
    }

    // Test 6: write validation and exact write request
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        if (!pair(session, device)) {
            std::cerr << "[FAIL] pairing for write test\n";
            ++failures;
        }

        std::vector<SettingsNode> nodes;
        Status read = session.readSettings("picture", nodes);
        SettingsNode brightness = nodeNamed(nodes, "brightness");
        SettingsNode mode = nodeNamed(nodes, "picture_mode");
        Status constraints = session.readSettingConstraints(brightness);
        Status elements = session.readSettingConstraints(mode);
        if (!read || !constraints || !elements || !brightness.range || mode.elements.empty()) {
            std::cerr << "[FAIL] reading picture settings: " << read.describe() << " / "
                      << constraints.describe() << " / " << elements.describe() << "\n";
            ++failures;
        }

        size_t before = transport->callCount();
        Status outOfRange = session.writeSetting(brightness, SettingValue(std::int64_t(150)));
        Status notElement = session.writeSetting(mode, SettingValue(EnumValue{"Cinema"}));
        Status wrongKind = session.writeSetting(brightness, SettingValue(EnumValue{"Max"}));
        if (outOfRange.kind != ErrorKind::InvalidValue || notElement.kind != ErrorKind::InvalidValue
            || wrongKind.kind != ErrorKind::InvalidValue || transport->callCount() != before) {
            std::cerr << "[FAIL] invalid writes: " << outOfRange.describe() << " / " << notElement.describe()
                      << " sent " << (transport->callCount() - before) << "\n";
            ++failures;
        }

        const SettingsNode snapshot = brightness;
        Status write = session.writeSetting(brightness, SettingValue(std::int64_t(60)));
        HttpRequest put = transport->lastRequest();
        nlohmann::json body = nlohmann::json::parse(put.body, nullptr, false);
        if (!write || transport->callCount() != before + 1 || put.method != HttpMethod::Put
            || requestPath(put.url) != "/menu_native/dynamic/tv_settings/picture/brightness"
            || body.value("REQUEST", "") != "MODIFY" || body.value("VALUE", 0) != 60
            || body.value("HASHVAL", 0u) != 3000000002u || authHeader(put) != device.issuedToken) {
            std::cerr << "[FAIL] valid write: " << write.describe() << " body=" << put.body << "\n";
            ++failures;
        }
        if (!brightness.value || std::get<std::int64_t>(*brightness.value) != std::get<std::int64_t>(*snapshot.value)
            || !session.isPaired()) {
            std::cerr << "[FAIL] successful write changed local state\n";
            ++failures;
        }

        Status listWrite = session.writeSetting(mode, SettingValue(EnumValue{"Game"}));
        if (!listWrite || device.writes().size() != 2 || device.writes().back().value("VALUE", "") != "Game") {
            std::cerr << "[FAIL] list write: " << listWrite.describe() << "\n";
            ++failures;
        }

        SettingsNode readOnly = nodeNamed(nodes, "model");
        SettingsNode menu;
        session.readSettings("", nodes);
        menu = nodeNamed(nodes, "picture");
        before = transport->callCount();
        if (session.writeSetting(readOnly, SettingValue(std::string("X"))).kind != ErrorKind::InvalidValue
            || session.writeSetting(menu, SettingValue(std::string("X"))).kind != ErrorKind::InvalidValue
            || transport->callCount() != before) {
            std::cerr << "[FAIL] read-only/menu writes should be rejected locally\n";
            ++failures;
        }
    }

    // Test 7: auth rejection drops the session to Unpaired
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);

        device.revokeToken();
        std::vector<SettingsNode> nodes;
        Status revoked = session.readSettings("picture", nodes);
        if (revoked.kind != ErrorKind::Device || revoked.code != "REQUIRES_PAIRING" || !revoked.isAuthRejection()
            || !std::holds_alternative<Unpaired>(session.state())) {
            std::cerr << "[FAIL] revoked token: " << revoked.describe() << " state=" << toString(session.state()) << "\n";
            ++failures;
        }

        session.restoreToken("stale-token");
        transport->setHandler([](const HttpRequest&) { return MockTransport::reply(403, "Forbidden"); });
        Status forbidden = session.sendKey(RemoteKey::Home);
        if (forbidden.code != "http-403" || session.isPaired()) {
            std::cerr << "[FAIL] HTTP 403 on key press: " << forbidden.describe() << "\n";
            ++failures;
        }

        session.restoreToken("good-token");
        transport->setHandler([](const HttpRequest&) {
            return MockTransport::reply(200, R"({"STATUS":{"RESULT":"URI_NOT_FOUND","DETAIL":"No such menu"}})");
        });
        Status missing = session.readSettings("nowhere", nodes);
        if (missing.code != "URI_NOT_FOUND" || !session.isPaired()) {
            std::cerr << "[FAIL] non-auth device error should keep the token: " << missing.describe() << "\n";
            ++failures;
        }
    }

    // Test 8: repeated reads are identical
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);

        std::vector<SettingsNode> first, second;
        Status a = session.readSettings("picture", first);
        Status b = session.readSettings("picture", second);
        bool same = a.ok() && b.ok() && first.size() == second.size() && !first.empty();
        for (size_t i = 0; same && i < first.size(); ++i) {
            same = first[i].path == second[i].path && first[i].name == second[i].name
                && first[i].type == second[i].type && first[i].value == second[i].value
                && first[i].hashval == second[i].hashval && first[i].readOnly == second[i].readOnly;
        }
        if (!same) {
            std::cerr << "[FAIL] readSettings is not repeatable\n";
            ++failures;
        }

        std::vector<SettingsNode> leaf;
        Status leafRead = session.readSettings("picture/brightness", leaf);
        if (!leafRead || leaf.size() != 1 || leaf[0].path != "picture/brightness") {
            std::cerr << "[FAIL] leaf read path: " << leafRead.describe() << "\n";
            ++failures;
        }
    }

    // Test 9: concurrent reads on one paired session
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);
        size_t before = transport->callCount();

        std::atomic<int> errors{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&session, &errors]() {
                for (int i = 0; i < 10; ++i) {
                    std::vector<SettingsNode> nodes;
                    DeviceState state;
                    if (!session.readSettings("picture", nodes).ok() || nodes.size() != 5) ++errors;
                    if (!session.getState(state).ok() || !state.powerOn) ++errors;
                }
            });
        }
        for (auto& thread : threads) thread.join();
        if (errors.load() != 0 || transport->callCount() != before + 80 || !session.isPaired()) {
            std::cerr << "[FAIL] concurrent reads: " << errors.load() << " error(s)\n";
            ++failures;
        }
        for (const auto& request : transport->requests()) {
            if (request.method == HttpMethod::Get && authHeader(request) != device.issuedToken) {
                std::cerr << "[FAIL] concurrent read without the session token\n";
                ++failures;
                break;
            }
        }
    }

    // Test 10: state, device info and settings root
    {
        SimulatedDevice device;
        device.powerMode = 0;
        device.settingsRoot = "audio_settings";
        device.dynamicItems["audio_settings/audio"] = nlohmann::json::array({
            {{"CNAME", "volume"}, {"NAME", "Volume"}, {"TYPE", "T_VALUE_ABS_V1"}, {"VALUE", 12}, {"HASHVAL", 9}},
        });
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());

        DeviceState state;
        Status stateStatus = session.getState(state);
        if (!stateStatus || state.powerOn || state.powerMode != 0 || !authHeader(transport->lastRequest()).empty()) {
            std::cerr << "[FAIL] getState while Unpaired: " << stateStatus.describe() << "\n";
            ++failures;
        }

        DeviceInfo info;
        Status infoStatus = session.getDeviceInfo(info);
        if (!infoStatus || info.modelName != "P65-F1" || info.chipset != 4 || info.inputs.size() != 3
            || info.firmwareVersion != "3.520.13.1-2" || session.settingsRoot() != "audio_settings") {
            std::cerr << "[FAIL] getDeviceInfo: " << infoStatus.describe() << "\n";
            ++failures;
        }

        pair(session, device);
        std::vector<SettingsNode> nodes;
        Status read = session.readSettings("audio", nodes);
        if (!read || nodes.size() != 1
            || requestPath(transport->lastRequest().url) != "/menu_native/dynamic/audio_settings/audio") {
            std::cerr << "[FAIL] settings root not applied: " << read.describe() << "\n";
            ++failures;
        }
    }

    // Test 11: remote keys
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);

        Status press = session.sendKey(RemoteKey::VolumeUp);
        HttpRequest put = transport->lastRequest();
        nlohmann::json expected = {{"KEYLIST", {{{"CODESET", 5}, {"CODE", 1}, {"ACTION", "KEYPRESS"}}}}};
        if (!press || put.method != HttpMethod::Put || requestPath(put.url) != "/key_command/"
            || device.keyPresses().size() != 1 || device.keyPresses()[0] != expected) {
            std::cerr << "[FAIL] sendKey body: " << put.body << "\n";
            ++failures;
        }

        Status batch = session.sendKeys({{RemoteKey::Down, KeyAction::Down}, {RemoteKey::Down, KeyAction::Up}});
        nlohmann::json keys = device.keyPresses().back()["KEYLIST"];
        if (!batch || keys.size() != 2 || keys[0]["ACTION"] != "KEYDOWN" || keys[1]["ACTION"] != "KEYUP") {
            std::cerr << "[FAIL] sendKeys batch\n";
            ++failures;
        }

        size_t before = transport->callCount();
        if (session.sendKeys({}).kind != ErrorKind::InvalidValue || transport->callCount() != before) {
            std::cerr << "[FAIL] empty key list should be rejected locally\n";
            ++failures;
        }
    }

    // Test 12: inputs
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);

        std::vector<InputSource> inputs;
        Status list = session.listInputs(inputs);
        if (!list || inputs.size() != 3 || inputs[0].name != "HDMI-1" || inputs[0].friendlyName != "Apple TV"
            || inputs[1].friendlyName != "HDMI-2") {
            std::cerr << "[FAIL] listInputs: " << list.describe() << "\n";
            ++failures;
        }

        InputSource current;
        Status cur = session.currentInput(current);
        if (!cur || current.name != "HDMI-1" || !current.hashval || *current.hashval != 555) {
            std::cerr << "[FAIL] currentInput: " << cur.describe() << "\n";
            ++failures;
        }

        Status change = session.changeInput("HDMI-2");
        auto writes = device.writes();
        if (!change || writes.empty() || writes.back().value("PATH", "") != "tv_settings/devices/current_input"
            || writes.back().value("VALUE", "") != "HDMI-2" || writes.back().value("HASHVAL", 0) != 555) {
            std::cerr << "[FAIL] changeInput: " << change.describe() << "\n";
            ++failures;
        }
    }

    // Test 13: direct connect probe and stored tokens
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>([&device](const HttpRequest& request) {
            if (request.url.find(":9000/") == std::string::npos) {
                return MockTransport::failure("CURL error: Couldn't connect to server");
            }
            return device.handle(request);
        });
        DeviceDescriptor found;
        Status probe = DeviceSession::probe("10.0.0.9", transport, found, testOptions());
        if (!probe || found.port != 9000 || found.host != "10.0.0.9" || found.identifier != "LTMWQRAP1234567"
            || found.friendlyName != "Living Room" || transport->callCount() != 2) {
            std::cerr << "[FAIL] probe fallback to 9000: " << probe.describe() << "\n";
            ++failures;
        }

        auto noSerial = std::make_shared<MockTransport>([](const HttpRequest&) {
            return MockTransport::reply(200,
                R"({"STATUS":{"RESULT":"SUCCESS"},"ITEMS":[{"CNAME":"deviceinfo","VALUE":{"CAST_NAME":"Old TV"}}]})");
        });
        DeviceDescriptor older;
        Status olderProbe = DeviceSession::probe("10.0.0.11", noSerial, older, testOptions());
        if (!olderProbe || older.identifier != "10.0.0.11" || older.port != 7345 || older.friendlyName != "Old TV") {
            std::cerr << "[FAIL] probe of a device without a serial number: " << olderProbe.describe() << "\n";
            ++failures;
        }

        auto dead = std::make_shared<MockTransport>([](const HttpRequest&) { return MockTransport::failure("refused"); });
        DeviceDescriptor none;
        Status nothing = DeviceSession::probe("10.0.0.10", dead, none, testOptions());
        if (nothing.kind != ErrorKind::Transport || dead->callCount() != 2) {
            std::cerr << "[FAIL] probe with no answer: " << nothing.describe() << "\n";
            ++failures;
        }

        DeviceSession session(testDevice(), transport, testOptions());
        if (session.restoreToken("   ").kind != ErrorKind::InvalidValue || session.isPaired()) {
            std::cerr << "[FAIL] empty token accepted\n";
            ++failures;
        }
        if (!session.restoreToken("Z2zscc1udl") || session.token() != std::string("Z2zscc1udl")) {
            std::cerr << "[FAIL] restoreToken\n";
            ++failures;
        }
        session.forget();
        if (session.isPaired() || session.token()) {
            std::cerr << "[FAIL] forget\n";
            ++failures;
        }

        SessionOptions randomId;
        DeviceSession a(testDevice(), transport, randomId);
        DeviceSession b(testDevice(), transport, randomId);
        const std::string prefix = "smartcast-";
        bool hex = a.clientId().size() == prefix.size() + 16 && a.clientId().compare(0, prefix.size(), prefix) == 0
            && a.clientId().find_first_not_of("0123456789abcdef", prefix.size()) == std::string::npos;
        if (!hex || a.clientId() == b.clientId()) {
            std::cerr << "[FAIL] generated client ids should be unique\n";
            ++failures;
        }
    }

    // Test 14: writes straight after a dynamic read still respect range and elements
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        pair(session, device);

        std::vector<SettingsNode> nodes;
        session.readSettings("picture", nodes);
        SettingsNode brightness = nodeNamed(nodes, "brightness");
        SettingsNode mode = nodeNamed(nodes, "picture_mode");
        if (brightness.range || !mode.elements.empty()) {
            std::cerr << "[FAIL] dynamic read should not carry constraints\n";
            ++failures;
        }

        size_t before = transport->callCount();
        Status tooBright = session.writeSetting(brightness, SettingValue(std::int64_t(9999)));
        HttpRequest lookup = transport->lastRequest();
        if (tooBright.kind != ErrorKind::InvalidValue || !device.writes().empty()
            || transport->callCount() != before + 1 || lookup.method != HttpMethod::Get
            || requestPath(lookup.url) != "/menu_native/static/tv_settings/picture/brightness") {
            std::cerr << "[FAIL] out-of-range write without loaded range: " << tooBright.describe()
                      << " writes=" << device.writes().size() << "\n";
            ++failures;
        }

        Status unknownMode = session.writeSetting(mode, SettingValue(EnumValue{"Cinema"}));
        if (unknownMode.kind != ErrorKind::InvalidValue || !device.writes().empty()) {
            std::cerr << "[FAIL] unknown element without loaded elements: " << unknownMode.describe() << "\n";
            ++failures;
        }

        before = transport->callCount();
        Status write = session.writeSetting(brightness, SettingValue(std::int64_t(60)));
        if (!write || transport->callCount() != before + 2 || device.writes().size() != 1
            || device.writes()[0].value("VALUE", 0) != 60) {
            std::cerr << "[FAIL] valid write without loaded range: " << write.describe() << "\n";
            ++failures;
        }

        SettingsNode orphan = brightness;
        orphan.path = "picture/contrast";
        before = transport->callCount();
        Status noConstraints = session.writeSetting(orphan, SettingValue(std::int64_t(10)));
        if (noConstraints.code != "URI_NOT_FOUND" || device.writes().size() != 1 || transport->callCount() != before + 1) {
            std::cerr << "[FAIL] write with unreadable constraints: " << noConstraints.describe() << "\n";
            ++failures;
        }
    }

    // Test 15: busy or failing devices keep the PIN challenge open
    {
        SimulatedDevice device;
        auto transport = std::make_shared<MockTransport>(device.handler());
        DeviceSession session(testDevice(), transport, testOptions());
        session.beginPair("unit-test");

        transport->setHandler([](const HttpRequest&) {
            return MockTransport::reply(200, R"({"STATUS":{"RESULT":"BUSY","DETAIL":"Try again"}})");
        });
        Status busy = session.submitPin(device.pin);
        if (busy.kind != ErrorKind::Device || busy.code != "BUSY" || !std::holds_alternative<Pairing>(session.state())) {
            std::cerr << "[FAIL] BUSY during submitPin: " << busy.describe() << "\n";
            ++failures;
        }

        transport->setHandler([](const HttpRequest&) { return MockTransport::reply(503, "Service Unavailable"); });
        Status unavailable = session.submitPin(device.pin);
        if (unavailable.kind != ErrorKind::Device || unavailable.code != "http-503"
            || !std::holds_alternative<Pairing>(session.state())) {
            std::cerr << "[FAIL] HTTP 503 during submitPin: " << unavailable.describe() << "\n";
            ++failures;
        }

        transport->setHandler(device.handler());
        Status paired = session.submitPin(device.pin);
        if (!paired || !session.isPaired()) {
            std::cerr << "[FAIL] submitPin after a busy device: " << paired.describe() << "\n";
            ++failures;
        }
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS" << std::endl;
        return 0;
    } else {
        std::cout << failures << " TEST(S) FAILED" << std::endl;
        return 1;
    }
}
