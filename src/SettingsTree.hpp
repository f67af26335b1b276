// SettingsTree.hpp
// Decoding and client-side validation of SmartCast menu_native settings nodes.
#pragma once

#include "SmartCastProtocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace SmartCast {

enum class SettingType {
    Slider,  // T_VALUE_ABS_V1
    List,    // T_LIST_V1
    XList,   // T_LIST_X_V1
    Value,   // T_VALUE_V1
    Menu,    // T_MENU_V1
    Other
};

const char* toString(SettingType type);
SettingType settingTypeFromTag(const std::string& tag);

// A choice out of a List/XList node's elements
struct EnumValue {
    std::string name;
    bool operator==(const EnumValue& other) const { return name == other.name; }
    bool operator!=(const EnumValue& other) const { return !(*this == other); }
};

using SettingValue = std::variant<bool, std::int64_t, EnumValue, std::string>;

struct SliderRange {
    std::int64_t minimum{0};
    std::int64_t maximum{0};
    std::int64_t increment{1};
    std::int64_t center{0};
    std::string decMarker;
    std::string incMarker;
};

struct SettingsNode {
    std::string name;
    std::string cname;    // Path segment
    std::string path;     // Full path below the settings root, "picture/brightness"
    std::string group;    // Path of the menu this node was read from
    SettingType type{SettingType::Other};
    std::string typeTag;  // Raw TYPE, kept for Other
    std::optional<SettingValue> value;
    std::optional<std::uint32_t> hashval;
    bool hidden{false};
    bool readOnly{false};
    std::optional<SliderRange> range;
    std::vector<std::string> elements;
};

// Device fields are loosely typed: integers arrive as numbers or numeric strings.
// Whole floats are accepted, anything else is nullopt.
std::optional<std::int64_t> asInteger(const nlohmann::json& raw);

// True when writes to the node need a static read first (slider range, list elements)
bool needsConstraints(const SettingsNode& node);

// "a/b" + "c" -> "a/b/c"; tolerates stray slashes on either side
std::string joinSettingsPath(const std::string& parent, const std::string& child);
std::string dynamicSettingsPath(const std::string& root, const std::string& path);
std::string staticSettingsPath(const std::string& root, const std::string& path);

// Decodes ITEMS[] of a dynamic read at requestedPath. Reading a leaf returns the
// leaf itself, which keeps requestedPath instead of growing a duplicate segment.
Status decodeSettingsItems(const nlohmann::json& items,
                           const std::string& requestedPath,
                           std::vector<SettingsNode>& out);

// Maps a raw VALUE onto the closed variant set for the given node type.
std::optional<SettingValue> decodeSettingValue(const nlohmann::json& raw, SettingType type);

// Merges a static (constraints) read into the node: slider range and/or elements.
Status applyStaticConstraints(const nlohmann::json& items, SettingsNode& node);

// InvalidValue when the node cannot be written with this value.
Status validateSettingValue(const SettingsNode& node, const SettingValue& value);

nlohmann::json toJson(const SettingValue& value);
std::string toString(const SettingValue& value);

// Reads command-line text as a value suitable for the node's type.
bool parseSettingValue(const SettingsNode& node, const std::string& text, SettingValue& out);

} // namespace SmartCast
