// SettingsTree.cpp
#include "SettingsTree.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace SmartCast {

namespace {

bool asFlag(const nlohmann::json& raw) {
    if (raw.is_boolean()) return raw.get<bool>();
    if (raw.is_string()) return toLower(trim(raw.get<std::string>())) == "true";
    if (raw.is_number_integer()) return raw.get<std::int64_t>() != 0;
    return false;
}

std::string stringField(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::string lastSegment(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) return "";
    size_t start = path.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

std::string parentPath(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) return "";
    size_t slash = path.find_last_of('/', end);
    if (slash == std::string::npos) return "";
    return path.substr(0, slash);
}

std::vector<std::string> decodeElements(const nlohmann::json& item) {
    std::vector<std::string> out;
    auto it = item.find("ELEMENTS");
    if (it == item.end() || !it->is_array()) return out;
    for (const auto& element : *it) {
        if (element.is_string()) out.push_back(element.get<std::string>());
        else if (element.is_object()) {
            std::string name = stringField(element, "NAME");
            if (!name.empty()) out.push_back(name);
        }
    }
    return out;
}

std::optional<SliderRange> decodeSliderRange(const nlohmann::json& item) {
    auto minimum = item.find("MINIMUM");
    auto maximum = item.find("MAXIMUM");
    if (minimum == item.end() || maximum == item.end()) return std::nullopt;
    auto lo = asInteger(*minimum);
    auto hi = asInteger(*maximum);
    if (!lo || !hi) return std::nullopt;

    SliderRange range;
    range.minimum = *lo;
    range.maximum = *hi;
    auto inc = item.find("INCREMENT");
    if (inc != item.end()) {
        if (auto v = asInteger(*inc)) range.increment = *v;
    }
    auto center = item.find("CENTER");
    if (center != item.end()) {
        if (auto v = asInteger(*center)) range.center = *v;
    }
    range.decMarker = stringField(item, "DECMARKER");
    range.incMarker = stringField(item, "INCMARKER");
    return range;
}

bool decodeNode(const nlohmann::json& item, SettingsNode& node) {
    if (!item.is_object()) return false;
    node.cname = stringField(item, "CNAME");
    if (node.cname.empty()) return false;
    node.name = stringField(item, "NAME");
    if (node.name.empty()) node.name = node.cname;
    node.typeTag = stringField(item, "TYPE");
    node.type = settingTypeFromTag(node.typeTag);

    auto hashval = item.find("HASHVAL");
    if (hashval != item.end()) {
        auto v = asInteger(*hashval);
        if (v && *v >= 0 && *v <= std::numeric_limits<std::uint32_t>::max()) {
            node.hashval = static_cast<std::uint32_t>(*v);
        }
    }
    auto hidden = item.find("HIDDEN");
    if (hidden != item.end()) node.hidden = asFlag(*hidden);
    auto readOnly = item.find("READONLY");
    if (readOnly != item.end()) node.readOnly = asFlag(*readOnly);

    auto value = item.find("VALUE");
    if (value != item.end() && !value->is_null()) {
        node.value = decodeSettingValue(*value, node.type);
    }
    node.elements = decodeElements(item);
    if (node.type == SettingType::Slider) node.range = decodeSliderRange(item);
    return true;
}

bool parseBool(const std::string& text, bool& out) {
    std::string v = toLower(trim(text));
    if (v == "true" || v == "on" || v == "1" || v == "yes") { out = true; return true; }
    if (v == "false" || v == "off" || v == "0" || v == "no") { out = false; return true; }
    return false;
}

} // anonymous namespace

std::optional<std::int64_t> asInteger(const nlohmann::json& raw) {
    if (raw.is_number_integer()) return raw.get<std::int64_t>();
    if (raw.is_number_float()) {
        double d = raw.get<double>();
        if (std::isfinite(d) && d == std::floor(d)) return static_cast<std::int64_t>(d);
        return std::nullopt;
    }
    if (raw.is_string()) {
        const std::string text = trim(raw.get<std::string>());
        if (text.empty()) return std::nullopt;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(text.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0') return std::nullopt;
        return static_cast<std::int64_t>(v);
    }
    return std::nullopt;
}

bool needsConstraints(const SettingsNode& node) {
    switch (node.type) {
        case SettingType::Slider: return !node.range.has_value();
        case SettingType::List:
        case SettingType::XList: return node.elements.empty();
        default: return false;
    }
}

const char* toString(SettingType type) {
    switch (type) {
        case SettingType::Slider: return "Slider";
        case SettingType::List:   return "List";
        case SettingType::XList:  return "XList";
        case SettingType::Value:  return "Value";
        case SettingType::Menu:   return "Menu";
        case SettingType::Other:  return "Other";
    }
    return "Other";
}

SettingType settingTypeFromTag(const std::string& tag) {
    std::string t = toUpper(tag);
    if (t == "T_VALUE_ABS_V1") return SettingType::Slider;
    if (t == "T_LIST_V1") return SettingType::List;
    if (t == "T_LIST_X_V1") return SettingType::XList;
    if (t == "T_VALUE_V1") return SettingType::Value;
    if (t == "T_MENU_V1") return SettingType::Menu;
    return SettingType::Other;
}

std::string joinSettingsPath(const std::string& parent, const std::string& child) {
    auto strip = [](const std::string& s) {
        size_t start = s.find_first_not_of('/');
        if (start == std::string::npos) return std::string();
        size_t end = s.find_last_not_of('/');
        return s.substr(start, end - start + 1);
    };
    std::string a = strip(parent);
    std::string b = strip(child);
    if (a.empty()) return b;
    if (b.empty()) return a;
    return a + "/" + b;
}

std::string dynamicSettingsPath(const std::string& root, const std::string& path) {
    return std::string(Endpoints::DynamicMenu) + joinSettingsPath(root, path);
}

std::string staticSettingsPath(const std::string& root, const std::string& path) {
    return std::string(Endpoints::StaticMenu) + joinSettingsPath(root, path);
}

Status decodeSettingsItems(const nlohmann::json& items,
                           const std::string& requestedPath,
                           std::vector<SettingsNode>& out) {
    out.clear();
    if (!items.is_array()) {
        return Status::error(ErrorKind::Protocol, "Settings ITEMS is not an array");
    }

    const std::string requested = joinSettingsPath(requestedPath, "");
    const std::string leaf = lastSegment(requested);

    for (const auto& item : items) {
        SettingsNode node;
        if (!decodeNode(item, node)) {
            return Status::error(ErrorKind::Protocol, "Settings item without CNAME at " + requested);
        }
        node.path = joinSettingsPath(requested, node.cname);
        node.group = requested;
        out.push_back(std::move(node));
    }

    if (out.size() == 1 && out[0].type != SettingType::Menu && !leaf.empty() && out[0].cname == leaf) {
        out[0].path = requested;
        out[0].group = parentPath(requested);
    }
    return Status::success();
}

std::optional<SettingValue> decodeSettingValue(const nlohmann::json& raw, SettingType type) {
    switch (type) {
        case SettingType::Menu:
            return std::nullopt;
        case SettingType::Slider: {
            auto v = asInteger(raw);
            if (v) return SettingValue(*v);
            return std::nullopt;
        }
        case SettingType::List:
        case SettingType::XList:
            if (raw.is_string()) return SettingValue(EnumValue{raw.get<std::string>()});
            if (raw.is_number()) return SettingValue(EnumValue{raw.dump()});
            return std::nullopt;
        case SettingType::Value:
        case SettingType::Other:
            break;
    }

    if (raw.is_boolean()) return SettingValue(raw.get<bool>());
    if (raw.is_number_integer()) return SettingValue(raw.get<std::int64_t>());
    if (raw.is_number_float()) {
        auto v = asInteger(raw);
        if (v) return SettingValue(*v);
        return SettingValue(raw.dump());
    }
    if (raw.is_string()) return SettingValue(raw.get<std::string>());
    if (raw.is_object()) {
        // Input-style values carry their display text in NAME
        std::string name = stringField(raw, "NAME");
        if (!name.empty()) return SettingValue(name);
    }
    return std::nullopt;
}

Status applyStaticConstraints(const nlohmann::json& items, SettingsNode& node) {
    if (!items.is_array() || items.empty()) {
        return Status::error(ErrorKind::Protocol, "Static read of " + node.path + " returned no ITEMS");
    }

    const nlohmann::json* match = &items[0];
    for (const auto& item : items) {
        if (item.is_object() && stringField(item, "CNAME") == node.cname) {
            match = &item;
            break;
        }
    }
    if (!match->is_object()) {
        return Status::error(ErrorKind::Protocol, "Static item for " + node.path + " is not an object");
    }

    if (node.type == SettingType::Slider) {
        auto range = decodeSliderRange(*match);
        if (!range) {
            return Status::error(ErrorKind::Protocol, "No slider range for " + node.path);
        }
        node.range = range;
    }
    if (node.type == SettingType::List || node.type == SettingType::XList) {
        auto elements = decodeElements(*match);
        if (elements.empty()) {
            return Status::error(ErrorKind::Protocol, "No elements for " + node.path);
        }
        node.elements = std::move(elements);
    }
    return Status::success();
}

Status validateSettingValue(const SettingsNode& node, const SettingValue& value) {
    if (node.readOnly) {
        return Status::error(ErrorKind::InvalidValue, node.path + " is read-only");
    }
    if (node.type == SettingType::Menu) {
        return Status::error(ErrorKind::InvalidValue, node.path + " is a menu, not a value");
    }
    if (!node.hashval) {
        return Status::error(ErrorKind::InvalidValue, node.path + " has no HASHVAL; read it before writing");
    }

    switch (node.type) {
        case SettingType::Slider: {
            const auto* number = std::get_if<std::int64_t>(&value);
            if (!number) {
                return Status::error(ErrorKind::InvalidValue, node.path + " expects an integer");
            }
            if (node.range) {
                const SliderRange& r = *node.range;
                if (*number < r.minimum || *number > r.maximum) {
                    return Status::error(ErrorKind::InvalidValue,
                                         node.path + " value " + std::to_string(*number) + " outside ["
                                         + std::to_string(r.minimum) + ", " + std::to_string(r.maximum) + "]");
                }
                if (r.increment > 0 && (*number - r.minimum) % r.increment != 0) {
                    return Status::error(ErrorKind::InvalidValue,
                                         node.path + " value " + std::to_string(*number)
                                         + " is not a multiple of increment " + std::to_string(r.increment));
                }
            }
            return Status::success();
        }
        case SettingType::List:
        case SettingType::XList: {
            const auto* choice = std::get_if<EnumValue>(&value);
            if (!choice) {
                return Status::error(ErrorKind::InvalidValue, node.path + " expects one of its elements");
            }
            if (!node.elements.empty()) {
                for (const auto& element : node.elements) {
                    if (element == choice->name) return Status::success();
                }
                return Status::error(ErrorKind::InvalidValue,
                                     "'" + choice->name + "' is not an element of " + node.path);
            }
            return Status::success();
        }
        case SettingType::Value:
        case SettingType::Other:
            if (std::holds_alternative<EnumValue>(value)) {
                return Status::error(ErrorKind::InvalidValue, node.path + " is not a list setting");
            }
            if (node.value && node.value->index() != value.index()) {
                return Status::error(ErrorKind::InvalidValue,
                                     node.path + " expects a value of the same kind as " + toString(*node.value));
            }
            return Status::success();
        case SettingType::Menu:
            break;
    }
    return Status::error(ErrorKind::InvalidValue, node.path + " cannot be written");
}

nlohmann::json toJson(const SettingValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
    if (const auto* e = std::get_if<EnumValue>(&value)) return e->name;
    return std::get<std::string>(value);
}

std::string toString(const SettingValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const auto* i = std::get_if<std::int64_t>(&value)) return std::to_string(*i);
    if (const auto* e = std::get_if<EnumValue>(&value)) return e->name;
    return std::get<std::string>(value);
}

bool parseSettingValue(const SettingsNode& node, const std::string& text, SettingValue& out) {
    switch (node.type) {
        case SettingType::Menu:
            return false;
        case SettingType::Slider: {
            auto v = asInteger(nlohmann::json(text));
            if (!v) return false;
            out = *v;
            return true;
        }
        case SettingType::List:
        case SettingType::XList: {
            std::string wanted = trim(text);
            // Use the device's spelling when the user typed it in another case
            for (const auto& element : node.elements) {
                if (toLower(element) == toLower(wanted)) {
                    out = EnumValue{element};
                    return true;
                }
            }
            out = EnumValue{wanted};
            return true;
        }
        case SettingType::Value:
        case SettingType::Other:
            break;
    }

    if (node.value) {
        if (std::holds_alternative<bool>(*node.value)) {
            bool b = false;
            if (!parseBool(text, b)) return false;
            out = b;
            return true;
        }
        if (std::holds_alternative<std::int64_t>(*node.value)) {
            auto v = asInteger(nlohmann::json(text));
            if (!v) return false;
            out = *v;
            return true;
        }
        out = text;
        return true;
    }

    bool b = false;
    if (parseBool(text, b) && (toLower(trim(text)) == "true" || toLower(trim(text)) == "false")) {
        out = b;
        return true;
    }
    if (auto v = asInteger(nlohmann::json(text))) {
        out = *v;
        return true;
    }
    out = text;
    return true;
}

} // namespace SmartCast
