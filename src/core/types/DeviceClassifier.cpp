#include "core/types/DeviceClassifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

namespace vlanvision::core {

namespace {

std::string toLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> tokenize(const std::string& lower) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += c;
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool hasToken(const std::vector<std::string>& tokens, std::string_view word) {
    return std::find(tokens.begin(), tokens.end(), word) != tokens.end();
}

// Matches model tokens such as "ex4300" or "srx300".
bool hasModelToken(const std::vector<std::string>& tokens, std::string_view family) {
    return std::any_of(tokens.begin(), tokens.end(), [family](const std::string& token) {
        if (token == family) {
            return true;
        }
        return token.size() > family.size() && token.compare(0, family.size(), family) == 0 &&
               std::isdigit(static_cast<unsigned char>(token[family.size()]));
    });
}

bool containsAny(const std::string& lower, std::initializer_list<std::string_view> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&lower](std::string_view needle) { return lower.find(needle) != std::string::npos; });
}

DeviceClass classifyDescription(const std::string& lower) {
    auto tokens = tokenize(lower);
    bool junos = hasToken(tokens, "junos") || hasToken(tokens, "juniper");

    if (containsAny(lower, {"firewall", "fortigate", "palo alto", "pan-os", "adaptive security"}) ||
        hasToken(tokens, "asa") || hasToken(tokens, "pix") || hasModelToken(tokens, "srx")) {
        return DeviceClass::Firewall;
    }
    if (containsAny(lower, {"router", "ios xr", "ios-xr", "routeros"}) ||
        (junos && !hasModelToken(tokens, "ex") && !hasModelToken(tokens, "qfx"))) {
        return DeviceClass::Router;
    }
    if (containsAny(lower, {"switch", "catalyst", "nexus", "procurve", "ex series"}) ||
        hasModelToken(tokens, "ex") || hasModelToken(tokens, "qfx") || hasToken(tokens, "eos")) {
        return DeviceClass::Switch;
    }
    if (containsAny(lower, {"access point", "aironet", "wlan"}) || hasToken(tokens, "ap")) {
        return DeviceClass::AccessPoint;
    }
    if (containsAny(lower, {"linux", "windows", "server", "freebsd"})) {
        return DeviceClass::Server;
    }
    return DeviceClass::Unknown;
}

// Hostname prefixes commonly used when a device hides its sysDescr.
DeviceClass classifyHostname(const std::string& lower) {
    auto tokens = tokenize(lower);
    if (hasToken(tokens, "fw") || hasModelToken(tokens, "fw")) {
        return DeviceClass::Firewall;
    }
    if (hasToken(tokens, "rtr") || hasModelToken(tokens, "rtr") || hasToken(tokens, "gw")) {
        return DeviceClass::Router;
    }
    if (hasToken(tokens, "sw") || hasModelToken(tokens, "sw")) {
        return DeviceClass::Switch;
    }
    if (hasToken(tokens, "ap") || hasModelToken(tokens, "ap") || hasToken(tokens, "wap")) {
        return DeviceClass::AccessPoint;
    }
    if (hasToken(tokens, "srv") || hasModelToken(tokens, "srv")) {
        return DeviceClass::Server;
    }
    return DeviceClass::Unknown;
}

struct EnterpriseVendor {
    std::string_view number;
    std::string_view vendor;
};

constexpr std::array<EnterpriseVendor, 10> kEnterpriseVendors{{
    {"9", "Cisco"},
    {"2636", "Juniper"},
    {"30065", "Arista"},
    {"11", "HP"},
    {"14823", "Aruba"},
    {"674", "Dell"},
    {"14988", "MikroTik"},
    {"41112", "Ubiquiti"},
    {"12356", "Fortinet"},
    {"25461", "Palo Alto"},
}};

} // namespace

Classification DeviceClassifier::classify(const std::string& sysDescr, const std::string& sysObjectId,
                                          const std::string& hostname) {
    Classification result;
    result.vendor = detectVendor(sysDescr, sysObjectId);
    result.deviceClass = classifyDescription(toLower(sysDescr));

    if (result.deviceClass == DeviceClass::Unknown && result.vendor == "Fortinet") {
        result.deviceClass = DeviceClass::Firewall;
    }
    if (result.deviceClass == DeviceClass::Unknown && result.vendor == "Palo Alto") {
        result.deviceClass = DeviceClass::Firewall;
    }
    if (result.deviceClass == DeviceClass::Unknown && !hostname.empty()) {
        result.deviceClass = classifyHostname(toLower(hostname));
    }
    return result;
}

std::string DeviceClassifier::detectVendor(const std::string& sysDescr, const std::string& sysObjectId) {
    static const std::vector<std::pair<std::string, std::vector<std::string_view>>> patterns = {
        {"Cisco", {"cisco", "catalyst", "aironet"}},
        {"Juniper", {"juniper", "junos"}},
        {"Arista", {"arista"}},
        {"HP", {"procurve", "hewlett", "hp "}},
        {"Aruba", {"aruba"}},
        {"Dell", {"dell", "force10"}},
        {"MikroTik", {"mikrotik", "routeros"}},
        {"Ubiquiti", {"ubiquiti", "unifi", "edgeos"}},
        {"Fortinet", {"fortinet", "fortigate"}},
        {"Palo Alto", {"palo alto", "pan-os"}},
    };

    auto lower = toLower(sysDescr);
    for (const auto& [vendor, needles] : patterns) {
        for (auto needle : needles) {
            if (lower.find(needle) != std::string::npos) {
                return vendor;
            }
        }
    }

    // sysObjectID is 1.3.6.1.4.1.<enterprise>...
    constexpr std::string_view enterprises = "1.3.6.1.4.1.";
    std::string_view oid = sysObjectId;
    if (!oid.empty() && oid.front() == '.') {
        oid.remove_prefix(1);
    }
    if (oid.substr(0, enterprises.size()) == enterprises) {
        auto rest = oid.substr(enterprises.size());
        auto number = rest.substr(0, rest.find('.'));
        for (const auto& entry : kEnterpriseVendors) {
            if (entry.number == number) {
                return std::string(entry.vendor);
            }
        }
    }
    return {};
}

DeviceRole DeviceClassifier::roleFor(const std::string& hostname, DeviceClass deviceClass) {
    auto lower = toLower(hostname);
    auto tokens = tokenize(lower);

    if (containsAny(lower, {"core", "backbone"})) {
        return DeviceRole::Core;
    }
    if (containsAny(lower, {"dist"})) {
        return DeviceRole::Distribution;
    }
    if (containsAny(lower, {"access"}) || hasToken(tokens, "acc") || hasModelToken(tokens, "acc")) {
        return DeviceRole::Access;
    }
    if (containsAny(lower, {"edge", "wan", "dmz", "internet"})) {
        return DeviceRole::Edge;
    }
    if (containsAny(lower, {"server"}) || hasToken(tokens, "srv") || hasModelToken(tokens, "srv")) {
        return DeviceRole::Server;
    }

    switch (deviceClass) {
    case DeviceClass::Router:
    case DeviceClass::Firewall:
        return DeviceRole::Edge;
    case DeviceClass::Switch:
        return DeviceRole::Access;
    case DeviceClass::Server:
        return DeviceRole::Server;
    case DeviceClass::AccessPoint:
    case DeviceClass::Unknown:
        break;
    }
    return DeviceRole::Endpoint;
}

} // namespace vlanvision::core
