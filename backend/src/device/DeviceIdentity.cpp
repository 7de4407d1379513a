/*
src/device/DeviceIdentity.cpp
Normalisation and classification of device addresses typed by users or
stored in config: loopback emulator ports, adb-over-tcp hosts, usb serials,
and http agents.
*/
#include "device/DeviceIdentity.hpp"
#include "core/DeviceError.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace droidlink {

namespace {

constexpr uint16_t kDefaultAdbTcpPort = 5555;
constexpr uint16_t kDefaultAgentPort = 7912;
constexpr uint16_t kWsaPort = 58526;
const char* kLoopback = "127.0.0.1";

struct PortBand {
    EmulatorFamily family;
    uint16_t low;
    uint16_t high;
};

// Checked in order; the first band containing the port wins.
const PortBand kPortBands[] = {
    { EmulatorFamily::MuMu12, 16384, 17408 },
    { EmulatorFamily::MuMuLegacy, 7555, 7555 },
    { EmulatorFamily::Nox, 62001, 63025 },
    { EmulatorFamily::LDPlayer, 5555, 5587 },
    { EmulatorFamily::Vmos, 5667, 5699 },
    { EmulatorFamily::Wsa, kWsaPort, kWsaPort },
    { EmulatorFamily::ChinacCloud, 301, 309 },
};

struct HostMarker {
    const char* name;
    EmulatorFamily family;
};

const HostMarker kHostMarkers[] = {
    { "mumu", EmulatorFamily::MuMu12 },
    { "mumu12", EmulatorFamily::MuMu12 },
    { "mumu6", EmulatorFamily::MuMuLegacy },
    { "nox", EmulatorFamily::Nox },
    { "ldplayer", EmulatorFamily::LDPlayer },
    { "leidian", EmulatorFamily::LDPlayer },
    { "vmos", EmulatorFamily::Vmos },
    { "bluestacks", EmulatorFamily::BlueStacks },
};

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c); });
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

uint16_t parse_port(const std::string& text) {
    if (!all_digits(text) || text.size() > 5) throw ParseError(errors::D1100_BAD_PORT);
    unsigned long v = std::stoul(text);
    if (v == 0 || v > 65535) throw ParseError(errors::D1100_BAD_PORT);
    return static_cast<uint16_t>(v);
}

bool valid_host(const std::string& host) {
    if (host.empty() || host.front() == '.' || host.back() == '.' || host.front() == '-') return false;
    return std::all_of(host.begin(), host.end(), [](unsigned char c){
        return std::isalnum(c) || c == '.' || c == '-' || c == '_';
    });
}

bool is_loopback(const std::string& host) {
    return starts_with(host, "127.") || host == "localhost";
}

DeviceIdentity parse_http(const std::string& raw, const std::string& s) {
    const std::string scheme = starts_with(lower(s), "https://") ? "https://" : "http://";
    std::string rest = s.substr(scheme.size());
    auto slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);

    std::string host = rest;
    uint16_t port = kDefaultAgentPort;
    auto colon = rest.find(':');
    if (colon != std::string::npos) {
        host = rest.substr(0, colon);
        port = parse_port(rest.substr(colon + 1));
    }
    if (!valid_host(host)) throw ParseError(errors::D1100_BAD_HOST);

    DeviceIdentity id;
    id.raw_address = raw;
    id.serial = scheme + host + ":" + std::to_string(port);
    id.transport_kind = TransportKind::Http;
    id.port = port;
    return id;
}

} // namespace

std::string DeviceIdentity::scheme() const {
    if (transport_kind != TransportKind::Http) return "";
    return starts_with(lower(serial), "https://") ? "https" : "http";
}

std::string DeviceIdentity::host() const {
    std::string s = serial;
    if (transport_kind == TransportKind::Http) {
        auto scheme_end = s.find("://");
        if (scheme_end != std::string::npos) s = s.substr(scheme_end + 3);
    }
    if (transport_kind == TransportKind::Local &&
        (!emulator_family || *emulator_family == EmulatorFamily::AndroidVirtualDevice)) {
        return "";
    }
    auto colon = s.rfind(':');
    if (colon != std::string::npos) s = s.substr(0, colon);
    return s;
}

DeviceIdentity DeviceIdentity::with_port(uint16_t p) const {
    DeviceIdentity out = *this;
    out.port = p;
    if (emulator_family == EmulatorFamily::Generic) {
        auto fam = family_for_port(p);
        if (fam && *fam != EmulatorFamily::ChinacCloud) out.emulator_family = *fam;
    }
    if (transport_kind == TransportKind::Http) {
        auto scheme_end = serial.find("://");
        std::string scheme = scheme_end == std::string::npos ? "http://" : serial.substr(0, scheme_end + 3);
        out.serial = scheme + host() + ":" + std::to_string(p);
    } else if (emulator_family == EmulatorFamily::AndroidVirtualDevice) {
        out.serial = "emulator-" + std::to_string(p);
    } else {
        std::string h = host();
        if (h.empty()) h = kLoopback;
        out.serial = h + ":" + std::to_string(p);
    }
    return out;
}

std::string revise_serial(const std::string& address) {
    std::string serial;
    serial.reserve(address.size());
    for (unsigned char c : address) {
        if (!std::isspace(c)) serial.push_back(static_cast<char>(c));
    }

    // Full-width punctuation from CJK input methods.
    replace_all(serial, "\xE3\x80\x82", ".");   // 。
    replace_all(serial, "\xEF\xBC\x8C", ".");   // ，
    replace_all(serial, "\xEF\xBC\x9A", ":");   // ：
    if (!starts_with(lower(serial), "http")) replace_all(serial, ",", ".");

    if (starts_with(lower(serial), "localhost")) serial = kLoopback + serial.substr(9);
    replace_all(serial, "127.0.0.1.", "127.0.0.1:");

    if (all_digits(serial) && serial.size() <= 5) {
        unsigned long port = std::stoul(serial);
        if (port > 1000 && port < 65536) serial = std::string(kLoopback) + ":" + serial;
    }

    // "模拟器 127.0.0.1:7555" -> "127.0.0.1:7555"
    if (serial.find("\xE6\xA8\xA1\xE6\x8B\x9F") != std::string::npos) {
        static const std::regex embedded(R"((127\.\d+\.\d+\.\d+:\d+))");
        std::smatch m;
        if (std::regex_search(serial, m, embedded)) serial = m[1].str();
    }

    replace_all(serial, "12127.0.0.1", "127.0.0.1");
    replace_all(serial, "auto127.0.0.1", "127.0.0.1");
    replace_all(serial, "autoemulator", "emulator");
    return serial;
}

DeviceIdentity parse_address(const std::string& address) {
    const std::string s = revise_serial(address);
    if (s.empty()) throw ParseError(errors::D1100_EMPTY);

    const std::string ls = lower(s);
    if (starts_with(ls, "http://") || starts_with(ls, "https://")) {
        return parse_http(address, s);
    }

    DeviceIdentity id;
    id.raw_address = address;

    static const std::regex avd(R"(^emulator-(\d{1,5})$)");
    std::smatch m;
    if (std::regex_match(s, m, avd)) {
        id.serial = s;
        id.transport_kind = TransportKind::Local;
        id.emulator_family = EmulatorFamily::AndroidVirtualDevice;
        id.port = parse_port(m[1].str());
        return id;
    }

    // "wsa", "wsa-0" ...: the subsystem always listens on one loopback port
    if (starts_with(ls, "wsa")) {
        id.serial = std::string(kLoopback) + ":" + std::to_string(kWsaPort);
        id.transport_kind = TransportKind::Local;
        id.emulator_family = EmulatorFamily::Wsa;
        id.port = kWsaPort;
        return id;
    }

    for (const auto& marker : kHostMarkers) {
        if (ls == marker.name) {
            id.serial = kLoopback;
            id.transport_kind = TransportKind::Local;
            id.emulator_family = marker.family;
            return id;
        }
    }

    if (all_digits(s)) throw ParseError(errors::D1100_BAD_PORT);

    auto colon = s.find(':');
    if (colon != std::string::npos) {
        if (s.find(':', colon + 1) != std::string::npos) throw ParseError(errors::D1100_BAD_HOST);
        std::string host = s.substr(0, colon);
        if (!valid_host(host)) throw ParseError(errors::D1100_BAD_HOST);
        uint16_t port = parse_port(s.substr(colon + 1));
        id.port = port;
        if (is_loopback(host)) {
            id.serial = std::string(kLoopback) + ":" + std::to_string(port);
            id.transport_kind = TransportKind::Local;
            auto fam = family_for_port(port);
            id.emulator_family = (fam && *fam != EmulatorFamily::ChinacCloud) ? *fam : EmulatorFamily::Generic;
        } else {
            id.serial = host + ":" + std::to_string(port);
            id.transport_kind = TransportKind::Network;
            if (port >= 301 && port <= 309) id.emulator_family = EmulatorFamily::ChinacCloud;
        }
        return id;
    }

    if (!valid_host(s)) throw ParseError(errors::D1100_BAD_CHARS);

    if (is_loopback(s)) {
        // Loopback without port: try the well-known emulator ports.
        id.serial = kLoopback;
        id.transport_kind = TransportKind::Local;
        id.emulator_family = EmulatorFamily::Generic;
        return id;
    }
    if (s.find('.') != std::string::npos) {
        id.serial = s + ":" + std::to_string(kDefaultAdbTcpPort);
        id.transport_kind = TransportKind::Network;
        id.port = kDefaultAdbTcpPort;
        return id;
    }

    // Plain usb serial, e.g. "R58M12ABCDE".
    id.serial = s;
    id.transport_kind = TransportKind::Local;
    return id;
}

bool is_emulator(const DeviceIdentity& id) {
    return id.transport_kind == TransportKind::Local && id.emulator_family.has_value();
}

bool is_network_device(const DeviceIdentity& id) {
    return id.transport_kind == TransportKind::Network;
}

bool is_local_network_device(const DeviceIdentity& id) {
    static const std::regex lan(R"(^192\.168\.\d+\.\d+:\d+$)");
    return id.transport_kind == TransportKind::Network && std::regex_match(id.serial, lan);
}

bool is_over_http(const DeviceIdentity& id) {
    return id.transport_kind == TransportKind::Http;
}

bool is_wsa(const DeviceIdentity& id) {
    return id.emulator_family == EmulatorFamily::Wsa;
}

std::optional<EmulatorFamily> family_for_port(uint16_t port) {
    for (const auto& band : kPortBands) {
        if (port >= band.low && port <= band.high) return band.family;
    }
    return std::nullopt;
}

std::vector<uint16_t> common_ports_for(EmulatorFamily family) {
    std::vector<uint16_t> ports;
    switch (family) {
        case EmulatorFamily::MuMu12:
            // one instance every 32 ports
            for (int p = 16384; p <= 17408; p += 32) ports.push_back(static_cast<uint16_t>(p));
            break;
        case EmulatorFamily::MuMuLegacy:
            ports = { 7555 };
            break;
        case EmulatorFamily::Nox:
            ports = { 62001 };
            for (int p = 62025; p <= 62030; ++p) ports.push_back(static_cast<uint16_t>(p));
            break;
        case EmulatorFamily::LDPlayer:
        case EmulatorFamily::AndroidVirtualDevice:
            for (int p = 5555; p <= 5587; p += 2) ports.push_back(static_cast<uint16_t>(p));
            break;
        case EmulatorFamily::Vmos:
            for (int p = 5667; p <= 5699; p += 2) ports.push_back(static_cast<uint16_t>(p));
            break;
        case EmulatorFamily::BlueStacks:
            ports = { 5555, 5565, 5575, 5585, 5595 };
            break;
        case EmulatorFamily::Wsa:
            ports = { kWsaPort };
            break;
        case EmulatorFamily::ChinacCloud:
            for (int p = 301; p <= 309; ++p) ports.push_back(static_cast<uint16_t>(p));
            break;
        case EmulatorFamily::Generic:
            ports = { 5555, 7555, 16384, 62001, 5565 };
            break;
    }
    return ports;
}

std::string to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::Local: return "local";
        case TransportKind::Network: return "network";
        case TransportKind::Http: return "http";
    }
    return "unknown";
}

std::string to_string(EmulatorFamily family) {
    switch (family) {
        case EmulatorFamily::MuMu12: return "mumu12";
        case EmulatorFamily::MuMuLegacy: return "mumu_legacy";
        case EmulatorFamily::Nox: return "nox";
        case EmulatorFamily::LDPlayer: return "ldplayer";
        case EmulatorFamily::Vmos: return "vmos";
        case EmulatorFamily::BlueStacks: return "bluestacks";
        case EmulatorFamily::AndroidVirtualDevice: return "avd";
        case EmulatorFamily::Wsa: return "wsa";
        case EmulatorFamily::ChinacCloud: return "chinac";
        case EmulatorFamily::Generic: return "generic";
    }
    return "unknown";
}

std::string device_type(const DeviceIdentity& id) {
    if (id.emulator_family) {
        switch (*id.emulator_family) {
            case EmulatorFamily::MuMu12:
            case EmulatorFamily::MuMuLegacy: return "MuMu";
            case EmulatorFamily::Nox: return "Nox";
            case EmulatorFamily::LDPlayer: return "LDPlayer";
            case EmulatorFamily::Vmos: return "VMOS";
            case EmulatorFamily::BlueStacks: return "BlueStacks";
            case EmulatorFamily::AndroidVirtualDevice: return "AVD";
            case EmulatorFamily::Wsa: return "WSA";
            case EmulatorFamily::ChinacCloud: return "ChinaC";
            case EmulatorFamily::Generic: return "Emulator";
        }
    }
    switch (id.transport_kind) {
        case TransportKind::Network: return "Network";
        case TransportKind::Http: return "HTTP";
        case TransportKind::Local: return "USB";
    }
    return "Unknown";
}

} // namespace droidlink
