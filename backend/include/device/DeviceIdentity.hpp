#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace droidlink {

enum class TransportKind {
    Local,    // loopback emulator or USB serial, reached through the local adb server
    Network,  // host:port over adb-over-tcp
    Http      // uiautomator2 agent reached directly over http
};

enum class EmulatorFamily {
    MuMu12,
    MuMuLegacy,
    Nox,
    LDPlayer,
    Vmos,
    BlueStacks,
    AndroidVirtualDevice,
    Wsa,          // Windows Subsystem for Android, always 127.0.0.1:58526
    ChinacCloud,
    Generic
};

/**
 * @brief Typed, immutable identity of a device address.
 *
 * `serial` is the canonical comparison key: "5555", "127.0.0.1.5555" and
 * "127.0.0.1:5555" all produce the serial "127.0.0.1:5555".
 */
struct DeviceIdentity {
    std::string raw_address;
    std::string serial;
    TransportKind transport_kind = TransportKind::Local;
    std::optional<EmulatorFamily> emulator_family;
    std::optional<uint16_t> port;

    /** @brief Host part of the serial (no scheme, no port). Empty for USB serials. */
    std::string host() const;

    /** @brief "http" or "https" for Http identities, empty otherwise. */
    std::string scheme() const;

    /**
     * @brief Copy bound to an explicit port. A Generic loopback identity takes
     * the family that owns the port.
     */
    DeviceIdentity with_port(uint16_t p) const;

    bool operator==(const DeviceIdentity& o) const { return serial == o.serial; }
    bool operator!=(const DeviceIdentity& o) const { return serial != o.serial; }
};

/**
 * @brief Apply the typo/punctuation repairs users make when typing serials.
 * Pure string rewrite; no validation.
 */
std::string revise_serial(const std::string& address);

/**
 * @brief Parse and classify an address.
 * @throws ParseError when the address is malformed.
 */
DeviceIdentity parse_address(const std::string& address);

bool is_emulator(const DeviceIdentity& id);
bool is_network_device(const DeviceIdentity& id);
// adb-over-tcp device on a 192.168.x.x LAN address
bool is_local_network_device(const DeviceIdentity& id);
bool is_over_http(const DeviceIdentity& id);
bool is_wsa(const DeviceIdentity& id);

/** @brief Family owning a loopback port, if any. */
std::optional<EmulatorFamily> family_for_port(uint16_t port);

/** @brief Ports tried, in order, when a family is known but no port was given. */
std::vector<uint16_t> common_ports_for(EmulatorFamily family);

std::string to_string(TransportKind kind);
std::string to_string(EmulatorFamily family);

/** @brief Display name used in status output ("MuMu", "Nox", "Network", "USB" ...). */
std::string device_type(const DeviceIdentity& id);

} // namespace droidlink
