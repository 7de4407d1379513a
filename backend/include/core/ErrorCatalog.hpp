#pragma once

#include <string>
#include <string_view>

namespace droidlink::errors {

// 1100-1199: address parsing
// 1200-1299: connect
// 1300-1399: session state
// 1400-1499: transport
// 1500-1599: package / app control

inline constexpr int E1100_INVALID_FORMAT = 1100;
inline constexpr int E1200_INVALID_ADDRESS = 1200;
inline constexpr int E1210_TRANSPORT_UNREACHABLE = 1210;
inline constexpr int E1220_NO_PORT_FOUND = 1220;
inline constexpr int E1300_NOT_CONNECTED = 1300;
inline constexpr int E1400_TRANSPORT_ERROR = 1400;
inline constexpr int E1500_PACKAGE_NOT_SET = 1500;

inline constexpr const char* MSG_E1100_INVALID_FORMAT_PREFIX = "Error 1100: Invalid device address: ";
inline constexpr const char* MSG_E1200_INVALID_ADDRESS_PREFIX = "Error 1200: Cannot connect, invalid address: ";
inline constexpr const char* MSG_E1210_TRANSPORT_UNREACHABLE_PREFIX = "Error 1210: Command transport unreachable: ";
inline constexpr const char* MSG_E1220_NO_PORT_FOUND_PREFIX = "Error 1220: No emulator port answered for: ";
inline constexpr const char* MSG_E1300_NOT_CONNECTED = "Error 1300: No device connected";
inline constexpr const char* MSG_E1400_TRANSPORT_ERROR_PREFIX = "Error 1400: Transport error: ";
inline constexpr const char* MSG_E1500_PACKAGE_NOT_SET = "Error 1500: Target package is not set";

// Catalogued detail strings.
inline constexpr const char* D1100_EMPTY = "empty address";
inline constexpr const char* D1100_BAD_PORT = "port out of range";
inline constexpr const char* D1100_BAD_HOST = "malformed host";
inline constexpr const char* D1100_BAD_CHARS = "unexpected characters";
inline constexpr const char* D1400_NOT_OVER_HTTP = "operation not available over http: ";
inline constexpr const char* D1400_LISTENER_NOT_FOUND = "listener not found: ";
inline constexpr const char* D1400_TIMEOUT = "timed out: ";

inline std::string code_string(int code) {
    return std::to_string(code);
}

inline std::string with_detail(const char* prefix, std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(prefix) + detail.size());
    out.append(prefix);
    out.append(detail.data(), detail.size());
    return out;
}

} // namespace droidlink::errors
