#pragma once

#include "core/ErrorCatalog.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace droidlink {

// Base of every error raised by the device layer. code() is one of the
// catalogued numbers in core/ErrorCatalog.hpp.
class DeviceError : public std::runtime_error {
public:
    DeviceError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

class ParseError : public DeviceError {
public:
    explicit ParseError(const std::string& detail)
    : DeviceError(errors::E1100_INVALID_FORMAT,
                  errors::with_detail(errors::MSG_E1100_INVALID_FORMAT_PREFIX, detail)) {}
};

class ConnectError : public DeviceError {
public:
    enum class Kind {
        InvalidAddress,
        TransportUnreachable,
        NoPortFound
    };

    ConnectError(Kind kind, const std::string& detail)
    : DeviceError(code_for(kind), errors::with_detail(prefix_for(kind), detail)), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    static int code_for(Kind k) {
        switch (k) {
            case Kind::InvalidAddress: return errors::E1200_INVALID_ADDRESS;
            case Kind::TransportUnreachable: return errors::E1210_TRANSPORT_UNREACHABLE;
            case Kind::NoPortFound: return errors::E1220_NO_PORT_FOUND;
        }
        return errors::E1200_INVALID_ADDRESS;
    }
    static const char* prefix_for(Kind k) {
        switch (k) {
            case Kind::InvalidAddress: return errors::MSG_E1200_INVALID_ADDRESS_PREFIX;
            case Kind::TransportUnreachable: return errors::MSG_E1210_TRANSPORT_UNREACHABLE_PREFIX;
            case Kind::NoPortFound: return errors::MSG_E1220_NO_PORT_FOUND_PREFIX;
        }
        return errors::MSG_E1200_INVALID_ADDRESS_PREFIX;
    }

    Kind kind_;
};

class NotConnectedError : public DeviceError {
public:
    NotConnectedError()
    : DeviceError(errors::E1300_NOT_CONNECTED, errors::MSG_E1300_NOT_CONNECTED) {}
};

// Opaque failure reported by a transport collaborator.
class TransportError : public DeviceError {
public:
    explicit TransportError(const std::string& detail)
    : DeviceError(errors::E1400_TRANSPORT_ERROR,
                  errors::with_detail(errors::MSG_E1400_TRANSPORT_ERROR_PREFIX, detail)) {}
};

class PackageError : public DeviceError {
public:
    PackageError()
    : DeviceError(errors::E1500_PACKAGE_NOT_SET, errors::MSG_E1500_PACKAGE_NOT_SET) {}
};

// A release that failed during teardown. Collected, never thrown.
struct ReleaseFailure {
    uint64_t id = 0;
    std::string name;
    std::string message;
};

} // namespace droidlink
