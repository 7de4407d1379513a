#pragma once
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace droidlink {

struct DeviceIdentity;

enum class ForwardDirection {
    Forward,  // host port -> device service
    Reverse   // device port -> host service
};

/**
 * @brief One live local<->remote redirection.
 * For Forward, `local` is "tcp:<port>" on the host and `remote` the device
 * side target. For Reverse, `remote` is the device side listener and `local`
 * the host side target.
 */
struct PortMapping {
    ForwardDirection direction = ForwardDirection::Forward;
    std::string local;
    std::string remote;

    bool operator==(const PortMapping& o) const {
        return direction == o.direction && local == o.local && remote == o.remote;
    }
};

/**
 * @brief Handle to one device on the debug-bridge style transport.
 *
 * All operations block on device I/O and throw TransportError on failure.
 */
class CommandClient {
public:
    virtual ~CommandClient() = default;

    virtual std::string serial() const = 0;
    /** @brief Transport-reported device state ("device", "offline", ...). */
    virtual std::string get_state() = 0;
    virtual std::string shell(const std::string& cmd) = 0;
    /** @brief Create a forward to `remote`, returning the allocated local tcp port. */
    virtual uint16_t forward(const std::string& remote) = 0;
    virtual void reverse(const std::string& remote, const std::string& local) = 0;
    /** @brief Remove a forward or reverse mapping. Missing mappings are not an error. */
    virtual void remove_forward(const PortMapping& mapping) = 0;
    virtual std::set<std::string> list_packages() = 0;
};

class CommandTransport {
public:
    virtual ~CommandTransport() = default;
    /**
     * @brief Open a handle to the device named by `id`.
     * @throws TransportError when the device cannot be reached.
     */
    virtual std::shared_ptr<CommandClient> connect(const DeviceIdentity& id) = 0;
};

} // namespace droidlink
