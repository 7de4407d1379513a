#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace droidlink {

struct DeviceIdentity;

/** @brief Where the on-device automation agent answers. */
struct UiEndpoint {
    std::string host;
    uint16_t port = 0;
    std::string scheme = "http";
};

/**
 * @brief Handle to the UI-automation agent of one device.
 * Operations throw TransportError on failure.
 */
class UiClient {
public:
    virtual ~UiClient() = default;

    virtual bool ping() = 0;
    /** @brief Current window hierarchy as XML. */
    virtual std::string dump_hierarchy() = 0;
    virtual void app_start(const std::string& package) = 0;
    virtual void app_stop(const std::string& package) = 0;
    /** @brief Package name owning the focused window, empty if none. */
    virtual std::string app_current() = 0;
    virtual void click(int x, int y) = 0;
};

class UiTransport {
public:
    virtual ~UiTransport() = default;
    virtual std::shared_ptr<UiClient> connect(const DeviceIdentity& id, const UiEndpoint& endpoint) = 0;
};

} // namespace droidlink
