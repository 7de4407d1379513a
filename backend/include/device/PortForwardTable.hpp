#pragma once
#include "core/DeviceError.hpp"
#include "transport/CommandTransport.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace droidlink {

class ResourceRegistry;

/**
 * @brief Forward/reverse mappings owned by one session.
 *
 * At most one mapping exists per (direction, remote). Every mapping created
 * here also registers a release entry in the session's ResourceRegistry; that
 * entry and remove_all() both go through remove(), so a mapping is torn down
 * exactly once whichever path runs first.
 */
class PortForwardTable {
public:
    PortForwardTable(std::shared_ptr<CommandClient> client, ResourceRegistry& resources);
    PortForwardTable(const PortForwardTable&) = delete;
    PortForwardTable& operator=(const PortForwardTable&) = delete;

    // Returns the existing local port when `remote` is already forwarded.
    uint16_t forward(const std::string& remote);
    void reverse(const std::string& remote, const std::string& local);

    // Remove a single mapping; unknown keys are a no-op.
    void remove(ForwardDirection direction, const std::string& remote);
    std::vector<ReleaseFailure> remove_all();

    std::vector<PortMapping> list() const;
    size_t size() const;

private:
    using Key = std::pair<ForwardDirection, std::string>;

    std::shared_ptr<CommandClient> client_;
    ResourceRegistry& resources_;
    std::map<Key, PortMapping> mappings_;
    mutable std::mutex mu_;
};

} // namespace droidlink
