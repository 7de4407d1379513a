#pragma once
#include "core/DeviceError.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace droidlink {

using ResourceId = uint64_t;

/**
 * @brief Session-scoped resources with a release action.
 *
 * Release functions report failure by throwing. Each entry is released at
 * most once, either individually through release() or by release_all().
 */
class ResourceRegistry {
public:
    ResourceRegistry() = default;
    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    ResourceId register_resource(std::string name, std::function<void()> release);

    // Release one entry. Unknown or already released ids are a no-op.
    // Rethrows the release function's failure; the entry is dropped either way.
    void release(ResourceId id);

    // Release every live entry, last registered first, continuing past
    // failures. Returns the failures in release order.
    std::vector<ReleaseFailure> release_all();

    size_t size() const;
    bool empty() const { return size() == 0; }

private:
    struct Entry {
        ResourceId id;
        std::string name;
        std::function<void()> release;
    };

    std::vector<Entry> entries;
    ResourceId next_id = 1;
    mutable std::mutex registry_mutex;
};

} // namespace droidlink
