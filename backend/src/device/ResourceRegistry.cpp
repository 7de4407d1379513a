#include "device/ResourceRegistry.hpp"

#include <algorithm>

namespace droidlink {

ResourceId ResourceRegistry::register_resource(std::string name, std::function<void()> release) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    ResourceId id = next_id++;
    entries.push_back({ id, std::move(name), std::move(release) });
    return id;
}

void ResourceRegistry::release(ResourceId id) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto it = std::find_if(entries.begin(), entries.end(), [id](const Entry& e){ return e.id == id; });
        if (it == entries.end()) return;
        entry = std::move(*it);
        entries.erase(it);
    }
    // run outside the lock: release actions may do device I/O
    if (entry.release) entry.release();
}

std::vector<ReleaseFailure> ResourceRegistry::release_all() {
    std::vector<Entry> taken;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        taken.swap(entries);
    }

    std::vector<ReleaseFailure> failures;
    for (auto it = taken.rbegin(); it != taken.rend(); ++it) {
        if (!it->release) continue;
        try {
            it->release();
        } catch (const std::exception& e) {
            failures.push_back({ it->id, it->name, e.what() });
        }
    }
    return failures;
}

size_t ResourceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return entries.size();
}

} // namespace droidlink
