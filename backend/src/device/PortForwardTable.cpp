#include "device/PortForwardTable.hpp"
#include "device/ResourceRegistry.hpp"

#include <iostream>

namespace droidlink {

PortForwardTable::PortForwardTable(std::shared_ptr<CommandClient> client, ResourceRegistry& resources)
: client_(std::move(client)), resources_(resources) {}

uint16_t PortForwardTable::forward(const std::string& remote) {
    Key key{ ForwardDirection::Forward, remote };
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = mappings_.find(key);
        if (it != mappings_.end()) {
            std::cout << "PortForwardTable: reuse forward " << it->second.local << " -> " << remote << std::endl;
            return static_cast<uint16_t>(std::stoi(it->second.local.substr(4)));
        }
    }

    uint16_t port = client_->forward(remote);
    PortMapping m{ ForwardDirection::Forward, "tcp:" + std::to_string(port), remote };
    {
        std::lock_guard<std::mutex> lk(mu_);
        mappings_[key] = m;
    }
    std::cout << "PortForwardTable: create forward " << m.local << " -> " << remote << std::endl;
    resources_.register_resource("forward " + m.local + " " + remote,
        [this, remote]() { remove(ForwardDirection::Forward, remote); });
    return port;
}

void PortForwardTable::reverse(const std::string& remote, const std::string& local) {
    Key key{ ForwardDirection::Reverse, remote };
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (mappings_.count(key)) {
            std::cout << "PortForwardTable: reuse reverse " << remote << " -> " << mappings_[key].local << std::endl;
            return;
        }
    }

    client_->reverse(remote, local);
    {
        std::lock_guard<std::mutex> lk(mu_);
        mappings_[key] = PortMapping{ ForwardDirection::Reverse, local, remote };
    }
    std::cout << "PortForwardTable: create reverse " << remote << " -> " << local << std::endl;
    resources_.register_resource("reverse " + remote + " " + local,
        [this, remote]() { remove(ForwardDirection::Reverse, remote); });
}

void PortForwardTable::remove(ForwardDirection direction, const std::string& remote) {
    PortMapping m;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = mappings_.find(Key{ direction, remote });
        if (it == mappings_.end()) return;
        m = it->second;
        mappings_.erase(it);
    }
    client_->remove_forward(m);
}

std::vector<ReleaseFailure> PortForwardTable::remove_all() {
    std::map<Key, PortMapping> taken;
    {
        std::lock_guard<std::mutex> lk(mu_);
        taken.swap(mappings_);
    }

    std::vector<ReleaseFailure> failures;
    for (const auto& [key, m] : taken) {
        try {
            client_->remove_forward(m);
        } catch (const std::exception& e) {
            failures.push_back({ 0, m.local + " " + m.remote, e.what() });
        }
    }
    return failures;
}

std::vector<PortMapping> PortForwardTable::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PortMapping> out;
    out.reserve(mappings_.size());
    for (const auto& p : mappings_) out.push_back(p.second);
    return out;
}

size_t PortForwardTable::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return mappings_.size();
}

} // namespace droidlink
