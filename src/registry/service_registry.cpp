#include "registry/service_registry.hpp"

#include "core/logging/logger.hpp"

namespace toolbridge::registry {

using protocol::ServiceDescriptor;

bool ServiceRegistry::register_service(const ServiceDescriptor& descriptor) {
    if (!protocol::is_valid(descriptor)) {
        LOG_WARN("ServiceRegistry: rejected incomplete descriptor '" + descriptor.name + "'");
        return false;
    }
    const bool replaced = services_.find(descriptor.name) != services_.end();
    services_[descriptor.name] = descriptor;
    LOG_INFO("ServiceRegistry: " + std::string(replaced ? "replaced " : "registered ") +
             protocol::kind_name(descriptor) + " service " + descriptor.name);
    return true;
}

bool ServiceRegistry::unregister_service(const std::string& name) {
    if (services_.erase(name) == 0) {
        return false;
    }
    LOG_INFO("ServiceRegistry: unregistered service " + name);
    return true;
}

std::optional<ServiceDescriptor> ServiceRegistry::get(const std::string& name) const {
    auto it = services_.find(name);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ServiceRegistry::contains(const std::string& name) const {
    return services_.find(name) != services_.end();
}

std::vector<ServiceDescriptor> ServiceRegistry::list() const {
    std::vector<ServiceDescriptor> descriptors;
    descriptors.reserve(services_.size());
    for (const auto& [name, descriptor] : services_) {
        descriptors.push_back(descriptor);
    }
    return descriptors;
}

std::vector<std::string> ServiceRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(services_.size());
    for (const auto& entry : services_) {
        result.push_back(entry.first);
    }
    return result;
}

bool ServiceRegistry::touch(const std::string& name, const std::int64_t now_ms) {
    auto it = services_.find(name);
    if (it == services_.end()) {
        return false;
    }
    it->second.last_used_at = now_ms;
    return true;
}

void ServiceRegistry::clear() {
    services_.clear();
}

std::size_t ServiceRegistry::size() const {
    return services_.size();
}

}  // namespace toolbridge::registry
