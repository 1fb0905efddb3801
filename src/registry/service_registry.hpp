#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "protocol/service_descriptor.hpp"

namespace toolbridge::registry {

// In-memory name -> descriptor table. Pure data, owned by the event-loop thread.
class ServiceRegistry {
public:
    // Fails without side effects when the descriptor is incomplete; overwrites on an existing name.
    bool register_service(const protocol::ServiceDescriptor& descriptor);
    bool unregister_service(const std::string& name);

    std::optional<protocol::ServiceDescriptor> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    // Ordered by name
    std::vector<protocol::ServiceDescriptor> list() const;
    std::vector<std::string> names() const;

    bool touch(const std::string& name, std::int64_t now_ms);
    void clear();
    std::size_t size() const;

private:
    std::map<std::string, protocol::ServiceDescriptor> services_;
};

}  // namespace toolbridge::registry
