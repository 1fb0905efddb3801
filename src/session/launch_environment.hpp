#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "protocol/service_descriptor.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::session {

using Environment = std::map<std::string, std::string>;

// "~" and "~/..." become paths under home; anything else is returned unchanged
std::string expand_home(const std::string& path, const std::string& home);

std::string home_directory();
Environment process_environment();

struct LaunchContext {
    Environment base_env;
    std::string home;
    std::filesystem::path fallback_cwd;
};

LaunchContext current_launch_context();

// Resolves command and working directory, then merges caller env over the
// base environment, adding package-manager cache defaults the caller did not set.
protocol::StdioSpec build_launch_spec(const std::string& service_name,
                                      const protocol::LocalService& service,
                                      const LaunchContext& context);

}  // namespace toolbridge::session
