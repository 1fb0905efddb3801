#include "session/launch_environment.hpp"

#include <cstdlib>
#include <pwd.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace toolbridge::session {

namespace {

void set_default(Environment& env, const Environment& caller, const std::string& key,
                 const std::string& value) {
    if (caller.find(key) == caller.end()) {
        env[key] = value;
    }
}

}  // namespace

std::string expand_home(const std::string& path, const std::string& home) {
    if (path == "~") {
        return home;
    }
    if (path.rfind("~/", 0) == 0) {
        return (std::filesystem::path(home) / path.substr(2)).string();
    }
    return path;
}

std::string home_directory() {
    if (const char* home = std::getenv("HOME")) {
        if (*home != '\0') {
            return home;
        }
    }
    if (const passwd* entry = getpwuid(getuid())) {
        if (entry->pw_dir != nullptr) {
            return entry->pw_dir;
        }
    }
    return "/";
}

Environment process_environment() {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string pair = *entry;
        const auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    return env;
}

LaunchContext current_launch_context() {
    LaunchContext context;
    context.base_env = process_environment();
    context.home = home_directory();
    std::error_code ec;
    context.fallback_cwd = std::filesystem::current_path(ec);
    if (ec) {
        context.fallback_cwd = context.home;
    }
    return context;
}

protocol::StdioSpec build_launch_spec(const std::string& service_name,
                                      const protocol::LocalService& service,
                                      const LaunchContext& context) {
    protocol::StdioSpec spec;
    spec.command = expand_home(service.command, context.home);
    spec.args = service.args;

    if (service.cwd.has_value() && !service.cwd->empty()) {
        spec.cwd = expand_home(service.cwd.value(), context.home);
    } else {
        const auto plugin_dir =
            std::filesystem::path(context.home) / "mcp_plugins" / service_name;
        std::error_code ec;
        if (std::filesystem::is_directory(plugin_dir, ec) && !ec) {
            spec.cwd = plugin_dir.string();
        } else {
            spec.cwd = context.fallback_cwd.string();
        }
    }

    spec.env = context.base_env;
    for (const auto& [key, value] : service.env) {
        spec.env[key] = value;
    }
    set_default(spec.env, service.env, "npm_config_cache",
                (std::filesystem::path(spec.cwd) / ".npm-cache").string());
    set_default(spec.env, service.env, "npm_config_prefer_offline", "true");
    set_default(spec.env, service.env, "UV_LINK_MODE", "copy");
    return spec;
}

}  // namespace toolbridge::session
