#pragma once
#include <string>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::app::cli {

    struct CliOptions {
        core::config::BridgeConfig config;
        bool show_help = false;
    };

    std::string usage();

    toolbridge::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
