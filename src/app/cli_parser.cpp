#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <vector>

namespace toolbridge::app::cli {

    using namespace toolbridge::core::errors;
    using toolbridge::core::config::BridgeConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> log_level;
        std::vector<std::string> positionals;
        bool help = false;
    };

    std::string usage() {
        return "Usage: toolbridge [--host ADDR] [--log-level debug|info|warn|error] "
               "[port] [command] [args...]";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: flags are only recognized before the first positional,
        //    everything after the port belongs to the seeded command line.
        for (size_t i = 0; i < args.size(); ++i) {
            if (!raw.positionals.empty()) {
                raw.positionals.push_back(args[i]);
            } else if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else if (args[i].rfind("--", 0) == 0) {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // 3. Validator Phase
        CliOptions options;
        options.show_help = raw.help;
        BridgeConfig& config = options.config;

        if (raw.host) {
            if (raw.host->empty()) {
                return BridgeError{ErrorCategory::Input, "--host cannot be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }

        std::optional<std::string> level_text = raw.log_level;
        if (!level_text) {
            if (const char* env = std::getenv("TOOLBRIDGE_LOG_LEVEL")) {
                level_text = std::string(env);
            }
        }
        if (level_text) {
            auto level = core::logging::parse_level(level_text.value());
            if (!level) {
                return BridgeError{ErrorCategory::Input, "Invalid log level: " + level_text.value(),
                                   "invalid_log_level", "Use one of debug, info, warn, error."};
            }
            config.log_level = level.value();
        }

        if (!raw.positionals.empty()) {
            const std::string& port_text = raw.positionals.front();
            std::uint32_t port = 0;
            const char* begin = port_text.data();
            const char* end = port_text.data() + port_text.size();
            auto [ptr, ec] = std::from_chars(begin, end, port);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid port: " + port_text, "invalid_integer",
                                   "Provide a port number between 1 and 65535."};
            }
            if (port == 0 || port > 65535) {
                return BridgeError{ErrorCategory::Input, "Port out of bounds: " + port_text, "bounds_error",
                                   "Must be between 1 and 65535."};
            }
            config.port = static_cast<std::uint16_t>(port);
        }

        if (raw.positionals.size() > 1) {
            config.default_command = raw.positionals[1];
            config.default_args.assign(raw.positionals.begin() + 2, raw.positionals.end());
        }

        return options;
    }

} // namespace toolbridge::app::cli
