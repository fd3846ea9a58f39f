#include "options.h"
#include <string_view>

namespace piping {
namespace app {

namespace {

bool parse_u16(std::string_view text, uint16_t& out) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    uint32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

} // anonymous namespace

bool parse_options(int argc, const char* const* argv, ServerOptions& options, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        std::string_view name = arg;
        std::optional<std::string_view> inline_value;
        if (arg.size() > 2 && arg.substr(0, 2) == "--") {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                name = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }

        // Flags
        if (name == "--help" || name == "-h") {
            options.show_help = true;
            continue;
        }
        if (name == "--version" || name == "-V") {
            options.show_version = true;
            continue;
        }
        if (name == "--enable-https") {
            if (inline_value) {
                error = "--enable-https does not take a value";
                return false;
            }
            options.enable_https = true;
            continue;
        }

        bool takes_value = name == "--http-port" || name == "--https-port" ||
                           name == "--crt-path" || name == "--key-path" ||
                           name == "--host" || name == "--workers";
        if (!takes_value) {
            error = "Unknown option: " + std::string(arg);
            return false;
        }

        std::string_view value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            error = "Missing value for " + std::string(name);
            return false;
        }

        if (name == "--http-port" || name == "--https-port" || name == "--workers") {
            uint16_t number = 0;
            if (!parse_u16(value, number)) {
                error = "Invalid value for " + std::string(name) + ": " + std::string(value);
                return false;
            }
            if (name == "--http-port") {
                options.http_port = number;
            } else if (name == "--https-port") {
                options.https_port = number;
            } else {
                options.workers = number;
            }
        } else if (name == "--crt-path") {
            options.crt_path = std::string(value);
        } else if (name == "--key-path") {
            options.key_path = std::string(value);
        } else {
            if (value.empty()) {
                error = "Invalid value for --host";
                return false;
            }
            options.host = std::string(value);
        }
    }

    if (options.show_help || options.show_version) {
        return true;
    }

    if (options.enable_https &&
        (!options.https_port || options.crt_path.empty() || options.key_path.empty())) {
        error = "--https-port, --crt-path and --key-path should be specified";
        return false;
    }
    return true;
}

std::string usage(const char* program) {
    std::string text;
    text += "Usage: ";
    text += program ? program : "piping-server";
    text += " [OPTIONS]\n\n";
    text += "Streaming data transfer server over pure HTTP\n\n";
    text += "Options:\n";
    text += "  --host <ADDR>          Bind address [default: 0.0.0.0]\n";
    text += "  --http-port <PORT>     HTTP port [default: 8080]\n";
    text += "  --enable-https         Enable HTTPS\n";
    text += "  --https-port <PORT>    HTTPS port\n";
    text += "  --crt-path <FILE>      Certificate path (PEM)\n";
    text += "  --key-path <FILE>      Private key path (PEM)\n";
    text += "  --workers <N>          Worker threads per listener [default: automatic]\n";
    text += "  -h, --help             Print help\n";
    text += "  -V, --version          Print version\n\n";
    text += "Environment:\n";
    text += "  PIPING_LOG_LEVEL       debug, info, warn, error or off [default: info]\n";
    return text;
}

http::ServerConfig to_server_config(const ServerOptions& options) {
    http::ServerConfig config;
    config.host = options.host;
    config.http_port = options.http_port;
    config.num_workers = options.workers;
    config.enable_https = options.enable_https;
    if (options.enable_https) {
        config.https_port = options.https_port.value_or(0);
        config.cert_file = options.crt_path;
        config.key_file = options.key_path;
    }
    return config;
}

} // namespace app
} // namespace piping
