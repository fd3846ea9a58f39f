#pragma once

#include "../http/server.h"
#include <cstdint>
#include <optional>
#include <string>

namespace piping {
namespace app {

/**
 * Command-line configuration of piping-server.
 */
struct ServerOptions {
    std::string host = "0.0.0.0";
    uint16_t http_port = 8080;
    bool enable_https = false;
    std::optional<uint16_t> https_port;
    std::string crt_path;
    std::string key_path;
    uint16_t workers = 0;           // 0 = automatic
    bool show_help = false;
    bool show_version = false;
};

/**
 * Parse argv. Accepts "--opt value" and "--opt=value".
 *
 * @param error Set to a one-line message on failure
 * @return false on unknown options, missing or malformed values, or an
 *         incomplete HTTPS configuration
 */
bool parse_options(int argc, const char* const* argv, ServerOptions& options, std::string& error);

/**
 * Usage text for --help.
 */
std::string usage(const char* program);

/**
 * Listener configuration for the parsed options. TLS material is loaded
 * from crt_path/key_path by the server.
 */
http::ServerConfig to_server_config(const ServerOptions& options);

} // namespace app
} // namespace piping
