#pragma once

#include "../http/request.h"
#include <string>
#include <string_view>
#include <vector>

#ifndef PIPING_VERSION
#define PIPING_VERSION "0.0.0-dev"
#endif

namespace piping {
namespace app {

/**
 * Paths served by fixed handlers. They never reach the rendezvous engine.
 */
namespace paths {
constexpr const char* INDEX = "/";
constexpr const char* NOSCRIPT = "/noscript";
constexpr const char* VERSION = "/version";
constexpr const char* HELP = "/help";
constexpr const char* ROBOTS = "/robots.txt";
constexpr const char* FAVICON = "/favicon.ico";
} // namespace paths

const std::vector<std::string>& reserved_paths();
bool is_reserved_path(std::string_view path);

/**
 * Escape &, <, >, " and ' for HTML text and attribute values.
 */
std::string html_escape(std::string_view text);

/**
 * "http://host" or "https://host" as seen by the client (Host header,
 * falling back to localhost).
 */
std::string base_url(const http::Request& request);

/**
 * Interactive upload page served at /.
 */
std::string index_page();

/**
 * Form page for browsers without JavaScript. mode is "file" or "text";
 * anything else falls back to "file".
 */
std::string noscript_page(std::string_view path, std::string_view mode);

/**
 * curl usage text for /help.
 */
std::string help_text(std::string_view base_url);

/**
 * Body of /version.
 */
std::string version_text();

} // namespace app
} // namespace piping
