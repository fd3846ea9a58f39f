#pragma once

#include "http1_parser.h"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace piping {
namespace http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * HTTP request head with owned storage.
 *
 * Built from an HTTP1Request once the head is parsed, so it outlives the
 * connection's input buffer. The body is not part of it; it is streamed
 * through the Exchange.
 */
class Request {
public:
    Request() = default;

    /**
     * Copy a parsed head.
     *
     * @param parsed Parsed head (views into the input buffer)
     * @param secure True for connections accepted on the HTTPS listener
     */
    static Request from_parsed(const HTTP1Request& parsed, bool secure);

    const std::string& method() const noexcept { return method_; }
    HTTP1Method method_enum() const noexcept { return method_enum_; }

    /**
     * Request target as received (path + '?' + query).
     */
    const std::string& target() const noexcept { return target_; }

    /**
     * Path exactly as received: percent-encoding is kept.
     */
    const std::string& path() const noexcept { return path_; }

    /**
     * Raw query string without the '?'.
     */
    const std::string& query() const noexcept { return query_; }

    /**
     * 0 for HTTP/1.0, 1 for HTTP/1.1.
     */
    int version_minor() const noexcept { return version_minor_; }

    bool secure() const noexcept { return secure_; }
    bool keep_alive() const noexcept { return keep_alive_; }
    bool expect_continue() const noexcept { return expect_continue_; }
    bool is_head() const noexcept { return method_enum_ == HTTP1Method::HEAD; }

    const HeaderList& headers() const noexcept { return headers_; }

    /**
     * First header with the given name (case-insensitive), or nullptr.
     */
    const std::string* header(std::string_view name) const noexcept;

    bool has_header(std::string_view name) const noexcept {
        return header(name) != nullptr;
    }

    /**
     * Value of the first query parameter named key, percent-decoded
     * ('+' decodes to a space). A key without '=' yields "".
     */
    std::optional<std::string> query_param(std::string_view key) const;

    /**
     * Percent-decode a query component.
     */
    static std::string url_decode(std::string_view encoded);

    // Setters for building requests in tests and for synthetic requests.
    void set_method(std::string method);
    void set_target(std::string target);
    void set_version_minor(int minor) noexcept { version_minor_ = minor; }
    void set_secure(bool secure) noexcept { secure_ = secure; }
    void set_keep_alive(bool keep_alive) noexcept { keep_alive_ = keep_alive; }
    void add_header(std::string name, std::string value);

private:
    std::string method_;
    HTTP1Method method_enum_{HTTP1Method::UNKNOWN};
    std::string target_;
    std::string path_;
    std::string query_;
    int version_minor_{1};
    bool secure_{false};
    bool keep_alive_{true};
    bool expect_continue_{false};
    HeaderList headers_;
};

} // namespace http
} // namespace piping
