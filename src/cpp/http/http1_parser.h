#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <array>

namespace piping {
namespace http {

/**
 * Zero-allocation HTTP/1.0 and HTTP/1.1 request-head parser.
 *
 * - Zero heap allocations (stack only)
 * - Zero-copy parsing (string_view)
 * - No callbacks (direct returns)
 * - No exceptions
 *
 * Only the head (request line + header fields) is parsed. The body is
 * framed separately by BodyDecoder, since relay bodies are streamed and
 * never held in one buffer.
 *
 * HTTP/1.1 Spec: RFC 9112
 */

/**
 * HTTP method enumeration.
 */
enum class HTTP1Method : uint8_t {
    GET = 0,
    HEAD = 1,
    POST = 2,
    PUT = 3,
    DELETE = 4,
    CONNECT = 5,
    OPTIONS = 6,
    TRACE = 7,
    PATCH = 8,
    UNKNOWN = 255
};

/**
 * HTTP version.
 */
enum class HTTP1Version : uint8_t {
    HTTP_1_0 = 0,
    HTTP_1_1 = 1,
    UNKNOWN = 255
};

/**
 * Parser state.
 */
enum class HTTP1State : uint8_t {
    START,
    COMPLETE,
    ERROR
};

/**
 * Why a head was rejected.
 */
enum class HTTP1Error : uint8_t {
    NONE,
    BAD_REQUEST_LINE,
    BAD_VERSION,
    BAD_HEADER,
    TOO_MANY_HEADERS,
    BAD_CONTENT_LENGTH,
    BAD_TRANSFER_ENCODING
};

/**
 * Parsed HTTP/1.x request head.
 *
 * All string_views point into the original buffer (zero-copy).
 */
struct HTTP1Request {
    HTTP1Method method{HTTP1Method::UNKNOWN};
    HTTP1Version version{HTTP1Version::HTTP_1_1};

    std::string_view method_str;
    std::string_view url;       // Request target as received
    std::string_view path;      // Extracted from URL (still percent-encoded)
    std::string_view query;     // Extracted from URL, without '?'

    // Headers (max 100 for safety)
    static constexpr size_t MAX_HEADERS = 100;
    struct Header {
        std::string_view name;
        std::string_view value;
    };
    std::array<Header, MAX_HEADERS> headers;
    size_t header_count{0};

    // Content-Length (if present)
    uint64_t content_length{0};
    bool has_content_length{false};

    // Transfer-Encoding: chunked (takes precedence over Content-Length)
    bool chunked{false};

    bool keep_alive{false};
    bool expect_continue{false};

    /**
     * Get header value by name (case-insensitive).
     */
    std::string_view get_header(std::string_view name) const noexcept;

    /**
     * Check if header exists.
     */
    bool has_header(std::string_view name) const noexcept;
};

/**
 * HTTP/1.x request-head parser.
 */
class HTTP1Parser {
public:
    /**
     * Largest request head accepted; larger heads get 431.
     */
    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;

    HTTP1Parser();

    /**
     * Parse an HTTP request head from buffer.
     *
     * @param data Input buffer (must remain valid during access to request)
     * @param len Buffer length
     * @param out_request Parsed request (views into data buffer)
     * @param out_consumed Bytes consumed by the head, including the blank line
     * @return 0 on success, 1 on error (see error()), -1 if need more data
     */
    int parse(
        const uint8_t* data,
        size_t len,
        HTTP1Request& out_request,
        size_t& out_consumed
    ) noexcept;

    /**
     * Reset parser state for new request.
     */
    void reset() noexcept;

    HTTP1State get_state() const noexcept { return state_; }

    bool is_complete() const noexcept { return state_ == HTTP1State::COMPLETE; }

    bool has_error() const noexcept { return state_ == HTTP1State::ERROR; }

    HTTP1Error error() const noexcept { return error_; }

    /**
     * Case-insensitive ASCII string compare.
     */
    static bool str_eq_ci(std::string_view a, std::string_view b) noexcept;

    /**
     * True if the comma-separated header value contains token (case-insensitive).
     */
    static bool has_token(std::string_view list, std::string_view token) noexcept;

    /**
     * Parse a non-negative decimal integer. Rejects empty input, signs,
     * and values that overflow 64 bits.
     */
    static bool parse_uint64(std::string_view text, uint64_t& out) noexcept;

    /**
     * Split a request target into path and query.
     * Absolute-form targets ("http://host/p?q") are reduced to their path.
     */
    static void split_target(std::string_view target,
                             std::string_view& path,
                             std::string_view& query) noexcept;

private:
    HTTP1State state_;
    HTTP1Error error_;
    size_t pos_;  // Current position in buffer

    int fail(HTTP1Error error) noexcept;

    int parse_request_line(std::string_view head, HTTP1Request& req) noexcept;
    int parse_headers(std::string_view head, HTTP1Request& req) noexcept;
    int interpret_headers(HTTP1Request& req) noexcept;

    static HTTP1Method method_from_string(std::string_view method) noexcept;
    static bool is_token_char(uint8_t c) noexcept;
    static std::string_view trim(std::string_view s) noexcept;
};

} // namespace http
} // namespace piping
