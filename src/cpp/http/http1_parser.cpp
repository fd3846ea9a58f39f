#include "http1_parser.h"
#include <cstdint>

namespace piping {
namespace http {

namespace {

inline char ascii_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

} // namespace

// ============================================================================
// HTTP1Request Implementation
// ============================================================================

std::string_view HTTP1Request::get_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1Parser::str_eq_ci(headers[i].name, name)) {
            return headers[i].value;
        }
    }
    return {};
}

bool HTTP1Request::has_header(std::string_view name) const noexcept {
    for (size_t i = 0; i < header_count; ++i) {
        if (HTTP1Parser::str_eq_ci(headers[i].name, name)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// HTTP1Parser Implementation
// ============================================================================

HTTP1Parser::HTTP1Parser()
    : state_(HTTP1State::START), error_(HTTP1Error::NONE), pos_(0) {
}

void HTTP1Parser::reset() noexcept {
    state_ = HTTP1State::START;
    error_ = HTTP1Error::NONE;
    pos_ = 0;
}

int HTTP1Parser::fail(HTTP1Error error) noexcept {
    state_ = HTTP1State::ERROR;
    error_ = error;
    return 1;
}

int HTTP1Parser::parse(
    const uint8_t* data,
    size_t len,
    HTTP1Request& out_request,
    size_t& out_consumed
) noexcept {
    if (!data || len == 0) {
        return -1;  // Need more data
    }

    std::string_view input(reinterpret_cast<const char*>(data), len);

    // Tolerate empty lines before the request line (RFC 9112 2.2).
    pos_ = 0;
    while (pos_ + 1 < len && input[pos_] == '\r' && input[pos_ + 1] == '\n') {
        pos_ += 2;
    }

    // The head is complete only once the blank line has arrived.
    size_t end = input.find("\r\n\r\n", pos_);
    if (end == std::string_view::npos) {
        return -1;
    }

    std::string_view head = input.substr(pos_, end + 2 - pos_);  // Keeps the last CRLF
    out_request = HTTP1Request{};

    if (parse_request_line(head, out_request) != 0) {
        return 1;
    }
    if (parse_headers(head, out_request) != 0) {
        return 1;
    }
    if (interpret_headers(out_request) != 0) {
        return 1;
    }

    state_ = HTTP1State::COMPLETE;
    out_consumed = end + 4;
    return 0;
}

int HTTP1Parser::parse_request_line(std::string_view head, HTTP1Request& req) noexcept {
    size_t line_end = head.find("\r\n");
    std::string_view line = head.substr(0, line_end);

    // METHOD SP request-target SP HTTP-version
    size_t sp1 = line.find(' ');
    if (sp1 == std::string_view::npos || sp1 == 0) {
        return fail(HTTP1Error::BAD_REQUEST_LINE);
    }
    req.method_str = line.substr(0, sp1);
    for (char c : req.method_str) {
        if (!is_token_char(static_cast<uint8_t>(c))) {
            return fail(HTTP1Error::BAD_REQUEST_LINE);
        }
    }
    req.method = method_from_string(req.method_str);

    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos || sp2 == sp1 + 1) {
        return fail(HTTP1Error::BAD_REQUEST_LINE);
    }
    req.url = line.substr(sp1 + 1, sp2 - sp1 - 1);
    for (char c : req.url) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return fail(HTTP1Error::BAD_REQUEST_LINE);
        }
    }
    split_target(req.url, req.path, req.query);
    if (req.path.empty()) {
        return fail(HTTP1Error::BAD_REQUEST_LINE);
    }

    std::string_view version = line.substr(sp2 + 1);
    if (version == "HTTP/1.1") {
        req.version = HTTP1Version::HTTP_1_1;
    } else if (version == "HTTP/1.0") {
        req.version = HTTP1Version::HTTP_1_0;
    } else {
        return fail(HTTP1Error::BAD_VERSION);
    }

    pos_ = line_end + 2;
    return 0;
}

int HTTP1Parser::parse_headers(std::string_view head, HTTP1Request& req) noexcept {
    while (pos_ < head.size()) {
        size_t line_end = head.find("\r\n", pos_);
        std::string_view line = head.substr(pos_, line_end - pos_);
        pos_ = line_end + 2;

        if (line.empty()) {
            break;
        }

        // obs-fold is not accepted (RFC 9112 5.2)
        if (line[0] == ' ' || line[0] == '\t') {
            return fail(HTTP1Error::BAD_HEADER);
        }

        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return fail(HTTP1Error::BAD_HEADER);
        }

        std::string_view name = line.substr(0, colon);
        for (char c : name) {
            if (!is_token_char(static_cast<uint8_t>(c))) {
                return fail(HTTP1Error::BAD_HEADER);
            }
        }

        if (req.header_count >= HTTP1Request::MAX_HEADERS) {
            return fail(HTTP1Error::TOO_MANY_HEADERS);
        }

        auto& header = req.headers[req.header_count++];
        header.name = name;
        header.value = trim(line.substr(colon + 1));
    }
    return 0;
}

int HTTP1Parser::interpret_headers(HTTP1Request& req) noexcept {
    bool saw_connection_close = false;
    bool saw_connection_keep_alive = false;

    for (size_t i = 0; i < req.header_count; ++i) {
        const auto& header = req.headers[i];

        if (str_eq_ci(header.name, "content-length")) {
            uint64_t value = 0;
            if (!parse_uint64(header.value, value)) {
                return fail(HTTP1Error::BAD_CONTENT_LENGTH);
            }
            if (req.has_content_length && req.content_length != value) {
                return fail(HTTP1Error::BAD_CONTENT_LENGTH);
            }
            req.content_length = value;
            req.has_content_length = true;
        } else if (str_eq_ci(header.name, "transfer-encoding")) {
            // Only a bare "chunked" coding is decoded.
            if (!str_eq_ci(header.value, "chunked")) {
                return fail(HTTP1Error::BAD_TRANSFER_ENCODING);
            }
            req.chunked = true;
        } else if (str_eq_ci(header.name, "connection")) {
            saw_connection_close = saw_connection_close || has_token(header.value, "close");
            saw_connection_keep_alive = saw_connection_keep_alive || has_token(header.value, "keep-alive");
        } else if (str_eq_ci(header.name, "expect")) {
            req.expect_continue = str_eq_ci(header.value, "100-continue");
        }
    }

    if (req.chunked && req.version == HTTP1Version::HTTP_1_0) {
        return fail(HTTP1Error::BAD_TRANSFER_ENCODING);
    }

    if (req.chunked) {
        // Transfer-Encoding overrides Content-Length (RFC 9112 6.3)
        req.has_content_length = false;
        req.content_length = 0;
    }

    if (req.version == HTTP1Version::HTTP_1_1) {
        req.keep_alive = !saw_connection_close;
    } else {
        req.keep_alive = saw_connection_keep_alive && !saw_connection_close;
        req.expect_continue = false;
    }

    return 0;
}

void HTTP1Parser::split_target(std::string_view target,
                               std::string_view& path,
                               std::string_view& query) noexcept {
    // Absolute-form: scheme "://" authority path
    size_t scheme_end = target.find("://");
    if (!target.empty() && target[0] != '/' && scheme_end != std::string_view::npos) {
        size_t path_start = target.find_first_of("/?", scheme_end + 3);
        if (path_start == std::string_view::npos) {
            path = "/";
            query = {};
            return;
        }
        if (target[path_start] == '?') {
            path = "/";
            query = target.substr(path_start + 1);
            return;
        }
        target = target.substr(path_start);
    }

    size_t fragment_pos = target.find('#');
    if (fragment_pos != std::string_view::npos) {
        target = target.substr(0, fragment_pos);
    }

    size_t query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        path = target.substr(0, query_pos);
        query = target.substr(query_pos + 1);
    } else {
        path = target;
        query = {};
    }
}

HTTP1Method HTTP1Parser::method_from_string(std::string_view m) noexcept {
    if (m == "GET") return HTTP1Method::GET;
    if (m == "POST") return HTTP1Method::POST;
    if (m == "PUT") return HTTP1Method::PUT;
    if (m == "HEAD") return HTTP1Method::HEAD;
    if (m == "OPTIONS") return HTTP1Method::OPTIONS;
    if (m == "DELETE") return HTTP1Method::DELETE;
    if (m == "PATCH") return HTTP1Method::PATCH;
    if (m == "CONNECT") return HTTP1Method::CONNECT;
    if (m == "TRACE") return HTTP1Method::TRACE;
    return HTTP1Method::UNKNOWN;
}

bool HTTP1Parser::parse_uint64(std::string_view text, uint64_t& out) noexcept {
    if (text.empty()) {
        return false;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

bool HTTP1Parser::has_token(std::string_view list, std::string_view token) noexcept {
    while (!list.empty()) {
        size_t comma = list.find(',');
        std::string_view item = trim(list.substr(0, comma));
        if (str_eq_ci(item, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        list.remove_prefix(comma + 1);
    }
    return false;
}

bool HTTP1Parser::is_token_char(uint8_t c) noexcept {
    // RFC 9110: tchar
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           c == '!' || c == '#' || c == '$' || c == '%' || c == '&' || c == '\'' ||
           c == '*' || c == '+' || c == '-' || c == '.' || c == '^' || c == '_' ||
           c == '`' || c == '|' || c == '~';
}

std::string_view HTTP1Parser::trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool HTTP1Parser::str_eq_ci(std::string_view a, std::string_view b) noexcept {
    if (a.length() != b.length()) {
        return false;
    }

    for (size_t i = 0; i < a.length(); ++i) {
        if (ascii_lower(a[i]) != ascii_lower(b[i])) {
            return false;
        }
    }

    return true;
}

} // namespace http
} // namespace piping
