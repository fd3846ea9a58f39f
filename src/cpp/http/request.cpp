#include "request.h"

namespace piping {
namespace http {

namespace {

int hex_to_int(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

HTTP1Method method_enum_of(std::string_view m) noexcept {
    if (m == "GET") return HTTP1Method::GET;
    if (m == "HEAD") return HTTP1Method::HEAD;
    if (m == "POST") return HTTP1Method::POST;
    if (m == "PUT") return HTTP1Method::PUT;
    if (m == "OPTIONS") return HTTP1Method::OPTIONS;
    if (m == "DELETE") return HTTP1Method::DELETE;
    if (m == "PATCH") return HTTP1Method::PATCH;
    if (m == "CONNECT") return HTTP1Method::CONNECT;
    if (m == "TRACE") return HTTP1Method::TRACE;
    return HTTP1Method::UNKNOWN;
}

} // namespace

Request Request::from_parsed(const HTTP1Request& parsed, bool secure) {
    Request req;
    req.method_.assign(parsed.method_str);
    req.method_enum_ = parsed.method;
    req.target_.assign(parsed.url);
    req.path_.assign(parsed.path);
    req.query_.assign(parsed.query);
    req.version_minor_ = parsed.version == HTTP1Version::HTTP_1_0 ? 0 : 1;
    req.secure_ = secure;
    req.keep_alive_ = parsed.keep_alive;
    req.expect_continue_ = parsed.expect_continue;

    req.headers_.reserve(parsed.header_count);
    for (size_t i = 0; i < parsed.header_count; ++i) {
        req.headers_.emplace_back(std::string(parsed.headers[i].name),
                                  std::string(parsed.headers[i].value));
    }
    return req;
}

const std::string* Request::header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

std::optional<std::string> Request::query_param(std::string_view key) const {
    std::string_view query(query_);
    size_t pos = 0;

    while (pos <= query.size()) {
        size_t next_amp = query.find('&', pos);
        if (next_amp == std::string_view::npos) {
            next_amp = query.size();
        }

        std::string_view pair = query.substr(pos, next_amp - pos);
        if (!pair.empty()) {
            size_t eq_pos = pair.find('=');
            std::string_view raw_key = pair.substr(0, eq_pos);
            if (url_decode(raw_key) == key) {
                if (eq_pos == std::string_view::npos) {
                    return std::string();
                }
                return url_decode(pair.substr(eq_pos + 1));
            }
        }

        pos = next_amp + 1;
    }

    return std::nullopt;
}

std::string Request::url_decode(std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());  // Decoded string won't be larger

    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];

        if (c == '%' && i + 2 < encoded.size()) {
            int high = hex_to_int(encoded[i + 1]);
            int low = hex_to_int(encoded[i + 2]);

            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            } else {
                // Invalid encoding, keep as-is
                decoded.push_back(c);
            }
        } else if (c == '+') {
            decoded.push_back(' ');
        } else {
            decoded.push_back(c);
        }
    }

    return decoded;
}

void Request::set_method(std::string method) {
    method_enum_ = method_enum_of(method);
    method_ = std::move(method);
}

void Request::set_target(std::string target) {
    target_ = std::move(target);
    std::string_view path;
    std::string_view query;
    HTTP1Parser::split_target(target_, path, query);
    path_.assign(path);
    query_.assign(query);
}

void Request::add_header(std::string name, std::string value) {
    if (HTTP1Parser::str_eq_ci(name, "expect")) {
        expect_continue_ = HTTP1Parser::str_eq_ci(value, "100-continue");
    }
    headers_.emplace_back(std::move(name), std::move(value));
}

} // namespace http
} // namespace piping
