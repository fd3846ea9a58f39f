#include "multipart.h"
#include "http1_parser.h"

namespace piping {
namespace http {

using core::error_code;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

MultipartExtractor::MultipartExtractor(std::string_view boundary)
    : delimiter_("\r\n--")
{
    delimiter_.append(boundary);
    // The first delimiter may sit at offset 0 with no CRLF before it.
    buffer_ = "\r\n";
}

std::optional<std::string> MultipartExtractor::boundary_from(std::string_view content_type) {
    size_t semi = content_type.find(';');
    if (!HTTP1Parser::str_eq_ci(trim(content_type.substr(0, semi)), "multipart/form-data")) {
        return std::nullopt;
    }

    while (semi != std::string_view::npos) {
        content_type.remove_prefix(semi + 1);
        semi = content_type.find(';');
        std::string_view param = trim(content_type.substr(0, semi));

        size_t eq = param.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        if (!HTTP1Parser::str_eq_ci(trim(param.substr(0, eq)), "boundary")) {
            continue;
        }

        std::string_view value = trim(param.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        // RFC 2046: 1 to 70 characters
        if (value.empty() || value.size() > 70) {
            return std::nullopt;
        }
        return std::string(value);
    }

    return std::nullopt;
}

core::result<std::string> MultipartExtractor::feed(std::string_view data) {
    std::string out;
    if (state_ == State::DONE) {
        return out;
    }

    buffer_.append(data);

    if (state_ == State::PREAMBLE) {
        size_t pos = buffer_.find(delimiter_);
        if (pos == std::string::npos) {
            // Keep only what could still start a delimiter.
            if (buffer_.size() >= delimiter_.size()) {
                buffer_.erase(0, buffer_.size() - (delimiter_.size() - 1));
            }
            return out;
        }
        // Keep the CRLF that ends the delimiter line; it starts the header search.
        buffer_.erase(0, pos + delimiter_.size());
        state_ = State::HEADERS;
    }

    if (state_ == State::HEADERS) {
        // Transport padding after the delimiter is allowed before CRLF.
        size_t line_end = buffer_.find("\r\n");
        if (line_end == std::string::npos) {
            if (buffer_.size() > MAX_HEADER_BLOCK) {
                return core::err<std::string>(error_code::parse_error);
            }
            return out;
        }
        if (buffer_.compare(0, 2, "--") == 0) {
            // Close delimiter before any part: empty payload.
            state_ = State::DONE;
            buffer_.clear();
            return out;
        }

        size_t end = buffer_.find("\r\n\r\n", line_end);
        if (end == std::string::npos) {
            if (buffer_.size() > MAX_HEADER_BLOCK) {
                return core::err<std::string>(error_code::parse_error);
            }
            return out;
        }

        // An empty header block puts the blank line right at line_end.
        std::string_view block;
        if (end > line_end) {
            block = std::string_view(buffer_.data() + line_end + 2, end - (line_end + 2));
        }
        if (!parse_header_block(block)) {
            return core::err<std::string>(error_code::parse_error);
        }

        buffer_.erase(0, end + 4);
        state_ = State::BODY;
    }

    if (state_ == State::BODY) {
        size_t pos = buffer_.find(delimiter_);
        if (pos != std::string::npos) {
            out.assign(buffer_, 0, pos);
            buffer_.clear();
            state_ = State::DONE;
            return out;
        }

        size_t keep = delimiter_.size() - 1;
        if (buffer_.size() > keep) {
            size_t release = buffer_.size() - keep;
            out.assign(buffer_, 0, release);
            buffer_.erase(0, release);
        }
    }

    return out;
}

core::result<void> MultipartExtractor::finish() {
    if (state_ != State::DONE) {
        return core::err(error_code::parse_error);
    }
    return core::ok();
}

bool MultipartExtractor::parse_header_block(std::string_view block) {
    headers_.clear();
    while (!block.empty()) {
        size_t eol = block.find("\r\n");
        std::string_view line = block.substr(0, eol);
        block = eol == std::string_view::npos ? std::string_view() : block.substr(eol + 2);

        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return false;
        }
        headers_.emplace_back(std::string(trim(line.substr(0, colon))),
                              std::string(trim(line.substr(colon + 1))));
    }
    return true;
}

const std::string* MultipartExtractor::part_header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

} // namespace http
} // namespace piping
