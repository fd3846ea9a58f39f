#include "response_writer.h"
#include "exchange.h"
#include <cstdio>

namespace piping {
namespace http {

ResponseWriter::ResponseWriter(Exchange& exchange)
    : exchange_(exchange)
{
}

const char* ResponseWriter::status_text(int code) noexcept {
    switch (code) {
        case 100: return "Continue";
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default: return "Unknown";
    }
}

bool ResponseWriter::send_status(int code, std::string reason) {
    if (headers_sent_) {
        return false;
    }
    status_ = code;
    reason_ = std::move(reason);
    return true;
}

bool ResponseWriter::send_headers(const HeaderList& headers) {
    if (headers_sent_) {
        return false;
    }
    headers_.insert(headers_.end(), headers.begin(), headers.end());
    return true;
}

void ResponseWriter::send_continue() {
    if (headers_sent_ || continue_sent_ || !exchange_.request().expect_continue()) {
        return;
    }
    continue_sent_ = true;
    queue("HTTP/1.1 100 Continue\r\n\r\n", nullptr);
}

const std::string* ResponseWriter::find_header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers_) {
        if (HTTP1Parser::str_eq_ci(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

std::string ResponseWriter::serialize_head() {
    const Request& request = exchange_.request();

    bool bodiless = request.is_head() || status_ == 204 || status_ == 304 ||
                    (status_ >= 100 && status_ < 200);

    if (bodiless) {
        framing_ = Framing::NONE;
    } else if (find_header("content-length")) {
        framing_ = Framing::LENGTH;
    } else if (request.version_minor() >= 1) {
        framing_ = Framing::CHUNKED;
        headers_.emplace_back("Transfer-Encoding", "chunked");
    } else {
        framing_ = Framing::CLOSE;
    }

    close_after_ = close_after_ || !request.keep_alive() || framing_ == Framing::CLOSE;
    if (close_after_) {
        headers_.emplace_back("Connection", "close");
    } else if (request.version_minor() == 0) {
        headers_.emplace_back("Connection", "keep-alive");
    }

    std::string head;
    head.reserve(256);
    head += "HTTP/1.1 ";
    head += std::to_string(status_);
    head += ' ';
    head += reason_.empty() ? status_text(status_) : reason_;
    head += "\r\n";
    for (const auto& [name, value] : headers_) {
        head += name;
        head += ": ";
        head += value;
        head += "\r\n";
    }
    head += "\r\n";
    return head;
}

bool ResponseWriter::queue(std::string bytes, FlushCallback on_flushed) {
    auto sink = exchange_.sink();
    if (!sink || exchange_.is_closed()) {
        return false;
    }
    sink->write_response(exchange_.id(), std::move(bytes), std::move(on_flushed));
    return true;
}

bool ResponseWriter::flush_headers(FlushCallback on_flushed) {
    if (headers_sent_ || finished_) {
        return false;
    }
    headers_sent_ = true;
    return queue(serialize_head(), std::move(on_flushed));
}

bool ResponseWriter::write_chunk(std::string_view data, FlushCallback on_flushed) {
    if (finished_) {
        return false;
    }

    std::string bytes;
    if (!headers_sent_) {
        headers_sent_ = true;
        bytes = serialize_head();
    }

    if (!data.empty()) {
        switch (framing_) {
            case Framing::NONE:
                break;
            case Framing::LENGTH:
            case Framing::CLOSE:
                bytes.append(data);
                break;
            case Framing::CHUNKED: {
                char size_line[24];
                int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
                bytes.append(size_line, static_cast<size_t>(n));
                bytes.append(data);
                bytes += "\r\n";
                break;
            }
        }
    }

    return queue(std::move(bytes), std::move(on_flushed));
}

bool ResponseWriter::end(FlushCallback on_flushed) {
    if (finished_) {
        return false;
    }

    std::string bytes;
    if (!headers_sent_) {
        const Request& request = exchange_.request();
        bool bodiless = request.is_head() || status_ == 204 || status_ == 304;
        if (!bodiless && !find_header("content-length")) {
            // Nothing was written: an empty body needs no chunked framing.
            headers_.emplace_back("Content-Length", "0");
        }
        headers_sent_ = true;
        bytes = serialize_head();
    } else if (framing_ == Framing::CHUNKED) {
        bytes = "0\r\n\r\n";
    }

    finished_ = true;

    auto sink = exchange_.sink();
    if (!sink || exchange_.is_closed()) {
        return false;
    }
    sink->write_response(exchange_.id(), std::move(bytes), std::move(on_flushed));
    sink->finish_response(exchange_.id(), close_after_);
    return true;
}

void ResponseWriter::abort() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (auto sink = exchange_.sink()) {
        sink->abort_exchange(exchange_.id());
    }
}

bool ResponseWriter::respond(int status, const HeaderList& headers, std::string_view body) {
    if (headers_sent_ || finished_) {
        return false;
    }
    send_status(status);
    send_headers(headers);

    bool bodiless = status == 204 || status == 304;
    if (!bodiless && !find_header("content-length")) {
        headers_.emplace_back("Content-Length", std::to_string(body.size()));
    }

    if (!body.empty() && !exchange_.request().is_head() && !bodiless) {
        if (!write_chunk(body)) {
            return false;
        }
    }
    return end();
}

} // namespace http
} // namespace piping
