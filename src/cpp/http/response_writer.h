#pragma once

#include "request.h"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace piping {
namespace http {

class Exchange;

/**
 * Incremental HTTP/1.x response writer.
 *
 * Lets a handler emit status and headers first and stream the body
 * afterwards, possibly long after the handler returned. Headers go out with
 * the first write_chunk(), flush_headers() or end(); after that
 * send_status()/send_headers() fail.
 *
 * Body framing is chosen when the headers are flushed:
 * - no body for HEAD requests and 1xx/204/304 statuses
 * - Content-Length when the handler supplied one
 * - chunked on HTTP/1.1
 * - close-delimited on HTTP/1.0
 *
 * Backpressure: write_chunk() returns immediately; on_flushed runs once the
 * bytes left the process. Callers that wait for it before writing again
 * never buffer more than one chunk.
 */
class ResponseWriter {
public:
    using FlushCallback = std::function<void()>;

    explicit ResponseWriter(Exchange& exchange);

    ResponseWriter(const ResponseWriter&) = delete;
    ResponseWriter& operator=(const ResponseWriter&) = delete;

    /**
     * Set the status line. Reason defaults to the standard phrase.
     * @return false once headers were sent
     */
    bool send_status(int code, std::string reason = "");

    /**
     * Append header fields.
     * @return false once headers were sent
     */
    bool send_headers(const HeaderList& headers);

    /**
     * Send "100 Continue" if the request asked for it and no final
     * response was started yet.
     */
    void send_continue();

    /**
     * Serialize and queue the status line and headers.
     * @return false if already sent or the connection is gone
     */
    bool flush_headers(FlushCallback on_flushed = nullptr);

    /**
     * Queue a body chunk (headers are flushed first if needed).
     * Empty data only flushes the headers.
     *
     * @return false if the response already ended or the connection is gone;
     *         on_flushed is not called in that case
     */
    bool write_chunk(std::string_view data, FlushCallback on_flushed = nullptr);

    /**
     * Finish the response (terminating chunk for chunked framing).
     * @return false if already finished or the connection is gone
     */
    bool end(FlushCallback on_flushed = nullptr);

    /**
     * Drop the connection without finishing the response. Receivers of a
     * chunked body see it end without the terminating chunk.
     */
    void abort();

    /**
     * Complete response in one call. Content-Length is set from body; the
     * body itself is omitted for HEAD requests.
     */
    bool respond(int status, const HeaderList& headers, std::string_view body);

    bool headers_sent() const noexcept { return headers_sent_; }
    bool finished() const noexcept { return finished_; }

    /**
     * Standard reason phrase for a status code.
     */
    static const char* status_text(int code) noexcept;

private:
    enum class Framing : uint8_t {
        NONE,
        LENGTH,
        CHUNKED,
        CLOSE
    };

    const std::string* find_header(std::string_view name) const noexcept;
    std::string serialize_head();
    bool queue(std::string bytes, FlushCallback on_flushed);

    Exchange& exchange_;
    int status_ = 200;
    std::string reason_;
    HeaderList headers_;
    Framing framing_ = Framing::CHUNKED;
    bool headers_sent_ = false;
    bool finished_ = false;
    bool continue_sent_ = false;
    bool close_after_ = false;
};

} // namespace http
} // namespace piping
