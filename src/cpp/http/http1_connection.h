/**
 * HTTP/1.1 Connection Handler
 *
 * Manages HTTP/1.0 and HTTP/1.1 connections with:
 * - Request head parsing (HTTP1Parser)
 * - Streaming request bodies (BodyDecoder) with pause/resume backpressure
 * - Streaming responses through ResponseWriter
 * - Keep-alive and pipelining (one exchange at a time)
 * - Peer-close detection while a handler is waiting
 *
 * Supports both cleartext and TLS connections through net::Stream.
 */

#pragma once

#include "http1_parser.h"
#include "body_decoder.h"
#include "exchange.h"
#include "../net/event_loop.h"
#include "../net/stream.h"
#include "../core/result.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace piping {
namespace http {

/**
 * HTTP/1.1 Connection State
 */
enum class Http1State {
    READING_REQUEST,     // Waiting for / parsing a request head
    IN_EXCHANGE,         // A handler owns the current request
    CLOSING,             // Flushing the last response, then close
    CLOSED
};

/**
 * HTTP/1.1 Connection
 *
 * Confined to the event loop thread that accepted it. Owned through a
 * shared_ptr by the server's per-thread connection table; the fd handler
 * only keeps a weak_ptr.
 */
class Http1Connection : public ExchangeSink,
                        public std::enable_shared_from_this<Http1Connection> {
public:
    /**
     * Called on the loop thread for every request head.
     */
    using RequestHandler = std::function<void(const std::shared_ptr<Exchange>& exchange)>;

    /**
     * Called once when the connection is closed (argument: fd).
     */
    using ClosedCallback = std::function<void(int fd)>;

    /**
     * Largest chunk read from the socket at once.
     */
    static constexpr size_t READ_CHUNK = 16 * 1024;

    /**
     * Input buffered while no handler is consuming it.
     */
    static constexpr size_t MAX_INPUT_BUFFER = 256 * 1024;

    Http1Connection(std::unique_ptr<net::Stream> stream,
                    net::EventLoop* loop,
                    RequestHandler handler,
                    ClosedCallback on_closed);

    ~Http1Connection() override;

    Http1Connection(const Http1Connection&) = delete;
    Http1Connection& operator=(const Http1Connection&) = delete;

    /**
     * Register with the event loop and process anything already readable.
     * @return false if the fd could not be registered (connection closed)
     */
    bool start();

    /**
     * Close now. Notifies the active exchange.
     */
    void close();

    int fd() const noexcept { return fd_; }
    Http1State get_state() const noexcept { return state_; }
    bool is_secure() const noexcept { return secure_; }

    // ExchangeSink
    void write_response(uint64_t id, std::string bytes, FlushCallback on_flushed) override;
    void finish_response(uint64_t id, bool close_after) override;
    void abort_exchange(uint64_t id) override;
    void set_body_paused(uint64_t id, bool paused) override;

private:
    void on_event(net::IOEvent events);

    /**
     * Alternate between consuming buffered input and reading more until
     * neither makes progress. Re-entrant calls are folded into the
     * running one.
     */
    void pump();

    /**
     * Parse heads and hand body bytes to the active exchange.
     */
    void process_input();

    /**
     * Read one chunk if the current state wants input.
     * @return true if something changed (bytes read, EOF, or close)
     */
    bool fill_input();
    bool want_read() const noexcept;

    /**
     * Write queued output, then fire flush callbacks that are due.
     */
    void flush_output();
    bool write_pending();
    void schedule_flush_callbacks();
    void run_flush_callbacks();

    void begin_exchange(const HTTP1Request& parsed, size_t consumed);
    void complete_exchange();
    void send_error(int status, const char* message);
    void schedule_pump();

    size_t input_size() const noexcept { return input_.size() - input_offset_; }
    void consume_input(size_t n);

    std::unique_ptr<net::Stream> stream_;
    net::EventLoop* loop_;
    RequestHandler handler_;
    ClosedCallback on_closed_;
    int fd_;
    bool secure_;

    Http1State state_ = Http1State::READING_REQUEST;
    HTTP1Parser parser_;
    BodyDecoder body_;

    std::shared_ptr<Exchange> exchange_;
    uint64_t next_exchange_id_ = 1;
    bool end_delivered_ = false;     // deliver_end() done for the current exchange
    bool response_done_ = false;     // finish_response() seen for the current exchange
    bool discard_body_ = false;      // Response finished first; drain the request body
    bool close_after_response_ = false;

    std::string input_;
    size_t input_offset_ = 0;
    bool peer_eof_ = false;
    bool force_read_ = false;        // Peer shut down; read to EOF regardless of pause

    std::string output_;
    size_t output_offset_ = 0;
    uint64_t bytes_queued_ = 0;
    uint64_t bytes_sent_ = 0;
    std::deque<std::pair<uint64_t, FlushCallback>> flush_callbacks_;
    bool callbacks_scheduled_ = false;
    bool pump_scheduled_ = false;

    bool in_pump_ = false;
    bool pump_again_ = false;
};

} // namespace http
} // namespace piping
