#pragma once

#include "request.h"
#include "response_writer.h"
#include "../net/event_loop.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace piping {
namespace http {

/**
 * Output side of a connection, as seen by an Exchange.
 *
 * Implemented by Http1Connection. Every call carries the exchange id so
 * calls from an exchange that already finished are ignored.
 */
class ExchangeSink {
public:
    using FlushCallback = std::function<void()>;

    virtual ~ExchangeSink() = default;

    /**
     * Queue response bytes. on_flushed runs on the loop thread once these
     * bytes (and everything queued before them) were handed to the kernel.
     * It never runs if the connection closes first.
     */
    virtual void write_response(uint64_t id, std::string bytes, FlushCallback on_flushed) = 0;

    /**
     * The response is complete. close_after forces the connection to close
     * once the output drained.
     */
    virtual void finish_response(uint64_t id, bool close_after) = 0;

    /**
     * Drop the connection without completing the response.
     */
    virtual void abort_exchange(uint64_t id) = 0;

    /**
     * Stop or restart delivery of request body bytes.
     */
    virtual void set_body_paused(uint64_t id, bool paused) = 0;
};

/**
 * One request/response pair on a connection.
 *
 * Confined to the loop thread of its connection: every method must be
 * called there. Code running elsewhere reaches it through loop()->post().
 *
 * The request body starts paused. A handler that wants it registers
 * on_body() and calls resume_body(); calling pause_body() from inside the
 * body callback stops delivery after the current chunk.
 */
class Exchange : public std::enable_shared_from_this<Exchange> {
public:
    using BodyHandler = std::function<void(std::string_view chunk)>;
    using EndHandler = std::function<void(bool complete)>;
    using CloseHandler = std::function<void()>;

    Exchange(Request request, std::weak_ptr<ExchangeSink> sink, uint64_t id, net::EventLoop* loop);

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    const Request& request() const noexcept { return request_; }
    ResponseWriter& response() noexcept { return response_; }
    net::EventLoop* loop() const noexcept { return loop_; }
    uint64_t id() const noexcept { return id_; }

    /**
     * Register body callbacks. on_end(complete) fires exactly once:
     * complete is false when the connection ended before the body did.
     */
    void on_body(BodyHandler on_chunk, EndHandler on_end);

    /**
     * Called once when the connection closes before the exchange finished.
     */
    void on_close(CloseHandler handler);

    void pause_body();
    void resume_body();
    bool body_paused() const noexcept { return body_paused_; }

    /**
     * True once the underlying connection is gone.
     */
    bool is_closed() const noexcept { return closed_; }

    // ---- Connection side -------------------------------------------------

    void deliver_body(std::string_view chunk);
    void deliver_end(bool complete);
    void notify_closed();

    /**
     * Forget all handlers (the exchange completed).
     */
    void detach();

    std::shared_ptr<ExchangeSink> sink() const { return sink_.lock(); }

private:
    Request request_;
    std::weak_ptr<ExchangeSink> sink_;
    uint64_t id_;
    net::EventLoop* loop_;
    ResponseWriter response_;

    BodyHandler on_chunk_;
    EndHandler on_end_;
    CloseHandler on_close_;

    bool body_paused_ = true;
    bool body_ended_ = false;
    bool closed_ = false;
};

} // namespace http
} // namespace piping
