#include "exchange.h"

namespace piping {
namespace http {

Exchange::Exchange(Request request, std::weak_ptr<ExchangeSink> sink, uint64_t id, net::EventLoop* loop)
    : request_(std::move(request))
    , sink_(std::move(sink))
    , id_(id)
    , loop_(loop)
    , response_(*this)
{
}

void Exchange::on_body(BodyHandler on_chunk, EndHandler on_end) {
    on_chunk_ = std::move(on_chunk);
    on_end_ = std::move(on_end);
}

void Exchange::on_close(CloseHandler handler) {
    on_close_ = std::move(handler);
}

void Exchange::pause_body() {
    if (body_paused_ || body_ended_) {
        body_paused_ = true;
        return;
    }
    body_paused_ = true;
    if (auto sink = sink_.lock()) {
        sink->set_body_paused(id_, true);
    }
}

void Exchange::resume_body() {
    if (!body_paused_) {
        return;
    }
    body_paused_ = false;
    if (closed_) {
        return;
    }
    if (auto sink = sink_.lock()) {
        sink->set_body_paused(id_, false);
    }
}

void Exchange::deliver_body(std::string_view chunk) {
    if (body_ended_ || chunk.empty()) {
        return;
    }
    // Copy: the handler may replace itself while running.
    auto handler = on_chunk_;
    if (handler) {
        handler(chunk);
    }
}

void Exchange::deliver_end(bool complete) {
    if (body_ended_) {
        return;
    }
    body_ended_ = true;
    auto handler = std::move(on_end_);
    on_end_ = nullptr;
    on_chunk_ = nullptr;
    if (handler) {
        handler(complete);
    }
}

void Exchange::notify_closed() {
    if (closed_) {
        return;
    }
    closed_ = true;
    auto handler = std::move(on_close_);
    on_close_ = nullptr;
    if (handler) {
        handler();
    }
}

void Exchange::detach() {
    on_chunk_ = nullptr;
    on_end_ = nullptr;
    on_close_ = nullptr;
}

} // namespace http
} // namespace piping
