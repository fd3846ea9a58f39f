#include "http1_connection.h"
#include "../core/logger.h"

namespace piping {
namespace http {

using core::error_code;

Http1Connection::Http1Connection(std::unique_ptr<net::Stream> stream,
                                 net::EventLoop* loop,
                                 RequestHandler handler,
                                 ClosedCallback on_closed)
    : stream_(std::move(stream))
    , loop_(loop)
    , handler_(std::move(handler))
    , on_closed_(std::move(on_closed))
    , fd_(stream_->fd())
    , secure_(stream_->is_secure())
{
}

Http1Connection::~Http1Connection() {
    if (state_ != Http1State::CLOSED) {
        loop_->remove_fd(fd_);
        stream_->close();
    }
}

bool Http1Connection::start() {
    std::weak_ptr<Http1Connection> weak = shared_from_this();
    int rc = loop_->add_fd(
        fd_,
        net::IOEvent::READ | net::IOEvent::WRITE | net::IOEvent::EDGE,
        [weak](int, net::IOEvent events, void*) {
            if (auto self = weak.lock()) {
                self->on_event(events);
            }
        });

    if (rc < 0) {
        LOG_ERROR("HTTP1", "fd=%d failed to register with event loop", fd_);
        close();
        return false;
    }

    LOG_DEBUG("HTTP1", "fd=%d connection started (%s)", fd_, secure_ ? "https" : "http");
    pump();
    return state_ != Http1State::CLOSED;
}

void Http1Connection::on_event(net::IOEvent events) {
    auto self = shared_from_this();

    if (events & net::IOEvent::ERROR) {
        LOG_DEBUG("HTTP1", "fd=%d socket error", fd_);
        close();
        return;
    }

    if (events & net::IOEvent::HUP) {
        force_read_ = true;
    }

    if (events & net::IOEvent::WRITE) {
        flush_output();
        if (state_ == Http1State::CLOSED) {
            return;
        }
    }

    pump();
}

// ============================================================================
// Input
// ============================================================================

void Http1Connection::pump() {
    if (state_ == Http1State::CLOSED) {
        return;
    }
    if (in_pump_) {
        pump_again_ = true;
        return;
    }

    auto self = shared_from_this();
    in_pump_ = true;
    do {
        pump_again_ = false;
        process_input();
        if (state_ == Http1State::CLOSED) {
            break;
        }
        if (fill_input()) {
            pump_again_ = true;
        }
    } while (pump_again_ && state_ != Http1State::CLOSED);
    in_pump_ = false;
}

bool Http1Connection::want_read() const noexcept {
    if (peer_eof_ || state_ == Http1State::CLOSED || state_ == Http1State::CLOSING) {
        return false;
    }
    if (force_read_ || state_ == Http1State::READING_REQUEST) {
        return input_size() < MAX_INPUT_BUFFER;
    }
    if (!body_.done()) {
        // At most one read's worth of body is buffered.
        if (discard_body_ || !exchange_->body_paused()) {
            return input_size() == 0;
        }
        return false;
    }
    // Body finished: watch for the next pipelined head or for EOF.
    return input_size() < MAX_INPUT_BUFFER;
}

bool Http1Connection::fill_input() {
    if (!want_read()) {
        return false;
    }

    if (input_offset_ > 0 && input_offset_ >= input_.size() / 2) {
        input_.erase(0, input_offset_);
        input_offset_ = 0;
    }

    size_t base = input_.size();
    input_.resize(base + READ_CHUNK);
    auto r = stream_->read(&input_[base], READ_CHUNK);

    if (r.is_ok()) {
        input_.resize(base + r.value());
        if (r.value() == 0) {
            LOG_DEBUG("HTTP1", "fd=%d peer finished sending", fd_);
            peer_eof_ = true;
        }
        return true;
    }

    input_.resize(base);
    if (r.error() == error_code::would_block) {
        return false;
    }

    LOG_DEBUG("HTTP1", "fd=%d read failed: %s", fd_, core::to_string(r.error()));
    close();
    return true;
}

void Http1Connection::consume_input(size_t n) {
    input_offset_ += n;
    if (input_offset_ >= input_.size()) {
        input_.clear();
        input_offset_ = 0;
    }
}

void Http1Connection::process_input() {
    while (state_ != Http1State::CLOSED) {
        if (state_ == Http1State::CLOSING) {
            return;
        }

        if (state_ == Http1State::READING_REQUEST) {
            if (input_size() == 0) {
                if (peer_eof_) {
                    close();
                }
                return;
            }

            HTTP1Request parsed;
            size_t consumed = 0;
            int rc = parser_.parse(
                reinterpret_cast<const uint8_t*>(input_.data() + input_offset_),
                input_size(), parsed, consumed);

            if (rc < 0) {
                if (input_size() > HTTP1Parser::MAX_HEAD_SIZE) {
                    send_error(431, "[ERROR] Request header fields too large.\n");
                } else if (peer_eof_) {
                    close();
                }
                return;
            }

            if (rc > 0) {
                LOG_DEBUG("HTTP1", "fd=%d malformed request (error %d)", fd_,
                          static_cast<int>(parser_.error()));
                if (parser_.error() == HTTP1Error::TOO_MANY_HEADERS) {
                    send_error(431, "[ERROR] Request header fields too large.\n");
                } else {
                    send_error(400, "[ERROR] Bad request.\n");
                }
                return;
            }

            if (consumed > HTTP1Parser::MAX_HEAD_SIZE) {
                send_error(431, "[ERROR] Request header fields too large.\n");
                return;
            }

            begin_exchange(parsed, consumed);
            continue;
        }

        // IN_EXCHANGE
        if (!body_.done()) {
            bool deliver = !discard_body_;

            if (deliver && exchange_->body_paused()) {
                if (peer_eof_) {
                    // Nothing more will arrive; decide now whether the body is cut short.
                    BodyDecoder probe = body_;
                    std::string_view rest(input_.data() + input_offset_, input_size());
                    while (!rest.empty() && !probe.done()) {
                        auto step = probe.decode(rest);
                        if (step.is_err() || step.value().consumed == 0) {
                            break;
                        }
                        rest.remove_prefix(step.value().consumed);
                    }
                    if (!probe.done()) {
                        close();
                    }
                }
                return;
            }

            if (input_size() == 0) {
                if (peer_eof_) {
                    LOG_DEBUG("HTTP1", "fd=%d request body cut short", fd_);
                    close();
                }
                return;
            }

            std::string_view data(input_.data() + input_offset_, input_size());
            auto step = body_.decode(data);
            if (step.is_err()) {
                LOG_WARN("HTTP1", "fd=%d malformed chunked body", fd_);
                close();
                return;
            }

            if (deliver && !step.value().payload.empty()) {
                auto exchange = exchange_;
                exchange->deliver_body(step.value().payload);
                if (state_ == Http1State::CLOSED) {
                    return;
                }
            }
            consume_input(step.value().consumed);
            continue;
        }

        if (!end_delivered_ && !discard_body_ && !exchange_->body_paused()) {
            end_delivered_ = true;
            auto exchange = exchange_;
            exchange->deliver_end(true);
            continue;
        }

        if (response_done_) {
            complete_exchange();
            continue;
        }

        // The handler still owns the exchange; EOF here means the client left.
        if (peer_eof_) {
            LOG_DEBUG("HTTP1", "fd=%d client closed while waiting for response", fd_);
            close();
        }
        return;
    }
}

void Http1Connection::begin_exchange(const HTTP1Request& parsed, size_t consumed) {
    Request request = Request::from_parsed(parsed, secure_);

    if (parsed.chunked) {
        body_ = BodyDecoder::chunked();
    } else if (parsed.has_content_length) {
        body_ = BodyDecoder::length(parsed.content_length);
    } else {
        body_ = BodyDecoder::none();
    }
    consume_input(consumed);

    end_delivered_ = false;
    response_done_ = false;
    discard_body_ = false;
    close_after_response_ = !request.keep_alive();
    state_ = Http1State::IN_EXCHANGE;

    uint64_t id = next_exchange_id_++;
    LOG_DEBUG("HTTP1", "fd=%d request #%llu %s %s", fd_,
              static_cast<unsigned long long>(id), request.method().c_str(),
              request.target().c_str());

    std::weak_ptr<ExchangeSink> sink = std::static_pointer_cast<ExchangeSink>(shared_from_this());
    exchange_ = std::make_shared<Exchange>(std::move(request), std::move(sink), id, loop_);

    auto exchange = exchange_;
    try {
        handler_(exchange);
    } catch (const std::exception& e) {
        LOG_ERROR("HTTP1", "fd=%d request handler failed: %s", fd_, e.what());
        close();
    }
}

void Http1Connection::complete_exchange() {
    auto exchange = std::move(exchange_);
    exchange_.reset();
    exchange->detach();

    parser_.reset();
    body_ = BodyDecoder::none();
    state_ = Http1State::READING_REQUEST;

    if (close_after_response_) {
        state_ = Http1State::CLOSING;
        if (output_offset_ >= output_.size() && !stream_->has_pending_output()) {
            close();
        }
    }
}

void Http1Connection::send_error(int status, const char* message) {
    std::string body(message);
    std::string response = "HTTP/1.1 " + std::to_string(status) + " " +
                           ResponseWriter::status_text(status) + "\r\n"
                           "Content-Type: text/plain; charset=utf-8\r\n"
                           "Content-Length: " + std::to_string(body.size()) + "\r\n"
                           "Connection: close\r\n"
                           "\r\n" + body;

    bytes_queued_ += response.size();
    output_ += response;
    state_ = Http1State::CLOSING;

    if (!write_pending()) {
        return;
    }
    if (output_offset_ >= output_.size() && !stream_->has_pending_output()) {
        close();
    }
}

// ============================================================================
// Output
// ============================================================================

void Http1Connection::write_response(uint64_t id, std::string bytes, FlushCallback on_flushed) {
    if (state_ == Http1State::CLOSED || !exchange_ || exchange_->id() != id) {
        return;
    }

    bytes_queued_ += bytes.size();
    if (output_offset_ >= output_.size()) {
        output_ = std::move(bytes);
        output_offset_ = 0;
    } else {
        output_ += bytes;
    }
    if (on_flushed) {
        flush_callbacks_.emplace_back(bytes_queued_, std::move(on_flushed));
    }

    if (write_pending()) {
        schedule_flush_callbacks();
    }
}

void Http1Connection::finish_response(uint64_t id, bool close_after) {
    if (state_ == Http1State::CLOSED || !exchange_ || exchange_->id() != id) {
        return;
    }

    response_done_ = true;
    close_after_response_ = close_after_response_ || close_after;
    if (!body_.done()) {
        // The handler is done with the request; drain what is left of its body.
        discard_body_ = true;
    }
    schedule_pump();
}

void Http1Connection::abort_exchange(uint64_t id) {
    if (state_ == Http1State::CLOSED || !exchange_ || exchange_->id() != id) {
        return;
    }
    LOG_DEBUG("HTTP1", "fd=%d exchange aborted by handler", fd_);
    close();
}

void Http1Connection::set_body_paused(uint64_t id, bool paused) {
    if (state_ == Http1State::CLOSED || !exchange_ || exchange_->id() != id) {
        return;
    }
    if (!paused) {
        schedule_pump();
    }
}

bool Http1Connection::write_pending() {
    while (output_offset_ < output_.size()) {
        auto r = stream_->write(output_.data() + output_offset_, output_.size() - output_offset_);
        if (r.is_ok()) {
            output_offset_ += r.value();
            bytes_sent_ += r.value();
            continue;
        }
        if (r.error() == error_code::would_block) {
            break;
        }
        LOG_DEBUG("HTTP1", "fd=%d write failed: %s", fd_, core::to_string(r.error()));
        close();
        return false;
    }

    if (output_offset_ >= output_.size()) {
        output_.clear();
        output_offset_ = 0;
    }

    auto flushed = stream_->flush();
    if (flushed.is_err() && flushed.error() != error_code::would_block) {
        LOG_DEBUG("HTTP1", "fd=%d flush failed: %s", fd_, core::to_string(flushed.error()));
        close();
        return false;
    }
    return true;
}

void Http1Connection::flush_output() {
    if (!write_pending()) {
        return;
    }

    run_flush_callbacks();
    if (state_ == Http1State::CLOSING &&
        output_offset_ >= output_.size() && !stream_->has_pending_output()) {
        close();
    }
}

void Http1Connection::schedule_flush_callbacks() {
    if (callbacks_scheduled_ || flush_callbacks_.empty() ||
        flush_callbacks_.front().first > bytes_sent_) {
        return;
    }
    callbacks_scheduled_ = true;

    std::weak_ptr<Http1Connection> weak = shared_from_this();
    loop_->post([weak]() {
        if (auto self = weak.lock()) {
            self->callbacks_scheduled_ = false;
            self->run_flush_callbacks();
        }
    });
}

void Http1Connection::run_flush_callbacks() {
    auto self = shared_from_this();
    while (state_ != Http1State::CLOSED && !flush_callbacks_.empty() &&
           flush_callbacks_.front().first <= bytes_sent_) {
        auto callback = std::move(flush_callbacks_.front().second);
        flush_callbacks_.pop_front();
        callback();
    }
}

void Http1Connection::schedule_pump() {
    if (pump_scheduled_) {
        return;
    }
    pump_scheduled_ = true;

    std::weak_ptr<Http1Connection> weak = shared_from_this();
    loop_->post([weak]() {
        if (auto self = weak.lock()) {
            self->pump_scheduled_ = false;
            self->pump();
        }
    });
}

// ============================================================================
// Close
// ============================================================================

void Http1Connection::close() {
    if (state_ == Http1State::CLOSED) {
        return;
    }

    auto self = shared_from_this();
    state_ = Http1State::CLOSED;

    loop_->remove_fd(fd_);
    stream_->close();
    flush_callbacks_.clear();
    output_.clear();
    output_offset_ = 0;

    LOG_DEBUG("HTTP1", "fd=%d closed", fd_);

    auto exchange = std::move(exchange_);
    exchange_.reset();
    if (exchange) {
        if (!end_delivered_ && !discard_body_ && !body_.done()) {
            exchange->deliver_end(false);
        }
        exchange->notify_closed();
        exchange->detach();
    }

    if (on_closed_) {
        auto callback = std::move(on_closed_);
        on_closed_ = nullptr;
        callback(fd_);
    }
}

} // namespace http
} // namespace piping
