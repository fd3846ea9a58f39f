#include "rendezvous.h"
#include "../core/logger.h"
#include "../http/http1_parser.h"
#include <limits>

namespace piping {
namespace relay {

namespace messages {

std::string waiting_for(uint32_t n) {
    return "[INFO] Waiting for " + std::to_string(n) + " receiver(s)...\n";
}

std::string already_connected(size_t k) {
    return "[INFO] " + std::to_string(k) + " receiver(s) already connected.\n";
}

std::string receivers_connected(uint32_t n) {
    if (n == 1) {
        return "[INFO] A receiver was connected.\n";
    }
    return "[INFO] " + std::to_string(n) + " receivers were connected.\n";
}

std::string sent_partially(size_t delivered, size_t total) {
    return "[INFO] Sent successfully to " + std::to_string(delivered) + " of " +
           std::to_string(total) + " receiver(s).\n";
}

} // namespace messages

std::optional<uint32_t> parse_receiver_count(std::string_view text) noexcept {
    constexpr uint64_t max_count = std::numeric_limits<int32_t>::max();

    if (text.empty() || text.size() > 10) {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value == 0 || value > max_count) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

ForwardedHead build_forwarded_head(const http::HeaderList& source, bool multipart) {
    using http::HTTP1Parser;

    ForwardedHead head;
    const std::string* content_type = nullptr;
    const std::string* content_length = nullptr;
    const std::string* content_disposition = nullptr;
    bool transfer_encoded = false;

    for (const auto& [name, value] : source) {
        if (!content_type && HTTP1Parser::str_eq_ci(name, "content-type")) {
            content_type = &value;
        } else if (!content_length && HTTP1Parser::str_eq_ci(name, "content-length")) {
            content_length = &value;
        } else if (!content_disposition && HTTP1Parser::str_eq_ci(name, "content-disposition")) {
            content_disposition = &value;
        } else if (HTTP1Parser::str_eq_ci(name, "transfer-encoding")) {
            transfer_encoded = true;
        }
    }

    if (content_type) {
        head.headers.emplace_back("Content-Type", *content_type);
    }
    // The length of a multipart body is not the length of its first part,
    // and Transfer-Encoding overrides any Content-Length the sender sent.
    if (content_length && !multipart && !transfer_encoded) {
        head.headers.emplace_back("Content-Length", *content_length);
    }
    if (content_disposition) {
        head.headers.emplace_back("Content-Disposition", *content_disposition);
    }
    head.headers.emplace_back("Access-Control-Allow-Origin", "*");
    head.headers.emplace_back("Access-Control-Expose-Headers", "Content-Length, Content-Type");
    head.headers.emplace_back("X-Robots-Tag", "none");
    return head;
}

// ============================================================================
// ReceiverEndpoint
// ============================================================================

ReceiverEndpoint::ReceiverEndpoint(Rendezvous& rendezvous, std::shared_ptr<http::Exchange> exchange)
    : rendezvous_(rendezvous)
    , exchange_(std::move(exchange))
    , loop_(exchange_->loop())
    , path_(exchange_->request().path())
    , head_only_(exchange_->request().is_head())
{
}

void ReceiverEndpoint::start(std::optional<uint32_t> n) {
    auto self = shared_from_this();

    std::weak_ptr<ReceiverEndpoint> weak = self;
    net::EventLoop* loop = loop_;
    handoff_.receive([weak, loop](std::optional<Delivery> delivery) {
        loop->post([weak, delivery = std::move(delivery)]() mutable {
            if (auto receiver = weak.lock()) {
                receiver->on_delivery(std::move(delivery));
            }
        });
    });

    state_ = State::WAITING;
    auto registration = rendezvous_.registry().register_receiver(path_, self, n);

    if (registration.rejected()) {
        state_ = State::CLOSED;
        handoff_.cancel();
        LOG_WARN("Relay", "Receiver on %s rejected: %s", path_.c_str(),
                 to_string(registration.reason));

        const char* message = messages::ESTABLISHED;
        switch (registration.reason) {
            case RejectReason::RESERVED_PATH: message = messages::RESERVED_RECEIVE; break;
            case RejectReason::MISMATCHED_N: message = messages::MISMATCHED_N; break;
            case RejectReason::TOO_MANY_RECEIVERS: message = messages::TOO_MANY_RECEIVERS; break;
            default: break;
        }
        Rendezvous::reject(*exchange_, message);
        return;
    }

    exchange_->on_close([self]() {
        self->on_connection_closed();
    });

    if (registration.committed()) {
        LOG_INFO("Relay", "Receiver on %s completed the pairing (%u receiver(s))",
                 path_.c_str(), registration.expected);
        auto& pairing = *registration.pairing;
        pairing.sender->post_paired(std::move(pairing.receivers));
    } else {
        LOG_INFO("Relay", "Receiver on %s waiting (%zu of %u)",
                 path_.c_str(), registration.queued, registration.expected);
    }
}

void ReceiverEndpoint::on_delivery(std::optional<Delivery> delivery) {
    if (!delivery) {
        // Sender went away before the transfer started.
        if (state_ == State::WAITING) {
            state_ = State::CLOSED;
            LOG_INFO("Relay", "Receiver on %s: sender aborted before the transfer", path_.c_str());
            exchange_->response().abort();
        }
        return;
    }

    sender_ = std::move(delivery->sender);
    index_ = delivery->index;

    if (state_ != State::WAITING || exchange_->is_closed()) {
        state_ = State::CLOSED;
        report_lost();
        return;
    }

    auto& response = exchange_->response();
    response.send_status(delivery->head.status);
    response.send_headers(delivery->head.headers);

    if (head_only_) {
        state_ = State::FINISHED;
        response.end();
        return;
    }

    state_ = State::STREAMING;
    if (!response.flush_headers()) {
        state_ = State::CLOSED;
        report_lost();
    }
}

void ReceiverEndpoint::on_connection_closed() {
    auto self = shared_from_this();

    switch (state_) {
        case State::WAITING:
            state_ = State::CLOSED;
            if (rendezvous_.registry().unregister_receiver(path_, self)) {
                handoff_.cancel();
                LOG_INFO("Relay", "Receiver on %s left before pairing", path_.c_str());
                return;
            }
            // Paired already. Either the sender's send() now fails, or the
            // delivery is queued and on_delivery() reports the loss.
            static_cast<void>(handoff_.cancel());
            return;

        case State::STREAMING:
        case State::ENDING:
            state_ = State::CLOSED;
            report_lost();
            return;

        case State::IDLE:
        case State::FINISHED:
        case State::CLOSED:
            return;
    }
}

void ReceiverEndpoint::post_chunk(std::shared_ptr<const std::string> data) {
    auto self = shared_from_this();
    loop_->post([self, data = std::move(data)]() {
        self->write_chunk(data);
    });
}

void ReceiverEndpoint::post_finish() {
    auto self = shared_from_this();
    loop_->post([self]() {
        self->finish();
    });
}

void ReceiverEndpoint::post_abort() {
    auto self = shared_from_this();
    loop_->post([self]() {
        self->abort();
    });
}

void ReceiverEndpoint::write_chunk(const std::shared_ptr<const std::string>& data) {
    if (state_ != State::STREAMING) {
        return;
    }

    auto self = shared_from_this();
    bool queued = exchange_->response().write_chunk(*data, [self]() {
        self->sender_->post_chunk_ack(self->index_);
    });
    if (!queued) {
        state_ = State::CLOSED;
        report_lost();
    }
}

void ReceiverEndpoint::finish() {
    if (state_ != State::STREAMING) {
        return;
    }

    state_ = State::ENDING;
    auto self = shared_from_this();
    bool queued = exchange_->response().end([self]() {
        if (self->state_ == State::ENDING) {
            self->state_ = State::FINISHED;
            self->sender_->post_receiver_done(self->index_);
        }
    });
    if (!queued) {
        state_ = State::CLOSED;
        report_lost();
    }
}

void ReceiverEndpoint::abort() {
    if (state_ != State::STREAMING && state_ != State::ENDING) {
        return;
    }
    state_ = State::CLOSED;
    LOG_INFO("Relay", "Receiver on %s: transfer aborted by the sender", path_.c_str());
    exchange_->response().abort();
}

void ReceiverEndpoint::report_lost() {
    if (lost_reported_ || !sender_) {
        return;
    }
    lost_reported_ = true;
    sender_->post_receiver_lost(index_);
}

// ============================================================================
// SenderEndpoint
// ============================================================================

SenderEndpoint::SenderEndpoint(Rendezvous& rendezvous, std::shared_ptr<http::Exchange> exchange)
    : rendezvous_(rendezvous)
    , exchange_(std::move(exchange))
    , loop_(exchange_->loop())
    , path_(exchange_->request().path())
{
}

void SenderEndpoint::start(uint32_t n) {
    auto self = shared_from_this();
    expected_ = n;

    auto registration = rendezvous_.registry().register_sender(path_, self, n);

    if (registration.rejected()) {
        phase_ = Phase::DONE;
        LOG_WARN("Relay", "Sender on %s rejected: %s", path_.c_str(),
                 to_string(registration.reason));

        const char* message = messages::ALREADY_SENDER;
        switch (registration.reason) {
            case RejectReason::RESERVED_PATH: message = messages::RESERVED_SEND; break;
            case RejectReason::MISMATCHED_N: message = messages::MISMATCHED_N; break;
            default: break;
        }
        Rendezvous::reject(*exchange_, message);
        return;
    }

    phase_ = Phase::WAITING;

    auto& response = exchange_->response();
    response.send_continue();
    response.send_status(200);
    response.send_headers({
        {"Content-Type", "text/plain; charset=utf-8"},
        {"Access-Control-Allow-Origin", "*"}
    });

    std::string intro = messages::waiting_for(n);
    if (registration.queued > 0 && registration.queued < n) {
        intro += messages::already_connected(registration.queued);
    }
    write_line(intro);

    exchange_->on_close([self]() {
        self->on_connection_closed();
    });

    if (registration.committed()) {
        LOG_INFO("Relay", "Sender on %s completed the pairing (%u receiver(s))", path_.c_str(), n);
        on_paired(std::move(registration.pairing->receivers));
    } else {
        LOG_INFO("Relay", "Sender on %s waiting for %u receiver(s), %zu queued",
                 path_.c_str(), n, registration.queued);
    }
}

void SenderEndpoint::post_paired(std::vector<std::shared_ptr<ReceiverEndpoint>> receivers) {
    auto self = shared_from_this();
    loop_->post([self, receivers = std::move(receivers)]() mutable {
        self->on_paired(std::move(receivers));
    });
}

void SenderEndpoint::post_chunk_ack(size_t index) {
    auto self = shared_from_this();
    loop_->post([self, index]() {
        self->on_chunk_ack(index);
    });
}

void SenderEndpoint::post_receiver_done(size_t index) {
    auto self = shared_from_this();
    loop_->post([self, index]() {
        self->on_receiver_done(index);
    });
}

void SenderEndpoint::post_receiver_lost(size_t index) {
    auto self = shared_from_this();
    loop_->post([self, index]() {
        self->on_receiver_lost(index);
    });
}

void SenderEndpoint::on_paired(std::vector<std::shared_ptr<ReceiverEndpoint>> receivers) {
    if (phase_ != Phase::WAITING) {
        return;
    }

    targets_.clear();
    targets_.reserve(receivers.size());
    for (auto& receiver : receivers) {
        Target target;
        target.endpoint = std::move(receiver);
        targets_.push_back(std::move(target));
    }

    phase_ = Phase::STREAMING;

    if (exchange_->is_closed()) {
        abort_transfer("sender left before the transfer started");
        return;
    }

    LOG_INFO("Relay", "Transfer on %s started: %zu receiver(s)", path_.c_str(), targets_.size());
    write_line(messages::receivers_connected(expected_));

    const http::Request& request = exchange_->request();
    const std::string* content_type = request.header("content-type");
    if (content_type) {
        if (auto boundary = http::MultipartExtractor::boundary_from(*content_type)) {
            multipart_ = std::make_unique<http::MultipartExtractor>(*boundary);
        }
    }

    if (!multipart_) {
        deliver_head(build_forwarded_head(request.headers(), false));
        if (phase_ != Phase::STREAMING) {
            return;
        }
    }

    auto self = shared_from_this();
    exchange_->on_body(
        [self](std::string_view chunk) {
            self->on_body_chunk(chunk);
        },
        [self](bool complete) {
            self->on_body_end(complete);
        }
    );
    exchange_->resume_body();
}

void SenderEndpoint::deliver_head(ForwardedHead head) {
    head_delivered_ = true;

    auto self = shared_from_this();
    for (size_t i = 0; i < targets_.size(); ++i) {
        Target& target = targets_[i];
        if (target.state != ReceiverState::PENDING) {
            continue;
        }

        bool head_only = target.endpoint->is_head();
        if (target.endpoint->handoff().send(Delivery{head, self, i})) {
            target.state = head_only ? ReceiverState::DONE : ReceiverState::STREAMING;
        } else {
            LOG_WARN("Relay", "Receiver %zu on %s left before the transfer started", i, path_.c_str());
            target.state = ReceiverState::LOST;
        }
    }

    if (all_lost()) {
        abandon();
    }
}

void SenderEndpoint::on_body_chunk(std::string_view chunk) {
    if (phase_ != Phase::STREAMING) {
        return;
    }

    exchange_->pause_body();

    if (multipart_) {
        auto payload = multipart_->feed(chunk);
        if (payload.is_err()) {
            abort_transfer("malformed multipart body");
            return;
        }
        if (!head_delivered_ && multipart_->headers_ready()) {
            deliver_head(build_forwarded_head(multipart_->part_headers(), true));
            if (phase_ != Phase::STREAMING) {
                return;
            }
        }
        forward(payload.value());
    } else {
        forward(chunk);
    }

    maybe_resume();
}

void SenderEndpoint::forward(std::string_view payload) {
    if (payload.empty()) {
        return;
    }

    std::shared_ptr<const std::string> data;
    for (auto& target : targets_) {
        if (target.state != ReceiverState::STREAMING) {
            continue;
        }
        if (!data) {
            data = std::make_shared<const std::string>(payload);
        }
        target.awaiting_ack = true;
        ++pending_acks_;
        target.endpoint->post_chunk(data);
    }
}

void SenderEndpoint::maybe_resume() {
    if (phase_ == Phase::STREAMING && pending_acks_ == 0) {
        exchange_->resume_body();
    }
}

void SenderEndpoint::on_body_end(bool complete) {
    if (phase_ != Phase::STREAMING) {
        return;
    }

    if (!complete) {
        abort_transfer("sender connection closed mid-body");
        return;
    }

    if (multipart_) {
        auto finished = multipart_->finish();
        if (finished.is_err() || !head_delivered_) {
            abort_transfer("incomplete multipart body");
            return;
        }
    }

    phase_ = Phase::FINISHING;
    for (auto& target : targets_) {
        if (target.state == ReceiverState::STREAMING) {
            target.endpoint->post_finish();
        }
    }
    maybe_complete();
}

void SenderEndpoint::on_connection_closed() {
    switch (phase_) {
        case Phase::WAITING:
            if (rendezvous_.registry().unregister_sender(path_, shared_from_this())) {
                phase_ = Phase::DONE;
                LOG_INFO("Relay", "Sender on %s left before pairing", path_.c_str());
            }
            // Otherwise the pairing is on its way; on_paired() aborts it.
            return;

        case Phase::STREAMING:
            abort_transfer("sender connection closed");
            return;

        case Phase::IDLE:
        case Phase::FINISHING:
        case Phase::DONE:
            return;
    }
}

void SenderEndpoint::on_chunk_ack(size_t index) {
    if (index >= targets_.size()) {
        return;
    }
    Target& target = targets_[index];
    if (!target.awaiting_ack) {
        return;
    }
    target.awaiting_ack = false;
    --pending_acks_;
    maybe_resume();
}

void SenderEndpoint::on_receiver_done(size_t index) {
    if (index >= targets_.size()) {
        return;
    }
    Target& target = targets_[index];
    if (target.state == ReceiverState::STREAMING) {
        target.state = ReceiverState::DONE;
    }
    maybe_complete();
}

void SenderEndpoint::on_receiver_lost(size_t index) {
    if (index >= targets_.size()) {
        return;
    }
    Target& target = targets_[index];
    if (target.state == ReceiverState::DONE || target.state == ReceiverState::LOST) {
        return;
    }

    target.state = ReceiverState::LOST;
    LOG_WARN("Relay", "Receiver %zu on %s disconnected", index, path_.c_str());

    if (target.awaiting_ack) {
        target.awaiting_ack = false;
        --pending_acks_;
    }

    if (phase_ == Phase::STREAMING) {
        if (all_lost()) {
            abandon();
        } else {
            maybe_resume();
        }
        return;
    }
    maybe_complete();
}

void SenderEndpoint::maybe_complete() {
    if (phase_ != Phase::FINISHING) {
        return;
    }

    size_t delivered = 0;
    for (const auto& target : targets_) {
        if (target.state == ReceiverState::STREAMING || target.state == ReceiverState::PENDING) {
            return;
        }
        if (target.state == ReceiverState::DONE) {
            ++delivered;
        }
    }

    phase_ = Phase::DONE;
    release_path();

    std::string line;
    if (delivered == targets_.size()) {
        line = messages::SENT;
    } else if (delivered == 0) {
        line = messages::ABORTED;
    } else {
        line = messages::sent_partially(delivered, targets_.size());
    }
    LOG_INFO("Relay", "Transfer on %s finished: %zu of %zu receiver(s)",
             path_.c_str(), delivered, targets_.size());
    drop_targets();

    write_line(line);
    exchange_->response().end();
}

void SenderEndpoint::abandon() {
    phase_ = Phase::DONE;
    release_path();
    LOG_WARN("Relay", "All receivers on %s are gone; draining the sender", path_.c_str());
    drop_targets();

    // Ending the response makes the connection discard the rest of the body.
    write_line(messages::ABORTED);
    exchange_->response().end();
    exchange_->resume_body();
}

void SenderEndpoint::abort_transfer(const char* reason) {
    if (phase_ == Phase::DONE) {
        return;
    }
    phase_ = Phase::DONE;
    LOG_WARN("Relay", "Transfer on %s aborted: %s", path_.c_str(), reason);

    for (auto& target : targets_) {
        switch (target.state) {
            case ReceiverState::PENDING:
                static_cast<void>(target.endpoint->handoff().cancel());
                break;
            case ReceiverState::STREAMING:
                target.endpoint->post_abort();
                break;
            case ReceiverState::DONE:
            case ReceiverState::LOST:
                break;
        }
        target.state = ReceiverState::LOST;
    }
    drop_targets();

    release_path();

    if (!exchange_->is_closed()) {
        write_line(messages::ABORTED);
        exchange_->response().end();
    }
}

void SenderEndpoint::drop_targets() {
    // Receivers hold a reference back to this sender.
    targets_.clear();
    pending_acks_ = 0;
}

void SenderEndpoint::release_path() {
    if (path_released_) {
        return;
    }
    path_released_ = true;
    rendezvous_.registry().release(path_);
}

bool SenderEndpoint::all_lost() const noexcept {
    for (const auto& target : targets_) {
        if (target.state != ReceiverState::LOST) {
            return false;
        }
    }
    return true;
}

void SenderEndpoint::write_line(const std::string& line) {
    static_cast<void>(exchange_->response().write_chunk(line));
}

// ============================================================================
// Rendezvous
// ============================================================================

Rendezvous::Rendezvous(const std::vector<std::string>& reserved_paths)
    : registry_(reserved_paths)
{
}

void Rendezvous::reject(http::Exchange& exchange, const char* message, int status) {
    exchange.response().respond(status, {
        {"Content-Type", "text/plain; charset=utf-8"},
        {"Access-Control-Allow-Origin", "*"}
    }, message);
}

void Rendezvous::handle_sender(const std::shared_ptr<http::Exchange>& exchange) {
    const http::Request& request = exchange->request();

    uint32_t n = 1;
    if (auto text = request.query_param("n")) {
        auto parsed = parse_receiver_count(*text);
        if (!parsed) {
            LOG_WARN("Relay", "Sender on %s: invalid n '%s'", request.path().c_str(), text->c_str());
            reject(*exchange, messages::INVALID_N);
            return;
        }
        n = *parsed;
    }

    if (registry_.is_reserved(request.path())) {
        reject(*exchange, messages::RESERVED_SEND);
        return;
    }

    auto sender = std::make_shared<SenderEndpoint>(*this, exchange);
    sender->start(n);
}

void Rendezvous::handle_receiver(const std::shared_ptr<http::Exchange>& exchange) {
    const http::Request& request = exchange->request();

    std::optional<uint32_t> n;
    if (auto text = request.query_param("n")) {
        n = parse_receiver_count(*text);
        if (!n) {
            LOG_WARN("Relay", "Receiver on %s: invalid n '%s'", request.path().c_str(), text->c_str());
            reject(*exchange, messages::INVALID_N);
            return;
        }
    }

    if (registry_.is_reserved(request.path())) {
        reject(*exchange, messages::RESERVED_RECEIVE);
        return;
    }

    auto receiver = std::make_shared<ReceiverEndpoint>(*this, exchange);
    receiver->start(n);
}

} // namespace relay
} // namespace piping
