/**
 * Rendezvous engine
 *
 * Pairs one sender (POST/PUT) with n receivers (GET/HEAD) on the same path
 * and streams the sender's request body into every receiver's response.
 *
 * Threading: each endpoint is confined to the loop thread of its own
 * connection. The sender's loop drives the transfer; receivers are reached
 * with EventLoop::post() and report back the same way. The path registry
 * is the only state shared under a lock; pairing results cross threads
 * through a Handoff.
 *
 * Backpressure: the sender's body is paused while any live receiver still
 * has the previous chunk in flight, so at most one chunk per receiver is
 * buffered.
 */

#pragma once

#include "handoff.h"
#include "path_registry.h"
#include "../http/exchange.h"
#include "../http/multipart.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piping {
namespace relay {

class Rendezvous;
class SenderEndpoint;
class ReceiverEndpoint;

using PathRegistry = BasicPathRegistry<std::shared_ptr<SenderEndpoint>,
                                       std::shared_ptr<ReceiverEndpoint>>;

/**
 * Fixed client-visible lines.
 */
namespace messages {

constexpr const char* INVALID_N = "[ERROR] Invalid n query parameter.\n";
constexpr const char* MISMATCHED_N = "[ERROR] The number of receivers has been mismatched.\n";
constexpr const char* ALREADY_SENDER = "[ERROR] The path has been used by another sender.\n";
constexpr const char* TOO_MANY_RECEIVERS = "[ERROR] The number of receivers has reached limit.\n";
constexpr const char* ESTABLISHED = "[ERROR] Connection on the path has been established already.\n";
constexpr const char* RESERVED_SEND = "[ERROR] Cannot send to the reserved path.\n";
constexpr const char* RESERVED_RECEIVE = "[ERROR] Cannot receive from the reserved path.\n";
constexpr const char* SENT = "[INFO] Sent successfully!\n";
constexpr const char* ABORTED = "[INFO] Sending aborted.\n";

std::string waiting_for(uint32_t n);
std::string already_connected(size_t k);
std::string receivers_connected(uint32_t n);
std::string sent_partially(size_t delivered, size_t total);

} // namespace messages

/**
 * Parse an n query parameter: decimal, 1 ≤ n ≤ 2^31-1.
 */
std::optional<uint32_t> parse_receiver_count(std::string_view text) noexcept;

/**
 * Status line and headers a receiver answers with.
 */
struct ForwardedHead {
    int status = 200;
    http::HeaderList headers;
};

/**
 * What a sender hands to each paired receiver.
 */
struct Delivery {
    ForwardedHead head;
    std::shared_ptr<SenderEndpoint> sender;
    size_t index = 0;               // Receiver slot in the sender's transfer
};

/**
 * Headers forwarded from a sender request (or from the first multipart
 * part when multipart is true).
 */
ForwardedHead build_forwarded_head(const http::HeaderList& source, bool multipart);

/**
 * The receiving side of a pairing, bound to one GET/HEAD exchange.
 */
class ReceiverEndpoint : public std::enable_shared_from_this<ReceiverEndpoint> {
public:
    ReceiverEndpoint(Rendezvous& rendezvous, std::shared_ptr<http::Exchange> exchange);

    ReceiverEndpoint(const ReceiverEndpoint&) = delete;
    ReceiverEndpoint& operator=(const ReceiverEndpoint&) = delete;

    /**
     * Register on the path. Runs on the receiver's loop.
     */
    void start(std::optional<uint32_t> n);

    /**
     * Pairing result from the sender (any thread). Cancelled on either side
     * yields std::nullopt.
     */
    Handoff<Delivery>& handoff() noexcept { return handoff_; }

    // ---- Called by the sender, from any thread ---------------------------

    void post_chunk(std::shared_ptr<const std::string> data);
    void post_finish();
    void post_abort();

    bool is_head() const noexcept { return head_only_; }
    const std::string& path() const noexcept { return path_; }

private:
    enum class State {
        IDLE,
        WAITING,        // Registered, head not received yet
        STREAMING,
        ENDING,         // end() queued, waiting for the flush
        FINISHED,
        CLOSED
    };

    void on_delivery(std::optional<Delivery> delivery);
    void on_connection_closed();
    void write_chunk(const std::shared_ptr<const std::string>& data);
    void finish();
    void abort();
    void report_lost();

    Rendezvous& rendezvous_;
    std::shared_ptr<http::Exchange> exchange_;
    net::EventLoop* loop_;
    std::string path_;
    bool head_only_;

    Handoff<Delivery> handoff_;
    State state_ = State::IDLE;
    std::shared_ptr<SenderEndpoint> sender_;    // Set once delivered
    size_t index_ = 0;
    bool lost_reported_ = false;
};

/**
 * The sending side of a pairing, bound to one POST/PUT exchange. Drives the
 * transfer on its own loop thread.
 */
class SenderEndpoint : public std::enable_shared_from_this<SenderEndpoint> {
public:
    SenderEndpoint(Rendezvous& rendezvous, std::shared_ptr<http::Exchange> exchange);

    SenderEndpoint(const SenderEndpoint&) = delete;
    SenderEndpoint& operator=(const SenderEndpoint&) = delete;

    /**
     * Register on the path. Runs on the sender's loop.
     */
    void start(uint32_t n);

    // ---- Called from any thread ------------------------------------------

    /**
     * The registry committed a pairing that includes this sender.
     */
    void post_paired(std::vector<std::shared_ptr<ReceiverEndpoint>> receivers);

    /**
     * Receiver index finished writing the previous chunk.
     */
    void post_chunk_ack(size_t index);

    /**
     * Receiver index wrote the end of its response.
     */
    void post_receiver_done(size_t index);

    /**
     * Receiver index is gone.
     */
    void post_receiver_lost(size_t index);

    const std::string& path() const noexcept { return path_; }

private:
    enum class Phase {
        IDLE,
        WAITING,        // Registered, not paired yet
        STREAMING,      // Copying the request body
        FINISHING,      // Body done, waiting for receivers to flush
        DONE
    };

    enum class ReceiverState {
        PENDING,        // Head not delivered yet (multipart)
        STREAMING,
        DONE,
        LOST
    };

    struct Target {
        std::shared_ptr<ReceiverEndpoint> endpoint;
        ReceiverState state = ReceiverState::PENDING;
        bool awaiting_ack = false;
    };

    void on_paired(std::vector<std::shared_ptr<ReceiverEndpoint>> receivers);
    void on_body_chunk(std::string_view chunk);
    void on_body_end(bool complete);
    void on_connection_closed();
    void on_chunk_ack(size_t index);
    void on_receiver_done(size_t index);
    void on_receiver_lost(size_t index);

    void deliver_head(ForwardedHead head);
    void forward(std::string_view payload);
    void maybe_resume();
    void maybe_complete();

    /**
     * Every receiver is gone while the body is still streaming: answer the
     * sender and let the connection drain the rest of the body.
     */
    void abandon();

    /**
     * The sender side failed: abort every receiver.
     */
    void abort_transfer(const char* reason);

    /**
     * The transfer is over: forget the receivers.
     */
    void drop_targets();

    void release_path();
    bool all_lost() const noexcept;
    void write_line(const std::string& line);

    Rendezvous& rendezvous_;
    std::shared_ptr<http::Exchange> exchange_;
    net::EventLoop* loop_;
    std::string path_;

    Phase phase_ = Phase::IDLE;
    uint32_t expected_ = 1;
    std::vector<Target> targets_;
    size_t pending_acks_ = 0;
    bool head_delivered_ = false;
    bool path_released_ = false;
    std::unique_ptr<http::MultipartExtractor> multipart_;
};

/**
 * Entry points used by the HTTP dispatcher.
 */
class Rendezvous {
public:
    explicit Rendezvous(const std::vector<std::string>& reserved_paths);

    Rendezvous(const Rendezvous&) = delete;
    Rendezvous& operator=(const Rendezvous&) = delete;

    /**
     * POST/PUT on a user path. Answers the exchange now (error) or streams
     * until the transfer ends.
     */
    void handle_sender(const std::shared_ptr<http::Exchange>& exchange);

    /**
     * GET/HEAD on a user path.
     */
    void handle_receiver(const std::shared_ptr<http::Exchange>& exchange);

    PathRegistry& registry() noexcept { return registry_; }

    /**
     * Plain-text 400 with the CORS header.
     */
    static void reject(http::Exchange& exchange, const char* message, int status = 400);

private:
    PathRegistry registry_;
};

} // namespace relay
} // namespace piping
