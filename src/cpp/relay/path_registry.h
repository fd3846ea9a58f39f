#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace piping {
namespace relay {

/**
 * What a path currently holds. Absent paths are EMPTY.
 */
enum class SlotKind {
    EMPTY,
    SENDER_WAITING,
    RECEIVER_WAITING,
    IN_PROGRESS
};

enum class RejectReason {
    NONE,
    RESERVED_PATH,
    ALREADY_SENDER,       // A sender is waiting or transferring on the path
    IN_PROGRESS,          // A receiver arrived while a transfer is running
    MISMATCHED_N,
    TOO_MANY_RECEIVERS
};

inline const char* to_string(SlotKind kind) noexcept {
    switch (kind) {
        case SlotKind::EMPTY: return "empty";
        case SlotKind::SENDER_WAITING: return "sender waiting";
        case SlotKind::RECEIVER_WAITING: return "receiver waiting";
        case SlotKind::IN_PROGRESS: return "in progress";
    }
    return "unknown";
}

inline const char* to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::RESERVED_PATH: return "reserved path";
        case RejectReason::ALREADY_SENDER: return "already a sender";
        case RejectReason::IN_PROGRESS: return "transfer in progress";
        case RejectReason::MISMATCHED_N: return "mismatched n";
        case RejectReason::TOO_MANY_RECEIVERS: return "too many receivers";
    }
    return "unknown";
}

/**
 * Process-wide path → slot table.
 *
 * Matches one sender with exactly n receivers per path. Every operation
 * is a single read-modify-write under one mutex; handles are only moved,
 * never dereferenced, so the lock never waits on I/O.
 *
 * Templated on the handle types so the state machine can be tested
 * without connections.
 */
template<typename SenderHandle, typename ReceiverHandle>
class BasicPathRegistry {
public:
    struct Pairing {
        SenderHandle sender;
        std::vector<ReceiverHandle> receivers;
    };

    enum class Outcome {
        COMMIT,     // pairing is set, the path is now IN_PROGRESS
        WAIT,
        REJECT
    };

    struct Registration {
        Outcome outcome = Outcome::REJECT;
        RejectReason reason = RejectReason::NONE;
        uint32_t expected = 0;    // Receivers the path is waiting for
        size_t queued = 0;        // Receivers registered after this call
        std::optional<Pairing> pairing;

        bool committed() const noexcept { return outcome == Outcome::COMMIT; }
        bool waiting() const noexcept { return outcome == Outcome::WAIT; }
        bool rejected() const noexcept { return outcome == Outcome::REJECT; }
    };

    BasicPathRegistry() = default;

    explicit BasicPathRegistry(const std::vector<std::string>& reserved_paths)
        : reserved_(reserved_paths.begin(), reserved_paths.end()) {}

    BasicPathRegistry(const BasicPathRegistry&) = delete;
    BasicPathRegistry& operator=(const BasicPathRegistry&) = delete;

    /**
     * A sender expecting n receivers arrives on path.
     */
    Registration register_sender(const std::string& path, SenderHandle sender, uint32_t n) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (reserved_.count(path) != 0) {
            return reject(RejectReason::RESERVED_PATH);
        }

        auto it = slots_.find(path);
        if (it == slots_.end()) {
            slots_.emplace(path, SenderWaiting{std::move(sender), n, {}});
            return wait(n, 0);
        }

        Slot& slot = it->second;
        if (std::holds_alternative<SenderWaiting>(slot) || std::holds_alternative<InProgress>(slot)) {
            return reject(RejectReason::ALREADY_SENDER);
        }

        auto& waiting = std::get<ReceiverWaiting>(slot);
        if (waiting.expected != n) {
            return reject(RejectReason::MISMATCHED_N, waiting.expected, waiting.receivers.size());
        }

        size_t queued = waiting.receivers.size();
        if (queued == n) {
            Registration result;
            result.outcome = Outcome::COMMIT;
            result.expected = n;
            result.queued = queued;
            result.pairing = Pairing{std::move(sender), std::move(waiting.receivers)};
            slot = InProgress{};
            return result;
        }

        slot = SenderWaiting{std::move(sender), n, std::move(waiting.receivers)};
        return wait(n, queued);
    }

    /**
     * A receiver arrives on path. n is the count it asked for, if any.
     */
    Registration register_receiver(const std::string& path, ReceiverHandle receiver,
                                   std::optional<uint32_t> n = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (reserved_.count(path) != 0) {
            return reject(RejectReason::RESERVED_PATH);
        }

        auto it = slots_.find(path);
        if (it == slots_.end()) {
            uint32_t expected = n.value_or(1);
            std::vector<ReceiverHandle> receivers;
            receivers.push_back(std::move(receiver));
            slots_.emplace(path, ReceiverWaiting{std::move(receivers), expected});
            return wait(expected, 1);
        }

        Slot& slot = it->second;
        if (std::holds_alternative<InProgress>(slot)) {
            return reject(RejectReason::IN_PROGRESS);
        }

        if (auto* waiting = std::get_if<ReceiverWaiting>(&slot)) {
            if (n && *n != waiting->expected) {
                return reject(RejectReason::MISMATCHED_N, waiting->expected, waiting->receivers.size());
            }
            if (waiting->receivers.size() >= waiting->expected) {
                return reject(RejectReason::TOO_MANY_RECEIVERS, waiting->expected, waiting->receivers.size());
            }
            waiting->receivers.push_back(std::move(receiver));
            return wait(waiting->expected, waiting->receivers.size());
        }

        auto& sender = std::get<SenderWaiting>(slot);
        if (n && *n != sender.expected) {
            return reject(RejectReason::MISMATCHED_N, sender.expected, sender.receivers.size());
        }
        sender.receivers.push_back(std::move(receiver));

        if (sender.receivers.size() < sender.expected) {
            return wait(sender.expected, sender.receivers.size());
        }

        Registration result;
        result.outcome = Outcome::COMMIT;
        result.expected = sender.expected;
        result.queued = sender.receivers.size();
        result.pairing = Pairing{std::move(sender.sender), std::move(sender.receivers)};
        slot = InProgress{};
        return result;
    }

    /**
     * Remove a sender that is still waiting. Queued receivers stay.
     * @return false if the sender is no longer waiting (it was paired)
     */
    bool unregister_sender(const std::string& path, const SenderHandle& sender) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = slots_.find(path);
        if (it == slots_.end()) {
            return false;
        }
        auto* waiting = std::get_if<SenderWaiting>(&it->second);
        if (!waiting || !(waiting->sender == sender)) {
            return false;
        }

        if (waiting->receivers.empty()) {
            slots_.erase(it);
        } else {
            uint32_t expected = waiting->expected;
            it->second = ReceiverWaiting{std::move(waiting->receivers), expected};
        }
        return true;
    }

    /**
     * Remove a receiver that is still waiting.
     * @return false if the receiver is no longer waiting (it was paired)
     */
    bool unregister_receiver(const std::string& path, const ReceiverHandle& receiver) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = slots_.find(path);
        if (it == slots_.end()) {
            return false;
        }

        std::vector<ReceiverHandle>* receivers = nullptr;
        if (auto* waiting = std::get_if<ReceiverWaiting>(&it->second)) {
            receivers = &waiting->receivers;
        } else if (auto* sender = std::get_if<SenderWaiting>(&it->second)) {
            receivers = &sender->receivers;
        } else {
            return false;
        }

        auto pos = std::find(receivers->begin(), receivers->end(), receiver);
        if (pos == receivers->end()) {
            return false;
        }
        receivers->erase(pos);

        if (receivers->empty() && std::holds_alternative<ReceiverWaiting>(it->second)) {
            slots_.erase(it);
        }
        return true;
    }

    /**
     * End of a transfer: the path becomes EMPTY.
     */
    void release(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_.erase(path);
    }

    SlotKind slot(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(path);
        if (it == slots_.end()) {
            return SlotKind::EMPTY;
        }
        switch (it->second.index()) {
            case 0: return SlotKind::SENDER_WAITING;
            case 1: return SlotKind::RECEIVER_WAITING;
            default: return SlotKind::IN_PROGRESS;
        }
    }

    /**
     * Receivers currently queued on a waiting path.
     */
    size_t queued_receivers(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(path);
        if (it == slots_.end()) {
            return 0;
        }
        if (auto* waiting = std::get_if<ReceiverWaiting>(&it->second)) {
            return waiting->receivers.size();
        }
        if (auto* sender = std::get_if<SenderWaiting>(&it->second)) {
            return sender->receivers.size();
        }
        return 0;
    }

    /**
     * Number of non-empty paths.
     */
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    bool is_reserved(const std::string& path) const {
        return reserved_.count(path) != 0;
    }

private:
    struct SenderWaiting {
        SenderHandle sender;
        uint32_t expected;
        std::vector<ReceiverHandle> receivers;    // Fewer than expected
    };

    struct ReceiverWaiting {
        std::vector<ReceiverHandle> receivers;    // At most expected
        uint32_t expected;
    };

    struct InProgress {};

    // Alternative order matches slot()
    using Slot = std::variant<SenderWaiting, ReceiverWaiting, InProgress>;

    static Registration wait(uint32_t expected, size_t queued) {
        Registration result;
        result.outcome = Outcome::WAIT;
        result.expected = expected;
        result.queued = queued;
        return result;
    }

    static Registration reject(RejectReason reason, uint32_t expected = 0, size_t queued = 0) {
        Registration result;
        result.outcome = Outcome::REJECT;
        result.reason = reason;
        result.expected = expected;
        result.queued = queued;
        return result;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    std::unordered_set<std::string> reserved_;
};

} // namespace relay
} // namespace piping
