#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace piping {
namespace relay {

/**
 * One-shot handoff between two threads.
 *
 * The producing side calls send() once; the consuming side registers a
 * callback with receive() once. Whichever comes second triggers the
 * callback, on its own thread. cancel() from either side ends the handoff:
 * a registered callback receives std::nullopt and a later send() fails.
 *
 * The callback always runs outside the internal lock, exactly once.
 */
template<typename T>
class Handoff {
public:
    using Callback = std::function<void(std::optional<T>)>;

    enum class State {
        EMPTY,       // Nothing sent yet
        FULL,        // Value sent, no receiver yet
        DELIVERED,   // Value handed to the receiver
        CANCELLED
    };

    Handoff() = default;

    Handoff(const Handoff&) = delete;
    Handoff& operator=(const Handoff&) = delete;

    /**
     * @return false if a value was already sent or the handoff was cancelled
     */
    bool send(T value) {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::EMPTY) {
                return false;
            }
            if (!callback_) {
                value_.emplace(std::move(value));
                state_ = State::FULL;
                return true;
            }
            state_ = State::DELIVERED;
            callback = std::move(callback_);
            callback_ = nullptr;
        }
        callback(std::optional<T>(std::move(value)));
        return true;
    }

    /**
     * Register the consumer. Runs callback immediately if a value is
     * already waiting or the handoff was cancelled.
     *
     * @return false on a second call; callback then gets std::nullopt
     */
    bool receive(Callback callback) {
        std::optional<T> value;
        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!receiver_registered_) {
                receiver_registered_ = true;
                first = true;
                if (state_ == State::EMPTY) {
                    callback_ = std::move(callback);
                    return true;
                }
                if (state_ == State::FULL) {
                    value = std::move(value_);
                    value_.reset();
                    state_ = State::DELIVERED;
                }
            }
        }
        callback(std::move(value));
        return first;
    }

    /**
     * End the handoff without a value.
     * @return false if the value was already delivered (nothing changed)
     */
    bool cancel() {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == State::DELIVERED) {
                return false;
            }
            if (state_ == State::CANCELLED) {
                return true;
            }
            state_ = State::CANCELLED;
            value_.reset();
            callback = std::move(callback_);
            callback_ = nullptr;
        }
        if (callback) {
            callback(std::nullopt);
        }
        return true;
    }

    State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

private:
    mutable std::mutex mutex_;
    State state_ = State::EMPTY;
    std::optional<T> value_;
    Callback callback_;
    bool receiver_registered_ = false;
};

} // namespace relay
} // namespace piping
