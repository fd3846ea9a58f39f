#pragma once

#include <new>
#include <type_traits>
#include <utility>

namespace piping {
namespace core {

/**
 * Error codes for result<T>.
 */
enum class error_code : int {
    success = 0,
    would_block = 1,       // Retry once the descriptor is ready again
    closed = 2,            // Peer closed the stream
    io_error = 3,          // Socket level failure (errno preserved by the caller)
    tls_error = 4,         // OpenSSL reported a fatal error
    parse_error = 5,       // Malformed protocol input
    invalid_state = 6,
    cancelled = 7,
    invalid_argument = 8
};

/**
 * Human readable name of an error code (for logs).
 */
constexpr const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::success: return "success";
        case error_code::would_block: return "would block";
        case error_code::closed: return "closed";
        case error_code::io_error: return "I/O error";
        case error_code::tls_error: return "TLS error";
        case error_code::parse_error: return "parse error";
        case error_code::invalid_state: return "invalid state";
        case error_code::cancelled: return "cancelled";
        case error_code::invalid_argument: return "invalid argument";
    }
    return "unknown";
}

/**
 * Exception-free result type.
 *
 * Either contains a value T or an error code.
 *
 * Usage:
 *   result<size_t> r = stream.read(buf, sizeof(buf));
 *   if (r.is_ok()) {
 *       consume(buf, r.value());
 *   } else if (r.error() == error_code::would_block) {
 *       // wait for the next readiness event
 *   }
 */
template<typename T>
class result {
public:
    /**
     * Default constructor creates an error result.
     */
    result() noexcept
        : has_value_(false), error_(error_code::invalid_state) {}

    result(const T& val) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(val);
    }

    result(T&& val) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(std::move(val));
    }

    result(error_code err) noexcept
        : has_value_(false), error_(err) {}

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(other.has_value_), error_(other.error_) {
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
            other.value().~T();
            other.has_value_ = false;
        }
    }

    result& operator=(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            if (has_value_) {
                value().~T();
            }
            has_value_ = other.has_value_;
            error_ = other.error_;
            if (has_value_) {
                new (value_storage_) T(std::move(other.value()));
                other.value().~T();
                other.has_value_ = false;
            }
        }
        return *this;
    }

    ~result() {
        if (has_value_) {
            value().~T();
        }
    }

    bool is_ok() const noexcept { return has_value_; }
    bool is_err() const noexcept { return !has_value_; }

    /**
     * Get the value (undefined behavior if is_err()).
     */
    T& value() & noexcept {
        return *std::launder(reinterpret_cast<T*>(value_storage_));
    }

    const T& value() const& noexcept {
        return *std::launder(reinterpret_cast<const T*>(value_storage_));
    }

    T&& value() && noexcept {
        return std::move(*std::launder(reinterpret_cast<T*>(value_storage_)));
    }

    /**
     * Get the error code (undefined behavior if is_ok()).
     */
    error_code error() const noexcept {
        return error_;
    }

    T value_or(T&& default_value) && noexcept {
        return has_value_ ? std::move(value()) : std::move(default_value);
    }

    explicit operator bool() const noexcept { return has_value_; }

private:
    alignas(T) unsigned char value_storage_[sizeof(T)];
    bool has_value_;
    error_code error_{error_code::success};
};

/**
 * Specialization for void (only indicates success/error).
 */
template<>
class result<void> {
public:
    result() noexcept : error_(error_code::success) {}
    result(error_code err) noexcept : error_(err) {}

    bool is_ok() const noexcept { return error_ == error_code::success; }
    bool is_err() const noexcept { return error_ != error_code::success; }
    error_code error() const noexcept { return error_; }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    error_code error_;
};

template<typename T>
result<T> ok(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return result<T>(std::move(value));
}

inline result<void> ok() noexcept {
    return result<void>();
}

template<typename T>
result<T> err(error_code code) noexcept {
    return result<T>(code);
}

inline result<void> err(error_code code) noexcept {
    return result<void>(code);
}

} // namespace core
} // namespace piping
