#pragma once

#include <cstdio>
#include <cstdint>
#include <ctime>
#include <atomic>
#include <mutex>
#include <optional>
#include <string_view>

/**
 * Logging for the piping server
 *
 * Features:
 * - Zero-cost when disabled (compile-time)
 * - Tagged subsystem logging (Server, Listener, HTTP1, TLS, Relay, Registry)
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - Runtime level taken from the PIPING_LOG_LEVEL environment variable
 * - Redirectable output (stderr/file)
 *
 * Usage:
 *   LOG_DEBUG("HTTP1", "Connection accepted: fd=%d", fd);
 *   LOG_INFO("Server", "HTTP server is running on %u...", port);
 *   LOG_WARN("Relay", "Receiver dropped on %s", path.c_str());
 *   LOG_ERROR("TLS", "Handshake failed: %s", error.c_str());
 *
 * Build-time control:
 *   Define PIPING_ENABLE_LOGGING to enable logging
 *   If undefined, all LOG_* macros compile to nothing (zero overhead)
 */

namespace piping {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255  // Disable all logging
};

/**
 * Name of the environment variable read by Logger::configure_from_env().
 */
inline constexpr const char* kLogLevelEnv = "PIPING_LOG_LEVEL";

/**
 * Thread-safe logger singleton
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Log a message (called by macros, not meant for direct use)
     *
     * @param level Log level
     * @param tag Subsystem tag (e.g., "HTTP1", "Relay")
     * @param file Source file name
     * @param line Source line number
     * @param fmt Printf-style format string
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    bool enabled(LogLevel level) const noexcept {
        return static_cast<uint8_t>(level) >= min_level_.load(std::memory_order_relaxed);
    }

    /**
     * Parse a level name: debug, info, warn/warning, error, off/none.
     * Matching is case-insensitive.
     *
     * @return The level, or std::nullopt for unknown text
     */
    static std::optional<LogLevel> parse_level(std::string_view text) noexcept;

    /**
     * Apply PIPING_LOG_LEVEL to the logger. Unset means INFO.
     *
     * @return false if the variable held an unknown level (INFO is kept)
     */
    bool configure_from_env() noexcept;

    /**
     * Redirect output to a file
     *
     * @param path File path (nullptr for stderr)
     * @return true on success, false on failure
     */
    bool set_output_file(const char* path) noexcept;

    /**
     * Close output file and revert to stderr
     */
    void close_output_file() noexcept;

    // Non-copyable, non-movable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    Logger() noexcept = default;
    ~Logger() noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::INFO)};
    std::mutex output_mutex_;
    FILE* output_file_{stderr};
    bool owns_file_{false};

    static const char* level_to_string(LogLevel level) noexcept;
    static void format_timestamp(char* buf, size_t size) noexcept;
};

} // namespace core
} // namespace piping

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef PIPING_ENABLE_LOGGING

#define LOG_DEBUG(tag, fmt, ...) \
    ::piping::core::Logger::instance().log( \
        ::piping::core::LogLevel::DEBUG, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_INFO(tag, fmt, ...) \
    ::piping::core::Logger::instance().log( \
        ::piping::core::LogLevel::INFO, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_WARN(tag, fmt, ...) \
    ::piping::core::Logger::instance().log( \
        ::piping::core::LogLevel::WARN, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(tag, fmt, ...) \
    ::piping::core::Logger::instance().log( \
        ::piping::core::LogLevel::ERROR, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // PIPING_ENABLE_LOGGING
