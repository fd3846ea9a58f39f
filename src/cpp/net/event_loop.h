/**
 * Event Loop - Abstract Interface
 *
 * I/O multiplexing for the worker threads. Each worker owns exactly one
 * loop; every connection is confined to the loop that accepted it.
 * Other threads hand work to a loop with post().
 *
 * Implementations:
 * - Linux: epoll (EPOLLET for edge-triggered)
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <sys/socket.h>

namespace piping {
namespace net {

/**
 * I/O event types
 */
enum class IOEvent {
    READ = 1 << 0,      // Socket readable
    WRITE = 1 << 1,     // Socket writable
    ERROR = 1 << 2,     // Socket error
    HUP = 1 << 3,       // Peer closed (or shut down its write side)
    EDGE = 1 << 4       // Edge-triggered mode
};

inline IOEvent operator|(IOEvent a, IOEvent b) {
    return static_cast<IOEvent>(static_cast<int>(a) | static_cast<int>(b));
}

inline bool operator&(IOEvent a, IOEvent b) {
    return (static_cast<int>(a) & static_cast<int>(b)) != 0;
}

/**
 * Event handler callback
 *
 * Args:
 * - fd: File descriptor that triggered event
 * - events: IOEvent flags (READ, WRITE, ERROR, HUP)
 * - user_data: User-provided pointer
 */
using EventHandler = std::function<void(int fd, IOEvent events, void* user_data)>;

/**
 * Work item queued with EventLoop::post().
 */
using Task = std::function<void()>;

/**
 * Abstract event loop interface
 */
class EventLoop {
public:
    virtual ~EventLoop() = default;

    /**
     * Add file descriptor to event loop
     *
     * @param fd File descriptor to monitor
     * @param events IOEvent flags (READ, WRITE, EDGE)
     * @param handler Callback when event occurs
     * @param user_data User pointer passed to handler
     * @return 0 on success, -1 on error (check errno)
     */
    virtual int add_fd(int fd, IOEvent events, EventHandler handler, void* user_data = nullptr) = 0;

    /**
     * Modify events for existing file descriptor
     *
     * @return 0 on success, -1 on error
     */
    virtual int modify_fd(int fd, IOEvent events) = 0;

    /**
     * Remove file descriptor from event loop. Safe to call from inside
     * the handler registered for the same fd.
     *
     * @return 0 on success, -1 on error
     */
    virtual int remove_fd(int fd) = 0;

    /**
     * Queue a task to run on the loop thread.
     *
     * Thread-safe. Tasks run in FIFO order after the current dispatch
     * round, never inline. Tasks still queued when the loop is destroyed
     * are dropped without running.
     */
    virtual void post(Task task) = 0;

    /**
     * Run one iteration of the event loop
     *
     * Waits for events (up to timeout_ms) and dispatches handlers.
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = non-blocking)
     * @return Number of events processed, or -1 on error
     */
    virtual int poll(int timeout_ms = -1) = 0;

    /**
     * Run the event loop until stop() is called.
     *
     * A stop() issued before run() makes run() return immediately.
     */
    virtual void run() = 0;

    /**
     * Stop the event loop
     *
     * Thread-safe. Can be called from any thread.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /**
     * @return "epoll"
     */
    virtual const char* platform_name() const = 0;

    // Helper to set socket non-blocking
    static int set_nonblocking(int fd);

    // Helper to set TCP_NODELAY (disable Nagle's algorithm)
    static int set_tcp_nodelay(int fd);

    // Helper to set SO_REUSEADDR
    static int set_reuseaddr(int fd);

    // Helper to set SO_REUSEPORT
    static int set_reuseport(int fd);
};

/**
 * Factory function to create the platform event loop
 *
 * @return Unique pointer to event loop
 * @throws std::runtime_error if the kernel objects cannot be created
 */
std::unique_ptr<EventLoop> create_event_loop();

/**
 * Get recommended number of worker threads
 *
 * Returns hardware_concurrency - 2 (leave cores for OS and other tasks)
 */
uint32_t recommended_worker_count();

} // namespace net
} // namespace piping
