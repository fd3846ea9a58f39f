/**
 * Event Loop - epoll Implementation (Linux)
 *
 * Features:
 * - Edge-triggered mode (EPOLLET)
 * - EPOLLRDHUP always armed so peer shutdown is reported as HUP
 * - Wake pipe for cross-thread post()
 */

#include "event_loop.h"
#include "../core/logger.h"
#include <sys/epoll.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace piping {
namespace net {

struct EventHandlerData {
    EventHandler handler;
    void* user_data;
    IOEvent events;  // Registered events
};

class EpollEventLoop : public EventLoop {
public:
    EpollEventLoop()
        : epoll_fd_(-1)
        , running_(false)
        , stop_requested_(false)
        , wake_pending_(false)
    {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(std::string("epoll_create1() failed: ") + strerror(errno));
        }

        if (pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) < 0) {
            int saved = errno;
            close(epoll_fd_);
            throw std::runtime_error(std::string("pipe2() failed: ") + strerror(saved));
        }

        struct epoll_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.events = EPOLLIN;
        ev.data.fd = wake_pipe_[0];
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_pipe_[0], &ev) < 0) {
            int saved = errno;
            close(wake_pipe_[0]);
            close(wake_pipe_[1]);
            close(epoll_fd_);
            throw std::runtime_error(std::string("failed to register wake pipe: ") + strerror(saved));
        }

        events_.resize(256);
    }

    ~EpollEventLoop() override {
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        if (epoll_fd_ >= 0) {
            close(epoll_fd_);
        }
    }

    int add_fd(int fd, IOEvent events, EventHandler handler, void* user_data) override {
        if (fd < 0 || !handler) {
            errno = EINVAL;
            return -1;
        }

        if (update_epoll_events(fd, events, false) < 0) {
            return -1;
        }

        EventHandlerData data;
        data.handler = std::move(handler);
        data.user_data = user_data;
        data.events = events;
        handlers_[fd] = std::move(data);
        return 0;
    }

    int modify_fd(int fd, IOEvent events) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        it->second.events = events;
        return update_epoll_events(fd, events, true);
    }

    int remove_fd(int fd) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        struct epoll_event ev;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, &ev) < 0) {
            // Ignore ENOENT (already removed) and EBADF (fd already closed)
            if (errno != ENOENT && errno != EBADF) {
                return -1;
            }
        }

        handlers_.erase(it);
        return 0;
    }

    void post(Task task) override {
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            tasks_.push_back(std::move(task));
        }
        wake();
    }

    int poll(int timeout_ms) override {
        int n_events = epoll_wait(epoll_fd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);

        if (n_events < 0) {
            if (errno == EINTR) {
                return 0;
            }
            return -1;
        }

        bool woken = false;
        for (int i = 0; i < n_events; i++) {
            struct epoll_event& ev = events_[i];
            int fd = ev.data.fd;

            if (fd == wake_pipe_[0]) {
                woken = true;
                continue;
            }

            auto it = handlers_.find(fd);
            if (it == handlers_.end()) {
                continue;  // Handler was removed
            }

            IOEvent event_type = static_cast<IOEvent>(0);
            if (ev.events & EPOLLIN) {
                event_type = IOEvent::READ;
            }
            if (ev.events & EPOLLOUT) {
                event_type = event_type | IOEvent::WRITE;
            }
            if (ev.events & (EPOLLHUP | EPOLLRDHUP)) {
                event_type = event_type | IOEvent::HUP;
            }
            if (ev.events & EPOLLERR) {
                event_type = event_type | IOEvent::ERROR;
            }

            // The handler may remove its own fd; keep the callable alive.
            EventHandler handler = it->second.handler;
            void* user_data = it->second.user_data;
            try {
                handler(fd, event_type, user_data);
            } catch (const std::exception& e) {
                LOG_ERROR("Loop", "Event handler exception on fd=%d: %s", fd, e.what());
            }
        }

        if (n_events == static_cast<int>(events_.size())) {
            events_.resize(events_.size() * 2);
        }

        if (woken) {
            drain_wake_pipe();
        }
        run_posted_tasks();

        return n_events;
    }

    void run() override {
        running_.store(true, std::memory_order_release);

        while (!stop_requested_.load(std::memory_order_acquire)) {
            int result = poll(100);
            if (result < 0 && errno != EINTR) {
                LOG_ERROR("Loop", "epoll_wait() error: %s", strerror(errno));
                break;
            }
        }

        running_.store(false, std::memory_order_release);
    }

    void stop() override {
        stop_requested_.store(true, std::memory_order_release);
        wake();
    }

    bool is_running() const override {
        return running_.load(std::memory_order_acquire);
    }

    const char* platform_name() const override {
        return "epoll";
    }

private:
    int update_epoll_events(int fd, IOEvent events, bool modify) {
        struct epoll_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.data.fd = fd;

        if (events & IOEvent::READ) {
            ev.events |= EPOLLIN;
        }
        if (events & IOEvent::WRITE) {
            ev.events |= EPOLLOUT;
        }
        if (events & IOEvent::EDGE) {
            ev.events |= EPOLLET;
        }

        // Always enable EPOLLRDHUP to detect peer shutdown
        ev.events |= EPOLLRDHUP;

        int op = modify ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
        if (epoll_ctl(epoll_fd_, op, fd, &ev) < 0) {
            return -1;
        }

        return 0;
    }

    void wake() {
        if (wake_pending_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        char byte = 1;
        ssize_t written = ::write(wake_pipe_[1], &byte, 1);
        if (written < 0 && errno != EAGAIN) {
            LOG_ERROR("Loop", "Failed to write wake pipe: %s", strerror(errno));
        }
    }

    void drain_wake_pipe() {
        char buf[64];
        while (::read(wake_pipe_[0], buf, sizeof(buf)) > 0) {
        }
        wake_pending_.store(false, std::memory_order_release);
    }

    void run_posted_tasks() {
        std::vector<Task> batch;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            if (tasks_.empty()) {
                return;
            }
            batch.swap(tasks_);
        }

        for (auto& task : batch) {
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Loop", "Posted task exception: %s", e.what());
            }
        }
    }

    int epoll_fd_;
    int wake_pipe_[2] = {-1, -1};
    std::unordered_map<int, EventHandlerData> handlers_;
    std::vector<struct epoll_event> events_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_;
    std::atomic<bool> wake_pending_;
    std::mutex tasks_mutex_;
    std::vector<Task> tasks_;
};

std::unique_ptr<EventLoop> create_epoll_event_loop() {
    return std::make_unique<EpollEventLoop>();
}

} // namespace net
} // namespace piping
