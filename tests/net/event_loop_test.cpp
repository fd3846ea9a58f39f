/**
 * Event Loop Tests
 *
 * Google Test suite for the epoll event loop: registration, readiness
 * dispatch, peer shutdown, cross-thread post(), and run/stop.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/net/event_loop.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace piping::net;
using namespace piping::testing;

// =============================================================================
// EventLoop Test Fixture
// =============================================================================

class EventLoopTest : public PipingTest {
protected:
    std::unique_ptr<EventLoop> loop_;
    std::vector<int> fds_;

    void SetUp() override {
        PipingTest::SetUp();
        loop_ = create_event_loop();
        ASSERT_NE(loop_, nullptr) << "Failed to create event loop";
    }

    void TearDown() override {
        if (loop_ && loop_->is_running()) {
            loop_->stop();
        }
        loop_.reset();
        for (int fd : fds_) {
            close(fd);
        }
        PipingTest::TearDown();
    }

    // Helper: non-blocking socket pair, closed in TearDown
    std::pair<int, int> create_socket_pair() {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0) {
            return {-1, -1};
        }
        EventLoop::set_nonblocking(fds[0]);
        EventLoop::set_nonblocking(fds[1]);
        fds_.push_back(fds[0]);
        fds_.push_back(fds[1]);
        return {fds[0], fds[1]};
    }

    // Helper: poll until predicate holds or the deadline passes
    template <typename Pred>
    bool poll_until(Pred pred, int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            loop_->poll(10);
        }
        return true;
    }
};

// =============================================================================
// Basic EventLoop Tests
// =============================================================================

TEST_F(EventLoopTest, Creation) {
    EXPECT_FALSE(loop_->is_running());
    EXPECT_STREQ(loop_->platform_name(), "epoll");
}

TEST_F(EventLoopTest, AddRemoveFd) {
    auto [fd1, fd2] = create_socket_pair();
    ASSERT_GE(fd1, 0);

    int result = loop_->add_fd(fd1, IOEvent::READ, [](int, IOEvent, void*) {});
    EXPECT_EQ(result, 0);

    EXPECT_EQ(loop_->remove_fd(fd1), 0);
    (void)fd2;
}

TEST_F(EventLoopTest, AddRejectsInvalidArguments) {
    EXPECT_EQ(loop_->add_fd(-1, IOEvent::READ, [](int, IOEvent, void*) {}), -1);
    EXPECT_EQ(errno, EINVAL);

    auto [fd1, fd2] = create_socket_pair();
    EXPECT_EQ(loop_->add_fd(fd1, IOEvent::READ, EventHandler{}), -1);
    EXPECT_EQ(errno, EINVAL);
    (void)fd2;
}

TEST_F(EventLoopTest, PollWithData) {
    auto [reader_fd, writer_fd] = create_socket_pair();
    ASSERT_GE(reader_fd, 0);

    int seen_fd = -1;
    void* seen_data = nullptr;
    bool read_event = false;
    int tag = 42;

    ASSERT_EQ(loop_->add_fd(reader_fd, IOEvent::READ,
        [&](int fd, IOEvent events, void* user_data) {
            seen_fd = fd;
            seen_data = user_data;
            read_event = events & IOEvent::READ;
        }, &tag), 0);

    const char* msg = "Hello";
    ASSERT_EQ(write(writer_fd, msg, strlen(msg)), static_cast<ssize_t>(strlen(msg)));

    EXPECT_GE(loop_->poll(1000), 1);
    EXPECT_TRUE(read_event);
    EXPECT_EQ(seen_fd, reader_fd);
    EXPECT_EQ(seen_data, &tag);
}

TEST_F(EventLoopTest, PollTimeout) {
    auto [reader_fd, writer_fd] = create_socket_pair();
    ASSERT_EQ(loop_->add_fd(reader_fd, IOEvent::READ, [](int, IOEvent, void*) {}), 0);

    auto start = std::chrono::steady_clock::now();
    int events = loop_->poll(50);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    EXPECT_EQ(events, 0);
    EXPECT_GE(elapsed, 40);
    (void)writer_fd;
}

TEST_F(EventLoopTest, ModifyEvents) {
    auto [fd1, fd2] = create_socket_pair();

    int write_events = 0;
    ASSERT_EQ(loop_->add_fd(fd1, IOEvent::READ,
        [&](int, IOEvent events, void*) {
            if (events & IOEvent::WRITE) {
                ++write_events;
            }
        }), 0);

    // Not interested in writability yet
    loop_->poll(20);
    EXPECT_EQ(write_events, 0);

    // An idle socket is immediately writable
    ASSERT_EQ(loop_->modify_fd(fd1, IOEvent::READ | IOEvent::WRITE), 0);
    loop_->poll(100);
    EXPECT_EQ(write_events, 1);

    ASSERT_EQ(loop_->modify_fd(fd1, IOEvent::READ), 0);
    loop_->poll(20);
    EXPECT_EQ(write_events, 1);
    (void)fd2;
}

TEST_F(EventLoopTest, ModifyUnknownFd) {
    EXPECT_EQ(loop_->modify_fd(12345, IOEvent::READ), -1);
    EXPECT_EQ(errno, ENOENT);
}

TEST_F(EventLoopTest, EdgeTriggeredFiresOncePerArrival) {
    auto [reader_fd, writer_fd] = create_socket_pair();

    int calls = 0;
    ASSERT_EQ(loop_->add_fd(reader_fd, IOEvent::READ | IOEvent::EDGE,
        [&](int, IOEvent, void*) { ++calls; }), 0);

    ASSERT_EQ(write(writer_fd, "x", 1), 1);
    loop_->poll(100);
    EXPECT_EQ(calls, 1);

    // Data left unread does not re-trigger an edge
    loop_->poll(20);
    EXPECT_EQ(calls, 1);

    ASSERT_EQ(write(writer_fd, "y", 1), 1);
    loop_->poll(100);
    EXPECT_EQ(calls, 2);
}

TEST_F(EventLoopTest, PeerShutdownReportsHup) {
    auto [fd1, fd2] = create_socket_pair();

    bool hup = false;
    ASSERT_EQ(loop_->add_fd(fd1, IOEvent::READ,
        [&](int, IOEvent events, void*) {
            if (events & IOEvent::HUP) {
                hup = true;
            }
        }), 0);

    ASSERT_EQ(shutdown(fd2, SHUT_WR), 0);
    EXPECT_TRUE(poll_until([&] { return hup; }));
}

TEST_F(EventLoopTest, HandlerMayRemoveItself) {
    auto [reader_fd, writer_fd] = create_socket_pair();

    int calls = 0;
    ASSERT_EQ(loop_->add_fd(reader_fd, IOEvent::READ,
        [&](int fd, IOEvent, void*) {
            ++calls;
            EXPECT_EQ(loop_->remove_fd(fd), 0);
        }), 0);

    ASSERT_EQ(write(writer_fd, "x", 1), 1);
    loop_->poll(100);
    ASSERT_EQ(write(writer_fd, "y", 1), 1);
    loop_->poll(20);
    EXPECT_EQ(calls, 1);
}

TEST_F(EventLoopTest, HandlerExceptionIsContained) {
    auto [reader_fd, writer_fd] = create_socket_pair();
    ASSERT_EQ(loop_->add_fd(reader_fd, IOEvent::READ,
        [](int, IOEvent, void*) { throw std::runtime_error("boom"); }), 0);

    ASSERT_EQ(write(writer_fd, "x", 1), 1);
    EXPECT_GE(loop_->poll(100), 1);
}

TEST_F(EventLoopTest, MultipleFds) {
    constexpr int kPairs = 10;
    std::vector<std::pair<int, int>> pairs;
    std::vector<int> hits(kPairs, 0);

    for (int i = 0; i < kPairs; ++i) {
        auto pair = create_socket_pair();
        ASSERT_GE(pair.first, 0);
        pairs.push_back(pair);
        ASSERT_EQ(loop_->add_fd(pair.first, IOEvent::READ,
            [&hits, i](int fd, IOEvent, void*) {
                char buf[16];
                while (read(fd, buf, sizeof(buf)) > 0) {
                }
                ++hits[i];
            }), 0);
    }

    for (auto& pair : pairs) {
        ASSERT_EQ(write(pair.second, "x", 1), 1);
    }

    EXPECT_TRUE(poll_until([&] {
        for (int h : hits) {
            if (h == 0) return false;
        }
        return true;
    }));
}

// =============================================================================
// post() and run()
// =============================================================================

TEST_F(EventLoopTest, PostedTasksRunInOrder) {
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        loop_->post([&order, i] { order.push_back(i); });
    }
    EXPECT_TRUE(order.empty());

    loop_->poll(100);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(EventLoopTest, PostFromTaskRunsNextRound) {
    int stage = 0;
    loop_->post([&] {
        stage = 1;
        loop_->post([&] { stage = 2; });
    });

    loop_->poll(100);
    EXPECT_EQ(stage, 1);
    loop_->poll(100);
    EXPECT_EQ(stage, 2);
}

TEST_F(EventLoopTest, PostWakesBlockedPoll) {
    std::atomic<bool> ran{false};
    std::thread poster([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        loop_->post([&] { ran = true; });
    });

    auto start = std::chrono::steady_clock::now();
    loop_->poll(5000);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    poster.join();

    EXPECT_TRUE(ran);
    EXPECT_LT(elapsed, 4000);
}

TEST_F(EventLoopTest, PostedTaskExceptionIsContained) {
    bool after = false;
    loop_->post([] { throw std::runtime_error("boom"); });
    loop_->post([&] { after = true; });
    loop_->poll(100);
    EXPECT_TRUE(after);
}

TEST_F(EventLoopTest, RunAndStop) {
    std::thread runner([this] { loop_->run(); });

    EXPECT_TRUE(wait_for([this] { return loop_->is_running(); }, 2000));

    std::atomic<int> ran{0};
    for (int i = 0; i < 100; ++i) {
        loop_->post([&ran] { ++ran; });
    }
    EXPECT_TRUE(wait_for([&] { return ran.load() == 100; }, 2000));

    loop_->stop();
    runner.join();
    EXPECT_FALSE(loop_->is_running());
}

TEST_F(EventLoopTest, StopBeforeRunReturnsImmediately) {
    loop_->stop();
    auto start = std::chrono::steady_clock::now();
    loop_->run();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    EXPECT_LT(elapsed, 1000);
    EXPECT_FALSE(loop_->is_running());
}

// =============================================================================
// Socket option helpers
// =============================================================================

TEST_F(EventLoopTest, SetNonblocking) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    fds_.push_back(fd);

    EXPECT_EQ(EventLoop::set_nonblocking(fd), 0);
    EXPECT_TRUE(fcntl(fd, F_GETFL, 0) & O_NONBLOCK);
}

TEST_F(EventLoopTest, SetTcpNodelay) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    fds_.push_back(fd);

    EXPECT_EQ(EventLoop::set_tcp_nodelay(fd), 0);
    int value = 0;
    socklen_t len = sizeof(value);
    ASSERT_EQ(getsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &value, &len), 0);
    EXPECT_NE(value, 0);
}

TEST_F(EventLoopTest, SetReuseaddrAndReuseport) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    fds_.push_back(fd);

    EXPECT_EQ(EventLoop::set_reuseaddr(fd), 0);
    EXPECT_EQ(EventLoop::set_reuseport(fd), 0);

    int value = 0;
    socklen_t len = sizeof(value);
    ASSERT_EQ(getsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &value, &len), 0);
    EXPECT_NE(value, 0);
}

TEST_F(EventLoopTest, HelpersFailOnBadFd) {
    EXPECT_EQ(EventLoop::set_nonblocking(-1), -1);
    EXPECT_EQ(EventLoop::set_tcp_nodelay(-1), -1);
}

TEST_F(EventLoopTest, RecommendedWorkerCount) {
    EXPECT_GE(recommended_worker_count(), 1u);
}

// =============================================================================
// Edge Cases
// =============================================================================

TEST_F(EventLoopTest, RemoveNonexistentFd) {
    EXPECT_EQ(loop_->remove_fd(99999), -1);
    EXPECT_EQ(errno, ENOENT);
}

TEST_F(EventLoopTest, DoubleAdd) {
    auto [fd1, fd2] = create_socket_pair();
    ASSERT_EQ(loop_->add_fd(fd1, IOEvent::READ, [](int, IOEvent, void*) {}), 0);
    EXPECT_EQ(loop_->add_fd(fd1, IOEvent::READ, [](int, IOEvent, void*) {}), -1);
    EXPECT_EQ(errno, EEXIST);
    (void)fd2;
}

TEST_F(EventLoopTest, RemoveAfterClose) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    fds_.push_back(fds[1]);
    ASSERT_EQ(loop_->add_fd(fds[0], IOEvent::READ, [](int, IOEvent, void*) {}), 0);
    close(fds[0]);
    EXPECT_EQ(loop_->remove_fd(fds[0]), 0);
}
