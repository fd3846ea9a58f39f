/**
 * TCP Socket Tests
 *
 * Google Test suite for the RAII socket wrapper and the multi-worker
 * TcpListener accept loop.
 */

#include <gtest/gtest.h>
#include "../test_utils.h"
#include "../../src/cpp/net/tcp_socket.h"
#include "../../src/cpp/net/tcp_listener.h"
#include "../../src/cpp/net/event_loop.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <mutex>
#include <set>

using namespace piping::net;
using namespace piping::testing;

// =============================================================================
// TcpSocket Test Fixture
// =============================================================================

class TcpSocketTest : public PipingTest {
protected:
    // Helper: loopback listener on an ephemeral port
    static TcpSocket make_listener(uint16_t& port) {
        TcpSocket listener;
        listener.set_reuseaddr();
        EXPECT_EQ(listener.bind("127.0.0.1", 0), 0);
        EXPECT_EQ(listener.listen(128), 0);
        std::string ip;
        EXPECT_TRUE(listener.get_local_address(ip, port));
        return listener;
    }

    // Helper: accept with a deadline on a blocking or non-blocking listener
    static TcpSocket accept_within(TcpSocket& listener, int timeout_ms = 2000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            TcpSocket client = listener.accept();
            if (client.is_valid()) {
                return client;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return TcpSocket(-1);
    }

    // Helper: receive exactly len bytes from a non-blocking socket
    static bool recv_all(TcpSocket& socket, std::string& out, size_t len, int timeout_ms = 5000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        char buf[16384];
        while (out.size() < len) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            ssize_t n = socket.recv(buf, std::min(sizeof(buf), len - out.size()));
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
            } else if (n == 0) {
                return false;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                return false;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return true;
    }
};

// =============================================================================
// Basic Socket Tests
// =============================================================================

TEST_F(TcpSocketTest, DefaultConstruction) {
    TcpSocket sock;
    EXPECT_TRUE(sock.is_valid());
    EXPECT_GE(sock.fd(), 0);
    EXPECT_TRUE(fcntl(sock.fd(), F_GETFD) & FD_CLOEXEC);
}

TEST_F(TcpSocketTest, ConstructFromFd) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    TcpSocket sock(fd);
    EXPECT_EQ(sock.fd(), fd);
}

TEST_F(TcpSocketTest, MoveConstruction) {
    TcpSocket sock1;
    int fd = sock1.fd();

    TcpSocket sock2(std::move(sock1));
    EXPECT_FALSE(sock1.is_valid());
    EXPECT_EQ(sock2.fd(), fd);
}

TEST_F(TcpSocketTest, MoveAssignment) {
    TcpSocket sock1;
    TcpSocket sock2;
    int fd1 = sock1.fd();

    sock2 = std::move(sock1);
    EXPECT_FALSE(sock1.is_valid());
    EXPECT_EQ(sock2.fd(), fd1);
}

TEST_F(TcpSocketTest, Close) {
    TcpSocket sock;
    sock.close();
    EXPECT_FALSE(sock.is_valid());
    EXPECT_EQ(sock.fd(), -1);
    sock.close();  // Idempotent
}

TEST_F(TcpSocketTest, Release) {
    TcpSocket sock;
    int fd = sock.fd();

    int released = sock.release();
    EXPECT_EQ(released, fd);
    EXPECT_FALSE(sock.is_valid());

    // Still open after the wrapper lets go
    EXPECT_GE(fcntl(released, F_GETFD), 0);
    close(released);
}

TEST_F(TcpSocketTest, OperationsOnInvalidSocket) {
    TcpSocket sock(-1);
    char buf[4];
    EXPECT_EQ(sock.send("x", 1), -1);
    EXPECT_EQ(errno, EBADF);
    EXPECT_EQ(sock.recv(buf, sizeof(buf)), -1);
    EXPECT_EQ(errno, EBADF);
    EXPECT_EQ(sock.bind("127.0.0.1", 0), -1);
    EXPECT_EQ(sock.listen(), -1);
    EXPECT_EQ(sock.connect("127.0.0.1", 80), -1);
    EXPECT_FALSE(sock.accept().is_valid());

    std::string ip;
    uint16_t port = 0;
    EXPECT_FALSE(sock.get_local_address(ip, port));
    EXPECT_FALSE(sock.get_remote_address(ip, port));
}

// =============================================================================
// Socket Options
// =============================================================================

TEST_F(TcpSocketTest, SetNonblocking) {
    TcpSocket sock;
    EXPECT_EQ(sock.set_nonblocking(), 0);
    EXPECT_TRUE(fcntl(sock.fd(), F_GETFL, 0) & O_NONBLOCK);
}

TEST_F(TcpSocketTest, SetNodelay) {
    TcpSocket sock;
    EXPECT_EQ(sock.set_nodelay(), 0);

    int value = 0;
    socklen_t len = sizeof(value);
    ASSERT_EQ(getsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &value, &len), 0);
    EXPECT_NE(value, 0);
}

TEST_F(TcpSocketTest, SetReuseaddrAndReuseport) {
    TcpSocket sock;
    EXPECT_EQ(sock.set_reuseaddr(), 0);
    EXPECT_EQ(sock.set_reuseport(), 0);

    int value = 0;
    socklen_t len = sizeof(value);
    ASSERT_EQ(getsockopt(sock.fd(), SOL_SOCKET, SO_REUSEPORT, &value, &len), 0);
    EXPECT_NE(value, 0);
}

// =============================================================================
// Bind / Listen / Connect
// =============================================================================

TEST_F(TcpSocketTest, BindToAnyPort) {
    TcpSocket sock;
    ASSERT_EQ(sock.bind("127.0.0.1", 0), 0);

    std::string ip;
    uint16_t port = 0;
    ASSERT_TRUE(sock.get_local_address(ip, port));
    EXPECT_EQ(ip, "127.0.0.1");
    EXPECT_GT(port, 0);
}

TEST_F(TcpSocketTest, BindWildcard) {
    TcpSocket sock;
    ASSERT_EQ(sock.bind("", 0), 0);

    std::string ip;
    uint16_t port = 0;
    ASSERT_TRUE(sock.get_local_address(ip, port));
    EXPECT_EQ(ip, "0.0.0.0");
}

TEST_F(TcpSocketTest, BindRejectsBadAddress) {
    TcpSocket sock;
    EXPECT_EQ(sock.bind("not-an-ip", 0), -1);
    EXPECT_EQ(errno, EINVAL);
}

TEST_F(TcpSocketTest, BindToUsedPort) {
    uint16_t port = 0;
    TcpSocket first = make_listener(port);

    TcpSocket second;
    EXPECT_EQ(second.bind("127.0.0.1", port), -1);
    EXPECT_EQ(errno, EADDRINUSE);
}

TEST_F(TcpSocketTest, ConnectAndExchange) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);

    TcpSocket server = accept_within(listener);
    ASSERT_TRUE(server.is_valid());
    // accept() hands out non-blocking sockets
    EXPECT_TRUE(fcntl(server.fd(), F_GETFL, 0) & O_NONBLOCK);

    const std::string msg = "ping";
    ASSERT_EQ(client.send(msg.data(), msg.size()), static_cast<ssize_t>(msg.size()));

    std::string received;
    ASSERT_TRUE(recv_all(server, received, msg.size()));
    EXPECT_EQ(received, msg);
}

TEST_F(TcpSocketTest, ConnectByHostname) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    EXPECT_EQ(client.connect("localhost", port), 0);
    EXPECT_TRUE(accept_within(listener).is_valid());
}

TEST_F(TcpSocketTest, ConnectToRefusedPort) {
    uint16_t port = 0;
    {
        TcpSocket probe;
        ASSERT_EQ(probe.bind("127.0.0.1", 0), 0);
        std::string ip;
        probe.get_local_address(ip, port);
    }

    TcpSocket client;
    EXPECT_EQ(client.connect("127.0.0.1", port), -1);
    EXPECT_EQ(errno, ECONNREFUSED);
}

TEST_F(TcpSocketTest, NonblockingConnectInProgress) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    client.set_nonblocking();
    EXPECT_EQ(client.connect("127.0.0.1", port), 0);
    EXPECT_TRUE(accept_within(listener).is_valid());
}

TEST_F(TcpSocketTest, LargeDataTransfer) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = accept_within(listener);
    ASSERT_TRUE(server.is_valid());

    std::string payload = rng_.random_bytes(2 * 1024 * 1024);
    std::thread sender([&] {
        size_t sent = 0;
        while (sent < payload.size()) {
            ssize_t n = client.send(payload.data() + sent, payload.size() - sent);
            if (n <= 0) {
                break;
            }
            sent += static_cast<size_t>(n);
        }
    });

    std::string received;
    EXPECT_TRUE(recv_all(server, received, payload.size(), 10000));
    sender.join();
    EXPECT_EQ(received, payload);
}

TEST_F(TcpSocketTest, RecvReturnsZeroOnEof) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = accept_within(listener);
    ASSERT_TRUE(server.is_valid());

    client.close();

    char buf[8];
    ssize_t n = -1;
    ASSERT_TRUE(wait_for([&] {
        n = server.recv(buf, sizeof(buf));
        return n >= 0;
    }, 2000));
    EXPECT_EQ(n, 0);
}

TEST_F(TcpSocketTest, SendToClosedPeerFailsWithoutSignal) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);
    TcpSocket server = accept_within(listener);
    ASSERT_TRUE(server.is_valid());
    server.close();

    // The first send may be accepted before the RST arrives
    std::string chunk(4096, 'x');
    bool failed = wait_for([&] {
        return client.send(chunk.data(), chunk.size()) < 0;
    }, 2000);
    EXPECT_TRUE(failed);
    EXPECT_TRUE(errno == EPIPE || errno == ECONNRESET);
}

TEST_F(TcpSocketTest, AddressesMatchAcrossEnds) {
    uint16_t port = 0;
    TcpSocket listener = make_listener(port);

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", port), 0);

    struct sockaddr_in peer{};
    TcpSocket server;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!server.is_valid() && std::chrono::steady_clock::now() < deadline) {
        server = listener.accept(&peer);
    }
    ASSERT_TRUE(server.is_valid());

    std::string client_ip;
    uint16_t client_port = 0;
    ASSERT_TRUE(client.get_local_address(client_ip, client_port));

    std::string remote_ip;
    uint16_t remote_port = 0;
    ASSERT_TRUE(server.get_remote_address(remote_ip, remote_port));
    EXPECT_EQ(remote_ip, client_ip);
    EXPECT_EQ(remote_port, client_port);
    EXPECT_EQ(ntohs(peer.sin_port), client_port);

    std::string server_ip;
    uint16_t server_port = 0;
    ASSERT_TRUE(client.get_remote_address(server_ip, server_port));
    EXPECT_EQ(server_port, port);
}

// =============================================================================
// TcpListener
// =============================================================================

class TcpListenerTest : public TcpSocketTest {
protected:
    static TcpListenerConfig loopback(uint16_t workers) {
        TcpListenerConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.num_workers = workers;
        config.name = "test";
        return config;
    }
};

TEST_F(TcpListenerTest, ListenBindsEphemeralPort) {
    TcpListener listener(loopback(2), [](TcpSocket, EventLoop*) {});
    ASSERT_EQ(listener.listen(), 0);
    EXPECT_GT(listener.port(), 0);
    EXPECT_EQ(listener.num_workers(), 2);
    EXPECT_FALSE(listener.is_running());

    // Idempotent
    uint16_t port = listener.port();
    EXPECT_EQ(listener.listen(), 0);
    EXPECT_EQ(listener.port(), port);
}

TEST_F(TcpListenerTest, AutoWorkerCount) {
    TcpListener listener(loopback(0), [](TcpSocket, EventLoop*) {});
    EXPECT_GE(listener.num_workers(), 1);
}

TEST_F(TcpListenerTest, BindFailureReported) {
    uint16_t port = 0;
    TcpSocket taken = make_listener(port);

    TcpListenerConfig config = loopback(1);
    config.port = port;
    config.use_reuseport = false;
    TcpListener listener(config, [](TcpSocket, EventLoop*) {});
    EXPECT_EQ(listener.listen(), -1);
}

TEST_F(TcpListenerTest, StopBeforeStart) {
    TcpListener listener(loopback(1), [](TcpSocket, EventLoop*) {});
    listener.stop();
    EXPECT_FALSE(listener.is_running());
}

TEST_F(TcpListenerTest, AcceptsOnWorkerLoops) {
    std::mutex mutex;
    std::set<EventLoop*> loops;
    std::atomic<int> accepted{0};

    TcpListener listener(loopback(2), [&](TcpSocket socket, EventLoop* loop) {
        EXPECT_TRUE(socket.is_valid());
        EXPECT_NE(loop, nullptr);
        {
            std::lock_guard<std::mutex> lock(mutex);
            loops.insert(loop);
        }
        ++accepted;
    });
    ASSERT_EQ(listener.listen(), 0);

    std::thread runner([&] { listener.start(); });
    ASSERT_TRUE(wait_for([&] { return listener.is_running(); }, 2000));

    constexpr int kClients = 20;
    std::vector<TcpSocket> clients;
    for (int i = 0; i < kClients; ++i) {
        TcpSocket client;
        ASSERT_EQ(client.connect("127.0.0.1", listener.port()), 0);
        clients.push_back(std::move(client));
    }

    EXPECT_TRUE(wait_for([&] { return accepted.load() == kClients; }, 5000));

    listener.stop();
    runner.join();
    EXPECT_FALSE(listener.is_running());

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_GE(loops.size(), 1u);
    EXPECT_LE(loops.size(), 2u);
}

TEST_F(TcpListenerTest, EchoThroughWorkerLoop) {
    TcpListener listener(loopback(1), [](TcpSocket socket, EventLoop* loop) {
        int fd = socket.release();
        loop->add_fd(fd, IOEvent::READ, [loop](int fd, IOEvent events, void*) {
            char buf[1024];
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n > 0) {
                ::send(fd, buf, static_cast<size_t>(n), MSG_NOSIGNAL);
            } else if (n == 0 || (events & IOEvent::HUP)) {
                loop->remove_fd(fd);
                ::close(fd);
            }
        });
    });
    ASSERT_EQ(listener.listen(), 0);
    std::thread runner([&] { listener.start(); });
    ASSERT_TRUE(wait_for([&] { return listener.is_running(); }, 2000));

    TcpSocket client;
    ASSERT_EQ(client.connect("127.0.0.1", listener.port()), 0);
    ASSERT_EQ(client.send("echo", 4), 4);

    char buf[8] = {};
    struct timeval tv{5, 0};
    setsockopt(client.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ASSERT_EQ(client.recv(buf, sizeof(buf)), 4);
    EXPECT_EQ(std::string(buf, 4), "echo");

    client.close();
    listener.stop();
    runner.join();
}
