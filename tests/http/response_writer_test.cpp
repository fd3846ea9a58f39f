/**
 * ResponseWriter and Exchange tests against a recording sink: header
 * locking, body framing, end/abort, body flow control.
 */

#include <gtest/gtest.h>
#include "../../src/cpp/http/exchange.h"
#include "../../src/cpp/http/http1_parser.h"
#include "../test_utils.h"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

using namespace piping::http;
using namespace piping::testing;

namespace {

/**
 * Records every call an exchange makes into its connection.
 */
class RecordingSink : public ExchangeSink {
public:
    void write_response(uint64_t id, std::string bytes, FlushCallback on_flushed) override {
        ids.push_back(id);
        output += bytes;
        writes.push_back(std::move(bytes));
        callbacks.push_back(std::move(on_flushed));
    }

    void finish_response(uint64_t id, bool close_after) override {
        ids.push_back(id);
        ++finished;
        closed_after = close_after;
    }

    void abort_exchange(uint64_t id) override {
        ids.push_back(id);
        ++aborted;
    }

    void set_body_paused(uint64_t id, bool paused) override {
        ids.push_back(id);
        pause_calls.push_back(paused);
    }

    std::string output;
    std::vector<std::string> writes;
    std::vector<FlushCallback> callbacks;
    std::vector<uint64_t> ids;
    std::vector<bool> pause_calls;
    int finished = 0;
    int aborted = 0;
    bool closed_after = false;
};

} // namespace

class ResponseWriterTest : public PipingTest {
protected:
    static constexpr uint64_t kExchangeId = 42;

    void SetUp() override {
        PipingTest::SetUp();
        sink_ = std::make_shared<RecordingSink>();
    }

    std::shared_ptr<Exchange> make(const std::string& method, int version_minor = 1,
                                   bool keep_alive = true) {
        Request request;
        request.set_method(method);
        request.set_target("/path");
        request.set_version_minor(version_minor);
        request.set_keep_alive(keep_alive);
        return std::make_shared<Exchange>(std::move(request), sink_, kExchangeId, nullptr);
    }

    std::shared_ptr<Exchange> make_parsed(const std::string& head) {
        HTTP1Parser parser;
        HTTP1Request parsed;
        size_t consumed = 0;
        int rc = parser.parse(reinterpret_cast<const uint8_t*>(head.data()), head.size(),
                              parsed, consumed);
        EXPECT_EQ(rc, 0);
        return std::make_shared<Exchange>(Request::from_parsed(parsed, false), sink_,
                                          kExchangeId, nullptr);
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::shared_ptr<RecordingSink> sink_;
};

// =============================================================================
// Header locking
// =============================================================================

TEST_F(ResponseWriterTest, HeadersLockedAfterFirstChunk) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    EXPECT_TRUE(response.send_status(201));
    EXPECT_TRUE(response.send_headers({{"Content-Type", "text/plain"}}));
    EXPECT_FALSE(response.headers_sent());
    EXPECT_TRUE(sink_->writes.empty());

    ASSERT_TRUE(response.write_chunk("abc"));
    EXPECT_TRUE(response.headers_sent());
    ASSERT_EQ(sink_->writes.size(), 1u);
    EXPECT_EQ(sink_->writes[0].rfind("HTTP/1.1 201 Created\r\n", 0), 0u);
    EXPECT_TRUE(contains(sink_->writes[0], "Content-Type: text/plain\r\n"));

    EXPECT_FALSE(response.send_headers({{"X-Late", "1"}}));
    EXPECT_FALSE(response.send_status(500));
    EXPECT_FALSE(response.flush_headers());

    ASSERT_TRUE(response.write_chunk("def"));
    EXPECT_FALSE(contains(sink_->output, "X-Late"));
    EXPECT_FALSE(contains(sink_->output, "500"));
}

TEST_F(ResponseWriterTest, HeadersLockedAfterFlush) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.flush_headers());
    EXPECT_TRUE(response.headers_sent());
    ASSERT_EQ(sink_->writes.size(), 1u);
    EXPECT_TRUE(contains(sink_->writes[0], "\r\n\r\n"));

    EXPECT_FALSE(response.send_headers({{"X-Late", "1"}}));
    EXPECT_FALSE(response.send_status(404));
    EXPECT_FALSE(response.flush_headers());
    EXPECT_EQ(sink_->writes.size(), 1u);
}

TEST_F(ResponseWriterTest, CustomReasonPhrase) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    response.send_status(200, "Fine");
    response.end();
    EXPECT_EQ(sink_->output.rfind("HTTP/1.1 200 Fine\r\n", 0), 0u);
}

TEST_F(ResponseWriterTest, StatusText) {
    EXPECT_STREQ(ResponseWriter::status_text(200), "OK");
    EXPECT_STREQ(ResponseWriter::status_text(405), "Method Not Allowed");
    EXPECT_STREQ(ResponseWriter::status_text(799), "Unknown");
}

// =============================================================================
// Framing
// =============================================================================

TEST_F(ResponseWriterTest, ChunkedByDefaultOnHttp11) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk("hello"));
    ASSERT_TRUE(response.write_chunk(std::string(26, 'z')));
    ASSERT_TRUE(response.end());

    ASSERT_EQ(sink_->writes.size(), 3u);
    EXPECT_TRUE(contains(sink_->writes[0], "Transfer-Encoding: chunked\r\n"));
    EXPECT_FALSE(contains(sink_->writes[0], "Content-Length"));
    EXPECT_FALSE(contains(sink_->writes[0], "Connection:"));
    EXPECT_TRUE(contains(sink_->writes[0], "\r\n\r\n5\r\nhello\r\n"));
    EXPECT_EQ(sink_->writes[1], "1a\r\n" + std::string(26, 'z') + "\r\n");
    EXPECT_EQ(sink_->writes[2], "0\r\n\r\n");

    EXPECT_EQ(sink_->finished, 1);
    EXPECT_FALSE(sink_->closed_after);
    EXPECT_TRUE(response.finished());
}

TEST_F(ResponseWriterTest, EmptyChunkOnlyFlushesHeaders) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk(""));
    ASSERT_EQ(sink_->writes.size(), 1u);
    EXPECT_EQ(sink_->writes[0].substr(sink_->writes[0].size() - 4), "\r\n\r\n");

    ASSERT_TRUE(response.write_chunk(""));
    ASSERT_EQ(sink_->writes.size(), 2u);
    EXPECT_TRUE(sink_->writes[1].empty());
}

TEST_F(ResponseWriterTest, ContentLengthFraming) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    response.send_headers({{"Content-Length", "10"}});

    ASSERT_TRUE(response.write_chunk("hello"));
    ASSERT_TRUE(response.write_chunk("world"));
    ASSERT_TRUE(response.end());

    EXPECT_TRUE(contains(sink_->writes[0], "Content-Length: 10\r\n"));
    EXPECT_FALSE(contains(sink_->output, "Transfer-Encoding"));
    EXPECT_TRUE(contains(sink_->writes[0], "\r\n\r\nhello"));
    EXPECT_EQ(sink_->writes[1], "world");
    EXPECT_TRUE(sink_->writes[2].empty());
    EXPECT_EQ(sink_->finished, 1);
    EXPECT_FALSE(sink_->closed_after);
}

TEST_F(ResponseWriterTest, HeadRequestOmitsBody) {
    auto exchange = make("HEAD");
    ResponseWriter& response = exchange->response();
    response.send_headers({{"Content-Length", "5"}, {"Content-Type", "text/plain"}});

    ASSERT_TRUE(response.write_chunk("hello"));
    ASSERT_TRUE(response.end());

    EXPECT_TRUE(contains(sink_->output, "Content-Length: 5\r\n"));
    EXPECT_FALSE(contains(sink_->output, "hello"));
    EXPECT_FALSE(contains(sink_->output, "Transfer-Encoding"));
    EXPECT_EQ(sink_->output.substr(sink_->output.size() - 4), "\r\n\r\n");
    EXPECT_EQ(sink_->finished, 1);
}

TEST_F(ResponseWriterTest, NoContentHasNoFraming) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    response.send_status(204);

    ASSERT_TRUE(response.end());
    EXPECT_EQ(sink_->output.rfind("HTTP/1.1 204 No Content\r\n", 0), 0u);
    EXPECT_FALSE(contains(sink_->output, "Content-Length"));
    EXPECT_FALSE(contains(sink_->output, "Transfer-Encoding"));
    EXPECT_EQ(sink_->finished, 1);
}

TEST_F(ResponseWriterTest, Http10IsCloseDelimited) {
    // Even a keep-alive 1.0 client cannot reuse a close-delimited response
    auto exchange = make("GET", 0, true);
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk("abc"));
    ASSERT_TRUE(response.end());

    EXPECT_TRUE(contains(sink_->writes[0], "Connection: close\r\n"));
    EXPECT_FALSE(contains(sink_->output, "Transfer-Encoding"));
    EXPECT_FALSE(contains(sink_->output, "Content-Length"));
    EXPECT_TRUE(contains(sink_->writes[0], "\r\n\r\nabc"));
    EXPECT_TRUE(sink_->writes[1].empty());
    EXPECT_TRUE(sink_->closed_after);
}

TEST_F(ResponseWriterTest, Http10KeepAliveWithLength) {
    auto exchange = make("GET", 0, true);
    ResponseWriter& response = exchange->response();
    response.send_headers({{"Content-Length", "3"}});

    ASSERT_TRUE(response.write_chunk("abc"));
    ASSERT_TRUE(response.end());

    EXPECT_TRUE(contains(sink_->writes[0], "Connection: keep-alive\r\n"));
    EXPECT_FALSE(sink_->closed_after);
}

TEST_F(ResponseWriterTest, ClientRequestedClose) {
    auto exchange = make("GET", 1, false);
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk("x"));
    ASSERT_TRUE(response.end());

    EXPECT_TRUE(contains(sink_->writes[0], "Transfer-Encoding: chunked\r\n"));
    EXPECT_TRUE(contains(sink_->writes[0], "Connection: close\r\n"));
    EXPECT_TRUE(sink_->closed_after);
}

TEST_F(ResponseWriterTest, EndWithoutBodyWritesZeroLength) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    response.send_headers({{"Content-Type", "text/plain"}});

    ASSERT_TRUE(response.end());
    ASSERT_EQ(sink_->writes.size(), 1u);
    EXPECT_EQ(sink_->writes[0],
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: text/plain\r\n"
              "Content-Length: 0\r\n"
              "\r\n");
    EXPECT_EQ(sink_->finished, 1);
}

TEST_F(ResponseWriterTest, EndAfterFlushedHeadersTerminatesChunks) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.flush_headers());
    ASSERT_TRUE(response.end());
    EXPECT_TRUE(contains(sink_->writes[0], "Transfer-Encoding: chunked\r\n"));
    EXPECT_EQ(sink_->writes[1], "0\r\n\r\n");
}

// =============================================================================
// end / abort
// =============================================================================

TEST_F(ResponseWriterTest, NothingAfterEnd) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk("a"));
    ASSERT_TRUE(response.end());
    size_t writes = sink_->writes.size();

    EXPECT_FALSE(response.write_chunk("b"));
    EXPECT_FALSE(response.end());
    EXPECT_FALSE(response.flush_headers());
    EXPECT_EQ(sink_->writes.size(), writes);
    EXPECT_EQ(sink_->finished, 1);
}

TEST_F(ResponseWriterTest, AbortAfterEndDoesNothing) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.end());
    response.abort();
    EXPECT_EQ(sink_->aborted, 0);
    EXPECT_EQ(sink_->finished, 1);
}

TEST_F(ResponseWriterTest, AbortMidBody) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();

    ASSERT_TRUE(response.write_chunk("partial"));
    response.abort();
    EXPECT_EQ(sink_->aborted, 1);
    EXPECT_EQ(sink_->finished, 0);
    EXPECT_FALSE(contains(sink_->output, "0\r\n\r\n"));

    EXPECT_FALSE(response.write_chunk("more"));
    EXPECT_FALSE(response.end());
    response.abort();
    EXPECT_EQ(sink_->aborted, 1);
}

TEST_F(ResponseWriterTest, CallsCarryExchangeId) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    response.write_chunk("a");
    response.end();
    ASSERT_FALSE(sink_->ids.empty());
    for (uint64_t id : sink_->ids) {
        EXPECT_EQ(id, kExchangeId);
    }
}

TEST_F(ResponseWriterTest, FlushCallbacksReachTheSink) {
    auto exchange = make("GET");
    ResponseWriter& response = exchange->response();
    int flushed = 0;

    ASSERT_TRUE(response.write_chunk("one", [&]() { ++flushed; }));
    ASSERT_TRUE(response.end([&]() { flushed += 10; }));

    ASSERT_EQ(sink_->callbacks.size(), 2u);
    for (auto& callback : sink_->callbacks) {
        ASSERT_TRUE(callback);
        callback();
    }
    EXPECT_EQ(flushed, 11);
}

TEST_F(ResponseWriterTest, ClosedConnectionRejectsWrites) {
    auto exchange = make("GET");
    exchange->notify_closed();

    EXPECT_FALSE(exchange->response().write_chunk("x"));
    EXPECT_TRUE(sink_->writes.empty());
}

TEST_F(ResponseWriterTest, ExpiredSinkRejectsWrites) {
    auto exchange = make("GET");
    sink_.reset();
    EXPECT_FALSE(exchange->response().write_chunk("x"));
    EXPECT_FALSE(exchange->response().end());
}

// =============================================================================
// respond / 100 Continue
// =============================================================================

TEST_F(ResponseWriterTest, RespondSetsLength) {
    auto exchange = make("GET");
    ASSERT_TRUE(exchange->response().respond(404, {{"Content-Type", "text/plain"}}, "missing\n"));

    EXPECT_EQ(sink_->output.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_TRUE(contains(sink_->output, "Content-Length: 8\r\n"));
    EXPECT_EQ(sink_->output.substr(sink_->output.size() - 12), "\r\n\r\nmissing\n");
    EXPECT_EQ(sink_->finished, 1);

    EXPECT_FALSE(exchange->response().respond(200, {}, "again"));
}

TEST_F(ResponseWriterTest, RespondToHeadKeepsLength) {
    auto exchange = make("HEAD");
    ASSERT_TRUE(exchange->response().respond(200, {}, "0.1.0\n"));

    EXPECT_TRUE(contains(sink_->output, "Content-Length: 6\r\n"));
    EXPECT_FALSE(contains(sink_->output, "0.1.0"));
}

TEST_F(ResponseWriterTest, ContinueSentOnce) {
    auto exchange = make_parsed(
        "POST /upload HTTP/1.1\r\n"
        "Content-Length: 3\r\n"
        "Expect: 100-continue\r\n"
        "\r\n");
    ResponseWriter& response = exchange->response();

    response.send_continue();
    response.send_continue();
    ASSERT_EQ(sink_->writes.size(), 1u);
    EXPECT_EQ(sink_->writes[0], "HTTP/1.1 100 Continue\r\n\r\n");

    // The final response still starts with its own status line
    response.end();
    EXPECT_EQ(sink_->writes[1].rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
}

TEST_F(ResponseWriterTest, NoContinueWithoutExpect) {
    auto exchange = make_parsed(
        "POST /upload HTTP/1.1\r\n"
        "Content-Length: 3\r\n"
        "\r\n");
    exchange->response().send_continue();
    EXPECT_TRUE(sink_->writes.empty());
}

// =============================================================================
// Exchange body flow
// =============================================================================

TEST_F(ResponseWriterTest, BodyStartsPaused) {
    auto exchange = make("POST");
    EXPECT_TRUE(exchange->body_paused());

    exchange->pause_body();
    EXPECT_TRUE(sink_->pause_calls.empty());

    exchange->resume_body();
    EXPECT_FALSE(exchange->body_paused());
    ASSERT_EQ(sink_->pause_calls.size(), 1u);
    EXPECT_FALSE(sink_->pause_calls[0]);

    exchange->resume_body();
    EXPECT_EQ(sink_->pause_calls.size(), 1u);

    exchange->pause_body();
    ASSERT_EQ(sink_->pause_calls.size(), 2u);
    EXPECT_TRUE(sink_->pause_calls[1]);
}

TEST_F(ResponseWriterTest, BodyChunksAndEnd) {
    auto exchange = make("POST");
    std::string received;
    int ends = 0;
    bool was_complete = false;

    exchange->on_body(
        [&](std::string_view chunk) { received.append(chunk); },
        [&](bool complete) { ++ends; was_complete = complete; });

    exchange->deliver_body("ab");
    exchange->deliver_body("");
    exchange->deliver_body("cd");
    exchange->deliver_end(true);
    exchange->deliver_end(false);
    exchange->deliver_body("late");

    EXPECT_EQ(received, "abcd");
    EXPECT_EQ(ends, 1);
    EXPECT_TRUE(was_complete);
}

TEST_F(ResponseWriterTest, CloseNotifiedOnce) {
    auto exchange = make("GET");
    int closes = 0;
    exchange->on_close([&]() { ++closes; });

    exchange->notify_closed();
    exchange->notify_closed();
    EXPECT_EQ(closes, 1);
    EXPECT_TRUE(exchange->is_closed());

    // Resuming a closed exchange does not reach the connection
    exchange->resume_body();
    EXPECT_TRUE(sink_->pause_calls.empty());
}

TEST_F(ResponseWriterTest, DetachDropsHandlers) {
    auto exchange = make("POST");
    int calls = 0;
    exchange->on_body([&](std::string_view) { ++calls; }, [&](bool) { ++calls; });
    exchange->on_close([&]() { ++calls; });

    exchange->detach();
    exchange->deliver_body("x");
    exchange->deliver_end(true);
    exchange->notify_closed();
    EXPECT_EQ(calls, 0);
}
