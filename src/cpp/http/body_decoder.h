#pragma once

#include "../core/result.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace piping {
namespace http {

/**
 * Incremental request-body de-framer.
 *
 * Handles the three HTTP/1.1 request body framings:
 * - no body
 * - Content-Length
 * - Transfer-Encoding: chunked (chunk extensions and trailers are skipped)
 *
 * decode() is fed raw connection bytes and returns how many it consumed and
 * the payload view found in them. Payload views point into the input, so
 * nothing is copied. Bytes after the end of the body are left unconsumed
 * (they belong to the next pipelined request).
 */
class BodyDecoder {
public:
    enum class Mode : uint8_t {
        NONE,
        LENGTH,
        CHUNKED
    };

    struct Step {
        size_t consumed = 0;
        std::string_view payload;
    };

    /**
     * Longest chunk-size line (with extensions) or trailer line accepted.
     */
    static constexpr size_t MAX_LINE = 4096;

    BodyDecoder() = default;

    static BodyDecoder none() { return BodyDecoder(Mode::NONE, 0); }
    static BodyDecoder length(uint64_t n) { return BodyDecoder(Mode::LENGTH, n); }
    static BodyDecoder chunked() { return BodyDecoder(Mode::CHUNKED, 0); }

    /**
     * Consume framing from data.
     *
     * One call yields at most one contiguous payload span; call again with
     * the remaining input while consumed > 0 and !done().
     *
     * @return Step, or error_code::parse_error on malformed chunk framing
     */
    core::result<Step> decode(std::string_view data);

    bool done() const noexcept { return state_ == State::DONE; }
    Mode mode() const noexcept { return mode_; }

    /**
     * Payload bytes produced so far.
     */
    uint64_t total() const noexcept { return total_; }

private:
    enum class State : uint8_t {
        SIZE_LINE,     // Reading "<hex>[;ext]\r\n"
        DATA,          // Inside chunk payload / length body
        DATA_CRLF,     // CRLF after chunk payload
        TRAILER,       // Trailer lines until empty line
        DONE
    };

    BodyDecoder(Mode mode, uint64_t length);

    core::result<Step> decode_chunked(std::string_view data);
    bool parse_size_line(std::string_view line);

    Mode mode_{Mode::NONE};
    State state_{State::DONE};
    uint64_t remaining_{0};
    uint64_t total_{0};
    std::string line_;    // Partial framing line carried across calls
};

} // namespace http
} // namespace piping
