#pragma once

#include "request.h"
#include "../core/result.h"
#include <optional>
#include <string>
#include <string_view>

namespace piping {
namespace http {

/**
 * Streaming extractor for the first part of a multipart/form-data body.
 *
 * Bytes are fed as they arrive; the payload of the first part comes back
 * as soon as it is known not to be part of the closing delimiter. The
 * whole body is never buffered: at most one header block and a
 * delimiter-sized tail are kept.
 *
 * Usage:
 *   auto boundary = MultipartExtractor::boundary_from(content_type);
 *   MultipartExtractor extractor(*boundary);
 *   auto out = extractor.feed(chunk);
 *   if (extractor.headers_ready()) { ... extractor.part_headers() ... }
 */
class MultipartExtractor {
public:
    /**
     * Largest part header block accepted.
     */
    static constexpr size_t MAX_HEADER_BLOCK = 16 * 1024;

    explicit MultipartExtractor(std::string_view boundary);

    /**
     * Boundary parameter of a multipart/form-data Content-Type, or nullopt
     * if the type is not multipart/form-data or has no boundary.
     */
    static std::optional<std::string> boundary_from(std::string_view content_type);

    /**
     * Feed body bytes.
     *
     * @return First-part payload released by this call (may be empty),
     *         or error_code::parse_error on a malformed header block
     */
    core::result<std::string> feed(std::string_view data);

    /**
     * Signal the end of the body.
     *
     * @return error_code::parse_error if the first part never terminated
     */
    core::result<void> finish();

    bool headers_ready() const noexcept { return state_ == State::BODY || state_ == State::DONE; }
    bool part_complete() const noexcept { return state_ == State::DONE; }

    /**
     * Headers of the first part (valid once headers_ready()).
     */
    const HeaderList& part_headers() const noexcept { return headers_; }

    /**
     * First part header with the given name (case-insensitive), or nullptr.
     */
    const std::string* part_header(std::string_view name) const noexcept;

private:
    enum class State : uint8_t {
        PREAMBLE,   // Looking for the first delimiter
        HEADERS,    // Reading the part header block
        BODY,       // Streaming part payload
        DONE        // First part finished; the rest is discarded
    };

    bool parse_header_block(std::string_view block);

    std::string delimiter_;    // "\r\n--" + boundary
    State state_{State::PREAMBLE};
    std::string buffer_;
    HeaderList headers_;
};

} // namespace http
} // namespace piping
