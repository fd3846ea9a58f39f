#include "body_decoder.h"
#include <algorithm>

namespace piping {
namespace http {

using core::error_code;

BodyDecoder::BodyDecoder(Mode mode, uint64_t length)
    : mode_(mode)
{
    switch (mode) {
        case Mode::NONE:
            state_ = State::DONE;
            break;
        case Mode::LENGTH:
            remaining_ = length;
            state_ = length == 0 ? State::DONE : State::DATA;
            break;
        case Mode::CHUNKED:
            state_ = State::SIZE_LINE;
            break;
    }
}

core::result<BodyDecoder::Step> BodyDecoder::decode(std::string_view data) {
    if (state_ == State::DONE) {
        return Step{};
    }

    if (mode_ == Mode::LENGTH) {
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, data.size()));
        remaining_ -= take;
        total_ += take;
        if (remaining_ == 0) {
            state_ = State::DONE;
        }
        return Step{take, data.substr(0, take)};
    }

    return decode_chunked(data);
}

core::result<BodyDecoder::Step> BodyDecoder::decode_chunked(std::string_view data) {
    size_t pos = 0;

    while (pos < data.size() && state_ != State::DONE) {
        switch (state_) {
            case State::DATA: {
                size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, data.size() - pos));
                remaining_ -= take;
                total_ += take;
                if (remaining_ == 0) {
                    state_ = State::DATA_CRLF;
                }
                return Step{pos + take, data.substr(pos, take)};
            }

            case State::DATA_CRLF:
            case State::SIZE_LINE:
            case State::TRAILER: {
                size_t nl = data.find('\n', pos);
                size_t end = nl == std::string_view::npos ? data.size() : nl + 1;
                line_.append(data.data() + pos, end - pos);
                pos = end;

                if (line_.size() > MAX_LINE) {
                    return core::err<Step>(error_code::parse_error);
                }
                if (nl == std::string_view::npos) {
                    break;  // Line continues in the next read
                }

                // Strip the line terminator; a bare LF is tolerated.
                std::string_view line(line_);
                line.remove_suffix(1);
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1);
                }

                if (state_ == State::DATA_CRLF) {
                    if (!line.empty()) {
                        return core::err<Step>(error_code::parse_error);
                    }
                    state_ = State::SIZE_LINE;
                } else if (state_ == State::SIZE_LINE) {
                    if (!parse_size_line(line)) {
                        return core::err<Step>(error_code::parse_error);
                    }
                    state_ = remaining_ == 0 ? State::TRAILER : State::DATA;
                } else if (line.empty()) {
                    state_ = State::DONE;
                }
                line_.clear();
                break;
            }

            case State::DONE:
                break;
        }
    }

    return Step{pos, {}};
}

bool BodyDecoder::parse_size_line(std::string_view line) {
    size_t ext = line.find(';');
    std::string_view size = line.substr(0, ext);
    while (!size.empty() && (size.back() == ' ' || size.back() == '\t')) {
        size.remove_suffix(1);
    }
    if (size.empty() || size.size() > 16) {
        return false;
    }

    uint64_t value = 0;
    for (char c : size) {
        int digit;
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
        else return false;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    remaining_ = value;
    return true;
}

} // namespace http
} // namespace piping
