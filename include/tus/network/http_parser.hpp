#pragma once

#include "tus/core/result.hpp"
#include "tus/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <string>

namespace tus {
namespace network {

enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data may be fed in arbitrary pieces as it arrives from the socket;
 * parse() returns true once a full request (headers plus Content-Length
 * bytes of body) has been consumed. Bytes beyond the end of the request
 * are left unconsumed and reported through consumed().
 *
 * Request lines and headers are processed one character at a time. The
 * body is copied in bulk, since PATCH bodies are upload chunks of
 * potentially many megabytes.
 *
 * Usage:
 * ```cpp
 * HttpParser parser(max_body);
 * auto result = parser.parse(buf, n);
 * if (result.is_error()) { ... 400 ... }
 * if (result.value()) { HttpRequest req = parser.get_request(); }
 * ```
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpParser(std::size_t max_body_size = 64 * 1024 * 1024)
        : max_body_size_(max_body_size) {
        reset();
    }

    Result<bool> parse(const char* data, std::size_t len) {
        consumed_ = 0;

        while (consumed_ < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const std::size_t wanted = content_length_ - request_.body.size();
                const std::size_t take = std::min(wanted, len - consumed_);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + consumed_),
                                     reinterpret_cast<const uint8_t*>(data + consumed_ + take));
                consumed_ += take;
                if (request_.body.size() == content_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[consumed_++];
            if (++header_bytes_ > kMaxHeaderBytes) {
                return fail("Request head exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (!ok) {
                return fail(error_.empty() ? "Malformed request at line " + std::to_string(line_) : error_);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    HttpRequest get_request() const {
        return request_;
    }

    /**
     * @brief Moves the parsed request out; the parser must be reset before reuse
     */
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /**
     * @brief Bytes of the last parse() input that belonged to this request
     */
    std::size_t consumed() const {
        return consumed_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        content_length_ = 0;
        header_bytes_ = 0;
        consumed_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    std::size_t max_body_size_;
    std::size_t content_length_;
    std::size_t header_bytes_;
    std::size_t consumed_;
    std::size_t line_;
    bool last_char_was_cr_;

    Result<bool> fail(std::string message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool, std::string>(std::move(message));
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_ = "Unsupported HTTP method '" + buffer_ + "'";
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                error_ = "Unsupported HTTP version '" + buffer_ + "'";
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = std::move(buffer_);
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = std::move(buffer_);
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            error_ = "Transfer-Encoding is not supported";
            return false;
        }

        const std::string length = request_.get_header("Content-Length");
        if (!length.empty()) {
            const char* first = length.data();
            const char* last = length.data() + length.size();
            auto [ptr, ec] = std::from_chars(first, last, content_length_);
            if (ec != std::errc() || ptr != last) {
                error_ = "Invalid Content-Length '" + length + "'";
                return false;
            }
            if (content_length_ > max_body_size_) {
                error_ = "Body of " + length + " bytes exceeds limit of " + std::to_string(max_body_size_);
                return false;
            }
        }

        if (content_length_ > 0) {
            request_.body.reserve(content_length_);
            state_ = ParseState::BODY;
        } else {
            state_ = ParseState::COMPLETE;
        }
        return true;
    }
};

} // namespace network
} // namespace tus
