#pragma once

#include "fetchd/core/result.hpp"
#include "fetchd/network/http_types.hpp"

#include <cctype>
#include <string>

namespace fetchd {
namespace network {

/**
 * @brief States of the request parser
 *
 * METHOD SP URL SP VERSION CRLF
 * Header-Name: Header-Value CRLF
 * CRLF
 * [Body]
 */
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
 * Feed it data chunk by chunk as it arrives from the socket; parse() returns
 * true once a full request (headers plus Content-Length bytes of body) has
 * been seen.
 */
class HttpParser {
public:
    static constexpr size_t kMaxBodySize = 1024 * 1024;

    HttpParser() { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];
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
                case ParseState::BODY: parse_body(c); break;
                case ParseState::COMPLETE: return Ok(true);
                case ParseState::PARSE_ERROR: return Err<bool>(Error::input("Parser in error state"));
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(Error::input(error_ + " at line " + std::to_string(line_)));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    bool body_too_large() const {
        return body_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_body_ = 0;
        body_too_large_ = false;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t expected_body_;
    bool body_too_large_;
    size_t line_;
    bool last_char_was_cr_;

    bool fail(const char* message) {
        error_ = message;
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return fail("Unknown HTTP method");
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return fail("Failed to parse HTTP method");
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return fail("Empty URL");
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return fail("Failed to parse URL");
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
                return fail("Unsupported HTTP version");
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
            // Blank line: headers are done
            last_char_was_cr_ = false;
            return begin_body();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Failed to parse header name");
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
            request_.headers[current_header_name_] = buffer_;
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

    bool begin_body() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        if (content_length.find_first_not_of("0123456789") != std::string::npos || content_length.size() > 18) {
            return fail("Invalid Content-Length");
        }
        expected_body_ = std::stoull(content_length);
        if (expected_body_ > kMaxBodySize) {
            body_too_large_ = true;
            return fail("Request body too large");
        }
        if (expected_body_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(expected_body_);
        state_ = ParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        request_.body.push_back(static_cast<uint8_t>(c));
        if (request_.body.size() >= expected_body_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

} // namespace network
} // namespace fetchd
