#pragma once

#include "chunkflow/core/result.hpp"
#include "chunkflow/net/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace chunkflow {
namespace net {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP-Version SP Status-Code SP Reason-Phrase CRLF
 * *(Header-Name: Header-Value CRLF)
 * CRLF
 * [ body: Content-Length bytes | chunked | until close ]
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,              // Content-Length delimited
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after a chunk
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,  // Neither length nor chunked: read until EOF
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive; parse() returns true once a final (non-1xx)
 * response is complete. Interim 1xx responses are skipped. Only the first
 * max_body_bytes of the body are kept: upload replies are short status
 * documents and the rest is discarded.
 *
 * ```cpp
 * HttpResponseParser parser(HttpMethod::PUT);
 * while (!done) {
 *     auto n = read_some(buffer);
 *     if (n == 0) { done = parser.finish().value(); break; }
 *     done = parser.parse(buffer, n).value();
 * }
 * ```
 */
class HttpResponseParser {
public:
    static constexpr std::size_t kDefaultMaxBody = 64 * 1024;

    explicit HttpResponseParser(HttpMethod request_method = HttpMethod::GET,
                                std::size_t max_body_bytes = kDefaultMaxBody)
        : request_method_(request_method), max_body_bytes_(max_body_bytes) {
        reset();
    }

    Result<bool> parse(const char* data, std::size_t len) {
        for (std::size_t i = 0; i < len; ++i) {
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }

            // Bulk-consume body bytes instead of going char by char.
            if (state_ == ResponseParseState::BODY || state_ == ResponseParseState::CHUNK_DATA) {
                const std::size_t take = std::min<std::size_t>(len - i, remaining_);
                keep_body(data + i, take);
                remaining_ -= take;
                i += take - 1;
                if (remaining_ == 0) {
                    state_ = state_ == ResponseParseState::BODY
                        ? ResponseParseState::COMPLETE
                        : ResponseParseState::CHUNK_DATA_END;
                }
                continue;
            }
            if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
                keep_body(data + i, len - i);
                return Ok(false);
            }

            if (!step(data[i])) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool, std::string>("Malformed HTTP response (" + error_ + ") at line " +
                                              std::to_string(line_));
            }
        }
        return Ok(state_ == ResponseParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a read-until-close body; anything else still pending is
     * a truncated response.
     */
    Result<bool> finish() {
        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
            return Ok(true);
        }
        return Err<bool, std::string>(std::string("Connection closed before the response was complete"));
    }

    const HttpResponse& response() const { return response_; }
    HttpResponse take_response() { return std::move(response_); }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }
    ResponseParseState state() const { return state_; }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        remaining_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    HttpMethod request_method_;
    std::size_t max_body_bytes_;

    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    std::size_t remaining_;
    std::size_t line_;
    bool last_char_was_cr_;

    bool fail(const char* reason) {
        error_ = reason;
        return false;
    }

    void keep_body(const char* data, std::size_t len) {
        if (response_.body.size() >= max_body_bytes_) {
            return;
        }
        const std::size_t room = max_body_bytes_ - response_.body.size();
        response_.body.append(data, std::min(room, len));
    }

    // Returns true when c completed a CRLF; a bare LF is tolerated.
    bool end_of_line(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        const bool eol = c == '\n';
        last_char_was_cr_ = false;
        if (eol) {
            ++line_;
        }
        return eol;
    }

    bool step(char c) {
        switch (state_) {
            case ResponseParseState::VERSION: return parse_version(c);
            case ResponseParseState::STATUS_CODE: return parse_status_code(c);
            case ResponseParseState::REASON: return parse_reason(c);
            case ResponseParseState::HEADER_NAME: return parse_header_name(c);
            case ResponseParseState::HEADER_VALUE: return parse_header_value(c);
            case ResponseParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ResponseParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
            case ResponseParseState::CHUNK_TRAILER: return parse_chunk_trailer(c);
            case ResponseParseState::PARSE_ERROR: return fail("parser in error state");
            default: return true;
        }
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return fail("unknown HTTP version");
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8 || !std::isprint(static_cast<unsigned char>(c))) {
            return fail("bad status line");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r' || c == '\n') {
            if (buffer_.size() != 3) {
                return fail("bad status code");
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            if (c == ' ') {
                state_ = ResponseParseState::REASON;
                return true;
            }
            state_ = ResponseParseState::REASON;
            return parse_reason(c);
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("bad status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (end_of_line(c)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r' || c == '\n') {
            if (!buffer_.empty()) {
                return fail("header without colon");
            }
            if (end_of_line(c)) {
                return headers_complete();
            }
            return true;
        }

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }

        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') {
            return fail("invalid header name character");
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (end_of_line(c)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool headers_complete() {
        const int status = response_.status_code;

        // Interim response (100 Continue): the real one follows.
        if (status >= 100 && status < 200) {
            response_ = HttpResponse();
            state_ = ResponseParseState::VERSION;
            return true;
        }

        if (request_method_ == HttpMethod::HEAD || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        std::string encoding = response_.get_header("Transfer-Encoding");
        for (auto& ch : encoding) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        if (response_.has_header("Content-Length")) {
            const std::string length = response_.get_header("Content-Length");
            if (length.empty() || length.find_first_not_of("0123456789") != std::string::npos) {
                return fail("invalid Content-Length");
            }
            remaining_ = static_cast<std::size_t>(std::stoull(length));
            state_ = remaining_ == 0 ? ResponseParseState::COMPLETE : ResponseParseState::BODY;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    bool parse_chunk_size(char c) {
        if (end_of_line(c)) {
            const auto ext = buffer_.find(';');
            const std::string digits = buffer_.substr(0, ext);
            if (digits.empty() || digits.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
                return fail("invalid chunk size");
            }
            remaining_ = static_cast<std::size_t>(std::stoull(digits, nullptr, 16));
            buffer_.clear();
            state_ = remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER : ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (c != '\r') {
            if (buffer_.size() > 64) {
                return fail("chunk size line too long");
            }
            buffer_ += c;
        }
        return true;
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (end_of_line(c)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return fail("missing CRLF after chunk");
    }

    bool parse_chunk_trailer(char c) {
        if (end_of_line(c)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }
};

} // namespace net
} // namespace chunkflow
