#pragma once

#include <rivet/http/http_common.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace rivet::http {

/// HTTP parser state
enum class parse_state {
    start_line,
    headers,
    body,
    body_until_close,
    chunk_size,
    chunk_data,
    chunk_trailer,
    complete,
    error
};

/// HTTP parser result
enum class parse_result {
    need_more,      ///< Need more data
    complete,       ///< Parsing complete
    error           ///< Parse error
};

/// Incremental HTTP/1.x message parser. The start line is handled by
/// the derived class; headers and the three body framings (Content-Length,
/// chunked, read until the peer closes) are handled here.
template<typename Derived>
class message_parser {
public:
    /// Reject bodies larger than this (0 = unlimited)
    void set_max_body_size(size_t limit) noexcept { max_body_size_ = limit; }

    /// Feed received bytes
    /// @return Parse result and number of bytes consumed
    std::pair<parse_result, size_t> parse(std::string_view data) {
        size_t consumed = 0;
        buffer_ += data;

        while (!buffer_.empty() && state_ != parse_state::complete && state_ != parse_state::error) {
            size_t before = buffer_.size();
            bool progressed = false;

            switch (state_) {
                case parse_state::start_line:
                    progressed = with_line([this](std::string_view line) {
                        return static_cast<Derived*>(this)->parse_start_line(line);
                    });
                    if (progressed && state_ != parse_state::error) state_ = parse_state::headers;
                    break;
                case parse_state::headers:
                    progressed = parse_headers();
                    break;
                case parse_state::body:
                    progressed = parse_body();
                    break;
                case parse_state::body_until_close:
                    append_body(buffer_);
                    buffer_.clear();
                    break;
                case parse_state::chunk_size:
                    progressed = parse_chunk_size();
                    break;
                case parse_state::chunk_data:
                    progressed = parse_chunk_data();
                    break;
                case parse_state::chunk_trailer:
                    progressed = parse_chunk_trailer();
                    break;
                default:
                    break;
            }

            consumed += before - buffer_.size();
            if (state_ == parse_state::error) return {parse_result::error, consumed};
            if (!progressed) break;
        }

        if (state_ == parse_state::complete) return {parse_result::complete, consumed};
        if (state_ == parse_state::error) return {parse_result::error, consumed};
        return {parse_result::need_more, consumed};
    }

    /// The peer closed the connection. Completes a read-until-close body;
    /// anything else still in progress is an error.
    parse_result finish() {
        if (state_ == parse_state::body_until_close) {
            state_ = parse_state::complete;
        } else if (state_ != parse_state::complete) {
            set_error("Connection closed before message was complete");
        }
        return state_ == parse_state::complete ? parse_result::complete : parse_result::error;
    }

    std::string_view version() const noexcept { return version_; }

    const headers& get_headers() const noexcept { return headers_; }

    std::string_view body() const noexcept { return body_; }
    std::string take_body() { return std::move(body_); }

    std::string_view error_message() const noexcept { return error_message_; }

    bool is_complete() const noexcept { return state_ == parse_state::complete; }
    bool has_error() const noexcept { return state_ == parse_state::error; }

protected:
    void set_error(std::string_view msg) {
        state_ = parse_state::error;
        error_message_ = msg;
    }

    /// Body framing when neither Content-Length nor chunked is given
    parse_state unframed_body_state() const {
        return static_cast<const Derived*>(this)->reads_until_close()
            ? parse_state::body_until_close
            : parse_state::complete;
    }

    std::string version_;

private:
    /// Run fn on the next CRLF-terminated line and consume it.
    /// Returns false if no complete line is buffered yet.
    template<typename Fn>
    bool with_line(Fn&& fn) {
        auto line_end = buffer_.find("\r\n");
        if (line_end == std::string::npos) return false;
        bool ok = fn(std::string_view(buffer_.data(), line_end));
        buffer_.erase(0, line_end + 2);
        return ok || state_ == parse_state::error;
    }

    bool parse_headers() {
        for (;;) {
            auto line_end = buffer_.find("\r\n");
            if (line_end == std::string::npos) return false;

            if (line_end == 0) {
                buffer_.erase(0, 2);
                if (headers_.is_chunked()) {
                    state_ = parse_state::chunk_size;
                } else if (headers_.contains("Content-Length")) {
                    auto len = headers_.content_length();
                    if (!len) {
                        set_error("Invalid Content-Length");
                        return false;
                    }
                    if (max_body_size_ != 0 && *len > max_body_size_) {
                        set_error("Body exceeds size limit");
                        return false;
                    }
                    content_length_ = *len;
                    state_ = content_length_ > 0 ? parse_state::body : parse_state::complete;
                } else {
                    state_ = unframed_body_state();
                }
                return true;
            }

            std::string_view line(buffer_.data(), line_end);
            auto colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                set_error("Invalid header line");
                return false;
            }

            auto name = line.substr(0, colon);
            auto val = line.substr(colon + 1);
            while (!val.empty() && (val.front() == ' ' || val.front() == '\t')) val.remove_prefix(1);
            while (!val.empty() && (val.back() == ' ' || val.back() == '\t')) val.remove_suffix(1);

            headers_.add(name, val);
            buffer_.erase(0, line_end + 2);
        }
    }

    bool append_body(std::string_view data) {
        if (max_body_size_ != 0 && body_.size() + data.size() > max_body_size_) {
            set_error("Body exceeds size limit");
            return false;
        }
        body_.append(data);
        return true;
    }

    bool parse_body() {
        size_t available = std::min(content_length_ - body_.size(), buffer_.size());
        body_.append(buffer_.data(), available);
        buffer_.erase(0, available);

        if (body_.size() >= content_length_) {
            state_ = parse_state::complete;
            return true;
        }
        return false;
    }

    bool parse_chunk_size() {
        auto line_end = buffer_.find("\r\n");
        if (line_end == std::string::npos) return false;

        std::string_view line(buffer_.data(), line_end);
        line = line.substr(0, line.find(';'));  // chunk extensions are ignored
        while (!line.empty() && line.back() == ' ') line.remove_suffix(1);

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
        if (ec != std::errc{} || ptr != line.data() + line.size()) {
            set_error("Invalid chunk size");
            return false;
        }
        if (max_body_size_ != 0 && body_.size() + size > max_body_size_) {
            set_error("Body exceeds size limit");
            return false;
        }

        chunk_size_ = size;
        buffer_.erase(0, line_end + 2);
        state_ = chunk_size_ == 0 ? parse_state::chunk_trailer : parse_state::chunk_data;
        return true;
    }

    bool parse_chunk_data() {
        if (buffer_.size() < chunk_size_ + 2) return false;  // data + CRLF

        body_.append(buffer_.data(), chunk_size_);
        buffer_.erase(0, chunk_size_ + 2);
        state_ = parse_state::chunk_size;
        return true;
    }

    bool parse_chunk_trailer() {
        auto line_end = buffer_.find("\r\n");
        if (line_end == std::string::npos) return false;

        buffer_.erase(0, line_end + 2);
        if (line_end == 0) state_ = parse_state::complete;
        return true;
    }

    parse_state state_ = parse_state::start_line;
    headers headers_;
    std::string body_;
    std::string buffer_;
    size_t content_length_ = 0;
    size_t chunk_size_ = 0;
    size_t max_body_size_ = 0;
    std::string error_message_;
};

/// HTTP request parser
class request_parser : public message_parser<request_parser> {
public:
    method get_method() const noexcept { return method_; }
    std::string_view method_name() const noexcept { return method_name_; }
    std::string_view path() const noexcept { return path_; }
    std::string_view query() const noexcept { return query_; }

private:
    friend class message_parser<request_parser>;

    /// Requests without framing have no body
    bool reads_until_close() const noexcept { return false; }

    bool parse_start_line(std::string_view line) {
        auto space1 = line.find(' ');
        auto space2 = space1 == std::string_view::npos ? space1 : line.find(' ', space1 + 1);
        if (space2 == std::string_view::npos) {
            set_error("Invalid request line");
            return false;
        }

        method_name_ = std::string(line.substr(0, space1));
        method_ = string_to_method(method_name_);

        auto target = line.substr(space1 + 1, space2 - space1 - 1);
        auto query_pos = target.find('?');
        path_ = std::string(target.substr(0, query_pos));
        if (query_pos != std::string_view::npos) query_ = std::string(target.substr(query_pos + 1));

        version_ = std::string(line.substr(space2 + 1));
        if (!version_.starts_with("HTTP/1.")) {
            set_error("Unsupported HTTP version");
            return false;
        }
        return true;
    }

    method method_ = method::GET;
    std::string method_name_;
    std::string path_;
    std::string query_;
};

/// HTTP response parser
class response_parser : public message_parser<response_parser> {
public:
    /// Status code as received
    uint16_t status_code() const noexcept { return status_code_; }
    std::string_view reason() const noexcept { return reason_; }

    /// The request was HEAD, so the response carries no body
    void expect_no_body() noexcept { no_body_ = true; }

private:
    friend class message_parser<response_parser>;

    bool reads_until_close() const noexcept {
        return !no_body_ && status_code_ >= 200 && status_code_ != 204 && status_code_ != 304;
    }

    bool parse_start_line(std::string_view line) {
        auto space1 = line.find(' ');
        if (space1 == std::string_view::npos) {
            set_error("Invalid status line");
            return false;
        }
        version_ = std::string(line.substr(0, space1));
        if (!version_.starts_with("HTTP/")) {
            set_error("Invalid HTTP version");
            return false;
        }

        auto rest = line.substr(space1 + 1);
        auto space2 = rest.find(' ');
        auto code_str = rest.substr(0, space2);
        if (space2 != std::string_view::npos) reason_ = std::string(rest.substr(space2 + 1));

        auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(),
                                         status_code_);
        if (ec != std::errc{} || ptr != code_str.data() + code_str.size() ||
            status_code_ < 100 || status_code_ > 999) {
            set_error("Invalid status code");
            return false;
        }
        return true;
    }

    uint16_t status_code_ = 0;
    std::string reason_;
    bool no_body_ = false;
};

} // namespace rivet::http
