#pragma once

#include <rivet/http/http_common.hpp>
#include <rivet/http/http_parser.hpp>

#include <map>
#include <string>
#include <string_view>

namespace rivet::http {

/// HTTP request
class request {
public:
    request() = default;

    request(method m, std::string_view target)
        : method_(m) {
        set_target(target);
    }

    method get_method() const noexcept { return method_; }
    void set_method(method m) noexcept { method_ = m; }

    std::string_view path() const noexcept { return path_; }
    std::string_view query() const noexcept { return query_; }

    /// Set path and query from "/path?query"
    void set_target(std::string_view target) {
        auto q = target.find('?');
        path_ = std::string(target.substr(0, q));
        query_ = q == std::string_view::npos ? std::string() : std::string(target.substr(q + 1));
        if (path_.empty()) path_ = "/";
    }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    void set_header(std::string_view name, std::string_view val) {
        headers_.set(name, val);
    }

    std::string_view header(std::string_view name) const {
        return headers_.get(name);
    }

    std::string_view body() const noexcept { return body_; }

    /// Set the body and its Content-Type and Content-Length
    void set_body(std::string body, std::string_view content_type) {
        body_ = std::move(body);
        headers_.set_content_type(content_type);
        headers_.set_content_length(body_.size());
    }

    std::map<std::string, std::string> query_params() const {
        return parse_query_string(query_);
    }

    /// Serialize as HTTP/1.1
    std::string serialize() const {
        std::string result;
        result.reserve(body_.size() + 256);
        result += method_to_string(method_);
        result += ' ';
        result += path_;
        if (!query_.empty()) {
            result += '?';
            result += query_;
        }
        result += " HTTP/1.1\r\n";
        result += headers_.serialize();
        result += "\r\n";
        result += body_;
        return result;
    }

    static request from_parser(request_parser& parser) {
        request req;
        req.method_ = parser.get_method();
        req.path_ = std::string(parser.path());
        req.query_ = std::string(parser.query());
        req.headers_ = parser.get_headers();
        req.body_ = parser.take_body();
        return req;
    }

private:
    method method_ = method::GET;
    std::string path_ = "/";
    std::string query_;
    headers headers_;
    std::string body_;
};

/// HTTP response
class response {
public:
    response() = default;

    explicit response(status s) : status_(s) {
        headers_.set_content_length(0);
    }

    response(status s, std::string body, std::string_view content_type)
        : status_(s), body_(std::move(body)) {
        headers_.set_content_type(content_type);
        headers_.set_content_length(body_.size());
    }

    status get_status() const noexcept { return status_; }
    uint16_t status_code() const noexcept { return static_cast<uint16_t>(status_); }

    const headers& get_headers() const noexcept { return headers_; }
    headers& get_headers() noexcept { return headers_; }

    void set_header(std::string_view name, std::string_view val) {
        headers_.set(name, val);
    }

    std::string_view body() const noexcept { return body_; }

    /// Serialize as HTTP/1.1
    std::string serialize() const {
        std::string result;
        result.reserve(body_.size() + 256);
        result += "HTTP/1.1 ";
        result += std::to_string(status_code());
        result += ' ';
        result += status_reason(status_);
        result += "\r\n";
        result += headers_.serialize();
        result += "\r\n";
        result += body_;
        return result;
    }

    static response ok(std::string body, std::string_view content_type) {
        return response(status::ok, std::move(body), content_type);
    }

    /// Plain-text error page
    static response error(status s) {
        return response(s, std::string(status_reason(s)), mime::text_plain);
    }

private:
    status status_ = status::ok;
    headers headers_;
    std::string body_;
};

} // namespace rivet::http
