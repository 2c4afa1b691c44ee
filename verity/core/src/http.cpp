#include "verity/core/http.hpp"

#include "verity/core/serde.hpp"

#include <cctype>
#include <charconv>

namespace verity::http {
namespace {

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view HEADER_SEPARATOR = ": ";
constexpr std::string_view HTTP_VERSION_PREFIX = "HTTP/1.1 ";

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

method parse_method(std::string_view str) {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    return method::unknown;
}

std::string_view method_to_string(method m) {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

void headers_map::set(std::string_view name, std::string_view value) {
    for (auto& [k, v] : entries_) {
        if (iequals(k, name)) {
            v = std::string(value);
            return;
        }
    }
    entries_.emplace_back(std::string(name), std::string(value));
}

std::optional<std::string_view> headers_map::get(std::string_view name) const noexcept {
    for (const auto& [k, v] : entries_) {
        if (iequals(k, name)) {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

std::string_view reason_phrase(int32_t status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 500: return "Internal Server Error";
        default: return "";
    }
}

bool is_json_content_type(std::string_view content_type) noexcept {
    auto semi = content_type.find(';');
    std::string_view mime = serde::trim_view(content_type.substr(0, semi));
    if (iequals(mime, "application/json")) {
        return true;
    }
    auto slash = mime.find('/');
    if (slash == std::string_view::npos || !iequals(mime.substr(0, slash), "application")) {
        return false;
    }
    return mime.size() > 5 && iequals(mime.substr(mime.size() - 5), "+json");
}

std::string response::serialize() const {
    size_t headers_size = 0;
    for (const auto& [name, value] : headers) {
        headers_size += name.size() + HEADER_SEPARATOR.size() + value.size() + CRLF.size();
    }

    std::string result;
    result.reserve(32 + reason.size() + headers_size + body.size());

    char status_buf[16];
    auto [ptr, ec] = std::to_chars(status_buf, status_buf + sizeof(status_buf), status);

    result.append(HTTP_VERSION_PREFIX);
    result.append(status_buf, static_cast<size_t>(ptr - status_buf));
    result.push_back(' ');
    result.append(reason);
    result.append(CRLF);

    for (const auto& [name, value] : headers) {
        result.append(name);
        result.append(HEADER_SEPARATOR);
        result.append(value);
        result.append(CRLF);
    }

    result.append(CRLF);
    result.append(body);
    return result;
}

response response::ok(std::string body, std::string content_type) {
    response res;
    res.status = 200;
    res.reason = "OK";
    res.body = std::move(body);
    res.set_header("Content-Length", std::to_string(res.body.size()));
    res.set_header("Content-Type", content_type);
    return res;
}

response response::json(std::string body, int32_t status) {
    response res = ok(std::move(body), "application/json");
    res.status = status;
    res.reason = std::string(reason_phrase(status));
    return res;
}

} // namespace verity::http
