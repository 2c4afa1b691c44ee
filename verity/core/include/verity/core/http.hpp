#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace verity::http {

enum class method : uint8_t { get, post, put, del, patch, head, options, unknown };

method parse_method(std::string_view str);
std::string_view method_to_string(method m);

// Ordered header list with case-insensitive lookup.
class headers_map {
public:
    void set(std::string_view name, std::string_view value);
    void add(std::string name, std::string value) { entries_.emplace_back(std::move(name), std::move(value)); }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

    auto begin() const noexcept { return entries_.begin(); }
    auto end() const noexcept { return entries_.end(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

struct request {
    method http_method = method::unknown;
    std::string uri;
    headers_map headers;
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        return headers.get(name);
    }
};

struct response {
    int32_t status = 200;
    std::string reason;
    headers_map headers;
    std::string body;

    void set_header(std::string_view name, std::string_view value) { headers.set(name, value); }

    [[nodiscard]] std::string serialize() const;

    static response ok(std::string body = "", std::string content_type = "text/plain");
    static response json(std::string body, int32_t status = 200);
};

[[nodiscard]] std::string_view reason_phrase(int32_t status) noexcept;

// "application/json" or any "+json" media type, parameters ignored.
[[nodiscard]] bool is_json_content_type(std::string_view content_type) noexcept;

} // namespace verity::http
