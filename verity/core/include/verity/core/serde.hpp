#pragma once

#include "json_value.hpp"

#include <cctype>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace verity::serde {

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

// Why decoding stopped. The reason is a parser diagnostic and is logged, not
// returned to remote callers.
struct decode_error {
    size_t offset = 0; // byte offset for JSON, parser line for YAML (0 when unknown)
    std::string reason;
};

struct json_cursor {
    const char* ptr;
    const char* end;
    const char* start;

    json_cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    bool eof() const noexcept { return ptr >= end; }

    size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    void skip_ws() noexcept {
        while (!eof() && (*ptr == ' ' || *ptr == '\t' || *ptr == '\n' || *ptr == '\r')) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        if (static_cast<size_t>(end - ptr) < lit.size() ||
            std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

struct decode_limits {
    size_t max_depth = 128;
};

// Strict RFC 8259 decoding of a complete document.
[[nodiscard]] std::expected<json_value, decode_error> decode_json(std::string_view text,
                                                                  decode_limits limits = {});

// Single YAML document read with rapidyaml. Plain scalars are typed as null,
// booleans, integers or floats when they look like one; quoted and block
// scalars stay strings. Aliases, tags and duplicate keys are rejected.
[[nodiscard]] std::expected<json_value, decode_error> decode_yaml(std::string_view text,
                                                                  decode_limits limits = {});

} // namespace verity::serde
