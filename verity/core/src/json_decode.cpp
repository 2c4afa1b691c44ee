#include "verity/core/serde.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <utility>

namespace verity::serde {
namespace {

class json_decoder {
public:
    json_decoder(std::string_view text, decode_limits limits)
        : cur_(text.data(), text.data() + text.size()), limits_(limits) {}

    std::expected<json_value, decode_error> run() {
        json_value root;
        if (!parse_value(root, 0)) {
            return std::unexpected(std::move(error_));
        }
        cur_.skip_ws();
        if (!cur_.eof()) {
            return std::unexpected(decode_error{cur_.pos(), "trailing characters after document"});
        }
        return root;
    }

private:
    bool fail(std::string reason) {
        if (error_.reason.empty()) {
            error_ = decode_error{cur_.pos(), std::move(reason)};
        }
        return false;
    }

    bool parse_value(json_value& out, size_t depth) {
        if (depth > limits_.max_depth) {
            return fail("nesting depth limit exceeded");
        }
        cur_.skip_ws();
        if (cur_.eof()) {
            return fail("unexpected end of input");
        }
        switch (*cur_.ptr) {
        case '{':
            return parse_object(out, depth);
        case '[':
            return parse_array(out, depth);
        case '\"': {
            std::string s;
            if (!parse_string(s)) {
                return false;
            }
            out = json_value(std::move(s));
            return true;
        }
        case 't':
            if (cur_.consume_literal("true")) {
                out = json_value(true);
                return true;
            }
            return fail("invalid literal");
        case 'f':
            if (cur_.consume_literal("false")) {
                out = json_value(false);
                return true;
            }
            return fail("invalid literal");
        case 'n':
            if (cur_.consume_literal("null")) {
                out = json_value(nullptr);
                return true;
            }
            return fail("invalid literal");
        default:
            return parse_number(out);
        }
    }

    bool parse_object(json_value& out, size_t depth) {
        ++cur_.ptr; // '{'
        json_value::object_t members;
        if (cur_.try_object_end()) {
            out = json_value(std::move(members));
            return true;
        }
        while (true) {
            cur_.skip_ws();
            std::string key;
            if (cur_.eof() || *cur_.ptr != '\"') {
                return fail("expected object key");
            }
            if (!parse_string(key)) {
                return false;
            }
            if (!cur_.consume(':')) {
                return fail("expected ':' after object key");
            }
            json_value value;
            if (!parse_value(value, depth + 1)) {
                return false;
            }
            // Last duplicate wins, matching common JSON decoders.
            bool replaced = false;
            for (auto& [k, v] : members) {
                if (k == key) {
                    v = std::move(value);
                    replaced = true;
                    break;
                }
            }
            if (!replaced) {
                members.emplace_back(std::move(key), std::move(value));
            }
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_object_end()) {
                break;
            }
            return fail("expected ',' or '}' in object");
        }
        out = json_value(std::move(members));
        return true;
    }

    bool parse_array(json_value& out, size_t depth) {
        ++cur_.ptr; // '['
        json_value::array_t items;
        if (cur_.try_array_end()) {
            out = json_value(std::move(items));
            return true;
        }
        while (true) {
            json_value item;
            if (!parse_value(item, depth + 1)) {
                return false;
            }
            items.push_back(std::move(item));
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_array_end()) {
                break;
            }
            return fail("expected ',' or ']' in array");
        }
        out = json_value(std::move(items));
        return true;
    }

    static void append_utf8(uint32_t cp, std::string& out) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool parse_hex4(uint32_t& out) {
        if (cur_.end - cur_.ptr < 4) {
            return fail("truncated unicode escape");
        }
        uint32_t value = 0;
        auto [p, ec] = std::from_chars(cur_.ptr, cur_.ptr + 4, value, 16);
        if (ec != std::errc() || p != cur_.ptr + 4) {
            return fail("invalid unicode escape");
        }
        cur_.ptr += 4;
        out = value;
        return true;
    }

    bool parse_string(std::string& out) {
        ++cur_.ptr; // opening quote
        while (true) {
            if (cur_.eof()) {
                return fail("unterminated string");
            }
            char c = *cur_.ptr++;
            if (c == '\"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (cur_.eof()) {
                return fail("unterminated escape");
            }
            char e = *cur_.ptr++;
            switch (e) {
            case '\"':
            case '\\':
            case '/':
                out.push_back(e);
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                uint32_t cp = 0;
                if (!parse_hex4(cp)) {
                    return false;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (!cur_.consume_literal("\\u")) {
                        return fail("unpaired surrogate");
                    }
                    uint32_t low = 0;
                    if (!parse_hex4(low)) {
                        return false;
                    }
                    if (low < 0xDC00 || low > 0xDFFF) {
                        return fail("invalid low surrogate");
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return fail("unpaired surrogate");
                }
                append_utf8(cp, out);
                break;
            }
            default:
                return fail("invalid escape sequence");
            }
        }
    }

    bool parse_number(json_value& out) {
        const char* begin = cur_.ptr;
        const char* p = begin;
        auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
        bool negative = false;
        bool fractional = false;
        if (p < cur_.end && *p == '-') {
            negative = true;
            ++p;
        }
        if (p >= cur_.end || !is_digit(*p)) {
            return fail("invalid value");
        }
        if (*p == '0') {
            ++p;
        } else {
            while (p < cur_.end && is_digit(*p)) {
                ++p;
            }
        }
        if (p < cur_.end && *p == '.') {
            fractional = true;
            ++p;
            if (p >= cur_.end || !is_digit(*p)) {
                return fail("invalid number");
            }
            while (p < cur_.end && is_digit(*p)) {
                ++p;
            }
        }
        if (p < cur_.end && (*p == 'e' || *p == 'E')) {
            fractional = true;
            ++p;
            if (p < cur_.end && (*p == '+' || *p == '-')) {
                ++p;
            }
            if (p >= cur_.end || !is_digit(*p)) {
                return fail("invalid number exponent");
            }
            while (p < cur_.end && is_digit(*p)) {
                ++p;
            }
        }

        if (!fractional) {
            if (negative) {
                int64_t v = 0;
                auto [q, ec] = std::from_chars(begin, p, v);
                if (ec == std::errc() && q == p) {
                    cur_.ptr = p;
                    out = json_value(v);
                    return true;
                }
            } else {
                uint64_t v = 0;
                auto [q, ec] = std::from_chars(begin, p, v);
                if (ec == std::errc() && q == p) {
                    cur_.ptr = p;
                    if (v <= static_cast<uint64_t>(INT64_MAX)) {
                        out = json_value(static_cast<int64_t>(v));
                    } else {
                        out = json_value(v);
                    }
                    return true;
                }
            }
            // Out of 64-bit range: fall through to double.
        }

        std::string buf(begin, p);
        char* endptr = nullptr;
        double d = std::strtod(buf.c_str(), &endptr);
        if (endptr != buf.c_str() + buf.size()) {
            return fail("invalid number");
        }
        cur_.ptr = p;
        out = json_value(d);
        return true;
    }

    json_cursor cur_;
    decode_limits limits_;
    decode_error error_;
};

} // namespace

std::expected<json_value, decode_error> decode_json(std::string_view text, decode_limits limits) {
    return json_decoder(text, limits).run();
}

} // namespace verity::serde
