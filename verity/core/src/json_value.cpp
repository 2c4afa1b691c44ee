#include "verity/core/json_value.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace verity {

bool json_value::is_integer() const noexcept {
    switch (type()) {
    case kind::integer:
    case kind::unsigned_integer:
        return true;
    case kind::number: {
        double d = std::get<double>(data_);
        return std::isfinite(d) && std::trunc(d) == d;
    }
    default:
        return false;
    }
}

int64_t json_value::as_int64() const {
    switch (type()) {
    case kind::integer:
        return std::get<int64_t>(data_);
    case kind::unsigned_integer:
        return static_cast<int64_t>(std::get<uint64_t>(data_));
    default:
        return static_cast<int64_t>(std::get<double>(data_));
    }
}

uint64_t json_value::as_uint64() const {
    switch (type()) {
    case kind::integer:
        return static_cast<uint64_t>(std::get<int64_t>(data_));
    case kind::unsigned_integer:
        return std::get<uint64_t>(data_);
    default:
        return static_cast<uint64_t>(std::get<double>(data_));
    }
}

double json_value::as_double() const {
    switch (type()) {
    case kind::integer:
        return static_cast<double>(std::get<int64_t>(data_));
    case kind::unsigned_integer:
        return static_cast<double>(std::get<uint64_t>(data_));
    default:
        return std::get<double>(data_);
    }
}

size_t json_value::size() const noexcept {
    if (auto* a = std::get_if<array_t>(&data_)) {
        return a->size();
    }
    if (auto* o = std::get_if<object_t>(&data_)) {
        return o->size();
    }
    return 0;
}

const json_value* json_value::find(std::string_view key) const noexcept {
    auto* o = std::get_if<object_t>(&data_);
    if (!o) {
        return nullptr;
    }
    for (const auto& [k, v] : *o) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

json_value& json_value::operator[](std::string_view key) {
    if (is_null()) {
        data_ = object_t{};
    }
    auto& o = std::get<object_t>(data_);
    for (auto& [k, v] : o) {
        if (k == key) {
            return v;
        }
    }
    o.emplace_back(std::string(key), json_value{});
    return o.back().second;
}

void json_value::push_back(json_value v) {
    if (is_null()) {
        data_ = array_t{};
    }
    std::get<array_t>(data_).push_back(std::move(v));
}

namespace {

bool numbers_equal(const json_value& a, const json_value& b) {
    using k = json_value::kind;
    if (a.type() == k::number || b.type() == k::number) {
        return a.as_double() == b.as_double();
    }
    if (a.type() == b.type()) {
        return a.type() == k::integer ? a.as_int64() == b.as_int64()
                                      : a.as_uint64() == b.as_uint64();
    }
    // One signed, one unsigned.
    const json_value& s = a.type() == k::integer ? a : b;
    const json_value& u = a.type() == k::integer ? b : a;
    return s.as_int64() >= 0 && static_cast<uint64_t>(s.as_int64()) == u.as_uint64();
}

} // namespace

bool operator==(const json_value& a, const json_value& b) {
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
    case json_value::kind::null:
        return true;
    case json_value::kind::boolean:
        return a.as_bool() == b.as_bool();
    case json_value::kind::string:
        return a.as_string() == b.as_string();
    case json_value::kind::array:
        return a.as_array() == b.as_array();
    case json_value::kind::object: {
        const auto& lhs = a.as_object();
        if (lhs.size() != b.as_object().size()) {
            return false;
        }
        for (const auto& [key, value] : lhs) {
            const json_value* other = b.find(key);
            if (!other || !(*other == value)) {
                return false;
            }
        }
        return true;
    }
    default:
        return false;
    }
}

std::string_view kind_name(json_value::kind k) noexcept {
    switch (k) {
    case json_value::kind::null:
        return "null";
    case json_value::kind::boolean:
        return "boolean";
    case json_value::kind::integer:
    case json_value::kind::unsigned_integer:
        return "integer";
    case json_value::kind::number:
        return "number";
    case json_value::kind::string:
        return "string";
    case json_value::kind::array:
        return "array";
    case json_value::kind::object:
        return "object";
    }
    return "unknown";
}

std::string format_number(double d) {
    if (!std::isfinite(d)) {
        return "null";
    }
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc()) {
        return "null";
    }
    return std::string(buf.data(), ptr);
}

void append_escaped(std::string_view sv, std::string& out) {
    static constexpr char hex[] = "0123456789abcdef";
    out.push_back('\"');
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(hex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
                out.push_back(hex[static_cast<unsigned char>(c) & 0xF]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('\"');
}

void append_json(const json_value& v, std::string& out) {
    switch (v.type()) {
    case json_value::kind::null:
        out += "null";
        break;
    case json_value::kind::boolean:
        out += v.as_bool() ? "true" : "false";
        break;
    case json_value::kind::integer:
        out += std::to_string(v.as_int64());
        break;
    case json_value::kind::unsigned_integer:
        out += std::to_string(v.as_uint64());
        break;
    case json_value::kind::number:
        out += format_number(v.as_double());
        break;
    case json_value::kind::string:
        append_escaped(v.as_string(), out);
        break;
    case json_value::kind::array: {
        out.push_back('[');
        const auto& arr = v.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            append_json(arr[i], out);
        }
        out.push_back(']');
        break;
    }
    case json_value::kind::object: {
        out.push_back('{');
        const auto& obj = v.as_object();
        for (size_t i = 0; i < obj.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            append_escaped(obj[i].first, out);
            out.push_back(':');
            append_json(obj[i].second, out);
        }
        out.push_back('}');
        break;
    }
    }
}

std::string to_string(const json_value& v) {
    std::string out;
    append_json(v, out);
    return out;
}

} // namespace verity
