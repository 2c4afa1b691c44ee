#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace verity {

// Generic decoded document. Objects keep their keys in insertion order so that
// generated schemas and serialized error bodies are reproducible.
class json_value {
public:
    enum class kind : uint8_t { null, boolean, integer, unsigned_integer, number, string, array, object };

    using array_t = std::vector<json_value>;
    using member = std::pair<std::string, json_value>;
    using object_t = std::vector<member>;

    json_value() noexcept = default;
    json_value(std::nullptr_t) noexcept {}
    json_value(bool b) noexcept : data_(b) {}
    json_value(double d) noexcept : data_(d) {}
    json_value(float f) noexcept : data_(static_cast<double>(f)) {}
    json_value(const char* s) : data_(std::string(s)) {}
    json_value(std::string s) : data_(std::move(s)) {}
    json_value(std::string_view s) : data_(std::string(s)) {}
    json_value(array_t a) : data_(std::move(a)) {}
    json_value(object_t o) : data_(std::move(o)) {}

    template <typename I,
              typename = std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool> &&
                                          !std::is_same_v<I, char>>>
    json_value(I v) noexcept {
        if constexpr (std::is_signed_v<I>) {
            data_ = static_cast<int64_t>(v);
        } else {
            data_ = static_cast<uint64_t>(v);
        }
    }

    static json_value array(std::initializer_list<json_value> items = {}) {
        return json_value(array_t(items));
    }
    static json_value object() { return json_value(object_t{}); }

    [[nodiscard]] kind type() const noexcept { return static_cast<kind>(data_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return type() == kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return type() == kind::boolean; }
    [[nodiscard]] bool is_integer() const noexcept;
    [[nodiscard]] bool is_number() const noexcept {
        return type() == kind::integer || type() == kind::unsigned_integer ||
               type() == kind::number;
    }
    [[nodiscard]] bool is_string() const noexcept { return type() == kind::string; }
    [[nodiscard]] bool is_array() const noexcept { return type() == kind::array; }
    [[nodiscard]] bool is_object() const noexcept { return type() == kind::object; }

    // Accessors expect the matching kind; numeric accessors convert between
    // the three numeric representations.
    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t as_int64() const;
    [[nodiscard]] uint64_t as_uint64() const;
    [[nodiscard]] double as_double() const;
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const array_t& as_array() const { return std::get<array_t>(data_); }
    [[nodiscard]] array_t& as_array() { return std::get<array_t>(data_); }
    [[nodiscard]] const object_t& as_object() const { return std::get<object_t>(data_); }
    [[nodiscard]] object_t& as_object() { return std::get<object_t>(data_); }

    // Number of elements for arrays and objects, 0 otherwise.
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] const json_value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    // Object insertion helper: a null value becomes an empty object first.
    json_value& operator[](std::string_view key);
    void push_back(json_value v);

    friend bool operator==(const json_value& a, const json_value& b);
    friend bool operator!=(const json_value& a, const json_value& b) { return !(a == b); }

private:
    std::variant<std::nullptr_t, bool, int64_t, uint64_t, double, std::string, array_t, object_t>
        data_{nullptr};
};

[[nodiscard]] std::string_view kind_name(json_value::kind k) noexcept;

// Compact JSON text. Non-finite doubles are written as null.
[[nodiscard]] std::string to_string(const json_value& v);
void append_json(const json_value& v, std::string& out);
void append_escaped(std::string_view sv, std::string& out);

// Shortest decimal that round-trips through strtod; integral doubles print
// without a fractional part ("1000", not "1000.0").
[[nodiscard]] std::string format_number(double d);

} // namespace verity
