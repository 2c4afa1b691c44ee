#pragma once

#include "json_value.hpp"
#include "validation.hpp"

#include <cmath>
#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace verity {

// Text used for constraint parameters in messages: integers in decimal,
// floating point in shortest round-trip form, strings JSON-quoted.
template <typename V> std::string value_text(const V& v) {
    if constexpr (std::is_same_v<V, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_integral_v<V>) {
        return std::to_string(v);
    } else if constexpr (std::is_floating_point_v<V>) {
        return format_number(static_cast<double>(v));
    } else {
        std::string out;
        append_escaped(std::string_view(v), out);
        return out;
    }
}

// Number of Unicode code points in UTF-8 text; continuation bytes are not
// counted.
[[nodiscard]] size_t utf8_length(std::string_view s) noexcept;

// Compiled regular expression shared by every copy of a validator. A pattern
// is matched against the whole string unless it anchors itself with '^' or
// '$', in which case a search is performed.
class regex_pattern {
public:
    // Throws std::invalid_argument for malformed expressions.
    static regex_pattern compile(std::string source);

    [[nodiscard]] const std::string& source() const noexcept { return source_; }
    [[nodiscard]] bool anchored() const noexcept { return anchored_; }
    [[nodiscard]] bool matches(std::string_view s) const;

    // Pattern text for JSON Schema, where "pattern" is a search.
    [[nodiscard]] std::string schema_source() const;

private:
    regex_pattern(std::string source, std::shared_ptr<const std::regex> re, bool anchored)
        : source_(std::move(source)), re_(std::move(re)), anchored_(anchored) {}

    std::string source_;
    std::shared_ptr<const std::regex> re_;
    bool anchored_ = false;
};

namespace constraints {

template <typename N> std::optional<constraint_error> check_minimum(N value, N limit) {
    if (value < limit) {
        return make_constraint_error(constraint_kind::minimum, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

template <typename N> std::optional<constraint_error> check_maximum(N value, N limit) {
    if (value > limit) {
        return make_constraint_error(constraint_kind::maximum, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

template <typename N> std::optional<constraint_error> check_exclusive_minimum(N value, N limit) {
    if (!(value > limit)) {
        return make_constraint_error(constraint_kind::exclusive_minimum,
                                     {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

template <typename N> std::optional<constraint_error> check_exclusive_maximum(N value, N limit) {
    if (!(value < limit)) {
        return make_constraint_error(constraint_kind::exclusive_maximum,
                                     {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

inline constexpr double multiple_of_tolerance = 1e-9;

[[nodiscard]] bool is_multiple_of(double value, double divisor) noexcept;

// Exact for integers; floating point uses a relative tolerance on the
// quotient. The divisor is non-zero (checked when the rule is declared).
template <typename N> std::optional<constraint_error> check_multiple_of(N value, N divisor) {
    bool ok = true;
    if constexpr (std::is_integral_v<N>) {
        if constexpr (std::is_signed_v<N>) {
            ok = divisor == -1 || value % divisor == 0;
        } else {
            ok = value % divisor == 0;
        }
    } else {
        ok = is_multiple_of(static_cast<double>(value), static_cast<double>(divisor));
    }
    if (!ok) {
        return make_constraint_error(constraint_kind::multiple_of,
                                     {{"divisor", value_text(divisor)}});
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<constraint_error> check_min_length(std::string_view value, size_t limit);
[[nodiscard]] std::optional<constraint_error> check_max_length(std::string_view value, size_t limit);
[[nodiscard]] std::optional<constraint_error> check_pattern(std::string_view value,
                                                            const regex_pattern& pattern);

[[nodiscard]] std::optional<constraint_error> check_min_items(size_t count, size_t limit);
[[nodiscard]] std::optional<constraint_error> check_max_items(size_t count, size_t limit);
[[nodiscard]] std::optional<constraint_error> check_min_properties(size_t count, size_t limit);
[[nodiscard]] std::optional<constraint_error> check_max_properties(size_t count, size_t limit);

// Fails on the first pair of equal elements.
template <typename T> std::optional<constraint_error> check_unique_items(const std::vector<T>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            if (items[i] == items[j]) {
                return make_constraint_error(constraint_kind::unique_items);
            }
        }
    }
    return std::nullopt;
}

template <typename V> std::string enumerate_text(const std::vector<V>& allowed) {
    std::string out;
    for (size_t i = 0; i < allowed.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(value_text(allowed[i]));
    }
    return out;
}

template <typename V>
std::optional<constraint_error> check_enumerate(const V& value, const std::vector<V>& allowed) {
    for (const auto& candidate : allowed) {
        if (candidate == value) {
            return std::nullopt;
        }
    }
    return make_constraint_error(constraint_kind::enumerate, {{"values", enumerate_text(allowed)}});
}

} // namespace constraints
} // namespace verity
