#pragma once

#include "error_tree.hpp"
#include "json_value.hpp"
#include "traits.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace verity {

// Structural mismatch between a decoded document and the target type.
struct bind_error {
    std::string path; // JSON pointer of the offending value
    std::string message;
};

template <typename V, typename = void> struct value_binder;

template <typename V>
[[nodiscard]] std::optional<bind_error> bind_value(const json_value& in, V& out, const std::string& path) {
    return value_binder<V>::bind(in, out, path);
}

namespace detail {

inline bind_error type_mismatch(const std::string& path, std::string_view expected, const json_value& found) {
    std::string msg = "invalid type: expected ";
    msg.append(expected);
    msg.append(", found ");
    msg.append(kind_name(found.type()));
    return bind_error{path, std::move(msg)};
}

inline bind_error out_of_range(const std::string& path, const json_value& found) {
    return bind_error{path, "invalid value: " + to_string(found) + " is out of range"};
}

} // namespace detail

template <> struct value_binder<bool, void> {
    static std::optional<bind_error> bind(const json_value& in, bool& out, const std::string& path) {
        if (!in.is_bool()) {
            return detail::type_mismatch(path, "boolean", in);
        }
        out = in.as_bool();
        return std::nullopt;
    }
};

template <typename N>
struct value_binder<N, std::enable_if_t<std::is_integral_v<N> && !std::is_same_v<N, bool>>> {
    static std::optional<bind_error> bind(const json_value& in, N& out, const std::string& path) {
        if (!in.is_integer()) {
            return detail::type_mismatch(path, "integer", in);
        }
        switch (in.type()) {
        case json_value::kind::integer:
            if (!std::in_range<N>(in.as_int64())) {
                return detail::out_of_range(path, in);
            }
            out = static_cast<N>(in.as_int64());
            return std::nullopt;
        case json_value::kind::unsigned_integer:
            if (!std::in_range<N>(in.as_uint64())) {
                return detail::out_of_range(path, in);
            }
            out = static_cast<N>(in.as_uint64());
            return std::nullopt;
        default: {
            // Integral double such as 5.0.
            double d = in.as_double();
            if (d < static_cast<double>(std::numeric_limits<N>::min()) ||
                d >= std::ldexp(1.0, std::numeric_limits<N>::digits)) {
                return detail::out_of_range(path, in);
            }
            out = static_cast<N>(d);
            return std::nullopt;
        }
        }
    }
};

template <typename F> struct value_binder<F, std::enable_if_t<std::is_floating_point_v<F>>> {
    static std::optional<bind_error> bind(const json_value& in, F& out, const std::string& path) {
        if (!in.is_number()) {
            return detail::type_mismatch(path, "number", in);
        }
        out = static_cast<F>(in.as_double());
        return std::nullopt;
    }
};

template <> struct value_binder<std::string, void> {
    static std::optional<bind_error> bind(const json_value& in, std::string& out, const std::string& path) {
        if (!in.is_string()) {
            return detail::type_mismatch(path, "string", in);
        }
        out = in.as_string();
        return std::nullopt;
    }
};

template <typename U> struct value_binder<std::optional<U>, void> {
    static std::optional<bind_error> bind(const json_value& in, std::optional<U>& out, const std::string& path) {
        if (in.is_null()) {
            out.reset();
            return std::nullopt;
        }
        U value{};
        if (auto err = bind_value(in, value, path)) {
            return err;
        }
        out = std::move(value);
        return std::nullopt;
    }
};

template <typename U> struct value_binder<std::vector<U>, void> {
    static std::optional<bind_error> bind(const json_value& in, std::vector<U>& out, const std::string& path) {
        if (!in.is_array()) {
            return detail::type_mismatch(path, "array", in);
        }
        const auto& items = in.as_array();
        out.clear();
        out.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            std::string child = path;
            append_pointer_token(child, std::to_string(i));
            U value{};
            if (auto err = bind_value(items[i], value, child)) {
                return err;
            }
            out.push_back(std::move(value));
        }
        return std::nullopt;
    }
};

template <typename U> struct value_binder<std::map<std::string, U>, void> {
    static std::optional<bind_error>
    bind(const json_value& in, std::map<std::string, U>& out, const std::string& path) {
        if (!in.is_object()) {
            return detail::type_mismatch(path, "object", in);
        }
        out.clear();
        for (const auto& [key, item] : in.as_object()) {
            std::string child = path;
            append_pointer_token(child, key);
            U value{};
            if (auto err = bind_value(item, value, child)) {
                return err;
            }
            out.insert_or_assign(key, std::move(value));
        }
        return std::nullopt;
    }
};

template <typename T> struct value_binder<T, std::enable_if_t<is_validatable_v<T>>> {
    static std::optional<bind_error> bind(const json_value& in, T& out, const std::string& path) {
        return describe<T>().bind(in, out, path);
    }
};

} // namespace verity
