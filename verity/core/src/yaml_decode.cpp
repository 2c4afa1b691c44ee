#include "verity/core/serde.hpp"

#include <ryml.hpp>
#include <ryml_std.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <utility>

namespace verity::serde {
namespace {

// Thrown from the rapidyaml error callback, which must not return.
struct yaml_parse_failure {
    size_t line;
    std::string reason;
};

void on_parse_error(const char* msg, size_t len, ryml::Location location, void* /*user_data*/) {
    throw yaml_parse_failure{static_cast<size_t>(location.line), std::string(msg, len)};
}

std::string_view to_view(ryml::csubstr s) noexcept {
    return s.empty() ? std::string_view{} : std::string_view(s.str, s.len);
}

// Plain scalars are typed the way a JSON reader would see them; anything
// that is not null, a boolean or a complete number stays a string.
json_value typed_scalar(std::string_view sv) {
    if (sv.empty() || sv == "~" || sv == "null" || sv == "Null" || sv == "NULL") {
        return json_value(nullptr);
    }
    if (sv == "true" || sv == "True" || sv == "TRUE") {
        return json_value(true);
    }
    if (sv == "false" || sv == "False" || sv == "FALSE") {
        return json_value(false);
    }
    const char* first = sv.data();
    const char* last = sv.data() + sv.size();
    const char* digits = (*first == '+') ? first + 1 : first;
    const char* lead = (digits != last && *digits == '-') ? digits + 1 : digits;
    if (lead == last || !(std::isdigit(static_cast<unsigned char>(*lead)) || *lead == '.')) {
        return json_value(std::string(sv));
    }
    int64_t i = 0;
    auto [ip, iec] = std::from_chars(digits, last, i);
    if (iec == std::errc() && ip == last) {
        return json_value(i);
    }
    double d = 0.0;
    auto [dp, dec] = std::from_chars(digits, last, d);
    if (dec == std::errc() && dp == last) {
        return json_value(d);
    }
    return json_value(std::string(sv));
}

class tree_converter {
public:
    explicit tree_converter(decode_limits limits) : limits_(limits) {}

    std::expected<json_value, decode_error> convert(ryml::ConstNodeRef node, size_t depth) const {
        if (depth > limits_.max_depth) {
            return std::unexpected(decode_error{0, "nesting depth limit exceeded"});
        }
        if (node.is_val_ref() || (node.has_key() && node.is_key_ref())) {
            return std::unexpected(decode_error{0, "aliases are not supported"});
        }
        if (node.has_val_tag()) {
            return std::unexpected(decode_error{0, "tags are not supported"});
        }
        if (node.is_map()) {
            return convert_map(node, depth);
        }
        if (node.is_seq()) {
            json_value out = json_value::array();
            for (ryml::ConstNodeRef child : node.children()) {
                auto item = convert(child, depth + 1);
                if (!item) {
                    return item;
                }
                out.push_back(std::move(*item));
            }
            return out;
        }
        if (!node.has_val()) {
            return json_value(nullptr);
        }
        if (node.is_val_quoted()) {
            return json_value(std::string(to_view(node.val())));
        }
        return typed_scalar(to_view(node.val()));
    }

private:
    std::expected<json_value, decode_error> convert_map(ryml::ConstNodeRef node, size_t depth) const {
        json_value out = json_value::object();
        for (ryml::ConstNodeRef child : node.children()) {
            std::string_view key = to_view(child.key());
            if (out.contains(key)) {
                return std::unexpected(decode_error{0, "duplicate key \"" + std::string(key) + "\""});
            }
            auto value = convert(child, depth + 1);
            if (!value) {
                return value;
            }
            out[key] = std::move(*value);
        }
        return out;
    }

    decode_limits limits_;
};

} // namespace

std::expected<json_value, decode_error> decode_yaml(std::string_view text, decode_limits limits) {
    ryml::Callbacks callbacks(nullptr, nullptr, nullptr, &on_parse_error);
    ryml::Tree tree(callbacks);
    try {
        ryml::parse_in_arena(ryml::csubstr(text.data(), text.size()), &tree);
    } catch (const yaml_parse_failure& failure) {
        return std::unexpected(decode_error{failure.line, failure.reason});
    }

    ryml::ConstNodeRef root = tree.crootref();
    if (root.is_stream()) {
        if (root.num_children() == 0) {
            return json_value(nullptr);
        }
        if (root.num_children() > 1) {
            return std::unexpected(decode_error{0, "multiple documents are not supported"});
        }
        root = root.first_child();
    }
    return tree_converter(limits).convert(root, 0);
}

} // namespace verity::serde
