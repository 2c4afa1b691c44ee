#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace verity {

// Unified constraint kinds used by field rules, schema generation and
// localization identifiers.
enum class constraint_kind : uint8_t {
    minimum,
    maximum,
    exclusive_minimum,
    exclusive_maximum,
    multiple_of,
    min_length,
    max_length,
    pattern,
    min_items,
    max_items,
    unique_items,
    min_properties,
    max_properties,
    enumerate,
    custom,
};

inline constexpr std::string_view constraint_kind_name(constraint_kind kind) noexcept {
    switch (kind) {
    case constraint_kind::minimum:
        return "minimum";
    case constraint_kind::maximum:
        return "maximum";
    case constraint_kind::exclusive_minimum:
        return "exclusive_minimum";
    case constraint_kind::exclusive_maximum:
        return "exclusive_maximum";
    case constraint_kind::multiple_of:
        return "multiple_of";
    case constraint_kind::min_length:
        return "min_length";
    case constraint_kind::max_length:
        return "max_length";
    case constraint_kind::pattern:
        return "pattern";
    case constraint_kind::min_items:
        return "min_items";
    case constraint_kind::max_items:
        return "max_items";
    case constraint_kind::unique_items:
        return "unique_items";
    case constraint_kind::min_properties:
        return "min_properties";
    case constraint_kind::max_properties:
        return "max_properties";
    case constraint_kind::enumerate:
        return "enumerate";
    case constraint_kind::custom:
        return "custom";
    }
    return "unknown";
}

// Message templates; "{name}" is replaced by the argument of that name.
inline constexpr std::string_view default_message_template(constraint_kind kind) noexcept {
    switch (kind) {
    case constraint_kind::minimum:
        return "the number must be >= {limit}.";
    case constraint_kind::maximum:
        return "the number must be <= {limit}.";
    case constraint_kind::exclusive_minimum:
        return "the number must be > {limit}.";
    case constraint_kind::exclusive_maximum:
        return "the number must be < {limit}.";
    case constraint_kind::multiple_of:
        return "the value must be multiple of {divisor}.";
    case constraint_kind::min_length:
        return "the length of the value must be >= {limit}.";
    case constraint_kind::max_length:
        return "the length of the value must be <= {limit}.";
    case constraint_kind::pattern:
        return "the value must match the pattern of \"{pattern}\".";
    case constraint_kind::min_items:
        return "the length of the items must be >= {limit}.";
    case constraint_kind::max_items:
        return "the length of the items must be <= {limit}.";
    case constraint_kind::unique_items:
        return "the items must be unique.";
    case constraint_kind::min_properties:
        return "the size of the properties must be >= {limit}.";
    case constraint_kind::max_properties:
        return "the size of the properties must be <= {limit}.";
    case constraint_kind::enumerate:
        return "the value must be in [{values}].";
    case constraint_kind::custom:
        return "the value is invalid.";
    }
    return "unknown error";
}

struct message_arg {
    std::string name;
    std::string value;

    friend bool operator==(const message_arg&, const message_arg&) = default;
};

// One failed constraint. `message` is already rendered; `message_id` and
// `args` let a catalog produce a localized variant later.
struct constraint_error {
    constraint_kind kind = constraint_kind::custom;
    std::string message;
    std::string message_id;
    std::vector<message_arg> args;

    [[nodiscard]] const std::string* arg(std::string_view name) const noexcept {
        for (const auto& a : args) {
            if (a.name == name) {
                return &a.value;
            }
        }
        return nullptr;
    }

    friend bool operator==(const constraint_error&, const constraint_error&) = default;
};

[[nodiscard]] std::string render_message(std::string_view tmpl, const std::vector<message_arg>& args);

[[nodiscard]] constraint_error make_constraint_error(constraint_kind kind,
                                                     std::vector<message_arg> args = {});

// Errors returned from user-supplied checks.
[[nodiscard]] constraint_error custom_error(std::string message,
                                            std::string message_id = "custom",
                                            std::vector<message_arg> args = {});

} // namespace verity
