#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace verity {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    decode_failed = 1,
    schema_violation = 2,
    deserialize_failed = 3,
    validation_failed = 4,
    internal_mismatch = 5,
    invalid_schema = 6,
    invalid_pattern = 7,
    invalid_catalog = 8,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "verity"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::decode_failed:
            return "input could not be decoded";
        case ec::schema_violation:
            return "input violates the schema";
        case ec::deserialize_failed:
            return "input could not be bound to the target type";
        case ec::validation_failed:
            return "input failed validation";
        case ec::internal_mismatch:
            return "schema accepted input that the target type rejected";
        case ec::invalid_schema:
            return "schema is invalid";
        case ec::invalid_pattern:
            return "regular expression is invalid";
        case ec::invalid_catalog:
            return "message catalog is malformed";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace verity

namespace std {
template <> struct is_error_code_enum<verity::error_code> : true_type {};
} // namespace std
