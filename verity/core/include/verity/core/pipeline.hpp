#pragma once

#include "binding.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "error_tree.hpp"
#include "json_schema.hpp"
#include "json_value.hpp"
#include "result.hpp"
#include "schema_cache.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace verity {

enum class pipeline_stage : uint8_t { decoding, schema_checking, deserializing, validating, done };

enum class failure_kind : uint8_t { decode, schema, validation, internal_mismatch };

enum class input_format : uint8_t { json, yaml };

[[nodiscard]] std::string_view pipeline_stage_name(pipeline_stage stage) noexcept;
[[nodiscard]] std::string_view failure_kind_name(failure_kind kind) noexcept;

// Terminal outcome of a failed pipeline run. Every kind flattens to the same
// (path, message) list; decode and internal mismatch failures carry only a
// generic message, the low-level reason stays in detail() for logs.
class pipeline_error {
public:
    static pipeline_error decode(pipeline_stage stage, std::string message, std::string detail = {});
    static pipeline_error schema(std::vector<schema_violation> violations);
    static pipeline_error validation(error_tree tree);
    static pipeline_error internal_mismatch(std::string detail);

    [[nodiscard]] failure_kind kind() const noexcept { return kind_; }
    [[nodiscard]] pipeline_stage stage() const noexcept { return stage_; }
    [[nodiscard]] std::error_code code() const noexcept;

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }
    [[nodiscard]] const std::vector<schema_violation>& violations() const noexcept { return violations_; }
    [[nodiscard]] const std::optional<error_tree>& errors() const noexcept { return tree_; }

    [[nodiscard]] std::vector<flat_error> flatten() const;

    // Validation failures render as the nested error tree, everything else
    // as the flattened list.
    [[nodiscard]] std::string to_string() const;

private:
    pipeline_error(failure_kind kind, pipeline_stage stage) : kind_(kind), stage_(stage) {}

    failure_kind kind_;
    pipeline_stage stage_;
    std::string message_;
    std::string detail_;
    std::vector<schema_violation> violations_;
    std::optional<error_tree> tree_;
};

inline constexpr std::string_view invalid_json_message = "invalid json body";
inline constexpr std::string_view invalid_yaml_message = "invalid yaml document";
inline constexpr std::string_view invalid_request_message = "invalid request";
inline constexpr std::string_view payload_too_large_message = "payload too large";
inline constexpr std::string_view unsupported_content_type_message =
    "expected request with content-type application/json";

namespace detail {

std::expected<json_value, pipeline_error>
decode_document(std::string_view raw, input_format format, const pipeline_options& options);

std::optional<pipeline_error> check_schema(const compiled_schema& schema, const json_value& value,
                                           std::string_view type_name);

pipeline_error binding_failed(const bind_error& err, bool schema_checked, std::string_view type_name);

pipeline_error validation_failed(error_tree tree, std::string_view type_name);

void record_accepted(std::string_view type_name);

} // namespace detail

// Deserializing and Validating stages for an already decoded value, preceded
// by SchemaChecking when enabled. A schema violation stops the run before
// binding. The schema is structural, so constraint failures surface from the
// Validating stage.
template <typename T>
std::expected<T, pipeline_error> validate_value(const json_value& value,
                                                const pipeline_options& options = {},
                                                schema_cache& cache = schema_cache::global()) {
    const auto& descriptor = describe<T>();
    bool schema_checked = false;
    if (options.schema_check) {
        auto schema = cache.get<T>();
        if (auto err = detail::check_schema(*schema, value, descriptor.title())) {
            return std::unexpected(std::move(*err));
        }
        schema_checked = !schema->accepts_everything();
    }

    T out{};
    if (auto err = descriptor.bind(value, out)) {
        return std::unexpected(detail::binding_failed(*err, schema_checked, descriptor.title()));
    }

    if (auto tree = descriptor.validate(out)) {
        return std::unexpected(detail::validation_failed(std::move(*tree), descriptor.title()));
    }
    detail::record_accepted(descriptor.title());
    return out;
}

// Decoding -> SchemaChecking -> Deserializing -> Validating, one linear pass.
template <typename T>
std::expected<T, pipeline_error> decode_and_validate(std::string_view raw,
                                                     const pipeline_options& options = {},
                                                     schema_cache& cache = schema_cache::global(),
                                                     input_format format = input_format::json) {
    auto value = detail::decode_document(raw, format, options);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    return validate_value<T>(*value, options, cache);
}

namespace detail {

inline pipeline_options without_schema() {
    pipeline_options options;
    options.schema_check = false;
    return options;
}

} // namespace detail

// Convenience entry points: decode, bind and validate without the schema
// step.
template <typename T> std::expected<T, pipeline_error> from_json_value(const json_value& value) {
    return validate_value<T>(value, detail::without_schema());
}

template <typename T> std::expected<T, pipeline_error> from_json_str(std::string_view text) {
    return decode_and_validate<T>(text, detail::without_schema(), schema_cache::global(), input_format::json);
}

template <typename T> std::expected<T, pipeline_error> from_yaml_str(std::string_view text) {
    return decode_and_validate<T>(text, detail::without_schema(), schema_cache::global(), input_format::yaml);
}

} // namespace verity
