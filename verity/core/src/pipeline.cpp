#include "verity/core/pipeline.hpp"

#include "verity/core/log.hpp"
#include "verity/core/metrics.hpp"
#include "verity/core/serde.hpp"

#include <utility>

namespace verity {

std::string_view pipeline_stage_name(pipeline_stage stage) noexcept {
    switch (stage) {
    case pipeline_stage::decoding:
        return "decoding";
    case pipeline_stage::schema_checking:
        return "schema_checking";
    case pipeline_stage::deserializing:
        return "deserializing";
    case pipeline_stage::validating:
        return "validating";
    case pipeline_stage::done:
        return "done";
    }
    return "unknown";
}

std::string_view failure_kind_name(failure_kind kind) noexcept {
    switch (kind) {
    case failure_kind::decode:
        return "decode";
    case failure_kind::schema:
        return "schema";
    case failure_kind::validation:
        return "validation";
    case failure_kind::internal_mismatch:
        return "internal_mismatch";
    }
    return "unknown";
}

pipeline_error pipeline_error::decode(pipeline_stage stage, std::string message, std::string detail) {
    pipeline_error e(failure_kind::decode, stage);
    e.message_ = std::move(message);
    e.detail_ = std::move(detail);
    return e;
}

pipeline_error pipeline_error::schema(std::vector<schema_violation> violations) {
    pipeline_error e(failure_kind::schema, pipeline_stage::schema_checking);
    e.violations_ = std::move(violations);
    return e;
}

pipeline_error pipeline_error::validation(error_tree tree) {
    pipeline_error e(failure_kind::validation, pipeline_stage::validating);
    e.tree_ = std::move(tree);
    return e;
}

pipeline_error pipeline_error::internal_mismatch(std::string detail) {
    pipeline_error e(failure_kind::internal_mismatch, pipeline_stage::deserializing);
    e.message_ = std::string(invalid_request_message);
    e.detail_ = std::move(detail);
    return e;
}

std::error_code pipeline_error::code() const noexcept {
    switch (kind_) {
    case failure_kind::decode:
        return make_error_code(stage_ == pipeline_stage::deserializing ? error_code::deserialize_failed
                                                                       : error_code::decode_failed);
    case failure_kind::schema:
        return make_error_code(error_code::schema_violation);
    case failure_kind::validation:
        return make_error_code(error_code::validation_failed);
    case failure_kind::internal_mismatch:
        return make_error_code(error_code::internal_mismatch);
    }
    return make_error_code(error_code::ok);
}

std::vector<flat_error> pipeline_error::flatten() const {
    switch (kind_) {
    case failure_kind::schema: {
        std::vector<flat_error> out;
        out.reserve(violations_.size());
        for (const auto& v : violations_) {
            out.push_back(flat_error{v.instance_path, v.description});
        }
        return out;
    }
    case failure_kind::validation:
        return verity::flatten(*tree_);
    case failure_kind::decode:
    case failure_kind::internal_mismatch:
        break;
    }
    return {flat_error{"", message_}};
}

std::string pipeline_error::to_string() const {
    if (kind_ == failure_kind::validation) {
        return verity::to_string(*tree_);
    }
    json_value list = json_value::array();
    for (auto& entry : flatten()) {
        json_value item = json_value::object();
        item["path"] = std::move(entry.path);
        item["message"] = std::move(entry.message);
        list.push_back(std::move(item));
    }
    return verity::to_string(list);
}

namespace detail {

std::expected<json_value, pipeline_error>
decode_document(std::string_view raw, input_format format, const pipeline_options& options) {
    if (raw.size() > options.max_body_size) {
        global_metrics().decode_failures.fetch_add(1, std::memory_order_relaxed);
        log(log_level::debug, "pipeline",
            "rejected body of " + std::to_string(raw.size()) + " bytes (limit " +
                std::to_string(options.max_body_size) + ")");
        return std::unexpected(
            pipeline_error::decode(pipeline_stage::decoding, std::string(payload_too_large_message)));
    }

    std::expected<json_value, serde::decode_error> decoded;
    std::string_view message;
    if (format == input_format::yaml) {
        decoded = serde::decode_yaml(raw, serde::decode_limits{options.max_depth});
        message = invalid_yaml_message;
    } else {
        decoded = serde::decode_json(raw, serde::decode_limits{options.max_depth});
        message = invalid_json_message;
    }
    if (!decoded) {
        const auto& err = decoded.error();
        std::string detail = err.reason;
        if (format == input_format::json) {
            detail += " at offset " + std::to_string(err.offset);
        } else if (err.offset > 0) {
            detail += " at line " + std::to_string(err.offset);
        }
        global_metrics().decode_failures.fetch_add(1, std::memory_order_relaxed);
        log(log_level::debug, "pipeline", "decode failed: " + detail);
        return std::unexpected(
            pipeline_error::decode(pipeline_stage::decoding, std::string(message), std::move(detail)));
    }
    return std::move(*decoded);
}

std::optional<pipeline_error> check_schema(const compiled_schema& schema, const json_value& value,
                                           std::string_view type_name) {
    auto checked = schema.check(value);
    if (checked) {
        return std::nullopt;
    }
    global_metrics().schema_failures.fetch_add(1, std::memory_order_relaxed);
    log(log_level::debug, "pipeline",
        std::string(type_name) + ": " + std::to_string(checked.error().size()) + " schema violation(s)");
    return pipeline_error::schema(std::move(checked.error()));
}

pipeline_error binding_failed(const bind_error& err, bool schema_checked, std::string_view type_name) {
    std::string detail = err.message;
    if (!err.path.empty()) {
        detail += " at \"" + err.path + "\"";
    }
    if (schema_checked) {
        global_metrics().internal_mismatches.fetch_add(1, std::memory_order_relaxed);
        log(log_level::error, "pipeline",
            "schema validation passed but binding failed for " + std::string(type_name) + ": " + detail);
        return pipeline_error::internal_mismatch(std::move(detail));
    }
    global_metrics().decode_failures.fetch_add(1, std::memory_order_relaxed);
    log(log_level::debug, "pipeline", std::string(type_name) + ": binding failed: " + detail);
    return pipeline_error::decode(pipeline_stage::deserializing, std::string(invalid_request_message),
                                  std::move(detail));
}

pipeline_error validation_failed(error_tree tree, std::string_view type_name) {
    global_metrics().validation_failures.fetch_add(1, std::memory_order_relaxed);
    log(log_level::debug, "pipeline",
        std::string(type_name) + ": " + std::to_string(tree.leaf_count()) + " validation error(s)");
    return pipeline_error::validation(std::move(tree));
}

void record_accepted(std::string_view type_name) {
    global_metrics().accepted.fetch_add(1, std::memory_order_relaxed);
    if (current_log_level() <= log_level::debug) {
        log(log_level::debug, "pipeline", std::string(type_name) + ": accepted");
    }
}

} // namespace detail
} // namespace verity
