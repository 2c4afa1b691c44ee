#include "verity/core/rejection.hpp"

#include "verity/core/log.hpp"
#include "verity/core/metrics.hpp"

namespace verity {

json_value error_body::to_json() const {
    json_value list = json_value::array();
    for (const auto& e : errors) {
        json_value item = json_value::object();
        item["path"] = e.path;
        item["message"] = e.message;
        list.push_back(std::move(item));
    }
    json_value body = json_value::object();
    body["errors"] = std::move(list);
    return body;
}

std::string error_body::serialize() const {
    return verity::to_string(to_json());
}

http::response error_body::to_response() const {
    return http::response::json(serialize(), status);
}

error_body error_body::from(const pipeline_error& err) {
    error_body body;
    for (auto& entry : err.flatten()) {
        body.errors.push_back(error_entry{std::move(entry.path), std::move(entry.message)});
    }
    return body;
}

namespace detail {

std::optional<pipeline_error> check_content_type(const http::request& req) {
    auto content_type = req.header("Content-Type");
    if (content_type && http::is_json_content_type(*content_type)) {
        return std::nullopt;
    }
    global_metrics().decode_failures.fetch_add(1, std::memory_order_relaxed);
    log(log_level::debug, "extract",
        "rejected content type \"" + std::string(content_type.value_or("")) + "\"");
    return pipeline_error::decode(pipeline_stage::decoding, std::string(unsupported_content_type_message));
}

} // namespace detail
} // namespace verity
