#pragma once

#include "config.hpp"
#include "http.hpp"
#include "pipeline.hpp"
#include "rejection.hpp"
#include "schema_cache.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace verity {

// Request body -> validated T. The content type and body size are checked
// first and reported as decode failures.
template <typename T>
std::expected<T, pipeline_error> extract_json(const http::request& req,
                                              const pipeline_options& options = {},
                                              schema_cache& cache = schema_cache::global()) {
    if (auto err = detail::check_content_type(req)) {
        return std::unexpected(std::move(*err));
    }
    return decode_and_validate<T>(req.body, options, cache, input_format::json);
}

// Runs `handler(T&&)` on an accepted body, answers 400 with the error body
// otherwise.
template <typename T, typename Handler>
http::response handle_json(const http::request& req, Handler&& handler,
                           const pipeline_options& options = {},
                           schema_cache& cache = schema_cache::global()) {
    static_assert(std::is_invocable_r_v<http::response, Handler, T&&>,
                  "handler must accept the extracted value and return a response");
    auto extracted = extract_json<T>(req, options, cache);
    if (!extracted) {
        return to_response(extracted.error());
    }
    return std::forward<Handler>(handler)(std::move(*extracted));
}

} // namespace verity
