#pragma once

#include "http.hpp"
#include "json_value.hpp"
#include "pipeline.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace verity {

struct error_entry {
    std::string path;
    std::string message;

    friend bool operator==(const error_entry&, const error_entry&) = default;
};

// Uniform client-facing body {"errors":[{"path":..,"message":..}]} used for
// every failure kind.
struct error_body {
    std::vector<error_entry> errors;
    int32_t status = 400;

    [[nodiscard]] json_value to_json() const;
    [[nodiscard]] std::string serialize() const;
    [[nodiscard]] http::response to_response() const;

    static error_body from(const pipeline_error& err);
};

namespace detail {

// Content-Type gate in front of the JSON pipeline; nullopt when accepted.
std::optional<pipeline_error> check_content_type(const http::request& req);

} // namespace detail

[[nodiscard]] inline http::response to_response(const pipeline_error& err) {
    return error_body::from(err).to_response();
}

} // namespace verity
