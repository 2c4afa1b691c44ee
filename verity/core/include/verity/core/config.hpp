#pragma once

#include "log.hpp"

#include <cstddef>
#include <cstdint>

namespace verity {

struct pipeline_options {
    bool schema_check = true;
    uint64_t max_body_size = 10ULL * 1024ULL * 1024ULL;
    size_t max_depth = 128;
    log_level level = log_level::warn;

    // Reads VERITY_SCHEMA_CHECK, VERITY_MAX_BODY_SIZE, VERITY_MAX_DEPTH and
    // VERITY_LOG_LEVEL; unset or malformed variables keep the defaults.
    static pipeline_options from_env();
};

} // namespace verity
