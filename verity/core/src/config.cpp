#include "verity/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace verity {
namespace {

template <typename T> bool read_unsigned(const char* env_name, T& out) {
    const char* value = std::getenv(env_name);
    if (!value) {
        return false;
    }
    std::string_view sv(value);
    T parsed = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), parsed);
    if (ec != std::errc() || ptr != sv.data() + sv.size() || parsed == 0) {
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

pipeline_options pipeline_options::from_env() {
    pipeline_options opts;
    if (const char* value = std::getenv("VERITY_SCHEMA_CHECK")) {
        std::string_view sv(value);
        if (sv == "0" || sv == "false" || sv == "FALSE" || sv == "off") {
            opts.schema_check = false;
        } else if (sv == "1" || sv == "true" || sv == "TRUE" || sv == "on") {
            opts.schema_check = true;
        }
    }
    read_unsigned("VERITY_MAX_BODY_SIZE", opts.max_body_size);
    read_unsigned("VERITY_MAX_DEPTH", opts.max_depth);
    if (const char* value = std::getenv("VERITY_LOG_LEVEL")) {
        if (auto lvl = parse_log_level(value)) {
            opts.level = *lvl;
        }
    }
    return opts;
}

} // namespace verity
