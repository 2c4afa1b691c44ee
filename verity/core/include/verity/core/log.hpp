#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace verity {

enum class log_level : uint8_t { debug, info, warn, error, off };

// Receives every line that passes the level filter, possibly from several
// threads at once and without any logger lock held. The default sink writes
// "[verity][component] message" to std::cerr.
using log_sink = std::function<void(log_level, std::string_view component, std::string_view message)>;

void set_log_level(log_level level) noexcept;
[[nodiscard]] log_level current_log_level() noexcept;

// Passing an empty function restores the std::cerr sink.
void set_log_sink(log_sink sink);

void log(log_level level, std::string_view component, std::string_view message);

[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name) noexcept;
[[nodiscard]] std::string_view log_level_name(log_level level) noexcept;

} // namespace verity
