#include "verity/core/constraints.hpp"

#include <algorithm>
#include <stdexcept>

namespace verity {

size_t utf8_length(std::string_view s) noexcept {
    size_t n = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

regex_pattern regex_pattern::compile(std::string source) {
    bool anchored = !source.empty() && (source.front() == '^' || source.back() == '$');
    try {
        auto re = std::make_shared<const std::regex>(source, std::regex::ECMAScript);
        return regex_pattern(std::move(source), std::move(re), anchored);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid pattern \"" + source + "\": " + e.what());
    }
}

bool regex_pattern::matches(std::string_view s) const {
    if (anchored_) {
        return std::regex_search(s.begin(), s.end(), *re_);
    }
    return std::regex_match(s.begin(), s.end(), *re_);
}

std::string regex_pattern::schema_source() const {
    if (anchored_) {
        return source_;
    }
    return "^(?:" + source_ + ")$";
}

namespace constraints {

bool is_multiple_of(double value, double divisor) noexcept {
    if (!std::isfinite(value) || !std::isfinite(divisor) || divisor == 0.0) {
        return false;
    }
    double q = value / divisor;
    return std::fabs(q - std::round(q)) <= multiple_of_tolerance * std::max(1.0, std::fabs(q));
}

std::optional<constraint_error> check_min_length(std::string_view value, size_t limit) {
    if (utf8_length(value) < limit) {
        return make_constraint_error(constraint_kind::min_length, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_max_length(std::string_view value, size_t limit) {
    if (utf8_length(value) > limit) {
        return make_constraint_error(constraint_kind::max_length, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_pattern(std::string_view value, const regex_pattern& pattern) {
    if (!pattern.matches(value)) {
        return make_constraint_error(constraint_kind::pattern, {{"pattern", pattern.source()}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_min_items(size_t count, size_t limit) {
    if (count < limit) {
        return make_constraint_error(constraint_kind::min_items, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_max_items(size_t count, size_t limit) {
    if (count > limit) {
        return make_constraint_error(constraint_kind::max_items, {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_min_properties(size_t count, size_t limit) {
    if (count < limit) {
        return make_constraint_error(constraint_kind::min_properties,
                                     {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

std::optional<constraint_error> check_max_properties(size_t count, size_t limit) {
    if (count > limit) {
        return make_constraint_error(constraint_kind::max_properties,
                                     {{"limit", value_text(limit)}});
    }
    return std::nullopt;
}

} // namespace constraints
} // namespace verity
