#pragma once

#include "error_tree.hpp"
#include "result.hpp"
#include "validation.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace verity {

class message_catalog {
public:
    virtual ~message_catalog() = default;

    // nullopt when the identifier is unknown or an argument is missing.
    [[nodiscard]] virtual std::optional<std::string>
    translate(std::string_view message_id, const std::vector<message_arg>& args) const = 0;
};

// Fluent-style catalog: one "id = text" entry per line, "{ $name }"
// placeables, '#' comments.
class ftl_catalog final : public message_catalog {
public:
    // Fails with error_code::invalid_catalog on a malformed entry.
    [[nodiscard]] static result<ftl_catalog> parse(std::string_view source);

    void add(std::string id, std::string pattern);

    [[nodiscard]] std::optional<std::string>
    translate(std::string_view message_id, const std::vector<message_arg>& args) const override;

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<std::string, std::string> entries_;
};

// Localized text of one failure; falls back to the message identifier.
[[nodiscard]] std::string translate(const constraint_error& error, const message_catalog& catalog);

// Same shape, every leaf localized.
[[nodiscard]] message_tree translate(const error_tree& tree, const message_catalog& catalog);

// Already localized trees pass through unchanged.
[[nodiscard]] inline message_tree translate(const message_tree& tree, const message_catalog&) {
    return tree;
}

} // namespace verity
