#pragma once

#include "json_value.hpp"
#include "result.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace verity {

struct schema_violation {
    std::string instance_path; // JSON pointer, "" for the root
    std::string description;

    friend bool operator==(const schema_violation&, const schema_violation&) = default;
};

struct schema_error {
    error_code code = error_code::invalid_schema;
    std::string schema_path; // JSON pointer into the schema document
    std::string reason;
};

// Draft-07 subset compiled into a tree of checks. Unknown keywords are
// ignored; supported keywords with malformed values fail compilation.
class compiled_schema {
public:
    struct node;

    [[nodiscard]] static std::expected<compiled_schema, schema_error> compile(const json_value& schema);

    // Schema that every instance satisfies.
    [[nodiscard]] static compiled_schema accept_all();

    // All violations, in document order.
    [[nodiscard]] std::expected<void, std::vector<schema_violation>> check(const json_value& instance) const;

    [[nodiscard]] bool accepts(const json_value& instance) const;

    // True for accept_all() and the `true` schema, which check nothing.
    [[nodiscard]] bool accepts_everything() const noexcept;

private:
    explicit compiled_schema(std::shared_ptr<const node> root) : root_(std::move(root)) {}

    std::shared_ptr<const node> root_;
};

} // namespace verity
