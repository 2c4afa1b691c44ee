#pragma once

#include "constraints.hpp"
#include "error_tree.hpp"
#include "json_value.hpp"
#include "traits.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace verity {

template <typename N> class numeric_rules;
class bool_rules;
class string_rules;
template <typename U> class optional_rules;
template <typename U> class vector_rules;
template <typename U> class map_rules;
template <typename T> class nested_rules;

namespace detail {

template <typename V, typename = void> struct rules_select {};

template <typename N>
struct rules_select<N, std::enable_if_t<std::is_arithmetic_v<N> && !std::is_same_v<N, bool>>> {
    using type = numeric_rules<N>;
};

template <> struct rules_select<bool, void> {
    using type = bool_rules;
};

template <> struct rules_select<std::string, void> {
    using type = string_rules;
};

template <typename U> struct rules_select<std::optional<U>, void> {
    using type = optional_rules<U>;
};

template <typename U> struct rules_select<std::vector<U>, void> {
    using type = vector_rules<U>;
};

template <typename U> struct rules_select<std::map<std::string, U>, void> {
    using type = map_rules<U>;
};

template <typename T> struct rules_select<T, std::enable_if_t<is_validatable_v<T>>> {
    using type = nested_rules<T>;
};

} // namespace detail

// How much of a declaration a generated schema carries. Structural schemas
// hold types, properties, required members, nullability and the range of
// narrow integer types; full schemas add every constraint keyword.
enum class schema_detail : uint8_t { structural, full };

// Field rules for a value of type V. Every shape validates to zero or one
// error node: scalars to a newtype, sequences to an array node keyed by
// index, maps to an object node keyed by map key, validatable values to
// whatever their own descriptor produces.
template <typename V> using rules = typename detail::rules_select<V>::type;

template <typename V> struct value_check {
    std::function<std::optional<constraint_error>(const V&)> fn;
    std::optional<std::string> message;
    std::string message_id;
};

// Checks common to every shape: declaration-ordered constraints with
// optional message overrides, plus the JSON Schema keywords they imply.
template <typename Derived, typename V> class rule_set {
public:
    using value_type = V;
    using check_fn = std::function<std::optional<constraint_error>(const V&)>;

    Derived& custom(check_fn fn) { return add(std::move(fn)); }

    // Replaces the message of the most recently declared constraint.
    // Placeholders refer to the constraint's arguments ("{limit}").
    Derived& with_message(std::string text, std::string message_id = {}) {
        if (checks_.empty()) {
            throw std::invalid_argument("with_message() must follow a constraint");
        }
        checks_.back().message = std::move(text);
        checks_.back().message_id = std::move(message_id);
        return self();
    }

    // Name used to tag failures of custom checks.
    void tag_field(std::string_view name) { field_ = std::string(name); }

    [[nodiscard]] size_t check_count() const noexcept { return checks_.size(); }

    [[nodiscard]] std::vector<constraint_error> direct_errors(const V& value) const {
        std::vector<constraint_error> out;
        for (const auto& check : checks_) {
            auto err = check.fn(value);
            if (!err) {
                continue;
            }
            if (check.message) {
                err->message = render_message(*check.message, err->args);
            }
            if (!check.message_id.empty()) {
                err->message_id = check.message_id;
            }
            if (err->kind == constraint_kind::custom && !field_.empty() && !err->arg("field")) {
                err->args.push_back({"field", field_});
            }
            out.push_back(std::move(*err));
        }
        return out;
    }

protected:
    Derived& add(check_fn fn) {
        checks_.push_back(value_check<V>{std::move(fn), std::nullopt, {}});
        return self();
    }

    Derived& add(check_fn fn, std::string_view keyword, json_value keyword_value) {
        keywords_[keyword] = std::move(keyword_value);
        return add(std::move(fn));
    }

    void append_keywords(json_value& schema, schema_detail detail) const {
        if (detail != schema_detail::full) {
            return;
        }
        for (const auto& [key, value] : keywords_.as_object()) {
            schema[key] = value;
        }
    }

    Derived& self() { return static_cast<Derived&>(*this); }

    std::vector<value_check<V>> checks_;
    json_value keywords_ = json_value::object();
    std::string field_;
};

template <typename N> class numeric_rules : public rule_set<numeric_rules<N>, N> {
public:
    numeric_rules& minimum(N limit) {
        return this->add([limit](const N& v) { return constraints::check_minimum(v, limit); },
                         "minimum", json_value(limit));
    }

    numeric_rules& maximum(N limit) {
        return this->add([limit](const N& v) { return constraints::check_maximum(v, limit); },
                         "maximum", json_value(limit));
    }

    numeric_rules& exclusive_minimum(N limit) {
        return this->add(
            [limit](const N& v) { return constraints::check_exclusive_minimum(v, limit); },
            "exclusiveMinimum", json_value(limit));
    }

    numeric_rules& exclusive_maximum(N limit) {
        return this->add(
            [limit](const N& v) { return constraints::check_exclusive_maximum(v, limit); },
            "exclusiveMaximum", json_value(limit));
    }

    numeric_rules& multiple_of(N divisor) {
        if (!(divisor > N{0})) {
            throw std::invalid_argument("multiple_of divisor must be positive");
        }
        return this->add(
            [divisor](const N& v) { return constraints::check_multiple_of(v, divisor); },
            "multipleOf", json_value(divisor));
    }

    numeric_rules& enumerate(std::vector<N> allowed) {
        json_value list = json_value::array();
        for (N v : allowed) {
            list.push_back(json_value(v));
        }
        return this->add(
            [allowed = std::move(allowed)](const N& v) {
                return constraints::check_enumerate(v, allowed);
            },
            "enum", std::move(list));
    }

    [[nodiscard]] std::optional<error_tree> validate(const N& value) const {
        return error_tree::make_newtype(this->direct_errors(value));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = json_value::object();
        if constexpr (std::is_integral_v<N>) {
            s["type"] = "integer";
            if constexpr (sizeof(N) < sizeof(int64_t)) {
                s["minimum"] = json_value(std::numeric_limits<N>::min());
                s["maximum"] = json_value(std::numeric_limits<N>::max());
            } else if constexpr (std::is_unsigned_v<N>) {
                s["minimum"] = json_value(0);
            }
        } else {
            s["type"] = "number";
        }
        this->append_keywords(s, detail);
        return s;
    }
};

class bool_rules : public rule_set<bool_rules, bool> {
public:
    [[nodiscard]] std::optional<error_tree> validate(const bool& value) const {
        return error_tree::make_newtype(direct_errors(value));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = json_value::object();
        s["type"] = "boolean";
        append_keywords(s, detail);
        return s;
    }
};

class string_rules : public rule_set<string_rules, std::string> {
public:
    string_rules& min_length(size_t limit) {
        return add([limit](const std::string& v) { return constraints::check_min_length(v, limit); },
                   "minLength", json_value(limit));
    }

    string_rules& max_length(size_t limit) {
        return add([limit](const std::string& v) { return constraints::check_max_length(v, limit); },
                   "maxLength", json_value(limit));
    }

    // Throws std::invalid_argument when the expression does not compile.
    string_rules& pattern(std::string expression) {
        auto re = regex_pattern::compile(std::move(expression));
        json_value keyword(re.schema_source());
        return add([re = std::move(re)](const std::string& v) { return constraints::check_pattern(v, re); },
                   "pattern", std::move(keyword));
    }

    string_rules& enumerate(std::vector<std::string> allowed) {
        json_value list = json_value::array();
        for (const auto& v : allowed) {
            list.push_back(json_value(v));
        }
        return add(
            [allowed = std::move(allowed)](const std::string& v) {
                return constraints::check_enumerate(v, allowed);
            },
            "enum", std::move(list));
    }

    [[nodiscard]] std::optional<error_tree> validate(const std::string& value) const {
        return error_tree::make_newtype(direct_errors(value));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = json_value::object();
        s["type"] = "string";
        append_keywords(s, detail);
        return s;
    }
};

// Absent values are never validated.
template <typename U> class optional_rules {
public:
    optional_rules() = default;
    optional_rules(rules<U> inner) : inner_(std::move(inner)) {}

    void tag_field(std::string_view name) { inner_.tag_field(name); }

    [[nodiscard]] std::optional<error_tree> validate(const std::optional<U>& value) const {
        if (!value) {
            return std::nullopt;
        }
        return inner_.validate(*value);
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = inner_.schema(detail);
        if (const json_value* type = s.find("type")) {
            if (type->is_string()) {
                s["type"] = json_value::array({*type, json_value("null")});
            } else if (type->is_array() && !contains_null(*type)) {
                s["type"].push_back(json_value("null"));
            }
        }
        if (const json_value* allowed = s.find("enum"); allowed && !contains_null(*allowed)) {
            s["enum"].push_back(json_value(nullptr));
        }
        return s;
    }

    [[nodiscard]] const rules<U>& inner() const noexcept { return inner_; }

private:
    static bool contains_null(const json_value& list) {
        for (const auto& v : list.as_array()) {
            if (v.is_null() || (v.is_string() && v.as_string() == "null")) {
                return true;
            }
        }
        return false;
    }

    rules<U> inner_;
};

template <typename U> class vector_rules : public rule_set<vector_rules<U>, std::vector<U>> {
public:
    vector_rules& min_items(size_t limit) {
        return this->add(
            [limit](const std::vector<U>& v) { return constraints::check_min_items(v.size(), limit); },
            "minItems", json_value(limit));
    }

    vector_rules& max_items(size_t limit) {
        return this->add(
            [limit](const std::vector<U>& v) { return constraints::check_max_items(v.size(), limit); },
            "maxItems", json_value(limit));
    }

    vector_rules& unique_items() {
        return this->add([](const std::vector<U>& v) { return constraints::check_unique_items(v); },
                         "uniqueItems", json_value(true));
    }

    // Rules applied to every element, results keyed by index.
    vector_rules& items(rules<U> element_rules) {
        items_ = std::move(element_rules);
        items_.tag_field(this->field_);
        return *this;
    }

    void tag_field(std::string_view name) {
        rule_set<vector_rules<U>, std::vector<U>>::tag_field(name);
        items_.tag_field(name);
    }

    [[nodiscard]] std::optional<error_tree> validate(const std::vector<U>& value) const {
        auto own = this->direct_errors(value);
        error_tree::item_map children;
        for (size_t i = 0; i < value.size(); ++i) {
            if (auto child = items_.validate(value[i])) {
                children.emplace_back(i, std::move(*child));
            }
        }
        return error_tree::make_array(std::move(own), std::move(children));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = json_value::object();
        s["type"] = "array";
        s["items"] = items_.schema(detail);
        this->append_keywords(s, detail);
        return s;
    }

private:
    rules<U> items_;
};

template <typename U>
class map_rules : public rule_set<map_rules<U>, std::map<std::string, U>> {
public:
    using map_type = std::map<std::string, U>;

    map_rules& min_properties(size_t limit) {
        return this->add(
            [limit](const map_type& m) { return constraints::check_min_properties(m.size(), limit); },
            "minProperties", json_value(limit));
    }

    map_rules& max_properties(size_t limit) {
        return this->add(
            [limit](const map_type& m) { return constraints::check_max_properties(m.size(), limit); },
            "maxProperties", json_value(limit));
    }

    // Rules applied to every value, results keyed by map key.
    map_rules& values(rules<U> value_rules) {
        values_ = std::move(value_rules);
        values_.tag_field(this->field_);
        return *this;
    }

    void tag_field(std::string_view name) {
        rule_set<map_rules<U>, map_type>::tag_field(name);
        values_.tag_field(name);
    }

    [[nodiscard]] std::optional<error_tree> validate(const map_type& value) const {
        auto own = this->direct_errors(value);
        error_tree::property_map children;
        for (const auto& [key, item] : value) {
            if (auto child = values_.validate(item)) {
                children.emplace_back(key, std::move(*child));
            }
        }
        return error_tree::make_object(std::move(own), std::move(children));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = json_value::object();
        s["type"] = "object";
        s["additionalProperties"] = values_.schema(detail);
        this->append_keywords(s, detail);
        return s;
    }

private:
    rules<U> values_;
};

// A value whose type is validatable: its own descriptor runs and the result
// is embedded as one child. Checks declared here come first.
template <typename T> class nested_rules : public rule_set<nested_rules<T>, T> {
public:
    nested_rules& skip_nested() {
        nested_ = false;
        return *this;
    }

    [[nodiscard]] std::optional<error_tree> validate(const T& value) const {
        auto own = this->direct_errors(value);
        std::optional<error_tree> inner;
        if (nested_) {
            inner = describe<T>().validate(value);
        }
        return merge_field_errors(std::move(own), std::move(inner));
    }

    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        json_value s = describe<T>().schema(detail);
        this->append_keywords(s, detail);
        return s;
    }

private:
    bool nested_ = true;
};

} // namespace verity
