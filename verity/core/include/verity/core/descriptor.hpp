#pragma once

#include "binding.hpp"
#include "error_tree.hpp"
#include "json_value.hpp"
#include "rules.hpp"
#include "traits.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace verity {

template <typename T> class field_entry {
public:
    explicit field_entry(std::string name) : member_name_(name), wire_name_(std::move(name)) {}
    virtual ~field_entry() = default;

    [[nodiscard]] const std::string& member_name() const noexcept { return member_name_; }
    [[nodiscard]] const std::string& wire_name() const noexcept { return wire_name_; }

    virtual void rename(std::string wire_name) { wire_name_ = std::move(wire_name); }

    // Optional members may be absent on the wire.
    [[nodiscard]] virtual bool optional() const noexcept = 0;
    [[nodiscard]] virtual std::optional<error_tree> validate(const T& obj) const = 0;
    [[nodiscard]] virtual std::optional<bind_error>
    bind(const json_value& in, T& obj, const std::string& path) const = 0;
    [[nodiscard]] virtual json_value schema(schema_detail detail) const = 0;

private:
    std::string member_name_;
    std::string wire_name_;
};

template <typename T, typename V> class member_field final : public field_entry<T> {
public:
    member_field(std::string name, V T::*member, rules<V> r)
        : field_entry<T>(std::move(name)), member_(member), rules_(std::move(r)) {
        rules_.tag_field(this->wire_name());
    }

    void rename(std::string wire_name) override {
        field_entry<T>::rename(std::move(wire_name));
        rules_.tag_field(this->wire_name());
    }

    bool optional() const noexcept override {
        return is_optional<V>::value;
    }

    std::optional<error_tree> validate(const T& obj) const override {
        return rules_.validate(obj.*member_);
    }

    std::optional<bind_error> bind(const json_value& in, T& obj, const std::string& path) const override {
        return bind_value(in, obj.*member_, path);
    }

    json_value schema(schema_detail detail) const override { return rules_.schema(detail); }

private:
    template <typename X> struct is_optional : std::false_type {};
    template <typename X> struct is_optional<std::optional<X>> : std::true_type {};

    V T::*member_;
    rules<V> rules_;
};

// Declarative description of a validatable type, built once and shared by
// every validation, binding and schema generation for that type.
//
//   const type_descriptor<point>& validation_traits<point>::describe() {
//       static const auto d = type_descriptor<point>("point")
//                                 .field("x", &point::x, rules<int>().minimum(0))
//                                 .field("y", &point::y);
//       return d;
//   }
template <typename T> class type_descriptor {
public:
    using object_rule = std::function<std::optional<constraint_error>(const T&)>;

    explicit type_descriptor(std::string title) : title_(std::move(title)) {}

    template <typename V> type_descriptor& field(std::string name, V T::*member, rules<V> r = {}) {
        if (newtype_) {
            throw std::invalid_argument("newtype descriptor cannot take named fields");
        }
        for (const auto& f : fields_) {
            if (f->member_name() == name || f->wire_name() == name) {
                throw std::invalid_argument("duplicate field \"" + name + "\"");
            }
        }
        fields_.push_back(std::make_shared<member_field<T, V>>(std::move(name), member, std::move(r)));
        return *this;
    }

    // Wire name of the most recently declared field. Error paths, binding
    // and schemas use the wire name.
    type_descriptor& rename(std::string wire_name) {
        if (fields_.empty() || newtype_) {
            throw std::invalid_argument("rename() must follow a named field");
        }
        for (size_t i = 0; i + 1 < fields_.size(); ++i) {
            if (fields_[i]->wire_name() == wire_name) {
                throw std::invalid_argument("duplicate field \"" + wire_name + "\"");
            }
        }
        fields_.back()->rename(std::move(wire_name));
        return *this;
    }

    // Whole-object check run after the field checks, whatever their outcome.
    type_descriptor& rule(object_rule fn) {
        rules_.push_back(std::move(fn));
        return *this;
    }

    type_descriptor& deny_unknown_fields() {
        deny_unknown_ = true;
        return *this;
    }

    // Single wrapped value represented on the wire without an enclosing
    // object.
    template <typename V>
    static type_descriptor newtype(std::string title, V T::*member, rules<V> r = {}) {
        type_descriptor d(std::move(title));
        d.fields_.push_back(std::make_shared<member_field<T, V>>("0", member, std::move(r)));
        d.newtype_ = true;
        return d;
    }

    [[nodiscard]] const std::string& title() const noexcept { return title_; }
    [[nodiscard]] bool is_newtype() const noexcept { return newtype_; }
    [[nodiscard]] size_t field_count() const noexcept { return fields_.size(); }

    [[nodiscard]] std::optional<error_tree> validate(const T& obj) const {
        if (newtype_) {
            auto inner = fields_.front()->validate(obj);
            return merge_field_errors(object_errors(obj), std::move(inner));
        }
        error_tree::property_map properties;
        for (const auto& f : fields_) {
            if (auto child = f->validate(obj)) {
                properties.emplace_back(f->wire_name(), std::move(*child));
            }
        }
        return error_tree::make_object(object_errors(obj), std::move(properties));
    }

    [[nodiscard]] std::optional<bind_error>
    bind(const json_value& in, T& obj, const std::string& path = {}) const {
        if (newtype_) {
            return fields_.front()->bind(in, obj, path);
        }
        if (!in.is_object()) {
            return detail::type_mismatch(path, "object", in);
        }
        for (const auto& f : fields_) {
            std::string child = path;
            append_pointer_token(child, f->wire_name());
            const json_value* value = in.find(f->wire_name());
            if (!value) {
                if (f->optional()) {
                    continue;
                }
                return bind_error{path, "missing field \"" + f->wire_name() + "\""};
            }
            if (auto err = f->bind(*value, obj, child)) {
                return err;
            }
        }
        if (deny_unknown_) {
            for (const auto& [key, value] : in.as_object()) {
                if (!find_field(key)) {
                    std::string child = path;
                    append_pointer_token(child, key);
                    return bind_error{child, "unknown field \"" + key + "\""};
                }
            }
        }
        return std::nullopt;
    }

    // Inline schema fragment for this type.
    [[nodiscard]] json_value schema(schema_detail detail = schema_detail::structural) const {
        if (newtype_) {
            return fields_.front()->schema(detail);
        }
        json_value s = json_value::object();
        s["type"] = "object";
        json_value properties = json_value::object();
        json_value required = json_value::array();
        for (const auto& f : fields_) {
            properties[f->wire_name()] = f->schema(detail);
            if (!f->optional()) {
                required.push_back(json_value(f->wire_name()));
            }
        }
        s["properties"] = std::move(properties);
        if (required.size() > 0) {
            s["required"] = std::move(required);
        }
        if (deny_unknown_) {
            s["additionalProperties"] = false;
        }
        return s;
    }

private:
    std::vector<constraint_error> object_errors(const T& obj) const {
        std::vector<constraint_error> errors;
        for (const auto& fn : rules_) {
            if (auto err = fn(obj)) {
                errors.push_back(std::move(*err));
            }
        }
        return errors;
    }

    const field_entry<T>* find_field(std::string_view wire_name) const noexcept {
        for (const auto& f : fields_) {
            if (f->wire_name() == wire_name) {
                return f.get();
            }
        }
        return nullptr;
    }

    std::string title_;
    std::vector<std::shared_ptr<field_entry<T>>> fields_;
    std::vector<object_rule> rules_;
    bool deny_unknown_ = false;
    bool newtype_ = false;
};

inline constexpr std::string_view schema_dialect = "http://json-schema.org/draft-07/schema#";

// Draft-07 document for T with every subschema inlined. The pipeline checks
// the structural form before binding.
template <typename T> json_value generate_schema(schema_detail detail = schema_detail::structural) {
    const auto& d = describe<T>();
    json_value s = json_value::object();
    s["$schema"] = json_value(schema_dialect);
    s["title"] = json_value(d.title());
    json_value body = d.schema(detail);
    for (auto& [key, value] : body.as_object()) {
        s[key] = std::move(value);
    }
    return s;
}

// Validates a standalone instance.
template <typename T> std::optional<error_tree> validate(const T& value) {
    return describe<T>().validate(value);
}

} // namespace verity
