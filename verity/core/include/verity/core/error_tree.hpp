#pragma once

#include "json_value.hpp"
#include "validation.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace verity {

// Shaped failure record for one validation run. The tree mirrors the value:
// objects key children by (wire) field name, arrays by element index, and a
// newtype holds the failures of a single unstructured value. A tree is never
// empty; success is the absence of a tree.
template <typename E> class validation_errors {
public:
    enum class kind : uint8_t { object, array, newtype };

    using error_list = std::vector<E>;
    using property_map = std::vector<std::pair<std::string, validation_errors>>;
    using item_map = std::vector<std::pair<size_t, validation_errors>>;

    static std::optional<validation_errors> make_object(error_list errors, property_map properties) {
        if (errors.empty() && properties.empty()) {
            return std::nullopt;
        }
        validation_errors e(kind::object);
        e.errors_ = std::move(errors);
        e.properties_ = std::move(properties);
        return e;
    }

    static std::optional<validation_errors> make_array(error_list errors, item_map items) {
        if (errors.empty() && items.empty()) {
            return std::nullopt;
        }
        validation_errors e(kind::array);
        e.errors_ = std::move(errors);
        e.items_ = std::move(items);
        return e;
    }

    static std::optional<validation_errors> make_newtype(error_list errors) {
        if (errors.empty()) {
            return std::nullopt;
        }
        validation_errors e(kind::newtype);
        e.errors_ = std::move(errors);
        return e;
    }

    [[nodiscard]] kind shape() const noexcept { return kind_; }
    [[nodiscard]] const error_list& errors() const noexcept { return errors_; }
    [[nodiscard]] const property_map& properties() const noexcept { return properties_; }
    [[nodiscard]] const item_map& items() const noexcept { return items_; }

    [[nodiscard]] const validation_errors* property(std::string_view name) const noexcept {
        for (const auto& [key, child] : properties_) {
            if (key == name) {
                return &child;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const validation_errors* item(size_t index) const noexcept {
        for (const auto& [idx, child] : items_) {
            if (idx == index) {
                return &child;
            }
        }
        return nullptr;
    }

    // Direct failures in this node and all descendants.
    [[nodiscard]] size_t leaf_count() const noexcept {
        size_t n = errors_.size();
        for (const auto& [key, child] : properties_) {
            n += child.leaf_count();
        }
        for (const auto& [idx, child] : items_) {
            n += child.leaf_count();
        }
        return n;
    }

    // Puts `own` in front of this node's direct failures. Used when a field
    // carries constraints of its own next to a nested delegate.
    void prepend_errors(error_list own) {
        if (own.empty()) {
            return;
        }
        own.insert(own.end(),
                   std::make_move_iterator(errors_.begin()),
                   std::make_move_iterator(errors_.end()));
        errors_ = std::move(own);
    }

    void append_errors(error_list more) {
        errors_.insert(errors_.end(),
                       std::make_move_iterator(more.begin()),
                       std::make_move_iterator(more.end()));
    }

    // Structure-preserving leaf conversion.
    template <typename F>
    [[nodiscard]] auto map(F&& f) const -> validation_errors<std::decay_t<decltype(f(std::declval<const E&>()))>> {
        using U = std::decay_t<decltype(f(std::declval<const E&>()))>;
        validation_errors<U> out(static_cast<typename validation_errors<U>::kind>(kind_));
        out.errors_.reserve(errors_.size());
        for (const auto& e : errors_) {
            out.errors_.push_back(f(e));
        }
        out.properties_.reserve(properties_.size());
        for (const auto& [key, child] : properties_) {
            out.properties_.emplace_back(key, child.map(f));
        }
        out.items_.reserve(items_.size());
        for (const auto& [idx, child] : items_) {
            out.items_.emplace_back(idx, child.map(f));
        }
        return out;
    }

    friend bool operator==(const validation_errors& a, const validation_errors& b) {
        return a.kind_ == b.kind_ && a.errors_ == b.errors_ && a.properties_ == b.properties_ &&
               a.items_ == b.items_;
    }

private:
    template <typename> friend class validation_errors;

    explicit validation_errors(kind k) : kind_(k) {}

    kind kind_;
    error_list errors_;
    property_map properties_;
    item_map items_;
};

using error_tree = validation_errors<constraint_error>;
using message_tree = validation_errors<std::string>;

// Merges the direct failures of a field with the result of its nested
// delegate (element rules, a validatable value). Own failures come first.
template <typename E>
std::optional<validation_errors<E>> merge_field_errors(std::vector<E> own,
                                                       std::optional<validation_errors<E>> nested) {
    if (!nested) {
        return validation_errors<E>::make_newtype(std::move(own));
    }
    nested->prepend_errors(std::move(own));
    return nested;
}

inline const std::string& leaf_message(const constraint_error& e) noexcept {
    return e.message;
}
inline const std::string& leaf_message(const std::string& s) noexcept {
    return s;
}

struct flat_error {
    std::string path; // JSON pointer, "" for the root
    std::string message;

    friend bool operator==(const flat_error&, const flat_error&) = default;
};

void append_pointer_token(std::string& path, std::string_view token);

namespace detail {

template <typename E>
void flatten_into(const validation_errors<E>& node, const std::string& path, std::vector<flat_error>& out) {
    for (const auto& e : node.errors()) {
        out.push_back(flat_error{path, leaf_message(e)});
    }
    for (const auto& [key, child] : node.properties()) {
        std::string child_path = path;
        append_pointer_token(child_path, key);
        flatten_into(child, child_path, out);
    }
    for (const auto& [idx, child] : node.items()) {
        std::string child_path = path;
        append_pointer_token(child_path, std::to_string(idx));
        flatten_into(child, child_path, out);
    }
}

template <typename E> json_value messages_json(const std::vector<E>& errors) {
    json_value arr = json_value::array();
    for (const auto& e : errors) {
        arr.push_back(json_value(leaf_message(e)));
    }
    return arr;
}

} // namespace detail

// Depth-first (path, message) list: a node's own failures, then its
// properties or items in order.
template <typename E> std::vector<flat_error> flatten(const validation_errors<E>& tree) {
    std::vector<flat_error> out;
    detail::flatten_into(tree, std::string{}, out);
    return out;
}

// Nested rendering: objects become {"errors":[..],"properties":{..}}, arrays
// {"errors":[..],"items":{"<index>":..}}, newtypes a plain list of messages.
template <typename E> json_value to_json(const validation_errors<E>& tree) {
    using node = validation_errors<E>;
    switch (tree.shape()) {
    case node::kind::newtype:
        return detail::messages_json(tree.errors());
    case node::kind::object: {
        json_value out = json_value::object();
        out["errors"] = detail::messages_json(tree.errors());
        json_value props = json_value::object();
        for (const auto& [key, child] : tree.properties()) {
            props[key] = to_json(child);
        }
        out["properties"] = std::move(props);
        return out;
    }
    case node::kind::array: {
        json_value out = json_value::object();
        out["errors"] = detail::messages_json(tree.errors());
        json_value items = json_value::object();
        for (const auto& [idx, child] : tree.items()) {
            items[std::to_string(idx)] = to_json(child);
        }
        out["items"] = std::move(items);
        return out;
    }
    }
    return json_value{};
}

template <typename E> std::string to_string(const validation_errors<E>& tree) {
    return to_string(to_json(tree));
}

// Replaces every failure by its rendered message.
inline message_tree to_message_tree(const error_tree& tree) {
    return tree.map([](const constraint_error& e) { return e.message; });
}

} // namespace verity
