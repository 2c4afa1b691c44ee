#include "verity/core/json_schema.hpp"

#include "verity/core/constraints.hpp"
#include "verity/core/error_tree.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <utility>

namespace verity {

struct compiled_schema::node {
    std::optional<bool> constant; // true / false schemas
    std::vector<std::string> types;
    std::optional<json_value> allowed; // "enum"
    std::optional<json_value> expected; // "const"

    std::optional<json_value> minimum;
    std::optional<json_value> maximum;
    std::optional<json_value> exclusive_minimum;
    std::optional<json_value> exclusive_maximum;
    std::optional<json_value> multiple_of;

    std::optional<uint64_t> min_length;
    std::optional<uint64_t> max_length;
    std::string pattern_source;
    std::shared_ptr<const std::regex> pattern;

    std::optional<uint64_t> min_items;
    std::optional<uint64_t> max_items;
    bool unique_items = false;
    std::shared_ptr<const node> items;

    std::optional<uint64_t> min_properties;
    std::optional<uint64_t> max_properties;
    std::vector<std::pair<std::string, std::shared_ptr<const node>>> properties;
    std::vector<std::string> required;
    std::shared_ptr<const node> additional;
};

namespace {

using node = compiled_schema::node;

bool known_type(std::string_view t) {
    return t == "null" || t == "boolean" || t == "integer" || t == "number" || t == "string" ||
           t == "array" || t == "object";
}

bool matches_type(const json_value& v, std::string_view t) {
    if (t == "null") {
        return v.is_null();
    }
    if (t == "boolean") {
        return v.is_bool();
    }
    if (t == "integer") {
        return v.is_integer();
    }
    if (t == "number") {
        return v.is_number();
    }
    if (t == "string") {
        return v.is_string();
    }
    if (t == "array") {
        return v.is_array();
    }
    if (t == "object") {
        return v.is_object();
    }
    return false;
}

bool exact_integer(const json_value& v) {
    return v.type() == json_value::kind::integer || v.type() == json_value::kind::unsigned_integer;
}

// -1, 0 or 1. Integers compare exactly, anything else as double.
int compare_numbers(const json_value& a, const json_value& b) {
    if (exact_integer(a) && exact_integer(b)) {
        bool a_neg = a.type() == json_value::kind::integer && a.as_int64() < 0;
        bool b_neg = b.type() == json_value::kind::integer && b.as_int64() < 0;
        if (a_neg != b_neg) {
            return a_neg ? -1 : 1;
        }
        if (a_neg) {
            int64_t x = a.as_int64();
            int64_t y = b.as_int64();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        uint64_t x = a.as_uint64();
        uint64_t y = b.as_uint64();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    double x = a.as_double();
    double y = b.as_double();
    return x < y ? -1 : (x > y ? 1 : 0);
}

bool multiple_of(const json_value& v, const json_value& d) {
    if (exact_integer(v) && exact_integer(d)) {
        uint64_t divisor = d.as_uint64();
        uint64_t magnitude = v.type() == json_value::kind::integer && v.as_int64() < 0
                                 ? 0 - static_cast<uint64_t>(v.as_int64())
                                 : v.as_uint64();
        return magnitude % divisor == 0;
    }
    return constraints::is_multiple_of(v.as_double(), d.as_double());
}

class schema_compiler {
public:
    std::expected<std::shared_ptr<const node>, schema_error> compile(const json_value& s, const std::string& path) {
        auto n = std::make_shared<node>();
        if (s.is_bool()) {
            n->constant = s.as_bool();
            return n;
        }
        if (!s.is_object()) {
            return fail(path, "schema must be an object or a boolean");
        }

        if (const json_value* t = s.find("type")) {
            if (t->is_string()) {
                if (!known_type(t->as_string())) {
                    return fail(path + "/type", "unknown type \"" + t->as_string() + "\"");
                }
                n->types.push_back(t->as_string());
            } else if (t->is_array()) {
                for (const auto& item : t->as_array()) {
                    if (!item.is_string() || !known_type(item.as_string())) {
                        return fail(path + "/type", "type list must hold known type names");
                    }
                    n->types.push_back(item.as_string());
                }
            } else {
                return fail(path + "/type", "type must be a string or an array");
            }
        }

        if (const json_value* e = s.find("enum")) {
            if (!e->is_array()) {
                return fail(path + "/enum", "enum must be an array");
            }
            n->allowed = *e;
        }
        if (const json_value* c = s.find("const")) {
            n->expected = *c;
        }

        if (!number_keyword(s, path, "minimum", n->minimum) ||
            !number_keyword(s, path, "maximum", n->maximum) ||
            !number_keyword(s, path, "exclusiveMinimum", n->exclusive_minimum) ||
            !number_keyword(s, path, "exclusiveMaximum", n->exclusive_maximum) ||
            !number_keyword(s, path, "multipleOf", n->multiple_of)) {
            return std::unexpected(std::move(error_));
        }
        if (n->multiple_of && !(n->multiple_of->as_double() > 0.0)) {
            return fail(path + "/multipleOf", "multipleOf must be greater than 0");
        }

        if (!count_keyword(s, path, "minLength", n->min_length) ||
            !count_keyword(s, path, "maxLength", n->max_length) ||
            !count_keyword(s, path, "minItems", n->min_items) ||
            !count_keyword(s, path, "maxItems", n->max_items) ||
            !count_keyword(s, path, "minProperties", n->min_properties) ||
            !count_keyword(s, path, "maxProperties", n->max_properties)) {
            return std::unexpected(std::move(error_));
        }

        if (const json_value* p = s.find("pattern")) {
            if (!p->is_string()) {
                return fail(path + "/pattern", "pattern must be a string");
            }
            try {
                n->pattern = std::make_shared<const std::regex>(p->as_string(), std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                schema_error err{error_code::invalid_pattern, path + "/pattern", e.what()};
                return std::unexpected(std::move(err));
            }
            n->pattern_source = p->as_string();
        }

        if (const json_value* u = s.find("uniqueItems")) {
            if (!u->is_bool()) {
                return fail(path + "/uniqueItems", "uniqueItems must be a boolean");
            }
            n->unique_items = u->as_bool();
        }

        if (const json_value* items = s.find("items")) {
            if (items->is_array()) {
                return fail(path + "/items", "tuple items are not supported");
            }
            auto child = compile(*items, path + "/items");
            if (!child) {
                return std::unexpected(std::move(child.error()));
            }
            n->items = std::move(*child);
        }

        if (const json_value* props = s.find("properties")) {
            if (!props->is_object()) {
                return fail(path + "/properties", "properties must be an object");
            }
            for (const auto& [key, sub] : props->as_object()) {
                std::string child_path = path + "/properties";
                append_pointer_token(child_path, key);
                auto child = compile(sub, child_path);
                if (!child) {
                    return std::unexpected(std::move(child.error()));
                }
                n->properties.emplace_back(key, std::move(*child));
            }
        }

        if (const json_value* req = s.find("required")) {
            if (!req->is_array()) {
                return fail(path + "/required", "required must be an array");
            }
            for (const auto& item : req->as_array()) {
                if (!item.is_string()) {
                    return fail(path + "/required", "required must hold strings");
                }
                n->required.push_back(item.as_string());
            }
        }

        if (const json_value* extra = s.find("additionalProperties")) {
            auto child = compile(*extra, path + "/additionalProperties");
            if (!child) {
                return std::unexpected(std::move(child.error()));
            }
            n->additional = std::move(*child);
        }

        return n;
    }

private:
    std::unexpected<schema_error> fail(std::string path, std::string reason) {
        return std::unexpected(schema_error{error_code::invalid_schema, std::move(path), std::move(reason)});
    }

    bool number_keyword(const json_value& s, const std::string& path, std::string_view key,
                        std::optional<json_value>& out) {
        const json_value* v = s.find(key);
        if (!v) {
            return true;
        }
        if (!v->is_number()) {
            error_ = schema_error{error_code::invalid_schema, path + "/" + std::string(key),
                                  std::string(key) + " must be a number"};
            return false;
        }
        out = *v;
        return true;
    }

    bool count_keyword(const json_value& s, const std::string& path, std::string_view key,
                       std::optional<uint64_t>& out) {
        const json_value* v = s.find(key);
        if (!v) {
            return true;
        }
        if (!v->is_integer() || (v->type() == json_value::kind::integer && v->as_int64() < 0) ||
            (v->type() == json_value::kind::number && v->as_double() < 0)) {
            error_ = schema_error{error_code::invalid_schema, path + "/" + std::string(key),
                                  std::string(key) + " must be a non-negative integer"};
            return false;
        }
        out = v->as_uint64();
        return true;
    }

    schema_error error_;
};

std::string plural(uint64_t n, std::string_view one, std::string_view many) {
    return std::to_string(n) + " " + std::string(n == 1 ? one : many);
}

class schema_checker {
public:
    explicit schema_checker(std::vector<schema_violation>& out) : out_(out) {}

    void check(const node& n, const json_value& v, const std::string& path) {
        if (n.constant) {
            if (!*n.constant) {
                report(path, "False schema does not allow " + to_string(v));
            }
            return;
        }

        if (!n.types.empty()) {
            bool ok = false;
            for (const auto& t : n.types) {
                if (matches_type(v, t)) {
                    ok = true;
                    break;
                }
            }
            if (!ok) {
                report(path, to_string(v) + " is not of " + type_list(n.types));
                return;
            }
        }

        if (n.allowed) {
            bool found = false;
            for (const auto& candidate : n.allowed->as_array()) {
                if (candidate == v) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                report(path, to_string(v) + " is not one of " + to_string(*n.allowed));
            }
        }
        if (n.expected && !(*n.expected == v)) {
            report(path, to_string(*n.expected) + " was expected");
        }

        if (v.is_number()) {
            check_number(n, v, path);
        } else if (v.is_string()) {
            check_string(n, v, path);
        } else if (v.is_array()) {
            check_array(n, v, path);
        } else if (v.is_object()) {
            check_object(n, v, path);
        }
    }

private:
    void report(const std::string& path, std::string description) {
        out_.push_back(schema_violation{path, std::move(description)});
    }

    static std::string type_list(const std::vector<std::string>& types) {
        std::string out = types.size() == 1 ? "type " : "types ";
        for (size_t i = 0; i < types.size(); ++i) {
            if (i > 0) {
                out.append(", ");
            }
            out.push_back('"');
            out.append(types[i]);
            out.push_back('"');
        }
        return out;
    }

    void check_number(const node& n, const json_value& v, const std::string& path) {
        if (n.minimum && compare_numbers(v, *n.minimum) < 0) {
            report(path, to_string(v) + " is less than the minimum of " + to_string(*n.minimum));
        }
        if (n.maximum && compare_numbers(v, *n.maximum) > 0) {
            report(path, to_string(v) + " is greater than the maximum of " + to_string(*n.maximum));
        }
        if (n.exclusive_minimum && compare_numbers(v, *n.exclusive_minimum) <= 0) {
            report(path, to_string(v) + " is less than or equal to the minimum of " +
                             to_string(*n.exclusive_minimum));
        }
        if (n.exclusive_maximum && compare_numbers(v, *n.exclusive_maximum) >= 0) {
            report(path, to_string(v) + " is greater than or equal to the maximum of " +
                             to_string(*n.exclusive_maximum));
        }
        if (n.multiple_of && !multiple_of(v, *n.multiple_of)) {
            report(path, to_string(v) + " is not a multiple of " + to_string(*n.multiple_of));
        }
    }

    void check_string(const node& n, const json_value& v, const std::string& path) {
        size_t length = utf8_length(v.as_string());
        if (n.min_length && length < *n.min_length) {
            report(path, to_string(v) + " is shorter than " + plural(*n.min_length, "character", "characters"));
        }
        if (n.max_length && length > *n.max_length) {
            report(path, to_string(v) + " is longer than " + plural(*n.max_length, "character", "characters"));
        }
        if (n.pattern && !std::regex_search(v.as_string(), *n.pattern)) {
            std::string quoted;
            append_escaped(n.pattern_source, quoted);
            report(path, to_string(v) + " does not match " + quoted);
        }
    }

    void check_array(const node& n, const json_value& v, const std::string& path) {
        const auto& items = v.as_array();
        if (n.min_items && items.size() < *n.min_items) {
            report(path, to_string(v) + " has less than " + plural(*n.min_items, "item", "items"));
        }
        if (n.max_items && items.size() > *n.max_items) {
            report(path, to_string(v) + " has more than " + plural(*n.max_items, "item", "items"));
        }
        if (n.unique_items && !unique(items)) {
            report(path, to_string(v) + " has non-unique elements");
        }
        if (n.items) {
            for (size_t i = 0; i < items.size(); ++i) {
                std::string child = path;
                append_pointer_token(child, std::to_string(i));
                check(*n.items, items[i], child);
            }
        }
    }

    static bool unique(const json_value::array_t& items) {
        for (size_t i = 0; i < items.size(); ++i) {
            for (size_t j = i + 1; j < items.size(); ++j) {
                if (items[i] == items[j]) {
                    return false;
                }
            }
        }
        return true;
    }

    void check_object(const node& n, const json_value& v, const std::string& path) {
        const auto& members = v.as_object();
        for (const auto& name : n.required) {
            if (!v.contains(name)) {
                std::string quoted;
                append_escaped(name, quoted);
                report(path, quoted + " is a required property");
            }
        }
        if (n.min_properties && members.size() < *n.min_properties) {
            report(path, to_string(v) + " has less than " +
                             plural(*n.min_properties, "property", "properties"));
        }
        if (n.max_properties && members.size() > *n.max_properties) {
            report(path, to_string(v) + " has more than " +
                             plural(*n.max_properties, "property", "properties"));
        }
        for (const auto& [key, sub] : n.properties) {
            if (const json_value* child_value = v.find(key)) {
                std::string child = path;
                append_pointer_token(child, key);
                check(*sub, *child_value, child);
            }
        }
        if (!n.additional) {
            return;
        }
        std::vector<std::string> unexpected;
        for (const auto& [key, child_value] : members) {
            if (declared(n, key)) {
                continue;
            }
            if (n.additional->constant && !*n.additional->constant) {
                unexpected.push_back(key);
                continue;
            }
            std::string child = path;
            append_pointer_token(child, key);
            check(*n.additional, child_value, child);
        }
        if (!unexpected.empty()) {
            std::string list;
            for (size_t i = 0; i < unexpected.size(); ++i) {
                if (i > 0) {
                    list.append(", ");
                }
                list.append("'" + unexpected[i] + "'");
            }
            report(path, "Additional properties are not allowed (" + list +
                             (unexpected.size() == 1 ? " was unexpected)" : " were unexpected)"));
        }
    }

    static bool declared(const node& n, std::string_view key) {
        for (const auto& [name, sub] : n.properties) {
            if (name == key) {
                return true;
            }
        }
        return false;
    }

    std::vector<schema_violation>& out_;
};

} // namespace

std::expected<compiled_schema, schema_error> compiled_schema::compile(const json_value& schema) {
    schema_compiler compiler;
    auto root = compiler.compile(schema, "");
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }
    return compiled_schema(std::move(*root));
}

compiled_schema compiled_schema::accept_all() {
    auto n = std::make_shared<node>();
    n->constant = true;
    return compiled_schema(std::move(n));
}

bool compiled_schema::accepts_everything() const noexcept {
    return root_->constant && *root_->constant;
}

std::expected<void, std::vector<schema_violation>> compiled_schema::check(const json_value& instance) const {
    std::vector<schema_violation> violations;
    schema_checker(violations).check(*root_, instance, "");
    if (!violations.empty()) {
        return std::unexpected(std::move(violations));
    }
    return {};
}

bool compiled_schema::accepts(const json_value& instance) const {
    return check(instance).has_value();
}

} // namespace verity
