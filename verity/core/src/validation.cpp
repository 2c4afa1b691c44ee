#include "verity/core/validation.hpp"

namespace verity {

std::string render_message(std::string_view tmpl, const std::vector<message_arg>& args) {
    std::string out;
    out.reserve(tmpl.size() + 16);
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        out.append(tmpl.substr(pos, open - pos));
        std::string_view name = tmpl.substr(open + 1, close - open - 1);
        const message_arg* found = nullptr;
        for (const auto& a : args) {
            if (a.name == name) {
                found = &a;
                break;
            }
        }
        if (found) {
            out.append(found->value);
        } else {
            // Unknown placeholders stay visible.
            out.append(tmpl.substr(open, close - open + 1));
        }
        pos = close + 1;
    }
    return out;
}

constraint_error make_constraint_error(constraint_kind kind, std::vector<message_arg> args) {
    constraint_error e;
    e.kind = kind;
    e.message = render_message(default_message_template(kind), args);
    e.message_id = std::string(constraint_kind_name(kind));
    e.args = std::move(args);
    return e;
}

constraint_error custom_error(std::string message, std::string message_id, std::vector<message_arg> args) {
    constraint_error e;
    e.kind = constraint_kind::custom;
    e.message = render_message(message, args);
    e.message_id = std::move(message_id);
    e.args = std::move(args);
    return e;
}

} // namespace verity
