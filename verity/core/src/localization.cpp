#include "verity/core/localization.hpp"

#include "verity/core/serde.hpp"

#include <cctype>
#include <utility>

namespace verity {
namespace {

bool is_identifier(std::string_view id) {
    if (id.empty() || !std::isalpha(static_cast<unsigned char>(id.front()))) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

// Variable name of a "{ $name }" placeable, empty when malformed.
std::string_view placeable_variable(std::string_view inner) {
    inner = serde::trim_view(inner);
    if (inner.size() < 2 || inner.front() != '$') {
        return {};
    }
    inner.remove_prefix(1);
    return is_identifier(inner) ? inner : std::string_view{};
}

bool well_formed(std::string_view pattern) {
    size_t pos = 0;
    while ((pos = pattern.find('{', pos)) != std::string_view::npos) {
        size_t close = pattern.find('}', pos);
        if (close == std::string_view::npos ||
            placeable_variable(pattern.substr(pos + 1, close - pos - 1)).empty()) {
            return false;
        }
        pos = close + 1;
    }
    return true;
}

} // namespace

result<ftl_catalog> ftl_catalog::parse(std::string_view source) {
    ftl_catalog catalog;
    std::string current;
    size_t pos = 0;
    while (pos <= source.size()) {
        size_t end = source.find('\n', pos);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        std::string_view line = source.substr(pos, end - pos);
        pos = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        std::string_view trimmed = serde::trim_view(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        if (line.front() == ' ' || line.front() == '\t') {
            // Continuation of a multiline value.
            if (current.empty()) {
                return std::unexpected(make_error_code(error_code::invalid_catalog));
            }
            auto& text = catalog.entries_[current];
            if (!text.empty()) {
                text.push_back('\n');
            }
            text.append(trimmed);
            continue;
        }

        size_t eq = trimmed.find('=');
        if (eq == std::string_view::npos) {
            return std::unexpected(make_error_code(error_code::invalid_catalog));
        }
        std::string_view id = serde::trim_view(trimmed.substr(0, eq));
        if (!is_identifier(id)) {
            return std::unexpected(make_error_code(error_code::invalid_catalog));
        }
        current = std::string(id);
        catalog.entries_[current] = std::string(serde::trim_view(trimmed.substr(eq + 1)));
    }

    for (const auto& [id, text] : catalog.entries_) {
        if (!well_formed(text)) {
            return std::unexpected(make_error_code(error_code::invalid_catalog));
        }
    }
    return catalog;
}

void ftl_catalog::add(std::string id, std::string pattern) {
    entries_.insert_or_assign(std::move(id), std::move(pattern));
}

std::optional<std::string> ftl_catalog::translate(std::string_view message_id,
                                                  const std::vector<message_arg>& args) const {
    auto it = entries_.find(std::string(message_id));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    std::string_view pattern = it->second;
    std::string out;
    out.reserve(pattern.size());
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(pattern.substr(pos));
            break;
        }
        size_t close = pattern.find('}', open);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        out.append(pattern.substr(pos, open - pos));
        std::string_view name = placeable_variable(pattern.substr(open + 1, close - open - 1));
        const message_arg* found = nullptr;
        for (const auto& a : args) {
            if (a.name == name) {
                found = &a;
                break;
            }
        }
        if (name.empty() || !found) {
            return std::nullopt;
        }
        out.append(found->value);
        pos = close + 1;
    }
    return out;
}

std::string translate(const constraint_error& error, const message_catalog& catalog) {
    if (auto text = catalog.translate(error.message_id, error.args)) {
        return std::move(*text);
    }
    return error.message_id;
}

message_tree translate(const error_tree& tree, const message_catalog& catalog) {
    return tree.map([&catalog](const constraint_error& e) { return translate(e, catalog); });
}

} // namespace verity
