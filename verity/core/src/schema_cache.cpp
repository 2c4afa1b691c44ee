#include "verity/core/schema_cache.hpp"

#include "verity/core/log.hpp"
#include "verity/core/metrics.hpp"

#include <mutex>
#include <string>

namespace verity {

schema_cache& schema_cache::global() {
    static schema_cache instance;
    return instance;
}

schema_cache::schema_ptr schema_cache::find(std::type_index key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

schema_cache::schema_ptr schema_cache::get_or_compile(std::type_index key, std::string_view name,
                                                      const std::function<json_value()>& generate) {
    if (auto hit = find(key)) {
        global_metrics().schema_cache_hits.fetch_add(1, std::memory_order_relaxed);
        return hit;
    }

    auto compiled = compiled_schema::compile(generate());
    schema_ptr entry;
    if (compiled) {
        entry = std::make_shared<const compiled_schema>(std::move(*compiled));
    } else {
        const auto& err = compiled.error();
        std::string msg = "invalid schema for ";
        msg.append(name);
        msg.append(" at \"");
        msg.append(err.schema_path);
        msg.append("\": ");
        msg.append(err.reason);
        msg.append(" (");
        msg.append(make_error_code(err.code).message());
        msg.append(")");
        log(log_level::error, "schema", msg);
        entry = std::make_shared<const compiled_schema>(compiled_schema::accept_all());
    }
    global_metrics().schema_compilations.fetch_add(1, std::memory_order_relaxed);

    std::unique_lock lock(mutex_);
    entries_[key] = entry;
    return entry;
}

size_t schema_cache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void schema_cache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

} // namespace verity
