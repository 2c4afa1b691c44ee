#pragma once

#include "descriptor.hpp"
#include "json_schema.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace verity {

// Compiled schemas keyed by declared type. Lookups take a shared lock;
// compilation runs outside any lock, so two threads racing on the first use
// of a type may both compile; the later store wins.
class schema_cache {
public:
    using schema_ptr = std::shared_ptr<const compiled_schema>;

    schema_cache() = default;
    schema_cache(const schema_cache&) = delete;
    schema_cache& operator=(const schema_cache&) = delete;

    // Cache used by the pipeline when none is passed explicitly.
    static schema_cache& global();

    template <typename T> schema_ptr get() {
        return get_or_compile(std::type_index(typeid(T)), describe<T>().title(),
                              [] { return generate_schema<T>(); });
    }

    // A schema that fails to compile is logged and replaced by one that
    // accepts everything, leaving checks to binding and validation.
    schema_ptr get_or_compile(std::type_index key, std::string_view name,
                              const std::function<json_value()>& generate);

    [[nodiscard]] schema_ptr find(std::type_index key) const;
    [[nodiscard]] size_t size() const;
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, schema_ptr> entries_;
};

} // namespace verity
