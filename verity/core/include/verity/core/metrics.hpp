#pragma once

#include <atomic>
#include <cstdint>

namespace verity {

struct validation_metrics_snapshot {
    uint64_t accepted = 0;
    uint64_t decode_failures = 0;
    uint64_t schema_failures = 0;
    uint64_t validation_failures = 0;
    uint64_t internal_mismatches = 0;
    uint64_t schema_compilations = 0;
    uint64_t schema_cache_hits = 0;

    validation_metrics_snapshot& operator+=(const validation_metrics_snapshot& other) {
        accepted += other.accepted;
        decode_failures += other.decode_failures;
        schema_failures += other.schema_failures;
        validation_failures += other.validation_failures;
        internal_mismatches += other.internal_mismatches;
        schema_compilations += other.schema_compilations;
        schema_cache_hits += other.schema_cache_hits;
        return *this;
    }

    [[nodiscard]] uint64_t rejected() const noexcept {
        return decode_failures + schema_failures + validation_failures + internal_mismatches;
    }
};

struct validation_metrics {
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> decode_failures{0};
    std::atomic<uint64_t> schema_failures{0};
    std::atomic<uint64_t> validation_failures{0};
    std::atomic<uint64_t> internal_mismatches{0};
    std::atomic<uint64_t> schema_compilations{0};
    std::atomic<uint64_t> schema_cache_hits{0};

    void reset() {
        accepted.store(0, std::memory_order_relaxed);
        decode_failures.store(0, std::memory_order_relaxed);
        schema_failures.store(0, std::memory_order_relaxed);
        validation_failures.store(0, std::memory_order_relaxed);
        internal_mismatches.store(0, std::memory_order_relaxed);
        schema_compilations.store(0, std::memory_order_relaxed);
        schema_cache_hits.store(0, std::memory_order_relaxed);
    }

    [[nodiscard]] validation_metrics_snapshot snapshot() const {
        return validation_metrics_snapshot{accepted.load(std::memory_order_relaxed),
                                           decode_failures.load(std::memory_order_relaxed),
                                           schema_failures.load(std::memory_order_relaxed),
                                           validation_failures.load(std::memory_order_relaxed),
                                           internal_mismatches.load(std::memory_order_relaxed),
                                           schema_compilations.load(std::memory_order_relaxed),
                                           schema_cache_hits.load(std::memory_order_relaxed)};
    }
};

// Counters shared by every pipeline and schema cache in the process.
validation_metrics& global_metrics() noexcept;

} // namespace verity
