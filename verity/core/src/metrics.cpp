#include "verity/core/metrics.hpp"

namespace verity {

validation_metrics& global_metrics() noexcept {
    static validation_metrics instance;
    return instance;
}

} // namespace verity
