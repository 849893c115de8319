#include "usage_estimator.hpp"
#include <fmt/format.h>
#include <stdexcept>

UsageEstimator::UsageEstimator(double ratio) : ratio_(ratio) {
    if (!(ratio > 0)) {
        throw std::invalid_argument(fmt::format("usage ratio must be positive, got {}", ratio));
    }
}

double UsageEstimator::estimate(int64_t raw_total_bytes, double ratio) {
    if (raw_total_bytes < 0) {
        throw std::invalid_argument(
            fmt::format("raw byte total must not be negative, got {}", raw_total_bytes));
    }
    return static_cast<double>(raw_total_bytes) * ratio;
}

double UsageEstimator::estimate(int64_t raw_total_bytes) const {
    return estimate(raw_total_bytes, ratio_);
}

double UsageEstimator::estimate(const std::vector<RawInput>& inputs) const {
    return estimate(total_bytes(inputs), ratio_);
}
