#pragma once

#include <cstdint>
#include <vector>
#include "unit.hpp"

// Projects the peak disk footprint of one processing stage from raw input bytes.
//
//   projected = raw_total_bytes * ratio
//
// Callers sum all raw inputs of a unit first. Zero bytes project to zero;
// negative bytes throw std::invalid_argument.
class UsageEstimator {
public:
    explicit UsageEstimator(double ratio);

    double estimate(int64_t raw_total_bytes) const;
    double estimate(const std::vector<RawInput>& inputs) const;

    double ratio() const { return ratio_; }

    static double estimate(int64_t raw_total_bytes, double ratio);

private:
    double ratio_;
};
