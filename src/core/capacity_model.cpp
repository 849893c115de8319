#include "capacity_model.hpp"
#include "size_units.hpp"
#include <fmt/format.h>
#include <algorithm>

int64_t local_budget(const CapacitySnapshot& s) {
    return std::min(s.max_usage, s.free_space) - s.current_usage - s.min_free;
}

int64_t remote_budget(const CapacitySnapshot& s) {
    int64_t ceiling = std::min(s.max_usage, s.free_space);
    return std::min(ceiling - s.current_usage, s.free_space - s.min_free);
}

int64_t budget(const CapacitySnapshot& s, CapacityVariant variant) {
    return variant == CapacityVariant::Local ? local_budget(s) : remote_budget(s);
}

std::string describe(const CapacitySnapshot& s, CapacityVariant variant) {
    return fmt::format("{} free={} max_usage={} min_free={} {}={} -> free_to_use={}",
                       variant == CapacityVariant::Local ? "local" : "remote",
                       format_size(static_cast<double>(s.free_space)),
                       format_size(static_cast<double>(s.max_usage)),
                       format_size(static_cast<double>(s.min_free)),
                       variant == CapacityVariant::Local ? "current_usage" : "estimated_usage",
                       format_size(static_cast<double>(s.current_usage)),
                       format_size(static_cast<double>(budget(s, variant))));
}
