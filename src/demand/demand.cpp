#include "demand/demand.h"
#include "core/errors.h"
#include <cmath>

namespace cutstock {

size_t Demand::kind_of(Length length) const {
    for (size_t k = 0; k < histogram.size(); ++k) {
        if (histogram[k].length == length) return k;
    }
    return histogram.size();
}

Demand build_demand(Length raw_length, const std::vector<RequiredPart>& parts) {
    if (!std::isfinite(raw_length) || raw_length <= 0.0) {
        throw InvalidInputError("raw stock length must be a positive number, got "
                                + format_length(raw_length));
    }
    if (parts.empty()) {
        throw InvalidInputError("part list is empty: nothing to cut");
    }

    // Validate every row before any flattening work
    for (size_t i = 0; i < parts.size(); ++i) {
        const RequiredPart& p = parts[i];
        if (!std::isfinite(p.length) || p.length <= 0.0) {
            throw InvalidInputError("part " + std::to_string(i + 1)
                                    + ": length must be a positive number, got "
                                    + format_length(p.length));
        }
        if (p.quantity < 1) {
            throw InvalidInputError("part " + std::to_string(i + 1)
                                    + ": quantity must be at least 1, got "
                                    + std::to_string(p.quantity));
        }
        if (p.length > raw_length) {
            throw InfeasiblePartError(p.length, raw_length);
        }
    }

    Demand d;
    d.raw_length = raw_length;

    size_t n_instances = 0;
    for (const auto& p : parts) n_instances += static_cast<size_t>(p.quantity);
    d.instances.reserve(n_instances);
    d.instance_kind.reserve(n_instances);

    for (const auto& p : parts) {
        size_t kind = d.kind_of(p.length);
        if (kind == d.histogram.size()) {
            d.histogram.push_back({p.length, 0});
        }
        d.histogram[kind].count += p.quantity;

        for (int q = 0; q < p.quantity; ++q) {
            d.instances.push_back(p.length);
            d.instance_kind.push_back(static_cast<uint32_t>(kind));
            d.total_length += p.length;
        }
    }
    return d;
}

} // namespace cutstock
