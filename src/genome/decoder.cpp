#include "genome/decoder.h"
#include <algorithm>
#include <utility>

namespace cutstock {

Length CuttingPlan::genotype_waste() const {
    Length total = 0.0;
    for (const auto& p : patterns) total += p.waste;
    return total;
}

Length CuttingPlan::all_elements_length() const {
    Length total = 0.0;
    for (const auto& p : patterns) {
        for (Length l : p.lengths) total += l;
    }
    return total;
}

double CuttingPlan::surowca_utilization() const {
    if (patterns.empty() || raw_length <= 0.0) return 0.0;
    return 100.0 * all_elements_length()
         / (static_cast<double>(patterns.size()) * raw_length);
}

size_t CuttingPlan::part_count() const {
    size_t n = 0;
    for (const auto& p : patterns) n += p.lengths.size();
    return n;
}

// =============================================================================
// decode
// =============================================================================

CuttingPlan decode(const Genotype& genotype, Length raw_length, const Demand& demand) {
    CuttingPlan plan;
    plan.raw_length = raw_length;

    auto close_beam = [&](Pattern& beam) {
        beam.waste = std::max<Length>(0.0, raw_length - beam.used);
        plan.patterns.push_back(std::move(beam));
        beam = Pattern{};
    };

    Pattern current;
    for (uint32_t gene : genotype.order) {
        Length len = demand.instances[gene];
        if (!current.lengths.empty() && current.used + len > raw_length + kLengthTolerance) {
            close_beam(current);
        }
        current.lengths.push_back(len);
        current.used += len;
    }
    if (!current.lengths.empty()) close_beam(current);

    return plan;
}

} // namespace cutstock
