#pragma once
/**
 * Decoder — genotype -> cutting plan
 *
 * Sequential first-fit into the current beam: walk the genes in order, put
 * the part into the open beam if it still fits, otherwise close that beam
 * and open a new one with the part. The last beam is always closed and kept.
 * Deterministic and order-dependent; never fails for a valid genotype over
 * a validated Demand (every part is <= raw length).
 */

#include "core/types.h"
#include "demand/demand.h"
#include "genome/genotype.h"
#include <vector>

namespace cutstock {

// =============================================================================
// Pattern: contents of one beam
// =============================================================================

struct Pattern {
    std::vector<Length> lengths;   // in cutting order
    Length used  = 0.0;            // sum of lengths
    Length waste = 0.0;            // raw_length - used, >= 0
};

// =============================================================================
// CuttingPlan: decoded genotype
// =============================================================================

struct CuttingPlan {
    Length raw_length = 0.0;
    std::vector<Pattern> patterns;

    size_t beam_count() const { return patterns.size(); }

    /** Sum of pattern waste */
    Length genotype_waste() const;

    /** Sum of every cut length (equals the order's total demand) */
    Length all_elements_length() const;

    /** 100 * all_elements_length / (beam_count * raw_length); 0 for an empty plan */
    double surowca_utilization() const;

    /** Number of part instances over all beams */
    size_t part_count() const;
};

CuttingPlan decode(const Genotype& genotype, Length raw_length, const Demand& demand);

} // namespace cutstock
