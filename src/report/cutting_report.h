#pragma once
/**
 * CuttingReport — what the result page renders
 *
 * Pure assembly of fields already available on Demand and the optimizer's
 * best CuttingPlan: totals, utilization, the per-length demand table, the
 * beam list for the plot, and identical beams grouped as "N x pattern" rows.
 * Display rounding (two decimals for utilization) is left to the renderer.
 */

#include "core/types.h"
#include "demand/demand.h"
#include "genome/decoder.h"
#include "engine/optimizer.h"
#include <string>
#include <vector>

namespace cutstock {

// =============================================================================
// PatternGroup: identical beams reported once
// =============================================================================

struct PatternGroup {
    std::vector<Length> lengths;   // cutting order of the first such beam
    Length waste      = 0.0;
    int    repetition = 0;         // number of beams cut this way
    std::vector<int> counts;       // pieces per histogram entry
};

/**
 * Group beams that cut the same multiset of lengths, in order of first
 * appearance. Two beams with the same pieces in a different order are one
 * group.
 */
std::vector<PatternGroup> group_patterns(const std::vector<Pattern>& patterns,
                                         const std::vector<LengthCount>& histogram);

// =============================================================================
// CuttingReport
// =============================================================================

struct CuttingReport {
    Length raw_length          = 0.0;
    Length genotype_waste      = 0.0;
    size_t beam_count          = 0;
    Length all_elements_length = 0.0;
    double surowca_utilization = 0.0;   // percent, unrounded

    std::vector<LengthCount>  unique_element_lengths_and_count;
    std::vector<Pattern>      patterns;
    std::vector<PatternGroup> pattern_groups;

    size_t   generations_run  = 0;
    bool     cancelled        = false;
    bool     stopped_by_stall = false;
    uint32_t seed             = 0;

    /** Visualization payload for the web layer */
    std::string to_json() const;

    /** Totals block printed under the cutting plot */
    std::string summary() const;
};

CuttingReport make_report(const Demand& demand, const OptimizationResult& result);

/**
 * Validate, optimize and report in one call.
 * Throws InvalidInputError / InfeasiblePartError before any generation runs.
 */
CuttingReport optimize_cutting(Length raw_length,
                               const std::vector<RequiredPart>& parts,
                               const OptimizerConfig& config = {},
                               const CancelToken* cancel = nullptr);

} // namespace cutstock
