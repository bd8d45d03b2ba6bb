#pragma once
/**
 * Demand — canonical form of a cutting order
 *
 * Flattens (length x quantity) rows into one entry per part instance and
 * builds the unique-length histogram the result page shows as the
 * per-length demand table. Instance i of the flattened list is what a
 * genotype gene with value i refers to.
 */

#include "core/types.h"
#include <vector>
#include <cstddef>

namespace cutstock {

struct Demand {
    Length raw_length = 0.0;

    /** One length per part instance, in order of the input rows */
    std::vector<Length> instances;

    /** Histogram index of every instance (parallel to instances) */
    std::vector<uint32_t> instance_kind;

    /** Distinct lengths with their total count, first-seen order */
    std::vector<LengthCount> histogram;

    /** Sum of all instance lengths */
    Length total_length = 0.0;

    size_t size() const { return instances.size(); }
    bool empty() const { return instances.empty(); }

    /** Position of a length in the histogram, or histogram.size() if absent */
    size_t kind_of(Length length) const;
};

/**
 * Validate and flatten an order.
 *
 * Throws InvalidInputError for a non-positive or non-finite raw length,
 * an empty order, a non-positive or non-finite part length, or a quantity
 * below 1. Throws InfeasiblePartError for the first part longer than the
 * raw length. Equal lengths from separate rows share one histogram entry.
 */
Demand build_demand(Length raw_length, const std::vector<RequiredPart>& parts);

} // namespace cutstock
