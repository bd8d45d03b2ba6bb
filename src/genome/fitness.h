#pragma once
/**
 * Fitness evaluator
 *
 *   fitness = beam_count * beam_weight + genotype_waste * waste_weight
 *
 * Lower is better. Both weights >= 0 and not both zero.
 */

#include "genome/decoder.h"

namespace cutstock {

struct FitnessWeights {
    double beam_weight  = 1.0;
    double waste_weight = 1.0;

    bool valid() const {
        return beam_weight >= 0.0 && waste_weight >= 0.0
            && (beam_weight > 0.0 || waste_weight > 0.0);
    }
};

double evaluate_fitness(const CuttingPlan& plan, const FitnessWeights& weights);

/** Decode + evaluate in one step (what each evaluation worker runs) */
double evaluate_genotype(const Genotype& genotype, const Demand& demand,
                         const FitnessWeights& weights);

} // namespace cutstock
