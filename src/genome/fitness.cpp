#include "genome/fitness.h"

namespace cutstock {

double evaluate_fitness(const CuttingPlan& plan, const FitnessWeights& weights) {
    return static_cast<double>(plan.beam_count()) * weights.beam_weight
         + plan.genotype_waste() * weights.waste_weight;
}

double evaluate_genotype(const Genotype& genotype, const Demand& demand,
                         const FitnessWeights& weights) {
    return evaluate_fitness(decode(genotype, demand.raw_length, demand), weights);
}

} // namespace cutstock
