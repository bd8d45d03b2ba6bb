#pragma once
/**
 * PopulationManager — one generation step of the GA
 *
 * Works on a completed, fitness-annotated population and produces the next
 * one: tournament selection -> order crossover -> swap mutation, with the
 * generation's best genotype carried over unchanged (elitism). Runs on the
 * driver thread only; all randomness comes from the rng passed in.
 */

#include "genome/genotype.h"
#include <vector>
#include <random>
#include <cstddef>

namespace cutstock {

struct BreedingConfig {
    size_t population_size = 70;
    size_t tournament_size = 3;
    double p_crossover     = 0.9;
    double p_mutation      = 0.2;
};

class PopulationManager {
public:
    explicit PopulationManager(const BreedingConfig& config = {});

    /**
     * Index of the lowest-fitness genotype. Equal fitness keeps the lower
     * index, so the result never depends on sampling.
     */
    static size_t best_index(const std::vector<Genotype>& pop);

    /**
     * Sample tournament_size members uniformly (with replacement) and return
     * the index of the lowest fitness; ties go to the lower index.
     */
    size_t tournament_select(const std::vector<Genotype>& pop, std::mt19937& rng) const;

    /** Elite at index 0, then children until population_size */
    std::vector<Genotype> next_generation(const std::vector<Genotype>& current,
                                          std::mt19937& rng) const;

    const BreedingConfig& config() const { return config_; }

private:
    BreedingConfig config_;
};

} // namespace cutstock
