#include "genome/population_manager.h"
#include <utility>

namespace cutstock {

PopulationManager::PopulationManager(const BreedingConfig& config)
    : config_(config)
{
}

static bool better(const std::vector<Genotype>& pop, size_t i, size_t j) {
    if (pop[i].fitness != pop[j].fitness) return pop[i].fitness < pop[j].fitness;
    return i < j;
}

size_t PopulationManager::best_index(const std::vector<Genotype>& pop) {
    size_t best = 0;
    for (size_t i = 1; i < pop.size(); ++i) {
        if (better(pop, i, best)) best = i;
    }
    return best;
}

// =============================================================================
// Tournament selection
// =============================================================================

size_t PopulationManager::tournament_select(const std::vector<Genotype>& pop,
                                            std::mt19937& rng) const {
    std::uniform_int_distribution<size_t> pick(0, pop.size() - 1);
    size_t best_idx = pick(rng);
    for (size_t i = 1; i < config_.tournament_size; ++i) {
        size_t idx = pick(rng);
        if (better(pop, idx, best_idx)) best_idx = idx;
    }
    return best_idx;
}

// =============================================================================
// Next generation: elite + (selection -> crossover -> mutation)
// =============================================================================

std::vector<Genotype> PopulationManager::next_generation(const std::vector<Genotype>& current,
                                                         std::mt19937& rng) const {
    std::vector<Genotype> next;
    if (current.empty()) return next;
    next.reserve(config_.population_size);

    // Elite: single best survives unmodified, keeps its fitness
    next.push_back(current[best_index(current)]);

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    while (next.size() < config_.population_size) {
        const Genotype& parent_a = current[tournament_select(current, rng)];
        const Genotype& parent_b = current[tournament_select(current, rng)];

        Genotype child;
        if (coin(rng) < config_.p_crossover) {
            child = Genotype::crossover(parent_a, parent_b, rng);
        } else {
            child.order = parent_a.order;
        }
        child.mutate(rng, config_.p_mutation);
        child.evaluated = false;
        next.push_back(std::move(child));
    }
    return next;
}

} // namespace cutstock
