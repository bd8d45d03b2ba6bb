#pragma once
/**
 * Genotype — a cutting order encoded as a permutation of part instances
 *
 * Gene value i refers to instance i of Demand::instances. The decoder packs
 * instances into beams in gene order, so a genotype's quality depends only
 * on its permutation. Genome length is fixed (one gene per instance), which
 * keeps crossover and mutation simple index-array operations.
 *
 * Operators:
 *   randomize  -> uniform random permutation (initial population)
 *   crossover  -> one-point order crossover (prefix of A, rest in B's order)
 *   mutate     -> swap of two positions
 * All three keep the permutation property by construction.
 */

#include <vector>
#include <random>
#include <string>
#include <cstdint>
#include <limits>

namespace cutstock {

struct Genotype {
    std::vector<uint32_t> order;

    // --- Metadata ---
    double fitness    = std::numeric_limits<double>::max();
    bool   evaluated  = false;
    int    generation = 0;

    size_t size() const { return order.size(); }

    /** Replace order with a uniform random permutation of 0..n-1 */
    void randomize(size_t n, std::mt19937& rng);

    /** With probability p_mutation swap two distinct positions */
    void mutate(std::mt19937& rng, double p_mutation);

    /**
     * One-point order crossover. Child takes a[0, cut) and fills the rest
     * with b's genes not yet placed, in b's relative order. The cut point is
     * drawn from [1, n-1] so both parents contribute; shorter genomes copy a.
     */
    static Genotype crossover(const Genotype& a, const Genotype& b, std::mt19937& rng);

    /** True when order holds every value 0..n-1 exactly once */
    bool is_permutation_of(size_t n) const;

    /** One-liner for logs */
    std::string summary() const;
};

} // namespace cutstock
