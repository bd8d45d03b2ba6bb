#include "genome/genotype.h"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <iomanip>

namespace cutstock {

// =============================================================================
// Randomize
// =============================================================================

void Genotype::randomize(size_t n, std::mt19937& rng) {
    order.resize(n);
    std::iota(order.begin(), order.end(), 0u);
    std::shuffle(order.begin(), order.end(), rng);
    fitness = std::numeric_limits<double>::max();
    evaluated = false;
}

// =============================================================================
// Mutate (swap)
// =============================================================================

void Genotype::mutate(std::mt19937& rng, double p_mutation) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(rng) >= p_mutation) return;

    const size_t n = order.size();
    if (n < 2) return;

    std::uniform_int_distribution<size_t> pick_i(0, n - 1);
    std::uniform_int_distribution<size_t> pick_j(0, n - 2);
    size_t i = pick_i(rng);
    size_t j = pick_j(rng);
    if (j >= i) ++j;  // j uniform over positions != i

    std::swap(order[i], order[j]);
    fitness = std::numeric_limits<double>::max();
    evaluated = false;
}

// =============================================================================
// Crossover (one-point order crossover)
// =============================================================================

Genotype Genotype::crossover(const Genotype& a, const Genotype& b, std::mt19937& rng) {
    Genotype child;
    const size_t n = a.order.size();
    if (n < 2) {
        child.order = a.order;
        return child;
    }

    std::uniform_int_distribution<size_t> pick_cut(1, n - 1);
    size_t cut = pick_cut(rng);

    std::vector<uint8_t> placed(n, 0);
    child.order.reserve(n);
    for (size_t i = 0; i < cut; ++i) {
        child.order.push_back(a.order[i]);
        placed[a.order[i]] = 1;
    }
    for (uint32_t gene : b.order) {
        if (!placed[gene]) {
            child.order.push_back(gene);
            placed[gene] = 1;
        }
    }
    return child;
}

// =============================================================================
// Validity
// =============================================================================

bool Genotype::is_permutation_of(size_t n) const {
    if (order.size() != n) return false;
    std::vector<uint8_t> seen(n, 0);
    for (uint32_t gene : order) {
        if (gene >= n || seen[gene]) return false;
        seen[gene] = 1;
    }
    return true;
}

// =============================================================================
// Summary
// =============================================================================

std::string Genotype::summary() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "Gen" << generation << " fit=" << fitness << " genes=" << order.size() << " [";
    const size_t shown = std::min<size_t>(order.size(), 12);
    for (size_t i = 0; i < shown; ++i) {
        if (i) ss << ' ';
        ss << order[i];
    }
    if (shown < order.size()) ss << " ...";
    ss << ']';
    return ss.str();
}

} // namespace cutstock
