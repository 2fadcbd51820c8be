#pragma once

#include "EvolutionConfig.h"

#include <vector>

namespace NeuroEvo {

struct ConnectionGene;
struct Genotype;

/**
 * Connection genes of two genotypes lined up by innovation number.
 *
 * A gene found in only one genotype is disjoint when its innovation number
 * is within the other genotype's range, and excess when it lies beyond the
 * other genotype's largest innovation number.
 */
struct GeneAlignment {
    struct Match {
        const ConnectionGene* a;
        const ConnectionGene* b;
    };

    std::vector<Match> matching;
    std::vector<const ConnectionGene*> disjointA;
    std::vector<const ConnectionGene*> disjointB;
    std::vector<const ConnectionGene*> excessA;
    std::vector<const ConnectionGene*> excessB;

    size_t disjointCount() const { return disjointA.size() + disjointB.size(); }
    size_t excessCount() const { return excessA.size() + excessB.size(); }
};

GeneAlignment alignGenes(const Genotype& a, const Genotype& b);

// Symmetric: compatibilityDistance(a, b, c) == compatibilityDistance(b, a, c).
double compatibilityDistance(
    const Genotype& a, const Genotype& b, const CompatibilityConfig& config);

} // namespace NeuroEvo
