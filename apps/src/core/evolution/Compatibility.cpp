#include "Compatibility.h"

#include "core/genotype/Genotype.h"

#include <algorithm>
#include <cmath>

namespace NeuroEvo {

GeneAlignment alignGenes(const Genotype& a, const Genotype& b)
{
    GeneAlignment alignment;

    const auto& genesA = a.connections;
    const auto& genesB = b.connections;
    const Innovation maxA = genesA.empty() ? 0 : genesA.back().innovation;
    const Innovation maxB = genesB.empty() ? 0 : genesB.back().innovation;

    size_t i = 0;
    size_t j = 0;
    while (i < genesA.size() || j < genesB.size()) {
        if (i < genesA.size() && j < genesB.size()
            && genesA[i].innovation == genesB[j].innovation) {
            alignment.matching.push_back({ .a = &genesA[i], .b = &genesB[j] });
            ++i;
            ++j;
        }
        else if (j >= genesB.size() || (i < genesA.size() && genesA[i].innovation < genesB[j].innovation)) {
            if (genesB.empty() || genesA[i].innovation > maxB) {
                alignment.excessA.push_back(&genesA[i]);
            }
            else {
                alignment.disjointA.push_back(&genesA[i]);
            }
            ++i;
        }
        else {
            if (genesA.empty() || genesB[j].innovation > maxA) {
                alignment.excessB.push_back(&genesB[j]);
            }
            else {
                alignment.disjointB.push_back(&genesB[j]);
            }
            ++j;
        }
    }

    return alignment;
}

double compatibilityDistance(
    const Genotype& a, const Genotype& b, const CompatibilityConfig& config)
{
    const GeneAlignment alignment = alignGenes(a, b);

    const size_t larger = std::max(a.connections.size(), b.connections.size());
    const double n = static_cast<int>(larger) < config.normalizeThreshold
        ? 1.0
        : static_cast<double>(larger);

    double weightDifference = 0.0;
    if (!alignment.matching.empty()) {
        double sum = 0.0;
        for (const auto& match : alignment.matching) {
            sum += std::abs(match.a->weight - match.b->weight);
        }
        weightDifference = sum / static_cast<double>(alignment.matching.size());
    }

    return config.excessCoefficient * static_cast<double>(alignment.excessCount()) / n
        + config.disjointCoefficient * static_cast<double>(alignment.disjointCount()) / n
        + config.weightCoefficient * weightDifference;
}

} // namespace NeuroEvo
