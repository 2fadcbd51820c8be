#pragma once

#include "core/genotype/Genotype.h"

#include <limits>
#include <vector>

namespace NeuroEvo {

struct Species {
    SpeciesId id;
    std::vector<GenotypeId> members;
    Genotype representative;
    double bestFitness = std::numeric_limits<double>::lowest();
    int lastImprovementGeneration = 0;
    int createdGeneration = 0;
    int age = 0;
    bool stagnant = false;
    double meanFitness = 0.0;

    bool isStagnant(int generation, int threshold) const
    {
        return generation - lastImprovementGeneration >= threshold;
    }
};

} // namespace NeuroEvo
