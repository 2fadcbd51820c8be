#pragma once

#include "core/genotype/GenotypeIds.h"

#include <functional>
#include <string>

namespace NeuroEvo {

struct Genotype;

// Scores one genotype. Called concurrently from worker threads, so it must not
// share mutable state between calls. May throw; see evaluateGenotype().
using FitnessFunction = std::function<double(const Genotype&)>;

struct EvaluationResult {
    GenotypeId genotypeId;
    double fitness = 0.0;
    bool failed = false;
    std::string error;
};

// Runs the fitness function, turning an exception or a non-finite score into
// a failed result with fitness 0.
EvaluationResult evaluateGenotype(const Genotype& genotype, const FitnessFunction& fitness);

} // namespace NeuroEvo
