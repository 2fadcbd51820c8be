#include "EvaluationResult.h"

#include "core/LoggingChannels.h"
#include "core/genotype/Genotype.h"

#include <cmath>
#include <exception>

namespace NeuroEvo {

EvaluationResult evaluateGenotype(const Genotype& genotype, const FitnessFunction& fitness)
{
    EvaluationResult result{ .genotypeId = genotype.id };
    try {
        const double score = fitness(genotype);
        if (!std::isfinite(score)) {
            result.failed = true;
            result.error = "fitness is not finite";
        }
        else {
            result.fitness = score;
        }
    }
    catch (const std::exception& e) {
        result.failed = true;
        result.error = e.what();
    }
    catch (...) {
        result.failed = true;
        result.error = "unknown exception";
    }

    if (result.failed) {
        result.fitness = 0.0;
        LOG_WARN(Evolution, "Evaluation of genotype {} failed: {}", genotype.id, result.error);
    }
    return result;
}

} // namespace NeuroEvo
