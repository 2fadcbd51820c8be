#pragma once

#include "EvaluationResult.h"

#include <atomic>
#include <vector>

namespace NeuroEvo {

struct Genotype;

/**
 * Evaluates a batch of genotypes. Results come back in input order; a
 * cancelled batch returns only the results finished before cancellation.
 */
class EvaluationDispatcher {
public:
    virtual ~EvaluationDispatcher() = default;

    virtual std::vector<EvaluationResult> evaluateAll(
        const std::vector<Genotype>& genotypes, const std::atomic<bool>& cancel) = 0;
};

// Worker count for a batch: requested, or the core count when <= 0, clamped
// to [1, taskCount].
int resolveWorkerCount(int requested, int taskCount);

/**
 * Fans a batch out over a pool of worker threads started per batch. Work is
 * queued in contiguous chunks of max(1, n / workers) genotypes.
 */
class ParallelEvaluator : public EvaluationDispatcher {
public:
    ParallelEvaluator(FitnessFunction fitness, int maxParallelEvaluations);

    std::vector<EvaluationResult> evaluateAll(
        const std::vector<Genotype>& genotypes, const std::atomic<bool>& cancel) override;

private:
    FitnessFunction fitness_;
    int maxParallelEvaluations_;
};

} // namespace NeuroEvo
