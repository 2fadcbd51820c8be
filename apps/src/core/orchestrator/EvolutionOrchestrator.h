#pragma once

#include "OrchestratorState.h"
#include "core/Result.h"
#include "core/evolution/ParallelEvaluator.h"
#include "core/evolution/Population.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace NeuroEvo {

class InterfaceRegistry;

struct OrchestratorStatus {
    std::string state;
    int generation = 0; // Generation currently pending evaluation.
    int generationsCompleted = 0;
    int targetGenerations = 0;
    size_t populationSize = 0;
    size_t speciesCount = 0;
    std::optional<double> bestFitness;
    std::optional<std::string> savedBestPath; // Set once a completed run saved its champion.
    std::optional<std::string> error;
};

/**
 * Runs the generation loop on a background thread: evaluate the pending
 * genotypes through a dispatcher, apply the results, breed the next generation.
 *
 * All queries return snapshots and may be called from any thread while a run
 * is in progress. The population only changes when a generation completes, so
 * a stopped or failed generation leaves it exactly as it was.
 */
class EvolutionOrchestrator {
public:
    using ProgressCallback =
        std::function<void(int generation, double bestFitness, const GenerationStats& stats)>;

    // Called once from the worker thread when a run ends: completed, stopped or failed.
    using FinishedCallback = std::function<void(const OrchestratorStatus& status)>;

    // Validates the config, resolves the layout and creates generation 0.
    // Without a dispatcher, fitness is evaluated by a ParallelEvaluator.
    static Result<std::unique_ptr<EvolutionOrchestrator>, std::string> create(
        const EvolutionConfig& config,
        const GenotypeSpec& spec,
        const InterfaceRegistry& registry,
        FitnessFunction fitness,
        std::unique_ptr<EvaluationDispatcher> dispatcher = nullptr);

    EvolutionOrchestrator(
        Population population, std::unique_ptr<EvaluationDispatcher> dispatcher, uint32_t seed);
    ~EvolutionOrchestrator();

    EvolutionOrchestrator(const EvolutionOrchestrator&) = delete;
    EvolutionOrchestrator& operator=(const EvolutionOrchestrator&) = delete;

    // Fails when a run is already in progress or generations < 1. A completed
    // run saves the champion when the config names a bestGenotypePath.
    Result<std::monostate, std::string> start(
        int generations, ProgressCallback onProgress = {}, FinishedCallback onFinished = {});

    // Cancels the run and blocks until the worker thread exits.
    void stop();

    // Only valid in the Error state; resumes with the generations still owed.
    Result<std::monostate, std::string> retryGeneration();

    // False if still running when the timeout expires.
    bool waitUntilIdle(std::chrono::milliseconds timeout);

    OrchestratorStatus getStatus() const;
    OrchestratorState::Any getState() const;
    std::optional<Genotype> getBest() const;
    std::vector<GenerationStats> getStatistics() const;
    Population getPopulation() const;

private:
    void runLoop(int generations);
    OrchestratorStatus runGenerations(int generations);
    OrchestratorState::Completed complete(int generationsCompleted);
    OrchestratorStatus transitionTo(OrchestratorState::Any next);
    OrchestratorStatus fail(const std::string& message, int generationsRemaining);
    OrchestratorStatus statusLocked() const;
    void joinWorker();

    std::unique_ptr<EvaluationDispatcher> dispatcher_;
    std::mt19937 rng_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    OrchestratorState::Any state_;
    Population population_;
    ProgressCallback onProgress_;
    FinishedCallback onFinished_;

    std::thread worker_;
    std::atomic<bool> stopRequested_{ false };
};

} // namespace NeuroEvo
