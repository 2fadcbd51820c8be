#include "EvolutionOrchestrator.h"

#include "core/LoggingChannels.h"
#include "core/cortex/InterfaceRegistry.h"
#include "core/evolution/PopulationManager.h"
#include "core/genotype/GenotypeStore.h"

#include <system_error>
#include <type_traits>

namespace NeuroEvo {

Result<std::unique_ptr<EvolutionOrchestrator>, std::string> EvolutionOrchestrator::create(
    const EvolutionConfig& config,
    const GenotypeSpec& spec,
    const InterfaceRegistry& registry,
    FitnessFunction fitness,
    std::unique_ptr<EvaluationDispatcher> dispatcher)
{
    using R = Result<std::unique_ptr<EvolutionOrchestrator>, std::string>;

    if (!dispatcher && !fitness) {
        return R::error("either a fitness function or a dispatcher is required");
    }

    const uint32_t seed = config.seed ? *config.seed : std::random_device{}();
    std::mt19937 rng{ seed };

    auto population = createInitialPopulation(config, spec, registry, rng);
    if (population.isError()) {
        LOG_ERROR(Orchestrator, "Cannot create population: {}", population.errorValue());
        return R::error(population.errorValue());
    }

    if (!dispatcher) {
        dispatcher =
            std::make_unique<ParallelEvaluator>(std::move(fitness), config.maxParallelEvaluations);
    }

    // Breeding continues from a stream derived from the seed.
    return R::okay(std::make_unique<EvolutionOrchestrator>(
        std::move(population.value()), std::move(dispatcher), rng()));
}

EvolutionOrchestrator::EvolutionOrchestrator(
    Population population, std::unique_ptr<EvaluationDispatcher> dispatcher, uint32_t seed)
    : dispatcher_(std::move(dispatcher)),
      rng_(seed),
      state_(OrchestratorState::Idle{}),
      population_(std::move(population))
{}

EvolutionOrchestrator::~EvolutionOrchestrator()
{
    stop();
}

Result<std::monostate, std::string> EvolutionOrchestrator::start(
    int generations, ProgressCallback onProgress, FinishedCallback onFinished)
{
    using R = Result<std::monostate, std::string>;

    if (generations < 1) {
        return R::error("generations must be at least 1");
    }

    // Claiming Running under the same lock as the check keeps a concurrent
    // start() out until this run ends.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<OrchestratorState::Running>(state_)) {
            return R::error("evolution is already running");
        }
        onProgress_ = std::move(onProgress);
        onFinished_ = std::move(onFinished);
        state_ = OrchestratorState::Running{ .targetGenerations = generations };
        stopRequested_ = false;
    }

    // The previous worker has left its loop; it may still be notifying.
    joinWorker();

    LOG_INFO(
        Orchestrator,
        "Starting {} generations from generation {}",
        generations,
        getPopulation().generation);

    try {
        worker_ = std::thread([this, generations]() { runLoop(generations); });
    }
    catch (const std::system_error& e) {
        fail(std::string("cannot start evolution thread: ") + e.what(), generations);
        return R::error(e.what());
    }
    return R::okay(std::monostate{});
}

void EvolutionOrchestrator::stop()
{
    stopRequested_ = true;
    joinWorker();
}

Result<std::monostate, std::string> EvolutionOrchestrator::retryGeneration()
{
    using R = Result<std::monostate, std::string>;

    int remaining = 0;
    ProgressCallback onProgress;
    FinishedCallback onFinished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto* error = std::get_if<OrchestratorState::Error>(&state_);
        if (!error) {
            return R::error(
                "nothing to retry in state " + OrchestratorState::getStateName(state_));
        }
        remaining = error->generationsRemaining;
        onProgress = onProgress_;
        onFinished = onFinished_;
    }

    LOG_INFO(Orchestrator, "Retrying generation {}", getPopulation().generation);
    return start(remaining, std::move(onProgress), std::move(onFinished));
}

bool EvolutionOrchestrator::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() {
        return !std::holds_alternative<OrchestratorState::Running>(state_);
    });
}

OrchestratorStatus EvolutionOrchestrator::getStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return statusLocked();
}

OrchestratorStatus EvolutionOrchestrator::statusLocked() const
{
    OrchestratorStatus status{ .state = OrchestratorState::getStateName(state_),
                               .generation = population_.generation,
                               .populationSize = population_.size(),
                               .speciesCount = population_.species.size() };
    if (population_.best) {
        status.bestFitness = population_.best->fitness;
    }

    std::visit(
        [&status](const auto& state) {
            using T = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<T, OrchestratorState::Running>) {
                status.generationsCompleted = state.generationsCompleted;
                status.targetGenerations = state.targetGenerations;
            }
            else if constexpr (std::is_same_v<T, OrchestratorState::Completed>) {
                status.generationsCompleted = state.generationsCompleted;
                status.savedBestPath = state.savedBestPath;
                status.error = state.saveError;
            }
            else if constexpr (std::is_same_v<T, OrchestratorState::Stopped>) {
                status.generationsCompleted = state.generationsCompleted;
            }
            else if constexpr (std::is_same_v<T, OrchestratorState::Error>) {
                status.error = state.message;
            }
        },
        state_);
    return status;
}

OrchestratorState::Any EvolutionOrchestrator::getState() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Genotype> EvolutionOrchestrator::getBest() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return population_.best;
}

std::vector<GenerationStats> EvolutionOrchestrator::getStatistics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return population_.history;
}

Population EvolutionOrchestrator::getPopulation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return population_;
}

void EvolutionOrchestrator::runLoop(int generations)
{
    // Taken before the run ends: a later start() replaces the member.
    FinishedCallback onFinished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        onFinished = onFinished_;
    }

    const OrchestratorStatus status = runGenerations(generations);
    if (!onFinished) {
        return;
    }

    try {
        onFinished(status);
    }
    catch (const std::exception& e) {
        LOG_ERROR(Orchestrator, "Finished callback failed: {}", e.what());
    }
}

OrchestratorStatus EvolutionOrchestrator::runGenerations(int generations)
{
    int completed = 0;
    while (completed < generations) {
        if (stopRequested_) {
            break;
        }

        const Population current = getPopulation();
        const std::vector<Genotype> pending = unevaluatedGenotypes(current);

        std::vector<EvaluationResult> results;
        try {
            results = dispatcher_->evaluateAll(pending, stopRequested_);
        }
        catch (const std::exception& e) {
            return fail(
                std::string("evaluation dispatch failed: ") + e.what(), generations - completed);
        }

        if (stopRequested_) {
            break;
        }
        if (results.size() != pending.size()) {
            return fail(
                "dispatcher returned " + std::to_string(results.size()) + " of "
                    + std::to_string(pending.size()) + " results",
                generations - completed);
        }

        const Population evaluated = applyEvaluations(current, results);
        const GenerationStats stats = evaluated.history.back();
        const double bestFitness = evaluated.best ? evaluated.best->fitness : 0.0;
        Population next = nextGeneration(evaluated, rng_);

        completed++;
        ProgressCallback onProgress;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            population_ = std::move(next);
            state_ = OrchestratorState::Running{ .targetGenerations = generations,
                                                 .generationsCompleted = completed };
            onProgress = onProgress_;
        }

        if (onProgress) {
            try {
                onProgress(stats.generation, bestFitness, stats);
            }
            catch (const std::exception& e) {
                return fail(
                    std::string("progress callback failed: ") + e.what(), generations - completed);
            }
        }
    }

    if (completed < generations) {
        LOG_INFO(Orchestrator, "Stopped after {} of {} generations", completed, generations);
        return transitionTo(OrchestratorState::Stopped{ .generationsCompleted = completed });
    }

    LOG_INFO(Orchestrator, "Completed {} generations", completed);
    return transitionTo(complete(completed));
}

OrchestratorState::Completed EvolutionOrchestrator::complete(int generationsCompleted)
{
    OrchestratorState::Completed completed{ .generationsCompleted = generationsCompleted };

    std::optional<std::string> path;
    std::optional<Genotype> best;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = population_.config.bestGenotypePath;
        best = population_.best;
    }
    if (!path || !best) {
        return completed;
    }

    auto saved = GenotypeStore::save(*best, *path, GenotypeFormat::JsonLines);
    if (saved.isError()) {
        LOG_ERROR(Orchestrator, "Cannot save best genotype to {}: {}", *path, saved.errorValue());
        completed.saveError = "cannot save best genotype: " + saved.errorValue();
        return completed;
    }

    LOG_INFO(
        Orchestrator, "Saved genotype {} (fitness {:.4f}) to {}", best->id, best->fitness, *path);
    completed.savedBestPath = path;
    return completed;
}

OrchestratorStatus EvolutionOrchestrator::transitionTo(OrchestratorState::Any next)
{
    OrchestratorStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        LOG_DEBUG(
            Orchestrator,
            "{} -> {}",
            OrchestratorState::getStateName(state_),
            OrchestratorState::getStateName(next));
        state_ = std::move(next);
        status = statusLocked();
    }
    idleCv_.notify_all();
    return status;
}

OrchestratorStatus EvolutionOrchestrator::fail(
    const std::string& message, int generationsRemaining)
{
    LOG_ERROR(Orchestrator, "{}", message);
    return transitionTo(
        OrchestratorState::Error{ .message = message, .generationsRemaining = generationsRemaining });
}

void EvolutionOrchestrator::joinWorker()
{
    if (worker_.joinable()) {
        worker_.join();
    }
}

} // namespace NeuroEvo
