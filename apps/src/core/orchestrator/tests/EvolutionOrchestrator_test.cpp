#include "core/cortex/InterfaceRegistry.h"
#include "core/evolution/PopulationManager.h"
#include "core/evolution/XorEvaluator.h"
#include "core/genotype/GenotypeStore.h"
#include "core/orchestrator/EvolutionOrchestrator.h"

#include <filesystem>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace NeuroEvo;
using namespace std::chrono_literals;

namespace {

double connectionCount(const Genotype& genotype)
{
    return static_cast<double>(genotype.connections.size());
}

// Throws on its first `failures` batches, then scores everything 1.0.
class FlakyDispatcher : public EvaluationDispatcher {
public:
    explicit FlakyDispatcher(int failures, bool dropResults = false)
        : failures_(failures), dropResults_(dropResults)
    {}

    std::vector<EvaluationResult> evaluateAll(
        const std::vector<Genotype>& genotypes, const std::atomic<bool>& /*cancel*/) override
    {
        if (failures_ > 0) {
            failures_--;
            if (dropResults_) {
                return {};
            }
            throw std::runtime_error("worker pool lost");
        }

        std::vector<EvaluationResult> results;
        for (const auto& genotype : genotypes) {
            results.push_back({ .genotypeId = genotype.id, .fitness = 1.0 });
        }
        return results;
    }

private:
    int failures_;
    bool dropResults_;
};

} // namespace

class EvolutionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config.populationSize = 12;
        config.maxParallelEvaluations = 2;
        config.seed = 1234;
    }

    std::unique_ptr<EvolutionOrchestrator> make(
        FitnessFunction fitness, std::unique_ptr<EvaluationDispatcher> dispatcher = nullptr)
    {
        auto result = EvolutionOrchestrator::create(
            config,
            GenotypeSpec{},
            InterfaceRegistry::withDefaults(),
            std::move(fitness),
            std::move(dispatcher));
        EXPECT_TRUE(result.isValue());
        return std::move(result.value());
    }

    EvolutionConfig config;
};

TEST_F(EvolutionOrchestratorTest, StartsIdle)
{
    auto orchestrator = make(connectionCount);

    const OrchestratorStatus status = orchestrator->getStatus();

    EXPECT_EQ(status.state, "Idle");
    EXPECT_EQ(status.generation, 0);
    EXPECT_EQ(status.populationSize, 12u);
    EXPECT_FALSE(status.bestFitness.has_value());
    EXPECT_FALSE(orchestrator->getBest().has_value());
    EXPECT_TRUE(orchestrator->getStatistics().empty());
}

TEST_F(EvolutionOrchestratorTest, RunsRequestedGenerationsAndReportsProgress)
{
    auto orchestrator = make(connectionCount);

    std::mutex mutex;
    std::vector<int> reported;
    auto started = orchestrator->start(3, [&](int generation, double best, const GenerationStats& stats) {
        std::lock_guard<std::mutex> lock(mutex);
        reported.push_back(generation);
        EXPECT_GE(best, stats.bestFitness);
    });
    ASSERT_TRUE(started.isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    const OrchestratorStatus status = orchestrator->getStatus();
    EXPECT_EQ(status.state, "Completed");
    EXPECT_EQ(status.generationsCompleted, 3);
    EXPECT_EQ(status.generation, 3);
    EXPECT_EQ(status.populationSize, 12u);
    ASSERT_TRUE(status.bestFitness.has_value());
    EXPECT_EQ(orchestrator->getStatistics().size(), 3u);
    EXPECT_EQ(reported, (std::vector<int>{ 0, 1, 2 }));
    ASSERT_TRUE(orchestrator->getBest().has_value());
    EXPECT_DOUBLE_EQ(orchestrator->getBest()->fitness, *status.bestFitness);
}

TEST_F(EvolutionOrchestratorTest, CanContinueAfterCompleting)
{
    auto orchestrator = make(connectionCount);

    ASSERT_TRUE(orchestrator->start(2).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));
    ASSERT_TRUE(orchestrator->start(2).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    EXPECT_EQ(orchestrator->getStatistics().size(), 4u);
    EXPECT_EQ(orchestrator->getPopulation().generation, 4);
}

TEST_F(EvolutionOrchestratorTest, RejectsBadRequests)
{
    auto orchestrator = make(connectionCount);

    EXPECT_TRUE(orchestrator->start(0).isError());
    EXPECT_TRUE(orchestrator->retryGeneration().isError());
}

TEST_F(EvolutionOrchestratorTest, CreateRejectsInvalidSetup)
{
    config.populationSize = 0;
    EXPECT_TRUE(EvolutionOrchestrator::create(
                    config, GenotypeSpec{}, InterfaceRegistry::withDefaults(), connectionCount)
                    .isError());

    config.populationSize = 5;
    EXPECT_TRUE(EvolutionOrchestrator::create(
                    config, GenotypeSpec{}, InterfaceRegistry::withDefaults(), FitnessFunction{})
                    .isError());
}

TEST_F(EvolutionOrchestratorTest, StopInterruptsLongRun)
{
    auto orchestrator = make([](const Genotype& genotype) {
        std::this_thread::sleep_for(2ms);
        return connectionCount(genotype);
    });

    std::optional<OrchestratorStatus> finished;
    ASSERT_TRUE(orchestrator
                    ->start(100000, {}, [&finished](const OrchestratorStatus& status) {
                        finished = status;
                    })
                    .isValue());
    EXPECT_TRUE(orchestrator->start(1).isError());
    std::this_thread::sleep_for(50ms);
    orchestrator->stop();

    const OrchestratorStatus status = orchestrator->getStatus();
    EXPECT_EQ(status.state, "Stopped");
    EXPECT_LT(status.generationsCompleted, 100000);
    EXPECT_EQ(static_cast<int>(orchestrator->getStatistics().size()), status.generationsCompleted);

    // stop() joins the worker, so the notification has already happened.
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->state, "Stopped");
    EXPECT_EQ(finished->generationsCompleted, status.generationsCompleted);
    EXPECT_FALSE(finished->savedBestPath.has_value());
}

TEST_F(EvolutionOrchestratorTest, ConcurrentStartsLaunchOneRun)
{
    auto orchestrator = make([](const Genotype& genotype) {
        std::this_thread::sleep_for(1ms);
        return connectionCount(genotype);
    });

    std::atomic<int> accepted{ 0 };
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&orchestrator, &accepted]() {
            if (orchestrator->start(100000).isValue()) {
                accepted++;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    orchestrator->stop();
    EXPECT_EQ(orchestrator->getStatus().state, "Stopped");
}

TEST_F(EvolutionOrchestratorTest, CompletedRunSavesChampionAndNotifies)
{
    const auto path = std::filesystem::temp_directory_path() / "neuroevo_orchestrator_best.jsonl";
    std::filesystem::remove(path);
    config.bestGenotypePath = path.string();
    auto orchestrator = make(connectionCount);

    std::promise<OrchestratorStatus> finished;
    auto future = finished.get_future();
    ASSERT_TRUE(orchestrator
                    ->start(2, {}, [&finished](const OrchestratorStatus& status) {
                        finished.set_value(status);
                    })
                    .isValue());
    ASSERT_EQ(future.wait_for(30s), std::future_status::ready);

    const OrchestratorStatus status = future.get();
    EXPECT_EQ(status.state, "Completed");
    EXPECT_EQ(status.generationsCompleted, 2);
    EXPECT_FALSE(status.error.has_value());
    ASSERT_TRUE(status.savedBestPath.has_value());
    EXPECT_EQ(*status.savedBestPath, path.string());
    EXPECT_EQ(orchestrator->getStatus().savedBestPath, status.savedBestPath);

    auto loaded = GenotypeStore::load(path);
    ASSERT_TRUE(loaded.isValue()) << loaded.errorValue();
    const auto best = orchestrator->getBest();
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(loaded.value().id, best->id);
    EXPECT_EQ(loaded.value().connections.size(), best->connections.size());

    std::filesystem::remove(path);
}

TEST_F(EvolutionOrchestratorTest, UnwritableChampionPathIsReported)
{
    const auto dir = std::filesystem::temp_directory_path() / "neuroevo_missing_dir";
    std::filesystem::remove_all(dir);
    config.bestGenotypePath = (dir / "best.jsonl").string();
    auto orchestrator = make(connectionCount);

    ASSERT_TRUE(orchestrator->start(1).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    const OrchestratorStatus status = orchestrator->getStatus();
    EXPECT_EQ(status.state, "Completed");
    EXPECT_FALSE(status.savedBestPath.has_value());
    ASSERT_TRUE(status.error.has_value());
    EXPECT_NE(status.error->find("cannot save best genotype"), std::string::npos);
}

TEST_F(EvolutionOrchestratorTest, DispatcherFailureEntersErrorAndRetryResumes)
{
    auto orchestrator = make(FitnessFunction{}, std::make_unique<FlakyDispatcher>(1));

    ASSERT_TRUE(orchestrator->start(2).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    OrchestratorStatus status = orchestrator->getStatus();
    EXPECT_EQ(status.state, "Error");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_NE(status.error->find("worker pool lost"), std::string::npos);
    EXPECT_EQ(status.generation, 0);
    EXPECT_TRUE(orchestrator->getStatistics().empty());
    EXPECT_EQ(unevaluatedGenotypes(orchestrator->getPopulation()).size(), 12u);

    ASSERT_TRUE(orchestrator->retryGeneration().isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    status = orchestrator->getStatus();
    EXPECT_EQ(status.state, "Completed");
    EXPECT_EQ(status.generation, 2);
    EXPECT_EQ(orchestrator->getStatistics().size(), 2u);
}

TEST_F(EvolutionOrchestratorTest, IncompleteResultsAreAnError)
{
    auto orchestrator = make(FitnessFunction{}, std::make_unique<FlakyDispatcher>(1, true));

    ASSERT_TRUE(orchestrator->start(1).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(30s));

    EXPECT_TRUE(
        std::holds_alternative<OrchestratorState::Error>(orchestrator->getState()));
    EXPECT_EQ(orchestrator->getPopulation().generation, 0);
}

TEST_F(EvolutionOrchestratorTest, EvolvesXorThroughActorRuntime)
{
    config.populationSize = 10;
    auto result = EvolutionOrchestrator::create(
        config, xorGenotypeSpec(), xorLayoutRegistry(), XorEvaluator().fitnessFunction());
    ASSERT_TRUE(result.isValue()) << result.errorValue();
    auto& orchestrator = result.value();

    ASSERT_TRUE(orchestrator->start(2).isValue());
    ASSERT_TRUE(orchestrator->waitUntilIdle(60s));

    EXPECT_EQ(orchestrator->getStatus().state, "Completed");
    const auto stats = orchestrator->getStatistics();
    ASSERT_EQ(stats.size(), 2u);
    for (const auto& generation : stats) {
        EXPECT_EQ(generation.failedEvaluations, 0);
        EXPECT_GE(generation.bestFitness, 0.0);
        EXPECT_LE(generation.bestFitness, 4.0);
    }
}
