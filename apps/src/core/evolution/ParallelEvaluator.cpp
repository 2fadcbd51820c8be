#include "ParallelEvaluator.h"

#include "core/LoggingChannels.h"
#include "core/genotype/Genotype.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace NeuroEvo {

namespace {

struct WorkerTask {
    size_t begin = 0;
    size_t end = 0;
};

struct WorkerState {
    std::vector<std::thread> workers;
    std::deque<WorkerTask> taskQueue;
    std::mutex taskMutex;
    std::condition_variable taskCv;
    std::vector<std::optional<EvaluationResult>> results;
    std::mutex resultMutex;
    std::condition_variable resultCv;
    size_t completed = 0;
    std::atomic<bool> stopRequested{ false };
};

} // namespace

int resolveWorkerCount(int requested, int taskCount)
{
    int resolved = requested;
    if (resolved <= 0) {
        const unsigned int cores = std::thread::hardware_concurrency();
        resolved = cores > 0 ? static_cast<int>(cores) : 1;
    }

    if (taskCount > 0 && resolved > taskCount) {
        resolved = taskCount;
    }
    return std::max(1, resolved);
}

ParallelEvaluator::ParallelEvaluator(FitnessFunction fitness, int maxParallelEvaluations)
    : fitness_(std::move(fitness)), maxParallelEvaluations_(maxParallelEvaluations)
{}

std::vector<EvaluationResult> ParallelEvaluator::evaluateAll(
    const std::vector<Genotype>& genotypes, const std::atomic<bool>& cancel)
{
    if (genotypes.empty()) {
        return {};
    }

    const size_t total = genotypes.size();
    const int workerCount = resolveWorkerCount(maxParallelEvaluations_, static_cast<int>(total));
    const size_t chunkSize = std::max<size_t>(1, total / static_cast<size_t>(workerCount));

    WorkerState state;
    state.results.resize(total);
    for (size_t begin = 0; begin < total; begin += chunkSize) {
        state.taskQueue.push_back(
            WorkerTask{ .begin = begin, .end = std::min(total, begin + chunkSize) });
    }

    LOG_DEBUG(
        Evolution,
        "Evaluating {} genotypes on {} workers in {} chunks",
        total,
        workerCount,
        state.taskQueue.size());

    WorkerState* shared = &state;
    const FitnessFunction* fitness = &fitness_;
    const auto joinAll = [&state]() {
        state.stopRequested = true;
        for (auto& worker : state.workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    state.workers.reserve(workerCount);
    for (int i = 0; i < workerCount; ++i) {
        try {
            state.workers.emplace_back([shared, fitness, &genotypes, &cancel]() {
                while (true) {
                    WorkerTask task;
                    {
                        std::lock_guard<std::mutex> lock(shared->taskMutex);
                        if (shared->stopRequested || shared->taskQueue.empty()) {
                            return;
                        }
                        task = shared->taskQueue.front();
                        shared->taskQueue.pop_front();
                    }

                    for (size_t index = task.begin; index < task.end; ++index) {
                        if (shared->stopRequested || cancel.load()) {
                            return;
                        }

                        EvaluationResult result = evaluateGenotype(genotypes[index], *fitness);
                        {
                            std::lock_guard<std::mutex> lock(shared->resultMutex);
                            shared->results[index] = std::move(result);
                            shared->completed++;
                        }
                        shared->resultCv.notify_one();
                    }
                }
            });
        }
        catch (const std::system_error& e) {
            LOG_ERROR(Evolution, "Failed to start evaluation worker: {}", e.what());
            joinAll();
            throw;
        }
    }

    {
        std::unique_lock<std::mutex> lock(state.resultMutex);
        while (state.completed < total && !cancel.load()) {
            state.resultCv.wait_for(lock, std::chrono::milliseconds(20));
        }
    }

    joinAll();

    std::vector<EvaluationResult> merged;
    merged.reserve(total);
    for (auto& result : state.results) {
        if (result) {
            merged.push_back(std::move(*result));
        }
    }

    if (merged.size() < total) {
        LOG_INFO(Evolution, "Evaluation cancelled after {} of {} genotypes", merged.size(), total);
    }
    return merged;
}

} // namespace NeuroEvo
