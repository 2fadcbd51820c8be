#pragma once

#include "ChannelTable.h"
#include "InterfaceRegistry.h"
#include "Phenotype.h"
#include "RunResult.h"
#include "core/Result.h"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace NeuroEvo {

struct Genotype;

namespace Cortex {

class Actor;
class Synchronizer;

/**
 * A live phenotype: one thread per sensor, neuron and actuator plus the
 * synchronizer, all created by build(). The destructor joins a finished run
 * and abandons one that is still going.
 *
 * Example:
 *   auto network = Network::build(genotype, InterfaceRegistry::withDefaults());
 *   if (network.isError()) return;
 *   network.value()->start(1000);
 *   RunResult result = network.value()->wait();
 */
class Network {
public:
    // Fails without starting any thread when an interface name is unknown,
    // a vector length disagrees with the registry, or the wiring is invalid.
    static Result<std::unique_ptr<Network>, std::string> build(
        const Genotype& genotype, const InterfaceRegistry& registry);
    static Result<std::unique_ptr<Network>, std::string> build(
        const Phenotype& phenotype, const InterfaceRegistry& registry);

    ~Network();

    Network(const Network&) = delete;
    Network& operator=(const Network&) = delete;

    // Runs `steps` sense-think-act cycles. Only the first call has an effect.
    void start(int steps);

    // Blocks until the synchronizer finishes, then joins every actor thread.
    // A network that was never started is terminated first.
    RunResult wait();

    // nullopt if the run is still going when the timeout expires.
    std::optional<RunResult> waitFor(std::chrono::milliseconds timeout);

    // Asks the synchronizer to stop after collecting a backup.
    void terminate();

    // Tears the network down without waiting for its threads. Actors stuck in
    // an interface callback keep the shared runtime alive until they return.
    // Later wait() calls report `reason` as the failure.
    void abandon(const std::string& reason);

private:
    struct Runtime;

    Network();

    Result<std::monostate, std::string> launch();
    void joinThreads();

    NodeId synchronizerId_;
    std::shared_ptr<Runtime> runtime_;
    std::vector<std::thread> threads_;
    std::future<RunResult> future_;
    std::optional<RunResult> result_;
    bool started_ = false;
};

/**
 * Builds, runs and tears down a network for one evaluation. A run that
 * outlives `timeout` is abandoned and reported as an error right away, as is
 * a run in which an actor failed.
 */
Result<RunResult, std::string> runEpisode(
    const Genotype& genotype,
    const InterfaceRegistry& registry,
    int steps,
    std::chrono::milliseconds timeout);

} // namespace Cortex
} // namespace NeuroEvo
