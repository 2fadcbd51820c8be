#include "Network.h"
#include "Actuator.h"
#include "Neuron.h"
#include "Sensor.h"
#include "Synchronizer.h"
#include "core/LoggingChannels.h"
#include "core/genotype/Genotype.h"
#include "core/genotype/Innovation.h"

#include <system_error>

namespace NeuroEvo {
namespace Cortex {

// Shared with every actor thread so that a detached thread never outlives
// the mailboxes and actors it touches.
struct Network::Runtime {
    ChannelTable channels;
    std::vector<std::unique_ptr<Actor>> actors;
};

namespace {
NodeId makeSynchronizerId()
{
    return NodeId{ InnovationHasher().add("synchronizer").value() };
}
} // namespace

Result<std::unique_ptr<Network>, std::string> Network::build(
    const Genotype& genotype, const InterfaceRegistry& registry)
{
    auto phenotype = buildPhenotype(genotype);
    if (phenotype.isError()) {
        return Result<std::unique_ptr<Network>, std::string>::error(phenotype.errorValue());
    }
    return build(phenotype.value(), registry);
}

Result<std::unique_ptr<Network>, std::string> Network::build(
    const Phenotype& phenotype, const InterfaceRegistry& registry)
{
    using NetworkResult = Result<std::unique_ptr<Network>, std::string>;

    // Resolve every interface before allocating anything.
    std::vector<const SensorInterface*> sensorInterfaces;
    for (const auto& sensor : phenotype.sensors) {
        const SensorInterface* sensorInterface = registry.findSensor(sensor.name);
        if (!sensorInterface) {
            return NetworkResult::error("Unknown sensor: " + sensor.name);
        }
        if (sensorInterface->vectorLength != sensor.vectorLength) {
            return NetworkResult::error(
                "Sensor " + sensor.name + " has vector length "
                + std::to_string(sensorInterface->vectorLength) + ", genotype expects "
                + std::to_string(sensor.vectorLength));
        }
        sensorInterfaces.push_back(sensorInterface);
    }

    std::vector<const ActuatorInterface*> actuatorInterfaces;
    for (const auto& actuator : phenotype.actuators) {
        const ActuatorInterface* actuatorInterface = registry.findActuator(actuator.name);
        if (!actuatorInterface) {
            return NetworkResult::error("Unknown actuator: " + actuator.name);
        }
        if (actuatorInterface->vectorLength != actuator.vectorLength) {
            return NetworkResult::error(
                "Actuator " + actuator.name + " has vector length "
                + std::to_string(actuatorInterface->vectorLength) + ", genotype expects "
                + std::to_string(actuator.vectorLength));
        }
        actuatorInterfaces.push_back(actuatorInterface);
    }

    std::unique_ptr<Network> network(new Network());
    network->synchronizerId_ = makeSynchronizerId();
    const NodeId synchronizerId = network->synchronizerId_;
    ChannelTable& channels = network->runtime_->channels;
    auto& actors = network->runtime_->actors;

    std::vector<NodeId> sensorIds;
    std::vector<NodeId> neuronIds;
    std::vector<NodeId> actuatorIds;

    channels.add(synchronizerId);
    for (size_t i = 0; i < phenotype.sensors.size(); ++i) {
        const auto& sensor = phenotype.sensors[i];
        channels.add(sensor.id);
        sensorIds.push_back(sensor.id);
        actors.push_back(std::make_unique<Sensor>(
            sensor.id,
            synchronizerId,
            channels,
            sensor.name,
            sensor.vectorLength,
            sensorInterfaces[i]->signal,
            sensor.fanOut));
    }
    for (const auto& neuron : phenotype.neurons) {
        channels.add(neuron.id);
        neuronIds.push_back(neuron.id);
        actors.push_back(std::make_unique<Neuron>(
            neuron.id,
            synchronizerId,
            channels,
            neuron.activation,
            neuron.inputs,
            neuron.bias,
            neuron.outputs));
    }
    for (size_t i = 0; i < phenotype.actuators.size(); ++i) {
        const auto& actuator = phenotype.actuators[i];
        channels.add(actuator.id);
        actuatorIds.push_back(actuator.id);
        actors.push_back(std::make_unique<Actuator>(
            actuator.id,
            synchronizerId,
            channels,
            actuator.name,
            actuator.vectorLength,
            actuatorInterfaces[i]->consume,
            actuator.fanIn));
    }

    auto synchronizer = std::make_unique<Synchronizer>(
        synchronizerId, channels, sensorIds, neuronIds, actuatorIds);
    network->future_ = synchronizer->result();
    actors.push_back(std::move(synchronizer));

    auto launched = network->launch();
    if (launched.isError()) {
        return NetworkResult::error(launched.errorValue());
    }

    LOG_DEBUG(
        Cortex,
        "Network up: {} sensors, {} neurons, {} actuators",
        sensorIds.size(),
        neuronIds.size(),
        actuatorIds.size());

    return NetworkResult::okay(std::move(network));
}

Network::Network() : runtime_(std::make_shared<Runtime>())
{}

Result<std::monostate, std::string> Network::launch()
{
    threads_.reserve(runtime_->actors.size());
    try {
        for (auto& actor : runtime_->actors) {
            Actor* raw = actor.get();
            threads_.emplace_back([runtime = runtime_, raw]() { raw->run(); });
        }
    }
    catch (const std::system_error& e) {
        LOG_ERROR(Cortex, "Failed to start actor thread: {}", e.what());
        // The synchronizer is launched last; it only needs a failure report
        // to shut down, every other actor needs Terminate.
        for (const auto& actor : runtime_->actors) {
            if (actor->id() == synchronizerId_) {
                runtime_->channels.send(
                    synchronizerId_,
                    ActorFailed{ .from = synchronizerId_, .error = "thread start failed" });
            }
            else {
                runtime_->channels.send(actor->id(), Terminate{});
            }
        }
        joinThreads();
        result_ = RunResult{};
        result_->failure = std::string("thread start failed: ") + e.what();
        return Result<std::monostate, std::string>::error(result_->failure.value());
    }
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Network::~Network()
{
    if (!result_.has_value() && !threads_.empty()) {
        abandon("network destroyed while running");
    }
    joinThreads();
}

void Network::start(int steps)
{
    if (started_) {
        LOG_WARN(Cortex, "Network already started");
        return;
    }
    started_ = true;
    runtime_->channels.send(synchronizerId_, Start{ .steps = steps });
}

RunResult Network::wait()
{
    if (result_.has_value()) {
        return result_.value();
    }
    if (!started_) {
        terminate();
    }

    result_ = future_.get();
    joinThreads();
    return result_.value();
}

std::optional<RunResult> Network::waitFor(std::chrono::milliseconds timeout)
{
    if (result_.has_value()) {
        return result_;
    }
    if (future_.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }
    return wait();
}

void Network::terminate()
{
    runtime_->channels.send(synchronizerId_, Terminate{});
}

void Network::abandon(const std::string& reason)
{
    if (result_.has_value()) {
        return;
    }

    // A failure report makes the synchronizer terminate every actor without
    // waiting for backups, so only threads stuck in a callback linger.
    runtime_->channels.send(
        synchronizerId_, ActorFailed{ .from = synchronizerId_, .error = reason });
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
    threads_.clear();

    LOG_WARN(Cortex, "Network abandoned: {}", reason);
    result_ = RunResult{ .failure = reason };
}

void Network::joinThreads()
{
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

Result<RunResult, std::string> runEpisode(
    const Genotype& genotype,
    const InterfaceRegistry& registry,
    int steps,
    std::chrono::milliseconds timeout)
{
    auto built = Network::build(genotype, registry);
    if (built.isError()) {
        return Result<RunResult, std::string>::error(built.errorValue());
    }

    Network& network = *built.value();
    network.start(steps);

    auto result = network.waitFor(timeout);
    if (!result.has_value()) {
        const std::string error =
            "Evaluation timed out after " + std::to_string(timeout.count()) + " ms";
        network.abandon(error);
        return Result<RunResult, std::string>::error(error);
    }
    if (!result->succeeded()) {
        return Result<RunResult, std::string>::error(result->failure.value());
    }
    return Result<RunResult, std::string>::okay(std::move(result.value()));
}

} // namespace Cortex
} // namespace NeuroEvo
