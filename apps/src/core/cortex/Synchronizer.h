#pragma once

#include "Actor.h"
#include "RunResult.h"

#include <future>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

/**
 * Cycle barrier and lifecycle owner of a network.
 *
 * AwaitingInitialState -> Running -> CollectingBackup -> Terminated
 *
 * Start triggers the first cycle. Every time all actuators have synced the
 * step budget is decremented: above zero the sensors are sampled again, at
 * zero a backup is requested from every neuron and, once all have answered,
 * every actor is told to terminate. An out-of-band Terminate skips straight
 * to CollectingBackup. ActorFailed tears the network down without a backup.
 */
class Synchronizer : public Actor {
public:
    Synchronizer(
        NodeId id,
        const ChannelTable& channels,
        std::vector<NodeId> sensorIds,
        std::vector<NodeId> neuronIds,
        std::vector<NodeId> actuatorIds);

    const char* kind() const override { return "Synchronizer"; }

    std::future<RunResult> result() { return promise_.get_future(); }

protected:
    void receiveLoop(Mailbox& mailbox) override;
    void onFailure(const std::string& error) override;

private:
    void handle(const Start& start);
    void handle(const Sync& sync);
    void handle(const Backup& backup);
    void handle(const Terminate& terminate);
    void handle(const ActorFailed& failed);

    template <typename T>
    void handle(const T& message);

    void enter(SynchronizerPhase phase);
    void triggerSensors();
    void beginBackup();
    void finish();
    void terminateAll();

    std::vector<NodeId> sensorIds_;
    std::vector<NodeId> neuronIds_;
    std::vector<NodeId> actuatorIds_;
    std::unordered_set<NodeId> actuatorSet_;

    SynchronizerPhase phase_ = SynchronizerPhase::AwaitingInitialState;
    int stepsRemaining_ = 0;
    std::unordered_set<NodeId> synced_;
    std::unordered_map<NodeId, NeuronBackup> backups_;

    RunResult result_;
    std::promise<RunResult> promise_;
};

} // namespace Cortex
} // namespace NeuroEvo
