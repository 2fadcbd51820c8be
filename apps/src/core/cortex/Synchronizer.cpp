#include "Synchronizer.h"
#include "core/LoggingChannels.h"

namespace NeuroEvo {
namespace Cortex {

Synchronizer::Synchronizer(
    NodeId id,
    const ChannelTable& channels,
    std::vector<NodeId> sensorIds,
    std::vector<NodeId> neuronIds,
    std::vector<NodeId> actuatorIds)
    : Actor(id, id, channels),
      sensorIds_(std::move(sensorIds)),
      neuronIds_(std::move(neuronIds)),
      actuatorIds_(std::move(actuatorIds)),
      actuatorSet_(actuatorIds_.begin(), actuatorIds_.end())
{
    result_.phaseTrace.push_back(phase_);
}

void Synchronizer::receiveLoop(Mailbox& mailbox)
{
    while (phase_ != SynchronizerPhase::Terminated) {
        const Message message = mailbox.pop();
        std::visit([this](const auto& m) { handle(m); }, message);
    }
}

void Synchronizer::onFailure(const std::string& error)
{
    LOG_ERROR(Cortex, "Synchronizer failed: {}", error);
    if (phase_ == SynchronizerPhase::Terminated) {
        return;
    }
    result_.failure = "synchronizer: " + error;
    result_.backup.clear();
    terminateAll();
    enter(SynchronizerPhase::Terminated);
    promise_.set_value(result_);
}

void Synchronizer::handle(const Start& start)
{
    if (phase_ != SynchronizerPhase::AwaitingInitialState) {
        LOG_WARN(Cortex, "Synchronizer ignoring Start while {}", toString(phase_));
        return;
    }

    result_.stepsRequested = start.steps;
    stepsRemaining_ = start.steps;
    if (stepsRemaining_ <= 0) {
        beginBackup();
        return;
    }

    enter(SynchronizerPhase::Running);
    triggerSensors();
}

void Synchronizer::handle(const Sync& sync)
{
    if (phase_ != SynchronizerPhase::Running) {
        LOG_TRACE(Cortex, "Synchronizer dropping Sync from {} while {}", sync.from, toString(phase_));
        return;
    }
    if (!actuatorSet_.contains(sync.from)) {
        LOG_WARN(Cortex, "Synchronizer got Sync from unknown actor {}", sync.from);
        return;
    }

    synced_.insert(sync.from);
    if (synced_.size() < actuatorSet_.size()) {
        return;
    }

    synced_.clear();
    result_.cyclesCompleted++;
    stepsRemaining_--;
    LOG_TRACE(
        Cortex, "Cycle {} complete, {} steps left", result_.cyclesCompleted, stepsRemaining_);

    if (stepsRemaining_ > 0) {
        triggerSensors();
    }
    else {
        beginBackup();
    }
}

void Synchronizer::handle(const Backup& backup)
{
    if (phase_ != SynchronizerPhase::CollectingBackup) {
        return;
    }

    backups_[backup.backup.neuronId] = backup.backup;
    if (backups_.size() == neuronIds_.size()) {
        finish();
    }
}

void Synchronizer::handle(const Terminate& /*terminate*/)
{
    if (phase_ == SynchronizerPhase::AwaitingInitialState
        || phase_ == SynchronizerPhase::Running) {
        LOG_DEBUG(Cortex, "Synchronizer terminated after {} cycles", result_.cyclesCompleted);
        result_.terminatedEarly = true;
        beginBackup();
    }
}

void Synchronizer::handle(const ActorFailed& failed)
{
    result_.failure = "actor " + std::to_string(failed.from.get()) + ": " + failed.error;
    result_.backup.clear();
    terminateAll();
    enter(SynchronizerPhase::Terminated);
    promise_.set_value(result_);
}

template <typename T>
void Synchronizer::handle(const T& message)
{
    LOG_WARN(Cortex, "Synchronizer ignoring {}", message.name());
}

void Synchronizer::enter(SynchronizerPhase phase)
{
    phase_ = phase;
    result_.phaseTrace.push_back(phase);
}

void Synchronizer::triggerSensors()
{
    result_.sensorTriggers++;
    for (const NodeId sensor : sensorIds_) {
        send(sensor, Sample{});
    }
}

void Synchronizer::beginBackup()
{
    enter(SynchronizerPhase::CollectingBackup);
    if (neuronIds_.empty()) {
        finish();
        return;
    }
    for (const NodeId neuron : neuronIds_) {
        send(neuron, GetBackup{});
    }
}

void Synchronizer::finish()
{
    result_.backup.clear();
    for (const NodeId neuron : neuronIds_) {
        result_.backup.push_back(backups_.at(neuron));
    }

    terminateAll();
    enter(SynchronizerPhase::Terminated);
    promise_.set_value(result_);
}

void Synchronizer::terminateAll()
{
    for (const NodeId sensor : sensorIds_) {
        channels_.send(sensor, Terminate{});
    }
    for (const NodeId neuron : neuronIds_) {
        channels_.send(neuron, Terminate{});
    }
    for (const NodeId actuator : actuatorIds_) {
        channels_.send(actuator, Terminate{});
    }
}

} // namespace Cortex
} // namespace NeuroEvo
