#pragma once

#include "GenotypeIds.h"

#include <cstdint>
#include <string_view>

namespace NeuroEvo {

/**
 * Deterministic ids and innovation numbers.
 *
 * Every gene id is an FNV-1a hash of the structural change that created it, so
 * the same change arising independently in two genotypes yields the same
 * number. Crossover alignment relies on this.
 */
class InnovationHasher {
public:
    InnovationHasher& add(std::string_view value);
    InnovationHasher& add(uint64_t value);
    InnovationHasher& add(int value);

    uint64_t value() const { return hash_; }

private:
    static constexpr uint64_t kOffsetBasis = 1469598103934665603ull;
    uint64_t hash_ = kOffsetBasis;
};

NodeId sensorNodeId(std::string_view name, int ordinal);
NodeId actuatorNodeId(std::string_view name, int ordinal);
NodeId biasNodeId();
NodeId layerNeuronId(int layer, int index);

// Neuron inserted by add-node when splitting source[sourceIndex] -> target.
NodeId splitNeuronId(NodeId source, int sourceIndex, NodeId target);

Innovation nodeInnovation(NodeId id);
Innovation connectionInnovation(NodeId source, int sourceIndex, NodeId target);

} // namespace NeuroEvo
