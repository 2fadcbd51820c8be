#include "Innovation.h"

namespace NeuroEvo {

namespace {
void hashBytes(uint64_t& hash, const void* data, size_t size)
{
    constexpr uint64_t FNV_PRIME = 1099511628211ull;
    const auto* bytes = static_cast<const uint8_t*>(data);
    for (size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= FNV_PRIME;
    }
}
} // namespace

InnovationHasher& InnovationHasher::add(std::string_view value)
{
    // Length prefix keeps ("ab", "c") and ("a", "bc") apart.
    add(static_cast<uint64_t>(value.size()));
    if (!value.empty()) {
        hashBytes(hash_, value.data(), value.size());
    }
    return *this;
}

InnovationHasher& InnovationHasher::add(uint64_t value)
{
    // Fixed little-endian byte order so ids are stable across hosts.
    uint8_t bytes[8];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    hashBytes(hash_, bytes, sizeof(bytes));
    return *this;
}

InnovationHasher& InnovationHasher::add(int value)
{
    return add(static_cast<uint64_t>(static_cast<int64_t>(value)));
}

NodeId sensorNodeId(std::string_view name, int ordinal)
{
    return NodeId{ InnovationHasher().add("sensor").add(name).add(ordinal).value() };
}

NodeId actuatorNodeId(std::string_view name, int ordinal)
{
    return NodeId{ InnovationHasher().add("actuator").add(name).add(ordinal).value() };
}

NodeId biasNodeId()
{
    return NodeId{ InnovationHasher().add("bias").value() };
}

NodeId layerNeuronId(int layer, int index)
{
    return NodeId{ InnovationHasher().add("neuron").add(layer).add(index).value() };
}

NodeId splitNeuronId(NodeId source, int sourceIndex, NodeId target)
{
    return NodeId{ InnovationHasher()
                       .add("node_between")
                       .add(source.get())
                       .add(sourceIndex)
                       .add(target.get())
                       .value() };
}

Innovation nodeInnovation(NodeId id)
{
    return id.get();
}

Innovation connectionInnovation(NodeId source, int sourceIndex, NodeId target)
{
    return InnovationHasher()
        .add("connection")
        .add(source.get())
        .add(target.get())
        .add(sourceIndex)
        .value();
}

} // namespace NeuroEvo
