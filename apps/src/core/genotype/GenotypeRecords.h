#pragma once

#include "Genotype.h"
#include "core/Result.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <zpp_bits.h>

namespace NeuroEvo {
namespace GenotypeRecord {

// Genotype-level fields. Always the first record of a stream.
struct Header {
    GenotypeId id;
    double fitness = 0.0;
    double adjustedFitness = 0.0;
    std::optional<SpeciesId> speciesId;
    int generationCreated = 0;
    bool evaluated = false;
    bool evaluationFailed = false;

    bool operator==(const Header&) const = default;

    using serialize = zpp::bits::members<7>;
    static constexpr const char* name() { return "header"; }
};

struct Sensor {
    SensorRef ref;

    bool operator==(const Sensor&) const = default;

    using serialize = zpp::bits::members<1>;
    static constexpr const char* name() { return "sensor"; }
};

struct Actuator {
    ActuatorRef ref;

    bool operator==(const Actuator&) const = default;

    using serialize = zpp::bits::members<1>;
    static constexpr const char* name() { return "actuator"; }
};

struct Node {
    NodeGene gene;

    bool operator==(const Node&) const = default;

    using serialize = zpp::bits::members<1>;
    static constexpr const char* name() { return "node"; }
};

struct Connection {
    ConnectionGene gene;

    bool operator==(const Connection&) const = default;

    using serialize = zpp::bits::members<1>;
    static constexpr const char* name() { return "connection"; }
};

using Any = std::variant<Header, Sensor, Actuator, Node, Connection>;

std::string getRecordName(const Any& record);

} // namespace GenotypeRecord

// Header, then sensors, actuators, nodes and connections in genotype order.
std::vector<GenotypeRecord::Any> toRecords(const Genotype& genotype);

// Rejects streams without a leading header, duplicate headers, and genes that
// reference nodes absent from the stream.
Result<Genotype, std::string> fromRecords(const std::vector<GenotypeRecord::Any>& records);

} // namespace NeuroEvo
