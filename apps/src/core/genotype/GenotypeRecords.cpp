#include "GenotypeRecords.h"
#include "Innovation.h"

#include <unordered_set>

namespace NeuroEvo {

namespace GenotypeRecord {
std::string getRecordName(const Any& record)
{
    return std::visit([](const auto& r) { return std::string(r.name()); }, record);
}
} // namespace GenotypeRecord

std::vector<GenotypeRecord::Any> toRecords(const Genotype& genotype)
{
    std::vector<GenotypeRecord::Any> records;
    records.reserve(
        1 + genotype.sensors.size() + genotype.actuators.size() + genotype.nodes.size()
        + genotype.connections.size());

    records.emplace_back(GenotypeRecord::Header{
        .id = genotype.id,
        .fitness = genotype.fitness,
        .adjustedFitness = genotype.adjustedFitness,
        .speciesId = genotype.speciesId,
        .generationCreated = genotype.generationCreated,
        .evaluated = genotype.evaluated,
        .evaluationFailed = genotype.evaluationFailed,
    });
    for (const auto& sensor : genotype.sensors) {
        records.emplace_back(GenotypeRecord::Sensor{ .ref = sensor });
    }
    for (const auto& actuator : genotype.actuators) {
        records.emplace_back(GenotypeRecord::Actuator{ .ref = actuator });
    }
    for (const auto& node : genotype.nodes) {
        records.emplace_back(GenotypeRecord::Node{ .gene = node });
    }
    for (const auto& connection : genotype.connections) {
        records.emplace_back(GenotypeRecord::Connection{ .gene = connection });
    }
    return records;
}

Result<Genotype, std::string> fromRecords(const std::vector<GenotypeRecord::Any>& records)
{
    using GenotypeResult = Result<Genotype, std::string>;

    if (records.empty() || !std::holds_alternative<GenotypeRecord::Header>(records.front())) {
        return GenotypeResult::error("Record stream must start with a header");
    }

    Genotype genotype;
    const auto& header = std::get<GenotypeRecord::Header>(records.front());
    genotype.id = header.id;
    genotype.fitness = header.fitness;
    genotype.adjustedFitness = header.adjustedFitness;
    genotype.speciesId = header.speciesId;
    genotype.generationCreated = header.generationCreated;
    genotype.evaluated = header.evaluated;
    genotype.evaluationFailed = header.evaluationFailed;

    for (size_t i = 1; i < records.size(); ++i) {
        const auto& record = records[i];
        if (const auto* sensor = std::get_if<GenotypeRecord::Sensor>(&record)) {
            genotype.sensors.push_back(sensor->ref);
        }
        else if (const auto* actuator = std::get_if<GenotypeRecord::Actuator>(&record)) {
            genotype.actuators.push_back(actuator->ref);
        }
        else if (const auto* node = std::get_if<GenotypeRecord::Node>(&record)) {
            genotype.nodes.push_back(node->gene);
        }
        else if (const auto* connection = std::get_if<GenotypeRecord::Connection>(&record)) {
            genotype.connections.push_back(connection->gene);
        }
        else {
            return GenotypeResult::error(
                "Unexpected " + GenotypeRecord::getRecordName(record) + " record at position "
                + std::to_string(i));
        }
    }

    genotype.sortGenes();

    std::unordered_set<NodeId> nodeIds;
    for (const auto& node : genotype.nodes) {
        if (!nodeIds.insert(node.id).second) {
            return GenotypeResult::error("Duplicate node " + std::to_string(node.id.get()));
        }
        // Crossover aligns genes by innovation, so a stored number must match
        // the one the gene's structure hashes to.
        if (node.innovation != nodeInnovation(node.id)) {
            return GenotypeResult::error(
                "Node " + std::to_string(node.id.get()) + " has innovation "
                + std::to_string(node.innovation) + ", expected "
                + std::to_string(nodeInnovation(node.id)));
        }
    }
    for (const auto& connection : genotype.connections) {
        if (!nodeIds.contains(connection.sourceId) || !nodeIds.contains(connection.targetId)) {
            return GenotypeResult::error(
                "Connection " + std::to_string(connection.innovation)
                + " references a missing node");
        }
        const Innovation expected = connectionInnovation(
            connection.sourceId, connection.sourceIndex, connection.targetId);
        if (connection.innovation != expected) {
            return GenotypeResult::error(
                "Connection " + std::to_string(connection.sourceId.get()) + "["
                + std::to_string(connection.sourceIndex) + "] -> "
                + std::to_string(connection.targetId.get()) + " has innovation "
                + std::to_string(connection.innovation) + ", expected "
                + std::to_string(expected));
        }
    }
    for (const auto& sensor : genotype.sensors) {
        if (!nodeIds.contains(sensor.id)) {
            return GenotypeResult::error("Sensor " + sensor.name + " has no node gene");
        }
    }
    for (const auto& actuator : genotype.actuators) {
        if (!nodeIds.contains(actuator.id)) {
            return GenotypeResult::error("Actuator " + actuator.name + " has no node gene");
        }
        for (const NodeId fanIn : actuator.fanInIds) {
            if (!nodeIds.contains(fanIn)) {
                return GenotypeResult::error(
                    "Actuator " + actuator.name + " fan-in references a missing node");
            }
        }
    }

    return GenotypeResult::okay(std::move(genotype));
}

} // namespace NeuroEvo
