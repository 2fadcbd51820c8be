#include "GenotypeStore.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <zpp_bits.h>

namespace NeuroEvo {

namespace {

template <typename Record>
Result<GenotypeRecord::Any, std::string> parseRecord(const nlohmann::json& j)
{
    try {
        if constexpr (std::is_same_v<Record, GenotypeRecord::Header>) {
            return Result<GenotypeRecord::Any, std::string>::okay(
                ReflectSerializer::from_json<GenotypeRecord::Header>(j));
        }
        else if constexpr (std::is_same_v<Record, GenotypeRecord::Sensor>) {
            return Result<GenotypeRecord::Any, std::string>::okay(
                GenotypeRecord::Sensor{ .ref = j.get<SensorRef>() });
        }
        else if constexpr (std::is_same_v<Record, GenotypeRecord::Actuator>) {
            return Result<GenotypeRecord::Any, std::string>::okay(
                GenotypeRecord::Actuator{ .ref = j.get<ActuatorRef>() });
        }
        else if constexpr (std::is_same_v<Record, GenotypeRecord::Node>) {
            return Result<GenotypeRecord::Any, std::string>::okay(
                GenotypeRecord::Node{ .gene = j.get<NodeGene>() });
        }
        else {
            return Result<GenotypeRecord::Any, std::string>::okay(
                GenotypeRecord::Connection{ .gene = j.get<ConnectionGene>() });
        }
    }
    catch (const std::exception& e) {
        return Result<GenotypeRecord::Any, std::string>::error(
            std::string("Malformed ") + Record::name() + " record: " + e.what());
    }
}

} // namespace

nlohmann::json recordToJson(const GenotypeRecord::Any& record)
{
    nlohmann::json j = std::visit(
        [](const auto& r) -> nlohmann::json {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, GenotypeRecord::Header>) {
                return ReflectSerializer::to_json(r);
            }
            else if constexpr (
                std::is_same_v<T, GenotypeRecord::Sensor>
                || std::is_same_v<T, GenotypeRecord::Actuator>) {
                return r.ref;
            }
            else {
                return r.gene;
            }
        },
        record);
    j["record"] = GenotypeRecord::getRecordName(record);
    return j;
}

Result<GenotypeRecord::Any, std::string> recordFromJson(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("record") || !j["record"].is_string()) {
        return Result<GenotypeRecord::Any, std::string>::error("Record has no \"record\" tag");
    }

    const auto tag = j["record"].get<std::string>();
    if (tag == GenotypeRecord::Header::name()) {
        return parseRecord<GenotypeRecord::Header>(j);
    }
    if (tag == GenotypeRecord::Sensor::name()) {
        return parseRecord<GenotypeRecord::Sensor>(j);
    }
    if (tag == GenotypeRecord::Actuator::name()) {
        return parseRecord<GenotypeRecord::Actuator>(j);
    }
    if (tag == GenotypeRecord::Node::name()) {
        return parseRecord<GenotypeRecord::Node>(j);
    }
    if (tag == GenotypeRecord::Connection::name()) {
        return parseRecord<GenotypeRecord::Connection>(j);
    }
    return Result<GenotypeRecord::Any, std::string>::error("Unknown record tag: " + tag);
}

std::string GenotypeStore::toJsonLines(const Genotype& genotype)
{
    std::ostringstream out;
    for (const auto& record : toRecords(genotype)) {
        out << recordToJson(record).dump() << '\n';
    }
    return out.str();
}

Result<Genotype, std::string> GenotypeStore::fromJsonLines(const std::string& text)
{
    std::vector<GenotypeRecord::Any> records;
    std::istringstream in(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        lineNumber++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(line);
        }
        catch (const nlohmann::json::parse_error& e) {
            return Result<Genotype, std::string>::error(
                "Line " + std::to_string(lineNumber) + ": " + e.what());
        }

        auto record = recordFromJson(j);
        if (record.isError()) {
            return Result<Genotype, std::string>::error(
                "Line " + std::to_string(lineNumber) + ": " + record.errorValue());
        }
        records.push_back(std::move(record.value()));
    }
    return fromRecords(records);
}

std::vector<std::byte> GenotypeStore::toBinary(const Genotype& genotype)
{
    const auto records = toRecords(genotype);

    std::vector<std::byte> data;
    zpp::bits::out out(data);
    out(kBinaryMagic, kBinaryVersion, records).or_throw();
    return data;
}

Result<Genotype, std::string> GenotypeStore::fromBinary(std::span<const std::byte> data)
{
    uint32_t magic = 0;
    uint32_t version = 0;
    std::vector<GenotypeRecord::Any> records;

    try {
        zpp::bits::in in(data);
        in(magic, version).or_throw();
        if (magic != kBinaryMagic) {
            return Result<Genotype, std::string>::error("Not a binary genotype file");
        }
        if (version != kBinaryVersion) {
            return Result<Genotype, std::string>::error(
                "Unsupported binary genotype version " + std::to_string(version));
        }
        in(records).or_throw();
    }
    catch (const std::exception& e) {
        return Result<Genotype, std::string>::error(
            std::string("Truncated or corrupt binary genotype: ") + e.what());
    }

    return fromRecords(records);
}

Result<std::monostate, std::string> GenotypeStore::save(
    const Genotype& genotype, const std::filesystem::path& path, GenotypeFormat format)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<std::monostate, std::string>::error("Cannot open " + path.string());
    }

    if (format == GenotypeFormat::JsonLines) {
        file << toJsonLines(genotype);
    }
    else {
        const auto data = toBinary(genotype);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    if (!file.good()) {
        return Result<std::monostate, std::string>::error("Failed writing " + path.string());
    }

    LOG_DEBUG(Persistence, "Saved genotype {} to {}", genotype.id, path.string());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Result<Genotype, std::string> GenotypeStore::load(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<Genotype, std::string>::error("Cannot open " + path.string());
    }

    const std::string contents(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    const auto firstChar = contents.find_first_not_of(" \t\r\n");
    if (firstChar != std::string::npos && contents[firstChar] == '{') {
        auto result = fromJsonLines(contents);
        if (result.isError()) {
            LOG_WARN(Persistence, "Failed to load {}: {}", path.string(), result.errorValue());
        }
        return result;
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(contents.data());
    auto result = fromBinary(std::span<const std::byte>(bytes, contents.size()));
    if (result.isError()) {
        LOG_WARN(Persistence, "Failed to load {}: {}", path.string(), result.errorValue());
    }
    return result;
}

} // namespace NeuroEvo
