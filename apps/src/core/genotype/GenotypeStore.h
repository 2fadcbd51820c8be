#pragma once

#include "Genotype.h"
#include "GenotypeRecords.h"
#include "core/Result.h"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace NeuroEvo {

enum class GenotypeFormat { JsonLines, Binary };

/**
 * Genotype files: the record stream of GenotypeRecords.h written either as
 * line-delimited JSON (one object per record, tagged by "record") or as a
 * zpp_bits encoded, length-prefixed record vector behind a magic number.
 * Loading detects the format from the first bytes.
 */
class GenotypeStore {
public:
    static std::string toJsonLines(const Genotype& genotype);
    static Result<Genotype, std::string> fromJsonLines(const std::string& text);

    static std::vector<std::byte> toBinary(const Genotype& genotype);
    static Result<Genotype, std::string> fromBinary(std::span<const std::byte> data);

    static Result<std::monostate, std::string> save(
        const Genotype& genotype, const std::filesystem::path& path, GenotypeFormat format);
    static Result<Genotype, std::string> load(const std::filesystem::path& path);

    static constexpr uint32_t kBinaryMagic = 0x4F56454E; // "NEVO" little-endian.
    static constexpr uint32_t kBinaryVersion = 1;
};

nlohmann::json recordToJson(const GenotypeRecord::Any& record);
Result<GenotypeRecord::Any, std::string> recordFromJson(const nlohmann::json& j);

} // namespace NeuroEvo
