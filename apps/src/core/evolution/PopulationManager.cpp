#include "PopulationManager.h"
#include "Compatibility.h"
#include "Crossover.h"
#include "Mutation.h"
#include "Selection.h"

#include "core/LoggingChannels.h"
#include "core/cortex/InterfaceRegistry.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace NeuroEvo {

namespace {

bool isRate(double value)
{
    return value >= 0.0 && value <= 1.0;
}

Genotype freshGenotype(Population& population, std::mt19937& rng)
{
    Genotype genotype = constructGenotype(population.nextGenotypeId++, population.layout, rng);
    genotype.generationCreated = population.generation;
    return genotype;
}

} // namespace

Result<std::monostate, std::string> validateConfig(const EvolutionConfig& config)
{
    using R = Result<std::monostate, std::string>;
    if (config.populationSize < 1) {
        return R::error("populationSize must be at least 1");
    }
    if (config.tournamentSize < 1) {
        return R::error("tournamentSize must be at least 1");
    }
    if (config.compatibilityThreshold <= 0.0) {
        return R::error("compatibilityThreshold must be positive");
    }
    if (config.maxParallelEvaluations < 0) {
        return R::error("maxParallelEvaluations must not be negative");
    }

    const MutationConfig& m = config.mutation;
    if (!isRate(config.crossoverRate) || !isRate(m.weightMutationRate)
        || !isRate(m.weightPerturbationRate) || !isRate(m.addNodeRate)
        || !isRate(m.addConnectionRate) || !isRate(m.toggleRate)) {
        return R::error("rates must lie in [0, 1]");
    }
    if (!(m.weightRange >= 0.0) || !(m.perturbationMagnitude >= 0.0)) {
        return R::error("weightRange and perturbationMagnitude must not be negative");
    }

    const CompatibilityConfig& c = config.compatibility;
    if (!(c.excessCoefficient >= 0.0) || !(c.disjointCoefficient >= 0.0)
        || !(c.weightCoefficient >= 0.0)) {
        return R::error("compatibility coefficients must not be negative");
    }
    return R::okay(std::monostate{});
}

Population createInitialPopulation(
    const EvolutionConfig& config, const InterfaceLayout& layout, std::mt19937& rng)
{
    Population population{ .config = config, .layout = layout };
    for (int i = 0; i < config.populationSize; ++i) {
        Genotype genotype = freshGenotype(population, rng);
        const GenotypeId id = genotype.id;
        population.genotypes.emplace(id, std::move(genotype));
    }

    LOG_INFO(Evolution, "Created initial population of {} genotypes", population.size());
    return speciate(population);
}

Result<Population, std::string> createInitialPopulation(
    const EvolutionConfig& config,
    const GenotypeSpec& spec,
    const InterfaceRegistry& registry,
    std::mt19937& rng)
{
    using R = Result<Population, std::string>;

    auto valid = validateConfig(config);
    if (valid.isError()) {
        return R::error(valid.errorValue());
    }

    auto layout = resolveLayout(spec, registry);
    if (layout.isError()) {
        return R::error(layout.errorValue());
    }
    return R::okay(createInitialPopulation(config, layout.value(), rng));
}

Population speciate(const Population& population)
{
    Population next = population;
    const int generation = next.generation;

    for (auto& species : next.species) {
        species.members.clear();
    }

    for (auto& [id, genotype] : next.genotypes) {
        std::optional<size_t> home;
        for (size_t i = 0; i < next.species.size(); ++i) {
            const double distance = compatibilityDistance(
                genotype, next.species[i].representative, next.config.compatibility);
            if (distance < next.config.compatibilityThreshold) {
                home = i;
                break;
            }
        }

        if (!home) {
            next.species.push_back(
                Species{ .id = next.nextSpeciesId++,
                         .representative = genotype,
                         .lastImprovementGeneration = generation,
                         .createdGeneration = generation });
            home = next.species.size() - 1;
            LOG_DEBUG(
                Species, "Genotype {} founded species {}", id, next.species[*home].id);
        }

        next.species[*home].members.push_back(id);
        genotype.speciesId = next.species[*home].id;
    }

    const auto firstEmpty = std::remove_if(
        next.species.begin(), next.species.end(), [](const Species& species) {
            return species.members.empty();
        });
    for (auto it = firstEmpty; it != next.species.end(); ++it) {
        LOG_DEBUG(Species, "Species {} went extinct", it->id);
    }
    next.species.erase(firstEmpty, next.species.end());

    for (auto& species : next.species) {
        species.representative = next.genotypes.at(species.members.front());
        species.age = generation - species.createdGeneration;
    }

    LOG_DEBUG(
        Species,
        "Generation {}: {} genotypes in {} species",
        generation,
        next.size(),
        next.species.size());
    return next;
}

std::vector<Genotype> unevaluatedGenotypes(const Population& population)
{
    std::vector<Genotype> pending;
    for (const auto& [id, genotype] : population.genotypes) {
        if (!genotype.evaluated) {
            pending.push_back(genotype);
        }
    }
    return pending;
}

Population applyEvaluations(
    const Population& population, const std::vector<EvaluationResult>& results)
{
    Population next = population;
    GenerationStats stats{ .generation = next.generation };

    for (const auto& result : results) {
        auto it = next.genotypes.find(result.genotypeId);
        if (it == next.genotypes.end()) {
            LOG_WARN(Evolution, "Discarding result for unknown genotype {}", result.genotypeId);
            continue;
        }

        Genotype& genotype = it->second;
        genotype.fitness = result.failed ? 0.0 : result.fitness;
        genotype.evaluated = true;
        genotype.evaluationFailed = result.failed;
        stats.evaluations++;
        if (result.failed) {
            stats.failedEvaluations++;
        }
    }

    for (auto& species : next.species) {
        const double size = static_cast<double>(species.members.size());
        double sum = 0.0;
        double best = std::numeric_limits<double>::lowest();
        for (const GenotypeId id : species.members) {
            Genotype& member = next.genotypes.at(id);
            member.adjustedFitness = member.fitness / size;
            sum += member.fitness;
            best = std::max(best, member.fitness);
        }
        species.meanFitness = sum / size;

        if (best > species.bestFitness) {
            species.bestFitness = best;
            species.lastImprovementGeneration = next.generation;
        }

        const bool wasStagnant = species.stagnant;
        species.stagnant =
            species.isStagnant(next.generation, next.config.stagnationThreshold);
        if (species.stagnant) {
            stats.stagnantSpecies.push_back(species.id);
            if (!wasStagnant) {
                LOG_INFO(
                    Species,
                    "Species {} stagnant since generation {}",
                    species.id,
                    species.lastImprovementGeneration);
            }
        }
    }

    const Genotype* fittest = nullptr;
    double total = 0.0;
    for (const auto& [id, genotype] : next.genotypes) {
        total += genotype.fitness;
        if (genotype.evaluated && (!fittest || genotype.fitness > fittest->fitness)) {
            fittest = &genotype;
        }
    }

    if (fittest) {
        stats.bestFitness = fittest->fitness;
        if (!next.best || fittest->fitness > next.best->fitness) {
            next.best = *fittest;
        }
    }
    if (!next.genotypes.empty()) {
        stats.meanFitness = total / static_cast<double>(next.genotypes.size());
    }
    stats.speciesCount = static_cast<int>(next.species.size());
    next.history.push_back(stats);

    LOG_INFO(
        Evolution,
        "Generation {}: best {:.4f}, mean {:.4f}, {} species, {} failed",
        stats.generation,
        stats.bestFitness,
        stats.meanFitness,
        stats.speciesCount,
        stats.failedEvaluations);
    return next;
}

std::vector<int> computeOffspringCounts(
    const std::vector<double>& speciesMeanFitness, int populationSize)
{
    std::vector<int> counts(speciesMeanFitness.size(), 0);
    if (speciesMeanFitness.empty()) {
        return counts;
    }

    const double total = std::accumulate(
        speciesMeanFitness.begin(),
        speciesMeanFitness.end(),
        0.0,
        [](double sum, double mean) { return sum + std::max(0.0, mean); });

    for (size_t i = 0; i < counts.size(); ++i) {
        const double share = total > 0.0
            ? std::max(0.0, speciesMeanFitness[i]) / total
            : 1.0 / static_cast<double>(counts.size());
        counts[i] = static_cast<int>(std::lround(share * populationSize));
    }
    return counts;
}

Population nextGeneration(const Population& population, std::mt19937& rng)
{
    const EvolutionConfig& config = population.config;

    Population next{ .generation = population.generation + 1,
                     .species = population.species,
                     .config = config,
                     .layout = population.layout,
                     .nextGenotypeId = population.nextGenotypeId,
                     .nextSpeciesId = population.nextSpeciesId,
                     .best = population.best,
                     .history = population.history };

    std::vector<double> means;
    for (const auto& species : population.species) {
        means.push_back(species.meanFitness);
    }
    const std::vector<int> counts = computeOffspringCounts(means, config.populationSize);

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<Genotype> offspring;
    MutationStats totals;
    const auto tally = [&totals](const MutationStats& stats) {
        totals.nodesAdded += stats.nodesAdded;
        totals.connectionsAdded += stats.connectionsAdded;
        totals.connectionsToggled += stats.connectionsToggled;
    };

    for (size_t i = 0; i < population.species.size(); ++i) {
        const Species& species = population.species[i];

        std::vector<const Genotype*> members;
        for (const GenotypeId id : species.members) {
            members.push_back(population.find(id));
        }
        std::stable_sort(members.begin(), members.end(), [](const Genotype* a, const Genotype* b) {
            return a->fitness > b->fitness;
        });

        int produced = 0;
        if (counts[i] > 0 && members.size() > static_cast<size_t>(config.elitismMinSpeciesSize)) {
            offspring.push_back(*members.front());
            produced++;
        }

        while (produced < counts[i]) {
            const Genotype& first = tournamentSelect(members, config.tournamentSize, rng);

            Genotype child;
            MutationStats stats;
            if (members.size() >= 2 && unit(rng) < config.crossoverRate) {
                const Genotype& second = tournamentSelect(members, config.tournamentSize, rng);
                child = mutate(
                    crossover(first, second, next.nextGenotypeId++, config.crossover, rng),
                    config.mutation,
                    rng,
                    &stats);
            }
            else {
                child = mutate(first, config.mutation, rng, &stats);
                child.id = next.nextGenotypeId++;
            }
            tally(stats);
            child.generationCreated = next.generation;
            offspring.push_back(std::move(child));
            produced++;
        }
    }

    if (offspring.size() > static_cast<size_t>(config.populationSize)) {
        offspring.resize(config.populationSize);
    }
    while (offspring.size() < static_cast<size_t>(config.populationSize)) {
        offspring.push_back(freshGenotype(next, rng));
    }

    for (auto& genotype : offspring) {
        const GenotypeId id = genotype.id;
        next.genotypes.emplace(id, std::move(genotype));
    }

    LOG_DEBUG(
        Evolution,
        "Generation {} bred: {} nodes added, {} connections added, {} toggled",
        next.generation,
        totals.nodesAdded,
        totals.connectionsAdded,
        totals.connectionsToggled);
    return speciate(next);
}

} // namespace NeuroEvo
