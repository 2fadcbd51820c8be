#pragma once

#include <optional>
#include <string>
#include <variant>

namespace NeuroEvo {
namespace OrchestratorState {

struct Idle {
    static constexpr const char* name() { return "Idle"; }
};

struct Running {
    int targetGenerations = 0;
    int generationsCompleted = 0;

    static constexpr const char* name() { return "Running"; }
};

struct Completed {
    int generationsCompleted = 0;
    std::optional<std::string> savedBestPath;
    std::optional<std::string> saveError;

    static constexpr const char* name() { return "Completed"; }
};

struct Stopped {
    int generationsCompleted = 0;

    static constexpr const char* name() { return "Stopped"; }
};

// The generation that failed is still pending; retryGeneration() reissues it.
struct Error {
    std::string message;
    int generationsRemaining = 0;

    static constexpr const char* name() { return "Error"; }
};

using Any = std::variant<Idle, Running, Completed, Stopped, Error>;

inline std::string getStateName(const Any& state)
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, state);
}

} // namespace OrchestratorState
} // namespace NeuroEvo
