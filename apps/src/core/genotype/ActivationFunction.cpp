#include "ActivationFunction.h"

#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

namespace NeuroEvo {

namespace {

double tanhActivation(double x)
{
    return std::tanh(x);
}

double sigmoidActivation(double x)
{
    return 1.0 / (1.0 + std::exp(-x));
}

double reluActivation(double x)
{
    return x > 0.0 ? x : 0.0;
}

double linearActivation(double x)
{
    return x;
}

double gaussianActivation(double x)
{
    return std::exp(-x * x);
}

struct ActivationEntry {
    ActivationFunction function;
    const char* name;
    ActivationFn fn;
};

// Indexed by enum value.
constexpr std::array<ActivationEntry, 5> kActivationTable = { {
    { ActivationFunction::Tanh, "tanh", &tanhActivation },
    { ActivationFunction::Sigmoid, "sigmoid", &sigmoidActivation },
    { ActivationFunction::Relu, "relu", &reluActivation },
    { ActivationFunction::Linear, "linear", &linearActivation },
    { ActivationFunction::Gaussian, "gaussian", &gaussianActivation },
} };

} // namespace

ActivationFn resolveActivation(ActivationFunction function)
{
    const auto index = static_cast<size_t>(function);
    if (index >= kActivationTable.size()) {
        return &linearActivation;
    }
    return kActivationTable[index].fn;
}

const char* toString(ActivationFunction function)
{
    const auto index = static_cast<size_t>(function);
    if (index >= kActivationTable.size()) {
        return "unknown";
    }
    return kActivationTable[index].name;
}

std::optional<ActivationFunction> activationFromString(std::string_view name)
{
    for (const auto& entry : kActivationTable) {
        if (name == entry.name) {
            return entry.function;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, ActivationFunction function)
{
    j = toString(function);
}

void from_json(const nlohmann::json& j, ActivationFunction& function)
{
    const auto name = j.get<std::string>();
    const auto parsed = activationFromString(name);
    if (!parsed.has_value()) {
        throw std::runtime_error("Unknown activation function: " + name);
    }
    function = parsed.value();
}

} // namespace NeuroEvo
