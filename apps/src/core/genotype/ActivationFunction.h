#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace NeuroEvo {

/**
 * Activation functions a neuron gene may carry. Resolved to a function pointer
 * once, when the phenotype is built.
 */
enum class ActivationFunction : uint8_t { Tanh, Sigmoid, Relu, Linear, Gaussian };

using ActivationFn = double (*)(double);

ActivationFn resolveActivation(ActivationFunction function);

inline double applyActivation(ActivationFunction function, double x)
{
    return resolveActivation(function)(x);
}

const char* toString(ActivationFunction function);
std::optional<ActivationFunction> activationFromString(std::string_view name);

void to_json(nlohmann::json& j, ActivationFunction function);
void from_json(const nlohmann::json& j, ActivationFunction& function);

} // namespace NeuroEvo
