#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Never compiled out. Reserved for invariants whose violation is a programming
 * error (registering an interface without a name, a node kind switch falling
 * through). Recoverable failures are returned as Result values instead.
 *
 * Example:
 *   NEUROEVO_ASSERT(!name.empty(), "Sensor interface must have a name");
 */
#define NEUROEVO_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
