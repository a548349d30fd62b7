#ifndef ALLOCATION_H
#define ALLOCATION_H

#include <cstdint>
#include <string>
#include <vector>

#include "kernel/Config.h"

// Layout of an allocation vector: [r0_education, r0_enforcement, r0_incentive, r1_education, ...]
constexpr std::size_t kLeversPerRegion = 3;

struct ScaledAllocation {
    std::vector<double> amounts;   // pesos, same layout as the request
    double requested = 0.0;        // sum of sanitized fractions
    double scale = 0.0;            // factor applied to the fractions (0 when nothing was requested)

    double total() const;
    double education(std::size_t region) const { return amounts[region * kLeversPerRegion]; }
    double enforcement(std::size_t region) const { return amounts[region * kLeversPerRegion + 1]; }
    double incentive(std::size_t region) const { return amounts[region * kLeversPerRegion + 2]; }
};

/**
 * Turns a controller request into pesos.
 *
 * Entries are fractions of the quarterly budget. Negative or non-finite
 * entries count as zero. A request summing above 1.0 is scaled down
 * proportionally so the total equals the budget; an empty request yields
 * zero funds and a scale of 0.0.
 */
ScaledAllocation scaleAllocation(const std::vector<double>& fractions, double quarterlyBudget);

// Built-in policies (fractions of the quarterly budget), split by population share.
std::vector<double> scenarioAllocation(Scenario scenario, const std::vector<std::uint32_t>& populations);

const char* scenarioName(Scenario scenario);
// Throws std::invalid_argument for an unknown name.
Scenario parseScenario(const std::string& name);

#endif
