#include "kernel/Config.h"

#include <stdexcept>

#include "utils/Validation.h"

void RegionProfile::validate() const {
    const std::string prefix = "region '" + name + "' ";
    Validation::requireUnitInterval(prefix + "initialCompliance", initialCompliance);
    Validation::requireUnitInterval(prefix + "decayRate", decayRate);
    Validation::requireUnitInterval(prefix + "effortCost", effortCost);
    Validation::requireNonNegative(prefix + "fineAmount", fineAmount);
}

std::vector<RegionProfile> defaultRegionProfiles() {
    // Household counts and starting compliance follow the barangay survey;
    // centres lay the seven clusters out on the default 50x50 grid.
    std::vector<RegionProfile> profiles;
    profiles.reserve(7);

    auto add = [&profiles](const char* name, std::uint32_t households, double compliance,
                           double effort, int cx, int cy) {
        RegionProfile p;
        p.name = name;
        p.households = households;
        p.initialCompliance = compliance;
        p.effortCost = effort;
        p.centerX = cx;
        p.centerY = cy;
        profiles.push_back(p);
    };

    add("Poblacion", 200, 0.4, 0.40, 10, 10);   // urban centre, harder to manage
    add("Liangan East", 50, 0.7, 0.20, 25, 10); // high trust
    add("Esperanza", 150, 0.3, 0.25, 40, 10);
    add("Binuni", 80, 0.5, 0.20, 10, 25);
    add("Demologan", 80, 0.5, 0.20, 25, 25);
    add("Mati", 80, 0.5, 0.20, 40, 25);
    add("Babalaya", 80, 0.5, 0.20, 25, 40);
    return profiles;
}

void SimConfig::validate() const {
    if (gridWidth <= 0 || gridHeight <= 0) {
        throw std::invalid_argument("grid dimensions must be > 0 (got " + std::to_string(gridWidth) +
                                    "x" + std::to_string(gridHeight) + ")");
    }
    if (stepsPerQuarter <= 0) {
        throw std::invalid_argument("stepsPerQuarter must be > 0 (got " +
                                    std::to_string(stepsPerQuarter) + ")");
    }
    if (quarters <= 0) {
        throw std::invalid_argument("quarters must be > 0 (got " + std::to_string(quarters) + ")");
    }
    Validation::requireNonNegative("annualBudget", annualBudget);
    Validation::requirePositive("enforcementUnitCost", enforcementUnitCost);
    Validation::requirePositive("enforcementSaturation", enforcementSaturation);
    if (patrolRange < 0 || catchRadius < 0) {
        throw std::invalid_argument("patrolRange and catchRadius must be >= 0");
    }
    Validation::requireUnitInterval("initialPoliticalCapital", initialPoliticalCapital);
    Validation::requireUnitInterval("capitalErosion", capitalErosion);
    Validation::requireUnitInterval("capitalRecovery", capitalRecovery);
    Validation::requireNonNegative("complianceRewardWeight", complianceRewardWeight);
    Validation::requireNonNegative("budgetRewardWeight", budgetRewardWeight);
    Validation::requireNonNegative("backlashPenalty", backlashPenalty);
    Validation::requireUnitInterval("backlashEnforcementLevel", backlashEnforcementLevel);
    Validation::requireUnitInterval("backlashComplianceLevel", backlashComplianceLevel);

    if (regions.empty()) {
        throw std::invalid_argument("at least one region profile is required");
    }
    for (const auto& profile : regions) {
        profile.validate();
        Validation::requireRange("region '" + profile.name + "' centerX", profile.centerX, 0, gridWidth - 1);
        Validation::requireRange("region '" + profile.name + "' centerY", profile.centerY, 0, gridHeight - 1);
    }
}
