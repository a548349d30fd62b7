#include "modules/Allocation.h"

#include <array>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {
// Education / enforcement / incentive split of each region's share
std::array<double, kLeversPerRegion> scenarioMix(Scenario scenario) {
    switch (scenario) {
        case Scenario::Baseline: return {0.0, 0.0, 0.0};
        case Scenario::StatusQuo: return {0.4, 0.4, 0.2};
        case Scenario::EducationHeavy: return {0.7, 0.15, 0.15};
        case Scenario::EnforcementHeavy: return {0.15, 0.7, 0.15};
        case Scenario::IncentiveHeavy: return {0.15, 0.15, 0.7};
    }
    return {0.0, 0.0, 0.0};
}
}

double ScaledAllocation::total() const {
    return std::accumulate(amounts.begin(), amounts.end(), 0.0);
}

ScaledAllocation scaleAllocation(const std::vector<double>& fractions, double quarterlyBudget) {
    ScaledAllocation out;
    out.amounts.assign(fractions.size(), 0.0);

    std::vector<double> clean(fractions.size(), 0.0);
    for (std::size_t i = 0; i < fractions.size(); ++i) {
        const double v = fractions[i];
        clean[i] = (std::isfinite(v) && v > 0.0) ? v : 0.0;
        out.requested += clean[i];
    }

    if (out.requested <= 0.0 || quarterlyBudget <= 0.0) {
        out.scale = 0.0;
        return out;
    }

    // Over-allocation is corrected, never rejected
    out.scale = out.requested > 1.0 ? 1.0 / out.requested : 1.0;
    for (std::size_t i = 0; i < clean.size(); ++i) {
        out.amounts[i] = clean[i] * out.scale * quarterlyBudget;
    }
    return out;
}

std::vector<double> scenarioAllocation(Scenario scenario, const std::vector<std::uint32_t>& populations) {
    const std::size_t regions = populations.size();
    std::vector<double> fractions(regions * kLeversPerRegion, 0.0);
    if (regions == 0) {
        return fractions;
    }

    const double totalPop = std::accumulate(populations.begin(), populations.end(), 0.0);
    const auto mix = scenarioMix(scenario);

    for (std::size_t r = 0; r < regions; ++r) {
        const double share = totalPop > 0.0 ? populations[r] / totalPop : 1.0 / regions;
        for (std::size_t k = 0; k < kLeversPerRegion; ++k) {
            fractions[r * kLeversPerRegion + k] = share * mix[k];
        }
    }
    return fractions;
}

const char* scenarioName(Scenario scenario) {
    switch (scenario) {
        case Scenario::Baseline: return "baseline";
        case Scenario::StatusQuo: return "status_quo";
        case Scenario::EducationHeavy: return "education_heavy";
        case Scenario::EnforcementHeavy: return "enforcement_heavy";
        case Scenario::IncentiveHeavy: return "incentive_heavy";
    }
    return "unknown";
}

Scenario parseScenario(const std::string& name) {
    for (Scenario s : {Scenario::Baseline, Scenario::StatusQuo, Scenario::EducationHeavy,
                       Scenario::EnforcementHeavy, Scenario::IncentiveHeavy}) {
        if (name == scenarioName(s)) {
            return s;
        }
    }
    throw std::invalid_argument("unknown scenario '" + name +
                                "' (expected baseline, status_quo, education_heavy, "
                                "enforcement_heavy or incentive_heavy)");
}
