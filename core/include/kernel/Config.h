#ifndef SIM_CONFIG_H
#define SIM_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

// ---------- Tuning Constants ----------
// Behavioural constants calibrated against the status-quo compliance of the
// study barangays. Changing these shifts every scenario.
namespace TuningConstants {
    // Attitude dynamics
    constexpr double kEducationBoost = 0.02;        // Max attitude gain per tick at full education intensity
    constexpr double kReactanceThreshold = 0.8;     // Enforcement intensity above which households push back
    constexpr double kReactancePenalty = 0.002;     // Attitude loss per tick under heavy enforcement

    // Social norm
    constexpr int kNormRadius = 2;                  // Moore radius of the observed neighbourhood
    constexpr double kNormSmoothing = 0.2;          // Weight of the new observation (inertia = 1 - this)
    constexpr double kNormAmplify = 1.2;            // Good neighbourhoods are amplified ...
    constexpr double kNormBuffer = 0.8;             // ... bad ones are buffered
    constexpr double kBaseDecency = 0.2;            // Floor added to buffered norms
    constexpr double kNeutralNorm = 0.5;            // Target when no same-region neighbour is visible

    // Utility
    constexpr double kAttitudeWeight = 0.4;
    constexpr double kNormWeight = 0.3;
    constexpr double kControlWeight = 0.3;
    constexpr double kMoneyScale = 1000.0;          // Pesos -> utility units
    constexpr double kUtilityNoiseStd = 0.05;       // Zero-mean decision noise
    constexpr double kComplianceThreshold = 0.5;
    constexpr double kIncentiveThresholdRelief = 0.05; // Threshold drop at full incentive strength

    // Income sensitivity (poorer households weigh money more)
    constexpr double kIncomeWeightLow = 1.5;
    constexpr double kIncomeWeightMid = 1.2;
    constexpr double kIncomeWeightHigh = 1.0;

    // Penalties applied when caught
    constexpr double kFineUtilityPenalty = 0.5;
    constexpr double kFineAttitudePenalty = 0.02;

    // Incentive redemption
    constexpr double kRedemptionChance = 0.05;      // Per-tick chance a compliant household claims

    // Policy translation
    constexpr double kEducationCostPerHead = 650.0; // Quarterly IEC spend per household for full intensity

    // Population generation
    constexpr double kCompliantAttitude = 0.66;
    constexpr double kNonCompliantAttitude = 0.30;
    constexpr double kAttitudeJitter = 0.05;
    constexpr double kControlMean = 0.7;
    constexpr double kControlStd = 0.1;
    constexpr double kControlMin = 0.2;
    constexpr double kClusterSpread = 5.0;          // Std dev of household placement around a region centre
    constexpr double kLowIncomeShare = 0.5;
    constexpr double kMidIncomeShare = 0.3;
}

enum class TargetingPolicy : std::uint8_t {
    NearestViolator = 0,   // chase the closest non-compliant household in range
    SystematicSweep = 1    // visit every household once, then start over
};

enum class Scenario : std::uint8_t {
    Baseline = 0,
    StatusQuo = 1,
    EducationHeavy = 2,
    EnforcementHeavy = 3,
    IncentiveHeavy = 4
};

// ---------- Region Profile ----------
struct RegionProfile {
    std::string name;
    std::uint32_t households = 100;
    double initialCompliance = 0.5;     // probability a household starts compliant
    double decayRate = 0.005;           // attitude lost per tick ("public forgetting")
    double effortCost = 0.15;           // effort + out-of-pocket cost of segregating
    double fineAmount = 500.0;          // pesos per citation
    int centerX = 25;                   // grid cluster centre
    int centerY = 25;

    // Throws std::invalid_argument on out-of-range behavioural parameters.
    void validate() const;
};

// The seven study barangays and their cluster centres on a 50x50 grid.
std::vector<RegionProfile> defaultRegionProfiles();

// ---------- Configuration ----------
struct SimConfig {
    std::uint64_t seed = 42;

    // Space
    int gridWidth = 50;
    int gridHeight = 50;

    // Time
    int stepsPerQuarter = 90;           // ticks (days) between allocation decisions
    int quarters = 12;                  // episode length (3-year term)

    // Money
    double annualBudget = 6000000.0;
    double enforcementUnitCost = 45000.0;    // per unit per quarter
    double enforcementSaturation = 375000.0; // quarterly spend for full enforcement intensity

    // Enforcement units
    int patrolRange = 5;
    int catchRadius = 1;
    TargetingPolicy targeting = TargetingPolicy::NearestViolator;

    // Political capital: erosion by enforcement, recovery by restraint
    double initialPoliticalCapital = 0.8;
    double capitalErosion = 0.002;      // alpha
    double capitalRecovery = 0.001;     // beta

    // Reward shaping
    double complianceRewardWeight = 1.0;
    double budgetRewardWeight = 0.5;
    double backlashPenalty = 1.0;
    double backlashEnforcementLevel = 0.7;
    double backlashComplianceLevel = 0.3;

    // Allocation used when the controller has not supplied one
    Scenario defaultScenario = Scenario::StatusQuo;

    std::vector<RegionProfile> regions = defaultRegionProfiles();

    double quarterlyBudget() const { return annualBudget / 4.0; }
    double termBudget() const { return quarterlyBudget() * quarters; }
    std::uint64_t episodeSteps() const {
        return static_cast<std::uint64_t>(stepsPerQuarter) * static_cast<std::uint64_t>(quarters);
    }

    // Throws std::invalid_argument naming the first invalid field.
    void validate() const;
};

#endif
